#include "transport/transport_manager.h"
#include "test_support.h"
#include <gtest/gtest.h>
#include <thread>

using namespace ticketmcp;
using namespace ticketmcp::transport;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

    /// Channel that keeps every written frame in memory.
    class MemoryChannel : public Channel {
    public:
        MemoryChannel(asio::io_context &io, std::string id) : io_(io) {
            channel_id_ = std::move(id);
            remote_address_ = "127.0.0.1";
        }

        asio::awaitable<void> start(HttpHandler *) override { co_return; }

        asio::awaitable<void> write(const std::string &message) override {
            written.push_back(message);
            co_return;
        }

        /// Peer went away: the read side ends.
        void close() override {
            closed_ = true;
            notify_closed();
        }

        bool is_closed() const override { return closed_; }
        asio::any_io_executor get_executor() override { return io_.get_executor(); }

        size_t frames_containing(const std::string &needle) const {
            size_t count = 0;
            for (const auto &frame: written) {
                if (frame.find(needle) != std::string::npos) {
                    ++count;
                }
            }
            return count;
        }

        std::vector<std::string> written;

    private:
        asio::io_context &io_;
    };

}// namespace

class TransportManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend = std::make_shared<fakes::FakeBackend>();
        auto catalog = fakes::sample_catalog();
        registry = std::make_shared<session::SessionRegistry>(catalog);
        auto engine = std::make_shared<business::DispatchEngine>(catalog, backend);
        handler = std::make_shared<business::RequestHandler>(
                registry, engine, [this](std::function<void()> task) { pending.push_back(std::move(task)); }, "basic");
    }

    void TearDown() override {
        for (const auto &connection: connections) {
            connection->close(false);
        }
        if (manager) {
            manager->stop();
        }
        pump();
    }

    void make_manager(TransportOptions options = {}) {
        manager = std::make_shared<TransportManager>(io, io.get_executor(), registry, handler, nullptr, options);
    }

    ConnectionPtr open(const std::string &id, std::shared_ptr<MemoryChannel> &channel) {
        channel = std::make_shared<MemoryChannel>(io, id);
        auto connection = manager->open_stream(channel, auth::CallerIdentity{"alice", "agent"});
        connections.push_back(connection);
        return connection;
    }

    business::MessageAck post(const ConnectionPtr &connection, const json &message) {
        return manager->request_handler().handle_message(message.dump(), connection);
    }

    void initialize(const ConnectionPtr &connection, const std::string &package = "basic") {
        post(connection, {{"jsonrpc", "2.0"}, {"id", "init"}, {"method", "initialize"}, {"params", {{"requested_package", package}}}});
    }

    void run_pending() {
        auto tasks = std::move(pending);
        pending.clear();
        for (auto &task: tasks) {
            task();
        }
    }

    void pump(std::chrono::milliseconds duration = 20ms) {
        io.restart();
        io.run_for(duration);
    }

    asio::io_context io;
    std::shared_ptr<fakes::FakeBackend> backend;
    std::shared_ptr<session::SessionRegistry> registry;
    std::shared_ptr<business::RequestHandler> handler;
    std::shared_ptr<TransportManager> manager;
    std::vector<ConnectionPtr> connections;
    std::vector<std::function<void()>> pending;
};

TEST_F(TransportManagerTest, OpenStreamAnnouncesMessageEndpoint) {
    make_manager();
    std::shared_ptr<MemoryChannel> channel;
    auto connection = open("chan-1", channel);
    pump();

    ASSERT_FALSE(channel->written.empty());
    EXPECT_EQ(channel->written[0], "event: endpoint\ndata: /messages?session_id=chan-1\n\n");
    EXPECT_EQ(connection->state(), ConnectionState::Handshaking);
    EXPECT_EQ(manager->connection_count(), 1u);
    EXPECT_EQ(manager->find("chan-1"), connection);

    initialize(connection);
    ASSERT_NE(connection->session(), nullptr);
    EXPECT_EQ(connection->state(), ConnectionState::Active);
    EXPECT_EQ(manager->find(connection->session()->id()), connection);
    EXPECT_EQ(manager->find("missing"), nullptr);
}

TEST_F(TransportManagerTest, DroppedConnectionDiscardsCreateResult) {
    make_manager();
    std::shared_ptr<MemoryChannel> channel;
    auto connection = open("chan-1", channel);
    initialize(connection);
    pump();

    auto ack = post(connection, {{"jsonrpc", "2.0"},
                                 {"id", "create-1"},
                                 {"method", "tools/call"},
                                 {"params", {{"name", "create_incident"}, {"arguments", {{"short_description", "Disk full"}}}}}});
    ASSERT_EQ(ack.status, 202);
    ASSERT_EQ(pending.size(), 1u);

    // the peer disappears while the backend call is still queued
    channel->close();
    EXPECT_EQ(connection->state(), ConnectionState::Closed);
    EXPECT_EQ(registry->size(), 0u);
    EXPECT_EQ(manager->connection_count(), 0u);

    run_pending();
    pump();

    EXPECT_EQ(backend->operations(), std::vector<std::string>{"create"});
    EXPECT_EQ(channel->frames_containing("create-1"), 0u);
    EXPECT_EQ(channel->frames_containing("INC0000100"), 0u);
}

TEST_F(TransportManagerTest, DrainWaitsForInFlightCall) {
    TransportOptions options;
    options.drain_grace_period = 5s;
    make_manager(options);
    std::shared_ptr<MemoryChannel> channel;
    auto connection = open("chan-1", channel);
    initialize(connection);
    post(connection, {{"jsonrpc", "2.0"}, {"id", "slow"}, {"method", "tools/call"}, {"params", {{"name", "list_incidents"}}}});
    ASSERT_EQ(pending.size(), 1u);

    manager->begin_drain(connection, "maintenance");
    pump();

    EXPECT_EQ(connection->state(), ConnectionState::Draining);
    EXPECT_EQ(channel->frames_containing("\"event_type\":\"session_closing\""), 1u);
    EXPECT_EQ(channel->frames_containing("maintenance"), 1u);

    // new work is refused while draining
    post(connection, {{"jsonrpc", "2.0"}, {"id", "late"}, {"method", "tools/call"}, {"params", {{"name", "list_incidents"}}}});
    EXPECT_EQ(pending.size(), 1u);

    run_pending();
    pump(300ms);

    EXPECT_EQ(connection->state(), ConnectionState::Closed);
    EXPECT_EQ(channel->frames_containing("\"id\":\"slow\""), 1u);
    EXPECT_EQ(channel->frames_containing("session draining"), 1u);
    EXPECT_TRUE(channel->is_closed());
    EXPECT_EQ(manager->connection_count(), 0u);
    EXPECT_EQ(registry->size(), 0u);
}

TEST_F(TransportManagerTest, ExpiredGracePeriodDropsOutstandingResult) {
    TransportOptions options;
    options.drain_grace_period = 0s;
    make_manager(options);
    std::shared_ptr<MemoryChannel> channel;
    auto connection = open("chan-1", channel);
    initialize(connection);
    post(connection, {{"jsonrpc", "2.0"}, {"id", "stuck"}, {"method", "tools/call"}, {"params", {{"name", "list_incidents"}}}});

    manager->begin_drain(connection, "shutdown");
    pump();
    EXPECT_EQ(connection->state(), ConnectionState::Closed);

    run_pending();
    pump();

    EXPECT_EQ(backend->calls(), 1u);
    EXPECT_EQ(channel->frames_containing("\"id\":\"stuck\""), 0u);
    EXPECT_EQ(channel->frames_containing("session_closing"), 1u);
}

TEST_F(TransportManagerTest, SweepClosesIdleSessionAndItsStream) {
    TransportOptions options;
    options.idle_timeout = 0s;
    make_manager(options);
    manager->start();
    std::shared_ptr<MemoryChannel> channel;
    auto connection = open("chan-1", channel);
    initialize(connection);
    std::this_thread::sleep_for(5ms);

    EXPECT_EQ(manager->sweep_once(), 1u);
    pump();

    EXPECT_EQ(channel->frames_containing("idle timeout"), 1u);
    EXPECT_EQ(connection->state(), ConnectionState::Closed);
    EXPECT_EQ(registry->size(), 0u);
    EXPECT_EQ(manager->connection_count(), 0u);
}

TEST_F(TransportManagerTest, SweepClosesStaleHandshakes) {
    TransportOptions options;
    options.idle_timeout = 0s;
    make_manager(options);
    std::shared_ptr<MemoryChannel> channel;
    auto connection = open("chan-1", channel);
    std::this_thread::sleep_for(5ms);

    EXPECT_EQ(manager->sweep_once(), 1u);
    pump();

    EXPECT_EQ(channel->frames_containing("handshake timeout"), 1u);
    EXPECT_EQ(connection->state(), ConnectionState::Closed);
}

TEST_F(TransportManagerTest, BroadcastReachesEveryStream) {
    make_manager();
    std::shared_ptr<MemoryChannel> first;
    std::shared_ptr<MemoryChannel> second;
    open("chan-1", first);
    open("chan-2", second);

    manager->broadcast_event(protocol::event_type::BACKEND_REACHABILITY, {{"reachable", false}});
    pump();

    EXPECT_EQ(first->frames_containing("\"event_type\":\"backend_reachability_changed\""), 1u);
    EXPECT_EQ(second->frames_containing("\"event_type\":\"backend_reachability_changed\""), 1u);
}

TEST_F(TransportManagerTest, HeartbeatIsBroadcastPeriodically) {
    TransportOptions options;
    options.heartbeat_interval = 1s;
    make_manager(options);
    std::shared_ptr<MemoryChannel> channel;
    open("chan-1", channel);
    manager->start();

    pump(1300ms);

    EXPECT_GE(channel->frames_containing("\"event_type\":\"heartbeat\""), 1u);
}

TEST_F(TransportManagerTest, DrainAllRefusesNewStreamsAndClosesOpenOnes) {
    make_manager();
    std::shared_ptr<MemoryChannel> handshaking;
    std::shared_ptr<MemoryChannel> active;
    auto first = open("chan-1", handshaking);
    auto second = open("chan-2", active);
    initialize(second);

    manager->drain_all("server stopping");
    EXPECT_FALSE(manager->accepting());
    pump(300ms);

    EXPECT_EQ(first->state(), ConnectionState::Closed);
    EXPECT_EQ(second->state(), ConnectionState::Closed);
    EXPECT_EQ(handshaking->frames_containing("server stopping"), 1u);
    EXPECT_EQ(active->frames_containing("server stopping"), 1u);
    EXPECT_EQ(manager->connection_count(), 0u);
}
