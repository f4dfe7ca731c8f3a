#include "transport/connection.h"
#include <gtest/gtest.h>

using namespace ticketmcp;
using namespace ticketmcp::transport;
using namespace std::chrono_literals;

namespace {

    /// Channel that records writes instead of touching a socket.
    class RecordingChannel : public Channel {
    public:
        explicit RecordingChannel(asio::io_context &io) : io_(io) {
            channel_id_ = "chan-1";
            remote_address_ = "127.0.0.1";
        }

        asio::awaitable<void> start(HttpHandler *) override { co_return; }

        asio::awaitable<void> write(const std::string &message) override {
            written.push_back(message);
            co_return;
        }

        void close() override {
            closed_ = true;
            notify_closed();
        }

        bool is_closed() const override { return closed_; }
        asio::any_io_executor get_executor() override { return io_.get_executor(); }

        std::vector<std::string> written;

    private:
        asio::io_context &io_;
    };

}// namespace

class ConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        channel = std::make_shared<RecordingChannel>(io);
        connection = std::make_shared<Connection>("conn-1", channel, auth::CallerIdentity{});
    }

    void TearDown() override {
        // let a suspended writer finish before the io_context goes away
        connection->close(false);
        pump();
    }

    void pump() {
        io.restart();
        io.run_for(20ms);
    }

    asio::io_context io;
    std::shared_ptr<RecordingChannel> channel;
    std::shared_ptr<Connection> connection;
};

TEST(ConnectionStateTest, TransitionsOnlyMoveForward) {
    using S = ConnectionState;
    EXPECT_TRUE(Connection::can_transition(S::Connecting, S::Handshaking));
    EXPECT_TRUE(Connection::can_transition(S::Handshaking, S::Active));
    EXPECT_TRUE(Connection::can_transition(S::Handshaking, S::Draining));
    EXPECT_TRUE(Connection::can_transition(S::Active, S::Draining));

    EXPECT_FALSE(Connection::can_transition(S::Connecting, S::Active));
    EXPECT_FALSE(Connection::can_transition(S::Active, S::Handshaking));
    EXPECT_FALSE(Connection::can_transition(S::Draining, S::Active));
    EXPECT_FALSE(Connection::can_transition(S::Closed, S::Connecting));
    EXPECT_FALSE(Connection::can_transition(S::Closed, S::Closed));

    for (auto from: {S::Connecting, S::Handshaking, S::Active, S::Draining}) {
        EXPECT_TRUE(Connection::can_transition(from, S::Closed)) << to_string(from);
    }
}

TEST_F(ConnectionTest, BindSessionActivatesHandshakingConnection) {
    EXPECT_EQ(connection->state(), ConnectionState::Connecting);
    EXPECT_FALSE(connection->advance(ConnectionState::Active));

    ASSERT_TRUE(connection->advance(ConnectionState::Handshaking));
    connection->bind_session(nullptr);
    EXPECT_EQ(connection->state(), ConnectionState::Active);
    EXPECT_FALSE(connection->draining());

    connection->request_drain();
    EXPECT_EQ(connection->state(), ConnectionState::Draining);
    EXPECT_TRUE(connection->draining());
}

TEST_F(ConnectionTest, DrainHandlerReplacesDefaultDrain) {
    std::shared_ptr<Connection> drained;
    connection->set_drain_handler([&](const std::shared_ptr<Connection> &c) { drained = c; });
    connection->advance(ConnectionState::Handshaking);

    connection->request_drain();

    EXPECT_EQ(drained, connection);
    EXPECT_EQ(connection->state(), ConnectionState::Handshaking);
}

TEST_F(ConnectionTest, FramesAreWrittenInOrder) {
    connection->start();
    connection->post_frame("first");
    connection->send("{\"id\":1}");
    connection->send_event("heartbeat", nlohmann::json::object());
    pump();

    ASSERT_EQ(channel->written.size(), 3u);
    EXPECT_EQ(channel->written[0], "first");
    EXPECT_EQ(channel->written[1], "event: message\ndata: {\"id\":1}\n\n");
    EXPECT_NE(channel->written[2].find("\"event_type\":\"heartbeat\""), std::string::npos);
    EXPECT_EQ(connection->pending_frames(), 0u);
}

TEST_F(ConnectionTest, FlushingCloseDeliversQueuedFrames) {
    int closed_calls = 0;
    connection->set_closed_handler([&](Connection &) { ++closed_calls; });

    connection->post_frame("last words");
    connection->close(true);
    connection->close(true);
    connection->start();
    pump();

    EXPECT_EQ(closed_calls, 1);
    ASSERT_EQ(channel->written.size(), 1u);
    EXPECT_EQ(channel->written[0], "last words");
    EXPECT_TRUE(channel->is_closed());
    EXPECT_EQ(connection->state(), ConnectionState::Closed);
}

TEST_F(ConnectionTest, AbortingCloseDropsQueuedFrames) {
    connection->post_frame("never sent");
    connection->close(false);
    connection->start();
    pump();

    EXPECT_TRUE(channel->written.empty());
    EXPECT_TRUE(channel->is_closed());
    EXPECT_FALSE(connection->post_frame("too late"));
    EXPECT_FALSE(connection->send("{}"));
}

TEST_F(ConnectionTest, ClosedChannelEndsTheWriter) {
    connection->start();
    pump();
    channel->close();
    connection->post_frame("after peer left");
    pump();

    EXPECT_TRUE(channel->written.empty());
    EXPECT_EQ(connection->state(), ConnectionState::Closed);
}
