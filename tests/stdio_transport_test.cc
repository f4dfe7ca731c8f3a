#include "protocol/json_rpc.h"
#include "transport/stdio_transport.h"
#include "test_support.h"
#include <gtest/gtest.h>
#include <sstream>
#include <thread>

using namespace ticketmcp;
using namespace ticketmcp::transport;
using namespace std::chrono_literals;
using json = nlohmann::json;

class StdioTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend = std::make_shared<fakes::FakeBackend>();
        auto catalog = fakes::sample_catalog();
        registry = std::make_shared<session::SessionRegistry>(catalog);
        auto engine = std::make_shared<business::DispatchEngine>(catalog, backend);
        auto handler = std::make_shared<business::RequestHandler>(
                registry, engine, [this](std::function<void()> task) { pending.push_back(std::move(task)); }, "basic");
        stdio = std::make_shared<StdioTransport>(handler, registry, in, out);
    }

    void send(const json &message) {
        stdio->handle_line(message.dump());
    }

    void initialize() {
        send({{"jsonrpc", "2.0"}, {"id", "init"}, {"method", "initialize"}, {"params", json::object()}});
    }

    void call(const std::string &id, const std::string &tool = "list_incidents") {
        send({{"jsonrpc", "2.0"}, {"id", id}, {"method", "tools/call"}, {"params", {{"name", tool}}}});
    }

    void run_pending() {
        auto tasks = std::move(pending);
        pending.clear();
        for (auto &task: tasks) {
            task();
        }
    }

    /// Every line written so far, parsed.
    std::vector<json> lines() const {
        std::vector<json> parsed;
        std::istringstream written(out.str());
        std::string line;
        while (std::getline(written, line)) {
            if (!line.empty()) {
                parsed.push_back(json::parse(line));
            }
        }
        return parsed;
    }

    std::istringstream in;
    std::ostringstream out;
    std::shared_ptr<fakes::FakeBackend> backend;
    std::shared_ptr<session::SessionRegistry> registry;
    std::shared_ptr<StdioTransport> stdio;
    std::vector<std::function<void()>> pending;
};

TEST_F(StdioTransportTest, RepliesAreWrittenOnePerLine) {
    initialize();
    ASSERT_NE(stdio->session(), nullptr);

    call("1");
    EXPECT_EQ(stdio->in_flight(), 1u);
    run_pending();

    auto written = lines();
    ASSERT_EQ(written.size(), 2u);
    EXPECT_EQ(written[0]["id"], "init");
    EXPECT_EQ(written[0]["result"]["capability_package"], "basic");
    EXPECT_EQ(written[1]["id"], "1");
    EXPECT_TRUE(written[1].contains("result"));
    EXPECT_EQ(stdio->in_flight(), 0u);
    EXPECT_EQ(backend->calls(), 1u);
}

TEST_F(StdioTransportTest, IdleSweepLeavesTheStdioSessionOpen) {
    initialize();
    auto session = stdio->session();
    ASSERT_NE(session, nullptr);
    std::this_thread::sleep_for(5ms);

    EXPECT_TRUE(registry->sweep_idle(1ms).empty());
    EXPECT_FALSE(session->closed());
    EXPECT_EQ(registry->size(), 1u);

    call("after-idle");
    ASSERT_EQ(pending.size(), 1u);
    run_pending();
    EXPECT_EQ(lines().back()["id"], "after-idle");
    EXPECT_TRUE(lines().back().contains("result"));
}

TEST_F(StdioTransportTest, MalformedLineIsAnsweredInPlace) {
    stdio->handle_line("{not json");

    auto written = lines();
    ASSERT_EQ(written.size(), 1u);
    EXPECT_EQ(written[0]["error"]["code"], protocol::error_code::PARSE_ERROR);
    EXPECT_TRUE(written[0]["id"].is_null());
}

TEST_F(StdioTransportTest, DuplicateIdIsAnsweredWithoutReusingIt) {
    initialize();
    call("dup");
    call("dup");

    auto written = lines();
    ASSERT_EQ(written.size(), 2u);
    EXPECT_EQ(written[1]["error"]["code"], protocol::error_code::INVALID_REQUEST);
    EXPECT_TRUE(written[1]["id"].is_null());
    EXPECT_EQ(written[1]["error"]["data"]["request_id"], "dup");

    run_pending();
    size_t replies = 0;
    for (const auto &line: lines()) {
        if (line["id"] == "dup") {
            ++replies;
        }
    }
    EXPECT_EQ(replies, 1u);
}

TEST_F(StdioTransportTest, ShutdownRefusesFurtherCalls) {
    initialize();
    send({{"jsonrpc", "2.0"}, {"id", "bye"}, {"method", "shutdown"}});
    EXPECT_TRUE(stdio->draining());
    EXPECT_EQ(lines().back()["id"], "bye");

    call("late");
    EXPECT_TRUE(pending.empty());
    auto reply = lines().back();
    EXPECT_EQ(reply["id"], "late");
    EXPECT_EQ(reply["error"]["code"], protocol::error_code::UNAVAILABLE);
    EXPECT_EQ(reply["error"]["message"], "session draining");
}

TEST_F(StdioTransportTest, CloseReleasesSession) {
    initialize();
    call("inflight");
    ASSERT_EQ(registry->size(), 1u);

    stdio->close();
    EXPECT_EQ(registry->size(), 0u);
    EXPECT_TRUE(stdio->draining());

    // the result has nowhere to go once the session is released
    run_pending();
    EXPECT_EQ(lines().size(), 1u);
}
