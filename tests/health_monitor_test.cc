#include "health/health_monitor.h"
#include "test_support.h"
#include <gtest/gtest.h>

using namespace ticketmcp;
using namespace ticketmcp::health;
using namespace std::chrono_literals;

class HealthMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend = std::make_shared<fakes::FakeBackend>();
        monitor = std::make_shared<HealthMonitor>(backend, 500ms);
    }

    std::shared_ptr<fakes::FakeBackend> backend;
    std::shared_ptr<HealthMonitor> monitor;
};

TEST_F(HealthMonitorTest, LivenessIsAlwaysOk) {
    EXPECT_EQ(monitor->liveness(), HealthStatus::Ok);
    backend->fail_always(core::ErrorKind::Unavailable, "connect timeout");
    EXPECT_EQ(monitor->liveness(), HealthStatus::Ok);
}

TEST_F(HealthMonitorTest, ReadyWhenServingAndBackendReachable) {
    monitor->set_serving(true);
    monitor->set_session_counter([] { return size_t{3}; });

    auto report = monitor->readiness();

    EXPECT_EQ(report.status, HealthStatus::Ok);
    EXPECT_TRUE(report.backend_reachable);
    EXPECT_EQ(report.active_sessions, 3u);
    auto body = report.to_json();
    EXPECT_EQ(body["status"], "ok");
    EXPECT_EQ(body["service"], "ServiceNow MCP Server");
    EXPECT_EQ(body["backend"]["reachable"], true);
    EXPECT_FALSE(body["backend"].contains("detail"));
    EXPECT_EQ(backend->operations(), std::vector<std::string>{"ping"});
}

TEST_F(HealthMonitorTest, DegradedWhenBackendUnreachable) {
    monitor->set_serving(true);
    backend->fail_always(core::ErrorKind::Unavailable, "connect timeout");

    auto report = monitor->readiness();

    EXPECT_EQ(report.status, HealthStatus::Degraded);
    EXPECT_FALSE(report.backend_reachable);
    EXPECT_EQ(report.detail, "Unavailable: connect timeout");
    EXPECT_EQ(report.to_json()["status"], "degraded");
}

TEST_F(HealthMonitorTest, DownWhenNotServing) {
    auto report = monitor->readiness();
    EXPECT_EQ(report.status, HealthStatus::Down);
    // backend state is still reported
    EXPECT_TRUE(report.backend_reachable);
}

TEST_F(HealthMonitorTest, ListenersFireOnFlipsOnly) {
    std::vector<bool> flips;
    monitor->add_listener([&](bool reachable, const std::string &) { flips.push_back(reachable); });
    monitor->set_serving(true);

    monitor->readiness();// first observation
    monitor->readiness();// unchanged
    backend->fail_always(core::ErrorKind::Unauthorized, "bad credentials");
    monitor->readiness();
    monitor->readiness();
    backend->clear_failures();
    monitor->readiness();

    EXPECT_EQ(flips, (std::vector<bool>{true, false, true}));
    ASSERT_TRUE(monitor->last_reachable().has_value());
    EXPECT_TRUE(*monitor->last_reachable());
}
