#include "transport/rest_facade.h"
#include "test_support.h"
#include <gtest/gtest.h>

using namespace ticketmcp;
using namespace ticketmcp::transport;
using json = nlohmann::json;

class RestFacadeTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend = std::make_shared<fakes::FakeBackend>();
        engine = std::make_shared<business::DispatchEngine>(fakes::sample_catalog(), backend);
        facade = std::make_shared<RestFacade>(engine, "basic");
    }

    static RestRequest request(const std::string &method, const std::string &path, const std::string &body = {}) {
        RestRequest req;
        req.method = method;
        req.path = path;
        req.body = body;
        return req;
    }

    std::shared_ptr<fakes::FakeBackend> backend;
    std::shared_ptr<business::DispatchEngine> engine;
    std::shared_ptr<RestFacade> facade;
    auth::CallerIdentity anonymous;
};

TEST_F(RestFacadeTest, OwnsIncidentPaths) {
    EXPECT_TRUE(RestFacade::matches("/incidents"));
    EXPECT_TRUE(RestFacade::matches("/api/incidents"));
    EXPECT_TRUE(RestFacade::matches("/api/incidents/INC1/resolve"));
    EXPECT_FALSE(RestFacade::matches("/api/incidentsx"));
    EXPECT_FALSE(RestFacade::matches("/health"));
}

TEST_F(RestFacadeTest, StatusPerKind) {
    EXPECT_EQ(RestFacade::status_for(core::ErrorKind::Forbidden), 403);
    EXPECT_EQ(RestFacade::status_for(core::ErrorKind::InvalidArgument), 400);
    EXPECT_EQ(RestFacade::status_for(core::ErrorKind::NotFound), 404);
    EXPECT_EQ(RestFacade::status_for(core::ErrorKind::Unauthorized), 502);
    EXPECT_EQ(RestFacade::status_for(core::ErrorKind::RateLimited), 429);
    EXPECT_EQ(RestFacade::status_for(core::ErrorKind::Unavailable), 503);
    EXPECT_EQ(RestFacade::status_for(core::ErrorKind::Unknown), 500);
}

TEST_F(RestFacadeTest, ListTranslatesQueryAliases) {
    auto req = request("GET", "/api/incidents");
    req.query = {{"limit", "5"}, {"assigned_to", "beth"}, {"sysparm_query", "active=true"}};

    auto response = facade->handle(req, anonymous);

    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body["count"], 2);
    EXPECT_EQ(backend->last_query.limit, 5);
    EXPECT_EQ(backend->last_query.assignee, "beth");
    EXPECT_EQ(backend->last_query.query, "active=true");
}

TEST_F(RestFacadeTest, LegacyListPath) {
    auto response = facade->handle(request("GET", "/incidents"), anonymous);
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(backend->operations(), std::vector<std::string>{"list"});
}

TEST_F(RestFacadeTest, NonNumericLimitIsBadRequest) {
    auto req = request("GET", "/api/incidents");
    req.query = {{"limit", "lots"}};

    auto response = facade->handle(req, anonymous);

    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(response.body["status"], "error");
    EXPECT_EQ(response.body["error"]["kind"], "InvalidArgument");
    EXPECT_EQ(backend->calls(), 0u);
}

TEST_F(RestFacadeTest, CreateReturns201AndForwardsIdempotencyKey) {
    auto req = request("POST", "/api/incidents", R"({"short_description":"Printer on fire"})");
    req.headers["idempotency-key"] = "key-1";

    auto response = facade->handle(req, anonymous);

    EXPECT_EQ(response.status, 201);
    EXPECT_EQ(response.body["short_description"], "Printer on fire");
    EXPECT_EQ(backend->last_token, "key-1");
}

TEST_F(RestFacadeTest, CreateWithInvalidBodyIsBadRequest) {
    auto response = facade->handle(request("POST", "/api/incidents", "not json"), anonymous);
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(backend->calls(), 0u);

    auto missing = facade->handle(request("POST", "/api/incidents", "{}"), anonymous);
    EXPECT_EQ(missing.status, 400);
    EXPECT_EQ(missing.body["error"]["message"], "short_description required");
    EXPECT_TRUE(missing.body.contains("request_id"));
}

TEST_F(RestFacadeTest, ReadByIdentifier) {
    auto response = facade->handle(request("GET", "/api/incidents/INC0000042"), anonymous);
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body["identifier"], "INC0000042");
}

TEST_F(RestFacadeTest, OperationOutsideDefaultPackageIsForbidden) {
    auto response = facade->handle(request("DELETE", "/api/incidents/INC0000042"), anonymous);
    EXPECT_EQ(response.status, 403);
    EXPECT_EQ(response.body["error"]["kind"], "Forbidden");
    EXPECT_EQ(backend->calls(), 0u);
}

TEST_F(RestFacadeTest, PackageHeaderSelectsPackage) {
    auto req = request("DELETE", "/api/incidents/INC0000042");
    req.headers["x-tool-package"] = "full";

    auto response = facade->handle(req, anonymous);

    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body["deleted"], true);

    req.headers["x-tool-package"] = "platinum";
    EXPECT_EQ(facade->handle(req, anonymous).status, 404);
}

TEST_F(RestFacadeTest, PolicyAppliesToPackageHeader) {
    auth::PackagePolicy policy;
    policy.allow("agent", "basic");
    RestFacade restricted(engine, "basic", policy);

    auto req = request("GET", "/api/incidents/INC1");
    req.headers["x-tool-package"] = "full";
    auto response = restricted.handle(req, auth::CallerIdentity{"alice", "agent"});

    EXPECT_EQ(response.status, 403);
    EXPECT_EQ(backend->calls(), 0u);
}

TEST_F(RestFacadeTest, BackendFailureMapsToStatus) {
    backend->fail_next(core::ErrorKind::Unavailable, "instance hibernating");
    auto response = facade->handle(request("GET", "/api/incidents/INC1"), anonymous);

    EXPECT_EQ(response.status, 503);
    EXPECT_EQ(response.body["error"]["message"], "instance hibernating");
}

TEST_F(RestFacadeTest, UnknownRouteIsNotFound) {
    auto response = facade->handle(request("POST", "/api/incidents/INC1/escalate", "{}"), anonymous);
    EXPECT_EQ(response.status, 404);
}
