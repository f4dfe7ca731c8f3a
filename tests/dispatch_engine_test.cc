#include "business/dispatch_engine.h"
#include "test_support.h"
#include <gtest/gtest.h>

using namespace ticketmcp;
using namespace ticketmcp::business;
using json = nlohmann::json;

class DispatchEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog = fakes::sample_catalog();
        backend = std::make_shared<fakes::FakeBackend>();
    }

    DispatchEngine make_engine(bool strict = false) {
        DispatchOptions options;
        options.strict_arguments = strict;
        return DispatchEngine(catalog, backend, options);
    }

    static session::Session make_session(const std::string &package) {
        return session::Session("sess-1", "conn-1", package, auth::CallerIdentity{});
    }

    static protocol::ToolCallRequest call(const std::string &tool, json args) {
        protocol::ToolCallRequest request;
        request.request_id = "req-1";
        request.tool_name = tool;
        request.arguments = catalog::arguments_from_json(args);
        return request;
    }

    catalog::CatalogPtr catalog;
    std::shared_ptr<fakes::FakeBackend> backend;
};

TEST_F(DispatchEngineTest, ToolOutsidePackageIsForbiddenWithoutBackendCall) {
    auto engine = make_engine();
    auto result = engine.dispatch(make_session("basic"), call("delete_incident", {{"identifier", "INC0000001"}}));

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, core::ErrorKind::Forbidden);
    EXPECT_EQ(result.request_id, "req-1");
    EXPECT_EQ(backend->calls(), 0u);
}

TEST_F(DispatchEngineTest, EmptyPackageForbidsEverything) {
    auto engine = make_engine();
    auto result = engine.dispatch(make_session("none"), call("list_incidents", json::object()));

    EXPECT_EQ(result.error.kind, core::ErrorKind::Forbidden);
    EXPECT_EQ(backend->calls(), 0u);
}

TEST_F(DispatchEngineTest, MissingRequiredArgumentIsRejected) {
    auto engine = make_engine();
    auto result = engine.dispatch(make_session("basic"), call("create_incident", {{"priority", "1"}}));

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, core::ErrorKind::InvalidArgument);
    EXPECT_EQ(result.error.message, "short_description required");
    EXPECT_EQ(backend->calls(), 0u);
}

TEST_F(DispatchEngineTest, WrongArgumentTypeIsRejected) {
    auto engine = make_engine();
    auto result = engine.dispatch(make_session("basic"), call("list_incidents", {{"limit", "ten"}}));

    EXPECT_EQ(result.error.kind, core::ErrorKind::InvalidArgument);
    EXPECT_EQ(result.error.message, "limit must be integer");
    EXPECT_EQ(backend->calls(), 0u);
}

TEST_F(DispatchEngineTest, UnknownArgumentDependsOnStrictness) {
    auto args = json{{"identifier", "INC0000001"}, {"verbose", true}};

    auto strict = make_engine(true);
    auto rejected = strict.dispatch(make_session("basic"), call("get_incident", args));
    EXPECT_EQ(rejected.error.kind, core::ErrorKind::InvalidArgument);
    EXPECT_EQ(rejected.error.message, "unknown argument verbose");
    EXPECT_EQ(backend->calls(), 0u);

    auto lenient = make_engine(false);
    auto accepted = lenient.dispatch(make_session("basic"), call("get_incident", args));
    EXPECT_TRUE(accepted.ok);
    EXPECT_EQ(backend->calls(), 1u);
}

TEST_F(DispatchEngineTest, ReadReturnsRecordPayload) {
    auto engine = make_engine();
    auto result = engine.dispatch(make_session("basic"), call("get_incident", {{"identifier", "INC0000042"}}));

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.payload["identifier"], "INC0000042");
    EXPECT_TRUE(result.payload.contains("resolution"));
    EXPECT_EQ(backend->operations(), std::vector<std::string>{"read"});
}

TEST_F(DispatchEngineTest, ListAppliesDefaultsAndClamps) {
    auto engine = make_engine();

    auto result = engine.dispatch(make_session("basic"), call("list_incidents", json::object()));
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.payload["count"], 2);
    EXPECT_EQ(result.payload["records"].size(), 2u);
    EXPECT_EQ(backend->last_query.limit, 100);

    engine.dispatch(make_session("basic"), call("list_incidents", {{"limit", 50000}, {"state", "New"}}));
    EXPECT_EQ(backend->last_query.limit, 1000);
    EXPECT_EQ(backend->last_query.state, "New");
}

TEST_F(DispatchEngineTest, CreatePassesIdempotencyToken) {
    auto engine = make_engine();

    auto request = call("create_incident", {{"short_description", "Printer on fire"}});
    request.idempotency_token = "tok-1";
    auto result = engine.dispatch(make_session("basic"), request);
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(backend->last_token, "tok-1");
    EXPECT_EQ(backend->last_fields.short_description, "Printer on fire");

    engine.dispatch(make_session("basic"),
                    call("create_incident", {{"short_description", "x"}, {"idempotency_token", "tok-2"}}));
    EXPECT_EQ(backend->last_token, "tok-2");

    engine.dispatch(make_session("basic"), call("create_incident", {{"short_description", "y"}}));
    EXPECT_FALSE(backend->last_token.has_value());
}

TEST_F(DispatchEngineTest, DeleteReportsIdentifier) {
    auto engine = make_engine();
    auto result = engine.dispatch(make_session("full"), call("delete_incident", {{"identifier", "INC0000007"}}));

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.payload, (json{{"identifier", "INC0000007"}, {"deleted", true}}));
}

TEST_F(DispatchEngineTest, BackendErrorIsPropagatedUnchanged) {
    backend->fail_next(core::ErrorKind::NotFound, "record INC0000404 not found");
    auto engine = make_engine();
    auto result = engine.dispatch(make_session("basic"), call("get_incident", {{"identifier", "INC0000404"}}));

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, core::ErrorKind::NotFound);
    EXPECT_EQ(result.error.message, "record INC0000404 not found");
    EXPECT_EQ(result.to_json()["status"], "error");
    EXPECT_EQ(result.to_json()["kind"], "NotFound");
}

TEST_F(DispatchEngineTest, UnknownToolIsForbidden) {
    auto engine = make_engine();
    auto result = engine.dispatch(make_session("full"), call("reopen_incident", json::object()));
    EXPECT_EQ(result.error.kind, core::ErrorKind::Forbidden);
}
