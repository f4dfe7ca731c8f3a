#include "protocol/frames.h"
#include "protocol/json_rpc.h"
#include <gtest/gtest.h>

using namespace ticketmcp;
using namespace ticketmcp::protocol;
using json = nlohmann::json;

TEST(JsonRpcTest, ParsesRequestWithIdAndParams) {
    auto [request, error] = parse_request(R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"get_incident"}})");

    ASSERT_TRUE(request.has_value());
    EXPECT_FALSE(error.has_value());
    EXPECT_EQ(request->method, "tools/call");
    EXPECT_EQ(request->params["name"], "get_incident");
    ASSERT_TRUE(request->id.has_value());
    EXPECT_EQ(*request->id, 7);
    EXPECT_FALSE(request->is_notification());
}

TEST(JsonRpcTest, RequestWithoutIdIsNotification) {
    auto [request, error] = parse_request(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    ASSERT_TRUE(request.has_value());
    EXPECT_TRUE(request->is_notification());
    EXPECT_TRUE(get_request_id(*request).is_null());
}

TEST(JsonRpcTest, MalformedJsonIsParseError) {
    auto [request, error] = parse_request("{\"jsonrpc\":\"2.0\",");
    EXPECT_FALSE(request.has_value());
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, error_code::PARSE_ERROR);
}

TEST(JsonRpcTest, StructuralProblemsAreInvalidRequest) {
    const char *cases[] = {
            R"([1,2,3])",
            R"({"jsonrpc":"1.0","id":1,"method":"ping"})",
            R"({"jsonrpc":"2.0","id":1})",
            R"({"jsonrpc":"2.0","id":{"nested":true},"method":"ping"})",
    };
    for (const char *text: cases) {
        auto [request, error] = parse_request(text);
        EXPECT_FALSE(request.has_value()) << text;
        ASSERT_TRUE(error.has_value()) << text;
        EXPECT_EQ(error->code, error_code::INVALID_REQUEST) << text;
    }
}

TEST(JsonRpcTest, ScalarParamsAreInvalidParams) {
    auto [request, error] = parse_request(R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":"oops"})");
    EXPECT_FALSE(request.has_value());
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, error_code::INVALID_PARAMS);
}

TEST(JsonRpcTest, ErrorCodesPerKind) {
    EXPECT_EQ(error_code_for(core::ErrorKind::Forbidden), -32001);
    EXPECT_EQ(error_code_for(core::ErrorKind::InvalidArgument), error_code::INVALID_PARAMS);
    EXPECT_EQ(error_code_for(core::ErrorKind::NotFound), -32002);
    EXPECT_EQ(error_code_for(core::ErrorKind::Unauthorized), -32003);
    EXPECT_EQ(error_code_for(core::ErrorKind::RateLimited), -32004);
    EXPECT_EQ(error_code_for(core::ErrorKind::Unavailable), -32005);
    EXPECT_EQ(error_code_for(core::ErrorKind::Unknown), -32000);
}

TEST(JsonRpcTest, IdToString) {
    EXPECT_EQ(id_to_string(json("abc")), "abc");
    EXPECT_EQ(id_to_string(json(42)), "42");
    EXPECT_EQ(id_to_string(json(nullptr)), "");
}

TEST(JsonRpcTest, ResponseCarriesResultAndId) {
    auto text = make_response(json{{"ok", true}}, json("r-1"));
    auto parsed = json::parse(text);
    EXPECT_EQ(parsed["jsonrpc"], "2.0");
    EXPECT_EQ(parsed["id"], "r-1");
    EXPECT_EQ(parsed["result"]["ok"], true);
    EXPECT_FALSE(parsed.contains("error"));
}

TEST(FramesTest, SuccessResultIsJsonRpcResult) {
    auto result = ToolCallResult::success("r-1", json{{"identifier", "INC1"}});
    auto parsed = json::parse(encode_result(result, json("r-1")));

    EXPECT_EQ(parsed["id"], "r-1");
    EXPECT_EQ(parsed["result"]["request_id"], "r-1");
    EXPECT_EQ(parsed["result"]["status"], "success");
    EXPECT_EQ(parsed["result"]["payload"]["identifier"], "INC1");
}

TEST(FramesTest, FailureResultIsJsonRpcErrorWithNormalizedData) {
    auto result = ToolCallResult::failure("r-2", core::ErrorKind::RateLimited, "too many requests", "retry later");
    auto parsed = json::parse(encode_result(result, json(5)));

    EXPECT_EQ(parsed["id"], 5);
    EXPECT_EQ(parsed["error"]["code"], error_code::RATE_LIMITED);
    EXPECT_EQ(parsed["error"]["message"], "too many requests");
    const auto &data = parsed["error"]["data"];
    EXPECT_EQ(data["request_id"], "r-2");
    EXPECT_EQ(data["status"], "error");
    EXPECT_EQ(data["kind"], "RateLimited");
    EXPECT_EQ(data["detail"], "retry later");
}

TEST(FramesTest, FailureWithoutDetailOmitsIt) {
    auto json_result = ToolCallResult::failure("r-3", core::ErrorKind::NotFound, "missing").to_json();
    EXPECT_FALSE(json_result.contains("detail"));
    EXPECT_FALSE(json_result.contains("payload"));
}

TEST(FramesTest, EventIsNotification) {
    auto parsed = json::parse(encode_event(event_type::BACKEND_REACHABILITY, json{{"reachable", false}}));

    EXPECT_EQ(parsed["method"], EVENT_METHOD);
    EXPECT_FALSE(parsed.contains("id"));
    EXPECT_EQ(parsed["params"]["event_type"], "backend_reachability_changed");
    EXPECT_EQ(parsed["params"]["detail"]["reachable"], false);
}

TEST(FramesTest, SseFrameLayout) {
    EXPECT_EQ(format_sse("message", "{\"a\":1}"), "event: message\ndata: {\"a\":1}\n\n");
    EXPECT_EQ(format_sse("endpoint", "/message?session_id=c1", "3"),
              "event: endpoint\nid: 3\ndata: /message?session_id=c1\n\n");
    EXPECT_EQ(format_sse("", "line one\nline two"), "data: line one\ndata: line two\n\n");
}
