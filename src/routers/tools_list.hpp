#pragma once
#include "business/rpc_router.h"
#include "protocol/json_rpc.h"

namespace ticketmcp::routers {

    /**
     * @brief Handle tools/list: the tools of the session's package with their input schemas.
     */
    inline std::optional<protocol::Response> handle_tools_list(const protocol::Request &req, business::RpcContext &ctx) {
        auto id = protocol::get_request_id(req);
        auto session = ctx.client->session();
        if (!session) {
            return protocol::Response(protocol::Error(protocol::error_code::SESSION_REQUIRED, "initialize must complete first"), id);
        }

        nlohmann::json tools = nlohmann::json::array();
        for (const auto *tool: ctx.engine->catalog().resolve(session->package())) {
            tools.push_back(tool->to_json());
        }
        return protocol::Response(nlohmann::json{{"tools", std::move(tools)}}, id);
    }

}// namespace ticketmcp::routers
