#pragma once
#include "business/rpc_router.h"
#include "core/logger.h"
#include "protocol/json_rpc.h"
#include <version.h>

namespace ticketmcp::routers {

    constexpr const char *kProtocolVersion = "2024-11-05";

    /**
     * @brief Handle initialization request
     *
     * Opens the session with the requested tool package (or the configured default) and
     * returns the package's tools together with the server capabilities.
     * @param req RPC request
     * @return Response with session, package and tools, or an error when the package is
     * unknown or not permitted for the caller
     */
    inline std::optional<protocol::Response> handle_initialize(const protocol::Request &req, business::RpcContext &ctx) {
        auto id = protocol::get_request_id(req);

        if (ctx.client->session()) {
            return protocol::Response(protocol::Error(protocol::error_code::INVALID_REQUEST, "session already initialized"), id);
        }

        std::string requested = ctx.default_package;
        if (req.params.is_object() && req.params.contains("requested_package")) {
            const auto &value = req.params["requested_package"];
            if (!value.is_string()) {
                return protocol::Response(protocol::Error(protocol::error_code::INVALID_PARAMS, "requested_package must be string"), id);
            }
            requested = value.get<std::string>();
        }

        session::SessionPtr session;
        try {
            session = ctx.registry->open(ctx.client->connection_id(), requested, ctx.client->identity(),
                                         ctx.client->expires_when_idle());
        } catch (const core::ServiceError &e) {
            TICKETMCP_WARN("Handshake on {} rejected: {}", ctx.client->connection_id(), e.what());
            return protocol::Response(
                    protocol::Error(protocol::error_code_for(e.kind()), e.what(),
                                    nlohmann::json{{"kind", core::to_string(e.kind())}}),
                    id);
        }
        ctx.client->bind_session(session);

        nlohmann::json tools = nlohmann::json::array();
        for (const auto *tool: ctx.engine->catalog().resolve(session->package())) {
            tools.push_back(tool->to_json());
        }

        // echo the client's protocol version when it sent one
        std::string protocol_version = kProtocolVersion;
        if (req.params.is_object() && req.params.contains("protocolVersion") && req.params["protocolVersion"].is_string()) {
            protocol_version = req.params["protocolVersion"].get<std::string>();
        }

        nlohmann::json result = {
                {"protocolVersion", protocol_version},
                {"capabilities", {{"tools", {{"listChanged", false}}}, {"events", {{"types", {"heartbeat", "backend_reachability_changed", "session_closing"}}}}}},
                {"serverInfo", {{"name", PROJECT_NAME}, {"version", PROJECT_VERSION}}},
                {"session_id", session->id()},
                {"capability_package", session->package()},
                {"tools", std::move(tools)}};
        return protocol::Response(std::move(result), id);
    }

}// namespace ticketmcp::routers
