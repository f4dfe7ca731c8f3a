#pragma once
#include "business/rpc_router.h"
#include "core/logger.h"
#include "protocol/json_rpc.h"

namespace ticketmcp::routers {

    /**
     * @brief Handle shutdown: stop taking tool calls and close once in-flight calls finish.
     */
    inline std::optional<protocol::Response> handle_shutdown(const protocol::Request &req, business::RpcContext &ctx) {
        TICKETMCP_INFO("Client on {} requested shutdown", ctx.client->connection_id());
        ctx.client->request_drain();
        if (req.is_notification()) {
            return std::nullopt;
        }
        return protocol::Response(nlohmann::json::object(), *req.id);
    }

}// namespace ticketmcp::routers
