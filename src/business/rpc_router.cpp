#include "rpc_router.h"
#include "core/logger.h"

namespace ticketmcp::business {

    /**
     * @brief Register RPC method handler
     * @param method RPC method name
     * @param handler Handler function for the method
     */
    void RpcRouter::register_handler(const std::string &method, RpcHandler handler) {
        handlers_[method] = std::move(handler);
    }

    /**
     * @brief Find registered handler for a method
     * @param method RPC method name
     * @return Optional handler if found
     */
    std::optional<RpcHandler> RpcRouter::find_handler(const std::string &method) const {
        auto it = handlers_.find(method);
        return (it != handlers_.end()) ? std::optional<RpcHandler>(it->second) : std::nullopt;
    }

    /**
     * @brief Route RPC request to appropriate handler
     * @param req RPC request object
     * @param ctx Connection, registry and dispatcher for this message
     * @return Response to send now, if any
     */
    std::optional<protocol::Response> RpcRouter::route_request(const protocol::Request &req, RpcContext &ctx) const {
        auto handler = find_handler(req.method);
        if (handler.has_value()) {
            return handler.value()(req, ctx);
        }

        TICKETMCP_DEBUG("Unsupported method '{}' from {}", req.method, ctx.client->connection_id());
        if (req.is_notification()) {
            return std::nullopt;
        }
        return protocol::Response(
                protocol::Error(protocol::error_code::METHOD_NOT_FOUND, "Method not supported: " + req.method),
                *req.id);
    }

}// namespace ticketmcp::business
