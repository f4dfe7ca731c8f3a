#include "request_handler.h"
#include "core/logger.h"
#include "protocol/json_rpc.h"
#include "routers/initialize.hpp"
#include "routers/shutdown.hpp"
#include "routers/tools_call.hpp"
#include "routers/tools_list.hpp"

namespace ticketmcp::business {

    using namespace routers;

    RequestHandler::RequestHandler(std::shared_ptr<session::SessionRegistry> registry,
                                   std::shared_ptr<const DispatchEngine> engine,
                                   TaskRunner run_task,
                                   std::string default_package)
        : registry_(std::move(registry)),
          engine_(std::move(engine)),
          run_task_(std::move(run_task)),
          default_package_(std::move(default_package)) {
        // Register route handlers
        router_.register_handler("initialize", handle_initialize);
        router_.register_handler("tools/list", handle_tools_list);
        router_.register_handler("tools/call", handle_tools_call);
        router_.register_handler("shutdown", handle_shutdown);
        router_.register_handler("notifications/initialized", [](const protocol::Request &, RpcContext &ctx) -> std::optional<protocol::Response> {
            TICKETMCP_DEBUG("Received notifications/initialized on {}", ctx.client->connection_id());
            return std::nullopt;
        });
        router_.register_handler("ping", [](const protocol::Request &req, RpcContext &ctx) -> std::optional<protocol::Response> {
            TICKETMCP_TRACE("Received ping on {}", ctx.client->connection_id());
            return protocol::Response(nlohmann::json::object(), protocol::get_request_id(req));
        });
    }

    MessageAck RequestHandler::handle_message(const std::string &msg, const std::shared_ptr<ClientContext> &client) {
        TICKETMCP_TRACE("Raw message on {}: {}", client->connection_id(), msg);
        MessageAck ack;

        auto [parsed_req, parse_error] = protocol::parse_request(msg);
        if (!parsed_req.has_value()) {
            ack.status = 400;
            if (parse_error.has_value()) {
                ack.body = nlohmann::json::parse(protocol::make_error(parse_error.value()));
            } else {
                ack.body = nlohmann::json::parse(protocol::make_error(
                        protocol::error_code::INVALID_REQUEST, "Invalid JSON-RPC request format", nullptr));
            }
            return ack;
        }

        const protocol::Request &request = parsed_req.value();
        if (auto session = client->session()) {
            registry_->touch(session->id());
        }

        RpcContext ctx{client, registry_, engine_, run_task_, default_package_};
        auto response = router_.route_request(request, ctx);
        ack.status = ctx.ack_status;
        ack.body = std::move(ctx.accepted);

        // Only send responses that carry an id; notifications get none
        if (response.has_value() && !response->id.is_null()) {
            if (!client->send(protocol::make_response(*response))) {
                TICKETMCP_DEBUG("Reply to '{}' dropped: {} is closed", request.method, client->connection_id());
            }
        }
        return ack;
    }

}// namespace ticketmcp::business
