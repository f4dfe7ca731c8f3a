#pragma once
#include "business/rpc_router.h"
#include "core/logger.h"
#include "metrics/metrics_manager.h"
#include "protocol/frames.h"
#include "protocol/json_rpc.h"
#include "utils/session_id.h"
#include <chrono>

namespace ticketmcp::routers {

    /**
     * @brief Handle tools/call.
     *
     * Reserves the request id on the session, then hands the dispatch to the worker pool;
     * the result reaches the client later through the connection's queue. Every accepted
     * id gets exactly one reply frame, errors included. A reused id is refused in the
     * acknowledgement, so nothing on the stream carries it twice. A call without a
     * JSON-RPC id gets a server-assigned request id, reported in the acknowledgement.
     */
    inline std::optional<protocol::Response> handle_tools_call(const protocol::Request &req, business::RpcContext &ctx) {
        std::string request_id = req.id ? protocol::id_to_string(*req.id) : utils::generate_request_id();
        nlohmann::json rpc_id = req.id.value_or(nlohmann::json(request_id));
        ctx.accepted["request_id"] = request_id;

        auto session = ctx.client->session();
        if (!session) {
            return protocol::Response(protocol::Error(protocol::error_code::SESSION_REQUIRED, "initialize must complete first"), rpc_id);
        }

        switch (ctx.registry->begin_request(session->id(), request_id)) {
            case session::BeginResult::Accepted:
                break;
            case session::BeginResult::Duplicate:
                ctx.ack_status = 400;
                ctx.accepted = nlohmann::json::parse(protocol::make_error(protocol::Error(
                        protocol::error_code::INVALID_REQUEST, "request id " + request_id + " was already used in this session",
                        nlohmann::json{{"request_id", request_id}})));
                return std::nullopt;
            case session::BeginResult::Closed:
                // the session expired under the client; it may initialize again
                ctx.client->bind_session(nullptr);
                return protocol::Response(protocol::Error(protocol::error_code::SESSION_REQUIRED, "session closed"), rpc_id);
        }

        auto reject = [&](const std::string &message_json) -> std::optional<protocol::Response> {
            auto client = ctx.client;
            ctx.registry->complete_request(session->id(), request_id, [&]() { client->send(message_json); });
            return std::nullopt;
        };

        const auto &params = req.params;
        if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
            return reject(protocol::make_response(protocol::Error(protocol::error_code::INVALID_PARAMS, "name required"), rpc_id));
        }

        protocol::ToolCallRequest call;
        call.request_id = request_id;
        call.tool_name = params["name"].get<std::string>();
        try {
            call.arguments = catalog::arguments_from_json(params.value("arguments", nlohmann::json::object()));
        } catch (const std::exception &e) {
            return reject(protocol::make_response(protocol::Error(protocol::error_code::INVALID_PARAMS, e.what()), rpc_id));
        }
        if (params.contains("idempotency_token") && params["idempotency_token"].is_string()) {
            call.idempotency_token = params["idempotency_token"].get<std::string>();
        }

        if (ctx.client->draining()) {
            auto refused = protocol::ToolCallResult::failure(request_id, core::ErrorKind::Unavailable, "session draining");
            return reject(protocol::encode_result(refused, rpc_id));
        }

        ctx.run_task([client = ctx.client, registry = ctx.registry, engine = ctx.engine, session,
                      call = std::move(call), rpc_id]() {
            auto started = std::chrono::steady_clock::now();
            auto result = engine->dispatch(*session, call);
            double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();

            auto metrics = metrics::MetricsManager::getInstance();
            metrics->report_tool_call(call.tool_name, result.ok ? nullptr : &result.error.kind, elapsed_ms);

            auto frame = protocol::encode_result(result, rpc_id);
            bool delivered = registry->complete_request(session->id(), call.request_id, [&]() { client->send(frame); });
            if (!delivered) {
                TICKETMCP_DEBUG("Dropping result of {} [{}]: session {} is gone", call.tool_name, call.request_id, session->id());
                metrics->report_dropped_result();
            }
        });
        return std::nullopt;
    }

}// namespace ticketmcp::routers
