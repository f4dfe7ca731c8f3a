// src/protocol/frames.h
#pragma once

#include "catalog/tool_definition.h"
#include "core/errors.h"
#include "json_rpc.h"
#include <optional>
#include <string>

namespace ticketmcp::protocol {

    struct ToolCallRequest {
        std::string request_id;
        std::string tool_name;
        catalog::ArgumentMap arguments;
        std::optional<std::string> idempotency_token;
    };

    struct ToolError {
        core::ErrorKind kind = core::ErrorKind::Unknown;
        std::string message;
        std::string detail;
    };

    /**
     * @brief Outcome of one tool call. Exactly one of payload / error is meaningful,
     * selected by ok.
     */
    struct ToolCallResult {
        std::string request_id;
        bool ok = false;
        nlohmann::json payload;
        ToolError error;

        static ToolCallResult success(std::string request_id, nlohmann::json payload);
        static ToolCallResult failure(std::string request_id, core::ErrorKind kind, std::string message,
                                      std::string detail = {});

        /// {request_id, status, payload} or {request_id, status, kind, message, detail?}
        nlohmann::json to_json() const;
    };

    /// Unsolicited event types pushed to connections.
    namespace event_type {
        constexpr const char *HEARTBEAT = "heartbeat";
        constexpr const char *BACKEND_REACHABILITY = "backend_reachability_changed";
        constexpr const char *SESSION_CLOSING = "session_closing";
    }// namespace event_type

    constexpr const char *EVENT_METHOD = "notifications/event";

    /**
     * @brief JSON-RPC message carrying a tool call result, keyed by @p rpc_id.
     * Failures become a JSON-RPC error whose data repeats the normalized error.
     */
    std::string encode_result(const ToolCallResult &result, const nlohmann::json &rpc_id);

    /// notifications/event message with {event_type, detail}.
    std::string encode_event(const std::string &type, const nlohmann::json &detail);

    /// One Server-Sent Events frame. Multi-line data is split over several data: lines.
    std::string format_sse(const std::string &event, const std::string &data, const std::string &id = {});

}// namespace ticketmcp::protocol
