#include "frames.h"
#include <sstream>

namespace ticketmcp::protocol {

    ToolCallResult ToolCallResult::success(std::string request_id, nlohmann::json payload) {
        ToolCallResult result;
        result.request_id = std::move(request_id);
        result.ok = true;
        result.payload = std::move(payload);
        return result;
    }

    ToolCallResult ToolCallResult::failure(std::string request_id, core::ErrorKind kind, std::string message,
                                           std::string detail) {
        ToolCallResult result;
        result.request_id = std::move(request_id);
        result.ok = false;
        result.error = ToolError{kind, std::move(message), std::move(detail)};
        return result;
    }

    nlohmann::json ToolCallResult::to_json() const {
        if (ok) {
            return {{"request_id", request_id}, {"status", "success"}, {"payload", payload}};
        }
        nlohmann::json j = {{"request_id", request_id},
                            {"status", "error"},
                            {"kind", core::to_string(error.kind)},
                            {"message", error.message}};
        if (!error.detail.empty()) {
            j["detail"] = error.detail;
        }
        return j;
    }

    std::string encode_result(const ToolCallResult &result, const nlohmann::json &rpc_id) {
        if (result.ok) {
            return make_response(result.to_json(), rpc_id);
        }
        return make_response(Error{error_code_for(result.error.kind), result.error.message, result.to_json()}, rpc_id);
    }

    std::string encode_event(const std::string &type, const nlohmann::json &detail) {
        return make_notification(EVENT_METHOD, {{"event_type", type}, {"detail", detail}});
    }

    std::string format_sse(const std::string &event, const std::string &data, const std::string &id) {
        std::ostringstream out;
        if (!event.empty()) {
            out << "event: " << event << "\n";
        }
        if (!id.empty()) {
            out << "id: " << id << "\n";
        }
        std::istringstream lines(data);
        std::string line;
        bool any = false;
        while (std::getline(lines, line)) {
            out << "data: " << line << "\n";
            any = true;
        }
        if (!any) {
            out << "data: \n";
        }
        out << "\n";
        return out.str();
    }

}// namespace ticketmcp::protocol
