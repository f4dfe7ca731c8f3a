#include "json_rpc.h"
#include <string>

namespace ticketmcp::protocol {

    namespace {
        bool has_valid_jsonrpc(const nlohmann::json &j) {
            return j.contains("jsonrpc") && j["jsonrpc"].is_string() &&
                   j["jsonrpc"].get<std::string>() == "2.0";
        }

        nlohmann::json id_or_null(const nlohmann::json &j) {
            if (j.contains("id") && (j["id"].is_number() || j["id"].is_string())) {
                return j["id"];
            }
            return nullptr;
        }
    }// namespace

    int error_code_for(core::ErrorKind kind) {
        switch (kind) {
            case core::ErrorKind::Forbidden:
                return error_code::FORBIDDEN;
            case core::ErrorKind::InvalidArgument:
                return error_code::INVALID_PARAMS;
            case core::ErrorKind::NotFound:
                return error_code::NOT_FOUND;
            case core::ErrorKind::Unauthorized:
                return error_code::UNAUTHORIZED;
            case core::ErrorKind::RateLimited:
                return error_code::RATE_LIMITED;
            case core::ErrorKind::Unavailable:
                return error_code::UNAVAILABLE;
            case core::ErrorKind::Unknown:
            default:
                return error_code::UNKNOWN;
        }
    }

    std::pair<std::optional<Request>, std::optional<Error>> parse_request(const std::string &text) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(text);
        } catch (const nlohmann::json::parse_error &e) {
            return {std::nullopt,
                    Error{error_code::PARSE_ERROR,
                          "Parse error: " + std::string(e.what()),
                          nlohmann::json{{"byte", e.byte}},
                          nlohmann::json(nullptr)}};
        }

        if (!j.is_object()) {
            return {std::nullopt,
                    Error{error_code::INVALID_REQUEST, "Request must be a JSON object", std::nullopt, nlohmann::json(nullptr)}};
        }

        if (!has_valid_jsonrpc(j)) {
            return {std::nullopt,
                    Error{error_code::INVALID_REQUEST, "'jsonrpc' must be '2.0'", std::nullopt, id_or_null(j)}};
        }

        if (!j.contains("method") || !j["method"].is_string()) {
            return {std::nullopt,
                    Error{error_code::INVALID_REQUEST, "'method' must be a string", std::nullopt, id_or_null(j)}};
        }

        std::optional<nlohmann::json> req_id;
        if (j.contains("id")) {
            const auto &id = j["id"];
            if (id.is_number() || id.is_string()) {
                req_id = id;
            } else if (!id.is_null()) {
                return {std::nullopt,
                        Error{error_code::INVALID_REQUEST,
                              "'id' must be number, string, or null",
                              nlohmann::json{{"received_type", id.type_name()}},
                              nlohmann::json(nullptr)}};
            }
        }

        nlohmann::json params = j.value("params", nlohmann::json::object());
        if (!params.is_object() && !params.is_array()) {
            return {std::nullopt,
                    Error{error_code::INVALID_PARAMS, "'params' must be an object or array", std::nullopt, id_or_null(j)}};
        }

        return {Request(j["method"].get<std::string>(), std::move(params), std::move(req_id)), std::nullopt};
    }

    std::string make_response(const Response &resp) {
        if (!resp.is_valid()) {
            return make_error(error_code::INTERNAL_ERROR, "Invalid response: contains both result and error", resp.id);
        }

        nlohmann::json j;
        j["jsonrpc"] = "2.0";
        j["id"] = resp.id;

        if (resp.error.has_value()) {
            j["error"] = nlohmann::json{{"code", resp.error->code}, {"message", resp.error->message}};
            if (resp.error->data.has_value()) {
                j["error"]["data"] = resp.error->data.value();
            }
        } else {
            j["result"] = resp.result.is_null() ? nlohmann::json::object() : resp.result;
        }

        return j.dump();
    }

    std::string make_response(const nlohmann::json &result, const nlohmann::json &id) {
        return make_response(Response{result, id});
    }

    std::string make_response(const Error &error, const nlohmann::json &id) {
        return make_response(Response{error, id});
    }

    std::string make_error(const Error &err) {
        nlohmann::json j;
        j["jsonrpc"] = "2.0";

        nlohmann::json error_obj{{"code", err.code}, {"message", err.message}};
        if (err.data.has_value()) {
            error_obj["data"] = err.data.value();
        }
        j["error"] = error_obj;
        j["id"] = err.id.has_value() ? err.id.value() : nlohmann::json(nullptr);

        return j.dump();
    }

    std::string make_error(int code, const std::string &message, const nlohmann::json &id) {
        return make_error(Error{code, message, std::nullopt, id});
    }

    std::string make_notification(const std::string &method, const nlohmann::json &params) {
        nlohmann::json j;
        j["jsonrpc"] = "2.0";
        j["method"] = method;
        if (!params.is_null() && !params.empty()) {
            j["params"] = params;
        }
        return j.dump();
    }

    nlohmann::json get_request_id(const Request &req) {
        return req.id.has_value() ? req.id.value() : nlohmann::json(nullptr);
    }

    std::string id_to_string(const nlohmann::json &id) {
        if (id.is_string()) {
            return id.get<std::string>();
        }
        if (id.is_null()) {
            return {};
        }
        return id.dump();
    }

}// namespace ticketmcp::protocol
