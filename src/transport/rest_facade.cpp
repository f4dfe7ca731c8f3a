#include "rest_facade.h"
#include "core/logger.h"
#include "session/session.h"
#include "utils/session_id.h"
#include <vector>

namespace ticketmcp::transport {

    namespace {

        constexpr const char *kApiPrefix = "/api/incidents";
        constexpr const char *kLegacyListPath = "/incidents";

        // "/api/incidents/INC001/assign" -> {"INC001", "assign"}
        std::vector<std::string> split_segments(const std::string &rest) {
            std::vector<std::string> segments;
            size_t start = 0;
            while (start < rest.size()) {
                size_t end = rest.find('/', start);
                if (end == std::string::npos) {
                    end = rest.size();
                }
                if (end > start) {
                    segments.push_back(rest.substr(start, end - start));
                }
                start = end + 1;
            }
            return segments;
        }

        // query-string name -> list_incidents parameter name
        const std::map<std::string, std::string> &list_query_aliases() {
            static const std::map<std::string, std::string> aliases = {
                    {"limit", "limit"},
                    {"offset", "offset"},
                    {"query", "query"},
                    {"sysparm_query", "query"},
                    {"state", "state"},
                    {"priority", "priority"},
                    {"assigned_to", "assignee"},
                    {"assignee", "assignee"}};
            return aliases;
        }

    }// namespace

    RestFacade::RestFacade(std::shared_ptr<const business::DispatchEngine> engine, std::string default_package,
                           auth::PackagePolicy policy)
        : engine_(std::move(engine)), default_package_(std::move(default_package)), policy_(std::move(policy)) {}

    bool RestFacade::matches(const std::string &path) {
        return path == kLegacyListPath || path == kApiPrefix || path.rfind(std::string(kApiPrefix) + "/", 0) == 0;
    }

    int RestFacade::status_for(core::ErrorKind kind) {
        switch (kind) {
            case core::ErrorKind::Forbidden:
                return 403;
            case core::ErrorKind::InvalidArgument:
                return 400;
            case core::ErrorKind::NotFound:
                return 404;
            case core::ErrorKind::Unauthorized:
                return 502;
            case core::ErrorKind::RateLimited:
                return 429;
            case core::ErrorKind::Unavailable:
                return 503;
            case core::ErrorKind::Unknown:
            default:
                return 500;
        }
    }

    RestResponse RestFacade::error_response(core::ErrorKind kind, const std::string &message,
                                            const std::string &detail, const std::string &request_id) {
        nlohmann::json error = {{"kind", core::to_string(kind)}, {"message", message}};
        if (!detail.empty()) {
            error["detail"] = detail;
        }
        nlohmann::json body = {{"status", "error"}, {"error", std::move(error)}};
        if (!request_id.empty()) {
            body["request_id"] = request_id;
        }
        return RestResponse{status_for(kind), std::move(body)};
    }

    RestResponse RestFacade::handle(const RestRequest &request, const auth::CallerIdentity &identity) const {
        std::vector<std::string> segments;
        if (request.path != kLegacyListPath) {
            segments = split_segments(request.path.substr(std::string(kApiPrefix).size()));
        }

        catalog::ArgumentMap body_args;
        if ((request.method == "POST" || request.method == "PATCH" || request.method == "PUT") && !request.body.empty()) {
            try {
                body_args = catalog::arguments_from_json(nlohmann::json::parse(request.body));
            } catch (const std::exception &e) {
                return error_response(core::ErrorKind::InvalidArgument, "request body must be a JSON object", e.what());
            }
        }

        if (segments.empty()) {
            if (request.method == "GET") {
                catalog::ArgumentMap args;
                for (const auto &[name, value]: request.query) {
                    auto alias = list_query_aliases().find(name);
                    if (alias != list_query_aliases().end() && !value.empty()) {
                        args[alias->second] = value;
                    }
                }
                return invoke("list", std::move(args), std::nullopt, request, identity);
            }
            if (request.method == "POST" && request.path != kLegacyListPath) {
                std::optional<std::string> token;
                auto header = request.headers.find("idempotency-key");
                if (header != request.headers.end() && !header->second.empty()) {
                    token = header->second;
                }
                return invoke("create", std::move(body_args), token, request, identity);
            }
            return error_response(core::ErrorKind::InvalidArgument, "method " + request.method + " not allowed on " + request.path);
        }

        const std::string &identifier = segments[0];
        body_args["identifier"] = identifier;

        if (segments.size() == 1) {
            if (request.method == "GET") {
                return invoke("read", {{"identifier", identifier}}, std::nullopt, request, identity);
            }
            if (request.method == "PATCH" || request.method == "PUT") {
                return invoke("update", std::move(body_args), std::nullopt, request, identity);
            }
            if (request.method == "DELETE") {
                return invoke("delete", {{"identifier", identifier}}, std::nullopt, request, identity);
            }
        } else if (segments.size() == 2 && request.method == "POST") {
            if (segments[1] == "assign") {
                return invoke("assign", std::move(body_args), std::nullopt, request, identity);
            }
            if (segments[1] == "resolve") {
                return invoke("resolve", std::move(body_args), std::nullopt, request, identity);
            }
        }
        return error_response(core::ErrorKind::NotFound, "no route for " + request.method + " " + request.path);
    }

    RestResponse RestFacade::invoke(const std::string &operation, catalog::ArgumentMap arguments,
                                    std::optional<std::string> idempotency_token,
                                    const RestRequest &request, const auth::CallerIdentity &identity) const {
        std::string package = default_package_;
        auto header = request.headers.find("x-tool-package");
        if (header != request.headers.end() && !header->second.empty()) {
            package = header->second;
        }

        const auto &catalog = engine_->catalog();
        if (!catalog.has_package(package)) {
            return error_response(core::ErrorKind::NotFound, "unknown tool package '" + package + "'");
        }
        if (!policy_.permits(identity, package)) {
            return error_response(core::ErrorKind::Forbidden, "role '" + identity.role + "' may not use package '" + package + "'");
        }

        const auto *tool = catalog.find_by_operation(package, operation);
        if (!tool) {
            return error_response(core::ErrorKind::Forbidden,
                                  "operation '" + operation + "' is not available in package '" + package + "'");
        }

        // query-string values arrive as text; give them the declared types
        for (auto &[name, value]: arguments) {
            const auto *param = tool->find_param(name);
            const auto *text = std::get_if<std::string>(&value);
            if (param && text && param->type != catalog::ParamType::String) {
                value = catalog::parse_arg_text(param->type, *text);
            }
        }

        protocol::ToolCallRequest call;
        call.request_id = utils::generate_request_id();
        call.tool_name = tool->name;
        call.arguments = std::move(arguments);
        call.idempotency_token = std::move(idempotency_token);

        session::Session session(utils::generate_session_id(), "rest", package, identity);
        auto result = engine_->dispatch(session, call);
        if (!result.ok) {
            return error_response(result.error.kind, result.error.message, result.error.detail, result.request_id);
        }
        TICKETMCP_DEBUG("REST {} {} -> {} [{}]", request.method, request.path, tool->name, result.request_id);
        return RestResponse{operation == "create" ? 201 : 200, std::move(result.payload)};
    }

}// namespace ticketmcp::transport
