#include "dispatch_engine.h"
#include "core/logger.h"
#include <algorithm>
#include <sstream>

namespace ticketmcp::business {

    namespace {

        constexpr int kDefaultListLimit = 100;
        constexpr int kMaxListLimit = 1000;

        // Text form of a scalar argument, for backend fields that are strings on the wire
        std::optional<std::string> text_arg(const catalog::ArgumentMap &args, const std::string &name) {
            auto it = args.find(name);
            if (it == args.end()) {
                return std::nullopt;
            }
            return std::visit(
                    [](const auto &v) -> std::optional<std::string> {
                        using T = std::decay_t<decltype(v)>;
                        if constexpr (std::is_same_v<T, std::string>) {
                            return v;
                        } else if constexpr (std::is_same_v<T, bool>) {
                            return std::string(v ? "true" : "false");
                        } else if constexpr (std::is_same_v<T, std::monostate>) {
                            return std::nullopt;
                        } else {
                            std::ostringstream out;
                            out << v;
                            return out.str();
                        }
                    },
                    it->second);
        }

        std::string required_text(const catalog::ArgumentMap &args, const std::string &name) {
            auto value = text_arg(args, name);
            if (!value || value->empty()) {
                throw core::ServiceError(core::ErrorKind::InvalidArgument, name + " required");
            }
            return *value;
        }

        backend::RecordFields fields_from(const catalog::ArgumentMap &args) {
            backend::RecordFields fields;
            fields.short_description = text_arg(args, "short_description");
            fields.description = text_arg(args, "description");
            fields.priority = text_arg(args, "priority");
            fields.urgency = text_arg(args, "urgency");
            fields.impact = text_arg(args, "impact");
            fields.category = text_arg(args, "category");
            fields.assignee = text_arg(args, "assignee");
            fields.state = text_arg(args, "state");
            fields.caller = text_arg(args, "caller_id");
            return fields;
        }

    }// namespace

    DispatchEngine::DispatchEngine(catalog::CatalogPtr catalog, std::shared_ptr<backend::RecordBackend> backend,
                                   DispatchOptions options)
        : catalog_(std::move(catalog)), backend_(std::move(backend)), options_(options) {}

    std::optional<protocol::ToolError> DispatchEngine::validate(const catalog::ToolDefinition &tool,
                                                                const catalog::ArgumentMap &arguments) const {
        for (const auto &param: tool.parameters) {
            auto it = arguments.find(param.name);
            if (it == arguments.end()) {
                if (param.required) {
                    return protocol::ToolError{core::ErrorKind::InvalidArgument, param.name + " required", {}};
                }
                continue;
            }
            if (!catalog::value_matches(param.type, it->second)) {
                return protocol::ToolError{core::ErrorKind::InvalidArgument,
                                           param.name + " must be " + catalog::to_string(param.type), {}};
            }
        }

        if (options_.strict_arguments) {
            for (const auto &[name, _]: arguments) {
                if (!tool.find_param(name)) {
                    return protocol::ToolError{core::ErrorKind::InvalidArgument, "unknown argument " + name, {}};
                }
            }
        }
        return std::nullopt;
    }

    protocol::ToolCallResult DispatchEngine::dispatch(const session::Session &session,
                                                      const protocol::ToolCallRequest &request) const {
        using protocol::ToolCallResult;

        if (!catalog_->package_contains(session.package(), request.tool_name)) {
            TICKETMCP_WARN("Session {} (package '{}') called '{}', not permitted", session.id(), session.package(),
                           request.tool_name);
            return ToolCallResult::failure(request.request_id, core::ErrorKind::Forbidden,
                                           "tool '" + request.tool_name + "' is not available in package '" +
                                                   session.package() + "'");
        }

        const auto &tool = catalog_->get(request.tool_name);
        if (auto violation = validate(tool, request.arguments)) {
            TICKETMCP_DEBUG("Rejected {} [{}]: {}", tool.name, request.request_id, violation->message);
            return ToolCallResult::failure(request.request_id, violation->kind, violation->message);
        }

        try {
            auto payload = invoke(tool, request);
            TICKETMCP_DEBUG("{} [{}] succeeded", tool.name, request.request_id);
            return ToolCallResult::success(request.request_id, std::move(payload));
        } catch (const core::ServiceError &e) {
            TICKETMCP_WARN("{} [{}] failed: {} {}", tool.name, request.request_id, core::to_string(e.kind()), e.what());
            return ToolCallResult::failure(request.request_id, e.kind(), e.what(), e.detail());
        } catch (const std::exception &e) {
            TICKETMCP_ERROR("{} [{}] raised an unclassified error: {}", tool.name, request.request_id, e.what());
            return ToolCallResult::failure(request.request_id, core::ErrorKind::Unknown, "internal error", e.what());
        }
    }

    nlohmann::json DispatchEngine::invoke(const catalog::ToolDefinition &tool,
                                          const protocol::ToolCallRequest &request) const {
        const auto &args = request.arguments;
        auto operation = backend::backend_operation_from_string(tool.backend_operation);
        if (!operation) {
            // catalog validation makes this unreachable for a loaded catalog
            throw core::ServiceError(core::ErrorKind::Unknown, "unsupported backend operation " + tool.backend_operation);
        }

        switch (*operation) {
            case backend::BackendOperation::List: {
                backend::ListQuery query;
                auto limit = catalog::get_integer(args, "limit").value_or(kDefaultListLimit);
                query.limit = static_cast<int>(std::clamp<std::int64_t>(limit, 1, kMaxListLimit));
                query.offset = static_cast<int>(std::max<std::int64_t>(catalog::get_integer(args, "offset").value_or(0), 0));
                query.query = text_arg(args, "query").value_or("");
                query.state = text_arg(args, "state");
                query.priority = text_arg(args, "priority");
                query.assignee = text_arg(args, "assignee");

                auto records = backend_->list(query);
                nlohmann::json items = nlohmann::json::array();
                for (const auto &record: records) {
                    items.push_back(record.to_json());
                }
                return {{"records", std::move(items)}, {"count", records.size()}};
            }
            case backend::BackendOperation::Create: {
                auto token = request.idempotency_token;
                if (!token) {
                    token = text_arg(args, "idempotency_token");
                }
                return backend_->create(fields_from(args), token).to_json();
            }
            case backend::BackendOperation::Read:
                return backend_->read(required_text(args, "identifier")).to_json();
            case backend::BackendOperation::Update:
                return backend_->update(required_text(args, "identifier"), fields_from(args)).to_json();
            case backend::BackendOperation::Delete: {
                auto identifier = required_text(args, "identifier");
                backend_->remove(identifier);
                return {{"identifier", identifier}, {"deleted", true}};
            }
            case backend::BackendOperation::Assign:
                return backend_
                        ->assign(required_text(args, "identifier"), required_text(args, "assignee"),
                                 text_arg(args, "assignment_group"))
                        .to_json();
            case backend::BackendOperation::Resolve: {
                backend::ResolveRequest resolve;
                resolve.close_notes = text_arg(args, "close_notes").value_or("");
                if (auto code = text_arg(args, "close_code")) {
                    resolve.close_code = *code;
                }
                return backend_->resolve(required_text(args, "identifier"), resolve).to_json();
            }
        }
        throw core::ServiceError(core::ErrorKind::Unknown, "unsupported backend operation " + tool.backend_operation);
    }

}// namespace ticketmcp::business
