// src/business/dispatch_engine.h
#pragma once

#include "backend/record_backend.h"
#include "catalog/tool_catalog.h"
#include "protocol/frames.h"
#include "session/session.h"
#include <memory>
#include <optional>

namespace ticketmcp::business {

    struct DispatchOptions {
        /// Reject arguments the tool schema does not declare instead of ignoring them.
        bool strict_arguments = false;
    };

    /**
     * @brief Validates a tool call against the session's package and the tool schema, then
     * runs it against the backend.
     *
     * dispatch() never throws: every failure comes back as a ToolCallResult with a
     * classified error. It blocks for the duration of the backend call, so callers run it
     * on the worker pool.
     */
    class DispatchEngine {
    public:
        DispatchEngine(catalog::CatalogPtr catalog, std::shared_ptr<backend::RecordBackend> backend,
                       DispatchOptions options = {});

        protocol::ToolCallResult dispatch(const session::Session &session, const protocol::ToolCallRequest &request) const;

        /// Schema check only. Returns the first violation found.
        std::optional<protocol::ToolError> validate(const catalog::ToolDefinition &tool,
                                                    const catalog::ArgumentMap &arguments) const;

        const catalog::ToolCatalog &catalog() const { return *catalog_; }
        const DispatchOptions &options() const { return options_; }

    private:
        nlohmann::json invoke(const catalog::ToolDefinition &tool, const protocol::ToolCallRequest &request) const;

        catalog::CatalogPtr catalog_;
        std::shared_ptr<backend::RecordBackend> backend_;
        DispatchOptions options_;
    };

}// namespace ticketmcp::business
