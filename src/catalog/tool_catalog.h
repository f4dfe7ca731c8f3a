// src/catalog/tool_catalog.h
#pragma once

#include "tool_definition.h"
#include <functional>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace ticketmcp::catalog {

    /**
     * @brief Raised when a catalog document fails validation. Always fatal at startup.
     */
    class CatalogError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /// Answers whether the backend implements a named operation.
    using OperationSupport = std::function<bool(const std::string &operation)>;

    /**
     * @brief Immutable set of tool definitions and the packages that group them.
     *
     * Built once through load_file() or from_json() and shared as
     * std::shared_ptr<const ToolCatalog>. All accessors are const and safe to call
     * concurrently without locking.
     */
    class ToolCatalog {
    public:
        /// Reserved package name that always resolves to no tools.
        static constexpr const char *kNonePackage = "none";

        static std::shared_ptr<const ToolCatalog> load_file(const std::string &path, const OperationSupport &supports);
        static std::shared_ptr<const ToolCatalog> from_json(const nlohmann::json &doc, const OperationSupport &supports);

        /**
         * @brief Tools exposed by a package, in declaration order of the catalog.
         * @throws core::ServiceError NotFound when the package does not exist
         */
        std::vector<const ToolDefinition *> resolve(const std::string &package) const;

        /**
         * @brief Look up a tool by name regardless of package.
         * @throws core::ServiceError NotFound when the tool does not exist
         */
        const ToolDefinition &get(const std::string &tool_name) const;

        const ToolDefinition *find(const std::string &tool_name) const;

        bool has_package(const std::string &package) const;
        bool package_contains(const std::string &package, const std::string &tool_name) const;

        /// First tool in the package bound to the given backend operation, or nullptr.
        const ToolDefinition *find_by_operation(const std::string &package, const std::string &operation) const;

        std::vector<std::string> package_names() const;
        size_t tool_count() const { return tools_.size(); }

    private:
        ToolCatalog() = default;

        std::vector<ToolDefinition> tools_;
        std::unordered_map<std::string, size_t> index_;
        std::unordered_map<std::string, std::set<std::string>> packages_;
    };

    using CatalogPtr = std::shared_ptr<const ToolCatalog>;

}// namespace ticketmcp::catalog
