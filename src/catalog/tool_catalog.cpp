#include "tool_catalog.h"
#include "core/errors.h"
#include "core/logger.h"
#include <algorithm>
#include <fstream>

namespace ticketmcp::catalog {

    namespace {

        ParamSpec parse_param(const std::string &tool_name, const nlohmann::json &node) {
            if (!node.is_object()) {
                throw CatalogError("tool '" + tool_name + "': parameter entries must be objects");
            }
            ParamSpec spec;
            spec.name = node.value("name", "");
            if (spec.name.empty()) {
                throw CatalogError("tool '" + tool_name + "': parameter without a name");
            }
            std::string type_name = node.value("type", "string");
            auto type = param_type_from_string(type_name);
            if (!type) {
                throw CatalogError("tool '" + tool_name + "': parameter '" + spec.name + "' has unknown type '" + type_name + "'");
            }
            spec.type = *type;
            spec.required = node.value("required", false);
            spec.description = node.value("description", "");
            return spec;
        }

        ToolDefinition parse_tool(const nlohmann::json &node, const OperationSupport &supports) {
            if (!node.is_object()) {
                throw CatalogError("tool entries must be objects");
            }
            ToolDefinition tool;
            tool.name = node.value("name", "");
            if (tool.name.empty()) {
                throw CatalogError("tool without a name");
            }
            tool.description = node.value("description", "");
            tool.backend_operation = node.value("backend_operation", "");
            if (tool.backend_operation.empty()) {
                throw CatalogError("tool '" + tool.name + "' has no backend_operation");
            }
            if (supports && !supports(tool.backend_operation)) {
                throw CatalogError("tool '" + tool.name + "' maps to backend operation '" + tool.backend_operation +
                                   "' which the backend does not implement");
            }

            if (node.contains("parameters")) {
                const auto &params = node.at("parameters");
                if (!params.is_array()) {
                    throw CatalogError("tool '" + tool.name + "': parameters must be an array");
                }
                for (const auto &param_node: params) {
                    ParamSpec spec = parse_param(tool.name, param_node);
                    if (tool.find_param(spec.name) != nullptr) {
                        throw CatalogError("tool '" + tool.name + "': duplicate parameter '" + spec.name + "'");
                    }
                    tool.parameters.push_back(std::move(spec));
                }
            }
            return tool;
        }

    }// namespace

    std::shared_ptr<const ToolCatalog> ToolCatalog::load_file(const std::string &path, const OperationSupport &supports) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw CatalogError("cannot open tool catalog: " + path);
        }

        nlohmann::json doc;
        try {
            file >> doc;
        } catch (const nlohmann::json::parse_error &e) {
            throw CatalogError("tool catalog " + path + " is not valid JSON: " + e.what());
        }

        auto catalog = from_json(doc, supports);
        TICKETMCP_INFO("Loaded tool catalog {} ({} tools, {} packages)", path, catalog->tool_count(),
                       catalog->package_names().size());
        return catalog;
    }

    std::shared_ptr<const ToolCatalog> ToolCatalog::from_json(const nlohmann::json &doc, const OperationSupport &supports) {
        if (!doc.is_object() || !doc.contains("tools") || !doc.at("tools").is_array()) {
            throw CatalogError("tool catalog must be an object with a 'tools' array");
        }

        std::shared_ptr<ToolCatalog> catalog(new ToolCatalog());

        for (const auto &tool_node: doc.at("tools")) {
            ToolDefinition tool = parse_tool(tool_node, supports);
            if (catalog->index_.count(tool.name)) {
                throw CatalogError("duplicate tool '" + tool.name + "'");
            }
            catalog->index_.emplace(tool.name, catalog->tools_.size());
            catalog->tools_.push_back(std::move(tool));
        }

        catalog->packages_[kNonePackage] = {};

        if (doc.contains("packages")) {
            const auto &packages = doc.at("packages");
            if (!packages.is_object()) {
                throw CatalogError("'packages' must map package names to tool name arrays");
            }
            for (const auto &[package_name, members]: packages.items()) {
                if (package_name.empty()) {
                    throw CatalogError("package with an empty name");
                }
                if (!members.is_array()) {
                    throw CatalogError("package '" + package_name + "' must be an array of tool names");
                }
                if (package_name == kNonePackage) {
                    if (!members.empty()) {
                        throw CatalogError("package 'none' is reserved and must stay empty");
                    }
                    continue;
                }

                std::set<std::string> tool_names;
                for (const auto &member: members) {
                    if (!member.is_string()) {
                        throw CatalogError("package '" + package_name + "' contains a non-string entry");
                    }
                    auto tool_name = member.get<std::string>();
                    if (!catalog->index_.count(tool_name)) {
                        throw CatalogError("package '" + package_name + "' references unknown tool '" + tool_name + "'");
                    }
                    tool_names.insert(std::move(tool_name));
                }
                catalog->packages_[package_name] = std::move(tool_names);
            }
        }

        return catalog;
    }

    std::vector<const ToolDefinition *> ToolCatalog::resolve(const std::string &package) const {
        auto it = packages_.find(package);
        if (it == packages_.end()) {
            throw core::ServiceError(core::ErrorKind::NotFound, "unknown tool package '" + package + "'");
        }
        std::vector<const ToolDefinition *> result;
        for (const auto &tool: tools_) {
            if (it->second.count(tool.name)) {
                result.push_back(&tool);
            }
        }
        return result;
    }

    const ToolDefinition &ToolCatalog::get(const std::string &tool_name) const {
        const auto *tool = find(tool_name);
        if (!tool) {
            throw core::ServiceError(core::ErrorKind::NotFound, "unknown tool '" + tool_name + "'");
        }
        return *tool;
    }

    const ToolDefinition *ToolCatalog::find(const std::string &tool_name) const {
        auto it = index_.find(tool_name);
        return it == index_.end() ? nullptr : &tools_[it->second];
    }

    bool ToolCatalog::has_package(const std::string &package) const {
        return packages_.count(package) > 0;
    }

    bool ToolCatalog::package_contains(const std::string &package, const std::string &tool_name) const {
        auto it = packages_.find(package);
        return it != packages_.end() && it->second.count(tool_name) > 0;
    }

    const ToolDefinition *ToolCatalog::find_by_operation(const std::string &package, const std::string &operation) const {
        auto it = packages_.find(package);
        if (it == packages_.end()) {
            return nullptr;
        }
        for (const auto &tool: tools_) {
            if (tool.backend_operation == operation && it->second.count(tool.name)) {
                return &tool;
            }
        }
        return nullptr;
    }

    std::vector<std::string> ToolCatalog::package_names() const {
        std::vector<std::string> names;
        names.reserve(packages_.size());
        for (const auto &[name, _]: packages_) {
            names.push_back(name);
        }
        std::sort(names.begin(), names.end());
        return names;
    }

}// namespace ticketmcp::catalog
