// src/catalog/tool_definition.h
#pragma once

#include "nlohmann/json.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ticketmcp::catalog {

    enum class ParamType {
        String,
        Integer,
        Number,
        Boolean
    };

    const char *to_string(ParamType type);
    std::optional<ParamType> param_type_from_string(std::string_view name);

    /**
     * @brief A single tool argument. std::monostate marks a value whose JSON type has no
     * counterpart here (array, object), so it always fails schema validation.
     */
    using ArgValue = std::variant<std::monostate, std::string, std::int64_t, double, bool>;

    /// Arguments keyed by parameter name.
    using ArgumentMap = std::map<std::string, ArgValue>;

    struct ParamSpec {
        std::string name;
        ParamType type = ParamType::String;
        bool required = false;
        std::string description;
    };

    struct ToolDefinition {
        std::string name;
        std::string description;
        std::vector<ParamSpec> parameters;// declaration order is preserved
        std::string backend_operation;

        const ParamSpec *find_param(std::string_view param_name) const;

        /// JSON Schema object advertised through tools/list.
        nlohmann::json input_schema() const;
        nlohmann::json to_json() const;
    };

    /// True when the value is acceptable for the declared type. Integers are accepted for Number.
    bool value_matches(ParamType type, const ArgValue &value);

    nlohmann::json arg_to_json(const ArgValue &value);
    ArgValue arg_from_json(const nlohmann::json &value);

    /**
     * @brief Convert a JSON object into an ArgumentMap. Null members are treated as absent.
     * @throws std::invalid_argument when @p args is neither an object nor null
     */
    ArgumentMap arguments_from_json(const nlohmann::json &args);
    nlohmann::json arguments_to_json(const ArgumentMap &args);

    /**
     * @brief Parse a textual value (query string, header) into the declared type.
     * Returns a string ArgValue when the text does not parse, so validation reports the type.
     */
    ArgValue parse_arg_text(ParamType type, const std::string &text);

    // Typed accessors used when translating validated arguments into backend calls
    std::optional<std::string> get_string(const ArgumentMap &args, const std::string &name);
    std::optional<std::int64_t> get_integer(const ArgumentMap &args, const std::string &name);
    std::optional<bool> get_bool(const ArgumentMap &args, const std::string &name);

}// namespace ticketmcp::catalog
