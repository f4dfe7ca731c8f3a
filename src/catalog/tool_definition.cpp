#include "tool_definition.h"
#include <charconv>
#include <stdexcept>

namespace ticketmcp::catalog {

    const char *to_string(ParamType type) {
        switch (type) {
            case ParamType::String:
                return "string";
            case ParamType::Integer:
                return "integer";
            case ParamType::Number:
                return "number";
            case ParamType::Boolean:
                return "boolean";
        }
        return "string";
    }

    std::optional<ParamType> param_type_from_string(std::string_view name) {
        if (name == "string") return ParamType::String;
        if (name == "integer") return ParamType::Integer;
        if (name == "number") return ParamType::Number;
        if (name == "boolean") return ParamType::Boolean;
        return std::nullopt;
    }

    const ParamSpec *ToolDefinition::find_param(std::string_view param_name) const {
        for (const auto &param: parameters) {
            if (param.name == param_name) {
                return &param;
            }
        }
        return nullptr;
    }

    nlohmann::json ToolDefinition::input_schema() const {
        nlohmann::json properties = nlohmann::json::object();
        nlohmann::json required = nlohmann::json::array();
        for (const auto &param: parameters) {
            nlohmann::json prop = {{"type", to_string(param.type)}};
            if (!param.description.empty()) {
                prop["description"] = param.description;
            }
            properties[param.name] = std::move(prop);
            if (param.required) {
                required.push_back(param.name);
            }
        }
        return {{"type", "object"}, {"properties", std::move(properties)}, {"required", std::move(required)}};
    }

    nlohmann::json ToolDefinition::to_json() const {
        return {{"name", name}, {"description", description}, {"inputSchema", input_schema()}};
    }

    bool value_matches(ParamType type, const ArgValue &value) {
        switch (type) {
            case ParamType::String:
                return std::holds_alternative<std::string>(value);
            case ParamType::Integer:
                return std::holds_alternative<std::int64_t>(value);
            case ParamType::Number:
                return std::holds_alternative<double>(value) || std::holds_alternative<std::int64_t>(value);
            case ParamType::Boolean:
                return std::holds_alternative<bool>(value);
        }
        return false;
    }

    nlohmann::json arg_to_json(const ArgValue &value) {
        return std::visit(
                [](const auto &v) -> nlohmann::json {
                    using T = std::decay_t<decltype(v)>;
                    if constexpr (std::is_same_v<T, std::monostate>) {
                        return nullptr;
                    } else {
                        return v;
                    }
                },
                value);
    }

    ArgValue arg_from_json(const nlohmann::json &value) {
        if (value.is_string()) return value.get<std::string>();
        if (value.is_boolean()) return value.get<bool>();
        if (value.is_number_integer()) return value.get<std::int64_t>();
        if (value.is_number_float()) {
            double d = value.get<double>();
            return d;
        }
        return std::monostate{};
    }

    ArgumentMap arguments_from_json(const nlohmann::json &args) {
        ArgumentMap result;
        if (args.is_null()) {
            return result;
        }
        if (!args.is_object()) {
            throw std::invalid_argument("arguments must be an object");
        }
        for (const auto &[key, value]: args.items()) {
            if (value.is_null()) {
                continue;
            }
            result.emplace(key, arg_from_json(value));
        }
        return result;
    }

    nlohmann::json arguments_to_json(const ArgumentMap &args) {
        nlohmann::json out = nlohmann::json::object();
        for (const auto &[key, value]: args) {
            out[key] = arg_to_json(value);
        }
        return out;
    }

    ArgValue parse_arg_text(ParamType type, const std::string &text) {
        switch (type) {
            case ParamType::Integer: {
                std::int64_t v = 0;
                auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
                if (ec == std::errc() && ptr == text.data() + text.size()) {
                    return v;
                }
                break;
            }
            case ParamType::Number: {
                try {
                    size_t consumed = 0;
                    double v = std::stod(text, &consumed);
                    if (consumed == text.size()) {
                        return v;
                    }
                } catch (const std::exception &) {
                    // not a number, reported by validation
                }
                break;
            }
            case ParamType::Boolean:
                if (text == "true" || text == "1") return true;
                if (text == "false" || text == "0") return false;
                break;
            case ParamType::String:
                break;
        }
        return text;
    }

    std::optional<std::string> get_string(const ArgumentMap &args, const std::string &name) {
        auto it = args.find(name);
        if (it == args.end()) return std::nullopt;
        if (const auto *s = std::get_if<std::string>(&it->second)) return *s;
        return std::nullopt;
    }

    std::optional<std::int64_t> get_integer(const ArgumentMap &args, const std::string &name) {
        auto it = args.find(name);
        if (it == args.end()) return std::nullopt;
        if (const auto *i = std::get_if<std::int64_t>(&it->second)) return *i;
        if (const auto *d = std::get_if<double>(&it->second)) {
            // 2^63 is exact as a double; anything outside [-2^63, 2^63) or NaN has no int64 value
            constexpr double kLimit = 9223372036854775808.0;
            if (!(*d >= -kLimit && *d < kLimit)) return std::nullopt;
            return static_cast<std::int64_t>(*d);
        }
        return std::nullopt;
    }

    std::optional<bool> get_bool(const ArgumentMap &args, const std::string &name) {
        auto it = args.find(name);
        if (it == args.end()) return std::nullopt;
        if (const auto *b = std::get_if<bool>(&it->second)) return *b;
        return std::nullopt;
    }

}// namespace ticketmcp::catalog
