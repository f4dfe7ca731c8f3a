// src/backend/record.h
#pragma once

#include "nlohmann/json.hpp"
#include <optional>
#include <string>

namespace ticketmcp::backend {

    /**
     * @brief Vendor-neutral view of an incident record.
     *
     * The identifier is the human-facing record number (INC0010001); the backend's internal
     * key never leaves the adapter.
     */
    struct Record {
        std::string identifier;
        std::string short_description;
        std::string description;
        std::string priority;
        std::string urgency;
        std::string impact;
        std::string category;
        std::string assignee;
        std::string state;
        std::string opened_at;
        std::string updated_at;
        std::string resolution;

        /// Wire payload. Every key is always present so repeated reads have the same shape.
        nlohmann::json to_json() const;

        /// Build from a Table API row fetched with sysparm_display_value=true.
        static Record from_servicenow(const nlohmann::json &row);
    };

    /**
     * @brief Partial set of writable fields; unset members are left untouched on update.
     */
    struct RecordFields {
        std::optional<std::string> short_description;
        std::optional<std::string> description;
        std::optional<std::string> priority;
        std::optional<std::string> urgency;
        std::optional<std::string> impact;
        std::optional<std::string> category;
        std::optional<std::string> assignee;
        std::optional<std::string> state;
        std::optional<std::string> caller;

        bool empty() const;
        nlohmann::json to_servicenow() const;
    };

    struct ListQuery {
        int limit = 100;
        int offset = 0;
        std::string query;// raw encoded query, AND-ed with the structured filters
        std::optional<std::string> state;
        std::optional<std::string> priority;
        std::optional<std::string> assignee;

        /// Combined sysparm_query value; empty when there is nothing to filter on.
        std::string to_sysparm_query() const;
    };

    struct ResolveRequest {
        std::string close_code = "Solved (Permanently)";
        std::string close_notes;
    };

}// namespace ticketmcp::backend
