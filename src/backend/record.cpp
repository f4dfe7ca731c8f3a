#include "record.h"
#include <vector>

namespace ticketmcp::backend {

    namespace {

        // Reference fields come back as {"display_value": ..., "link": ...}
        std::string field_text(const nlohmann::json &row, const char *key) {
            auto it = row.find(key);
            if (it == row.end() || it->is_null()) {
                return {};
            }
            if (it->is_string()) {
                return it->get<std::string>();
            }
            if (it->is_object()) {
                auto display = it->find("display_value");
                if (display != it->end() && display->is_string()) {
                    return display->get<std::string>();
                }
                auto value = it->find("value");
                if (value != it->end() && value->is_string()) {
                    return value->get<std::string>();
                }
                return {};
            }
            return it->dump();
        }

        void put(nlohmann::json &body, const char *key, const std::optional<std::string> &value) {
            if (value) {
                body[key] = *value;
            }
        }

    }// namespace

    nlohmann::json Record::to_json() const {
        return {
                {"identifier", identifier},
                {"short_description", short_description},
                {"description", description},
                {"priority", priority},
                {"urgency", urgency},
                {"impact", impact},
                {"category", category},
                {"assignee", assignee},
                {"state", state},
                {"opened_at", opened_at},
                {"updated_at", updated_at},
                {"resolution", resolution}};
    }

    Record Record::from_servicenow(const nlohmann::json &row) {
        Record record;
        record.identifier = field_text(row, "number");
        record.short_description = field_text(row, "short_description");
        record.description = field_text(row, "description");
        record.priority = field_text(row, "priority");
        record.urgency = field_text(row, "urgency");
        record.impact = field_text(row, "impact");
        record.category = field_text(row, "category");
        record.assignee = field_text(row, "assigned_to");
        record.state = field_text(row, "state");
        record.opened_at = field_text(row, "opened_at");
        record.updated_at = field_text(row, "sys_updated_on");
        record.resolution = field_text(row, "close_notes");
        return record;
    }

    bool RecordFields::empty() const {
        return !short_description && !description && !priority && !urgency && !impact && !category && !assignee &&
               !state && !caller;
    }

    nlohmann::json RecordFields::to_servicenow() const {
        nlohmann::json body = nlohmann::json::object();
        put(body, "short_description", short_description);
        put(body, "description", description);
        put(body, "priority", priority);
        put(body, "urgency", urgency);
        put(body, "impact", impact);
        put(body, "category", category);
        put(body, "assigned_to", assignee);
        put(body, "state", state);
        put(body, "caller_id", caller);
        return body;
    }

    std::string ListQuery::to_sysparm_query() const {
        std::vector<std::string> clauses;
        if (!query.empty()) clauses.push_back(query);
        if (state) clauses.push_back("state=" + *state);
        if (priority) clauses.push_back("priority=" + *priority);
        if (assignee) clauses.push_back("assigned_to.user_name=" + *assignee);

        std::string joined;
        for (const auto &clause: clauses) {
            if (!joined.empty()) joined += '^';
            joined += clause;
        }
        return joined;
    }

}// namespace ticketmcp::backend
