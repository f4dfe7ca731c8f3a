#include "servicenow_client.h"
#include "core/logger.h"

namespace ticketmcp::backend {

    namespace {

        constexpr const char *kResolvedState = "6";

        const nlohmann::json &result_of(const nlohmann::json &body) {
            static const nlohmann::json empty = nlohmann::json::array();
            if (body.is_object()) {
                auto it = body.find("result");
                if (it != body.end()) {
                    return *it;
                }
            }
            return empty;
        }

        std::string quote_free(const std::string &identifier) {
            // encoded queries use ^ and = as separators
            if (identifier.find_first_of("^=") != std::string::npos) {
                throw core::ServiceError(core::ErrorKind::InvalidArgument, "identifier contains reserved characters");
            }
            return identifier;
        }

    }// namespace

    ServiceNowClient::ServiceNowClient(ServiceNowConfig config,
                                       std::shared_ptr<HttpExecutor> executor,
                                       std::shared_ptr<CredentialProvider> credentials,
                                       RetryPolicy retry_policy)
        : config_(std::move(config)),
          executor_(std::move(executor)),
          credentials_(std::move(credentials)),
          retry_(std::move(retry_policy)) {}

    std::string ServiceNowClient::table_path() const {
        return "/api/now/table/" + config_.table;
    }

    BackendRequest ServiceNowClient::make_request(const std::string &method, const std::string &path) const {
        BackendRequest request;
        request.method = method;
        request.path = path;
        request.timeout = config_.timeout;
        request.headers.emplace_back("Accept", "application/json");
        return request;
    }

    core::ServiceError ServiceNowClient::classify(const BackendResponse &response) {
        std::string message;
        std::string detail;
        try {
            auto body = nlohmann::json::parse(response.body);
            if (body.is_object() && body.contains("error") && body["error"].is_object()) {
                const auto &error = body["error"];
                if (error.contains("message") && error["message"].is_string()) {
                    message = error["message"].get<std::string>();
                }
                if (error.contains("detail") && error["detail"].is_string()) {
                    detail = error["detail"].get<std::string>();
                }
            }
        } catch (const nlohmann::json::exception &) {
            // non-JSON error page; the raw body becomes the detail below
        }
        if (message.empty()) {
            message = "backend returned HTTP " + std::to_string(response.status);
        }

        core::ErrorKind kind = core::ErrorKind::Unknown;
        const int status = response.status;
        if (status == 401 || status == 403) {
            kind = core::ErrorKind::Unauthorized;
        } else if (status == 404) {
            kind = core::ErrorKind::NotFound;
        } else if (status == 429) {
            kind = core::ErrorKind::RateLimited;
        } else if (status == 400 || status == 409 || status == 422) {
            kind = core::ErrorKind::InvalidArgument;
        } else if (status >= 500 && status <= 599) {
            kind = core::ErrorKind::Unavailable;
        }

        if (kind == core::ErrorKind::Unknown || detail.empty()) {
            detail = response.body;
        }

        core::ServiceError error(kind, message, detail);
        if (kind == core::ErrorKind::RateLimited) {
            auto retry_after = response.header("Retry-After");
            if (!retry_after.empty()) {
                try {
                    error.set_retry_after(std::stoi(retry_after));
                } catch (const std::exception &) {
                    // HTTP-date form is not used by the Table API
                }
            }
        }
        return error;
    }

    nlohmann::json ServiceNowClient::send(BackendRequest request) {
        const size_t base_headers = request.headers.size();
        for (int auth_attempt = 0;; ++auth_attempt) {
            request.headers.resize(base_headers);
            for (auto &header: credentials_->headers()) {
                request.headers.push_back(std::move(header));
            }

            BackendResponse response = executor_->execute(request);

            if (response.status == 401 && auth_attempt == 0 && credentials_->refreshable()) {
                TICKETMCP_WARN("Backend rejected the access token, refreshing");
                credentials_->invalidate();
                continue;
            }

            if (response.status < 200 || response.status >= 300) {
                throw classify(response);
            }
            if (response.body.empty()) {
                return nullptr;
            }
            try {
                return nlohmann::json::parse(response.body);
            } catch (const nlohmann::json::parse_error &) {
                throw core::ServiceError(core::ErrorKind::Unknown, "backend returned a non-JSON body", response.body);
            }
        }
    }

    nlohmann::json ServiceNowClient::send_with_retry(const std::string &operation, const BackendRequest &request) {
        return retry_.run(operation, [&] { return send(request); });
    }

    std::vector<Record> ServiceNowClient::list(const ListQuery &query) {
        auto request = make_request("GET", table_path());
        request.query = {{"sysparm_limit", std::to_string(query.limit)},
                         {"sysparm_display_value", "true"}};
        if (query.offset > 0) {
            request.query.emplace_back("sysparm_offset", std::to_string(query.offset));
        }
        auto encoded = query.to_sysparm_query();
        if (!encoded.empty()) {
            request.query.emplace_back("sysparm_query", encoded);
        }

        auto body = send_with_retry("list", request);
        std::vector<Record> records;
        for (const auto &row: result_of(body)) {
            records.push_back(Record::from_servicenow(row));
        }
        TICKETMCP_DEBUG("list returned {} records", records.size());
        return records;
    }

    Record ServiceNowClient::read(const std::string &identifier) {
        auto request = make_request("GET", table_path());
        request.query = {{"sysparm_query", "number=" + quote_free(identifier)},
                         {"sysparm_limit", "1"},
                         {"sysparm_display_value", "true"}};

        auto body = send_with_retry("read", request);
        const auto &rows = result_of(body);
        if (!rows.is_array() || rows.empty()) {
            throw core::ServiceError(core::ErrorKind::NotFound, "record " + identifier + " not found");
        }
        return Record::from_servicenow(rows.front());
    }

    std::string ServiceNowClient::lookup_sys_id(const std::string &identifier) {
        auto request = make_request("GET", table_path());
        request.query = {{"sysparm_query", "number=" + quote_free(identifier)},
                         {"sysparm_fields", "sys_id"},
                         {"sysparm_limit", "1"}};

        auto body = send_with_retry("lookup", request);
        const auto &rows = result_of(body);
        if (!rows.is_array() || rows.empty() || !rows.front().contains("sys_id")) {
            throw core::ServiceError(core::ErrorKind::NotFound, "record " + identifier + " not found");
        }
        return rows.front()["sys_id"].get<std::string>();
    }

    std::optional<Record> ServiceNowClient::find_by_correlation(const std::string &token) {
        auto request = make_request("GET", table_path());
        request.query = {{"sysparm_query", "correlation_id=" + quote_free(token)},
                         {"sysparm_limit", "1"},
                         {"sysparm_display_value", "true"}};
        auto body = send(request);
        const auto &rows = result_of(body);
        if (rows.is_array() && !rows.empty()) {
            return Record::from_servicenow(rows.front());
        }
        return std::nullopt;
    }

    Record ServiceNowClient::create(const RecordFields &fields, const std::optional<std::string> &idempotency_token) {
        nlohmann::json payload = fields.to_servicenow();
        if (idempotency_token) {
            payload["correlation_id"] = *idempotency_token;
        }

        auto request = make_request("POST", table_path());
        request.query = {{"sysparm_display_value", "true"}};
        request.body = payload.dump();

        nlohmann::json body;
        if (!idempotency_token) {
            // a repeated POST could create a second record
            body = send(request);
        } else {
            const std::string token = *idempotency_token;
            auto record = retry_.run_with_recovery(
                    "create",
                    [&] { return Record::from_servicenow(result_of(send(request))); },
                    std::function<std::optional<Record>()>([this, token] { return find_by_correlation(token); }));
            TICKETMCP_INFO("Created record {}", record.identifier);
            return record;
        }

        Record record = Record::from_servicenow(result_of(body));
        TICKETMCP_INFO("Created record {}", record.identifier);
        return record;
    }

    Record ServiceNowClient::patch(const std::string &operation, const std::string &identifier, const nlohmann::json &body) {
        const std::string sys_id = lookup_sys_id(identifier);
        auto request = make_request("PATCH", table_path() + "/" + sys_id);
        request.query = {{"sysparm_display_value", "true"}};
        request.body = body.dump();
        auto response = send_with_retry(operation, request);
        TICKETMCP_DEBUG("{} applied to {}", operation, identifier);
        return Record::from_servicenow(result_of(response));
    }

    Record ServiceNowClient::update(const std::string &identifier, const RecordFields &fields) {
        if (fields.empty()) {
            throw core::ServiceError(core::ErrorKind::InvalidArgument, "no fields to update");
        }
        return patch("update", identifier, fields.to_servicenow());
    }

    void ServiceNowClient::remove(const std::string &identifier) {
        const std::string sys_id = lookup_sys_id(identifier);
        auto request = make_request("DELETE", table_path() + "/" + sys_id);
        send_with_retry("delete", request);
        TICKETMCP_INFO("Deleted record {}", identifier);
    }

    Record ServiceNowClient::assign(const std::string &identifier, const std::string &assignee,
                                    const std::optional<std::string> &assignment_group) {
        nlohmann::json body = {{"assigned_to", assignee}};
        if (assignment_group) {
            body["assignment_group"] = *assignment_group;
        }
        return patch("assign", identifier, body);
    }

    Record ServiceNowClient::resolve(const std::string &identifier, const ResolveRequest &request) {
        nlohmann::json body = {{"state", kResolvedState},
                               {"close_code", request.close_code},
                               {"close_notes", request.close_notes}};
        return patch("resolve", identifier, body);
    }

    void ServiceNowClient::ping(std::chrono::milliseconds timeout) {
        auto request = make_request("GET", table_path());
        request.query = {{"sysparm_limit", "1"}, {"sysparm_fields", "sys_id"}};
        request.timeout = timeout;
        send(request);
    }

}// namespace ticketmcp::backend
