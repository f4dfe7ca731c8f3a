// src/backend/servicenow_client.h
#pragma once

#include "core/errors.h"
#include "credentials.h"
#include "http_executor.h"
#include "nlohmann/json.hpp"
#include "record_backend.h"
#include "retry_policy.h"
#include <chrono>
#include <memory>
#include <string>

namespace ticketmcp::backend {

    struct ServiceNowConfig {
        std::string table = "incident";
        std::chrono::milliseconds timeout{30000};
    };

    /**
     * @brief RecordBackend over the ServiceNow Table API (/api/now/table/<table>).
     *
     * Records are addressed by number; update, delete, assign and resolve first resolve the
     * number to the row's sys_id. Every HTTP failure is classified here and nowhere else.
     */
    class ServiceNowClient : public RecordBackend {
    public:
        ServiceNowClient(ServiceNowConfig config,
                         std::shared_ptr<HttpExecutor> executor,
                         std::shared_ptr<CredentialProvider> credentials,
                         RetryPolicy retry_policy);

        std::vector<Record> list(const ListQuery &query) override;
        Record create(const RecordFields &fields, const std::optional<std::string> &idempotency_token) override;
        Record read(const std::string &identifier) override;
        Record update(const std::string &identifier, const RecordFields &fields) override;
        void remove(const std::string &identifier) override;
        Record assign(const std::string &identifier, const std::string &assignee,
                      const std::optional<std::string> &assignment_group) override;
        Record resolve(const std::string &identifier, const ResolveRequest &request) override;
        void ping(std::chrono::milliseconds timeout) override;

        std::string name() const override { return "servicenow"; }

        /**
         * @brief Map a non-2xx response to the error taxonomy.
         *
         * 401/403 Unauthorized, 404 NotFound, 429 RateLimited, 400/409/422 InvalidArgument,
         * 5xx Unavailable, anything else Unknown with the raw body as detail.
         */
        static core::ServiceError classify(const BackendResponse &response);

    private:
        BackendRequest make_request(const std::string &method, const std::string &path) const;

        /// One authenticated exchange. Returns the decoded body (null for an empty body).
        nlohmann::json send(BackendRequest request);

        nlohmann::json send_with_retry(const std::string &operation, const BackendRequest &request);

        std::string lookup_sys_id(const std::string &identifier);
        std::optional<Record> find_by_correlation(const std::string &token);
        Record patch(const std::string &operation, const std::string &identifier, const nlohmann::json &body);

        std::string table_path() const;

        ServiceNowConfig config_;
        std::shared_ptr<HttpExecutor> executor_;
        std::shared_ptr<CredentialProvider> credentials_;
        RetryPolicy retry_;
    };

}// namespace ticketmcp::backend
