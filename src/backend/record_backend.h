// src/backend/record_backend.h
#pragma once

#include "record.h"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ticketmcp::backend {

    /// Logical operations a tool may be bound to through its backend_operation.
    enum class BackendOperation {
        List,
        Create,
        Read,
        Update,
        Delete,
        Assign,
        Resolve
    };

    const char *to_string(BackendOperation op);
    std::optional<BackendOperation> backend_operation_from_string(std::string_view name);

    /**
     * @brief Typed client for the downstream record system.
     *
     * Every method either returns the live result or throws core::ServiceError with the
     * failure already classified. Implementations are shared by all sessions and must be
     * safe to call from several worker threads at once.
     */
    class RecordBackend {
    public:
        virtual ~RecordBackend() = default;

        virtual std::vector<Record> list(const ListQuery &query) = 0;

        /**
         * @brief Create a record.
         * @param idempotency_token When set, the create may be retried and repeated attempts
         * resolve to the same record. Without it the create is attempted exactly once.
         */
        virtual Record create(const RecordFields &fields, const std::optional<std::string> &idempotency_token) = 0;

        virtual Record read(const std::string &identifier) = 0;
        virtual Record update(const std::string &identifier, const RecordFields &fields) = 0;
        virtual void remove(const std::string &identifier) = 0;
        virtual Record assign(const std::string &identifier, const std::string &assignee,
                              const std::optional<std::string> &assignment_group) = 0;
        virtual Record resolve(const std::string &identifier, const ResolveRequest &request) = 0;

        /// Cheap reachability check bounded by @p timeout. Throws on failure.
        virtual void ping(std::chrono::milliseconds timeout) = 0;

        /// Whether @p operation names a BackendOperation this backend implements.
        virtual bool supports(const std::string &operation) const {
            return backend_operation_from_string(operation).has_value();
        }

        virtual std::string name() const = 0;
    };

}// namespace ticketmcp::backend
