// src/session/session_registry.h
#pragma once

#include "Auth/package_policy.h"
#include "catalog/tool_catalog.h"
#include "session.h"
#include <functional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ticketmcp::session {

    /**
     * @brief In-memory map of open sessions.
     *
     * find/touch/begin_request/complete_request take a shared lock and may run concurrently
     * with each other; open/close/sweep_idle take the exclusive lock.
     */
    class SessionRegistry {
    public:
        /// Called outside the registry lock for every session closed by sweep_idle().
        using DisconnectListener = std::function<void(const std::string &session_id, const std::string &connection_id)>;

        SessionRegistry(catalog::CatalogPtr catalog, auth::PackagePolicy policy = {});

        /**
         * @brief Open a session for a connection.
         * @throws core::ServiceError NotFound for an unknown package, Forbidden when the
         * caller's role may not use it
         */
        SessionPtr open(const std::string &connection_id, const std::string &requested_package,
                        const auth::CallerIdentity &identity, bool expires_when_idle = true);

        /// Release a session. Returns false when it was already gone.
        bool close(const std::string &session_id);

        SessionPtr find(const std::string &session_id) const;
        bool touch(const std::string &session_id);

        /**
         * @brief Register a request id as in flight.
         * @return Duplicate for an id already used on the session, in flight or not;
         * Closed for unknown or closed sessions
         */
        BeginResult begin_request(const std::string &session_id, const std::string &request_id);

        /**
         * @brief Retire an in-flight request id.
         *
         * @p deliver runs under the session lock before the id is retired, so close() and
         * in_flight_count() observe either the undelivered request or the delivered result.
         * It must only queue the result and must not call back into the registry.
         * @return true exactly once per accepted id; false once the session is closed, in
         * which case the result is dropped and @p deliver is not called
         */
        bool complete_request(const std::string &session_id, const std::string &request_id,
                              const std::function<void()> &deliver = nullptr);

        /// Close sessions idle longer than @p threshold with nothing in flight. Returns their ids.
        /// Sessions opened with expires_when_idle = false are never swept.
        std::vector<std::string> sweep_idle(Clock::duration threshold);

        void set_disconnect_listener(DisconnectListener listener);

        size_t size() const;
        std::vector<SessionPtr> snapshot() const;

    private:
        catalog::CatalogPtr catalog_;
        auth::PackagePolicy policy_;

        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, SessionPtr> sessions_;

        std::mutex listener_mutex_;
        DisconnectListener listener_;
    };

}// namespace ticketmcp::session
