// src/session/session.h
#pragma once

#include "Auth/AuthManager.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace ticketmcp::session {

    using Clock = std::chrono::steady_clock;

    /// Outcome of registering a request id.
    enum class BeginResult {
        Accepted,
        Duplicate,///< the id was already used on this session
        Closed
    };

    inline const char *to_string(BeginResult result) {
        switch (result) {
            case BeginResult::Accepted:
                return "Accepted";
            case BeginResult::Duplicate:
                return "Duplicate";
            case BeginResult::Closed:
            default:
                return "Closed";
        }
    }

    /**
     * @brief Server-side state of one handshaken connection.
     *
     * The package and identity never change after open. In-flight request ids and the
     * closed flag share one mutex so a result racing with close() is either delivered or
     * dropped, never both. Every accepted id stays reserved for the life of the session.
     */
    class Session {
    public:
        Session(std::string id, std::string connection_id, std::string package, auth::CallerIdentity identity,
                bool expires_when_idle = true);

        const std::string &id() const { return id_; }
        const std::string &connection_id() const { return connection_id_; }
        const std::string &package() const { return package_; }
        const auth::CallerIdentity &identity() const { return identity_; }
        std::chrono::system_clock::time_point opened_at() const { return opened_at_; }
        /// False for sessions the idle sweep must leave alone (the stdio client).
        bool expires_when_idle() const { return expires_when_idle_; }

        Clock::time_point last_activity() const;
        void touch();

        bool closed() const;
        size_t in_flight_count() const;
        bool is_in_flight(const std::string &request_id) const;

    private:
        friend class SessionRegistry;

        BeginResult begin(const std::string &request_id);
        bool complete(const std::string &request_id, const std::function<void()> &deliver);
        void mark_closed();

        const std::string id_;
        const std::string connection_id_;
        const std::string package_;
        const auth::CallerIdentity identity_;
        const std::chrono::system_clock::time_point opened_at_;
        const bool expires_when_idle_;

        std::atomic<Clock::rep> last_activity_;

        mutable std::mutex mutex_;
        std::set<std::string> in_flight_;
        std::set<std::string> seen_;
        bool closed_ = false;
    };

    using SessionPtr = std::shared_ptr<Session>;

}// namespace ticketmcp::session
