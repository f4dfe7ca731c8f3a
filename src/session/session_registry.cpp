#include "session_registry.h"
#include "core/errors.h"
#include "core/logger.h"
#include "utils/session_id.h"
#include <mutex>

namespace ticketmcp::session {

    SessionRegistry::SessionRegistry(catalog::CatalogPtr catalog, auth::PackagePolicy policy)
        : catalog_(std::move(catalog)), policy_(std::move(policy)) {}

    SessionPtr SessionRegistry::open(const std::string &connection_id, const std::string &requested_package,
                                     const auth::CallerIdentity &identity, bool expires_when_idle) {
        if (!catalog_->has_package(requested_package)) {
            throw core::ServiceError(core::ErrorKind::NotFound, "unknown tool package '" + requested_package + "'");
        }
        if (!policy_.permits(identity, requested_package)) {
            throw core::ServiceError(core::ErrorKind::Forbidden,
                                     "role '" + identity.role + "' may not use package '" + requested_package + "'");
        }

        auto session = std::make_shared<Session>(utils::generate_session_id(), connection_id, requested_package, identity,
                                                 expires_when_idle);
        {
            std::unique_lock lock(mutex_);
            sessions_.emplace(session->id(), session);
        }
        TICKETMCP_INFO("Session {} opened for {} (package '{}', caller '{}')", session->id(), connection_id,
                       requested_package, identity.subject);
        return session;
    }

    bool SessionRegistry::close(const std::string &session_id) {
        SessionPtr session;
        {
            std::unique_lock lock(mutex_);
            auto it = sessions_.find(session_id);
            if (it == sessions_.end()) {
                return false;
            }
            session = std::move(it->second);
            sessions_.erase(it);
        }
        session->mark_closed();
        TICKETMCP_INFO("Session {} closed", session_id);
        return true;
    }

    SessionPtr SessionRegistry::find(const std::string &session_id) const {
        std::shared_lock lock(mutex_);
        auto it = sessions_.find(session_id);
        return it == sessions_.end() ? nullptr : it->second;
    }

    bool SessionRegistry::touch(const std::string &session_id) {
        auto session = find(session_id);
        if (!session) {
            return false;
        }
        session->touch();
        return true;
    }

    BeginResult SessionRegistry::begin_request(const std::string &session_id, const std::string &request_id) {
        auto session = find(session_id);
        if (!session) {
            return BeginResult::Closed;
        }
        session->touch();
        return session->begin(request_id);
    }

    bool SessionRegistry::complete_request(const std::string &session_id, const std::string &request_id,
                                           const std::function<void()> &deliver) {
        auto session = find(session_id);
        if (!session) {
            return false;
        }
        session->touch();
        return session->complete(request_id, deliver);
    }

    std::vector<std::string> SessionRegistry::sweep_idle(Clock::duration threshold) {
        const auto now = Clock::now();
        std::vector<SessionPtr> expired;
        {
            std::unique_lock lock(mutex_);
            for (auto it = sessions_.begin(); it != sessions_.end();) {
                const auto &session = it->second;
                if (session->expires_when_idle() && now - session->last_activity() > threshold &&
                    session->in_flight_count() == 0) {
                    expired.push_back(session);
                    it = sessions_.erase(it);
                } else {
                    ++it;
                }
            }
        }

        DisconnectListener listener;
        {
            std::lock_guard<std::mutex> lock(listener_mutex_);
            listener = listener_;
        }

        std::vector<std::string> ids;
        for (const auto &session: expired) {
            session->mark_closed();
            ids.push_back(session->id());
            TICKETMCP_INFO("Session {} closed after idle timeout", session->id());
            if (listener) {
                try {
                    listener(session->id(), session->connection_id());
                } catch (const std::exception &e) {
                    TICKETMCP_ERROR("Disconnect listener failed for session {}: {}", session->id(), e.what());
                }
            }
        }
        return ids;
    }

    void SessionRegistry::set_disconnect_listener(DisconnectListener listener) {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener_ = std::move(listener);
    }

    size_t SessionRegistry::size() const {
        std::shared_lock lock(mutex_);
        return sessions_.size();
    }

    std::vector<SessionPtr> SessionRegistry::snapshot() const {
        std::shared_lock lock(mutex_);
        std::vector<SessionPtr> result;
        result.reserve(sessions_.size());
        for (const auto &[_, session]: sessions_) {
            result.push_back(session);
        }
        return result;
    }

}// namespace ticketmcp::session
