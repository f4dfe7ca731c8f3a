#include "session.h"

namespace ticketmcp::session {

    Session::Session(std::string id, std::string connection_id, std::string package, auth::CallerIdentity identity,
                     bool expires_when_idle)
        : id_(std::move(id)),
          connection_id_(std::move(connection_id)),
          package_(std::move(package)),
          identity_(std::move(identity)),
          opened_at_(std::chrono::system_clock::now()),
          expires_when_idle_(expires_when_idle),
          last_activity_(Clock::now().time_since_epoch().count()) {}

    Clock::time_point Session::last_activity() const {
        return Clock::time_point(Clock::duration(last_activity_.load(std::memory_order_relaxed)));
    }

    void Session::touch() {
        last_activity_.store(Clock::now().time_since_epoch().count(), std::memory_order_relaxed);
    }

    bool Session::closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t Session::in_flight_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return in_flight_.size();
    }

    bool Session::is_in_flight(const std::string &request_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return in_flight_.count(request_id) > 0;
    }

    BeginResult Session::begin(const std::string &request_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return BeginResult::Closed;
        }
        if (!seen_.insert(request_id).second) {
            return BeginResult::Duplicate;
        }
        in_flight_.insert(request_id);
        return BeginResult::Accepted;
    }

    bool Session::complete(const std::string &request_id, const std::function<void()> &deliver) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || in_flight_.count(request_id) == 0) {
            return false;
        }
        // deliver before the id leaves in_flight_, so a drain waiting for zero sees the queued result
        if (deliver) {
            deliver();
        }
        in_flight_.erase(request_id);
        return true;
    }

    void Session::mark_closed() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        in_flight_.clear();
    }

}// namespace ticketmcp::session
