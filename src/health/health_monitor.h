// src/health/health_monitor.h
#pragma once

#include "backend/record_backend.h"
#include "nlohmann/json.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ticketmcp::health {

    enum class HealthStatus {
        Ok,
        Degraded,
        Down
    };

    const char *to_string(HealthStatus status);

    struct ReadinessReport {
        HealthStatus status = HealthStatus::Down;
        bool backend_reachable = false;
        std::string detail;
        size_t active_sessions = 0;

        nlohmann::json to_json() const;
    };

    /**
     * @brief Liveness and readiness for orchestration.
     *
     * Readiness is ok when the server accepts connections and the backend answers a cheap
     * probe, degraded when only the backend is unreachable, down when the server is not
     * accepting connections.
     */
    class HealthMonitor {
    public:
        using ReachabilityListener = std::function<void(bool reachable, const std::string &detail)>;

        HealthMonitor(std::shared_ptr<backend::RecordBackend> backend, std::chrono::milliseconds probe_timeout);

        HealthStatus liveness() const { return HealthStatus::Ok; }

        /// Probe the backend now. Blocks up to the probe timeout.
        ReadinessReport readiness();

        void set_serving(bool serving) { serving_ = serving; }
        bool serving() const { return serving_; }

        void set_session_counter(std::function<size_t()> counter);

        /// Invoked from the probing thread whenever reachability flips (and on the first probe).
        void add_listener(ReachabilityListener listener);

        std::optional<bool> last_reachable() const;

    private:
        void record(bool reachable, const std::string &detail);

        std::shared_ptr<backend::RecordBackend> backend_;
        std::chrono::milliseconds probe_timeout_;
        std::atomic<bool> serving_{false};

        mutable std::mutex mutex_;
        std::optional<bool> last_reachable_;
        std::vector<ReachabilityListener> listeners_;
        std::function<size_t()> session_counter_;
    };

}// namespace ticketmcp::health
