#include "health_monitor.h"
#include "core/errors.h"
#include "core/logger.h"

namespace ticketmcp::health {

    const char *to_string(HealthStatus status) {
        switch (status) {
            case HealthStatus::Ok:
                return "ok";
            case HealthStatus::Degraded:
                return "degraded";
            case HealthStatus::Down:
                return "down";
        }
        return "down";
    }

    nlohmann::json ReadinessReport::to_json() const {
        nlohmann::json backend = {{"reachable", backend_reachable}};
        if (!detail.empty()) {
            backend["detail"] = detail;
        }
        return {{"status", to_string(status)},
                {"service", "ServiceNow MCP Server"},
                {"backend", std::move(backend)},
                {"active_sessions", active_sessions}};
    }

    HealthMonitor::HealthMonitor(std::shared_ptr<backend::RecordBackend> backend, std::chrono::milliseconds probe_timeout)
        : backend_(std::move(backend)), probe_timeout_(probe_timeout) {}

    ReadinessReport HealthMonitor::readiness() {
        ReadinessReport report;
        try {
            backend_->ping(probe_timeout_);
            report.backend_reachable = true;
        } catch (const core::ServiceError &e) {
            report.detail = std::string(core::to_string(e.kind())) + ": " + e.what();
        } catch (const std::exception &e) {
            report.detail = e.what();
        }
        record(report.backend_reachable, report.detail);

        if (!serving_) {
            report.status = HealthStatus::Down;
        } else {
            report.status = report.backend_reachable ? HealthStatus::Ok : HealthStatus::Degraded;
        }

        std::function<size_t()> counter;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            counter = session_counter_;
        }
        if (counter) {
            report.active_sessions = counter();
        }
        return report;
    }

    void HealthMonitor::set_session_counter(std::function<size_t()> counter) {
        std::lock_guard<std::mutex> lock(mutex_);
        session_counter_ = std::move(counter);
    }

    void HealthMonitor::add_listener(ReachabilityListener listener) {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.push_back(std::move(listener));
    }

    std::optional<bool> HealthMonitor::last_reachable() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_reachable_;
    }

    void HealthMonitor::record(bool reachable, const std::string &detail) {
        std::vector<ReachabilityListener> to_notify;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (last_reachable_ == reachable) {
                return;
            }
            last_reachable_ = reachable;
            to_notify = listeners_;
        }

        if (reachable) {
            TICKETMCP_INFO("Backend {} reachable", backend_->name());
        } else {
            TICKETMCP_WARN("Backend {} unreachable: {}", backend_->name(), detail);
        }
        for (const auto &listener: to_notify) {
            try {
                listener(reachable, detail);
            } catch (const std::exception &e) {
                TICKETMCP_ERROR("Reachability listener failed: {}", e.what());
            }
        }
    }

}// namespace ticketmcp::health
