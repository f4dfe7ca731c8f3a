#include "metrics_manager.h"
#include "core/logger.h"

namespace ticketmcp::metrics {

    std::shared_ptr<MetricsManager> MetricsManager::getInstance() {
        static std::shared_ptr<MetricsManager> instance = [] {
            auto manager = std::shared_ptr<MetricsManager>(new MetricsManager());

            // default callbacks
            manager->set_performance_callback([](const TrackedHttpRequest &request,
                                                 const PerformanceMetrics &metrics,
                                                 const std::string &connection_id) {
                TICKETMCP_DEBUG("Performance - Connection: {}, {} {} -> {} in {:.2f}ms",
                                connection_id, request.method, request.target, metrics.status_code,
                                metrics.duration_ms());
            });
            manager->set_error_callback([](const std::string &error_message, const std::string &connection_id) {
                TICKETMCP_ERROR("Metrics Error - Connection: {}, Message: {}", connection_id, error_message);
            });
            return manager;
        }();
        return instance;
    }

    void MetricsManager::set_performance_callback(PerformanceCallback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        performance_callback_ = std::move(callback);
    }

    void MetricsManager::set_error_callback(ErrorCallback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        error_callback_ = std::move(callback);
    }

    void MetricsManager::report_performance(const TrackedHttpRequest &request,
                                            const PerformanceMetrics &metrics,
                                            const std::string &connection_id) {
        requests_.fetch_add(1, std::memory_order_relaxed);
        PerformanceCallback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = performance_callback_;
        }
        if (callback) {
            callback(request, metrics, connection_id);
        }
    }

    void MetricsManager::report_error(const std::string &error_message, const std::string &connection_id) {
        ErrorCallback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = error_callback_;
        }
        if (callback) {
            callback(error_message, connection_id);
        }
    }

    void MetricsManager::report_tool_call(const std::string &tool_name, const core::ErrorKind *error_kind,
                                          double duration_ms) {
        tool_calls_.fetch_add(1, std::memory_order_relaxed);
        if (error_kind) {
            errors_by_kind_[static_cast<size_t>(*error_kind)].fetch_add(1, std::memory_order_relaxed);
        }
        TICKETMCP_TRACE("Tool {} finished in {:.2f}ms ({})", tool_name, duration_ms,
                        error_kind ? core::to_string(*error_kind) : "success");
    }

    nlohmann::json MetricsManager::snapshot() const {
        nlohmann::json errors = nlohmann::json::object();
        for (size_t i = 0; i < errors_by_kind_.size(); ++i) {
            errors[core::to_string(static_cast<core::ErrorKind>(i))] = errors_by_kind_[i].load(std::memory_order_relaxed);
        }
        return {{"requests", requests_.load(std::memory_order_relaxed)},
                {"tool_calls", tool_calls_.load(std::memory_order_relaxed)},
                {"tool_errors", std::move(errors)},
                {"dropped_results", dropped_results_.load(std::memory_order_relaxed)}};
    }

    void MetricsManager::reset() {
        requests_ = 0;
        tool_calls_ = 0;
        dropped_results_ = 0;
        for (auto &counter: errors_by_kind_) {
            counter = 0;
        }
    }

}// namespace ticketmcp::metrics
