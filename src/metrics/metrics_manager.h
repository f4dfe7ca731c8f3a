#pragma once

#include "core/errors.h"
#include "nlohmann/json.hpp"
#include "performance_metrics.h"
#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace ticketmcp::metrics {

    /**
     * @brief Process-wide request and tool-call counters plus pluggable reporting callbacks.
     */
    class MetricsManager {
    public:
        using PerformanceCallback = std::function<void(
                const TrackedHttpRequest &request,
                const PerformanceMetrics &metrics,
                const std::string &connection_id)>;

        using ErrorCallback = std::function<void(
                const std::string &error_message,
                const std::string &connection_id)>;

        /**
         * @brief Get the singleton instance of MetricsManager.
         */
        static std::shared_ptr<MetricsManager> getInstance();

        void set_performance_callback(PerformanceCallback callback);
        void set_error_callback(ErrorCallback callback);

        /**
         * @brief Report a handled HTTP request.
         * @param request The HTTP request being tracked
         * @param metrics Performance metrics for the request
         * @param connection_id Connection identifier
         */
        void report_performance(const TrackedHttpRequest &request,
                                const PerformanceMetrics &metrics,
                                const std::string &connection_id);

        void report_error(const std::string &error_message, const std::string &connection_id);

        /// Count a completed tool call. A null kind means success.
        void report_tool_call(const std::string &tool_name, const core::ErrorKind *error_kind, double duration_ms);

        /// Counters as JSON: requests, tool_calls, tool_errors by kind, dropped_results.
        nlohmann::json snapshot() const;

        void report_dropped_result() { dropped_results_.fetch_add(1, std::memory_order_relaxed); }

        void reset();

    private:
        MetricsManager() = default;

        mutable std::mutex callback_mutex_;
        PerformanceCallback performance_callback_;
        ErrorCallback error_callback_;

        std::atomic<uint64_t> requests_{0};
        std::atomic<uint64_t> tool_calls_{0};
        std::atomic<uint64_t> dropped_results_{0};
        std::array<std::atomic<uint64_t>, 7> errors_by_kind_{};
    };

}// namespace ticketmcp::metrics
