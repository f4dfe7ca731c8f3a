#pragma once

#include <chrono>
#include <string>

namespace ticketmcp::metrics {

    /**
     * @brief Summary of an inbound HTTP request, as seen by metrics and rate limiting.
     */
    struct TrackedHttpRequest {
        std::string method;///< HTTP method (GET, POST, etc.)
        std::string target;///< Request target/URL
        size_t body_size = 0;
    };

    /**
     * @brief Timing and size of one handled request.
     */
    struct PerformanceMetrics {
        std::chrono::steady_clock::time_point start_time;
        std::chrono::steady_clock::time_point end_time;
        size_t request_size = 0;
        size_t response_size = 0;
        int status_code = 0;

        double duration_ms() const {
            return std::chrono::duration<double, std::milli>(end_time - start_time).count();
        }
    };

    class PerformanceTracker {
    public:
        static PerformanceMetrics start_tracking(size_t request_size = 0) {
            PerformanceMetrics metrics{};
            metrics.start_time = std::chrono::steady_clock::now();
            metrics.request_size = request_size;
            return metrics;
        }

        static void end_tracking(PerformanceMetrics &metrics, int status_code, size_t response_size = 0) {
            metrics.end_time = std::chrono::steady_clock::now();
            metrics.status_code = status_code;
            metrics.response_size = response_size;
        }
    };

}// namespace ticketmcp::metrics
