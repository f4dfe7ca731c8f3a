#pragma once

#include "performance_metrics.h"
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ticketmcp::metrics {

    /**
     * @brief Structure to hold rate limiting configuration
     */
    struct RateLimitConfig {
        size_t max_requests_per_second = 100; ///< Per connection
        size_t max_concurrent_requests = 1000;///< Across all connections
        size_t max_request_size = 1024 * 1024;///< Maximum request body size in bytes (1MB)
    };

    /**
     * @brief Rate limiting decision result
     */
    enum class RateLimitDecision {
        ALLOW,       ///< Request is allowed
        RATE_LIMITED,///< Request is rate limited
        TOO_LARGE    ///< Request body is too large
    };

    /**
     * @brief Inbound flow control. Thread-safe.
     */
    class RateLimiter {
    public:
        using RateLimitCallback = std::function<void(
                const std::string &connection_id,
                RateLimitDecision decision)>;

        /**
         * @brief Get the singleton instance of RateLimiter.
         */
        static std::shared_ptr<RateLimiter> getInstance();

        void set_config(const RateLimitConfig &config);
        RateLimitConfig get_config() const;

        void set_rate_limit_callback(RateLimitCallback callback);

        /**
         * @brief Check a request against the size, concurrency and per-second limits.
         * An allowed request is counted as started; pair it with report_request_completed().
         */
        RateLimitDecision check_request_allowed(const TrackedHttpRequest &request, const std::string &connection_id);

        void report_request_completed(const std::string &connection_id);

        /// Drop per-connection history when a connection closes.
        void forget(const std::string &connection_id);

        size_t active_requests() const;

    private:
        RateLimiter() = default;

        mutable std::mutex mutex_;
        RateLimitConfig config_;
        RateLimitCallback rate_limit_callback_;
        size_t active_requests_ = 0;
        std::unordered_map<std::string, std::deque<std::chrono::steady_clock::time_point>> request_timestamps_;
    };

}// namespace ticketmcp::metrics
