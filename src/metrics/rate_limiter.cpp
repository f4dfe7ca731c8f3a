#include "rate_limiter.h"
#include "core/logger.h"

namespace ticketmcp::metrics {

    std::shared_ptr<RateLimiter> RateLimiter::getInstance() {
        static std::shared_ptr<RateLimiter> instance(new RateLimiter());
        return instance;
    }

    void RateLimiter::set_config(const RateLimitConfig &config) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = config;
    }

    RateLimitConfig RateLimiter::get_config() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_;
    }

    void RateLimiter::set_rate_limit_callback(RateLimitCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        rate_limit_callback_ = std::move(callback);
    }

    RateLimitDecision RateLimiter::check_request_allowed(const TrackedHttpRequest &request,
                                                         const std::string &connection_id) {
        RateLimitDecision decision = RateLimitDecision::ALLOW;
        RateLimitCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = rate_limit_callback_;

            auto now = std::chrono::steady_clock::now();
            auto &timestamps = request_timestamps_[connection_id];
            while (!timestamps.empty() && now - timestamps.front() >= std::chrono::seconds(1)) {
                timestamps.pop_front();
            }

            if (request.body_size > config_.max_request_size) {
                TICKETMCP_WARN("Request too large - Connection: {}, Size: {}, Max: {}",
                               connection_id, request.body_size, config_.max_request_size);
                decision = RateLimitDecision::TOO_LARGE;
            } else if (active_requests_ >= config_.max_concurrent_requests) {
                TICKETMCP_WARN("Too many concurrent requests - Connection: {}, Active: {}, Max: {}",
                               connection_id, active_requests_, config_.max_concurrent_requests);
                decision = RateLimitDecision::RATE_LIMITED;
            } else if (timestamps.size() >= config_.max_requests_per_second) {
                TICKETMCP_WARN("Rate limit exceeded - Connection: {}, Requests: {}, Max: {}",
                               connection_id, timestamps.size(), config_.max_requests_per_second);
                decision = RateLimitDecision::RATE_LIMITED;
            } else {
                timestamps.push_back(now);
                ++active_requests_;
            }
        }

        if (callback) {
            callback(connection_id, decision);
        }
        return decision;
    }

    void RateLimiter::report_request_completed(const std::string &) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_requests_ > 0) {
            --active_requests_;
        }
    }

    void RateLimiter::forget(const std::string &connection_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        request_timestamps_.erase(connection_id);
    }

    size_t RateLimiter::active_requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_requests_;
    }

}// namespace ticketmcp::metrics
