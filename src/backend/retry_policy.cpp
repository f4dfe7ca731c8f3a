#include "retry_policy.h"
#include <algorithm>
#include <cmath>
#include <thread>

namespace ticketmcp::backend {

    RetryPolicy::RetryPolicy(RetryConfig config, Sleeper sleeper)
        : config_(config), sleeper_(std::move(sleeper)) {
        if (config_.max_attempts < 1) {
            config_.max_attempts = 1;
        }
    }

    std::chrono::milliseconds RetryPolicy::backoff_for(int attempt, const core::ServiceError &error) const {
        if (error.retry_after()) {
            auto requested = std::chrono::milliseconds(std::chrono::seconds(*error.retry_after()));
            return std::min(requested, config_.max_backoff);
        }
        double scaled = static_cast<double>(config_.initial_backoff.count()) *
                        std::pow(config_.multiplier, std::max(0, attempt - 1));
        auto delay = std::chrono::milliseconds(static_cast<long long>(scaled));
        return std::min(delay, config_.max_backoff);
    }

    void RetryPolicy::sleep(std::chrono::milliseconds delay) const {
        if (sleeper_) {
            sleeper_(delay);
        } else if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
    }

}// namespace ticketmcp::backend
