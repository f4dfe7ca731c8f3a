// src/backend/retry_policy.h
#pragma once

#include "core/errors.h"
#include "core/logger.h"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>

namespace ticketmcp::backend {

    struct RetryConfig {
        int max_attempts = 3;
        std::chrono::milliseconds initial_backoff{200};
        double multiplier = 2.0;
        std::chrono::milliseconds max_backoff{5000};
    };

    /**
     * @brief Bounded retry with exponential backoff for transient backend failures.
     *
     * Only RateLimited and Unavailable are retried; every other kind propagates on the
     * first attempt. The sleeper is injectable so tests run without real delays.
     */
    class RetryPolicy {
    public:
        using Sleeper = std::function<void(std::chrono::milliseconds)>;

        explicit RetryPolicy(RetryConfig config = {}, Sleeper sleeper = {});

        const RetryConfig &config() const { return config_; }

        /// Delay before the attempt following @p attempt (1-based). Honors Retry-After up to max_backoff.
        std::chrono::milliseconds backoff_for(int attempt, const core::ServiceError &error) const;

        template<typename Fn>
        auto run(const std::string &operation, Fn &&attempt) const -> decltype(attempt()) {
            using Result = decltype(attempt());
            return run_with_recovery(operation, std::forward<Fn>(attempt), std::function<std::optional<Result>()>{});
        }

        /**
         * @brief Like run(), but calls @p recover before each retry. A value returned by
         * @p recover ends the loop as if the attempt had succeeded.
         */
        template<typename Fn, typename Result = std::invoke_result_t<Fn>>
        Result run_with_recovery(const std::string &operation, Fn &&attempt,
                                 const std::type_identity_t<std::function<std::optional<Result>()>> &recover) const {
            for (int attempt_no = 1;; ++attempt_no) {
                try {
                    if (attempt_no > 1 && recover) {
                        if (auto recovered = recover()) {
                            TICKETMCP_INFO("{}: recovered result before attempt {}", operation, attempt_no);
                            return std::move(*recovered);
                        }
                    }
                    return attempt();
                } catch (const core::ServiceError &e) {
                    if (!core::is_transient(e.kind()) || attempt_no >= config_.max_attempts) {
                        throw;
                    }
                    auto delay = backoff_for(attempt_no, e);
                    TICKETMCP_WARN("{}: attempt {}/{} failed ({}: {}), retrying in {} ms", operation, attempt_no,
                                   config_.max_attempts, core::to_string(e.kind()), e.what(), delay.count());
                    sleep(delay);
                }
            }
        }

    private:
        void sleep(std::chrono::milliseconds delay) const;

        RetryConfig config_;
        Sleeper sleeper_;
    };

}// namespace ticketmcp::backend
