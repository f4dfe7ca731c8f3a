#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ticketmcp::core {

    /**
     * @brief Normalized error taxonomy shared by the backend adapter, the dispatcher and both
     * inbound surfaces. A kind is assigned once, where the failure is first observed.
     */
    enum class ErrorKind {
        Forbidden,
        InvalidArgument,
        NotFound,
        Unauthorized,
        RateLimited,
        Unavailable,
        Unknown
    };

    inline const char *to_string(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::Forbidden:
                return "Forbidden";
            case ErrorKind::InvalidArgument:
                return "InvalidArgument";
            case ErrorKind::NotFound:
                return "NotFound";
            case ErrorKind::Unauthorized:
                return "Unauthorized";
            case ErrorKind::RateLimited:
                return "RateLimited";
            case ErrorKind::Unavailable:
                return "Unavailable";
            case ErrorKind::Unknown:
            default:
                return "Unknown";
        }
    }

    inline std::optional<ErrorKind> error_kind_from_string(std::string_view name) {
        if (name == "Forbidden") return ErrorKind::Forbidden;
        if (name == "InvalidArgument") return ErrorKind::InvalidArgument;
        if (name == "NotFound") return ErrorKind::NotFound;
        if (name == "Unauthorized") return ErrorKind::Unauthorized;
        if (name == "RateLimited") return ErrorKind::RateLimited;
        if (name == "Unavailable") return ErrorKind::Unavailable;
        if (name == "Unknown") return ErrorKind::Unknown;
        return std::nullopt;
    }

    /// Transient kinds are the only ones the retry policy may retry.
    inline bool is_transient(ErrorKind kind) {
        return kind == ErrorKind::RateLimited || kind == ErrorKind::Unavailable;
    }

    /**
     * @brief Exception carrying a classified failure.
     *
     * @c what() is the human-readable message; @c detail() holds diagnostic text such as the
     * backend's raw response body, and may be empty.
     */
    class ServiceError : public std::runtime_error {
    public:
        ServiceError(ErrorKind kind, const std::string &message, std::string detail = {})
            : std::runtime_error(message), kind_(kind), detail_(std::move(detail)) {}

        ErrorKind kind() const noexcept { return kind_; }
        const std::string &detail() const noexcept { return detail_; }

        /// Seconds the backend asked us to wait (Retry-After), when it said so.
        std::optional<int> retry_after() const noexcept { return retry_after_; }
        void set_retry_after(int seconds) { retry_after_ = seconds; }

    private:
        ErrorKind kind_;
        std::string detail_;
        std::optional<int> retry_after_;
    };

    /**
     * @brief Raised for fatal configuration problems discovered at startup.
     */
    class ConfigError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

}// namespace ticketmcp::core
