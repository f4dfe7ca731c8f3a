#pragma once

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ticketmcp::auth {

    /// Header map with lower-cased keys, as produced by the HTTP parser.
    using HeaderMap = std::unordered_map<std::string, std::string>;

    /**
     * @brief Identity attached to a connection by whatever verified it upstream.
     */
    struct CallerIdentity {
        std::string subject = "anonymous";
        std::string role = "anonymous";
    };

    // ==============================
    // Abstract Auth Manager
    // ==============================
    class AuthManagerBase {
    public:
        virtual ~AuthManagerBase() = default;

        /// Identity for an accepted request, std::nullopt to reject it with 401.
        virtual std::optional<CallerIdentity> authenticate(const HeaderMap &headers) const = 0;
        // Get the type of the auth manager
        virtual std::string type() const = 0;
    };

    // ==============================
    // No auth: every caller is anonymous
    // ==============================
    class AuthManagerNone final : public AuthManagerBase {
    public:
        std::optional<CallerIdentity> authenticate(const HeaderMap &) const override {
            return CallerIdentity{};
        }

        std::string type() const override {
            return "none";
        }
    };

    // ==============================
    // Trusted headers set by the identity service in front of us
    // ==============================
    class AuthManagerTrustedHeader final : public AuthManagerBase {
    public:
        std::optional<CallerIdentity> authenticate(const HeaderMap &headers) const override {
            auto id = headers.find("x-caller-id");
            if (id == headers.end() || id->second.empty()) {
                return std::nullopt;
            }
            CallerIdentity identity;
            identity.subject = id->second;
            auto role = headers.find("x-caller-role");
            identity.role = (role == headers.end() || role->second.empty()) ? "user" : role->second;
            return identity;
        }

        std::string type() const override {
            return "trusted-header";
        }
    };

    // ==============================
    // X-API-Key Auth
    // ==============================
    class AuthManagerXApi final : public AuthManagerBase {
    private:
        std::unordered_set<std::string> valid_keys_;

    public:
        explicit AuthManagerXApi(std::vector<std::string> api_keys) {
            for (auto &key: api_keys) {
                if (!key.empty()) {
                    valid_keys_.insert(std::move(key));
                }
            }
        }

        std::optional<CallerIdentity> authenticate(const HeaderMap &headers) const override {
            auto it = headers.find("x-api-key");
            if (it == headers.end() || valid_keys_.find(it->second) == valid_keys_.end()) {
                return std::nullopt;
            }
            return CallerIdentity{"api-key:" + it->second.substr(0, 4), "service"};
        }

        std::string type() const override {
            return "X-API-Key";
        }
    };

    // ==============================
    // Bearer Token Auth
    // ==============================
    class AuthManagerBearer final : public AuthManagerBase {
    private:
        std::unordered_set<std::string> valid_tokens_;

    public:
        explicit AuthManagerBearer(std::vector<std::string> tokens) {
            for (auto &token: tokens) {
                if (!token.empty()) {
                    valid_tokens_.insert(std::move(token));
                }
            }
        }

        std::optional<CallerIdentity> authenticate(const HeaderMap &headers) const override {
            auto it = headers.find("authorization");
            if (it == headers.end()) {
                return std::nullopt;
            }

            const std::string &auth = it->second;
            constexpr std::string_view prefix = "Bearer ";
            if (auth.substr(0, prefix.size()) != prefix) {
                return std::nullopt;
            }

            std::string token = auth.substr(prefix.size());
            size_t start = token.find_first_not_of(" \t");
            size_t end = token.find_last_not_of(" \t");
            if (start == std::string::npos) {
                return std::nullopt;
            }
            token = token.substr(start, end - start + 1);

            if (valid_tokens_.find(token) == valid_tokens_.end()) {
                return std::nullopt;
            }
            return CallerIdentity{"bearer:" + token.substr(0, 4), "service"};
        }

        std::string type() const override {
            return "Bearer";
        }
    };

    /**
     * @brief Build the manager for a configured mode.
     * @param mode none, trusted-header, X-API-Key or Bearer
     * @param keys accepted keys or tokens for the key based modes
     * @return nullptr for an unrecognized mode
     */
    inline std::shared_ptr<AuthManagerBase> make_auth_manager(const std::string &mode, std::vector<std::string> keys) {
        if (mode.empty() || mode == "none") {
            return std::make_shared<AuthManagerNone>();
        }
        if (mode == "trusted-header") {
            return std::make_shared<AuthManagerTrustedHeader>();
        }
        if (mode == "X-API-Key") {
            return std::make_shared<AuthManagerXApi>(std::move(keys));
        }
        if (mode == "Bearer") {
            return std::make_shared<AuthManagerBearer>(std::move(keys));
        }
        return nullptr;
    }

}// namespace ticketmcp::auth
