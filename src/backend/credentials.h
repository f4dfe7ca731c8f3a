// src/backend/credentials.h
#pragma once

#include "http_executor.h"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ticketmcp::backend {

    enum class AuthType {
        Basic,
        OAuth,
        ApiKey
    };

    std::optional<AuthType> auth_type_from_string(const std::string &name);
    const char *to_string(AuthType type);

    struct CredentialConfig {
        AuthType type = AuthType::Basic;
        std::string username;
        std::string password;
        std::string client_id;
        std::string client_secret;
        std::string token_url;// path on the instance, default /oauth_token.do
        std::string api_key;
        std::string api_key_header = "X-ServiceNow-API-Key";
    };

    /**
     * @brief Produces the authentication headers for backend requests.
     *
     * One provider is shared by every session. invalidate() is called after the backend
     * answered 401 so the next headers() call refreshes a cached token.
     */
    class CredentialProvider {
    public:
        virtual ~CredentialProvider() = default;
        virtual std::vector<std::pair<std::string, std::string>> headers() = 0;
        virtual void invalidate() {}
        virtual bool refreshable() const { return false; }
    };

    class BasicCredentials : public CredentialProvider {
    public:
        BasicCredentials(std::string username, std::string password);
        std::vector<std::pair<std::string, std::string>> headers() override;

    private:
        std::pair<std::string, std::string> authorization_;
    };

    class ApiKeyCredentials : public CredentialProvider {
    public:
        ApiKeyCredentials(std::string header, std::string key);
        std::vector<std::pair<std::string, std::string>> headers() override;

    private:
        std::string header_;
        std::string key_;
    };

    /**
     * @brief OAuth 2.0 password grant against the instance token endpoint.
     * The access token is cached until shortly before it expires.
     */
    class OAuthCredentials : public CredentialProvider {
    public:
        OAuthCredentials(CredentialConfig config, std::shared_ptr<HttpExecutor> executor,
                         std::chrono::milliseconds timeout);

        std::vector<std::pair<std::string, std::string>> headers() override;
        void invalidate() override;
        bool refreshable() const override { return true; }

    private:
        void refresh_locked();

        CredentialConfig config_;
        std::shared_ptr<HttpExecutor> executor_;
        std::chrono::milliseconds timeout_;
        std::mutex mutex_;
        std::string access_token_;
        std::chrono::steady_clock::time_point expires_at_{};
    };

    /**
     * @brief Build the provider for @p config.
     * @throws core::ConfigError when the credentials required by the auth type are missing
     */
    std::shared_ptr<CredentialProvider> make_credential_provider(const CredentialConfig &config,
                                                                 std::shared_ptr<HttpExecutor> executor,
                                                                 std::chrono::milliseconds timeout);

}// namespace ticketmcp::backend
