#include "credentials.h"
#include "core/errors.h"
#include "core/logger.h"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include <algorithm>

namespace ticketmcp::backend {

    namespace {
        // the executor is bound to the instance, so only the path of an absolute URL is kept
        std::string token_path(const std::string &token_url) {
            if (token_url.empty()) {
                return "/oauth_token.do";
            }
            auto scheme = token_url.find("://");
            if (scheme == std::string::npos) {
                return token_url;
            }
            auto path = token_url.find('/', scheme + 3);
            return path == std::string::npos ? "/oauth_token.do" : token_url.substr(path);
        }
    }// namespace

    std::optional<AuthType> auth_type_from_string(const std::string &name) {
        if (name == "basic") return AuthType::Basic;
        if (name == "oauth") return AuthType::OAuth;
        if (name == "api_key") return AuthType::ApiKey;
        return std::nullopt;
    }

    const char *to_string(AuthType type) {
        switch (type) {
            case AuthType::Basic:
                return "basic";
            case AuthType::OAuth:
                return "oauth";
            case AuthType::ApiKey:
                return "api_key";
        }
        return "basic";
    }

    BasicCredentials::BasicCredentials(std::string username, std::string password)
        : authorization_(httplib::make_basic_authentication_header(username, password)) {}

    std::vector<std::pair<std::string, std::string>> BasicCredentials::headers() {
        return {authorization_};
    }

    ApiKeyCredentials::ApiKeyCredentials(std::string header, std::string key)
        : header_(std::move(header)), key_(std::move(key)) {}

    std::vector<std::pair<std::string, std::string>> ApiKeyCredentials::headers() {
        return {{header_, key_}};
    }

    OAuthCredentials::OAuthCredentials(CredentialConfig config, std::shared_ptr<HttpExecutor> executor,
                                       std::chrono::milliseconds timeout)
        : config_(std::move(config)), executor_(std::move(executor)), timeout_(timeout) {}

    std::vector<std::pair<std::string, std::string>> OAuthCredentials::headers() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (access_token_.empty() || std::chrono::steady_clock::now() >= expires_at_) {
            refresh_locked();
        }
        return {{"Authorization", "Bearer " + access_token_}};
    }

    void OAuthCredentials::invalidate() {
        std::lock_guard<std::mutex> lock(mutex_);
        access_token_.clear();
    }

    void OAuthCredentials::refresh_locked() {
        BackendRequest request;
        request.method = "POST";
        request.path = token_path(config_.token_url);
        request.timeout = timeout_;
        request.form = {{"grant_type", "password"},
                        {"client_id", config_.client_id},
                        {"client_secret", config_.client_secret},
                        {"username", config_.username},
                        {"password", config_.password}};

        BackendResponse response = executor_->execute(request);
        if (response.status == 401 || response.status == 403 || response.status == 400) {
            throw core::ServiceError(core::ErrorKind::Unauthorized, "OAuth token request rejected", response.body);
        }
        if (response.status >= 500 || response.status == 429) {
            throw core::ServiceError(response.status == 429 ? core::ErrorKind::RateLimited : core::ErrorKind::Unavailable,
                                     "OAuth token endpoint returned " + std::to_string(response.status), response.body);
        }

        nlohmann::json body;
        try {
            body = nlohmann::json::parse(response.body);
        } catch (const nlohmann::json::parse_error &) {
            throw core::ServiceError(core::ErrorKind::Unknown, "OAuth token response is not JSON", response.body);
        }
        access_token_ = body.value("access_token", "");
        if (access_token_.empty()) {
            throw core::ServiceError(core::ErrorKind::Unauthorized, "OAuth token response has no access_token", response.body);
        }
        int expires_in = body.value("expires_in", 1800);
        // renew a little early so in-flight requests never carry an expired token
        expires_at_ = std::chrono::steady_clock::now() + std::chrono::seconds(std::max(expires_in - 60, 0));
        TICKETMCP_INFO("Obtained OAuth access token, valid for {} s", expires_in);
    }

    std::shared_ptr<CredentialProvider> make_credential_provider(const CredentialConfig &config,
                                                                 std::shared_ptr<HttpExecutor> executor,
                                                                 std::chrono::milliseconds timeout) {
        switch (config.type) {
            case AuthType::Basic:
                if (config.username.empty() || config.password.empty()) {
                    throw core::ConfigError("basic auth requires backend username and password");
                }
                return std::make_shared<BasicCredentials>(config.username, config.password);
            case AuthType::ApiKey:
                if (config.api_key.empty()) {
                    throw core::ConfigError("api_key auth requires backend api_key");
                }
                return std::make_shared<ApiKeyCredentials>(config.api_key_header, config.api_key);
            case AuthType::OAuth:
                if (config.client_id.empty() || config.client_secret.empty() || config.username.empty() ||
                    config.password.empty()) {
                    throw core::ConfigError("oauth auth requires client_id, client_secret, username and password");
                }
                return std::make_shared<OAuthCredentials>(config, std::move(executor), timeout);
        }
        throw core::ConfigError("unsupported backend auth type");
    }

}// namespace ticketmcp::backend
