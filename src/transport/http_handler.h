#pragma once

#include "Auth/AuthManager.hpp"
#include "health/health_monitor.h"
#include "rest_facade.h"
#include "tcp_session.h"
#include "transport_manager.h"
#include <asio.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace ticketmcp {
    namespace metrics {
        class MetricsManager;
        class RateLimiter;
    }// namespace metrics
}// namespace ticketmcp

namespace ticketmcp::transport {

    /**
     * @brief HTTP request structure for parsing incoming requests.
     */
    struct HttpRequest {
        std::string method;                     ///< HTTP method (GET, POST, etc.)
        std::string target;                     ///< Request target as sent, path plus query
        std::string path;                       ///< Target without the query string
        std::string version;                    ///< HTTP version
        std::map<std::string, std::string> query;///< Decoded query parameters
        auth::HeaderMap headers;                ///< HTTP headers, lower-cased names
        std::string body;                       ///< Request body

        std::string header(const std::string &lower_name) const;
    };

    /**
     * @brief Routes HTTP requests: the event stream and its message endpoint, health
     * checks and the REST facade.
     */
    class HttpHandler {
    public:
        HttpHandler(std::shared_ptr<TransportManager> manager,
                    std::shared_ptr<RestFacade> rest,
                    std::shared_ptr<health::HealthMonitor> health,
                    std::shared_ptr<auth::AuthManagerBase> auth_manager = nullptr);

        /**
         * @brief Process one complete HTTP request read from @p channel.
         * @param channel Channel the request arrived on
         * @param raw_request Raw HTTP request string
         */
        asio::awaitable<void> handle_request(std::shared_ptr<TcpSession> channel, const std::string &raw_request);

        /**
         * @brief Parse raw HTTP request into structured data.
         * @param raw_request Raw HTTP request string
         * @return Optional HttpRequest structure
         */
        static std::optional<HttpRequest> parse_request(const std::string &raw_request);

        /// Percent-decoding for query strings ('+' is a space).
        static std::string url_decode(const std::string &text);

        static const char *status_text(int status_code);

    private:
        /**
         * @brief Send an HTTP response with a JSON body.
         * @param channel Active channel
         * @param req Request being answered, for connection persistence
         * @param body Response body
         * @param status_code HTTP status code
         */
        asio::awaitable<void> send_http_response(std::shared_ptr<TcpSession> channel, const HttpRequest &req,
                                                 const std::string &body, int status_code);

        asio::awaitable<int> route(std::shared_ptr<TcpSession> channel, const HttpRequest &req,
                                   const auth::CallerIdentity &identity);

        asio::awaitable<int> open_event_stream(std::shared_ptr<TcpSession> channel, const HttpRequest &req,
                                               const auth::CallerIdentity &identity);

        asio::awaitable<int> post_message(std::shared_ptr<TcpSession> channel, const HttpRequest &req,
                                          const auth::CallerIdentity &identity);

        std::shared_ptr<TransportManager> manager_;
        std::shared_ptr<RestFacade> rest_;
        std::shared_ptr<health::HealthMonitor> health_;
        std::shared_ptr<auth::AuthManagerBase> auth_manager_;
        std::shared_ptr<metrics::MetricsManager> metrics_manager_;
        std::shared_ptr<metrics::RateLimiter> rate_limiter_;
    };

}// namespace ticketmcp::transport
