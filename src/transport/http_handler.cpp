#include "http_handler.h"
#include "core/logger.h"
#include "metrics/metrics_manager.h"
#include "metrics/performance_metrics.h"
#include "metrics/rate_limiter.h"
#include "nlohmann/json.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

using asio::awaitable;
using asio::use_awaitable;

namespace ticketmcp::transport {

    namespace {

        std::string to_lower(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        std::string error_body(const std::string &message) {
            return nlohmann::json{{"error", message}}.dump();
        }

        constexpr const char *kSseHeaders =
                "HTTP/1.1 200 OK\r\n"
                "Content-Type: text/event-stream\r\n"
                "Cache-Control: no-cache, no-transform\r\n"
                "Connection: keep-alive\r\n"
                "X-Accel-Buffering: no\r\n"
                "\r\n";

    }// namespace

    std::string HttpRequest::header(const std::string &lower_name) const {
        auto it = headers.find(lower_name);
        return (it != headers.end()) ? it->second : "";
    }

    HttpHandler::HttpHandler(std::shared_ptr<TransportManager> manager,
                             std::shared_ptr<RestFacade> rest,
                             std::shared_ptr<health::HealthMonitor> health,
                             std::shared_ptr<auth::AuthManagerBase> auth_manager)
        : manager_(std::move(manager)),
          rest_(std::move(rest)),
          health_(std::move(health)),
          auth_manager_(std::move(auth_manager)) {
        metrics_manager_ = metrics::MetricsManager::getInstance();
        rate_limiter_ = metrics::RateLimiter::getInstance();
    }

    std::string HttpHandler::url_decode(const std::string &text) {
        std::string out;
        out.reserve(text.size());
        for (size_t i = 0; i < text.size(); ++i) {
            char c = text[i];
            if (c == '+') {
                out += ' ';
            } else if (c == '%' && i + 2 < text.size() &&
                       std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
                       std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
                out += static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16));
                i += 2;
            } else {
                out += c;
            }
        }
        return out;
    }

    std::optional<HttpRequest> HttpHandler::parse_request(const std::string &raw_request) {
        HttpRequest req;
        std::istringstream iss(raw_request);
        std::string line;

        // Parse request line (method, target, version)
        if (!std::getline(iss, line)) {
            return std::nullopt;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        std::istringstream request_line(line);
        request_line >> req.method >> req.target >> req.version;
        if (request_line.fail() || req.target.empty() || req.target[0] != '/') {
            return std::nullopt;
        }

        // Split path and query string
        auto question = req.target.find('?');
        req.path = req.target.substr(0, question);
        if (question != std::string::npos) {
            std::istringstream query(req.target.substr(question + 1));
            std::string pair;
            while (std::getline(query, pair, '&')) {
                if (pair.empty()) {
                    continue;
                }
                auto eq = pair.find('=');
                auto key = url_decode(pair.substr(0, eq));
                req.query[key] = eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
            }
        }

        // Parse headers
        while (std::getline(iss, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            // Headers end marker (empty line)
            if (line.empty()) {
                break;
            }
            size_t colon_pos = line.find(':');
            if (colon_pos == std::string::npos) {
                continue;// Invalid header format, skip
            }
            std::string key = to_lower(line.substr(0, colon_pos));
            std::string value = line.substr(colon_pos + 1);
            size_t start = value.find_first_not_of(" \t");
            size_t end = value.find_last_not_of(" \t");
            req.headers[key] = (start == std::string::npos) ? "" : value.substr(start, end - start + 1);
        }

        // Parse body (based on Content-Length)
        auto length = req.headers.find("content-length");
        if (length != req.headers.end()) {
            size_t content_len = 0;
            try {
                content_len = std::stoull(length->second);
            } catch (const std::exception &) {
                return std::nullopt;
            }
            req.body.resize(content_len);
            iss.read(req.body.data(), static_cast<std::streamsize>(content_len));
            req.body.resize(static_cast<size_t>(iss.gcount()));
        }

        return req;
    }

    const char *HttpHandler::status_text(int status_code) {
        switch (status_code) {
            case 200:
                return "OK";
            case 201:
                return "Created";
            case 202:
                return "Accepted";
            case 204:
                return "No Content";
            case 400:
                return "Bad Request";
            case 401:
                return "Unauthorized";
            case 403:
                return "Forbidden";
            case 404:
                return "Not Found";
            case 405:
                return "Method Not Allowed";
            case 406:
                return "Not Acceptable";
            case 413:
                return "Payload Too Large";
            case 429:
                return "Too Many Requests";
            case 500:
                return "Internal Server Error";
            case 502:
                return "Bad Gateway";
            case 503:
                return "Service Unavailable";
            default:
                return "Unknown";
        }
    }

    /**
    * @brief Sends an HTTP response to the client over the specified channel.
    *
    * Builds the status line and headers, honours the client's Connection preference and
    * closes the socket afterwards when the client asked for it.
    */
    awaitable<void> HttpHandler::send_http_response(std::shared_ptr<TcpSession> channel, const HttpRequest &req,
                                                    const std::string &body, int status_code) {
        std::ostringstream oss;
        oss << "HTTP/1.1 " << status_code << " " << status_text(status_code) << "\r\n";
        oss << "Content-Type: application/json\r\n";
        oss << "Server: " << "ticketmcp" << "\r\n";

        bool has_body = status_code != 204;
        oss << "Content-Length: " << (has_body ? body.size() : 0) << "\r\n";

        // Connection management based on client request
        std::string client_connection = to_lower(req.header("connection"));
        bool keep_alive = client_connection.empty() ? req.version != "HTTP/1.0" : client_connection == "keep-alive";
        if (keep_alive) {
            oss << "Connection: keep-alive\r\n";
            oss << "Keep-Alive: timeout=300, max=100\r\n";
        } else {
            oss << "Connection: close\r\n";
        }
        oss << "\r\n";
        if (has_body) {
            oss << body;
        }

        co_await channel->write(oss.str());
        TICKETMCP_DEBUG("Sent HTTP {} for {} {} (channel: {})", status_code, req.method, req.path, channel->get_channel_id());

        if (!keep_alive) {
            channel->close();
        }
        co_return;
    }

    awaitable<void> HttpHandler::handle_request(std::shared_ptr<TcpSession> channel, const std::string &raw_request) {
        auto performance = metrics::PerformanceTracker::start_tracking(raw_request.size());
        const std::string channel_id = channel->get_channel_id();

        auto req_opt = parse_request(raw_request);
        if (!req_opt.has_value()) {
            HttpRequest empty;
            empty.version = "HTTP/1.0";// close after answering garbage
            co_await send_http_response(channel, empty, error_body("Invalid HTTP request"), 400);
            metrics::PerformanceTracker::end_tracking(performance, 400);
            metrics_manager_->report_performance(metrics::TrackedHttpRequest{}, performance, channel_id);
            co_return;
        }
        const HttpRequest &req = *req_opt;
        metrics::TrackedHttpRequest tracked{req.method, req.path, req.body.size()};

        // Flow control
        auto decision = rate_limiter_->check_request_allowed(tracked, channel_id);
        if (decision != metrics::RateLimitDecision::ALLOW) {
            int status_code = decision == metrics::RateLimitDecision::TOO_LARGE ? 413 : 429;
            co_await send_http_response(channel, req,
                                        error_body(status_code == 413 ? "Request too large" : "Rate limit exceeded"),
                                        status_code);
            metrics::PerformanceTracker::end_tracking(performance, status_code);
            metrics_manager_->report_performance(tracked, performance, channel_id);
            co_return;
        }

        int status_code = 500;
        bool failed = false;
        try {
            // Probes carry no credentials
            if (req.path == "/health/live" || req.path == "/health") {
                status_code = co_await route(channel, req, auth::CallerIdentity{});
            } else {
                std::optional<auth::CallerIdentity> identity = auth::CallerIdentity{};
                if (auth_manager_) {
                    identity = auth_manager_->authenticate(req.headers);
                }
                if (!identity) {
                    TICKETMCP_WARN("Auth failed for {} {} (channel: {})", req.method, req.path, channel_id);
                    status_code = 401;
                    co_await send_http_response(channel, req, error_body("Unauthorized"), status_code);
                } else {
                    status_code = co_await route(channel, req, *identity);
                }
            }
        } catch (const std::exception &e) {
            TICKETMCP_ERROR("Error handling {} {}: {}", req.method, req.path, e.what());
            metrics_manager_->report_error(e.what(), channel_id);
            failed = true;
        }
        if (failed) {
            status_code = 500;
            if (!channel->is_streaming()) {
                co_await send_http_response(channel, req, error_body("Internal Server Error"), status_code);
            }
        }

        metrics::PerformanceTracker::end_tracking(performance, status_code);
        metrics_manager_->report_performance(tracked, performance, channel_id);
        rate_limiter_->report_request_completed(channel_id);
        co_return;
    }

    awaitable<int> HttpHandler::route(std::shared_ptr<TcpSession> channel, const HttpRequest &req,
                                      const auth::CallerIdentity &identity) {
        TICKETMCP_DEBUG("{} {} (channel: {})", req.method, req.target, channel->get_channel_id());

        if (req.path == "/sse") {
            if (req.method != "GET") {
                co_await send_http_response(channel, req, error_body("Method Not Allowed"), 405);
                co_return 405;
            }
            co_return co_await open_event_stream(channel, req, identity);
        }

        if (req.path == "/messages") {
            if (req.method != "POST") {
                co_await send_http_response(channel, req, error_body("Method Not Allowed"), 405);
                co_return 405;
            }
            co_return co_await post_message(channel, req, identity);
        }

        if (req.path == "/health/live" && req.method == "GET") {
            nlohmann::json body = {{"status", health::to_string(health_->liveness())}, {"service", "ServiceNow MCP Server"}};
            co_await send_http_response(channel, req, body.dump(), 200);
            co_return 200;
        }

        if (req.path == "/health" && req.method == "GET") {
            // readiness pings the backend, which blocks
            auto report = co_await asio::co_spawn(manager_->worker_executor(), [health = health_]() -> awaitable<health::ReadinessReport> {
                    co_return health->readiness(); }, use_awaitable);
            int status_code = report.status == health::HealthStatus::Down ? 503 : 200;
            co_await send_http_response(channel, req, report.to_json().dump(), status_code);
            co_return status_code;
        }

        if (rest_ && RestFacade::matches(req.path)) {
            RestRequest rest_request{req.method, req.path, req.query, req.headers, req.body};
            auto response = co_await asio::co_spawn(manager_->worker_executor(), [rest = rest_, rest_request, identity]() -> awaitable<RestResponse> {
                    co_return rest->handle(rest_request, identity); }, use_awaitable);
            co_await send_http_response(channel, req, response.body.dump(), response.status);
            co_return response.status;
        }

        co_await send_http_response(channel, req, error_body("Not Found"), 404);
        co_return 404;
    }

    awaitable<int> HttpHandler::open_event_stream(std::shared_ptr<TcpSession> channel, const HttpRequest &req,
                                                  const auth::CallerIdentity &identity) {
        std::string accept = req.header("accept");
        if (!accept.empty() && accept.find("text/event-stream") == std::string::npos && accept.find("*/*") == std::string::npos) {
            co_await send_http_response(channel, req, error_body("Accept must include text/event-stream"), 406);
            co_return 406;
        }
        if (!manager_->accepting()) {
            co_await send_http_response(channel, req, error_body("Server is shutting down"), 503);
            co_return 503;
        }

        co_await channel->write(kSseHeaders);
        if (channel->is_closed()) {
            co_return 200;
        }
        channel->set_streaming(true);
        manager_->open_stream(channel, identity);
        co_return 200;
    }

    awaitable<int> HttpHandler::post_message(std::shared_ptr<TcpSession> channel, const HttpRequest &req,
                                             const auth::CallerIdentity &identity) {
        auto id = req.query.find("session_id");
        if (id == req.query.end() || id->second.empty()) {
            co_await send_http_response(channel, req, error_body("session_id required"), 400);
            co_return 400;
        }

        auto connection = manager_->find(id->second);
        if (!connection || connection->state() == ConnectionState::Closed) {
            co_await send_http_response(channel, req, error_body("Unknown session"), 404);
            co_return 404;
        }
        if (connection->identity().subject != identity.subject) {
            TICKETMCP_WARN("Caller '{}' posted to stream {} owned by '{}'", identity.subject,
                           connection->connection_id(), connection->identity().subject);
            co_await send_http_response(channel, req, error_body("Forbidden"), 403);
            co_return 403;
        }

        auto ack = manager_->request_handler().handle_message(req.body, connection);
        co_await send_http_response(channel, req, ack.body.dump(), ack.status);
        co_return ack.status;
    }

}// namespace ticketmcp::transport
