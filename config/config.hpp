#ifndef TICKETMCP_CONFIG_HPP
#define TICKETMCP_CONFIG_HPP

#include "core/errors.h"
#include "core/logger.h"
#include "inicpp.hpp"
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>


namespace ticketmcp {
    namespace config {

        constexpr const char *CONFIG_FILE = "config.ini";
        constexpr const char *CONFIG_ENV = "TICKETMCP_CONFIG";

        /// Looks up one environment variable. Replaced in tests.
        using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

        inline std::optional<std::string> process_env(const std::string &name) {
            const char *value = std::getenv(name.c_str());
            if (value == nullptr || *value == '\0') {
                return std::nullopt;
            }
            return std::string(value);
        }

        /**
         * @brief Config file location: --config, then TICKETMCP_CONFIG, then ./config.ini
         */
        inline std::string resolve_config_path(const std::string &cli_path, const EnvLookup &env = process_env) {
            if (!cli_path.empty()) {
                return cli_path;
            }
            if (auto from_env = env(CONFIG_ENV)) {
                return *from_env;
            }
            return CONFIG_FILE;
        }

        /**
 * Listener and logging configuration
 */
        struct ServerConfig {
            std::string ip;
            std::string log_level;
            std::string log_path;
            size_t max_file_size;
            size_t max_files;
            unsigned short http_port;
            bool enable_http;
            bool enable_stdio;
            size_t worker_threads;
            size_t io_threads;
            size_t max_requests_per_second;
            size_t max_concurrent_requests;
            size_t max_request_size;

            static ServerConfig load(inicpp::IniManager &ini) {
                try {
                    auto server_section = ini["server"];
                    ServerConfig config;

                    config.ip = server_section["ip"].String().empty() ? "127.0.0.1" : server_section["ip"].String();
                    config.log_level = server_section["log_level"].String().empty() ? "info" : server_section["log_level"].String();
                    config.log_path = server_section["log_path"].String().empty() ? "logs/ticketmcp.log" : server_section["log_path"].String();

                    config.max_file_size = server_section["max_file_size"].String().empty() ? 10485760 : static_cast<size_t>(server_section["max_file_size"]);
                    config.max_files = server_section["max_files"].String().empty() ? 10 : static_cast<size_t>(server_section["max_files"]);
                    config.http_port = server_section["http_port"].String().empty() ? 8080 : static_cast<unsigned short>(server_section["http_port"]);
                    config.worker_threads = server_section["worker_threads"].String().empty() ? 8 : static_cast<size_t>(server_section["worker_threads"]);
                    config.io_threads = server_section["io_threads"].String().empty() ? 2 : static_cast<size_t>(server_section["io_threads"]);

                    config.max_requests_per_second = server_section["max_requests_per_second"].String().empty() ? 100 : static_cast<size_t>(server_section["max_requests_per_second"]);
                    config.max_concurrent_requests = server_section["max_concurrent_requests"].String().empty() ? 1000 : static_cast<size_t>(server_section["max_concurrent_requests"]);
                    config.max_request_size = server_section["max_request_size"].String().empty() ? 1024 * 1024 : static_cast<size_t>(server_section["max_request_size"]);

                    config.enable_http = server_section["enable_http"].String().empty() ? true : static_cast<bool>(server_section["enable_http"]);
                    config.enable_stdio = server_section["enable_stdio"].String().empty() ? false : static_cast<bool>(server_section["enable_stdio"]);

                    return config;
                } catch (const std::exception &e) {
                    TICKETMCP_ERROR("Failed to load server config: {}", e.what());
                    throw;
                }
            }
        };

        /**
 * Session lifetime, in seconds
 */
        struct SessionConfig {
            size_t idle_timeout;
            size_t sweep_interval;
            size_t heartbeat_interval;
            size_t drain_grace_period;
            bool strict_arguments;

            static SessionConfig load(inicpp::IniManager &ini) {
                try {
                    SessionConfig config;
                    auto section = ini["session"];
                    config.idle_timeout = section["idle_timeout"].String().empty() ? 300 : static_cast<size_t>(section["idle_timeout"]);
                    config.sweep_interval = section["sweep_interval"].String().empty() ? 30 : static_cast<size_t>(section["sweep_interval"]);
                    config.heartbeat_interval = section["heartbeat_interval"].String().empty() ? 15 : static_cast<size_t>(section["heartbeat_interval"]);
                    config.drain_grace_period = section["drain_grace_period"].String().empty() ? 10 : static_cast<size_t>(section["drain_grace_period"]);
                    config.strict_arguments = section["strict_arguments"].String().empty() ? true : static_cast<bool>(section["strict_arguments"]);
                    return config;
                } catch (const std::exception &e) {
                    TICKETMCP_ERROR("Failed to load session config: {}", e.what());
                    throw;
                }
            }
        };

        struct CatalogConfig {
            std::string file;
            std::string default_package;

            static CatalogConfig load(inicpp::IniManager &ini) {
                try {
                    CatalogConfig config;
                    auto section = ini["catalog"];
                    config.file = section["file"].String().empty() ? "config/tool_catalog.json" : section["file"].String();
                    config.default_package = section["default_package"].String().empty() ? "full" : section["default_package"].String();
                    return config;
                } catch (const std::exception &e) {
                    TICKETMCP_ERROR("Failed to load catalog config: {}", e.what());
                    throw;
                }
            }
        };

        /**
 * Ticketing backend connection. timeout is in seconds.
 */
        struct BackendConfig {
            std::string instance_url;
            std::string auth_type;
            std::string username;
            std::string password;
            std::string client_id;
            std::string client_secret;
            std::string token_url;
            std::string api_key;
            std::string api_key_header;
            size_t timeout;
            size_t max_attempts;
            size_t initial_backoff_ms;
            size_t max_backoff_ms;
            size_t pool_size;

            static BackendConfig load(inicpp::IniManager &ini) {
                try {
                    BackendConfig config;
                    auto section = ini["backend"];
                    config.instance_url = section["instance_url"].String();
                    config.auth_type = section["auth_type"].String().empty() ? "basic" : section["auth_type"].String();
                    config.username = section["username"].String();
                    config.password = section["password"].String();
                    config.client_id = section["client_id"].String();
                    config.client_secret = section["client_secret"].String();
                    config.token_url = section["token_url"].String();
                    config.api_key = section["api_key"].String();
                    config.api_key_header = section["api_key_header"].String().empty() ? "X-ServiceNow-API-Key" : section["api_key_header"].String();
                    config.timeout = section["timeout"].String().empty() ? 30 : static_cast<size_t>(section["timeout"]);
                    config.max_attempts = section["max_attempts"].String().empty() ? 3 : static_cast<size_t>(section["max_attempts"]);
                    config.initial_backoff_ms = section["initial_backoff_ms"].String().empty() ? 200 : static_cast<size_t>(section["initial_backoff_ms"]);
                    config.max_backoff_ms = section["max_backoff_ms"].String().empty() ? 5000 : static_cast<size_t>(section["max_backoff_ms"]);
                    config.pool_size = section["pool_size"].String().empty() ? 8 : static_cast<size_t>(section["pool_size"]);
                    return config;
                } catch (const std::exception &e) {
                    TICKETMCP_ERROR("Failed to load backend config: {}", e.what());
                    throw;
                }
            }
        };

        struct HealthConfig {
            size_t probe_timeout;
            size_t probe_interval;

            static HealthConfig load(inicpp::IniManager &ini) {
                try {
                    HealthConfig config;
                    auto section = ini["health"];
                    config.probe_timeout = section["probe_timeout"].String().empty() ? 5 : static_cast<size_t>(section["probe_timeout"]);
                    config.probe_interval = section["probe_interval"].String().empty() ? 30 : static_cast<size_t>(section["probe_interval"]);
                    return config;
                } catch (const std::exception &e) {
                    TICKETMCP_ERROR("Failed to load health config: {}", e.what());
                    throw;
                }
            }
        };

        struct AuthConfig {
            std::string mode;
            std::string keys_file;

            static AuthConfig load(inicpp::IniManager &ini) {
                try {
                    AuthConfig config;
                    auto section = ini["auth"];
                    config.mode = section["mode"].String().empty() ? "none" : section["mode"].String();
                    config.keys_file = section["keys_file"].String().empty() ? ".env.auth" : section["keys_file"].String();
                    return config;
                } catch (const std::exception &e) {
                    TICKETMCP_ERROR("Failed to load auth config: {}", e.what());
                    throw;
                }
            }
        };

        /**
 * Global configuration
 */
        struct GlobalConfig {
            std::string title;
            ServerConfig server;
            SessionConfig session;
            CatalogConfig catalog;
            BackendConfig backend;
            HealthConfig health;
            AuthConfig auth;
            // role -> comma separated package names
            std::map<std::string, std::string> package_policy;

            static GlobalConfig load(const std::string &path) {
                try {
                    inicpp::IniManager ini(path);
                    TICKETMCP_INFO("Loading configuration from: {}", path);

                    GlobalConfig config;
                    config.title = ini[""]["title"].String().empty() ? "Ticket MCP Server Configuration" : ini[""]["title"].String();
                    config.server = ServerConfig::load(ini);
                    config.session = SessionConfig::load(ini);
                    config.catalog = CatalogConfig::load(ini);
                    config.backend = BackendConfig::load(ini);
                    config.health = HealthConfig::load(ini);
                    config.auth = AuthConfig::load(ini);
                    for (const auto &sec: ini.sectionsList()) {
                        if (sec != "package_policy") {
                            continue;
                        }
                        for (const auto &[role, packages]: ini.sectionMap(sec)) {
                            config.package_policy[role] = packages;
                        }
                    }
                    return config;
                } catch (const std::exception &e) {
                    TICKETMCP_ERROR("Failed to load global config: {}", e.what());
                    throw;
                }
            }

            /**
             * @brief Overlay SERVICENOW_*, MCP_TOOL_PACKAGE and TOOL_PACKAGE_CONFIG_PATH.
             * @throws core::ConfigError for a numeric variable that does not parse
             */
            void apply_environment(const EnvLookup &env = process_env) {
                auto assign = [&env](const char *name, std::string &target) {
                    if (auto value = env(name)) {
                        target = *value;
                    }
                };
                auto assign_number = [&env](const char *name, auto &target) {
                    auto value = env(name);
                    if (!value) {
                        return;
                    }
                    try {
                        size_t consumed = 0;
                        unsigned long parsed = std::stoul(*value, &consumed);
                        if (consumed != value->size()) {
                            throw std::invalid_argument(*value);
                        }
                        target = static_cast<std::remove_reference_t<decltype(target)>>(parsed);
                    } catch (const std::logic_error &) {
                        throw core::ConfigError(fmt::format("{} must be a non-negative integer, got '{}'", name, *value));
                    }
                };

                assign("SERVICENOW_INSTANCE_URL", backend.instance_url);
                assign("SERVICENOW_AUTH_TYPE", backend.auth_type);
                assign("SERVICENOW_USERNAME", backend.username);
                assign("SERVICENOW_PASSWORD", backend.password);
                assign("SERVICENOW_CLIENT_ID", backend.client_id);
                assign("SERVICENOW_CLIENT_SECRET", backend.client_secret);
                assign("SERVICENOW_TOKEN_URL", backend.token_url);
                assign("SERVICENOW_API_KEY", backend.api_key);
                assign("SERVICENOW_API_KEY_HEADER", backend.api_key_header);
                assign_number("SERVICENOW_TIMEOUT", backend.timeout);
                assign("SERVICENOW_HOST", server.ip);
                assign_number("SERVICENOW_PORT", server.http_port);
                if (auto debug = env("SERVICENOW_DEBUG")) {
                    if (*debug == "1" || *debug == "true" || *debug == "yes") {
                        server.log_level = "debug";
                    }
                }
                assign("MCP_TOOL_PACKAGE", catalog.default_package);
                assign("TOOL_PACKAGE_CONFIG_PATH", catalog.file);
            }

            /**
             * @brief Reject settings the server cannot start with. Credential presence for the
             * chosen auth type is checked when the credential provider is built.
             * @throws core::ConfigError
             */
            void validate() const {
                if (backend.instance_url.empty()) {
                    throw core::ConfigError("backend instance URL is not set (instance_url or SERVICENOW_INSTANCE_URL)");
                }
                if (backend.instance_url.rfind("http://", 0) != 0 && backend.instance_url.rfind("https://", 0) != 0) {
                    throw core::ConfigError(fmt::format("backend instance URL must start with http:// or https://, got '{}'", backend.instance_url));
                }
                if (backend.timeout == 0) {
                    throw core::ConfigError("backend timeout must be positive");
                }
                if (backend.max_attempts == 0) {
                    throw core::ConfigError("backend max_attempts must be at least 1");
                }
                if (backend.pool_size == 0) {
                    throw core::ConfigError("backend pool_size must be at least 1");
                }
                if (!server.enable_http && !server.enable_stdio) {
                    throw core::ConfigError("no transport enabled (enable_http and enable_stdio are both off)");
                }
                if (server.worker_threads == 0 || server.io_threads == 0) {
                    throw core::ConfigError("worker_threads and io_threads must be at least 1");
                }
                if (catalog.default_package.empty()) {
                    throw core::ConfigError("catalog default_package is empty");
                }
            }
        };

        /**
 * Write a commented default file at @p config_file unless one with content exists
 */
        inline void initialize_default_config(const std::string &config_file) {
            try {
                if (std::filesystem::exists(config_file) && std::filesystem::file_size(config_file) > 0) {
                    return;
                }

                inicpp::IniManager ini(config_file);
                TICKETMCP_INFO("Creating default config file: {}", config_file);

                // [server]
                ini.set("server", "ip", "127.0.0.1");
                ini.set("server", "http_port", 8080);
                ini.set("server", "enable_http", 1);
                ini.set("server", "enable_stdio", 0);
                ini.set("server", "worker_threads", 8);
                ini.set("server", "io_threads", 2);
                ini.set("server", "log_level", "info");
                ini.set("server", "log_path", "logs/ticketmcp.log");
                ini.set("server", "max_file_size", 10485760);
                ini.set("server", "max_files", 10);
                ini.set("server", "max_requests_per_second", 100);
                ini.set("server", "max_concurrent_requests", 1000);
                ini.set("server", "max_request_size", 1024 * 1024);

                // [session]
                ini.set("session", "idle_timeout", 300);
                ini.set("session", "sweep_interval", 30);
                ini.set("session", "heartbeat_interval", 15);
                ini.set("session", "drain_grace_period", 10);
                ini.set("session", "strict_arguments", 1);

                // [catalog]
                ini.set("catalog", "file", "config/tool_catalog.json");
                ini.set("catalog", "default_package", "full");

                // [backend]
                ini.set("backend", "instance_url", "");
                ini.set("backend", "auth_type", "basic");
                ini.set("backend", "username", "");
                ini.set("backend", "password", "");
                ini.set("backend", "api_key_header", "X-ServiceNow-API-Key");
                ini.set("backend", "timeout", 30);
                ini.set("backend", "max_attempts", 3);
                ini.set("backend", "initial_backoff_ms", 200);
                ini.set("backend", "max_backoff_ms", 5000);
                ini.set("backend", "pool_size", 8);

                // [health]
                ini.set("health", "probe_timeout", 5);
                ini.set("health", "probe_interval", 30);

                // [auth]
                ini.set("auth", "mode", "none");
                ini.set("auth", "keys_file", ".env.auth");

                ini.setComment("server", "ip", "IP address the HTTP listener binds to");
                ini.setComment("server", "http_port", "HTTP port for /sse, /messages, /health and the REST routes");
                ini.setComment("server", "enable_http", "Enable HTTP transport (1=enable, 0=disable)");
                ini.setComment("server", "enable_stdio", "Enable stdio transport (1=enable, 0=disable)");
                ini.setComment("server", "worker_threads", "Threads running tool calls against the backend");
                ini.setComment("server", "io_threads", "Threads serving connections");
                ini.setComment("server", "log_level", "Logging severity (trace, debug, info, warn, error)");
                ini.setComment("server", "log_path", "Filesystem path for log storage");
                ini.setComment("server", "max_file_size", "Maximum size per log file in bytes");
                ini.setComment("server", "max_files", "Maximum number of rotated log files");
                ini.setComment("server", "max_requests_per_second", "Rate limiter: maximum requests allowed per second");
                ini.setComment("server", "max_concurrent_requests", "Rate limiter: maximum concurrent requests");
                ini.setComment("server", "max_request_size", "Rate limiter: maximum request size in bytes");

                ini.setComment("session", "idle_timeout", "Seconds without traffic before a session is closed");
                ini.setComment("session", "sweep_interval", "Seconds between idle session sweeps");
                ini.setComment("session", "heartbeat_interval", "Seconds between heartbeat events on open streams");
                ini.setComment("session", "drain_grace_period", "Seconds in-flight calls may finish during shutdown");
                ini.setComment("session", "strict_arguments", "Reject undeclared tool arguments (1) or ignore them (0)");

                ini.setComment("catalog", "file", "Tool catalog JSON (TOOL_PACKAGE_CONFIG_PATH overrides)");
                ini.setComment("catalog", "default_package", "Package used when a client names none (MCP_TOOL_PACKAGE overrides)");

                ini.setComment("backend", "instance_url", "Ticketing instance base URL, e.g. https://example.service-now.com");
                ini.setComment("backend", "auth_type", "basic, oauth or api_key");
                ini.setComment("backend", "timeout", "Per request timeout in seconds");
                ini.setComment("backend", "max_attempts", "Attempts for rate limited or unavailable responses");

                ini.setComment("health", "probe_timeout", "Seconds the readiness probe waits for the backend");
                ini.setComment("health", "probe_interval", "Seconds between background reachability probes");

                ini.setComment("auth", "mode", "Caller identity (none, trusted-header, X-API-Key, Bearer)");
                ini.setComment("auth", "keys_file", "Accepted keys, one per line, for X-API-Key and Bearer");

                // Root section configuration
                ini.set("title", "Ticket MCP Server Configuration");
                ini.setComment("title", "Auto-generated configuration file");
                ini.parse();

                TICKETMCP_INFO("Default config created successfully");
            } catch (const std::exception &e) {
                TICKETMCP_ERROR("Failed to initialize default config: {}", e.what());
                throw;
            }
        }

        inline void print_config(const GlobalConfig &config) {
            TICKETMCP_DEBUG("===== Ticket MCP Configuration =====");
            TICKETMCP_DEBUG("Title: {}", config.title);
            TICKETMCP_DEBUG("Listen: {}:{} (http {}, stdio {})", config.server.ip, config.server.http_port,
                            config.server.enable_http ? "on" : "off", config.server.enable_stdio ? "on" : "off");
            TICKETMCP_DEBUG("Log Level: {}", config.server.log_level);
            TICKETMCP_DEBUG("Threads: io {}, worker {}", config.server.io_threads, config.server.worker_threads);
            TICKETMCP_DEBUG("Max Requests/sec: {}", config.server.max_requests_per_second);
            TICKETMCP_DEBUG("Session idle timeout: {}s, grace period: {}s", config.session.idle_timeout, config.session.drain_grace_period);
            TICKETMCP_DEBUG("Catalog: {} (default package '{}')", config.catalog.file, config.catalog.default_package);
            TICKETMCP_DEBUG("Backend: {} ({})", config.backend.instance_url, config.backend.auth_type);
            TICKETMCP_DEBUG("Auth Mode: {}", config.auth.mode);
            for (const auto &[role, packages]: config.package_policy) {
                TICKETMCP_DEBUG("Policy: {} -> {}", role, packages);
            }
            TICKETMCP_DEBUG("====================================");
        }

    }// namespace config
}// namespace ticketmcp

#endif// TICKETMCP_CONFIG_HPP
