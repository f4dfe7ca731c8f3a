#include "Auth/AuthManager.hpp"
#include "Auth/package_policy.h"
#include "args.hxx"
#include "backend/credentials.h"
#include "backend/http_executor.h"
#include "backend/retry_policy.h"
#include "backend/servicenow_client.h"
#include "catalog/tool_catalog.h"
#include "config/config.hpp"// Configuration management using INI file
#include "core/errors.h"
#include "core/logger.h"
#include "core/server.h"
#include "metrics/metrics_manager.h"
#include "metrics/performance_metrics.h"
#include "metrics/rate_limiter.h"
#include "utils/auth_utils.h"
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace {

    struct CommandLine {
        std::string config_path;
        std::optional<std::string> host;
        std::optional<unsigned short> port;
        std::optional<std::string> package;
        bool stdio = false;
        bool debug = false;
    };

    /// Returns nullopt when the process should exit (help shown or bad arguments); @p exit_code says how.
    std::optional<CommandLine> parse_command_line(int argc, char *argv[], int &exit_code) {
        args::ArgumentParser parser("Ticket MCP Server",
                                    "Serves incident tools to MCP clients over HTTP+SSE or stdio.");
        parser.Prog(argv[0]);

        args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});
        args::ValueFlag<std::string> config_path(parser, "PATH", "Config file path (default: $TICKETMCP_CONFIG or config.ini)", {"config"});
        args::ValueFlag<std::string> host(parser, "HOST", "Address the HTTP listener binds to", {"host"});
        args::ValueFlag<unsigned short> port(parser, "PORT", "HTTP listener port", {"port"});
        args::ValueFlag<std::string> package(parser, "PACKAGE", "Default tool package", {"package"});
        args::Flag stdio(parser, "stdio", "Serve a single client over stdin/stdout instead of HTTP", {"stdio"});
        args::Flag debug(parser, "debug", "Enable debug logging", {"debug"});

        try {
            parser.ParseCLI(argc, argv);
        } catch (const args::Help &) {
            std::cout << parser;
            exit_code = 0;
            return std::nullopt;
        } catch (const args::ParseError &e) {
            std::cerr << "Error parsing command line: " << e.what() << std::endl;
            std::cerr << parser;
            exit_code = 1;
            return std::nullopt;
        } catch (const args::ValidationError &e) {
            std::cerr << "Validation error: " << e.what() << std::endl;
            std::cerr << parser;
            exit_code = 1;
            return std::nullopt;
        }

        CommandLine cli;
        if (config_path) {
            cli.config_path = args::get(config_path);
        }
        if (host) {
            cli.host = args::get(host);
        }
        if (port) {
            cli.port = args::get(port);
        }
        if (package) {
            cli.package = args::get(package);
        }
        cli.stdio = args::get(stdio);
        cli.debug = args::get(debug);
        return cli;
    }

    /// INI, then environment, then command line.
    ticketmcp::config::GlobalConfig load_configuration(const CommandLine &cli) {
        auto path = ticketmcp::config::resolve_config_path(cli.config_path);
        ticketmcp::config::initialize_default_config(path);

        auto config = ticketmcp::config::GlobalConfig::load(path);
        config.apply_environment();

        if (cli.host) {
            config.server.ip = *cli.host;
        }
        if (cli.port) {
            config.server.http_port = *cli.port;
        }
        if (cli.package) {
            config.catalog.default_package = *cli.package;
        }
        if (cli.stdio) {
            config.server.enable_stdio = true;
            config.server.enable_http = false;
        }
        if (cli.debug) {
            config.server.log_level = "debug";
        }

        config.validate();
        return config;
    }

    std::shared_ptr<ticketmcp::backend::ServiceNowClient> make_backend(const ticketmcp::config::BackendConfig &config) {
        using namespace ticketmcp::backend;

        auto auth_type = auth_type_from_string(config.auth_type);
        if (!auth_type) {
            throw ticketmcp::core::ConfigError(fmt::format("unknown backend auth_type '{}' (expected basic, oauth or api_key)", config.auth_type));
        }

        CredentialConfig credentials;
        credentials.type = *auth_type;
        credentials.username = config.username;
        credentials.password = config.password;
        credentials.client_id = config.client_id;
        credentials.client_secret = config.client_secret;
        credentials.token_url = config.token_url;
        credentials.api_key = config.api_key;
        credentials.api_key_header = config.api_key_header;

        std::chrono::milliseconds timeout(std::chrono::seconds(config.timeout));
        auto executor = std::make_shared<HttplibExecutor>(config.instance_url, config.pool_size);
        auto provider = make_credential_provider(credentials, executor, timeout);

        RetryConfig retry;
        retry.max_attempts = static_cast<int>(config.max_attempts);
        retry.initial_backoff = std::chrono::milliseconds(config.initial_backoff_ms);
        retry.max_backoff = std::chrono::milliseconds(config.max_backoff_ms);

        ServiceNowConfig client_config;
        client_config.timeout = timeout;

        TICKETMCP_INFO("Backend: {} (auth {})", config.instance_url, to_string(*auth_type));
        return std::make_shared<ServiceNowClient>(client_config, executor, provider, RetryPolicy(retry));
    }

    std::shared_ptr<ticketmcp::auth::AuthManagerBase> make_auth(const ticketmcp::config::AuthConfig &config) {
        std::vector<std::string> keys;
        if (config.mode == "X-API-Key" || config.mode == "Bearer") {
            keys = ticketmcp::utils::load_auth_keys_from_file(config.keys_file);
            if (keys.empty()) {
                TICKETMCP_WARN("Authentication mode {} has no keys loaded from {}; every caller will be refused",
                               config.mode, config.keys_file);
            }
        }
        auto manager = ticketmcp::auth::make_auth_manager(config.mode, std::move(keys));
        if (!manager) {
            throw ticketmcp::core::ConfigError(fmt::format("unknown auth mode '{}'", config.mode));
        }
        TICKETMCP_DEBUG("Caller identity mode: {}", manager->type());
        return manager;
    }

    void configure_metrics(const ticketmcp::config::ServerConfig &config) {
        ticketmcp::metrics::MetricsManager::getInstance()->set_performance_callback([](
                                                                                           const ticketmcp::metrics::TrackedHttpRequest &request,
                                                                                           const ticketmcp::metrics::PerformanceMetrics &metrics,
                                                                                           const std::string &connection_id) {
            TICKETMCP_DEBUG("Performance - Connection: {}, Method: {}, Target: {}, Duration: {:.2f}ms",
                            connection_id,
                            request.method,
                            request.target,
                            metrics.duration_ms());
        });

        auto rate_limiter = ticketmcp::metrics::RateLimiter::getInstance();
        ticketmcp::metrics::RateLimitConfig rate_limit_config;
        rate_limit_config.max_requests_per_second = config.max_requests_per_second;
        rate_limit_config.max_concurrent_requests = config.max_concurrent_requests;
        rate_limit_config.max_request_size = config.max_request_size;
        rate_limiter->set_config(rate_limit_config);

        rate_limiter->set_rate_limit_callback([](
                                                      const std::string &connection_id,
                                                      ticketmcp::metrics::RateLimitDecision decision) {
            switch (decision) {
                case ticketmcp::metrics::RateLimitDecision::ALLOW:
                    break;
                case ticketmcp::metrics::RateLimitDecision::RATE_LIMITED:
                    TICKETMCP_WARN("Request rate limited - Connection: {}", connection_id);
                    break;
                case ticketmcp::metrics::RateLimitDecision::TOO_LARGE:
                    TICKETMCP_WARN("Request too large - Connection: {}", connection_id);
                    break;
            }
        });
    }

}// namespace

/**
 * Entry point of the ticket MCP server.
 * Loads configuration, sets up logging, loads the tool catalog, connects the backend and
 * serves until a signal or the stdio client ends the process.
 *
 * @return 0 after a clean shutdown, 1 on a startup error.
 */
int main(int argc, char *argv[]) {
    int exit_code = 0;
    auto cli = parse_command_line(argc, argv, exit_code);
    if (!cli) {
        return exit_code;
    }

    ticketmcp::config::GlobalConfig config;
    try {
        config = load_configuration(*cli);
    } catch (const std::exception &e) {
        // no logger yet; a console-only one carries the fatal message
        ticketmcp::core::initializeAsyncLogger("", "info", 0, 0, true);
        TICKETMCP_CRITICAL("Configuration error: {}", e.what());
        ticketmcp::core::shutdownLogger();
        return 1;
    }

    // stdout carries protocol frames in stdio mode
    ticketmcp::core::initializeAsyncLogger(
            config.server.log_path,
            config.server.log_level,
            config.server.max_file_size,
            config.server.max_files,
            config.server.enable_stdio);
    TICKETMCP_INFO("Starting Ticket MCP Server");
    ticketmcp::config::print_config(config);

    int result = 0;
    try {
        configure_metrics(config.server);

        auto backend = make_backend(config.backend);
        auto catalog = ticketmcp::catalog::ToolCatalog::load_file(
                config.catalog.file,
                [&backend](const std::string &operation) { return backend->supports(operation); });

        ticketmcp::auth::PackagePolicy policy;
        for (const auto &[role, packages]: config.package_policy) {
            policy.allow_csv(role, packages);
        }

        ticketmcp::business::DispatchOptions dispatch_options;
        dispatch_options.strict_arguments = config.session.strict_arguments;

        ticketmcp::transport::TransportOptions transport_options;
        transport_options.idle_timeout = std::chrono::seconds(config.session.idle_timeout);
        transport_options.sweep_interval = std::chrono::seconds(config.session.sweep_interval);
        transport_options.heartbeat_interval = std::chrono::seconds(config.session.heartbeat_interval);
        transport_options.drain_grace_period = std::chrono::seconds(config.session.drain_grace_period);
        transport_options.probe_interval = std::chrono::seconds(config.health.probe_interval);

        auto server = ticketmcp::core::TicketServer::Builder{}
                              .with_catalog(catalog)
                              .with_backend(backend)
                              .with_default_package(config.catalog.default_package)
                              .with_package_policy(policy)
                              .with_auth_manager(make_auth(config.auth))
                              .with_dispatch_options(dispatch_options)
                              .with_transport_options(transport_options)
                              .with_probe_timeout(std::chrono::seconds(config.health.probe_timeout))
                              .with_threads(config.server.io_threads, config.server.worker_threads)
                              .with_address(config.server.ip)
                              .with_port(config.server.http_port)
                              .enableHttpTransport(config.server.enable_http)
                              .enableStdioTransport(config.server.enable_stdio)
                              .build();

        // Blocks until a signal or the stdio client ends the server
        if (!server->run()) {
            result = 1;
        } else {
            TICKETMCP_INFO("Server shutdown complete.");
        }
    } catch (const ticketmcp::catalog::CatalogError &e) {
        TICKETMCP_CRITICAL("Tool catalog error: {}", e.what());
        result = 1;
    } catch (const ticketmcp::core::ConfigError &e) {
        TICKETMCP_CRITICAL("Configuration error: {}", e.what());
        result = 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        TICKETMCP_CRITICAL("Server error: {}", e.what());
        result = 1;
    }

    ticketmcp::core::shutdownLogger();
    return result;
}
