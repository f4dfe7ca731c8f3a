#include "server.h"
#include "core/errors.h"
#include "core/logger.h"
#include "transport/rest_facade.h"
#include <thread>


namespace ticketmcp::core {

    namespace {
        constexpr auto kShutdownPollInterval = std::chrono::milliseconds(100);
    }

    TicketServer::TicketServer() : signals_(io_context_, SIGINT, SIGTERM) {}

    TicketServer::~TicketServer() {
        if (task_pool_) {
            task_pool_->stop();
            task_pool_->join();
        }
        if (io_pool_) {
            io_pool_->Stop();
        }
    }

    TicketServer::Builder::Builder() {
        server_ = std::unique_ptr<TicketServer>(new TicketServer());
    }

    std::unique_ptr<TicketServer> TicketServer::Builder::build() {
        if (!catalog_) {
            throw ConfigError("server built without a tool catalog");
        }
        if (!backend_) {
            throw ConfigError("server built without a backend");
        }
        if (!catalog_->has_package(default_package_)) {
            throw ConfigError(fmt::format("default package '{}' is not defined in the catalog", default_package_));
        }

        server_->address_ = address_;
        server_->port_ = port_;
        server_->task_pool_ = std::make_unique<asio::thread_pool>(worker_threads_);
        server_->io_pool_ = std::make_unique<IoContextPool>(io_threads_);

        server_->registry_ = std::make_shared<session::SessionRegistry>(catalog_, policy_);
        server_->engine_ = std::make_shared<business::DispatchEngine>(catalog_, backend_, dispatch_options_);
        server_->health_ = std::make_shared<health::HealthMonitor>(backend_, probe_timeout_);
        server_->health_->set_session_counter([registry = std::weak_ptr<session::SessionRegistry>(server_->registry_)]() -> size_t {
            auto locked = registry.lock();
            return locked ? locked->size() : 0;
        });

        // tool calls block on the backend, so they leave the IO threads
        business::TaskRunner run_task = [pool = server_->task_pool_.get()](std::function<void()> task) {
            asio::post(*pool, std::move(task));
        };
        server_->request_handler_ = std::make_shared<business::RequestHandler>(
                server_->registry_, server_->engine_, run_task, default_package_);

        if (enable_http_transport_) {
            server_->manager_ = std::make_shared<transport::TransportManager>(
                    server_->io_context_, server_->task_pool_->get_executor(),
                    server_->registry_, server_->request_handler_, server_->health_, transport_options_);
            auto rest = std::make_shared<transport::RestFacade>(server_->engine_, default_package_, policy_);
            server_->http_handler_ = std::make_shared<transport::HttpHandler>(
                    server_->manager_, rest, server_->health_, auth_manager_);
        }

        if (enable_stdio_transport_) {
            server_->stdio_transport_ = std::make_shared<transport::StdioTransport>(
                    server_->request_handler_, server_->registry_);
        }

        std::string packages;
        for (const auto &name: catalog_->package_names()) {
            packages += packages.empty() ? name : ", " + name;
        }
        TICKETMCP_INFO("Catalog: {} tool(s), packages [{}], default '{}'", catalog_->tool_count(), packages, default_package_);
        if (!enable_http_transport_ && !enable_stdio_transport_) {
            TICKETMCP_WARN("No transports enabled. Server will not be able to receive messages.");
        }
        return std::move(server_);
    }

    bool TicketServer::start_http_transport() {
        try {
            http_transport_ = std::make_unique<transport::HttpTransport>(address_, port_, *io_pool_, http_handler_);
            auto success = http_transport_->start();
            if (success) {
                TICKETMCP_INFO("HTTP Transport started on {}:{}", address_, http_transport_->port());
            } else {
                TICKETMCP_ERROR("Failed to start HTTP Transport on {}:{}", address_, port_);
            }
            return success;
        } catch (const std::exception &e) {
            TICKETMCP_ERROR("Exception when starting HTTP Transport: {}", e.what());
            http_transport_.reset();
            return false;
        }
    }

    bool TicketServer::start_stdio_transport() {
        try {
            // input ended or the client sent shutdown: the whole server drains
            bool success = stdio_transport_->open([this]() {
                shutdown("stdio client finished");
            });
            if (success) {
                TICKETMCP_INFO("STDIO Transport started");
            } else {
                TICKETMCP_ERROR("Failed to start STDIO Transport");
            }
            return success;
        } catch (const std::exception &e) {
            TICKETMCP_ERROR("Exception when starting STDIO Transport: {}", e.what());
            return false;
        }
    }

    bool TicketServer::run() {
        bool any_started = false;

        if (http_handler_) {
            manager_->start();
            if (start_http_transport()) {
                any_started = true;
            } else {
                manager_->stop();
            }
        }
        if (stdio_transport_ && start_stdio_transport()) {
            any_started = true;
        }
        if (!any_started) {
            TICKETMCP_CRITICAL("No transport could be started");
            stop_components();
            return false;
        }
        health_->set_serving(true);

        signals_.async_wait([this](const asio::error_code &error, int signal_number) {
            if (!error) {
                TICKETMCP_INFO("Received signal {}, initiating graceful shutdown...", signal_number);
                begin_shutdown(fmt::format("signal {}", signal_number));
            }
        });

        TICKETMCP_INFO("Ticket MCP server is ready.");
        io_context_.run();
        return true;
    }

    void TicketServer::shutdown(const std::string &reason) {
        asio::post(io_context_, [this, reason]() { begin_shutdown(reason); });
    }

    unsigned short TicketServer::http_port() const {
        return http_transport_ ? http_transport_->port() : 0;
    }

    void TicketServer::begin_shutdown(const std::string &reason) {
        if (shutting_down_.exchange(true)) {
            return;
        }
        TICKETMCP_INFO("Shutting down: {}", reason);
        health_->set_serving(false);
        if (manager_) {
            manager_->drain_all(reason);
        }
        asio::co_spawn(io_context_, drain_and_stop(), asio::detached);
    }

    asio::awaitable<void> TicketServer::drain_and_stop() {
        auto grace = manager_ ? manager_->options().drain_grace_period : std::chrono::seconds(10);
        auto deadline = std::chrono::steady_clock::now() + grace + std::chrono::seconds(1);
        asio::steady_timer timer(io_context_);

        while (std::chrono::steady_clock::now() < deadline) {
            bool streams_done = !manager_ || manager_->connection_count() == 0;
            bool stdio_done = !stdio_transport_ || stdio_transport_->in_flight() == 0;
            if (streams_done && stdio_done) {
                break;
            }
            timer.expires_after(kShutdownPollInterval);
            asio::error_code ec;
            co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        }

        if (stdio_transport_ && stdio_transport_->in_flight() > 0) {
            TICKETMCP_WARN("{} stdio call(s) still in flight at shutdown; their results will be dropped",
                           stdio_transport_->in_flight());
        }
        stop_components();
        co_return;
    }

    void TicketServer::stop_components() {
        if (stdio_transport_) {
            stdio_transport_->close();
        }
        if (http_transport_) {
            http_transport_->stop();
        }
        if (manager_) {
            manager_->stop();
        }
        signals_.cancel();
        if (io_pool_) {
            io_pool_->Stop();
        }
        if (task_pool_) {
            // running calls finish; their results are dropped since their sessions are closed
            task_pool_->stop();
            task_pool_->join();
        }
        io_context_.stop();
        TICKETMCP_INFO("Server stopped");
    }

}// namespace ticketmcp::core
