#pragma once
#if defined(_WIN32) && !defined(_WIN32_WINNT)
#define _WIN32_WINNT 0x0601
#endif

#include "Auth/AuthManager.hpp"
#include "Auth/package_policy.h"
#include "backend/record_backend.h"
#include "business/dispatch_engine.h"
#include "business/request_handler.h"
#include "catalog/tool_catalog.h"
#include "core/io_context_pool.hpp"
#include "health/health_monitor.h"
#include "session/session_registry.h"
#include "transport/http_transport.h"
#include "transport/stdio_transport.h"
#include "transport/transport_manager.h"
#include <asio.hpp>
#include <atomic>
#include <memory>
#include <string>


namespace ticketmcp::core {

    class TicketServer {
    public:
        class Builder;

        ~TicketServer();

        /**
         * @brief Start the enabled transports and block until shutdown completes.
         * @return false when no transport could be started
         */
        bool run();

        /// Stop accepting, drain open sessions, then stop. Safe to call from any thread.
        void shutdown(const std::string &reason);

        asio::io_context &get_io_context() { return io_context_; }
        unsigned short http_port() const;

    private:
        TicketServer();
        friend class Builder;

        bool start_http_transport();
        bool start_stdio_transport();
        void begin_shutdown(const std::string &reason);
        asio::awaitable<void> drain_and_stop();
        void stop_components();

        asio::io_context io_context_;
        asio::signal_set signals_;
        std::unique_ptr<asio::thread_pool> task_pool_;
        std::unique_ptr<IoContextPool> io_pool_;

        std::shared_ptr<session::SessionRegistry> registry_;
        std::shared_ptr<const business::DispatchEngine> engine_;
        std::shared_ptr<health::HealthMonitor> health_;
        std::shared_ptr<business::RequestHandler> request_handler_;
        std::shared_ptr<transport::TransportManager> manager_;
        std::shared_ptr<transport::HttpHandler> http_handler_;
        std::unique_ptr<transport::HttpTransport> http_transport_;
        std::shared_ptr<transport::StdioTransport> stdio_transport_;

        std::string address_;
        unsigned short port_ = 0;
        std::atomic<bool> shutting_down_{false};
    };

    class TicketServer::Builder {
    public:
        Builder();

        Builder &with_catalog(catalog::CatalogPtr catalog) {
            catalog_ = std::move(catalog);
            return *this;
        }
        Builder &with_backend(std::shared_ptr<backend::RecordBackend> backend) {
            backend_ = std::move(backend);
            return *this;
        }
        Builder &with_address(const std::string &address = "127.0.0.1") {
            address_ = address;
            return *this;
        };
        Builder &with_port(unsigned short port = 8080) {
            port_ = port;
            return *this;
        }
        Builder &with_default_package(const std::string &package) {
            default_package_ = package;
            return *this;
        }
        Builder &with_auth_manager(std::shared_ptr<auth::AuthManagerBase> auth_manager) {
            auth_manager_ = std::move(auth_manager);
            return *this;
        }
        Builder &with_package_policy(auth::PackagePolicy policy) {
            policy_ = std::move(policy);
            return *this;
        }
        Builder &with_dispatch_options(business::DispatchOptions options) {
            dispatch_options_ = options;
            return *this;
        }
        Builder &with_transport_options(transport::TransportOptions options) {
            transport_options_ = options;
            return *this;
        }
        Builder &with_probe_timeout(std::chrono::milliseconds timeout) {
            probe_timeout_ = timeout;
            return *this;
        }
        Builder &with_threads(size_t io_threads, size_t worker_threads) {
            io_threads_ = io_threads;
            worker_threads_ = worker_threads;
            return *this;
        }
        Builder &enableHttpTransport(bool enable = true) {
            enable_http_transport_ = enable;
            return *this;
        }
        Builder &enableStdioTransport(bool enable = true) {
            enable_stdio_transport_ = enable;
            return *this;
        }

        /// @throws core::ConfigError when the catalog or backend is missing
        std::unique_ptr<TicketServer> build();

    private:
        std::unique_ptr<TicketServer> server_ = nullptr;
        catalog::CatalogPtr catalog_;
        std::shared_ptr<backend::RecordBackend> backend_;
        std::shared_ptr<auth::AuthManagerBase> auth_manager_;
        auth::PackagePolicy policy_;
        business::DispatchOptions dispatch_options_;
        transport::TransportOptions transport_options_;
        std::chrono::milliseconds probe_timeout_{5000};
        std::string default_package_ = "full";
        size_t io_threads_ = 2;
        size_t worker_threads_ = 8;
        bool enable_http_transport_ = false;
        bool enable_stdio_transport_ = false;

        std::string address_ = "127.0.0.1";
        unsigned short port_ = 8080;
    };

}// namespace ticketmcp::core
