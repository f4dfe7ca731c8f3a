#pragma once

#include "business/request_handler.h"
#include "connection.h"
#include "health/health_monitor.h"
#include "session/session_registry.h"
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace ticketmcp::transport {

    struct TransportOptions {
        std::chrono::seconds idle_timeout{300};
        std::chrono::seconds sweep_interval{30};
        std::chrono::seconds heartbeat_interval{15};
        std::chrono::seconds drain_grace_period{10};
        std::chrono::seconds probe_interval{30};
    };

    /**
     * @brief Owns the open event-stream connections and the timers that act on all of them:
     * heartbeats, the idle sweep, the backend probe and draining.
     *
     * Timers run on the control context; blocking work (readiness probes, REST calls) is
     * shipped to the worker executor.
     */
    class TransportManager : public std::enable_shared_from_this<TransportManager> {
    public:
        TransportManager(asio::io_context &control_context,
                         asio::any_io_executor worker_executor,
                         std::shared_ptr<session::SessionRegistry> registry,
                         std::shared_ptr<business::RequestHandler> request_handler,
                         std::shared_ptr<health::HealthMonitor> health,
                         TransportOptions options = {});

        /// Register listeners and launch the periodic timers.
        void start();
        /// Cancel the timers. Connections are left alone; use drain_all() first.
        void stop();

        /**
         * @brief Turn an accepted channel into an event stream and announce its message
         * endpoint. The channel must already have sent the stream's HTTP headers.
         */
        ConnectionPtr open_stream(std::shared_ptr<Channel> channel, auth::CallerIdentity identity);

        /// Look a connection up by connection id, falling back to the bound session id.
        ConnectionPtr find(const std::string &id) const;

        /// Stop taking tool calls on @p connection, then close it after in-flight calls finish or the grace period ends.
        void begin_drain(const ConnectionPtr &connection, const std::string &reason);

        /// Refuse new streams and drain every open connection.
        void drain_all(const std::string &reason);

        void broadcast_event(const std::string &type, const nlohmann::json &detail);

        /// Close idle sessions and stale handshakes now. Returns the number of connections closed.
        size_t sweep_once();

        bool accepting() const { return accepting_; }
        size_t connection_count() const;

        business::RequestHandler &request_handler() { return *request_handler_; }
        asio::any_io_executor worker_executor() const { return worker_executor_; }
        const TransportOptions &options() const { return options_; }

    private:
        void on_connection_closed(Connection &connection);
        void on_session_swept(const std::string &session_id, const std::string &connection_id);

        asio::awaitable<void> heartbeat_loop();
        asio::awaitable<void> sweep_loop();
        asio::awaitable<void> probe_loop();
        asio::awaitable<void> drain_connection(ConnectionPtr connection);

        asio::io_context &control_context_;
        asio::any_io_executor worker_executor_;
        std::shared_ptr<session::SessionRegistry> registry_;
        std::shared_ptr<business::RequestHandler> request_handler_;
        std::shared_ptr<health::HealthMonitor> health_;
        TransportOptions options_;

        std::atomic<bool> accepting_{true};
        std::atomic<bool> running_{false};
        asio::steady_timer heartbeat_timer_;
        asio::steady_timer sweep_timer_;
        asio::steady_timer probe_timer_;

        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, ConnectionPtr> connections_;
    };

}// namespace ticketmcp::transport
