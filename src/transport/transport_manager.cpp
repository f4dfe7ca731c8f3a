#include "transport_manager.h"
#include "core/logger.h"
#include "metrics/rate_limiter.h"
#include "protocol/frames.h"
#include <vector>

using asio::use_awaitable;

namespace ticketmcp::transport {

    namespace {
        constexpr auto kDrainPollInterval = std::chrono::milliseconds(100);

        int64_t unix_millis() {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                    .count();
        }
    }// namespace

    TransportManager::TransportManager(asio::io_context &control_context,
                                       asio::any_io_executor worker_executor,
                                       std::shared_ptr<session::SessionRegistry> registry,
                                       std::shared_ptr<business::RequestHandler> request_handler,
                                       std::shared_ptr<health::HealthMonitor> health,
                                       TransportOptions options)
        : control_context_(control_context),
          worker_executor_(std::move(worker_executor)),
          registry_(std::move(registry)),
          request_handler_(std::move(request_handler)),
          health_(std::move(health)),
          options_(options),
          heartbeat_timer_(control_context),
          sweep_timer_(control_context),
          probe_timer_(control_context) {}

    void TransportManager::start() {
        std::weak_ptr<TransportManager> weak = weak_from_this();

        registry_->set_disconnect_listener([weak](const std::string &session_id, const std::string &connection_id) {
            if (auto self = weak.lock()) {
                self->on_session_swept(session_id, connection_id);
            }
        });

        if (health_) {
            health_->add_listener([weak](bool reachable, const std::string &detail) {
                if (auto self = weak.lock()) {
                    nlohmann::json event = {{"reachable", reachable}};
                    if (!detail.empty()) {
                        event["detail"] = detail;
                    }
                    self->broadcast_event(protocol::event_type::BACKEND_REACHABILITY, event);
                }
            });
        }

        running_ = true;
        auto self = shared_from_this();
        asio::co_spawn(control_context_, [self]() { return self->heartbeat_loop(); }, asio::detached);
        asio::co_spawn(control_context_, [self]() { return self->sweep_loop(); }, asio::detached);
        if (health_) {
            asio::co_spawn(control_context_, [self]() { return self->probe_loop(); }, asio::detached);
        }
        TICKETMCP_INFO("Transport manager started (heartbeat {}s, idle timeout {}s, probe {}s)",
                       options_.heartbeat_interval.count(), options_.idle_timeout.count(),
                       options_.probe_interval.count());
    }

    void TransportManager::stop() {
        running_ = false;
        asio::post(control_context_, [self = shared_from_this()]() {
            self->heartbeat_timer_.cancel();
            self->sweep_timer_.cancel();
            self->probe_timer_.cancel();
        });
    }

    ConnectionPtr TransportManager::open_stream(std::shared_ptr<Channel> channel, auth::CallerIdentity identity) {
        auto connection = std::make_shared<Connection>(channel->get_channel_id(), channel, std::move(identity));
        std::weak_ptr<TransportManager> weak = weak_from_this();
        std::weak_ptr<Connection> weak_connection = connection;

        connection->set_closed_handler([weak](Connection &closed) {
            if (auto self = weak.lock()) {
                self->on_connection_closed(closed);
            }
        });
        connection->set_drain_handler([weak](const ConnectionPtr &target) {
            if (auto self = weak.lock()) {
                self->begin_drain(target, "client requested shutdown");
            }
        });
        // Abrupt loss: the read side ended, nothing left to flush
        channel->set_close_handler([weak_connection](const std::string &) {
            if (auto target = weak_connection.lock()) {
                target->close(false);
            }
        });

        {
            std::unique_lock lock(mutex_);
            connections_[connection->connection_id()] = connection;
        }

        connection->start();
        connection->post_frame(protocol::format_sse("endpoint", "/messages?session_id=" + connection->connection_id()));
        connection->advance(ConnectionState::Handshaking);
        TICKETMCP_INFO("Stream {} opened from {} (caller '{}')", connection->connection_id(),
                       channel->get_remote_address(), connection->identity().subject);
        return connection;
    }

    ConnectionPtr TransportManager::find(const std::string &id) const {
        std::shared_lock lock(mutex_);
        auto it = connections_.find(id);
        if (it != connections_.end()) {
            return it->second;
        }
        for (const auto &[_, connection]: connections_) {
            auto session = connection->session();
            if (session && session->id() == id) {
                return connection;
            }
        }
        return nullptr;
    }

    size_t TransportManager::connection_count() const {
        std::shared_lock lock(mutex_);
        return connections_.size();
    }

    void TransportManager::on_connection_closed(Connection &connection) {
        {
            std::unique_lock lock(mutex_);
            connections_.erase(connection.connection_id());
        }
        if (auto session = connection.session()) {
            registry_->close(session->id());
        }
        metrics::RateLimiter::getInstance()->forget(connection.connection_id());
        TICKETMCP_INFO("Stream {} closed", connection.connection_id());
    }

    void TransportManager::on_session_swept(const std::string &session_id, const std::string &connection_id) {
        auto connection = find(connection_id);
        if (!connection) {
            return;
        }
        TICKETMCP_INFO("Session {} idle, closing stream {}", session_id, connection_id);
        connection->advance(ConnectionState::Draining);
        connection->send_event(protocol::event_type::SESSION_CLOSING, {{"reason", "idle timeout"}, {"session_id", session_id}});
        connection->close(true);
    }

    void TransportManager::begin_drain(const ConnectionPtr &connection, const std::string &reason) {
        if (!connection->advance(ConnectionState::Draining)) {
            if (connection->state() == ConnectionState::Connecting) {
                connection->close(false);
            }
            return;
        }
        nlohmann::json detail = {{"reason", reason}, {"grace_period_s", options_.drain_grace_period.count()}};
        if (auto session = connection->session()) {
            detail["session_id"] = session->id();
        }
        connection->send_event(protocol::event_type::SESSION_CLOSING, detail);
        TICKETMCP_INFO("Draining stream {}: {}", connection->connection_id(), reason);
        asio::co_spawn(control_context_, [self = shared_from_this(), connection]() { return self->drain_connection(connection); }, asio::detached);
    }

    void TransportManager::drain_all(const std::string &reason) {
        accepting_ = false;
        if (health_) {
            health_->set_serving(false);
        }
        std::vector<ConnectionPtr> open;
        {
            std::shared_lock lock(mutex_);
            for (const auto &[_, connection]: connections_) {
                open.push_back(connection);
            }
        }
        TICKETMCP_INFO("Draining {} stream(s): {}", open.size(), reason);
        for (const auto &connection: open) {
            begin_drain(connection, reason);
        }
    }

    void TransportManager::broadcast_event(const std::string &type, const nlohmann::json &detail) {
        std::vector<ConnectionPtr> open;
        {
            std::shared_lock lock(mutex_);
            for (const auto &[_, connection]: connections_) {
                open.push_back(connection);
            }
        }
        for (const auto &connection: open) {
            connection->send_event(type, detail);
        }
        TICKETMCP_TRACE("Broadcast {} to {} stream(s)", type, open.size());
    }

    size_t TransportManager::sweep_once() {
        // Sessions first; the registry calls back on_session_swept for each one it closes
        size_t closed = registry_->sweep_idle(options_.idle_timeout).size();

        // Streams that never completed the handshake have no session to expire
        std::vector<ConnectionPtr> stale;
        auto cutoff = std::chrono::steady_clock::now() - options_.idle_timeout;
        {
            std::shared_lock lock(mutex_);
            for (const auto &[_, connection]: connections_) {
                if (connection->state() == ConnectionState::Handshaking && connection->opened_at() < cutoff) {
                    stale.push_back(connection);
                }
            }
        }
        for (const auto &connection: stale) {
            TICKETMCP_INFO("Stream {} never initialized, closing", connection->connection_id());
            connection->send_event(protocol::event_type::SESSION_CLOSING, {{"reason", "handshake timeout"}});
            connection->close(true);
        }
        return closed + stale.size();
    }

    asio::awaitable<void> TransportManager::heartbeat_loop() {
        while (running_) {
            heartbeat_timer_.expires_after(options_.heartbeat_interval);
            asio::error_code ec;
            co_await heartbeat_timer_.async_wait(asio::redirect_error(use_awaitable, ec));
            if (ec || !running_) {
                break;
            }
            broadcast_event(protocol::event_type::HEARTBEAT, {{"timestamp_ms", unix_millis()}});
        }
        co_return;
    }

    asio::awaitable<void> TransportManager::sweep_loop() {
        while (running_) {
            sweep_timer_.expires_after(options_.sweep_interval);
            asio::error_code ec;
            co_await sweep_timer_.async_wait(asio::redirect_error(use_awaitable, ec));
            if (ec || !running_) {
                break;
            }
            try {
                auto closed = sweep_once();
                if (closed > 0) {
                    TICKETMCP_DEBUG("Idle sweep closed {} stream(s)", closed);
                }
            } catch (const std::exception &e) {
                TICKETMCP_ERROR("Idle sweep failed: {}", e.what());
            }
        }
        co_return;
    }

    asio::awaitable<void> TransportManager::probe_loop() {
        while (running_) {
            // ping blocks, so it runs on the worker pool; listeners fire from there
            co_await asio::co_spawn(worker_executor_, [health = health_]() -> asio::awaitable<void> {
                    health->readiness();
                    co_return; }, use_awaitable);

            probe_timer_.expires_after(options_.probe_interval);
            asio::error_code ec;
            co_await probe_timer_.async_wait(asio::redirect_error(use_awaitable, ec));
            if (ec) {
                break;
            }
        }
        co_return;
    }

    asio::awaitable<void> TransportManager::drain_connection(ConnectionPtr connection) {
        auto deadline = std::chrono::steady_clock::now() + options_.drain_grace_period;
        asio::steady_timer timer(control_context_);

        while (std::chrono::steady_clock::now() < deadline && connection->state() != ConnectionState::Closed) {
            auto session = connection->session();
            if (!session || session->in_flight_count() == 0) {
                break;
            }
            timer.expires_after(kDrainPollInterval);
            asio::error_code ec;
            co_await timer.async_wait(asio::redirect_error(use_awaitable, ec));
        }

        if (auto session = connection->session(); session && session->in_flight_count() > 0) {
            TICKETMCP_WARN("Stream {} closing with {} call(s) still in flight; their results will be dropped",
                           connection->connection_id(), session->in_flight_count());
        }
        connection->close(true);
        co_return;
    }

}// namespace ticketmcp::transport
