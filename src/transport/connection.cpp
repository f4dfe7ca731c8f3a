#include "connection.h"
#include "core/logger.h"
#include "protocol/frames.h"

using asio::use_awaitable;

namespace ticketmcp::transport {

    Connection::Connection(std::string id, std::shared_ptr<Channel> channel, auth::CallerIdentity identity)
        : id_(std::move(id)),
          channel_(std::move(channel)),
          identity_(std::move(identity)),
          opened_at_(std::chrono::steady_clock::now()),
          signal_(channel_->get_executor()) {
        signal_.expires_at(asio::steady_timer::time_point::max());
    }

    session::SessionPtr Connection::session() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return session_;
    }

    void Connection::bind_session(session::SessionPtr session) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            session_ = std::move(session);
        }
        advance(ConnectionState::Active);
    }

    bool Connection::draining() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_ == ConnectionState::Draining || state_ == ConnectionState::Closed;
    }

    void Connection::request_drain() {
        DrainHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = drain_handler_;
        }
        if (handler) {
            handler(shared_from_this());
        } else {
            advance(ConnectionState::Draining);
        }
    }

    bool Connection::send(const std::string &message) {
        return post_frame(protocol::format_sse("message", message));
    }

    bool Connection::send_event(const std::string &type, const nlohmann::json &detail) {
        return post_frame(protocol::format_sse("event", protocol::encode_event(type, detail)));
    }

    ConnectionState Connection::state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    bool Connection::can_transition(ConnectionState from, ConnectionState to) {
        if (from == ConnectionState::Closed) {
            return false;
        }
        if (to == ConnectionState::Closed) {
            return true;
        }
        switch (from) {
            case ConnectionState::Connecting:
                return to == ConnectionState::Handshaking;
            case ConnectionState::Handshaking:
                return to == ConnectionState::Active || to == ConnectionState::Draining;
            case ConnectionState::Active:
                return to == ConnectionState::Draining;
            default:
                return false;
        }
    }

    bool Connection::advance(ConnectionState next) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!can_transition(state_, next)) {
            return false;
        }
        TICKETMCP_DEBUG("Connection {}: {} -> {}", id_, to_string(state_), to_string(next));
        state_ = next;
        return true;
    }

    bool Connection::post_frame(std::string frame) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == ConnectionState::Closed) {
                return false;
            }
            queue_.push_back(std::move(frame));
        }
        wake_writer();
        return true;
    }

    void Connection::wake_writer() {
        asio::post(signal_.get_executor(), [self = shared_from_this()]() {
            self->signal_.cancel();
        });
    }

    void Connection::start() {
        asio::co_spawn(channel_->get_executor(), [self = shared_from_this()]() -> asio::awaitable<void> {
                co_await self->write_loop();
                co_return; }, asio::detached);
    }

    asio::awaitable<void> Connection::write_loop() {
        while (true) {
            std::deque<std::string> batch;
            bool closing = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                closing = state_ == ConnectionState::Closed;
                if (!closing || flush_on_close_) {
                    batch.swap(queue_);
                } else {
                    queue_.clear();
                }
            }

            for (const auto &frame: batch) {
                if (channel_->is_closed()) {
                    break;
                }
                co_await channel_->write(frame);
            }

            if (closing || channel_->is_closed()) {
                break;
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!queue_.empty() || state_ == ConnectionState::Closed) {
                    continue;
                }
            }

            // Woken by wake_writer(), which cancels the timer on this executor
            asio::error_code ec;
            signal_.expires_at(asio::steady_timer::time_point::max());
            co_await signal_.async_wait(asio::redirect_error(use_awaitable, ec));
        }

        channel_->close();
        close(false);
        TICKETMCP_DEBUG("Connection {} writer finished", id_);
        co_return;
    }

    void Connection::close(bool flush) {
        ClosedHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == ConnectionState::Closed) {
                return;
            }
            TICKETMCP_DEBUG("Connection {}: {} -> Closed", id_, to_string(state_));
            state_ = ConnectionState::Closed;
            flush_on_close_ = flush;
            if (!flush) {
                queue_.clear();
            }
            handler = std::move(closed_handler_);
            closed_handler_ = nullptr;
        }
        wake_writer();
        if (handler) {
            handler(*this);
        }
    }

    size_t Connection::pending_frames() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    void Connection::set_closed_handler(ClosedHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_handler_ = std::move(handler);
    }

    void Connection::set_drain_handler(DrainHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        drain_handler_ = std::move(handler);
    }

}// namespace ticketmcp::transport
