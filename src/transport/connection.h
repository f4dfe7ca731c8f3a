#pragma once

#include "business/client_context.h"
#include "channel.h"
#include "nlohmann/json.hpp"
#include "transport_types.h"
#include <asio.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace ticketmcp::transport {

    /**
     * @brief One event stream and the session bound to it.
     *
     * Everything destined for the client goes through post_frame(): a single writer
     * coroutine running on the channel's executor drains the queue in order, so results
     * produced on worker threads never touch the socket directly.
     */
    class Connection : public business::ClientContext,
                       public std::enable_shared_from_this<Connection> {
    public:
        using ClosedHandler = std::function<void(Connection &)>;
        using DrainHandler = std::function<void(const std::shared_ptr<Connection> &)>;

        Connection(std::string id, std::shared_ptr<Channel> channel, auth::CallerIdentity identity);

        // ClientContext
        const std::string &connection_id() const override { return id_; }
        const auth::CallerIdentity &identity() const override { return identity_; }
        session::SessionPtr session() const override;
        void bind_session(session::SessionPtr session) override;
        bool draining() const override;
        void request_drain() override;
        bool send(const std::string &message) override;

        ConnectionState state() const;

        /// Forward-only transition. Returns false (and changes nothing) for any other move.
        bool advance(ConnectionState next);
        static bool can_transition(ConnectionState from, ConnectionState to);

        /// Queue a pre-formatted SSE frame. False once the connection is closed.
        bool post_frame(std::string frame);

        /// Queue a notifications/event frame.
        bool send_event(const std::string &type, const nlohmann::json &detail);

        /// Launch the writer on the channel's executor.
        void start();

        /**
         * @brief Move to Closed. With @p flush the writer sends what is already queued
         * before closing the socket; without it the queue is dropped.
         */
        void close(bool flush = false);

        size_t pending_frames() const;
        std::chrono::steady_clock::time_point opened_at() const { return opened_at_; }

        void set_closed_handler(ClosedHandler handler);
        void set_drain_handler(DrainHandler handler);

    private:
        asio::awaitable<void> write_loop();
        void wake_writer();

        const std::string id_;
        std::shared_ptr<Channel> channel_;
        const auth::CallerIdentity identity_;
        const std::chrono::steady_clock::time_point opened_at_;
        asio::steady_timer signal_;

        mutable std::mutex mutex_;
        ConnectionState state_ = ConnectionState::Connecting;
        std::deque<std::string> queue_;
        bool flush_on_close_ = true;
        session::SessionPtr session_;
        ClosedHandler closed_handler_;
        DrainHandler drain_handler_;
    };

    using ConnectionPtr = std::shared_ptr<Connection>;

}// namespace ticketmcp::transport
