// src/transport/stdio_transport.h
#pragma once
#include "business/client_context.h"
#include "business/request_handler.h"
#include "session/session_registry.h"
#include <atomic>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace ticketmcp::transport {

    /**
     * @brief JSON-RPC over stdin/stdout: one message per line, one implicit connection.
     *
     * Replies and events are written as single lines; log output must go to stderr while
     * this transport is active.
     */
    class StdioTransport : public business::ClientContext,
                           public std::enable_shared_from_this<StdioTransport> {
    public:
        using StopCallback = std::function<void()>;

        StdioTransport(std::shared_ptr<business::RequestHandler> handler,
                       std::shared_ptr<session::SessionRegistry> registry,
                       std::istream &in = std::cin, std::ostream &out = std::cout);
        ~StdioTransport() override;

        /// Start the reader thread. @p on_stop runs when input ends or the client asks to shut down.
        bool open(StopCallback on_stop = nullptr);
        /// Release the session; results still in flight are dropped.
        void close();
        size_t in_flight() const;

        /// Process one input line synchronously. Exposed for the reader thread and tests.
        void handle_line(const std::string &line);

        // ClientContext
        const std::string &connection_id() const override { return connection_id_; }
        const auth::CallerIdentity &identity() const override { return identity_; }
        session::SessionPtr session() const override;
        void bind_session(session::SessionPtr session) override;
        /// The single stdio client lives as long as its input; idle time never ends it.
        bool expires_when_idle() const override { return false; }
        bool draining() const override { return draining_; }
        void request_drain() override;
        bool send(const std::string &message) override;

    private:
        void finish();

        std::shared_ptr<business::RequestHandler> handler_;
        std::shared_ptr<session::SessionRegistry> registry_;
        std::istream &in_;
        std::ostream &out_;

        const std::string connection_id_ = "stdio";
        const auth::CallerIdentity identity_{"stdio", "local"};

        mutable std::mutex mutex_;
        session::SessionPtr session_;
        StopCallback on_stop_;
        std::atomic<bool> running_{false};
        std::atomic<bool> draining_{false};
        std::thread reader_;
    };

}// namespace ticketmcp::transport
