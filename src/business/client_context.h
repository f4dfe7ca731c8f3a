#pragma once

#include "Auth/AuthManager.hpp"
#include "session/session.h"
#include <memory>
#include <string>

namespace ticketmcp::business {

    /**
     * @brief What the JSON-RPC layer needs from the peer that sent a message.
     *
     * Implemented by the streaming connection and by the stdio transport. send() must not
     * block on IO; implementations queue the message and return.
     */
    class ClientContext {
    public:
        virtual ~ClientContext() = default;

        virtual const std::string &connection_id() const = 0;
        virtual const auth::CallerIdentity &identity() const = 0;

        /// Session bound by a successful initialize, null before that.
        virtual session::SessionPtr session() const = 0;
        virtual void bind_session(session::SessionPtr session) = 0;

        /// Whether the idle sweep may close this client's session.
        virtual bool expires_when_idle() const { return true; }

        virtual bool draining() const = 0;
        /// Ask the transport to stop accepting work and close once in-flight calls finish.
        virtual void request_drain() = 0;

        /// Queue one JSON-RPC message for delivery. False when the peer is gone.
        virtual bool send(const std::string &message) = 0;
    };

}// namespace ticketmcp::business
