#pragma once

#include <functional>
#include <string>

namespace ticketmcp::transport {

    /// Invoked with the channel id when a socket's read side ends.
    using CloseHandler = std::function<void(const std::string &)>;

    /// Lifecycle of a streaming connection. Transitions only move forward.
    enum class ConnectionState {
        Connecting,
        Handshaking,
        Active,
        Draining,
        Closed
    };

    inline const char *to_string(ConnectionState state) {
        switch (state) {
            case ConnectionState::Connecting:
                return "Connecting";
            case ConnectionState::Handshaking:
                return "Handshaking";
            case ConnectionState::Active:
                return "Active";
            case ConnectionState::Draining:
                return "Draining";
            case ConnectionState::Closed:
            default:
                return "Closed";
        }
    }

}// namespace ticketmcp::transport
