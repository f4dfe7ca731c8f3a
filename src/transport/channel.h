#pragma once

#include "transport_types.h"
#include <asio.hpp>
#include <array>
#include <memory>
#include <string>

namespace ticketmcp::transport {

    class HttpHandler;

    /**
     * @brief Base class for one accepted socket.
     * Handles IO operations only, no protocol logic.
     */
    class Channel : public std::enable_shared_from_this<Channel> {
    public:
        virtual ~Channel() = default;

        /**
         * @brief Read requests until the peer goes away and hand each to @p handler.
         */
        virtual asio::awaitable<void> start(HttpHandler *handler) = 0;

        /**
         * @brief Send raw bytes to the client.
         * @param message The message to send
         */
        virtual asio::awaitable<void> write(const std::string &message) = 0;

        /**
         * @brief Close the channel. Safe to call more than once.
         */
        virtual void close() = 0;

        virtual bool is_closed() const = 0;

        virtual asio::any_io_executor get_executor() = 0;

        const std::string &get_channel_id() const { return channel_id_; }
        const std::string &get_remote_address() const { return remote_address_; }

        /// Invoked once when the read side ends (EOF, reset or close()).
        void set_close_handler(CloseHandler handler) { close_handler_ = std::move(handler); }

    protected:
        Channel() = default;

        void notify_closed() {
            if (close_handler_) {
                auto handler = std::move(close_handler_);
                close_handler_ = nullptr;
                handler(channel_id_);
            }
        }

        std::string channel_id_;   ///< Unique channel identifier
        std::string remote_address_;
        std::array<char, 8192> buffer_;///< Buffer for reading data
        CloseHandler close_handler_;
        bool closed_ = false;
    };

}// namespace ticketmcp::transport
