#pragma once

#include "channel.h"

namespace ticketmcp::transport {

    /**
     * @brief Plain TCP channel carrying HTTP/1.1 requests.
     *
     * Once a request upgrades the socket to an event stream, the stream writer owns all
     * further output and pipelined requests on that socket are discarded.
     */
    class TcpSession : public Channel {
    public:
        explicit TcpSession(asio::ip::tcp::socket socket);
        ~TcpSession() override = default;

        asio::awaitable<void> start(HttpHandler *handler) override;
        asio::awaitable<void> write(const std::string &message) override;

        void close() override;
        bool is_closed() const override;
        asio::any_io_executor get_executor() override { return socket_.get_executor(); }

        void set_streaming(bool streaming) { streaming_ = streaming; }
        bool is_streaming() const { return streaming_; }

        /// Length of the first complete request in @p buffer, 0 while more bytes are needed.
        static size_t complete_request_length(const std::string &buffer);

    private:
        asio::ip::tcp::socket socket_;///< Underlying TCP socket
        bool streaming_ = false;      ///< Socket has been handed to an event stream
    };

}// namespace ticketmcp::transport
