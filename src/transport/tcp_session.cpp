#include "tcp_session.h"
#include "core/logger.h"
#include "http_handler.h"
#include "utils/session_id.h"
#include <algorithm>
#include <cctype>

using asio::use_awaitable;

namespace ticketmcp::transport {

    TcpSession::TcpSession(asio::ip::tcp::socket socket)
        : socket_(std::move(socket)) {
        channel_id_ = utils::generate_session_id();
        asio::error_code ec;
        auto endpoint = socket_.remote_endpoint(ec);
        if (!ec) {
            remote_address_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
        }
    }

    size_t TcpSession::complete_request_length(const std::string &buffer) {
        size_t header_end = buffer.find("\r\n\r\n");
        if (header_end == std::string::npos) {
            return 0;// Incomplete headers - wait for more data
        }

        std::string head = buffer.substr(0, header_end);
        std::transform(head.begin(), head.end(), head.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        // Parse Content-Length header
        size_t content_length = 0;
        size_t content_length_pos = head.find("\r\ncontent-length:");
        if (content_length_pos != std::string::npos) {
            size_t value_start = content_length_pos + 17;// After "\r\ncontent-length:"
            size_t value_end = head.find("\r\n", value_start);
            std::string length_str = head.substr(value_start, value_end == std::string::npos ? std::string::npos : value_end - value_start);
            length_str.erase(0, length_str.find_first_not_of(" \t"));
            length_str.erase(length_str.find_last_not_of(" \t") + 1);
            try {
                content_length = std::stoull(length_str);
            } catch (const std::exception &) {
                content_length = 0;// Treat an unparsable length as no body
            }
        }

        size_t total_required = header_end + 4 + content_length;// +4 for "\r\n\r\n"
        return buffer.length() >= total_required ? total_required : 0;
    }

    /**
     * @brief Start the TCP session and begin reading requests.
     * @param handler HTTP handler for processing requests
     */
    asio::awaitable<void> TcpSession::start(HttpHandler *handler) {
        try {
            std::string request_buffer;
            while (socket_.is_open()) {
                auto n = co_await socket_.async_read_some(asio::buffer(buffer_), use_awaitable);
                if (n == 0) break;// Connection closed gracefully

                if (streaming_) {
                    // Event streams are one-way; keep reading only to notice disconnects
                    continue;
                }
                request_buffer.append(buffer_.data(), n);

                while (!request_buffer.empty() && !streaming_) {
                    size_t total_required = complete_request_length(request_buffer);
                    if (total_required == 0) {
                        break;// Incomplete request - wait for more data
                    }
                    std::string complete_request = request_buffer.substr(0, total_required);
                    request_buffer.erase(0, total_required);
                    co_await handler->handle_request(std::static_pointer_cast<TcpSession>(shared_from_this()), complete_request);
                }
            }
        } catch (const std::exception &e) {
            if (!closed_) {
                TICKETMCP_DEBUG("TCP channel {} read ended: {}", channel_id_, e.what());
            }
        }
        close();
        notify_closed();
        co_return;
    }

    /**
     * @brief Write data to the TCP socket.
     * @param message Data to send to client
     */
    asio::awaitable<void> TcpSession::write(const std::string &message) {
        if (!socket_.is_open()) {
            co_return;
        }
        try {
            co_await asio::async_write(socket_, asio::buffer(message), use_awaitable);
        } catch (const std::exception &e) {
            TICKETMCP_WARN("Failed to write to TCP channel {}: {}", channel_id_, e.what());
            close();
        }
        co_return;
    }

    /**
     * @brief Close the TCP session and release resources.
     */
    void TcpSession::close() {
        if (!closed_ && socket_.is_open()) {
            asio::error_code ec;
            socket_.cancel(ec);
            socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
            socket_.close(ec);

            // Clear buffer for security
            std::fill(buffer_.begin(), buffer_.end(), static_cast<char>(0));
        }
        closed_ = true;
        streaming_ = false;
    }

    bool TcpSession::is_closed() const {
        return closed_ || !socket_.is_open();
    }

}// namespace ticketmcp::transport
