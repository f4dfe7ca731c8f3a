#include "http_transport.h"
#include "core/logger.h"
#include "tcp_session.h"

using asio::use_awaitable;

namespace ticketmcp::transport {

    /**
     * @brief Construct HTTP transport with specified address and port.
     * @param address IP address to bind to
     * @param port Port number to listen on (0 picks a free port)
     */
    HttpTransport::HttpTransport(const std::string &address, unsigned short port,
                                 core::IoContextPool &io_pool, std::shared_ptr<HttpHandler> handler)
        : io_context_(),
          acceptor_(io_context_, asio::ip::tcp::endpoint(asio::ip::make_address(address), port)),
          work_guard_(asio::make_work_guard(io_context_)),
          io_pool_(io_pool),
          handler_(std::move(handler)) {
        TICKETMCP_INFO("HTTP Transport bound to {}:{}", address, acceptor_.local_endpoint().port());
    }

    HttpTransport::~HttpTransport() {
        stop();
    }

    unsigned short HttpTransport::port() const {
        asio::error_code ec;
        auto endpoint = acceptor_.local_endpoint(ec);
        return ec ? 0 : endpoint.port();
    }

    bool HttpTransport::start() {
        is_running_ = true;
        asio::co_spawn(io_context_, accept_loop(), asio::detached);

        accept_thread_ = std::thread([this]() {
            try {
                io_context_.run();
            } catch (const std::exception &e) {
                TICKETMCP_ERROR("Error in HTTP io_context: {}", e.what());
            }
        });

        TICKETMCP_INFO("HTTP Transport started on {}:{}",
                       acceptor_.local_endpoint().address().to_string(),
                       acceptor_.local_endpoint().port());
        return true;
    }

    asio::awaitable<void> HttpTransport::accept_loop() {
        while (is_running_) {
            asio::error_code ec;
            // Accept directly onto a pool context so the session never migrates
            auto &session_io_context = io_pool_.GetIOService();
            asio::ip::tcp::socket socket(session_io_context);
            co_await acceptor_.async_accept(socket, asio::redirect_error(use_awaitable, ec));
            if (ec) {
                if (ec == asio::error::operation_aborted || !is_running_) {
                    break;
                }
                TICKETMCP_WARN("Error accepting HTTP connection: {}", ec.message());
                continue;
            }

            auto session = std::make_shared<TcpSession>(std::move(socket));
            TICKETMCP_DEBUG("HTTP client connected from {} (channel: {})", session->get_remote_address(), session->get_channel_id());

            asio::co_spawn(session_io_context, [session, handler = handler_]() -> asio::awaitable<void> {
                    co_await session->start(handler.get());
                    co_return; }, asio::detached);
        }
        co_return;
    }

    /**
     * @brief Stop the HTTP transport and clean up resources.
     */
    void HttpTransport::stop() {
        if (!is_running_.exchange(false)) {
            return;
        }
        asio::post(io_context_, [this]() {
            asio::error_code ec;
            acceptor_.close(ec);
        });
        work_guard_.reset();
        io_context_.stop();
        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }
        TICKETMCP_INFO("HTTP Transport stopped");
    }

}// namespace ticketmcp::transport
