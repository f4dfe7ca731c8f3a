#pragma once

#include "core/io_context_pool.hpp"
#include "http_handler.h"
#include <asio.hpp>
#include <atomic>
#include <memory>
#include <thread>

namespace ticketmcp::transport {

    /**
     * @brief HTTP transport using plain TCP sockets.
     * Accepts on its own io_context and hands each connection to the IO pool.
     */
    class HttpTransport {
    public:
        HttpTransport(const std::string &address, unsigned short port,
                      core::IoContextPool &io_pool, std::shared_ptr<HttpHandler> handler);
        ~HttpTransport();

        /**
         * @brief Start accepting connections.
         * @return True if startup successful
         */
        bool start();

        /**
         * @brief Stop accepting. Open sockets are left to their connections.
         */
        void stop();

        unsigned short port() const;

    private:
        asio::awaitable<void> accept_loop();

        asio::io_context io_context_;                                          ///< Context owning the acceptor
        asio::ip::tcp::acceptor acceptor_;                                     ///< TCP acceptor for incoming connections
        asio::executor_work_guard<asio::io_context::executor_type> work_guard_;///< Keep IO context running
        core::IoContextPool &io_pool_;
        std::shared_ptr<HttpHandler> handler_;
        std::atomic<bool> is_running_{false};
        std::thread accept_thread_;
    };

}// namespace ticketmcp::transport
