#pragma once
#include "core/logger.h"
#include <asio.hpp>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace ticketmcp::core {

    /**
     * @brief Fixed set of io_contexts, one thread each. Connections are spread round-robin
     * so each connection's coroutines stay on a single thread.
     */
    class IoContextPool {
    public:
        using IOService = asio::io_context;
        using Work = asio::executor_work_guard<asio::io_context::executor_type>;
        using WorkPtr = std::unique_ptr<Work>;

        explicit IoContextPool(std::size_t size = 2);
        ~IoContextPool();
        IoContextPool(const IoContextPool &) = delete;
        IoContextPool &operator=(const IoContextPool &) = delete;

        asio::io_context &GetIOService();
        std::size_t size() const { return ioServices_.size(); }
        void Stop();

    private:
        std::vector<std::unique_ptr<IOService>> ioServices_;
        std::vector<WorkPtr> works_;
        std::vector<std::thread> threads_;
        std::atomic<std::size_t> nextIOService_{0};
        bool stopped_ = false;
    };

    inline IoContextPool::IoContextPool(std::size_t size) {
        if (size == 0) {
            size = 1;
        }
        for (std::size_t i = 0; i < size; ++i) {
            ioServices_.push_back(std::make_unique<IOService>(1));
            works_.push_back(std::make_unique<Work>(asio::make_work_guard(*ioServices_[i])));
        }

        for (std::size_t i = 0; i < ioServices_.size(); ++i) {
            threads_.emplace_back([this, i]() {
                try {
                    ioServices_[i]->run();
                } catch (const std::exception &e) {
                    TICKETMCP_ERROR("IO thread {} stopped: {}", i, e.what());
                }
            });
        }
    }

    inline IoContextPool::~IoContextPool() {
        Stop();
    }

    inline asio::io_context &IoContextPool::GetIOService() {
        return *ioServices_[nextIOService_.fetch_add(1, std::memory_order_relaxed) % ioServices_.size()];
    }

    inline void IoContextPool::Stop() {
        if (stopped_) {
            return;
        }
        stopped_ = true;

        for (auto &work: works_) {
            work.reset();
        }

        for (auto &io: ioServices_) {
            io->stop();
        }

        for (auto &t: threads_) {
            if (t.joinable() && t.get_id() != std::this_thread::get_id()) {
                t.join();
            } else if (t.joinable()) {
                t.detach();
            }
        }
    }

}// namespace ticketmcp::core
