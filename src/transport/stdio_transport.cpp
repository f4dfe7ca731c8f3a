// src/transport/stdio_transport.cpp
#include "stdio_transport.h"
#include "core/logger.h"

namespace ticketmcp::transport {

    StdioTransport::StdioTransport(std::shared_ptr<business::RequestHandler> handler,
                                   std::shared_ptr<session::SessionRegistry> registry,
                                   std::istream &in, std::ostream &out)
        : handler_(std::move(handler)), registry_(std::move(registry)), in_(in), out_(out) {}

    StdioTransport::~StdioTransport() {
        running_ = false;
        if (reader_.joinable()) {
            // std::getline cannot be interrupted; the process is exiting anyway
            reader_.detach();
        }
    }

    bool StdioTransport::open(StopCallback on_stop) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            on_stop_ = std::move(on_stop);
        }
        running_ = true;
        reader_ = std::thread([self = shared_from_this()]() {
            std::string line;
            while (self->running_ && std::getline(self->in_, line)) {
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                if (!line.empty()) {
                    self->handle_line(line);
                }
            }
            TICKETMCP_INFO("STDIO input closed");
            self->finish();
        });
        TICKETMCP_INFO("STDIO Transport started, waiting for input...");
        return true;
    }

    void StdioTransport::handle_line(const std::string &line) {
        TICKETMCP_DEBUG("Received raw message: {}", line);
        auto ack = handler_->handle_message(line, shared_from_this());
        // framing errors have no stream to travel on; answer them in place
        if (ack.status >= 400) {
            send(ack.body.dump());
        }
    }

    session::SessionPtr StdioTransport::session() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return session_;
    }

    void StdioTransport::bind_session(session::SessionPtr session) {
        std::lock_guard<std::mutex> lock(mutex_);
        session_ = std::move(session);
    }

    void StdioTransport::request_drain() {
        draining_ = true;
        StopCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = on_stop_;
        }
        if (callback) {
            callback();
        }
    }

    bool StdioTransport::send(const std::string &message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!out_) {
            return false;
        }
        out_ << message << std::endl;// endl flushes
        return static_cast<bool>(out_);
    }

    void StdioTransport::finish() {
        running_ = false;
        draining_ = true;
        StopCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = std::move(on_stop_);
            on_stop_ = nullptr;
        }
        if (callback) {
            callback();
        }
    }

    size_t StdioTransport::in_flight() const {
        auto current = session();
        return current ? current->in_flight_count() : 0;
    }

    void StdioTransport::close() {
        running_ = false;
        draining_ = true;
        if (auto current = session()) {
            registry_->close(current->id());
        }
    }

}// namespace ticketmcp::transport
