// src/backend/http_executor.h
#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace httplib {
    class Client;
}

namespace ticketmcp::backend {

    struct BackendRequest {
        std::string method;// GET, POST, PATCH, DELETE
        std::string path;
        std::vector<std::pair<std::string, std::string>> query;
        std::vector<std::pair<std::string, std::string>> headers;
        std::string body;
        /// Form fields; when present they are sent url-encoded in place of body.
        std::vector<std::pair<std::string, std::string>> form;
        std::string content_type = "application/json";
        std::chrono::milliseconds timeout{30000};
    };

    struct BackendResponse {
        int status = 0;
        std::string body;
        std::map<std::string, std::string> headers;

        std::string header(const std::string &name) const;
    };

    /**
     * @brief Seam between the typed client and the wire.
     *
     * execute() returns any HTTP status as a response; only transport failures (connect,
     * timeout, TLS) throw, as core::ServiceError with kind Unavailable.
     */
    class HttpExecutor {
    public:
        virtual ~HttpExecutor() = default;
        virtual BackendResponse execute(const BackendRequest &request) = 0;
    };

    /**
     * @brief cpp-httplib implementation backed by a fixed pool of keep-alive clients.
     *
     * A client is leased for the duration of one request, so concurrent callers never
     * share a connection. Callers block while every client is leased. Query and form
     * parameters are encoded by httplib.
     */
    class HttplibExecutor : public HttpExecutor {
    public:
        HttplibExecutor(std::string base_url, size_t pool_size);
        ~HttplibExecutor() override;

        BackendResponse execute(const BackendRequest &request) override;

    private:
        class Lease;

        std::unique_ptr<httplib::Client> acquire();
        void release(std::unique_ptr<httplib::Client> client);

        std::string base_url_;
        std::mutex pool_mutex_;
        std::condition_variable pool_cv_;
        std::vector<std::unique_ptr<httplib::Client>> idle_;
    };

}// namespace ticketmcp::backend
