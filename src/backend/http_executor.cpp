#include "http_executor.h"
#include "core/errors.h"
#include "core/logger.h"
#include "httplib.h"
#include <cctype>

namespace ticketmcp::backend {

    namespace {

        std::string lower(std::string s) {
            for (auto &c: s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            return s;
        }

        void apply_timeout(httplib::Client &client, std::chrono::milliseconds timeout) {
            auto sec = static_cast<time_t>(timeout.count() / 1000);
            auto usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
            client.set_connection_timeout(sec, usec);
            client.set_read_timeout(sec, usec);
            client.set_write_timeout(sec, usec);
        }

    }// namespace

    std::string BackendResponse::header(const std::string &name) const {
        auto it = headers.find(lower(name));
        return it == headers.end() ? std::string{} : it->second;
    }

    HttplibExecutor::HttplibExecutor(std::string base_url, size_t pool_size) : base_url_(std::move(base_url)) {
        while (!base_url_.empty() && base_url_.back() == '/') {
            base_url_.pop_back();
        }
        if (pool_size == 0) {
            pool_size = 1;
        }
        for (size_t i = 0; i < pool_size; ++i) {
            auto client = std::make_unique<httplib::Client>(base_url_);
            client->set_keep_alive(true);
            idle_.push_back(std::move(client));
        }
        TICKETMCP_DEBUG("HTTP client pool for {} created with {} clients", base_url_, pool_size);
    }

    HttplibExecutor::~HttplibExecutor() = default;

    /// Returns the client to the pool on every exit path.
    class HttplibExecutor::Lease {
    public:
        explicit Lease(HttplibExecutor &pool) : pool_(pool), client_(pool.acquire()) {}
        ~Lease() { pool_.release(std::move(client_)); }

        Lease(const Lease &) = delete;
        Lease &operator=(const Lease &) = delete;

        httplib::Client &operator*() const { return *client_; }
        httplib::Client *operator->() const { return client_.get(); }

    private:
        HttplibExecutor &pool_;
        std::unique_ptr<httplib::Client> client_;
    };

    std::unique_ptr<httplib::Client> HttplibExecutor::acquire() {
        std::unique_lock<std::mutex> lock(pool_mutex_);
        pool_cv_.wait(lock, [this] { return !idle_.empty(); });
        auto client = std::move(idle_.back());
        idle_.pop_back();
        return client;
    }

    void HttplibExecutor::release(std::unique_ptr<httplib::Client> client) {
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            idle_.push_back(std::move(client));
        }
        pool_cv_.notify_one();
    }

    BackendResponse HttplibExecutor::execute(const BackendRequest &request) {
        Lease client(*this);
        apply_timeout(*client, request.timeout);

        httplib::Headers headers(request.headers.begin(), request.headers.end());
        httplib::Params query(request.query.begin(), request.query.end());
        std::string target = query.empty() ? request.path : httplib::append_query_params(request.path, query);

        httplib::Result result;
        if (request.method == "GET") {
            result = client->Get(target, headers);
        } else if (request.method == "POST" && !request.form.empty()) {
            httplib::Params form(request.form.begin(), request.form.end());
            result = client->Post(target, headers, form);
        } else if (request.method == "POST") {
            result = client->Post(target, headers, request.body, request.content_type);
        } else if (request.method == "PATCH") {
            result = client->Patch(target, headers, request.body, request.content_type);
        } else if (request.method == "PUT") {
            result = client->Put(target, headers, request.body, request.content_type);
        } else if (request.method == "DELETE") {
            result = client->Delete(target, headers);
        } else {
            throw core::ServiceError(core::ErrorKind::Unknown, "unsupported HTTP method " + request.method);
        }

        if (!result) {
            auto error = httplib::to_string(result.error());
            // drop the broken keep-alive connection before the client goes back to the pool
            client->stop();
            TICKETMCP_WARN("{} {}{} failed: {}", request.method, base_url_, request.path, error);
            throw core::ServiceError(core::ErrorKind::Unavailable, "backend request failed: " + error);
        }

        BackendResponse response;
        response.status = result->status;
        response.body = result->body;
        for (const auto &[key, value]: result->headers) {
            response.headers[lower(key)] = value;
        }

        TICKETMCP_TRACE("{} {} -> {}", request.method, request.path, response.status);
        return response;
    }

}// namespace ticketmcp::backend
