#pragma once

#include "backend/http_executor.h"
#include "backend/record_backend.h"
#include "business/client_context.h"
#include "catalog/tool_catalog.h"
#include "core/errors.h"
#include "nlohmann/json.hpp"
#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ticketmcp::fakes {

    /// Catalog with a read-mostly "basic" package and a "full" package carrying every tool.
    inline nlohmann::json sample_catalog_json() {
        auto identifier = nlohmann::json{{"name", "identifier"}, {"type", "string"}, {"required", true}};
        return {
                {"tools",
                 {{{"name", "list_incidents"},
                   {"description", "List incidents"},
                   {"backend_operation", "list"},
                   {"parameters",
                    {{{"name", "limit"}, {"type", "integer"}},
                     {{"name", "offset"}, {"type", "integer"}},
                     {{"name", "query"}, {"type", "string"}},
                     {{"name", "state"}, {"type", "string"}},
                     {{"name", "priority"}, {"type", "string"}},
                     {{"name", "assignee"}, {"type", "string"}}}}},
                  {{"name", "get_incident"},
                   {"description", "Fetch one incident"},
                   {"backend_operation", "read"},
                   {"parameters", nlohmann::json::array({identifier})}},
                  {{"name", "create_incident"},
                   {"description", "Open an incident"},
                   {"backend_operation", "create"},
                   {"parameters",
                    {{{"name", "short_description"}, {"type", "string"}, {"required", true}},
                     {{"name", "description"}, {"type", "string"}},
                     {{"name", "priority"}, {"type", "string"}},
                     {{"name", "idempotency_token"}, {"type", "string"}}}}},
                  {{"name", "update_incident"},
                   {"description", "Change fields"},
                   {"backend_operation", "update"},
                   {"parameters",
                    {identifier,
                     {{"name", "short_description"}, {"type", "string"}},
                     {{"name", "state"}, {"type", "string"}}}}},
                  {{"name", "delete_incident"},
                   {"description", "Delete an incident"},
                   {"backend_operation", "delete"},
                   {"parameters", nlohmann::json::array({identifier})}}}},
                {"packages",
                 {{"basic", {"list_incidents", "get_incident", "create_incident"}},
                  {"full", {"list_incidents", "get_incident", "create_incident", "update_incident", "delete_incident"}},
                  {"none", nlohmann::json::array()}}}};
    }

    inline catalog::CatalogPtr sample_catalog() {
        return catalog::ToolCatalog::from_json(sample_catalog_json(), nullptr);
    }

    inline backend::Record sample_record(const std::string &identifier) {
        backend::Record record;
        record.identifier = identifier;
        record.short_description = "Printer on fire";
        record.state = "New";
        return record;
    }

    /**
     * @brief In-memory RecordBackend counting every call. A queued failure is thrown by the
     * next call of any kind.
     */
    class FakeBackend : public backend::RecordBackend {
    public:
        std::vector<backend::Record> list(const backend::ListQuery &query) override {
            record_call("list");
            last_query = query;
            return {sample_record("INC0000001"), sample_record("INC0000002")};
        }

        backend::Record create(const backend::RecordFields &fields, const std::optional<std::string> &token) override {
            record_call("create");
            last_fields = fields;
            last_token = token;
            auto record = sample_record("INC0000100");
            record.short_description = fields.short_description.value_or("");
            return record;
        }

        backend::Record read(const std::string &identifier) override {
            record_call("read");
            return sample_record(identifier);
        }

        backend::Record update(const std::string &identifier, const backend::RecordFields &fields) override {
            record_call("update");
            last_fields = fields;
            return sample_record(identifier);
        }

        void remove(const std::string &) override {
            record_call("delete");
        }

        backend::Record assign(const std::string &identifier, const std::string &assignee,
                               const std::optional<std::string> &) override {
            record_call("assign");
            auto record = sample_record(identifier);
            record.assignee = assignee;
            return record;
        }

        backend::Record resolve(const std::string &identifier, const backend::ResolveRequest &request) override {
            record_call("resolve");
            auto record = sample_record(identifier);
            record.resolution = request.close_notes;
            return record;
        }

        void ping(std::chrono::milliseconds) override {
            record_call("ping");
        }

        std::string name() const override { return "fake"; }

        void fail_next(core::ErrorKind kind, const std::string &message) {
            std::lock_guard<std::mutex> lock(mutex_);
            failures_.emplace_back(kind, message);
        }

        /// Every following call fails until clear_failures().
        void fail_always(core::ErrorKind kind, const std::string &message) {
            std::lock_guard<std::mutex> lock(mutex_);
            sticky_failure_ = core::ServiceError(kind, message);
        }

        void clear_failures() {
            std::lock_guard<std::mutex> lock(mutex_);
            failures_.clear();
            sticky_failure_.reset();
        }

        size_t calls() const { return calls_.load(); }

        std::vector<std::string> operations() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return operations_;
        }

        backend::ListQuery last_query;
        backend::RecordFields last_fields;
        std::optional<std::string> last_token;

    private:
        void record_call(const std::string &operation) {
            ++calls_;
            std::lock_guard<std::mutex> lock(mutex_);
            operations_.push_back(operation);
            if (sticky_failure_) {
                throw *sticky_failure_;
            }
            if (!failures_.empty()) {
                auto [kind, message] = failures_.front();
                failures_.pop_front();
                throw core::ServiceError(kind, message);
            }
        }

        mutable std::mutex mutex_;
        std::atomic<size_t> calls_{0};
        std::vector<std::string> operations_;
        std::deque<std::pair<core::ErrorKind, std::string>> failures_;
        std::optional<core::ServiceError> sticky_failure_;
    };

    /// Returns queued responses in order and keeps every request it saw.
    class ScriptedHttpExecutor : public backend::HttpExecutor {
    public:
        backend::BackendResponse execute(const backend::BackendRequest &request) override {
            std::lock_guard<std::mutex> lock(mutex_);
            requests.push_back(request);
            if (responses_.empty()) {
                throw core::ServiceError(core::ErrorKind::Unavailable, "no scripted response left");
            }
            auto response = responses_.front();
            responses_.pop_front();
            return response;
        }

        void push(int status, const std::string &body = {}, std::map<std::string, std::string> headers = {}) {
            std::lock_guard<std::mutex> lock(mutex_);
            responses_.push_back(backend::BackendResponse{status, body, std::move(headers)});
        }

        void push_json(int status, const nlohmann::json &body) {
            push(status, body.dump());
        }

        std::vector<backend::BackendRequest> requests;

    private:
        std::mutex mutex_;
        std::deque<backend::BackendResponse> responses_;
    };

    inline std::string query_value(const backend::BackendRequest &request, const std::string &name) {
        for (const auto &[key, value]: request.query) {
            if (key == name) {
                return value;
            }
        }
        return {};
    }

    /// ClientContext that records what the handler sends instead of writing to a socket.
    class RecordingClient : public business::ClientContext {
    public:
        explicit RecordingClient(std::string id = "conn-1", auth::CallerIdentity identity = {})
            : id_(std::move(id)), identity_(std::move(identity)) {}

        const std::string &connection_id() const override { return id_; }
        const auth::CallerIdentity &identity() const override { return identity_; }

        session::SessionPtr session() const override {
            std::lock_guard<std::mutex> lock(mutex_);
            return session_;
        }

        void bind_session(session::SessionPtr session) override {
            std::lock_guard<std::mutex> lock(mutex_);
            session_ = std::move(session);
        }

        bool draining() const override { return draining_; }
        void request_drain() override { draining_ = true; }

        bool send(const std::string &message) override {
            std::lock_guard<std::mutex> lock(mutex_);
            sent_.push_back(nlohmann::json::parse(message));
            return true;
        }

        std::vector<nlohmann::json> sent() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return sent_;
        }

        nlohmann::json last_sent() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return sent_.empty() ? nlohmann::json() : sent_.back();
        }

        /// Number of messages sent in reply to JSON-RPC id @p id.
        size_t replies_to(const nlohmann::json &id) const {
            std::lock_guard<std::mutex> lock(mutex_);
            size_t count = 0;
            for (const auto &message: sent_) {
                if (message.contains("id") && message["id"] == id) {
                    ++count;
                }
            }
            return count;
        }

        std::atomic<bool> draining_{false};

    private:
        const std::string id_;
        const auth::CallerIdentity identity_;
        mutable std::mutex mutex_;
        session::SessionPtr session_;
        std::vector<nlohmann::json> sent_;
    };

}// namespace ticketmcp::fakes
