#pragma once
#include "business/client_context.h"
#include "business/dispatch_engine.h"
#include "protocol/json_rpc.h"
#include "session/session_registry.h"
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>

namespace ticketmcp::business {

    /// Schedules blocking work (tool dispatch) off the IO threads.
    using TaskRunner = std::function<void(std::function<void()>)>;

    /**
     * @brief Everything a method handler may touch while handling one message.
     */
    struct RpcContext {
        std::shared_ptr<ClientContext> client;
        std::shared_ptr<session::SessionRegistry> registry;
        std::shared_ptr<const DispatchEngine> engine;
        TaskRunner run_task;
        std::string default_package;

        /// Transport-level acknowledgement: status and body of the answer to the POST.
        int ack_status = 202;
        nlohmann::json accepted = nlohmann::json::object();
    };

    /// std::nullopt when nothing should be sent back right away.
    using RpcHandler = std::function<std::optional<protocol::Response>(const protocol::Request &, RpcContext &)>;

    class RpcRouter {
    public:
        void register_handler(const std::string &method, RpcHandler handler);

        std::optional<RpcHandler> find_handler(const std::string &method) const;

        std::optional<protocol::Response> route_request(const protocol::Request &req, RpcContext &ctx) const;

    private:
        std::unordered_map<std::string, RpcHandler> handlers_;
    };

}// namespace ticketmcp::business
