#pragma once

#include "business/client_context.h"
#include "business/dispatch_engine.h"
#include "business/rpc_router.h"
#include "session/session_registry.h"
#include <memory>
#include <string>

namespace ticketmcp::business {

    /// Transport-level acknowledgement of one inbound message.
    struct MessageAck {
        int status = 202;
        nlohmann::json body = nlohmann::json::object();
    };

    /**
     * @brief Parses inbound JSON-RPC messages and routes them to the method handlers.
     *
     * Replies are delivered through ClientContext::send(); the returned MessageAck is what
     * the transport answers the POST with. Parse and framing errors come back in the ack
     * (status 400) instead of on the stream.
     */
    class RequestHandler {
    public:
        RequestHandler(std::shared_ptr<session::SessionRegistry> registry,
                       std::shared_ptr<const DispatchEngine> engine,
                       TaskRunner run_task,
                       std::string default_package);

        MessageAck handle_message(const std::string &msg, const std::shared_ptr<ClientContext> &client);

        const std::string &default_package() const { return default_package_; }

    private:
        std::shared_ptr<session::SessionRegistry> registry_;
        std::shared_ptr<const DispatchEngine> engine_;
        TaskRunner run_task_;
        std::string default_package_;
        RpcRouter router_;
    };

}// namespace ticketmcp::business
