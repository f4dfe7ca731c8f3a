#pragma once

#include "Auth/AuthManager.hpp"
#include "Auth/package_policy.h"
#include "business/dispatch_engine.h"
#include "nlohmann/json.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace ticketmcp::transport {

    struct RestRequest {
        std::string method;
        std::string path;
        std::map<std::string, std::string> query;
        auth::HeaderMap headers;// lower-cased keys
        std::string body;
    };

    struct RestResponse {
        int status = 200;
        nlohmann::json body;
    };

    /**
     * @brief Plain REST routes over the same tools the streaming clients call.
     *
     * Each request runs through the DispatchEngine with a throwaway session bound to the
     * default package, or to the package named by the X-Tool-Package header. The tool is the
     * one in that package whose backend_operation matches the route.
     */
    class RestFacade {
    public:
        RestFacade(std::shared_ptr<const business::DispatchEngine> engine, std::string default_package,
                   auth::PackagePolicy policy = {});

        /// True for paths this facade owns.
        static bool matches(const std::string &path);

        /// Handle a request on a facade path. Blocks for the backend call.
        RestResponse handle(const RestRequest &request, const auth::CallerIdentity &identity) const;

        static int status_for(core::ErrorKind kind);

    private:
        RestResponse invoke(const std::string &operation, catalog::ArgumentMap arguments,
                            std::optional<std::string> idempotency_token,
                            const RestRequest &request, const auth::CallerIdentity &identity) const;

        static RestResponse error_response(core::ErrorKind kind, const std::string &message,
                                           const std::string &detail = {}, const std::string &request_id = {});

        std::shared_ptr<const business::DispatchEngine> engine_;
        std::string default_package_;
        auth::PackagePolicy policy_;
    };

}// namespace ticketmcp::transport
