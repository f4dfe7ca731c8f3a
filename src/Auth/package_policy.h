#pragma once

#include "AuthManager.hpp"
#include <map>
#include <set>
#include <string>

namespace ticketmcp::auth {

    /**
     * @brief Which tool packages a caller role may open a session with.
     *
     * An empty policy allows every package. Otherwise a role may use the packages listed
     * for it, plus those listed under the wildcard role "*".
     */
    class PackagePolicy {
    public:
        PackagePolicy() = default;

        void allow(const std::string &role, const std::string &package);
        void allow_csv(const std::string &role, const std::string &packages);

        bool permits(const CallerIdentity &identity, const std::string &package) const;
        bool empty() const { return rules_.empty(); }

        const std::map<std::string, std::set<std::string>> &rules() const { return rules_; }

    private:
        std::map<std::string, std::set<std::string>> rules_;
    };

}// namespace ticketmcp::auth
