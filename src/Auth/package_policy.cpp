#include "package_policy.h"
#include <sstream>

namespace ticketmcp::auth {

    void PackagePolicy::allow(const std::string &role, const std::string &package) {
        rules_[role].insert(package);
    }

    void PackagePolicy::allow_csv(const std::string &role, const std::string &packages) {
        std::istringstream stream(packages);
        std::string item;
        auto &allowed = rules_[role];
        while (std::getline(stream, item, ',')) {
            item.erase(0, item.find_first_not_of(" \t"));
            item.erase(item.find_last_not_of(" \t") + 1);
            if (!item.empty()) {
                allowed.insert(item);
            }
        }
    }

    bool PackagePolicy::permits(const CallerIdentity &identity, const std::string &package) const {
        if (rules_.empty()) {
            return true;
        }
        auto role = rules_.find(identity.role);
        if (role != rules_.end() && role->second.count(package)) {
            return true;
        }
        auto wildcard = rules_.find("*");
        return wildcard != rules_.end() && wildcard->second.count(package) > 0;
    }

}// namespace ticketmcp::auth
