#include "gavel/AccessControl.hpp"
#include "gavel/Errors.hpp"

namespace gavel {

    bool AccessControl::grantRole(const Address& actor, Role role) {
        if (actor.empty()) {
            return false;
        }
        return roles[actor].insert(role).second;
    }

    bool AccessControl::revokeRole(const Address& actor, Role role) {
        auto it = roles.find(actor);
        if (it == roles.end()) {
            return false;
        }

        bool removed = it->second.erase(role) > 0;
        if (it->second.empty()) {
            roles.erase(it);
        }
        return removed;
    }

    bool AccessControl::hasRole(const Address& actor, Role role) const {
        auto it = roles.find(actor);
        return it != roles.end() && it->second.count(role) > 0;
    }

    void AccessControl::requireRole(const Address& actor, Role role) const {
        if (!hasRole(actor, role)) {
            throw AuctionError(ErrorCode::Unauthorized,
                               actor + " lacks role " + roleToString(role));
        }
    }

    void AccessControl::requireAnyRole(const Address& actor, std::initializer_list<Role> required) const {
        for (Role role : required) {
            if (hasRole(actor, role)) {
                return;
            }
        }
        throw AuctionError(ErrorCode::Unauthorized, actor + " lacks a required role");
    }

    std::vector<Role> AccessControl::rolesOf(const Address& actor) const {
        auto it = roles.find(actor);
        if (it == roles.end()) {
            return {};
        }
        return std::vector<Role>(it->second.begin(), it->second.end());
    }

    bool AccessControl::setBlacklisted(const Address& actor, bool blacklisted) {
        if (blacklisted) {
            return blacklist.insert(actor).second;
        }
        return blacklist.erase(actor) > 0;
    }

    bool AccessControl::isBlacklisted(const Address& actor) const {
        return blacklist.count(actor) > 0;
    }

    size_t AccessControl::blacklistedCount() const {
        return blacklist.size();
    }

} // namespace gavel
