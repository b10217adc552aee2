#ifndef GAVEL_ACCESS_CONTROL_HPP
#define GAVEL_ACCESS_CONTROL_HPP

#include "gavel/AuctionTypes.hpp"
#include <initializer_list>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace gavel {

    /**
     * Role membership and the bidder blacklist.
     *
     * Not synchronized: AuctionEngine guards it together with the
     * SystemStateController under one lock.
     */
    class AccessControl {
        public:
            AccessControl() = default;

            /**
             * Adds a role to an actor. Returns false if the actor already held it.
             */
            bool grantRole(const Address& actor, Role role);

            /**
             * Removes a role from an actor. Returns false if the actor did not hold it.
             */
            bool revokeRole(const Address& actor, Role role);

            bool hasRole(const Address& actor, Role role) const;

            /**
             * Throws AuctionError(Unauthorized) unless the actor holds the role.
             */
            void requireRole(const Address& actor, Role role) const;

            /**
             * Throws AuctionError(Unauthorized) unless the actor holds at least one of the roles.
             */
            void requireAnyRole(const Address& actor, std::initializer_list<Role> roles) const;

            std::vector<Role> rolesOf(const Address& actor) const;

            /**
             * Marks or clears an actor as blacklisted. Returns true if the flag changed.
             */
            bool setBlacklisted(const Address& actor, bool blacklisted);
            bool isBlacklisted(const Address& actor) const;
            size_t blacklistedCount() const;

        private:
            std::unordered_map<Address, std::set<Role>> roles;
            std::unordered_set<Address> blacklist;
    };

} // namespace gavel

#endif // GAVEL_ACCESS_CONTROL_HPP
