#ifndef GAVEL_COOLDOWN_GUARD_HPP
#define GAVEL_COOLDOWN_GUARD_HPP

#include "gavel/AuctionTypes.hpp"
#include <cstdint>
#include <unordered_map>

namespace gavel {

    // Intervalo mínimo entre pujas de un mismo actor. No sincronizado.
    class CooldownGuard {
        public:
            explicit CooldownGuard(uint64_t cooldownSeconds = ACTION_COOLDOWN);

            /**
             * Throws AuctionError(CooldownPeriod) if the actor's last successful
             * bid was less than the cooldown ago.
             */
            void check(const Address& actor, Timestamp now) const;

            // Solo tras una puja aceptada
            void record(const Address& actor, Timestamp now);

            // 0 si el actor nunca ha pujado
            Timestamp cooldownEnds(const Address& actor) const;

            uint64_t cooldown() const { return cooldownSeconds; }

        private:
            uint64_t cooldownSeconds;
            std::unordered_map<Address, Timestamp> lastAction;
    };

} // namespace gavel

#endif // GAVEL_COOLDOWN_GUARD_HPP
