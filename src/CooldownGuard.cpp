#include "gavel/CooldownGuard.hpp"
#include "gavel/Errors.hpp"

namespace gavel {

    CooldownGuard::CooldownGuard(uint64_t cooldownSeconds)
        : cooldownSeconds(cooldownSeconds) {}

    void CooldownGuard::check(const Address& actor, Timestamp now) const {
        auto it = lastAction.find(actor);
        if (it == lastAction.end()) {
            return;
        }

        if (now < it->second + cooldownSeconds) {
            throw AuctionError(ErrorCode::CooldownPeriod,
                               actor + " must wait until " + std::to_string(it->second + cooldownSeconds));
        }
    }

    void CooldownGuard::record(const Address& actor, Timestamp now) {
        lastAction[actor] = now;
    }

    Timestamp CooldownGuard::cooldownEnds(const Address& actor) const {
        auto it = lastAction.find(actor);
        if (it == lastAction.end()) {
            return 0;
        }
        return it->second + cooldownSeconds;
    }

} // namespace gavel
