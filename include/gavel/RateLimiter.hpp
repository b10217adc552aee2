#ifndef GAVEL_RATE_LIMITER_HPP
#define GAVEL_RATE_LIMITER_HPP

#include "gavel/AuctionTypes.hpp"
#include <cstdint>
#include <unordered_map>

namespace gavel {

    struct ThrottleWindow {
        Timestamp windowStart = 0;
        uint32_t actionCount = 0;
    };

    /**
     * Fixed window per actor. The window restarts on the first action at or
     * after windowStart + period; that action counts as the first of the new
     * window.
     *
     * check() never mutates, record() commits an action that already passed
     * check(). Not synchronized.
     */
    class RateLimiter {
        public:
            RateLimiter(uint64_t periodSeconds = RATE_LIMIT_PERIOD,
                        uint32_t maxActions = MAX_ACTIONS_PER_PERIOD);

            /**
             * Throws AuctionError(RateLimitExceeded) if the actor has used up the current window.
             */
            void check(const Address& actor, Timestamp now) const;

            void record(const Address& actor, Timestamp now);

            uint32_t remaining(const Address& actor, Timestamp now) const;

            ThrottleWindow windowOf(const Address& actor) const;

            uint64_t period() const { return periodSeconds; }
            uint32_t capacity() const { return maxActions; }

        private:
            bool inWindow(const ThrottleWindow& window, Timestamp now) const;

            uint64_t periodSeconds;
            uint32_t maxActions;
            std::unordered_map<Address, ThrottleWindow> windows;
    };

} // namespace gavel

#endif // GAVEL_RATE_LIMITER_HPP
