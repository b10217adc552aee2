#include "gavel/RateLimiter.hpp"
#include "gavel/Errors.hpp"
#include <iostream>
#include <limits>
#include <stdexcept>

namespace gavel {

    RateLimiter::RateLimiter(uint64_t periodSeconds, uint32_t maxActions)
        : periodSeconds(periodSeconds), maxActions(maxActions) {
        if (periodSeconds == 0 || maxActions == 0) {
            throw std::invalid_argument("Rate limit period and capacity must be positive");
        }
    }

    bool RateLimiter::inWindow(const ThrottleWindow& window, Timestamp now) const {
        // windowStart + period saturado para no desbordar
        if (window.windowStart > std::numeric_limits<Timestamp>::max() - periodSeconds) {
            return true;
        }
        return now < window.windowStart + periodSeconds;
    }

    void RateLimiter::check(const Address& actor, Timestamp now) const {
        auto it = windows.find(actor);
        ThrottleWindow window = (it != windows.end()) ? it->second : ThrottleWindow();

        if (inWindow(window, now) && window.actionCount >= maxActions) {
            std::cerr << "Warning: Rate limit exceeded for actor " << actor << std::endl;
            throw AuctionError(ErrorCode::RateLimitExceeded,
                               actor + " exceeded " + std::to_string(maxActions) + " actions per window");
        }
    }

    void RateLimiter::record(const Address& actor, Timestamp now) {
        auto& window = windows[actor];

        if (inWindow(window, now)) {
            window.actionCount++;
        } else {
            window.windowStart = now;
            window.actionCount = 1;
        }
    }

    uint32_t RateLimiter::remaining(const Address& actor, Timestamp now) const {
        auto it = windows.find(actor);
        if (it == windows.end() || !inWindow(it->second, now)) {
            return maxActions;
        }
        if (it->second.actionCount >= maxActions) {
            return 0;
        }
        return maxActions - it->second.actionCount;
    }

    ThrottleWindow RateLimiter::windowOf(const Address& actor) const {
        auto it = windows.find(actor);
        return (it != windows.end()) ? it->second : ThrottleWindow();
    }

} // namespace gavel
