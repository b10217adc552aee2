#ifndef GAVEL_SYSTEM_STATE_HPP
#define GAVEL_SYSTEM_STATE_HPP

#include "gavel/AuctionTypes.hpp"

namespace gavel {

    /**
     * Global circuit breaker: Active / Maintenance / Emergency plus an
     * independent pause flag.
     *
     * Emergency always implies pause; Maintenance never touches it.
     */
    class SystemStateController {
        public:
            SystemStateController() = default;

            /**
             * Throws InvalidSystemState unless Active, then EmergencyPaused if paused.
             */
            void assertOperable() const;

            /**
             * Throws EmergencyPaused if paused, whatever the mode.
             */
            void assertNotPaused() const;

            // Devuelve true si cambió el estado
            bool setEmergency(bool enabled);
            bool setMaintenance(bool enabled);

            SystemMode mode() const { return currentMode; }
            bool isPaused() const { return paused; }

        private:
            SystemMode currentMode = SystemMode::Active;
            bool paused = false;
    };

} // namespace gavel

#endif // GAVEL_SYSTEM_STATE_HPP
