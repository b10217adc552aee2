#include "gavel/SystemState.hpp"
#include "gavel/Errors.hpp"

namespace gavel {

    void SystemStateController::assertOperable() const {
        if (currentMode != SystemMode::Active) {
            throw AuctionError(ErrorCode::InvalidSystemState,
                               "system is in " + systemModeToString(currentMode) + " mode");
        }
        assertNotPaused();
    }

    void SystemStateController::assertNotPaused() const {
        if (paused) {
            throw AuctionError(ErrorCode::EmergencyPaused, "system is paused");
        }
    }

    bool SystemStateController::setEmergency(bool enabled) {
        SystemMode target = enabled ? SystemMode::Emergency : SystemMode::Active;
        bool changed = (currentMode != target) || (paused != enabled);

        currentMode = target;
        paused = enabled;
        return changed;
    }

    bool SystemStateController::setMaintenance(bool enabled) {
        // La pausa no se toca: salir de mantenimiento desde Emergency deja el sistema pausado
        SystemMode target = enabled ? SystemMode::Maintenance : SystemMode::Active;
        bool changed = currentMode != target;

        currentMode = target;
        return changed;
    }

} // namespace gavel
