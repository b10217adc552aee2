#include "gavel/AuctionTypes.hpp"

namespace gavel {

    std::string roleToString(Role role) {
        switch (role) {
            case Role::Admin:      return "Admin";
            case Role::Auctioneer: return "Auctioneer";
            case Role::Operator:   return "Operator";
            case Role::Maintainer: return "Maintainer";
            case Role::Recovery:   return "Recovery";
        }
        return "Unknown";
    }

    std::string systemModeToString(SystemMode mode) {
        switch (mode) {
            case SystemMode::Active:      return "Active";
            case SystemMode::Maintenance: return "Maintenance";
            case SystemMode::Emergency:   return "Emergency";
        }
        return "Unknown";
    }

} // namespace gavel
