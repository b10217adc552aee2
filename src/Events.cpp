#include "gavel/Events.hpp"
#include <sstream>

namespace gavel {

    std::string eventTypeToString(EventType type) {
        switch (type) {
            case EventType::AuctionCreated:     return "AuctionCreated";
            case EventType::BidPlaced:          return "BidPlaced";
            case EventType::AuctionEnded:       return "AuctionEnded";
            case EventType::BidWithdrawn:       return "BidWithdrawn";
            case EventType::AuctionExtended:    return "AuctionExtended";
            case EventType::AuctionCanceled:    return "AuctionCanceled";
            case EventType::BidderBlacklisted:  return "BidderBlacklisted";
            case EventType::FeeUpdated:         return "FeeUpdated";
            case EventType::SystemStateChanged: return "SystemStateChanged";
            case EventType::SecurityAlert:      return "SecurityAlert";
            case EventType::MetricsUpdated:     return "MetricsUpdated";
            case EventType::EmergencyAction:    return "EmergencyAction";
        }
        return "Unknown";
    }

    bool isValidEventType(uint8_t raw) {
        return raw >= static_cast<uint8_t>(EventType::AuctionCreated) &&
               raw <= static_cast<uint8_t>(EventType::EmergencyAction);
    }

    std::string Event::stringForHash() const {
        std::stringstream ss;
        ss << previousHash << '|' << sequence << '|' << static_cast<int>(type) << '|'
           << auctionId << '|' << actor << '|' << amount << '|' << value << '|'
           << timestamp << '|' << detail;
        return ss.str();
    }

    Event makeEvent(EventType type, AuctionId auctionId, const Address& actor,
                    Amount amount, uint64_t value, Timestamp timestamp,
                    const std::string& detail) {
        Event event;
        event.type = type;
        event.auctionId = auctionId;
        event.actor = actor;
        event.amount = amount;
        event.value = value;
        event.timestamp = timestamp;
        event.detail = detail;
        return event;
    }

} // namespace gavel
