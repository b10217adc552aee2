#ifndef GAVEL_EVENTS_HPP
#define GAVEL_EVENTS_HPP

#include "gavel/AuctionTypes.hpp"
#include <cstdint>
#include <string>

namespace gavel {

    // ============================================================
    //  TIPOS DE EVENTO
    // ============================================================
    enum class EventType : uint8_t {
        AuctionCreated     = 1,
        BidPlaced          = 2,
        AuctionEnded       = 3,
        BidWithdrawn       = 4,
        AuctionExtended    = 5,
        AuctionCanceled    = 6,
        BidderBlacklisted  = 7,
        FeeUpdated         = 8,
        SystemStateChanged = 9,
        SecurityAlert      = 10,
        MetricsUpdated     = 11,
        EmergencyAction    = 12
    };

    std::string eventTypeToString(EventType type);
    bool isValidEventType(uint8_t raw);

    /**
     * One entry of the audit stream.
     *
     * amount and value are event specific: for BidPlaced amount is the bid and
     * value the auction end time; for AuctionExtended value is the new end time;
     * for AuctionEnded amount is the winning bid and value the fee taken; for
     * MetricsUpdated amount is totalVolume and value activeAuctions.
     */
    struct Event {
        uint64_t sequence = 0;
        EventType type = EventType::MetricsUpdated;
        AuctionId auctionId = 0;
        Address actor;
        Amount amount = 0;
        uint64_t value = 0;
        Timestamp timestamp = 0;
        std::string detail;
        std::string previousHash;   // hex
        std::string hash;           // hex, SHA-256

        std::string stringForHash() const;
    };

    Event makeEvent(EventType type, AuctionId auctionId, const Address& actor,
                    Amount amount, uint64_t value, Timestamp timestamp,
                    const std::string& detail = "");

} // namespace gavel

#endif // GAVEL_EVENTS_HPP
