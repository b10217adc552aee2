#ifndef GAVEL_AUCTION_TYPES_HPP
#define GAVEL_AUCTION_TYPES_HPP

#include "gavel/Types.hpp"
#include <cstdint>
#include <string>

namespace gavel {

    using Amount = uint64_t;
    using Timestamp = uint64_t;   // segundos
    using AuctionId = uint64_t;
    using Address = std::string;  // 40 caracteres hex

    enum class Role : uint8_t {
        Admin      = 1,
        Auctioneer = 2,
        Operator   = 3,
        Maintainer = 4,
        Recovery   = 5
    };

    std::string roleToString(Role role);

    enum class SystemMode : uint8_t {
        Active      = 0,
        Maintenance = 1,
        Emergency   = 2
    };

    std::string systemModeToString(SystemMode mode);

    // Identidad del llamante y hora actual, suministradas en cada operación
    struct CallContext {
        Address caller;
        Timestamp now = 0;
    };

    // Prueba de pago que acompaña a una puja. Para la moneda nativa el valor
    // adjunto debe coincidir exactamente con el importe de la puja.
    struct PaymentProof {
        Amount attachedValue = 0;
        std::string reference;
    };

    struct AuctionParams {
        std::string asset;                       // referencia del activo subastado
        std::string paymentAsset = NATIVE_ASSET; // moneda nativa o token
        Amount reservePrice = 0;
        Amount buyNowPrice = 0;
        Amount minimumBidIncrement = 0;
        uint64_t durationSeconds = 0;
        uint64_t timeExtensionSeconds = 0;
        uint64_t extensionWindowSeconds = 0;
    };

    struct AuctionItem {
        AuctionId id = 0;
        std::string asset;
        std::string paymentAsset;
        Amount reservePrice = 0;
        Amount buyNowPrice = 0;
        Amount minimumBidIncrement = 0;
        uint64_t timeExtensionSeconds = 0;
        uint64_t extensionWindowSeconds = 0;
        Address owner;
        bool isActive = false;
        bool isCanceled = false;
        Timestamp startTime = 0;
        Timestamp endTime = 0;

        bool isNativePayment() const { return paymentAsset == NATIVE_ASSET; }
    };

    struct Bid {
        Address bidder;
        Amount amount = 0;
        Timestamp timestamp = 0;
        bool withdrawn = false;
    };

    struct HighestBid {
        Address bidder;   // vacío mientras no haya pujas
        Amount amount = 0;
    };

    struct SystemMetrics {
        uint64_t totalAuctions = 0;
        uint64_t activeAuctions = 0;
        Amount totalVolume = 0;
        Timestamp lastUpdateTimestamp = 0;
    };

    struct RateLimitStatus {
        uint32_t actionsRemaining = 0;
        Timestamp cooldownEnds = 0;
    };

} // namespace gavel

#endif // GAVEL_AUCTION_TYPES_HPP
