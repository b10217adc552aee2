#ifndef GAVEL_ERRORS_HPP
#define GAVEL_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace gavel {

    /**
     * Error kinds raised by the engine. Values are stable: they travel on the
     * wire as the response status byte (0 is reserved for success).
     */
    enum class ErrorCode : uint8_t {
        InvalidFeePercentage = 1,
        InvalidAuction       = 2,
        AuctionNotActive     = 3,
        BidTooLow            = 4,
        AuctionEnded         = 5,
        AuctionNotEnded      = 6,
        BlacklistedBidder    = 7,
        TransferFailed       = 8,
        InvalidAmount        = 9,
        Unauthorized         = 10,
        RateLimitExceeded    = 11,
        CooldownPeriod       = 12,
        InvalidSystemState   = 13,
        EmergencyPaused      = 14
    };

    /** Convierte un ErrorCode en string (útil para logs) */
    std::string errorCodeToString(ErrorCode code);

    /** Returns false for bytes that do not name an ErrorCode. */
    bool isValidErrorCode(uint8_t raw);

    class AuctionError : public std::runtime_error {
    public:
        AuctionError(ErrorCode code, const std::string& detail);
        explicit AuctionError(ErrorCode code);

        ErrorCode code() const noexcept { return errorCode; }

    private:
        ErrorCode errorCode;
    };

} // namespace gavel

#endif // GAVEL_ERRORS_HPP
