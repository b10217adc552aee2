#include "gavel/Errors.hpp"

namespace gavel {

    std::string errorCodeToString(ErrorCode code) {
        switch (code) {
            case ErrorCode::InvalidFeePercentage: return "InvalidFeePercentage";
            case ErrorCode::InvalidAuction:       return "InvalidAuction";
            case ErrorCode::AuctionNotActive:     return "AuctionNotActive";
            case ErrorCode::BidTooLow:            return "BidTooLow";
            case ErrorCode::AuctionEnded:         return "AuctionEnded";
            case ErrorCode::AuctionNotEnded:      return "AuctionNotEnded";
            case ErrorCode::BlacklistedBidder:    return "BlacklistedBidder";
            case ErrorCode::TransferFailed:       return "TransferFailed";
            case ErrorCode::InvalidAmount:        return "InvalidAmount";
            case ErrorCode::Unauthorized:         return "Unauthorized";
            case ErrorCode::RateLimitExceeded:    return "RateLimitExceeded";
            case ErrorCode::CooldownPeriod:       return "CooldownPeriod";
            case ErrorCode::InvalidSystemState:   return "InvalidSystemState";
            case ErrorCode::EmergencyPaused:      return "EmergencyPaused";
        }
        return "Unknown";
    }

    bool isValidErrorCode(uint8_t raw) {
        return raw >= static_cast<uint8_t>(ErrorCode::InvalidFeePercentage) &&
               raw <= static_cast<uint8_t>(ErrorCode::EmergencyPaused);
    }

    AuctionError::AuctionError(ErrorCode code, const std::string& detail)
        : std::runtime_error(errorCodeToString(code) + ": " + detail), errorCode(code) {}

    AuctionError::AuctionError(ErrorCode code)
        : std::runtime_error(errorCodeToString(code)), errorCode(code) {}

} // namespace gavel
