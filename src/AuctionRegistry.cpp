#include "gavel/AuctionRegistry.hpp"
#include "gavel/Errors.hpp"
#include <limits>

namespace gavel {

    AuctionItem AuctionRegistry::makeItem(const AuctionParams& params, const Address& owner, Timestamp now) {
        if (params.asset.empty()) {
            throw AuctionError(ErrorCode::InvalidAmount, "auction asset cannot be empty");
        }
        if (params.paymentAsset.empty()) {
            throw AuctionError(ErrorCode::InvalidAmount, "payment asset cannot be empty");
        }
        if (params.reservePrice >= params.buyNowPrice) {
            throw AuctionError(ErrorCode::InvalidAmount,
                               "reserve price " + std::to_string(params.reservePrice) +
                               " must be below buy-now price " + std::to_string(params.buyNowPrice));
        }
        if (params.durationSeconds == 0) {
            throw AuctionError(ErrorCode::InvalidAmount, "duration must be positive");
        }
        if (now > std::numeric_limits<Timestamp>::max() - params.durationSeconds) {
            throw AuctionError(ErrorCode::InvalidAmount, "duration overflows end time");
        }

        AuctionItem item;
        item.asset = params.asset;
        item.paymentAsset = params.paymentAsset;
        item.reservePrice = params.reservePrice;
        item.buyNowPrice = params.buyNowPrice;
        item.minimumBidIncrement = params.minimumBidIncrement;
        item.timeExtensionSeconds = params.timeExtensionSeconds;
        item.extensionWindowSeconds = params.extensionWindowSeconds;
        item.owner = owner;
        item.isActive = true;
        item.isCanceled = false;
        item.startTime = now;
        item.endTime = now + params.durationSeconds;
        return item;
    }

    std::shared_ptr<AuctionRecord> AuctionRegistry::insert(AuctionItem item) {
        std::unique_lock<std::shared_mutex> lock(mapMtx);

        item.id = ++lastId;
        auto record = std::make_shared<AuctionRecord>();
        record->item = std::move(item);
        auctions[record->item.id] = record;
        return record;
    }

    std::shared_ptr<AuctionRecord> AuctionRegistry::find(AuctionId id) const {
        std::shared_lock<std::shared_mutex> lock(mapMtx);
        auto it = auctions.find(id);
        return (it != auctions.end()) ? it->second : nullptr;
    }

    std::shared_ptr<AuctionRecord> AuctionRegistry::require(AuctionId id) const {
        auto record = find(id);
        if (!record) {
            throw AuctionError(ErrorCode::InvalidAuction, "unknown auction " + std::to_string(id));
        }
        return record;
    }

    std::vector<AuctionId> AuctionRegistry::ids() const {
        std::shared_lock<std::shared_mutex> lock(mapMtx);
        std::vector<AuctionId> result;
        result.reserve(auctions.size());
        for (const auto& [id, record] : auctions) {
            result.push_back(id);
        }
        return result;
    }

    size_t AuctionRegistry::size() const {
        std::shared_lock<std::shared_mutex> lock(mapMtx);
        return auctions.size();
    }

    Settlement AuctionRegistry::planEnd(const AuctionItem& item, const BidBook& book,
                                        Timestamp now, bool explicitEnd, uint32_t feeBasisPoints) {
        if (item.isCanceled) {
            throw AuctionError(ErrorCode::InvalidAuction,
                               "auction " + std::to_string(item.id) + " was canceled");
        }
        if (!item.isActive) {
            throw AuctionError(ErrorCode::AuctionNotActive,
                               "auction " + std::to_string(item.id) + " already ended");
        }
        if (explicitEnd) {
            if (now < item.endTime) {
                throw AuctionError(ErrorCode::AuctionNotEnded,
                                   "auction " + std::to_string(item.id) + " runs until " +
                                   std::to_string(item.endTime));
            }
            if (book.highest.bidder.empty()) {
                throw AuctionError(ErrorCode::InvalidAuction,
                                   "auction " + std::to_string(item.id) + " has no bids");
            }
        }

        return makeSettlement(book.highest.bidder, book.highest.amount, feeBasisPoints);
    }

    Settlement AuctionRegistry::makeSettlement(const Address& winner, Amount winningBid, uint32_t feeBasisPoints) {
        Settlement settlement;
        settlement.winner = winner;
        settlement.winningBid = winningBid;
        settlement.fee = computeFee(winningBid, feeBasisPoints);
        settlement.ownerProceeds = winningBid - settlement.fee;
        return settlement;
    }

    void AuctionRegistry::applyEnd(AuctionItem& item) {
        item.isActive = false;
    }

    void AuctionRegistry::planCancel(const AuctionItem& item, const Address& caller, bool isAuctioneer) {
        if (caller != item.owner && !isAuctioneer) {
            throw AuctionError(ErrorCode::Unauthorized,
                               caller + " cannot cancel auction " + std::to_string(item.id));
        }
        if (item.isCanceled) {
            throw AuctionError(ErrorCode::InvalidAuction,
                               "auction " + std::to_string(item.id) + " already canceled");
        }
        if (!item.isActive) {
            throw AuctionError(ErrorCode::AuctionNotActive,
                               "auction " + std::to_string(item.id) + " already ended");
        }
    }

    void AuctionRegistry::applyCancel(AuctionItem& item, BidBook& book) {
        item.isActive = false;
        item.isCanceled = true;

        if (!book.highest.bidder.empty()) {
            BidLedger::creditEscrow(book, book.highest.bidder, book.highest.amount);
        }
    }

    Amount AuctionRegistry::computeFee(Amount amount, uint32_t feeBasisPoints) {
        // amount * bps / 10000 sin desbordar en 64 bits
        Amount whole = amount / BASIS_POINTS_DENOMINATOR;
        Amount rest = amount % BASIS_POINTS_DENOMINATOR;
        return whole * feeBasisPoints + (rest * feeBasisPoints) / BASIS_POINTS_DENOMINATOR;
    }

} // namespace gavel
