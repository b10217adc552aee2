#include "gavel/BidLedger.hpp"
#include "gavel/Errors.hpp"
#include <limits>
#include <stdexcept>

namespace gavel {

    Amount BidBook::escrowOf(const Address& bidder) const {
        auto it = escrow.find(bidder);
        return (it != escrow.end()) ? it->second : 0;
    }

    Amount BidBook::escrowTotal() const {
        Amount total = 0;
        for (const auto& [bidder, owed] : escrow) {
            total += owed;
        }
        return total;
    }

    BidPlan BidLedger::planBid(const AuctionItem& item, const BidBook& book,
                               const Address& bidder, bool bidderBlacklisted,
                               Amount amount, const PaymentProof& proof, Timestamp now) {
        if (!item.isActive) {
            throw AuctionError(ErrorCode::AuctionNotActive,
                               "auction " + std::to_string(item.id) + " is not active");
        }

        if (bidderBlacklisted) {
            throw AuctionError(ErrorCode::BlacklistedBidder, bidder + " is blacklisted");
        }

        if (now >= item.endTime) {
            throw AuctionError(ErrorCode::AuctionEnded,
                               "auction " + std::to_string(item.id) + " ended at " + std::to_string(item.endTime));
        }

        // amount > highest + increment, sin desbordar
        const Amount highest = book.highest.amount;
        if (amount <= highest || amount - highest <= item.minimumBidIncrement) {
            throw AuctionError(ErrorCode::BidTooLow,
                               "bid " + std::to_string(amount) + " must exceed " + std::to_string(highest) +
                               " + " + std::to_string(item.minimumBidIncrement));
        }

        if (amount < item.reservePrice) {
            throw AuctionError(ErrorCode::BidTooLow,
                               "bid " + std::to_string(amount) + " below reserve " + std::to_string(item.reservePrice));
        }

        if (item.isNativePayment() && proof.attachedValue != amount) {
            throw AuctionError(ErrorCode::InvalidAmount,
                               "attached value " + std::to_string(proof.attachedValue) +
                               " does not match bid " + std::to_string(amount));
        }

        BidPlan plan;
        plan.bidder = bidder;
        plan.amount = amount;
        plan.timestamp = now;

        if (!book.highest.bidder.empty()) {
            plan.displacedBidder = book.highest.bidder;
            plan.displacedAmount = highest;
        }

        // Anti-sniping: puja dentro de la ventana final
        bool inWindow = item.extensionWindowSeconds >= item.endTime - now;
        if (inWindow && item.timeExtensionSeconds > 0) {
            plan.extendsAuction = true;
            Timestamp maxEnd = std::numeric_limits<Timestamp>::max();
            plan.newEndTime = (item.endTime > maxEnd - item.timeExtensionSeconds)
                ? maxEnd
                : item.endTime + item.timeExtensionSeconds;
        } else {
            plan.newEndTime = item.endTime;
        }

        plan.triggersBuyNow = amount >= item.buyNowPrice;
        return plan;
    }

    void BidLedger::applyBid(AuctionItem& item, BidBook& book, const BidPlan& plan) {
        if (!plan.displacedBidder.empty()) {
            creditEscrow(book, plan.displacedBidder, plan.displacedAmount);
        }

        book.highest.bidder = plan.bidder;
        book.highest.amount = plan.amount;

        Bid bid;
        bid.bidder = plan.bidder;
        bid.amount = plan.amount;
        bid.timestamp = plan.timestamp;
        book.bids.push_back(bid);

        if (plan.extendsAuction) {
            item.endTime = plan.newEndTime;
        }
    }

    Amount BidLedger::planWithdrawal(const BidBook& book, const Address& bidder) {
        Amount owed = book.escrowOf(bidder);
        if (owed == 0) {
            throw AuctionError(ErrorCode::InvalidAmount, bidder + " has nothing to withdraw");
        }
        return owed;
    }

    void BidLedger::zeroEscrow(BidBook& book, const Address& bidder) {
        book.escrow.erase(bidder);
    }

    void BidLedger::restoreEscrow(BidBook& book, const Address& bidder, Amount amount) {
        book.escrow[bidder] = amount;
    }

    void BidLedger::markWithdrawn(BidBook& book, const Address& bidder, bool includeStanding) {
        for (auto& bid : book.bids) {
            // La puja ganadora vigente no se reembolsa por escrow salvo cancelación
            bool standing = !includeStanding &&
                            bid.bidder == book.highest.bidder && bid.amount == book.highest.amount;
            if (bid.bidder == bidder && !bid.withdrawn && !standing) {
                bid.withdrawn = true;
            }
        }
    }

    void BidLedger::creditEscrow(BidBook& book, const Address& bidder, Amount amount) {
        if (amount == 0) {
            return;
        }
        book.escrow[bidder] += amount;
    }

    const Bid& BidLedger::bidAt(const BidBook& book, size_t index) {
        if (index >= book.bids.size()) {
            throw std::out_of_range("Bid index " + std::to_string(index) + " out of range (" +
                                    std::to_string(book.bids.size()) + " bids)");
        }
        return book.bids[index];
    }

} // namespace gavel
