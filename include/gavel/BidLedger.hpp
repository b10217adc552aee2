#ifndef GAVEL_BID_LEDGER_HPP
#define GAVEL_BID_LEDGER_HPP

#include "gavel/AuctionTypes.hpp"
#include <unordered_map>
#include <vector>

namespace gavel {

    // Estado de pujas de una subasta
    struct BidBook {
        std::vector<Bid> bids;                           // solo se añaden
        HighestBid highest;
        std::unordered_map<Address, Amount> escrow;      // importes adeudados a pujadores superados

        Amount escrowOf(const Address& bidder) const;
        Amount escrowTotal() const;
        bool hasBids() const { return !bids.empty(); }
    };

    // Resultado de validar una puja; applyBid lo aplica sin poder fallar
    struct BidPlan {
        Address bidder;
        Amount amount = 0;
        Timestamp timestamp = 0;
        Address displacedBidder;         // vacío si no hay puja previa
        Amount displacedAmount = 0;
        bool extendsAuction = false;
        Timestamp newEndTime = 0;
        bool triggersBuyNow = false;
    };

    class BidLedger {
    public:
        /**
         * Read-only validation of a bid against an auction. Checks, in order:
         * auction active, bidder not blacklisted, auction not past its end,
         * amount above highest bid plus increment and at least the reserve,
         * native payment proof matching the amount.
         *
         * Throws AuctionError on the first failing condition.
         */
        static BidPlan planBid(const AuctionItem& item, const BidBook& book,
                               const Address& bidder, bool bidderBlacklisted,
                               Amount amount, const PaymentProof& proof, Timestamp now);

        static void applyBid(AuctionItem& item, BidBook& book, const BidPlan& plan);

        /**
         * Amount owed to the bidder. Throws AuctionError(InvalidAmount) when zero.
         */
        static Amount planWithdrawal(const BidBook& book, const Address& bidder);

        // Pone a cero la entrada de escrow; se llama antes de ordenar el pago
        static void zeroEscrow(BidBook& book, const Address& bidder);

        // Deshace zeroEscrow si la orden de pago falla
        static void restoreEscrow(BidBook& book, const Address& bidder, Amount amount);

        // includeStanding: la puja más alta también se devolvió (subasta cancelada)
        static void markWithdrawn(BidBook& book, const Address& bidder, bool includeStanding);

        static void creditEscrow(BidBook& book, const Address& bidder, Amount amount);

        /**
         * Throws std::out_of_range for an index past the last bid.
         */
        static const Bid& bidAt(const BidBook& book, size_t index);
    };

} // namespace gavel

#endif // GAVEL_BID_LEDGER_HPP
