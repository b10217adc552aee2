#ifndef GAVEL_AUCTION_REGISTRY_HPP
#define GAVEL_AUCTION_REGISTRY_HPP

#include "gavel/AuctionTypes.hpp"
#include "gavel/BidLedger.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace gavel {

    // Subasta y su libro de pujas, protegidos por un mutex propio
    struct AuctionRecord {
        mutable std::mutex mtx;
        AuctionItem item;
        BidBook book;
    };

    // Liquidación calculada antes de ordenar transferencias
    struct Settlement {
        Address winner;
        Amount winningBid = 0;
        Amount fee = 0;
        Amount ownerProceeds = 0;
    };

    /**
     * Owns every auction record. The map itself is guarded by a shared
     * mutex; each record carries its own mutex for per-auction operations.
     */
    class AuctionRegistry {
        public:
            AuctionRegistry() = default;

            /**
             * Validates creation parameters and builds the item (id still 0).
             * Throws AuctionError(InvalidAmount) on bad parameters.
             */
            static AuctionItem makeItem(const AuctionParams& params, const Address& owner, Timestamp now);

            // Asigna el siguiente id (desde 1) y guarda el registro
            std::shared_ptr<AuctionRecord> insert(AuctionItem item);

            // nullptr si no existe
            std::shared_ptr<AuctionRecord> find(AuctionId id) const;

            /**
             * Throws AuctionError(InvalidAuction) for an unknown id.
             */
            std::shared_ptr<AuctionRecord> require(AuctionId id) const;

            std::vector<AuctionId> ids() const;
            size_t size() const;

            /**
             * Checks that the auction can be settled. explicitEnd adds the
             * end-time and has-bids checks of a caller-requested end; buy-now
             * settlement skips them. Throws AuctionError.
             */
            static Settlement planEnd(const AuctionItem& item, const BidBook& book,
                                      Timestamp now, bool explicitEnd, uint32_t feeBasisPoints);

            static Settlement makeSettlement(const Address& winner, Amount winningBid, uint32_t feeBasisPoints);

            static void applyEnd(AuctionItem& item);

            /**
             * Checks that caller may cancel the auction. isAuctioneer is the
             * caller's Auctioneer role membership. Throws AuctionError.
             */
            static void planCancel(const AuctionItem& item, const Address& caller, bool isAuctioneer);

            /**
             * Marks the auction canceled and moves the standing highest bid
             * into its bidder's escrow.
             */
            static void applyCancel(AuctionItem& item, BidBook& book);

            static Amount computeFee(Amount amount, uint32_t feeBasisPoints);

        private:
            mutable std::shared_mutex mapMtx;
            std::map<AuctionId, std::shared_ptr<AuctionRecord>> auctions;
            AuctionId lastId = 0;
    };

} // namespace gavel

#endif // GAVEL_AUCTION_REGISTRY_HPP
