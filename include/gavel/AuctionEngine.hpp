#ifndef GAVEL_AUCTION_ENGINE_HPP
#define GAVEL_AUCTION_ENGINE_HPP

#include "gavel/AccessControl.hpp"
#include "gavel/AuctionRegistry.hpp"
#include "gavel/AuctionTypes.hpp"
#include "gavel/CooldownGuard.hpp"
#include "gavel/EventLog.hpp"
#include "gavel/Metrics.hpp"
#include "gavel/PaymentAdapter.hpp"
#include "gavel/RateLimiter.hpp"
#include "gavel/SystemState.hpp"
#include <array>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace gavel {

    struct RoleGrant {
        Address actor;
        Role role;
    };

    // ============================================================
    //  CONFIGURACIÓN DEL MOTOR
    // ============================================================

    struct EngineConfig {
        Address admin;                                   // recibe todos los roles
        uint32_t feeBasisPoints = 0;
        Address feeRecipient;                            // vacío: el admin
        std::vector<RoleGrant> initialRoles;
        uint64_t rateLimitPeriod = RATE_LIMIT_PERIOD;
        uint32_t maxActionsPerPeriod = MAX_ACTIONS_PER_PERIOD;
        uint64_t actionCooldown = ACTION_COOLDOWN;
        Address custodyAccount;                          // cuenta del motor en el adaptador de pagos
    };

    /**
     * Multi-auction escrow and bidding engine.
     *
     * Every mutating operation validates all of its preconditions before it
     * changes anything; a failed call leaves auctions, escrow, quotas, metrics
     * and the event log untouched. Events of one operation are appended to
     * the log while its locks are held, so log order matches commit order;
     * subscribers are called once the locks are released.
     *
     * Lock order: actor stripe, control, auction record, then the short
     * throttle / treasury / metrics locks.
     */
    class AuctionEngine {
        public:
            /**
             * Throws std::invalid_argument for a malformed admin, fee recipient
             * or role grant address, AuctionError(InvalidFeePercentage) for a
             * fee above MAX_FEE_BASIS_POINTS.
             */
            AuctionEngine(const EngineConfig& config, PaymentAdapter& paymentAdapter);

            AuctionEngine(const AuctionEngine&) = delete;
            AuctionEngine& operator=(const AuctionEngine&) = delete;

            // ---- Subastas ----
            AuctionId createAuction(const CallContext& ctx, const AuctionParams& params);
            void placeBid(const CallContext& ctx, AuctionId auctionId, Amount amount, const PaymentProof& proof);
            void endAuction(const CallContext& ctx, AuctionId auctionId);
            void cancelAuction(const CallContext& ctx, AuctionId auctionId);
            Amount withdrawFunds(const CallContext& ctx, AuctionId auctionId);

            // ---- Administración ----
            void setEmergencyState(const CallContext& ctx, bool enabled);
            void setMaintenanceMode(const CallContext& ctx, bool enabled);
            void recoverToken(const CallContext& ctx, const std::string& asset, Amount amount);
            void blacklistBidder(const CallContext& ctx, const Address& bidder, bool blacklisted);
            void updatePlatformFee(const CallContext& ctx, uint32_t feeBasisPoints);
            void grantRole(const CallContext& ctx, const Address& actor, Role role);
            void revokeRole(const CallContext& ctx, const Address& actor, Role role);

            // ---- Consultas ----
            AuctionItem getAuction(AuctionId auctionId) const;
            HighestBid getHighestBid(AuctionId auctionId) const;
            size_t getBidCount(AuctionId auctionId) const;
            Bid getBid(AuctionId auctionId, size_t index) const;
            Amount escrowBalance(AuctionId auctionId, const Address& bidder) const;
            std::vector<AuctionId> auctionIds() const;

            SystemMetrics getSystemMetrics() const;
            RateLimitStatus checkRateLimit(const Address& actor, Timestamp now) const;

            SystemMode systemMode() const;
            bool isPaused() const;
            uint32_t platformFee() const;
            Address feeRecipientAddress() const;
            bool hasRole(const Address& actor, Role role) const;
            bool isBlacklisted(const Address& actor) const;

            // Fondos que recoverToken no puede tocar
            Amount protectedBalance(const std::string& asset) const;

            EventLog& events() { return eventLog; }
            const EventLog& events() const { return eventLog; }

        private:
            static constexpr size_t ACTOR_LOCK_STRIPES = 64;

            // Dirección normalizada del llamante; Unauthorized si está mal formada
            static Address callerOf(const CallContext& ctx);
            std::mutex& actorLock(const Address& actor);

            void reserveProtected(const std::string& asset, Amount amount);
            void releaseProtected(const std::string& asset, Amount amount);

            /**
             * Issues the settlement transfers: asset to winner, proceeds to
             * owner, fee to recipient. On a failed step the earlier steps are
             * reversed and false is returned.
             */
            bool executeSettlement(const AuctionItem& item, const Settlement& settlement,
                                   const Address& recipient);

            Event metricsEvent(Timestamp now) const;

            PaymentAdapter& adapter;

            AuctionRegistry registry;
            MetricsAggregator metrics;
            EventLog eventLog;

            // Estado de control: roles, lista negra, modo del sistema y comisión
            mutable std::shared_mutex controlMtx;
            AccessControl access;
            SystemStateController state;
            uint32_t feeBps;
            Address feeRecipient;

            mutable std::mutex throttleMtx;
            RateLimiter rateLimiter;
            CooldownGuard cooldownGuard;

            mutable std::mutex treasuryMtx;
            std::map<std::string, Amount> protectedFunds;

            std::array<std::mutex, ACTOR_LOCK_STRIPES> actorLocks;
    };

} // namespace gavel

#endif // GAVEL_AUCTION_ENGINE_HPP
