#include "gavel/AuctionEngine.hpp"
#include "gavel/AddressManager.hpp"
#include "gavel/Errors.hpp"
#include <functional>
#include <iostream>
#include <stdexcept>

namespace gavel {

    // ============================================================
    //  CONSTRUCCIÓN
    // ============================================================

    AuctionEngine::AuctionEngine(const EngineConfig& config, PaymentAdapter& paymentAdapter)
        : adapter(paymentAdapter),
          feeBps(config.feeBasisPoints),
          rateLimiter(config.rateLimitPeriod, config.maxActionsPerPeriod),
          cooldownGuard(config.actionCooldown) {

        Address admin = AddressManager::normalizeAddress(config.admin);

        if (config.feeBasisPoints > MAX_FEE_BASIS_POINTS) {
            throw AuctionError(ErrorCode::InvalidFeePercentage,
                               "fee " + std::to_string(config.feeBasisPoints) + " exceeds " +
                               std::to_string(MAX_FEE_BASIS_POINTS) + " basis points");
        }

        feeRecipient = config.feeRecipient.empty()
            ? admin
            : AddressManager::normalizeAddress(config.feeRecipient);

        for (Role role : {Role::Admin, Role::Auctioneer, Role::Operator, Role::Maintainer, Role::Recovery}) {
            access.grantRole(admin, role);
        }

        for (const auto& grant : config.initialRoles) {
            access.grantRole(AddressManager::normalizeAddress(grant.actor), grant.role);
        }
    }

    // ============================================================
    //  AUXILIARES
    // ============================================================

    Address AuctionEngine::callerOf(const CallContext& ctx) {
        if (!AddressManager::isValidAddress(ctx.caller)) {
            throw AuctionError(ErrorCode::Unauthorized, "malformed caller address '" + ctx.caller + "'");
        }
        return AddressManager::normalizeAddress(ctx.caller);
    }

    std::mutex& AuctionEngine::actorLock(const Address& actor) {
        return actorLocks[std::hash<Address>{}(actor) % ACTOR_LOCK_STRIPES];
    }

    void AuctionEngine::reserveProtected(const std::string& asset, Amount amount) {
        std::lock_guard<std::mutex> lock(treasuryMtx);
        protectedFunds[asset] += amount;
    }

    void AuctionEngine::releaseProtected(const std::string& asset, Amount amount) {
        std::lock_guard<std::mutex> lock(treasuryMtx);
        auto it = protectedFunds.find(asset);
        if (it == protectedFunds.end()) {
            return;
        }
        it->second = (it->second > amount) ? it->second - amount : 0;
        if (it->second == 0) {
            protectedFunds.erase(it);
        }
    }

    bool AuctionEngine::executeSettlement(const AuctionItem& item, const Settlement& settlement,
                                          const Address& recipient) {
        if (!adapter.release(item.asset, settlement.winner, ASSET_UNIT)) {
            std::cerr << "Error: Failed to deliver asset " << item.asset << " of auction " << item.id
                      << " to " << settlement.winner << std::endl;
            return false;
        }

        if (settlement.ownerProceeds > 0 &&
            !adapter.release(item.paymentAsset, item.owner, settlement.ownerProceeds)) {
            std::cerr << "Error: Failed to pay " << settlement.ownerProceeds << " to owner of auction "
                      << item.id << std::endl;
            if (!adapter.custody(item.asset, settlement.winner, ASSET_UNIT)) {
                std::cerr << "Error: Compensation failed: asset " << item.asset << " remains with "
                          << settlement.winner << std::endl;
            }
            return false;
        }

        if (settlement.fee > 0 && !adapter.release(item.paymentAsset, recipient, settlement.fee)) {
            std::cerr << "Error: Failed to pay fee " << settlement.fee << " for auction " << item.id << std::endl;
            if (settlement.ownerProceeds > 0 &&
                !adapter.pull(item.paymentAsset, item.owner, settlement.ownerProceeds)) {
                std::cerr << "Error: Compensation failed: proceeds remain with " << item.owner << std::endl;
            }
            if (!adapter.custody(item.asset, settlement.winner, ASSET_UNIT)) {
                std::cerr << "Error: Compensation failed: asset " << item.asset << " remains with "
                          << settlement.winner << std::endl;
            }
            return false;
        }

        return true;
    }

    Event AuctionEngine::metricsEvent(Timestamp now) const {
        SystemMetrics snapshot = metrics.snapshot();
        return makeEvent(EventType::MetricsUpdated, 0, "", snapshot.totalVolume, snapshot.activeAuctions, now);
    }

    // ============================================================
    //  SUBASTAS
    // ============================================================

    AuctionId AuctionEngine::createAuction(const CallContext& ctx, const AuctionParams& params) {
        const Address owner = callerOf(ctx);
        std::lock_guard<std::mutex> actorGuard(actorLock(owner));

        std::vector<Event> events;
        AuctionId auctionId = 0;
        {
            std::shared_lock<std::shared_mutex> control(controlMtx);
            state.assertOperable();
            {
                std::lock_guard<std::mutex> throttle(throttleMtx);
                rateLimiter.check(owner, ctx.now);
            }

            AuctionItem item = AuctionRegistry::makeItem(params, owner, ctx.now);

            reserveProtected(item.asset, ASSET_UNIT);
            if (!adapter.custody(item.asset, owner, ASSET_UNIT)) {
                releaseProtected(item.asset, ASSET_UNIT);
                std::cerr << "Warning: Custody of " << item.asset << " from " << owner << " failed" << std::endl;
                throw AuctionError(ErrorCode::TransferFailed, "could not take custody of " + item.asset);
            }

            // A partir de aquí nada puede fallar
            auto record = registry.insert(std::move(item));
            auctionId = record->item.id;
            {
                std::lock_guard<std::mutex> throttle(throttleMtx);
                rateLimiter.record(owner, ctx.now);
            }
            metrics.auctionCreated(ctx.now);

            events.push_back(makeEvent(EventType::AuctionCreated, auctionId, owner,
                                       record->item.reservePrice, record->item.endTime, ctx.now,
                                       record->item.asset));
            events.push_back(metricsEvent(ctx.now));

            eventLog.append(std::move(events));
        }

        std::cout << "Auction " << auctionId << " created by " << owner << std::endl;
        eventLog.dispatch();
        return auctionId;
    }

    void AuctionEngine::placeBid(const CallContext& ctx, AuctionId auctionId, Amount amount,
                                 const PaymentProof& proof) {
        const Address bidder = callerOf(ctx);
        std::lock_guard<std::mutex> actorGuard(actorLock(bidder));

        std::vector<Event> events;
        bool soldAtBuyNow = false;
        {
            std::shared_lock<std::shared_mutex> control(controlMtx);
            state.assertOperable();
            {
                std::lock_guard<std::mutex> throttle(throttleMtx);
                rateLimiter.check(bidder, ctx.now);
                cooldownGuard.check(bidder, ctx.now);
            }

            auto record = registry.require(auctionId);
            std::lock_guard<std::mutex> auctionGuard(record->mtx);
            AuctionItem& item = record->item;

            bool blacklisted = access.isBlacklisted(bidder);
            if (blacklisted && item.isActive) {
                std::cerr << "Warning: Blacklisted bidder " << bidder << " attempted to bid on auction "
                          << auctionId << std::endl;
            }

            BidPlan plan = BidLedger::planBid(item, record->book, bidder, blacklisted, amount, proof, ctx.now);

            Settlement settlement;
            if (plan.triggersBuyNow) {
                settlement = AuctionRegistry::makeSettlement(bidder, amount, feeBps);
            }

            reserveProtected(item.paymentAsset, amount);
            if (!adapter.pull(item.paymentAsset, bidder, amount)) {
                releaseProtected(item.paymentAsset, amount);
                std::cerr << "Warning: Payment of " << amount << " " << item.paymentAsset << " from "
                          << bidder << " failed" << std::endl;
                throw AuctionError(ErrorCode::TransferFailed, "could not collect bid from " + bidder);
            }

            if (plan.triggersBuyNow && !executeSettlement(item, settlement, feeRecipient)) {
                // Devolver lo cobrado: la puja no se aplica
                if (!adapter.release(item.paymentAsset, bidder, amount)) {
                    std::cerr << "Error: Compensation failed: " << amount << " " << item.paymentAsset
                              << " not returned to " << bidder << std::endl;
                }
                releaseProtected(item.paymentAsset, amount);
                throw AuctionError(ErrorCode::TransferFailed,
                                   "buy-now settlement of auction " + std::to_string(auctionId) + " failed");
            }

            // Commit
            BidLedger::applyBid(item, record->book, plan);
            {
                std::lock_guard<std::mutex> throttle(throttleMtx);
                rateLimiter.record(bidder, ctx.now);
                cooldownGuard.record(bidder, ctx.now);
            }
            metrics.volumeAdded(amount, ctx.now);

            if (plan.extendsAuction) {
                events.push_back(makeEvent(EventType::AuctionExtended, auctionId, bidder,
                                           item.timeExtensionSeconds, item.endTime, ctx.now));
            }
            events.push_back(makeEvent(EventType::BidPlaced, auctionId, bidder, amount, item.endTime, ctx.now));

            if (plan.triggersBuyNow) {
                AuctionRegistry::applyEnd(item);
                metrics.auctionClosed(ctx.now);
                releaseProtected(item.paymentAsset, amount);
                releaseProtected(item.asset, ASSET_UNIT);
                events.push_back(makeEvent(EventType::AuctionEnded, auctionId, bidder,
                                           settlement.winningBid, settlement.fee, ctx.now, item.owner));
                soldAtBuyNow = true;
            }

            events.push_back(metricsEvent(ctx.now));

            eventLog.append(std::move(events));
        }

        if (soldAtBuyNow) {
            std::cout << "Auction " << auctionId << " sold at buy-now price to " << bidder << std::endl;
        }
        eventLog.dispatch();
    }

    void AuctionEngine::endAuction(const CallContext& ctx, AuctionId auctionId) {
        callerOf(ctx);

        std::vector<Event> events;
        Settlement settlement;
        {
            std::shared_lock<std::shared_mutex> control(controlMtx);
            state.assertNotPaused();

            auto record = registry.require(auctionId);
            std::lock_guard<std::mutex> auctionGuard(record->mtx);
            AuctionItem& item = record->item;

            settlement = AuctionRegistry::planEnd(item, record->book, ctx.now, true, feeBps);

            if (!executeSettlement(item, settlement, feeRecipient)) {
                throw AuctionError(ErrorCode::TransferFailed,
                                   "settlement of auction " + std::to_string(auctionId) + " failed");
            }

            AuctionRegistry::applyEnd(item);
            metrics.auctionClosed(ctx.now);
            releaseProtected(item.paymentAsset, settlement.winningBid);
            releaseProtected(item.asset, ASSET_UNIT);

            events.push_back(makeEvent(EventType::AuctionEnded, auctionId, settlement.winner,
                                       settlement.winningBid, settlement.fee, ctx.now, item.owner));
            events.push_back(metricsEvent(ctx.now));

            eventLog.append(std::move(events));
        }

        std::cout << "Auction " << auctionId << " ended; winner " << settlement.winner
                  << " paid " << settlement.winningBid << std::endl;
        eventLog.dispatch();
    }

    void AuctionEngine::cancelAuction(const CallContext& ctx, AuctionId auctionId) {
        const Address caller = callerOf(ctx);

        std::vector<Event> events;
        {
            std::shared_lock<std::shared_mutex> control(controlMtx);

            auto record = registry.require(auctionId);
            std::lock_guard<std::mutex> auctionGuard(record->mtx);
            AuctionItem& item = record->item;

            AuctionRegistry::planCancel(item, caller, access.hasRole(caller, Role::Auctioneer));

            if (!adapter.release(item.asset, item.owner, ASSET_UNIT)) {
                std::cerr << "Error: Failed to return asset " << item.asset << " of auction " << auctionId
                          << " to " << item.owner << std::endl;
                throw AuctionError(ErrorCode::TransferFailed, "could not return " + item.asset);
            }

            Amount refunded = record->book.highest.amount;
            AuctionRegistry::applyCancel(item, record->book);
            metrics.auctionClosed(ctx.now);
            releaseProtected(item.asset, ASSET_UNIT);

            events.push_back(makeEvent(EventType::AuctionCanceled, auctionId, caller,
                                       refunded, 0, ctx.now, item.owner));
            events.push_back(metricsEvent(ctx.now));

            eventLog.append(std::move(events));
        }

        std::cout << "Auction " << auctionId << " canceled by " << caller << std::endl;
        eventLog.dispatch();
    }

    Amount AuctionEngine::withdrawFunds(const CallContext& ctx, AuctionId auctionId) {
        const Address bidder = callerOf(ctx);

        std::vector<Event> events;
        Amount owed = 0;
        {
            auto record = registry.require(auctionId);
            std::lock_guard<std::mutex> auctionGuard(record->mtx);
            AuctionItem& item = record->item;

            owed = BidLedger::planWithdrawal(record->book, bidder);

            // La entrada se pone a cero antes de ordenar el pago
            BidLedger::zeroEscrow(record->book, bidder);
            if (!adapter.release(item.paymentAsset, bidder, owed)) {
                BidLedger::restoreEscrow(record->book, bidder, owed);
                std::cerr << "Warning: Withdrawal of " << owed << " by " << bidder << " from auction "
                          << auctionId << " failed" << std::endl;
                throw AuctionError(ErrorCode::TransferFailed, "could not pay out " + std::to_string(owed));
            }

            BidLedger::markWithdrawn(record->book, bidder, item.isCanceled);
            releaseProtected(item.paymentAsset, owed);

            events.push_back(makeEvent(EventType::BidWithdrawn, auctionId, bidder, owed, 0, ctx.now));

            eventLog.append(std::move(events));
        }

        eventLog.dispatch();
        return owed;
    }

    // ============================================================
    //  ADMINISTRACIÓN
    // ============================================================

    void AuctionEngine::setEmergencyState(const CallContext& ctx, bool enabled) {
        const Address caller = callerOf(ctx);

        std::vector<Event> events;
        {
            std::unique_lock<std::shared_mutex> control(controlMtx);
            access.requireRole(caller, Role::Admin);

            if (!state.setEmergency(enabled)) {
                return;
            }

            const std::string detail = enabled ? "emergency enabled" : "emergency cleared";
            events.push_back(makeEvent(EventType::SystemStateChanged, 0, caller, 0,
                                       static_cast<uint64_t>(state.mode()), ctx.now, detail));
            events.push_back(makeEvent(EventType::EmergencyAction, 0, caller, 0,
                                       state.isPaused() ? 1 : 0, ctx.now, detail));

            eventLog.append(std::move(events));
        }

        std::cout << "System state: " << (enabled ? "EMERGENCY" : "ACTIVE") << " (by " << caller << ")" << std::endl;
        eventLog.dispatch();
    }

    void AuctionEngine::setMaintenanceMode(const CallContext& ctx, bool enabled) {
        const Address caller = callerOf(ctx);

        std::vector<Event> events;
        {
            std::unique_lock<std::shared_mutex> control(controlMtx);
            access.requireRole(caller, Role::Maintainer);

            if (!state.setMaintenance(enabled)) {
                return;
            }

            events.push_back(makeEvent(EventType::SystemStateChanged, 0, caller, 0,
                                       static_cast<uint64_t>(state.mode()), ctx.now,
                                       enabled ? "maintenance enabled" : "maintenance cleared"));

            eventLog.append(std::move(events));
        }

        std::cout << "System state: " << (enabled ? "MAINTENANCE" : "ACTIVE") << " (by " << caller << ")" << std::endl;
        eventLog.dispatch();
    }

    void AuctionEngine::recoverToken(const CallContext& ctx, const std::string& asset, Amount amount) {
        const Address caller = callerOf(ctx);

        std::vector<Event> events;
        {
            std::shared_lock<std::shared_mutex> control(controlMtx);
            access.requireRole(caller, Role::Recovery);

            if (asset.empty() || amount == 0) {
                throw AuctionError(ErrorCode::InvalidAmount, "nothing to recover");
            }

            std::lock_guard<std::mutex> treasury(treasuryMtx);
            Amount held = adapter.balanceOf(asset);
            auto it = protectedFunds.find(asset);
            Amount locked = (it != protectedFunds.end()) ? it->second : 0;
            Amount recoverable = (held > locked) ? held - locked : 0;

            if (amount > recoverable) {
                std::cerr << "Warning: Recovery of " << amount << " " << asset << " by " << caller
                          << " refused; only " << recoverable << " unprotected" << std::endl;
                throw AuctionError(ErrorCode::InvalidAmount,
                                   "only " + std::to_string(recoverable) + " " + asset + " recoverable");
            }

            if (!adapter.release(asset, caller, amount)) {
                std::cerr << "Error: Recovery transfer of " << amount << " " << asset << " failed" << std::endl;
                throw AuctionError(ErrorCode::TransferFailed, "could not release " + asset);
            }

            events.push_back(makeEvent(EventType::EmergencyAction, 0, caller, amount, 0, ctx.now,
                                       "recovered " + asset));

            eventLog.append(std::move(events));
        }

        std::cout << "Recovered " << amount << " " << asset << " to " << caller << std::endl;
        eventLog.dispatch();
    }

    void AuctionEngine::blacklistBidder(const CallContext& ctx, const Address& bidder, bool blacklisted) {
        const Address caller = callerOf(ctx);

        std::vector<Event> events;
        {
            std::unique_lock<std::shared_mutex> control(controlMtx);
            access.requireAnyRole(caller, {Role::Admin, Role::Operator});

            Address target = AddressManager::normalizeAddress(bidder);
            if (!access.setBlacklisted(target, blacklisted)) {
                return;
            }

            events.push_back(makeEvent(EventType::BidderBlacklisted, 0, target, 0,
                                       blacklisted ? 1 : 0, ctx.now, caller));

            eventLog.append(std::move(events));
        }

        eventLog.dispatch();
    }

    void AuctionEngine::updatePlatformFee(const CallContext& ctx, uint32_t feeBasisPoints) {
        const Address caller = callerOf(ctx);

        std::vector<Event> events;
        {
            std::unique_lock<std::shared_mutex> control(controlMtx);
            access.requireRole(caller, Role::Admin);

            if (feeBasisPoints > MAX_FEE_BASIS_POINTS) {
                throw AuctionError(ErrorCode::InvalidFeePercentage,
                                   "fee " + std::to_string(feeBasisPoints) + " exceeds " +
                                   std::to_string(MAX_FEE_BASIS_POINTS) + " basis points");
            }

            uint32_t previous = feeBps;
            feeBps = feeBasisPoints;

            events.push_back(makeEvent(EventType::FeeUpdated, 0, caller, feeBasisPoints, previous, ctx.now));

            eventLog.append(std::move(events));
        }

        eventLog.dispatch();
    }

    void AuctionEngine::grantRole(const CallContext& ctx, const Address& actor, Role role) {
        const Address caller = callerOf(ctx);

        std::vector<Event> events;
        {
            std::unique_lock<std::shared_mutex> control(controlMtx);
            access.requireRole(caller, Role::Admin);

            Address target = AddressManager::normalizeAddress(actor);
            if (!access.grantRole(target, role)) {
                return;
            }

            events.push_back(makeEvent(EventType::SecurityAlert, 0, target, 0, static_cast<uint64_t>(role),
                                       ctx.now, roleToString(role) + " granted by " + caller));

            eventLog.append(std::move(events));
        }

        eventLog.dispatch();
    }

    void AuctionEngine::revokeRole(const CallContext& ctx, const Address& actor, Role role) {
        const Address caller = callerOf(ctx);

        std::vector<Event> events;
        {
            std::unique_lock<std::shared_mutex> control(controlMtx);
            access.requireRole(caller, Role::Admin);

            Address target = AddressManager::normalizeAddress(actor);
            if (!access.revokeRole(target, role)) {
                return;
            }

            events.push_back(makeEvent(EventType::SecurityAlert, 0, target, 0, static_cast<uint64_t>(role),
                                       ctx.now, roleToString(role) + " revoked by " + caller));

            eventLog.append(std::move(events));
        }

        std::cerr << "Warning: Role " << roleToString(role) << " revoked from " << actor << std::endl;
        eventLog.dispatch();
    }

    // ============================================================
    //  CONSULTAS
    // ============================================================

    AuctionItem AuctionEngine::getAuction(AuctionId auctionId) const {
        auto record = registry.require(auctionId);
        std::lock_guard<std::mutex> auctionGuard(record->mtx);
        return record->item;
    }

    HighestBid AuctionEngine::getHighestBid(AuctionId auctionId) const {
        auto record = registry.require(auctionId);
        std::lock_guard<std::mutex> auctionGuard(record->mtx);
        return record->book.highest;
    }

    size_t AuctionEngine::getBidCount(AuctionId auctionId) const {
        auto record = registry.require(auctionId);
        std::lock_guard<std::mutex> auctionGuard(record->mtx);
        return record->book.bids.size();
    }

    Bid AuctionEngine::getBid(AuctionId auctionId, size_t index) const {
        auto record = registry.require(auctionId);
        std::lock_guard<std::mutex> auctionGuard(record->mtx);
        return BidLedger::bidAt(record->book, index);
    }

    Amount AuctionEngine::escrowBalance(AuctionId auctionId, const Address& bidder) const {
        auto record = registry.require(auctionId);
        std::lock_guard<std::mutex> auctionGuard(record->mtx);
        return record->book.escrowOf(AddressManager::normalizeAddress(bidder));
    }

    std::vector<AuctionId> AuctionEngine::auctionIds() const {
        return registry.ids();
    }

    SystemMetrics AuctionEngine::getSystemMetrics() const {
        return metrics.snapshot();
    }

    RateLimitStatus AuctionEngine::checkRateLimit(const Address& actor, Timestamp now) const {
        Address normalized = AddressManager::normalizeAddress(actor);

        std::lock_guard<std::mutex> throttle(throttleMtx);
        RateLimitStatus status;
        status.actionsRemaining = rateLimiter.remaining(normalized, now);
        status.cooldownEnds = cooldownGuard.cooldownEnds(normalized);
        return status;
    }

    SystemMode AuctionEngine::systemMode() const {
        std::shared_lock<std::shared_mutex> control(controlMtx);
        return state.mode();
    }

    bool AuctionEngine::isPaused() const {
        std::shared_lock<std::shared_mutex> control(controlMtx);
        return state.isPaused();
    }

    uint32_t AuctionEngine::platformFee() const {
        std::shared_lock<std::shared_mutex> control(controlMtx);
        return feeBps;
    }

    Address AuctionEngine::feeRecipientAddress() const {
        std::shared_lock<std::shared_mutex> control(controlMtx);
        return feeRecipient;
    }

    bool AuctionEngine::hasRole(const Address& actor, Role role) const {
        std::shared_lock<std::shared_mutex> control(controlMtx);
        return access.hasRole(AddressManager::normalizeAddress(actor), role);
    }

    bool AuctionEngine::isBlacklisted(const Address& actor) const {
        std::shared_lock<std::shared_mutex> control(controlMtx);
        return access.isBlacklisted(AddressManager::normalizeAddress(actor));
    }

    Amount AuctionEngine::protectedBalance(const std::string& asset) const {
        std::lock_guard<std::mutex> treasury(treasuryMtx);
        auto it = protectedFunds.find(asset);
        return (it != protectedFunds.end()) ? it->second : 0;
    }

} // namespace gavel
