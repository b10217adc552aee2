#include <gtest/gtest.h>
#include "gavel/AuctionEngine.hpp"
#include "gavel/Crypto.hpp"
#include "gavel/Errors.hpp"
#include "gavel/InMemoryLedger.hpp"
#include <atomic>
#include <chrono>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace gavel;

namespace {

    // Ledger que rechaza pagos hacia una cuenta concreta
    class FailingLedger : public InMemoryLedger {
    public:
        using InMemoryLedger::InMemoryLedger;

        bool release(const std::string& asset, const Address& to, Amount amount) override {
            if (!failReleaseTo.empty() && to == failReleaseTo) {
                return false;
            }
            return InMemoryLedger::release(asset, to, amount);
        }

        Address failReleaseTo;
    };

    Address addressFor(unsigned n) {
        std::ostringstream out;
        out << std::hex << std::setw(40) << std::setfill('0') << (0x1000 + n);
        return out.str();
    }

} // namespace

// ============================================================================
// FIXTURE PRINCIPAL PARA TESTS DE AUCTIONENGINE
// ============================================================================

class AuctionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(Crypto::initialize());

        params.asset = "nft:1";
        params.reservePrice = 10;
        params.buyNowPrice = 100;
        params.minimumBidIncrement = 1;
        params.durationSeconds = 3600;
        params.timeExtensionSeconds = 120;
        params.extensionWindowSeconds = 300;

        for (const Address& bidder : {alice, bob, carol, dave}) {
            ledger.deposit(NATIVE_ASSET, bidder, 1000);
        }
        for (int i = 1; i <= 5; ++i) {
            ledger.deposit("nft:" + std::to_string(i), owner, 1);
        }

        config.admin = admin;
        config.custodyAccount = custody;
        config.initialRoles.push_back({operatorAddr, Role::Operator});
        engine = std::make_unique<AuctionEngine>(config, ledger);
    }

    CallContext at(const Address& caller, Timestamp now) {
        CallContext ctx;
        ctx.caller = caller;
        ctx.now = now;
        return ctx;
    }

    PaymentProof paid(Amount amount) {
        PaymentProof proof;
        proof.attachedValue = amount;
        return proof;
    }

    void bid(const Address& bidder, AuctionId id, Amount amount, Timestamp now) {
        engine->placeBid(at(bidder, now), id, amount, paid(amount));
    }

    template <typename Operation>
    ErrorCode errorOf(Operation&& operation) {
        try {
            operation();
        } catch (const AuctionError& e) {
            return e.code();
        }
        ADD_FAILURE() << "operation did not throw AuctionError";
        return ErrorCode::InvalidAuction;
    }

    const Address admin = std::string(40, '1');
    const Address custody = std::string(40, 'c');
    const Address owner = std::string(40, 'f');
    const Address operatorAddr = std::string(40, '7');
    const Address alice = std::string(40, 'a');
    const Address bob = std::string(40, 'b');
    const Address carol = std::string(40, 'd');
    const Address dave = std::string(40, 'e');

    FailingLedger ledger{custody};
    EngineConfig config;
    AuctionParams params;
    std::unique_ptr<AuctionEngine> engine;
};

// ============================================================================
// SECCIÓN 1: CONSTRUCCIÓN
// ============================================================================

TEST_F(AuctionEngineTest, AdminHoldsEveryRole) {
    for (Role role : {Role::Admin, Role::Auctioneer, Role::Operator, Role::Maintainer, Role::Recovery}) {
        EXPECT_TRUE(engine->hasRole(admin, role));
    }
    EXPECT_TRUE(engine->hasRole(operatorAddr, Role::Operator));
    EXPECT_FALSE(engine->hasRole(operatorAddr, Role::Admin));
    EXPECT_EQ(engine->feeRecipientAddress(), admin);
    EXPECT_EQ(engine->systemMode(), SystemMode::Active);
    EXPECT_FALSE(engine->isPaused());
}

TEST_F(AuctionEngineTest, ConstructorRejectsBadConfig) {
    EngineConfig bad = config;
    bad.feeBasisPoints = 1001;
    try {
        AuctionEngine rejected(bad, ledger);
        FAIL() << "Expected InvalidFeePercentage";
    } catch (const AuctionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidFeePercentage);
    }

    bad = config;
    bad.admin = "not-an-address";
    EXPECT_THROW(AuctionEngine malformed(bad, ledger), std::invalid_argument);
}

// ============================================================================
// SECCIÓN 2: CICLO COMPLETO DE UNA SUBASTA
// ============================================================================

TEST_F(AuctionEngineTest, FullAuctionLifecycle) {
    AuctionId id = engine->createAuction(at(owner, 0), params);
    EXPECT_EQ(id, 1u);
    EXPECT_EQ(ledger.balanceOf("nft:1"), 1u);
    EXPECT_EQ(engine->getAuction(id).endTime, 3600u);

    bid(alice, id, 15, 0);
    bid(bob, id, 20, 10);
    EXPECT_EQ(engine->escrowBalance(id, alice), 15u);

    EXPECT_EQ(errorOf([&] { bid(carol, id, 12, 20); }), ErrorCode::BidTooLow);

    // Puja en la ventana final: la subasta se alarga
    bid(carol, id, 30, 3350);
    EXPECT_EQ(engine->getAuction(id).endTime, 3720u);

    // Precio de compra inmediata: cierra la subasta
    bid(dave, id, 100, 3400);
    AuctionItem item = engine->getAuction(id);
    EXPECT_FALSE(item.isActive);
    EXPECT_EQ(ledger.balance("nft:1", dave), 1u);
    EXPECT_EQ(ledger.balance(NATIVE_ASSET, owner), 100u);

    EXPECT_EQ(engine->withdrawFunds(at(alice, 3500), id), 15u);
    EXPECT_EQ(ledger.balance(NATIVE_ASSET, alice), 1000u);
    EXPECT_EQ(errorOf([&] { engine->withdrawFunds(at(alice, 3600), id); }), ErrorCode::InvalidAmount);

    EXPECT_EQ(engine->getBidCount(id), 4u);
    EXPECT_TRUE(engine->getBid(id, 0).withdrawn);
    EXPECT_FALSE(engine->getBid(id, 3).withdrawn);
    EXPECT_EQ(engine->escrowBalance(id, bob), 20u);
    EXPECT_EQ(engine->escrowBalance(id, carol), 30u);
    EXPECT_EQ(engine->protectedBalance(NATIVE_ASSET), 50u);
    EXPECT_EQ(engine->protectedBalance("nft:1"), 0u);

    SystemMetrics metrics = engine->getSystemMetrics();
    EXPECT_EQ(metrics.totalAuctions, 1u);
    EXPECT_EQ(metrics.activeAuctions, 0u);
    EXPECT_EQ(metrics.totalVolume, 165u);
}

TEST_F(AuctionEngineTest, LifecycleEventsInOrder) {
    AuctionId id = engine->createAuction(at(owner, 0), params);
    bid(alice, id, 15, 0);
    bid(bob, id, 30, 3350);
    bid(carol, id, 100, 3400);
    engine->withdrawFunds(at(alice, 3500), id);

    std::vector<EventType> expected = {
        EventType::AuctionCreated, EventType::MetricsUpdated,
        EventType::BidPlaced, EventType::MetricsUpdated,
        EventType::AuctionExtended, EventType::BidPlaced, EventType::MetricsUpdated,
        EventType::BidPlaced, EventType::AuctionEnded, EventType::MetricsUpdated,
        EventType::BidWithdrawn
    };

    std::vector<Event> log = engine->events().events();
    ASSERT_EQ(log.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(log[i].type, expected[i]) << "event " << i;
    }

    EXPECT_EQ(log[0].detail, "nft:1");
    EXPECT_EQ(log[4].value, 3720u);
    EXPECT_EQ(log[8].actor, carol);
    EXPECT_EQ(log[8].amount, 100u);
    EXPECT_EQ(log[8].detail, owner);
    EXPECT_EQ(log[9].auctionId, 0u);
    EXPECT_EQ(log[9].amount, 145u);
    EXPECT_EQ(log[10].amount, 15u);
    EXPECT_TRUE(engine->events().verifyChain());
}

TEST_F(AuctionEngineTest, ExplicitEndSplitsFee) {
    config.feeBasisPoints = 250;
    engine = std::make_unique<AuctionEngine>(config, ledger);

    params.buyNowPrice = 5000;
    AuctionId id = engine->createAuction(at(owner, 0), params);
    bid(alice, id, 400, 10);
    bid(bob, id, 800, 20);

    EXPECT_EQ(errorOf([&] { engine->endAuction(at(bob, 3599), id); }), ErrorCode::AuctionNotEnded);
    engine->endAuction(at(bob, 3600), id);

    EXPECT_EQ(ledger.balance("nft:1", bob), 1u);
    EXPECT_EQ(ledger.balance(NATIVE_ASSET, owner), 780u);
    EXPECT_EQ(ledger.balance(NATIVE_ASSET, admin), 20u);
    EXPECT_EQ(engine->escrowBalance(id, alice), 400u);
    EXPECT_EQ(engine->protectedBalance(NATIVE_ASSET), 400u);

    EXPECT_EQ(errorOf([&] { engine->endAuction(at(bob, 3700), id); }), ErrorCode::AuctionNotActive);
    EXPECT_EQ(engine->events().events().back().type, EventType::MetricsUpdated);
}

TEST_F(AuctionEngineTest, EndWithoutBidsRejected) {
    AuctionId id = engine->createAuction(at(owner, 0), params);
    EXPECT_EQ(errorOf([&] { engine->endAuction(at(owner, 4000), id); }), ErrorCode::InvalidAuction);
    EXPECT_TRUE(engine->getAuction(id).isActive);
}

TEST_F(AuctionEngineTest, BidAfterEndTimeRejected) {
    AuctionId id = engine->createAuction(at(owner, 0), params);
    EXPECT_EQ(errorOf([&] { bid(alice, id, 20, 3600); }), ErrorCode::AuctionEnded);
}

// ============================================================================
// SECCIÓN 3: VALIDACIÓN ATÓMICA
// ============================================================================

TEST_F(AuctionEngineTest, FailedBidLeavesNoTrace) {
    AuctionId id = engine->createAuction(at(owner, 0), params);
    bid(alice, id, 50, 0);

    size_t eventsBefore = engine->events().size();
    RateLimitStatus quotaBefore = engine->checkRateLimit(bob, 10);

    EXPECT_EQ(errorOf([&] { bid(bob, id, 51, 10); }), ErrorCode::BidTooLow);
    EXPECT_EQ(errorOf([&] { engine->placeBid(at(bob, 10), id, 60, paid(59)); }), ErrorCode::InvalidAmount);
    EXPECT_EQ(errorOf([&] { bid(bob, 99, 60, 10); }), ErrorCode::InvalidAuction);

    RateLimitStatus quotaAfter = engine->checkRateLimit(bob, 10);
    EXPECT_EQ(quotaAfter.actionsRemaining, quotaBefore.actionsRemaining);
    EXPECT_EQ(quotaAfter.cooldownEnds, 0u);
    EXPECT_EQ(engine->events().size(), eventsBefore);
    EXPECT_EQ(engine->getBidCount(id), 1u);
    EXPECT_EQ(ledger.balance(NATIVE_ASSET, bob), 1000u);
    EXPECT_EQ(engine->getSystemMetrics().totalVolume, 50u);
}

TEST_F(AuctionEngineTest, UnfundedBidIsTransferFailure) {
    AuctionId id = engine->createAuction(at(owner, 0), params);
    Address broke = addressFor(1);

    EXPECT_EQ(errorOf([&] { bid(broke, id, 20, 0); }), ErrorCode::TransferFailed);
    EXPECT_EQ(engine->getBidCount(id), 0u);
    EXPECT_EQ(engine->protectedBalance(NATIVE_ASSET), 0u);
}

TEST_F(AuctionEngineTest, CreateRejectsBadParamsAndMissingAsset) {
    AuctionParams bad = params;
    bad.reservePrice = 200;
    EXPECT_EQ(errorOf([&] { engine->createAuction(at(owner, 0), bad); }), ErrorCode::InvalidAmount);

    bad = params;
    bad.asset = "nft:404";
    EXPECT_EQ(errorOf([&] { engine->createAuction(at(owner, 0), bad); }), ErrorCode::TransferFailed);

    EXPECT_TRUE(engine->auctionIds().empty());
    EXPECT_EQ(engine->getSystemMetrics().totalAuctions, 0u);
    EXPECT_EQ(engine->protectedBalance("nft:404"), 0u);
    EXPECT_EQ(engine->events().size(), 0u);
}

TEST_F(AuctionEngineTest, MalformedCallerUnauthorized) {
    EXPECT_EQ(errorOf([&] { engine->createAuction(at("bogus", 0), params); }), ErrorCode::Unauthorized);
}

TEST_F(AuctionEngineTest, TokenPaymentIgnoresAttachedValue) {
    ledger.deposit("token:usdc", alice, 500);
    params.paymentAsset = "token:usdc";
    AuctionId id = engine->createAuction(at(owner, 0), params);

    engine->placeBid(at(alice, 0), id, 40, PaymentProof{});
    EXPECT_EQ(ledger.balance("token:usdc", alice), 460u);
    EXPECT_EQ(engine->protectedBalance("token:usdc"), 40u);
}

// ============================================================================
// SECCIÓN 4: LÍMITES DE FRECUENCIA
// ============================================================================

TEST_F(AuctionEngineTest, CooldownBetweenBids) {
    AuctionId first = engine->createAuction(at(owner, 0), params);
    params.asset = "nft:2";
    AuctionId second = engine->createAuction(at(owner, 0), params);

    bid(alice, first, 20, 0);
    EXPECT_EQ(errorOf([&] { bid(alice, second, 20, 30); }), ErrorCode::CooldownPeriod);
    EXPECT_EQ(engine->checkRateLimit(alice, 30).cooldownEnds, 60u);
    EXPECT_NO_THROW(bid(alice, second, 20, 60));
}

TEST_F(AuctionEngineTest, RateLimitPerActor) {
    config.maxActionsPerPeriod = 2;
    engine = std::make_unique<AuctionEngine>(config, ledger);

    engine->createAuction(at(owner, 0), params);
    params.asset = "nft:2";
    engine->createAuction(at(owner, 1), params);
    EXPECT_EQ(engine->checkRateLimit(owner, 2).actionsRemaining, 0u);

    params.asset = "nft:3";
    EXPECT_EQ(errorOf([&] { engine->createAuction(at(owner, 2), params); }), ErrorCode::RateLimitExceeded);
    EXPECT_EQ(ledger.balance("nft:3", owner), 1u);

    // Otro actor conserva su cupo
    EXPECT_EQ(engine->checkRateLimit(alice, 2).actionsRemaining, 2u);
}

// ============================================================================
// SECCIÓN 5: CANCELACIÓN Y RETIROS
// ============================================================================

TEST_F(AuctionEngineTest, OwnerCancelRefundsThroughEscrow) {
    AuctionId id = engine->createAuction(at(owner, 0), params);
    bid(alice, id, 20, 0);
    bid(bob, id, 30, 10);

    engine->cancelAuction(at(owner, 100), id);
    AuctionItem item = engine->getAuction(id);
    EXPECT_TRUE(item.isCanceled);
    EXPECT_FALSE(item.isActive);
    EXPECT_EQ(ledger.balance("nft:1", owner), 1u);

    Event canceled = engine->events().events()[engine->events().size() - 2];
    EXPECT_EQ(canceled.type, EventType::AuctionCanceled);
    EXPECT_EQ(canceled.amount, 30u);

    EXPECT_EQ(engine->withdrawFunds(at(bob, 200), id), 30u);
    EXPECT_EQ(engine->withdrawFunds(at(alice, 200), id), 20u);
    EXPECT_TRUE(engine->getBid(id, 1).withdrawn);
    EXPECT_EQ(engine->protectedBalance(NATIVE_ASSET), 0u);
    EXPECT_EQ(ledger.balanceOf(NATIVE_ASSET), 0u);

    EXPECT_EQ(errorOf([&] { engine->cancelAuction(at(owner, 300), id); }), ErrorCode::InvalidAuction);
    EXPECT_EQ(errorOf([&] { engine->endAuction(at(owner, 4000), id); }), ErrorCode::InvalidAuction);
}

TEST_F(AuctionEngineTest, CancelRequiresOwnerOrAuctioneer) {
    AuctionId id = engine->createAuction(at(owner, 0), params);

    EXPECT_EQ(errorOf([&] { engine->cancelAuction(at(alice, 10), id); }), ErrorCode::Unauthorized);
    EXPECT_NO_THROW(engine->cancelAuction(at(admin, 10), id));
}

TEST_F(AuctionEngineTest, WithdrawPayoutFailureRestoresEscrow) {
    AuctionId id = engine->createAuction(at(owner, 0), params);
    bid(alice, id, 20, 0);
    bid(bob, id, 30, 10);

    ledger.failReleaseTo = alice;
    EXPECT_EQ(errorOf([&] { engine->withdrawFunds(at(alice, 20), id); }), ErrorCode::TransferFailed);
    EXPECT_EQ(engine->escrowBalance(id, alice), 20u);

    ledger.failReleaseTo.clear();
    EXPECT_EQ(engine->withdrawFunds(at(alice, 30), id), 20u);
}

// ============================================================================
// SECCIÓN 6: COMPRA INMEDIATA CON FALLO DE LIQUIDACIÓN
// ============================================================================

TEST_F(AuctionEngineTest, BuyNowSettlementFailureCompensates) {
    AuctionId id = engine->createAuction(at(owner, 0), params);
    bid(alice, id, 20, 0);

    size_t eventsBefore = engine->events().size();
    ledger.failReleaseTo = owner;

    EXPECT_EQ(errorOf([&] { bid(bob, id, 100, 10); }), ErrorCode::TransferFailed);

    AuctionItem item = engine->getAuction(id);
    EXPECT_TRUE(item.isActive);
    EXPECT_EQ(engine->getHighestBid(id).bidder, alice);
    EXPECT_EQ(engine->getBidCount(id), 1u);
    EXPECT_EQ(ledger.balance(NATIVE_ASSET, bob), 1000u);
    EXPECT_EQ(ledger.balance("nft:1", bob), 0u);
    EXPECT_EQ(ledger.balanceOf("nft:1"), 1u);
    EXPECT_EQ(engine->protectedBalance(NATIVE_ASSET), 20u);
    EXPECT_EQ(engine->events().size(), eventsBefore);

    ledger.failReleaseTo.clear();
    EXPECT_NO_THROW(bid(bob, id, 100, 80));
    EXPECT_FALSE(engine->getAuction(id).isActive);
}

// ============================================================================
// SECCIÓN 7: ESTADO DEL SISTEMA
// ============================================================================

TEST_F(AuctionEngineTest, EmergencyBlocksTradingButNotWithdrawals) {
    AuctionId id = engine->createAuction(at(owner, 0), params);
    bid(alice, id, 20, 0);
    bid(bob, id, 30, 10);

    EXPECT_EQ(errorOf([&] { engine->setEmergencyState(at(alice, 20), true); }), ErrorCode::Unauthorized);
    engine->setEmergencyState(at(admin, 20), true);
    EXPECT_EQ(engine->systemMode(), SystemMode::Emergency);
    EXPECT_TRUE(engine->isPaused());

    params.asset = "nft:2";
    EXPECT_EQ(errorOf([&] { engine->createAuction(at(owner, 30), params); }), ErrorCode::InvalidSystemState);
    EXPECT_EQ(errorOf([&] { bid(carol, id, 40, 30); }), ErrorCode::InvalidSystemState);
    EXPECT_EQ(errorOf([&] { engine->endAuction(at(owner, 4000), id); }), ErrorCode::EmergencyPaused);

    EXPECT_EQ(engine->withdrawFunds(at(alice, 40), id), 20u);

    engine->setEmergencyState(at(admin, 50), false);
    EXPECT_FALSE(engine->isPaused());
    EXPECT_NO_THROW(engine->endAuction(at(owner, 4000), id));
}

TEST_F(AuctionEngineTest, MaintenanceAllowsSettlement) {
    AuctionId id = engine->createAuction(at(owner, 0), params);
    bid(alice, id, 20, 0);

    EXPECT_EQ(errorOf([&] { engine->setMaintenanceMode(at(operatorAddr, 5), true); }), ErrorCode::Unauthorized);
    engine->setMaintenanceMode(at(admin, 5), true);
    EXPECT_EQ(engine->systemMode(), SystemMode::Maintenance);

    EXPECT_EQ(errorOf([&] { bid(bob, id, 30, 10); }), ErrorCode::InvalidSystemState);
    EXPECT_NO_THROW(engine->endAuction(at(owner, 3600), id));
}

TEST_F(AuctionEngineTest, UnchangedStateEmitsNothing) {
    engine->setMaintenanceMode(at(admin, 0), false);
    engine->setEmergencyState(at(admin, 0), false);
    EXPECT_EQ(engine->events().size(), 0u);

    engine->setEmergencyState(at(admin, 1), true);
    std::vector<Event> log = engine->events().events();
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0].type, EventType::SystemStateChanged);
    EXPECT_EQ(log[0].value, static_cast<uint64_t>(SystemMode::Emergency));
    EXPECT_EQ(log[1].type, EventType::EmergencyAction);
    EXPECT_EQ(log[1].value, 1u);
}

// ============================================================================
// SECCIÓN 8: ADMINISTRACIÓN
// ============================================================================

TEST_F(AuctionEngineTest, BlacklistedBidderRejected) {
    AuctionId id = engine->createAuction(at(owner, 0), params);

    EXPECT_EQ(errorOf([&] { engine->blacklistBidder(at(alice, 0), bob, true); }), ErrorCode::Unauthorized);
    engine->blacklistBidder(at(operatorAddr, 0), bob, true);
    EXPECT_TRUE(engine->isBlacklisted(bob));
    EXPECT_EQ(errorOf([&] { bid(bob, id, 20, 10); }), ErrorCode::BlacklistedBidder);

    size_t before = engine->events().size();
    engine->blacklistBidder(at(admin, 20), bob, true);
    EXPECT_EQ(engine->events().size(), before);

    engine->blacklistBidder(at(admin, 30), bob, false);
    EXPECT_NO_THROW(bid(bob, id, 20, 40));
}

TEST_F(AuctionEngineTest, PlatformFeeBounds) {
    EXPECT_EQ(errorOf([&] { engine->updatePlatformFee(at(admin, 0), 1001); }), ErrorCode::InvalidFeePercentage);
    EXPECT_EQ(errorOf([&] { engine->updatePlatformFee(at(operatorAddr, 0), 100); }), ErrorCode::Unauthorized);
    EXPECT_EQ(engine->events().size(), 0u);

    engine->updatePlatformFee(at(admin, 0), 1000);
    EXPECT_EQ(engine->platformFee(), 1000u);

    Event updated = engine->events().events().back();
    EXPECT_EQ(updated.type, EventType::FeeUpdated);
    EXPECT_EQ(updated.amount, 1000u);
    EXPECT_EQ(updated.value, 0u);
}

TEST_F(AuctionEngineTest, GrantAndRevokeRoles) {
    EXPECT_EQ(errorOf([&] { engine->grantRole(at(alice, 0), alice, Role::Admin); }), ErrorCode::Unauthorized);

    engine->grantRole(at(admin, 0), alice, Role::Recovery);
    EXPECT_TRUE(engine->hasRole(alice, Role::Recovery));
    EXPECT_EQ(engine->events().events().back().type, EventType::SecurityAlert);

    size_t before = engine->events().size();
    engine->grantRole(at(admin, 1), alice, Role::Recovery);
    EXPECT_EQ(engine->events().size(), before);

    engine->revokeRole(at(admin, 2), alice, Role::Recovery);
    EXPECT_FALSE(engine->hasRole(alice, Role::Recovery));
    EXPECT_EQ(engine->events().size(), before + 1);

    EXPECT_THROW(engine->grantRole(at(admin, 3), "zz", Role::Operator), std::invalid_argument);
}

TEST_F(AuctionEngineTest, RecoverTokenCannotTouchEscrow) {
    AuctionId id = engine->createAuction(at(owner, 0), params);
    bid(alice, id, 20, 0);

    // Fondos enviados por error a la cuenta de custodia
    ledger.deposit(NATIVE_ASSET, custody, 50);
    EXPECT_EQ(ledger.balanceOf(NATIVE_ASSET), 70u);

    EXPECT_EQ(errorOf([&] { engine->recoverToken(at(operatorAddr, 10), NATIVE_ASSET, 10); }),
              ErrorCode::Unauthorized);
    EXPECT_EQ(errorOf([&] { engine->recoverToken(at(admin, 10), NATIVE_ASSET, 51); }),
              ErrorCode::InvalidAmount);
    EXPECT_EQ(errorOf([&] { engine->recoverToken(at(admin, 10), NATIVE_ASSET, 0); }),
              ErrorCode::InvalidAmount);
    EXPECT_EQ(errorOf([&] { engine->recoverToken(at(admin, 10), "nft:1", 1); }),
              ErrorCode::InvalidAmount);

    engine->recoverToken(at(admin, 10), NATIVE_ASSET, 50);
    EXPECT_EQ(ledger.balance(NATIVE_ASSET, admin), 50u);
    EXPECT_EQ(ledger.balanceOf(NATIVE_ASSET), 20u);

    Event recovered = engine->events().events().back();
    EXPECT_EQ(recovered.type, EventType::EmergencyAction);
    EXPECT_EQ(recovered.amount, 50u);
    EXPECT_EQ(recovered.detail, "recovered native");
}

TEST_F(AuctionEngineTest, QueriesOnUnknownAuction) {
    EXPECT_EQ(errorOf([&] { engine->getAuction(5); }), ErrorCode::InvalidAuction);
    EXPECT_EQ(errorOf([&] { engine->withdrawFunds(at(alice, 0), 5); }), ErrorCode::InvalidAuction);

    AuctionId id = engine->createAuction(at(owner, 0), params);
    EXPECT_THROW(engine->getBid(id, 0), std::out_of_range);
    EXPECT_TRUE(engine->getHighestBid(id).bidder.empty());
}

// ============================================================================
// SECCIÓN 9: CONCURRENCIA
// ============================================================================

TEST_F(AuctionEngineTest, ConcurrentBiddersKeepBooksBalanced) {
    params.buyNowPrice = 1000;
    AuctionId id = engine->createAuction(at(owner, 0), params);

    const unsigned bidders = 16;
    for (unsigned i = 0; i < bidders; ++i) {
        ledger.deposit(NATIVE_ASSET, addressFor(i), 100);
    }

    std::atomic<unsigned> accepted{0};
    std::vector<std::thread> workers;
    for (unsigned i = 0; i < bidders; ++i) {
        workers.emplace_back([this, i, id, &accepted] {
            try {
                bid(addressFor(i), id, 20 + i, 100);
                ++accepted;
            } catch (const AuctionError& e) {
                EXPECT_EQ(e.code(), ErrorCode::BidTooLow);
            }
        });
    }
    for (auto& worker : workers) worker.join();

    size_t count = engine->getBidCount(id);
    ASSERT_EQ(count, accepted.load());
    ASSERT_GE(count, 1u);

    Amount total = 0;
    Amount previous = 0;
    for (size_t i = 0; i < count; ++i) {
        Bid placed = engine->getBid(id, i);
        EXPECT_GT(placed.amount, previous);
        previous = placed.amount;
        total += placed.amount;
    }

    EXPECT_EQ(engine->getHighestBid(id).amount, previous);
    EXPECT_EQ(engine->protectedBalance(NATIVE_ASSET), total);
    EXPECT_EQ(ledger.balanceOf(NATIVE_ASSET), total);
    EXPECT_EQ(engine->getSystemMetrics().totalVolume, total);
    EXPECT_TRUE(engine->events().verifyChain());
}

TEST_F(AuctionEngineTest, ConcurrentBidsLoggedInCommitOrder) {
    params.buyNowPrice = 1000;
    AuctionId id = engine->createAuction(at(owner, 0), params);

    const unsigned bidders = 12;
    for (unsigned i = 0; i < bidders; ++i) {
        ledger.deposit(NATIVE_ASSET, addressFor(i), 100);
    }

    // Un suscriptor lento ensancha el hueco entre commit y entrega
    std::mutex seenMtx;
    std::vector<uint64_t> delivered;
    engine->events().subscribe([&seenMtx, &delivered](const Event& event) {
        if (event.type == EventType::BidPlaced) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        std::lock_guard<std::mutex> lock(seenMtx);
        delivered.push_back(event.sequence);
    });

    std::vector<std::thread> workers;
    for (unsigned i = 0; i < bidders; ++i) {
        workers.emplace_back([this, i, id] {
            try {
                bid(addressFor(i), id, 20 + i, 100);
            } catch (const AuctionError& e) {
                EXPECT_EQ(e.code(), ErrorCode::BidTooLow);
            }
        });
    }
    for (auto& worker : workers) worker.join();

    std::vector<Amount> logged;
    for (const auto& event : engine->events().events()) {
        if (event.type == EventType::BidPlaced) {
            logged.push_back(event.amount);
        }
    }

    ASSERT_EQ(logged.size(), engine->getBidCount(id));
    for (size_t i = 0; i < logged.size(); ++i) {
        EXPECT_EQ(logged[i], engine->getBid(id, i).amount);
        if (i > 0) {
            EXPECT_GT(logged[i], logged[i - 1]);
        }
    }

    std::lock_guard<std::mutex> lock(seenMtx);
    ASSERT_EQ(delivered.size(), engine->events().size() - 2); // creación antes de suscribirse
    for (size_t i = 1; i < delivered.size(); ++i) {
        EXPECT_EQ(delivered[i], delivered[i - 1] + 1);
    }
    EXPECT_TRUE(engine->events().verifyChain());
}
