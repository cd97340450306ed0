// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Pairing engine tests
 *
 * Tests:
 *   1. mint / burn / transfer effects on both halves, fee custody and events
 *   2. rejections leave no state behind and emit nothing
 *   3. pause gate and emergency withdrawal
 *   4. refund failure and counter cross-check roll the whole call back
 *   5. reentrant calls through a hostile fee token
 */

#include "consensus/validation.h"
#include "init.h"
#include "pairs/pairengine.h"
#include "state/statedb.h"
#include "test/test_pairmint.h"

#include <boost/test/unit_test.hpp>

static const std::string TEST_URI = "https://pairs.example/meta.json";

namespace {

/** Everything a rejected call must leave untouched */
struct EngineSnapshot {
    CAmount nStableAlice;
    CAmount nStableBob;
    CAmount nStableEngine;
    CAmount nUnitsAlice;
    CAmount nUnitsBob;
    CAmount nUnitSupply;
    uint64_t nRegistryLive;
    uint64_t nNextId;
    uint64_t nEvents;
    PairState pairState;

    EngineSnapshot(const PairTestingSetup& s)
    {
        nStableAlice = s.node.stablecoin->BalanceOf(s.alice);
        nStableBob = s.node.stablecoin->BalanceOf(s.bob);
        nStableEngine = s.node.stablecoin->BalanceOf(EngineAddress());
        nUnitsAlice = s.node.pairledger->BalanceOf(s.alice);
        nUnitsBob = s.node.pairledger->BalanceOf(s.bob);
        nUnitSupply = s.node.pairledger->TotalSupply();
        nRegistryLive = s.node.registry->TotalSupply();
        nNextId = s.node.registry->NextId();
        nEvents = s.node.statedb->ReadEventCount();
        pairState = s.node.engine->GetState();
    }

    bool operator==(const EngineSnapshot& o) const
    {
        return nStableAlice == o.nStableAlice && nStableBob == o.nStableBob &&
               nStableEngine == o.nStableEngine && nUnitsAlice == o.nUnitsAlice &&
               nUnitsBob == o.nUnitsBob && nUnitSupply == o.nUnitSupply &&
               nRegistryLive == o.nRegistryLive && nNextId == o.nNextId &&
               nEvents == o.nEvents && pairState.nLivePairs == o.pairState.nLivePairs &&
               pairState.nPairSupply == o.pairState.nPairSupply &&
               pairState.nFeesEscrowed == o.pairState.nFeesEscrowed &&
               pairState.nTotalMinted == o.pairState.nTotalMinted &&
               pairState.nTotalBurned == o.pairState.nTotalBurned;
    }
};

/**
 * Fee token that calls back into an engine from inside TransferFrom and
 * Transfer, then forwards to the real stablecoin.
 */
class CReentrantToken : public IFungibleToken
{
public:
    IFungibleToken& inner;
    CPairEngine* target;
    CAccountID attacker;
    std::string strNestedReason;
    bool fNestedSucceeded;

    explicit CReentrantToken(IFungibleToken& innerIn)
        : inner(innerIn), target(nullptr), fNestedSucceeded(false) {}

    const CAccountID& GetAddress() const override { return inner.GetAddress(); }
    CAmount BalanceOf(const CAccountID& account) const override { return inner.BalanceOf(account); }
    CAmount TotalSupply() const override { return inner.TotalSupply(); }
    CAmount Allowance(const CAccountID& owner, const CAccountID& spender) const override { return inner.Allowance(owner, spender); }
    bool Approve(const CAccountID& caller, const CAccountID& spender, CAmount amount, CValidationState& state) override
    {
        return inner.Approve(caller, spender, amount, state);
    }

    bool Transfer(const CAccountID& caller, const CAccountID& to, CAmount amount, CValidationState& state) override
    {
        Attack();
        return inner.Transfer(caller, to, amount, state);
    }

    bool TransferFrom(const CAccountID& caller, const CAccountID& from, const CAccountID& to, CAmount amount, CValidationState& state) override
    {
        Attack();
        return inner.TransferFrom(caller, from, to, amount, state);
    }

private:
    void Attack()
    {
        if (!target) return;
        CValidationState nested;
        uint64_t nId = 0;
        fNestedSucceeded = target->MintPair(attacker, TEST_URI, nId, nested);
        strNestedReason = nested.GetRejectReason();
    }
};

struct ZeroFeeTestingSetup : public PairTestingSetup {
    ZeroFeeTestingSetup() : PairTestingSetup(0) {}
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(pairengine_tests, PairTestingSetup)

// =============================================================================
// Test 1: the A/B lifecycle
// =============================================================================
BOOST_AUTO_TEST_CASE(pair_lifecycle_scenario)
{
    CValidationState state;
    const CAccountID engine = EngineAddress();

    // A starts with 2.000000 stablecoin
    CTokenLedger& stable = *node.stablecoin;
    BOOST_REQUIRE(stable.Transfer(alice, admin, TEST_FUNDED_STABLE - 2 * COIN, state));
    BOOST_CHECK_EQUAL(stable.BalanceOf(alice), 2 * COIN);
    const CAmount nBobStart = stable.BalanceOf(bob);

    uint64_t nId = 99;
    BOOST_REQUIRE(node.engine->MintPair(alice, TEST_URI, nId, state));
    BOOST_CHECK_EQUAL(nId, 0U);
    BOOST_CHECK_EQUAL(stable.BalanceOf(alice), COIN);
    BOOST_CHECK_EQUAL(stable.BalanceOf(engine), COIN);
    BOOST_CHECK_EQUAL(node.pairledger->BalanceOf(alice), COIN);
    CAccountID owner;
    BOOST_CHECK(node.registry->OwnerOf(0, owner));
    BOOST_CHECK(owner == alice);
    BOOST_CHECK(node.engine->IsLive(0));

    BOOST_REQUIRE(node.engine->TransferPair(alice, bob, 0, state));
    BOOST_CHECK(node.registry->OwnerOf(0, owner));
    BOOST_CHECK(owner == bob);
    BOOST_CHECK_EQUAL(node.pairledger->BalanceOf(bob), COIN);
    BOOST_CHECK_EQUAL(node.pairledger->BalanceOf(alice), 0);
    BOOST_CHECK(node.engine->IsLive(0));

    BOOST_REQUIRE(node.engine->BurnPair(bob, 0, state));
    BOOST_CHECK_EQUAL(stable.BalanceOf(bob), nBobStart + COIN);
    BOOST_CHECK_EQUAL(stable.BalanceOf(engine), 0);
    BOOST_CHECK(!node.engine->IsLive(0));
    BOOST_CHECK(!node.registry->Exists(0));
    BOOST_CHECK_EQUAL(node.pairledger->TotalSupply(), 0);

    const PairState pairState = node.engine->GetState();
    BOOST_CHECK_EQUAL(pairState.nLivePairs, 0U);
    BOOST_CHECK_EQUAL(pairState.nTotalMinted, 1U);
    BOOST_CHECK_EQUAL(pairState.nTotalBurned, 1U);
    BOOST_CHECK_EQUAL(pairState.nFeesEscrowed, 0);
    BOOST_CHECK(pairState.CheckInvariants());
}

BOOST_AUTO_TEST_CASE(mint_effects_and_event)
{
    const uint64_t nEvents = node.statedb->ReadEventCount();
    const uint64_t nFirst = MintTestPair(alice);
    const uint64_t nSecond = MintTestPair(bob);
    BOOST_CHECK_EQUAL(nSecond, nFirst + 1);

    PairRecord pair;
    BOOST_REQUIRE(node.engine->GetPair(nSecond, pair));
    BOOST_CHECK(pair.fExists);
    BOOST_CHECK_EQUAL(pair.nFeePaid, DEFAULT_PAIR_FEE);

    std::string uri;
    BOOST_CHECK(node.registry->TokenURI(nSecond, uri));
    BOOST_CHECK_EQUAL(uri, "https://pairs.example/meta.json");

    BOOST_CHECK_EQUAL(node.stablecoin->Allowance(alice, EngineAddress()), TEST_FUNDED_STABLE - DEFAULT_PAIR_FEE);
    BOOST_CHECK_EQUAL(node.engine->GetState().nFeesEscrowed, 2 * DEFAULT_PAIR_FEE);

    BOOST_REQUIRE_EQUAL(node.statedb->ReadEventCount(), nEvents + 2);
    PairEvent event;
    BOOST_REQUIRE(node.statedb->ReadEvent(nEvents + 1, event));
    BOOST_CHECK_EQUAL(event.nType, EVENT_PAIR_MINTED);
    BOOST_CHECK(event.from == bob);
    BOOST_CHECK_EQUAL(event.nId, nSecond);
    BOOST_CHECK_EQUAL(event.amount, PAIR_UNIT);
    BOOST_CHECK_EQUAL(pair.nMintSeq, event.nSeq);
}

BOOST_AUTO_TEST_CASE(mint_then_burn_restores_balance)
{
    const CAmount nBefore = node.stablecoin->BalanceOf(alice);
    const uint64_t nId = MintTestPair(alice);
    CValidationState state;
    BOOST_REQUIRE(node.engine->BurnPair(alice, nId, state));

    BOOST_CHECK_EQUAL(node.stablecoin->BalanceOf(alice), nBefore);
    BOOST_CHECK_EQUAL(node.pairledger->BalanceOf(alice), 0);
    BOOST_CHECK(!node.engine->IsLive(nId));

    // Identifiers are not reassigned
    BOOST_CHECK_EQUAL(MintTestPair(alice), nId + 1);
}

// =============================================================================
// Test 2: rejections
// =============================================================================
BOOST_AUTO_TEST_CASE(mint_rejections)
{
    const EngineSnapshot before(*this);
    uint64_t nId = 0;

    CValidationState state;
    BOOST_CHECK(!node.engine->MintPair(alice, "", nId, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-uri-empty");
    BOOST_CHECK_EQUAL(state.GetRejectCode(), REJECT_INVALID);

    CValidationState state2;
    BOOST_CHECK(!node.engine->MintPair(alice, "ftp://pairs.example/x", nId, state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "bad-uri-prefix");

    CValidationState state3;
    BOOST_CHECK(!node.engine->MintPair(CAccountID(), TEST_URI, nId, state3));
    BOOST_CHECK_EQUAL(state3.GetRejectReason(), "bad-pair-zero-address");

    const CAccountID carol = TestAccount("b3");
    CValidationState state4;
    BOOST_CHECK(!node.engine->MintPair(carol, TEST_URI, nId, state4));
    BOOST_CHECK_EQUAL(state4.GetRejectReason(), "insufficient-fee-balance");
    BOOST_CHECK_EQUAL(state4.GetRejectCode(), REJECT_INSUFFICIENT);

    CValidationState state5;
    BOOST_REQUIRE(node.stablecoin->Approve(bob, EngineAddress(), DEFAULT_PAIR_FEE - 1, state5));
    const EngineSnapshot approved(*this);
    BOOST_CHECK(!node.engine->MintPair(bob, TEST_URI, nId, state5));
    BOOST_CHECK_EQUAL(state5.GetRejectReason(), "insufficient-fee-allowance");

    BOOST_CHECK(approved == EngineSnapshot(*this));
    BOOST_CHECK(before.nEvents == approved.nEvents);
}

BOOST_AUTO_TEST_CASE(burn_rejections)
{
    const uint64_t nId = MintTestPair(alice);
    const EngineSnapshot before(*this);

    // Never minted
    CValidationState state;
    BOOST_CHECK(!node.engine->BurnPair(alice, nId + 7, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "pair-not-live");
    BOOST_CHECK_EQUAL(state.GetRejectCode(), REJECT_INVARIANT);

    // Not the owner
    CValidationState state2;
    BOOST_CHECK(!node.engine->BurnPair(bob, nId, state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "not-pair-owner");
    BOOST_CHECK_EQUAL(state2.GetRejectCode(), REJECT_UNAUTHORIZED);

    BOOST_CHECK(before == EngineSnapshot(*this));

    // Already burned
    CValidationState state3;
    BOOST_REQUIRE(node.engine->BurnPair(alice, nId, state3));
    const EngineSnapshot burned(*this);
    BOOST_CHECK(!node.engine->BurnPair(alice, nId, state3));
    BOOST_CHECK_EQUAL(state3.GetRejectReason(), "pair-not-live");
    BOOST_CHECK(burned == EngineSnapshot(*this));
}

BOOST_AUTO_TEST_CASE(transfer_rejections)
{
    const uint64_t nId = MintTestPair(alice);

    CValidationState state;
    BOOST_CHECK(!node.engine->TransferPair(alice, CAccountID(), nId, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-pair-zero-address");

    CValidationState state2;
    BOOST_CHECK(!node.engine->TransferPair(bob, alice, nId, state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "not-pair-owner");

    CValidationState state3;
    BOOST_CHECK(!node.engine->TransferPair(alice, bob, nId + 1, state3));
    BOOST_CHECK_EQUAL(state3.GetRejectReason(), "pair-not-live");

    // The same transfer twice: the second finds the sender no longer owns it
    CValidationState state4;
    BOOST_REQUIRE(node.engine->TransferPair(alice, bob, nId, state4));
    const EngineSnapshot after(*this);
    BOOST_CHECK(!node.engine->TransferPair(alice, bob, nId, state4));
    BOOST_CHECK_EQUAL(state4.GetRejectReason(), "not-pair-owner");
    BOOST_CHECK(after == EngineSnapshot(*this));
}

BOOST_AUTO_TEST_CASE(engine_account_cannot_pair)
{
    const uint64_t nAliceId = MintTestPair(alice);

    // Funded and approved, so only the caller check stands in the way
    CValidationState state;
    BOOST_REQUIRE(node.stablecoin->Mint(admin, EngineAddress(), DEFAULT_PAIR_FEE, state));
    BOOST_REQUIRE(node.stablecoin->Approve(EngineAddress(), EngineAddress(), DEFAULT_PAIR_FEE, state));
    const EngineSnapshot before(*this);

    uint64_t nId = 0;
    CValidationState state2;
    BOOST_CHECK(!node.engine->MintPair(EngineAddress(), TEST_URI, nId, state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "bad-pair-engine-caller");
    BOOST_CHECK_EQUAL(state2.GetRejectCode(), REJECT_INVALID);

    CValidationState state3;
    BOOST_CHECK(!node.engine->TransferPair(EngineAddress(), bob, nAliceId, state3));
    BOOST_CHECK_EQUAL(state3.GetRejectReason(), "bad-pair-engine-caller");

    CValidationState state4;
    BOOST_CHECK(!node.engine->BurnPair(EngineAddress(), nAliceId, state4));
    BOOST_CHECK_EQUAL(state4.GetRejectReason(), "bad-pair-engine-caller");

    BOOST_CHECK(before == EngineSnapshot(*this));
    BOOST_CHECK_EQUAL(node.stablecoin->Allowance(EngineAddress(), EngineAddress()), DEFAULT_PAIR_FEE);
}

BOOST_AUTO_TEST_CASE(transfer_to_self)
{
    const uint64_t nId = MintTestPair(alice);
    CValidationState state;
    BOOST_CHECK(node.engine->TransferPair(alice, alice, nId, state));
    CAccountID owner;
    BOOST_CHECK(node.registry->OwnerOf(nId, owner));
    BOOST_CHECK(owner == alice);
    BOOST_CHECK_EQUAL(node.pairledger->BalanceOf(alice), PAIR_UNIT);
}

BOOST_AUTO_TEST_CASE(burn_needs_unit)
{
    const uint64_t nId = MintTestPair(alice);

    // Take the unit away behind the engine's back (administrative burner)
    CValidationState state;
    BOOST_REQUIRE(node.pairledger->GetAccess().GrantRole(admin, ROLE_BURNER, admin, state));
    BOOST_REQUIRE(node.pairledger->Burn(admin, alice, PAIR_UNIT, state));

    CValidationState state2;
    BOOST_CHECK(!node.engine->BurnPair(alice, nId, state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "insufficient-pair-balance");
    CValidationState state3;
    BOOST_CHECK(!node.engine->TransferPair(alice, bob, nId, state3));
    BOOST_CHECK_EQUAL(state3.GetRejectReason(), "insufficient-pair-balance");

    PairAudit audit;
    node.engine->AuditPairs(audit);
    BOOST_CHECK(!audit.IsClean());
}

// =============================================================================
// Test 3: pause and emergency withdrawal
// =============================================================================
BOOST_AUTO_TEST_CASE(pause_scenario)
{
    const uint64_t nId = MintTestPair(alice);

    CValidationState state;
    BOOST_CHECK(!node.engine->Pause(alice, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "missing-role-pauser");

    CValidationState state2;
    BOOST_REQUIRE(node.engine->Pause(admin, state2));
    BOOST_CHECK(node.engine->IsPaused());

    const EngineSnapshot paused(*this);
    uint64_t nNew = 0;
    CValidationState s1, s2, s3;
    BOOST_CHECK(!node.engine->MintPair(alice, TEST_URI, nNew, s1));
    BOOST_CHECK_EQUAL(s1.GetRejectReason(), "engine-paused");
    BOOST_CHECK_EQUAL(s1.GetRejectCode(), REJECT_PAUSED);
    BOOST_CHECK(!node.engine->BurnPair(alice, nId, s2));
    BOOST_CHECK_EQUAL(s2.GetRejectReason(), "engine-paused");
    BOOST_CHECK(!node.engine->TransferPair(alice, bob, nId, s3));
    BOOST_CHECK_EQUAL(s3.GetRejectReason(), "engine-paused");
    BOOST_CHECK(paused == EngineSnapshot(*this));

    // Administration keeps working
    CValidationState state3;
    BOOST_CHECK(node.engine->EmergencyWithdraw(admin, StablecoinAddress(), DEFAULT_PAIR_FEE, state3));
    BOOST_CHECK(node.engine->Unpause(admin, state3));
    BOOST_CHECK(!node.engine->IsPaused());
    BOOST_CHECK(node.engine->TransferPair(alice, bob, nId, state3));
}

BOOST_AUTO_TEST_CASE(emergency_withdraw)
{
    MintTestPair(alice);
    MintTestPair(bob);
    const CAmount nEscrow = node.stablecoin->BalanceOf(EngineAddress());
    BOOST_CHECK_EQUAL(nEscrow, 2 * DEFAULT_PAIR_FEE);

    CValidationState state;
    BOOST_CHECK(!node.engine->EmergencyWithdraw(alice, StablecoinAddress(), COIN, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "missing-role-emergency");

    CValidationState state2;
    BOOST_CHECK(!node.engine->EmergencyWithdraw(admin, RegistryAddress(), COIN, state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "unknown-token");

    CValidationState state3;
    BOOST_CHECK(!node.engine->EmergencyWithdraw(admin, StablecoinAddress(), nEscrow + 1, state3));
    BOOST_CHECK_EQUAL(state3.GetRejectReason(), "insufficient-balance");

    const CAmount nAdminBefore = node.stablecoin->BalanceOf(admin);
    const uint64_t nEvents = node.statedb->ReadEventCount();
    CValidationState state4;
    BOOST_REQUIRE(node.engine->EmergencyWithdraw(admin, StablecoinAddress(), nEscrow, state4));
    BOOST_CHECK_EQUAL(node.stablecoin->BalanceOf(admin), nAdminBefore + nEscrow);
    BOOST_CHECK_EQUAL(node.stablecoin->BalanceOf(EngineAddress()), 0);

    PairEvent event;
    BOOST_REQUIRE(node.statedb->ReadEvent(nEvents, event));
    BOOST_CHECK_EQUAL(event.nType, EVENT_EMERGENCY_WITHDRAWAL);
    BOOST_CHECK(event.token == StablecoinAddress());
    BOOST_CHECK(event.to == admin);
    BOOST_CHECK_EQUAL(event.amount, nEscrow);

    // Escrow is now short of the recorded fees; reported, not enforced
    PairAudit audit;
    node.engine->AuditPairs(audit);
    BOOST_CHECK(audit.IsClean());
    BOOST_CHECK(!audit.fEscrowCovered);
    BOOST_CHECK_EQUAL(audit.nFeesRecorded, 2 * DEFAULT_PAIR_FEE);
}

// =============================================================================
// Test 4: atomic rollback
// =============================================================================
BOOST_AUTO_TEST_CASE(refund_failure_rolls_back_burn)
{
    const uint64_t nId = MintTestPair(alice);

    // Sweep the escrow so the refund cannot be paid
    CValidationState state;
    BOOST_REQUIRE(node.engine->EmergencyWithdraw(admin, StablecoinAddress(), DEFAULT_PAIR_FEE, state));
    const EngineSnapshot before(*this);

    CValidationState state2;
    BOOST_CHECK(!node.engine->BurnPair(alice, nId, state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "insufficient-balance");
    BOOST_CHECK(before == EngineSnapshot(*this));

    // Both halves are still there
    BOOST_CHECK(node.engine->IsLive(nId));
    CAccountID owner;
    BOOST_CHECK(node.registry->OwnerOf(nId, owner));
    BOOST_CHECK(owner == alice);
    BOOST_CHECK_EQUAL(node.pairledger->BalanceOf(alice), PAIR_UNIT);

    // A paused stablecoin fails the refund the same way
    CValidationState state3;
    BOOST_REQUIRE(node.stablecoin->Mint(admin, EngineAddress(), DEFAULT_PAIR_FEE, state3));
    BOOST_REQUIRE(node.stablecoin->GetAccess().Pause(admin, state3));
    CValidationState state4;
    BOOST_CHECK(!node.engine->BurnPair(alice, nId, state4));
    BOOST_CHECK_EQUAL(state4.GetRejectReason(), "stablecoin-paused");
    BOOST_CHECK(node.engine->IsLive(nId));
    BOOST_CHECK(node.registry->Exists(nId));

    CValidationState state5;
    BOOST_REQUIRE(node.stablecoin->GetAccess().Unpause(admin, state5));
    BOOST_CHECK(node.engine->BurnPair(alice, nId, state5));
}

BOOST_AUTO_TEST_CASE(paused_collaborator_rolls_back_mint)
{
    // The registry refuses after the fee pull and the unit mint already ran
    CValidationState state;
    BOOST_REQUIRE(node.registry->GetAccess().Pause(admin, state));
    const EngineSnapshot before(*this);

    uint64_t nId = 0;
    CValidationState state2;
    BOOST_CHECK(!node.engine->MintPair(alice, TEST_URI, nId, state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "registry-paused");
    BOOST_CHECK(before == EngineSnapshot(*this));
    BOOST_CHECK_EQUAL(node.stablecoin->Allowance(alice, EngineAddress()), TEST_FUNDED_STABLE);
}

BOOST_AUTO_TEST_CASE(paused_registry_rolls_back_transfer)
{
    // The unit moves first; the registry then refuses the collectible
    const uint64_t nId = MintTestPair(alice);
    CValidationState state;
    BOOST_REQUIRE(node.registry->GetAccess().Pause(admin, state));
    const EngineSnapshot before(*this);

    CValidationState state2;
    BOOST_CHECK(!node.engine->TransferPair(alice, bob, nId, state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "registry-paused");
    BOOST_CHECK_EQUAL(state2.GetRejectCode(), REJECT_PAUSED);
    BOOST_CHECK(before == EngineSnapshot(*this));

    BOOST_CHECK_EQUAL(node.pairledger->BalanceOf(alice), PAIR_UNIT);
    BOOST_CHECK_EQUAL(node.pairledger->BalanceOf(bob), 0);
    CAccountID owner;
    BOOST_CHECK(node.registry->OwnerOf(nId, owner));
    BOOST_CHECK(owner == alice);
    BOOST_CHECK(node.engine->IsLive(nId));

    CValidationState state3;
    BOOST_REQUIRE(node.registry->GetAccess().Unpause(admin, state3));
    BOOST_CHECK(node.engine->TransferPair(alice, bob, nId, state3));
    BOOST_CHECK_EQUAL(node.pairledger->BalanceOf(bob), PAIR_UNIT);
}

BOOST_AUTO_TEST_CASE(paused_ledger_rolls_back_transfer)
{
    const uint64_t nId = MintTestPair(alice);
    CValidationState state;
    BOOST_REQUIRE(node.pairledger->GetAccess().Pause(admin, state));
    const EngineSnapshot before(*this);

    CValidationState state2;
    BOOST_CHECK(!node.engine->TransferPair(alice, bob, nId, state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "pairledger-paused");
    BOOST_CHECK(before == EngineSnapshot(*this));

    CAccountID owner;
    BOOST_CHECK(node.registry->OwnerOf(nId, owner));
    BOOST_CHECK(owner == alice);
    BOOST_CHECK_EQUAL(node.pairledger->BalanceOf(alice), PAIR_UNIT);
    BOOST_CHECK_EQUAL(node.pairledger->BalanceOf(bob), 0);
}

BOOST_AUTO_TEST_CASE(counter_mismatch_aborts)
{
    MintTestPair(alice);

    // Corrupt the ledger supply directly
    BOOST_REQUIRE(node.statedb->WriteSupply(PairLedgerAddress(), 5 * PAIR_UNIT));
    const EngineSnapshot before(*this);

    uint64_t nId = 0;
    CValidationState state;
    BOOST_CHECK(!node.engine->MintPair(bob, TEST_URI, nId, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "pair-invariant-broken");
    BOOST_CHECK_EQUAL(state.GetRejectCode(), REJECT_INVARIANT);
    BOOST_CHECK(before == EngineSnapshot(*this));

    PairAudit audit;
    node.engine->AuditPairs(audit);
    BOOST_CHECK(!audit.IsClean());
}

// =============================================================================
// Test 5: reentrancy
// =============================================================================
BOOST_AUTO_TEST_CASE(reentrant_mint_rejected)
{
    CReentrantToken hostile(*node.stablecoin);
    CPairEngine engine(*node.statedb, EngineAddress(), *node.pairledger, *node.registry, hostile, DEFAULT_PAIR_FEE);
    hostile.target = &engine;
    hostile.attacker = bob;

    uint64_t nId = 0;
    CValidationState state;
    BOOST_REQUIRE_MESSAGE(engine.MintPair(alice, TEST_URI, nId, state), FormatStateMessage(state));
    BOOST_CHECK(!hostile.fNestedSucceeded);
    BOOST_CHECK_EQUAL(hostile.strNestedReason, "pair-reentrant-call");

    // Only the outer pair exists
    BOOST_CHECK_EQUAL(engine.GetState().nLivePairs, 1U);
    BOOST_CHECK_EQUAL(node.pairledger->BalanceOf(bob), 0);

    // Also during the refund of a burn
    hostile.strNestedReason.clear();
    BOOST_REQUIRE(engine.BurnPair(alice, nId, state));
    BOOST_CHECK_EQUAL(hostile.strNestedReason, "pair-reentrant-call");
    BOOST_CHECK_EQUAL(engine.GetState().nLivePairs, 0U);

    // Outside an operation the engine is usable again
    hostile.target = nullptr;
    BOOST_CHECK(engine.MintPair(bob, TEST_URI, nId, state));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(pairengine_zerofee_tests, ZeroFeeTestingSetup)

BOOST_AUTO_TEST_CASE(zero_fee_pairs)
{
    const CAccountID carol = TestAccount("b3");
    uint64_t nId = 0;
    CValidationState state;
    // No stablecoin, no allowance needed
    BOOST_REQUIRE(node.engine->MintPair(carol, TEST_URI, nId, state));
    BOOST_CHECK_EQUAL(node.pairledger->BalanceOf(carol), PAIR_UNIT);
    BOOST_CHECK_EQUAL(node.stablecoin->BalanceOf(EngineAddress()), 0);

    PairRecord pair;
    BOOST_REQUIRE(node.engine->GetPair(nId, pair));
    BOOST_CHECK_EQUAL(pair.nFeePaid, 0);

    BOOST_CHECK(node.engine->BurnPair(carol, nId, state));
    BOOST_CHECK_EQUAL(node.stablecoin->BalanceOf(carol), 0);
}

BOOST_AUTO_TEST_SUITE_END()
