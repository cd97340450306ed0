// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pairs/pairengine.h"

#include "consensus/validation.h"
#include "logging.h"
#include "state/statedb.h"
#include "sync.h"
#include "token/collectibles.h"
#include "utilmoneystr.h"

#include <map>

namespace {

/** Holds the entered flag for one call; a nested call finds it taken */
class CReentrancyGuard
{
private:
    bool& fEntered;
    bool fOwner;

public:
    explicit CReentrancyGuard(bool& fEnteredIn) : fEntered(fEnteredIn), fOwner(false)
    {
        if (!fEntered) {
            fEntered = true;
            fOwner = true;
        }
    }
    ~CReentrancyGuard()
    {
        if (fOwner) {
            fEntered = false;
        }
    }

    bool Acquired() const { return fOwner; }
};

bool ReentrantCall(CValidationState& state)
{
    LogPrintf("CPairEngine: REJECT reentrant call\n");
    return state.Invalid(false, REJECT_INVALID, "pair-reentrant-call");
}

} // anonymous namespace

CPairEngine::CPairEngine(CStateDB& dbIn,
                         const CAccountID& addressIn,
                         IPairLedger& ledgerIn,
                         ICollectibleRegistry& registryIn,
                         IFungibleToken& stablecoinIn,
                         CAmount nFeeIn)
    : db(dbIn), address(addressIn), ledger(ledgerIn), registry(registryIn),
      stablecoin(stablecoinIn), nFee(nFeeIn), access(dbIn, addressIn, "engine"), fEntered(false)
{
}

bool CPairEngine::ReadStateOrNull(PairState& pairState) const
{
    if (!db.ReadPairState(pairState)) {
        pairState.SetNull();
    }
    return true;
}

/**
 * CheckPaired - Verify counters and their agreement with the collaborators
 *
 * pair_supply == live_pairs * PAIR_UNIT == ledger total supply
 * live_pairs == registry live count
 */
bool CPairEngine::CheckPaired(PairState& pairState, CValidationState& state) const
{
    if (!pairState.CheckInvariants()) {
        LogPrintf("ERROR: CheckPaired: INVARIANT BROKEN! %s\n", pairState.ToString());
        return state.Invalid(false, REJECT_INVARIANT, "pair-invariant-broken", pairState.ToString());
    }

    const CAmount nLedgerSupply = ledger.TotalSupply();
    const uint64_t nRegistryLive = registry.TotalSupply();
    if (nLedgerSupply != pairState.nPairSupply || nRegistryLive != pairState.nLivePairs) {
        LogPrintf("ERROR: CheckPaired: INVARIANT BROKEN! ledger=%s registry=%u %s\n",
                  FormatMoney(nLedgerSupply), nRegistryLive, pairState.ToString());
        return state.Invalid(false, REJECT_INVARIANT, "pair-invariant-broken",
                             strprintf("ledger=%s registry=%u", FormatMoney(nLedgerSupply), nRegistryLive));
    }

    LogPrint(BCLog::PAIRS, "CheckPaired: OK %s\n", pairState.ToString());
    return true;
}

// =============================================================================
// mintPair
// =============================================================================

bool CPairEngine::MintPair(const CAccountID& caller, const std::string& uri, uint64_t& nIdOut, CValidationState& state)
{
    LOCK(db.cs_state);
    CReentrancyGuard guard(fEntered);
    if (!guard.Acquired()) {
        return ReentrantCall(state);
    }

    // Check
    if (!access.CheckNotPaused(state)) {
        return false;
    }
    if (caller.IsNull()) {
        return state.Invalid(false, REJECT_INVALID, "bad-pair-zero-address");
    }
    // The engine's own fee pull would be a self transfer
    if (caller == address) {
        return state.Invalid(false, REJECT_INVALID, "bad-pair-engine-caller");
    }
    if (!ValidateTokenURI(uri, state)) {
        return false;
    }
    if (nFee > 0) {
        CAmount nBalance = stablecoin.BalanceOf(caller);
        if (nBalance < nFee) {
            LogPrint(BCLog::PAIRS, "MintPair: REJECT %s fee balance %s < %s\n", AccountLogStr(caller),
                     FormatMoney(nBalance), FormatMoney(nFee));
            return state.Invalid(false, REJECT_INSUFFICIENT, "insufficient-fee-balance",
                                 strprintf("has %s, fee %s", FormatMoney(nBalance), FormatMoney(nFee)));
        }
        CAmount nAllowance = stablecoin.Allowance(caller, address);
        if (nAllowance < nFee) {
            LogPrint(BCLog::PAIRS, "MintPair: REJECT %s fee allowance %s < %s\n", AccountLogStr(caller),
                     FormatMoney(nAllowance), FormatMoney(nFee));
            return state.Invalid(false, REJECT_INSUFFICIENT, "insufficient-fee-allowance",
                                 strprintf("allows %s, fee %s", FormatMoney(nAllowance), FormatMoney(nFee)));
        }
    }

    // Apply
    CStateDB::Txn txn(db);
    if (!txn.IsActive()) {
        return state.Error("db-txn-failed");
    }

    if (nFee > 0 && !stablecoin.TransferFrom(address, caller, address, nFee, state)) {
        return false;
    }
    if (!ledger.Mint(address, caller, PAIR_UNIT, state)) {
        return false;
    }
    uint64_t nId = 0;
    if (!registry.Mint(address, caller, uri, nId, state)) {
        return false;
    }
    if (db.IsPair(nId)) {
        return state.Invalid(false, REJECT_INVARIANT, "pair-id-reused", strprintf("id=%u", nId));
    }

    PairEvent event(EVENT_PAIR_MINTED);
    event.source = address;
    event.from = caller;
    event.nId = nId;
    event.amount = PAIR_UNIT;
    if (!db.AppendEvent(event)) {
        return state.Error("db-write-failed");
    }

    PairRecord pair;
    pair.nId = nId;
    pair.fExists = true;
    pair.nFeePaid = nFee;
    pair.nMintSeq = event.nSeq;

    PairState pairState;
    ReadStateOrNull(pairState);
    pairState.nLivePairs++;
    pairState.nPairSupply += PAIR_UNIT;
    pairState.nFeesEscrowed += nFee;
    pairState.nTotalMinted++;

    if (!db.WritePair(pair) || !db.WritePairState(pairState)) {
        return state.Error("db-write-failed");
    }
    if (!CheckPaired(pairState, state)) {
        return false;
    }
    if (!txn.Commit()) {
        return state.Error("db-commit-failed");
    }

    nIdOut = nId;
    LogPrint(BCLog::PAIRS, "MintPair: id=%u owner=%s fee=%s live=%u\n", nId, AccountLogStr(caller),
             FormatMoney(nFee), pairState.nLivePairs);
    return true;
}

// =============================================================================
// burnPair
// =============================================================================

bool CPairEngine::BurnPair(const CAccountID& caller, uint64_t nId, CValidationState& state)
{
    LOCK(db.cs_state);
    CReentrancyGuard guard(fEntered);
    if (!guard.Acquired()) {
        return ReentrantCall(state);
    }

    // Check
    if (!access.CheckNotPaused(state)) {
        return false;
    }
    if (caller == address) {
        return state.Invalid(false, REJECT_INVALID, "bad-pair-engine-caller");
    }
    PairRecord pair;
    if (!db.ReadPair(nId, pair) || !pair.fExists) {
        LogPrint(BCLog::PAIRS, "BurnPair: REJECT id=%u not live\n", nId);
        return state.Invalid(false, REJECT_INVARIANT, "pair-not-live", strprintf("id=%u", nId));
    }
    CAccountID owner;
    if (!registry.OwnerOf(nId, owner)) {
        return state.Invalid(false, REJECT_INVARIANT, "pair-unpaired", strprintf("id=%u has no collectible", nId));
    }
    if (owner != caller) {
        return state.Invalid(false, REJECT_UNAUTHORIZED, "not-pair-owner", strprintf("id=%u", nId));
    }
    if (ledger.BalanceOf(caller) < PAIR_UNIT) {
        return state.Invalid(false, REJECT_INSUFFICIENT, "insufficient-pair-balance", strprintf("id=%u", nId));
    }

    // Apply
    CStateDB::Txn txn(db);
    if (!txn.IsActive()) {
        return state.Error("db-txn-failed");
    }

    if (!ledger.Burn(address, caller, PAIR_UNIT, state)) {
        return false;
    }
    if (!registry.Burn(address, nId, state)) {
        return false;
    }
    if (!db.ErasePair(nId)) {
        return state.Error("db-write-failed");
    }
    if (pair.nFeePaid > 0 && !stablecoin.Transfer(address, caller, pair.nFeePaid, state)) {
        LogPrintf("BurnPair: refund of %s for id=%u failed: %s\n", FormatMoney(pair.nFeePaid), nId, FormatStateMessage(state));
        return false;
    }

    PairEvent event(EVENT_PAIR_BURNED);
    event.source = address;
    event.from = caller;
    event.nId = nId;
    event.amount = PAIR_UNIT;
    if (!db.AppendEvent(event)) {
        return state.Error("db-write-failed");
    }

    PairState pairState;
    ReadStateOrNull(pairState);
    pairState.nLivePairs--;
    pairState.nPairSupply -= PAIR_UNIT;
    pairState.nFeesEscrowed -= pair.nFeePaid;
    pairState.nTotalBurned++;

    if (!db.WritePairState(pairState)) {
        return state.Error("db-write-failed");
    }
    if (!CheckPaired(pairState, state)) {
        return false;
    }
    if (!txn.Commit()) {
        return state.Error("db-commit-failed");
    }

    LogPrint(BCLog::PAIRS, "BurnPair: id=%u owner=%s refund=%s live=%u\n", nId, AccountLogStr(caller),
             FormatMoney(pair.nFeePaid), pairState.nLivePairs);
    return true;
}

// =============================================================================
// transferPair
// =============================================================================

bool CPairEngine::TransferPair(const CAccountID& caller, const CAccountID& to, uint64_t nId, CValidationState& state)
{
    LOCK(db.cs_state);
    CReentrancyGuard guard(fEntered);
    if (!guard.Acquired()) {
        return ReentrantCall(state);
    }

    // Check
    if (!access.CheckNotPaused(state)) {
        return false;
    }
    if (to.IsNull()) {
        return state.Invalid(false, REJECT_INVALID, "bad-pair-zero-address");
    }
    if (caller == address) {
        return state.Invalid(false, REJECT_INVALID, "bad-pair-engine-caller");
    }
    PairRecord pair;
    if (!db.ReadPair(nId, pair) || !pair.fExists) {
        return state.Invalid(false, REJECT_INVARIANT, "pair-not-live", strprintf("id=%u", nId));
    }
    CAccountID owner;
    if (!registry.OwnerOf(nId, owner)) {
        return state.Invalid(false, REJECT_INVARIANT, "pair-unpaired", strprintf("id=%u has no collectible", nId));
    }
    if (owner != caller) {
        return state.Invalid(false, REJECT_UNAUTHORIZED, "not-pair-owner", strprintf("id=%u", nId));
    }
    if (ledger.BalanceOf(caller) < PAIR_UNIT) {
        return state.Invalid(false, REJECT_INSUFFICIENT, "insufficient-pair-balance", strprintf("id=%u", nId));
    }

    // Apply
    CStateDB::Txn txn(db);
    if (!txn.IsActive()) {
        return state.Error("db-txn-failed");
    }

    if (!ledger.TransferFrom(address, caller, to, PAIR_UNIT, state)) {
        return false;
    }
    if (!registry.TransferFrom(address, caller, to, nId, state)) {
        return false;
    }

    PairEvent event(EVENT_PAIR_TRANSFERRED);
    event.source = address;
    event.from = caller;
    event.to = to;
    event.nId = nId;
    event.amount = PAIR_UNIT;
    if (!db.AppendEvent(event)) {
        return state.Error("db-write-failed");
    }

    PairState pairState;
    ReadStateOrNull(pairState);
    if (!CheckPaired(pairState, state)) {
        return false;
    }
    if (!txn.Commit()) {
        return state.Error("db-commit-failed");
    }

    LogPrint(BCLog::PAIRS, "TransferPair: id=%u %s -> %s\n", nId, AccountLogStr(caller), AccountLogStr(to));
    return true;
}

// =============================================================================
// Administration
// =============================================================================

bool CPairEngine::Pause(const CAccountID& caller, CValidationState& state)
{
    return access.Pause(caller, state);
}

bool CPairEngine::Unpause(const CAccountID& caller, CValidationState& state)
{
    return access.Unpause(caller, state);
}

bool CPairEngine::IsPaused() const
{
    return access.IsPaused();
}

bool CPairEngine::EmergencyWithdraw(const CAccountID& caller, const CAccountID& token, CAmount amount, CValidationState& state)
{
    LOCK(db.cs_state);
    CReentrancyGuard guard(fEntered);
    if (!guard.Acquired()) {
        return ReentrantCall(state);
    }

    if (!access.CheckRole(ROLE_EMERGENCY, caller, state)) {
        return false;
    }

    IFungibleToken* pToken = nullptr;
    if (token == stablecoin.GetAddress()) {
        pToken = &stablecoin;
    } else if (token == ledger.GetAddress()) {
        pToken = &ledger;
    } else {
        return state.Invalid(false, REJECT_INVALID, "unknown-token", token.GetHex());
    }

    CStateDB::Txn txn(db);
    if (!txn.IsActive()) {
        return state.Error("db-txn-failed");
    }
    if (!pToken->Transfer(address, caller, amount, state)) {
        return false;
    }

    PairEvent event(EVENT_EMERGENCY_WITHDRAWAL);
    event.source = address;
    event.token = token;
    event.to = caller;
    event.amount = amount;
    if (!db.AppendEvent(event)) {
        return state.Error("db-write-failed");
    }
    if (!txn.Commit()) {
        return state.Error("db-commit-failed");
    }

    LogPrintf("EmergencyWithdraw: %s of %s to %s\n", FormatMoney(amount), token.GetHex(), AccountLogStr(caller));
    return true;
}

// =============================================================================
// Queries
// =============================================================================

bool CPairEngine::GetPair(uint64_t nId, PairRecord& pair) const
{
    LOCK(db.cs_state);
    return db.ReadPair(nId, pair) && pair.fExists;
}

bool CPairEngine::IsLive(uint64_t nId) const
{
    PairRecord pair;
    return GetPair(nId, pair);
}

bool CPairEngine::ForEachPair(std::function<bool(const PairRecord&)> func) const
{
    LOCK(db.cs_state);
    return db.ForEachPair(func);
}

PairState CPairEngine::GetState() const
{
    LOCK(db.cs_state);
    PairState pairState;
    ReadStateOrNull(pairState);
    return pairState;
}

void CPairEngine::AuditPairs(PairAudit& audit) const
{
    LOCK(db.cs_state);

    PairState pairState;
    ReadStateOrNull(pairState);

    std::map<CAccountID, uint64_t> mapOwned;
    CAmount nFeesRecorded = 0;
    bool fWalked = db.ForEachPair([&](const PairRecord& pair) {
        audit.nPairsChecked++;
        nFeesRecorded += pair.nFeePaid;
        CAccountID owner;
        if (!registry.OwnerOf(pair.nId, owner)) {
            audit.vProblems.push_back(strprintf("pair %u has no collectible", pair.nId));
        } else {
            mapOwned[owner]++;
        }
        return true;
    });
    if (!fWalked) {
        audit.vProblems.push_back(strprintf("pair records unreadable after %u entries", audit.nPairsChecked));
    }

    for (const auto& entry : mapOwned) {
        CAmount nBalance = ledger.BalanceOf(entry.first);
        if (nBalance < (CAmount)entry.second * PAIR_UNIT) {
            audit.vProblems.push_back(strprintf("%s owns %u pairs but holds %s", entry.first.GetHex(),
                                                entry.second, FormatMoney(nBalance)));
        }
    }
    audit.nOwners = mapOwned.size();

    if (audit.nPairsChecked != pairState.nLivePairs) {
        audit.vProblems.push_back(strprintf("%u records, state counts %u", audit.nPairsChecked, pairState.nLivePairs));
    }
    if (!pairState.CheckInvariants()) {
        audit.vProblems.push_back("counters broken: " + pairState.ToString());
    }
    if (ledger.TotalSupply() != pairState.nPairSupply) {
        audit.vProblems.push_back(strprintf("ledger supply %s != pair supply %s",
                                            FormatMoney(ledger.TotalSupply()), FormatMoney(pairState.nPairSupply)));
    }
    if (registry.TotalSupply() != pairState.nLivePairs) {
        audit.vProblems.push_back(strprintf("registry count %u != live pairs %u",
                                            registry.TotalSupply(), pairState.nLivePairs));
    }

    audit.nFeesRecorded = nFeesRecorded;
    audit.nEscrowBalance = stablecoin.BalanceOf(address);
    audit.fEscrowCovered = audit.nEscrowBalance >= nFeesRecorded;

    LogPrint(BCLog::PAIRS, "AuditPairs: %u pairs, %u owners, %u problems, escrow %s/%s\n",
             audit.nPairsChecked, audit.nOwners, audit.vProblems.size(),
             FormatMoney(audit.nEscrowBalance), FormatMoney(nFeesRecorded));
}
