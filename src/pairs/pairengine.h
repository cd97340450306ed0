// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PAIRMINT_PAIRS_PAIRENGINE_H
#define PAIRMINT_PAIRS_PAIRENGINE_H

/**
 * Pairing Engine - mints, moves and burns a fungible unit and a
 * collectible as one asset
 *
 * Operation model (every paired operation):
 *   1. take the state lock and the reentrancy guard
 *   2. Check: pause flag, arguments, ownership, balances, allowances
 *   3. Apply: collaborator calls, pair record, counters and event inside
 *      one database transaction
 *   4. cross-check counters against ledger supply and registry count
 *   5. commit, or roll back everything on the first failure
 *
 * The engine holds ROLE_MINTER, ROLE_BURNER and ROLE_TRANSFER on the pair
 * ledger and the registry; nobody else does, so neither half can move on
 * its own once minted.
 */

#include "access/accesscontrol.h"
#include "pairs/pair.h"
#include "token/collectible.h"
#include "token/fungible.h"

#include <functional>
#include <string>
#include <vector>

class CStateDB;
class CValidationState;

/** Result of AuditPairs */
struct PairAudit
{
    uint64_t nPairsChecked;
    uint64_t nOwners;
    CAmount nEscrowBalance;      // Stablecoin held by the engine
    CAmount nFeesRecorded;       // Fees owed back to live pairs
    bool fEscrowCovered;         // nEscrowBalance >= nFeesRecorded (reported, not enforced)
    std::vector<std::string> vProblems;

    PairAudit() : nPairsChecked(0), nOwners(0), nEscrowBalance(0), nFeesRecorded(0), fEscrowCovered(true) {}

    bool IsClean() const { return vProblems.empty(); }
};

class CPairEngine
{
private:
    CStateDB& db;
    CAccountID address;
    IPairLedger& ledger;
    ICollectibleRegistry& registry;
    IFungibleToken& stablecoin;
    CAmount nFee;
    CAccessControl access;

    //! Set while a paired operation runs (guarded by db.cs_state)
    bool fEntered;

    bool CheckPaired(PairState& pairState, CValidationState& state) const;
    bool ReadStateOrNull(PairState& pairState) const;

public:
    CPairEngine(CStateDB& dbIn,
                const CAccountID& addressIn,
                IPairLedger& ledgerIn,
                ICollectibleRegistry& registryIn,
                IFungibleToken& stablecoinIn,
                CAmount nFeeIn);

    const CAccountID& GetAddress() const { return address; }
    CAmount GetFee() const { return nFee; }
    CAccessControl& GetAccess() { return access; }
    const CAccessControl& GetAccess() const { return access; }

    /**
     * MintPair - Create a new pair owned by caller
     *
     * Pulls the fee from caller (needs balance and allowance to the engine),
     * mints PAIR_UNIT and the next collectible id to caller.
     *
     * @param nIdOut Identifier of the new pair
     */
    bool MintPair(const CAccountID& caller, const std::string& uri, uint64_t& nIdOut, CValidationState& state);

    /**
     * BurnPair - Destroy a live pair owned by caller
     *
     * Burns both halves, deletes the record and refunds the fee recorded
     * at mint. A failed refund rolls back the burn.
     */
    bool BurnPair(const CAccountID& caller, uint64_t nId, CValidationState& state);

    /** TransferPair - Move both halves of a live pair from caller to `to` */
    bool TransferPair(const CAccountID& caller, const CAccountID& to, uint64_t nId, CValidationState& state);

    bool Pause(const CAccountID& caller, CValidationState& state);
    bool Unpause(const CAccountID& caller, CValidationState& state);
    bool IsPaused() const;

    /**
     * EmergencyWithdraw - Sweep tokens held by the engine to caller
     *
     * ROLE_EMERGENCY only. Works while paused and does not look at the
     * pairing invariant, so escrowed fees may end up uncovered.
     *
     * @param token Stablecoin or pair ledger address
     */
    bool EmergencyWithdraw(const CAccountID& caller, const CAccountID& token, CAmount amount, CValidationState& state);

    bool GetPair(uint64_t nId, PairRecord& pair) const;
    bool IsLive(uint64_t nId) const;
    /** false if the record walk stopped on a database fault */
    bool ForEachPair(std::function<bool(const PairRecord&)> func) const;
    PairState GetState() const;

    /** Walk all live pairs and compare them with the ledger and registry */
    void AuditPairs(PairAudit& audit) const;
};

#endif // PAIRMINT_PAIRS_PAIRENGINE_H
