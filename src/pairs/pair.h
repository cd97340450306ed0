// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PAIRMINT_PAIRS_PAIR_H
#define PAIRMINT_PAIRS_PAIR_H

/**
 * Paired assets - one fungible unit bound to one collectible id
 *
 * Pairing invariant: pair_supply == live_pairs * PAIR_UNIT
 *   Every live collectible id corresponds to exactly one PAIR_UNIT of the
 *   pair ledger, held by the same account that owns the id.
 *
 * DB Keys (see state/statedb.h for the full table):
 * 'P' + id (big-endian)   -> PairRecord
 * "pairstate"             -> PairState
 * 'E' + seq (big-endian)  -> PairEvent
 */

#include "account.h"
#include "amount.h"
#include "serialize.h"

#include <stdint.h>
#include <string>

/** One fungible unit travels with each collectible: 1.000000 */
static const CAmount PAIR_UNIT = COIN;

/** Default stablecoin fee charged on mint and refunded on burn */
static const CAmount DEFAULT_PAIR_FEE = COIN;

/**
 * PairRecord - durable record of a live pair
 *
 * Exists from mintPair until burnPair. Ownership is not stored here; the
 * ledger and the registry track it and the engine keeps them coupled.
 */
struct PairRecord
{
    uint64_t nId;                // Collectible identifier
    bool fExists;                // true while the pair is live
    CAmount nFeePaid;            // Stablecoin fee escrowed at mint, refunded on burn
    uint64_t nMintSeq;           // Event sequence number of the mint

    PairRecord() { SetNull(); }

    void SetNull()
    {
        nId = 0;
        fExists = false;
        nFeePaid = 0;
        nMintSeq = 0;
    }

    bool IsNull() const { return !fExists; }

    SERIALIZE_METHODS(PairRecord, obj)
    {
        READWRITE(obj.nId, obj.fExists);
        READWRITE(obj.nFeePaid, obj.nMintSeq);
    }
};

/**
 * PairState - aggregate counters of the pairing engine
 *
 * Updated by every paired operation in the same transaction as the records.
 */
struct PairState
{
    uint64_t nLivePairs;         // Records with fExists
    CAmount nPairSupply;         // Pair-ledger units attributed to live pairs
    CAmount nFeesEscrowed;       // Sum of nFeePaid over live pairs
    uint64_t nTotalMinted;       // Pairs ever minted
    uint64_t nTotalBurned;       // Pairs ever burned

    PairState() { SetNull(); }

    void SetNull()
    {
        nLivePairs = 0;
        nPairSupply = 0;
        nFeesEscrowed = 0;
        nTotalMinted = 0;
        nTotalBurned = 0;
    }

    /**
     * CheckInvariants - Verify the pairing invariants
     *
     * pair_supply == live_pairs * PAIR_UNIT
     * total_minted - total_burned == live_pairs
     */
    bool CheckInvariants() const
    {
        // All amounts must be non-negative
        if (nPairSupply < 0 || nFeesEscrowed < 0) {
            return false;
        }

        if (nTotalBurned > nTotalMinted) {
            return false;
        }

        if (nPairSupply != (CAmount)nLivePairs * PAIR_UNIT) {
            return false;
        }

        return nTotalMinted - nTotalBurned == nLivePairs;
    }

    std::string ToString() const;

    SERIALIZE_METHODS(PairState, obj)
    {
        READWRITE(obj.nLivePairs, obj.nPairSupply, obj.nFeesEscrowed);
        READWRITE(obj.nTotalMinted, obj.nTotalBurned);
    }
};

/** Kinds of entries in the append-only event log */
enum PairEventType : uint8_t {
    EVENT_PAIR_MINTED = 1,
    EVENT_PAIR_BURNED = 2,
    EVENT_PAIR_TRANSFERRED = 3,
    EVENT_EMERGENCY_WITHDRAWAL = 4,
    EVENT_PAUSE_CHANGED = 5,
    EVENT_ROLE_GRANTED = 6,
    EVENT_ROLE_REVOKED = 7,
};

std::string EventTypeToString(uint8_t nType);

/**
 * PairEvent - one entry of the event log
 *
 * Only the fields relevant to nType are set:
 *   minted/burned:   from = owner, nId, amount
 *   transferred:     from, to, nId, amount
 *   emergency:       token, to, amount
 *   pause:           source = component, fPaused
 *   role:            source = component, to = account, nRole
 */
struct PairEvent
{
    uint64_t nSeq;
    uint8_t nType;
    int64_t nTime;
    CAccountID source;
    CAccountID from;
    CAccountID to;
    CAccountID token;
    uint64_t nId;
    CAmount amount;
    bool fPaused;
    uint8_t nRole;

    PairEvent() { SetNull(); }
    explicit PairEvent(uint8_t nTypeIn) { SetNull(); nType = nTypeIn; }

    void SetNull()
    {
        nSeq = 0;
        nType = 0;
        nTime = 0;
        source.SetNull();
        from.SetNull();
        to.SetNull();
        token.SetNull();
        nId = 0;
        amount = 0;
        fPaused = false;
        nRole = 0;
    }

    std::string ToString() const;

    SERIALIZE_METHODS(PairEvent, obj)
    {
        READWRITE(obj.nSeq, obj.nType, obj.nTime);
        READWRITE(obj.source, obj.from, obj.to, obj.token);
        READWRITE(obj.nId, obj.amount, obj.fPaused, obj.nRole);
    }
};

#endif // PAIRMINT_PAIRS_PAIR_H
