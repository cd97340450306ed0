// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PAIRMINT_STATE_STATEDB_H
#define PAIRMINT_STATE_STATEDB_H

/**
 * Deployment state database
 *
 * One SQLite key/value table holds the state of every component of a
 * deployment, so that a single transaction can span the engine, the
 * ledgers and the registry.
 *
 * DB Keys:
 * 'b' + token + account            -> CAmount balance
 * 'a' + token + owner + spender    -> CAmount allowance
 * 's' + token                      -> CAmount total supply
 * 'o' + registry + id              -> CAccountID owner
 * 'u' + registry + id              -> std::string metadata pointer
 * 'k' + registry + id              -> CAccountID approved account
 * 'n' + registry                   -> uint64_t next id
 * 'l' + registry                   -> uint64_t live collectible count
 * 'x' + registry                   -> std::string base metadata pointer
 * 'r' + domain + role + account    -> bool role membership
 * 'z' + domain                     -> bool paused
 * 'P' + id                         -> PairRecord
 * 'E' + seq                        -> PairEvent
 * "pairstate"                      -> PairState
 * "eventcount"                     -> uint64_t
 * "deployed"                       -> CAccountID bootstrap administrator
 * "version"                        -> int schema version
 *
 * Ids and sequence numbers are stored big-endian so that cursors walk
 * them in numeric order.
 */

#include "account.h"
#include "amount.h"
#include "fs.h"
#include "pairs/pair.h"
#include "state/db.h"
#include "sync.h"

#include <functional>
#include <memory>
#include <string>

// DB Key prefixes
static const char DB_BALANCE = 'b';
static const char DB_ALLOWANCE = 'a';
static const char DB_SUPPLY = 's';
static const char DB_NFT_OWNER = 'o';
static const char DB_NFT_URI = 'u';
static const char DB_NFT_APPROVAL = 'k';
static const char DB_NFT_NEXT_ID = 'n';
static const char DB_NFT_LIVE = 'l';
static const char DB_NFT_BASE_URI = 'x';
static const char DB_ROLE = 'r';
static const char DB_PAUSED = 'z';
static const char DB_PAIR = 'P';
static const char DB_EVENT = 'E';

static const std::string STATEDB_FILENAME = "state.sqlite";

class CStateDB
{
private:
    std::unique_ptr<SQLiteDatabase> m_database;
    std::unique_ptr<SQLiteBatch> m_batch;

public:
    /**
     * Open the database at path, or an in-memory one if fMemory.
     * Throws std::runtime_error when the file cannot be opened or carries
     * a schema version this build does not understand.
     */
    explicit CStateDB(const fs::path& path, bool fMemory = false);
    ~CStateDB();

    CStateDB(const CStateDB&) = delete;
    CStateDB& operator=(const CStateDB&) = delete;

    /**
     * Held for the whole of every state-changing operation. Recursive so
     * that a component called by the engine can take it again.
     */
    mutable RecursiveMutex cs_state;

    // Fungible balances (absent entries read as zero)
    CAmount ReadBalance(const CAccountID& token, const CAccountID& account) const;
    bool WriteBalance(const CAccountID& token, const CAccountID& account, CAmount amount);
    CAmount ReadAllowance(const CAccountID& token, const CAccountID& owner, const CAccountID& spender) const;
    bool WriteAllowance(const CAccountID& token, const CAccountID& owner, const CAccountID& spender, CAmount amount);
    CAmount ReadSupply(const CAccountID& token) const;
    bool WriteSupply(const CAccountID& token, CAmount amount);

    // Collectibles
    bool ReadOwner(const CAccountID& registry, uint64_t nId, CAccountID& owner) const;
    bool WriteOwner(const CAccountID& registry, uint64_t nId, const CAccountID& owner);
    bool EraseOwner(const CAccountID& registry, uint64_t nId);
    bool ReadTokenURI(const CAccountID& registry, uint64_t nId, std::string& uri) const;
    bool WriteTokenURI(const CAccountID& registry, uint64_t nId, const std::string& uri);
    bool EraseTokenURI(const CAccountID& registry, uint64_t nId);
    bool ReadApproval(const CAccountID& registry, uint64_t nId, CAccountID& approved) const;
    bool WriteApproval(const CAccountID& registry, uint64_t nId, const CAccountID& approved);
    bool EraseApproval(const CAccountID& registry, uint64_t nId);
    uint64_t ReadNextId(const CAccountID& registry) const;
    bool WriteNextId(const CAccountID& registry, uint64_t nNextId);
    uint64_t ReadLiveCount(const CAccountID& registry) const;
    bool WriteLiveCount(const CAccountID& registry, uint64_t nCount);
    std::string ReadBaseURI(const CAccountID& registry) const;
    bool WriteBaseURI(const CAccountID& registry, const std::string& uri);

    // Pair records
    bool WritePair(const PairRecord& pair);
    bool ReadPair(uint64_t nId, PairRecord& pair) const;
    bool ErasePair(uint64_t nId);
    bool IsPair(uint64_t nId) const;

    /**
     * ForEachPair - Iterate over live pair records in id order
     *
     * @param func Callback function (return false to stop iteration)
     * @return false if the walk hit an unreadable entry; the records before
     *         it have been passed to func
     */
    bool ForEachPair(std::function<bool(const PairRecord&)> func) const;

    bool WritePairState(const PairState& state);
    bool ReadPairState(PairState& state) const;

    // Access control
    bool HasRole(const CAccountID& domain, uint8_t nRole, const CAccountID& account) const;
    bool WriteRole(const CAccountID& domain, uint8_t nRole, const CAccountID& account);
    bool EraseRole(const CAccountID& domain, uint8_t nRole, const CAccountID& account);
    bool ForEachRoleMember(const CAccountID& domain, uint8_t nRole, std::function<bool(const CAccountID&)> func) const;
    bool ReadPaused(const CAccountID& domain) const;
    bool WritePaused(const CAccountID& domain, bool fPaused);

    // Event log
    /** Assign the next sequence number and the current time, then store */
    bool AppendEvent(PairEvent& event);
    bool ReadEvent(uint64_t nSeq, PairEvent& event) const;
    uint64_t ReadEventCount() const;
    bool ForEachEvent(uint64_t nFrom, std::function<bool(const PairEvent&)> func) const;

    // Deployment marker
    bool WriteDeployed(const CAccountID& admin);
    bool ReadDeployed(CAccountID& admin) const;

    void Flush();
    bool Backup(const std::string& strDest);
    bool IsMemory() const { return m_database->IsMock(); }
    const fs::path& GetPath() const { return m_database->GetPathToFile(); }

    /**
     * Txn - all-or-nothing scope over the database
     *
     * Begins on construction and rolls back on destruction unless Commit()
     * succeeded. Scopes nest; an inner commit only becomes durable when the
     * outermost scope commits.
     */
    class Txn
    {
    private:
        CStateDB& parent;
        bool fActive;

    public:
        explicit Txn(CStateDB& db);
        ~Txn();

        Txn(const Txn&) = delete;
        Txn& operator=(const Txn&) = delete;

        /** false if the scope could not be opened */
        bool IsActive() const { return fActive; }
        bool Commit();
        void Abort();
    };
};

#endif // PAIRMINT_STATE_STATEDB_H
