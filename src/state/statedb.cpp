// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "state/statedb.h"

#include "logging.h"
#include "util/format.h"
#include "utiltime.h"
#include "version.h"

#include <stdexcept>
#include <utility>
#include <vector>

// DB key helpers
namespace {

template<typename T>
std::pair<char, T> MakeKey(char prefix, const T& key)
{
    return std::make_pair(prefix, key);
}

typedef std::pair<CAccountID, CAccountID> AccountPair;
typedef std::pair<CAccountID, CBigEndian64> ItemKey;
typedef std::pair<CAccountID, std::pair<uint8_t, CAccountID>> RoleKey;

ItemKey MakeItem(const CAccountID& registry, uint64_t nId)
{
    return std::make_pair(registry, CBigEndian64(nId));
}

RoleKey MakeRole(const CAccountID& domain, uint8_t nRole, const CAccountID& account)
{
    return std::make_pair(domain, std::make_pair(nRole, account));
}

/**
 * Walk entries from the serialized start key while the prefix matches.
 * Entries are buffered before the callback runs, so callbacks may use the
 * batch freely. Returns false if the walk stopped on a read or decode
 * fault rather than at the end of the prefix.
 */
template<typename K, typename V>
bool ScanPrefix(SQLiteBatch& batch, char prefix, const K& start,
                std::vector<std::pair<K, V>>& entries,
                std::function<bool(const K&)> inRange)
{
    if (!batch.StartCursor(MakeKey(prefix, start))) {
        LogPrintf("ScanPrefix: cannot start cursor under '%c'\n", prefix);
        return false;
    }

    bool fOk = true;
    while (true) {
        CDataStream ssKey(SER_DISK, CLIENT_VERSION);
        CDataStream ssValue(SER_DISK, CLIENT_VERSION);
        bool complete = false;
        if (!batch.ReadAtCursor(ssKey, ssValue, complete)) {
            LogPrintf("ERROR: ScanPrefix: cursor read failed under '%c' after %u entries\n", prefix, entries.size());
            fOk = false;
            break;
        }
        if (complete) {
            break;
        }

        char chPrefix = 0;
        K key;
        V value;
        try {
            ssKey >> chPrefix;
            if (chPrefix != prefix) {
                break;  // No more entries under this prefix
            }
            ssKey >> key;
            if (!inRange(key)) {
                break;
            }
            ssValue >> value;
        } catch (const std::exception& e) {
            LogPrintf("ERROR: ScanPrefix: undecodable entry under '%c' after %u entries: %s\n", prefix, entries.size(), e.what());
            fOk = false;
            break;
        }
        entries.emplace_back(key, value);
    }
    batch.CloseCursor();
    return fOk;
}

} // anonymous namespace

CStateDB::CStateDB(const fs::path& path, bool fMemory)
{
    if (fMemory) {
        m_database = SQLiteDatabase::CreateMock();
    } else {
        std::string strWarning, strError;
        if (!SQLiteDatabase::VerifyDatabaseFile(path, strWarning, strError)) {
            throw std::runtime_error(strError);
        }
        if (!strWarning.empty()) {
            LogPrintf("%s\n", strWarning);
        }
        m_database = std::make_unique<SQLiteDatabase>(path);
    }
    m_batch = std::make_unique<SQLiteBatch>(*m_database);

    int nVersion = 0;
    if (!m_batch->ReadVersion(nVersion)) {
        // Fresh database
        if (!m_batch->WriteVersion(DB_SCHEMA_VERSION)) {
            throw std::runtime_error("CStateDB: failed to write schema version");
        }
        nVersion = DB_SCHEMA_VERSION;
    }
    if (nVersion != DB_SCHEMA_VERSION) {
        throw std::runtime_error(strprintf("CStateDB: unsupported schema version %d (expected %d)",
                                           nVersion, DB_SCHEMA_VERSION));
    }

    LogPrint(BCLog::DB, "CStateDB: opened %s (schema version %d)\n",
             fMemory ? std::string(":memory:") : path.string(), nVersion);
}

CStateDB::~CStateDB()
{
    m_batch.reset();
    m_database.reset();
}

// =============================================================================
// Fungible balances
// =============================================================================

CAmount CStateDB::ReadBalance(const CAccountID& token, const CAccountID& account) const
{
    CAmount amount = 0;
    if (!m_batch->Read(MakeKey(DB_BALANCE, AccountPair(token, account)), amount)) {
        return 0;
    }
    return amount;
}

bool CStateDB::WriteBalance(const CAccountID& token, const CAccountID& account, CAmount amount)
{
    auto key = MakeKey(DB_BALANCE, AccountPair(token, account));
    if (amount == 0) {
        return m_batch->Erase(key);
    }
    return m_batch->Write(key, amount);
}

CAmount CStateDB::ReadAllowance(const CAccountID& token, const CAccountID& owner, const CAccountID& spender) const
{
    CAmount amount = 0;
    if (!m_batch->Read(MakeKey(DB_ALLOWANCE, std::make_pair(token, AccountPair(owner, spender))), amount)) {
        return 0;
    }
    return amount;
}

bool CStateDB::WriteAllowance(const CAccountID& token, const CAccountID& owner, const CAccountID& spender, CAmount amount)
{
    auto key = MakeKey(DB_ALLOWANCE, std::make_pair(token, AccountPair(owner, spender)));
    if (amount == 0) {
        return m_batch->Erase(key);
    }
    return m_batch->Write(key, amount);
}

CAmount CStateDB::ReadSupply(const CAccountID& token) const
{
    CAmount amount = 0;
    if (!m_batch->Read(MakeKey(DB_SUPPLY, token), amount)) {
        return 0;
    }
    return amount;
}

bool CStateDB::WriteSupply(const CAccountID& token, CAmount amount)
{
    return m_batch->Write(MakeKey(DB_SUPPLY, token), amount);
}

// =============================================================================
// Collectibles
// =============================================================================

bool CStateDB::ReadOwner(const CAccountID& registry, uint64_t nId, CAccountID& owner) const
{
    return m_batch->Read(MakeKey(DB_NFT_OWNER, MakeItem(registry, nId)), owner);
}

bool CStateDB::WriteOwner(const CAccountID& registry, uint64_t nId, const CAccountID& owner)
{
    return m_batch->Write(MakeKey(DB_NFT_OWNER, MakeItem(registry, nId)), owner);
}

bool CStateDB::EraseOwner(const CAccountID& registry, uint64_t nId)
{
    return m_batch->Erase(MakeKey(DB_NFT_OWNER, MakeItem(registry, nId)));
}

bool CStateDB::ReadTokenURI(const CAccountID& registry, uint64_t nId, std::string& uri) const
{
    return m_batch->Read(MakeKey(DB_NFT_URI, MakeItem(registry, nId)), uri);
}

bool CStateDB::WriteTokenURI(const CAccountID& registry, uint64_t nId, const std::string& uri)
{
    return m_batch->Write(MakeKey(DB_NFT_URI, MakeItem(registry, nId)), uri);
}

bool CStateDB::EraseTokenURI(const CAccountID& registry, uint64_t nId)
{
    return m_batch->Erase(MakeKey(DB_NFT_URI, MakeItem(registry, nId)));
}

bool CStateDB::ReadApproval(const CAccountID& registry, uint64_t nId, CAccountID& approved) const
{
    return m_batch->Read(MakeKey(DB_NFT_APPROVAL, MakeItem(registry, nId)), approved);
}

bool CStateDB::WriteApproval(const CAccountID& registry, uint64_t nId, const CAccountID& approved)
{
    return m_batch->Write(MakeKey(DB_NFT_APPROVAL, MakeItem(registry, nId)), approved);
}

bool CStateDB::EraseApproval(const CAccountID& registry, uint64_t nId)
{
    return m_batch->Erase(MakeKey(DB_NFT_APPROVAL, MakeItem(registry, nId)));
}

uint64_t CStateDB::ReadNextId(const CAccountID& registry) const
{
    uint64_t nNextId = 0;
    if (!m_batch->Read(MakeKey(DB_NFT_NEXT_ID, registry), nNextId)) {
        return 0;
    }
    return nNextId;
}

bool CStateDB::WriteNextId(const CAccountID& registry, uint64_t nNextId)
{
    return m_batch->Write(MakeKey(DB_NFT_NEXT_ID, registry), nNextId);
}

uint64_t CStateDB::ReadLiveCount(const CAccountID& registry) const
{
    uint64_t nCount = 0;
    if (!m_batch->Read(MakeKey(DB_NFT_LIVE, registry), nCount)) {
        return 0;
    }
    return nCount;
}

bool CStateDB::WriteLiveCount(const CAccountID& registry, uint64_t nCount)
{
    return m_batch->Write(MakeKey(DB_NFT_LIVE, registry), nCount);
}

std::string CStateDB::ReadBaseURI(const CAccountID& registry) const
{
    std::string uri;
    if (!m_batch->Read(MakeKey(DB_NFT_BASE_URI, registry), uri)) {
        return std::string();
    }
    return uri;
}

bool CStateDB::WriteBaseURI(const CAccountID& registry, const std::string& uri)
{
    auto key = MakeKey(DB_NFT_BASE_URI, registry);
    if (uri.empty()) {
        return m_batch->Erase(key);
    }
    return m_batch->Write(key, uri);
}

// =============================================================================
// Pair records
// =============================================================================

bool CStateDB::WritePair(const PairRecord& pair)
{
    return m_batch->Write(MakeKey(DB_PAIR, CBigEndian64(pair.nId)), pair);
}

bool CStateDB::ReadPair(uint64_t nId, PairRecord& pair) const
{
    return m_batch->Read(MakeKey(DB_PAIR, CBigEndian64(nId)), pair);
}

bool CStateDB::ErasePair(uint64_t nId)
{
    return m_batch->Erase(MakeKey(DB_PAIR, CBigEndian64(nId)));
}

bool CStateDB::IsPair(uint64_t nId) const
{
    return m_batch->Exists(MakeKey(DB_PAIR, CBigEndian64(nId)));
}

bool CStateDB::ForEachPair(std::function<bool(const PairRecord&)> func) const
{
    std::vector<std::pair<CBigEndian64, PairRecord>> entries;
    bool fOk = ScanPrefix<CBigEndian64, PairRecord>(*m_batch, DB_PAIR, CBigEndian64(0), entries,
                                                    [](const CBigEndian64&) { return true; });

    for (const auto& entry : entries) {
        if (!func(entry.second)) {
            break;  // Callback returned false, stop iteration
        }
    }
    return fOk;
}

bool CStateDB::WritePairState(const PairState& state)
{
    return m_batch->Write(std::string("pairstate"), state);
}

bool CStateDB::ReadPairState(PairState& state) const
{
    return m_batch->Read(std::string("pairstate"), state);
}

// =============================================================================
// Access control
// =============================================================================

bool CStateDB::HasRole(const CAccountID& domain, uint8_t nRole, const CAccountID& account) const
{
    return m_batch->Exists(MakeKey(DB_ROLE, MakeRole(domain, nRole, account)));
}

bool CStateDB::WriteRole(const CAccountID& domain, uint8_t nRole, const CAccountID& account)
{
    return m_batch->Write(MakeKey(DB_ROLE, MakeRole(domain, nRole, account)), true);
}

bool CStateDB::EraseRole(const CAccountID& domain, uint8_t nRole, const CAccountID& account)
{
    return m_batch->Erase(MakeKey(DB_ROLE, MakeRole(domain, nRole, account)));
}

bool CStateDB::ForEachRoleMember(const CAccountID& domain, uint8_t nRole, std::function<bool(const CAccountID&)> func) const
{
    std::vector<std::pair<RoleKey, bool>> entries;
    bool fOk = ScanPrefix<RoleKey, bool>(*m_batch, DB_ROLE, MakeRole(domain, nRole, CAccountID()), entries,
                              [&](const RoleKey& key) { return key.first == domain && key.second.first == nRole; });

    for (const auto& entry : entries) {
        if (!func(entry.first.second.second)) {
            break;
        }
    }
    return fOk;
}

bool CStateDB::ReadPaused(const CAccountID& domain) const
{
    bool fPaused = false;
    if (!m_batch->Read(MakeKey(DB_PAUSED, domain), fPaused)) {
        return false;
    }
    return fPaused;
}

bool CStateDB::WritePaused(const CAccountID& domain, bool fPaused)
{
    return m_batch->Write(MakeKey(DB_PAUSED, domain), fPaused);
}

// =============================================================================
// Event log
// =============================================================================

bool CStateDB::AppendEvent(PairEvent& event)
{
    uint64_t nCount = ReadEventCount();
    event.nSeq = nCount;
    event.nTime = GetTime();
    if (!m_batch->Write(MakeKey(DB_EVENT, CBigEndian64(event.nSeq)), event)) {
        return false;
    }
    LogPrint(BCLog::DB, "AppendEvent: seq=%u %s\n", event.nSeq, event.ToString());
    return m_batch->Write(std::string("eventcount"), nCount + 1);
}

bool CStateDB::ReadEvent(uint64_t nSeq, PairEvent& event) const
{
    return m_batch->Read(MakeKey(DB_EVENT, CBigEndian64(nSeq)), event);
}

uint64_t CStateDB::ReadEventCount() const
{
    uint64_t nCount = 0;
    if (!m_batch->Read(std::string("eventcount"), nCount)) {
        return 0;
    }
    return nCount;
}

bool CStateDB::ForEachEvent(uint64_t nFrom, std::function<bool(const PairEvent&)> func) const
{
    std::vector<std::pair<CBigEndian64, PairEvent>> entries;
    bool fOk = ScanPrefix<CBigEndian64, PairEvent>(*m_batch, DB_EVENT, CBigEndian64(nFrom), entries,
                                                   [](const CBigEndian64&) { return true; });

    for (const auto& entry : entries) {
        if (!func(entry.second)) {
            break;
        }
    }
    return fOk;
}

// =============================================================================
// Deployment marker
// =============================================================================

bool CStateDB::WriteDeployed(const CAccountID& admin)
{
    return m_batch->Write(std::string("deployed"), admin);
}

bool CStateDB::ReadDeployed(CAccountID& admin) const
{
    return m_batch->Read(std::string("deployed"), admin);
}

void CStateDB::Flush()
{
    m_database->Flush(false);
}

bool CStateDB::Backup(const std::string& strDest)
{
    LOCK(cs_state);
    return m_database->Backup(strDest);
}

// =============================================================================
// Txn
// =============================================================================

CStateDB::Txn::Txn(CStateDB& db) : parent(db), fActive(false)
{
    fActive = parent.m_batch->TxnBegin();
}

CStateDB::Txn::~Txn()
{
    if (fActive) {
        Abort();
    }
}

bool CStateDB::Txn::Commit()
{
    if (!fActive) {
        return false;
    }
    fActive = false;
    if (!parent.m_batch->TxnCommit()) {
        // Release failed: undo this level so the depth stays consistent
        parent.m_batch->TxnAbort();
        return false;
    }
    return true;
}

void CStateDB::Txn::Abort()
{
    if (!fActive) {
        return;
    }
    fActive = false;
    if (!parent.m_batch->TxnAbort()) {
        LogPrintf("CStateDB::Txn: rollback failed\n");
    }
}
