// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "token/collectibles.h"

#include "consensus/validation.h"
#include "logging.h"
#include "state/statedb.h"
#include "sync.h"
#include "utilstrencodings.h"

bool ValidateTokenURI(const std::string& uri, CValidationState& state)
{
    if (uri.empty()) {
        return state.Invalid(false, REJECT_INVALID, "bad-uri-empty");
    }

    for (const URIPrefix& entry : URI_PREFIXES) {
        const std::string strPrefix(entry.prefix);
        if (uri.compare(0, strPrefix.size(), strPrefix) == 0) {
            if (uri.size() < entry.nMinLength) {
                return state.Invalid(false, REJECT_INVALID, "bad-uri-length",
                                     strprintf("%s pointers need at least %u characters", strPrefix, entry.nMinLength));
            }
            return true;
        }
    }

    return state.Invalid(false, REJECT_INVALID, "bad-uri-prefix", SanitizeString(uri.substr(0, 16)));
}

CCollectibleRegistry::CCollectibleRegistry(CStateDB& dbIn, const CAccountID& addressIn, const std::string& strName)
    : db(dbIn), address(addressIn), access(dbIn, addressIn, strName)
{
}

bool CCollectibleRegistry::Exists(uint64_t nId) const
{
    CAccountID owner;
    return OwnerOf(nId, owner);
}

bool CCollectibleRegistry::OwnerOf(uint64_t nId, CAccountID& owner) const
{
    LOCK(db.cs_state);
    return db.ReadOwner(address, nId, owner);
}

bool CCollectibleRegistry::TokenURI(uint64_t nId, std::string& uri) const
{
    LOCK(db.cs_state);
    std::string strStored;
    if (!db.ReadTokenURI(address, nId, strStored)) {
        return false;
    }
    uri = db.ReadBaseURI(address) + strStored;
    return true;
}

bool CCollectibleRegistry::GetApproved(uint64_t nId, CAccountID& approved) const
{
    LOCK(db.cs_state);
    approved.SetNull();
    if (!Exists(nId)) {
        return false;
    }
    db.ReadApproval(address, nId, approved);
    return true;
}

uint64_t CCollectibleRegistry::NextId() const
{
    LOCK(db.cs_state);
    return db.ReadNextId(address);
}

uint64_t CCollectibleRegistry::TotalSupply() const
{
    LOCK(db.cs_state);
    return db.ReadLiveCount(address);
}

std::string CCollectibleRegistry::GetBaseURI() const
{
    LOCK(db.cs_state);
    return db.ReadBaseURI(address);
}

bool CCollectibleRegistry::Mint(const CAccountID& caller, const CAccountID& to, const std::string& uri, uint64_t& nIdOut, CValidationState& state)
{
    LOCK(db.cs_state);
    if (!access.CheckRole(ROLE_MINTER, caller, state)) {
        return false;
    }
    if (!access.CheckNotPaused(state)) {
        return false;
    }
    if (to.IsNull()) {
        return state.Invalid(false, REJECT_INVALID, "bad-mint-zero-address");
    }
    if (!ValidateTokenURI(uri, state)) {
        return false;
    }

    const uint64_t nId = db.ReadNextId(address);
    const uint64_t nLive = db.ReadLiveCount(address);

    CStateDB::Txn txn(db);
    if (!txn.IsActive()) {
        return state.Error("db-txn-failed");
    }
    if (!db.WriteOwner(address, nId, to) ||
        !db.WriteTokenURI(address, nId, uri) ||
        !db.WriteNextId(address, nId + 1) ||
        !db.WriteLiveCount(address, nLive + 1)) {
        return state.Error("db-write-failed");
    }
    if (!txn.Commit()) {
        return state.Error("db-commit-failed");
    }

    nIdOut = nId;
    LogPrint(BCLog::REGISTRY, "%s: mint id=%u to %s\n", access.GetName(), nId, AccountLogStr(to));
    return true;
}

bool CCollectibleRegistry::Burn(const CAccountID& caller, uint64_t nId, CValidationState& state)
{
    LOCK(db.cs_state);
    if (!access.CheckRole(ROLE_BURNER, caller, state)) {
        return false;
    }
    if (!access.CheckNotPaused(state)) {
        return false;
    }

    CAccountID owner;
    if (!db.ReadOwner(address, nId, owner)) {
        return state.Invalid(false, REJECT_INVARIANT, "nonexistent-token", strprintf("id=%u", nId));
    }
    CAccountID approved;
    db.ReadApproval(address, nId, approved);
    if (caller != owner && caller != approved && !access.HasRole(ROLE_TRANSFER, caller)) {
        return state.Invalid(false, REJECT_UNAUTHORIZED, "not-owner-nor-approved", strprintf("id=%u", nId));
    }

    const uint64_t nLive = db.ReadLiveCount(address);

    CStateDB::Txn txn(db);
    if (!txn.IsActive()) {
        return state.Error("db-txn-failed");
    }
    if (!db.EraseOwner(address, nId) ||
        !db.EraseTokenURI(address, nId) ||
        !db.EraseApproval(address, nId) ||
        !db.WriteLiveCount(address, nLive - 1)) {
        return state.Error("db-write-failed");
    }
    if (!txn.Commit()) {
        return state.Error("db-commit-failed");
    }

    LogPrint(BCLog::REGISTRY, "%s: burn id=%u (owner %s)\n", access.GetName(), nId, AccountLogStr(owner));
    return true;
}

bool CCollectibleRegistry::TransferFrom(const CAccountID& caller, const CAccountID& from, const CAccountID& to, uint64_t nId, CValidationState& state)
{
    LOCK(db.cs_state);
    if (!access.CheckRole(ROLE_TRANSFER, caller, state)) {
        return false;
    }
    if (!access.CheckNotPaused(state)) {
        return false;
    }
    if (to.IsNull()) {
        return state.Invalid(false, REJECT_INVALID, "bad-transfer-zero-address");
    }

    CAccountID owner;
    if (!db.ReadOwner(address, nId, owner)) {
        return state.Invalid(false, REJECT_INVARIANT, "nonexistent-token", strprintf("id=%u", nId));
    }
    if (owner != from) {
        return state.Invalid(false, REJECT_UNAUTHORIZED, "transfer-from-incorrect-owner", strprintf("id=%u", nId));
    }

    CStateDB::Txn txn(db);
    if (!txn.IsActive()) {
        return state.Error("db-txn-failed");
    }
    // A new owner starts without approvals
    if (!db.WriteOwner(address, nId, to) || !db.EraseApproval(address, nId)) {
        return state.Error("db-write-failed");
    }
    if (!txn.Commit()) {
        return state.Error("db-commit-failed");
    }

    LogPrint(BCLog::REGISTRY, "%s: transfer id=%u from %s to %s\n", access.GetName(), nId,
             AccountLogStr(from), AccountLogStr(to));
    return true;
}

bool CCollectibleRegistry::Approve(const CAccountID& caller, const CAccountID& to, uint64_t nId, CValidationState& state)
{
    LOCK(db.cs_state);
    CAccountID owner;
    if (!db.ReadOwner(address, nId, owner)) {
        return state.Invalid(false, REJECT_INVARIANT, "nonexistent-token", strprintf("id=%u", nId));
    }
    if (caller != owner) {
        return state.Invalid(false, REJECT_UNAUTHORIZED, "approve-caller-not-owner", strprintf("id=%u", nId));
    }
    if (to == owner) {
        return state.Invalid(false, REJECT_INVALID, "approve-to-owner");
    }

    bool fOk = to.IsNull() ? db.EraseApproval(address, nId) : db.WriteApproval(address, nId, to);
    if (!fOk) {
        return state.Error("db-write-failed");
    }
    return true;
}

bool CCollectibleRegistry::SetBaseURI(const CAccountID& caller, const std::string& uri, CValidationState& state)
{
    LOCK(db.cs_state);
    if (!access.CheckRole(ROLE_URI_SETTER, caller, state)) {
        return false;
    }
    if (!db.WriteBaseURI(address, uri)) {
        return state.Error("db-write-failed");
    }

    LogPrintf("%s: base metadata pointer set to \"%s\"\n", access.GetName(), SanitizeString(uri));
    return true;
}
