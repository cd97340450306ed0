// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "access/accesscontrol.h"

#include "consensus/validation.h"
#include "logging.h"
#include "pairs/pair.h"
#include "state/statedb.h"
#include "sync.h"

static const char* const ROLE_NAMES[ROLE_COUNT] = {
    "admin",
    "pauser",
    "minter",
    "burner",
    "transfer",
    "emergency",
    "urisetter",
};

std::string RoleToString(uint8_t nRole)
{
    if (nRole >= ROLE_COUNT) {
        return "unknown";
    }
    return ROLE_NAMES[nRole];
}

bool RoleFromString(const std::string& str, AccessRole& role)
{
    for (uint8_t n = 0; n < ROLE_COUNT; n++) {
        if (str == ROLE_NAMES[n]) {
            role = static_cast<AccessRole>(n);
            return true;
        }
    }
    return false;
}

CAccessControl::CAccessControl(CStateDB& dbIn, const CAccountID& domainIn, const std::string& strNameIn)
    : db(dbIn), domain(domainIn), strName(strNameIn)
{
}

bool CAccessControl::HasRole(AccessRole role, const CAccountID& account) const
{
    LOCK(db.cs_state);
    return db.HasRole(domain, role, account);
}

bool CAccessControl::CheckRole(AccessRole role, const CAccountID& account, CValidationState& state) const
{
    if (!HasRole(role, account)) {
        return state.Invalid(false, REJECT_UNAUTHORIZED, "missing-role-" + RoleToString(role),
                             strprintf("%s on %s", AccountLogStr(account), strName));
    }
    return true;
}

bool CAccessControl::SetupRole(AccessRole role, const CAccountID& account, CValidationState& state)
{
    return AddRole(CAccountID(), role, account, state);
}

bool CAccessControl::AddRole(const CAccountID& grantor, AccessRole role, const CAccountID& account, CValidationState& state)
{
    if (account.IsNull()) {
        return state.Invalid(false, REJECT_INVALID, "bad-role-zero-address");
    }

    LOCK(db.cs_state);
    if (db.HasRole(domain, role, account)) {
        return true;
    }

    CStateDB::Txn txn(db);
    if (!txn.IsActive()) {
        return state.Error("db-txn-failed");
    }

    PairEvent event(EVENT_ROLE_GRANTED);
    event.source = domain;
    event.from = grantor;
    event.to = account;
    event.nRole = role;
    if (!db.WriteRole(domain, role, account) || !db.AppendEvent(event)) {
        return state.Error("db-write-failed");
    }
    if (!txn.Commit()) {
        return state.Error("db-commit-failed");
    }

    LogPrint(BCLog::ACCESS, "%s: %s granted %s\n", strName, AccountLogStr(account), RoleToString(role));
    return true;
}

bool CAccessControl::GrantRole(const CAccountID& caller, AccessRole role, const CAccountID& account, CValidationState& state)
{
    LOCK(db.cs_state);
    if (!CheckRole(ROLE_ADMIN, caller, state)) {
        return false;
    }
    if (role >= ROLE_COUNT) {
        return state.Invalid(false, REJECT_INVALID, "bad-role");
    }

    CStateDB::Txn txn(db);
    if (!txn.IsActive()) {
        return state.Error("db-txn-failed");
    }
    if (!AddRole(caller, role, account, state)) {
        return false;
    }
    if (!txn.Commit()) {
        return state.Error("db-commit-failed");
    }
    return true;
}

bool CAccessControl::RevokeRole(const CAccountID& caller, AccessRole role, const CAccountID& account, CValidationState& state)
{
    LOCK(db.cs_state);
    if (!CheckRole(ROLE_ADMIN, caller, state)) {
        return false;
    }
    if (role >= ROLE_COUNT) {
        return state.Invalid(false, REJECT_INVALID, "bad-role");
    }
    if (!db.HasRole(domain, role, account)) {
        return true;
    }
    if (role == ROLE_ADMIN && CountRoleMembers(ROLE_ADMIN) <= 1) {
        return state.Invalid(false, REJECT_INVALID, "last-admin", strName);
    }

    CStateDB::Txn txn(db);
    if (!txn.IsActive()) {
        return state.Error("db-txn-failed");
    }

    PairEvent event(EVENT_ROLE_REVOKED);
    event.source = domain;
    event.from = caller;
    event.to = account;
    event.nRole = role;
    if (!db.EraseRole(domain, role, account) || !db.AppendEvent(event)) {
        return state.Error("db-write-failed");
    }
    if (!txn.Commit()) {
        return state.Error("db-commit-failed");
    }

    LogPrint(BCLog::ACCESS, "%s: %s revoked %s from %s\n", strName, AccountLogStr(caller),
             RoleToString(role), AccountLogStr(account));
    return true;
}

unsigned int CAccessControl::CountRoleMembers(AccessRole role) const
{
    LOCK(db.cs_state);
    unsigned int nCount = 0;
    if (!db.ForEachRoleMember(domain, role, [&](const CAccountID&) {
            nCount++;
            return true;
        })) {
        LogPrintf("%s: role table for %s unreadable, counted %u before the fault\n", strName, RoleToString(role), nCount);
    }
    return nCount;
}

bool CAccessControl::IsPaused() const
{
    LOCK(db.cs_state);
    return db.ReadPaused(domain);
}

bool CAccessControl::CheckNotPaused(CValidationState& state) const
{
    if (IsPaused()) {
        return state.Invalid(false, REJECT_PAUSED, strName + "-paused");
    }
    return true;
}

bool CAccessControl::Pause(const CAccountID& caller, CValidationState& state)
{
    return SetPaused(caller, true, state);
}

bool CAccessControl::Unpause(const CAccountID& caller, CValidationState& state)
{
    return SetPaused(caller, false, state);
}

bool CAccessControl::SetPaused(const CAccountID& caller, bool fPaused, CValidationState& state)
{
    LOCK(db.cs_state);
    if (!CheckRole(ROLE_PAUSER, caller, state)) {
        return false;
    }
    if (db.ReadPaused(domain) == fPaused) {
        return state.Invalid(false, REJECT_INVALID, fPaused ? "already-paused" : "not-paused", strName);
    }

    CStateDB::Txn txn(db);
    if (!txn.IsActive()) {
        return state.Error("db-txn-failed");
    }

    PairEvent event(EVENT_PAUSE_CHANGED);
    event.source = domain;
    event.from = caller;
    event.fPaused = fPaused;
    if (!db.WritePaused(domain, fPaused) || !db.AppendEvent(event)) {
        return state.Error("db-write-failed");
    }
    if (!txn.Commit()) {
        return state.Error("db-commit-failed");
    }

    LogPrintf("%s: %s by %s\n", strName, fPaused ? "PAUSED" : "unpaused", AccountLogStr(caller));
    return true;
}
