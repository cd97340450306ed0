// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PAIRMINT_ACCESS_ACCESSCONTROL_H
#define PAIRMINT_ACCESS_ACCESSCONTROL_H

#include "account.h"

#include <stdint.h>
#include <string>

class CStateDB;
class CValidationState;

/**
 * Roles of a permission domain.
 *
 * Every component (engine, pair ledger, registry, stablecoin) is its own
 * domain, keyed by the component's account. Holding ROLE_MINTER on the
 * ledger says nothing about the registry.
 */
enum AccessRole : uint8_t {
    ROLE_ADMIN = 0,       //!< grant and revoke roles
    ROLE_PAUSER = 1,      //!< pause and unpause the component
    ROLE_MINTER = 2,      //!< create units or collectibles
    ROLE_BURNER = 3,      //!< destroy units or collectibles
    ROLE_TRANSFER = 4,    //!< move assets between holders (engine only)
    ROLE_EMERGENCY = 5,   //!< sweep custody of the engine
    ROLE_URI_SETTER = 6,  //!< change the base metadata pointer
    ROLE_COUNT
};

std::string RoleToString(uint8_t nRole);
/** Accepts the names printed by RoleToString; false if unknown */
bool RoleFromString(const std::string& str, AccessRole& role);

/**
 * CAccessControl - role table and pause switch of one component
 *
 * State lives in the deployment database; this object only names the
 * domain. Pause/grant/revoke append to the event log.
 */
class CAccessControl
{
private:
    CStateDB& db;
    CAccountID domain;
    std::string strName;

public:
    CAccessControl(CStateDB& dbIn, const CAccountID& domainIn, const std::string& strNameIn);

    const CAccountID& GetDomain() const { return domain; }
    const std::string& GetName() const { return strName; }

    bool HasRole(AccessRole role, const CAccountID& account) const;

    /** Fails with REJECT_UNAUTHORIZED "missing-role-<role>" */
    bool CheckRole(AccessRole role, const CAccountID& account, CValidationState& state) const;

    /** Grant without an admin check. Bootstrap only. */
    bool SetupRole(AccessRole role, const CAccountID& account, CValidationState& state);

    /**
     * Grant a role. Caller must hold ROLE_ADMIN in this domain. Granting a
     * role the account already holds succeeds without an event.
     */
    bool GrantRole(const CAccountID& caller, AccessRole role, const CAccountID& account, CValidationState& state);

    /**
     * Revoke a role. Caller must hold ROLE_ADMIN. Removing the last admin
     * of the domain is refused.
     */
    bool RevokeRole(const CAccountID& caller, AccessRole role, const CAccountID& account, CValidationState& state);

    /** Number of accounts holding a role */
    unsigned int CountRoleMembers(AccessRole role) const;

    bool IsPaused() const;

    /** Fails with REJECT_PAUSED "<name>-paused" */
    bool CheckNotPaused(CValidationState& state) const;

    /** Caller must hold ROLE_PAUSER. Fails with "already-paused" / "not-paused". */
    bool Pause(const CAccountID& caller, CValidationState& state);
    bool Unpause(const CAccountID& caller, CValidationState& state);

private:
    bool AddRole(const CAccountID& grantor, AccessRole role, const CAccountID& account, CValidationState& state);
    bool SetPaused(const CAccountID& caller, bool fPaused, CValidationState& state);
};

#endif // PAIRMINT_ACCESS_ACCESSCONTROL_H
