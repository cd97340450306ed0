// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PAIRMINT_TOKEN_TOKENLEDGER_H
#define PAIRMINT_TOKEN_TOKENLEDGER_H

#include "access/accesscontrol.h"
#include "token/fungible.h"

#include <string>

class CStateDB;

/**
 * CTokenLedger - database backed balance token (6 decimals)
 *
 * Used for both the fungible half of a pair and the fee stablecoin:
 *
 * - restricted (pair ledger): Transfer and TransferFrom require
 *   ROLE_TRANSFER; a privileged TransferFrom does not consume allowance.
 *   Holders therefore cannot move their unit apart from its collectible.
 * - unrestricted (stablecoin): anyone moves their own balance, and
 *   TransferFrom spends the allowance granted by `from`.
 *
 * Mint and Burn always require ROLE_MINTER / ROLE_BURNER. Every mutation
 * is refused while the ledger is paused.
 */
class CTokenLedger : public IPairLedger
{
private:
    CStateDB& db;
    CAccountID address;
    std::string strName;
    bool fRestricted;
    CAccessControl access;

    /** Move balance; runs inside the caller's transaction */
    bool ApplyTransfer(const CAccountID& from, const CAccountID& to, CAmount amount, CValidationState& state);
    bool CheckAmount(CAmount amount, CValidationState& state) const;

public:
    CTokenLedger(CStateDB& dbIn, const CAccountID& addressIn, const std::string& strNameIn, bool fRestrictedIn);

    const CAccountID& GetAddress() const override { return address; }
    const std::string& GetName() const { return strName; }
    bool IsRestricted() const { return fRestricted; }
    CAccessControl& GetAccess() { return access; }
    const CAccessControl& GetAccess() const { return access; }

    CAmount BalanceOf(const CAccountID& account) const override;
    CAmount TotalSupply() const override;
    CAmount Allowance(const CAccountID& owner, const CAccountID& spender) const override;

    bool Approve(const CAccountID& caller, const CAccountID& spender, CAmount amount, CValidationState& state) override;
    bool Transfer(const CAccountID& caller, const CAccountID& to, CAmount amount, CValidationState& state) override;
    bool TransferFrom(const CAccountID& caller, const CAccountID& from, const CAccountID& to, CAmount amount, CValidationState& state) override;
    bool Mint(const CAccountID& caller, const CAccountID& to, CAmount amount, CValidationState& state) override;
    bool Burn(const CAccountID& caller, const CAccountID& from, CAmount amount, CValidationState& state) override;
};

#endif // PAIRMINT_TOKEN_TOKENLEDGER_H
