// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "token/tokenledger.h"

#include "consensus/validation.h"
#include "logging.h"
#include "state/statedb.h"
#include "sync.h"
#include "utilmoneystr.h"

CTokenLedger::CTokenLedger(CStateDB& dbIn, const CAccountID& addressIn, const std::string& strNameIn, bool fRestrictedIn)
    : db(dbIn), address(addressIn), strName(strNameIn), fRestricted(fRestrictedIn),
      access(dbIn, addressIn, strNameIn)
{
}

CAmount CTokenLedger::BalanceOf(const CAccountID& account) const
{
    LOCK(db.cs_state);
    return db.ReadBalance(address, account);
}

CAmount CTokenLedger::TotalSupply() const
{
    LOCK(db.cs_state);
    return db.ReadSupply(address);
}

CAmount CTokenLedger::Allowance(const CAccountID& owner, const CAccountID& spender) const
{
    LOCK(db.cs_state);
    return db.ReadAllowance(address, owner, spender);
}

bool CTokenLedger::CheckAmount(CAmount amount, CValidationState& state) const
{
    if (amount <= 0) {
        return state.Invalid(false, REJECT_INVALID, "bad-amount-zero", strName);
    }
    if (!MoneyRange(amount)) {
        return state.Invalid(false, REJECT_INVALID, "bad-amount-range", FormatMoney(amount));
    }
    return true;
}

bool CTokenLedger::ApplyTransfer(const CAccountID& from, const CAccountID& to, CAmount amount, CValidationState& state)
{
    CAmount nFromBalance = db.ReadBalance(address, from);
    if (nFromBalance < amount) {
        return state.Invalid(false, REJECT_INSUFFICIENT, "insufficient-balance",
                             strprintf("%s has %s, needs %s", AccountLogStr(from), FormatMoney(nFromBalance), FormatMoney(amount)));
    }
    if (from == to) {
        return true;
    }

    CAmount nToBalance = db.ReadBalance(address, to);
    if (!MoneyRange(nToBalance + amount)) {
        return state.Invalid(false, REJECT_INVALID, "bad-balance-overflow");
    }
    if (!db.WriteBalance(address, from, nFromBalance - amount) ||
        !db.WriteBalance(address, to, nToBalance + amount)) {
        return state.Error("db-write-failed");
    }

    LogPrint(BCLog::LEDGER, "%s: transfer %s from %s to %s\n", strName, FormatMoney(amount),
             AccountLogStr(from), AccountLogStr(to));
    return true;
}

bool CTokenLedger::Approve(const CAccountID& caller, const CAccountID& spender, CAmount amount, CValidationState& state)
{
    if (caller.IsNull() || spender.IsNull()) {
        return state.Invalid(false, REJECT_INVALID, "bad-approve-zero-address");
    }
    if (!MoneyRange(amount)) {
        return state.Invalid(false, REJECT_INVALID, "bad-amount-range", FormatMoney(amount));
    }

    LOCK(db.cs_state);
    if (!db.WriteAllowance(address, caller, spender, amount)) {
        return state.Error("db-write-failed");
    }

    LogPrint(BCLog::LEDGER, "%s: %s approved %s for %s\n", strName, AccountLogStr(caller),
             AccountLogStr(spender), FormatMoney(amount));
    return true;
}

bool CTokenLedger::Transfer(const CAccountID& caller, const CAccountID& to, CAmount amount, CValidationState& state)
{
    LOCK(db.cs_state);
    if (fRestricted && !access.CheckRole(ROLE_TRANSFER, caller, state)) {
        return false;
    }
    if (!access.CheckNotPaused(state)) {
        return false;
    }
    if (caller.IsNull() || to.IsNull()) {
        return state.Invalid(false, REJECT_INVALID, "bad-transfer-zero-address");
    }
    if (!CheckAmount(amount, state)) {
        return false;
    }

    CStateDB::Txn txn(db);
    if (!txn.IsActive()) {
        return state.Error("db-txn-failed");
    }
    if (!ApplyTransfer(caller, to, amount, state)) {
        return false;
    }
    if (!txn.Commit()) {
        return state.Error("db-commit-failed");
    }
    return true;
}

bool CTokenLedger::TransferFrom(const CAccountID& caller, const CAccountID& from, const CAccountID& to, CAmount amount, CValidationState& state)
{
    LOCK(db.cs_state);
    if (fRestricted && !access.CheckRole(ROLE_TRANSFER, caller, state)) {
        return false;
    }
    if (!access.CheckNotPaused(state)) {
        return false;
    }
    if (from.IsNull() || to.IsNull()) {
        return state.Invalid(false, REJECT_INVALID, "bad-transfer-zero-address");
    }
    if (!CheckAmount(amount, state)) {
        return false;
    }

    CStateDB::Txn txn(db);
    if (!txn.IsActive()) {
        return state.Error("db-txn-failed");
    }

    // The transfer role moves holdings on the holder's behalf
    if (!fRestricted && caller != from) {
        CAmount nAllowance = db.ReadAllowance(address, from, caller);
        if (nAllowance < amount) {
            return state.Invalid(false, REJECT_INSUFFICIENT, "insufficient-allowance",
                                 strprintf("%s allows %s, needs %s", AccountLogStr(from), FormatMoney(nAllowance), FormatMoney(amount)));
        }
        if (!db.WriteAllowance(address, from, caller, nAllowance - amount)) {
            return state.Error("db-write-failed");
        }
    }

    if (!ApplyTransfer(from, to, amount, state)) {
        return false;
    }
    if (!txn.Commit()) {
        return state.Error("db-commit-failed");
    }
    return true;
}

bool CTokenLedger::Mint(const CAccountID& caller, const CAccountID& to, CAmount amount, CValidationState& state)
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
    if (!CheckAmount(amount, state)) {
        return false;
    }

    CAmount nSupply = db.ReadSupply(address);
    CAmount nBalance = db.ReadBalance(address, to);
    if (!MoneyRange(nSupply + amount)) {
        return state.Invalid(false, REJECT_INVALID, "bad-supply-overflow");
    }

    CStateDB::Txn txn(db);
    if (!txn.IsActive()) {
        return state.Error("db-txn-failed");
    }
    if (!db.WriteSupply(address, nSupply + amount) ||
        !db.WriteBalance(address, to, nBalance + amount)) {
        return state.Error("db-write-failed");
    }
    if (!txn.Commit()) {
        return state.Error("db-commit-failed");
    }

    LogPrint(BCLog::LEDGER, "%s: mint %s to %s (supply %s)\n", strName, FormatMoney(amount),
             AccountLogStr(to), FormatMoney(nSupply + amount));
    return true;
}

bool CTokenLedger::Burn(const CAccountID& caller, const CAccountID& from, CAmount amount, CValidationState& state)
{
    LOCK(db.cs_state);
    if (!access.CheckRole(ROLE_BURNER, caller, state)) {
        return false;
    }
    if (!access.CheckNotPaused(state)) {
        return false;
    }
    if (from.IsNull()) {
        return state.Invalid(false, REJECT_INVALID, "bad-burn-zero-address");
    }
    if (!CheckAmount(amount, state)) {
        return false;
    }

    CAmount nBalance = db.ReadBalance(address, from);
    if (nBalance < amount) {
        return state.Invalid(false, REJECT_INSUFFICIENT, "insufficient-balance",
                             strprintf("%s has %s, burn needs %s", AccountLogStr(from), FormatMoney(nBalance), FormatMoney(amount)));
    }
    CAmount nSupply = db.ReadSupply(address);

    CStateDB::Txn txn(db);
    if (!txn.IsActive()) {
        return state.Error("db-txn-failed");
    }
    if (!db.WriteSupply(address, nSupply - amount) ||
        !db.WriteBalance(address, from, nBalance - amount)) {
        return state.Error("db-write-failed");
    }
    if (!txn.Commit()) {
        return state.Error("db-commit-failed");
    }

    LogPrint(BCLog::LEDGER, "%s: burn %s from %s (supply %s)\n", strName, FormatMoney(amount),
             AccountLogStr(from), FormatMoney(nSupply - amount));
    return true;
}
