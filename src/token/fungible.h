// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PAIRMINT_TOKEN_FUNGIBLE_H
#define PAIRMINT_TOKEN_FUNGIBLE_H

#include "account.h"
#include "amount.h"

class CValidationState;

/**
 * IFungibleToken - capability of a balance token
 *
 * This is all the engine needs from the fee stablecoin. Every mutation
 * either applies completely or returns false with the reason in state.
 */
class IFungibleToken
{
public:
    virtual ~IFungibleToken() {}

    virtual const CAccountID& GetAddress() const = 0;
    virtual CAmount BalanceOf(const CAccountID& account) const = 0;
    virtual CAmount TotalSupply() const = 0;
    virtual CAmount Allowance(const CAccountID& owner, const CAccountID& spender) const = 0;
    virtual int Decimals() const { return MONEY_DECIMALS; }

    virtual bool Approve(const CAccountID& caller, const CAccountID& spender, CAmount amount, CValidationState& state) = 0;
    virtual bool Transfer(const CAccountID& caller, const CAccountID& to, CAmount amount, CValidationState& state) = 0;
    virtual bool TransferFrom(const CAccountID& caller, const CAccountID& from, const CAccountID& to, CAmount amount, CValidationState& state) = 0;
};

/**
 * IPairLedger - fungible half of a pair
 *
 * Adds privileged issuance. Mint and burn are restricted to the minter and
 * burner roles, transfers to the transfer role.
 */
class IPairLedger : public IFungibleToken
{
public:
    virtual bool Mint(const CAccountID& caller, const CAccountID& to, CAmount amount, CValidationState& state) = 0;
    virtual bool Burn(const CAccountID& caller, const CAccountID& from, CAmount amount, CValidationState& state) = 0;
};

#endif // PAIRMINT_TOKEN_FUNGIBLE_H
