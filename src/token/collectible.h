// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PAIRMINT_TOKEN_COLLECTIBLE_H
#define PAIRMINT_TOKEN_COLLECTIBLE_H

#include "account.h"

#include <stdint.h>
#include <string>

class CValidationState;

/**
 * ICollectibleRegistry - capability of the non-fungible half of a pair
 *
 * Identifiers are assigned sequentially from 0 and never reused.
 */
class ICollectibleRegistry
{
public:
    virtual ~ICollectibleRegistry() {}

    virtual const CAccountID& GetAddress() const = 0;

    virtual bool Exists(uint64_t nId) const = 0;
    /** false if the id does not exist */
    virtual bool OwnerOf(uint64_t nId, CAccountID& owner) const = 0;
    virtual bool TokenURI(uint64_t nId, std::string& uri) const = 0;
    virtual bool GetApproved(uint64_t nId, CAccountID& approved) const = 0;
    /** Id the next mint will assign */
    virtual uint64_t NextId() const = 0;
    /** Collectibles minted and not burned */
    virtual uint64_t TotalSupply() const = 0;

    /** Mint the next id to `to`. The pointer is validated first. */
    virtual bool Mint(const CAccountID& caller, const CAccountID& to, const std::string& uri, uint64_t& nIdOut, CValidationState& state) = 0;
    virtual bool Burn(const CAccountID& caller, uint64_t nId, CValidationState& state) = 0;
    virtual bool TransferFrom(const CAccountID& caller, const CAccountID& from, const CAccountID& to, uint64_t nId, CValidationState& state) = 0;
    virtual bool Approve(const CAccountID& caller, const CAccountID& to, uint64_t nId, CValidationState& state) = 0;
    virtual bool SetBaseURI(const CAccountID& caller, const std::string& uri, CValidationState& state) = 0;
};

#endif // PAIRMINT_TOKEN_COLLECTIBLE_H
