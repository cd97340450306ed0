// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PAIRMINT_TOKEN_COLLECTIBLES_H
#define PAIRMINT_TOKEN_COLLECTIBLES_H

#include "access/accesscontrol.h"
#include "token/collectible.h"

#include <stddef.h>
#include <string>

class CStateDB;

/**
 * Metadata pointer formats accepted by the registry, with the shortest
 * pointer that can name anything ("ipfs://" + a 46 character CIDv0).
 */
struct URIPrefix {
    const char* prefix;
    size_t nMinLength;
};

static const URIPrefix URI_PREFIXES[] = {
    {"http://", 10},
    {"https://", 11},
    {"ipfs://", 53},
};

/**
 * ValidateTokenURI - Check a metadata pointer before anything is minted
 *
 * @return false with REJECT_INVALID and "bad-uri-empty", "bad-uri-prefix"
 *         or "bad-uri-length"
 */
bool ValidateTokenURI(const std::string& uri, CValidationState& state);

/**
 * CCollectibleRegistry - database backed registry of unique collectibles
 *
 * Mint requires ROLE_MINTER, burn ROLE_BURNER plus being the owner, the
 * approved account or an operator (ROLE_TRANSFER holder), and TransferFrom
 * requires ROLE_TRANSFER. All three are refused while paused.
 */
class CCollectibleRegistry : public ICollectibleRegistry
{
private:
    CStateDB& db;
    CAccountID address;
    CAccessControl access;

public:
    CCollectibleRegistry(CStateDB& dbIn, const CAccountID& addressIn, const std::string& strName);

    const CAccountID& GetAddress() const override { return address; }
    CAccessControl& GetAccess() { return access; }
    const CAccessControl& GetAccess() const { return access; }

    bool Exists(uint64_t nId) const override;
    bool OwnerOf(uint64_t nId, CAccountID& owner) const override;
    /** Base pointer (if set) prepended to the stored pointer */
    bool TokenURI(uint64_t nId, std::string& uri) const override;
    bool GetApproved(uint64_t nId, CAccountID& approved) const override;
    uint64_t NextId() const override;
    uint64_t TotalSupply() const override;
    std::string GetBaseURI() const;

    bool Mint(const CAccountID& caller, const CAccountID& to, const std::string& uri, uint64_t& nIdOut, CValidationState& state) override;
    bool Burn(const CAccountID& caller, uint64_t nId, CValidationState& state) override;
    bool TransferFrom(const CAccountID& caller, const CAccountID& from, const CAccountID& to, uint64_t nId, CValidationState& state) override;
    bool Approve(const CAccountID& caller, const CAccountID& to, uint64_t nId, CValidationState& state) override;
    bool SetBaseURI(const CAccountID& caller, const std::string& uri, CValidationState& state) override;
};

#endif // PAIRMINT_TOKEN_COLLECTIBLES_H
