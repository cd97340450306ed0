// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PAIRMINT_ACCOUNT_H
#define PAIRMINT_ACCOUNT_H

#include "uint256.h"

#include <string>

/**
 * CAccountID - 160-bit identifier of an account.
 *
 * Holders, the engine and every token component are addressed the same way.
 * The null (all-zero) value is the "zero address" and never holds assets.
 */
class CAccountID : public uint160
{
public:
    CAccountID() : uint160() {}
    explicit CAccountID(const uint160& in) : uint160(in) {}
};

/** Parse exactly 40 hex characters (optional 0x prefix) */
bool ParseAccountID(const std::string& str, CAccountID& id);

/** Short form for log lines */
std::string AccountLogStr(const CAccountID& id);

#endif // PAIRMINT_ACCOUNT_H
