// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PAIRMINT_AMOUNT_H
#define PAIRMINT_AMOUNT_H

#include <stdint.h>

/** Amount in base units (can be negative) */
typedef int64_t CAmount;

/** 6 decimal places: 1 unit = 1000000 base units */
static const int MONEY_DECIMALS = 6;
static const CAmount COIN = 1000000;

/**
 * No amount larger than this is valid.
 *
 * Bounds stablecoin and pair token balances alike; chosen so that the sum of
 * any two valid amounts still fits in a CAmount.
 */
static const CAmount MAX_MONEY = 1000000000000 * COIN;
inline bool MoneyRange(const CAmount& nValue) { return (nValue >= 0 && nValue <= MAX_MONEY); }

#endif // PAIRMINT_AMOUNT_H
