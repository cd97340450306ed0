// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Money parsing/formatting utilities.
 */
#ifndef PAIRMINT_UTILMONEYSTR_H
#define PAIRMINT_UTILMONEYSTR_H

#include "amount.h"

#include <string>

/** Render base units as a decimal string with exactly MONEY_DECIMALS digits ("1.000000") */
std::string FormatMoney(const CAmount& n, bool fPlus = false);
bool ParseMoney(const std::string& str, CAmount& nRet);
bool ParseMoney(const char* pszIn, CAmount& nRet);

#endif // PAIRMINT_UTILMONEYSTR_H
