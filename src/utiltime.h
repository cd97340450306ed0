// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin developers
// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PAIRMINT_UTILTIME_H
#define PAIRMINT_UTILTIME_H

#include <stdint.h>
#include <string>

/**
 * GetTime() returns the system time in seconds, but also supports mocktime,
 * where the time can be fixed by the caller, eg for testing event stamps.
 */
int64_t GetTime();
/** For testing. Zero returns to the system clock */
void SetMockTime(int64_t nMockTimeIn);

/**
 * ISO 8601 formatting is preferred. Use the FormatISO8601{DateTime,Date}
 * helper functions if possible.
 */
std::string FormatISO8601DateTime(int64_t nTime);

#endif // PAIRMINT_UTILTIME_H
