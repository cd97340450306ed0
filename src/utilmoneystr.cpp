// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "utilmoneystr.h"

#include "util/format.h"
#include "utilstrencodings.h"

std::string FormatMoney(const CAmount& n, bool fPlus)
{
    // Note: not using straight sprintf here because we do NOT want
    // localized number formatting.
    int64_t n_abs = (n > 0 ? n : -n);
    int64_t quotient = n_abs / COIN;
    int64_t remainder = n_abs % COIN;
    std::string str = strprintf("%d.%06d", quotient, remainder);

    if (n < 0)
        str.insert((unsigned int)0, 1, '-');
    else if (fPlus && n > 0)
        str.insert((unsigned int)0, 1, '+');
    return str;
}


bool ParseMoney(const std::string& str, CAmount& nRet)
{
    return ParseMoney(str.c_str(), nRet);
}

bool ParseMoney(const char* pszIn, CAmount& nRet)
{
    std::string strWhole;
    int64_t nUnits = 0;
    bool fHaveDigit = false;
    const char* p = pszIn;

    // Skip leading whitespace
    while (IsSpace(*p))
        p++;

    for (; *p; p++) {
        if (*p == '.') {
            p++;
            int64_t nMult = COIN / 10;
            while (IsDigit(*p) && (nMult > 0)) {
                nUnits += nMult * (*p++ - '0');
                nMult /= 10;
                fHaveDigit = true;
            }
            break;
        }
        if (IsSpace(*p))
            break;
        if (!IsDigit(*p))
            return false;
        strWhole.insert(strWhole.end(), *p);
        fHaveDigit = true;
    }

    // Skip trailing whitespace; anything else (including a 7th decimal) is an error
    for (; *p; p++)
        if (!IsSpace(*p))
            return false;

    if (strWhole.size() > 12) // guard against 63 bit overflow
        return false;
    if (!fHaveDigit)
        return false;

    int64_t nWhole = strWhole.empty() ? 0 : atoi64(strWhole);
    CAmount nValue = nWhole * COIN + nUnits;

    if (!MoneyRange(nValue))
        return false;

    nRet = nValue;
    return true;
}
