// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "account.h"

#include "utilstrencodings.h"

bool ParseAccountID(const std::string& str, CAccountID& id)
{
    std::string strHex = str;
    if (strHex.size() > 2 && strHex[0] == '0' && ToLower(strHex[1]) == 'x') {
        strHex = strHex.substr(2);
    }
    if (strHex.size() != 2 * CAccountID::size() || !IsHex(strHex)) {
        return false;
    }
    id.SetHex(strHex);
    return true;
}

std::string AccountLogStr(const CAccountID& id)
{
    return id.GetHex().substr(0, 12);
}
