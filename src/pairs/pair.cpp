// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pairs/pair.h"

#include "access/accesscontrol.h"
#include "util/format.h"
#include "utilmoneystr.h"

std::string PairState::ToString() const
{
    return strprintf("PairState(live=%u, supply=%s, escrowed=%s, minted=%u, burned=%u)",
                     nLivePairs, FormatMoney(nPairSupply), FormatMoney(nFeesEscrowed),
                     nTotalMinted, nTotalBurned);
}

std::string EventTypeToString(uint8_t nType)
{
    switch (nType) {
    case EVENT_PAIR_MINTED: return "pair-minted";
    case EVENT_PAIR_BURNED: return "pair-burned";
    case EVENT_PAIR_TRANSFERRED: return "pair-transferred";
    case EVENT_EMERGENCY_WITHDRAWAL: return "emergency-withdrawal";
    case EVENT_PAUSE_CHANGED: return "pause-state-changed";
    case EVENT_ROLE_GRANTED: return "role-granted";
    case EVENT_ROLE_REVOKED: return "role-revoked";
    }
    return "unknown";
}

std::string PairEvent::ToString() const
{
    switch (nType) {
    case EVENT_PAIR_MINTED:
    case EVENT_PAIR_BURNED:
        return strprintf("%s(owner=%s, id=%u, amount=%s)", EventTypeToString(nType),
                         from.GetHex(), nId, FormatMoney(amount));
    case EVENT_PAIR_TRANSFERRED:
        return strprintf("%s(from=%s, to=%s, id=%u, amount=%s)", EventTypeToString(nType),
                         from.GetHex(), to.GetHex(), nId, FormatMoney(amount));
    case EVENT_EMERGENCY_WITHDRAWAL:
        return strprintf("%s(token=%s, to=%s, amount=%s)", EventTypeToString(nType),
                         token.GetHex(), to.GetHex(), FormatMoney(amount));
    case EVENT_PAUSE_CHANGED:
        return strprintf("%s(component=%s, paused=%d)", EventTypeToString(nType), source.GetHex(), fPaused);
    case EVENT_ROLE_GRANTED:
    case EVENT_ROLE_REVOKED:
        return strprintf("%s(component=%s, role=%s, account=%s)", EventTypeToString(nType),
                         source.GetHex(), RoleToString(nRole), to.GetHex());
    }
    return strprintf("unknown(type=%d)", nType);
}
