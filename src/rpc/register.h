// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PAIRMINT_RPC_REGISTER_H
#define PAIRMINT_RPC_REGISTER_H

/** These are in one header file to avoid creating tons of single-function
 * headers for everything under src/rpc/ */
class CRPCTable;

/** Register pairing engine RPC commands (mintpair, burnpair, transferpair, queries) */
void RegisterPairRPCCommands(CRPCTable& tableRPC);
/** Register administrative RPC commands (pause, roles, emergency withdrawal) */
void RegisterAdminRPCCommands(CRPCTable& tableRPC);
/** Register token and event RPC commands */
void RegisterTokenRPCCommands(CRPCTable& tableRPC);

static inline void RegisterAllPairmintRPCCommands(CRPCTable& tableRPC)
{
    RegisterPairRPCCommands(tableRPC);
    RegisterAdminRPCCommands(tableRPC);
    RegisterTokenRPCCommands(tableRPC);
}

#endif // PAIRMINT_RPC_REGISTER_H
