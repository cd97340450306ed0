// Copyright (c) 2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PAIRMINT_RPC_SERVER_H
#define PAIRMINT_RPC_SERVER_H

#include "account.h"
#include "amount.h"
#include "rpc/protocol.h"

#include <map>
#include <stdint.h>
#include <string>
#include <vector>

#include <univalue.h>

struct NodeContext;
class CAccessControl;
class CTokenLedger;
class CValidationState;

class JSONRPCRequest
{
public:
    UniValue id;
    std::string strMethod;
    UniValue params;
    bool fHelp;

    //! Deployment the command runs against
    NodeContext* context;
    //! Account on whose behalf the command runs (-caller)
    CAccountID caller;

    JSONRPCRequest() : id(NullUniValue), params(NullUniValue), fHelp(false), context(nullptr) {}
};

typedef UniValue(*rpcfn_type)(const JSONRPCRequest& jsonRequest);

class CRPCCommand
{
public:
    std::string category;
    std::string name;
    rpcfn_type actor;
    bool okSafeMode;
    std::vector<std::string> argNames;
};

/**
 * RPC command dispatcher.
 */
class CRPCTable
{
private:
    std::map<std::string, const CRPCCommand*> mapCommands;

public:
    CRPCTable();
    const CRPCCommand* operator[](const std::string& name) const;
    std::string help(const std::string& name) const;

    /**
     * Execute a method.
     * @param request The JSONRPCRequest to execute
     * @returns Result of the call.
     * @throws an exception (UniValue) when an error happens.
     */
    UniValue execute(const JSONRPCRequest& request) const;

    /**
     * Returns a list of registered commands
     * @returns List of registered commands.
     */
    std::vector<std::string> listCommands() const;

    /**
     * Appends a CRPCCommand to the dispatch table.
     * Returns false if RPC server is already running (dump concurrency protection).
     * Commands cannot be overwritten (returns false).
     */
    bool appendCommand(const std::string& name, const CRPCCommand* pcmd);
};

extern CRPCTable tableRPC;

/**
 * Utilities: convert hex/amount/id values to internal types and check
 * presence of a deployment and a caller.
 */
UniValue ValueFromAmount(const CAmount& amount);
CAmount AmountFromValue(const UniValue& value);
CAccountID ParseAccountV(const UniValue& v, const std::string& strName);
uint64_t ParseIdV(const UniValue& v, const std::string& strName);

/** The loaded and bootstrapped deployment, or RPC_PAIR_NOT_DEPLOYED */
NodeContext& EnsureDeployment(const JSONRPCRequest& request);
/** The -caller account, or RPC_INVALID_PARAMETER */
const CAccountID& EnsureCaller(const JSONRPCRequest& request);
/**
 * Components are addressed by name (engine, pairledger, registry,
 * stablecoin) or by account. ParseTargetV accepts either form.
 */
CAccountID ParseTargetV(const NodeContext& node, const UniValue& v, const std::string& strName);
CAccessControl& ComponentAccessV(NodeContext& node, const UniValue& v);
CTokenLedger& TokenLedgerV(NodeContext& node, const UniValue& v);

/** Map a rejected CValidationState to the JSON-RPC error of its category */
UniValue JSONRPCStateError(const CValidationState& state);

std::string HelpExampleCli(const std::string& methodname, const std::string& args);

#endif // PAIRMINT_RPC_SERVER_H
