// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/server.h"

#include "access/accesscontrol.h"
#include "consensus/validation.h"
#include "init.h"
#include "node/context.h"
#include "rpc/register.h"
#include "util/format.h"
#include "util/system.h"
#include "utilmoneystr.h"

#include <stdexcept>

#include <univalue.h>


static UniValue EventToJSON(const PairEvent& event)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("seq", (uint64_t)event.nSeq);
    obj.pushKV("type", EventTypeToString(event.nType));
    obj.pushKV("time", event.nTime);
    switch (event.nType) {
    case EVENT_PAIR_MINTED:
    case EVENT_PAIR_BURNED:
        obj.pushKV("owner", event.from.GetHex());
        obj.pushKV("id", (uint64_t)event.nId);
        obj.pushKV("amount", ValueFromAmount(event.amount));
        break;
    case EVENT_PAIR_TRANSFERRED:
        obj.pushKV("from", event.from.GetHex());
        obj.pushKV("to", event.to.GetHex());
        obj.pushKV("id", (uint64_t)event.nId);
        obj.pushKV("amount", ValueFromAmount(event.amount));
        break;
    case EVENT_EMERGENCY_WITHDRAWAL:
        obj.pushKV("token", event.token.GetHex());
        obj.pushKV("to", event.to.GetHex());
        obj.pushKV("amount", ValueFromAmount(event.amount));
        break;
    case EVENT_PAUSE_CHANGED:
        obj.pushKV("component", event.source.GetHex());
        obj.pushKV("paused", event.fPaused);
        break;
    case EVENT_ROLE_GRANTED:
    case EVENT_ROLE_REVOKED:
        obj.pushKV("component", event.source.GetHex());
        obj.pushKV("role", RoleToString(event.nRole));
        obj.pushKV("account", event.to.GetHex());
        if (!event.from.IsNull()) {
            obj.pushKV("sender", event.from.GetHex());
        }
        break;
    }
    return obj;
}

static UniValue getbalance(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 1 || request.params.size() > 2) {
        throw std::runtime_error(
            "getbalance \"account\" ( \"token\" )\n"
            "\nReturns the balance of an account.\n"
            "\nArguments:\n"
            "1. \"account\"  (string, required) Account or component name\n"
            "2. \"token\"    (string, optional, default=stablecoin) stablecoin or pairledger\n"
            "\nResult:\n"
            "x.xxxxxx      (numeric) Balance\n"
            "\nExamples:\n"
            + HelpExampleCli("getbalance", "engine")
            + HelpExampleCli("getbalance", "\"00000000000000000000000000000000000000b1\" pairledger"));
    }

    NodeContext& node = EnsureDeployment(request);
    const CAccountID account = ParseTargetV(node, request.params[0], "account");
    const CTokenLedger& token = request.params.size() > 1 ? TokenLedgerV(node, request.params[1])
                                                          : *node.stablecoin;
    return ValueFromAmount(token.BalanceOf(account));
}

static UniValue approve(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 3) {
        throw std::runtime_error(
            "approve \"token\" \"spender\" amount\n"
            "\nSet the allowance of spender over the caller's balance (replaces any previous value).\n"
            "\nArguments:\n"
            "1. \"token\"    (string, required) stablecoin or pairledger\n"
            "2. \"spender\"  (string, required) Account or component name\n"
            "3. amount     (numeric, required) Allowance\n"
            "\nResult:\n"
            "x.xxxxxx      (numeric) The allowance now in effect\n"
            "\nExamples:\n"
            + HelpExampleCli("approve", "stablecoin engine 1.0"));
    }

    NodeContext& node = EnsureDeployment(request);
    const CAccountID& caller = EnsureCaller(request);
    CTokenLedger& token = TokenLedgerV(node, request.params[0]);
    const CAccountID spender = ParseTargetV(node, request.params[1], "spender");
    const CAmount amount = AmountFromValue(request.params[2]);

    CValidationState state;
    if (!token.Approve(caller, spender, amount, state)) {
        throw JSONRPCStateError(state);
    }
    return ValueFromAmount(token.Allowance(caller, spender));
}

static UniValue mintstable(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "mintstable \"to\" amount\n"
            "\nIssue stablecoin. Requires the minter role on the stablecoin.\n"
            "\nArguments:\n"
            "1. \"to\"     (string, required) Receiving account\n"
            "2. amount   (numeric, required) Amount to issue\n"
            "\nResult:\n"
            "x.xxxxxx    (numeric) New balance of the receiver\n"
            "\nExamples:\n"
            + HelpExampleCli("mintstable", "\"00000000000000000000000000000000000000b1\" 2.0"));
    }

    NodeContext& node = EnsureDeployment(request);
    const CAccountID& caller = EnsureCaller(request);
    const CAccountID to = ParseTargetV(node, request.params[0], "to");
    const CAmount amount = AmountFromValue(request.params[1]);

    CValidationState state;
    if (!node.stablecoin->Mint(caller, to, amount, state)) {
        throw JSONRPCStateError(state);
    }
    return ValueFromAmount(node.stablecoin->BalanceOf(to));
}

static UniValue getevents(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() > 2) {
        throw std::runtime_error(
            "getevents ( from count )\n"
            "\nReturns entries of the append-only event log.\n"
            "\nArguments:\n"
            "1. from     (numeric, optional, default=0) First sequence number\n"
            "2. count    (numeric, optional, default=-eventcount) Maximum number of events\n"
            "\nResult:\n"
            "[\n"
            "  {\n"
            "    \"seq\": n,          (numeric) Sequence number\n"
            "    \"type\": \"...\",     (string) pair-minted, pair-burned, pair-transferred, emergency-withdrawal,\n"
            "                         pause-state-changed, role-granted or role-revoked\n"
            "    \"time\": n,         (numeric) Unix time\n"
            "    ...                (type specific fields)\n"
            "  }, ...\n"
            "]\n"
            "\nExamples:\n"
            + HelpExampleCli("getevents", "")
            + HelpExampleCli("getevents", "10 5"));
    }

    NodeContext& node = EnsureDeployment(request);
    const uint64_t nFrom = request.params.size() > 0 ? ParseIdV(request.params[0], "from") : 0;
    int64_t nCount = gArgs.GetIntArg("-eventcount", DEFAULT_EVENT_COUNT);
    if (request.params.size() > 1) {
        nCount = (int64_t)ParseIdV(request.params[1], "count");
    }
    if (nCount <= 0) {
        throw JSONRPCError(RPC_INVALID_PARAMETER, "count must be positive");
    }

    UniValue result(UniValue::VARR);
    LOCK(node.statedb->cs_state);
    if (!node.statedb->ForEachEvent(nFrom, [&](const PairEvent& event) {
            result.push_back(EventToJSON(event));
            return (int64_t)result.size() < nCount;
        })) {
        throw JSONRPCError(RPC_DATABASE_ERROR, strprintf("Event log unreadable after %u entries", result.size()));
    }
    return result;
}

// clang-format off
static const CRPCCommand commands[] =
{ //  category       name                   actor (function)    okSafe argNames
  //  -------------- ---------------------- ------------------- ------ --------
    { "tokens",      "getbalance",          &getbalance,        true,  {"account", "token"} },
    { "tokens",      "approve",             &approve,           false, {"token", "spender", "amount"} },
    { "tokens",      "mintstable",          &mintstable,        false, {"to", "amount"} },
    { "events",      "getevents",           &getevents,         true,  {"from", "count"} },
};
// clang-format on

void RegisterTokenRPCCommands(CRPCTable& t)
{
    for (const auto& c : commands) {
        t.appendCommand(c.name, &c);
    }
}
