// Copyright (c) 2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/server.h"

#include "consensus/validation.h"
#include "logging.h"
#include "node/context.h"
#include "utilmoneystr.h"
#include "utilstrencodings.h"

#include <algorithm>
#include <set>
#include <stdexcept>

#include <boost/algorithm/string/case_conv.hpp>

UniValue ValueFromAmount(const CAmount& amount)
{
    return UniValue(UniValue::VNUM, FormatMoney(amount));
}

CAmount AmountFromValue(const UniValue& value)
{
    if (!value.isNum() && !value.isStr())
        throw JSONRPCError(RPC_TYPE_ERROR, "Amount is not a number or string");
    CAmount amount;
    if (!ParseMoney(value.getValStr(), amount))
        throw JSONRPCError(RPC_TYPE_ERROR, "Invalid amount");
    if (!MoneyRange(amount))
        throw JSONRPCError(RPC_TYPE_ERROR, "Amount out of range");
    return amount;
}

CAccountID ParseAccountV(const UniValue& v, const std::string& strName)
{
    if (!v.isStr())
        throw JSONRPCError(RPC_TYPE_ERROR, strName + " must be a string");
    CAccountID account;
    if (!ParseAccountID(v.get_str(), account))
        throw JSONRPCError(RPC_INVALID_ADDRESS_OR_KEY, strName + " must be 40 hexadecimal characters (not '" + v.get_str() + "')");
    return account;
}

uint64_t ParseIdV(const UniValue& v, const std::string& strName)
{
    uint64_t nId = 0;
    if (v.isNum()) {
        int64_t n = v.get_int64();
        if (n < 0)
            throw JSONRPCError(RPC_INVALID_PARAMETER, strName + " must be non-negative");
        return (uint64_t)n;
    }
    if (!v.isStr() || !ParseUInt64(v.get_str(), &nId))
        throw JSONRPCError(RPC_TYPE_ERROR, strName + " must be a non-negative integer");
    return nId;
}

NodeContext& EnsureDeployment(const JSONRPCRequest& request)
{
    if (!request.context || !request.context->IsLoaded()) {
        throw JSONRPCError(RPC_INTERNAL_ERROR, "State database not loaded");
    }
    CAccountID admin;
    if (!request.context->statedb->ReadDeployed(admin)) {
        throw JSONRPCError(RPC_PAIR_NOT_DEPLOYED, "Deployment not bootstrapped; start with -admin=<account>");
    }
    return *request.context;
}

const CAccountID& EnsureCaller(const JSONRPCRequest& request)
{
    if (request.caller.IsNull()) {
        throw JSONRPCError(RPC_INVALID_PARAMETER, "No caller account; use -caller=<account>");
    }
    return request.caller;
}

CAccountID ParseTargetV(const NodeContext& node, const UniValue& v, const std::string& strName)
{
    if (v.isStr()) {
        const std::string& str = v.get_str();
        if (str == "engine") return node.engine->GetAddress();
        if (str == "pairledger") return node.pairledger->GetAddress();
        if (str == "registry") return node.registry->GetAddress();
        if (str == "stablecoin") return node.stablecoin->GetAddress();
    }
    return ParseAccountV(v, strName);
}

CAccessControl& ComponentAccessV(NodeContext& node, const UniValue& v)
{
    const CAccountID target = ParseTargetV(node, v, "component");
    if (target == node.engine->GetAddress()) return node.engine->GetAccess();
    if (target == node.pairledger->GetAddress()) return node.pairledger->GetAccess();
    if (target == node.registry->GetAddress()) return node.registry->GetAccess();
    if (target == node.stablecoin->GetAddress()) return node.stablecoin->GetAccess();
    throw JSONRPCError(RPC_INVALID_PARAMETER, "Unknown component: " + target.GetHex());
}

CTokenLedger& TokenLedgerV(NodeContext& node, const UniValue& v)
{
    const CAccountID target = ParseTargetV(node, v, "token");
    if (target == node.stablecoin->GetAddress()) return *node.stablecoin;
    if (target == node.pairledger->GetAddress()) return *node.pairledger;
    throw JSONRPCError(RPC_INVALID_PARAMETER, "Unknown token: " + target.GetHex());
}

UniValue JSONRPCStateError(const CValidationState& state)
{
    int code = RPC_MISC_ERROR;
    switch (state.GetRejectCode()) {
    case REJECT_INVALID: code = RPC_PAIR_REJECTED; break;
    case REJECT_UNAUTHORIZED: code = RPC_PAIR_UNAUTHORIZED; break;
    case REJECT_INSUFFICIENT: code = RPC_PAIR_INSUFFICIENT; break;
    case REJECT_INVARIANT: code = RPC_PAIR_INVARIANT; break;
    case REJECT_PAUSED: code = RPC_PAIR_PAUSED; break;
    case REJECT_INTERNAL: code = RPC_DATABASE_ERROR; break;
    }
    return JSONRPCError(code, FormatStateMessage(state));
}

std::string HelpExampleCli(const std::string& methodname, const std::string& args)
{
    return "> pairmint-cli " + methodname + " " + args + "\n";
}

static UniValue help(const JSONRPCRequest& jsonRequest);

// clang-format off
static const CRPCCommand vRPCCommands[] =
{ //  category       name                   actor (function)    okSafe argNames
  //  -------------- ---------------------- ------------------- ------ --------
    { "control",     "help",                &help,              true,  {"command"} },
};
// clang-format on

CRPCTable::CRPCTable()
{
    for (const auto& c : vRPCCommands) {
        appendCommand(c.name, &c);
    }
}

const CRPCCommand* CRPCTable::operator[](const std::string& name) const
{
    std::map<std::string, const CRPCCommand*>::const_iterator it = mapCommands.find(name);
    if (it == mapCommands.end())
        return nullptr;
    return (*it).second;
}

std::string CRPCTable::help(const std::string& strCommand) const
{
    std::string strRet;
    std::string category;
    std::set<rpcfn_type> setDone;
    std::vector<std::pair<std::string, const CRPCCommand*> > vCommands;

    for (std::map<std::string, const CRPCCommand*>::const_iterator mi = mapCommands.begin(); mi != mapCommands.end(); ++mi)
        vCommands.push_back(std::make_pair(mi->second->category + mi->first, mi->second));
    std::sort(vCommands.begin(), vCommands.end());

    JSONRPCRequest jreq;
    jreq.fHelp = true;
    for (const std::pair<std::string, const CRPCCommand*>& command : vCommands) {
        const CRPCCommand* pcmd = command.second;
        std::string strMethod = pcmd->name;
        if (strCommand != "" && strMethod != strCommand)
            continue;
        jreq.strMethod = strMethod;
        try {
            rpcfn_type pfn = pcmd->actor;
            if (setDone.insert(pfn).second)
                (*pfn)(jreq);
        } catch (const std::exception& e) {
            // Help text is returned in an exception
            std::string strHelp = std::string(e.what());
            if (strCommand == "") {
                if (strHelp.find('\n') != std::string::npos)
                    strHelp = strHelp.substr(0, strHelp.find('\n'));

                if (category != pcmd->category) {
                    if (!category.empty())
                        strRet += "\n";
                    category = pcmd->category;
                    std::string firstLetter = category.substr(0, 1);
                    boost::to_upper(firstLetter);
                    strRet += "== " + firstLetter + category.substr(1) + " ==\n";
                }
            }
            strRet += strHelp + "\n";
        }
    }
    if (strRet == "")
        strRet = strprintf("help: unknown command: %s\n", strCommand);
    strRet = strRet.substr(0, strRet.size() - 1);
    return strRet;
}

UniValue CRPCTable::execute(const JSONRPCRequest& request) const
{
    // Find method
    const CRPCCommand* pcmd = (*this)[request.strMethod];
    if (!pcmd)
        throw JSONRPCError(RPC_METHOD_NOT_FOUND, "Method not found");

    LogPrint(BCLog::RPC, "ThreadRPCServer method=%s caller=%s\n", SanitizeString(request.strMethod),
             request.caller.IsNull() ? std::string("none") : AccountLogStr(request.caller));

    try {
        // Execute
        return pcmd->actor(request);
    } catch (const std::exception& e) {
        throw JSONRPCError(RPC_MISC_ERROR, e.what());
    }
}

std::vector<std::string> CRPCTable::listCommands() const
{
    std::vector<std::string> commandList;
    for (const auto& i : mapCommands) commandList.emplace_back(i.first);
    return commandList;
}

bool CRPCTable::appendCommand(const std::string& name, const CRPCCommand* pcmd)
{
    std::map<std::string, const CRPCCommand*>::const_iterator it = mapCommands.find(name);
    if (it != mapCommands.end())
        return false;

    mapCommands[name] = pcmd;
    return true;
}

static UniValue help(const JSONRPCRequest& jsonRequest)
{
    if (jsonRequest.fHelp || jsonRequest.params.size() > 1)
        throw std::runtime_error(
            "help ( \"command\" )\n"
            "\nList all commands, or get help for a specified command.\n"
            "\nArguments:\n"
            "1. \"command\"     (string, optional) The command to get help on\n"
            "\nResult:\n"
            "\"text\"     (string) The help text\n");

    std::string strCommand;
    if (jsonRequest.params.size() > 0)
        strCommand = jsonRequest.params[0].get_str();

    return tableRPC.help(strCommand);
}

CRPCTable tableRPC;
