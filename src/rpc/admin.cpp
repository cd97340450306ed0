// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Administrative RPCs
 *
 * Components are named engine, pairledger, registry or stablecoin (or
 * given as an account). Every command runs as -caller and is checked
 * against that component's role table.
 */

#include "rpc/server.h"

#include "access/accesscontrol.h"
#include "consensus/validation.h"
#include "node/context.h"
#include "rpc/register.h"
#include "util/format.h"
#include "utilmoneystr.h"

#include <stdexcept>

#include <univalue.h>

static AccessRole RoleFromValue(const UniValue& v)
{
    AccessRole role;
    if (!v.isStr() || !RoleFromString(v.get_str(), role)) {
        throw JSONRPCError(RPC_INVALID_PARAMETER,
            "Unknown role; expected admin, pauser, minter, burner, transfer, emergency or urisetter");
    }
    return role;
}

static UniValue SetPaused(const JSONRPCRequest& request, bool fPause)
{
    NodeContext& node = EnsureDeployment(request);
    const CAccountID& caller = EnsureCaller(request);

    CAccessControl& access = request.params.size() > 0 ? ComponentAccessV(node, request.params[0])
                                                        : node.engine->GetAccess();

    CValidationState state;
    bool fOk = fPause ? access.Pause(caller, state) : access.Unpause(caller, state);
    if (!fOk) {
        throw JSONRPCStateError(state);
    }

    UniValue result(UniValue::VOBJ);
    result.pushKV("component", access.GetName());
    result.pushKV("paused", access.IsPaused());
    return result;
}

static UniValue pausecomponent(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() > 1) {
        throw std::runtime_error(
            "pause ( \"component\" )\n"
            "\nPause a component. Paired operations fail while the engine is paused.\n"
            "Requires the pauser role on the component.\n"
            "\nArguments:\n"
            "1. \"component\"  (string, optional, default=engine) engine, pairledger, registry or stablecoin\n"
            "\nResult:\n"
            "{ \"component\": \"name\", \"paused\": true }\n"
            "\nExamples:\n"
            + HelpExampleCli("pause", "")
            + HelpExampleCli("pause", "registry"));
    }

    return SetPaused(request, true);
}

static UniValue unpausecomponent(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() > 1) {
        throw std::runtime_error(
            "unpause ( \"component\" )\n"
            "\nUnpause a component. Requires the pauser role on the component.\n"
            "\nArguments:\n"
            "1. \"component\"  (string, optional, default=engine) engine, pairledger, registry or stablecoin\n"
            "\nResult:\n"
            "{ \"component\": \"name\", \"paused\": false }\n"
            "\nExamples:\n"
            + HelpExampleCli("unpause", ""));
    }

    return SetPaused(request, false);
}

static UniValue emergencywithdraw(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "emergencywithdraw \"token\" amount\n"
            "\nMove tokens held by the engine to the caller. Requires the emergency role on the engine.\n"
            "Works while paused and does not check the pairing invariant.\n"
            "\nArguments:\n"
            "1. \"token\"   (string, required) stablecoin or pairledger (or its account)\n"
            "2. amount    (numeric, required) Amount to withdraw\n"
            "\nResult:\n"
            "{ \"token\": \"hex\", \"to\": \"hex\", \"amount\": x.xxxxxx }\n"
            "\nExamples:\n"
            + HelpExampleCli("emergencywithdraw", "stablecoin 5.0"));
    }

    NodeContext& node = EnsureDeployment(request);
    const CAccountID& caller = EnsureCaller(request);
    const CAccountID token = ParseTargetV(node, request.params[0], "token");
    const CAmount amount = AmountFromValue(request.params[1]);

    CValidationState state;
    if (!node.engine->EmergencyWithdraw(caller, token, amount, state)) {
        throw JSONRPCStateError(state);
    }

    UniValue result(UniValue::VOBJ);
    result.pushKV("token", token.GetHex());
    result.pushKV("to", caller.GetHex());
    result.pushKV("amount", ValueFromAmount(amount));
    return result;
}

static UniValue grantrole(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 3) {
        throw std::runtime_error(
            "grantrole \"component\" \"role\" \"account\"\n"
            "\nGrant a role on a component. Requires the admin role on the component.\n"
            "\nArguments:\n"
            "1. \"component\"  (string, required) engine, pairledger, registry or stablecoin\n"
            "2. \"role\"       (string, required) admin, pauser, minter, burner, transfer, emergency or urisetter\n"
            "3. \"account\"    (string, required) Account receiving the role\n"
            "\nResult:\n"
            "true\n"
            "\nExamples:\n"
            + HelpExampleCli("grantrole", "engine pauser \"00000000000000000000000000000000000000b1\""));
    }

    NodeContext& node = EnsureDeployment(request);
    const CAccountID& caller = EnsureCaller(request);
    CAccessControl& access = ComponentAccessV(node, request.params[0]);
    const AccessRole role = RoleFromValue(request.params[1]);
    const CAccountID account = ParseTargetV(node, request.params[2], "account");

    CValidationState state;
    if (!access.GrantRole(caller, role, account, state)) {
        throw JSONRPCStateError(state);
    }
    return true;
}

static UniValue revokerole(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 3) {
        throw std::runtime_error(
            "revokerole \"component\" \"role\" \"account\"\n"
            "\nRevoke a role on a component. Requires the admin role; the last admin cannot be revoked.\n"
            "\nArguments:\n"
            "1. \"component\"  (string, required) engine, pairledger, registry or stablecoin\n"
            "2. \"role\"       (string, required) Role name\n"
            "3. \"account\"    (string, required) Account losing the role\n"
            "\nResult:\n"
            "true\n"
            "\nExamples:\n"
            + HelpExampleCli("revokerole", "engine pauser \"00000000000000000000000000000000000000b1\""));
    }

    NodeContext& node = EnsureDeployment(request);
    const CAccountID& caller = EnsureCaller(request);
    CAccessControl& access = ComponentAccessV(node, request.params[0]);
    const AccessRole role = RoleFromValue(request.params[1]);
    const CAccountID account = ParseTargetV(node, request.params[2], "account");

    CValidationState state;
    if (!access.RevokeRole(caller, role, account, state)) {
        throw JSONRPCStateError(state);
    }
    return true;
}

static UniValue hasrole(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 3) {
        throw std::runtime_error(
            "hasrole \"component\" \"role\" \"account\"\n"
            "\nReturns whether an account holds a role on a component.\n"
            "\nArguments:\n"
            "1. \"component\"  (string, required) engine, pairledger, registry or stablecoin\n"
            "2. \"role\"       (string, required) Role name\n"
            "3. \"account\"    (string, required) Account or component name\n"
            "\nResult:\n"
            "true|false\n"
            "\nExamples:\n"
            + HelpExampleCli("hasrole", "pairledger transfer engine"));
    }

    NodeContext& node = EnsureDeployment(request);
    CAccessControl& access = ComponentAccessV(node, request.params[0]);
    const AccessRole role = RoleFromValue(request.params[1]);
    const CAccountID account = ParseTargetV(node, request.params[2], "account");

    return access.HasRole(role, account);
}

static UniValue setbaseuri(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "setbaseuri \"uri\"\n"
            "\nSet the prefix prepended to every collectible's metadata pointer (empty to clear).\n"
            "Requires the urisetter role on the registry.\n"
            "\nArguments:\n"
            "1. \"uri\"     (string, required) Base pointer\n"
            "\nResult:\n"
            "\"uri\"        (string) The base pointer now in effect\n"
            "\nExamples:\n"
            + HelpExampleCli("setbaseuri", "\"https://meta.example.org/\""));
    }

    NodeContext& node = EnsureDeployment(request);
    const CAccountID& caller = EnsureCaller(request);

    CValidationState state;
    if (!node.registry->SetBaseURI(caller, request.params[0].get_str(), state)) {
        throw JSONRPCStateError(state);
    }
    return node.registry->GetBaseURI();
}

// clang-format off
static const CRPCCommand commands[] =
{ //  category       name                   actor (function)    okSafe argNames
  //  -------------- ---------------------- ------------------- ------ --------
    { "admin",       "pause",               &pausecomponent,    true,  {"component"} },
    { "admin",       "unpause",             &unpausecomponent,  true,  {"component"} },
    { "admin",       "emergencywithdraw",   &emergencywithdraw, true,  {"token", "amount"} },
    { "admin",       "grantrole",           &grantrole,         true,  {"component", "role", "account"} },
    { "admin",       "revokerole",          &revokerole,        true,  {"component", "role", "account"} },
    { "admin",       "hasrole",             &hasrole,           true,  {"component", "role", "account"} },
    { "admin",       "setbaseuri",          &setbaseuri,        true,  {"uri"} },
};
// clang-format on

void RegisterAdminRPCCommands(CRPCTable& t)
{
    for (const auto& c : commands) {
        t.appendCommand(c.name, &c);
    }
}
