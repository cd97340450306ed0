// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Pairing engine RPCs
 *
 * - mintpair / burnpair / transferpair: the three paired operations, run
 *   as -caller
 * - getpair / listpairs: live pair records with owner and pointer
 * - getpairstate / auditpairs: counters, invariants and escrow health
 */

#include "rpc/server.h"

#include "consensus/validation.h"
#include "node/context.h"
#include "rpc/register.h"
#include "util/format.h"
#include "utilmoneystr.h"

#include <stdexcept>

#include <univalue.h>

static UniValue PairToJSON(const NodeContext& node, const PairRecord& pair)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("id", (uint64_t)pair.nId);
    obj.pushKV("live", pair.fExists);

    CAccountID owner;
    if (node.registry->OwnerOf(pair.nId, owner)) {
        obj.pushKV("owner", owner.GetHex());
        obj.pushKV("units", ValueFromAmount(node.pairledger->BalanceOf(owner)));
    }
    std::string uri;
    if (node.registry->TokenURI(pair.nId, uri)) {
        obj.pushKV("uri", uri);
    }
    obj.pushKV("fee_paid", ValueFromAmount(pair.nFeePaid));
    obj.pushKV("mint_seq", (uint64_t)pair.nMintSeq);
    return obj;
}

static UniValue mintpair(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "mintpair \"uri\"\n"
            "\nMint one unit and the next collectible to the caller, paying the pair fee in stablecoin.\n"
            "The caller must hold the fee and have approved the engine for it.\n"
            "\nArguments:\n"
            "1. \"uri\"     (string, required) Metadata pointer (http://, https:// or ipfs://)\n"
            "\nResult:\n"
            "{\n"
            "  \"id\": n,            (numeric) Identifier of the new pair\n"
            "  \"owner\": \"hex\",     (string) Caller\n"
            "  \"fee\": x.xxxxxx     (numeric) Stablecoin fee charged\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("mintpair", "\"ipfs://QmYwAPJzv5CZsnA625s3Xf2nemtYgPpHdWEz79ojWnPbdG\""));
    }

    NodeContext& node = EnsureDeployment(request);
    const CAccountID& caller = EnsureCaller(request);

    CValidationState state;
    uint64_t nId = 0;
    if (!node.engine->MintPair(caller, request.params[0].get_str(), nId, state)) {
        throw JSONRPCStateError(state);
    }

    UniValue result(UniValue::VOBJ);
    result.pushKV("id", nId);
    result.pushKV("owner", caller.GetHex());
    result.pushKV("fee", ValueFromAmount(node.engine->GetFee()));
    return result;
}

static UniValue burnpair(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "burnpair id\n"
            "\nBurn a live pair owned by the caller and refund the fee it was minted with.\n"
            "\nArguments:\n"
            "1. id     (numeric, required) Pair identifier\n"
            "\nResult:\n"
            "{\n"
            "  \"id\": n,            (numeric) Burned identifier\n"
            "  \"refund\": x.xxxxxx  (numeric) Stablecoin returned to the caller\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("burnpair", "0"));
    }

    NodeContext& node = EnsureDeployment(request);
    const CAccountID& caller = EnsureCaller(request);
    const uint64_t nId = ParseIdV(request.params[0], "id");

    PairRecord pair;
    CAmount nRefund = node.engine->GetPair(nId, pair) ? pair.nFeePaid : 0;

    CValidationState state;
    if (!node.engine->BurnPair(caller, nId, state)) {
        throw JSONRPCStateError(state);
    }

    UniValue result(UniValue::VOBJ);
    result.pushKV("id", nId);
    result.pushKV("refund", ValueFromAmount(nRefund));
    return result;
}

static UniValue transferpair(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "transferpair \"to\" id\n"
            "\nMove both halves of a live pair from the caller to another account.\n"
            "\nArguments:\n"
            "1. \"to\"     (string, required) Receiving account (40 hex characters)\n"
            "2. id       (numeric, required) Pair identifier\n"
            "\nResult:\n"
            "{\n"
            "  \"id\": n,          (numeric) Pair identifier\n"
            "  \"from\": \"hex\",    (string) Previous owner\n"
            "  \"to\": \"hex\"       (string) New owner\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("transferpair", "\"00000000000000000000000000000000000000b2\" 0"));
    }

    NodeContext& node = EnsureDeployment(request);
    const CAccountID& caller = EnsureCaller(request);
    const CAccountID to = ParseAccountV(request.params[0], "to");
    const uint64_t nId = ParseIdV(request.params[1], "id");

    CValidationState state;
    if (!node.engine->TransferPair(caller, to, nId, state)) {
        throw JSONRPCStateError(state);
    }

    UniValue result(UniValue::VOBJ);
    result.pushKV("id", nId);
    result.pushKV("from", caller.GetHex());
    result.pushKV("to", to.GetHex());
    return result;
}

static UniValue getpair(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "getpair id\n"
            "\nReturns a live pair.\n"
            "\nArguments:\n"
            "1. id     (numeric, required) Pair identifier\n"
            "\nResult:\n"
            "{\n"
            "  \"id\": n,              (numeric) Identifier\n"
            "  \"live\": true,         (boolean) Always true for a returned pair\n"
            "  \"owner\": \"hex\",       (string) Current owner of both halves\n"
            "  \"units\": x.xxxxxx,    (numeric) Pair ledger balance of the owner\n"
            "  \"uri\": \"...\",         (string) Metadata pointer\n"
            "  \"fee_paid\": x.xxxxxx, (numeric) Fee refunded on burn\n"
            "  \"mint_seq\": n         (numeric) Event sequence of the mint\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("getpair", "0"));
    }

    NodeContext& node = EnsureDeployment(request);
    const uint64_t nId = ParseIdV(request.params[0], "id");

    PairRecord pair;
    if (!node.engine->GetPair(nId, pair)) {
        throw JSONRPCError(RPC_PAIR_INVARIANT, strprintf("Pair %u is not live", nId));
    }
    return PairToJSON(node, pair);
}

static UniValue listpairs(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() > 0) {
        throw std::runtime_error(
            "listpairs\n"
            "\nReturns all live pairs in identifier order.\n"
            "\nResult:\n"
            "[ { ... }, ... ]     (array) Objects as returned by getpair\n"
            "\nExamples:\n"
            + HelpExampleCli("listpairs", ""));
    }

    NodeContext& node = EnsureDeployment(request);

    UniValue result(UniValue::VARR);
    if (!node.engine->ForEachPair([&](const PairRecord& pair) {
            result.push_back(PairToJSON(node, pair));
            return true;
        })) {
        throw JSONRPCError(RPC_DATABASE_ERROR, strprintf("Pair records unreadable after %u entries", result.size()));
    }
    return result;
}

static UniValue getpairstate(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() > 0) {
        throw std::runtime_error(
            "getpairstate\n"
            "\nReturns the pairing engine counters and invariant status.\n"
            "\nResult:\n"
            "{\n"
            "  \"live_pairs\": n,            (numeric) Live pairs\n"
            "  \"pair_supply\": x.xxxxxx,    (numeric) Units attributed to live pairs\n"
            "  \"ledger_supply\": x.xxxxxx,  (numeric) Pair ledger total supply\n"
            "  \"registry_count\": n,        (numeric) Live collectibles\n"
            "  \"next_id\": n,               (numeric) Identifier of the next mint\n"
            "  \"fees_escrowed\": x.xxxxxx,  (numeric) Fees owed to live pairs\n"
            "  \"escrow_balance\": x.xxxxxx, (numeric) Stablecoin held by the engine\n"
            "  \"total_minted\": n,\n"
            "  \"total_burned\": n,\n"
            "  \"fee\": x.xxxxxx,            (numeric) Current pair fee\n"
            "  \"paused\": true|false,\n"
            "  \"invariants\": { \"ok\": true|false, \"formula\": \"...\" }\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("getpairstate", ""));
    }

    NodeContext& node = EnsureDeployment(request);
    LOCK(node.statedb->cs_state);

    const PairState pairState = node.engine->GetState();
    const CAmount nLedgerSupply = node.pairledger->TotalSupply();
    const uint64_t nRegistryCount = node.registry->TotalSupply();

    UniValue result(UniValue::VOBJ);
    result.pushKV("live_pairs", pairState.nLivePairs);
    result.pushKV("pair_supply", ValueFromAmount(pairState.nPairSupply));
    result.pushKV("ledger_supply", ValueFromAmount(nLedgerSupply));
    result.pushKV("registry_count", nRegistryCount);
    result.pushKV("next_id", node.registry->NextId());
    result.pushKV("fees_escrowed", ValueFromAmount(pairState.nFeesEscrowed));
    result.pushKV("escrow_balance", ValueFromAmount(node.stablecoin->BalanceOf(node.engine->GetAddress())));
    result.pushKV("total_minted", pairState.nTotalMinted);
    result.pushKV("total_burned", pairState.nTotalBurned);
    result.pushKV("fee", ValueFromAmount(node.engine->GetFee()));
    result.pushKV("paused", node.engine->IsPaused());

    UniValue invariants(UniValue::VOBJ);
    invariants.pushKV("ok", pairState.CheckInvariants() &&
                            nLedgerSupply == pairState.nPairSupply &&
                            nRegistryCount == pairState.nLivePairs);
    invariants.pushKV("formula", "pair_supply == live_pairs * 1.000000 == ledger_supply");
    result.pushKV("invariants", invariants);
    return result;
}

static UniValue auditpairs(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() > 0) {
        throw std::runtime_error(
            "auditpairs\n"
            "\nChecks every live pair against the registry and the pair ledger.\n"
            "\nResult:\n"
            "{\n"
            "  \"ok\": true|false,             (boolean) No problems found\n"
            "  \"pairs_checked\": n,\n"
            "  \"owners\": n,\n"
            "  \"escrow_balance\": x.xxxxxx,\n"
            "  \"fees_recorded\": x.xxxxxx,\n"
            "  \"escrow_covered\": true|false, (boolean) Reported only, never enforced\n"
            "  \"problems\": [ \"...\", ... ]\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("auditpairs", ""));
    }

    NodeContext& node = EnsureDeployment(request);

    PairAudit audit;
    node.engine->AuditPairs(audit);

    UniValue problems(UniValue::VARR);
    for (const std::string& strProblem : audit.vProblems) {
        problems.push_back(strProblem);
    }

    UniValue result(UniValue::VOBJ);
    result.pushKV("ok", audit.IsClean());
    result.pushKV("pairs_checked", audit.nPairsChecked);
    result.pushKV("owners", audit.nOwners);
    result.pushKV("escrow_balance", ValueFromAmount(audit.nEscrowBalance));
    result.pushKV("fees_recorded", ValueFromAmount(audit.nFeesRecorded));
    result.pushKV("escrow_covered", audit.fEscrowCovered);
    result.pushKV("problems", problems);
    return result;
}

// clang-format off
static const CRPCCommand commands[] =
{ //  category       name                   actor (function)    okSafe argNames
  //  -------------- ---------------------- ------------------- ------ --------
    { "pairs",       "mintpair",            &mintpair,          false, {"uri"} },
    { "pairs",       "burnpair",            &burnpair,          false, {"id"} },
    { "pairs",       "transferpair",        &transferpair,      false, {"to", "id"} },
    { "pairs",       "getpair",             &getpair,           true,  {"id"} },
    { "pairs",       "listpairs",           &listpairs,         true,  {} },
    { "pairs",       "getpairstate",        &getpairstate,      true,  {} },
    { "pairs",       "auditpairs",          &auditpairs,        true,  {} },
};
// clang-format on

void RegisterPairRPCCommands(CRPCTable& t)
{
    for (const auto& c : commands) {
        t.appendCommand(c.name, &c);
    }
}
