// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "init.h"

#include "consensus/validation.h"
#include "logging.h"
#include "node/context.h"
#include "util/system.h"
#include "utilmoneystr.h"
#include "version.h"

#include <stdexcept>

CAccountID EngineAddress()
{
    return CAccountID(uint160S("00000000000000000000000000000000000000a1"));
}

CAccountID PairLedgerAddress()
{
    return CAccountID(uint160S("00000000000000000000000000000000000000a2"));
}

CAccountID RegistryAddress()
{
    return CAccountID(uint160S("00000000000000000000000000000000000000a3"));
}

CAccountID StablecoinAddress()
{
    return CAccountID(uint160S("00000000000000000000000000000000000000a4"));
}

std::string HelpMessage()
{
    std::string strUsage = HelpMessageGroup("Options:");
    strUsage += HelpMessageOpt("-?", "This help message");
    strUsage += HelpMessageOpt("-conf=<file>", strprintf("Specify configuration file (default: %s)", PAIRMINT_CONF_FILENAME));
    strUsage += HelpMessageOpt("-datadir=<dir>", "Specify data directory");

    strUsage += HelpMessageGroup("Deployment options:");
    strUsage += HelpMessageOpt("-admin=<account>", "Bootstrap administrator of a new deployment (40 hex characters)");
    strUsage += HelpMessageOpt("-caller=<account>", "Account that issues the command");
    strUsage += HelpMessageOpt("-pairfee=<amt>", strprintf("Stablecoin fee charged per pair and refunded on burn (default: %s)", FormatMoney(DEFAULT_PAIR_FEE)));
    strUsage += HelpMessageOpt("-eventcount=<n>", strprintf("Default number of events returned by getevents (default: %d)", DEFAULT_EVENT_COUNT));
    strUsage += HelpMessageOpt("-startpaused", strprintf("Pause the pairing engine when it is loaded (default: %u)", DEFAULT_STARTPAUSED));

    strUsage += HelpMessageGroup("Debugging/Testing options:");
    strUsage += HelpMessageOpt("-debug=<category>", "Output debugging information (default: 0, supplying <category> is optional). "
        "If <category> is not supplied or if <category> = 1, output all debugging information. <category> can be: " + ListLogCategories() + ".");
    strUsage += HelpMessageOpt("-logtimestamps", strprintf("Prepend debug output with timestamp (default: %u)", DEFAULT_LOGTIMESTAMPS));
    strUsage += HelpMessageOpt("-shrinkdebugfile", strprintf("Shrink debug.log file on client startup (default: %u)", DEFAULT_SHRINKDEBUGFILE));
    strUsage += HelpMessageOpt("-printtoconsole", strprintf("Send trace/debug info to console instead of debug.log file (default: %u)", DEFAULT_PRINTTOCONSOLE));

    return strUsage;
}

void InitLogging()
{
    LogInstance().m_print_to_console = gArgs.GetBoolArg("-printtoconsole", DEFAULT_PRINTTOCONSOLE);
    LogInstance().m_print_to_file = !LogInstance().m_print_to_console;
    LogInstance().m_file_path = GetDataDir() / DEFAULT_DEBUGLOGFILE;
    LogInstance().m_log_timestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);

    if (gArgs.IsArgSet("-debug")) {
        // Special-case: if -debug=0/-nodebug is set, turn off debugging messages
        const std::vector<std::string> categories = gArgs.GetArgs("-debug");
        bool fNone = false;
        for (const std::string& cat : categories) {
            if (cat == "0" || cat == "none") {
                fNone = true;
                break;
            }
        }
        if (!fNone) {
            for (const std::string& cat : categories) {
                if (!LogInstance().EnableCategory(cat.empty() ? std::string("1") : cat)) {
                    LogPrintf("Unsupported logging category -debug=%s.\n", cat);
                }
            }
        }
    }

    LogPrintf("Pairmint version %s\n", FormatFullVersion());
}

bool GetPairFee(CAmount& nFee, std::string& strError)
{
    nFee = DEFAULT_PAIR_FEE;
    if (!gArgs.IsArgSet("-pairfee")) {
        return true;
    }
    const std::string strFee = gArgs.GetArg("-pairfee", "");
    if (!ParseMoney(strFee, nFee)) {
        strError = strprintf("Invalid amount for -pairfee=<amount>: '%s'", strFee);
        return false;
    }
    return true;
}

void LoadComponents(NodeContext& node, CAmount nFee)
{
    CStateDB& db = *node.statedb;
    node.stablecoin = std::make_unique<CTokenLedger>(db, StablecoinAddress(), "stablecoin", false);
    node.pairledger = std::make_unique<CTokenLedger>(db, PairLedgerAddress(), "pairledger", true);
    node.registry = std::make_unique<CCollectibleRegistry>(db, RegistryAddress(), "registry");
    node.engine = std::make_unique<CPairEngine>(db, EngineAddress(), *node.pairledger, *node.registry,
                                                *node.stablecoin, nFee);
}

bool DeployPairSystem(NodeContext& node, const CAccountID& admin, CValidationState& state)
{
    if (!node.IsLoaded()) {
        return state.Error("components-not-loaded");
    }
    CStateDB& db = *node.statedb;

    LOCK(db.cs_state);
    CAccountID deployedAdmin;
    if (db.ReadDeployed(deployedAdmin)) {
        LogPrint(BCLog::ACCESS, "DeployPairSystem: already deployed by %s\n", AccountLogStr(deployedAdmin));
        return true;
    }
    if (admin.IsNull()) {
        return state.Invalid(false, REJECT_INVALID, "bad-admin-zero-address");
    }
    if (admin == node.engine->GetAddress()) {
        return state.Invalid(false, REJECT_INVALID, "bad-admin-is-engine");
    }

    CStateDB::Txn txn(db);
    if (!txn.IsActive()) {
        return state.Error("db-txn-failed");
    }

    CAccessControl& engineAccess = node.engine->GetAccess();
    CAccessControl& ledgerAccess = node.pairledger->GetAccess();
    CAccessControl& registryAccess = node.registry->GetAccess();
    CAccessControl& stableAccess = node.stablecoin->GetAccess();
    const CAccountID engine = node.engine->GetAddress();

    bool fOk =
        // Administrator
        engineAccess.SetupRole(ROLE_ADMIN, admin, state) &&
        engineAccess.SetupRole(ROLE_PAUSER, admin, state) &&
        engineAccess.SetupRole(ROLE_EMERGENCY, admin, state) &&
        ledgerAccess.SetupRole(ROLE_ADMIN, admin, state) &&
        ledgerAccess.SetupRole(ROLE_PAUSER, admin, state) &&
        registryAccess.SetupRole(ROLE_ADMIN, admin, state) &&
        registryAccess.SetupRole(ROLE_PAUSER, admin, state) &&
        registryAccess.SetupRole(ROLE_URI_SETTER, admin, state) &&
        stableAccess.SetupRole(ROLE_ADMIN, admin, state) &&
        stableAccess.SetupRole(ROLE_PAUSER, admin, state) &&
        stableAccess.SetupRole(ROLE_MINTER, admin, state) &&
        // Engine
        ledgerAccess.SetupRole(ROLE_MINTER, engine, state) &&
        ledgerAccess.SetupRole(ROLE_BURNER, engine, state) &&
        ledgerAccess.SetupRole(ROLE_TRANSFER, engine, state) &&
        registryAccess.SetupRole(ROLE_MINTER, engine, state) &&
        registryAccess.SetupRole(ROLE_BURNER, engine, state) &&
        registryAccess.SetupRole(ROLE_TRANSFER, engine, state);
    if (!fOk) {
        return false;
    }

    if (!db.WriteDeployed(admin)) {
        return state.Error("db-write-failed");
    }
    if (!txn.Commit()) {
        return state.Error("db-commit-failed");
    }

    LogPrintf("DeployPairSystem: deployed, administrator %s, fee %s\n", admin.GetHex(),
              FormatMoney(node.engine->GetFee()));
    return true;
}

bool AppInitMain(NodeContext& node, bool fMemory, std::string& strError)
{
    CAmount nFee = 0;
    if (!GetPairFee(nFee, strError)) {
        return false;
    }

    CAccountID admin;
    if (gArgs.IsArgSet("-admin") && !ParseAccountID(gArgs.GetArg("-admin", ""), admin)) {
        strError = strprintf("Invalid account for -admin=<account>: '%s'", gArgs.GetArg("-admin", ""));
        return false;
    }

    try {
        if (fMemory) {
            node.statedb = std::make_unique<CStateDB>(fs::path(), true);
        } else {
            const fs::path& datadir = GetDataDir();
            if (!TryCreateDirectories(datadir) && !fs::is_directory(datadir)) {
                strError = strprintf("Cannot create data directory %s", datadir.string());
                return false;
            }
            node.statedb = std::make_unique<CStateDB>(datadir / STATEDB_FILENAME);
        }
    } catch (const std::exception& e) {
        strError = strprintf("Error opening state database: %s", e.what());
        return false;
    }

    LoadComponents(node, nFee);

    CAccountID deployedAdmin;
    bool fDeployed = node.statedb->ReadDeployed(deployedAdmin);
    if (!fDeployed && !admin.IsNull()) {
        CValidationState state;
        if (!DeployPairSystem(node, admin, state)) {
            strError = strprintf("Deployment failed: %s", FormatStateMessage(state));
            return false;
        }
        deployedAdmin = admin;
        fDeployed = true;
    }
    if (!fDeployed) {
        LogPrintf("State database has no deployment yet; start with -admin=<account> to bootstrap\n");
    }

    if (gArgs.GetBoolArg("-startpaused", DEFAULT_STARTPAUSED) && fDeployed && !node.engine->IsPaused()) {
        CValidationState state;
        if (!node.engine->Pause(deployedAdmin, state)) {
            strError = strprintf("-startpaused: %s", FormatStateMessage(state));
            return false;
        }
    }

    LogPrintf("Pairing engine loaded: fee %s, %s\n", FormatMoney(nFee), node.engine->GetState().ToString());
    return true;
}

void Shutdown(NodeContext& node)
{
    if (node.statedb) {
        node.statedb->Flush();
    }
    node.Reset();
    LogPrint(BCLog::DB, "Shutdown: done\n");
}
