// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "init.h"
#include "logging.h"
#include "node/context.h"
#include "rpc/client.h"
#include "rpc/protocol.h"
#include "rpc/register.h"
#include "rpc/server.h"
#include "util/format.h"
#include "util/system.h"
#include "utilstrencodings.h"
#include "version.h"

#include <stdio.h>
#include <stdlib.h>

#include <univalue.h>

static const int CONTINUE_EXECUTION = -1;

static std::string HelpMessageCli()
{
    std::string strUsage = HelpMessage();
    strUsage += HelpMessageGroup("Client options:");
    strUsage += HelpMessageOpt("-memory", "Run against a throwaway in-memory state database (default: 0)");
    return strUsage;
}

//
// Returns CONTINUE_EXECUTION when the command should be run, or an exit code.
//
static int AppInitCli(int argc, char* argv[], int& nFirstPositional)
{
    std::string error;
    if (!gArgs.ParseParameters(argc, argv, error, &nFirstPositional)) {
        fprintf(stderr, "Error parsing command line arguments: %s\n", error.c_str());
        return EXIT_FAILURE;
    }
    if (argc < 2 || gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help") || gArgs.IsArgSet("-version")) {
        std::string strUsage = "Pairmint RPC client version " + FormatFullVersion() + "\n";
        if (!gArgs.IsArgSet("-version")) {
            strUsage += "\n"
                        "Usage:  pairmint-cli [options] <command> [params]  Run a pairing engine command\n"
                        "or:     pairmint-cli [options] help                List commands\n"
                        "or:     pairmint-cli [options] help <command>      Get help for a command\n";
            strUsage += "\n" + HelpMessageCli();
        }
        fprintf(stdout, "%s", strUsage.c_str());
        if (argc < 2) {
            fprintf(stderr, "Error: too few parameters\n");
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }
    if (!fs::is_directory(GetDataDir()) && !gArgs.GetBoolArg("-memory", false)) {
        if (!TryCreateDirectories(GetDataDir())) {
            fprintf(stderr, "Error: Specified data directory \"%s\" could not be created.\n", gArgs.GetArg("-datadir", "").c_str());
            return EXIT_FAILURE;
        }
    }
    if (!gArgs.ReadConfigFile(gArgs.GetArg("-conf", PAIRMINT_CONF_FILENAME), error)) {
        fprintf(stderr, "Error reading configuration file: %s\n", error.c_str());
        return EXIT_FAILURE;
    }
    // A throwaway run leaves the persistent debug.log as it found it
    if (gArgs.GetBoolArg("-memory", false)) {
        gArgs.SoftSetArg("-shrinkdebugfile", "0");
    }
    return CONTINUE_EXECUTION;
}

static int CommandLineRPC(NodeContext& node, int argc, char* argv[], int nFirstPositional)
{
    std::string strPrint;
    int nRet = 0;
    try {
        if (nFirstPositional >= argc) {
            throw std::runtime_error("too few parameters");
        }
        std::vector<std::string> args(&argv[nFirstPositional], &argv[argc]);

        JSONRPCRequest request;
        request.id = 1;
        request.context = &node;
        request.strMethod = args[0];
        args.erase(args.begin());
        request.params = RPCConvertValues(request.strMethod, args);

        if (gArgs.IsArgSet("-caller")) {
            const std::string strCaller = gArgs.GetArg("-caller", "");
            if (!ParseAccountID(strCaller, request.caller)) {
                throw std::runtime_error(strprintf("Invalid account for -caller=<account>: '%s'", strCaller));
            }
        }

        try {
            const UniValue result = tableRPC.execute(request);
            if (result.isNull()) {
                strPrint = "";
            } else if (result.isStr()) {
                strPrint = result.get_str();
            } else {
                strPrint = result.write(2);
            }
        } catch (const UniValue& objError) {
            // Error
            const UniValue& code = find_value(objError, "code");
            const UniValue& message = find_value(objError, "message");
            strPrint = "error code: " + (code.isNum() ? code.getValStr() : "-1") + "\n";
            if (message.isStr()) {
                strPrint += "error message:\n" + message.get_str();
            }
            nRet = abs(code.isNum() ? code.get_int() : RPC_MISC_ERROR);
        }
    } catch (const std::exception& e) {
        strPrint = std::string("error: ") + e.what();
        nRet = EXIT_FAILURE;
    }

    if (strPrint != "") {
        fprintf((nRet == 0 ? stdout : stderr), "%s\n", strPrint.c_str());
    }
    return nRet;
}

int main(int argc, char* argv[])
{
    int nFirstPositional = argc;
    int ret = AppInitCli(argc, argv, nFirstPositional);
    if (ret != CONTINUE_EXECUTION) {
        return ret;
    }

    InitLogging();
    if (LogInstance().m_print_to_file && gArgs.GetBoolArg("-shrinkdebugfile", DEFAULT_SHRINKDEBUGFILE)) {
        // Do this first since it both loads a bunch of debug.log into memory,
        // and because this needs to happen before any other debug.log printing
        LogInstance().ShrinkDebugFile();
    }
    if (!LogInstance().StartLogging()) {
        fprintf(stderr, "Error: could not open debug log file %s\n", LogInstance().m_file_path.string().c_str());
        return EXIT_FAILURE;
    }

    NodeContext node;
    std::string strError;
    if (!AppInitMain(node, gArgs.GetBoolArg("-memory", false), strError)) {
        fprintf(stderr, "Error: %s\n", strError.c_str());
        Shutdown(node);
        return EXIT_FAILURE;
    }

    RegisterAllPairmintRPCCommands(tableRPC);
    ret = CommandLineRPC(node, argc, argv, nFirstPositional);
    Shutdown(node);
    return ret;
}
