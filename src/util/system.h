// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Server/client environment: argument handling, config file parsing,
 * data directory.
 */
#ifndef PAIRMINT_UTIL_SYSTEM_H
#define PAIRMINT_UTIL_SYSTEM_H

#include "fs.h"
#include "sync.h"

#include <map>
#include <set>
#include <stdint.h>
#include <string>
#include <vector>

extern const char * const PAIRMINT_CONF_FILENAME;

const fs::path& GetDataDir();
/** Forget the cached data directory (tests switch -datadir between cases) */
void ClearDatadirCache();
fs::path GetConfigFile(const std::string& confPath);
bool TryCreateDirectories(const fs::path& p);

class ArgsManager
{
protected:
    mutable RecursiveMutex cs_args;
    std::map<std::string, std::string> mapArgs;
    std::map<std::string, std::vector<std::string>> mapMultiArgs;

public:
    /**
     * Parse "-name=value" / "-noname" style command line arguments.
     * Parsing stops at the first argument that does not start with '-'; its
     * index is returned through nFirstPositional.
     */
    bool ParseParameters(int argc, const char* const argv[], std::string& error, int* nFirstPositional = nullptr);

    /**
     * Read "name=value" lines from the config file. Command line values take
     * precedence over config file values.
     */
    bool ReadConfigFile(const std::string& confPath, std::string& error);

    std::vector<std::string> GetArgs(const std::string& strArg) const;

    /**
     * Return true if the given argument has been manually set
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return true if the argument has been set
     */
    bool IsArgSet(const std::string& strArg) const;

    /**
     * Return string argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param strDefault (e.g. "1")
     * @return command-line argument or default value
     */
    std::string GetArg(const std::string& strArg, const std::string& strDefault) const;

    /**
     * Return integer argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param nDefault (e.g. 1)
     * @return command-line argument (0 if invalid number) or default value
     */
    int64_t GetIntArg(const std::string& strArg, int64_t nDefault) const;

    /**
     * Return boolean argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param fDefault (true or false)
     * @return command-line argument or default value
     */
    bool GetBoolArg(const std::string& strArg, bool fDefault) const;

    /**
     * Set an argument if it doesn't already have a value
     *
     * @param strArg Argument to set (e.g. "-foo")
     * @param strValue Value (e.g. "1")
     * @return true if argument gets set, false if it already had a value
     */
    bool SoftSetArg(const std::string& strArg, const std::string& strValue);

    // Forces an arg setting. Called by SoftSetArg() if the arg hasn't already
    // been set. Also called directly in testing.
    void ForceSetArg(const std::string& strArg, const std::string& strValue);

    /** Drop every parsed argument */
    void ClearArgs();
};

extern ArgsManager gArgs;

/**
 * Format a string to be used as group of options in help messages
 *
 * @param message Group name (e.g. "RPC server options:")
 * @return the formatted string
 */
std::string HelpMessageGroup(const std::string& message);

/**
 * Format a string to be used as option description in help messages
 *
 * @param option Option message (e.g. "-rpcuser=<user>")
 * @param message Option description (e.g. "Username for JSON-RPC connections")
 * @return the formatted string
 */
std::string HelpMessageOpt(const std::string& option, const std::string& message);

#endif // PAIRMINT_UTIL_SYSTEM_H
