// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/system.h"

#include "logging.h"
#include "utilstrencodings.h"

#include <stdlib.h>
#include <string.h>

const char * const PAIRMINT_CONF_FILENAME = "pairmint.conf";

ArgsManager gArgs;

static fs::path pathCached;
static RecursiveMutex csPathCached;

/** Interpret string as boolean, for argument parsing */
static bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (atoi(strValue.c_str()) != 0);
}

/** Turn -noX into -X=0 */
static void InterpretNegativeSetting(std::string& strKey, std::string& strValue)
{
    if (strKey.length() > 3 && strKey[0] == '-' && strKey[1] == 'n' && strKey[2] == 'o') {
        strKey = "-" + strKey.substr(3);
        strValue = InterpretBool(strValue) ? "0" : "1";
    }
}

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error, int* nFirstPositional)
{
    LOCK(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();

    int i = 1;
    for (; i < argc; i++) {
        std::string str(argv[i]);
        std::string strValue;
        size_t is_index = str.find('=');
        if (is_index != std::string::npos) {
            strValue = str.substr(is_index + 1);
            str = str.substr(0, is_index);
        }

        if (str.empty() || str[0] != '-')
            break;

        // Interpret --foo as -foo.
        // If both --foo and -foo are set, the last takes effect.
        if (str.length() > 1 && str[1] == '-')
            str = str.substr(1);
        if (str.length() < 2) {
            error = strprintf("Invalid parameter %s", argv[i]);
            return false;
        }
        InterpretNegativeSetting(str, strValue);

        mapArgs[str] = strValue;
        mapMultiArgs[str].push_back(strValue);
    }

    if (nFirstPositional) *nFirstPositional = i;
    return true;
}

bool ArgsManager::ReadConfigFile(const std::string& confPath, std::string& error)
{
    fs::path pathConfigFile = GetConfigFile(confPath);
    fs::ifstream streamConfig(pathConfigFile);
    if (!streamConfig.good()) {
        // No config file is OK
        return true;
    }

    LOCK(cs_args);
    std::string line;
    int nLine = 0;
    while (std::getline(streamConfig, line)) {
        nLine++;
        size_t pos = line.find('#');
        if (pos != std::string::npos) line = line.substr(0, pos);
        // trim
        size_t begin = line.find_first_not_of(" \t\r");
        if (begin == std::string::npos) continue;
        size_t end = line.find_last_not_of(" \t\r");
        line = line.substr(begin, end - begin + 1);

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            error = strprintf("parse error on line %i: %s, if you intended to specify a negated option, use -no%s=1 instead", nLine, line, line);
            return false;
        }
        std::string strKey = "-" + line.substr(0, eq);
        std::string strValue = line.substr(eq + 1);
        InterpretNegativeSetting(strKey, strValue);
        // Don't overwrite existing settings so command line settings override the config file
        if (mapArgs.count(strKey) == 0) {
            mapArgs[strKey] = strValue;
        }
        mapMultiArgs[strKey].push_back(strValue);
    }
    return true;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    LOCK(cs_args);
    auto it = mapMultiArgs.find(strArg);
    if (it != mapMultiArgs.end()) return it->second;
    return {};
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    LOCK(cs_args);
    return mapArgs.count(strArg);
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return it->second;
    return strDefault;
}

int64_t ArgsManager::GetIntArg(const std::string& strArg, int64_t nDefault) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return atoi64(it->second);
    return nDefault;
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return InterpretBool(it->second);
    return fDefault;
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    if (IsArgSet(strArg)) return false;
    ForceSetArg(strArg, strValue);
    return true;
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    mapArgs[strArg] = strValue;
    mapMultiArgs[strArg] = {strValue};
}

void ArgsManager::ClearArgs()
{
    LOCK(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();
}

static const int screenWidth = 79;
static const int optIndent = 2;
static const int msgIndent = 7;

std::string HelpMessageGroup(const std::string& message)
{
    return std::string(message) + std::string("\n\n");
}

std::string HelpMessageOpt(const std::string& option, const std::string& message)
{
    std::string ret = std::string(optIndent, ' ') + std::string(option) + std::string("\n");
    std::string indent(msgIndent, ' ');
    std::string line;
    std::string word;
    for (char c : message + " ") {
        if (c != ' ') {
            word.push_back(c);
            continue;
        }
        if (!line.empty() && (int)(msgIndent + line.size() + 1 + word.size()) > screenWidth) {
            ret += indent + line + "\n";
            line.clear();
        }
        if (!line.empty()) line += ' ';
        line += word;
        word.clear();
    }
    if (!line.empty()) ret += indent + line + "\n";
    return ret + "\n";
}

static fs::path GetDefaultDataDir()
{
    // Unix: ~/.pairmint
    fs::path pathRet;
    char* pszHome = getenv("HOME");
    if (pszHome == nullptr || strlen(pszHome) == 0)
        pathRet = fs::path("/");
    else
        pathRet = fs::path(pszHome);
    return pathRet / ".pairmint";
}

const fs::path& GetDataDir()
{
    LOCK(csPathCached);

    fs::path& path = pathCached;

    // This can be called during exceptions by LogPrintf(), so we cache the
    // value so we don't have to do memory allocations after that.
    if (!path.empty())
        return path;

    if (gArgs.IsArgSet("-datadir")) {
        path = fs::absolute(gArgs.GetArg("-datadir", ""));
        if (!fs::is_directory(path)) {
            path = "";
            return path;
        }
    } else {
        path = GetDefaultDataDir();
    }

    TryCreateDirectories(path);
    return path;
}

void ClearDatadirCache()
{
    LOCK(csPathCached);
    pathCached = fs::path();
}

fs::path GetConfigFile(const std::string& confPath)
{
    fs::path pathConfigFile(confPath);
    if (!pathConfigFile.is_absolute())
        pathConfigFile = GetDataDir() / pathConfigFile;

    return pathConfigFile;
}

/**
 * Ignores exceptions thrown by Boost's create_directories if the requested directory exists.
 * Specifically handles case where path p exists, but it wasn't possible for the user to
 * write to the parent directory.
 */
bool TryCreateDirectories(const fs::path& p)
{
    try {
        return fs::create_directories(p);
    } catch (const fs::filesystem_error&) {
        if (!fs::exists(p) || !fs::is_directory(p))
            throw;
    }

    // create_directories didn't create the directory, it had to have existed already
    return false;
}
