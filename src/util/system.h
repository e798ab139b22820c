// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Server/client environment: argument handling, config file parsing,
 * error reporting helpers.
 */
#ifndef PIGGY_UTIL_SYSTEM_H
#define PIGGY_UTIL_SYSTEM_H

#include "logging.h"
#include "sync.h"

#include <istream>
#include <map>
#include <string>
#include <vector>

template <typename... Args>
bool error(const char* fmt, const Args&... args)
{
    LogPrintf("ERROR: %s\n", util_format::format(fmt, args...));
    return false;
}

class ArgsManager
{
protected:
    mutable RecursiveMutex cs_args;
    std::map<std::string, std::vector<std::string>> m_override_args;
    std::map<std::string, std::vector<std::string>> m_config_args;

    bool GetArgValue(const std::string& strArg, std::string& strValue) const;

public:
    /**
     * Parse "-name=value" style command line arguments.
     * "-noname" is stored as name=0. Parsing stops at the first
     * non-dash argument, which is left for the caller.
     *
     * @return false and set error on malformed input
     */
    bool ParseParameters(int argc, const char* const argv[], std::string& error);

    /** Arguments left over after the last "-" option */
    std::vector<std::string> GetPositionalArgs() const;

    /**
     * Read "name=value" lines. '#' starts a comment; blank lines are
     * skipped. Values given on the command line take precedence.
     */
    bool ReadConfigStream(std::istream& stream, std::string& error);
    bool ReadConfigFile(const std::string& strPath, std::string& error);

    /**
     * Return a vector of strings of the given argument
     */
    std::vector<std::string> GetArgs(const std::string& strArg) const;

    /**
     * Return true if the given argument has been manually set
     */
    bool IsArgSet(const std::string& strArg) const;

    /**
     * Return true if the argument was originally passed as a negated option,
     * i.e. -nofoo.
     */
    bool IsArgNegated(const std::string& strArg) const;

    std::string GetArg(const std::string& strArg, const std::string& strDefault) const;
    int64_t GetArg(const std::string& strArg, int64_t nDefault) const;
    bool GetBoolArg(const std::string& strArg, bool fDefault) const;

    /** Set an argument if it doesn't already have a value */
    bool SoftSetArg(const std::string& strArg, const std::string& strValue);

    /** Forcibly set an argument, used by tests */
    void ForceSetArg(const std::string& strArg, const std::string& strValue);

    void ClearArgs();

private:
    std::vector<std::string> m_positional;
};

extern ArgsManager gArgs;

#endif // PIGGY_UTIL_SYSTEM_H
