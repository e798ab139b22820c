// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PIGGY_VAULT_SCRIPT_H
#define PIGGY_VAULT_SCRIPT_H

#include <istream>
#include <map>
#include <ostream>
#include <string>
#include <vector>

class CManualClock;
class CMemoryTokenLedger;
class CVaultManager;

struct CScriptContext
{
    CVaultManager& manager;
    CMemoryTokenLedger& ledger;
    CManualClock& clock;
};

struct CScriptRequest
{
    std::string strMethod;
    std::vector<std::string> params;
};

typedef std::string (*scriptfn_type)(CScriptContext& ctx, const CScriptRequest& request);

struct CScriptCommand
{
    std::string name;
    scriptfn_type actor;
    std::vector<std::string> argNames;
};

/**
 * CVaultScript - line-oriented command processor
 *
 * One command per line, each run to completion before the next is read,
 * so a script is a serialized request queue against one vault. '#'
 * starts a comment. Time only moves on "advance".
 *
 * Usage:
 *   mint <account> <amount>
 *   deposit <owner> <amount> <plan-days>
 *   withdraw <owner> <deposit-id>
 *   advance <duration>            e.g. 30d, 12h, 90m, 45
 *   plans
 */
class CVaultScript
{
private:
    CScriptContext ctx;
    std::map<std::string, const CScriptCommand*> mapCommands;

public:
    CVaultScript(CVaultManager& manager, CMemoryTokenLedger& ledger, CManualClock& clock);

    /**
     * Execute - Run one command line
     *
     * @return command output, empty for blank lines and comments
     * @throws std::runtime_error on unknown command, bad arguments, or a
     *         rejected vault operation (message is the reject reason)
     */
    std::string Execute(const std::string& strLine);

    /** Execute, with failures reported as "error: <reason>" in strResult */
    bool ExecuteLine(const std::string& strLine, std::string& strResult);

    /**
     * Run - Execute every line of in, writing results to out
     *
     * @return number of failed commands
     */
    unsigned int Run(std::istream& in, std::ostream& out);

    std::vector<std::string> ListCommands() const;
};

#endif // PIGGY_VAULT_SCRIPT_H
