// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "vault/vault_script.h"

#include "logging.h"
#include "util/moneystr.h"
#include "util/strencodings.h"
#include "util/time.h"
#include "validationstate.h"
#include "vault/vault_interest.h"
#include "vault/vault_manager.h"
#include "vault/vault_memledger.h"

#include <stdexcept>

#include <boost/algorithm/string/trim.hpp>

// ============================================================================
// Argument helpers
// ============================================================================

static CAmount AmountFromParam(const std::string& str)
{
    CAmount nAmount;
    if (!ParseMoney(str, nAmount)) {
        throw std::runtime_error(strprintf("invalid amount '%s'", str));
    }
    return nAmount;
}

static uint32_t UInt32FromParam(const std::string& str, const char* name)
{
    uint32_t n;
    if (!ParseUInt32(str, &n)) {
        throw std::runtime_error(strprintf("invalid %s '%s'", name, str));
    }
    return n;
}

static uint64_t DepositIdFromParam(const std::string& str)
{
    int64_t n;
    if (!ParseInt64(str, &n) || n <= 0) {
        throw std::runtime_error(strprintf("invalid deposit id '%s'", str));
    }
    return static_cast<uint64_t>(n);
}

static bool BoolFromParam(const std::string& str)
{
    if (str == "1" || str == "true" || str == "active") return true;
    if (str == "0" || str == "false" || str == "inactive") return false;
    throw std::runtime_error(strprintf("invalid flag '%s'", str));
}

/** Turn a rejected operation into the command's error */
static void CheckResult(bool fOk, const CValidationState& state)
{
    if (!fOk) {
        throw std::runtime_error(state.ToString());
    }
}

// ============================================================================
// Commands
// ============================================================================

static std::string mint(CScriptContext& ctx, const CScriptRequest& request)
{
    const std::string& account = request.params[0];
    std::string strError;
    if (!ctx.ledger.Mint(account, AmountFromParam(request.params[1]), strError)) {
        throw std::runtime_error(strError);
    }
    return strprintf("balance=%s", FormatMoney(ctx.ledger.GetBalance(account)));
}

static std::string balance(CScriptContext& ctx, const CScriptRequest& request)
{
    return FormatMoney(ctx.ledger.GetBalance(request.params[0]));
}

static std::string plan(CScriptContext& ctx, const CScriptRequest& request)
{
    const uint32_t nDays = UInt32FromParam(request.params[1], "plan days");
    const uint32_t nAPY = UInt32FromParam(request.params[2], "apy");
    const CAmount nMin = AmountFromParam(request.params[3]);
    const CAmount nMax = AmountFromParam(request.params[4]);
    const bool fActive = request.params.size() > 5 ? BoolFromParam(request.params[5]) : true;

    CValidationState state;
    CheckResult(ctx.manager.SetPlan(request.params[0], nDays, nDays * SECONDS_PER_DAY, nAPY, nMin, nMax, fActive, state), state);
    return "ok";
}

static std::string planmult(CScriptContext& ctx, const CScriptRequest& request)
{
    CValidationState state;
    CheckResult(ctx.manager.SetPlanMultiplier(request.params[0],
                                              UInt32FromParam(request.params[1], "plan days"),
                                              UInt32FromParam(request.params[2], "multiplier"),
                                              state), state);
    return "ok";
}

static std::string globalmult(CScriptContext& ctx, const CScriptRequest& request)
{
    CValidationState state;
    CheckResult(ctx.manager.SetGlobalMultiplier(request.params[0],
                                                UInt32FromParam(request.params[1], "multiplier"),
                                                state), state);
    return "ok";
}

static std::string mode(CScriptContext& ctx, const CScriptRequest& request)
{
    vault_interest::CompoundingMode newMode;
    if (!vault_interest::CompoundingModeFromString(request.params[1], newMode)) {
        throw std::runtime_error(strprintf("invalid mode '%s' (expected bounded, exact or continuous)", request.params[1]));
    }

    CValidationState state;
    CheckResult(ctx.manager.SetCompoundingMode(request.params[0], newMode, state), state);
    return "ok";
}

static std::string fund(CScriptContext& ctx, const CScriptRequest& request)
{
    CValidationState state;
    CheckResult(ctx.manager.FundRewardPool(request.params[0], AmountFromParam(request.params[1]), state), state);
    return strprintf("pool=%s", FormatMoney(ctx.manager.GetRewardPool().nTotalPool));
}

static std::string deposit(CScriptContext& ctx, const CScriptRequest& request)
{
    uint64_t nDepositId = 0;
    CValidationState state;
    CheckResult(ctx.manager.CreateDeposit(request.params[0],
                                          AmountFromParam(request.params[1]),
                                          UInt32FromParam(request.params[2], "plan days"),
                                          state, &nDepositId), state);
    return strprintf("deposit %d", nDepositId);
}

static std::string withdraw(CScriptContext& ctx, const CScriptRequest& request)
{
    CPayout payout;
    CValidationState state;
    CheckResult(ctx.manager.Withdraw(request.params[0], DepositIdFromParam(request.params[1]), state, &payout), state);
    return strprintf("principal=%s interest=%s bonus=%s total=%s",
                     FormatMoney(payout.nPrincipal), FormatMoney(payout.nInterest),
                     FormatMoney(payout.nBonus), FormatMoney(payout.nTotal));
}

static std::string emergency(CScriptContext& ctx, const CScriptRequest& request)
{
    CPayout payout;
    CValidationState state;
    CheckResult(ctx.manager.EmergencyWithdraw(request.params[0], DepositIdFromParam(request.params[1]), state, &payout), state);
    return strprintf("principal=%s penalty=%s total=%s",
                     FormatMoney(payout.nPrincipal), FormatMoney(payout.nPenalty), FormatMoney(payout.nTotal));
}

static std::string interest(CScriptContext& ctx, const CScriptRequest& request)
{
    const uint64_t nDepositId = DepositIdFromParam(request.params[0]);
    if (!ctx.manager.GetDeposit(nDepositId)) {
        throw std::runtime_error(strprintf("bad-deposit-unknown (deposit %d)", nDepositId));
    }
    return FormatMoney(ctx.manager.CalculateCurrentInterest(nDepositId));
}

static std::string advance(CScriptContext& ctx, const CScriptRequest& request)
{
    int64_t nSeconds;
    if (!ParseDuration(request.params[0], nSeconds)) {
        throw std::runtime_error(strprintf("invalid duration '%s'", request.params[0]));
    }
    ctx.clock.Advance(nSeconds);
    return strprintf("now=%d", ctx.clock.Now());
}

static std::string summary(CScriptContext& ctx, const CScriptRequest& request)
{
    const CUserSummary s = ctx.manager.GetUserSummary(request.params[0]);
    return strprintf("saved=%s active=%u earned=%s",
                     FormatMoney(s.nTotalSaved), s.nActiveCount, FormatMoney(s.nTotalEarned));
}

static std::string show(CScriptContext& ctx, const CScriptRequest& request)
{
    const uint64_t nDepositId = DepositIdFromParam(request.params[0]);
    const Optional<CDeposit> deposit = ctx.manager.GetDeposit(nDepositId);
    if (!deposit) {
        throw std::runtime_error(strprintf("bad-deposit-unknown (deposit %d)", nDepositId));
    }
    return deposit->ToString();
}

static std::string pool(CScriptContext& ctx, const CScriptRequest& request)
{
    const CRewardPool rewardPool = ctx.manager.GetRewardPool();
    return strprintf("total=%s distributed=%s available=%s",
                     FormatMoney(rewardPool.nTotalPool), FormatMoney(rewardPool.nDistributed),
                     FormatMoney(rewardPool.GetAvailable()));
}

static std::string plans(CScriptContext& ctx, const CScriptRequest& request)
{
    std::string strResult;
    for (const CSavingsPlan& p : ctx.manager.ListPlans()) {
        if (!strResult.empty()) strResult += "\n";
        strResult += strprintf("%ud apy=%u mult=%u min=%s max=%s penalty=%u %s",
                               p.nPlanId, p.nBaseAPY, p.nMultiplier, FormatMoney(p.nMinAmount),
                               FormatMoney(p.nMaxAmount), p.nPenaltyRate, p.fActive ? "active" : "inactive");
    }
    return strResult;
}

// ============================================================================
// Command table
// ============================================================================

static const CScriptCommand commands[] = {
    //  name            actor           argNames
    //  --------------  --------------  ----------
    { "mint",           &mint,          {"account", "amount"} },
    { "balance",        &balance,       {"account"} },
    { "plan",           &plan,          {"caller", "days", "apy", "min", "max", "[active]"} },
    { "planmult",       &planmult,      {"caller", "days", "multiplier"} },
    { "globalmult",     &globalmult,    {"caller", "multiplier"} },
    { "mode",           &mode,          {"caller", "bounded|exact|continuous"} },
    { "fund",           &fund,          {"caller", "amount"} },
    { "deposit",        &deposit,       {"owner", "amount", "days"} },
    { "withdraw",       &withdraw,      {"owner", "id"} },
    { "emergency",      &emergency,     {"owner", "id"} },
    { "interest",       &interest,      {"id"} },
    { "advance",        &advance,       {"duration"} },
    { "summary",        &summary,       {"owner"} },
    { "show",           &show,          {"id"} },
    { "deposit?",       &show,          {"id"} },
    { "pool",           &pool,          {} },
    { "plans",          &plans,         {} },
};

CVaultScript::CVaultScript(CVaultManager& manager, CMemoryTokenLedger& ledger, CManualClock& clock)
    : ctx{manager, ledger, clock}
{
    for (const CScriptCommand& command : commands) {
        mapCommands[command.name] = &command;
    }
}

static std::string Usage(const CScriptCommand& command)
{
    std::string strUsage = command.name;
    for (const std::string& arg : command.argNames) {
        strUsage += " " + (arg[0] == '[' ? arg : "<" + arg + ">");
    }
    return strUsage;
}

std::string CVaultScript::Execute(const std::string& strLine)
{
    std::string strTrimmed = strLine.substr(0, strLine.find('#'));
    boost::algorithm::trim(strTrimmed);
    if (strTrimmed.empty()) {
        return "";
    }

    const std::vector<std::string> vWords = SplitWords(strTrimmed);

    CScriptRequest request;
    request.strMethod = vWords[0];
    request.params.assign(vWords.begin() + 1, vWords.end());

    auto it = mapCommands.find(request.strMethod);
    if (it == mapCommands.end()) {
        throw std::runtime_error(strprintf("unknown command '%s'", request.strMethod));
    }

    const CScriptCommand& command = *it->second;
    size_t nRequired = 0;
    for (const std::string& arg : command.argNames) {
        if (arg[0] != '[') nRequired++;
    }
    if (request.params.size() < nRequired || request.params.size() > command.argNames.size()) {
        throw std::runtime_error("usage: " + Usage(command));
    }

    return command.actor(ctx, request);
}

bool CVaultScript::ExecuteLine(const std::string& strLine, std::string& strResult)
{
    try {
        strResult = Execute(strLine);
    } catch (const std::runtime_error& e) {
        strResult = strprintf("error: %s", e.what());
        LogPrint(BCLog::VAULT, "%s: '%s' failed: %s\n", __func__, strLine, e.what());
        return false;
    }
    return true;
}

unsigned int CVaultScript::Run(std::istream& in, std::ostream& out)
{
    unsigned int nFailures = 0;
    std::string strLine;
    while (std::getline(in, strLine)) {
        std::string strResult;
        if (!ExecuteLine(strLine, strResult)) {
            nFailures++;
        }
        if (!strResult.empty()) {
            out << strResult << "\n";
        }
    }
    return nFailures;
}

std::vector<std::string> CVaultScript::ListCommands() const
{
    std::vector<std::string> vUsage;
    for (const auto& entry : mapCommands) {
        vUsage.push_back(Usage(*entry.second));
    }
    return vUsage;
}
