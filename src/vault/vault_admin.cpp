// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "vault/vault_admin.h"

#include "logging.h"
#include "util/moneystr.h"
#include "validationstate.h"
#include "vault/vault_state.h"

std::string AdminActionTypeToString(AdminActionType type)
{
    switch (type) {
    case AdminActionType::SET_PLAN: return "set-plan";
    case AdminActionType::SET_PLAN_MULTIPLIER: return "set-plan-multiplier";
    case AdminActionType::SET_GLOBAL_MULTIPLIER: return "set-global-multiplier";
    case AdminActionType::FUND_REWARD_POOL: return "fund-reward-pool";
    case AdminActionType::SET_COMPOUNDING_MODE: return "set-compounding-mode";
    }
    return "unknown";
}

CAdminAction CAdminAction::SetPlan(uint32_t nPlanId, int64_t nDuration, uint32_t nBaseAPY,
                                   CAmount nMinAmount, CAmount nMaxAmount, bool fActive)
{
    CAdminAction action;
    action.type = AdminActionType::SET_PLAN;
    action.nPlanId = nPlanId;
    action.nDuration = nDuration;
    action.nBaseAPY = nBaseAPY;
    action.nMinAmount = nMinAmount;
    action.nMaxAmount = nMaxAmount;
    action.fActive = fActive;
    return action;
}

CAdminAction CAdminAction::SetPlanMultiplier(uint32_t nPlanId, uint32_t nMultiplier)
{
    CAdminAction action;
    action.type = AdminActionType::SET_PLAN_MULTIPLIER;
    action.nPlanId = nPlanId;
    action.nMultiplier = nMultiplier;
    return action;
}

CAdminAction CAdminAction::SetGlobalMultiplier(uint32_t nMultiplier)
{
    CAdminAction action;
    action.type = AdminActionType::SET_GLOBAL_MULTIPLIER;
    action.nMultiplier = nMultiplier;
    return action;
}

CAdminAction CAdminAction::FundRewardPool(CAmount nAmount)
{
    CAdminAction action;
    action.type = AdminActionType::FUND_REWARD_POOL;
    action.nAmount = nAmount;
    return action;
}

CAdminAction CAdminAction::SetCompoundingMode(vault_interest::CompoundingMode mode)
{
    CAdminAction action;
    action.type = AdminActionType::SET_COMPOUNDING_MODE;
    action.mode = mode;
    return action;
}

std::string CAdminAction::ToString() const
{
    switch (type) {
    case AdminActionType::SET_PLAN:
        return strprintf("%s(plan=%u, duration=%d, apy=%u, min=%s, max=%s, active=%d)",
                         AdminActionTypeToString(type), nPlanId, nDuration, nBaseAPY,
                         FormatMoney(nMinAmount), FormatMoney(nMaxAmount), fActive ? 1 : 0);
    case AdminActionType::SET_PLAN_MULTIPLIER:
        return strprintf("%s(plan=%u, multiplier=%u)", AdminActionTypeToString(type), nPlanId, nMultiplier);
    case AdminActionType::SET_GLOBAL_MULTIPLIER:
        return strprintf("%s(multiplier=%u)", AdminActionTypeToString(type), nMultiplier);
    case AdminActionType::FUND_REWARD_POOL:
        return strprintf("%s(amount=%s)", AdminActionTypeToString(type), FormatMoney(nAmount));
    case AdminActionType::SET_COMPOUNDING_MODE:
        return strprintf("%s(mode=%s)", AdminActionTypeToString(type),
                         vault_interest::CompoundingModeToString(mode));
    }
    return "unknown";
}

static bool CheckMultiplier(uint32_t nMultiplier, CValidationState& state)
{
    if (!vault_interest::IsValidMultiplier(nMultiplier)) {
        return state.Invalid(false, VaultError::VALIDATION, "bad-admin-multiplier",
                             strprintf("multiplier %u outside [%u, %u]", nMultiplier,
                                       vault_interest::MIN_MULTIPLIER_BPS, vault_interest::MAX_MULTIPLIER_BPS));
    }
    return true;
}

bool CheckAdminAction(const VaultConfig& config,
                      const std::string& caller,
                      const CAdminAction& action,
                      CValidationState& state)
{
    // 1. Elevated caller only
    if (config.strAdmin.empty() || caller != config.strAdmin) {
        return state.Invalid(false, VaultError::VALIDATION, "bad-admin-caller",
                             strprintf("%s is not the vault admin", caller));
    }

    switch (action.type) {
    case AdminActionType::SET_PLAN:
        return CPlanCatalog::CheckPlanParams(action.nPlanId, action.nDuration, action.nBaseAPY,
                                             action.nMinAmount, action.nMaxAmount, state);

    case AdminActionType::SET_PLAN_MULTIPLIER:
        if (!config.plans.HavePlan(action.nPlanId)) {
            return state.Invalid(false, VaultError::VALIDATION, "bad-plan-unknown",
                                 strprintf("plan %u", action.nPlanId));
        }
        return CheckMultiplier(action.nMultiplier, state);

    case AdminActionType::SET_GLOBAL_MULTIPLIER:
        return CheckMultiplier(action.nMultiplier, state);

    case AdminActionType::FUND_REWARD_POOL:
        if (action.nAmount <= 0 || !MoneyRange(action.nAmount) ||
            config.rewardPool.nTotalPool > MAX_MONEY - action.nAmount) {
            return state.Invalid(false, VaultError::VALIDATION, "bad-admin-amount",
                                 strprintf("amount=%d pool=%d", action.nAmount, config.rewardPool.nTotalPool));
        }
        return true;

    case AdminActionType::SET_COMPOUNDING_MODE:
        return true;
    }

    return state.Invalid(false, VaultError::VALIDATION, "bad-admin-action", "unknown action type");
}

bool ApplyAdminAction(VaultConfig& config, const CAdminAction& action, CValidationState& state)
{
    switch (action.type) {
    case AdminActionType::SET_PLAN:
        if (!config.plans.SetPlan(action.nPlanId, action.nDuration, action.nBaseAPY,
                                  action.nMinAmount, action.nMaxAmount, action.fActive, state)) {
            return false;
        }
        break;

    case AdminActionType::SET_PLAN_MULTIPLIER:
        if (!config.plans.SetPlanMultiplier(action.nPlanId, action.nMultiplier, state)) {
            return false;
        }
        break;

    case AdminActionType::SET_GLOBAL_MULTIPLIER:
        if (!CheckMultiplier(action.nMultiplier, state)) {
            return false;
        }
        config.nGlobalMultiplier = action.nMultiplier;
        break;

    case AdminActionType::FUND_REWARD_POOL:
        if (action.nAmount <= 0 || config.rewardPool.nTotalPool > MAX_MONEY - action.nAmount) {
            return state.Invalid(false, VaultError::VALIDATION, "bad-admin-amount",
                                 strprintf("amount=%d", action.nAmount));
        }
        config.rewardPool.nTotalPool += action.nAmount;
        break;

    case AdminActionType::SET_COMPOUNDING_MODE:
        config.compoundingMode = action.mode;
        break;
    }

    if (!config.CheckInvariants()) {
        return state.Error(strprintf("%s: invariant violation after %s", __func__, action.ToString()));
    }

    LogPrint(BCLog::ADMIN, "%s: %s\n", __func__, action.ToString());
    return true;
}
