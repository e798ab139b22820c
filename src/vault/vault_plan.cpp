// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "vault/vault_plan.h"

#include "logging.h"
#include "util/moneystr.h"
#include "util/time.h"
#include "validationstate.h"
#include "vault/vault_interest.h"

#include <limits>

static const CPenaltyTier PENALTY_TIERS[] = {
    {30, 200},
    {90, 300},
    {180, 400},
    {std::numeric_limits<uint32_t>::max(), 500},
};

uint32_t GetPenaltyRateForDuration(uint32_t nDurationDays)
{
    for (const CPenaltyTier& tier : PENALTY_TIERS) {
        if (nDurationDays <= tier.nMaxDurationDays) {
            return tier.nPenaltyRate;
        }
    }
    return PENALTY_TIERS[3].nPenaltyRate;
}

int64_t GetMinimumHoldForDuration(int64_t nDuration)
{
    return nDuration > 0 ? nDuration / 2 : 0;
}

std::string CSavingsPlan::ToString() const
{
    return strprintf("CSavingsPlan(id=%u, duration=%ds, apy=%u, min=%s, max=%s, active=%d, mult=%u, penalty=%u, hold=%ds)",
                     nPlanId, nDuration, nBaseAPY, FormatMoney(nMinAmount), FormatMoney(nMaxAmount),
                     fActive ? 1 : 0, nMultiplier, nPenaltyRate, nMinimumHold);
}

bool CPlanCatalog::CheckPlanParams(uint32_t nPlanId,
                                   int64_t nDuration,
                                   uint32_t nBaseAPY,
                                   CAmount nMinAmount,
                                   CAmount nMaxAmount,
                                   CValidationState& state)
{
    // 1. Plan id is the duration in days
    if (nPlanId == 0) {
        return state.Invalid(false, VaultError::VALIDATION, "bad-plan-id", "plan id must be > 0");
    }
    if (nDuration <= 0 || nDuration != static_cast<int64_t>(nPlanId) * SECONDS_PER_DAY) {
        return state.Invalid(false, VaultError::VALIDATION, "bad-plan-duration",
                             strprintf("duration %d does not match %u days", nDuration, nPlanId));
    }

    // 2. Base APY bounded
    if (nBaseAPY > vault_interest::MAX_BASE_APY) {
        return state.Invalid(false, VaultError::VALIDATION, "bad-plan-apy",
                             strprintf("apy %u > %u", nBaseAPY, vault_interest::MAX_BASE_APY));
    }

    // 3. Amount bounds
    if (nMinAmount <= 0 || nMinAmount > nMaxAmount || !MoneyRange(nMaxAmount)) {
        return state.Invalid(false, VaultError::VALIDATION, "bad-plan-amount-bounds",
                             strprintf("min=%d max=%d", nMinAmount, nMaxAmount));
    }

    return true;
}

bool CPlanCatalog::SetPlan(uint32_t nPlanId,
                           int64_t nDuration,
                           uint32_t nBaseAPY,
                           CAmount nMinAmount,
                           CAmount nMaxAmount,
                           bool fActive,
                           CValidationState& state)
{
    if (!CheckPlanParams(nPlanId, nDuration, nBaseAPY, nMinAmount, nMaxAmount, state)) {
        return false;
    }

    CSavingsPlan& plan = mapPlans[nPlanId];
    const bool fNew = plan.IsNull();

    plan.nPlanId = nPlanId;
    plan.nDuration = nDuration;
    plan.nBaseAPY = nBaseAPY;
    plan.nMinAmount = nMinAmount;
    plan.nMaxAmount = nMaxAmount;
    plan.fActive = fActive;
    if (fNew) {
        plan.nMultiplier = vault_interest::NEUTRAL_MULTIPLIER_BPS;
    }
    plan.nPenaltyRate = GetPenaltyRateForDuration(nPlanId);
    plan.nMinimumHold = GetMinimumHoldForDuration(nDuration);

    LogPrint(BCLog::ADMIN, "%s: %s %s\n", __func__, fNew ? "added" : "updated", plan.ToString());
    return true;
}

bool CPlanCatalog::SetPlanMultiplier(uint32_t nPlanId, uint32_t nMultiplier, CValidationState& state)
{
    auto it = mapPlans.find(nPlanId);
    if (it == mapPlans.end()) {
        return state.Invalid(false, VaultError::VALIDATION, "bad-plan-unknown",
                             strprintf("plan %u", nPlanId));
    }
    if (!vault_interest::IsValidMultiplier(nMultiplier)) {
        return state.Invalid(false, VaultError::VALIDATION, "bad-admin-multiplier",
                             strprintf("multiplier %u outside [%u, %u]", nMultiplier,
                                       vault_interest::MIN_MULTIPLIER_BPS, vault_interest::MAX_MULTIPLIER_BPS));
    }

    it->second.nMultiplier = nMultiplier;
    LogPrint(BCLog::ADMIN, "%s: plan %u multiplier=%u\n", __func__, nPlanId, nMultiplier);
    return true;
}

bool CPlanCatalog::CheckDepositAmount(uint32_t nPlanId, CAmount nAmount, CValidationState& state) const
{
    auto it = mapPlans.find(nPlanId);
    if (it == mapPlans.end()) {
        return state.Invalid(false, VaultError::VALIDATION, "bad-deposit-plan-unknown",
                             strprintf("plan %u", nPlanId));
    }

    const CSavingsPlan& plan = it->second;
    if (!plan.fActive) {
        return state.Invalid(false, VaultError::VALIDATION, "bad-deposit-plan-inactive",
                             strprintf("plan %u", nPlanId));
    }

    if (nAmount < plan.nMinAmount || nAmount > plan.nMaxAmount) {
        return state.Invalid(false, VaultError::VALIDATION, "bad-deposit-amount-range",
                             strprintf("amount %s outside [%s, %s]", FormatMoney(nAmount),
                                       FormatMoney(plan.nMinAmount), FormatMoney(plan.nMaxAmount)));
    }

    return true;
}

Optional<CSavingsPlan> CPlanCatalog::GetPlan(uint32_t nPlanId) const
{
    auto it = mapPlans.find(nPlanId);
    if (it == mapPlans.end()) {
        return nullopt;
    }
    return it->second;
}

bool CPlanCatalog::HavePlan(uint32_t nPlanId) const
{
    return mapPlans.count(nPlanId) > 0;
}

std::vector<CSavingsPlan> CPlanCatalog::ListPlans() const
{
    std::vector<CSavingsPlan> vPlans;
    vPlans.reserve(mapPlans.size());
    for (const auto& entry : mapPlans) {
        vPlans.push_back(entry.second);
    }
    return vPlans;
}
