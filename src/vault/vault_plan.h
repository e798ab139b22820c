// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PIGGY_VAULT_PLAN_H
#define PIGGY_VAULT_PLAN_H

#include "amount.h"
#include "optional.h"

#include <map>
#include <stdint.h>
#include <string>
#include <vector>

class CValidationState;

/**
 * Early withdrawal penalty tier, selected by plan duration.
 *
 * ≤30d → 2%, ≤90d → 3%, ≤180d → 4%, longer → 5%
 */
struct CPenaltyTier
{
    uint32_t nMaxDurationDays;
    uint32_t nPenaltyRate;      // basis points
};

uint32_t GetPenaltyRateForDuration(uint32_t nDurationDays);

/** Minimum hold before the penalty starts decaying: half the lock period */
int64_t GetMinimumHoldForDuration(int64_t nDuration);

/**
 * CSavingsPlan - one row of the plan catalog
 *
 * Identified by its duration in days. Plans are never deleted, only
 * deactivated. Existing deposits keep the terms they were opened with.
 */
struct CSavingsPlan
{
    uint32_t nPlanId;          // duration in days
    int64_t nDuration;         // seconds, == nPlanId days
    uint32_t nBaseAPY;         // basis points, 0..10000
    CAmount nMinAmount;
    CAmount nMaxAmount;
    bool fActive;
    uint32_t nMultiplier;      // basis points, [5000, 20000]
    uint32_t nPenaltyRate;     // basis points, from the tier table
    int64_t nMinimumHold;      // seconds

    CSavingsPlan()
    {
        SetNull();
    }

    void SetNull()
    {
        nPlanId = 0;
        nDuration = 0;
        nBaseAPY = 0;
        nMinAmount = 0;
        nMaxAmount = 0;
        fActive = false;
        nMultiplier = 0;
        nPenaltyRate = 0;
        nMinimumHold = 0;
    }

    bool IsNull() const { return nPlanId == 0; }

    std::string ToString() const;
};

/**
 * CPlanCatalog - admin-mutable table of savings plans
 *
 * Mutated only through vault_admin (SET_PLAN, SET_PLAN_MULTIPLIER).
 */
class CPlanCatalog
{
private:
    std::map<uint32_t, CSavingsPlan> mapPlans;

public:
    /**
     * CheckPlanParams - Range validation for SET_PLAN
     *
     * 1. planId > 0 and duration == planId days
     * 2. baseAPY ≤ MAX_BASE_APY
     * 3. 0 < minAmount ≤ maxAmount ≤ MAX_MONEY
     */
    static bool CheckPlanParams(uint32_t nPlanId,
                                int64_t nDuration,
                                uint32_t nBaseAPY,
                                CAmount nMinAmount,
                                CAmount nMaxAmount,
                                CValidationState& state);

    /**
     * SetPlan - Create or update a plan
     *
     * Keeps the plan multiplier of an existing plan. Penalty rate and
     * minimum hold are re-derived from the duration.
     */
    bool SetPlan(uint32_t nPlanId,
                 int64_t nDuration,
                 uint32_t nBaseAPY,
                 CAmount nMinAmount,
                 CAmount nMaxAmount,
                 bool fActive,
                 CValidationState& state);

    bool SetPlanMultiplier(uint32_t nPlanId, uint32_t nMultiplier, CValidationState& state);

    /**
     * CheckDepositAmount - Plan must exist, be active, and bound the amount
     */
    bool CheckDepositAmount(uint32_t nPlanId, CAmount nAmount, CValidationState& state) const;

    Optional<CSavingsPlan> GetPlan(uint32_t nPlanId) const;
    bool HavePlan(uint32_t nPlanId) const;
    std::vector<CSavingsPlan> ListPlans() const;
    size_t Size() const { return mapPlans.size(); }
};

#endif // PIGGY_VAULT_PLAN_H
