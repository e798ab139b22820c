// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PIGGY_VAULT_ADMIN_H
#define PIGGY_VAULT_ADMIN_H

#include "amount.h"
#include "vault/vault_interest.h"

#include <stdint.h>
#include <string>

class CValidationState;
struct VaultConfig;

/**
 * Administrative surface
 *
 * Every mutation of VaultConfig goes through CheckAdminAction followed by
 * ApplyAdminAction. Check never mutates; Apply re-validates and is
 * all-or-nothing.
 */
enum class AdminActionType : uint8_t {
    SET_PLAN = 0,
    SET_PLAN_MULTIPLIER = 1,
    SET_GLOBAL_MULTIPLIER = 2,
    FUND_REWARD_POOL = 3,
    SET_COMPOUNDING_MODE = 4,
};

std::string AdminActionTypeToString(AdminActionType type);

struct CAdminAction
{
    AdminActionType type;

    // SET_PLAN / SET_PLAN_MULTIPLIER
    uint32_t nPlanId;
    int64_t nDuration;
    uint32_t nBaseAPY;
    CAmount nMinAmount;
    CAmount nMaxAmount;
    bool fActive;

    // SET_PLAN_MULTIPLIER / SET_GLOBAL_MULTIPLIER
    uint32_t nMultiplier;

    // FUND_REWARD_POOL
    CAmount nAmount;

    // SET_COMPOUNDING_MODE
    vault_interest::CompoundingMode mode;

    CAdminAction()
        : type(AdminActionType::SET_PLAN), nPlanId(0), nDuration(0), nBaseAPY(0),
          nMinAmount(0), nMaxAmount(0), fActive(false), nMultiplier(0), nAmount(0),
          mode(vault_interest::CompoundingMode::BOUNDED_DAILY)
    {
    }

    static CAdminAction SetPlan(uint32_t nPlanId, int64_t nDuration, uint32_t nBaseAPY,
                                CAmount nMinAmount, CAmount nMaxAmount, bool fActive);
    static CAdminAction SetPlanMultiplier(uint32_t nPlanId, uint32_t nMultiplier);
    static CAdminAction SetGlobalMultiplier(uint32_t nMultiplier);
    static CAdminAction FundRewardPool(CAmount nAmount);
    static CAdminAction SetCompoundingMode(vault_interest::CompoundingMode mode);

    std::string ToString() const;
};

/**
 * CheckAdminAction - Validate an administrative action
 *
 * Checks:
 * 1. caller == config.strAdmin                        (bad-admin-caller)
 * 2. SET_PLAN: duration matches plan id, apy ≤ 10000,
 *    0 < min ≤ max                                     (bad-plan-*)
 * 3. multipliers in [5000, 20000]                     (bad-admin-multiplier)
 * 4. SET_PLAN_MULTIPLIER: plan exists                 (bad-plan-unknown)
 * 5. FUND_REWARD_POOL: 0 < amount, pool stays ≤ MAX_MONEY (bad-admin-amount)
 */
bool CheckAdminAction(const VaultConfig& config,
                      const std::string& caller,
                      const CAdminAction& action,
                      CValidationState& state);

/**
 * ApplyAdminAction - Mutate config. Caller must have run CheckAdminAction.
 *
 * Verifies VaultConfig::CheckInvariants() afterwards.
 */
bool ApplyAdminAction(VaultConfig& config, const CAdminAction& action, CValidationState& state);

#endif // PIGGY_VAULT_ADMIN_H
