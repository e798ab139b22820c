// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PIGGY_VAULT_STATE_H
#define PIGGY_VAULT_STATE_H

#include "amount.h"
#include "vault/vault_interest.h"
#include "vault/vault_plan.h"

#include <map>
#include <stdint.h>
#include <string>

/**
 * CRewardPool - funds earmarked for maturity bonuses
 *
 * INVARIANT: 0 ≤ nDistributed ≤ nTotalPool
 *
 * A bonus the pool cannot cover is clamped to zero, never reverted.
 */
struct CRewardPool
{
    CAmount nTotalPool;
    CAmount nDistributed;

    CRewardPool()
    {
        SetNull();
    }

    void SetNull()
    {
        nTotalPool = 0;
        nDistributed = 0;
    }

    CAmount GetAvailable() const
    {
        return nTotalPool > nDistributed ? nTotalPool - nDistributed : 0;
    }

    bool CheckInvariants() const
    {
        return nTotalPool >= 0 && nDistributed >= 0 && nDistributed <= nTotalPool;
    }

    std::string ToString() const;
};

/**
 * VaultConfig - every piece of process-wide mutable state
 *
 * Passed by reference into CVaultManager and vault_admin. Mutated only
 * through ApplyAdminAction.
 */
struct VaultConfig
{
    CPlanCatalog plans;
    CRewardPool rewardPool;
    uint32_t nGlobalMultiplier;
    uint32_t nMaturityBonusRate;
    vault_interest::CompoundingMode compoundingMode;
    std::string strAdmin;

    VaultConfig()
        : nGlobalMultiplier(vault_interest::NEUTRAL_MULTIPLIER_BPS),
          nMaturityBonusRate(vault_interest::DEFAULT_MATURITY_BONUS_BPS),
          compoundingMode(vault_interest::CompoundingMode::BOUNDED_DAILY)
    {
    }

    /**
     * CheckInvariants
     *
     * 1. reward pool: distributed ≤ totalPool, both ≥ 0
     * 2. global multiplier in [5000, 20000]
     * 3. every plan multiplier in [5000, 20000]
     */
    bool CheckInvariants() const;
};

enum class DepositStatus : uint8_t {
    OPEN = 0,
    WITHDRAWN = 1,
    EMERGENCY_WITHDRAWN = 2,
};

std::string DepositStatusToString(DepositStatus status);

/**
 * CDeposit - append-only deposit record
 *
 * INVARIANTS:
 * - nMaturityAt > nCreatedAt
 * - status leaves OPEN exactly once and never returns
 *
 * Plan terms the exit paths need are snapshotted at creation, so admin
 * changes never touch existing deposits.
 */
struct CDeposit
{
    uint64_t nId;
    std::string owner;
    CAmount nAmount;
    uint32_t nPlanId;
    int64_t nCreatedAt;
    int64_t nMaturityAt;
    DepositStatus status;
    uint64_t nPositionId;

    // Snapshot of plan terms
    uint32_t nPenaltyRate;
    int64_t nMinimumHold;

    // Filled at exit
    CAmount nInterestAtWithdrawal;
    CAmount nBonusPaid;
    CAmount nPenaltyPaid;
    CAmount nPayout;
    int64_t nWithdrawnAt;

    CDeposit()
    {
        SetNull();
    }

    void SetNull()
    {
        nId = 0;
        owner.clear();
        nAmount = 0;
        nPlanId = 0;
        nCreatedAt = 0;
        nMaturityAt = 0;
        status = DepositStatus::OPEN;
        nPositionId = 0;
        nPenaltyRate = 0;
        nMinimumHold = 0;
        nInterestAtWithdrawal = 0;
        nBonusPaid = 0;
        nPenaltyPaid = 0;
        nPayout = 0;
        nWithdrawnAt = 0;
    }

    bool IsNull() const { return nId == 0; }
    bool IsWithdrawn() const { return status != DepositStatus::OPEN; }
    bool IsMatured(int64_t nNow) const { return nNow >= nMaturityAt; }

    std::string ToString() const;
};

/**
 * CUserAggregate - per-owner counters derived from the deposit log
 *
 * Never authoritative: RebuildUserAggregate must reproduce it exactly.
 */
struct CUserAggregate
{
    CAmount nTotalDeposited;
    CAmount nTotalEarned;        // interest + bonus paid
    CAmount nTotalWithdrawn;     // sum of payouts
    CAmount nTotalPenalties;
    uint32_t nTransactionCount;  // one per create, one per exit
    int64_t nLastActivity;
    uint32_t nActiveCount;
    std::map<uint32_t, uint32_t> mapPlanDeposits;

    CUserAggregate()
    {
        SetNull();
    }

    void SetNull()
    {
        nTotalDeposited = 0;
        nTotalEarned = 0;
        nTotalWithdrawn = 0;
        nTotalPenalties = 0;
        nTransactionCount = 0;
        nLastActivity = 0;
        nActiveCount = 0;
        mapPlanDeposits.clear();
    }

    /** Plan with the most deposits, ties to the smaller id; 0 if none */
    uint32_t GetPreferredPlan() const;

    void ApplyCreate(const CDeposit& deposit);
    void ApplyExit(const CDeposit& deposit);

    bool operator==(const CUserAggregate& other) const;
    bool operator!=(const CUserAggregate& other) const { return !(*this == other); }

    std::string ToString() const;
};

/** Payout breakdown returned by the exit paths */
struct CPayout
{
    CAmount nPrincipal{0};
    CAmount nInterest{0};
    CAmount nBonus{0};
    CAmount nPenalty{0};
    CAmount nTotal{0};

    std::string ToString() const;
};

/** GetUserSummary result */
struct CUserSummary
{
    CAmount nTotalSaved{0};      // principal still locked in open deposits
    uint32_t nActiveCount{0};
    CAmount nTotalEarned{0};
};

#endif // PIGGY_VAULT_STATE_H
