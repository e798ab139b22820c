// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "vault/vault_state.h"

#include "logging.h"
#include "util/moneystr.h"

#include <algorithm>

std::string CRewardPool::ToString() const
{
    return strprintf("CRewardPool(total=%s, distributed=%s, available=%s)",
                     FormatMoney(nTotalPool), FormatMoney(nDistributed), FormatMoney(GetAvailable()));
}

bool VaultConfig::CheckInvariants() const
{
    if (!rewardPool.CheckInvariants()) {
        LogPrintf("VAULT INVARIANT VIOLATION: %s\n", rewardPool.ToString());
        return false;
    }

    if (!vault_interest::IsValidMultiplier(nGlobalMultiplier)) {
        LogPrintf("VAULT INVARIANT VIOLATION: global multiplier %u\n", nGlobalMultiplier);
        return false;
    }

    for (const CSavingsPlan& plan : plans.ListPlans()) {
        if (!vault_interest::IsValidMultiplier(plan.nMultiplier)) {
            LogPrintf("VAULT INVARIANT VIOLATION: plan %u multiplier %u\n", plan.nPlanId, plan.nMultiplier);
            return false;
        }
    }

    return true;
}

std::string DepositStatusToString(DepositStatus status)
{
    switch (status) {
    case DepositStatus::OPEN: return "open";
    case DepositStatus::WITHDRAWN: return "withdrawn";
    case DepositStatus::EMERGENCY_WITHDRAWN: return "emergency-withdrawn";
    }
    return "unknown";
}

std::string CDeposit::ToString() const
{
    return strprintf("CDeposit(id=%d, owner=%s, amount=%s, plan=%u, created=%d, maturity=%d, status=%s, interest=%s, bonus=%s, penalty=%s, payout=%s)",
                     nId, owner, FormatMoney(nAmount), nPlanId, nCreatedAt, nMaturityAt,
                     DepositStatusToString(status), FormatMoney(nInterestAtWithdrawal),
                     FormatMoney(nBonusPaid), FormatMoney(nPenaltyPaid), FormatMoney(nPayout));
}

uint32_t CUserAggregate::GetPreferredPlan() const
{
    uint32_t nBest = 0;
    uint32_t nBestCount = 0;
    // std::map iterates in ascending plan id, strict > keeps the smaller id on ties
    for (const auto& entry : mapPlanDeposits) {
        if (entry.second > nBestCount) {
            nBest = entry.first;
            nBestCount = entry.second;
        }
    }
    return nBest;
}

void CUserAggregate::ApplyCreate(const CDeposit& deposit)
{
    nTotalDeposited += deposit.nAmount;
    nTransactionCount++;
    nLastActivity = std::max(nLastActivity, deposit.nCreatedAt);
    nActiveCount++;
    mapPlanDeposits[deposit.nPlanId]++;
}

void CUserAggregate::ApplyExit(const CDeposit& deposit)
{
    if (deposit.status == DepositStatus::WITHDRAWN) {
        nTotalEarned += deposit.nInterestAtWithdrawal + deposit.nBonusPaid;
    }
    nTotalWithdrawn += deposit.nPayout;
    nTotalPenalties += deposit.nPenaltyPaid;
    nTransactionCount++;
    nLastActivity = std::max(nLastActivity, deposit.nWithdrawnAt);
    if (nActiveCount > 0) {
        nActiveCount--;
    }
}

bool CUserAggregate::operator==(const CUserAggregate& other) const
{
    return nTotalDeposited == other.nTotalDeposited &&
           nTotalEarned == other.nTotalEarned &&
           nTotalWithdrawn == other.nTotalWithdrawn &&
           nTotalPenalties == other.nTotalPenalties &&
           nTransactionCount == other.nTransactionCount &&
           nLastActivity == other.nLastActivity &&
           nActiveCount == other.nActiveCount &&
           mapPlanDeposits == other.mapPlanDeposits;
}

std::string CUserAggregate::ToString() const
{
    return strprintf("CUserAggregate(deposited=%s, earned=%s, withdrawn=%s, penalties=%s, tx=%u, last=%d, active=%u, preferred=%u)",
                     FormatMoney(nTotalDeposited), FormatMoney(nTotalEarned), FormatMoney(nTotalWithdrawn),
                     FormatMoney(nTotalPenalties), nTransactionCount, nLastActivity, nActiveCount,
                     GetPreferredPlan());
}

std::string CPayout::ToString() const
{
    return strprintf("CPayout(principal=%s, interest=%s, bonus=%s, penalty=%s, total=%s)",
                     FormatMoney(nPrincipal), FormatMoney(nInterest), FormatMoney(nBonus),
                     FormatMoney(nPenalty), FormatMoney(nTotal));
}
