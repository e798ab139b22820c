// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "vault/vault_manager.h"

#include "logging.h"
#include "util/moneystr.h"
#include "util/system.h"
#include "validationstate.h"
#include "vault/vault_interest.h"
#include "vault/vault_milestones.h"

#include <exception>

CVaultManager::CVaultManager(VaultConfig& configIn,
                             CTokenLedger& tokenLedgerIn,
                             CRewardNotifier& rewardNotifierIn,
                             const CClock& clockIn)
    : config(configIn),
      tokenLedger(tokenLedgerIn),
      rewardNotifier(rewardNotifierIn),
      clock(clockIn)
{
}

// ============================================================================
// Collaborators
// ============================================================================

bool CVaultManager::SafeTransferIn(const std::string& from, CAmount nAmount, std::string& strError)
{
    AssertLockHeld(cs_vault);
    try {
        return tokenLedger.TransferIn(from, nAmount, strError);
    } catch (const std::exception& e) {
        strError = strprintf("exception: %s", e.what());
        return false;
    }
}

bool CVaultManager::SafeTransferOut(const std::string& to, CAmount nAmount, std::string& strError)
{
    AssertLockHeld(cs_vault);
    bool fOk = false;
    fPayoutPending = true;
    try {
        fOk = tokenLedger.TransferOut(to, nAmount, strError);
    } catch (const std::exception& e) {
        strError = strprintf("exception: %s", e.what());
    }
    fPayoutPending = false;
    return fOk;
}

bool CVaultManager::CheckNoPayoutPending(CValidationState& state) const
{
    AssertLockHeld(cs_vault);
    if (fPayoutPending) {
        return state.Invalid(false, VaultError::STATE_CONFLICT, "payout-in-progress",
                             "called back from inside a payout transfer");
    }
    return true;
}

std::vector<std::string> CVaultManager::ClaimMilestones(const std::string& user, const std::vector<std::string>& vCategories)
{
    AssertLockHeld(cs_vault);

    std::vector<std::string> vClaimed;
    for (const std::string& category : vCategories) {
        if (setNotified.insert(std::make_pair(user, category)).second) {
            vClaimed.push_back(category);
        }
    }
    return vClaimed;
}

void CVaultManager::DeliverMilestones(const std::string& user, const std::vector<std::string>& vCategories)
{
    for (const std::string& category : vCategories) {
        try {
            rewardNotifier.Notify(user, category);
        } catch (const std::exception& e) {
            LogPrintf("%s: reward notifier failed for %s/%s: %s\n", __func__, user, category, e.what());
            LOCK(cs_vault);
            setNotified.erase(std::make_pair(user, category));
            continue;
        }

        LogPrint(BCLog::REWARD, "%s: %s earned %s\n", __func__, user, category);
        signals.NotifyMilestone(user, category);
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

bool CVaultManager::CreateDeposit(const std::string& owner,
                                  CAmount nAmount,
                                  uint32_t nPlanId,
                                  CValidationState& state,
                                  uint64_t* pDepositId)
{
    CDeposit deposit;
    std::vector<std::string> vMilestones;
    {
        LOCK(cs_vault);

        if (owner.empty()) {
            return state.Invalid(false, VaultError::VALIDATION, "bad-deposit-owner", "empty owner");
        }
        if (tokenLedger.IsReservedAccount(owner)) {
            return state.Invalid(false, VaultError::VALIDATION, "bad-deposit-owner",
                                 strprintf("%s is reserved by the token ledger", owner));
        }
        if (!CheckNoPayoutPending(state)) {
            return false;
        }

        // 1. Plan and amount
        if (!config.plans.CheckDepositAmount(nPlanId, nAmount, state)) {
            return false;
        }
        const CSavingsPlan plan = *config.plans.GetPlan(nPlanId);
        if (!CYieldPositionLedger::CheckOpen(nAmount, plan.nDuration, state)) {
            return false;
        }
        const uint32_t nAPY = vault_interest::EffectiveAPY(plan.nBaseAPY, plan.nMultiplier, config.nGlobalMultiplier);

        // 2. Pull funds before touching any state
        std::string strError;
        if (!SafeTransferIn(owner, nAmount, strError)) {
            LogPrintf("%s: TransferIn(%s, %s) failed: %s\n", __func__, owner, FormatMoney(nAmount), strError);
            return state.Invalid(false, VaultError::COLLABORATOR_FAILURE, "transfer-failed", strError);
        }

        // 3. Position
        const int64_t nNow = clock.Now();
        uint64_t nPositionId = 0;
        if (!positions.Open(nAmount, plan.nDuration, nAPY, nNow, state, nPositionId)) {
            std::string strRefundError;
            if (!SafeTransferOut(owner, nAmount, strRefundError)) {
                LogPrintf("ERROR: %s: refund of %s to %s failed: %s\n", __func__, FormatMoney(nAmount), owner, strRefundError);
            }
            return false;
        }

        // 4. Deposit record, owner index, aggregate
        deposit.nId = nNextDepositId++;
        deposit.owner = owner;
        deposit.nAmount = nAmount;
        deposit.nPlanId = nPlanId;
        deposit.nCreatedAt = nNow;
        deposit.nMaturityAt = nNow + plan.nDuration;
        deposit.status = DepositStatus::OPEN;
        deposit.nPositionId = nPositionId;
        deposit.nPenaltyRate = plan.nPenaltyRate;
        deposit.nMinimumHold = plan.nMinimumHold;

        mapDeposits[deposit.nId] = deposit;
        mapOwnerDeposits[owner].push_back(deposit.nId);
        mapAggregates[owner].ApplyCreate(deposit);

        if (pDepositId) {
            *pDepositId = deposit.nId;
        }

        LogPrint(BCLog::VAULT, "%s: %s apy=%u\n", __func__, deposit.ToString(), nAPY);

        // 5. Milestones, delivered once the lock is gone
        const bool fFirstDeposit = !setNotified.count(std::make_pair(owner, std::string(vault_milestones::CATEGORY_FIRST_DEPOSIT)));
        vMilestones = ClaimMilestones(owner, vault_milestones::GetDepositMilestones(fFirstDeposit, nPlanId, nAmount));
    }

    signals.NotifyDepositCreated(deposit);
    DeliverMilestones(owner, vMilestones);

    return true;
}

CDeposit* CVaultManager::CheckExit(const std::string& caller, uint64_t nDepositId, CValidationState& state)
{
    AssertLockHeld(cs_vault);

    auto it = mapDeposits.find(nDepositId);
    if (it == mapDeposits.end()) {
        state.Invalid(false, VaultError::VALIDATION, "bad-deposit-unknown", strprintf("deposit %d", nDepositId));
        return nullptr;
    }

    CDeposit& deposit = it->second;
    if (deposit.owner != caller) {
        state.Invalid(false, VaultError::VALIDATION, "not-owner",
                      strprintf("deposit %d belongs to %s", nDepositId, deposit.owner));
        return nullptr;
    }

    if (deposit.IsWithdrawn()) {
        state.Invalid(false, VaultError::STATE_CONFLICT, "already-withdrawn",
                      strprintf("deposit %d is %s", nDepositId, DepositStatusToString(deposit.status)));
        return nullptr;
    }

    if (!CheckNoPayoutPending(state)) {
        return nullptr;
    }

    return &deposit;
}

bool CVaultManager::Withdraw(const std::string& caller,
                             uint64_t nDepositId,
                             CValidationState& state,
                             CPayout* pPayout)
{
    CDeposit depositDone;
    CPayout payout;
    bool fBonusClamped = false;
    CAmount nRequestedBonus = 0;
    CAmount nAvailable = 0;
    std::vector<std::string> vMilestones;
    {
        LOCK(cs_vault);

        CDeposit* pdeposit = CheckExit(caller, nDepositId, state);
        if (!pdeposit) {
            return false;
        }
        CDeposit& deposit = *pdeposit;

        const int64_t nNow = clock.Now();
        if (!deposit.IsMatured(nNow)) {
            return state.Invalid(false, VaultError::STATE_CONFLICT, "not-matured",
                                 strprintf("deposit %d matures at %d, now %d", nDepositId, deposit.nMaturityAt, nNow));
        }

        // Snapshots for rollback. Nothing else can mutate while the payout is
        // pending, so restoring them undoes this exit and nothing more.
        const CDeposit depositBefore = deposit;
        const Optional<CYieldPosition> positionBefore = positions.GetPosition(deposit.nPositionId);
        const CUserAggregate aggregateBefore = mapAggregates[caller];
        if (!positionBefore) {
            return state.Error(strprintf("%s: deposit %d has no position", __func__, nDepositId));
        }

        // 1. Finalize: accrue to min(now, maturity) and freeze
        CAmount nPrincipal = 0;
        CAmount nInterest = 0;
        if (!positions.Finalize(deposit.nPositionId, nNow, config.compoundingMode, state, nPrincipal, nInterest)) {
            return false;
        }

        // 2. Bonus, clamped to zero if the pool cannot cover it
        CAmount nBonus = vault_interest::MaturityBonus(nPrincipal, nInterest, config.nMaturityBonusRate);
        nAvailable = config.rewardPool.GetAvailable();
        nRequestedBonus = nBonus;
        if (nBonus > nAvailable) {
            LogPrint(BCLog::REWARD, "%s: deposit %d bonus %s exceeds pool available %s, clamped to zero\n",
                     __func__, nDepositId, FormatMoney(nBonus), FormatMoney(nAvailable));
            fBonusClamped = true;
            nBonus = 0;
        }

        if (!positions.ApplyBonus(deposit.nPositionId, nBonus, state)) {
            positions.Restore(*positionBefore);
            return false;
        }
        config.rewardPool.nDistributed += nBonus;

        // 3. Mark withdrawn before paying
        payout.nPrincipal = nPrincipal;
        payout.nInterest = nInterest;
        payout.nBonus = nBonus;
        payout.nTotal = nPrincipal + nInterest + nBonus;

        deposit.status = DepositStatus::WITHDRAWN;
        deposit.nInterestAtWithdrawal = nInterest;
        deposit.nBonusPaid = nBonus;
        deposit.nPayout = payout.nTotal;
        deposit.nWithdrawnAt = nNow;
        mapAggregates[caller].ApplyExit(deposit);

        auto rollback = [&]() {
            deposit = depositBefore;
            positions.Restore(*positionBefore);
            mapAggregates[caller] = aggregateBefore;
            config.rewardPool.nDistributed -= nBonus;
        };

        if (!config.rewardPool.CheckInvariants()) {
            rollback();
            return state.Error(strprintf("%s: reward pool invariant violated", __func__));
        }

        // 4. Pay
        std::string strError;
        if (!SafeTransferOut(caller, payout.nTotal, strError)) {
            rollback();
            LogPrintf("%s: TransferOut(%s, %s) for deposit %d failed, rolled back: %s\n",
                      __func__, caller, FormatMoney(payout.nTotal), nDepositId, strError);
            return state.Invalid(false, VaultError::COLLABORATOR_FAILURE, "transfer-failed", strError);
        }

        LogPrint(BCLog::VAULT, "%s: deposit %d %s\n", __func__, nDepositId, payout.ToString());
        depositDone = deposit;
        vMilestones = ClaimMilestones(caller, vault_milestones::GetMaturityMilestones(deposit.nPlanId));
    }

    if (pPayout) {
        *pPayout = payout;
    }

    if (fBonusClamped) {
        signals.NotifyBonusClamped(nDepositId, nRequestedBonus, nAvailable);
    }
    signals.NotifyDepositWithdrawn(depositDone, payout);
    DeliverMilestones(caller, vMilestones);

    return true;
}

bool CVaultManager::EmergencyWithdraw(const std::string& caller,
                                      uint64_t nDepositId,
                                      CValidationState& state,
                                      CPayout* pPayout)
{
    CDeposit depositDone;
    CPayout payout;
    {
        LOCK(cs_vault);

        CDeposit* pdeposit = CheckExit(caller, nDepositId, state);
        if (!pdeposit) {
            return false;
        }
        CDeposit& deposit = *pdeposit;

        const int64_t nNow = clock.Now();

        const CDeposit depositBefore = deposit;
        const Optional<CYieldPosition> positionBefore = positions.GetPosition(deposit.nPositionId);
        const CUserAggregate aggregateBefore = mapAggregates[caller];
        if (!positionBefore) {
            return state.Error(strprintf("%s: deposit %d has no position", __func__, nDepositId));
        }

        // 1. Finalize: interest is frozen for the audit trail, not paid
        CAmount nPrincipal = 0;
        CAmount nInterest = 0;
        if (!positions.Finalize(deposit.nPositionId, nNow, config.compoundingMode, state, nPrincipal, nInterest)) {
            return false;
        }

        // 2. Penalty from the tier snapshotted at creation
        const CAmount nPenalty = vault_interest::EarlyWithdrawalPenalty(nPrincipal, deposit.nPenaltyRate,
                                                                        nNow - deposit.nCreatedAt, deposit.nMinimumHold);

        payout.nPrincipal = nPrincipal;
        payout.nPenalty = nPenalty;
        payout.nTotal = nPrincipal > nPenalty ? nPrincipal - nPenalty : 0;

        // 3. Mark withdrawn before paying
        deposit.status = DepositStatus::EMERGENCY_WITHDRAWN;
        deposit.nInterestAtWithdrawal = nInterest;
        deposit.nPenaltyPaid = nPenalty;
        deposit.nPayout = payout.nTotal;
        deposit.nWithdrawnAt = nNow;
        mapAggregates[caller].ApplyExit(deposit);

        // 4. Pay
        if (payout.nTotal > 0) {
            std::string strError;
            if (!SafeTransferOut(caller, payout.nTotal, strError)) {
                deposit = depositBefore;
                positions.Restore(*positionBefore);
                mapAggregates[caller] = aggregateBefore;
                LogPrintf("%s: TransferOut(%s, %s) for deposit %d failed, rolled back: %s\n",
                          __func__, caller, FormatMoney(payout.nTotal), nDepositId, strError);
                return state.Invalid(false, VaultError::COLLABORATOR_FAILURE, "transfer-failed", strError);
            }
        }

        LogPrint(BCLog::VAULT, "%s: deposit %d %s forfeited interest=%s\n",
                 __func__, nDepositId, payout.ToString(), FormatMoney(nInterest));
        depositDone = deposit;
    }

    if (pPayout) {
        *pPayout = payout;
    }

    signals.NotifyEmergencyWithdrawn(depositDone, payout);

    return true;
}

CAmount CVaultManager::CalculateCurrentInterest(uint64_t nDepositId, int64_t nNow) const
{
    LOCK(cs_vault);

    auto it = mapDeposits.find(nDepositId);
    if (it == mapDeposits.end()) {
        return 0;
    }
    return positions.ProjectInterest(it->second.nPositionId, nNow, config.compoundingMode);
}

CAmount CVaultManager::CalculateCurrentInterest(uint64_t nDepositId) const
{
    return CalculateCurrentInterest(nDepositId, clock.Now());
}

// ============================================================================
// Administration
// ============================================================================

bool CVaultManager::ExecuteAdminAction(const std::string& caller, const CAdminAction& action, CValidationState& state)
{
    LOCK(cs_vault);

    if (tokenLedger.IsReservedAccount(caller)) {
        return state.Invalid(false, VaultError::VALIDATION, "bad-admin-caller",
                             strprintf("%s is reserved by the token ledger", caller));
    }
    if (!CheckNoPayoutPending(state)) {
        return false;
    }

    if (!CheckAdminAction(config, caller, action, state)) {
        LogPrint(BCLog::ADMIN, "%s: rejected %s from %s: %s\n", __func__, action.ToString(), caller, state.ToString());
        return false;
    }

    if (action.type != AdminActionType::FUND_REWARD_POOL) {
        return ApplyAdminAction(config, action, state);
    }

    // Funding moves real tokens: pull first, refund if the pool cannot take them
    std::string strError;
    if (!SafeTransferIn(caller, action.nAmount, strError)) {
        LogPrintf("%s: TransferIn(%s, %s) for reward pool failed: %s\n",
                  __func__, caller, FormatMoney(action.nAmount), strError);
        return state.Invalid(false, VaultError::COLLABORATOR_FAILURE, "transfer-failed", strError);
    }

    const CRewardPool poolBefore = config.rewardPool;
    if (!ApplyAdminAction(config, action, state)) {
        config.rewardPool = poolBefore;
        std::string strRefundError;
        if (!SafeTransferOut(caller, action.nAmount, strRefundError)) {
            LogPrintf("ERROR: %s: refund of %s to %s failed: %s\n",
                      __func__, FormatMoney(action.nAmount), caller, strRefundError);
        }
        return false;
    }

    return true;
}

bool CVaultManager::SetPlan(const std::string& caller, uint32_t nPlanId, int64_t nDuration, uint32_t nBaseAPY,
                            CAmount nMinAmount, CAmount nMaxAmount, bool fActive, CValidationState& state)
{
    return ExecuteAdminAction(caller, CAdminAction::SetPlan(nPlanId, nDuration, nBaseAPY, nMinAmount, nMaxAmount, fActive), state);
}

bool CVaultManager::SetPlanMultiplier(const std::string& caller, uint32_t nPlanId, uint32_t nMultiplier, CValidationState& state)
{
    return ExecuteAdminAction(caller, CAdminAction::SetPlanMultiplier(nPlanId, nMultiplier), state);
}

bool CVaultManager::SetGlobalMultiplier(const std::string& caller, uint32_t nMultiplier, CValidationState& state)
{
    return ExecuteAdminAction(caller, CAdminAction::SetGlobalMultiplier(nMultiplier), state);
}

bool CVaultManager::SetCompoundingMode(const std::string& caller, vault_interest::CompoundingMode mode, CValidationState& state)
{
    return ExecuteAdminAction(caller, CAdminAction::SetCompoundingMode(mode), state);
}

bool CVaultManager::FundRewardPool(const std::string& caller, CAmount nAmount, CValidationState& state)
{
    return ExecuteAdminAction(caller, CAdminAction::FundRewardPool(nAmount), state);
}

// ============================================================================
// Queries
// ============================================================================

Optional<CDeposit> CVaultManager::GetDeposit(uint64_t nDepositId) const
{
    LOCK(cs_vault);
    auto it = mapDeposits.find(nDepositId);
    if (it == mapDeposits.end()) {
        return nullopt;
    }
    return it->second;
}

std::vector<uint64_t> CVaultManager::ListDepositIds(const std::string& owner) const
{
    LOCK(cs_vault);
    auto it = mapOwnerDeposits.find(owner);
    if (it == mapOwnerDeposits.end()) {
        return std::vector<uint64_t>();
    }
    return it->second;
}

CUserSummary CVaultManager::GetUserSummary(const std::string& owner) const
{
    LOCK(cs_vault);

    CUserSummary summary;
    auto it = mapOwnerDeposits.find(owner);
    if (it != mapOwnerDeposits.end()) {
        for (uint64_t nId : it->second) {
            const CDeposit& deposit = mapDeposits.at(nId);
            if (!deposit.IsWithdrawn()) {
                summary.nTotalSaved += deposit.nAmount;
                summary.nActiveCount++;
            }
        }
    }

    auto itAgg = mapAggregates.find(owner);
    if (itAgg != mapAggregates.end()) {
        summary.nTotalEarned = itAgg->second.nTotalEarned;
    }
    return summary;
}

Optional<CSavingsPlan> CVaultManager::GetPlan(uint32_t nPlanId) const
{
    LOCK(cs_vault);
    return config.plans.GetPlan(nPlanId);
}

std::vector<CSavingsPlan> CVaultManager::ListPlans() const
{
    LOCK(cs_vault);
    return config.plans.ListPlans();
}

CUserAggregate CVaultManager::GetUserAggregate(const std::string& owner) const
{
    LOCK(cs_vault);
    auto it = mapAggregates.find(owner);
    if (it == mapAggregates.end()) {
        return CUserAggregate();
    }
    return it->second;
}

CUserAggregate CVaultManager::RebuildUserAggregate(const std::string& owner) const
{
    LOCK(cs_vault);

    CUserAggregate aggregate;
    auto it = mapOwnerDeposits.find(owner);
    if (it == mapOwnerDeposits.end()) {
        return aggregate;
    }

    for (uint64_t nId : it->second) {
        const CDeposit& deposit = mapDeposits.at(nId);
        aggregate.ApplyCreate(deposit);
        if (deposit.IsWithdrawn()) {
            aggregate.ApplyExit(deposit);
        }
    }
    return aggregate;
}

CRewardPool CVaultManager::GetRewardPool() const
{
    LOCK(cs_vault);
    return config.rewardPool;
}

size_t CVaultManager::GetDepositCount() const
{
    LOCK(cs_vault);
    return mapDeposits.size();
}

Optional<CYieldPosition> CVaultManager::GetPosition(uint64_t nDepositId) const
{
    LOCK(cs_vault);
    auto it = mapDeposits.find(nDepositId);
    if (it == mapDeposits.end()) {
        return nullopt;
    }
    return positions.GetPosition(it->second.nPositionId);
}

vault_interest::CompoundingMode CVaultManager::GetCompoundingMode() const
{
    LOCK(cs_vault);
    return config.compoundingMode;
}

uint32_t CVaultManager::GetGlobalMultiplier() const
{
    LOCK(cs_vault);
    return config.nGlobalMultiplier;
}

bool CVaultManager::CheckInvariants() const
{
    LOCK(cs_vault);

    if (!config.CheckInvariants()) {
        return false;
    }

    for (const auto& entry : mapDeposits) {
        const CDeposit& deposit = entry.second;
        if (deposit.nMaturityAt <= deposit.nCreatedAt) {
            return error("%s: deposit %d maturity %d <= created %d", __func__,
                         deposit.nId, deposit.nMaturityAt, deposit.nCreatedAt);
        }

        const Optional<CYieldPosition> position = positions.GetPosition(deposit.nPositionId);
        if (!position || !position->CheckInvariants()) {
            return error("%s: deposit %d position %d invalid", __func__, deposit.nId, deposit.nPositionId);
        }
        if (position->fActive == deposit.IsWithdrawn()) {
            return error("%s: deposit %d status %s but position active=%d", __func__, deposit.nId,
                         DepositStatusToString(deposit.status), position->fActive ? 1 : 0);
        }
    }

    return true;
}
