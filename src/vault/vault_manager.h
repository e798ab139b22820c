// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PIGGY_VAULT_MANAGER_H
#define PIGGY_VAULT_MANAGER_H

#include "amount.h"
#include "optional.h"
#include "sync.h"
#include "vault/vault_admin.h"
#include "vault/vault_interfaces.h"
#include "vault/vault_position.h"
#include "vault/vault_signals.h"
#include "vault/vault_state.h"

#include <map>
#include <set>
#include <stdint.h>
#include <string>
#include <utility>
#include <vector>

class CValidationState;

/**
 * CVaultManager - deposit lifecycle state machine
 *
 * Deposit states: OPEN → WITHDRAWN | EMERGENCY_WITHDRAWN (terminal).
 *
 * | From     | Event             | To                  | Side effects                          |
 * |----------|-------------------|---------------------|---------------------------------------|
 * | (none)   | CreateDeposit     | OPEN                | pull funds, open position, milestones |
 * | OPEN     | Withdraw (mature) | WITHDRAWN           | finalize, pay principal+interest+bonus|
 * | OPEN     | EmergencyWithdraw | EMERGENCY_WITHDRAWN | finalize, pay principal-penalty       |
 * | terminal | any exit          | -                   | fails already-withdrawn               |
 *
 * ORDERING:
 * - CreateDeposit pulls funds before any mutation.
 * - Withdraw / EmergencyWithdraw commit the terminal state before the
 *   payout transfer. A failed transfer undoes this exit only.
 * - Signals and the reward notifier fire after cs_vault is released.
 *
 * Every public method takes cs_vault. The mutex is recursive, so a token
 * ledger that calls back into the manager on the same thread sees the
 * already-committed state. While a payout transfer is in flight every
 * mutating call from that ledger fails with payout-in-progress.
 */
class CVaultManager
{
private:
    mutable RecursiveMutex cs_vault;

    VaultConfig& config;
    CTokenLedger& tokenLedger;
    CRewardNotifier& rewardNotifier;
    const CClock& clock;

    CYieldPositionLedger positions;
    std::map<uint64_t, CDeposit> mapDeposits;
    std::map<std::string, std::vector<uint64_t>> mapOwnerDeposits;
    std::map<std::string, CUserAggregate> mapAggregates;
    std::set<std::pair<std::string, std::string>> setNotified;
    uint64_t nNextDepositId{1};

    //! Set while a TransferOut is in flight; mutations from the ledger are refused
    bool fPayoutPending{false};

    CVaultSignals signals;

    bool SafeTransferIn(const std::string& from, CAmount nAmount, std::string& strError);
    bool SafeTransferOut(const std::string& to, CAmount nAmount, std::string& strError);

    /** payout-in-progress when called back from inside a payout transfer */
    bool CheckNoPayoutPending(CValidationState& state) const;

    /** Common checks of both exit paths; returns the deposit on success */
    CDeposit* CheckExit(const std::string& caller, uint64_t nDepositId, CValidationState& state);

    /** Reserve the categories not yet delivered to user; returns them */
    std::vector<std::string> ClaimMilestones(const std::string& user, const std::vector<std::string>& vCategories);

    /**
     * Notify claimed categories. Called without cs_vault. A failed
     * category is released again so a later operation retries it.
     */
    void DeliverMilestones(const std::string& user, const std::vector<std::string>& vCategories);

public:
    CVaultManager(VaultConfig& configIn,
                  CTokenLedger& tokenLedgerIn,
                  CRewardNotifier& rewardNotifierIn,
                  const CClock& clockIn);

    // ------------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------------

    /**
     * CreateDeposit - Open a time-locked deposit
     *
     * 1. plan exists, is active, and bounds amount (bad-deposit-*)
     * 2. TransferIn(owner, amount), failure → transfer-failed, nothing mutated
     * 3. open position at EffectiveAPY(base, planMult, globalMult)
     * 4. record deposit, owner index, aggregate
     * 5. milestones (best-effort)
     */
    bool CreateDeposit(const std::string& owner,
                       CAmount nAmount,
                       uint32_t nPlanId,
                       CValidationState& state,
                       uint64_t* pDepositId = nullptr);

    /**
     * Withdraw - Pay a matured deposit
     *
     * payout = principal + interest + bonus. The bonus is clamped to zero
     * when the reward pool cannot cover it.
     */
    bool Withdraw(const std::string& caller,
                  uint64_t nDepositId,
                  CValidationState& state,
                  CPayout* pPayout = nullptr);

    /**
     * EmergencyWithdraw - Exit at any time
     *
     * payout = principal - penalty. Accrued interest is frozen on the
     * position and recorded on the deposit but forfeited.
     */
    bool EmergencyWithdraw(const std::string& caller,
                           uint64_t nDepositId,
                           CValidationState& state,
                           CPayout* pPayout = nullptr);

    /** Interest Accrue(now) would leave on the position, without mutating */
    CAmount CalculateCurrentInterest(uint64_t nDepositId, int64_t nNow) const;
    CAmount CalculateCurrentInterest(uint64_t nDepositId) const;

    // ------------------------------------------------------------------
    // Administration (caller must be config.strAdmin)
    // ------------------------------------------------------------------

    bool ExecuteAdminAction(const std::string& caller, const CAdminAction& action, CValidationState& state);

    bool SetPlan(const std::string& caller, uint32_t nPlanId, int64_t nDuration, uint32_t nBaseAPY,
                 CAmount nMinAmount, CAmount nMaxAmount, bool fActive, CValidationState& state);
    bool SetPlanMultiplier(const std::string& caller, uint32_t nPlanId, uint32_t nMultiplier, CValidationState& state);
    bool SetGlobalMultiplier(const std::string& caller, uint32_t nMultiplier, CValidationState& state);
    bool SetCompoundingMode(const std::string& caller, vault_interest::CompoundingMode mode, CValidationState& state);

    /** Pulls nAmount from the caller via the token ledger, then credits the pool */
    bool FundRewardPool(const std::string& caller, CAmount nAmount, CValidationState& state);

    // ------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------

    Optional<CDeposit> GetDeposit(uint64_t nDepositId) const;
    std::vector<uint64_t> ListDepositIds(const std::string& owner) const;
    CUserSummary GetUserSummary(const std::string& owner) const;
    Optional<CSavingsPlan> GetPlan(uint32_t nPlanId) const;
    std::vector<CSavingsPlan> ListPlans() const;
    CUserAggregate GetUserAggregate(const std::string& owner) const;

    /** Recompute an owner's aggregate from the deposit log */
    CUserAggregate RebuildUserAggregate(const std::string& owner) const;

    CRewardPool GetRewardPool() const;
    size_t GetDepositCount() const;

    /** Position backing a deposit */
    Optional<CYieldPosition> GetPosition(uint64_t nDepositId) const;

    vault_interest::CompoundingMode GetCompoundingMode() const;
    uint32_t GetGlobalMultiplier() const;

    /** Config invariants, plus every deposit and position */
    bool CheckInvariants() const;

    CVaultSignals& Signals() { return signals; }
};

#endif // PIGGY_VAULT_MANAGER_H
