// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

//
// Administrative actions: plans, multipliers, compounding mode, reward pool
//

#include "test/test_piggy.h"

#include "util/time.h"
#include "validationstate.h"
#include "vault/vault_admin.h"

#include <boost/test/unit_test.hpp>

using vault_interest::CompoundingMode;

static const std::string ALICE = "alice";

BOOST_FIXTURE_TEST_SUITE(vault_admin_tests, VaultTestingSetup)

// ============================================================================
// TEST 1: Caller checks
// ============================================================================

BOOST_AUTO_TEST_CASE(non_admin_rejected)
{
    Mint(ALICE, 1000 * COIN);

    CValidationState statePlan;
    BOOST_CHECK(!manager->SetPlan(ALICE, 60, 60 * SECONDS_PER_DAY, 1500, 100 * COIN, 1000 * COIN, true, statePlan));
    BOOST_CHECK_EQUAL(statePlan.GetRejectReason(), "bad-admin-caller");

    CValidationState stateMult;
    BOOST_CHECK(!manager->SetPlanMultiplier(ALICE, 30, 20000, stateMult));
    BOOST_CHECK_EQUAL(stateMult.GetRejectReason(), "bad-admin-caller");

    CValidationState stateGlobal;
    BOOST_CHECK(!manager->SetGlobalMultiplier(ALICE, 20000, stateGlobal));
    BOOST_CHECK_EQUAL(stateGlobal.GetRejectReason(), "bad-admin-caller");

    CValidationState stateMode;
    BOOST_CHECK(!manager->SetCompoundingMode(ALICE, CompoundingMode::CONTINUOUS, stateMode));
    BOOST_CHECK_EQUAL(stateMode.GetRejectReason(), "bad-admin-caller");

    CValidationState stateFund;
    BOOST_CHECK(!manager->FundRewardPool(ALICE, 100 * COIN, stateFund));
    BOOST_CHECK_EQUAL(stateFund.GetRejectReason(), "bad-admin-caller");

    // Nothing moved and nothing changed
    BOOST_CHECK_EQUAL(ledger.nTransferInCalls, 0);
    BOOST_CHECK_EQUAL(ledger.GetBalance(ALICE), 1000 * COIN);
    BOOST_CHECK(!manager->GetPlan(60));
    BOOST_CHECK_EQUAL(manager->GetPlan(30)->nMultiplier, 10000u);
    BOOST_CHECK_EQUAL(manager->GetGlobalMultiplier(), 10000u);
    BOOST_CHECK(manager->GetCompoundingMode() == CompoundingMode::BOUNDED_DAILY);
    BOOST_CHECK_EQUAL(manager->GetRewardPool().nTotalPool, 0);
}

// ============================================================================
// TEST 2: Plans
// ============================================================================

BOOST_AUTO_TEST_CASE(add_plan_then_deposit)
{
    CValidationState state;
    BOOST_REQUIRE(manager->SetPlan(ADMIN, 60, 60 * SECONDS_PER_DAY, 1500, 100 * COIN, 1000 * COIN, true, state));

    Optional<CSavingsPlan> plan = manager->GetPlan(60);
    BOOST_REQUIRE(plan);
    BOOST_CHECK_EQUAL(plan->nPenaltyRate, 300u);
    BOOST_CHECK_EQUAL(manager->ListPlans().size(), 7u);

    Mint(ALICE, 500 * COIN);
    const uint64_t nId = Deposit(ALICE, 500 * COIN, 60);
    BOOST_CHECK_EQUAL(manager->GetDeposit(nId)->nMaturityAt, TEST_START_TIME + 60 * SECONDS_PER_DAY);
    BOOST_CHECK_EQUAL(manager->GetPosition(nId)->nEffectiveAPY, 1500u);
}

BOOST_AUTO_TEST_CASE(set_plan_validation)
{
    CValidationState stateApy;
    BOOST_CHECK(!manager->SetPlan(ADMIN, 60, 60 * SECONDS_PER_DAY, 20000, 100 * COIN, 1000 * COIN, true, stateApy));
    BOOST_CHECK_EQUAL(stateApy.GetRejectReason(), "bad-plan-apy");

    CValidationState stateBounds;
    BOOST_CHECK(!manager->SetPlan(ADMIN, 60, 60 * SECONDS_PER_DAY, 1500, 1000 * COIN, 100 * COIN, true, stateBounds));
    BOOST_CHECK_EQUAL(stateBounds.GetRejectReason(), "bad-plan-amount-bounds");

    CValidationState stateDuration;
    BOOST_CHECK(!manager->SetPlan(ADMIN, 60, 59 * SECONDS_PER_DAY, 1500, 100 * COIN, 1000 * COIN, true, stateDuration));
    BOOST_CHECK_EQUAL(stateDuration.GetRejectReason(), "bad-plan-duration");

    BOOST_CHECK(!manager->GetPlan(60));
}

BOOST_AUTO_TEST_CASE(deactivate_plan_keeps_open_deposits)
{
    Mint(ALICE, 2000 * COIN);
    FundPool(1000 * COIN);
    const uint64_t nId = Deposit(ALICE, 1000 * COIN, 30);

    CValidationState state;
    BOOST_REQUIRE(manager->SetPlan(ADMIN, 30, 30 * SECONDS_PER_DAY, 1200, 100 * COIN, 50000 * COIN, false, state));

    CValidationState stateDeposit;
    BOOST_CHECK(!manager->CreateDeposit(ALICE, 500 * COIN, 30, stateDeposit));
    BOOST_CHECK_EQUAL(stateDeposit.GetRejectReason(), "bad-deposit-plan-inactive");

    clock.Advance(30 * SECONDS_PER_DAY);
    CPayout payout;
    BOOST_REQUIRE(manager->Withdraw(ALICE, nId, state, &payout));
    BOOST_CHECK_EQUAL(payout.nTotal, 1060405684);
}

// ============================================================================
// TEST 3: Multipliers
// ============================================================================

BOOST_AUTO_TEST_CASE(multiplier_bounds)
{
    CValidationState stateLow;
    BOOST_CHECK(!manager->SetGlobalMultiplier(ADMIN, 4999, stateLow));
    BOOST_CHECK_EQUAL(stateLow.GetRejectReason(), "bad-admin-multiplier");

    CValidationState stateHigh;
    BOOST_CHECK(!manager->SetPlanMultiplier(ADMIN, 30, 20001, stateHigh));
    BOOST_CHECK_EQUAL(stateHigh.GetRejectReason(), "bad-admin-multiplier");

    CValidationState stateUnknown;
    BOOST_CHECK(!manager->SetPlanMultiplier(ADMIN, 45, 10000, stateUnknown));
    BOOST_CHECK_EQUAL(stateUnknown.GetRejectReason(), "bad-plan-unknown");

    CValidationState state;
    BOOST_CHECK(manager->SetGlobalMultiplier(ADMIN, 5000, state));
    BOOST_CHECK(manager->SetGlobalMultiplier(ADMIN, 20000, state));
    BOOST_CHECK_EQUAL(manager->GetGlobalMultiplier(), 20000u);
}

BOOST_AUTO_TEST_CASE(multipliers_combine_into_effective_apy)
{
    CValidationState state;
    BOOST_REQUIRE(manager->SetGlobalMultiplier(ADMIN, 15000, state));
    BOOST_REQUIRE(manager->SetPlanMultiplier(ADMIN, 90, 20000, state));

    Mint(ALICE, 2000 * COIN);
    const uint64_t nShort = Deposit(ALICE, 1000 * COIN, 30);
    const uint64_t nLong = Deposit(ALICE, 1000 * COIN, 90);

    BOOST_CHECK_EQUAL(manager->GetPosition(nShort)->nEffectiveAPY, 1800u);
    // 1800 * 2 * 1.5
    BOOST_CHECK_EQUAL(manager->GetPosition(nLong)->nEffectiveAPY, 5400u);
}

// ============================================================================
// TEST 4: Compounding mode
// ============================================================================

BOOST_AUTO_TEST_CASE(switch_compounding_mode)
{
    Mint(ALICE, 1000 * COIN);
    const uint64_t nId = Deposit(ALICE, 1000 * COIN, 30);
    const int64_t nMaturity = TEST_START_TIME + 30 * SECONDS_PER_DAY;

    BOOST_CHECK_EQUAL(manager->CalculateCurrentInterest(nId, nMaturity), 9910176);

    CValidationState state;
    BOOST_REQUIRE(manager->SetCompoundingMode(ADMIN, CompoundingMode::CONTINUOUS, state));
    BOOST_CHECK(manager->GetCompoundingMode() == CompoundingMode::CONTINUOUS);
    BOOST_CHECK_EQUAL(manager->CalculateCurrentInterest(nId, nMaturity), 9911813);

    BOOST_REQUIRE(manager->SetCompoundingMode(ADMIN, CompoundingMode::EXACT_DAILY, state));
    BOOST_CHECK_EQUAL(manager->CalculateCurrentInterest(nId, nMaturity), 9910176);
}

// ============================================================================
// TEST 5: Reward pool funding
// ============================================================================

BOOST_AUTO_TEST_CASE(fund_reward_pool)
{
    Mint(ADMIN, 500 * COIN);

    CValidationState state;
    BOOST_REQUIRE(manager->FundRewardPool(ADMIN, 200 * COIN, state));
    BOOST_REQUIRE(manager->FundRewardPool(ADMIN, 300 * COIN, state));

    const CRewardPool pool = manager->GetRewardPool();
    BOOST_CHECK_EQUAL(pool.nTotalPool, 500 * COIN);
    BOOST_CHECK_EQUAL(pool.nDistributed, 0);
    BOOST_CHECK_EQUAL(pool.GetAvailable(), 500 * COIN);
    BOOST_CHECK_EQUAL(ledger.GetBalance(ADMIN), 0);
    BOOST_CHECK_EQUAL(ledger.GetCustodyBalance(), 500 * COIN);
}

BOOST_AUTO_TEST_CASE(fund_rejects_bad_amount)
{
    Mint(ADMIN, 500 * COIN);

    CValidationState stateZero;
    BOOST_CHECK(!manager->FundRewardPool(ADMIN, 0, stateZero));
    BOOST_CHECK_EQUAL(stateZero.GetRejectReason(), "bad-admin-amount");

    CValidationState stateNeg;
    BOOST_CHECK(!manager->FundRewardPool(ADMIN, -COIN, stateNeg));
    BOOST_CHECK_EQUAL(stateNeg.GetRejectReason(), "bad-admin-amount");

    BOOST_CHECK_EQUAL(ledger.nTransferInCalls, 0);
    BOOST_CHECK_EQUAL(manager->GetRewardPool().nTotalPool, 0);
}

BOOST_AUTO_TEST_CASE(fund_transfer_failure_leaves_pool_unchanged)
{
    // Admin holds nothing: the ledger refuses the pull
    CValidationState state;
    BOOST_CHECK(!manager->FundRewardPool(ADMIN, 100 * COIN, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "transfer-failed");
    BOOST_CHECK(state.GetErrorClass() == VaultError::COLLABORATOR_FAILURE);
    BOOST_CHECK_EQUAL(manager->GetRewardPool().nTotalPool, 0);

    Mint(ADMIN, 100 * COIN);
    ledger.fFailTransferIn = true;
    CValidationState stateInjected;
    BOOST_CHECK(!manager->FundRewardPool(ADMIN, 100 * COIN, stateInjected));
    BOOST_CHECK_EQUAL(manager->GetRewardPool().nTotalPool, 0);
    BOOST_CHECK_EQUAL(ledger.GetBalance(ADMIN), 100 * COIN);
}

// ============================================================================
// TEST 6: Admin action records
// ============================================================================

BOOST_AUTO_TEST_CASE(admin_action_descriptions)
{
    BOOST_CHECK_EQUAL(AdminActionTypeToString(AdminActionType::FUND_REWARD_POOL), "fund-reward-pool");
    BOOST_CHECK_EQUAL(CAdminAction::SetGlobalMultiplier(12000).ToString(), "set-global-multiplier(multiplier=12000)");
    BOOST_CHECK_EQUAL(CAdminAction::FundRewardPool(5 * COIN).ToString(), "fund-reward-pool(amount=5.00)");

    // Check never mutates
    CValidationState state;
    BOOST_CHECK(CheckAdminAction(config, ADMIN, CAdminAction::SetGlobalMultiplier(12000), state));
    BOOST_CHECK_EQUAL(config.nGlobalMultiplier, 10000u);

    BOOST_CHECK(manager->ExecuteAdminAction(ADMIN, CAdminAction::SetGlobalMultiplier(12000), state));
    BOOST_CHECK_EQUAL(manager->GetGlobalMultiplier(), 12000u);
}

BOOST_AUTO_TEST_SUITE_END()
