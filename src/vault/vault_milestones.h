// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PIGGY_VAULT_MILESTONES_H
#define PIGGY_VAULT_MILESTONES_H

#include "amount.h"

#include <stdint.h>
#include <string>
#include <vector>

/**
 * Milestone categories for the reward notifier
 *
 * Resolution is pure: the manager decides which (user, category) pairs
 * were already notified.
 */
namespace vault_milestones {

static const char* const CATEGORY_FIRST_DEPOSIT = "first_deposit";

// Plan-days tiers
static const char* const CATEGORY_STARTER = "starter";      // ≤ 30 days
static const char* const CATEGORY_SAVER = "saver";          // ≤ 90 days
static const char* const CATEGORY_INVESTOR = "investor";    // ≤ 180 days
static const char* const CATEGORY_CHAMPION = "champion";    // longer

// Amount tiers
static const char* const CATEGORY_HUNDRED_CLUB = "hundred_club";
static const char* const CATEGORY_THOUSAND_CLUB = "thousand_club";
static const char* const CATEGORY_TEN_THOUSAND_CLUB = "ten_thousand_club";

// Matured withdrawals
static const char* const CATEGORY_HALF_YEAR_SAVER = "half_year_saver";
static const char* const CATEGORY_YEAR_CHAMPION = "year_champion";

static const CAmount HUNDRED_CLUB_AMOUNT = 100 * COIN;
static const CAmount THOUSAND_CLUB_AMOUNT = 1000 * COIN;
static const CAmount TEN_THOUSAND_CLUB_AMOUNT = 10000 * COIN;

std::string GetPlanTierCategory(uint32_t nPlanDays);

/** Every amount tier reached by nAmount, smallest first */
std::vector<std::string> GetAmountCategories(CAmount nAmount);

/**
 * GetDepositMilestones - categories earned by a new deposit
 *
 * first_deposit (if fFirstDeposit), the plan tier, then the amount tiers.
 */
std::vector<std::string> GetDepositMilestones(bool fFirstDeposit, uint32_t nPlanDays, CAmount nAmount);

/** Categories earned by a matured withdrawal of a nPlanDays plan */
std::vector<std::string> GetMaturityMilestones(uint32_t nPlanDays);

} // namespace vault_milestones

#endif // PIGGY_VAULT_MILESTONES_H
