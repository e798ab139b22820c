// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "vault/vault_milestones.h"

namespace vault_milestones {

std::string GetPlanTierCategory(uint32_t nPlanDays)
{
    if (nPlanDays <= 30) return CATEGORY_STARTER;
    if (nPlanDays <= 90) return CATEGORY_SAVER;
    if (nPlanDays <= 180) return CATEGORY_INVESTOR;
    return CATEGORY_CHAMPION;
}

std::vector<std::string> GetAmountCategories(CAmount nAmount)
{
    std::vector<std::string> vCategories;
    if (nAmount >= HUNDRED_CLUB_AMOUNT) vCategories.push_back(CATEGORY_HUNDRED_CLUB);
    if (nAmount >= THOUSAND_CLUB_AMOUNT) vCategories.push_back(CATEGORY_THOUSAND_CLUB);
    if (nAmount >= TEN_THOUSAND_CLUB_AMOUNT) vCategories.push_back(CATEGORY_TEN_THOUSAND_CLUB);
    return vCategories;
}

std::vector<std::string> GetDepositMilestones(bool fFirstDeposit, uint32_t nPlanDays, CAmount nAmount)
{
    std::vector<std::string> vCategories;
    if (fFirstDeposit) {
        vCategories.push_back(CATEGORY_FIRST_DEPOSIT);
    }
    vCategories.push_back(GetPlanTierCategory(nPlanDays));

    const std::vector<std::string> vAmount = GetAmountCategories(nAmount);
    vCategories.insert(vCategories.end(), vAmount.begin(), vAmount.end());
    return vCategories;
}

std::vector<std::string> GetMaturityMilestones(uint32_t nPlanDays)
{
    std::vector<std::string> vCategories;
    if (nPlanDays >= 180) vCategories.push_back(CATEGORY_HALF_YEAR_SAVER);
    if (nPlanDays >= 365) vCategories.push_back(CATEGORY_YEAR_CHAMPION);
    return vCategories;
}

} // namespace vault_milestones
