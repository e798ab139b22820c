// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "vault/vault_interest.h"

#include "logging.h"
#include "util/time.h"

#include <boost/multiprecision/cpp_int.hpp>

#include <algorithm>

using namespace boost::multiprecision;

namespace vault_interest {

// ============================================================================
// Fixed-point helpers
// ============================================================================

static const int256_t WAD = int256_t(1000000000000000000LL);

// Growth factors never need to exceed MAX_MONEY× (principal × factor is
// clamped to MAX_MONEY anyway). Keeps WAD products inside int256.
static const int256_t FACTOR_CAP = WAD * MAX_MONEY;

// e^35 > MAX_MONEY, anything larger saturates
static const int256_t EXP_INPUT_CAP = WAD * 35;

static const int256_t YEAR_BPS = int256_t(BPS_DENOMINATOR) * SECONDS_PER_YEAR;

static CAmount ClampToMoney(const int256_t& value, const char* func)
{
    if (value <= 0) {
        return 0;
    }
    if (value > MAX_MONEY) {
        LogPrintf("ERROR: %s: overflow (value=%s), clamped to MAX_MONEY\n", func, value.str());
        return MAX_MONEY;
    }
    return static_cast<CAmount>(value);
}

static int256_t MulWad(const int256_t& a, const int256_t& b)
{
    int256_t r = a * b / WAD;
    return r > FACTOR_CAP ? FACTOR_CAP : r;
}

/** (1 + apy / 365) in WAD */
static int256_t DailyFactorWad(uint32_t nAPY)
{
    return WAD + int256_t(nAPY) * WAD / (int256_t(BPS_DENOMINATOR) * DAYS_PER_YEAR);
}

/** base^exp in WAD by exponentiation by squaring */
static int256_t PowWad(int256_t base, uint64_t exp)
{
    int256_t result = WAD;
    while (exp > 0) {
        if (exp & 1) {
            result = MulWad(result, base);
        }
        exp >>= 1;
        if (exp > 0) {
            base = MulWad(base, base);
        }
    }
    return result;
}

/** e^x for x in WAD */
static int256_t ExpWad(const int256_t& x)
{
    if (x <= 0) {
        return WAD;
    }
    if (x >= EXP_INPUT_CAP) {
        return FACTOR_CAP;
    }

    int256_t sum = WAD;
    int256_t term = WAD;
    for (int k = 1; k <= 200; ++k) {
        term = term * x / (WAD * k);
        if (term == 0) {
            break;
        }
        sum += term;
    }
    return sum > FACTOR_CAP ? FACTOR_CAP : sum;
}

/** Growth factor (WAD) over elapsed seconds, elapsed ≥ 1 day unless CONTINUOUS */
static int256_t GrowthFactorWad(uint32_t nAPY, int64_t nElapsed, CompoundingMode mode)
{
    if (mode == CompoundingMode::CONTINUOUS) {
        return ExpWad(int256_t(nAPY) * WAD * nElapsed / YEAR_BPS);
    }

    const int64_t nDays = nElapsed / SECONDS_PER_DAY;
    const int64_t nRemainder = nElapsed % SECONDS_PER_DAY;
    const int256_t daily = DailyFactorWad(nAPY);

    int256_t factor = WAD;
    if (mode == CompoundingMode::EXACT_DAILY) {
        factor = PowWad(daily, static_cast<uint64_t>(nDays));
    } else {
        // Bounded iteration: remainder beyond MAX_COMPOUND_DAYS is not compounded
        const int64_t nIterations = std::min<int64_t>(nDays, MAX_COMPOUND_DAYS);
        if (nDays > nIterations) {
            LogPrint(BCLog::YIELD, "GrowthFactorWad: %d days requested, compounding capped at %d\n",
                     nDays, nIterations);
        }
        for (int64_t i = 0; i < nIterations; ++i) {
            factor = MulWad(factor, daily);
        }
    }

    // Partial day: pro-rata on the compounded balance
    if (nRemainder > 0) {
        factor += factor * nAPY * nRemainder / YEAR_BPS;
        if (factor > FACTOR_CAP) {
            factor = FACTOR_CAP;
        }
    }

    return factor;
}

// ============================================================================
// Public Functions
// ============================================================================

std::string CompoundingModeToString(CompoundingMode mode)
{
    switch (mode) {
    case CompoundingMode::BOUNDED_DAILY: return "bounded";
    case CompoundingMode::EXACT_DAILY: return "exact";
    case CompoundingMode::CONTINUOUS: return "continuous";
    }
    return "unknown";
}

bool CompoundingModeFromString(const std::string& str, CompoundingMode& modeOut)
{
    if (str == "bounded") {
        modeOut = CompoundingMode::BOUNDED_DAILY;
    } else if (str == "exact") {
        modeOut = CompoundingMode::EXACT_DAILY;
    } else if (str == "continuous") {
        modeOut = CompoundingMode::CONTINUOUS;
    } else {
        return false;
    }
    return true;
}

CAmount SimpleInterest(CAmount nPrincipal, uint32_t nAPY, int64_t nElapsed)
{
    if (nPrincipal <= 0 || nAPY == 0 || nElapsed <= 0) {
        return 0;
    }

    int256_t interest = int256_t(nPrincipal) * nAPY * nElapsed / YEAR_BPS;
    return ClampToMoney(interest, __func__);
}

CAmount DailyInterest(CAmount nPrincipal, uint32_t nAPY)
{
    // FORMULE: daily = principal × apy / (10000 × 365)
    if (nPrincipal <= 0 || nAPY == 0) {
        return 0;
    }

    int128_t daily = int128_t(nPrincipal) * nAPY / (int128_t(BPS_DENOMINATOR) * DAYS_PER_YEAR);
    return ClampToMoney(int256_t(daily), __func__);
}

CAmount ContinuousInterest(CAmount nPrincipal, uint32_t nAPY, int64_t nElapsed)
{
    if (nPrincipal <= 0 || nAPY == 0 || nElapsed <= 0) {
        return 0;
    }

    int256_t factor = GrowthFactorWad(nAPY, nElapsed, CompoundingMode::CONTINUOUS);
    int256_t grown = int256_t(nPrincipal) * factor / WAD;
    return ClampToMoney(grown - nPrincipal, __func__);
}

CAmount CompoundInterest(CAmount nPrincipal,
                         uint32_t nAPY,
                         int64_t nElapsed,
                         int64_t nTotalDuration,
                         CompoundingMode mode)
{
    if (nPrincipal <= 0 || nAPY == 0 || nElapsed <= 0 || nTotalDuration <= 0) {
        return 0;
    }

    if (nElapsed > nTotalDuration) {
        nElapsed = nTotalDuration;
    }

    if (mode == CompoundingMode::CONTINUOUS) {
        return ContinuousInterest(nPrincipal, nAPY, nElapsed);
    }

    if (nElapsed < SECONDS_PER_DAY) {
        return SimpleInterest(nPrincipal, nAPY, nElapsed);
    }

    int256_t factor = GrowthFactorWad(nAPY, nElapsed, mode);
    int256_t grown = int256_t(nPrincipal) * factor / WAD;
    return ClampToMoney(grown - nPrincipal, __func__);
}

CAmount EarlyWithdrawalPenalty(CAmount nPrincipal,
                               uint32_t nPenaltyRate,
                               int64_t nElapsed,
                               int64_t nMinimumHold)
{
    if (nPrincipal <= 0 || nPenaltyRate == 0 || nMinimumHold <= 0) {
        return 0;
    }

    int256_t fullPenalty = int256_t(nPrincipal) * nPenaltyRate / BPS_DENOMINATOR;

    if (nElapsed < nMinimumHold) {
        return ClampToMoney(fullPenalty, __func__);
    }

    // Linear decay from full (at minimumHold) to zero (at 2 × minimumHold)
    int64_t nSinceHold = nElapsed - nMinimumHold;
    if (nSinceHold >= nMinimumHold) {
        return 0;
    }

    int256_t reduction = fullPenalty * nSinceHold / nMinimumHold;
    if (reduction >= fullPenalty) {
        return 0;
    }
    int256_t penalty = fullPenalty - reduction;
    return ClampToMoney(penalty, __func__);
}

bool IsValidMultiplier(uint32_t nMultiplier)
{
    return nMultiplier >= MIN_MULTIPLIER_BPS && nMultiplier <= MAX_MULTIPLIER_BPS;
}

uint32_t ClampMultiplier(uint32_t nMultiplier)
{
    return std::max(MIN_MULTIPLIER_BPS, std::min(MAX_MULTIPLIER_BPS, nMultiplier));
}

uint32_t EffectiveAPY(uint32_t nBaseAPY, uint32_t nPlanMultiplier, uint32_t nGlobalMultiplier)
{
    int128_t apy = int128_t(nBaseAPY) * ClampMultiplier(nPlanMultiplier) * ClampMultiplier(nGlobalMultiplier)
                   / (int128_t(BPS_DENOMINATOR) * BPS_DENOMINATOR);
    return static_cast<uint32_t>(apy);
}

CAmount MaturityBonus(CAmount nPrincipal, CAmount nInterestEarned, uint32_t nBonusRate)
{
    if (nBonusRate == 0) {
        return 0;
    }

    int256_t base = int256_t(std::max<CAmount>(nPrincipal, 0)) + std::max<CAmount>(nInterestEarned, 0);
    int256_t bonus = base * nBonusRate / BPS_DENOMINATOR;
    return ClampToMoney(bonus, __func__);
}

} // namespace vault_interest
