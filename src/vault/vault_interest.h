// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PIGGY_VAULT_INTEREST_H
#define PIGGY_VAULT_INTEREST_H

#include "amount.h"

#include <stdint.h>
#include <string>

/**
 * Interest Calculator - pure fixed-point yield math
 *
 * RÈGLES:
 * - No floating point anywhere. Amounts are CAmount, rates are basis points.
 * - Every ratio is mul-then-div in 128/256-bit intermediates.
 * - All functions are total: zero or negative inputs yield 0, results are
 *   clamped to [0, MAX_MONEY], subtractions saturate at 0.
 *
 * Growth factors are carried in WAD precision (1e18 = 1.0).
 */
namespace vault_interest {

// ============================================================================
// Constants
// ============================================================================

static const uint32_t BPS_DENOMINATOR = 10000;         // 10000 bps = 100%
static const uint32_t MAX_BASE_APY = 10000;            // 100% before multipliers
static const uint32_t MIN_MULTIPLIER_BPS = 5000;       // 50%
static const uint32_t MAX_MULTIPLIER_BPS = 20000;      // 200%
static const uint32_t NEUTRAL_MULTIPLIER_BPS = 10000;  // 100%
static const uint32_t MAX_COMPOUND_DAYS = 365;         // BOUNDED_DAILY iteration cap
static const uint32_t DEFAULT_MATURITY_BONUS_BPS = 500; // 5%

/**
 * How whole days of a period are compounded.
 *
 * BOUNDED_DAILY: iterative (1 + apy/365) per day, at most 365 iterations.
 *                Whole days beyond 365 are not compounded.
 * EXACT_DAILY:   closed-form (1 + apy/365)^days, no cap.
 * CONTINUOUS:    e^(apy * t), no day split.
 */
enum class CompoundingMode : uint8_t {
    BOUNDED_DAILY = 0,
    EXACT_DAILY = 1,
    CONTINUOUS = 2,
};

std::string CompoundingModeToString(CompoundingMode mode);
bool CompoundingModeFromString(const std::string& str, CompoundingMode& modeOut);

// ============================================================================
// Interest
// ============================================================================

/**
 * SimpleInterest - pro-rata interest
 *
 * FORMULA: principal × apy × elapsed / (10000 × SECONDS_PER_YEAR)
 */
CAmount SimpleInterest(CAmount nPrincipal, uint32_t nAPY, int64_t nElapsed);

/**
 * DailyInterest - one day of simple interest
 *
 * FORMULA: principal × apy / (10000 × 365)
 */
CAmount DailyInterest(CAmount nPrincipal, uint32_t nAPY);

/**
 * ContinuousInterest - principal × (e^(apy × elapsed / year) − 1)
 *
 * e^x is evaluated by a WAD fixed-point Taylor series.
 */
CAmount ContinuousInterest(CAmount nPrincipal, uint32_t nAPY, int64_t nElapsed);

/**
 * CompoundInterest - interest earned by principal over elapsed seconds
 *
 * - elapsed is capped at totalDuration
 * - elapsed < 1 day: SimpleInterest
 * - elapsed ≥ 1 day: whole days compound according to mode, the partial
 *   day remainder accrues pro-rata on the compounded balance
 *
 * @return 0 if any input is zero or negative
 */
CAmount CompoundInterest(CAmount nPrincipal,
                         uint32_t nAPY,
                         int64_t nElapsed,
                         int64_t nTotalDuration,
                         CompoundingMode mode = CompoundingMode::BOUNDED_DAILY);

// ============================================================================
// Penalties, bonuses, APY composition
// ============================================================================

/**
 * EarlyWithdrawalPenalty
 *
 * - elapsed < minimumHold: full principal × rate / 10000
 * - minimumHold ≤ elapsed < 2 × minimumHold: falls linearly to zero
 * - elapsed ≥ 2 × minimumHold, or minimumHold == 0: zero
 */
CAmount EarlyWithdrawalPenalty(CAmount nPrincipal,
                               uint32_t nPenaltyRate,
                               int64_t nElapsed,
                               int64_t nMinimumHold);

/**
 * EffectiveAPY - base × planMultiplier / 10000 × globalMultiplier / 10000
 *
 * Multipliers outside [MIN_MULTIPLIER_BPS, MAX_MULTIPLIER_BPS] are clamped.
 */
uint32_t EffectiveAPY(uint32_t nBaseAPY, uint32_t nPlanMultiplier, uint32_t nGlobalMultiplier);

/**
 * MaturityBonus - (principal + interest) × bonusRate / 10000
 */
CAmount MaturityBonus(CAmount nPrincipal, CAmount nInterestEarned, uint32_t nBonusRate);

bool IsValidMultiplier(uint32_t nMultiplier);
uint32_t ClampMultiplier(uint32_t nMultiplier);

} // namespace vault_interest

#endif // PIGGY_VAULT_INTEREST_H
