// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "vault/vault_position.h"

#include "logging.h"
#include "util/moneystr.h"
#include "util/system.h"
#include "validationstate.h"

#include <algorithm>

using vault_interest::CompoundingMode;

std::string CYieldPosition::ToString() const
{
    return strprintf("CYieldPosition(id=%d, principal=%s, interest=%s, bonus=%s, start=%d, end=%d, last=%d, apy=%u, active=%d)",
                     nPositionId, FormatMoney(nPrincipal), FormatMoney(nAccruedInterest), FormatMoney(nBonusAwarded),
                     nStartTime, nEndTime, nLastUpdateTime, nEffectiveAPY, fActive ? 1 : 0);
}

/**
 * Interest that accrual at nNow would add on top of nAccruedInterest.
 * Shared by Accrue and ProjectInterest so that projection == accrual.
 */
static CAmount PendingInterest(const CYieldPosition& pos, int64_t nNow, CompoundingMode mode, int64_t& nCappedOut)
{
    nCappedOut = std::min(nNow, pos.nEndTime);
    if (!pos.fActive || nCappedOut <= pos.nLastUpdateTime) {
        return 0;
    }

    return vault_interest::CompoundInterest(pos.nPrincipal + pos.nAccruedInterest,
                                            pos.nEffectiveAPY,
                                            nCappedOut - pos.nLastUpdateTime,
                                            pos.GetDuration(),
                                            mode);
}

static CAmount AddSaturating(CAmount a, CAmount b)
{
    if (b > MAX_MONEY - a) {
        LogPrintf("ERROR: %s: %d + %d exceeds MAX_MONEY, clamped\n", __func__, a, b);
        return MAX_MONEY;
    }
    return a + b;
}

bool CYieldPositionLedger::CheckOpen(CAmount nPrincipal, int64_t nDuration, CValidationState& state)
{
    if (nPrincipal <= 0 || !MoneyRange(nPrincipal)) {
        return state.Invalid(false, VaultError::VALIDATION, "bad-position-principal",
                             strprintf("principal=%d", nPrincipal));
    }
    if (nDuration <= 0) {
        return state.Invalid(false, VaultError::VALIDATION, "bad-position-duration",
                             strprintf("duration=%d", nDuration));
    }
    return true;
}

bool CYieldPositionLedger::Open(CAmount nPrincipal,
                                int64_t nDuration,
                                uint32_t nEffectiveAPY,
                                int64_t nNow,
                                CValidationState& state,
                                uint64_t& nPositionIdOut)
{
    if (!CheckOpen(nPrincipal, nDuration, state)) {
        return false;
    }

    CYieldPosition pos;
    pos.nPositionId = nNextPositionId++;
    pos.nPrincipal = nPrincipal;
    pos.nStartTime = nNow;
    pos.nEndTime = nNow + nDuration;
    pos.nLastUpdateTime = nNow;
    pos.nEffectiveAPY = nEffectiveAPY;
    pos.fActive = true;

    mapPositions[pos.nPositionId] = pos;
    nPositionIdOut = pos.nPositionId;

    LogPrint(BCLog::YIELD, "%s: %s\n", __func__, pos.ToString());
    return true;
}

bool CYieldPositionLedger::Accrue(uint64_t nPositionId, int64_t nNow, CompoundingMode mode)
{
    auto it = mapPositions.find(nPositionId);
    if (it == mapPositions.end()) {
        return error("%s: unknown position %d", __func__, nPositionId);
    }

    CYieldPosition& pos = it->second;
    int64_t nCapped = 0;
    const CAmount nInterest = PendingInterest(pos, nNow, mode, nCapped);

    // Inactive or nothing elapsed: idempotent no-op
    if (!pos.fActive || nCapped <= pos.nLastUpdateTime) {
        return true;
    }

    pos.nAccruedInterest = AddSaturating(pos.nAccruedInterest, nInterest);
    pos.nLastUpdateTime = nCapped;

    LogPrint(BCLog::YIELD, "%s: position %d +%s (total %s) at %d\n",
             __func__, nPositionId, FormatMoney(nInterest), FormatMoney(pos.nAccruedInterest), nCapped);
    return true;
}

bool CYieldPositionLedger::Finalize(uint64_t nPositionId,
                                    int64_t nNow,
                                    CompoundingMode mode,
                                    CValidationState& state,
                                    CAmount& nPrincipalOut,
                                    CAmount& nInterestOut)
{
    auto it = mapPositions.find(nPositionId);
    if (it == mapPositions.end()) {
        return state.Invalid(false, VaultError::VALIDATION, "bad-position-unknown",
                             strprintf("position %d", nPositionId));
    }

    if (!it->second.fActive) {
        return state.Invalid(false, VaultError::STATE_CONFLICT, "position-already-finalized",
                             strprintf("position %d", nPositionId));
    }

    if (!Accrue(nPositionId, nNow, mode)) {
        return state.Error("position-accrue-failed");
    }

    CYieldPosition& pos = it->second;
    pos.fActive = false;

    nPrincipalOut = pos.nPrincipal;
    nInterestOut = pos.nAccruedInterest;

    LogPrint(BCLog::YIELD, "%s: %s\n", __func__, pos.ToString());
    return true;
}

bool CYieldPositionLedger::ApplyBonus(uint64_t nPositionId, CAmount nBonus, CValidationState& state)
{
    if (nBonus < 0 || !MoneyRange(nBonus)) {
        return state.Invalid(false, VaultError::VALIDATION, "bad-bonus-amount",
                             strprintf("bonus=%d", nBonus));
    }

    auto it = mapPositions.find(nPositionId);
    if (it == mapPositions.end()) {
        return state.Invalid(false, VaultError::VALIDATION, "bad-position-unknown",
                             strprintf("position %d", nPositionId));
    }

    it->second.nBonusAwarded = AddSaturating(it->second.nBonusAwarded, nBonus);
    return true;
}

CAmount CYieldPositionLedger::ProjectInterest(uint64_t nPositionId, int64_t nNow, CompoundingMode mode) const
{
    auto it = mapPositions.find(nPositionId);
    if (it == mapPositions.end()) {
        return 0;
    }

    int64_t nCapped = 0;
    const CAmount nPending = PendingInterest(it->second, nNow, mode, nCapped);
    return AddSaturating(it->second.nAccruedInterest, nPending);
}

Optional<CYieldPosition> CYieldPositionLedger::GetPosition(uint64_t nPositionId) const
{
    auto it = mapPositions.find(nPositionId);
    if (it == mapPositions.end()) {
        return nullopt;
    }
    return it->second;
}

void CYieldPositionLedger::Restore(const CYieldPosition& position)
{
    mapPositions[position.nPositionId] = position;
    LogPrint(BCLog::YIELD, "%s: %s\n", __func__, position.ToString());
}
