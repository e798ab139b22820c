// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PIGGY_VAULT_POSITION_H
#define PIGGY_VAULT_POSITION_H

#include "amount.h"
#include "optional.h"
#include "vault/vault_interest.h"

#include <map>
#include <stdint.h>
#include <string>

class CValidationState;

/**
 * CYieldPosition - accrual bookkeeping paired 1:1 with a deposit
 *
 * INVARIANTS:
 * - nStartTime ≤ nLastUpdateTime ≤ nEndTime
 * - nAccruedInterest never decreases
 * - once fActive is false the position never changes again, except for
 *   nBonusAwarded
 *
 * The maturity bonus lives in nBonusAwarded, never in nAccruedInterest,
 * so a payout always splits into principal / interest / bonus.
 */
struct CYieldPosition
{
    uint64_t nPositionId;
    CAmount nPrincipal;
    CAmount nAccruedInterest;
    CAmount nBonusAwarded;
    int64_t nStartTime;
    int64_t nEndTime;
    int64_t nLastUpdateTime;
    uint32_t nEffectiveAPY;    // basis points, frozen at open
    bool fActive;

    CYieldPosition()
    {
        SetNull();
    }

    void SetNull()
    {
        nPositionId = 0;
        nPrincipal = 0;
        nAccruedInterest = 0;
        nBonusAwarded = 0;
        nStartTime = 0;
        nEndTime = 0;
        nLastUpdateTime = 0;
        nEffectiveAPY = 0;
        fActive = false;
    }

    bool IsNull() const { return nPositionId == 0; }

    int64_t GetDuration() const { return nEndTime - nStartTime; }

    bool CheckInvariants() const
    {
        if (nPrincipal <= 0 || nAccruedInterest < 0 || nBonusAwarded < 0) {
            return false;
        }
        return nStartTime <= nLastUpdateTime && nLastUpdateTime <= nEndTime;
    }

    std::string ToString() const;
};

/**
 * CYieldPositionLedger - owns every yield position
 *
 * State machine per position: Active → Finalized (terminal).
 *
 * Not thread-safe on its own: the vault manager serializes access under
 * cs_vault.
 */
class CYieldPositionLedger
{
private:
    std::map<uint64_t, CYieldPosition> mapPositions;
    uint64_t nNextPositionId{1};

public:
    /**
     * CheckOpen - Validate Open arguments without mutating
     *
     * Lets the caller reject a request before any collaborator is called.
     */
    static bool CheckOpen(CAmount nPrincipal, int64_t nDuration, CValidationState& state);

    /**
     * Open - Create an active position
     *
     * lastUpdateTime = startTime = now, endTime = now + duration.
     *
     * @return false with bad-position-principal / bad-position-duration
     */
    bool Open(CAmount nPrincipal,
              int64_t nDuration,
              uint32_t nEffectiveAPY,
              int64_t nNow,
              CValidationState& state,
              uint64_t& nPositionIdOut);

    /**
     * Accrue - Bring a position's interest up to min(now, endTime)
     *
     * RÈGLES:
     * - no-op if the position is finalized
     * - no-op if min(now, endTime) ≤ lastUpdateTime (idempotent for a fixed now)
     * - otherwise accrued += CompoundInterest(principal + accrued, apy,
     *   capped - lastUpdate, endTime - startTime)
     *
     * @return false only if the position does not exist
     */
    bool Accrue(uint64_t nPositionId, int64_t nNow, vault_interest::CompoundingMode mode);

    /**
     * Finalize - Accrue one last time and freeze
     *
     * @param[out] nPrincipalOut  position principal
     * @param[out] nInterestOut   frozen accrued interest (bonus excluded)
     * @return false with position-already-finalized on a second call
     */
    bool Finalize(uint64_t nPositionId,
                  int64_t nNow,
                  vault_interest::CompoundingMode mode,
                  CValidationState& state,
                  CAmount& nPrincipalOut,
                  CAmount& nInterestOut);

    /**
     * ApplyBonus - Credit a maturity bonus to bonusAwarded
     *
     * Allowed on finalized positions. Negative amounts are rejected.
     */
    bool ApplyBonus(uint64_t nPositionId, CAmount nBonus, CValidationState& state);

    /**
     * ProjectInterest - Total accrued interest Accrue(now) would leave
     *
     * Read-only. Finalized positions report their frozen value.
     */
    CAmount ProjectInterest(uint64_t nPositionId, int64_t nNow, vault_interest::CompoundingMode mode) const;

    Optional<CYieldPosition> GetPosition(uint64_t nPositionId) const;

    /** Put back a snapshot taken before a failed operation */
    void Restore(const CYieldPosition& position);

    size_t Size() const { return mapPositions.size(); }
};

#endif // PIGGY_VAULT_POSITION_H
