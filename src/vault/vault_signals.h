// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PIGGY_VAULT_SIGNALS_H
#define PIGGY_VAULT_SIGNALS_H

#include "amount.h"

#include <stdint.h>
#include <string>

#include <boost/signals2/signal.hpp>

struct CDeposit;
struct CPayout;

/**
 * Signals for vault lifecycle events.
 *
 * Fired while cs_vault is held, after the state change has been
 * committed. Slots must not call back into the manager from another
 * thread.
 */
class CVaultSignals
{
public:
    /** A deposit was opened */
    boost::signals2::signal<void(const CDeposit& deposit)> NotifyDepositCreated;

    /** A matured deposit was paid out */
    boost::signals2::signal<void(const CDeposit& deposit, const CPayout& payout)> NotifyDepositWithdrawn;

    /** A deposit was closed early */
    boost::signals2::signal<void(const CDeposit& deposit, const CPayout& payout)> NotifyEmergencyWithdrawn;

    /** The reward pool could not cover a bonus, which was clamped to zero */
    boost::signals2::signal<void(uint64_t nDepositId, CAmount nRequested, CAmount nAvailable)> NotifyBonusClamped;

    /** A milestone badge was delivered to the reward notifier */
    boost::signals2::signal<void(const std::string& user, const std::string& category)> NotifyMilestone;
};

#endif // PIGGY_VAULT_SIGNALS_H
