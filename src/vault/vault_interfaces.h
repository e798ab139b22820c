// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PIGGY_VAULT_INTERFACES_H
#define PIGGY_VAULT_INTERFACES_H

#include "amount.h"
#include "util/time.h"

#include <atomic>
#include <stdint.h>
#include <string>

/**
 * CTokenLedger - custody of the single fungible asset
 *
 * The engine never mutates balances itself, it only requests transfers.
 * Both calls are synchronous and all-or-nothing. A thrown std::exception
 * counts as a failed transfer.
 */
class CTokenLedger
{
public:
    virtual ~CTokenLedger() {}

    /** Pull nAmount from `from` into vault custody */
    virtual bool TransferIn(const std::string& from, CAmount nAmount, std::string& strError) = 0;

    /** Pay nAmount out of vault custody to `to` */
    virtual bool TransferOut(const std::string& to, CAmount nAmount, std::string& strError) = 0;

    /** Accounts the ledger keeps for itself; they may not act as users */
    virtual bool IsReservedAccount(const std::string& account) const { return false; }
};

/**
 * CRewardNotifier - mints a badge for a milestone category
 *
 * Fire-and-forget. Failures are logged by the caller and never abort
 * the operation that triggered them.
 */
class CRewardNotifier
{
public:
    virtual ~CRewardNotifier() {}

    virtual void Notify(const std::string& user, const std::string& category) = 0;
};

/** Injected time source, seconds since the epoch */
class CClock
{
public:
    virtual ~CClock() {}

    virtual int64_t Now() const = 0;
};

class CSystemClock : public CClock
{
public:
    int64_t Now() const override { return GetTime(); }
};

/** Clock moved by hand; used by the script processor and the tests */
class CManualClock : public CClock
{
private:
    std::atomic<int64_t> nTime;

public:
    explicit CManualClock(int64_t nTimeIn = 0) : nTime(nTimeIn) {}

    int64_t Now() const override { return nTime.load(); }
    void Set(int64_t nTimeIn) { nTime.store(nTimeIn); }
    void Advance(int64_t nSeconds) { nTime += nSeconds; }
};

#endif // PIGGY_VAULT_INTERFACES_H
