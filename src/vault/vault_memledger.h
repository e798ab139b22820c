// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PIGGY_VAULT_MEMLEDGER_H
#define PIGGY_VAULT_MEMLEDGER_H

#include "sync.h"
#include "vault/vault_interfaces.h"

#include <map>
#include <string>

/** Account that holds everything the vault has pulled in */
static const char* const VAULT_CUSTODY_ACCOUNT = "vault";

/**
 * CMemoryTokenLedger - in-process balances for the CLI and the tests
 *
 * Every transfer is checked then applied under cs_ledger, so it either
 * moves the full amount or nothing.
 */
class CMemoryTokenLedger : public CTokenLedger
{
protected:
    mutable Mutex cs_ledger;
    std::map<std::string, CAmount> mapBalances;

    bool Move(const std::string& from, const std::string& to, CAmount nAmount, std::string& strError);

public:
    /** Credit an account out of thin air (faucet) */
    bool Mint(const std::string& account, CAmount nAmount, std::string& strError);

    CAmount GetBalance(const std::string& account) const;
    CAmount GetCustodyBalance() const { return GetBalance(VAULT_CUSTODY_ACCOUNT); }

    bool TransferIn(const std::string& from, CAmount nAmount, std::string& strError) override;
    bool TransferOut(const std::string& to, CAmount nAmount, std::string& strError) override;
    bool IsReservedAccount(const std::string& account) const override { return account == VAULT_CUSTODY_ACCOUNT; }
};

/** Reward notifier that only writes the badge to the log */
class CLoggingRewardNotifier : public CRewardNotifier
{
public:
    void Notify(const std::string& user, const std::string& category) override;
};

#endif // PIGGY_VAULT_MEMLEDGER_H
