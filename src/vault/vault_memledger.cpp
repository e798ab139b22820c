// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "vault/vault_memledger.h"

#include "logging.h"
#include "util/moneystr.h"

bool CMemoryTokenLedger::Move(const std::string& from, const std::string& to, CAmount nAmount, std::string& strError)
{
    if (nAmount <= 0 || !MoneyRange(nAmount)) {
        strError = strprintf("invalid amount %d", nAmount);
        return false;
    }
    if (from == to) {
        strError = strprintf("transfer from %s to itself", from);
        return false;
    }

    LOCK(cs_ledger);
    CAmount& nFrom = mapBalances[from];
    if (nFrom < nAmount) {
        strError = strprintf("insufficient balance for %s: have %s, need %s",
                             from, FormatMoney(nFrom), FormatMoney(nAmount));
        return false;
    }

    CAmount& nTo = mapBalances[to];
    if (nTo > MAX_MONEY - nAmount) {
        strError = strprintf("balance overflow for %s", to);
        return false;
    }

    nFrom -= nAmount;
    nTo += nAmount;

    LogPrint(BCLog::LEDGER, "%s: %s -> %s %s\n", __func__, from, to, FormatMoney(nAmount));
    return true;
}

bool CMemoryTokenLedger::Mint(const std::string& account, CAmount nAmount, std::string& strError)
{
    if (nAmount <= 0 || !MoneyRange(nAmount)) {
        strError = strprintf("invalid amount %d", nAmount);
        return false;
    }

    LOCK(cs_ledger);
    CAmount& nBalance = mapBalances[account];
    if (nBalance > MAX_MONEY - nAmount) {
        strError = strprintf("balance overflow for %s", account);
        return false;
    }
    nBalance += nAmount;

    LogPrint(BCLog::LEDGER, "%s: %s +%s\n", __func__, account, FormatMoney(nAmount));
    return true;
}

CAmount CMemoryTokenLedger::GetBalance(const std::string& account) const
{
    LOCK(cs_ledger);
    auto it = mapBalances.find(account);
    return it == mapBalances.end() ? 0 : it->second;
}

bool CMemoryTokenLedger::TransferIn(const std::string& from, CAmount nAmount, std::string& strError)
{
    return Move(from, VAULT_CUSTODY_ACCOUNT, nAmount, strError);
}

bool CMemoryTokenLedger::TransferOut(const std::string& to, CAmount nAmount, std::string& strError)
{
    return Move(VAULT_CUSTODY_ACCOUNT, to, nAmount, strError);
}

void CLoggingRewardNotifier::Notify(const std::string& user, const std::string& category)
{
    LogPrintf("Reward: %s earned badge \"%s\"\n", user, category);
}
