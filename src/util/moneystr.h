// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Money parsing/formatting utilities.
 */
#ifndef PIGGY_UTIL_MONEYSTR_H
#define PIGGY_UTIL_MONEYSTR_H

#include "amount.h"

#include <string>

/** Number of decimal places of the vault asset */
static const int MONEY_DECIMALS = 6;

/* FormatMoney keeps at least two decimals ("12.50"). ParseMoney rejects
 * more than MONEY_DECIMALS fractional digits and anything outside MoneyRange.
 */
std::string FormatMoney(const CAmount n);
bool ParseMoney(const std::string& str, CAmount& nRet);

#endif // PIGGY_UTIL_MONEYSTR_H
