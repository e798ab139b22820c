// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PIGGY_AMOUNT_H
#define PIGGY_AMOUNT_H

#include <stdint.h>

/** Amount in the vault asset's smallest unit (6 decimals, like USDT) */
typedef int64_t CAmount;

static const CAmount COIN = 1000000;
static const CAmount CENT = 10000;

/**
 * No amount larger than this is valid anywhere in the engine.
 *
 * Chosen so that amount * WAD (1e18) still fits comfortably in a signed
 * 128-bit intermediate.
 */
static const CAmount MAX_MONEY = 1000000000 * COIN;
inline bool MoneyRange(const CAmount& nValue) { return (nValue >= 0 && nValue <= MAX_MONEY); }

#endif // PIGGY_AMOUNT_H
