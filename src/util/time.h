// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PIGGY_UTIL_TIME_H
#define PIGGY_UTIL_TIME_H

#include <stdint.h>
#include <string>

static const int64_t SECONDS_PER_HOUR = 60 * 60;
static const int64_t SECONDS_PER_DAY = 24 * SECONDS_PER_HOUR;
static const int64_t DAYS_PER_YEAR = 365;
static const int64_t SECONDS_PER_YEAR = DAYS_PER_YEAR * SECONDS_PER_DAY;

/** Wall-clock seconds since the epoch. Only the system clock reads it. */
int64_t GetTime();

/**
 * ISO 8601 formatting is preferred. Use the FormatISO8601{DateTime,Date}
 * helper functions if possible.
 */
std::string FormatISO8601DateTime(int64_t nTime);

/**
 * Parse a duration such as "30d", "12h", "90m" or "45" (seconds).
 * @return false if the string is malformed or negative
 */
bool ParseDuration(const std::string& str, int64_t& nSecondsOut);

#endif // PIGGY_UTIL_TIME_H
