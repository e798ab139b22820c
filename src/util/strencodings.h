// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PIGGY_UTIL_STRENCODINGS_H
#define PIGGY_UTIL_STRENCODINGS_H

#include <stdint.h>
#include <string>
#include <vector>

/**
 * Convert string to signed 64-bit integer with strict parse error feedback.
 * @returns true if the entire string could be parsed as valid integer,
 *   false if not the entire string could be parsed or when overflow or underflow occurred.
 */
bool ParseInt64(const std::string& str, int64_t* out);

/**
 * Convert decimal string to unsigned 32-bit integer with strict parse error feedback.
 * Leading '-' is rejected.
 */
bool ParseUInt32(const std::string& str, uint32_t* out);

/** Split on runs of whitespace, dropping empty tokens */
std::vector<std::string> SplitWords(const std::string& str);

#endif // PIGGY_UTIL_STRENCODINGS_H
