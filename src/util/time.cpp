// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/time.h"

#include "util/format.h"

#include <chrono>
#include <ctime>
#include <limits>

int64_t GetTime()
{
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string FormatISO8601DateTime(int64_t nTime)
{
    struct tm ts;
    time_t time_val = nTime;
    if (gmtime_r(&time_val, &ts) == nullptr) {
        return {};
    }
    return strprintf("%04d-%02d-%02dT%02d:%02d:%02dZ", ts.tm_year + 1900, ts.tm_mon + 1, ts.tm_mday, ts.tm_hour, ts.tm_min, ts.tm_sec);
}

bool ParseDuration(const std::string& str, int64_t& nSecondsOut)
{
    if (str.empty()) return false;

    int64_t nUnit = 1;
    std::string strDigits = str;
    switch (str.back()) {
    case 'd': nUnit = SECONDS_PER_DAY; strDigits.pop_back(); break;
    case 'h': nUnit = SECONDS_PER_HOUR; strDigits.pop_back(); break;
    case 'm': nUnit = 60; strDigits.pop_back(); break;
    case 's': strDigits.pop_back(); break;
    default: break;
    }
    if (strDigits.empty() || strDigits.size() > 12) return false;

    int64_t nValue = 0;
    for (char c : strDigits) {
        if (c < '0' || c > '9') return false;
        nValue = nValue * 10 + (c - '0');
    }
    if (nValue > std::numeric_limits<int64_t>::max() / nUnit) return false;

    nSecondsOut = nValue * nUnit;
    return true;
}
