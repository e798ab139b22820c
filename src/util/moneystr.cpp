// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/moneystr.h"

#include "util/format.h"

#include <cctype>
#include <stdlib.h>

std::string FormatMoney(const CAmount n)
{
    // Note: not using straight sprintf here because we do NOT want
    // localized number formatting.
    int64_t n_abs = (n > 0 ? n : -n);
    int64_t quotient = n_abs / COIN;
    int64_t remainder = n_abs % COIN;
    std::string str = strprintf("%d.%06d", quotient, remainder);

    // Right-trim excess zeros before the decimal point:
    int nTrim = 0;
    for (int i = str.size() - 1; (str[i] == '0' && isdigit(str[i - 2])); --i)
        ++nTrim;
    if (nTrim)
        str.erase(str.size() - nTrim, nTrim);

    if (n < 0)
        str.insert((unsigned int)0, 1, '-');
    return str;
}

bool ParseMoney(const std::string& str, CAmount& nRet)
{
    std::string strWhole;
    int64_t nUnits = 0;
    bool fDigits = false;
    const char* p = str.c_str();
    while (isspace(*p))
        p++;
    for (; *p; p++) {
        if (*p == '.') {
            p++;
            int64_t nMult = COIN / 10;
            while (isdigit(*p) && (nMult > 0)) {
                fDigits = true;
                nUnits += nMult * (*p++ - '0');
                nMult /= 10;
            }
            break;
        }
        if (isspace(*p))
            break;
        if (!isdigit(*p))
            return false;
        strWhole.insert(strWhole.end(), *p);
        fDigits = true;
    }
    for (; *p; p++)
        if (!isspace(*p))
            return false;
    if (!fDigits)
        return false;
    if (strWhole.size() > 10) // guard against 63 bit overflow
        return false;
    if (nUnits < 0 || nUnits > COIN)
        return false;
    int64_t nWhole = strWhole.empty() ? 0 : strtoll(strWhole.c_str(), nullptr, 10);
    CAmount nValue = nWhole * COIN + nUnits;
    if (!MoneyRange(nValue))
        return false;

    nRet = nValue;
    return true;
}
