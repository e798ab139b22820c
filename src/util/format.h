// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PIGGY_UTIL_FORMAT_H
#define PIGGY_UTIL_FORMAT_H

#include <string>

#include <boost/format.hpp>

/**
 * printf-style formatting into a std::string.
 *
 * Length modifiers (%lld, %zu) are accepted and ignored: arguments are
 * streamed with their own type. Throws boost::io::format_error on a
 * mismatched argument count.
 */
namespace util_format {

inline void FeedArgs(boost::format&) {}

template <typename T, typename... Args>
void FeedArgs(boost::format& fmt, const T& arg, const Args&... args)
{
    fmt % arg;
    FeedArgs(fmt, args...);
}

template <typename... Args>
std::string format(const std::string& fmt, const Args&... args)
{
    boost::format f(fmt);
    FeedArgs(f, args...);
    return f.str();
}

} // namespace util_format

template <typename... Args>
std::string strprintf(const std::string& fmt, const Args&... args)
{
    return util_format::format(fmt, args...);
}

#endif // PIGGY_UTIL_FORMAT_H
