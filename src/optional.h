// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PIGGY_OPTIONAL_H
#define PIGGY_OPTIONAL_H

#include <boost/none.hpp>
#include <boost/optional.hpp>

//! Substitute for C++17 std::optional
template <typename T>
using Optional = boost::optional<T>;

//! Substitute for C++17 std::nullopt
static auto& nullopt = boost::none;

#endif // PIGGY_OPTIONAL_H
