// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "sync.h"

#include "logging.h"

#include <stdexcept>
#include <vector>

namespace {

struct CLockLocation {
    void* cs;
    const char* pszName;
    const char* pszFile;
    int nLine;
};

//! Locks held by the current thread, innermost last
thread_local std::vector<CLockLocation> g_lockstack;

bool LockHeld(void* cs)
{
    for (const CLockLocation& loc : g_lockstack) {
        if (loc.cs == cs) return true;
    }
    return false;
}

} // namespace

void EnterCritical(const char* pszName, const char* pszFile, int nLine, void* cs)
{
    g_lockstack.push_back(CLockLocation{cs, pszName, pszFile, nLine});
}

void LeaveCritical(void* cs)
{
    for (auto it = g_lockstack.rbegin(); it != g_lockstack.rend(); ++it) {
        if (it->cs == cs) {
            g_lockstack.erase(std::next(it).base());
            return;
        }
    }
}

void AssertLockHeldInternal(const char* pszName, const char* pszFile, int nLine, void* cs)
{
    if (LockHeld(cs)) return;
    LogPrintf("Assertion failed: lock %s not held in %s:%d\n", pszName, pszFile, nLine);
    throw std::logic_error(strprintf("lock %s not held in %s:%d", pszName, pszFile, nLine));
}

void AssertLockNotHeldInternal(const char* pszName, const char* pszFile, int nLine, void* cs)
{
    if (!LockHeld(cs)) return;
    LogPrintf("Assertion failed: lock %s held in %s:%d\n", pszName, pszFile, nLine);
    throw std::logic_error(strprintf("lock %s held in %s:%d", pszName, pszFile, nLine));
}
