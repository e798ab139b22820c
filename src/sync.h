// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PIGGY_SYNC_H
#define PIGGY_SYNC_H

#include <mutex>
#include <type_traits>

////////////////////////////////////////////////
//                                            //
// THE SIMPLE DEFINITION, EXCLUDING DEBUG CODE //
//                                            //
////////////////////////////////////////////////

/*
RecursiveMutex mutex;
    std::recursive_mutex mutex;

LOCK(mutex);
    std::unique_lock<std::recursive_mutex> criticalblock(mutex);

AssertLockHeld(mutex);
    throws std::logic_error unless the current thread holds mutex
*/

///////////////////////////////
//                           //
// THE ACTUAL IMPLEMENTATION //
//                           //
///////////////////////////////

/**
 * Template mixin that adds lock bookkeeping hooks to a standard mutex.
 */
template <typename PARENT>
class AnnotatedMixin : public PARENT
{
public:
    ~AnnotatedMixin() {}

    void lock()
    {
        PARENT::lock();
    }

    void unlock()
    {
        PARENT::unlock();
    }

    bool try_lock()
    {
        return PARENT::try_lock();
    }
};

/**
 * Wrapped mutex: supports recursive locking, but no waiting
 */
typedef AnnotatedMixin<std::recursive_mutex> RecursiveMutex;

/** Wrapped mutex: supports waiting but not recursive locking */
typedef AnnotatedMixin<std::mutex> Mutex;

void EnterCritical(const char* pszName, const char* pszFile, int nLine, void* cs);
void LeaveCritical(void* cs);
void AssertLockHeldInternal(const char* pszName, const char* pszFile, int nLine, void* cs);
void AssertLockNotHeldInternal(const char* pszName, const char* pszFile, int nLine, void* cs);

#define AssertLockHeld(cs) AssertLockHeldInternal(#cs, __FILE__, __LINE__, &cs)
#define AssertLockNotHeld(cs) AssertLockNotHeldInternal(#cs, __FILE__, __LINE__, &cs)

/** Wrapper around std::unique_lock style lock for Mutex. */
template <typename MutexType>
class UniqueLock : public std::unique_lock<MutexType>
{
private:
    typedef std::unique_lock<MutexType> Base;

public:
    UniqueLock(MutexType& mutexIn, const char* pszName, const char* pszFile, int nLine) : Base(mutexIn)
    {
        EnterCritical(pszName, pszFile, nLine, (void*)(Base::mutex()));
    }

    ~UniqueLock()
    {
        if (Base::owns_lock())
            LeaveCritical((void*)(Base::mutex()));
    }
};

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) UniqueLock<typename std::remove_reference<decltype(cs)>::type> PASTE2(criticalblock, __COUNTER__)(cs, #cs, __FILE__, __LINE__)

#endif // PIGGY_SYNC_H
