// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PIGGY_LOGGING_H
#define PIGGY_LOGGING_H

#include "util/format.h"

#include <atomic>
#include <cstdio>
#include <functional>
#include <list>
#include <mutex>
#include <stdint.h>
#include <string>
#include <vector>

static const bool DEFAULT_LOGTIMESTAMPS = true;
extern const char* const DEFAULT_DEBUGLOGFILE;

struct CLogCategoryActive
{
    std::string category;
    bool active;
};

namespace BCLog {

enum LogFlags : uint32_t {
    NONE        = 0,
    VAULT       = (1 << 0),
    YIELD       = (1 << 1),
    REWARD      = (1 << 2),
    ADMIN       = (1 << 3),
    LEDGER      = (1 << 4),
    ALL         = ~(uint32_t)0,
};

class Logger
{
private:
    mutable std::mutex m_cs;
    FILE* m_fileout = nullptr;
    std::list<std::function<void(const std::string&)>> m_print_callbacks;

    /** Log categories bitfield. */
    std::atomic<uint32_t> m_categories{0};

    /** True while the last line written ended with a newline */
    bool m_started_new_line{true};

    std::string LogTimestampStr(const std::string& str);

public:
    bool m_print_to_console = false;
    bool m_print_to_file = false;
    bool m_log_timestamps = DEFAULT_LOGTIMESTAMPS;

    std::string m_file_path;

    ~Logger();

    /** Send a string to the log output */
    void LogPrintStr(const std::string& str);

    /** Returns whether logs will be written to any output */
    bool Enabled() const;

    /** Connect a slot to the print signal and return the connection */
    std::list<std::function<void(const std::string&)>>::iterator PushBackCallback(std::function<void(const std::string&)> fun);
    void DeleteCallback(std::list<std::function<void(const std::string&)>>::iterator it);

    bool OpenDebugLog();
    void CloseDebugLog();

    uint32_t GetCategoryMask() const { return m_categories.load(); }

    void EnableCategory(LogFlags flag);
    bool EnableCategory(const std::string& str);
    void DisableCategory(LogFlags flag);
    bool DisableCategory(const std::string& str);

    bool WillLogCategory(LogFlags category) const;
};

} // namespace BCLog

BCLog::Logger& LogInstance();

/** Return true if log accepts specified category */
static inline bool LogAcceptCategory(BCLog::LogFlags category)
{
    return LogInstance().WillLogCategory(category);
}

/** Returns a string with the log categories. */
std::string ListLogCategories();

/** Returns a vector of the active log categories. */
std::vector<CLogCategoryActive> ListActiveLogCategories();

/** Return true if str parses as a log category and set the flag */
bool GetLogCategory(BCLog::LogFlags& flag, const std::string& str);

template <typename... Args>
static inline void LogPrintf(const char* fmt, const Args&... args)
{
    if (LogInstance().Enabled()) {
        std::string log_msg;
        try {
            log_msg = util_format::format(fmt, args...);
        } catch (const boost::io::format_error& fmterr) {
            /* Original format string will have newline so don't add one here */
            log_msg = "Error \"" + std::string(fmterr.what()) + "\" while formatting log message: " + fmt;
        }
        LogInstance().LogPrintStr(log_msg);
    }
}

// Use a macro instead of a function for conditional logging to prevent
// evaluating arguments when logging for the category is not enabled.
#define LogPrint(category, ...)              \
    do {                                     \
        if (LogAcceptCategory((category))) { \
            LogPrintf(__VA_ARGS__);          \
        }                                    \
    } while (0)

#endif // PIGGY_LOGGING_H
