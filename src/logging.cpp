// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "logging.h"

#include "util/time.h"

#include <iostream>

const char* const DEFAULT_DEBUGLOGFILE = "debug.log";

BCLog::Logger& LogInstance()
{
    // Leaked on purpose so that logging from static destructors stays valid.
    static BCLog::Logger* g_logger{new BCLog::Logger()};
    return *g_logger;
}

struct CLogCategoryDesc
{
    BCLog::LogFlags flag;
    std::string category;
};

const CLogCategoryDesc LogCategories[] =
{
    {BCLog::NONE, "0"},
    {BCLog::NONE, "none"},
    {BCLog::VAULT, "vault"},
    {BCLog::YIELD, "yield"},
    {BCLog::REWARD, "reward"},
    {BCLog::ADMIN, "admin"},
    {BCLog::LEDGER, "ledger"},
    {BCLog::ALL, "1"},
    {BCLog::ALL, "all"},
};

bool GetLogCategory(BCLog::LogFlags& flag, const std::string& str)
{
    if (str.empty()) {
        flag = BCLog::ALL;
        return true;
    }
    for (const CLogCategoryDesc& category_desc : LogCategories) {
        if (category_desc.category == str) {
            flag = category_desc.flag;
            return true;
        }
    }
    return false;
}

std::string ListLogCategories()
{
    std::string ret;
    int outcount = 0;
    for (const CLogCategoryDesc& category_desc : LogCategories) {
        // Omit the special cases.
        if (category_desc.flag != BCLog::NONE && category_desc.flag != BCLog::ALL) {
            if (outcount != 0) ret += ", ";
            ret += category_desc.category;
            outcount++;
        }
    }
    return ret;
}

std::vector<CLogCategoryActive> ListActiveLogCategories()
{
    std::vector<CLogCategoryActive> ret;
    for (const CLogCategoryDesc& category_desc : LogCategories) {
        if (category_desc.flag != BCLog::NONE && category_desc.flag != BCLog::ALL) {
            CLogCategoryActive catActive;
            catActive.category = category_desc.category;
            catActive.active = LogAcceptCategory(category_desc.flag);
            ret.push_back(catActive);
        }
    }
    return ret;
}

namespace BCLog {

Logger::~Logger()
{
    CloseDebugLog();
}

bool Logger::Enabled() const
{
    std::lock_guard<std::mutex> lock(m_cs);
    return m_print_to_file || m_print_to_console || !m_print_callbacks.empty();
}

std::list<std::function<void(const std::string&)>>::iterator Logger::PushBackCallback(std::function<void(const std::string&)> fun)
{
    std::lock_guard<std::mutex> lock(m_cs);
    m_print_callbacks.push_back(std::move(fun));
    return --m_print_callbacks.end();
}

void Logger::DeleteCallback(std::list<std::function<void(const std::string&)>>::iterator it)
{
    std::lock_guard<std::mutex> lock(m_cs);
    m_print_callbacks.erase(it);
}

bool Logger::OpenDebugLog()
{
    std::lock_guard<std::mutex> lock(m_cs);

    if (m_fileout) return true;
    if (m_file_path.empty()) return false;

    m_fileout = fopen(m_file_path.c_str(), "a");
    if (!m_fileout) {
        return false;
    }
    setbuf(m_fileout, nullptr); // unbuffered
    return true;
}

void Logger::CloseDebugLog()
{
    std::lock_guard<std::mutex> lock(m_cs);
    if (m_fileout) {
        fclose(m_fileout);
        m_fileout = nullptr;
    }
}

void Logger::EnableCategory(LogFlags flag)
{
    m_categories |= flag;
}

bool Logger::EnableCategory(const std::string& str)
{
    LogFlags flag;
    if (!GetLogCategory(flag, str)) return false;
    EnableCategory(flag);
    return true;
}

void Logger::DisableCategory(LogFlags flag)
{
    m_categories &= ~flag;
}

bool Logger::DisableCategory(const std::string& str)
{
    LogFlags flag;
    if (!GetLogCategory(flag, str)) return false;
    DisableCategory(flag);
    return true;
}

bool Logger::WillLogCategory(LogFlags category) const
{
    return (m_categories.load(std::memory_order_relaxed) & category) != 0;
}

std::string Logger::LogTimestampStr(const std::string& str)
{
    std::string strStamped;

    if (!m_log_timestamps)
        return str;

    if (m_started_new_line) {
        strStamped = FormatISO8601DateTime(GetTime()) + ' ' + str;
    } else {
        strStamped = str;
    }

    return strStamped;
}

void Logger::LogPrintStr(const std::string& str)
{
    std::lock_guard<std::mutex> lock(m_cs);
    std::string str_prefixed = LogTimestampStr(str);

    m_started_new_line = !str.empty() && str[str.size() - 1] == '\n';

    if (m_print_to_console) {
        // print to console
        fwrite(str_prefixed.data(), 1, str_prefixed.size(), stdout);
        fflush(stdout);
    }
    for (const auto& cb : m_print_callbacks) {
        cb(str_prefixed);
    }
    if (m_print_to_file && m_fileout) {
        fwrite(str_prefixed.data(), 1, str_prefixed.size(), m_fileout);
    }
}

} // namespace BCLog
