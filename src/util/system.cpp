// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/system.h"

#include <boost/algorithm/string/trim.hpp>

#include <fstream>

ArgsManager gArgs;

/** Interpret string as boolean, for argument parsing */
static bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (atoi(strValue.c_str()) != 0);
}

/** Turn -noX into -X=0 */
static void InterpretNegatedOption(std::string& key, std::string& val)
{
    if (key.substr(0, 3) == "-no") {
        bool bool_val = InterpretBool(val);
        key.erase(1, 2);
        val = bool_val ? "0" : "1";
    }
}

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error)
{
    LOCK(cs_args);
    m_override_args.clear();
    m_positional.clear();

    for (int i = 1; i < argc; i++) {
        std::string key(argv[i]);
        if (key.empty() || key[0] != '-') {
            for (; i < argc; i++) {
                m_positional.emplace_back(argv[i]);
            }
            break;
        }
        if (key == "-") {
            error = "Invalid parameter -";
            return false;
        }

        std::string val;
        size_t is_index = key.find('=');
        if (is_index != std::string::npos) {
            val = key.substr(is_index + 1);
            key.erase(is_index);
        }

        // Transform --foo to -foo
        if (key.length() > 1 && key[1] == '-')
            key = key.substr(1);

        InterpretNegatedOption(key, val);
        m_override_args[key].push_back(val);
    }
    return true;
}

std::vector<std::string> ArgsManager::GetPositionalArgs() const
{
    LOCK(cs_args);
    return m_positional;
}

bool ArgsManager::ReadConfigStream(std::istream& stream, std::string& error)
{
    LOCK(cs_args);
    std::string str;
    int linenr = 1;
    while (std::getline(stream, str)) {
        size_t pos;
        if ((pos = str.find('#')) != std::string::npos) {
            str = str.substr(0, pos);
        }
        boost::algorithm::trim(str);
        if (!str.empty()) {
            if ((pos = str.find('=')) == std::string::npos) {
                error = strprintf("parse error on line %d: %s", linenr, str);
                return false;
            }
            std::string name = "-" + boost::algorithm::trim_copy(str.substr(0, pos));
            std::string value = boost::algorithm::trim_copy(str.substr(pos + 1));
            if (name == "-") {
                error = strprintf("parse error on line %d: missing option name", linenr);
                return false;
            }
            InterpretNegatedOption(name, value);
            m_config_args[name].push_back(value);
        }
        ++linenr;
    }
    return true;
}

bool ArgsManager::ReadConfigFile(const std::string& strPath, std::string& error)
{
    std::ifstream stream(strPath);
    if (!stream.good()) {
        error = strprintf("cannot open config file %s", strPath);
        return false;
    }
    return ReadConfigStream(stream, error);
}

bool ArgsManager::GetArgValue(const std::string& strArg, std::string& strValue) const
{
    LOCK(cs_args);
    auto it = m_override_args.find(strArg);
    if (it != m_override_args.end() && !it->second.empty()) {
        strValue = it->second.back();
        return true;
    }
    it = m_config_args.find(strArg);
    if (it != m_config_args.end() && !it->second.empty()) {
        strValue = it->second.back();
        return true;
    }
    return false;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    LOCK(cs_args);
    std::vector<std::string> result;
    auto it = m_override_args.find(strArg);
    if (it != m_override_args.end()) {
        return it->second;
    }
    it = m_config_args.find(strArg);
    if (it != m_config_args.end()) {
        result = it->second;
    }
    return result;
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    std::string strValue;
    return GetArgValue(strArg, strValue);
}

bool ArgsManager::IsArgNegated(const std::string& strArg) const
{
    std::string strValue;
    return GetArgValue(strArg, strValue) && strValue == "0";
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    std::string strValue;
    if (GetArgValue(strArg, strValue)) return strValue;
    return strDefault;
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    std::string strValue;
    if (GetArgValue(strArg, strValue)) return atoll(strValue.c_str());
    return nDefault;
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    std::string strValue;
    if (GetArgValue(strArg, strValue)) return InterpretBool(strValue);
    return fDefault;
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    if (IsArgSet(strArg)) return false;
    ForceSetArg(strArg, strValue);
    return true;
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    m_override_args[strArg] = {strValue};
}

void ArgsManager::ClearArgs()
{
    LOCK(cs_args);
    m_override_args.clear();
    m_config_args.clear();
    m_positional.clear();
}
