// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "logging.h"
#include "util/system.h"
#include "util/time.h"
#include "validationstate.h"
#include "vault/vault_interfaces.h"
#include "vault/vault_manager.h"
#include "vault/vault_memledger.h"
#include "vault/vault_params.h"
#include "vault/vault_script.h"

#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>

static const char* const DEFAULT_ADMIN = "admin";

static std::string HelpMessage(const std::vector<std::string>& vCommands)
{
    std::string strUsage = "Usage: piggyvault [options] [script]\n\n"
                           "Runs vault commands from <script>, or from stdin, one per line.\n\n"
                           "Options:\n";
    strUsage += "  -conf=<file>              Read options from <file> (name=value per line)\n";
    strUsage += "  -regtest                  Use the regtest plan preset (adds 180d and 365d plans)\n";
    strUsage += "  -admin=<name>             Vault admin identity (default: " + std::string(DEFAULT_ADMIN) + ")\n";
    strUsage += "  -starttime=<n>            Initial clock, seconds since epoch (default: now)\n";
    strUsage += "  -globalmultiplier=<bps>   Global APY multiplier, 5000..20000\n";
    strUsage += "  -compounding=<mode>       bounded, exact or continuous (default: bounded)\n";
    strUsage += "  -bonusrate=<bps>          Maturity bonus rate (default: 500)\n";
    strUsage += "  -printtoconsole           Send log output to stdout\n";
    strUsage += "  -debuglogfile=<file>      Also write the log to <file>\n";
    strUsage += "  -debug=<category>         Enable debug logging: " + ListLogCategories() + ", 1 for all\n";
    strUsage += "  -nologtimestamps          Do not prepend timestamps to log lines\n";
    strUsage += "\nCommands:\n";
    for (const std::string& strCommand : vCommands) {
        strUsage += "  " + strCommand + "\n";
    }
    return strUsage;
}

static bool InitLogging()
{
    BCLog::Logger& logger = LogInstance();
    logger.m_print_to_console = gArgs.GetBoolArg("-printtoconsole", false);
    logger.m_log_timestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);

    if (gArgs.IsArgSet("-debuglogfile")) {
        logger.m_print_to_file = true;
        logger.m_file_path = gArgs.GetArg("-debuglogfile", DEFAULT_DEBUGLOGFILE);
        if (!logger.OpenDebugLog()) {
            std::cerr << "Error: could not open debug log file " << logger.m_file_path << std::endl;
            return false;
        }
    }

    if (!gArgs.IsArgNegated("-debug")) {
        for (const std::string& cat : gArgs.GetArgs("-debug")) {
            if (!logger.EnableCategory(cat)) {
                std::cerr << "Warning: unsupported logging category -debug=" << cat << std::endl;
            }
        }
    }
    return true;
}

static int AppMain(int argc, char* argv[])
{
    std::string strError;
    if (!gArgs.ParseParameters(argc, argv, strError)) {
        std::cerr << "Error parsing command line arguments: " << strError << std::endl;
        return EXIT_FAILURE;
    }

    if (gArgs.IsArgSet("-conf")) {
        if (!gArgs.ReadConfigFile(gArgs.GetArg("-conf", ""), strError)) {
            std::cerr << "Error reading configuration file: " << strError << std::endl;
            return EXIT_FAILURE;
        }
    }

    if (!InitLogging()) {
        return EXIT_FAILURE;
    }

    SelectVaultParams(gArgs.GetBoolArg("-regtest", false) ? CVaultParams::REGTEST : CVaultParams::MAIN);

    VaultConfig config;
    if (!InitVaultConfig(VaultParams(), gArgs.GetArg("-admin", DEFAULT_ADMIN), config)) {
        std::cerr << "Error: failed to initialize vault configuration" << std::endl;
        return EXIT_FAILURE;
    }

    CValidationState state;
    if (!ApplyArgsToVaultConfig(gArgs, config, state)) {
        std::cerr << "Error: " << state.ToString() << std::endl;
        return EXIT_FAILURE;
    }

    CMemoryTokenLedger ledger;
    CLoggingRewardNotifier notifier;
    CManualClock clock(gArgs.GetArg("-starttime", GetTime()));
    CVaultManager manager(config, ledger, notifier, clock);
    CVaultScript script(manager, ledger, clock);

    if (gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help")) {
        std::cout << HelpMessage(script.ListCommands());
        return EXIT_SUCCESS;
    }

    LogPrintf("PiggyVault starting: preset=%s admin=%s compounding=%s time=%s\n",
              VaultParams().NetworkIDString(), config.strAdmin,
              vault_interest::CompoundingModeToString(config.compoundingMode),
              FormatISO8601DateTime(clock.Now()));

    unsigned int nFailures = 0;
    const std::vector<std::string> vPositional = gArgs.GetPositionalArgs();
    if (vPositional.empty()) {
        nFailures = script.Run(std::cin, std::cout);
    } else {
        std::ifstream file(vPositional[0]);
        if (!file.is_open()) {
            std::cerr << "Error: cannot open script " << vPositional[0] << std::endl;
            return EXIT_FAILURE;
        }
        nFailures = script.Run(file, std::cout);
    }

    if (!manager.CheckInvariants()) {
        LogPrintf("ERROR: vault invariants violated at shutdown\n");
        return EXIT_FAILURE;
    }

    LogPrintf("PiggyVault done: %u deposit(s), %u failed command(s)\n", manager.GetDepositCount(), nFailures);
    return nFailures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}

int main(int argc, char* argv[])
{
    try {
        return AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }
    return EXIT_FAILURE;
}
