// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "vault/vault_params.h"

#include "logging.h"
#include "util/system.h"
#include "util/time.h"
#include "validationstate.h"
#include "vault/vault_state.h"

#include <stdexcept>

const std::string CVaultParams::MAIN = "main";
const std::string CVaultParams::REGTEST = "regtest";

/**
 * Main preset
 */
class CMainVaultParams : public CVaultParams
{
public:
    CMainVaultParams()
    {
        strNetworkID = MAIN;

        vDefaultPlans = {
            // days, apy bps, min, max
            {7, 500, 10 * COIN, 10000 * COIN},
            {14, 800, 50 * COIN, 25000 * COIN},
            {30, 1200, 100 * COIN, 50000 * COIN},
            {90, 1800, 500 * COIN, 100000 * COIN},
        };
    }
};

/**
 * Regression test preset
 */
class CRegTestVaultParams : public CMainVaultParams
{
public:
    CRegTestVaultParams()
    {
        strNetworkID = REGTEST;

        vDefaultPlans.push_back({180, 2400, 100 * COIN, 100000 * COIN});
        vDefaultPlans.push_back({365, 3000, 100 * COIN, 100000 * COIN});
    }
};

static std::unique_ptr<CVaultParams> globalVaultParams;

const CVaultParams& VaultParams()
{
    if (!globalVaultParams) {
        throw std::logic_error("VaultParams: no preset selected");
    }
    return *globalVaultParams;
}

std::unique_ptr<CVaultParams> CreateVaultParams(const std::string& network)
{
    if (network == CVaultParams::MAIN)
        return std::make_unique<CMainVaultParams>();
    else if (network == CVaultParams::REGTEST)
        return std::make_unique<CRegTestVaultParams>();
    throw std::runtime_error(strprintf("%s: Unknown vault preset %s.", __func__, network));
}

void SelectVaultParams(const std::string& network)
{
    globalVaultParams = CreateVaultParams(network);
}

bool InitVaultConfig(const CVaultParams& params, const std::string& admin, VaultConfig& config)
{
    config = VaultConfig();
    config.strAdmin = admin;
    config.nMaturityBonusRate = params.MaturityBonusRate();
    config.nGlobalMultiplier = params.GlobalMultiplier();
    config.compoundingMode = params.DefaultCompoundingMode();

    for (const CPlanPreset& preset : params.DefaultPlans()) {
        CValidationState state;
        if (!config.plans.SetPlan(preset.nPlanId, preset.nPlanId * SECONDS_PER_DAY, preset.nBaseAPY,
                                  preset.nMinAmount, preset.nMaxAmount, true, state)) {
            return error("%s: preset %s plan %u rejected: %s", __func__,
                         params.NetworkIDString(), preset.nPlanId, state.ToString());
        }
    }

    if (!config.CheckInvariants()) {
        return error("%s: preset %s violates invariants", __func__, params.NetworkIDString());
    }

    LogPrint(BCLog::VAULT, "%s: preset=%s plans=%u admin=%s\n", __func__,
             params.NetworkIDString(), config.plans.Size(), admin);
    return true;
}

bool ApplyArgsToVaultConfig(const ArgsManager& args, VaultConfig& config, CValidationState& state)
{
    if (args.IsArgSet("-globalmultiplier")) {
        const int64_t nMultiplier = args.GetArg("-globalmultiplier", (int64_t)vault_interest::NEUTRAL_MULTIPLIER_BPS);
        if (nMultiplier < vault_interest::MIN_MULTIPLIER_BPS || nMultiplier > vault_interest::MAX_MULTIPLIER_BPS) {
            return state.Invalid(false, VaultError::VALIDATION, "bad-config-multiplier",
                                 strprintf("-globalmultiplier=%d outside [%u, %u]", nMultiplier,
                                           vault_interest::MIN_MULTIPLIER_BPS, vault_interest::MAX_MULTIPLIER_BPS));
        }
        config.nGlobalMultiplier = static_cast<uint32_t>(nMultiplier);
    }

    if (args.IsArgSet("-compounding")) {
        const std::string strMode = args.GetArg("-compounding", "bounded");
        vault_interest::CompoundingMode mode;
        if (!vault_interest::CompoundingModeFromString(strMode, mode)) {
            return state.Invalid(false, VaultError::VALIDATION, "bad-config-compounding",
                                 strprintf("-compounding=%s (expected bounded, exact or continuous)", strMode));
        }
        config.compoundingMode = mode;
    }

    if (args.IsArgSet("-bonusrate")) {
        const int64_t nRate = args.GetArg("-bonusrate", (int64_t)vault_interest::DEFAULT_MATURITY_BONUS_BPS);
        if (nRate < 0 || nRate > vault_interest::BPS_DENOMINATOR) {
            return state.Invalid(false, VaultError::VALIDATION, "bad-config-bonusrate",
                                 strprintf("-bonusrate=%d outside [0, %u]", nRate, vault_interest::BPS_DENOMINATOR));
        }
        config.nMaturityBonusRate = static_cast<uint32_t>(nRate);
    }

    LogPrint(BCLog::VAULT, "%s: globalmultiplier=%u compounding=%s bonusrate=%u\n", __func__,
             config.nGlobalMultiplier, vault_interest::CompoundingModeToString(config.compoundingMode),
             config.nMaturityBonusRate);
    return true;
}
