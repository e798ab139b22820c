// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PIGGY_VAULT_PARAMS_H
#define PIGGY_VAULT_PARAMS_H

#include "amount.h"
#include "vault/vault_interest.h"

#include <memory>
#include <stdint.h>
#include <string>
#include <vector>

class ArgsManager;
class CValidationState;
struct VaultConfig;

/** One row of a preset plan catalog */
struct CPlanPreset
{
    uint32_t nPlanId;
    uint32_t nBaseAPY;
    CAmount nMinAmount;
    CAmount nMaxAmount;
};

/**
 * CVaultParams - defines the preset a vault starts from
 *
 * main:    7d / 14d / 30d / 90d plans
 * regtest: main plus 180d / 365d, for exercising the long tiers
 */
class CVaultParams
{
public:
    static const std::string MAIN;
    static const std::string REGTEST;

    virtual ~CVaultParams() {}

    const std::string& NetworkIDString() const { return strNetworkID; }
    const std::vector<CPlanPreset>& DefaultPlans() const { return vDefaultPlans; }
    uint32_t MaturityBonusRate() const { return nMaturityBonusRate; }
    uint32_t GlobalMultiplier() const { return nGlobalMultiplier; }
    vault_interest::CompoundingMode DefaultCompoundingMode() const { return compoundingMode; }

protected:
    CVaultParams() {}

    std::string strNetworkID;
    std::vector<CPlanPreset> vDefaultPlans;
    uint32_t nMaturityBonusRate{vault_interest::DEFAULT_MATURITY_BONUS_BPS};
    uint32_t nGlobalMultiplier{vault_interest::NEUTRAL_MULTIPLIER_BPS};
    vault_interest::CompoundingMode compoundingMode{vault_interest::CompoundingMode::BOUNDED_DAILY};
};

/**
 * Creates and returns a std::unique_ptr<CVaultParams> of the chosen preset.
 * @throws std::runtime_error when the preset is not supported.
 */
std::unique_ptr<CVaultParams> CreateVaultParams(const std::string& network);

/**
 * Return the currently selected parameters.
 * @throws std::logic_error if SelectVaultParams has not been called.
 */
const CVaultParams& VaultParams();

/**
 * Sets the params returned by VaultParams() to those for the given network.
 * @throws std::runtime_error when the preset is not supported.
 */
void SelectVaultParams(const std::string& network);

/**
 * InitVaultConfig - Reset config to a preset
 *
 * Installs every preset plan (neutral multiplier), the bonus rate, the
 * global multiplier and the compounding mode, and sets the admin.
 */
bool InitVaultConfig(const CVaultParams& params, const std::string& admin, VaultConfig& config);

/**
 * ApplyArgsToVaultConfig - Overrides from the command line / config file
 *
 * -globalmultiplier=<bps>                (bad-config-multiplier)
 * -compounding=bounded|exact|continuous  (bad-config-compounding)
 * -bonusrate=<bps>                       (bad-config-bonusrate)
 */
bool ApplyArgsToVaultConfig(const ArgsManager& args, VaultConfig& config, CValidationState& state);

#endif // PIGGY_VAULT_PARAMS_H
