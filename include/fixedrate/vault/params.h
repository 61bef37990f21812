// FIXEDRATE - Vault Parameters
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#ifndef FIXEDRATE_VAULT_PARAMS_H
#define FIXEDRATE_VAULT_PARAMS_H

#include "fixedrate/core/types.h"
#include "fixedrate/util/config.h"

#include <string>

namespace fixedrate {
namespace vault {

class FixedRateVault;

/// Default minimum time between harvests (6 hours)
constexpr Seconds DEFAULT_HARVEST_DELAY = 6 * 60 * 60;

/**
 * Operating parameters of a vault, as configured.
 */
struct VaultParams {
    Seconds withdrawalDelay{0};
    Seconds harvestDelay{DEFAULT_HARVEST_DELAY};
    uint64_t fixedRatePerSecond{0};

    std::string ToString() const;
};

/**
 * Read [vault] withdrawaldelay, harvestdelay and fixedrate.
 *
 * Delays accept plain seconds or a unit suffix (15m, 6h, 7d).
 *
 * @throws std::invalid_argument for a malformed value
 * @throws ZeroDelayError / DelayTooLongError for an out-of-range harvest delay
 */
VaultParams LoadVaultParams(const util::ConfigManager& config);

/**
 * Push params into vault through its privileged setters, as caller.
 * The harvest delay follows the usual staging rule.
 */
void ApplyVaultParams(FixedRateVault& vault, const AccountId& caller, const VaultParams& params);

} // namespace vault
} // namespace fixedrate

#endif // FIXEDRATE_VAULT_PARAMS_H
