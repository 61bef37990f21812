// FIXEDRATE - Vault Parameters Implementation
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#include "fixedrate/vault/params.h"
#include "fixedrate/core/errors.h"
#include "fixedrate/util/time.h"
#include "fixedrate/vault/vault.h"

#include <sstream>
#include <stdexcept>

namespace fixedrate {
namespace vault {

namespace {

Seconds ReadDelay(const util::ConfigManager& config, const char* key, Seconds fallback) {
    using util::ConfigKeys::VAULT_SECTION;

    if (!config.HasKey(key, VAULT_SECTION)) {
        return fallback;
    }
    auto value = config.TryGetDuration(key, VAULT_SECTION);
    if (!value) {
        throw std::invalid_argument(std::string("[vault] ") + key + " is not a duration: " +
                                    config.GetString(key, "", VAULT_SECTION));
    }
    return static_cast<Seconds>(*value);
}

} // namespace

std::string VaultParams::ToString() const {
    std::ostringstream oss;
    oss << "withdrawaldelay=" << util::FormatDuration(static_cast<int64_t>(withdrawalDelay))
        << " harvestdelay=" << util::FormatDuration(static_cast<int64_t>(harvestDelay))
        << " fixedrate=" << fixedRatePerSecond;
    return oss.str();
}

VaultParams LoadVaultParams(const util::ConfigManager& config) {
    using namespace util::ConfigKeys;

    VaultParams params;
    params.withdrawalDelay = ReadDelay(config, WITHDRAWALDELAY, params.withdrawalDelay);
    params.harvestDelay = ReadDelay(config, HARVESTDELAY, params.harvestDelay);

    if (config.HasKey(FIXEDRATE, VAULT_SECTION)) {
        auto rate = config.TryGetUInt(FIXEDRATE, VAULT_SECTION);
        if (!rate) {
            throw std::invalid_argument("[vault] fixedrate is not an unsigned integer: " +
                                        config.GetString(FIXEDRATE, "", VAULT_SECTION));
        }
        params.fixedRatePerSecond = *rate;
    }

    if (params.harvestDelay == 0) {
        throw ZeroDelayError("[vault] harvestdelay cannot be zero");
    }
    if (params.harvestDelay > MAX_HARVEST_DELAY) {
        throw DelayTooLongError("[vault] harvestdelay exceeds one year");
    }

    return params;
}

void ApplyVaultParams(FixedRateVault& vault, const AccountId& caller, const VaultParams& params) {
    if (vault.HarvestDelay() != params.harvestDelay) {
        vault.SetHarvestDelay(caller, params.harvestDelay);
    }
    if (vault.WithdrawalDelay() != params.withdrawalDelay) {
        vault.SetWithdrawalDelay(caller, params.withdrawalDelay);
    }
    if (vault.FixedRatePerSecond() != params.fixedRatePerSecond) {
        vault.SetFixedRate(caller, params.fixedRatePerSecond);
    }
}

} // namespace vault
} // namespace fixedrate
