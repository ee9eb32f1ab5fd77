// STAKELEDGER - Ledger Parameters Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/ledger/params.h"
#include "stakeledger/util/config.h"
#include "stakeledger/util/logging.h"

#include <cctype>
#include <sstream>

namespace stakeledger {
namespace ledger {

std::string LedgerParameters::ToString() const {
    std::ostringstream ss;
    ss << "LedgerParameters(rate=" << annualRatePercent << "%"
       << ", cooldown=" << cooldownSeconds << "s"
       << ", base=" << (baseToken.empty() ? "<unset>" : baseToken)
       << ", reward=" << (rewardToken.empty() ? "<unset>" : rewardToken) << ")";
    return ss.str();
}

bool IsValidSymbol(const std::string& symbol) {
    if (symbol.empty() || symbol.size() > MAX_SYMBOL_LENGTH) {
        return false;
    }
    for (char c : symbol) {
        if (!std::isalnum(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

LedgerResult ValidateParameters(const LedgerParameters& params) {
    if (!IsValidAnnualRate(params.annualRatePercent)) {
        return LedgerResult::Error(LedgerError::RATE_OUT_OF_RANGE,
            "annual rate " + std::to_string(params.annualRatePercent) +
            " exceeds " + std::to_string(MAX_ANNUAL_RATE));
    }
    if (!IsValidCooldown(params.cooldownSeconds)) {
        return LedgerResult::Error(LedgerError::COOLDOWN_OUT_OF_RANGE,
            "cooldown " + std::to_string(params.cooldownSeconds) +
            "s outside [0, " + std::to_string(MAX_COOLDOWN) + "]");
    }
    if (!params.baseToken.empty() && !IsValidSymbol(params.baseToken)) {
        return LedgerResult::Error(LedgerError::TOKEN_NOT_SET,
            "invalid base token symbol '" + params.baseToken + "'");
    }
    if (!params.rewardToken.empty() && !IsValidSymbol(params.rewardToken)) {
        return LedgerResult::Error(LedgerError::TOKEN_NOT_SET,
            "invalid reward token symbol '" + params.rewardToken + "'");
    }
    return LedgerResult::Ok();
}

LedgerResult LoadParametersFromConfig(const util::ConfigManager& config,
                                      LedgerParameters& out) {
    LedgerParameters params;

    if (config.HasKey(util::ConfigKeys::ANNUALRATE)) {
        auto rate = config.TryGetUInt(util::ConfigKeys::ANNUALRATE);
        if (!rate || !IsValidAnnualRate(*rate)) {
            return LedgerResult::Error(LedgerError::RATE_OUT_OF_RANGE,
                "annualrate must be an integer in [0, " +
                std::to_string(MAX_ANNUAL_RATE) + "]");
        }
        params.annualRatePercent = static_cast<uint32_t>(*rate);
    }

    if (config.HasKey(util::ConfigKeys::COOLDOWN)) {
        auto cooldown = config.TryGetInt(util::ConfigKeys::COOLDOWN);
        if (!cooldown || !IsValidCooldown(*cooldown)) {
            return LedgerResult::Error(LedgerError::COOLDOWN_OUT_OF_RANGE,
                "cooldown must be an integer number of seconds in [0, " +
                std::to_string(MAX_COOLDOWN) + "]");
        }
        params.cooldownSeconds = *cooldown;
    }

    params.baseToken = config.GetString(util::ConfigKeys::BASETOKEN, "");
    params.rewardToken = config.GetString(util::ConfigKeys::REWARDTOKEN, "");

    auto result = ValidateParameters(params);
    if (!result.ok()) {
        return result;
    }

    LOG_DEBUG(util::LogCategory::CONFIG) << "Genesis " << params.ToString();
    out = params;
    return LedgerResult::Ok();
}

} // namespace ledger
} // namespace stakeledger
