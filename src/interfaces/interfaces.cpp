// FIXEDRATE - Interface Helpers
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#include "fixedrate/interfaces/authority.h"
#include "fixedrate/interfaces/host.h"
#include "fixedrate/util/time.h"

#include <algorithm>
#include <cctype>

namespace fixedrate {

const char* OperationToString(Operation op) {
    switch (op) {
        case Operation::Initialize:         return "Initialize";
        case Operation::Harvest:            return "Harvest";
        case Operation::ClaimProfit:        return "ClaimProfit";
        case Operation::SetWithdrawalDelay: return "SetWithdrawalDelay";
        case Operation::SetHarvestDelay:    return "SetHarvestDelay";
        case Operation::SetFixedRate:       return "SetFixedRate";
        default:                            return "Unknown";
    }
}

std::optional<Operation> ParseOperation(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "initialize")         return Operation::Initialize;
    if (lower == "harvest")            return Operation::Harvest;
    if (lower == "claimprofit")        return Operation::ClaimProfit;
    if (lower == "setwithdrawaldelay") return Operation::SetWithdrawalDelay;
    if (lower == "setharvestdelay")    return Operation::SetHarvestDelay;
    if (lower == "setfixedrate")       return Operation::SetFixedRate;
    return std::nullopt;
}

Timestamp SystemHost::Now() const {
    return util::GetTime();
}

} // namespace fixedrate
