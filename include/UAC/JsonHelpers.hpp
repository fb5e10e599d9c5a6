#pragma once
#include "UAC/Enums.hpp"
#include "UAC/Error.h"
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>

namespace UAC::JsonHelpers {
    using json = nlohmann::json;

    std::string uacVersionToString(UacVersion version);
    std::string formatModeToString(FormatMode mode);
    std::string transferErrorToString(TransferError error);
    std::string hexByteToString(uint8_t value);
    std::string hexWordToString(uint16_t value);
    json serializeHexBytes(const std::vector<uint8_t>& bytes);

    // Strings from argv or the device may not be valid UTF-8; those bytes become U+FFFD
    std::string dumpReport(const json& report, int indent = 2);
}
