#include "UAC/JsonHelpers.hpp"
#include <nlohmann/json.hpp>
#include <sstream>
#include <iomanip>

namespace UAC::JsonHelpers {
    std::string uacVersionToString(UacVersion version) {
        switch (version) {
            case UacVersion::Uac1: return "UAC1";
            case UacVersion::Uac2: return "UAC2";
            default: return "Unknown";
        }
    }
    std::string formatModeToString(FormatMode mode) {
        return (mode == FormatMode::Uac2) ? "UAC2" : "UAC1";
    }
    std::string transferErrorToString(TransferError error) {
        return make_error_code(error).message();
    }
    std::string hexByteToString(uint8_t value) {
        std::ostringstream oss;
        oss << "0x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(value);
        return oss.str();
    }
    std::string hexWordToString(uint16_t value) {
        std::ostringstream oss;
        oss << "0x" << std::hex << std::setw(4) << std::setfill('0') << value;
        return oss.str();
    }
    json serializeHexBytes(const std::vector<uint8_t>& bytes) {
        if (bytes.empty()) return nullptr;
        std::ostringstream oss;
        oss << std::hex << std::uppercase << std::setfill('0');
        for (const auto& byte : bytes) {
            oss << std::setw(2) << static_cast<int>(byte);
        }
        return oss.str();
    }
    std::string dumpReport(const json& report, int indent) {
        return report.dump(indent, ' ', false, json::error_handler_t::replace);
    }
}
