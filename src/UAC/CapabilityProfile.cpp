// src/UAC/CapabilityProfile.cpp
#include "UAC/CapabilityProfile.hpp"
#include "UAC/JsonHelpers.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <sstream>

namespace UAC {

std::string EndpointInfo::toString() const {
    std::ostringstream oss;
    oss << "EP " << JsonHelpers::hexByteToString(address)
        << " (if " << static_cast<int>(interfaceNumber)
        << " alt " << static_cast<int>(alternateSetting) << "): "
        << static_cast<int>(channels) << "ch "
        << static_cast<int>(bitResolution) << "-bit @ "
        << sampleRate << " Hz"
        << ", maxPacket " << maxPacketSize
        << (sampleRateSettable ? ", rate settable" : "");
    return oss.str();
}

nlohmann::json EndpointInfo::toJson() const {
    nlohmann::json j;
    j["address"] = address;
    j["maxPacketSize"] = maxPacketSize;
    j["channels"] = channels;
    j["bitResolution"] = bitResolution;
    j["sampleRate"] = sampleRate;
    j["sampleRateSettable"] = sampleRateSettable;
    j["interfaceNumber"] = interfaceNumber;
    j["alternateSetting"] = alternateSetting;
    return j;
}

bool CapabilityProfile::supportsSampleRate(uint32_t rate) const {
    return std::binary_search(sampleRates_.begin(), sampleRates_.end(), rate);
}

std::expected<uint32_t, TransferError> CapabilityProfile::requireSampleRate() const {
    if (!sampleRates_.empty()) {
        return sampleRates_.back();
    }
    return std::unexpected(clockQueryError_.value_or(TransferError::NotFound));
}

std::string CapabilityProfile::toString() const {
    std::ostringstream oss;
    oss << JsonHelpers::uacVersionToString(uacVersion_) << ", rates: ";
    if (sampleRates_.empty()) {
        oss << "none";
    }
    for (size_t i = 0; i < sampleRates_.size(); ++i) {
        if (i != 0) oss << ", ";
        oss << sampleRates_[i];
    }
    if (!endpoints_.empty()) {
        oss << "\n  Endpoints (" << endpoints_.size() << "):";
        for (const auto& ep : endpoints_) {
            oss << "\n    - " << ep.toString();
        }
    } else {
        oss << "\n  Endpoints: None";
    }
    if (clockQueryError_) {
        oss << "\n  Clock query failed: " << JsonHelpers::transferErrorToString(*clockQueryError_);
    }
    return oss.str();
}

nlohmann::json CapabilityProfile::toJson() const {
    nlohmann::json j;
    j["uacVersion"] = getUacVersionNumber();
    j["sampleRates"] = sampleRates_;
    nlohmann::json endpointsJson = nlohmann::json::array();
    for (const auto& ep : endpoints_) {
        endpointsJson.push_back(ep.toJson());
    }
    j["endpoints"] = endpointsJson;
    if (clockQueryError_) {
        j["clockQueryError"] = JsonHelpers::transferErrorToString(*clockQueryError_);
    }
    return j;
}

} // namespace UAC
