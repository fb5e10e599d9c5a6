// include/UAC/CapabilityProfile.hpp
#pragma once

#include "UAC/Enums.hpp"
#include "UAC/Error.h"
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace UAC {

/**
 * @brief One isochronous audio endpoint together with the format it carries.
 */
struct EndpointInfo {
    uint8_t address = 0;            ///< bEndpointAddress, 0 when no IN isochronous endpoint preceded
    uint16_t maxPacketSize = 0;     ///< wMaxPacketSize of that endpoint
    uint8_t channels = 0;
    uint8_t bitResolution = 0;
    uint32_t sampleRate = 0;        ///< Hz
    bool sampleRateSettable = false;
    uint8_t interfaceNumber = 0;
    uint8_t alternateSetting = 0;

    std::string toString() const;
    nlohmann::json toJson() const;
};

/**
 * @brief Audio capabilities recovered from a device's descriptors.
 *        Immutable once returned by the resolver.
 */
class CapabilityProfile {
public:
    CapabilityProfile() = default;
    CapabilityProfile(UacVersion version,
                      std::vector<uint32_t> sampleRates,
                      std::vector<EndpointInfo> endpoints,
                      std::optional<TransferError> clockQueryError = std::nullopt)
      : uacVersion_(version),
        sampleRates_(std::move(sampleRates)),
        endpoints_(std::move(endpoints)),
        clockQueryError_(clockQueryError) {}

    UacVersion getUacVersion() const { return uacVersion_; }
    int getUacVersionNumber() const { return static_cast<int>(uacVersion_); }

    /// Ascending, without duplicates.
    const std::vector<uint32_t>& getSampleRates() const { return sampleRates_; }

    /// In descriptor order.
    const std::vector<EndpointInfo>& getEndpoints() const { return endpoints_; }

    /// Last failed live clock read, if any, kept for diagnostics.
    std::optional<TransferError> getClockQueryError() const { return clockQueryError_; }

    bool supportsSampleRate(uint32_t rate) const;

    /**
     * @brief Highest supported rate, for callers that cannot proceed without one.
     * @return The rate, or the live clock read failure that left the set empty
     *         (TransferError::NotFound when no source declared any rate)
     */
    std::expected<uint32_t, TransferError> requireSampleRate() const;

    std::string toString() const;
    nlohmann::json toJson() const;

private:
    UacVersion uacVersion_{UacVersion::Uac1};
    std::vector<uint32_t> sampleRates_;
    std::vector<EndpointInfo> endpoints_;
    std::optional<TransferError> clockQueryError_;
};

} // namespace UAC
