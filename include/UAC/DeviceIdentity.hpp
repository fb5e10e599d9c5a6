#pragma once

#include "UAC/Enums.hpp"
#include "UAC/Error.h"
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace spdlog { class logger; }

namespace UAC {

class IControlTransport;

/**
 * @brief Identity fields of the standard device descriptor.
 */
struct DeviceIdentity {
    uint16_t bcdUSB = 0;
    uint8_t deviceClass = 0;
    uint16_t vendorId = 0;
    uint16_t productId = 0;
    uint16_t bcdDevice = 0;
    uint8_t manufacturerIndex = 0; ///< iManufacturer, 0 when the device has no such string
    uint8_t productIndex = 0;      ///< iProduct
    uint8_t numConfigurations = 0;

    std::string manufacturerName = "Unknown";
    std::string productName = "Unknown";

    nlohmann::json toJson() const;
};

/**
 * @brief Reads the device descriptor at the head of a usbfs descriptor dump.
 * @return The identity, or nullopt when the buffer does not start with a device descriptor
 */
std::optional<DeviceIdentity> parseDeviceIdentity(std::span<const uint8_t> raw,
                                                  std::shared_ptr<spdlog::logger> logger = nullptr);

/**
 * @brief Fetches one string descriptor with GET_DESCRIPTOR and decodes it to UTF-8.
 * @param index String index (not 0, which holds the LANGID table)
 * @return The string, TransferError::UnexpectedLength for a malformed reply, or the transport error
 */
std::expected<std::string, TransferError> readStringDescriptor(IControlTransport& transport,
                                                               uint8_t index,
                                                               uint16_t langId,
                                                               uint32_t timeoutMs = kDefaultControlTimeoutMs);

/**
 * @brief Fills manufacturerName and productName from the device's string descriptors.
 *
 * Uses the first language of string descriptor 0. Names stay "Unknown" when there is
 * no transport, the index is 0, or the read fails.
 */
void readDeviceStrings(DeviceIdentity& identity,
                       IControlTransport* transport,
                       std::shared_ptr<spdlog::logger> logger = nullptr,
                       uint32_t timeoutMs = kDefaultControlTimeoutMs);

} // namespace UAC
