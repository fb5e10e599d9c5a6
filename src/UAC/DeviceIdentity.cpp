#include "UAC/DeviceIdentity.hpp"
#include "UAC/Helpers.h"
#include "UAC/IControlTransport.h"
#include "UAC/JsonHelpers.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <vector>

namespace UAC {

namespace {

constexpr uint16_t kReplacementCharacter = 0xFFFD;

void appendUtf8(std::string& out, uint32_t codePoint) {
    if (codePoint < 0x80) {
        out.push_back(static_cast<char>(codePoint));
    } else if (codePoint < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    } else if (codePoint < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    }
}

// String descriptors carry UTF-16LE; unpaired surrogates become U+FFFD
std::string utf16leToUtf8(const uint8_t* data, size_t units) {
    std::string out;
    for (size_t i = 0; i < units; ++i) {
        uint32_t unit = Helpers::readLE16(data + i * 2);
        if (unit >= 0xD800 && unit <= 0xDBFF && i + 1 < units) {
            uint32_t low = Helpers::readLE16(data + (i + 1) * 2);
            if (low >= 0xDC00 && low <= 0xDFFF) {
                appendUtf8(out, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
                ++i;
                continue;
            }
        }
        if (unit >= 0xD800 && unit <= 0xDFFF) {
            unit = kReplacementCharacter;
        }
        appendUtf8(out, unit);
    }
    return out;
}

std::expected<std::vector<uint8_t>, TransferError> getStringDescriptor(IControlTransport& transport,
                                                                       uint8_t index,
                                                                       uint16_t langId,
                                                                       uint32_t timeoutMs) {
    auto reply = transport.controlTransfer(kRequestTypeStandardDeviceIn,
                                           kRequestGetDescriptor,
                                           static_cast<uint16_t>((kDescTypeString << 8) | index),
                                           langId,
                                           kStringDescriptorMaxLength,
                                           timeoutMs);
    if (!reply) {
        return std::unexpected(reply.error());
    }
    auto& bytes = reply.value();
    if (bytes.size() < 2 || bytes[1] != kDescTypeString || bytes[0] < 2) {
        return std::unexpected(TransferError::UnexpectedLength);
    }
    // bLength may promise more than the device actually sent
    bytes.resize(std::min<size_t>(bytes[0], bytes.size()));
    return std::move(bytes);
}

} // namespace

nlohmann::json DeviceIdentity::toJson() const {
    nlohmann::json j;
    j["vendorId"] = vendorId;
    j["productId"] = productId;
    j["bcdUSB"] = JsonHelpers::hexWordToString(bcdUSB);
    j["bcdDevice"] = JsonHelpers::hexWordToString(bcdDevice);
    j["deviceClass"] = deviceClass;
    j["numConfigurations"] = numConfigurations;
    j["manufacturerName"] = manufacturerName;
    j["productName"] = productName;
    return j;
}

std::optional<DeviceIdentity> parseDeviceIdentity(std::span<const uint8_t> raw,
                                                  std::shared_ptr<spdlog::logger> logger) {
    auto log = Helpers::loggerOrNull(std::move(logger));
    if (raw.size() < kDeviceDescriptorLength || raw[0] < kDeviceDescriptorLength ||
        raw[1] != kDescTypeDevice) {
        log->debug("parseDeviceIdentity: buffer does not start with a device descriptor");
        return std::nullopt;
    }
    DeviceIdentity identity;
    identity.bcdUSB            = Helpers::readLE16(raw.data() + 2);
    identity.deviceClass       = raw[4];
    identity.vendorId          = Helpers::readLE16(raw.data() + 8);
    identity.productId         = Helpers::readLE16(raw.data() + 10);
    identity.bcdDevice         = Helpers::readLE16(raw.data() + 12);
    identity.manufacturerIndex = raw[kDeviceManufacturerIndexOffset];
    identity.productIndex      = raw[kDeviceProductIndexOffset];
    identity.numConfigurations = raw[17];
    log->debug("parseDeviceIdentity: {}:{} bcdUSB={}",
               JsonHelpers::hexWordToString(identity.vendorId),
               JsonHelpers::hexWordToString(identity.productId),
               JsonHelpers::hexWordToString(identity.bcdUSB));
    return identity;
}

std::expected<std::string, TransferError> readStringDescriptor(IControlTransport& transport,
                                                               uint8_t index,
                                                               uint16_t langId,
                                                               uint32_t timeoutMs) {
    auto bytes = getStringDescriptor(transport, index, langId, timeoutMs);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    const auto& data = bytes.value();
    return utf16leToUtf8(data.data() + 2, (data.size() - 2) / 2);
}

void readDeviceStrings(DeviceIdentity& identity,
                       IControlTransport* transport,
                       std::shared_ptr<spdlog::logger> logger,
                       uint32_t timeoutMs) {
    auto log = Helpers::loggerOrNull(std::move(logger));
    if (!transport) {
        log->debug("readDeviceStrings: no device connection, names left unknown");
        return;
    }
    if (identity.manufacturerIndex == 0 && identity.productIndex == 0) {
        log->debug("readDeviceStrings: device declares no manufacturer or product string");
        return;
    }

    auto langTable = getStringDescriptor(*transport, 0, 0, timeoutMs);
    if (!langTable || langTable->size() < 4) {
        log->warn("readDeviceStrings: cannot read language table: {}",
                  langTable ? "no language listed"
                            : JsonHelpers::transferErrorToString(langTable.error()));
        return;
    }
    const uint16_t langId = Helpers::readLE16(langTable->data() + 2);
    log->debug("readDeviceStrings: using language 0x{:04x}", langId);

    auto readName = [&](uint8_t index, std::string& target, const char* what) {
        if (index == 0) {
            return;
        }
        auto name = readStringDescriptor(*transport, index, langId, timeoutMs);
        if (!name) {
            log->warn("readDeviceStrings: {} string {} unreadable: {}",
                      what, index, JsonHelpers::transferErrorToString(name.error()));
            return;
        }
        target = name.value();
    };
    readName(identity.manufacturerIndex, identity.manufacturerName, "manufacturer");
    readName(identity.productIndex, identity.productName, "product");
}

} // namespace UAC
