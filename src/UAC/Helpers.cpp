#include "UAC/Helpers.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#include <iomanip>
#include <sstream>

namespace UAC {

std::string Helpers::formatHexBytes(const std::vector<uint8_t>& bytes) {
    return formatHexBytes(std::span<const uint8_t>(bytes.data(), bytes.size()));
}

std::string Helpers::formatHexBytes(std::span<const uint8_t> bytes) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i != 0) oss << ' ';
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

uint16_t Helpers::readLE16(const uint8_t* data) {
    return static_cast<uint16_t>(data[0] | (data[1] << 8));
}

uint32_t Helpers::readLE24(const uint8_t* data) {
    return static_cast<uint32_t>(data[0]) |
           (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16);
}

uint32_t Helpers::readLE32(const uint8_t* data) {
    return static_cast<uint32_t>(data[0]) |
           (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) |
           (static_cast<uint32_t>(data[3]) << 24);
}

std::shared_ptr<spdlog::logger> Helpers::loggerOrNull(std::shared_ptr<spdlog::logger> logger) {
    if (logger) {
        return logger;
    }
    // Not registered in the spdlog registry so parallel parsers never collide on the name
    static const auto nullLogger = std::make_shared<spdlog::logger>(
        "uac_null", std::make_shared<spdlog::sinks::null_sink_mt>());
    return nullLogger;
}

} // namespace UAC
