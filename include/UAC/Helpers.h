// include/UAC/Helpers.h
#ifndef UAC_HELPERS_H
#define UAC_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace spdlog { class logger; }

namespace UAC {

class Helpers {
public:
    static std::string formatHexBytes(const std::vector<uint8_t>& bytes);
    static std::string formatHexBytes(std::span<const uint8_t> bytes);

    // Little-endian field readers. Callers check bounds before reading.
    static uint16_t readLE16(const uint8_t* data);
    static uint32_t readLE24(const uint8_t* data);
    static uint32_t readLE32(const uint8_t* data);

    /**
     * @brief Returns the given logger, or a shared logger that discards everything
     *        when none was injected.
     */
    static std::shared_ptr<spdlog::logger> loggerOrNull(std::shared_ptr<spdlog::logger> logger);
};

} // namespace UAC

#endif // UAC_HELPERS_H
