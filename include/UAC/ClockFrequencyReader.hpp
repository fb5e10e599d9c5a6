#pragma once

#include "UAC/Error.h"
#include "UAC/Enums.hpp"
#include <cstdint>
#include <expected>
#include <memory>

namespace spdlog { class logger; }

namespace UAC {

class IControlTransport;

/**
 * @brief Reads the current frequency of a UAC2 Clock Source entity with GET_CUR.
 */
class ClockFrequencyReader {
public:
    ClockFrequencyReader(IControlTransport& transport,
                         std::shared_ptr<spdlog::logger> logger,
                         uint32_t timeoutMs = kDefaultControlTimeoutMs);
    ~ClockFrequencyReader() = default;

    /**
     * @brief Issue one CS_SAM_FREQ_CONTROL GET_CUR request to the clock entity.
     * @param clockId bClockID of the Clock Source descriptor
     * @return Frequency in Hz, or TransferError::UnexpectedLength when the device
     *         does not return exactly four bytes, or the transport's error
     */
    std::expected<uint32_t, TransferError> queryClockFrequency(uint8_t clockId);

    ClockFrequencyReader(const ClockFrequencyReader&) = delete;
    ClockFrequencyReader& operator=(const ClockFrequencyReader&) = delete;
    ClockFrequencyReader(ClockFrequencyReader&&) = delete;
    ClockFrequencyReader& operator=(ClockFrequencyReader&&) = delete;

private:
    IControlTransport& transport_;
    std::shared_ptr<spdlog::logger> logger_;
    uint32_t timeoutMs_;
};

} // namespace UAC
