#include "UAC/ClockFrequencyReader.hpp"
#include "UAC/IControlTransport.h"
#include "UAC/Helpers.h"
#include <spdlog/spdlog.h>

namespace UAC {

ClockFrequencyReader::ClockFrequencyReader(IControlTransport& transport,
                                           std::shared_ptr<spdlog::logger> logger,
                                           uint32_t timeoutMs)
    : transport_(transport)
    , logger_(Helpers::loggerOrNull(std::move(logger)))
    , timeoutMs_(timeoutMs)
{}

std::expected<uint32_t, TransferError> ClockFrequencyReader::queryClockFrequency(uint8_t clockId) {
    const uint16_t wValue = static_cast<uint16_t>(kCSSamFreqControl << 8);
    const uint16_t wIndex = static_cast<uint16_t>(clockId << 8);

    logger_->debug("ClockFrequencyReader: GET_CUR SAM_FREQ clock={} wValue=0x{:04x} wIndex=0x{:04x} timeout={}ms",
                   clockId, wValue, wIndex, timeoutMs_);

    auto response = transport_.controlTransfer(kRequestTypeClassInterfaceIn,
                                               kUac2RequestCur,
                                               wValue,
                                               wIndex,
                                               kClockFrequencyResponseSize,
                                               timeoutMs_);
    if (!response) {
        logger_->warn("ClockFrequencyReader: GET_CUR for clock {} failed: {}",
                      clockId, make_error_code(response.error()).message());
        return std::unexpected(response.error());
    }

    const auto& bytes = response.value();
    if (bytes.size() != kClockFrequencyResponseSize) {
        logger_->warn("ClockFrequencyReader: GET_CUR for clock {} returned {} bytes (expected {}): {}",
                      clockId, bytes.size(), kClockFrequencyResponseSize, Helpers::formatHexBytes(bytes));
        return std::unexpected(TransferError::UnexpectedLength);
    }

    uint32_t frequency = Helpers::readLE32(bytes.data());
    logger_->info("ClockFrequencyReader: clock {} runs at {} Hz", clockId, frequency);
    return frequency;
}

} // namespace UAC
