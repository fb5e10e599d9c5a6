#include "UAC/CapabilityResolver.hpp"
#include "UAC/ClockFrequencyReader.hpp"
#include "UAC/Helpers.h"
#include "UAC/JsonHelpers.hpp"
#include <spdlog/spdlog.h>
#include <set>
#include <variant>

namespace UAC {

CapabilityResolver::CapabilityResolver(IControlTransport* transport, const ParserConfig& config)
    : transport_(transport)
    , config_(config)
    , logger_(Helpers::loggerOrNull(config.logger))
{}

std::expected<uint32_t, TransferError> CapabilityResolver::readClock(uint8_t clockId) {
    if (!transport_) {
        logger_->debug("CapabilityResolver: no device connection, clock {} not read", clockId);
        return std::unexpected(TransferError::NotOpen);
    }
    ClockFrequencyReader reader(*transport_, logger_, config_.clockQueryTimeoutMs);
    return reader.queryClockFrequency(clockId);
}

CapabilityProfile CapabilityResolver::resolve(const ScanResult& scan) {
    std::set<uint32_t> rates;
    std::vector<EndpointInfo> endpoints;
    std::optional<TransferError> clockError;

    // Format state as seen by the consumer, including live clock results
    uint8_t channels = 1;
    uint8_t bitResolution = 16;
    uint32_t currentSampleRate = 0;

    for (const auto& event : scan.events) {
        if (const auto* format = std::get_if<FormatDecoded>(&event)) {
            channels = format->channels;
            bitResolution = format->bitResolution;
            if (format->mode == FormatMode::Uac1) {
                rates.insert(format->sampleRates.begin(), format->sampleRates.end());
                currentSampleRate = format->maxSampleRate;
            }
            logger_->trace("CapabilityResolver: {} format {}ch {}-bit, current rate {} Hz",
                           JsonHelpers::formatModeToString(format->mode), channels, bitResolution, currentSampleRate);
        } else if (const auto* request = std::get_if<ClockRateRequested>(&event)) {
            if (!config_.queryClockDuringScan) {
                logger_->debug("CapabilityResolver: in-scan clock read disabled, clock {} skipped", request->clockId);
                continue;
            }
            auto rate = readClock(request->clockId);
            if (rate && rate.value() > 0) {
                currentSampleRate = rate.value();
                rates.insert(rate.value());
            } else if (!rate) {
                clockError = rate.error();
                logger_->warn("CapabilityResolver: failed to read UAC2 sample rate from clock {}: {}",
                              request->clockId, JsonHelpers::transferErrorToString(rate.error()));
            }
        } else if (const auto* finalized = std::get_if<EndpointFinalized>(&event)) {
            if (currentSampleRate == 0) {
                logger_->debug("CapabilityResolver: endpoint on interface {} alt {} dropped, no sample rate known",
                               finalized->interfaceNumber, finalized->alternateSetting);
                continue;
            }
            EndpointInfo info;
            info.address = finalized->address;
            info.maxPacketSize = finalized->maxPacketSize;
            info.channels = channels;
            info.bitResolution = bitResolution;
            info.sampleRate = currentSampleRate;
            info.sampleRateSettable = finalized->sampleRateSettable;
            info.interfaceNumber = finalized->interfaceNumber;
            info.alternateSetting = finalized->alternateSetting;
            logger_->debug("CapabilityResolver: {}", info.toString());
            endpoints.push_back(info);
        }
    }

    const ScanState& state = scan.finalState;
    if (state.uac2ClockId >= 0 && rates.empty() && config_.queryClockAfterScan) {
        logger_->debug("CapabilityResolver: no rate found in descriptors, reading clock {} directly", state.uac2ClockId);
        auto rate = readClock(static_cast<uint8_t>(state.uac2ClockId));
        if (rate && rate.value() > 0) {
            rates.insert(rate.value());
        } else if (!rate) {
            clockError = rate.error();
            logger_->error("CapabilityResolver: fallback read of clock {} failed: {}. Profile has no sample rate.",
                           state.uac2ClockId, JsonHelpers::transferErrorToString(rate.error()));
        }
    }

    const UacVersion version = (state.uacVersion == UacVersion::Unknown) ? UacVersion::Uac1 : state.uacVersion;
    CapabilityProfile profile(version,
                              std::vector<uint32_t>(rates.begin(), rates.end()),
                              std::move(endpoints),
                              clockError);
    logger_->info("CapabilityResolver: {}", profile.toString());
    return profile;
}

} // namespace UAC
