// DescriptorScanner.cpp
#include "UAC/DescriptorScanner.hpp"
#include "UAC/Helpers.h"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace UAC {

DescriptorScanner::DescriptorScanner(std::shared_ptr<spdlog::logger> logger)
    : logger_(Helpers::loggerOrNull(std::move(logger)))
{}

ScanResult DescriptorScanner::scan(std::span<const uint8_t> raw) const {
    ScanResult result;
    logger_->debug("DescriptorScanner: scanning {} bytes of descriptors", raw.size());

    size_t offset = 0;
    while (offset < raw.size()) {
        const uint8_t bLength = raw[offset];
        const size_t remaining = raw.size() - offset;
        if (bLength < kMinRecordLength || bLength > remaining) {
            // Trailing garbage is common on real devices; keep what was decoded so far
            logger_->warn("DescriptorScanner: record at offset {} declares bLength={} with {} bytes left. Stopping scan.",
                          offset, bLength, remaining);
            result.events.emplace_back(ScanTruncated{offset, bLength, remaining});
            break;
        }

        auto record = raw.subspan(offset, bLength);
        logger_->trace("DescriptorScanner: [{:4}] {}", offset, Helpers::formatHexBytes(record));
        step(result.finalState, record, result.events);

        ++result.recordCount;
        offset += bLength;
    }

    result.bytesConsumed = offset;
    logger_->debug("DescriptorScanner: {} records, {} events, {} of {} bytes consumed",
                   result.recordCount, result.events.size(), result.bytesConsumed, raw.size());
    return result;
}

void DescriptorScanner::step(ScanState& state, std::span<const uint8_t> record, std::vector<ScanEvent>& events) const {
    if (record.size() < kMinRecordLength) {
        return;
    }
    switch (record[1]) {
        case kDescTypeInterface:
            handleInterface(state, record, events);
            break;
        case kDescTypeCSInterface:
            handleClassSpecificInterface(state, record, events);
            break;
        case kDescTypeEndpoint:
            handleEndpoint(state, record, events);
            break;
        case kDescTypeCSEndpoint:
            handleClassSpecificEndpoint(state, record, events);
            break;
        default:
            break;
    }
}

void DescriptorScanner::handleInterface(ScanState& state, std::span<const uint8_t> record, std::vector<ScanEvent>& events) const {
    if (record.size() < kInterfaceMinLength) {
        return;
    }

    InterfaceEntered entered;
    entered.interfaceNumber   = record[2];
    entered.alternateSetting  = record[3];
    entered.numEndpoints      = record[4];
    entered.interfaceClass    = record[5];
    entered.interfaceSubclass = record[6];
    entered.audioStreaming = entered.interfaceClass == kUsbClassAudio &&
                             entered.interfaceSubclass == kUsbSubclassAudioStreaming &&
                             entered.numEndpoints > 0;

    state.currentInterfaceNumber = entered.interfaceNumber;
    state.currentAlternateSetting = entered.alternateSetting;

    if (entered.audioStreaming) {
        state.foundAudioStreaming = true;
        state.expectingFormat = true;
        state.formatMode = FormatMode::Uac1;
    } else {
        state.foundAudioStreaming = false;
        state.expectingFormat = false;
    }
    // A new scope invalidates any pending endpoint
    state.expectingEndpoint = false;
    state.matchedEndpointAddress = 0;
    state.matchedEndpointMaxPacketSize = 0;

    logger_->debug("DescriptorScanner: interface {} alt {} class=0x{:02x} subclass=0x{:02x} endpoints={}{}",
                   entered.interfaceNumber, entered.alternateSetting, entered.interfaceClass,
                   entered.interfaceSubclass, entered.numEndpoints,
                   entered.audioStreaming ? " (audio streaming)" : "");
    events.emplace_back(entered);
}

void DescriptorScanner::handleClassSpecificInterface(ScanState& state, std::span<const uint8_t> record, std::vector<ScanEvent>& events) const {
    if (record.size() < kCSInterfaceMinLength) {
        return;
    }
    const uint8_t subtype = record[2];
    const size_t length = record.size();

    // The checks below are independent. Subtype 0x01 is both the AC header and AS_GENERAL.

    if (subtype == kSubtypeHeader && length >= kHeaderMinLength) {
        const uint16_t bcdADC = static_cast<uint16_t>(record[4] | (record[3] << 8));
        if (bcdADC >= kBcdAdcUac2) {
            state.uacVersion = UacVersion::Uac2;
        } else if (state.uacVersion == UacVersion::Unknown) {
            state.uacVersion = UacVersion::Uac1;
        }
        logger_->debug("DescriptorScanner: UAC header bcdADC=0x{:04x} -> UAC{}",
                       bcdADC, static_cast<int>(state.uacVersion));
        events.emplace_back(UacHeaderSeen{bcdADC, state.uacVersion});
    }

    if (subtype == kSubtypeClockSource && length >= kClockSourceMinLength) {
        ClockSourceSeen clock;
        clock.clockId    = record[3];
        clock.attributes = record[4];
        clock.controls   = record[5];
        const bool readable = (clock.attributes & kClockTypeMask) != 0 &&
                              (clock.controls & kClockFreqReadableMask) != 0;
        if (readable && state.uac2ClockId < 0) {
            state.uac2ClockId = clock.clockId;
            clock.selected = true;
            logger_->debug("DescriptorScanner: UAC2 clock source id={} selected (attributes=0x{:02x} controls=0x{:02x})",
                           clock.clockId, clock.attributes, clock.controls);
        } else {
            logger_->debug("DescriptorScanner: UAC2 clock source id={} not used (attributes=0x{:02x} controls=0x{:02x} readable={})",
                           clock.clockId, clock.attributes, clock.controls, readable);
        }
        events.emplace_back(clock);
    }

    if (state.foundAudioStreaming && state.expectingFormat && subtype == kSubtypeASGeneral &&
        length >= kASGeneralMinLength) {
        const uint16_t formatTag = Helpers::readLE16(record.data() + 5);
        const bool pcm = formatTag == kFormatTagPCM;
        if (pcm) {
            logger_->debug("DescriptorScanner: AS_GENERAL PCM format on interface {} alt {}",
                           state.currentInterfaceNumber, state.currentAlternateSetting);
        } else {
            logger_->warn("DescriptorScanner: AS_GENERAL format tag 0x{:04x} on interface {} alt {} is not PCM",
                          formatTag, state.currentInterfaceNumber, state.currentAlternateSetting);
        }
        events.emplace_back(FormatTagSeen{formatTag, pcm});
    }

    if (state.foundAudioStreaming && state.expectingFormat && state.formatMode == FormatMode::Uac1 &&
        subtype == kSubtypeFormatType && length >= kUac1FormatMinLength) {
        decodeUac1FormatTypeI(state, record, events);
    }

    if (state.foundAudioStreaming && state.expectingFormat && state.uacVersion == UacVersion::Uac2 &&
        subtype == kSubtypeASGeneral) {
        // UAC2 AS_GENERAL: the rate comes from the clock source, not from the format record
        state.formatMode = FormatMode::Uac2;
        logger_->debug("DescriptorScanner: interface {} alt {} uses UAC2 format layout",
                       state.currentInterfaceNumber, state.currentAlternateSetting);
    }

    if (state.foundAudioStreaming && state.uacVersion == UacVersion::Uac2 && state.formatMode == FormatMode::Uac2 &&
        subtype == kSubtypeFormatType && length >= kUac2FormatMinLength) {
        decodeUac2FormatTypeI(state, record, events);
    }
}

void DescriptorScanner::decodeUac1FormatTypeI(ScanState& state, std::span<const uint8_t> record, std::vector<ScanEvent>& events) const {
    if (record[3] != kFormatTypeI) {
        logger_->debug("DescriptorScanner: UAC1 format type {} ignored", record[3]);
        return;
    }

    FormatDecoded format;
    format.mode = FormatMode::Uac1;
    format.channels      = record[4];
    format.subframeSize  = record[5];
    format.bitResolution = record[6];
    const uint8_t samFreqType = record[7];

    if (samFreqType == 0 && record.size() >= kUac1ContinuousMinLength) {
        SampleRateRange range{Helpers::readLE24(record.data() + 8), Helpers::readLE24(record.data() + 11)};
        format.sampleRates.push_back(range.lower);
        format.sampleRates.push_back(range.upper);
        for (uint32_t candidate : kContinuousRangeProbeRates) {
            if (candidate >= range.lower && candidate <= range.upper) {
                format.sampleRates.push_back(candidate);
            }
        }
        format.continuousRange = range;
        format.maxSampleRate = range.upper;
        logger_->debug("DescriptorScanner: UAC1 continuous rate range {} - {} Hz", range.lower, range.upper);
    } else {
        for (size_t i = 0; i < samFreqType; ++i) {
            const size_t rateOffset = 8 + i * 3;
            if (rateOffset + 3 > record.size()) {
                logger_->warn("DescriptorScanner: UAC1 format declares {} rates but record holds only {}",
                              samFreqType, i);
                break;
            }
            const uint32_t rate = Helpers::readLE24(record.data() + rateOffset);
            format.sampleRates.push_back(rate);
            format.maxSampleRate = std::max(format.maxSampleRate, rate);
            logger_->debug("DescriptorScanner: UAC1 discrete rate {} Hz", rate);
        }
    }

    state.currentChannels = format.channels;
    state.currentBitResolution = format.bitResolution;
    state.currentSampleRate = format.maxSampleRate;
    state.expectingFormat = false;
    state.expectingEndpoint = true;

    logger_->debug("DescriptorScanner: UAC1 Type I format {}ch {}-bit, highest rate {} Hz",
                   format.channels, format.bitResolution, format.maxSampleRate);
    events.emplace_back(std::move(format));
}

void DescriptorScanner::decodeUac2FormatTypeI(ScanState& state, std::span<const uint8_t> record, std::vector<ScanEvent>& events) const {
    if (record[3] != kFormatTypeI) {
        logger_->debug("DescriptorScanner: UAC2 format type {} ignored", record[3]);
        return;
    }

    FormatDecoded format;
    format.mode = FormatMode::Uac2;
    format.subframeSize  = record[4];
    format.bitResolution = record[5];
    format.channels = 1; // Channel count lives in AS_GENERAL for UAC2; target devices are mono

    state.currentChannels = format.channels;
    state.currentBitResolution = format.bitResolution;
    state.expectingFormat = false;
    state.formatMode = FormatMode::Uac1;
    state.expectingEndpoint = true;

    logger_->debug("DescriptorScanner: UAC2 Type I format {}-bit (subslot {} bytes)",
                   format.bitResolution, format.subframeSize);
    events.emplace_back(std::move(format));

    if (state.uac2ClockId >= 0) {
        events.emplace_back(ClockRateRequested{static_cast<uint8_t>(state.uac2ClockId)});
    } else {
        logger_->debug("DescriptorScanner: no readable clock source known yet for UAC2 format");
    }
}

void DescriptorScanner::handleEndpoint(ScanState& state, std::span<const uint8_t> record, std::vector<ScanEvent>& events) const {
    if (record.size() < kEndpointMinLength || !state.expectingEndpoint) {
        return;
    }
    EndpointMatched endpoint;
    endpoint.address       = record[2];
    endpoint.attributes    = record[3];
    endpoint.maxPacketSize = Helpers::readLE16(record.data() + 4);

    const bool isInput = (endpoint.address & kEndpointDirIn) != 0;
    const bool isIsochronous = (endpoint.attributes & kEndpointTransferMask) == kEndpointXferIsochronous;
    if (!isInput || !isIsochronous) {
        logger_->debug("DescriptorScanner: endpoint 0x{:02x} skipped (in={} iso={})",
                       endpoint.address, isInput, isIsochronous);
        return;
    }

    state.expectingEndpoint = false;
    state.matchedEndpointAddress = endpoint.address;
    state.matchedEndpointMaxPacketSize = endpoint.maxPacketSize;
    logger_->debug("DescriptorScanner: audio endpoint addr=0x{:02x} maxPacket={}",
                   endpoint.address, endpoint.maxPacketSize);
    events.emplace_back(endpoint);
}

void DescriptorScanner::handleClassSpecificEndpoint(ScanState& state, std::span<const uint8_t> record, std::vector<ScanEvent>& events) const {
    if (record.size() < kCSEndpointMinLength) {
        return;
    }
    if (!state.foundAudioStreaming) {
        logger_->debug("DescriptorScanner: class-specific endpoint outside audio streaming scope ignored");
        return;
    }

    EndpointFinalized finalized;
    finalized.sampleRateSettable = (record[3] & kCSEndpointSamFreqControl) != 0;
    finalized.interfaceNumber  = static_cast<uint8_t>(state.currentInterfaceNumber);
    finalized.alternateSetting = static_cast<uint8_t>(state.currentAlternateSetting);
    finalized.address          = state.matchedEndpointAddress;
    finalized.maxPacketSize    = state.matchedEndpointMaxPacketSize;

    state.matchedEndpointAddress = 0;
    state.matchedEndpointMaxPacketSize = 0;
    events.emplace_back(finalized);
}

} // namespace UAC
