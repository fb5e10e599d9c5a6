// include/UAC/ScanTypes.hpp
#pragma once

#include "UAC/Enums.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

namespace UAC {

/**
 * @brief Cross-record state threaded through one forward pass over a descriptor buffer.
 *
 * Created fresh for every scan and discarded afterwards. Not shared between scans.
 */
struct ScanState {
    int currentInterfaceNumber = -1;
    int currentAlternateSetting = 0;
    bool foundAudioStreaming = false;   ///< Scope is an AS interface with at least one endpoint
    bool expectingFormat = false;
    bool expectingEndpoint = false;
    FormatMode formatMode = FormatMode::Uac1;
    UacVersion uacVersion = UacVersion::Unknown; ///< Never downgraded once Uac2
    int uac2ClockId = -1;               ///< First readable clock source, -1 if none
    uint8_t currentChannels = 1;
    uint8_t currentBitResolution = 16;
    uint32_t currentSampleRate = 0;     ///< Highest statically declared rate of the last format
    uint8_t matchedEndpointAddress = 0; ///< Last IN isochronous endpoint in scope, 0 if none
    uint16_t matchedEndpointMaxPacketSize = 0;
};

struct SampleRateRange {
    uint32_t lower = 0;
    uint32_t upper = 0;
};

// --- Events emitted by DescriptorScanner, consumed in order by CapabilityResolver ---

struct InterfaceEntered {
    uint8_t interfaceNumber = 0;
    uint8_t alternateSetting = 0;
    uint8_t numEndpoints = 0;
    uint8_t interfaceClass = 0;
    uint8_t interfaceSubclass = 0;
    bool audioStreaming = false;
};

struct UacHeaderSeen {
    uint16_t bcdADC = 0;
    UacVersion version = UacVersion::Unknown; ///< Version in effect after this header
};

struct FormatTagSeen {
    uint16_t formatTag = 0;
    bool pcm = false;
};

struct FormatDecoded {
    FormatMode mode = FormatMode::Uac1;
    uint8_t channels = 0;
    uint8_t subframeSize = 0;
    uint8_t bitResolution = 0;
    std::vector<uint32_t> sampleRates;             ///< Bounds and probe hits for a range, or the discrete list
    std::optional<SampleRateRange> continuousRange;
    uint32_t maxSampleRate = 0;                    ///< 0 for UAC2, where the rate lives in the clock
};

struct ClockSourceSeen {
    uint8_t clockId = 0;
    uint8_t attributes = 0;
    uint8_t controls = 0;
    bool selected = false; ///< Became the clock used for live frequency queries
};

/// Deferred live query: the resolver reads the clock at this point of the event stream.
struct ClockRateRequested {
    uint8_t clockId = 0;
};

struct EndpointMatched {
    uint8_t address = 0;
    uint8_t attributes = 0;
    uint16_t maxPacketSize = 0;
};

struct EndpointFinalized {
    bool sampleRateSettable = false;
    uint8_t interfaceNumber = 0;
    uint8_t alternateSetting = 0;
    uint8_t address = 0;
    uint16_t maxPacketSize = 0;
};

struct ScanTruncated {
    size_t offset = 0;
    uint8_t declaredLength = 0;
    size_t remaining = 0;
};

using ScanEvent = std::variant<
    InterfaceEntered,
    UacHeaderSeen,
    FormatTagSeen,
    FormatDecoded,
    ClockSourceSeen,
    ClockRateRequested,
    EndpointMatched,
    EndpointFinalized,
    ScanTruncated>;

struct ScanResult {
    std::vector<ScanEvent> events;
    ScanState finalState;
    size_t bytesConsumed = 0;
    size_t recordCount = 0;
};

} // namespace UAC
