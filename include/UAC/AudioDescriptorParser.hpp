// include/UAC/AudioDescriptorParser.hpp
#pragma once

#include <cstdint>
#include <span>
#include <vector>
#include "UAC/CapabilityProfile.hpp"
#include "UAC/ParserConfig.hpp"

namespace UAC {

class IControlTransport;

/**
 * @brief Recovers a USB Audio Class capability profile from raw descriptors.
 *
 * Runs DescriptorScanner over the buffer and hands the events to
 * CapabilityResolver. Each call owns its own scan state, so separate parser
 * instances may run on separate threads for separate devices.
 */
class AudioDescriptorParser {
public:
    /**
     * @brief Construct a new parser.
     * @param transport Control-transfer primitive of the already-open device, or null
     *        when only the static descriptors are available. Not owned.
     * @param config Parse options
     */
    explicit AudioDescriptorParser(IControlTransport* transport, ParserConfig config = {});

    ~AudioDescriptorParser() = default;

    AudioDescriptorParser(const AudioDescriptorParser&) = delete;
    AudioDescriptorParser& operator=(const AudioDescriptorParser&) = delete;
    AudioDescriptorParser(AudioDescriptorParser&&) = delete;
    AudioDescriptorParser& operator=(AudioDescriptorParser&&) = delete;

    /**
     * @brief Parses the descriptor buffer. Never fails on malformed data.
     * @param raw Concatenated descriptors as returned by the device
     * @return The (possibly rate-incomplete) capability profile
     */
    CapabilityProfile parse(std::span<const uint8_t> raw);
    CapabilityProfile parse(const std::vector<uint8_t>& raw) {
        return parse(std::span<const uint8_t>(raw.data(), raw.size()));
    }

private:
    IControlTransport* transport_; ///< Non-owning pointer to the device connection.
    ParserConfig config_;
};

} // namespace UAC
