// src/UAC/AudioDescriptorParser.cpp
#include "UAC/AudioDescriptorParser.hpp"
#include "UAC/CapabilityResolver.hpp"
#include "UAC/DescriptorScanner.hpp"
#include <utility>

namespace UAC {

AudioDescriptorParser::AudioDescriptorParser(IControlTransport* transport, ParserConfig config)
    : transport_(transport)
    , config_(std::move(config))
{}

CapabilityProfile AudioDescriptorParser::parse(std::span<const uint8_t> raw) {
    DescriptorScanner scanner(config_.logger);
    ScanResult scan = scanner.scan(raw);

    CapabilityResolver resolver(transport_, config_);
    return resolver.resolve(scan);
}

} // namespace UAC
