#pragma once

#include "UAC/CapabilityProfile.hpp"
#include "UAC/ParserConfig.hpp"
#include "UAC/ScanTypes.hpp"
#include <memory>

namespace spdlog { class logger; }

namespace UAC {

class IControlTransport;

/**
 * @brief Folds scanner events into a CapabilityProfile.
 *
 * Carries out the live clock reads the scan deferred, at their position in the
 * event stream, plus one fallback read when a readable UAC2 clock was found but
 * no rate was. Clock read failures are logged and never abort the resolve.
 */
class CapabilityResolver {
public:
    /**
     * @param transport Borrowed control-transfer primitive; null disables live reads
     * @param config Parse options
     */
    CapabilityResolver(IControlTransport* transport, const ParserConfig& config);
    ~CapabilityResolver() = default;

    CapabilityProfile resolve(const ScanResult& scan);

    CapabilityResolver(const CapabilityResolver&) = delete;
    CapabilityResolver& operator=(const CapabilityResolver&) = delete;
    CapabilityResolver(CapabilityResolver&&) = delete;
    CapabilityResolver& operator=(CapabilityResolver&&) = delete;

private:
    std::expected<uint32_t, TransferError> readClock(uint8_t clockId);

    IControlTransport* transport_;
    ParserConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace UAC
