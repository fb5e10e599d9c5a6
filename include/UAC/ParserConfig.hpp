#pragma once

#include "UAC/Enums.hpp"
#include <cstdint>
#include <memory>

namespace spdlog { class logger; }

namespace UAC {

/**
 * @brief Options for one capability parse.
 *
 * The defaults perform the in-scan clock read for UAC2 formats and the post-pass
 * fallback read. A null logger silences diagnostics.
 */
struct ParserConfig {
    uint32_t clockQueryTimeoutMs = kDefaultControlTimeoutMs;
    bool queryClockDuringScan = true;
    bool queryClockAfterScan = true;
    std::shared_ptr<spdlog::logger> logger;
};

} // namespace UAC
