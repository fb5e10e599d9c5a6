// DescriptorScanner.hpp
#pragma once

#include "UAC/ScanTypes.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace spdlog { class logger; }

namespace UAC {

/**
 * @brief Walks a raw configuration-descriptor buffer and turns it into ScanEvents.
 *
 * The scanner performs no device I/O. A live clock read that a UAC2 format needs is
 * emitted as a ClockRateRequested event for the resolver to carry out. Malformed or
 * overrunning records stop the scan; everything decoded before that point is kept.
 * The scanner holds no per-scan state, so one instance may serve several threads.
 */
class DescriptorScanner {
public:
    explicit DescriptorScanner(std::shared_ptr<spdlog::logger> logger = nullptr);
    ~DescriptorScanner() = default;

    ScanResult scan(std::span<const uint8_t> raw) const;
    ScanResult scan(const std::vector<uint8_t>& raw) const {
        return scan(std::span<const uint8_t>(raw.data(), raw.size()));
    }

    /**
     * @brief Applies one descriptor record to the scan state.
     * @param state Scan state, updated in place
     * @param record One complete record; record[0] is bLength and record.size() == bLength
     * @param events Events produced by this record are appended here
     */
    void step(ScanState& state, std::span<const uint8_t> record, std::vector<ScanEvent>& events) const;

    DescriptorScanner(const DescriptorScanner&) = delete;
    DescriptorScanner& operator=(const DescriptorScanner&) = delete;
    DescriptorScanner(DescriptorScanner&&) = delete;
    DescriptorScanner& operator=(DescriptorScanner&&) = delete;

private:
    void handleInterface(ScanState& state, std::span<const uint8_t> record, std::vector<ScanEvent>& events) const;
    void handleClassSpecificInterface(ScanState& state, std::span<const uint8_t> record, std::vector<ScanEvent>& events) const;
    void handleEndpoint(ScanState& state, std::span<const uint8_t> record, std::vector<ScanEvent>& events) const;
    void handleClassSpecificEndpoint(ScanState& state, std::span<const uint8_t> record, std::vector<ScanEvent>& events) const;

    void decodeUac1FormatTypeI(ScanState& state, std::span<const uint8_t> record, std::vector<ScanEvent>& events) const;
    void decodeUac2FormatTypeI(ScanState& state, std::span<const uint8_t> record, std::vector<ScanEvent>& events) const;

    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace UAC
