// include/UAC/IControlTransport.h
#pragma once

#include <cstdint>
#include <expected>
#include <vector>
#include "UAC/Error.h"

namespace UAC {

/**
 * @brief Synchronous control-transfer primitive bound to an open device connection.
 *
 * Implementations borrow the connection: they must not close or release it.
 * The caller owns interface claims and the connection lifecycle.
 */
class IControlTransport {
public:
    virtual ~IControlTransport() = default;

    /**
     * @brief Issue a single control transfer and wait for its completion.
     * @param requestType bmRequestType (direction, type and recipient)
     * @param request bRequest
     * @param value wValue
     * @param index wIndex
     * @param length wLength, the number of bytes requested for IN transfers
     * @param timeoutMs Upper bound on the wait
     * @return The bytes actually returned by the device (may be shorter than length) or error
     */
    virtual std::expected<std::vector<uint8_t>, TransferError> controlTransfer(
        uint8_t requestType,
        uint8_t request,
        uint16_t value,
        uint16_t index,
        uint32_t length,
        uint32_t timeoutMs) = 0;
};

} // namespace UAC
