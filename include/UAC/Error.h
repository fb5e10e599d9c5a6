// include/UAC/Error.h
// Synopsis: Error codes for USB control transfers issued against a device.

#pragma once

#include <system_error>
#include <string>

namespace UAC {

enum class TransferError {
    Success = 0,          // Operation completed successfully
    Timeout,              // Device did not answer within the timeout
    Stall,                // Endpoint stalled (request not supported)
    NoDevice,             // Device disconnected
    NotPermitted,         // No permission on the device node
    BadArgument,          // Invalid request parameters
    UnexpectedLength,     // Response length differs from the requested length
    IOError,              // General I/O error
    NotOpen,              // No valid device handle
    NotFound              // Requested value could not be determined
};

// Make TransferError work with std::error_code
namespace detail {
    struct TransferErrorCategory : std::error_category {
        const char* name() const noexcept override { return "usb-transfer"; }
        std::string message(int ev) const override {
            switch (static_cast<TransferError>(ev)) {
                case TransferError::Success: return "Success";
                case TransferError::Timeout: return "Transfer timed out";
                case TransferError::Stall: return "Endpoint stalled";
                case TransferError::NoDevice: return "No such device";
                case TransferError::NotPermitted: return "Operation not permitted";
                case TransferError::BadArgument: return "Invalid argument";
                case TransferError::UnexpectedLength: return "Unexpected response length";
                case TransferError::IOError: return "I/O error";
                case TransferError::NotOpen: return "Device not open";
                case TransferError::NotFound: return "Not found";
                default: return "Unknown error";
            }
        }
    };
}

inline const std::error_category& transfer_error_category() noexcept {
    static detail::TransferErrorCategory category;
    return category;
}

inline std::error_code make_error_code(TransferError e) noexcept {
    return {static_cast<int>(e), transfer_error_category()};
}

/**
 * @brief Maps an errno value reported by a usbfs ioctl to a TransferError.
 */
TransferError transferErrorFromErrno(int err) noexcept;

} // namespace UAC

namespace std {
    template<>
    struct is_error_code_enum<UAC::TransferError> : true_type {};
}
