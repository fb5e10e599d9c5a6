// include/UAC/UsbfsDevice.hpp
// Synopsis: Linux usbfs access to an already-open device node (/dev/bus/usb/BBB/DDD).

#pragma once

#include "UAC/IControlTransport.h"
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <vector>

namespace spdlog { class logger; }

namespace UAC {

/**
 * @brief IControlTransport over USBDEVFS_CONTROL on a borrowed file descriptor.
 *        The descriptor is never closed by this class.
 */
class UsbfsControlTransport : public IControlTransport {
public:
    UsbfsControlTransport(int deviceFd, std::shared_ptr<spdlog::logger> logger);
    ~UsbfsControlTransport() override = default;

    std::expected<std::vector<uint8_t>, TransferError> controlTransfer(
        uint8_t requestType,
        uint8_t request,
        uint16_t value,
        uint16_t index,
        uint32_t length,
        uint32_t timeoutMs) override;


private:
    int deviceFd_;
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief Interface ownership operations on a usbfs device node.
 *        Each call returns 0 on success or the errno of the failed ioctl.
 */
class IInterfaceOwnership {
public:
    virtual ~IInterfaceOwnership() = default;

    virtual int claim(int deviceFd, unsigned int interfaceNumber) = 0;
    virtual int release(int deviceFd, unsigned int interfaceNumber) = 0;
    /// Unbinds the kernel driver (snd-usb-audio) from the interface.
    virtual int detachKernelDriver(int deviceFd, unsigned int interfaceNumber) = 0;
    virtual int attachKernelDriver(int deviceFd, unsigned int interfaceNumber) = 0;
};

/**
 * @brief IInterfaceOwnership over USBDEVFS_CLAIMINTERFACE / USBDEVFS_RELEASEINTERFACE
 *        and the USBDEVFS_DISCONNECT / USBDEVFS_CONNECT driver ioctls.
 */
class UsbfsInterfaceOwnership : public IInterfaceOwnership {
public:
    int claim(int deviceFd, unsigned int interfaceNumber) override;
    int release(int deviceFd, unsigned int interfaceNumber) override;
    int detachKernelDriver(int deviceFd, unsigned int interfaceNumber) override;
    int attachKernelDriver(int deviceFd, unsigned int interfaceNumber) override;
};

/**
 * @brief Claims a set of interfaces for its lifetime and releases them on destruction,
 *        whatever the outcome of the work done while they were held.
 *
 * An interface bound to a kernel driver cannot be claimed, and usbfs then rejects
 * interface-recipient class requests to it with EBUSY. Such interfaces are detached
 * from their driver first and handed back to it on destruction.
 */
class ScopedInterfaceClaim {
public:
    /**
     * @param ownership Ownership operations; null uses the usbfs ioctls
     */
    ScopedInterfaceClaim(int deviceFd, const std::vector<uint8_t>& interfaceNumbers,
                         std::shared_ptr<spdlog::logger> logger,
                         IInterfaceOwnership* ownership = nullptr);
    ~ScopedInterfaceClaim();

    ScopedInterfaceClaim(const ScopedInterfaceClaim&) = delete;
    ScopedInterfaceClaim& operator=(const ScopedInterfaceClaim&) = delete;
    ScopedInterfaceClaim(ScopedInterfaceClaim&&) = delete;
    ScopedInterfaceClaim& operator=(ScopedInterfaceClaim&&) = delete;

    const std::vector<uint8_t>& getClaimedInterfaces() const { return claimed_; }
    const std::vector<uint8_t>& getDetachedInterfaces() const { return detached_; }

private:
    int deviceFd_;
    std::vector<uint8_t> claimed_;
    std::vector<uint8_t> detached_;
    std::shared_ptr<spdlog::logger> logger_;
    IInterfaceOwnership& ownership_;
};

/**
 * @brief Reads the cached device and configuration descriptors that usbfs returns
 *        from read() on the device node.
 */
std::expected<std::vector<uint8_t>, TransferError> readRawDescriptors(int deviceFd,
                                                                     std::shared_ptr<spdlog::logger> logger = nullptr);

/**
 * @brief Distinct numbers of all audio-class interfaces found in a descriptor buffer.
 */
std::vector<uint8_t> audioInterfaceNumbers(std::span<const uint8_t> raw);

} // namespace UAC
