// src/UAC/UsbfsDevice.cpp
#include "UAC/UsbfsDevice.hpp"
#include "UAC/Enums.hpp"
#include "UAC/Helpers.h"
#include <spdlog/spdlog.h>
#include <linux/usbdevice_fs.h>
#include <sys/ioctl.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace UAC {

constexpr size_t kMaxDescriptorDumpBytes = 64 * 1024;
constexpr size_t kDescriptorReadChunk = 4096;
constexpr uint32_t kMaxControlLength = 0xFFFF;

UsbfsControlTransport::UsbfsControlTransport(int deviceFd, std::shared_ptr<spdlog::logger> logger)
    : deviceFd_(deviceFd)
    , logger_(Helpers::loggerOrNull(std::move(logger)))
{}

std::expected<std::vector<uint8_t>, TransferError> UsbfsControlTransport::controlTransfer(
    uint8_t requestType,
    uint8_t request,
    uint16_t value,
    uint16_t index,
    uint32_t length,
    uint32_t timeoutMs)
{
    if (deviceFd_ < 0) {
        logger_->error("UsbfsControlTransport: invalid device handle");
        return std::unexpected(TransferError::NotOpen);
    }
    if (length > kMaxControlLength) {
        logger_->error("UsbfsControlTransport: wLength {} exceeds 16 bits", length);
        return std::unexpected(TransferError::BadArgument);
    }

    std::vector<uint8_t> buffer(length, 0);
    struct usbdevfs_ctrltransfer ctrl = {};
    ctrl.bRequestType = requestType;
    ctrl.bRequest = request;
    ctrl.wValue = value;
    ctrl.wIndex = index;
    ctrl.wLength = static_cast<uint16_t>(length);
    ctrl.timeout = timeoutMs;
    ctrl.data = buffer.empty() ? nullptr : buffer.data();

    int result = ioctl(deviceFd_, USBDEVFS_CONTROL, &ctrl);
    if (result < 0) {
        int err = errno;
        logger_->debug("UsbfsControlTransport: control 0x{:02x}/0x{:02x} wValue=0x{:04x} wIndex=0x{:04x} failed: errno={} {}",
                       requestType, request, value, index, err, strerror(err));
        return std::unexpected(transferErrorFromErrno(err));
    }

    // For IN transfers the ioctl returns the number of bytes actually received
    buffer.resize(std::min(static_cast<size_t>(result), buffer.size()));
    logger_->trace("UsbfsControlTransport: control 0x{:02x}/0x{:02x} returned {} bytes: {}",
                   requestType, request, buffer.size(), Helpers::formatHexBytes(buffer));
    return buffer;
}

namespace {

int errnoOf(int ioctlResult) {
    return ioctlResult < 0 ? errno : 0;
}

int driverIoctl(int deviceFd, unsigned int interfaceNumber, unsigned long code) {
    struct usbdevfs_ioctl command = {};
    command.ifno = static_cast<int>(interfaceNumber);
    command.ioctl_code = static_cast<int>(code);
    command.data = nullptr;
    return errnoOf(ioctl(deviceFd, USBDEVFS_IOCTL, &command));
}

IInterfaceOwnership& defaultOwnership() {
    static UsbfsInterfaceOwnership ownership;
    return ownership;
}

} // namespace

int UsbfsInterfaceOwnership::claim(int deviceFd, unsigned int interfaceNumber) {
    return errnoOf(ioctl(deviceFd, USBDEVFS_CLAIMINTERFACE, &interfaceNumber));
}

int UsbfsInterfaceOwnership::release(int deviceFd, unsigned int interfaceNumber) {
    return errnoOf(ioctl(deviceFd, USBDEVFS_RELEASEINTERFACE, &interfaceNumber));
}

int UsbfsInterfaceOwnership::detachKernelDriver(int deviceFd, unsigned int interfaceNumber) {
    return driverIoctl(deviceFd, interfaceNumber, USBDEVFS_DISCONNECT);
}

int UsbfsInterfaceOwnership::attachKernelDriver(int deviceFd, unsigned int interfaceNumber) {
    return driverIoctl(deviceFd, interfaceNumber, USBDEVFS_CONNECT);
}

ScopedInterfaceClaim::ScopedInterfaceClaim(int deviceFd, const std::vector<uint8_t>& interfaceNumbers,
                                           std::shared_ptr<spdlog::logger> logger,
                                           IInterfaceOwnership* ownership)
    : deviceFd_(deviceFd)
    , logger_(Helpers::loggerOrNull(std::move(logger)))
    , ownership_(ownership ? *ownership : defaultOwnership())
{
    for (uint8_t number : interfaceNumbers) {
        int err = ownership_.claim(deviceFd_, number);
        if (err == EBUSY) {
            // Bound to snd-usb-audio: take it over for the duration of the claim
            int detachErr = ownership_.detachKernelDriver(deviceFd_, number);
            if (detachErr == 0) {
                logger_->debug("ScopedInterfaceClaim: detached kernel driver from interface {}", number);
                detached_.push_back(number);
                err = ownership_.claim(deviceFd_, number);
            } else {
                logger_->warn("ScopedInterfaceClaim: cannot detach kernel driver from interface {}: {}",
                              number, strerror(detachErr));
            }
        }
        if (err != 0) {
            logger_->warn("ScopedInterfaceClaim: cannot claim interface {}: {}", number, strerror(err));
            continue;
        }
        logger_->debug("ScopedInterfaceClaim: claimed interface {}", number);
        claimed_.push_back(number);
    }
}

ScopedInterfaceClaim::~ScopedInterfaceClaim() {
    for (uint8_t number : claimed_) {
        int err = ownership_.release(deviceFd_, number);
        if (err != 0) {
            logger_->warn("ScopedInterfaceClaim: failed to release interface {}: {}", number, strerror(err));
        } else {
            logger_->debug("ScopedInterfaceClaim: released interface {}", number);
        }
    }
    for (uint8_t number : detached_) {
        int err = ownership_.attachKernelDriver(deviceFd_, number);
        if (err != 0) {
            logger_->warn("ScopedInterfaceClaim: failed to reattach kernel driver to interface {}: {}",
                          number, strerror(err));
        } else {
            logger_->debug("ScopedInterfaceClaim: reattached kernel driver to interface {}", number);
        }
    }
}

std::expected<std::vector<uint8_t>, TransferError> readRawDescriptors(int deviceFd,
                                                                     std::shared_ptr<spdlog::logger> logger) {
    auto log = Helpers::loggerOrNull(std::move(logger));
    if (deviceFd < 0) {
        return std::unexpected(TransferError::NotOpen);
    }
    if (lseek(deviceFd, 0, SEEK_SET) < 0) {
        int err = errno;
        log->error("readRawDescriptors: lseek failed: {}", strerror(err));
        return std::unexpected(transferErrorFromErrno(err));
    }

    std::vector<uint8_t> descriptors;
    uint8_t chunk[kDescriptorReadChunk];
    while (descriptors.size() < kMaxDescriptorDumpBytes) {
        ssize_t n = read(deviceFd, chunk, sizeof(chunk));
        if (n < 0) {
            int err = errno;
            if (err == EINTR) continue;
            log->error("readRawDescriptors: read failed: {}", strerror(err));
            return std::unexpected(transferErrorFromErrno(err));
        }
        if (n == 0) break;
        descriptors.insert(descriptors.end(), chunk, chunk + n);
    }
    log->debug("readRawDescriptors: {} bytes of descriptors", descriptors.size());
    return descriptors;
}

std::vector<uint8_t> audioInterfaceNumbers(std::span<const uint8_t> raw) {
    std::vector<uint8_t> numbers;
    size_t offset = 0;
    while (offset + kMinRecordLength <= raw.size()) {
        const uint8_t bLength = raw[offset];
        if (bLength < kMinRecordLength || bLength > raw.size() - offset) {
            break;
        }
        if (raw[offset + 1] == kDescTypeInterface && bLength >= kInterfaceMinLength &&
            raw[offset + 5] == kUsbClassAudio) {
            const uint8_t number = raw[offset + 2];
            if (std::find(numbers.begin(), numbers.end(), number) == numbers.end()) {
                numbers.push_back(number);
            }
        }
        offset += bLength;
    }
    return numbers;
}

} // namespace UAC
