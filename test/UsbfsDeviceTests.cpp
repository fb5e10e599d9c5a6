#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "UAC/DeviceIdentity.hpp"
#include "UAC/Error.h"
#include "UAC/UsbfsDevice.hpp"
#include "DescriptorBuilder.hpp"
#include "MockControlTransport.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <nlohmann/json.hpp>
#include <cerrno>
#include <cstdlib>
#include <unistd.h>

using namespace UAC;
using namespace UAC::test;
using ::testing::_;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::StrictMock;

namespace {

class MockInterfaceOwnership : public IInterfaceOwnership {
public:
    MOCK_METHOD(int, claim, (int deviceFd, unsigned int interfaceNumber), (override));
    MOCK_METHOD(int, release, (int deviceFd, unsigned int interfaceNumber), (override));
    MOCK_METHOD(int, detachKernelDriver, (int deviceFd, unsigned int interfaceNumber), (override));
    MOCK_METHOD(int, attachKernelDriver, (int deviceFd, unsigned int interfaceNumber), (override));
};

TransferResult stringDescriptor(const std::u16string& text) {
    std::vector<uint8_t> bytes{static_cast<uint8_t>(2 + text.size() * 2), 0x03};
    for (char16_t unit : text) {
        bytes.push_back(static_cast<uint8_t>(unit & 0xFF));
        bytes.push_back(static_cast<uint8_t>(unit >> 8));
    }
    return bytes;
}

TransferResult languageTable(uint16_t langId) {
    return std::vector<uint8_t>{4, 0x03, static_cast<uint8_t>(langId & 0xFF), static_cast<uint8_t>(langId >> 8)};
}

} // namespace

TEST(UsbfsDeviceTest, AudioInterfaceNumbersAreDistinct) {
    auto raw = DescriptorBuilder()
        .device(0x1234, 0x5678)
        .configuration(3)
        .audioControlInterface(0)
        .header(0x0100)
        .streamingInterface(1, 0, 0)
        .streamingInterface(1, 1)
        .interface(2, 0, 1, 0x03, 0x00)
        .streamingInterface(3, 1)
        .build();
    EXPECT_EQ(audioInterfaceNumbers(raw), (std::vector<uint8_t>{0, 1, 3}));
}

TEST(UsbfsDeviceTest, AudioInterfaceNumbersStopAtMalformedRecord) {
    auto raw = DescriptorBuilder()
        .audioControlInterface(0)
        .raw({0, 0x04})
        .streamingInterface(1, 1)
        .build();
    EXPECT_EQ(audioInterfaceNumbers(raw), std::vector<uint8_t>{0});
}

TEST(UsbfsDeviceTest, ParsesDeviceIdentity) {
    auto raw = DescriptorBuilder().device(0x0FD9, 0x0066).configuration(1).build();
    auto identity = parseDeviceIdentity(raw);
    ASSERT_TRUE(identity.has_value());
    EXPECT_EQ(identity->vendorId, 0x0FD9);
    EXPECT_EQ(identity->productId, 0x0066);
    EXPECT_EQ(identity->bcdUSB, 0x0200);
    EXPECT_EQ(identity->deviceClass, 0xEF);
    EXPECT_EQ(identity->bcdDevice, 0x0100);
    EXPECT_EQ(identity->numConfigurations, 1);
    EXPECT_EQ(identity->manufacturerIndex, 1);
    EXPECT_EQ(identity->productIndex, 2);
    EXPECT_EQ(identity->manufacturerName, "Unknown");
    EXPECT_EQ(identity->productName, "Unknown");

    auto j = identity->toJson();
    EXPECT_EQ(j["vendorId"], 0x0FD9);
    EXPECT_EQ(j["bcdUSB"], "0x0200");
}

TEST(UsbfsDeviceTest, DeviceIdentityRequiresDeviceDescriptor) {
    auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
    auto logger = std::make_shared<spdlog::logger>("identity_test", sink);
    logger->set_level(spdlog::level::debug);

    EXPECT_FALSE(parseDeviceIdentity(DescriptorBuilder().configuration(1).build(), logger).has_value());
    EXPECT_FALSE(parseDeviceIdentity(std::vector<uint8_t>{18, 0x01, 0x00}).has_value());

    auto lines = sink->last_formatted();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("does not start with a device descriptor"), std::string::npos);
}

TEST(DeviceStringsTest, ReadsManufacturerAndProductNames) {
    auto identity = parseDeviceIdentity(DescriptorBuilder().device(0x0FD9, 0x0066).build());
    ASSERT_TRUE(identity.has_value());

    MockControlTransport transport;
    EXPECT_CALL(transport, controlTransfer(0x80, 0x06, 0x0300, 0x0000, 255, _))
        .WillOnce(Return(languageTable(0x0409)));
    EXPECT_CALL(transport, controlTransfer(0x80, 0x06, 0x0301, 0x0409, 255, _))
        .WillOnce(Return(stringDescriptor(u"Elgato")));
    EXPECT_CALL(transport, controlTransfer(0x80, 0x06, 0x0302, 0x0409, 255, _))
        .WillOnce(Return(stringDescriptor(u"Wave:3 \u00b5")));

    readDeviceStrings(*identity, &transport);
    EXPECT_EQ(identity->manufacturerName, "Elgato");
    EXPECT_EQ(identity->productName, "Wave:3 \xC2\xB5");

    auto j = identity->toJson();
    EXPECT_EQ(j["manufacturerName"], "Elgato");
}

TEST(DeviceStringsTest, NoTransportLeavesNamesUnknown) {
    auto identity = parseDeviceIdentity(DescriptorBuilder().device(0x1234, 0x5678).build());
    ASSERT_TRUE(identity.has_value());
    readDeviceStrings(*identity, nullptr);
    EXPECT_EQ(identity->manufacturerName, "Unknown");
    EXPECT_EQ(identity->productName, "Unknown");
}

TEST(DeviceStringsTest, ZeroIndexIsNotRead) {
    DeviceIdentity identity;
    identity.productIndex = 2;

    MockControlTransport transport;
    EXPECT_CALL(transport, controlTransfer(_, _, 0x0300, _, _, _))
        .WillOnce(Return(languageTable(0x0407)));
    EXPECT_CALL(transport, controlTransfer(_, _, 0x0302, 0x0407, _, _))
        .WillOnce(Return(stringDescriptor(u"Mic")));

    readDeviceStrings(identity, &transport);
    EXPECT_EQ(identity.manufacturerName, "Unknown");
    EXPECT_EQ(identity.productName, "Mic");

    DeviceIdentity noStrings;
    StrictMock<MockControlTransport> untouched;
    readDeviceStrings(noStrings, &untouched);
    EXPECT_EQ(noStrings.productName, "Unknown");
}

TEST(DeviceStringsTest, FailedReadsKeepUnknown) {
    DeviceIdentity identity;
    identity.manufacturerIndex = 1;
    identity.productIndex = 2;

    MockControlTransport transport;
    EXPECT_CALL(transport, controlTransfer(_, _, 0x0300, _, _, _))
        .WillOnce(Return(languageTable(0x0409)));
    EXPECT_CALL(transport, controlTransfer(_, _, 0x0301, _, _, _))
        .WillOnce(Return(transferFailure(TransferError::Stall)));
    EXPECT_CALL(transport, controlTransfer(_, _, 0x0302, _, _, _))
        .WillOnce(Return(TransferResult{std::vector<uint8_t>{4, 0x02, 0x41, 0x00}}));

    readDeviceStrings(identity, &transport);
    EXPECT_EQ(identity.manufacturerName, "Unknown");
    EXPECT_EQ(identity.productName, "Unknown");
}

TEST(DeviceStringsTest, MissingLanguageTableSkipsNames) {
    DeviceIdentity identity;
    identity.productIndex = 2;

    StrictMock<MockControlTransport> transport;
    EXPECT_CALL(transport, controlTransfer(_, _, 0x0300, _, _, _))
        .WillOnce(Return(transferFailure(TransferError::Timeout)));

    readDeviceStrings(identity, &transport);
    EXPECT_EQ(identity.productName, "Unknown");
}

TEST(DeviceStringsTest, StringDecodingHandlesSurrogatesAndShortReplies) {
    MockControlTransport transport;
    EXPECT_CALL(transport, controlTransfer(_, _, _, _, _, _))
        // U+1F3A4 as a surrogate pair, then an unpaired high surrogate
        .WillOnce(Return(TransferResult{std::vector<uint8_t>{8, 0x03, 0x3C, 0xD8, 0xA4, 0xDF, 0x3C, 0xD8}}))
        // bLength promises more than was sent
        .WillOnce(Return(TransferResult{std::vector<uint8_t>{40, 0x03, 0x4F, 0x00, 0x4B, 0x00}}));

    auto pair = readStringDescriptor(transport, 1, 0x0409);
    ASSERT_TRUE(pair.has_value());
    EXPECT_EQ(pair.value(), "\xF0\x9F\x8E\xA4\xEF\xBF\xBD");

    auto truncated = readStringDescriptor(transport, 2, 0x0409);
    ASSERT_TRUE(truncated.has_value());
    EXPECT_EQ(truncated.value(), "OK");
}

TEST(UsbfsDeviceTest, ErrnoMapping) {
    EXPECT_EQ(transferErrorFromErrno(0), TransferError::Success);
    EXPECT_EQ(transferErrorFromErrno(ETIMEDOUT), TransferError::Timeout);
    EXPECT_EQ(transferErrorFromErrno(EPIPE), TransferError::Stall);
    EXPECT_EQ(transferErrorFromErrno(ENODEV), TransferError::NoDevice);
    EXPECT_EQ(transferErrorFromErrno(ENOENT), TransferError::NoDevice);
    EXPECT_EQ(transferErrorFromErrno(EACCES), TransferError::NotPermitted);
    EXPECT_EQ(transferErrorFromErrno(EPERM), TransferError::NotPermitted);
    EXPECT_EQ(transferErrorFromErrno(EINVAL), TransferError::BadArgument);
    EXPECT_EQ(transferErrorFromErrno(EBADF), TransferError::NotOpen);
    EXPECT_EQ(transferErrorFromErrno(EOVERFLOW), TransferError::IOError);
}

TEST(UsbfsDeviceTest, ErrorCodesUseTransferCategory) {
    std::error_code ec = TransferError::Timeout;
    EXPECT_STREQ(ec.category().name(), "usb-transfer");
    EXPECT_EQ(ec.message(), "Transfer timed out");
    EXPECT_TRUE(static_cast<bool>(ec));
    EXPECT_FALSE(static_cast<bool>(std::error_code(TransferError::Success)));
}

TEST(UsbfsDeviceTest, TransportOnClosedDeviceFails) {
    UsbfsControlTransport transport(-1, nullptr);
    auto result = transport.controlTransfer(0xA1, 0x01, 0x0100, 0x0100, 4, 100);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), TransferError::NotOpen);
    EXPECT_FALSE(readRawDescriptors(-1).has_value());
}

TEST(UsbfsDeviceTest, ClaimOnInvalidDescriptorClaimsNothing) {
    ScopedInterfaceClaim claim(-1, {0, 1}, nullptr);
    EXPECT_TRUE(claim.getClaimedInterfaces().empty());
    EXPECT_TRUE(claim.getDetachedInterfaces().empty());
}

TEST(ScopedInterfaceClaimTest, FreeInterfacesAreClaimedAndReleased) {
    StrictMock<MockInterfaceOwnership> ownership;
    {
        InSequence seq;
        EXPECT_CALL(ownership, claim(7, 0u)).WillOnce(Return(0));
        EXPECT_CALL(ownership, claim(7, 1u)).WillOnce(Return(0));
        EXPECT_CALL(ownership, release(7, 0u)).WillOnce(Return(0));
        EXPECT_CALL(ownership, release(7, 1u)).WillOnce(Return(0));
    }
    ScopedInterfaceClaim claim(7, {0, 1}, nullptr, &ownership);
    EXPECT_EQ(claim.getClaimedInterfaces(), (std::vector<uint8_t>{0, 1}));
    EXPECT_TRUE(claim.getDetachedInterfaces().empty());
}

TEST(ScopedInterfaceClaimTest, KernelDriverIsDetachedAndReattached) {
    StrictMock<MockInterfaceOwnership> ownership;
    {
        InSequence seq;
        EXPECT_CALL(ownership, claim(3, 1u)).WillOnce(Return(EBUSY));
        EXPECT_CALL(ownership, detachKernelDriver(3, 1u)).WillOnce(Return(0));
        EXPECT_CALL(ownership, claim(3, 1u)).WillOnce(Return(0));
        EXPECT_CALL(ownership, release(3, 1u)).WillOnce(Return(0));
        EXPECT_CALL(ownership, attachKernelDriver(3, 1u)).WillOnce(Return(0));
    }
    ScopedInterfaceClaim claim(3, {1}, nullptr, &ownership);
    EXPECT_EQ(claim.getClaimedInterfaces(), std::vector<uint8_t>{1});
    EXPECT_EQ(claim.getDetachedInterfaces(), std::vector<uint8_t>{1});
}

TEST(ScopedInterfaceClaimTest, FailedDetachLeavesInterfaceUnclaimed) {
    StrictMock<MockInterfaceOwnership> ownership;
    EXPECT_CALL(ownership, claim(3, 2u)).WillOnce(Return(EBUSY));
    EXPECT_CALL(ownership, detachKernelDriver(3, 2u)).WillOnce(Return(EPERM));

    ScopedInterfaceClaim claim(3, {2}, nullptr, &ownership);
    EXPECT_TRUE(claim.getClaimedInterfaces().empty());
    EXPECT_TRUE(claim.getDetachedInterfaces().empty());
}

TEST(ScopedInterfaceClaimTest, DetachedDriverIsReattachedEvenIfClaimFails) {
    StrictMock<MockInterfaceOwnership> ownership;
    {
        InSequence seq;
        EXPECT_CALL(ownership, claim(3, 1u)).WillOnce(Return(EBUSY));
        EXPECT_CALL(ownership, detachKernelDriver(3, 1u)).WillOnce(Return(0));
        EXPECT_CALL(ownership, claim(3, 1u)).WillOnce(Return(EBUSY));
        EXPECT_CALL(ownership, attachKernelDriver(3, 1u)).WillOnce(Return(0));
    }
    ScopedInterfaceClaim claim(3, {1}, nullptr, &ownership);
    EXPECT_TRUE(claim.getClaimedInterfaces().empty());
}

TEST(ScopedInterfaceClaimTest, OtherClaimErrorsDoNotDetach) {
    StrictMock<MockInterfaceOwnership> ownership;
    EXPECT_CALL(ownership, claim(3, 0u)).WillOnce(Return(ENOENT));

    ScopedInterfaceClaim claim(3, {0}, nullptr, &ownership);
    EXPECT_TRUE(claim.getClaimedInterfaces().empty());
}

TEST(UsbfsDeviceTest, ReadsDescriptorDumpFromFile) {
    auto expected = DescriptorBuilder().device(0x1234, 0x5678).configuration(1).audioControlInterface(0).build();

    char path[] = "/tmp/uac_descriptorsXXXXXX";
    int fd = mkstemp(path);
    ASSERT_GE(fd, 0);
    unlink(path);
    ASSERT_EQ(write(fd, expected.data(), expected.size()), static_cast<ssize_t>(expected.size()));

    auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
    auto logger = std::make_shared<spdlog::logger>("dump_test", sink);
    logger->set_level(spdlog::level::debug);

    auto raw = readRawDescriptors(fd, logger);
    close(fd);
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw.value(), expected);

    auto lines = sink->last_formatted();
    ASSERT_FALSE(lines.empty());
    EXPECT_NE(lines.back().find("bytes of descriptors"), std::string::npos);
}
