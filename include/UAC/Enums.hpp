// include/UAC/Enums.hpp
#pragma once
#include <array>
#include <cstdint>

namespace UAC {

// Standard descriptor types (USB 2.0, Table 9-5) and audio class-specific types
constexpr uint8_t kDescTypeDevice        = 0x01;
constexpr uint8_t kDescTypeString        = 0x03;
constexpr uint8_t kDescTypeInterface     = 0x04;
constexpr uint8_t kDescTypeEndpoint      = 0x05;
constexpr uint8_t kDescTypeCSInterface   = 0x24;
constexpr uint8_t kDescTypeCSEndpoint    = 0x25;

// Minimum record sizes the scanner needs before it reads a field
constexpr uint8_t kMinRecordLength           = 2;
constexpr uint8_t kInterfaceMinLength        = 9;
constexpr uint8_t kCSInterfaceMinLength      = 3;
constexpr uint8_t kHeaderMinLength           = 6;
constexpr uint8_t kASGeneralMinLength        = 7;
constexpr uint8_t kUac1FormatMinLength       = 8;
constexpr uint8_t kUac1ContinuousMinLength   = 14;
constexpr uint8_t kUac2FormatMinLength       = 6;
constexpr uint8_t kClockSourceMinLength      = 8;
constexpr uint8_t kEndpointMinLength         = 7;
constexpr uint8_t kCSEndpointMinLength       = 4;
constexpr uint8_t kDeviceDescriptorLength    = 18;

// Interface class codes
constexpr uint8_t kUsbClassAudio              = 0x01;
constexpr uint8_t kUsbSubclassAudioStreaming  = 0x02;

// Class-specific AC/AS interface descriptor subtypes
constexpr uint8_t kSubtypeHeader       = 0x01; // AC header, same value as AS_GENERAL
constexpr uint8_t kSubtypeASGeneral    = 0x01;
constexpr uint8_t kSubtypeFormatType   = 0x02;
constexpr uint8_t kSubtypeClockSource  = 0x0A; // UAC2 only

constexpr uint8_t  kFormatTypeI   = 0x01;
constexpr uint16_t kFormatTagPCM  = 0x0001;
constexpr uint16_t kBcdAdcUac2    = 0x0200;

// Endpoint descriptor bits
constexpr uint8_t kEndpointDirIn            = 0x80;
constexpr uint8_t kEndpointTransferMask     = 0x03;
constexpr uint8_t kEndpointXferIsochronous  = 0x01;
constexpr uint8_t kCSEndpointSamFreqControl = 0x01; // bmAttributes bit 0

// UAC2 clock source bits
constexpr uint8_t kClockTypeMask            = 0x03;
constexpr uint8_t kClockFreqReadableMask    = 0x01;

// Class request used for the live clock frequency query (UAC2 5.2.5.1.1)
constexpr uint8_t  kRequestTypeClassInterfaceIn = 0xA1;
constexpr uint8_t  kUac2RequestCur              = 0x01; // GET_CUR when direction is IN
constexpr uint8_t  kCSSamFreqControl            = 0x01;
constexpr uint16_t kClockFrequencyResponseSize  = 4;
constexpr uint32_t kDefaultControlTimeoutMs     = 1000;

// Standard GET_DESCRIPTOR for string descriptors (USB 2.0 9.4.3, 9.6.7)
constexpr uint8_t  kRequestTypeStandardDeviceIn = 0x80;
constexpr uint8_t  kRequestGetDescriptor        = 0x06;
constexpr uint16_t kStringDescriptorMaxLength   = 255;
constexpr uint8_t  kDeviceManufacturerIndexOffset = 14;
constexpr uint8_t  kDeviceProductIndexOffset      = 15;

// Rates probed inside a UAC1 continuous range
constexpr std::array<uint32_t, 7> kContinuousRangeProbeRates = {
    44100, 48000, 96000, 192000, 256000, 384000, 500000
};

/**
 * @brief USB Audio Class protocol version reported in the profile.
 */
enum class UacVersion : uint8_t {
    Unknown = 0,
    Uac1    = 1,
    Uac2    = 2
};

/**
 * @brief Interpretation mode for Format-Type-I records in the current scope.
 */
enum class FormatMode : uint8_t {
    Uac1,
    Uac2
};

} // namespace UAC
