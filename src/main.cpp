/**
 * @file main.cpp
 * @brief uac_probe: prints the USB Audio Class capabilities of a device as JSON.
 *
 * Usage: uac_probe [-v|-vv] [--no-clock] [--dump] [--descriptors FILE] [DEVICE]
 */

#include <iostream>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "UAC/AudioDescriptorParser.hpp"
#include "UAC/DeviceIdentity.hpp"
#include "UAC/JsonHelpers.hpp"
#include "UAC/UsbfsDevice.hpp"
#include <nlohmann/json.hpp>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace {

struct Options {
    spdlog::level::level_enum level = spdlog::level::warn;
    bool queryClock = true;
    bool dumpDescriptors = false;
    std::optional<std::string> descriptorFile;
    std::optional<std::string> devicePath;
};

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [-v|-vv] [--no-clock] [--dump] [--descriptors FILE] [DEVICE]\n"
              << "  DEVICE             usbfs node, e.g. /dev/bus/usb/001/004\n"
              << "  --descriptors FILE parse a raw descriptor dump instead of a live device\n"
              << "  --no-clock         never read UAC2 clock sources\n"
              << "  --dump             include the raw descriptor bytes in the output\n"
              << "  -v, -vv            debug / trace logging on stderr\n";
}

std::optional<Options> parseArguments(int argc, char** argv) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-v") {
            options.level = spdlog::level::debug;
        } else if (arg == "-vv") {
            options.level = spdlog::level::trace;
        } else if (arg == "--no-clock") {
            options.queryClock = false;
        } else if (arg == "--dump") {
            options.dumpDescriptors = true;
        } else if (arg == "--descriptors") {
            if (i + 1 >= argc) return std::nullopt;
            options.descriptorFile = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (!arg.empty() && arg[0] != '-' && !options.devicePath) {
            options.devicePath = arg;
        } else {
            return std::nullopt;
        }
    }
    if (options.devicePath.has_value() == options.descriptorFile.has_value()) {
        return std::nullopt;
    }
    return options;
}

std::optional<std::vector<uint8_t>> readDescriptorFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        spdlog::error("Cannot open descriptor file '{}'", path);
        return std::nullopt;
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

nlohmann::json buildReport(const std::vector<uint8_t>& raw, UAC::IControlTransport* transport,
                           const Options& options, const std::shared_ptr<spdlog::logger>& logger) {
    UAC::ParserConfig config;
    config.queryClockDuringScan = options.queryClock;
    config.queryClockAfterScan = options.queryClock;
    config.logger = logger;

    UAC::AudioDescriptorParser parser(transport, config);
    UAC::CapabilityProfile profile = parser.parse(raw);

    nlohmann::json report = profile.toJson();
    if (auto identity = UAC::parseDeviceIdentity(raw, logger)) {
        UAC::readDeviceStrings(*identity, transport, logger);
        report["device"] = identity->toJson();
        report["vendorId"] = identity->vendorId;
        report["productId"] = identity->productId;
        report["manufacturerName"] = identity->manufacturerName;
        report["productName"] = identity->productName;
    }
    if (options.dumpDescriptors) {
        report["rawDescriptors"] = UAC::JsonHelpers::serializeHexBytes(raw);
    }
    return report;
}

} // namespace

int main(int argc, char** argv) {
    auto options = parseArguments(argc, argv);
    if (!options) {
        printUsage(argv[0]);
        return 2;
    }

    std::shared_ptr<spdlog::logger> logger;
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        logger = std::make_shared<spdlog::logger>("uac_probe", console_sink);
        spdlog::set_default_logger(logger);
        spdlog::set_level(options->level);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        return 1;
    }

    if (options->descriptorFile) {
        auto raw = readDescriptorFile(*options->descriptorFile);
        if (!raw) {
            return 1;
        }
        std::cout << UAC::JsonHelpers::dumpReport(buildReport(*raw, nullptr, *options, logger)) << std::endl;
        return 0;
    }

    const std::string& devicePath = *options->devicePath;
    int fd = open(devicePath.c_str(), O_RDWR);
    if (fd < 0) {
        spdlog::critical("Cannot open '{}': {}", devicePath, strerror(errno));
        return 1;
    }

    int exitCode = 0;
    auto raw = UAC::readRawDescriptors(fd, logger);
    if (!raw) {
        spdlog::critical("Failed to read descriptors from '{}': {}",
                         devicePath, UAC::JsonHelpers::transferErrorToString(raw.error()));
        exitCode = 1;
    } else {
        UAC::UsbfsControlTransport transport(fd, logger);
        nlohmann::json report;
        {
            // Audio interfaces stay claimed only for the duration of the parse
            UAC::ScopedInterfaceClaim claim(fd, UAC::audioInterfaceNumbers(*raw), logger);
            report = buildReport(*raw, &transport, *options, logger);
        }
        report["deviceName"] = devicePath;
        std::cout << UAC::JsonHelpers::dumpReport(report) << std::endl;
    }

    close(fd);
    return exitCode;
}
