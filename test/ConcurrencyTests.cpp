#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "UAC/AudioDescriptorParser.hpp"
#include "DescriptorBuilder.hpp"
#include "MockControlTransport.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace UAC;
using namespace UAC::test;
using ::testing::_;
using ::testing::Return;

// Each thread owns its parser and transport, as separate devices would
TEST(ConcurrencyTest, IndependentParsersRunInParallel) {
    const int numThreads = 8;
    const int iterations = 200;
    const auto uac1 = uac1Microphone({44100, 48000});
    const auto uac2 = uac2Microphone();

    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([&, t]() {
            MockControlTransport transport;
            const uint32_t rate = 44100u * static_cast<uint32_t>(t + 1);
            EXPECT_CALL(transport, controlTransfer(_, _, _, _, _, _))
                .WillRepeatedly(Return(rateResponse(rate)));

            AudioDescriptorParser parser(&transport);
            for (int i = 0; i < iterations; ++i) {
                const bool useUac2 = ((i + t) % 2) == 0;
                auto profile = parser.parse(useUac2 ? uac2 : uac1);
                const uint32_t expectedRate = useUac2 ? rate : 48000u;
                if (profile.getEndpoints().size() != 1 ||
                    profile.getEndpoints()[0].sampleRate != expectedRate) {
                    ++mismatches;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(mismatches.load(), 0);
}

TEST(ConcurrencyTest, SharedScanInputIsReadOnly) {
    const auto raw = uac1Microphone({32000, 96000});
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            AudioDescriptorParser parser(nullptr);
            for (int i = 0; i < 500; ++i) {
                auto profile = parser.parse(raw);
                if (profile.getSampleRates() != std::vector<uint32_t>{32000, 96000}) {
                    ++failures;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(failures.load(), 0);
}
