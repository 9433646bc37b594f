#include "ESP32IRPairCodec.h"
#include <gtest/gtest.h>

namespace
{
    int64_t gNowUs = 0;

    int64_t fakeClock() { return gNowUs; }

    constexpr esp32pair::PulsePair kSync{9000, 400};

    class PpmDecoderTest : public ::testing::Test
    {
    protected:
        PpmDecoderTest() : decoder(fakeClock) { gNowUs = 1000000; }

        esp32pair::PpmDecoder decoder;
    };
} // namespace

TEST_F(PpmDecoderTest, SafeBeforeFirstSync)
{
    EXPECT_TRUE(decoder.isSafe());
    EXPECT_FALSE(decoder.synced());
    EXPECT_EQ(decoder.channelUs(0), 1500u);
}

TEST_F(PpmDecoderTest, PulsesBeforeSyncAreIgnored)
{
    decoder.handlePulsePair(esp32pair::PulsePair{600, 1400});
    decoder.handlePulsePair(esp32pair::PulsePair{600, 600});
    EXPECT_EQ(decoder.currentChannel(), 0);

    decoder.handlePulsePair(kSync);
    ASSERT_FALSE(decoder.isSafe());
    // nothing was stored, the initial values are still the safe values
    EXPECT_EQ(decoder.channelUs(0), 1500u);
    EXPECT_EQ(decoder.channelUs(1), 1500u);
}

TEST_F(PpmDecoderTest, ChannelsAfterSync)
{
    decoder.handlePulsePair(kSync);
    decoder.handlePulsePair(esp32pair::PulsePair{400, 600});
    decoder.handlePulsePair(esp32pair::PulsePair{400, 1600});
    decoder.handlePulsePair(esp32pair::PulsePair{400, 1103});
    EXPECT_EQ(decoder.currentChannel(), 3);

    gNowUs += 100000;
    EXPECT_FALSE(decoder.isSafe());
    EXPECT_EQ(decoder.channelUs(0), 1000u);
    EXPECT_EQ(decoder.channelUs(1), 2000u);
    EXPECT_EQ(decoder.channelUs(2), 1500u); // 1503 rounds down
    esp32pair::PpmChannels all = decoder.channels();
    EXPECT_EQ(all[1], 2000u);
    EXPECT_EQ(all[3], 1500u);
}

TEST_F(PpmDecoderTest, RoundsHalfUpToTenMicroseconds)
{
    decoder.handlePulsePair(kSync);
    decoder.handlePulsePair(esp32pair::PulsePair{400, 1105});
    decoder.handlePulsePair(esp32pair::PulsePair{400, 1104});
    EXPECT_EQ(decoder.channelUs(0), 1510u);
    EXPECT_EQ(decoder.channelUs(1), 1500u);
}

TEST_F(PpmDecoderTest, TimeoutFallsBackToSafeValues)
{
    decoder.handlePulsePair(kSync);
    decoder.handlePulsePair(esp32pair::PulsePair{400, 1600});

    gNowUs += 600000; // exactly the timeout: still live
    EXPECT_FALSE(decoder.isSafe());
    EXPECT_EQ(decoder.channelUs(0), 2000u);

    gNowUs += 1;
    EXPECT_TRUE(decoder.isSafe());
    EXPECT_EQ(decoder.channelUs(0), 1500u);
    EXPECT_EQ(decoder.channels(), esp32pair::kPpmSafeChannelsMid);

    // a fresh sync brings the live values back
    decoder.handlePulsePair(kSync);
    EXPECT_FALSE(decoder.isSafe());
    EXPECT_EQ(decoder.channelUs(0), 2000u);
}

TEST_F(PpmDecoderTest, CustomSafeChannelsAndTimeout)
{
    decoder.setSafeChannels(esp32pair::kPpmSafeChannelsBottom);
    decoder.setTimeoutUs(20000);
    decoder.handlePulsePair(kSync);
    decoder.handlePulsePair(esp32pair::PulsePair{400, 1600});
    gNowUs += 20001;
    EXPECT_EQ(decoder.channelUs(0), 1000u);
}

TEST_F(PpmDecoderTest, SyncThresholdIsStrict)
{
    decoder.handlePulsePair(esp32pair::PulsePair{6000, 0});
    EXPECT_FALSE(decoder.synced());
    decoder.handlePulsePair(esp32pair::PulsePair{6001, 0});
    EXPECT_TRUE(decoder.synced());
}

TEST_F(PpmDecoderTest, PulsesPastCapacityAreDropped)
{
    decoder.handlePulsePair(kSync);
    for (int i = 0; i < 16; ++i)
    {
        decoder.handlePulsePair(esp32pair::PulsePair{400, 600u + static_cast<uint32_t>(i) * 10});
    }
    EXPECT_EQ(decoder.currentChannel(), 16);
    decoder.handlePulsePair(esp32pair::PulsePair{400, 1600});
    EXPECT_EQ(decoder.currentChannel(), 16);
    EXPECT_EQ(decoder.channelUs(15), 1150u);
    EXPECT_EQ(decoder.channelUs(0), 1000u);
}

TEST(PpmDecoderConfigTest, ChannelCountLimitsStorage)
{
    gNowUs = 5000;
    esp32pair::PpmDecoder::Config cfg;
    cfg.channelCount = 2;
    esp32pair::PpmDecoder decoder(fakeClock, cfg);
    decoder.handlePulsePair(kSync);
    decoder.handlePulsePair(esp32pair::PulsePair{400, 600});
    decoder.handlePulsePair(esp32pair::PulsePair{400, 1600});
    decoder.handlePulsePair(esp32pair::PulsePair{400, 1100});
    EXPECT_EQ(decoder.currentChannel(), 2);
    EXPECT_EQ(decoder.channelUs(2), 1500u);
}

TEST(PpmDecoderConfigTest, MissingClockStaysSafe)
{
    esp32pair::PpmDecoder decoder(nullptr);
    decoder.handlePulsePair(kSync);
    decoder.handlePulsePair(esp32pair::PulsePair{400, 1600});
    EXPECT_TRUE(decoder.synced());
    EXPECT_TRUE(decoder.isSafe());
    EXPECT_EQ(decoder.channelUs(0), 1500u);
}

TEST(PpmDecoderConfigTest, OutOfRangeChannelReadsZero)
{
    esp32pair::PpmDecoder decoder(fakeClock);
    EXPECT_EQ(decoder.channelUs(esp32pair::kPpmMaxChannels), 0u);
}

TEST(PpmUnitTest, MapsWidthToUnitRange)
{
    EXPECT_FLOAT_EQ(esp32pair::ppmToUnit(1000), -1.0f);
    EXPECT_FLOAT_EQ(esp32pair::ppmToUnit(1500), 0.0f);
    EXPECT_FLOAT_EQ(esp32pair::ppmToUnit(2000), 1.0f);
}
