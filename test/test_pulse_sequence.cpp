#include "ESP32IRPairCodec.h"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace
{
    class CollectingConsumer : public esp32pair::PulsePairConsumer
    {
    public:
        void handlePulsePair(const esp32pair::PulsePair &pair) override { pairs.push_back(pair); }

        std::vector<esp32pair::PulsePair> pairs;
    };
} // namespace

TEST(PulseSequenceTest, TotalTimeSumsBothHalves)
{
    esp32pair::PulseSequence seq;
    EXPECT_TRUE(seq.empty());
    EXPECT_EQ(seq.totalTimeUs(), 0u);
    seq.add(100, 200);
    seq.add(esp32pair::PulsePair{300, 400});
    EXPECT_EQ(seq.size(), 2u);
    EXPECT_EQ(seq.totalTimeUs(), 1000u);
}

TEST(PulseSequenceTest, AtOutOfRangeIsEmptyPair)
{
    esp32pair::PulseSequence seq;
    seq.add(5, 6);
    EXPECT_EQ(seq.at(0), (esp32pair::PulsePair{5, 6}));
    EXPECT_EQ(seq.at(1), (esp32pair::PulsePair{0, 0}));
    seq.clear();
    EXPECT_TRUE(seq.empty());
}

TEST(PulseSequenceTest, ReplayKeepsOrder)
{
    esp32pair::PulseSequence seq;
    seq.add(1, 2);
    seq.add(3, 4);
    seq.add(5, 6);
    CollectingConsumer out;
    esp32pair::replay(seq, out);

    ASSERT_EQ(out.pairs.size(), 3u);
    EXPECT_EQ(out.pairs[0], (esp32pair::PulsePair{1, 2}));
    EXPECT_EQ(out.pairs[2], (esp32pair::PulsePair{5, 6}));
}

TEST(PulseSequenceTest, NaturalOrderPerProtocol)
{
    EXPECT_EQ(esp32pair::naturalPairOrder(esp32pair::Protocol::Generic10), esp32pair::PairOrder::MarkSpace);
    EXPECT_EQ(esp32pair::naturalPairOrder(esp32pair::Protocol::Samsung), esp32pair::PairOrder::SpaceMark);
    EXPECT_EQ(esp32pair::naturalPairOrder(esp32pair::Protocol::Hexbug), esp32pair::PairOrder::SpaceMark);
    EXPECT_EQ(esp32pair::naturalPairOrder(esp32pair::Protocol::PPM), esp32pair::PairOrder::SpaceMark);
}

TEST(PulseSequenceTest, ProtocolNames)
{
    EXPECT_EQ(std::string(esp32pair::protocolName(esp32pair::Protocol::Generic10)), "Generic10");
    EXPECT_EQ(std::string(esp32pair::protocolName(esp32pair::Protocol::Samsung)), "Samsung");
    EXPECT_EQ(std::string(esp32pair::protocolName(esp32pair::Protocol::Hexbug)), "Hexbug");
    EXPECT_EQ(std::string(esp32pair::protocolName(esp32pair::Protocol::PPM)), "PPM");
}

TEST(FrameMarshallerTest, FramesCarryTheirOrder)
{
    esp32pair::SamsungFrame samsung(0x0707, 0x0202);
    esp32pair::HexbugFrame hexbug(esp32pair::kHexbugForward, esp32pair::kHexbugChannel1);
    const esp32pair::FrameMarshaller *frames[] = {&samsung, &hexbug};
    for (const auto *f : frames)
    {
        EXPECT_EQ(f->pairOrder(), esp32pair::PairOrder::SpaceMark);
        EXPECT_FALSE(f->marshalFrame().empty());
    }
    EXPECT_EQ(hexbug.marshalFrame().size(), 10u);
}
