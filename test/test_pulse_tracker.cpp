#include "ESP32IRPairCodec.h"
#include <gtest/gtest.h>
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

TEST(PulsePairTrackerTest, MarkSpaceClosesOnNextMark)
{
    CollectingConsumer out;
    esp32pair::PulsePairTracker tracker(esp32pair::PairOrder::MarkSpace, &out);
    tracker.onEdge(true, 1000);
    tracker.onEdge(false, 1600);
    tracker.onEdge(true, 2000);
    tracker.onEdge(false, 3000);
    tracker.onEdge(true, 3500);

    ASSERT_EQ(out.pairs.size(), 3u);
    // leading idle time comes out as a pair with no mark
    EXPECT_EQ(out.pairs[0], (esp32pair::PulsePair{0, 1000}));
    EXPECT_EQ(out.pairs[1], (esp32pair::PulsePair{600, 400}));
    EXPECT_EQ(out.pairs[2], (esp32pair::PulsePair{1000, 500}));
}

TEST(PulsePairTrackerTest, SpaceMarkClosesWhenMarkEnds)
{
    CollectingConsumer out;
    esp32pair::PulsePairTracker tracker(esp32pair::PairOrder::SpaceMark, &out);
    tracker.onEdge(true, 1000);
    tracker.onEdge(false, 1600);
    tracker.onEdge(true, 2000);
    tracker.onEdge(false, 3000);

    ASSERT_EQ(out.pairs.size(), 2u);
    EXPECT_EQ(out.pairs[0], (esp32pair::PulsePair{1000, 600}));
    EXPECT_EQ(out.pairs[1], (esp32pair::PulsePair{400, 1000}));
}

TEST(PulsePairTrackerTest, CounterWrapKeepsDurations)
{
    CollectingConsumer out;
    esp32pair::PulsePairTracker tracker(esp32pair::PairOrder::SpaceMark, &out);
    tracker.onEdge(true, 0xFFFFFF00u);
    tracker.onEdge(false, 0xFFFFFF00u + 0x200u);

    ASSERT_EQ(out.pairs.size(), 1u);
    EXPECT_EQ(out.pairs[0].offUs, 0x200u);
}

TEST(PulsePairTrackerTest, SamsungFrameThroughEdges)
{
    std::vector<esp32pair::payload::Samsung> frames;
    esp32pair::SamsungDecoder decoder([&](const esp32pair::payload::Samsung &f) { frames.push_back(f); });
    esp32pair::PulsePairTracker tracker(esp32pair::naturalPairOrder(esp32pair::Protocol::Samsung), &decoder);

    // play the marshalled pairs as space then mark, the way the transmitter would
    uint32_t t = 100000;
    for (const auto &p : esp32pair::marshalSamsung({0x00FF, 0x1E1E}))
    {
        t += p.onUs;
        tracker.onEdge(true, t);
        t += p.offUs;
        tracker.onEdge(false, t);
    }

    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].address, 0x00FF);
    EXPECT_EQ(frames[0].command, 0x1E1E);
}

TEST(PulsePairTrackerTest, SetOrderDropsHeldHalf)
{
    CollectingConsumer out;
    esp32pair::PulsePairTracker tracker(esp32pair::PairOrder::MarkSpace, &out);
    tracker.onEdge(false, 700);
    tracker.setOrder(esp32pair::PairOrder::SpaceMark);
    EXPECT_EQ(tracker.order(), esp32pair::PairOrder::SpaceMark);
    tracker.onEdge(false, 900);

    ASSERT_EQ(out.pairs.size(), 1u);
    EXPECT_EQ(out.pairs[0], (esp32pair::PulsePair{0, 200}));
}

TEST(PulsePairTrackerTest, NoConsumerIsHarmless)
{
    esp32pair::PulsePairTracker tracker;
    tracker.onEdge(true, 10);
    tracker.onEdge(false, 20);
    tracker.onEdge(true, 30);
    tracker.reset();
}
