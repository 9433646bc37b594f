#include "ESP32IRPairCodec.h"
#include "pulse_utils.h"

namespace esp32pair
{

    PulsePairTracker::PulsePairTracker(esp32pair::PairOrder order, esp32pair::PulsePairConsumer *consumer)
        : order_(order), consumer_(consumer) {}

    void PulsePairTracker::setConsumer(esp32pair::PulsePairConsumer *consumer) { consumer_ = consumer; }

    void PulsePairTracker::setOrder(esp32pair::PairOrder order)
    {
        order_ = order;
        heldUs_ = 0;
    }

    void PulsePairTracker::reset()
    {
        lastEdgeUs_ = 0;
        heldUs_ = 0;
    }

    void PulsePairTracker::onEdge(bool markStarted, uint32_t nowUs)
    {
        uint32_t since = elapsedUs(lastEdgeUs_, nowUs);
        lastEdgeUs_ = nowUs;

        // MarkSpace closes a pair when the next mark begins, SpaceMark when the mark ends.
        bool closesPair = (order_ == esp32pair::PairOrder::MarkSpace) ? markStarted : !markStarted;
        if (!closesPair)
        {
            heldUs_ = since;
            return;
        }
        if (consumer_)
        {
            consumer_->handlePulsePair(esp32pair::PulsePair{heldUs_, since});
        }
    }

} // namespace esp32pair
