#include "ESP32IRPairCodec.h"
#include "pulse_utils.h"
#include <esp_log.h>

namespace esp32pair
{

    PulsePairDispatcher::PulsePairDispatcher(std::initializer_list<esp32pair::PulsePairConsumer *> consumers)
    {
        consumers_.reserve(consumers.size());
        for (auto c : consumers)
        {
            add(c);
        }
    }

    bool PulsePairDispatcher::add(esp32pair::PulsePairConsumer *consumer)
    {
        if (!consumer)
        {
            ESP_LOGE(kTag, "dispatcher add failed: consumer is null");
            return false;
        }
        consumers_.push_back(consumer);
        return true;
    }

    void PulsePairDispatcher::clear() { consumers_.clear(); }

    size_t PulsePairDispatcher::size() const { return consumers_.size(); }

    void PulsePairDispatcher::handlePulsePair(const esp32pair::PulsePair &pair)
    {
        for (auto c : consumers_)
        {
            c->handlePulsePair(pair);
        }
    }

} // namespace esp32pair
