#include "ESP32IRPairDevice.h"
#include "core/pulse_utils.h"
#include <esp_log.h>

#if defined(CONFIG_ARDUINO_ISR_IRAM) && CONFIG_ARDUINO_ISR_IRAM
#error "GpioReceiver decodes edges from flash; disable CONFIG_ARDUINO_ISR_IRAM or use Receiver (RMT)."
#endif

namespace esp32pair
{

    GpioReceiver::GpioReceiver() = default;
    GpioReceiver::GpioReceiver(int pin, bool invert, esp32pair::PairOrder order)
        : rxPin_(pin), invertInput_(invert), order_(order), tracker_(order) {}

    GpioReceiver::~GpioReceiver() { end(); }

    bool GpioReceiver::setPin(int pin)
    {
        if (begun_)
            return false;
        rxPin_ = pin;
        return true;
    }
    bool GpioReceiver::setInvertInput(bool invert)
    {
        if (begun_)
            return false;
        invertInput_ = invert;
        return true;
    }
    bool GpioReceiver::setPairOrder(esp32pair::PairOrder order)
    {
        if (begun_)
            return false;
        order_ = order;
        tracker_.setOrder(order);
        return true;
    }
    bool GpioReceiver::setQueueDepth(uint16_t depth)
    {
        if (begun_ || depth == 0)
            return false;
        queueDepth_ = depth;
        return true;
    }
    void GpioReceiver::setConsumer(esp32pair::PulsePairConsumer *consumer) { consumer_ = consumer; }

    void GpioReceiver::IsrQueueConsumer::handlePulsePair(const esp32pair::PulsePair &pair)
    {
        if (xQueueSendFromISR(queue, &pair, &woken) != pdTRUE)
        {
            overflowed = true;
        }
    }

    void IRAM_ATTR GpioReceiver::isrThunk(void *arg)
    {
        static_cast<GpioReceiver *>(arg)->onEdgeIsr();
    }

    void GpioReceiver::onEdgeIsr()
    {
        uint32_t now = micros();
        bool high = digitalRead(rxPin_) == HIGH;
        // Demodulating receivers idle high and pull low while the carrier is seen.
        bool mark = invertInput_ ? !high : high;
        isrSink_.woken = pdFALSE;
        tracker_.onEdge(mark, now);
        if (isrSink_.woken == pdTRUE)
        {
            portYIELD_FROM_ISR();
        }
    }

    bool GpioReceiver::begin()
    {
        if (begun_)
        {
            ESP_LOGW(kTag, "GPIO RX begin called while already begun");
            return false;
        }
        if (rxPin_ < 0)
        {
            ESP_LOGE(kTag, "GPIO RX begin failed: pin not set");
            return false;
        }
        isrSink_.queue = xQueueCreate(queueDepth_, sizeof(esp32pair::PulsePair));
        if (!isrSink_.queue)
        {
            ESP_LOGE(kTag, "GPIO RX begin failed: queue create");
            return false;
        }
        isrSink_.overflowed = false;
        overflowReported_ = false;
        tracker_.reset();
        tracker_.setConsumer(&isrSink_);
        pinMode(rxPin_, INPUT);
        attachInterruptArg(digitalPinToInterrupt(rxPin_), isrThunk, this, CHANGE);
        begun_ = true;
        ESP_LOGI(kTag, "GPIO RX begin: pin=%d invert=%s queueDepth=%u",
                 rxPin_, invertInput_ ? "true" : "false", static_cast<unsigned>(queueDepth_));
        return true;
    }

    void GpioReceiver::end()
    {
        if (!begun_)
        {
            return;
        }
        detachInterrupt(digitalPinToInterrupt(rxPin_));
        tracker_.setConsumer(nullptr);
        if (isrSink_.queue)
        {
            vQueueDelete(isrSink_.queue);
            isrSink_.queue = nullptr;
        }
        begun_ = false;
        ESP_LOGI(kTag, "GPIO RX end");
    }

    size_t GpioReceiver::poll()
    {
        if (!begun_)
        {
            ESP_LOGW(kTag, "GPIO RX poll called before begin");
            return 0;
        }
        if (isrSink_.overflowed)
        {
            if (!overflowReported_)
            {
                ESP_LOGW(kTag, "GPIO RX queue overflow: pairs dropped");
                overflowReported_ = true;
            }
            isrSink_.overflowed = false;
        }
        else
        {
            overflowReported_ = false;
        }
        size_t delivered = 0;
        esp32pair::PulsePair pair{};
        while (xQueueReceive(isrSink_.queue, &pair, 0) == pdTRUE)
        {
            if (consumer_)
            {
                consumer_->handlePulsePair(pair);
            }
            ++delivered;
        }
        return delivered;
    }

} // namespace esp32pair
