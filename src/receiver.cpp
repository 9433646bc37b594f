#include "ESP32IRPairDevice.h"
#include "core/pulse_utils.h"
#include <driver/rmt_rx.h>
#include <driver/rmt_types.h>
#include <esp_log.h>

namespace esp32pair
{

    namespace
    {
        constexpr uint32_t kRmtResolutionHz = 1000000; // 1us tick
        constexpr uint32_t kRmtDurationMax = 32767;
        constexpr uint32_t kMinSignalNs = 1000;
        constexpr UBaseType_t kQueueDepth = 4;

        const char *pairOrderName(esp32pair::PairOrder order)
        {
            switch (order)
            {
            case esp32pair::PairOrder::MarkSpace:
                return "MARK_SPACE";
            case esp32pair::PairOrder::SpaceMark:
                return "SPACE_MARK";
            default:
                return "UNKNOWN";
            }
        }

        bool rxDoneCallback(rmt_channel_handle_t, const rmt_rx_done_event_data_t *edata, void *user_ctx)
        {
            auto queue = static_cast<QueueHandle_t>(user_ctx);
            if (!queue || !edata)
            {
                return false;
            }
            BaseType_t high_task_woken = pdFALSE;
            xQueueSendFromISR(queue, edata, &high_task_woken);
            return high_task_woken == pdTRUE;
        }
    } // namespace

    Receiver::Receiver() = default;
    Receiver::Receiver(int pin, bool invert, esp32pair::PairOrder order)
        : rxPin_(pin), invertInput_(invert), order_(order), tracker_(order) {}

    bool Receiver::setPin(int pin)
    {
        if (begun_)
            return false;
        rxPin_ = pin;
        return true;
    }
    bool Receiver::setInvertInput(bool invert)
    {
        if (begun_)
            return false;
        invertInput_ = invert;
        return true;
    }
    bool Receiver::setPairOrder(esp32pair::PairOrder order)
    {
        if (begun_)
            return false;
        order_ = order;
        tracker_.setOrder(order);
        return true;
    }
    bool Receiver::setIdleGapUs(uint32_t idleGapUs)
    {
        if (begun_)
            return false;
        if (idleGapUs == 0 || idleGapUs > kRmtDurationMax)
        {
            ESP_LOGE(kTag, "RX idleGapUs %lu out of range (1..%lu)",
                     static_cast<unsigned long>(idleGapUs), static_cast<unsigned long>(kRmtDurationMax));
            return false;
        }
        idleGapUs_ = idleGapUs;
        return true;
    }
    bool Receiver::setBufferSymbols(size_t symbols)
    {
        if (begun_ || symbols == 0)
            return false;
        bufferSymbols_ = symbols;
        return true;
    }
    void Receiver::setConsumer(esp32pair::PulsePairConsumer *consumer)
    {
        tracker_.setConsumer(consumer);
    }

    bool Receiver::begin()
    {
        if (begun_)
        {
            ESP_LOGW(kTag, "RX begin called while already begun");
            return false;
        }
        if (rxPin_ < 0)
        {
            ESP_LOGE(kTag, "RX begin failed: pin not set");
            return false;
        }
        rmt_rx_channel_config_t config = {
            .gpio_num = static_cast<gpio_num_t>(rxPin_),
            .clk_src = RMT_CLK_SRC_DEFAULT,
            .resolution_hz = kRmtResolutionHz,
            .mem_block_symbols = 64,
            .intr_priority = 0,
            .flags = {
                .invert_in = invertInput_ ? 1U : 0U,
                .with_dma = 0,
                .io_loop_back = 0,
                .allow_pd = 0,
            },
        };
        if (rmt_new_rx_channel(&config, &rxChannel_) != ESP_OK)
        {
            ESP_LOGE(kTag, "RX begin failed: rmt_new_rx_channel");
            return false;
        }
        if (rmt_enable(rxChannel_) != ESP_OK)
        {
            ESP_LOGE(kTag, "RX begin failed: rmt_enable");
            rmt_del_channel(rxChannel_);
            rxChannel_ = nullptr;
            return false;
        }
        rxQueue_ = xQueueCreate(kQueueDepth, sizeof(rmt_rx_done_event_data_t));
        if (!rxQueue_)
        {
            ESP_LOGE(kTag, "RX begin failed: queue create");
            rmt_disable(rxChannel_);
            rmt_del_channel(rxChannel_);
            rxChannel_ = nullptr;
            return false;
        }
        rmt_rx_event_callbacks_t cbs = {
            .on_recv_done = rxDoneCallback,
        };
        if (rmt_rx_register_event_callbacks(rxChannel_, &cbs, rxQueue_) != ESP_OK)
        {
            ESP_LOGE(kTag, "RX begin failed: register callbacks");
            vQueueDelete(rxQueue_);
            rxQueue_ = nullptr;
            rmt_disable(rxChannel_);
            rmt_del_channel(rxChannel_);
            rxChannel_ = nullptr;
            return false;
        }
        rxBuffer_.assign(bufferSymbols_, {});
        rxConfig_.signal_range_min_ns = kMinSignalNs;
        rxConfig_.signal_range_max_ns = static_cast<uint32_t>(idleGapUs_) * 1000U;
        if (rmt_receive(rxChannel_, rxBuffer_.data(), rxBuffer_.size() * sizeof(rmt_symbol_word_t), &rxConfig_) != ESP_OK)
        {
            ESP_LOGE(kTag, "RX begin failed: rmt_receive");
            vQueueDelete(rxQueue_);
            rxQueue_ = nullptr;
            rmt_disable(rxChannel_);
            rmt_del_channel(rxChannel_);
            rxChannel_ = nullptr;
            return false;
        }
        tracker_.reset();
        clockUs_ = 0;
        ESP_LOGD(kTag, "RX init version=%s pin=%d invert=%s order=%s idleGapUs=%lu bufferSymbols=%u",
                 ESP32IRPAIRCODEC_VERSION_STR,
                 rxPin_, invertInput_ ? "true" : "false",
                 pairOrderName(order_),
                 static_cast<unsigned long>(idleGapUs_),
                 static_cast<unsigned>(bufferSymbols_));
        begun_ = true;
        ESP_LOGI(kTag, "RX begin: pin=%d invert=%s order=%s",
                 rxPin_, invertInput_ ? "true" : "false", pairOrderName(order_));
        return true;
    }

    void Receiver::end()
    {
        if (!begun_)
        {
            return;
        }
        if (rxChannel_)
        {
            rmt_disable(rxChannel_);
            rmt_del_channel(rxChannel_);
            rxChannel_ = nullptr;
        }
        if (rxQueue_)
        {
            vQueueDelete(rxQueue_);
            rxQueue_ = nullptr;
        }
        begun_ = false;
        ESP_LOGI(kTag, "RX end");
    }

    void Receiver::deliverCapture(const rmt_symbol_word_t *symbols, size_t count)
    {
        // A capture always opens with a mark after at least idleGapUs of silence.
        uint32_t t = clockUs_ + idleGapUs_;
        tracker_.onEdge(true, t);
        bool markActive = true;
        for (size_t i = 0; i < count; ++i)
        {
            const rmt_symbol_word_t &sym = symbols[i];
            const uint32_t levels[2] = {sym.level0, sym.level1};
            const uint32_t durations[2] = {sym.duration0, sym.duration1};
            for (int half = 0; half < 2; ++half)
            {
                if (durations[half] == 0)
                {
                    i = count; // end marker
                    break;
                }
                bool mark = levels[half] != 0;
                if (mark != markActive)
                {
                    tracker_.onEdge(mark, t);
                    markActive = mark;
                }
                t += durations[half];
            }
        }
        if (markActive)
        {
            tracker_.onEdge(false, t);
        }
        clockUs_ = t;
    }

    bool Receiver::poll()
    {
        if (!begun_)
        {
            ESP_LOGW(kTag, "RX poll called before begin");
            return false;
        }
        bool handled = false;
        rmt_rx_done_event_data_t ev{};
        while (xQueueReceive(rxQueue_, &ev, 0) == pdTRUE)
        {
            if (ev.num_symbols >= rxBuffer_.size())
            {
                ESP_LOGW(kTag, "RX buffer full (symbols=%u); capture may be truncated",
                         static_cast<unsigned>(ev.num_symbols));
            }
            deliverCapture(ev.received_symbols, ev.num_symbols);
            handled = true;
            esp_err_t err = rmt_receive(rxChannel_, rxBuffer_.data(), rxBuffer_.size() * sizeof(rmt_symbol_word_t), &rxConfig_);
            if (err != ESP_OK)
            {
                ESP_LOGE(kTag, "RX re-arm failed: rmt_receive err=%d", err);
                break;
            }
        }
        return handled;
    }

} // namespace esp32pair
