#include "ESP32IRPairDevice.h"
#include "core/pulse_utils.h"
#include <driver/rmt_tx.h>
#include <driver/rmt_encoder.h>
#include <esp_log.h>

namespace esp32pair
{

    namespace
    {
        constexpr uint32_t kRmtResolutionHz = 1000000; // 1us tick
        constexpr uint32_t kRmtDurationMax = 32767;

        void pushSymbol(std::vector<rmt_symbol_word_t> &items, bool level, uint32_t durationUs)
        {
            uint32_t remaining = durationUs;
            while (remaining > 0)
            {
                uint32_t chunk = remaining > kRmtDurationMax ? kRmtDurationMax : remaining;
                if (items.empty() || items.back().duration1 != 0)
                {
                    rmt_symbol_word_t item = {};
                    item.level0 = level ? 1 : 0;
                    item.duration0 = chunk;
                    items.push_back(item);
                }
                else
                {
                    rmt_symbol_word_t &last = items.back();
                    last.level1 = level ? 1 : 0;
                    last.duration1 = chunk;
                }
                remaining -= chunk;
            }
        }

        void appendPairs(std::vector<rmt_symbol_word_t> &items, const esp32pair::PulseSequence &seq, esp32pair::PairOrder order)
        {
            bool onIsMark = order == esp32pair::PairOrder::MarkSpace;
            for (const auto &p : seq)
            {
                pushSymbol(items, onIsMark, p.onUs);
                pushSymbol(items, !onIsMark, p.offUs);
            }
        }
    } // namespace

    Transmitter::Transmitter() = default;
    Transmitter::Transmitter(int pin, bool invert, uint32_t hz)
        : txPin_(pin), invertOutput_(invert), carrierHz_(hz) {}

    Transmitter::~Transmitter() { end(); }

    bool Transmitter::setPin(int pin)
    {
        if (begun_)
            return false;
        txPin_ = pin;
        return true;
    }
    bool Transmitter::setInvertOutput(bool invert)
    {
        if (begun_)
            return false;
        invertOutput_ = invert;
        return true;
    }
    bool Transmitter::setCarrierHz(uint32_t hz)
    {
        if (begun_)
            return false;
        carrierHz_ = hz;
        return true;
    }
    bool Transmitter::setGapUs(uint32_t gapUs)
    {
        if (begun_)
            return false;
        gapUs_ = gapUs;
        return true;
    }
    bool Transmitter::setDutyPercent(uint8_t dutyPercent)
    {
        if (begun_ || dutyPercent == 0 || dutyPercent > 100)
            return false;
        dutyPercent_ = dutyPercent;
        return true;
    }

    void Transmitter::releaseChannel()
    {
        if (txEncoder_)
        {
            rmt_del_encoder(txEncoder_);
            txEncoder_ = nullptr;
        }
        if (txChannel_)
        {
            if (channelEnabled_)
            {
                rmt_disable(txChannel_);
                channelEnabled_ = false;
            }
            rmt_del_channel(txChannel_);
            txChannel_ = nullptr;
        }
    }

    bool Transmitter::begin()
    {
        if (begun_)
        {
            ESP_LOGW(kTag, "TX begin called while already begun");
            return false;
        }
        if (txPin_ < 0)
        {
            ESP_LOGE(kTag, "TX begin failed: pin not set");
            return false;
        }
        rmt_tx_channel_config_t config = {};
        config.gpio_num = static_cast<gpio_num_t>(txPin_);
        config.clk_src = RMT_CLK_SRC_DEFAULT;
        config.resolution_hz = kRmtResolutionHz;
        config.mem_block_symbols = 64;
        config.trans_queue_depth = 4;
        config.flags.invert_out = invertOutput_ ? 1U : 0U;

        esp_err_t err = rmt_new_tx_channel(&config, &txChannel_);
        const char *step = "rmt_new_tx_channel";
        if (err == ESP_OK && carrierHz_ > 0)
        {
            // Pairs are played as mark/space levels; the carrier only fills marks.
            rmt_carrier_config_t carrier = {};
            carrier.frequency_hz = carrierHz_;
            carrier.duty_cycle = static_cast<float>(dutyPercent_) / 100.0f;
            err = rmt_apply_carrier(txChannel_, &carrier);
            step = "rmt_apply_carrier";
        }
        if (err == ESP_OK)
        {
            err = rmt_enable(txChannel_);
            step = "rmt_enable";
            channelEnabled_ = err == ESP_OK;
        }
        if (err == ESP_OK)
        {
            rmt_copy_encoder_config_t encoderConfig = {};
            err = rmt_new_copy_encoder(&encoderConfig, &txEncoder_);
            step = "rmt_new_copy_encoder";
        }
        if (err != ESP_OK)
        {
            ESP_LOGE(kTag, "TX begin failed: %s err=%d", step, err);
            releaseChannel();
            return false;
        }
        begun_ = true;
        ESP_LOGI(kTag, "TX begin v%s: pin=%d invert=%s carrier=%luHz duty=%u%% gapUs=%lu",
                 ESP32IRPAIRCODEC_VERSION_STR,
                 txPin_, invertOutput_ ? "true" : "false",
                 static_cast<unsigned long>(carrierHz_),
                 static_cast<unsigned>(dutyPercent_),
                 static_cast<unsigned long>(gapUs_));
        return true;
    }

    void Transmitter::end()
    {
        if (!begun_)
        {
            return;
        }
        releaseChannel();
        begun_ = false;
        ESP_LOGI(kTag, "TX end");
    }

    bool Transmitter::sendPairs(const esp32pair::PulseSequence &seq, esp32pair::PairOrder order)
    {
        if (!begun_)
        {
            ESP_LOGE(kTag, "TX send called before begin");
            return false;
        }
        if (seq.empty())
        {
            ESP_LOGE(kTag, "TX send failed: empty sequence");
            return false;
        }
        std::vector<rmt_symbol_word_t> items;
        items.reserve(seq.size() + 2);
        appendPairs(items, seq, order);
        // trailing gap as Space
        if (gapUs_ > 0)
        {
            pushSymbol(items, false, gapUs_);
        }
        uint64_t totalUs = static_cast<uint64_t>(seq.totalTimeUs()) + gapUs_;
        rmt_transmit_config_t tx_cfg = {
            .loop_count = 0,
            .flags = {
                .eot_level = 0,
                .queue_nonblocking = 0,
            },
        };
        esp_err_t err = rmt_transmit(txChannel_, txEncoder_, items.data(),
                                     items.size() * sizeof(rmt_symbol_word_t), &tx_cfg);
        if (err != ESP_OK)
        {
            ESP_LOGE(kTag, "TX send failed: rmt_transmit err=%d", err);
            return false;
        }
        uint32_t waitMs = static_cast<uint32_t>((totalUs + 50000) / 1000); // add 50ms margin
        if (waitMs < 100)
            waitMs = 100;
        err = rmt_tx_wait_all_done(txChannel_, pdMS_TO_TICKS(waitMs));
        if (err != ESP_OK)
        {
            ESP_LOGW(kTag, "TX wait done returned err=%d", err);
            return false;
        }
        return true;
    }

    bool Transmitter::sendFrame(const esp32pair::FrameMarshaller &frame)
    {
        return sendPairs(frame.marshalFrame(), frame.pairOrder());
    }

    bool Transmitter::sendFrames(std::initializer_list<const esp32pair::FrameMarshaller *> frames)
    {
        for (auto f : frames)
        {
            if (!f)
            {
                ESP_LOGE(kTag, "TX sendFrames failed: null frame");
                return false;
            }
            if (!sendFrame(*f))
            {
                return false;
            }
        }
        return true;
    }

} // namespace esp32pair
