#include "ESP32IRPairCodec.h"
#include "core/pulse_utils.h"
#include "pair_like.h"
#include <esp_log.h>
#include <utility>

namespace esp32pair
{

    namespace
    {
        constexpr uint32_t kHdrOnUs = 4500;
        constexpr uint32_t kHdrOffUs = 4500;
        constexpr uint32_t kOneOnUs = 1690;
        constexpr uint32_t kZeroOnUs = 560;
        constexpr uint32_t kBitOffUs = 560;

        constexpr esp32pair::PulsePair kStartPair{kHdrOnUs, kHdrOffUs};
        constexpr esp32pair::PulsePair kZeroPair{kZeroOnUs, kBitOffUs};
        constexpr esp32pair::PulsePair kOnePair{kOneOnUs, kBitOffUs};
    } // namespace

    SamsungDecoder::SamsungDecoder(Handler handler)
        : SamsungDecoder(std::move(handler), Config{}) {}

    SamsungDecoder::SamsungDecoder(Handler handler, const Config &config)
        : handler_(std::move(handler)), config_(config) {}

    void SamsungDecoder::setHandler(Handler handler) { handler_ = std::move(handler); }

    void SamsungDecoder::reset()
    {
        buf_ = 0;
        bitCount_ = 0;
    }

    void SamsungDecoder::handlePulsePair(const esp32pair::PulsePair &pair)
    {
        if (longerThan(pair.offUs, config_.ignoreOffUs))
        {
            return; // repeat gap or no signal
        }
        if (longerThan(pair.offUs, config_.startOffUs))
        {
            if (longerThan(pair.onUs, config_.startOnUs))
            {
                reset();
            }
            return;
        }
        if (bitCount_ >= kBits)
        {
            return;
        }
        if (longerThan(pair.onUs, config_.oneOnUs))
        {
            buf_ |= (1u << bitCount_);
        }
        ++bitCount_;

        if (bitCount_ != kBits)
        {
            return;
        }
        esp32pair::payload::Samsung out{};
        if (unmarshalSamsung(buf_, &out) != ESP_OK)
        {
            return;
        }
        if (handler_)
        {
            handler_(out);
        }
    }

    esp_err_t unmarshalSamsung(uint32_t raw, esp32pair::payload::Samsung *out)
    {
        if (out == nullptr)
        {
            ESP_LOGE(kTag, "Samsung unmarshal failed: destination frame not allocated");
            return ESP_ERR_INVALID_ARG;
        }
        out->address = static_cast<uint16_t>(raw & 0xFFFF);
        out->command = static_cast<uint16_t>((raw >> 16) & 0xFFFF);
        return ESP_OK;
    }

    esp32pair::PulseSequence marshalSamsung(const esp32pair::payload::Samsung &frame)
    {
        uint32_t data = (static_cast<uint32_t>(frame.command) << 16) | frame.address;
        // The stop bit is a zero.
        return pair_like::build(kStartPair, kZeroPair, kOnePair, data, SamsungDecoder::kBits, &kZeroPair);
    }

    SamsungFrame::SamsungFrame(uint16_t address, uint16_t command)
        : frame_{address, command} {}

    SamsungFrame::SamsungFrame(const esp32pair::payload::Samsung &frame)
        : frame_(frame) {}

    esp32pair::PulseSequence SamsungFrame::marshalFrame() const
    {
        return marshalSamsung(frame_);
    }

    esp32pair::PairOrder SamsungFrame::pairOrder() const
    {
        return naturalPairOrder(esp32pair::Protocol::Samsung);
    }

} // namespace esp32pair
