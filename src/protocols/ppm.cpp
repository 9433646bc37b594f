#include "ESP32IRPairCodec.h"
#include "core/pulse_utils.h"
#include <esp_log.h>

// Pulse-position modulation carried over IR, as an RC transmitter would
// put it on a wire: a long gap syncs the frame, then each channel is one
// on+off period of roughly 1ms..2ms. At a 38kHz carrier that leaves about
// 38 steps per channel.

namespace esp32pair
{

    namespace
    {
        constexpr esp32pair::PpmChannels filled(uint32_t us)
        {
            esp32pair::PpmChannels c{};
            for (size_t i = 0; i < c.size(); ++i)
            {
                c[i] = us;
            }
            return c;
        }
    } // namespace

    const esp32pair::PpmChannels kPpmSafeChannelsMid = filled(1500);
    const esp32pair::PpmChannels kPpmSafeChannelsBottom = filled(1000);

    float ppmToUnit(uint32_t us)
    {
        return (2.0f * static_cast<float>(us) - 3000.0f) / 1000.0f;
    }

    PpmDecoder::PpmDecoder(ClockFn clock)
        : PpmDecoder(clock, Config{}) {}

    PpmDecoder::PpmDecoder(ClockFn clock, const Config &config)
        : clock_(clock), config_(config), channels_(config.safeChannels)
    {
        if (config_.channelCount > kPpmMaxChannels)
        {
            ESP_LOGW(kTag, "PPM channelCount %u clamped to %u",
                     static_cast<unsigned>(config_.channelCount), static_cast<unsigned>(kPpmMaxChannels));
            config_.channelCount = static_cast<uint8_t>(kPpmMaxChannels);
        }
        if (!clock_)
        {
            ESP_LOGE(kTag, "PPM decoder created without a clock; channels stay at safe values");
        }
    }

    void PpmDecoder::handlePulsePair(const esp32pair::PulsePair &pair)
    {
        if (longerThan(pair.onUs, config_.syncOnUs))
        {
            if (clock_)
            {
                lastSyncUs_ = clock_();
            }
            synced_ = true;
            currentCh_ = 0;
            return;
        }
        // Starting mid-frame would put garbage on the channels.
        if (!synced_)
        {
            return;
        }
        if (currentCh_ >= config_.channelCount)
        {
            ESP_LOGV(kTag, "PPM pulse past channel %u dropped", static_cast<unsigned>(config_.channelCount));
            return;
        }
        channels_[currentCh_] = roundToTick(pair.onUs + pair.offUs, config_.tickUs);
        ++currentCh_;
    }

    void PpmDecoder::setSafeChannels(const esp32pair::PpmChannels &channels) { config_.safeChannels = channels; }

    void PpmDecoder::setTimeoutUs(int64_t timeoutUs) { config_.timeoutUs = timeoutUs; }

    bool PpmDecoder::isSafe() const
    {
        if (!synced_ || !clock_)
        {
            return true;
        }
        return (clock_() - lastSyncUs_) > config_.timeoutUs;
    }

    uint32_t PpmDecoder::channelUs(size_t ch) const
    {
        if (ch >= kPpmMaxChannels)
        {
            ESP_LOGE(kTag, "PPM channel %u out of range", static_cast<unsigned>(ch));
            return 0;
        }
        if (isSafe())
        {
            return config_.safeChannels[ch];
        }
        return channels_[ch];
    }

    esp32pair::PpmChannels PpmDecoder::channels() const
    {
        if (isSafe())
        {
            return config_.safeChannels;
        }
        return channels_;
    }

} // namespace esp32pair
