#pragma once

#include "ESP32IRPairCodec.h"

namespace esp32pair
{
    constexpr const char *kTag = "ESP32IRPairCodec";

    // Thresholds are strict: a duration equal to the threshold is "below".
    inline bool longerThan(uint32_t us, uint32_t thresholdUs)
    {
        return us > thresholdUs;
    }

    // Rounds to the nearest multiple of tickUs, halves away from zero.
    inline uint32_t roundToTick(uint32_t us, uint32_t tickUs)
    {
        if (tickUs <= 1)
        {
            return us;
        }
        uint64_t counts = (static_cast<uint64_t>(us) + (tickUs / 2)) / tickUs;
        return static_cast<uint32_t>(counts * tickUs);
    }

    // Unsigned difference survives a wrap of the 32-bit microsecond counter.
    inline uint32_t elapsedUs(uint32_t fromUs, uint32_t toUs)
    {
        return toUs - fromUs;
    }
} // namespace esp32pair
