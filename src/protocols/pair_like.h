#pragma once

#include "ESP32IRPairCodec.h"
#include "core/pulse_utils.h"

namespace esp32pair
{
namespace pair_like
{
// One pair per bit, LSB first.
inline void appendBits(esp32pair::PulseSequence &seq,
                       uint32_t data,
                       uint8_t bits,
                       const esp32pair::PulsePair &zeroPair,
                       const esp32pair::PulsePair &onePair)
{
    for (uint8_t i = 0; i < bits; ++i)
    {
        bool one = (data >> i) & 0x1;
        seq.add(one ? onePair : zeroPair);
    }
}

// Start pair, the data bits, then the trailer when one is given.
inline esp32pair::PulseSequence build(const esp32pair::PulsePair &startPair,
                                      const esp32pair::PulsePair &zeroPair,
                                      const esp32pair::PulsePair &onePair,
                                      uint32_t data,
                                      uint8_t bits,
                                      const esp32pair::PulsePair *trailer)
{
    esp32pair::PulseSequence seq;
    seq.reserve(static_cast<size_t>(bits) + 2);
    seq.add(startPair);
    appendBits(seq, data, bits, zeroPair, onePair);
    if (trailer)
    {
        seq.add(*trailer);
    }
    return seq;
}
} // namespace pair_like
} // namespace esp32pair
