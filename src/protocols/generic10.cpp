#include "ESP32IRPairCodec.h"
#include "core/pulse_utils.h"
#include <utility>

// Cheap unbranded remotes sold with LED light strips. A ~9ms leading mark,
// then 10 bits carried in the space length. Codes usually count up from 0
// left to right, top to bottom. There is no check word.

namespace esp32pair
{

    Generic10Decoder::Generic10Decoder(Handler handler)
        : Generic10Decoder(std::move(handler), Config{}) {}

    Generic10Decoder::Generic10Decoder(Handler handler, const Config &config)
        : handler_(std::move(handler)), config_(config) {}

    void Generic10Decoder::setHandler(Handler handler) { handler_ = std::move(handler); }

    void Generic10Decoder::reset()
    {
        buf_ = 0;
        bitCount_ = 0;
    }

    void Generic10Decoder::handlePulsePair(const esp32pair::PulsePair &pair)
    {
        if (longerThan(pair.onUs, config_.startOnUs))
        {
            reset();
            return;
        }
        if (bitCount_ >= kBits)
        {
            return; // frame already delivered, wait for the next start
        }
        if (longerThan(pair.offUs, config_.oneOffUs))
        {
            buf_ |= static_cast<uint16_t>(1u << bitCount_);
        }
        ++bitCount_;

        if (bitCount_ < kBits)
        {
            return;
        }
        if (handler_)
        {
            esp32pair::payload::Generic10 out{buf_};
            handler_(out);
        }
    }

} // namespace esp32pair
