#include "ESP32IRPairCodec.h"
#include "core/pulse_utils.h"
#include "pair_like.h"
#include <esp_log.h>
#include <utility>

// HEXBUG BattleBots 6-button / 4-channel remote.
//
// A frame is a start pulse followed by 9 bits, LSB first. Only the carrier
// time matters: > 1.6ms is a start, > 750us is a one, shorter is a zero.
// Received as (gap, carrier) pairs the carrier time lands in offUs.
//
//   bit  8 7 6 5 4 3 2 1 0
//        P C C U D R L B F
//
//   F forward, B back, L left, R right, D left weapon, U right weapon,
//   CC channel id, P odd parity over all nine bits.
//
// A press is sent at least twice ~6ms apart and repeated while held. On
// release the remote sends ten stop frames (no buttons) ~200ms apart.

namespace esp32pair
{

    namespace
    {
        constexpr uint32_t kGapUs = 350;
        constexpr uint32_t kStartCarrierUs = 1750;
        constexpr uint32_t kOneCarrierUs = 1000;
        constexpr uint32_t kZeroCarrierUs = 350;
        constexpr uint8_t kDataBits = 8;

        constexpr esp32pair::PulsePair kStartPair{kGapUs, kStartCarrierUs};
        constexpr esp32pair::PulsePair kZeroPair{kGapUs, kZeroCarrierUs};
        constexpr esp32pair::PulsePair kOnePair{kGapUs, kOneCarrierUs};

        uint8_t packData(const esp32pair::payload::Hexbug &cmd)
        {
            return static_cast<uint8_t>((cmd.buttons & kHexbugButtonMask) | ((cmd.channel & 0x3) << 6));
        }
    } // namespace

    uint8_t hexbugChannelNumber(uint8_t channelId)
    {
        switch (channelId)
        {
        case kHexbugChannel1:
            return 1;
        case kHexbugChannel2:
            return 2;
        case kHexbugChannel3:
            return 3;
        case kHexbugChannel4:
            return 4;
        default:
            return 0;
        }
    }

    bool hexbugChannelId(uint8_t channelNumber, uint8_t &channelId)
    {
        switch (channelNumber)
        {
        case 1:
            channelId = kHexbugChannel1;
            return true;
        case 2:
            channelId = kHexbugChannel2;
            return true;
        case 3:
            channelId = kHexbugChannel3;
            return true;
        case 4:
            channelId = kHexbugChannel4;
            return true;
        default:
            return false;
        }
    }

    HexbugDecoder::HexbugDecoder(Handler handler)
        : HexbugDecoder(std::move(handler), Config{}) {}

    HexbugDecoder::HexbugDecoder(Handler handler, const Config &config)
        : handler_(std::move(handler)), config_(config) {}

    void HexbugDecoder::setHandler(Handler handler) { handler_ = std::move(handler); }

    void HexbugDecoder::reset()
    {
        buf_ = 0;
        bitCount_ = 0;
        parity_ = false;
    }

    void HexbugDecoder::handlePulsePair(const esp32pair::PulsePair &pair)
    {
        if (longerThan(pair.offUs, config_.startOffUs))
        {
            reset();
            return;
        }
        if (longerThan(pair.offUs, config_.oneOffUs))
        {
            buf_ |= static_cast<uint16_t>(1u << bitCount_);
            // Starts false and flips per one: true means an odd count.
            parity_ = !parity_;
        }
        ++bitCount_;

        if (bitCount_ < kBits)
        {
            return;
        }
        if (parity_)
        {
            if (handler_)
            {
                uint8_t data = static_cast<uint8_t>(buf_ & 0xFF);
                esp32pair::payload::Hexbug out{static_cast<uint8_t>(data & kHexbugButtonMask),
                                               static_cast<uint8_t>(data >> 6)};
                handler_(out);
            }
        }
        else
        {
            ESP_LOGD(kTag, "Hexbug frame 0x%03x dropped: parity", static_cast<unsigned>(buf_));
        }
        reset();
    }

    esp32pair::PulseSequence marshalHexbug(const esp32pair::payload::Hexbug &cmd)
    {
        uint8_t data = packData(cmd);
        uint8_t ones = 0;
        for (uint8_t i = 0; i < kDataBits; ++i)
        {
            ones += (data >> i) & 0x1;
        }
        // Parity bit makes the total count of ones odd.
        const esp32pair::PulsePair &parityPair = (ones % 2 == 0) ? kOnePair : kZeroPair;
        return pair_like::build(kStartPair, kZeroPair, kOnePair, data, kDataBits, &parityPair);
    }

    HexbugFrame::HexbugFrame(uint8_t buttons, uint8_t channelId)
        : cmd_{buttons, channelId} {}

    HexbugFrame::HexbugFrame(const esp32pair::payload::Hexbug &cmd)
        : cmd_(cmd) {}

    esp32pair::PulseSequence HexbugFrame::marshalFrame() const
    {
        return marshalHexbug(cmd_);
    }

    esp32pair::PairOrder HexbugFrame::pairOrder() const
    {
        return naturalPairOrder(esp32pair::Protocol::Hexbug);
    }

} // namespace esp32pair
