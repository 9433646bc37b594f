#ifndef ESP32IRPAIRCODEC_H
#define ESP32IRPAIRCODEC_H

#include <stddef.h>
#include <stdint.h>

#include "esp32irpaircodec_version.h"
#include <array>
#include <functional>
#include <initializer_list>
#include <vector>
#include <esp_err.h>

namespace esp32pair
{

  // One on/off cycle in microseconds. Which physical level "on" carries is
  // given by PairOrder.
  struct PulsePair
  {
    uint32_t onUs;
    uint32_t offUs;
  };

  inline bool operator==(const PulsePair &a, const PulsePair &b)
  {
    return a.onUs == b.onUs && a.offUs == b.offUs;
  }

  inline bool operator!=(const PulsePair &a, const PulsePair &b) { return !(a == b); }

  enum class PairOrder : uint8_t
  {
    MarkSpace = 0, // on = carrier time, off = following gap
    SpaceMark,     // on = gap before the carrier, off = carrier time
  };

  // Protocol identifiers
  enum class Protocol : uint8_t
  {
    Generic10 = 0,
    Samsung,
    Hexbug,
    PPM,
  };

  PairOrder naturalPairOrder(esp32pair::Protocol protocol);
  const char *protocolName(esp32pair::Protocol protocol);

  class PulseSequence
  {
  public:
    PulseSequence() = default;

    void clear();
    void reserve(size_t n);
    void add(const esp32pair::PulsePair &pair);
    void add(uint32_t onUs, uint32_t offUs);

    size_t size() const;
    bool empty() const;
    const esp32pair::PulsePair &at(size_t i) const;
    uint32_t totalTimeUs() const;

    std::vector<esp32pair::PulsePair>::const_iterator begin() const { return pairs_.begin(); }
    std::vector<esp32pair::PulsePair>::const_iterator end() const { return pairs_.end(); }

  private:
    std::vector<esp32pair::PulsePair> pairs_;
  };

  // Anything that eats pulse pairs: decoders, the dispatcher, host code.
  class PulsePairConsumer
  {
  public:
    virtual ~PulsePairConsumer() = default;
    virtual void handlePulsePair(const esp32pair::PulsePair &pair) = 0;
  };

  // Anything that can play a sequence out on a carrier.
  class PulsePairSink
  {
  public:
    virtual ~PulsePairSink() = default;
    virtual bool sendPairs(const esp32pair::PulseSequence &seq, esp32pair::PairOrder order) = 0;
  };

  class FrameMarshaller
  {
  public:
    virtual ~FrameMarshaller() = default;
    virtual esp32pair::PulseSequence marshalFrame() const = 0;
    virtual esp32pair::PairOrder pairOrder() const = 0;
  };

  // Feeds every pair of seq to consumer, in order.
  void replay(const esp32pair::PulseSequence &seq, esp32pair::PulsePairConsumer &consumer);

  // Forwards each pair to every registered consumer in registration order.
  // Consumers are not owned and must outlive the dispatcher.
  class PulsePairDispatcher : public PulsePairConsumer
  {
  public:
    PulsePairDispatcher() = default;
    PulsePairDispatcher(std::initializer_list<esp32pair::PulsePairConsumer *> consumers);

    bool add(esp32pair::PulsePairConsumer *consumer);
    void clear();
    size_t size() const;

    void handlePulsePair(const esp32pair::PulsePair &pair) override;

  private:
    std::vector<esp32pair::PulsePairConsumer *> consumers_;
  };

  // Turns timestamped edges into pulse pairs, the same rule for every receiver.
  class PulsePairTracker
  {
  public:
    explicit PulsePairTracker(esp32pair::PairOrder order = esp32pair::PairOrder::MarkSpace,
                              esp32pair::PulsePairConsumer *consumer = nullptr);

    void setConsumer(esp32pair::PulsePairConsumer *consumer);
    void setOrder(esp32pair::PairOrder order);
    esp32pair::PairOrder order() const { return order_; }

    // markStarted: true when the carrier just appeared, false when it just went away.
    void onEdge(bool markStarted, uint32_t nowUs);
    void reset();

  private:
    esp32pair::PairOrder order_;
    esp32pair::PulsePairConsumer *consumer_;
    uint32_t lastEdgeUs_{0};
    uint32_t heldUs_{0};
  };

  namespace payload
  {
    struct Generic10
    {
      uint16_t code;
    };

    struct Samsung
    {
      uint16_t address;
      uint16_t command;
    };

    struct Hexbug
    {
      uint8_t buttons; // kHexbug* masks
      uint8_t channel; // 2-bit id as sent, see hexbugChannelNumber()
    };

  } // namespace payload

  // ---------------------------------------------------------------- Generic10

  class Generic10Decoder : public PulsePairConsumer
  {
  public:
    static constexpr uint8_t kBits = 10;

    struct Config
    {
      uint32_t startOnUs{7000};
      uint32_t oneOffUs{1000};
    };

    using Handler = std::function<void(const esp32pair::payload::Generic10 &)>;

    explicit Generic10Decoder(Handler handler);
    Generic10Decoder(Handler handler, const Config &config);

    void setHandler(Handler handler);
    void handlePulsePair(const esp32pair::PulsePair &pair) override;
    void reset();

    uint16_t buffer() const { return buf_; }
    uint8_t bitCount() const { return bitCount_; }

  private:
    Handler handler_;
    Config config_;
    uint16_t buf_{0};
    uint8_t bitCount_{0};
  };

  // ------------------------------------------------------------------ Samsung

  class SamsungDecoder : public PulsePairConsumer
  {
  public:
    static constexpr uint8_t kBits = 32;

    struct Config
    {
      uint32_t ignoreOffUs{200000};
      uint32_t startOffUs{3000};
      uint32_t startOnUs{3000};
      uint32_t oneOnUs{1000};
    };

    using Handler = std::function<void(const esp32pair::payload::Samsung &)>;

    explicit SamsungDecoder(Handler handler);
    SamsungDecoder(Handler handler, const Config &config);

    void setHandler(Handler handler);
    void handlePulsePair(const esp32pair::PulsePair &pair) override;
    void reset();

    uint32_t buffer() const { return buf_; }
    uint8_t bitCount() const { return bitCount_; }

  private:
    Handler handler_;
    Config config_;
    uint32_t buf_{0};
    uint8_t bitCount_{0};
  };

  // Splits a received 32-bit word into address (low half) and command (high half).
  // Returns ESP_ERR_INVALID_ARG when out is null.
  esp_err_t unmarshalSamsung(uint32_t raw, esp32pair::payload::Samsung *out);
  esp32pair::PulseSequence marshalSamsung(const esp32pair::payload::Samsung &frame);

  class SamsungFrame : public FrameMarshaller
  {
  public:
    SamsungFrame(uint16_t address, uint16_t command);
    explicit SamsungFrame(const esp32pair::payload::Samsung &frame);

    const esp32pair::payload::Samsung &payload() const { return frame_; }

    esp32pair::PulseSequence marshalFrame() const override;
    esp32pair::PairOrder pairOrder() const override;

  private:
    esp32pair::payload::Samsung frame_;
  };

  // ------------------------------------------------------------------- Hexbug

  constexpr uint8_t kHexbugStop = 0x00;
  constexpr uint8_t kHexbugForward = 0x01;
  constexpr uint8_t kHexbugBack = 0x02;
  constexpr uint8_t kHexbugLeft = 0x04;
  constexpr uint8_t kHexbugRight = 0x08;
  constexpr uint8_t kHexbugLeftWeapon = 0x10;
  constexpr uint8_t kHexbugRightWeapon = 0x20;
  constexpr uint8_t kHexbugButtonMask = 0x3F;

  // Channel ids as they appear on the wire. 3 and 4 are swapped by the remote.
  constexpr uint8_t kHexbugChannel1 = 0;
  constexpr uint8_t kHexbugChannel2 = 1;
  constexpr uint8_t kHexbugChannel3 = 3;
  constexpr uint8_t kHexbugChannel4 = 2;

  // 1..4 for a 2-bit id, 0 for anything else.
  uint8_t hexbugChannelNumber(uint8_t channelId);
  // 2-bit id for channel 1..4; returns false for other numbers.
  bool hexbugChannelId(uint8_t channelNumber, uint8_t &channelId);

  class HexbugDecoder : public PulsePairConsumer
  {
  public:
    static constexpr uint8_t kBits = 9;

    struct Config
    {
      uint32_t startOffUs{1600};
      uint32_t oneOffUs{750};
    };

    using Handler = std::function<void(const esp32pair::payload::Hexbug &)>;

    explicit HexbugDecoder(Handler handler);
    HexbugDecoder(Handler handler, const Config &config);

    void setHandler(Handler handler);
    void handlePulsePair(const esp32pair::PulsePair &pair) override;
    void reset();

    uint16_t buffer() const { return buf_; }
    uint8_t bitCount() const { return bitCount_; }
    bool parity() const { return parity_; }

  private:
    Handler handler_;
    Config config_;
    uint16_t buf_{0};
    uint8_t bitCount_{0};
    bool parity_{false};
  };

  esp32pair::PulseSequence marshalHexbug(const esp32pair::payload::Hexbug &cmd);

  class HexbugFrame : public FrameMarshaller
  {
  public:
    HexbugFrame(uint8_t buttons, uint8_t channelId);
    explicit HexbugFrame(const esp32pair::payload::Hexbug &cmd);

    const esp32pair::payload::Hexbug &payload() const { return cmd_; }

    esp32pair::PulseSequence marshalFrame() const override;
    esp32pair::PairOrder pairOrder() const override;

  private:
    esp32pair::payload::Hexbug cmd_;
  };

  // ---------------------------------------------------------------------- PPM

  constexpr size_t kPpmMaxChannels = 16;
  using PpmChannels = std::array<uint32_t, kPpmMaxChannels>;

  extern const esp32pair::PpmChannels kPpmSafeChannelsMid;
  extern const esp32pair::PpmChannels kPpmSafeChannelsBottom;

  // Maps a 1000..2000us channel width onto -1..1.
  float ppmToUnit(uint32_t us);

  class PpmDecoder : public PulsePairConsumer
  {
  public:
    // Monotonic microseconds, e.g. esp_timer_get_time.
    using ClockFn = int64_t (*)();

    static constexpr uint32_t kMinFrameGapUs = 6000;

    struct Config
    {
      uint32_t syncOnUs{kMinFrameGapUs};
      uint32_t tickUs{10};
      uint8_t channelCount{kPpmMaxChannels};
      int64_t timeoutUs{100 * static_cast<int64_t>(kMinFrameGapUs)};
      esp32pair::PpmChannels safeChannels = kPpmSafeChannelsMid;
    };

    explicit PpmDecoder(ClockFn clock);
    PpmDecoder(ClockFn clock, const Config &config);

    void handlePulsePair(const esp32pair::PulsePair &pair) override;

    void setSafeChannels(const esp32pair::PpmChannels &channels);
    void setTimeoutUs(int64_t timeoutUs);

    // True until the first sync and whenever the last sync is older than the timeout.
    bool isSafe() const;
    bool synced() const { return synced_; }
    uint8_t currentChannel() const { return currentCh_; }

    uint32_t channelUs(size_t ch) const;
    esp32pair::PpmChannels channels() const;

  private:
    ClockFn clock_;
    Config config_;
    esp32pair::PpmChannels channels_;
    uint8_t currentCh_{0};
    bool synced_{false};
    int64_t lastSyncUs_{0};
  };

} // namespace esp32pair

#endif // ESP32IRPAIRCODEC_H
