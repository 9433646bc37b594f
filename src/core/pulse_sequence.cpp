#include "ESP32IRPairCodec.h"

namespace esp32pair
{

  void PulseSequence::clear() { pairs_.clear(); }

  void PulseSequence::reserve(size_t n) { pairs_.reserve(n); }

  void PulseSequence::add(const esp32pair::PulsePair &pair) { pairs_.push_back(pair); }

  void PulseSequence::add(uint32_t onUs, uint32_t offUs) { pairs_.push_back(esp32pair::PulsePair{onUs, offUs}); }

  size_t PulseSequence::size() const { return pairs_.size(); }

  bool PulseSequence::empty() const { return pairs_.empty(); }

  const esp32pair::PulsePair &PulseSequence::at(size_t i) const
  {
    static const esp32pair::PulsePair kEmptyPair{0, 0};
    if (i < pairs_.size())
    {
      return pairs_[i];
    }
    return kEmptyPair;
  }

  uint32_t PulseSequence::totalTimeUs() const
  {
    uint32_t total = 0;
    for (const auto &p : pairs_)
    {
      total += p.onUs + p.offUs;
    }
    return total;
  }

  void replay(const esp32pair::PulseSequence &seq, esp32pair::PulsePairConsumer &consumer)
  {
    for (const auto &p : seq)
    {
      consumer.handlePulsePair(p);
    }
  }

  PairOrder naturalPairOrder(esp32pair::Protocol protocol)
  {
    switch (protocol)
    {
    case esp32pair::Protocol::Generic10:
      return esp32pair::PairOrder::MarkSpace;
    case esp32pair::Protocol::Samsung:
    case esp32pair::Protocol::Hexbug:
    case esp32pair::Protocol::PPM:
      return esp32pair::PairOrder::SpaceMark;
    default:
      return esp32pair::PairOrder::MarkSpace;
    }
  }

  const char *protocolName(esp32pair::Protocol protocol)
  {
    switch (protocol)
    {
    case esp32pair::Protocol::Generic10:
      return "Generic10";
    case esp32pair::Protocol::Samsung:
      return "Samsung";
    case esp32pair::Protocol::Hexbug:
      return "Hexbug";
    case esp32pair::Protocol::PPM:
      return "PPM";
    default:
      return "UNKNOWN";
    }
  }

} // namespace esp32pair
