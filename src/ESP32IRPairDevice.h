#ifndef ESP32IRPAIRDEVICE_H
#define ESP32IRPAIRDEVICE_H

#include <Arduino.h>
#ifndef ESP_PLATFORM
#error "ESP32IRPairDevice is intended for ESP32 (ESP_PLATFORM must be defined)."
#endif

#include "ESP32IRPairCodec.h"
#include <initializer_list>
#include <vector>
#include <driver/rmt_tx.h>
#include <driver/rmt_rx.h>
#include <driver/rmt_encoder.h>
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

namespace esp32pair
{

  // RMT capture. Each capture ends after idleGapUs of silence; poll() turns the
  // captured symbols into pulse pairs and hands them to the consumer.
  class Receiver
  {
  public:
    Receiver();
    Receiver(int rxPin, bool invert = true, esp32pair::PairOrder order = esp32pair::PairOrder::MarkSpace);
    Receiver(const Receiver &) = delete;
    Receiver &operator=(const Receiver &) = delete;

    bool setPin(int rxPin);
    bool setInvertInput(bool invert);
    bool setPairOrder(esp32pair::PairOrder order);
    bool setIdleGapUs(uint32_t idleGapUs);
    bool setBufferSymbols(size_t symbols);
    // Not owned. May be changed while running.
    void setConsumer(esp32pair::PulsePairConsumer *consumer);

    bool begin();
    void end();

    // Delivers every pending capture. Returns true if at least one was handled.
    bool poll();

  private:
    void deliverCapture(const rmt_symbol_word_t *symbols, size_t count);

    int rxPin_{-1};
    bool invertInput_{true};
    esp32pair::PairOrder order_{esp32pair::PairOrder::MarkSpace};
    uint32_t idleGapUs_{20000};
    size_t bufferSymbols_{256};
    bool begun_{false};
    esp32pair::PulsePairTracker tracker_;
    uint32_t clockUs_{0};
    rmt_channel_handle_t rxChannel_{nullptr};
    QueueHandle_t rxQueue_{nullptr};
    std::vector<rmt_symbol_word_t> rxBuffer_;
    rmt_receive_config_t rxConfig_{};
  };

  // Edge interrupt on a plain GPIO, timestamped with micros(). The ISR only
  // queues pairs; poll() delivers them in task context.
  // Only isrThunk is in IRAM: the edge path runs through flash code, so this
  // needs the default (non-IRAM) Arduino ISR service.
  class GpioReceiver
  {
  public:
    GpioReceiver();
    GpioReceiver(int rxPin, bool invert = true, esp32pair::PairOrder order = esp32pair::PairOrder::MarkSpace);
    GpioReceiver(const GpioReceiver &) = delete;
    GpioReceiver &operator=(const GpioReceiver &) = delete;
    ~GpioReceiver();

    bool setPin(int rxPin);
    bool setInvertInput(bool invert);
    bool setPairOrder(esp32pair::PairOrder order);
    bool setQueueDepth(uint16_t depth);
    void setConsumer(esp32pair::PulsePairConsumer *consumer);

    bool begin();
    void end();

    // Returns the number of pairs delivered.
    size_t poll();

  private:
    class IsrQueueConsumer : public PulsePairConsumer
    {
    public:
      void handlePulsePair(const esp32pair::PulsePair &pair) override;
      QueueHandle_t queue{nullptr};
      volatile bool overflowed{false};
      BaseType_t woken{pdFALSE};
    };

    static void isrThunk(void *arg);
    void onEdgeIsr();

    int rxPin_{-1};
    bool invertInput_{true};
    esp32pair::PairOrder order_{esp32pair::PairOrder::MarkSpace};
    uint16_t queueDepth_{64};
    bool begun_{false};
    bool overflowReported_{false};
    esp32pair::PulsePairConsumer *consumer_{nullptr};
    IsrQueueConsumer isrSink_;
    esp32pair::PulsePairTracker tracker_;
  };

  // RMT playback with carrier.
  class Transmitter : public PulsePairSink
  {
  public:
    Transmitter();
    Transmitter(int txPin, bool invert = false, uint32_t hz = 38000);
    Transmitter(const Transmitter &) = delete;
    Transmitter &operator=(const Transmitter &) = delete;
    ~Transmitter();

    bool setPin(int txPin);
    bool setInvertOutput(bool invert);
    bool setCarrierHz(uint32_t hz);
    bool setDutyPercent(uint8_t dutyPercent);
    bool setGapUs(uint32_t gapUs);

    bool begin();
    void end();

    bool sendPairs(const esp32pair::PulseSequence &seq, esp32pair::PairOrder order) override;
    bool sendFrame(const esp32pair::FrameMarshaller &frame);
    bool sendFrames(std::initializer_list<const esp32pair::FrameMarshaller *> frames);

  private:
    void releaseChannel();

    int txPin_{-1};
    bool invertOutput_{false};
    uint32_t carrierHz_{38000};
    uint8_t dutyPercent_{50};
    uint32_t gapUs_{40000};
    bool begun_{false};
    bool channelEnabled_{false};
    rmt_channel_handle_t txChannel_{nullptr};
    rmt_encoder_handle_t txEncoder_{nullptr};
  };

} // namespace esp32pair

#endif // ESP32IRPAIRDEVICE_H
