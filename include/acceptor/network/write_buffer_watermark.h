#ifndef ACCEPTOR_NETWORK_WRITE_BUFFER_WATERMARK_H
#define ACCEPTOR_NETWORK_WRITE_BUFFER_WATERMARK_H

#include <cstddef>
#include <cstdint>
#include <functional>

namespace acceptor {
namespace network {

/**
 * Outbound queue accounting with high/low watermark hysteresis.
 *
 * The queue turns unwritable once its byte count reaches the high watermark
 * and writable again once it falls to the low watermark. Callbacks fire on
 * transitions only.
 */
class WriteBufferWatermark {
 public:
  using WatermarkCallback = std::function<void()>;

  static constexpr uint32_t kDefaultHighWatermark = 64 * 1024;
  static constexpr uint32_t kDefaultLowWatermark = 32 * 1024;

  WriteBufferWatermark(WatermarkCallback above_high_watermark,
                       WatermarkCallback below_low_watermark);

  /**
   * Throws std::invalid_argument unless 0 < low < high.
   */
  void setWatermarks(uint32_t high_watermark, uint32_t low_watermark);

  // Account for entries handed to the transport
  void add(size_t bytes, size_t entries = 1);

  // Account for entries written to the socket
  void drain(size_t bytes, size_t entries = 1);

  bool aboveHighWatermark() const { return above_high_watermark_; }

  size_t bytes() const { return bytes_; }
  size_t entries() const { return entries_; }
  uint32_t highWatermark() const { return high_watermark_; }
  uint32_t lowWatermark() const { return low_watermark_; }

 private:
  void checkWatermarks();

  uint32_t high_watermark_{kDefaultHighWatermark};
  uint32_t low_watermark_{kDefaultLowWatermark};
  size_t bytes_{0};
  size_t entries_{0};
  bool above_high_watermark_{false};
  WatermarkCallback above_high_watermark_callback_;
  WatermarkCallback below_low_watermark_callback_;
};

}  // namespace network
}  // namespace acceptor

#endif  // ACCEPTOR_NETWORK_WRITE_BUFFER_WATERMARK_H
