#include "acceptor/network/write_buffer_watermark.h"

#include <stdexcept>

namespace acceptor {
namespace network {

WriteBufferWatermark::WriteBufferWatermark(
    WatermarkCallback above_high_watermark,
    WatermarkCallback below_low_watermark)
    : above_high_watermark_callback_(std::move(above_high_watermark)),
      below_low_watermark_callback_(std::move(below_low_watermark)) {}

void WriteBufferWatermark::setWatermarks(uint32_t high_watermark,
                                         uint32_t low_watermark) {
  if (high_watermark == 0 || low_watermark == 0) {
    throw std::invalid_argument("watermarks must be positive");
  }
  if (low_watermark >= high_watermark) {
    throw std::invalid_argument(
        "low watermark must be below the high watermark");
  }
  high_watermark_ = high_watermark;
  low_watermark_ = low_watermark;
  checkWatermarks();
}

void WriteBufferWatermark::add(size_t bytes, size_t entries) {
  bytes_ += bytes;
  entries_ += entries;
  checkWatermarks();
}

void WriteBufferWatermark::drain(size_t bytes, size_t entries) {
  bytes_ = bytes > bytes_ ? 0 : bytes_ - bytes;
  entries_ = entries > entries_ ? 0 : entries_ - entries;
  checkWatermarks();
}

void WriteBufferWatermark::checkWatermarks() {
  if (!above_high_watermark_ && bytes_ >= high_watermark_) {
    above_high_watermark_ = true;
    if (above_high_watermark_callback_) {
      above_high_watermark_callback_();
    }
  } else if (above_high_watermark_ && bytes_ <= low_watermark_) {
    above_high_watermark_ = false;
    if (below_low_watermark_callback_) {
      below_low_watermark_callback_();
    }
  }
}

}  // namespace network
}  // namespace acceptor
