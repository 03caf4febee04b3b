#include <gtest/gtest.h>

#include <stdexcept>

#include "acceptor/network/write_buffer_watermark.h"

namespace acceptor {
namespace network {
namespace {

class WriteBufferWatermarkTest : public ::testing::Test {
 protected:
  WriteBufferWatermarkTest()
      : watermark_([this]() { ++above_high_; }, [this]() { ++below_low_; }) {
    watermark_.setWatermarks(100, 50);
  }

  int above_high_{0};
  int below_low_{0};
  WriteBufferWatermark watermark_;
};

TEST_F(WriteBufferWatermarkTest, Defaults) {
  WriteBufferWatermark defaults(nullptr, nullptr);
  EXPECT_EQ(defaults.highWatermark(), 64u * 1024u);
  EXPECT_EQ(defaults.lowWatermark(), 32u * 1024u);
  EXPECT_FALSE(defaults.aboveHighWatermark());
}

TEST_F(WriteBufferWatermarkTest, BecomesUnwritableAtHighWatermark) {
  watermark_.add(99);
  EXPECT_FALSE(watermark_.aboveHighWatermark());
  EXPECT_EQ(above_high_, 0);

  watermark_.add(1);
  EXPECT_TRUE(watermark_.aboveHighWatermark());
  EXPECT_EQ(above_high_, 1);
  EXPECT_EQ(watermark_.entries(), 2);
}

TEST_F(WriteBufferWatermarkTest, WritableAgainAtLowWatermark) {
  watermark_.add(150, 3);
  ASSERT_TRUE(watermark_.aboveHighWatermark());

  // Between the marks: still unwritable
  watermark_.drain(60, 1);
  EXPECT_TRUE(watermark_.aboveHighWatermark());
  EXPECT_EQ(below_low_, 0);

  watermark_.drain(40, 1);
  EXPECT_FALSE(watermark_.aboveHighWatermark());
  EXPECT_EQ(below_low_, 1);
  EXPECT_EQ(watermark_.bytes(), 50);
  EXPECT_EQ(watermark_.entries(), 1);
}

TEST_F(WriteBufferWatermarkTest, CallbacksFireOnTransitionsOnly) {
  watermark_.add(200);
  watermark_.add(200);
  watermark_.drain(390);
  watermark_.drain(10);
  watermark_.add(99);

  EXPECT_EQ(above_high_, 1);
  EXPECT_EQ(below_low_, 1);
}

TEST_F(WriteBufferWatermarkTest, LowWatermarkWithoutHighIsNotATransition) {
  watermark_.add(60);
  watermark_.drain(60);
  EXPECT_EQ(below_low_, 0);
}

TEST_F(WriteBufferWatermarkTest, DrainClampsAtZero) {
  watermark_.add(10, 1);
  watermark_.drain(100, 5);
  EXPECT_EQ(watermark_.bytes(), 0);
  EXPECT_EQ(watermark_.entries(), 0);
}

TEST_F(WriteBufferWatermarkTest, LoweringHighWatermarkCanTransition) {
  watermark_.add(80);
  EXPECT_FALSE(watermark_.aboveHighWatermark());

  watermark_.setWatermarks(70, 20);
  EXPECT_TRUE(watermark_.aboveHighWatermark());
  EXPECT_EQ(above_high_, 1);
}

TEST_F(WriteBufferWatermarkTest, RejectsInvalidWatermarks) {
  EXPECT_THROW(watermark_.setWatermarks(0, 0), std::invalid_argument);
  EXPECT_THROW(watermark_.setWatermarks(100, 0), std::invalid_argument);
  EXPECT_THROW(watermark_.setWatermarks(100, 100), std::invalid_argument);
  EXPECT_THROW(watermark_.setWatermarks(50, 100), std::invalid_argument);

  EXPECT_EQ(watermark_.highWatermark(), 100);
  EXPECT_EQ(watermark_.lowWatermark(), 50);
}

}  // namespace
}  // namespace network
}  // namespace acceptor
