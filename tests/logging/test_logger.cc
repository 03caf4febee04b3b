#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "acceptor/logging/logger.h"

#include "../mocks/network_mocks.h"

using namespace acceptor::logging;
using acceptor::test::CapturingSink;

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override { sink_ = std::make_shared<CapturingSink>(); }

  std::shared_ptr<CapturingSink> sink_;
};

TEST_F(LoggerTest, BasicLogging) {
  Logger logger("test", LogMode::Sync);
  logger.setSink(sink_);

  logger.info("Test message");

  auto messages = sink_->getMessages();
  ASSERT_EQ(messages.size(), 1);
  EXPECT_EQ(messages[0].level, LogLevel::Info);
  EXPECT_EQ(messages[0].message, "Test message");
  EXPECT_EQ(messages[0].logger_name, "test");
}

TEST_F(LoggerTest, LogLevelFiltering) {
  Logger logger("test", LogMode::Sync);
  logger.setSink(sink_);
  logger.setLevel(LogLevel::Warning);

  logger.debug("Debug - should not appear");
  logger.info("Info - should not appear");
  logger.warning("Warning - should appear");
  logger.error("Error - should appear");

  auto messages = sink_->getMessages();
  ASSERT_EQ(messages.size(), 2);
  EXPECT_EQ(messages[0].message, "Warning - should appear");
  EXPECT_EQ(messages[1].message, "Error - should appear");
}

TEST_F(LoggerTest, FormattedLogging) {
  Logger logger("test", LogMode::Sync);
  logger.setSink(sink_);

  int value = 42;
  std::string str = "world";
  logger.info("Hello {} with value {}", str, value);

  auto messages = sink_->getMessages();
  ASSERT_EQ(messages.size(), 1);
  EXPECT_EQ(messages[0].message, "Hello world with value 42");
}

TEST_F(LoggerTest, ContextLogging) {
  Logger logger("test", LogMode::Sync);
  logger.setSink(sink_);

  LogContext ctx;
  ctx.connection_id = "7";
  ctx.request_id = "1001";
  ctx.component = Component::Server;
  ctx.with("event", "connect").with("count", 3);
  ctx.setLocation("test.cc", 100, "testFunc");

  logger.logWithContext(LogLevel::Warning, ctx, "connection {}", 7);

  auto messages = sink_->getMessages();
  ASSERT_EQ(messages.size(), 1);
  EXPECT_EQ(messages[0].level, LogLevel::Warning);
  EXPECT_EQ(messages[0].message, "connection 7");
  EXPECT_EQ(messages[0].logger_name, "test");
  EXPECT_EQ(messages[0].connection_id, "7");
  EXPECT_EQ(messages[0].request_id, "1001");
  EXPECT_EQ(messages[0].component, Component::Server);
  EXPECT_EQ(messages[0].key_values.at("event"), "connect");
  EXPECT_EQ(messages[0].key_values.at("count"), "3");
  EXPECT_STREQ(messages[0].file, "test.cc");
  EXPECT_EQ(messages[0].line, 100);
}

TEST_F(LoggerTest, ContextLoggingRespectsLevel) {
  Logger logger("test", LogMode::Sync);
  logger.setSink(sink_);
  logger.setLevel(LogLevel::Error);

  LogContext ctx;
  logger.logWithContext(LogLevel::Warning, ctx, "filtered");

  EXPECT_TRUE(sink_->getMessages().empty());
}

TEST_F(LoggerTest, LocationLogging) {
  Logger logger("test", LogMode::Sync);
  logger.setSink(sink_);

  logger.log(LogLevel::Error, "file.cc", 42, "function", "Error at {}",
             "location");

  auto messages = sink_->getMessages();
  ASSERT_EQ(messages.size(), 1);
  EXPECT_EQ(messages[0].message, "Error at location");
  EXPECT_STREQ(messages[0].file, "file.cc");
  EXPECT_EQ(messages[0].line, 42);
  EXPECT_STREQ(messages[0].function, "function");
}

TEST_F(LoggerTest, NoOpLogger) {
  Logger logger("test", LogMode::NoOp);
  logger.setSink(sink_);

  logger.error("Should not appear");
  logger.critical("Should not appear either");

  EXPECT_TRUE(sink_->getMessages().empty());
  EXPECT_FALSE(logger.shouldLog(LogLevel::Emergency));
}

TEST_F(LoggerTest, ModeSwitch) {
  Logger logger("test", LogMode::Sync);
  logger.setSink(sink_);

  logger.info("Sync");
  logger.setMode(LogMode::NoOp);
  logger.info("Dropped");
  logger.setMode(LogMode::Sync);
  logger.info("Sync again");

  auto messages = sink_->getMessages();
  ASSERT_EQ(messages.size(), 2);
  EXPECT_EQ(messages[1].message, "Sync again");
}

TEST_F(LoggerTest, OffLevelNeverLogs) {
  Logger logger("test", LogMode::Sync);
  logger.setLevel(LogLevel::Debug);
  EXPECT_FALSE(logger.shouldLog(LogLevel::Off));
}

TEST_F(LoggerTest, ThreadSafety) {
  Logger logger("test", LogMode::Sync);
  logger.setSink(sink_);

  const int num_threads = 10;
  const int messages_per_thread = 100;

  std::vector<std::thread> threads;
  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([&logger, t, messages_per_thread]() {
      for (int i = 0; i < messages_per_thread; ++i) {
        logger.info("Thread {} message {}", t, i);
      }
    });
  }

  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(sink_->getMessages().size(),
            static_cast<size_t>(num_threads * messages_per_thread));
}

TEST_F(LoggerTest, GettersAndSetters) {
  Logger logger("my_logger", LogMode::Sync);

  EXPECT_EQ(logger.getName(), "my_logger");
  EXPECT_EQ(logger.getLevel(), LogLevel::Info);
  EXPECT_EQ(logger.getMode(), LogMode::Sync);
  EXPECT_EQ(logger.getSink(), nullptr);

  logger.setLevel(LogLevel::Error);
  EXPECT_EQ(logger.getLevel(), LogLevel::Error);

  logger.setSink(sink_);
  EXPECT_EQ(logger.getSink(), sink_);
}
