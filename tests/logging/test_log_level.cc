#include <gtest/gtest.h>

#include "acceptor/logging/log_level.h"

using namespace acceptor::logging;

TEST(LogLevelTest, LogLevelToString) {
  EXPECT_STREQ(logLevelToString(LogLevel::Debug), "DEBUG");
  EXPECT_STREQ(logLevelToString(LogLevel::Info), "INFO");
  EXPECT_STREQ(logLevelToString(LogLevel::Notice), "NOTICE");
  EXPECT_STREQ(logLevelToString(LogLevel::Warning), "WARNING");
  EXPECT_STREQ(logLevelToString(LogLevel::Error), "ERROR");
  EXPECT_STREQ(logLevelToString(LogLevel::Critical), "CRITICAL");
  EXPECT_STREQ(logLevelToString(LogLevel::Alert), "ALERT");
  EXPECT_STREQ(logLevelToString(LogLevel::Emergency), "EMERGENCY");
  EXPECT_STREQ(logLevelToString(LogLevel::Off), "OFF");
}

TEST(LogLevelTest, StringToLogLevel) {
  EXPECT_EQ(stringToLogLevel("DEBUG"), LogLevel::Debug);
  EXPECT_EQ(stringToLogLevel("WARNING"), LogLevel::Warning);
  EXPECT_EQ(stringToLogLevel("OFF"), LogLevel::Off);

  EXPECT_EQ(stringToLogLevel("debug"), LogLevel::Debug);
  EXPECT_EQ(stringToLogLevel("warning"), LogLevel::Warning);
  EXPECT_EQ(stringToLogLevel("warn"), LogLevel::Warning);
  EXPECT_EQ(stringToLogLevel("error"), LogLevel::Error);

  // Invalid defaults to Info
  EXPECT_EQ(stringToLogLevel("invalid"), LogLevel::Info);
  EXPECT_EQ(stringToLogLevel(""), LogLevel::Info);
}

TEST(LogLevelTest, TryParseRejectsUnknownNames) {
  LogLevel level = LogLevel::Critical;
  EXPECT_FALSE(tryParseLogLevel("verbose", level));
  EXPECT_EQ(level, LogLevel::Critical);

  EXPECT_TRUE(tryParseLogLevel("notice", level));
  EXPECT_EQ(level, LogLevel::Notice);
}

TEST(LogLevelTest, ComponentToString) {
  EXPECT_STREQ(componentToString(Component::Root), "Root");
  EXPECT_STREQ(componentToString(Component::Server), "Server");
  EXPECT_STREQ(componentToString(Component::Network), "Network");
  EXPECT_STREQ(componentToString(Component::Channel), "Channel");
  EXPECT_STREQ(componentToString(Component::Processor), "Processor");
  EXPECT_STREQ(componentToString(Component::Event), "Event");
  EXPECT_STREQ(componentToString(Component::Config), "Config");
}

TEST(LogLevelTest, LogLevelOrdering) {
  EXPECT_LT(LogLevel::Debug, LogLevel::Info);
  EXPECT_LT(LogLevel::Info, LogLevel::Notice);
  EXPECT_LT(LogLevel::Notice, LogLevel::Warning);
  EXPECT_LT(LogLevel::Warning, LogLevel::Error);
  EXPECT_LT(LogLevel::Error, LogLevel::Critical);
  EXPECT_LT(LogLevel::Critical, LogLevel::Alert);
  EXPECT_LT(LogLevel::Alert, LogLevel::Emergency);
  EXPECT_LT(LogLevel::Emergency, LogLevel::Off);
}
