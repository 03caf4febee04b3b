#include <gtest/gtest.h>

#include <algorithm>
#include <thread>

#include "acceptor/logging/log_macros.h"
#include "acceptor/logging/logger_registry.h"

#include "../mocks/network_mocks.h"

using namespace acceptor::logging;
using acceptor::test::CapturingSink;

class LoggerRegistryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    registry_ = &LoggerRegistry::instance();
    saved_sink_ = registry_->getDefaultSink();
    test_sink_ = std::make_shared<CapturingSink>();
  }

  void TearDown() override {
    registry_->clearPatterns();
    registry_->setComponentLevel(Component::Server, LogLevel::Info);
    registry_->setComponentLevel(Component::Network, LogLevel::Info);
    registry_->setGlobalLevel(LogLevel::Info);
    registry_->setDefaultSink(saved_sink_);
  }

  LoggerRegistry* registry_;
  std::shared_ptr<LogSink> saved_sink_;
  std::shared_ptr<CapturingSink> test_sink_;
};

TEST_F(LoggerRegistryTest, SingletonInstance) {
  auto& instance1 = LoggerRegistry::instance();
  auto& instance2 = LoggerRegistry::instance();

  EXPECT_EQ(&instance1, &instance2);
}

TEST_F(LoggerRegistryTest, DefaultLogger) {
  auto logger = registry_->getDefaultLogger();

  ASSERT_NE(logger, nullptr);
  EXPECT_EQ(logger->getName(), "default");
  EXPECT_EQ(logger->getLevel(), LogLevel::Info);
}

TEST_F(LoggerRegistryTest, GetOrCreateLogger) {
  auto logger1 = registry_->getOrCreateLogger("registry_test_logger");
  auto logger2 = registry_->getOrCreateLogger("registry_test_logger");

  ASSERT_NE(logger1, nullptr);
  EXPECT_EQ(logger1, logger2);
  EXPECT_EQ(logger1->getName(), "registry_test_logger");
}

TEST_F(LoggerRegistryTest, ComponentLogger) {
  auto logger = registry_->getComponentLogger(Component::Server, "acceptor");

  EXPECT_EQ(logger->getName(), "Server.acceptor");
  EXPECT_EQ(LoggerRegistry::getComponentPath(Component::Network, "connection"),
            "Network.connection");
}

TEST_F(LoggerRegistryTest, SetGlobalLevel) {
  auto logger = registry_->getOrCreateLogger("registry_global_level");

  registry_->setGlobalLevel(LogLevel::Error);
  EXPECT_EQ(logger->getLevel(), LogLevel::Error);

  registry_->setGlobalLevel(LogLevel::Debug);
  EXPECT_EQ(logger->getLevel(), LogLevel::Debug);
}

TEST_F(LoggerRegistryTest, SetComponentLevel) {
  auto server = registry_->getComponentLogger(Component::Server, "level_test");
  auto network =
      registry_->getComponentLogger(Component::Network, "level_test");

  registry_->setComponentLevel(Component::Server, LogLevel::Error);

  EXPECT_EQ(server->getLevel(), LogLevel::Error);
  EXPECT_EQ(network->getLevel(), LogLevel::Info);
}

TEST_F(LoggerRegistryTest, PatternOverridesComponentLevel) {
  auto logger = registry_->getComponentLogger(Component::Server, "acceptor");

  registry_->setComponentLevel(Component::Server, LogLevel::Error);
  registry_->setPattern("Server.*", LogLevel::Debug);

  EXPECT_EQ(logger->getLevel(), LogLevel::Debug);
  EXPECT_EQ(registry_->getEffectiveLevel("Server.anything"), LogLevel::Debug);
  EXPECT_EQ(registry_->getEffectiveLevel("Network.anything"), LogLevel::Info);

  registry_->clearPatterns();
  EXPECT_EQ(logger->getLevel(), LogLevel::Error);
}

TEST_F(LoggerRegistryTest, LaterPatternWins) {
  registry_->setPattern("Server.*", LogLevel::Debug);
  registry_->setPattern("Server.acceptor", LogLevel::Critical);

  EXPECT_EQ(registry_->getEffectiveLevel("Server.acceptor"),
            LogLevel::Critical);
  EXPECT_EQ(registry_->getEffectiveLevel("Server.callbacks"), LogLevel::Debug);
}

TEST_F(LoggerRegistryTest, NewLoggersPickUpPatterns) {
  registry_->setPattern("Event.*", LogLevel::Warning);

  auto logger = registry_->getOrCreateLogger("Event.pattern_late");
  EXPECT_EQ(logger->getLevel(), LogLevel::Warning);
}

TEST_F(LoggerRegistryTest, DefaultSinkReplacement) {
  auto logger = registry_->getOrCreateLogger("registry_sink_swap");
  registry_->setDefaultSink(test_sink_);

  EXPECT_EQ(logger->getSink(), test_sink_);
  logger->warning("routed {}", 1);

  auto messages = test_sink_->getMessages();
  ASSERT_EQ(messages.size(), 1);
  EXPECT_EQ(messages[0].message, "routed 1");
}

TEST_F(LoggerRegistryTest, CustomSinkSurvivesDefaultReplacement) {
  auto custom = std::make_shared<CapturingSink>();
  auto logger = registry_->getOrCreateLogger("registry_custom_sink");
  logger->setSink(custom);

  registry_->setDefaultSink(test_sink_);

  EXPECT_EQ(logger->getSink(), custom);
}

TEST_F(LoggerRegistryTest, GetLoggerNames) {
  registry_->getOrCreateLogger("registry_names_a");
  registry_->getOrCreateLogger("registry_names_b");

  auto names = registry_->getLoggerNames();
  EXPECT_NE(std::find(names.begin(), names.end(), "registry_names_a"),
            names.end());
  EXPECT_NE(std::find(names.begin(), names.end(), "registry_names_b"),
            names.end());
  EXPECT_NE(std::find(names.begin(), names.end(), "default"), names.end());
}

TEST_F(LoggerRegistryTest, ZeroConfigurationMacros) {
  registry_->setDefaultSink(test_sink_);

#undef ACCEPTOR_LOG_COMPONENT
#define ACCEPTOR_LOG_COMPONENT "Server.macro_test"
  ACCEPTOR_LOG_INFO("macro message {}", 5);
  ACCEPTOR_LOG_DEBUG("filtered at info");

  auto messages = test_sink_->getMessages();
  ASSERT_EQ(messages.size(), 1);
  EXPECT_EQ(messages[0].message, "macro message 5");
  EXPECT_EQ(messages[0].logger_name, "Server.macro_test");
  EXPECT_NE(messages[0].file, nullptr);
}

TEST_F(LoggerRegistryTest, ThreadSafety) {
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([this, t]() {
      for (int i = 0; i < 50; ++i) {
        auto logger = registry_->getOrCreateLogger(
            "registry_thread_" + std::to_string(t) + "_" + std::to_string(i));
        EXPECT_NE(logger, nullptr);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  auto logger = registry_->getOrCreateLogger("registry_thread_7_49");
  EXPECT_EQ(logger->getName(), "registry_thread_7_49");
}
