#include <gtest/gtest.h>

#include <algorithm>

#include "support/capturing_sink.h"

#define AUTHKIT_LOG_COMPONENT "authkit.test.registry"
#include "authkit/logging/log_macros.h"

using namespace authkit::logging;
using authkit::test::CapturingSink;

class LoggerRegistryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    registry_ = &LoggerRegistry::instance();
    sink_ = std::make_shared<CapturingSink>();
    registry_->setGlobalLevel(LogLevel::Info);
  }

  void TearDown() override {
    registry_->setGlobalLevel(LogLevel::Info);
    registry_->setDefaultSink(std::make_shared<StdioSink>(StdioSink::Stderr));
  }

  LoggerRegistry* registry_;
  std::shared_ptr<CapturingSink> sink_;
};

TEST_F(LoggerRegistryTest, SingletonInstance) {
  EXPECT_EQ(&LoggerRegistry::instance(), &LoggerRegistry::instance());
}

TEST_F(LoggerRegistryTest, DefaultLogger) {
  auto logger = registry_->getDefaultLogger();
  ASSERT_NE(logger, nullptr);
  EXPECT_EQ(logger->getName(), "default");
  EXPECT_EQ(logger->getLevel(), LogLevel::Info);
}

TEST_F(LoggerRegistryTest, GetOrCreateLoggerReturnsSameInstance) {
  auto logger1 = registry_->getOrCreateLogger("authkit.test.same");
  auto logger2 = registry_->getOrCreateLogger("authkit.test.same");
  EXPECT_EQ(logger1, logger2);
  EXPECT_EQ(logger1->getName(), "authkit.test.same");

  auto names = registry_->getLoggerNames();
  EXPECT_TRUE(std::find(names.begin(), names.end(), "authkit.test.same") !=
              names.end());
}

TEST_F(LoggerRegistryTest, SetGlobalLevel) {
  auto logger = registry_->getOrCreateLogger("authkit.test.global");
  registry_->setGlobalLevel(LogLevel::Warning);
  EXPECT_EQ(logger->getLevel(), LogLevel::Warning);
  EXPECT_EQ(registry_->getGlobalLevel(), LogLevel::Warning);

  registry_->setGlobalLevel(LogLevel::Debug);
  EXPECT_EQ(logger->getLevel(), LogLevel::Debug);
}

TEST_F(LoggerRegistryTest, ComponentLevelAppliesToItsSubtree) {
  auto token = registry_->getOrCreateLogger("authkit.token.refresh");
  auto flow = registry_->getOrCreateLogger("authkit.flow");

  registry_->setComponentLevel(Component::Token, LogLevel::Error);
  EXPECT_EQ(token->getLevel(), LogLevel::Error);
  EXPECT_EQ(flow->getLevel(), LogLevel::Info);

  // Loggers created later pick the component level up too
  auto later = registry_->getOrCreateLogger("authkit.token.exchange");
  EXPECT_EQ(later->getLevel(), LogLevel::Error);

  // A name that merely starts with the same letters is not in the subtree
  EXPECT_EQ(registry_->getEffectiveLevel("authkit.tokenizer"), LogLevel::Info);
}

TEST_F(LoggerRegistryTest, PatternOverridesComponentLevel) {
  registry_->setComponentLevel(Component::Flow, LogLevel::Error);
  registry_->setPattern("authkit.flow.*", LogLevel::Debug);

  EXPECT_EQ(registry_->getEffectiveLevel("authkit.flow.legacy"),
            LogLevel::Debug);
  EXPECT_EQ(registry_->getEffectiveLevel("authkit.flow"), LogLevel::Error);
  EXPECT_EQ(registry_->getEffectiveLevel("authkit.http"), LogLevel::Info);
}

TEST_F(LoggerRegistryTest, ComponentPath) {
  EXPECT_EQ(LoggerRegistry::getComponentPath(Component::Authenticator, ""),
            "authkit.authenticator");
  EXPECT_EQ(LoggerRegistry::getComponentPath(Component::Http, "curl"),
            "authkit.http.curl");
}

TEST_F(LoggerRegistryTest, MacroLogsThroughDefaultSink) {
  registry_->setDefaultSink(sink_);

  AUTHKIT_LOG(Info, "Loaded {} keys", 3);
  AUTHKIT_LOG(Debug, "filtered out at Info");

  auto messages = sink_->messages();
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].message, "Loaded 3 keys");
  EXPECT_EQ(messages[0].logger_name, "authkit.test.registry");
  EXPECT_NE(messages[0].file, nullptr);
}

TEST_F(LoggerRegistryTest, MacroHonoursLevelChanges) {
  registry_->setDefaultSink(sink_);
  registry_->setGlobalLevel(LogLevel::Debug);

  AUTHKIT_LOG(Debug, "now visible");
  EXPECT_EQ(sink_->count(LogLevel::Debug), 1u);

  registry_->setGlobalLevel(LogLevel::Off);
  AUTHKIT_LOG(Emergency, "dropped");
  EXPECT_EQ(sink_->messages().size(), 1u);
}

TEST_F(LoggerRegistryTest, NullDefaultSinkBecomesNullSink) {
  auto logger = registry_->getOrCreateLogger("authkit.test.nullsink");
  registry_->setDefaultSink(nullptr);
  ASSERT_NE(logger->getSink(), nullptr);
  EXPECT_EQ(logger->getSink()->type(), SinkType::Null);
}
