#include <gtest/gtest.h>

#include "authkit/logging/log_level.h"

using namespace authkit::logging;

TEST(LogLevelTest, LogLevelToString) {
  EXPECT_STREQ(logLevelToString(LogLevel::Debug), "DEBUG");
  EXPECT_STREQ(logLevelToString(LogLevel::Info), "INFO");
  EXPECT_STREQ(logLevelToString(LogLevel::Notice), "NOTICE");
  EXPECT_STREQ(logLevelToString(LogLevel::Warning), "WARNING");
  EXPECT_STREQ(logLevelToString(LogLevel::Error), "ERROR");
  EXPECT_STREQ(logLevelToString(LogLevel::Emergency), "EMERGENCY");
  EXPECT_STREQ(logLevelToString(LogLevel::Off), "OFF");
}

TEST(LogLevelTest, StringToLogLevel) {
  EXPECT_EQ(stringToLogLevel("DEBUG"), LogLevel::Debug);
  EXPECT_EQ(stringToLogLevel("WARNING"), LogLevel::Warning);
  EXPECT_EQ(stringToLogLevel("OFF"), LogLevel::Off);

  EXPECT_EQ(stringToLogLevel("debug"), LogLevel::Debug);
  EXPECT_EQ(stringToLogLevel("error"), LogLevel::Error);
  EXPECT_EQ(stringToLogLevel("critical"), LogLevel::Critical);

  // Unknown names fall back to Info
  EXPECT_EQ(stringToLogLevel("verbose"), LogLevel::Info);
  EXPECT_EQ(stringToLogLevel(""), LogLevel::Info);
}

TEST(LogLevelTest, ComponentToString) {
  EXPECT_STREQ(componentToString(Component::Root), "Root");
  EXPECT_STREQ(componentToString(Component::Http), "Http");
  EXPECT_STREQ(componentToString(Component::Discovery), "Discovery");
  EXPECT_STREQ(componentToString(Component::Token), "Token");
  EXPECT_STREQ(componentToString(Component::Flow), "Flow");
  EXPECT_STREQ(componentToString(Component::Credential), "Credential");
  EXPECT_STREQ(componentToString(Component::Authenticator), "Authenticator");
  EXPECT_STREQ(componentToString(Component::Validator), "Validator");
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
