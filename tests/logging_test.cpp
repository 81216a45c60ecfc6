#include <citegraph/logging.h>

#include <gtest/gtest.h>

#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {

TEST(LoggingTest, RespectsLogLevelThreshold) {
  std::stringstream stream;
  citegraph::StructuredLogger logger(stream, {citegraph::LogLevel::kInfo});

  logger.Log(citegraph::LogLevel::kDebug, "debug message", {});
  logger.Log(citegraph::LogLevel::kInfo, "info message", {});

  const auto output = stream.str();
  EXPECT_EQ(std::string::npos, output.find("debug message"));
  EXPECT_NE(std::string::npos, output.find("level=info"));
  EXPECT_NE(std::string::npos, output.find("info message"));
}

TEST(LoggingTest, FormatsFieldsAsStructuredPairs) {
  std::stringstream stream;
  citegraph::StructuredLogger logger(stream, {citegraph::LogLevel::kDebug});

  logger.Log(citegraph::LogLevel::kDebug, "build.batch.committed",
             {{"batch", "3"}, {"last_committed_id", "2913.02"}});

  const auto output = stream.str();
  EXPECT_NE(std::string::npos, output.find("fields={\"batch\": \"3\""));
  EXPECT_NE(std::string::npos,
            output.find("\"last_committed_id\": \"2913.02\"}"));
  EXPECT_NE(std::string::npos,
            output.find("message=\"build.batch.committed\""));
}

TEST(LoggingTest, EscapesFieldValues) {
  std::stringstream stream;
  citegraph::StructuredLogger logger(stream, {citegraph::LogLevel::kWarn});

  logger.Log(citegraph::LogLevel::kWarn, "input.record.skipped",
             {{"reason", "bad \"quote\"\n"}});

  EXPECT_NE(std::string::npos,
            stream.str().find("\"reason\": \"bad \\\"quote\\\"\\n\""));
}

TEST(LoggingTest, DefaultLevelIsWarn) {
  std::stringstream stream;
  citegraph::StructuredLogger logger(stream, citegraph::LoggingConfig{});

  logger.Log(citegraph::LogLevel::kInfo, "build.start", {});
  logger.Log(citegraph::LogLevel::kWarn, "input.record.skipped", {});

  const auto output = stream.str();
  EXPECT_EQ(std::string::npos, output.find("build.start"));
  EXPECT_NE(std::string::npos, output.find("input.record.skipped"));
}

TEST(LoggingTest, EnsureLoggerProvidesDefault) {
  auto provided = citegraph::EnsureLogger(nullptr);
  EXPECT_NE(nullptr, provided);
  EXPECT_NE(nullptr,
            std::dynamic_pointer_cast<citegraph::NullLogger>(provided));

  auto custom = std::make_shared<citegraph::StructuredLogger>(
      std::cout, citegraph::LoggingConfig{});
  EXPECT_EQ(custom, citegraph::EnsureLogger(custom));
}

TEST(LoggingTest, ParsesLogLevelNames) {
  EXPECT_EQ(citegraph::LogLevel::kError, citegraph::ParseLogLevel("error"));
  EXPECT_EQ(citegraph::LogLevel::kWarn, citegraph::ParseLogLevel("Warning"));
  EXPECT_EQ(citegraph::LogLevel::kInfo, citegraph::ParseLogLevel(" info "));
  EXPECT_EQ(citegraph::LogLevel::kDebug, citegraph::ParseLogLevel("DEBUG"));
  EXPECT_THROW(citegraph::ParseLogLevel("chatty"), std::invalid_argument);
}

} // namespace
