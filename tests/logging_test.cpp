#include <cochange/logging.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {

TEST(LoggingTest, RespectsLogLevelThreshold) {
  std::stringstream stream;
  cochange::StructuredLogger logger(stream, {cochange::LogLevel::kInfo});

  logger.Log(cochange::LogLevel::kDebug, "parser.issue", {});
  logger.Log(cochange::LogLevel::kInfo, "pipeline.start", {});

  const auto output = stream.str();
  EXPECT_EQ(std::string::npos, output.find("parser.issue"));
  EXPECT_NE(std::string::npos, output.find("level=info"));
  EXPECT_NE(std::string::npos, output.find("pipeline.start"));
}

TEST(LoggingTest, FormatsFieldsAsStructuredPairs) {
  std::stringstream stream;
  cochange::StructuredLogger logger(stream, {cochange::LogLevel::kDebug});

  logger.Log(cochange::LogLevel::kDebug, "pipeline.stage.complete",
             {{"stage", "history"}, {"commits", "42"}});

  const auto output = stream.str();
  EXPECT_NE(std::string::npos, output.find("fields={\"stage\": \"history\""));
  EXPECT_NE(std::string::npos, output.find("\"commits\": \"42\"}"));
  EXPECT_NE(std::string::npos,
            output.find("message=\"pipeline.stage.complete\""));
}

TEST(LoggingTest, KeepsRecordsOnOneLineForUnusualPaths) {
  std::stringstream stream;
  cochange::StructuredLogger logger(stream, {cochange::LogLevel::kWarn});

  logger.Log(cochange::LogLevel::kWarn, "identity.inconsistency",
             {{"path", "dir/\"odd\"\nname\tx"}});

  const auto output = stream.str();
  ASSERT_FALSE(output.empty());
  EXPECT_EQ(output.find('\n'), output.size() - 1);
  EXPECT_NE(std::string::npos,
            output.find("\"dir/\\\"odd\\\"\\nname\\tx\""));
}

TEST(LoggingTest, EnsureLoggerProvidesDefault) {
  auto provided = cochange::EnsureLogger(nullptr);
  EXPECT_NE(nullptr, provided);
  EXPECT_NE(nullptr, std::dynamic_pointer_cast<cochange::NullLogger>(provided));

  auto custom = std::make_shared<cochange::StructuredLogger>(
      std::cout, cochange::LoggingConfig{});
  EXPECT_EQ(custom, cochange::EnsureLogger(custom));
}

TEST(LoggingTest, MakeLoggerWritesStructuredRecordsAtTheConfiguredLevel) {
  std::stringstream stream;
  auto logger = cochange::MakeLogger(
      cochange::LoggingConfig{cochange::ParseLogLevel("warn")}, stream);

  EXPECT_EQ(cochange::LogLevel::kWarn, logger->Level());
  logger->Log(cochange::LogLevel::kInfo, "pipeline.start", {});
  logger->Log(cochange::LogLevel::kWarn, "identity.inconsistency",
              {{"reason", "rename_target_owned"}, {"path", "b.py"}});

  const auto output = stream.str();
  EXPECT_EQ(std::string::npos, output.find("pipeline.start"));
  EXPECT_NE(std::string::npos, output.find("level=warn"));
  EXPECT_NE(std::string::npos,
            output.find("message=\"identity.inconsistency\""));
  EXPECT_NE(std::string::npos, output.find("\"path\": \"b.py\"}"));
  EXPECT_EQ(1, std::count(output.begin(), output.end(), '\n'));
}

TEST(LoggingTest, ParsesLevelNames) {
  EXPECT_EQ(cochange::LogLevel::kDebug, cochange::ParseLogLevel(" DEBUG "));
  EXPECT_EQ(cochange::LogLevel::kWarn, cochange::ParseLogLevel("warning"));
  EXPECT_EQ("info", cochange::LevelName(cochange::ParseLogLevel("info")));
  EXPECT_THROW(cochange::ParseLogLevel("verbose"), std::invalid_argument);
}

} // namespace
