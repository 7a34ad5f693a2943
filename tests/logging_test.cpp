#include <cq/logging.h>

#include <gtest/gtest.h>

#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {

TEST(LoggingTest, RespectsLogLevelThreshold) {
  std::stringstream stream;
  cq::StructuredLogger logger(stream, {cq::LogLevel::kInfo});

  logger.Log(cq::LogLevel::kDebug, "debug message", {});
  logger.Log(cq::LogLevel::kInfo, "info message", {});

  const auto output = stream.str();
  EXPECT_EQ(std::string::npos, output.find("debug message"));
  EXPECT_NE(std::string::npos, output.find("level=info"));
  EXPECT_NE(std::string::npos, output.find("info message"));
}

TEST(LoggingTest, DefaultLevelDropsInfo) {
  std::stringstream stream;
  cq::StructuredLogger logger(stream, cq::LoggingConfig{});

  logger.Log(cq::LogLevel::kInfo, "pipeline.start", {});
  logger.Log(cq::LogLevel::kWarn, "tool.unavailable", {{"tool", "lint"}});

  const auto output = stream.str();
  EXPECT_EQ(std::string::npos, output.find("pipeline.start"));
  EXPECT_NE(std::string::npos, output.find("level=warn"));
}

TEST(LoggingTest, FormatsFieldsAsStructuredPairs) {
  std::stringstream stream;
  cq::StructuredLogger logger(stream, {cq::LogLevel::kDebug});

  logger.Log(cq::LogLevel::kDebug, "pipeline.stage.complete",
             {{"stage", "load"}, {"duration_ms", "42"}});

  const auto output = stream.str();
  EXPECT_NE(std::string::npos, output.find("fields={\"stage\": \"load\""));
  EXPECT_NE(std::string::npos, output.find("\"duration_ms\": \"42\"}"));
  EXPECT_NE(std::string::npos,
            output.find("message=\"pipeline.stage.complete\""));
}

TEST(LoggingTest, EnsureLoggerProvidesDefault) {
  auto provided = cq::EnsureLogger(nullptr);
  EXPECT_NE(nullptr, provided);
  EXPECT_NE(nullptr, std::dynamic_pointer_cast<cq::NullLogger>(provided));

  auto custom =
      std::make_shared<cq::StructuredLogger>(std::cout, cq::LoggingConfig{});
  EXPECT_EQ(custom, cq::EnsureLogger(custom));
}

TEST(LoggingTest, ParsesLevelNames) {
  EXPECT_EQ(cq::ParseLogLevel(" Debug "), cq::LogLevel::kDebug);
  EXPECT_EQ(cq::ParseLogLevel("warning"), cq::LogLevel::kWarn);
  EXPECT_EQ(cq::LogLevelName(cq::ParseLogLevel("error")), "error");
  EXPECT_THROW(cq::ParseLogLevel("loud"), std::invalid_argument);
}

} // namespace
