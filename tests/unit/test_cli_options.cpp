/**
 * @file test_cli_options.cpp
 * @brief Unit tests for polarlink command line parsing
 */

#include <gtest/gtest.h>
#include "cli_options.h"

#include <vector>

using namespace polarlink;
using namespace polarlink::cli;

namespace {

Result<CliOptions> parse(std::vector<const char *> args) {
  args.insert(args.begin(), "polarlink");
  return parse_cli_options(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST(CliOptionsTest, NoArguments) {
  auto r = parse({});
  ASSERT_TRUE(r.is_ok());
  EXPECT_FALSE(r.value().show_help);
  EXPECT_FALSE(r.value().scan_only);
  EXPECT_FALSE(r.value().mode.has_value());
}

TEST(CliOptionsTest, ModeAndLevel) {
  auto r = parse({"--mode", "ECG", "--log-level=DEBUG"});
  ASSERT_TRUE(r.is_ok());
  EXPECT_TRUE(r.value().mode == MonitorMode::Ecg);
  EXPECT_TRUE(r.value().log_level == LogLevel::Debug);
}

TEST(CliOptionsTest, Flags) {
  auto r = parse({"--scan", "--no-record", "-h", "--version"});
  ASSERT_TRUE(r.is_ok());
  EXPECT_TRUE(r.value().scan_only);
  EXPECT_TRUE(r.value().no_record);
  EXPECT_TRUE(r.value().show_help);
  EXPECT_TRUE(r.value().show_version);
}

TEST(CliOptionsTest, PathsAndDevice) {
  auto r = parse({"--device", "a0:9e:1a:12:34:56", "--log-dir", "/tmp/hr",
                  "--config=/etc/polarlink.conf", "--scan-timeout", "20"});
  ASSERT_TRUE(r.is_ok());
  EXPECT_EQ(r.value().device_address.value(), "a0:9e:1a:12:34:56");
  EXPECT_EQ(r.value().log_dir.value(), std::filesystem::path("/tmp/hr"));
  EXPECT_EQ(r.value().config_path.value(),
            std::filesystem::path("/etc/polarlink.conf"));
  EXPECT_EQ(r.value().scan_timeout_s.value(), 20);
}

TEST(CliOptionsTest, Errors) {
  auto unknown = parse({"--frobnicate"});
  ASSERT_TRUE(unknown.is_error());
  EXPECT_EQ(unknown.error().code, ErrorCode::InvalidArgument);
  EXPECT_EQ(unknown.error().message, "Unknown option: --frobnicate");

  EXPECT_TRUE(parse({"--mode", "PPG"}).is_error());
  EXPECT_TRUE(parse({"--mode"}).is_error());
  EXPECT_TRUE(parse({"--log-level", "LOUD"}).is_error());
  EXPECT_TRUE(parse({"--device", "12:34"}).is_error());
  EXPECT_TRUE(parse({"--scan-timeout", "0"}).is_error());
  EXPECT_TRUE(parse({"--scan-timeout", "ten"}).is_error());
  EXPECT_TRUE(parse({"--scan-timeout", "601"}).is_error());
}

TEST(CliOptionsTest, OnlyListedLogLevels) {
  EXPECT_TRUE(parse({"--log-level", "warning"}).value().log_level ==
              LogLevel::Warn);
  EXPECT_TRUE(parse({"--log-level", "Info"}).value().log_level ==
              LogLevel::Info);

  for (const char *level : {"TRACE", "OFF", "WARN"}) {
    auto r = parse({"--log-level", level});
    ASSERT_TRUE(r.is_error()) << level;
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
  }
}

TEST(CliOptionsTest, ApplyOverridesOnlyGivenOptions) {
  MonitorConfig config;
  config.log_dir = "/from/file";
  config.mode = MonitorMode::Ecg;

  auto r = parse({"--log-level", "ERROR", "--no-record", "--scan-timeout",
                  "3"});
  ASSERT_TRUE(r.is_ok());
  r.value().apply_to(config);

  EXPECT_EQ(config.mode, MonitorMode::Ecg);
  EXPECT_EQ(config.log_dir, std::filesystem::path("/from/file"));
  EXPECT_EQ(config.log_level, LogLevel::Error);
  EXPECT_FALSE(config.record_csv);
  EXPECT_EQ(config.scan_timeout, std::chrono::seconds(3));
}

TEST(CliOptionsTest, UsageListsOptions) {
  std::string usage = usage_text("polarlink");
  EXPECT_NE(usage.find("Usage: polarlink"), std::string::npos);
  EXPECT_NE(usage.find("--mode HR|ECG"), std::string::npos);
  EXPECT_NE(usage.find("--scan"), std::string::npos);
}
