/**
 * @file test_config.cpp
 * @brief Unit tests for configuration parsing and persistence
 */

#include <gtest/gtest.h>
#include <polarlink/config.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace polarlink;
namespace fs = std::filesystem;

// ============================================================================
// MonitorConfig
// ============================================================================

TEST(MonitorConfigTest, DefaultsAreValid) {
  MonitorConfig config;
  EXPECT_TRUE(config.validate().is_ok());
  EXPECT_EQ(config.mode, MonitorMode::HeartRate);
  EXPECT_EQ(config.log_level, LogLevel::Info);
  EXPECT_EQ(config.log_dir, fs::path("data"));
  EXPECT_EQ(config.name_filter, "Polar H10");
  EXPECT_EQ(config.max_reconnect_attempts, 5);
}

TEST(MonitorConfigTest, RejectsBadAddress) {
  MonitorConfig config;
  config.device_address = "not-an-address";
  auto result = config.validate();
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::ConfigInvalid);

  config.device_address = "A0:9E:1A:12:34:56";
  EXPECT_TRUE(config.validate().is_ok());
}

TEST(MonitorConfigTest, RequiresAddressOrFilter) {
  MonitorConfig config;
  config.name_filter.clear();
  EXPECT_TRUE(config.validate().is_error());
}

TEST(MonitorConfigTest, RejectsOutOfRangeValues) {
  MonitorConfig config;
  config.max_reconnect_attempts = 0;
  EXPECT_TRUE(config.validate().is_error());

  config = MonitorConfig();
  config.quality_buffer_size = 0;
  EXPECT_TRUE(config.validate().is_error());

  config = MonitorConfig();
  config.ecg_sample_rate = 250;
  EXPECT_TRUE(config.validate().is_error());

  config = MonitorConfig();
  config.data_timeout = std::chrono::seconds(0);
  EXPECT_TRUE(config.validate().is_error());
}

TEST(MonitorConfigTest, DeviceConfigMapping) {
  MonitorConfig config;
  config.device_address = "A0:9E:1A:12:34:56";
  config.max_reconnect_attempts = 7;
  config.base_retry_interval = std::chrono::milliseconds(250);
  config.max_retry_interval = std::chrono::seconds(30);
  config.data_timeout = std::chrono::seconds(8);
  config.auto_reconnect = false;

  PolarDeviceConfig dc = config.to_device_config();
  EXPECT_EQ(dc.device_address, "A0:9E:1A:12:34:56");
  EXPECT_EQ(dc.reconnect.max_attempts, 7);
  EXPECT_EQ(dc.reconnect.base_interval, std::chrono::milliseconds(250));
  EXPECT_EQ(dc.reconnect.max_interval, std::chrono::milliseconds(30000));
  EXPECT_EQ(dc.data_timeout, std::chrono::milliseconds(8000));
  EXPECT_EQ(dc.ecg.sample_rate_hz, 130);
  EXPECT_EQ(dc.ecg_buffer_capacity, 1300u);
  EXPECT_FALSE(dc.auto_reconnect);
}

TEST(MonitorConfigTest, XdgConfigDir) {
  const char *old = std::getenv("XDG_CONFIG_HOME");
  std::string saved = old ? old : "";

  setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
  EXPECT_EQ(MonitorConfig::get_default_config_dir(),
            fs::path("/tmp/xdg-test/polarlink"));

  if (old) {
    setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
  } else {
    unsetenv("XDG_CONFIG_HOME");
  }
}

// ============================================================================
// File Format
// ============================================================================

TEST(ConfigParseTest, ReadsKeys) {
  std::istringstream in("# comment\n"
                        "\n"
                        "mode = ECG\n"
                        "log_level = debug\n"
                        "device_address = A0:9E:1A:12:34:56\n"
                        "log_dir = /var/tmp/hr logs\n"
                        "record_csv = no\n"
                        "  scan_timeout=15  \n"
                        "base_retry_interval_ms = 500\n"
                        "auto_reconnect = off\n");

  MonitorConfig config;
  auto result = parse_config(in, config);
  ASSERT_TRUE(result.is_ok()) << result.error().to_string();

  EXPECT_EQ(config.mode, MonitorMode::Ecg);
  EXPECT_EQ(config.log_level, LogLevel::Debug);
  EXPECT_EQ(config.device_address, "A0:9E:1A:12:34:56");
  EXPECT_EQ(config.log_dir, fs::path("/var/tmp/hr logs"));
  EXPECT_FALSE(config.record_csv);
  EXPECT_EQ(config.scan_timeout, std::chrono::seconds(15));
  EXPECT_EQ(config.base_retry_interval, std::chrono::milliseconds(500));
  EXPECT_FALSE(config.auto_reconnect);
}

TEST(ConfigParseTest, UnknownKeysIgnored) {
  std::istringstream in("colour = blue\nmode = HR\n");
  MonitorConfig config;
  config.mode = MonitorMode::Ecg;
  EXPECT_TRUE(parse_config(in, config).is_ok());
  EXPECT_EQ(config.mode, MonitorMode::HeartRate);
}

TEST(ConfigParseTest, ErrorsNameTheLine) {
  std::istringstream in("mode = HR\nscan_timeout = soon\n");
  MonitorConfig config;
  auto result = parse_config(in, config);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::ConfigParseError);
  EXPECT_EQ(result.error().message.rfind("Line 2:", 0), 0u);
}

TEST(ConfigParseTest, RejectsMalformedLines) {
  MonitorConfig config;

  std::istringstream no_eq("just text\n");
  EXPECT_TRUE(parse_config(no_eq, config).is_error());

  std::istringstream bad_mode("mode = PPG\n");
  EXPECT_TRUE(parse_config(bad_mode, config).is_error());

  std::istringstream bad_bool("record_csv = maybe\n");
  EXPECT_TRUE(parse_config(bad_bool, config).is_error());

  std::istringstream negative("data_timeout = -5\n");
  EXPECT_TRUE(parse_config(negative, config).is_error());
}

TEST(ConfigParseTest, RejectsValuesThatDoNotFit) {
  MonitorConfig config;

  std::istringstream rate("# ecg\necg_sample_rate = 65666\n");
  auto r = parse_config(rate, config);
  ASSERT_TRUE(r.is_error());
  EXPECT_EQ(r.error().code, ErrorCode::ConfigParseError);
  EXPECT_EQ(r.error().message.rfind("Line 2:", 0), 0u);
  EXPECT_EQ(config.ecg_sample_rate, 130);

  std::istringstream attempts("max_reconnect_attempts = 4294967297\n");
  EXPECT_TRUE(parse_config(attempts, config).is_error());
  EXPECT_EQ(config.max_reconnect_attempts, 5);

  std::istringstream huge("data_timeout = 99999999999999999999\n");
  EXPECT_TRUE(parse_config(huge, config).is_error());

  std::istringstream edge("ecg_resolution = 65535\n");
  EXPECT_TRUE(parse_config(edge, config).is_ok());
  EXPECT_EQ(config.ecg_resolution, 65535);
}

TEST(ConfigParseTest, FormatIsReadBack) {
  MonitorConfig original;
  original.mode = MonitorMode::Ecg;
  original.log_level = LogLevel::Warn;
  original.device_address = "A0:9E:1A:12:34:56";
  original.record_csv = false;
  original.max_reconnect_attempts = 3;

  std::istringstream in(format_config(original));
  MonitorConfig copy;
  ASSERT_TRUE(parse_config(in, copy).is_ok());

  EXPECT_EQ(copy.mode, original.mode);
  EXPECT_EQ(copy.log_level, original.log_level);
  EXPECT_EQ(copy.device_address, original.device_address);
  EXPECT_EQ(copy.record_csv, original.record_csv);
  EXPECT_EQ(copy.max_reconnect_attempts, 3);
}

// ============================================================================
// ConfigManager
// ============================================================================

class ConfigManagerTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir = fs::temp_directory_path() /
          ("polarlink_config_test_" +
           std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
           "_" + ::testing::UnitTest::GetInstance()
                     ->current_test_info()
                     ->name());
    fs::remove_all(dir);
  }

  void TearDown() override { fs::remove_all(dir); }

  fs::path dir;
};

TEST_F(ConfigManagerTest, MissingFileUsesDefaults) {
  ConfigManager manager;
  ASSERT_TRUE(manager.init(dir / "polarlink.conf").is_ok());
  EXPECT_EQ(manager.get().mode, MonitorMode::HeartRate);
  EXPECT_EQ(manager.config_path(), dir / "polarlink.conf");
}

TEST_F(ConfigManagerTest, SaveThenLoad) {
  const fs::path path = dir / "nested" / "polarlink.conf";
  {
    ConfigManager manager;
    ASSERT_TRUE(manager.init(path).is_ok());

    MonitorConfig config = manager.get();
    config.mode = MonitorMode::Ecg;
    config.display_points = 250;
    ASSERT_TRUE(manager.set(config).is_ok());
    ASSERT_TRUE(manager.save().is_ok());
  }
  ASSERT_TRUE(fs::exists(path));

  ConfigManager reloaded;
  ASSERT_TRUE(reloaded.init(path).is_ok());
  EXPECT_EQ(reloaded.get().mode, MonitorMode::Ecg);
  EXPECT_EQ(reloaded.get().display_points, 250u);
}

TEST_F(ConfigManagerTest, SetRejectsInvalid) {
  ConfigManager manager;
  ASSERT_TRUE(manager.init(dir / "polarlink.conf").is_ok());

  MonitorConfig bad = manager.get();
  bad.max_reconnect_attempts = 0;
  EXPECT_TRUE(manager.set(bad).is_error());
  EXPECT_EQ(manager.get().max_reconnect_attempts, 5);
}

TEST_F(ConfigManagerTest, InvalidFileReported) {
  fs::create_directories(dir);
  const fs::path path = dir / "polarlink.conf";
  {
    std::ofstream out(path);
    out << "ecg_sample_rate = 500\n";
  }

  ConfigManager manager;
  auto result = manager.init(path);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::ConfigInvalid);
  EXPECT_EQ(manager.get().ecg_sample_rate, 130);
}

TEST_F(ConfigManagerTest, ResetDefaults) {
  ConfigManager manager;
  ASSERT_TRUE(manager.init(dir / "polarlink.conf").is_ok());

  MonitorConfig config = manager.get();
  config.record_csv = false;
  ASSERT_TRUE(manager.set(config).is_ok());
  manager.reset_defaults();
  EXPECT_TRUE(manager.get().record_csv);
}
