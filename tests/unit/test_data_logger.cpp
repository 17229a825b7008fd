/**
 * @file test_data_logger.cpp
 * @brief Unit tests for CSV recording
 */

#include <gtest/gtest.h>
#include <polarlink/data_logger.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace polarlink;
namespace fs = std::filesystem;

namespace {

std::vector<std::string> read_lines(const fs::path &path) {
  std::ifstream in(path);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

} // namespace

class DataLoggerTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir = fs::temp_directory_path() /
          ("polarlink_logger_test_" + std::string(::testing::UnitTest::
                                                      GetInstance()
                                                          ->current_test_info()
                                                          ->name()));
    fs::remove_all(dir);
  }

  void TearDown() override { fs::remove_all(dir); }

  fs::path dir;
};

TEST_F(DataLoggerTest, InitCreatesDirectoryAndHeader) {
  DataLogger logger(dir / "sub");
  ASSERT_TRUE(logger.init().is_ok());

  fs::path file = logger.current_file();
  ASSERT_FALSE(file.empty());
  EXPECT_TRUE(fs::exists(file));
  EXPECT_EQ(file.parent_path(), dir / "sub");
  EXPECT_EQ(file.extension(), ".csv");
  EXPECT_EQ(file.filename().string().rfind(HR_LOG_PREFIX, 0), 0u);

  auto lines = read_lines(file);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], "Timestamp,HeartRate");
}

TEST_F(DataLoggerTest, HeartRateRows) {
  DataLogger logger(dir);
  ASSERT_TRUE(logger.init().is_ok());

  ASSERT_TRUE(logger.log_heart_rate(72).is_ok());
  ASSERT_TRUE(logger.log_heart_rate(75).is_ok());

  auto lines = read_lines(logger.current_file());
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines[1].substr(lines[1].size() - 3), ",72");
  EXPECT_EQ(lines[2].substr(lines[2].size() - 3), ",75");

  // "YYYY-MM-DDTHH:MM:SS.ffffff,72"
  EXPECT_EQ(lines[1].find(','), 26u);
  EXPECT_EQ(lines[1][10], 'T');
}

TEST_F(DataLoggerTest, NotInitialized) {
  DataLogger logger(dir);
  auto result = logger.log_heart_rate(70);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::NotInitialized);

  EXPECT_TRUE(logger.log_ecg_samples({EcgSample()}).is_error());
  EXPECT_TRUE(logger.current_file().empty());
}

TEST_F(DataLoggerTest, NewLogDoesNotOverwrite) {
  DataLogger logger(dir);
  ASSERT_TRUE(logger.init().is_ok());
  fs::path first = logger.current_file();

  ASSERT_TRUE(logger.start_new_log().is_ok());
  fs::path second = logger.current_file();

  EXPECT_NE(first, second);
  EXPECT_TRUE(fs::exists(first));
  EXPECT_TRUE(fs::exists(second));
}

TEST_F(DataLoggerTest, GenerateFilenameAddsSuffix) {
  fs::create_directories(dir);
  DataLogger logger(dir);

  fs::path name = logger.generate_filename("probe");
  { std::ofstream touch(name); }

  fs::path next = logger.generate_filename("probe");
  // The clock may tick between calls; only a same-second clash gets "_1"
  if (next.stem().string().size() == name.stem().string().size() + 2) {
    EXPECT_EQ(next.stem().string(), name.stem().string() + "_1");
  }
  EXPECT_NE(name, next);
}

TEST_F(DataLoggerTest, EcgRows) {
  DataLogger logger(dir);
  ASSERT_TRUE(logger.start_ecg_log().is_ok());
  EXPECT_TRUE(logger.current_file().empty());

  std::vector<EcgSample> samples(2);
  samples[0].timestamp_ns = 1000;
  samples[0].microvolts = -120;
  samples[1].timestamp_ns = 8692;
  samples[1].microvolts = 340;
  ASSERT_TRUE(logger.log_ecg_samples(samples).is_ok());
  logger.close();

  auto lines = read_lines(logger.current_ecg_file());
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines[0], "TimestampNs,Microvolts");
  EXPECT_EQ(lines[1], "1000,-120");
  EXPECT_EQ(lines[2], "8692,340");
}

TEST_F(DataLoggerTest, CloseStopsLogging) {
  DataLogger logger(dir);
  ASSERT_TRUE(logger.init().is_ok());
  logger.close();
  EXPECT_TRUE(logger.log_heart_rate(70).is_error());
}

TEST(IsoTimestampTest, Layout) {
  auto tp = std::chrono::system_clock::time_point(
      std::chrono::seconds(1700000000) + std::chrono::microseconds(42));
  std::string s = format_iso_timestamp(tp);

  ASSERT_EQ(s.size(), 26u);
  EXPECT_EQ(s[4], '-');
  EXPECT_EQ(s[10], 'T');
  EXPECT_EQ(s[19], '.');
  EXPECT_EQ(s.substr(20), "000042");
}
