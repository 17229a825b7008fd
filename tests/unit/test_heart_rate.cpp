/**
 * @file test_heart_rate.cpp
 * @brief Unit tests for Heart Rate Measurement decoding
 */

#include <gtest/gtest.h>
#include <polarlink/heart_rate.h>

using namespace polarlink;

// ============================================================================
// Parsing
// ============================================================================

TEST(HeartRateParseTest, EightBitValue) {
  auto r = parse_heart_rate_measurement({0x00, 72});
  ASSERT_TRUE(r.is_ok());
  EXPECT_EQ(r.value().bpm, 72);
  EXPECT_FALSE(r.value().sensor_contact_supported);
  EXPECT_TRUE(r.value().rr_intervals.empty());
}

TEST(HeartRateParseTest, SixteenBitValue) {
  // 0x012C = 300, little-endian
  auto r = parse_heart_rate_measurement({0x01, 0x2C, 0x01});
  ASSERT_TRUE(r.is_ok());
  EXPECT_EQ(r.value().bpm, 300);
}

TEST(HeartRateParseTest, SensorContact) {
  auto r = parse_heart_rate_measurement({0x06, 65});
  ASSERT_TRUE(r.is_ok());
  EXPECT_TRUE(r.value().sensor_contact_supported);
  EXPECT_TRUE(r.value().sensor_contact_detected);

  // Detected bit without supported bit is meaningless
  r = parse_heart_rate_measurement({0x02, 65});
  ASSERT_TRUE(r.is_ok());
  EXPECT_FALSE(r.value().sensor_contact_detected);
}

TEST(HeartRateParseTest, EnergyAndRrIntervals) {
  // flags: energy + RR, bpm 60, energy 0x0010, RR 1024 and 512
  Bytes data = {0x18, 60, 0x10, 0x00, 0x00, 0x04, 0x00, 0x02};
  auto r = parse_heart_rate_measurement(data);
  ASSERT_TRUE(r.is_ok());

  const auto &m = r.value();
  EXPECT_EQ(m.bpm, 60);
  ASSERT_TRUE(m.energy_expended_kj.has_value());
  EXPECT_EQ(*m.energy_expended_kj, 16);
  ASSERT_EQ(m.rr_intervals.size(), 2u);
  EXPECT_EQ(m.rr_intervals[0], 1024);
  EXPECT_EQ(m.rr_intervals[1], 512);

  auto ms = m.rr_intervals_ms();
  EXPECT_DOUBLE_EQ(ms[0], 1000.0);
  EXPECT_DOUBLE_EQ(ms[1], 500.0);
}

TEST(HeartRateParseTest, TooShort) {
  auto r = parse_heart_rate_measurement({0x00});
  ASSERT_TRUE(r.is_error());
  EXPECT_EQ(r.error().code, ErrorCode::InvalidData);
  EXPECT_EQ(r.error().message, "Invalid heart rate data format");

  EXPECT_TRUE(parse_heart_rate_measurement({}).is_error());
}

TEST(HeartRateParseTest, TruncatedFields) {
  EXPECT_TRUE(parse_heart_rate_measurement({0x01, 0x2C}).is_error());
  EXPECT_TRUE(parse_heart_rate_measurement({0x08, 70, 0x10}).is_error());
  EXPECT_TRUE(parse_heart_rate_measurement({0x10, 70, 0x00}).is_error());
}

// ============================================================================
// Validation
// ============================================================================

TEST(HeartRateValidateTest, Bounds) {
  EXPECT_TRUE(validate_heart_rate(30).is_ok());
  EXPECT_TRUE(validate_heart_rate(240).is_ok());
  EXPECT_TRUE(validate_heart_rate(72).is_ok());

  auto low = validate_heart_rate(29);
  ASSERT_TRUE(low.is_error());
  EXPECT_EQ(low.error().code, ErrorCode::ValueOutOfRange);
  EXPECT_TRUE(validate_heart_rate(241).is_error());
  EXPECT_TRUE(validate_heart_rate(0).is_error());
}
