/**
 * @file test_error.cpp
 * @brief Unit tests for error codes and Result
 */

#include <gtest/gtest.h>
#include <memory>
#include <polarlink/error.h>

using namespace polarlink;

// ============================================================================
// Error
// ============================================================================

TEST(ErrorTest, DefaultIsSuccess) {
  Error err;
  EXPECT_TRUE(err.is_ok());
  EXPECT_FALSE(err.is_error());
}

TEST(ErrorTest, ToStringIncludesAllParts) {
  Error err(ErrorCode::DeviceNotFound, "No Polar H10 device found",
            "scanned 10s");
  err.location = "discover";

  EXPECT_EQ(err.to_string(),
            "DeviceNotFound: No Polar H10 device found (scanned 10s) "
            "[discover]");
}

TEST(ErrorTest, ToStringCodeOnly) {
  Error err(ErrorCode::Timeout);
  EXPECT_EQ(err.to_string(), "Timeout");
}

TEST(ErrorTest, CodeNames) {
  EXPECT_STREQ(error_code_name(ErrorCode::ConnectionLost), "ConnectionLost");
  EXPECT_STREQ(error_code_name(ErrorCode::ServicesMissing), "ServicesMissing");
  EXPECT_STREQ(error_code_name(ErrorCode::ConfigParseError),
               "ConfigParseError");
}

TEST(ErrorTest, Recoverability) {
  EXPECT_TRUE(is_recoverable(ErrorCode::ConnectionLost));
  EXPECT_TRUE(is_recoverable(ErrorCode::ConnectionTimeout));
  EXPECT_FALSE(is_recoverable(ErrorCode::BluetoothNotSupported));
  EXPECT_FALSE(is_recoverable(ErrorCode::ConfigInvalid));
}

// ============================================================================
// Result
// ============================================================================

TEST(ResultTest, HoldsValue) {
  Result<int> r(72);
  ASSERT_TRUE(r.is_ok());
  EXPECT_TRUE(static_cast<bool>(r));
  EXPECT_EQ(r.value(), 72);
  EXPECT_EQ(r.value_or(0), 72);
}

TEST(ResultTest, HoldsError) {
  Result<int> r = Error(ErrorCode::InvalidData, "bad frame");
  ASSERT_TRUE(r.is_error());
  EXPECT_EQ(r.error().code, ErrorCode::InvalidData);
  EXPECT_EQ(r.error().message, "bad frame");
  EXPECT_EQ(r.value_or(-1), -1);
  EXPECT_FALSE(r.to_optional().has_value());
}

TEST(ResultTest, MoveOnlyValue) {
  auto ptr = std::make_unique<int>(5);
  Result<std::unique_ptr<int>> r(std::move(ptr));
  ASSERT_TRUE(r.is_ok());
  std::unique_ptr<int> out = std::move(r.value());
  EXPECT_EQ(*out, 5);
}

TEST(ResultTest, VoidResult) {
  Result<void> ok = Result<void>::ok();
  EXPECT_TRUE(ok.is_ok());

  Result<void> bad(ErrorCode::NotConnected, "Not connected");
  EXPECT_TRUE(bad.is_error());
  EXPECT_EQ(bad.error().code, ErrorCode::NotConnected);
}

namespace {

Result<void> fails_first() {
  POLARLINK_TRY(Result<void>(ErrorCode::GattWriteFailed, "write"));
  return Result<void>::ok();
}

Result<int> requires_positive(int v) {
  POLARLINK_REQUIRE(v > 0, ErrorCode::InvalidArgument, "must be positive");
  return v;
}

} // namespace

TEST(ResultTest, TryMacroPropagates) {
  auto r = fails_first();
  ASSERT_TRUE(r.is_error());
  EXPECT_EQ(r.error().code, ErrorCode::GattWriteFailed);
}

TEST(ResultTest, RequireMacro) {
  EXPECT_TRUE(requires_positive(3).is_ok());
  auto r = requires_positive(-1);
  ASSERT_TRUE(r.is_error());
  EXPECT_EQ(r.error().message, "must be positive");
}
