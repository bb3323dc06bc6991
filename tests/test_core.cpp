/// @file test_core.cpp
#include "MmsCore.hpp"
#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>

TEST(MmsCore, Version)
{
    auto ver = mms::core::version();
    EXPECT_FALSE(ver.empty());
    EXPECT_EQ(ver, "0.1.0");
}

TEST(MmsCore, ErrorDefault) {
    mms::core::Error err;
    EXPECT_TRUE(err.ok());
    EXPECT_EQ(err.code, mms::core::ErrorCode::kSuccess);
}

// ============================================================================
// Expected 测试
// ============================================================================

TEST(Expected, ValueAndError) {
    mms::core::Result<int> ok = 42;
    ASSERT_TRUE(ok);
    EXPECT_EQ(*ok, 42);

    mms::core::Result<int> bad = mms::core::make_error(mms::core::ErrorCode::kParseError, "bad input");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, mms::core::ErrorCode::kParseError);
    EXPECT_EQ(bad.error().message, "bad input");
}

TEST(Expected, VoidSpecialization) {
    mms::core::Result<void> ok;
    EXPECT_TRUE(ok.has_value());

    mms::core::Result<void> bad = mms::core::make_error(mms::core::ErrorCode::kInvalidFootprint, "flat");
    EXPECT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, mms::core::ErrorCode::kInvalidFootprint);
}

// ============================================================================
// 枚举工具测试
// ============================================================================

TEST(EnumUtils, Name) {
    EXPECT_EQ(mms::core::enum_name(mms::core::ErrorCode::kMalformedSegmentation), "kMalformedSegmentation");
    EXPECT_EQ(mms::core::enum_name(mms::core::LogLevel::kDebug), "kDebug");
}

TEST(EnumUtils, Cast) {
    auto level = mms::core::enum_cast<mms::core::LogLevel>("kWarn");
    ASSERT_TRUE(level.has_value());
    EXPECT_EQ(*level, mms::core::LogLevel::kWarn);

    EXPECT_FALSE(mms::core::enum_cast<mms::core::LogLevel>("verbose").has_value());
    EXPECT_EQ(mms::core::enum_cast_or("verbose", mms::core::LogLevel::kInfo), mms::core::LogLevel::kInfo);
    EXPECT_EQ(mms::core::enum_count<mms::core::LogLevel>(), 7u);
}

// ============================================================================
// 日志测试
// ============================================================================

TEST(Log, SetLevel) {
    mms::core::Log::init("MMSegTest", mms::core::LogLevel::kInfo);
    EXPECT_EQ(mms::core::Log::level(), mms::core::LogLevel::kInfo);

    mms::core::Log::set_level(mms::core::LogLevel::kError);
    EXPECT_EQ(mms::core::Log::level(), mms::core::LogLevel::kError);
    MMS_INFO("suppressed {}", 1);
    MMS_ERROR("visible {}", 2);

    // 重复初始化不抛异常
    EXPECT_NO_THROW(mms::core::Log::init("MMSegTest", mms::core::LogLevel::kWarn));
    EXPECT_EQ(mms::core::Log::level(), mms::core::LogLevel::kWarn);
}

TEST(Log, ParseLevel) {
    EXPECT_EQ(mms::core::Log::parse_level("debug").value_or(mms::core::LogLevel::kOff), mms::core::LogLevel::kDebug);
    EXPECT_EQ(mms::core::Log::parse_level("WARN").value_or(mms::core::LogLevel::kOff), mms::core::LogLevel::kWarn);
    EXPECT_EQ(mms::core::Log::parse_level("Critical").value_or(mms::core::LogLevel::kOff), mms::core::LogLevel::kCritical);
    EXPECT_FALSE(mms::core::Log::parse_level("").has_value());
    EXPECT_FALSE(mms::core::Log::parse_level("verbose").has_value());
}

TEST(Log, AddAndRemoveSink) {
    mms::core::Log::init("MMSegTest", mms::core::LogLevel::kInfo);
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    mms::core::Log::add_sink(sink);
    MMS_WARN("captured {}", 7);
    mms::core::Log::logger()->flush();
    EXPECT_NE(out.str().find("captured 7"), std::string::npos);

    mms::core::Log::remove_sink(sink);
    MMS_WARN("not captured");
    mms::core::Log::logger()->flush();
    EXPECT_EQ(out.str().find("not captured"), std::string::npos);
}
