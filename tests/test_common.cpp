/**
 * @file test_common.cpp
 * @brief Unit tests for report levels and error codes
 * @brief 报告级别与错误码的单元测试
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include <propcheck/common.hpp>

namespace propcheck {
namespace test {

// ==============================================================================
// Level / 级别
// ==============================================================================

/**
 * @brief Test Level enum values
 * @brief 测试 Level 枚举值
 */
TEST(LevelTest, EnumValues) {
    EXPECT_EQ(static_cast<uint8_t>(Level::Trace), 0);
    EXPECT_EQ(static_cast<uint8_t>(Level::Debug), 1);
    EXPECT_EQ(static_cast<uint8_t>(Level::Info), 2);
    EXPECT_EQ(static_cast<uint8_t>(Level::Warn), 3);
    EXPECT_EQ(static_cast<uint8_t>(Level::Error), 4);
    EXPECT_EQ(static_cast<uint8_t>(Level::Critical), 5);
    EXPECT_EQ(static_cast<uint8_t>(Level::Off), 6);
}

TEST(LevelTest, LevelToStringStyles) {
    EXPECT_EQ(LevelToString(Level::Debug, LevelNameStyle::Full), "debug");
    EXPECT_EQ(LevelToString(Level::Critical, LevelNameStyle::Full), "critical");
    EXPECT_EQ(LevelToString(Level::Trace, LevelNameStyle::Short4), "TRAC");
    EXPECT_EQ(LevelToString(Level::Error, LevelNameStyle::Short4), "ERRO");
    EXPECT_EQ(LevelToString(Level::Warn, LevelNameStyle::Short1), "W");
    EXPECT_EQ(LevelToString(Level::Off, LevelNameStyle::Short1), "O");
}

/**
 * @brief Default style is Short4
 * @brief 默认样式为 Short4
 */
TEST(LevelTest, LevelToStringDefault) {
    EXPECT_EQ(LevelToString(Level::Info), "INFO");
    EXPECT_EQ(LevelToString(Level::Off), "OFF");
    EXPECT_EQ(LevelToString(static_cast<Level>(42)), "UNKN");
}

TEST(LevelTest, ShouldReport) {
    EXPECT_FALSE(ShouldReport(Level::Debug, Level::Info));
    EXPECT_TRUE(ShouldReport(Level::Info, Level::Info));
    EXPECT_TRUE(ShouldReport(Level::Error, Level::Info));
    EXPECT_TRUE(ShouldReport(Level::Trace, Level::Trace));

    // Off filters everything / Off 过滤所有行
    EXPECT_FALSE(ShouldReport(Level::Critical, Level::Off));
    EXPECT_FALSE(ShouldReport(Level::Off, Level::Off));
}

// ==============================================================================
// ErrorCode / 错误码
// ==============================================================================

TEST(ErrorCodeTest, ToString) {
    EXPECT_EQ(ErrorCodeToString(ErrorCode::Success), "Success");
    EXPECT_EQ(ErrorCodeToString(ErrorCode::FileOpenFailed), "FileOpenFailed");
    EXPECT_EQ(ErrorCodeToString(ErrorCode::ConfigParseError), "ConfigParseError");
    EXPECT_EQ(ErrorCodeToString(ErrorCode::InvalidRange), "InvalidRange");
    EXPECT_EQ(ErrorCodeToString(ErrorCode::DuplicateField), "DuplicateField");
    EXPECT_EQ(ErrorCodeToString(static_cast<ErrorCode>(12345)), "UnknownError");
}

TEST(ErrorCodeTest, Categories) {
    EXPECT_EQ(static_cast<int32_t>(ErrorCode::FileWriteFailed), 301);
    EXPECT_EQ(static_cast<int32_t>(ErrorCode::ConfigInvalidValue), 601);
    EXPECT_EQ(static_cast<int32_t>(ErrorCode::NotInitialized), 902);
}

/**
 * @brief UsageError message is prefixed with the code name
 * @brief UsageError 的消息以错误码名称为前缀
 */
TEST(UsageErrorTest, MessageAndCode) {
    const UsageError error(ErrorCode::InvalidRange, "min (3) must not exceed max (1)");
    EXPECT_EQ(error.Code(), ErrorCode::InvalidRange);
    EXPECT_EQ(std::string(error.what()), "InvalidRange: min (3) must not exceed max (1)");
}

TEST(UsageErrorTest, IsLogicError) {
    try {
        throw UsageError(ErrorCode::AlreadyInitialized, "twice");
    } catch (const std::logic_error& e) {
        EXPECT_EQ(std::string(e.what()), "AlreadyInitialized: twice");
    }
}

}  // namespace test
}  // namespace propcheck
