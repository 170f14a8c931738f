/**
 * @file test_config.cpp
 * @brief Unit tests for run configuration
 * @brief 运行配置的单元测试
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include <propcheck/config.hpp>

namespace propcheck {
namespace test {

namespace {

ErrorCode ParseError(const std::string& params) {
    try {
        ParseConfig(params);
    } catch (const UsageError& e) {
        return e.Code();
    }
    return ErrorCode::Success;
}

}  // namespace

// ==============================================================================
// Default Tests / 默认值测试
// ==============================================================================

TEST(ConfigTest, Defaults) {
    const Config config = Config::Default();
    EXPECT_FALSE(config.seed.has_value());
    EXPECT_EQ(config.maxTests, 100);
    EXPECT_EQ(config.startSize, 1);
    EXPECT_EQ(config.endSize, 100);
    EXPECT_EQ(config.reporter, nullptr);
}

// ==============================================================================
// ParseConfig Tests / ParseConfig 测试
// ==============================================================================

/**
 * @brief Test every supported key
 * @brief 测试所有支持的键
 */
TEST(ConfigTest, ParseAllKeys) {
    const Config config = ParseConfig("seed=1873066016 max_tests=500\tstart_size=0  end_size=-3");
    ASSERT_TRUE(config.seed.has_value());
    EXPECT_EQ(*config.seed, 1873066016u);
    EXPECT_EQ(config.maxTests, 500);
    EXPECT_EQ(config.startSize, 0);
    EXPECT_EQ(config.endSize, -3);
}

TEST(ConfigTest, ParseKeepsBaseForMissingKeys) {
    Config base;
    base.maxTests = 7;
    base.reporter = DefaultReporter();
    const Config config = ParseConfig("seed=3", base);
    EXPECT_EQ(*config.seed, 3u);
    EXPECT_EQ(config.maxTests, 7);
    EXPECT_EQ(config.reporter, base.reporter);
}

TEST(ConfigTest, ParseEmptyAndBlank) {
    EXPECT_EQ(ParseConfig("").maxTests, 100);
    EXPECT_EQ(ParseConfig("   \n ").maxTests, 100);
}

TEST(ConfigTest, ParseErrors) {
    EXPECT_EQ(ParseError("verbose=1"), ErrorCode::ConfigParseError);
    EXPECT_EQ(ParseError("seed"), ErrorCode::ConfigParseError);
    EXPECT_EQ(ParseError("=5"), ErrorCode::ConfigParseError);
    EXPECT_EQ(ParseError("seed=abc"), ErrorCode::ConfigInvalidValue);
    EXPECT_EQ(ParseError("seed=-1"), ErrorCode::ConfigInvalidValue);
    EXPECT_EQ(ParseError("seed=4294967296"), ErrorCode::ConfigInvalidValue);
    EXPECT_EQ(ParseError("max_tests=-5"), ErrorCode::ConfigInvalidValue);
    EXPECT_EQ(ParseError("max_tests=12x"), ErrorCode::ConfigInvalidValue);
    EXPECT_EQ(ParseError("end_size="), ErrorCode::ConfigInvalidValue);
    EXPECT_EQ(ParseError("seed=4294967295"), ErrorCode::Success);
}

// ==============================================================================
// Environment Tests / 环境变量测试
// ==============================================================================

/**
 * @brief Test PROPCHECK_PARAMS is applied over the base config
 * @brief 测试 PROPCHECK_PARAMS 被应用到基础配置上
 */
TEST(ConfigTest, FromEnvironment) {
    ::setenv(kParamsEnvVar, "seed=42 max_tests=10", 1);
    Config base;
    base.endSize = 30;
    const Config config = Config::FromEnvironment(base);
    EXPECT_EQ(*config.seed, 42u);
    EXPECT_EQ(config.maxTests, 10);
    EXPECT_EQ(config.endSize, 30);

    ::unsetenv(kParamsEnvVar);
    const Config unchanged = Config::FromEnvironment(base);
    EXPECT_FALSE(unchanged.seed.has_value());
    EXPECT_EQ(unchanged.maxTests, 100);
}

TEST(ConfigTest, FromEnvironmentWithDefaults) {
    ::setenv(kParamsEnvVar, "end_size=40", 1);
    const Config config = Config::FromEnvironment();
    EXPECT_FALSE(config.seed.has_value());
    EXPECT_EQ(config.maxTests, kDefaultMaxTests);
    EXPECT_EQ(config.startSize, kDefaultStartSize);
    EXPECT_EQ(config.endSize, 40);

    ::unsetenv(kParamsEnvVar);
    EXPECT_EQ(Config::FromEnvironment().endSize, kDefaultEndSize);
}

}  // namespace test
}  // namespace propcheck
