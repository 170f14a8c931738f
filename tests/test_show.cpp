/**
 * @file test_show.cpp
 * @brief Unit tests for value rendering
 * @brief 值渲染的单元测试
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

#include <propcheck/show.hpp>

namespace propcheck {
namespace test {

namespace {

struct Opaque {
    int value;
};

}  // namespace

TEST(ShowTest, Scalars) {
    EXPECT_EQ(Stringify(18), "18");
    EXPECT_EQ(Stringify(-7), "-7");
    EXPECT_EQ(Stringify(1.5), "1.5");
    EXPECT_EQ(Stringify(true), "true");
    EXPECT_EQ(Stringify(false), "false");
}

/**
 * @brief Test strings are quoted and escaped
 * @brief 测试字符串被加引号并转义
 */
TEST(ShowTest, Strings) {
    EXPECT_EQ(Stringify(std::string("ab")), "\"ab\"");
    EXPECT_EQ(Stringify(std::string("a\"b\\c")), "\"a\\\"b\\\\c\"");
    EXPECT_EQ(Stringify(std::string("line\n\t")), "\"line\\n\\t\"");
    EXPECT_EQ(Stringify(std::string("\x01")), "\"\\u0001\"");
    EXPECT_EQ(QuoteString("\xC3\xA9"), "\"\xC3\xA9\"");
}

TEST(ShowTest, CodePoints) {
    EXPECT_EQ(Stringify(U'a'), "'a'");
    EXPECT_EQ(Stringify(char32_t{0x0A}), "U+000A");
    EXPECT_EQ(ShowCodePoint(0xE9), "U+00E9");
    EXPECT_EQ(ShowCodePoint(0x1F600), "U+1F600");
}

TEST(ShowTest, Containers) {
    EXPECT_EQ(Stringify(std::vector<int>{3, 1}), "[3, 1]");
    EXPECT_EQ(Stringify(std::vector<int>{}), "[]");
    EXPECT_EQ(Stringify(std::make_tuple(1, std::string("x"), true)), "(1, \"x\", true)");
    EXPECT_EQ(Stringify(std::vector<std::vector<int>>{{1}, {}}), "[[1], []]");
}

TEST(ShowTest, OptionalPointerVariant) {
    EXPECT_EQ(Stringify(std::optional<int>()), "nullopt");
    EXPECT_EQ(Stringify(std::optional<int>(4)), "4");
    EXPECT_EQ(Stringify(std::shared_ptr<const int>()), "null");
    EXPECT_EQ(Stringify(std::make_shared<const int>(9)), "9");
    EXPECT_EQ(Stringify(std::variant<std::string, int>(5)), "5");
    EXPECT_EQ(Stringify(std::variant<std::monostate, int>()), "monostate");
}

TEST(ShowTest, Unprintable) {
    EXPECT_EQ(Stringify(Opaque{1}), "<unprintable>");
}

}  // namespace test
}  // namespace propcheck
