/**
 * @file primitives.hpp
 * @brief Primitive arbitraries: bounded integers, reals and code points
 * @brief 基本 Arbitrary：有界整数、实数和码点
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#pragma once

#include <cstdint>
#include <string_view>

#include "propcheck/arbitrary.hpp"

namespace propcheck {

// ==============================================================================
// Code Point Constants / 码点常量
// ==============================================================================

constexpr char32_t kCodePointMin = 0x0000;
constexpr char32_t kAsciiMax = 0x007F;
constexpr char32_t kLatin1Max = 0x00FF;
constexpr char32_t kCodePointMax = 0x10FFFF;

/// Scale of the numerator and denominator drawn by Number() / Number() 分子分母的精度
constexpr double kNumberPrecision = 9999999999999.0;

/**
 * @brief Code point categories, ordered from simplest to most complex
 * @brief 码点类别，按从简单到复杂排序
 */
enum class CodePointCategory : uint8_t {
    AsciiLower = 0,       ///< a-z
    AsciiUpper = 1,       ///< A-Z
    AsciiDigit = 2,       ///< 0-9
    AsciiOther = 3,       ///< Remaining ASCII / 其余 ASCII
    Latin1NonAscii = 4,   ///< U+0080..U+00FF
    BeyondLatin1 = 5      ///< U+0100 and above / U+0100 及以上
};

constexpr CodePointCategory CategoryOf(char32_t c) noexcept {
    if (c <= kAsciiMax) {
        if (c >= U'a' && c <= U'z') {
            return CodePointCategory::AsciiLower;
        }
        if (c >= U'A' && c <= U'Z') {
            return CodePointCategory::AsciiUpper;
        }
        if (c >= U'0' && c <= U'9') {
            return CodePointCategory::AsciiDigit;
        }
        return CodePointCategory::AsciiOther;
    }
    if (c <= kLatin1Max) {
        return CodePointCategory::Latin1NonAscii;
    }
    return CodePointCategory::BeyondLatin1;
}

/**
 * @brief Strict "simpler than" order on code points (category, then value)
 * @brief 码点上的严格“更简单”顺序（先类别，后数值）
 */
constexpr bool IsSimplerCodePoint(char32_t lhs, char32_t rhs) noexcept {
    const auto lc = CategoryOf(lhs);
    const auto rc = CategoryOf(rhs);
    return lc < rc || (lc == rc && lhs < rhs);
}

std::string_view CodePointCategoryToString(CodePointCategory category) noexcept;

// ==============================================================================
// Factories / 工厂函数
// ==============================================================================

/**
 * @brief Integers in (-size, size), shrinking toward zero
 * @brief (-size, size) 内的整数，向零收缩
 */
ArbitraryPtr<int32_t> Int32();

/**
 * @brief Pseudo-rational reals scaled by size, shrinking toward zero
 * @brief 按规模缩放的伪有理实数，向零收缩
 */
ArbitraryPtr<double> Number();

/**
 * @brief ASCII or Latin-1 code points, shrinking toward 'a'
 * @brief ASCII 或 Latin-1 码点，向 'a' 收缩
 */
ArbitraryPtr<char32_t> CodePoint();

/**
 * @brief value - sign(value), value / 2, 0 (nothing for 0)
 * @brief value - sign(value)、value / 2、0（0 没有候选值）
 */
Stream<int32_t> ShrinkInt32(int32_t value);

}  // namespace propcheck
