/**
 * @file primitives.cpp
 * @brief Primitive arbitraries implementation
 * @brief 基本 Arbitrary 实现
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#include "propcheck/primitives.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace propcheck {

namespace {

class Int32Arbitrary final : public Arbitrary<int32_t> {
public:
    int32_t Generate(Random& random, int32_t size) const override {
        const double bound = static_cast<double>(size);
        return static_cast<int32_t>(random.Range(-bound, bound));
    }

    Stream<int32_t> Shrink(const int32_t& value) const override { return ShrinkInt32(value); }
};

class NumberArbitrary final : public Arbitrary<double> {
public:
    double Generate(Random& random, int32_t size) const override {
        const double scale = static_cast<double>(size) * kNumberPrecision;
        const double numerator = std::trunc(random.Range(-scale, scale));
        const double denominator = std::trunc(random.Range(1.0, kNumberPrecision));
        return numerator / denominator;
    }

    Stream<double> Shrink(const double& value) const override {
        if (!std::isfinite(value)) {
            return Stream<double>::Just(0.0);
        }

        std::vector<double> candidates;
        if (value < 0) {
            candidates.push_back(-value);
        }
        const double n = std::trunc(value);
        if (n != 0) {
            candidates.push_back(n - (n > 0 ? 1.0 : -1.0));
            candidates.push_back(std::trunc(n / 2));
            candidates.push_back(0.0);
        }
        // Large magnitudes lose the -1 step to rounding.
        candidates.erase(std::remove(candidates.begin(), candidates.end(), value), candidates.end());
        return Stream<double>::Of(std::move(candidates));
    }
};

class CodePointArbitrary final : public Arbitrary<char32_t> {
public:
    char32_t Generate(Random& random, int32_t) const override {
        const double upper = random.Next() < 0.5 ? static_cast<double>(kAsciiMax)
                                                 : static_cast<double>(kLatin1Max);
        return static_cast<char32_t>(random.Range(static_cast<double>(kCodePointMin), upper));
    }

    Stream<char32_t> Shrink(const char32_t& value) const override {
        const char32_t c = std::min(value, kCodePointMax);
        const char32_t candidates[] = {
            c > kCodePointMin ? static_cast<char32_t>(c - 1) : kCodePointMin,
            static_cast<char32_t>(c / 2),
            U' ',
            U'\n',
            U'0',
            U'a',
        };

        std::vector<char32_t> simpler;
        for (char32_t candidate : candidates) {
            if (IsSimplerCodePoint(candidate, c)) {
                simpler.push_back(candidate);
            }
        }
        return Stream<char32_t>::Of(std::move(simpler));
    }
};

}  // namespace

std::string_view CodePointCategoryToString(CodePointCategory category) noexcept {
    switch (category) {
        case CodePointCategory::AsciiLower:
            return "AsciiLower";
        case CodePointCategory::AsciiUpper:
            return "AsciiUpper";
        case CodePointCategory::AsciiDigit:
            return "AsciiDigit";
        case CodePointCategory::AsciiOther:
            return "AsciiOther";
        case CodePointCategory::Latin1NonAscii:
            return "Latin1NonAscii";
        case CodePointCategory::BeyondLatin1:
            return "BeyondLatin1";
        default:
            return "Unknown";
    }
}

Stream<int32_t> ShrinkInt32(int32_t value) {
    if (value == 0) {
        return Stream<int32_t>::Empty();
    }
    return Stream<int32_t>::Of({value - (value > 0 ? 1 : -1), value / 2, 0});
}

ArbitraryPtr<int32_t> Int32() {
    static const auto instance = std::make_shared<const Int32Arbitrary>();
    return instance;
}

ArbitraryPtr<double> Number() {
    static const auto instance = std::make_shared<const NumberArbitrary>();
    return instance;
}

ArbitraryPtr<char32_t> CodePoint() {
    static const auto instance = std::make_shared<const CodePointArbitrary>();
    return instance;
}

}  // namespace propcheck
