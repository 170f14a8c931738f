/**
 * @file combinators.cpp
 * @brief Non-template combinators implementation
 * @brief 非模板组合子实现
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#include "propcheck/combinators.hpp"

#include "propcheck/internal/utf8.hpp"

namespace propcheck {

namespace {

class StringArbitrary final : public Arbitrary<std::string> {
public:
    StringArbitrary() : m_codePoints(Array(CodePoint())) {}

    std::string Generate(Random& random, int32_t size) const override {
        return internal::EncodeUtf8(m_codePoints->Generate(random, size));
    }

    Stream<std::string> Shrink(const std::string& value) const override {
        return m_codePoints->Shrink(internal::DecodeUtf8(value)).Map([](std::vector<char32_t> codePoints) {
            return internal::EncodeUtf8(codePoints);
        });
    }

private:
    ArbitraryPtr<std::vector<char32_t>> m_codePoints;
};

}  // namespace

ArbitraryPtr<std::string> String() {
    static const auto instance = std::make_shared<const StringArbitrary>();
    return instance;
}

}  // namespace propcheck
