/**
 * @file show.hpp
 * @brief Human-readable rendering of generated values
 * @brief 生成值的可读渲染
 *
 * Rendering is only used to build reports; it never takes part in equality or
 * ordering decisions during shrink-search.
 *
 * 渲染只用于生成报告，从不参与收缩搜索中的相等或顺序判断。
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

namespace propcheck {

/// Stringifier supplied alongside an arbitrary / 与 Arbitrary 一起提供的字符串化函数
template <typename T>
using Show = std::function<std::string(const T&)>;

/**
 * @brief Quote and escape a UTF-8 string ("a\n" -> "\"a\\n\"")
 * @brief 为 UTF-8 字符串加引号并转义
 */
std::string QuoteString(std::string_view text);

/**
 * @brief Render a code point as 'c' (printable ASCII) or U+XXXX
 * @brief 将码点渲染为 'c'（可打印 ASCII）或 U+XXXX
 */
std::string ShowCodePoint(char32_t c);

/**
 * @brief Default rendering, specialized per value shape
 * @brief 默认渲染，按值的形态特化
 */
template <typename T, typename Enable = void>
struct Printer {
    static std::string Print(const T& value) {
        if constexpr (fmt::is_formattable<T>::value) {
            return fmt::format("{}", value);
        } else {
            (void)value;
            return "<unprintable>";
        }
    }
};

template <typename T>
std::string Stringify(const T& value) {
    return Printer<T>::Print(value);
}

template <>
struct Printer<bool> {
    static std::string Print(bool value) { return value ? "true" : "false"; }
};

template <>
struct Printer<char32_t> {
    static std::string Print(char32_t value) { return ShowCodePoint(value); }
};

template <>
struct Printer<std::string> {
    static std::string Print(const std::string& value) { return QuoteString(value); }
};

template <>
struct Printer<std::monostate> {
    static std::string Print(const std::monostate&) { return "monostate"; }
};

template <typename T>
struct Printer<T, std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool> &&
                                   !std::is_same_v<T, char32_t>>> {
    static std::string Print(T value) { return fmt::format("{}", value); }
};

template <typename T>
struct Printer<std::vector<T>> {
    static std::string Print(const std::vector<T>& values) {
        std::string result = "[";
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) {
                result += ", ";
            }
            result += Stringify(values[i]);
        }
        result += "]";
        return result;
    }
};

template <typename... Ts>
struct Printer<std::tuple<Ts...>> {
    static std::string Print(const std::tuple<Ts...>& value) {
        std::string result = "(";
        std::apply(
            [&result](const auto&... elements) {
                size_t index = 0;
                ((result += (index++ > 0 ? ", " : "") + Stringify(elements)), ...);
            },
            value);
        result += ")";
        return result;
    }
};

template <typename T>
struct Printer<std::optional<T>> {
    static std::string Print(const std::optional<T>& value) {
        return value ? Stringify(*value) : std::string("nullopt");
    }
};

template <typename T>
struct Printer<std::shared_ptr<T>> {
    static std::string Print(const std::shared_ptr<T>& value) {
        return value ? Stringify(*value) : std::string("null");
    }
};

template <typename... Ts>
struct Printer<std::variant<Ts...>> {
    static std::string Print(const std::variant<Ts...>& value) {
        return std::visit([](const auto& alternative) { return Stringify(alternative); }, value);
    }
};

}  // namespace propcheck
