/**
 * @file utf8.hpp
 * @brief UTF-8 encoding and decoding of code point sequences
 * @brief 码点序列的 UTF-8 编码与解码
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace propcheck {
namespace internal {

constexpr char32_t kReplacementCharacter = 0xFFFD;

/**
 * @brief Append the UTF-8 encoding of @p c to @p out
 * @brief 将 @p c 的 UTF-8 编码追加到 @p out
 *
 * Surrogates and values above U+10FFFF are encoded as U+FFFD.
 * 代理码点和大于 U+10FFFF 的值编码为 U+FFFD。
 */
void AppendUtf8(std::string& out, char32_t c);

std::string EncodeUtf8(const std::vector<char32_t>& codePoints);

/**
 * @brief Decode UTF-8; malformed sequences become U+FFFD
 * @brief 解码 UTF-8；非法序列转换为 U+FFFD
 */
std::vector<char32_t> DecodeUtf8(std::string_view text);

}  // namespace internal
}  // namespace propcheck
