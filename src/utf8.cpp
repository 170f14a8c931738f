/**
 * @file utf8.cpp
 * @brief UTF-8 helpers implementation
 * @brief UTF-8 辅助函数实现
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#include "propcheck/internal/utf8.hpp"

namespace propcheck {
namespace internal {

namespace {

bool IsContinuation(unsigned char byte) {
    return (byte & 0xC0u) == 0x80u;
}

}  // namespace

void AppendUtf8(std::string& out, char32_t c) {
    if (c > 0x10FFFF || (c >= 0xD800 && c <= 0xDFFF)) {
        c = kReplacementCharacter;
    }

    if (c < 0x80) {
        out += static_cast<char>(c);
    } else if (c < 0x800) {
        out += static_cast<char>(0xC0 | (c >> 6));
        out += static_cast<char>(0x80 | (c & 0x3F));
    } else if (c < 0x10000) {
        out += static_cast<char>(0xE0 | (c >> 12));
        out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (c & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (c >> 18));
        out += static_cast<char>(0x80 | ((c >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (c & 0x3F));
    }
}

std::string EncodeUtf8(const std::vector<char32_t>& codePoints) {
    std::string result;
    result.reserve(codePoints.size());
    for (char32_t c : codePoints) {
        AppendUtf8(result, c);
    }
    return result;
}

std::vector<char32_t> DecodeUtf8(std::string_view text) {
    std::vector<char32_t> result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        size_t length = 0;
        char32_t c = 0;
        char32_t minimum = 0;

        if (lead < 0x80) {
            result.push_back(lead);
            ++i;
            continue;
        } else if ((lead & 0xE0u) == 0xC0u) {
            length = 2;
            c = lead & 0x1Fu;
            minimum = 0x80;
        } else if ((lead & 0xF0u) == 0xE0u) {
            length = 3;
            c = lead & 0x0Fu;
            minimum = 0x800;
        } else if ((lead & 0xF8u) == 0xF0u) {
            length = 4;
            c = lead & 0x07u;
            minimum = 0x10000;
        } else {
            result.push_back(kReplacementCharacter);
            ++i;
            continue;
        }

        size_t consumed = 1;
        while (consumed < length && i + consumed < text.size() &&
               IsContinuation(static_cast<unsigned char>(text[i + consumed]))) {
            c = (c << 6) | (static_cast<unsigned char>(text[i + consumed]) & 0x3Fu);
            ++consumed;
        }

        if (consumed != length || c < minimum || c > 0x10FFFF || (c >= 0xD800 && c <= 0xDFFF)) {
            result.push_back(kReplacementCharacter);
        } else {
            result.push_back(c);
        }
        i += consumed;
    }
    return result;
}

}  // namespace internal
}  // namespace propcheck
