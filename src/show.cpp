/**
 * @file show.cpp
 * @brief Value rendering helpers implementation
 * @brief 值渲染辅助函数实现
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#include "propcheck/show.hpp"

#include <cstdint>

namespace propcheck {

std::string QuoteString(std::string_view text) {
    std::string result;
    result.reserve(text.size() + 2);
    result += '"';

    for (char c : text) {
        switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) {
                    // Control character, escape as \uXXXX
                    // 控制字符，转义为 \uXXXX
                    result += fmt::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                } else {
                    result += c;
                }
                break;
        }
    }

    result += '"';
    return result;
}

std::string ShowCodePoint(char32_t c) {
    if (c >= 0x20 && c < 0x7F) {
        if (c == U'\'' || c == U'\\') {
            return fmt::format("'\\{}'", static_cast<char>(c));
        }
        return fmt::format("'{}'", static_cast<char>(c));
    }
    return fmt::format("U+{:04X}", static_cast<uint32_t>(c));
}

}  // namespace propcheck
