/**
 * @file config.cpp
 * @brief Run configuration parsing
 * @brief 运行配置解析
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#include "propcheck/config.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <string>

#include <fmt/format.h>

namespace propcheck {

namespace {

bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

template <typename Int>
Int ParseNumber(std::string_view key, std::string_view text, Int minValue) {
    Int value{};
    const char* first = text.data();
    const char* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || ptr != last || value < minValue) {
        throw UsageError(ErrorCode::ConfigInvalidValue,
                         fmt::format("invalid value '{}' for '{}'", text, key));
    }
    return value;
}

void ApplyPair(Config& config, std::string_view pair) {
    const size_t eq = pair.find('=');
    if (eq == std::string_view::npos || eq == 0) {
        throw UsageError(ErrorCode::ConfigParseError, fmt::format("expected key=value, got '{}'", pair));
    }
    const std::string_view key = pair.substr(0, eq);
    const std::string_view value = pair.substr(eq + 1);

    if (key == "seed") {
        config.seed = ParseNumber<uint32_t>(key, value, 0);
    } else if (key == "max_tests") {
        config.maxTests = ParseNumber<int32_t>(key, value, 0);
    } else if (key == "start_size") {
        config.startSize = ParseNumber<int32_t>(key, value, std::numeric_limits<int32_t>::min());
    } else if (key == "end_size") {
        config.endSize = ParseNumber<int32_t>(key, value, std::numeric_limits<int32_t>::min());
    } else {
        throw UsageError(ErrorCode::ConfigParseError, fmt::format("unknown parameter '{}'", key));
    }
}

}  // namespace

Config ParseConfig(std::string_view params, Config base) {
    size_t pos = 0;
    while (pos < params.size()) {
        while (pos < params.size() && IsSpace(params[pos])) {
            ++pos;
        }
        size_t end = pos;
        while (end < params.size() && !IsSpace(params[end])) {
            ++end;
        }
        if (end > pos) {
            ApplyPair(base, params.substr(pos, end - pos));
        }
        pos = end;
    }
    return base;
}

Config Config::FromEnvironment(Config base) {
    const char* params = std::getenv(kParamsEnvVar);
    if (params == nullptr) {
        return base;
    }
    return ParseConfig(params, std::move(base));
}

Config Config::FromEnvironment() {
    return FromEnvironment(Config{});
}

}  // namespace propcheck
