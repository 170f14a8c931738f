/**
 * @file random.cpp
 * @brief Random implementation
 * @brief Random 实现
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#include "propcheck/random.hpp"

#include <algorithm>
#include <chrono>

#include <fmt/format.h>

#include "propcheck/common.hpp"

namespace propcheck {

namespace {

constexpr double kTwoPow32 = 4294967296.0;

}  // namespace

uint32_t SeedOfNow() noexcept {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
    return static_cast<uint32_t>(static_cast<uint64_t>(millis));
}

Random::Random(uint32_t seed) noexcept
    : m_seed(seed), m_x(123456789u), m_y(362436069u), m_z(521288629u), m_w(seed) {}

uint32_t Random::NextUInt32() noexcept {
    const uint32_t t = m_x ^ (m_x << 11);
    m_x = m_y;
    m_y = m_z;
    m_z = m_w;
    m_w = (m_w ^ (m_w >> 19)) ^ (t ^ (t >> 8));
    return m_w;
}

double Random::Next() noexcept {
    return static_cast<double>(NextUInt32()) / kTwoPow32;
}

double Random::Range(double min, double max) {
    if (max < min) {
        throw UsageError(ErrorCode::InvalidRange,
                         fmt::format("min ({}) must not exceed max ({})", min, max));
    }
    const double lo = std::min(min, max);
    const double hi = std::max(min, max);
    return lo + Next() * (hi - lo);
}

}  // namespace propcheck
