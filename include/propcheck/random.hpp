/**
 * @file random.hpp
 * @brief Deterministic pseudo-random source for propcheck
 * @brief propcheck 确定性伪随机数源
 *
 * Random is a xorshift128 generator. The same seed always produces the same
 * infinite sequence, which is what makes a failing run reproducible from the
 * seed printed in its report.
 *
 * Random 是 xorshift128 生成器。相同的种子总是产生相同的无限序列，
 * 因此可以用报告中打印的种子重现失败的运行。
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#pragma once

#include <cstdint>

namespace propcheck {

/**
 * @brief Current wall clock in milliseconds, truncated to 32 bits
 * @brief 当前时钟毫秒数，截断为 32 位
 *
 * Only used as a default argument. Regression suites should always pass a seed.
 * 仅用作默认参数。回归测试应始终传入种子。
 */
uint32_t SeedOfNow() noexcept;

/**
 * @brief Xorshift128 random source
 * @brief Xorshift128 随机数源
 *
 * Owned by exactly one run; not thread-safe.
 * 仅由一次运行独占；非线程安全。
 */
class Random {
public:
    explicit Random(uint32_t seed = SeedOfNow()) noexcept;

    /**
     * @brief Next 32-bit word of the sequence
     * @brief 序列中的下一个 32 位字
     */
    uint32_t NextUInt32() noexcept;

    /**
     * @brief Uniform real in [0, 1)
     * @brief [0, 1) 内的均匀实数
     */
    double Next() noexcept;

    /**
     * @brief Uniform real in [min, max)
     * @brief [min, max) 内的均匀实数
     *
     * @throws UsageError (InvalidRange) when max < min
     */
    double Range(double min, double max);

    uint32_t Seed() const noexcept { return m_seed; }

private:
    uint32_t m_seed;
    uint32_t m_x;
    uint32_t m_y;
    uint32_t m_z;
    uint32_t m_w;
};

}  // namespace propcheck
