/**
 * @file gtest.hpp
 * @brief GoogleTest integration
 * @brief GoogleTest 集成
 *
 * Holds() runs a property check and returns a ::testing::AssertionResult whose
 * failure message is the run's report, so it can be used with EXPECT_TRUE and
 * ASSERT_TRUE. Unless a Config is passed, the configuration is taken from the
 * PROPCHECK_PARAMS environment variable, e.g. PROPCHECK_PARAMS="seed=42".
 *
 * Holds() 运行属性检查并返回 ::testing::AssertionResult，失败消息即运行报告，
 * 可与 EXPECT_TRUE、ASSERT_TRUE 一起使用。未传入 Config 时从 PROPCHECK_PARAMS 环境变量读取配置。
 *
 * @section usage Basic Usage / 基本用法
 * @code
 * TEST(Reverse, IsInvolution) {
 *     PROPCHECK_EXPECT_HOLDS(propcheck::FromArbitrary(propcheck::Int32()).Array(),
 *                            [](std::vector<int32_t> xs) {
 *                                auto ys = xs;
 *                                std::reverse(ys.begin(), ys.end());
 *                                std::reverse(ys.begin(), ys.end());
 *                                return xs == ys;
 *                            });
 * }
 * @endcode
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#pragma once

#include <memory>
#include <utility>

#include <gtest/gtest.h>

#include "propcheck/check.hpp"
#include "propcheck/checker.hpp"
#include "propcheck/config.hpp"
#include "propcheck/reporter.hpp"
#include "propcheck/sink.hpp"

namespace propcheck {

/**
 * @brief Run a check and turn its report into an AssertionResult
 * @brief 运行检查并将报告转换为 AssertionResult
 *
 * The reporter of @p config is replaced by one collecting the summary lines.
 * @p config 中的报告器会被替换为收集摘要行的报告器。
 */
template <typename T, typename Predicate>
::testing::AssertionResult Holds(const Arbitrary<T>& arbitrary, const Show<T>& show, Predicate&& predicate,
                                 Config config = Config::FromEnvironment()) {
    auto sink = std::make_shared<MemorySink>();
    config.reporter = std::make_shared<SinkReporter>(sink, Level::Info);
    const TestResult<T> result = Check(arbitrary, show, std::forward<Predicate>(predicate), config);
    if (result.IsSuccess()) {
        return ::testing::AssertionSuccess() << sink->Joined();
    }
    return ::testing::AssertionFailure() << sink->Joined();
}

template <typename T, typename Predicate>
::testing::AssertionResult Holds(const Checker<T>& checker, Predicate&& predicate,
                                 Config config = Config::FromEnvironment()) {
    return Holds(*checker.GetArbitrary(), checker.GetShow(), std::forward<Predicate>(predicate), std::move(config));
}

template <typename T, typename Predicate>
::testing::AssertionResult Holds(const ArbitraryPtr<T>& arbitrary, Predicate&& predicate,
                                 Config config = Config::FromEnvironment()) {
    return Holds(FromArbitrary(arbitrary), std::forward<Predicate>(predicate), std::move(config));
}

}  // namespace propcheck

/// EXPECT_TRUE(propcheck::Holds(...)) / 属性成立的非致命断言
#define PROPCHECK_EXPECT_HOLDS(...) EXPECT_TRUE(::propcheck::Holds(__VA_ARGS__))

/// ASSERT_TRUE(propcheck::Holds(...)) / 属性成立的致命断言
#define PROPCHECK_ASSERT_HOLDS(...) ASSERT_TRUE(::propcheck::Holds(__VA_ARGS__))
