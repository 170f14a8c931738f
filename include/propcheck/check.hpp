/**
 * @file check.hpp
 * @brief Trial loop and shrink-search
 * @brief 试验循环与收缩搜索
 *
 * Check() draws values of growing size, evaluates the predicate on each and, on
 * the first failure, hill-climbs through the arbitrary's shrink candidates to a
 * locally minimal counterexample. The run's outcome is handed to the reporter
 * and returned as a TestResult.
 *
 * Check() 以逐渐增长的规模生成值并对每个值求值谓词；首次失败时，沿 Arbitrary
 * 的收缩候选值爬山，找到局部最小反例。运行结果交给报告器并作为 TestResult 返回。
 *
 * @section usage Basic Usage / 基本用法
 * @code
 * propcheck::Config config;
 * config.seed = 42;
 * auto result = propcheck::Check(*propcheck::Int32(), [](int32_t x) { return x * 0 == 0; }, config);
 * @endcode
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "propcheck/arbitrary.hpp"
#include "propcheck/config.hpp"
#include "propcheck/internal/evaluate.hpp"
#include "propcheck/outcome.hpp"
#include "propcheck/random.hpp"
#include "propcheck/reporter.hpp"
#include "propcheck/show.hpp"

namespace propcheck {

namespace internal {

/**
 * @brief Local-minimum search starting from a failing value
 * @brief 从失败值开始的局部最小搜索
 *
 * Candidates of the current maximum failing value are tried in order. A failing
 * candidate becomes the new minimum. A passing candidate ends the search if no
 * candidate of this pass failed yet, otherwise the search restarts from the
 * latest minimum. An exhausted candidate sequence also ends the search.
 *
 * 按顺序尝试当前最大失败值的候选值。失败的候选值成为新的最小值。
 * 若本轮尚无失败，通过的候选值结束搜索，否则从最新的最小值重新开始。
 * 候选序列耗尽时同样结束搜索。
 */
template <typename T, typename Predicate>
TestResult<T> FindLocalMinFail(const Arbitrary<T>& arbitrary, const Show<T>& show, Predicate& predicate,
                               T originalFail, Outcome originalOutcome, Reporter& reporter) {
    T maxFail = originalFail;
    T minFail = originalFail;
    Outcome minOutcome = std::move(originalOutcome);
    int32_t failCount = 0;
    int32_t shrinkCount = 0;

    bool searching = true;
    while (searching) {
        searching = false;
        Stream<T> candidates = arbitrary.Shrink(maxFail);
        const std::string maxRendered = show(maxFail);
        while (std::optional<T> candidate = candidates.Next()) {
            const std::string rendered = show(*candidate);
            reporter.OnShrink(shrinkCount, maxRendered, rendered);
            Outcome outcome = Evaluate(predicate, *candidate, rendered);
            if (outcome.IsSuccess()) {
                if (failCount > 0) {
                    maxFail = minFail;
                    failCount = 0;
                    searching = true;
                }
                break;
            }
            ++failCount;
            ++shrinkCount;
            minFail = std::move(*candidate);
            minOutcome = std::move(outcome);
        }
    }

    TestResult<T> result;
    result.report.kind = minOutcome.Kind();
    result.report.shrinkCount = shrinkCount;
    result.report.originalFail = show(originalFail);
    result.report.minFail = show(minFail);
    result.report.errorMessage = minOutcome.ErrorMessage();
    result.originalFail = std::move(originalFail);
    result.minFail = std::move(minFail);
    result.error = minOutcome.Error();
    return result;
}

}  // namespace internal

/**
 * @brief Run a property check
 * @brief 运行属性检查
 *
 * @param arbitrary Source of trial values / 试验值来源
 * @param show Renders values for the reporter / 为报告器渲染值
 * @param predicate Callable taking const T& (see internal::Evaluate) / 接受 const T& 的可调用对象
 * @param config Seed, trial count, size range and reporter / 种子、试验次数、规模范围和报告器
 *
 * @throws UsageError(InvalidArgument) if config.maxTests is negative
 * @note Exceptions from the arbitrary or the reporter propagate; with the default
 *       reporter a failing run throws TestFailureError.
 */
template <typename T, typename Predicate>
TestResult<T> Check(const Arbitrary<T>& arbitrary, const Show<T>& show, Predicate&& predicate,
                    const Config& config = {}) {
    if (config.maxTests < 0) {
        throw UsageError(ErrorCode::InvalidArgument, "maxTests must not be negative");
    }
    const std::shared_ptr<Reporter> reporter = config.reporter ? config.reporter : DefaultReporter();
    Random random(config.seed ? *config.seed : SeedOfNow());
    const int32_t minSize = std::max(1, config.startSize);
    const int32_t maxSize = std::max(config.endSize, minSize);

    std::map<std::string, int32_t> labelCounts;
    for (int32_t i = 0; i < config.maxTests; ++i) {
        const int32_t size = internal::ComputeSize(i, config.maxTests, minSize, maxSize);
        T value = arbitrary.Generate(random, size);
        const std::string rendered = show(value);
        reporter->OnTest(i, rendered);

        Outcome outcome = internal::Evaluate(predicate, value, rendered);
        if (outcome.IsSuccess()) {
            if (outcome.GetLabels()) {
                for (const auto& label : *outcome.GetLabels()) {
                    ++labelCounts[label];
                }
            }
            continue;
        }

        TestResult<T> result =
            internal::FindLocalMinFail(arbitrary, show, predicate, std::move(value), std::move(outcome), *reporter);
        result.report.seed = random.Seed();
        result.report.testCount = i + 1;
        reporter->OnFinish(result.report);
        return result;
    }

    TestResult<T> result;
    result.report.kind = OutcomeKind::Success;
    result.report.seed = random.Seed();
    result.report.testCount = config.maxTests;
    result.report.labelCounts = std::move(labelCounts);
    reporter->OnFinish(result.report);
    return result;
}

/// Check() rendering values with Stringify / 使用 Stringify 渲染值的 Check()
template <typename T, typename Predicate>
TestResult<T> Check(const Arbitrary<T>& arbitrary, Predicate&& predicate, const Config& config = {}) {
    return Check(arbitrary, Show<T>([](const T& value) { return Stringify(value); }),
                 std::forward<Predicate>(predicate), config);
}

template <typename T, typename Predicate>
TestResult<T> Check(const ArbitraryPtr<T>& arbitrary, const Show<T>& show, Predicate&& predicate,
                    const Config& config = {}) {
    return Check(*arbitrary, show, std::forward<Predicate>(predicate), config);
}

template <typename T, typename Predicate>
TestResult<T> Check(const ArbitraryPtr<T>& arbitrary, Predicate&& predicate, const Config& config = {}) {
    return Check(*arbitrary, std::forward<Predicate>(predicate), config);
}

}  // namespace propcheck
