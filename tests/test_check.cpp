/**
 * @file test_check.cpp
 * @brief Unit tests for the trial loop and shrink-search
 * @brief 试验循环与收缩搜索的单元测试
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#include <gtest/gtest.h>

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <propcheck/check.hpp>
#include <propcheck/primitives.hpp>
#include <propcheck/sink.hpp>

namespace propcheck {
namespace test {

namespace {

constexpr uint32_t kScenarioSeed = 1873066016;

/// Config writing every line to @p sink
Config Recording(const std::shared_ptr<MemorySink>& sink, uint32_t seed) {
    Config config;
    config.seed = seed;
    config.reporter = std::make_shared<SinkReporter>(sink);
    return config;
}

/// Arbitrary returning the size it was asked for
ArbitraryPtr<int32_t> Sizes() {
    return Create<int32_t>([](Random&, int32_t size) { return size; });
}

std::vector<std::string> ScenarioTrials() {
    return {"0: 0",  "1: 0",   "2: 2",  "3: 1",    "4: 0",  "5: 4",    "6: 6",    "7: 5",  "8: 2",   "9: 0",
            "10: -7", "11: 0", "12: -11", "13: -4", "14: 2", "15: -14", "16: -15", "17: 7", "18: -11", "19: 18"};
}

std::vector<std::string> ScenarioShrinks() {
    return {"shrink[0]: 18 => 17", "shrink[1]: 18 => 9",  "shrink[1]: 17 => 16", "shrink[2]: 17 => 8",
            "shrink[2]: 16 => 15", "shrink[3]: 16 => 8",  "shrink[3]: 15 => 14", "shrink[4]: 15 => 7",
            "shrink[4]: 14 => 13", "shrink[5]: 14 => 7",  "shrink[5]: 13 => 12", "shrink[6]: 13 => 6",
            "shrink[6]: 12 => 11", "shrink[7]: 12 => 6",  "shrink[7]: 11 => 10"};
}

}  // namespace

// ==============================================================================
// Scenario Tests / 场景测试
// ==============================================================================

/**
 * @brief Test the full transcript of a throwing predicate on Int32()
 * @brief 测试 Int32() 上抛异常谓词的完整记录
 */
TEST(CheckTest, ThrowingPredicateTranscript) {
    auto sink = std::make_shared<MemorySink>();
    const auto result = Check(Int32(),
                              [](int32_t x) {
                                  if (x > 10) {
                                      throw std::runtime_error("too big");
                                  }
                              },
                              Recording(sink, kScenarioSeed));

    std::vector<std::string> expected = ScenarioTrials();
    for (const auto& line : ScenarioShrinks()) {
        expected.push_back(line);
    }
    expected.push_back("Falsifiable, after 20 tests (7 shrink) (seed: 1873066016):");
    expected.push_back("Original: 18");
    expected.push_back("Shrunk: 11");
    expected.push_back("with exception: too big");
    EXPECT_EQ(sink->Lines(), expected);

    EXPECT_EQ(result.report.kind, OutcomeKind::Exception);
    EXPECT_EQ(result.report.testCount, 20);
    EXPECT_EQ(result.report.shrinkCount, 7);
    EXPECT_EQ(result.report.seed, kScenarioSeed);
    EXPECT_EQ(result.report.originalFail, "18");
    EXPECT_EQ(result.report.minFail, "11");
    EXPECT_EQ(result.report.errorMessage, "too big");
    ASSERT_TRUE(result.originalFail.has_value());
    ASSERT_TRUE(result.minFail.has_value());
    EXPECT_EQ(*result.originalFail, 18);
    EXPECT_EQ(*result.minFail, 11);
    ASSERT_TRUE(result.error != nullptr);
    EXPECT_THROW(std::rethrow_exception(result.error), std::runtime_error);
}

/**
 * @brief Test a bool predicate reaches the same minimum as a failure
 * @brief 测试 bool 谓词以失败形式得到相同的最小值
 */
TEST(CheckTest, BoolPredicateSameMinimum) {
    auto sink = std::make_shared<MemorySink>();
    const auto result = Check(Int32(), [](int32_t x) { return x <= 10; }, Recording(sink, kScenarioSeed));

    EXPECT_EQ(result.report.kind, OutcomeKind::Failure);
    EXPECT_EQ(result.report.testCount, 20);
    EXPECT_EQ(result.report.shrinkCount, 7);
    EXPECT_EQ(*result.minFail, 11);
    EXPECT_TRUE(result.error == nullptr);
    ASSERT_FALSE(sink->Lines().empty());
    EXPECT_EQ(sink->Lines().back(), "Shrunk: 11");
}

/**
 * @brief Test a restart after a passing candidate
 * @brief 测试候选值通过后的重新开始
 */
TEST(CheckTest, RestartFromLatestMinimum) {
    auto sink = std::make_shared<MemorySink>();
    const auto result = Check(Int32(), [](int32_t x) { return std::abs(x) < 5; }, Recording(sink, 7));

    EXPECT_EQ(result.report.testCount, 12);
    EXPECT_EQ(result.report.shrinkCount, 2);
    EXPECT_EQ(*result.originalFail, -10);
    EXPECT_EQ(*result.minFail, -5);

    const std::vector<std::string> shrinks = {"shrink[0]: -10 => -9", "shrink[1]: -10 => -5",
                                              "shrink[2]: -10 => 0", "shrink[2]: -5 => -4"};
    const std::vector<std::string> lines = sink->Lines();
    ASSERT_EQ(lines.size(), 12u + shrinks.size() + 3u);
    EXPECT_EQ(std::vector<std::string>(lines.begin() + 12, lines.begin() + 16), shrinks);
}

/**
 * @brief Test an always-failing predicate ends on the last candidate, zero
 * @brief 测试恒失败谓词止于最后一个候选值 0
 */
TEST(CheckTest, AlwaysFailingEndsAtZero) {
    Config config;
    config.seed = 5;
    config.startSize = 50;
    config.reporter = std::make_shared<SinkReporter>(std::make_shared<MemorySink>());
    const auto result = Check(Int32(), [](int32_t) { return false; }, config);
    EXPECT_EQ(result.report.testCount, 1);
    EXPECT_EQ(*result.minFail, 0);
}

// ==============================================================================
// Success Tests / 成功测试
// ==============================================================================

/**
 * @brief Shrink-search ends at a local minimum for sampled thresholds
 * @brief 对采样的阈值，收缩搜索停在局部最小值
 *
 * For |x| <= k the minimum is k + 1 in magnitude and its first shrink candidate
 * already passes.
 */
TEST(CheckTest, ShrinkSearchReachesFixedPoint) {
    SampleOptions options;
    options.count = 25;
    options.seed = 31;
    const auto thresholds = Sample(Elements({0, 1, 2, 3, 5, 8, 13, 20}), options);
    uint32_t seed = 100;
    for (const int32_t k : thresholds) {
        auto holds = [k](int32_t x) { return std::abs(x) <= k; };
        auto sink = std::make_shared<MemorySink>();
        const auto result = Check(*Int32(), holds, Recording(sink, seed++));
        ASSERT_FALSE(result.IsSuccess()) << "k = " << k;
        ASSERT_TRUE(result.minFail.has_value());
        const int32_t minFail = *result.minFail;
        EXPECT_EQ(std::abs(minFail), k + 1) << "k = " << k;

        const auto first = Int32()->Shrink(minFail).Next();
        ASSERT_TRUE(first.has_value());
        EXPECT_TRUE(holds(*first)) << "k = " << k;
    }
}

TEST(CheckTest, SuccessReport) {
    auto sink = std::make_shared<MemorySink>();
    Config config = Recording(sink, 3);
    config.reporter = std::make_shared<SinkReporter>(sink, Level::Info);
    const auto result = Check(Int32(), [](int32_t x) { return x == x; }, config);

    EXPECT_TRUE(result.IsSuccess());
    EXPECT_EQ(result.report.testCount, 100);
    EXPECT_FALSE(result.minFail.has_value());
    EXPECT_EQ(sink->Lines(), std::vector<std::string>({"Ok passed 100 tests."}));
}

/**
 * @brief Test labels of successful outcomes are counted
 * @brief 测试成功结果的标签被计数
 */
TEST(CheckTest, LabelsAreCounted) {
    auto sink = std::make_shared<MemorySink>();
    Config config = Recording(sink, 3);
    config.maxTests = 10;
    config.endSize = 10;
    config.reporter = std::make_shared<SinkReporter>(sink, Level::Info);
    const auto result = Check(Sizes(), [](int32_t size) {
        Labels labels = {"always"};
        if (size % 2 == 0) {
            labels.insert("even");
        }
        return Outcome::Success({}, labels);
    }, config);

    EXPECT_EQ(result.report.labelCounts.at("always"), 10);
    EXPECT_EQ(result.report.labelCounts.at("even"), 5);
    EXPECT_EQ(sink->Lines(), std::vector<std::string>({"Ok passed 10 tests.", "100% always", "50% even"}));
}

TEST(CheckTest, ZeroTestsIsImmediateSuccess) {
    Config config;
    config.seed = 1;
    config.maxTests = 0;
    const auto result = Check(Int32(), [](int32_t) { return false; }, config);
    EXPECT_TRUE(result.IsSuccess());
    EXPECT_EQ(result.report.testCount, 0);
}

TEST(CheckTest, NegativeTestsThrows) {
    Config config;
    config.maxTests = -1;
    try {
        Check(Int32(), [](int32_t) { return true; }, config);
        FAIL() << "expected UsageError";
    } catch (const UsageError& e) {
        EXPECT_EQ(e.Code(), ErrorCode::InvalidArgument);
    }
}

// ==============================================================================
// Size Schedule Tests / 规模调度测试
// ==============================================================================

namespace {

std::vector<int32_t> ObservedSizes(int32_t maxTests, int32_t startSize, int32_t endSize) {
    std::vector<int32_t> sizes;
    Config config;
    config.seed = 1;
    config.maxTests = maxTests;
    config.startSize = startSize;
    config.endSize = endSize;
    Check(Sizes(), [&sizes](int32_t size) { sizes.push_back(size); }, config);
    return sizes;
}

}  // namespace

/**
 * @brief Test sizes grow from startSize to endSize and never decrease
 * @brief 测试规模从 startSize 增长到 endSize 且不减小
 */
TEST(CheckTest, SizeScheduleNonDecreasing) {
    const auto sizes = ObservedSizes(100, 1, 100);
    ASSERT_EQ(sizes.size(), 100u);
    for (size_t i = 1; i < sizes.size(); ++i) {
        EXPECT_LE(sizes[i - 1], sizes[i]);
    }
    EXPECT_EQ(sizes.front(), 1);
    EXPECT_EQ(sizes.back(), 100);
}

TEST(CheckTest, SizeScheduleClamping) {
    EXPECT_EQ(ObservedSizes(4, 0, 10), std::vector<int32_t>({3, 5, 7, 10}));
    EXPECT_EQ(ObservedSizes(3, 5, 2), std::vector<int32_t>({5, 5, 5}));
}

TEST(CheckTest, ComputeSize) {
    EXPECT_EQ(internal::ComputeSize(0, 100, 1, 100), 1);
    EXPECT_EQ(internal::ComputeSize(49, 100, 1, 100), 50);
    EXPECT_EQ(internal::ComputeSize(99, 100, 1, 100), 100);
}

// ==============================================================================
// Classification Tests / 分类测试
// ==============================================================================

TEST(CheckTest, OutcomeFailureIsUsedVerbatim) {
    Config config;
    config.seed = kScenarioSeed;
    config.reporter = std::make_shared<SinkReporter>(std::make_shared<MemorySink>());
    const auto result = Check(Int32(), [](int32_t x) {
        return x > 10 ? Outcome::Failure(std::to_string(x)) : Outcome::Success();
    }, config);
    EXPECT_EQ(result.report.kind, OutcomeKind::Failure);
    EXPECT_EQ(*result.minFail, 11);
}

/**
 * @brief Test non-std exceptions are classified, not swallowed
 * @brief 测试非 std 异常被分类而不是被吞掉
 */
TEST(CheckTest, NonStandardException) {
    auto sink = std::make_shared<MemorySink>();
    const auto result = Check(Int32(),
                              [](int32_t x) {
                                  if (x > 10) {
                                      throw 42;
                                  }
                                  return true;
                              },
                              Recording(sink, kScenarioSeed));
    EXPECT_EQ(result.report.kind, OutcomeKind::Exception);
    EXPECT_EQ(result.report.errorMessage, "unknown exception");
    EXPECT_EQ(sink->Lines().back(), "with exception: unknown exception");
    EXPECT_THROW(std::rethrow_exception(result.error), int);
}

TEST(CheckTest, GeneratorErrorsPropagate) {
    auto broken = Create<int32_t>([](Random& random, int32_t) { return static_cast<int32_t>(random.Range(1, 0)); });
    Config config;
    config.seed = 1;
    EXPECT_THROW(Check(broken, [](int32_t) { return true; }, config), UsageError);
}

/**
 * @brief Test the default reporter throws TestFailureError carrying the report
 * @brief 测试默认报告器抛出携带报告的 TestFailureError
 */
TEST(CheckTest, DefaultReporterThrows) {
    Config config;
    config.seed = kScenarioSeed;
    try {
        Check(Int32(), [](int32_t x) { return x <= 10; }, config);
        FAIL() << "expected TestFailureError";
    } catch (const TestFailureError& e) {
        EXPECT_EQ(e.Report().testCount, 20);
        EXPECT_EQ(std::string(e.what()),
                  "Falsifiable, after 20 tests (7 shrink) (seed: 1873066016):\nOriginal: 18\nShrunk: 11");
    }
}

TEST(CheckTest, CustomShow) {
    auto sink = std::make_shared<MemorySink>();
    const Show<int32_t> show = [](const int32_t& x) { return "#" + std::to_string(x); };
    Check(*Int32(), show, [](int32_t x) { return x <= 10; }, Recording(sink, kScenarioSeed));
    EXPECT_EQ(sink->Lines().front(), "0: #0");
    EXPECT_EQ(sink->Lines().back(), "Shrunk: #11");
}

}  // namespace test
}  // namespace propcheck
