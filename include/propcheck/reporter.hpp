/**
 * @file reporter.hpp
 * @brief Progress and result reporting for property runs
 * @brief 属性测试运行的进度与结果报告
 *
 * A Reporter observes a run: every trial, every shrink candidate and the final
 * report. SinkReporter renders those events as text lines; ThrowOnFailureReporter
 * turns a failing report into a TestFailureError.
 *
 * Reporter 观察一次运行：每次试验、每个收缩候选值和最终报告。
 * SinkReporter 将事件渲染为文本行；ThrowOnFailureReporter 将失败报告转换为 TestFailureError。
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "propcheck/common.hpp"
#include "propcheck/outcome.hpp"
#include "propcheck/sink.hpp"

namespace propcheck {

// ==============================================================================
// Reporter Interface / 报告器接口
// ==============================================================================

class Reporter {
public:
    virtual ~Reporter() = default;

    /// Called after each trial value is drawn, before it is evaluated
    virtual void OnTest(int32_t index, const std::string& value) = 0;

    /// Called before each shrink candidate is evaluated
    virtual void OnShrink(int32_t shrinkCount, const std::string& maxFail, const std::string& value) = 0;

    /// Called once per run with the final report, on success and on failure
    virtual void OnFinish(const TestReport& report) = 0;
};

// ==============================================================================
// Report Formatting / 报告格式化
// ==============================================================================

/**
 * @brief Summary lines of a finished run
 * @brief 已结束运行的摘要行
 *
 * Success: "Ok passed N tests." followed by one "P% label" line per label.
 * Failure: "Falsifiable, after N tests (K shrink) (seed: S):", "Original: ...",
 * "Shrunk: ..." and, for exceptions, "with exception: ...".
 */
std::vector<std::string> FormatReportLines(const TestReport& report);

/// Level used for the summary lines of @p report / 摘要行使用的级别
inline Level ReportLevel(const TestReport& report) noexcept {
    return report.IsSuccess() ? Level::Info : Level::Error;
}

// ==============================================================================
// SinkReporter / Sink 报告器
// ==============================================================================

/**
 * @brief Writes every event as a line through a Sink
 * @brief 将每个事件作为一行写入 Sink
 *
 * Trials and shrinks are written at Debug, summaries at Info (success) or
 * Error (failure). Lines below @p minLevel are dropped.
 */
class SinkReporter : public Reporter {
public:
    explicit SinkReporter(std::shared_ptr<Sink> sink, Level minLevel = Level::Trace);

    void OnTest(int32_t index, const std::string& value) override;
    void OnShrink(int32_t shrinkCount, const std::string& maxFail, const std::string& value) override;
    void OnFinish(const TestReport& report) override;

    Level GetLevel() const { return m_minLevel; }
    void SetLevel(Level level) { m_minLevel = level; }
    const std::shared_ptr<Sink>& GetSink() const { return m_sink; }

private:
    void Emit(Level level, const std::string& line);

    std::shared_ptr<Sink> m_sink;
    Level m_minLevel;
};

// ==============================================================================
// ThrowOnFailureReporter / 失败抛出报告器
// ==============================================================================

/**
 * @brief Exception thrown by ThrowOnFailureReporter for a failing run
 * @brief ThrowOnFailureReporter 在运行失败时抛出的异常
 */
class TestFailureError : public std::runtime_error {
public:
    explicit TestFailureError(TestReport report);

    const TestReport& Report() const noexcept { return m_report; }

private:
    TestReport m_report;
};

/**
 * @brief Silent while running; throws TestFailureError on a failing report
 * @brief 运行期间静默；失败报告时抛出 TestFailureError
 */
class ThrowOnFailureReporter : public Reporter {
public:
    void OnTest(int32_t, const std::string&) override {}
    void OnShrink(int32_t, const std::string&, const std::string&) override {}
    void OnFinish(const TestReport& report) override;
};

/**
 * @brief Reporter used when a Config carries none (a ThrowOnFailureReporter)
 * @brief Config 未指定报告器时使用的报告器（ThrowOnFailureReporter）
 */
std::shared_ptr<Reporter> DefaultReporter();

/**
 * @brief SinkReporter writing to the console
 * @brief 写入控制台的 SinkReporter
 */
std::shared_ptr<Reporter> ConsoleReporter(Level minLevel = Level::Trace,
                                          ConsoleSink::Output output = ConsoleSink::Output::StdOut);

}  // namespace propcheck
