/**
 * @file reporter.cpp
 * @brief Progress and result reporting implementation
 * @brief 进度与结果报告实现
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#include "propcheck/reporter.hpp"

#include <cstdint>

#include <fmt/format.h>

namespace propcheck {

namespace {

std::string JoinLines(const std::vector<std::string>& lines) {
    std::string result;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            result += '\n';
        }
        result += lines[i];
    }
    return result;
}

}  // namespace

std::vector<std::string> FormatReportLines(const TestReport& report) {
    std::vector<std::string> lines;
    if (report.IsSuccess()) {
        lines.push_back(fmt::format("Ok passed {} tests.", report.testCount));
        for (const auto& [label, count] : report.labelCounts) {
            const int64_t percent =
                report.testCount > 0 ? static_cast<int64_t>(count) * 100 / report.testCount : 0;
            lines.push_back(fmt::format("{}% {}", percent, label));
        }
        return lines;
    }

    lines.push_back(fmt::format("Falsifiable, after {} tests ({} shrink) (seed: {}):", report.testCount,
                                report.shrinkCount, report.seed));
    lines.push_back(fmt::format("Original: {}", report.originalFail));
    lines.push_back(fmt::format("Shrunk: {}", report.minFail));
    if (report.kind == OutcomeKind::Exception) {
        lines.push_back(fmt::format("with exception: {}", report.errorMessage));
    }
    return lines;
}

// ==============================================================================
// SinkReporter Implementation / SinkReporter 实现
// ==============================================================================

SinkReporter::SinkReporter(std::shared_ptr<Sink> sink, Level minLevel)
    : m_sink(std::move(sink)), m_minLevel(minLevel) {
    if (!m_sink) {
        throw UsageError(ErrorCode::InvalidArgument, "SinkReporter requires a sink");
    }
}

void SinkReporter::OnTest(int32_t index, const std::string& value) {
    Emit(Level::Debug, fmt::format("{}: {}", index, value));
}

void SinkReporter::OnShrink(int32_t shrinkCount, const std::string& maxFail, const std::string& value) {
    Emit(Level::Debug, fmt::format("shrink[{}]: {} => {}", shrinkCount, maxFail, value));
}

void SinkReporter::OnFinish(const TestReport& report) {
    const Level level = ReportLevel(report);
    for (const auto& line : FormatReportLines(report)) {
        Emit(level, line);
    }
    m_sink->Flush();
}

void SinkReporter::Emit(Level level, const std::string& line) {
    if (ShouldReport(level, m_minLevel)) {
        m_sink->Write(level, line);
    }
}

// ==============================================================================
// ThrowOnFailureReporter Implementation / ThrowOnFailureReporter 实现
// ==============================================================================

TestFailureError::TestFailureError(TestReport report)
    : std::runtime_error(JoinLines(FormatReportLines(report))), m_report(std::move(report)) {}

void ThrowOnFailureReporter::OnFinish(const TestReport& report) {
    if (!report.IsSuccess()) {
        throw TestFailureError(report);
    }
}

std::shared_ptr<Reporter> DefaultReporter() {
    return std::make_shared<ThrowOnFailureReporter>();
}

std::shared_ptr<Reporter> ConsoleReporter(Level minLevel, ConsoleSink::Output output) {
    return std::make_shared<SinkReporter>(std::make_shared<ConsoleSink>(output), minLevel);
}

}  // namespace propcheck
