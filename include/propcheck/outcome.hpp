/**
 * @file outcome.hpp
 * @brief Per-evaluation outcomes and per-run reports
 * @brief 单次求值结果与单次运行报告
 *
 * - Outcome: result of evaluating the predicate once (Success, Failure, Exception)
 * - TestReport: rendered, non-template summary of a run, handed to reporters
 * - TestResult<T>: TestReport plus the typed failing values, returned by Check()
 *
 * - Outcome：谓词单次求值的结果
 * - TestReport：一次运行的渲染后摘要（非模板），传给报告器
 * - TestResult<T>：TestReport 加上带类型的失败值，由 Check() 返回
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#pragma once

#include <cstdint>
#include <exception>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace propcheck {

/**
 * @brief Kind of an outcome or report
 * @brief 结果或报告的种类
 */
enum class OutcomeKind : uint8_t {
    Success = 0,    ///< Predicate held / 谓词成立
    Failure = 1,    ///< Predicate returned false / 谓词返回 false
    Exception = 2   ///< Predicate threw / 谓词抛出异常
};

constexpr std::string_view OutcomeKindToString(OutcomeKind kind) noexcept {
    switch (kind) {
        case OutcomeKind::Success:
            return "Success";
        case OutcomeKind::Failure:
            return "Failure";
        case OutcomeKind::Exception:
            return "Exception";
        default:
            return "Unknown";
    }
}

using Labels = std::set<std::string>;

// ==============================================================================
// Outcome / 单次结果
// ==============================================================================

/**
 * @brief Result of one predicate evaluation
 * @brief 一次谓词求值的结果
 *
 * A predicate may return an Outcome directly to attach labels or to signal
 * failure without throwing.
 * 谓词可以直接返回 Outcome，用于附加标签或在不抛异常的情况下表示失败。
 */
class Outcome {
public:
    static Outcome Success(std::string value = {}, std::optional<Labels> labels = std::nullopt) {
        return Outcome(OutcomeKind::Success, std::move(value), std::move(labels), nullptr, {});
    }

    static Outcome Failure(std::string value = {}, std::optional<Labels> labels = std::nullopt) {
        return Outcome(OutcomeKind::Failure, std::move(value), std::move(labels), nullptr, {});
    }

    static Outcome Exception(std::exception_ptr error, std::string errorMessage, std::string value = {},
                             std::optional<Labels> labels = std::nullopt) {
        return Outcome(OutcomeKind::Exception, std::move(value), std::move(labels), std::move(error),
                       std::move(errorMessage));
    }

    OutcomeKind Kind() const noexcept { return m_kind; }
    bool IsSuccess() const noexcept { return m_kind == OutcomeKind::Success; }

    /// Rendered value that was evaluated / 被求值的值的渲染结果
    const std::string& Value() const noexcept { return m_value; }
    const std::optional<Labels>& GetLabels() const noexcept { return m_labels; }
    std::exception_ptr Error() const noexcept { return m_error; }
    const std::string& ErrorMessage() const noexcept { return m_errorMessage; }

private:
    Outcome(OutcomeKind kind, std::string value, std::optional<Labels> labels, std::exception_ptr error,
            std::string errorMessage)
        : m_kind(kind),
          m_value(std::move(value)),
          m_labels(std::move(labels)),
          m_error(std::move(error)),
          m_errorMessage(std::move(errorMessage)) {}

    OutcomeKind m_kind;
    std::string m_value;
    std::optional<Labels> m_labels;
    std::exception_ptr m_error;
    std::string m_errorMessage;
};

// ==============================================================================
// TestReport / 测试报告
// ==============================================================================

/**
 * @brief Rendered summary of a finished run
 * @brief 已结束运行的渲染摘要
 *
 * For a success only kind, seed, testCount and labelCounts are meaningful.
 * 成功时只有 kind、seed、testCount 和 labelCounts 有意义。
 */
struct TestReport {
    OutcomeKind kind = OutcomeKind::Success;
    uint32_t seed = 0;
    int32_t testCount = 0;
    int32_t shrinkCount = 0;
    std::string originalFail;
    std::string minFail;
    std::string errorMessage;
    std::map<std::string, int32_t> labelCounts;

    bool IsSuccess() const noexcept { return kind == OutcomeKind::Success; }
};

/**
 * @brief TestReport plus the typed values of a failing run
 * @brief TestReport 加上失败运行的带类型值
 */
template <typename T>
struct TestResult {
    TestReport report;
    std::optional<T> originalFail;
    std::optional<T> minFail;
    std::exception_ptr error;

    bool IsSuccess() const noexcept { return report.IsSuccess(); }
};

}  // namespace propcheck
