/**
 * @file evaluate.hpp
 * @brief Predicate evaluation and size schedule used by the trial loop
 * @brief 试验循环使用的谓词求值与规模调度
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <string>
#include <type_traits>

#include "propcheck/outcome.hpp"

namespace propcheck {
namespace internal {

/**
 * @brief Size for trial @p index of @p maxTests, growing from minSize to maxSize
 * @brief 第 @p index 次试验（共 @p maxTests 次）的规模，从 minSize 增长到 maxSize
 */
int32_t ComputeSize(int32_t index, int32_t maxTests, int32_t minSize, int32_t maxSize);

/**
 * @brief Exception outcome carrying @p error and its what() text
 * @brief 携带 @p error 及其 what() 文本的异常结果
 */
Outcome ExceptionOutcome(std::exception_ptr error, std::string value);

/**
 * @brief Run @p predicate on @p value and classify the result
 * @brief 对 @p value 运行 @p predicate 并对结果分类
 *
 * An Outcome return is taken as is, bool false is a failure, anything else
 * (void, true, other types) is a success. A thrown exception becomes an
 * Exception outcome holding the exception_ptr.
 */
template <typename T, typename Predicate>
Outcome Evaluate(Predicate& predicate, const T& value, const std::string& rendered) {
    using Result = std::invoke_result_t<Predicate&, const T&>;
    try {
        if constexpr (std::is_same_v<std::decay_t<Result>, Outcome>) {
            return std::invoke(predicate, value);
        } else if constexpr (std::is_same_v<std::decay_t<Result>, bool>) {
            return std::invoke(predicate, value) ? Outcome::Success(rendered) : Outcome::Failure(rendered);
        } else {
            std::invoke(predicate, value);
            return Outcome::Success(rendered);
        }
    } catch (...) {
        return ExceptionOutcome(std::current_exception(), rendered);
    }
}

}  // namespace internal
}  // namespace propcheck
