/**
 * @file evaluate.cpp
 * @brief Predicate evaluation helpers
 * @brief 谓词求值辅助函数
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#include "propcheck/internal/evaluate.hpp"

#include <cmath>

namespace propcheck {
namespace internal {

int32_t ComputeSize(int32_t index, int32_t maxTests, int32_t minSize, int32_t maxSize) {
    const double progress = static_cast<double>(index + 1) / static_cast<double>(maxTests);
    const double size = static_cast<double>(minSize) + static_cast<double>(maxSize - minSize) * progress;
    return static_cast<int32_t>(std::trunc(size));
}

Outcome ExceptionOutcome(std::exception_ptr error, std::string value) {
    std::string message;
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        message = e.what();
    } catch (...) {
        // Non-std payloads stay reachable through the exception_ptr.
        message = "unknown exception";
    }
    return Outcome::Exception(std::move(error), std::move(message), std::move(value));
}

}  // namespace internal
}  // namespace propcheck
