/**
 * @file propcheck.hpp
 * @brief Main header file for propcheck - property-based testing for C++
 * @brief propcheck 主头文件 - C++ 基于属性的测试
 *
 * Include this file to use all propcheck features except the GoogleTest glue,
 * which lives in propcheck/gtest.hpp.
 * 包含此文件以使用 propcheck 的所有功能（GoogleTest 集成位于 propcheck/gtest.hpp）。
 *
 * @section features Features / 功能特性
 * - Deterministic, seedable random source
 *   确定性、可指定种子的随机源
 * - Generator/shrinker algebra for primitives, containers, records and sums
 *   覆盖基本类型、容器、记录和和类型的生成/收缩代数
 * - Local-minimum shrink-search with readable reports
 *   局部最小收缩搜索与可读报告
 *
 * @section usage Basic Usage / 基本用法
 * @code
 * #include <propcheck/propcheck.hpp>
 *
 * int main() {
 *     propcheck::Config config;
 *     config.reporter = propcheck::ConsoleReporter(propcheck::Level::Info);
 *     auto result = propcheck::FromArbitrary(propcheck::Int32())
 *                       .Check([](int32_t x) { return x + 0 == x; }, config);
 *     return result.IsSuccess() ? 0 : 1;
 * }
 * @endcode
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#pragma once

// Core types / 核心类型
#include "propcheck/common.hpp"
#include "propcheck/random.hpp"
#include "propcheck/stream.hpp"

// Generators and shrinkers / 生成器与收缩器
#include "propcheck/arbitrary.hpp"
#include "propcheck/primitives.hpp"
#include "propcheck/combinators.hpp"

// Rendering and output / 渲染与输出
#include "propcheck/show.hpp"
#include "propcheck/outcome.hpp"
#include "propcheck/sink.hpp"
#include "propcheck/reporter.hpp"

// Running checks / 运行检查
#include "propcheck/config.hpp"
#include "propcheck/check.hpp"
#include "propcheck/checker.hpp"
