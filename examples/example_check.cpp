/**
 * @file example_check.cpp
 * @brief Property checking examples for propcheck
 * @brief propcheck 属性检查示例
 *
 * Features demonstrated / 演示的功能:
 * - Checking a property with a console reporter / 使用控制台报告器检查属性
 * - Shrinking a failing value / 收缩失败值
 * - Records, sums and custom printers / 记录、和类型与自定义打印函数
 * - Writing reports to a file / 将报告写入文件
 * - Sampling values / 采样
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#include <algorithm>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <propcheck/propcheck.hpp>

// ==============================================================================
// Example 1: Passing Property
// 示例 1: 成立的属性
// ==============================================================================

/**
 * @brief Reversing twice gives back the original vector
 * @brief 反转两次得到原 vector
 */
void PassingPropertyExample() {
    std::cout << "\n=== Example 1: Passing Property / 成立的属性 ===" << std::endl;

    propcheck::Config config;
    config.reporter = propcheck::ConsoleReporter(propcheck::Level::Info);

    propcheck::FromArbitrary(propcheck::Int32()).Array().Check(
        [](const std::vector<int32_t>& values) {
            std::vector<int32_t> copy = values;
            std::reverse(copy.begin(), copy.end());
            std::reverse(copy.begin(), copy.end());
            return copy == values;
        },
        config);
}

// ==============================================================================
// Example 2: Failing Property With Shrinking
// 示例 2: 失败属性与收缩
// ==============================================================================

/**
 * @brief Prints every trial and shrink step of a failing run
 * @brief 打印失败运行的每次试验与收缩步骤
 */
void ShrinkingExample() {
    std::cout << "\n=== Example 2: Shrinking / 收缩 ===" << std::endl;

    propcheck::Config config;
    config.seed = 1873066016;
    config.reporter = propcheck::ConsoleReporter(propcheck::Level::Debug);

    const auto result = propcheck::Check(propcheck::Int32(), [](int32_t x) {
        if (x > 10) {
            throw std::out_of_range("x > 10");
        }
    }, config);
    std::cout << "minimal counterexample / 最小反例: " << *result.minFail << std::endl;
}

// ==============================================================================
// Example 3: Records and Sums
// 示例 3: 记录与和类型
// ==============================================================================

struct Order {
    int32_t quantity = 0;
    std::string item;
};

/**
 * @brief Combines a record with a sum and a custom printer
 * @brief 组合记录、和类型与自定义打印函数
 */
void RecordExample() {
    std::cout << "\n=== Example 3: Records and Sums / 记录与和类型 ===" << std::endl;

    auto orders = propcheck::Record<Order>()
                      .Field("quantity", &Order::quantity, propcheck::Int32())
                      .Field("item", &Order::item, propcheck::String())
                      .Build();
    auto checker = propcheck::FromArbitrary(orders).WithPrinter([](const Order& order) {
        return order.item + " x" + std::to_string(order.quantity);
    });

    propcheck::Config config;
    config.seed = 7;
    config.reporter = propcheck::ConsoleReporter(propcheck::Level::Info);
    checker.Check([](const Order& order) { return order.quantity < 30 || order.item.size() < 3; }, config);

    auto keys = propcheck::Sum(propcheck::Int32(), propcheck::String());
    propcheck::SampleOptions options;
    options.count = 5;
    options.seed = 1;
    for (const auto& key : propcheck::Sample(keys, options)) {
        std::cout << "key: " << propcheck::Stringify(key) << std::endl;
    }
}

// ==============================================================================
// Example 4: File Reporter
// 示例 4: 文件报告器
// ==============================================================================

/**
 * @brief Appends the report of a run to a file
 * @brief 将运行报告追加到文件
 */
void FileReporterExample() {
    std::cout << "\n=== Example 4: File Reporter / 文件报告器 ===" << std::endl;

    auto sink = std::make_shared<propcheck::FileSink>("propcheck_example.log");
    if (sink->HasError()) {
        std::cout << sink->GetLastError() << std::endl;
        return;
    }

    propcheck::Config config = propcheck::ParseConfig("seed=42 max_tests=200");
    config.reporter = std::make_shared<propcheck::SinkReporter>(sink, propcheck::Level::Info);
    propcheck::FromArbitrary(propcheck::Number()).Check([](double x) { return x * 0 == 0; }, config);
    std::cout << "Report appended to propcheck_example.log" << std::endl;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "propcheck Examples" << std::endl;
    std::cout << "propcheck 示例" << std::endl;
    std::cout << "========================================" << std::endl;

    try {
        PassingPropertyExample();
        ShrinkingExample();
        RecordExample();
        FileReporterExample();
    } catch (const propcheck::UsageError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    std::cout << "\n========================================" << std::endl;
    std::cout << "All examples completed!" << std::endl;
    std::cout << "所有示例完成！" << std::endl;
    std::cout << "========================================" << std::endl;

    return 0;
}
