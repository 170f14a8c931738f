/**
 * @file config.hpp
 * @brief Run configuration for property checks
 * @brief 属性检查的运行配置
 *
 * A Config is read once at the start of a run and is never modified by it.
 * Besides setting fields directly, a Config can be read from a parameter string
 * such as "seed=42 max_tests=500" or from the PROPCHECK_PARAMS environment variable.
 *
 * Config 在运行开始时读取一次，运行过程中不会被修改。除了直接设置字段，
 * 还可以从参数字符串（如 "seed=42 max_tests=500"）或 PROPCHECK_PARAMS 环境变量读取。
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include "propcheck/reporter.hpp"

namespace propcheck {

/// Name of the environment variable read by Config::FromEnvironment
constexpr const char* kParamsEnvVar = "PROPCHECK_PARAMS";

constexpr int32_t kDefaultMaxTests = 100;
constexpr int32_t kDefaultStartSize = 1;
constexpr int32_t kDefaultEndSize = 100;

/**
 * @brief Parameters of one property run
 * @brief 一次属性运行的参数
 */
struct Config {
    std::optional<uint32_t> seed;             ///< Defaults to SeedOfNow() / 默认为 SeedOfNow()
    int32_t maxTests = kDefaultMaxTests;      ///< Number of trials / 试验次数
    int32_t startSize = kDefaultStartSize;    ///< Size of the first trial / 首次试验规模
    int32_t endSize = kDefaultEndSize;        ///< Size of the last trial / 末次试验规模
    std::shared_ptr<Reporter> reporter;       ///< Defaults to DefaultReporter() / 默认为 DefaultReporter()

    static Config Default() { return Config{}; }

    /**
     * @brief Apply PROPCHECK_PARAMS on top of @p base when the variable is set
     * @brief 若设置了 PROPCHECK_PARAMS，则在 @p base 基础上应用
     *
     * @throws UsageError (ConfigParseError, ConfigInvalidValue) on malformed text
     */
    static Config FromEnvironment(Config base);

    /// FromEnvironment() over the default parameters / 基于默认参数的 FromEnvironment()
    static Config FromEnvironment();
};

/**
 * @brief Apply whitespace-separated key=value pairs on top of @p base
 * @brief 在 @p base 基础上应用以空白分隔的 key=value 对
 *
 * Keys: seed, max_tests, start_size, end_size.
 *
 * @throws UsageError(ConfigParseError) for an unknown key or a pair without '='
 * @throws UsageError(ConfigInvalidValue) for a non-numeric or out of range value
 */
Config ParseConfig(std::string_view params, Config base = {});

}  // namespace propcheck
