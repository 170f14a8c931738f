/**
 * @file common.hpp
 * @brief Common definitions for propcheck (Level, ErrorCode, UsageError)
 * @brief propcheck 通用定义（报告级别、错误码、用法错误）
 *
 * This file contains fundamental types and constants used throughout the library:
 * - Level: Severity of report lines (Trace, Debug, Info, Warn, Error, Critical, Off)
 * - ErrorCode: Error codes for programmer errors
 * - UsageError: Exception thrown for programmer errors
 *
 * 此文件包含整个库使用的基本类型和常量：
 * - Level：报告行的严重级别
 * - ErrorCode：编程错误的错误码
 * - UsageError：编程错误时抛出的异常
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#ifndef PROPCHECK_COMMON_HPP
#define PROPCHECK_COMMON_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace propcheck {

// ==============================================================================
// Report Level / 报告级别
// ==============================================================================

/**
 * @brief Report line level enumeration
 * @brief 报告行级别枚举
 *
 * Per-trial and per-shrink lines are written at Debug, the success summary at
 * Info and the failure summary at Error.
 *
 * 每次试验和每次收缩的行以 Debug 级别写出，成功摘要为 Info，失败摘要为 Error。
 */
enum class Level : uint8_t {
    Trace = 0,     ///< Most detailed / 最详细
    Debug = 1,     ///< Trials and shrink steps / 试验与收缩步骤
    Info = 2,      ///< Success summary / 成功摘要
    Warn = 3,      ///< Warnings / 警告
    Error = 4,     ///< Failure summary / 失败摘要
    Critical = 5,  ///< Critical / 严重
    Off = 6        ///< Reporting disabled / 关闭报告
};

/**
 * @brief Level name display style
 * @brief 级别名称显示样式
 */
enum class LevelNameStyle : uint8_t {
    Full,    ///< Full name: "trace", "debug", "info", "warn", "error", "critical"
    Short4,  ///< 4-char name: "TRAC", "DBUG", "INFO", "WARN", "ERRO", "CRIT"
    Short1   ///< 1-char name: "T", "D", "I", "W", "E", "C"
};

/**
 * @brief Convert level to string representation
 * @brief 将级别转换为字符串表示
 */
constexpr std::string_view LevelToString(Level level,
                                          LevelNameStyle style = LevelNameStyle::Short4) noexcept {
    constexpr std::string_view kFullNames[] = {"trace", "debug", "info",  "warn",
                                                "error", "critical", "off"};
    constexpr std::string_view kShort4Names[] = {"TRAC", "DBUG", "INFO", "WARN",
                                                  "ERRO", "CRIT", "OFF"};
    constexpr std::string_view kShort1Names[] = {"T", "D", "I", "W", "E", "C", "O"};

    const auto idx = static_cast<size_t>(level);
    if (idx > static_cast<size_t>(Level::Off)) {
        return "UNKN";
    }

    switch (style) {
        case LevelNameStyle::Full:
            return kFullNames[idx];
        case LevelNameStyle::Short4:
            return kShort4Names[idx];
        case LevelNameStyle::Short1:
            return kShort1Names[idx];
        default:
            return kShort4Names[idx];
    }
}

/**
 * @brief Check if a line at @p lineLevel passes the @p minLevel filter
 * @brief 检查 @p lineLevel 级别的行是否通过 @p minLevel 过滤
 */
constexpr bool ShouldReport(Level lineLevel, Level minLevel) noexcept {
    return minLevel != Level::Off &&
           static_cast<uint8_t>(lineLevel) >= static_cast<uint8_t>(minLevel);
}

// ==============================================================================
// Error Code / 错误码
// ==============================================================================

/**
 * @brief Error code enumeration
 * @brief 错误码枚举
 *
 * Error codes organized by category:
 * - 0: Success
 * - 300-399: File errors (sinks)
 * - 600-699: Configuration errors (parse, invalid)
 * - 900-999: Usage errors (argument, range, state)
 *
 * 按类别组织的错误码：
 * - 0：成功
 * - 300-399：文件错误（输出目标）
 * - 600-699：配置错误（解析、无效）
 * - 900-999：用法错误（参数、范围、状态）
 */
enum class ErrorCode : int32_t {
    Success = 0,  ///< Operation completed successfully / 操作成功完成

    // File errors (300-399) / 文件错误
    FileOpenFailed = 300,   ///< Failed to open file / 文件打开失败
    FileWriteFailed = 301,  ///< Failed to write to file / 文件写入失败

    // Configuration errors (600-699) / 配置错误
    ConfigParseError = 600,    ///< Failed to parse configuration / 配置解析失败
    ConfigInvalidValue = 601,  ///< Invalid configuration value / 配置值无效

    // Usage errors (900-999) / 用法错误
    InvalidArgument = 900,     ///< Invalid argument provided / 提供的参数无效
    InvalidRange = 901,        ///< Range upper bound below lower bound / 范围上界小于下界
    NotInitialized = 902,      ///< Forward declaration not defined / 前向声明未定义
    AlreadyInitialized = 903,  ///< Forward declaration defined twice / 前向声明重复定义
    DuplicateField = 904       ///< Record field registered twice / 记录字段重复注册
};

/**
 * @brief Convert error code to string representation
 * @brief 将错误码转换为字符串表示
 */
constexpr std::string_view ErrorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::FileOpenFailed:
            return "FileOpenFailed";
        case ErrorCode::FileWriteFailed:
            return "FileWriteFailed";
        case ErrorCode::ConfigParseError:
            return "ConfigParseError";
        case ErrorCode::ConfigInvalidValue:
            return "ConfigInvalidValue";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::InvalidRange:
            return "InvalidRange";
        case ErrorCode::NotInitialized:
            return "NotInitialized";
        case ErrorCode::AlreadyInitialized:
            return "AlreadyInitialized";
        case ErrorCode::DuplicateField:
            return "DuplicateField";
        default:
            return "UnknownError";
    }
}

// ==============================================================================
// UsageError / 用法错误
// ==============================================================================

/**
 * @brief Exception thrown for programmer errors
 * @brief 编程错误时抛出的异常
 *
 * Raised immediately and never retried: malformed ranges, empty element lists,
 * negative trial counts, forward declaration misuse, duplicate record fields and
 * unparsable configuration text.
 *
 * 立即抛出，不会重试。
 */
class UsageError : public std::logic_error {
public:
    UsageError(ErrorCode code, const std::string& message)
        : std::logic_error(std::string(ErrorCodeToString(code)) + ": " + message), m_code(code) {}

    ErrorCode Code() const noexcept { return m_code; }

private:
    ErrorCode m_code;
};

}  // namespace propcheck

#endif  // PROPCHECK_COMMON_HPP
