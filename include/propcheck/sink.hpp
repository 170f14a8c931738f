/**
 * @file sink.hpp
 * @brief Report output sinks for propcheck
 * @brief propcheck 报告输出目标
 *
 * This file contains all sink implementations:
 * - Sink: Base class for all sinks
 * - ConsoleSink: Console output sink
 * - FileSink: File output sink (append mode)
 * - MemorySink: Keeps every line in memory
 * - CallbackSink: Forwards every line to a function
 *
 * Sinks are owned by a single run and are not synchronized.
 * Sink 由单次运行独占，不做同步。
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#pragma once

#include <cstdio>
#include <fstream>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "propcheck/common.hpp"

namespace propcheck {

// ==============================================================================
// Sink Base Class / Sink 基类
// ==============================================================================

/**
 * @brief Base class for report output sinks
 * @brief 报告输出目标基类
 *
 * Sink is responsible for writing formatted report lines to various destinations.
 * I/O problems are recorded (HasError/GetLastError) rather than thrown.
 *
 * Sink 负责将格式化后的报告行写入各种目标。I/O 问题会被记录（HasError/GetLastError）而不是抛出。
 */
class Sink {
public:
    virtual ~Sink() = default;

    /**
     * @brief Write a single line (without trailing newline)
     * @brief 写入一行（不含换行符）
     */
    virtual void Write(Level level, std::string_view line) = 0;

    virtual void WriteBatch(Level level, const std::vector<std::string>& lines) {
        for (const auto& line : lines) {
            Write(level, line);
        }
    }

    virtual void Flush() = 0;
    virtual void Close() = 0;
    virtual bool HasError() const = 0;
    virtual std::string GetLastError() const = 0;
};

// ==============================================================================
// ConsoleSink / 控制台输出
// ==============================================================================

/**
 * @brief Console output sink
 * @brief 控制台输出 Sink
 *
 * Writes report lines to stdout or stderr with optional color support. Lines are
 * written as-is unless a level prefix is enabled.
 * 将报告行写入 stdout 或 stderr，支持可选的颜色输出。除非启用级别前缀，否则原样写入。
 */
class ConsoleSink : public Sink {
public:
    /**
     * @brief Output stream selection
     * @brief 输出流选择
     */
    enum class Output {
        StdOut,  ///< Standard output / 标准输出
        StdErr   ///< Standard error / 标准错误
    };

    explicit ConsoleSink(Output output = Output::StdOut)
        : m_output(output),
          m_colorEnabled(true),
          m_levelPrefixEnabled(false),
          m_levelStyle(LevelNameStyle::Short4),
          m_hasError(false) {}

    void Write(Level level, std::string_view line) override;
    void Flush() override;
    void Close() override {}

    bool HasError() const override { return m_hasError; }
    std::string GetLastError() const override { return m_lastError; }

    void SetColorEnabled(bool enable) { m_colorEnabled = enable; }
    bool IsColorEnabled() const { return m_colorEnabled; }

    /// Prefix each line with "[LEVEL] " / 在每行前加上 "[LEVEL] "
    void SetLevelPrefixEnabled(bool enable) { m_levelPrefixEnabled = enable; }
    bool IsLevelPrefixEnabled() const { return m_levelPrefixEnabled; }
    void SetLevelStyle(LevelNameStyle style) { m_levelStyle = style; }
    LevelNameStyle GetLevelStyle() const { return m_levelStyle; }

    static const char* GetLevelColor(Level level);
    static const char* GetResetColor() { return "\033[0m"; }

private:
    std::FILE* Handle() const { return m_output == Output::StdOut ? stdout : stderr; }

    Output m_output;
    bool m_colorEnabled;
    bool m_levelPrefixEnabled;
    LevelNameStyle m_levelStyle;
    bool m_hasError;
    std::string m_lastError;
};

// ==============================================================================
// FileSink / 文件输出
// ==============================================================================

/**
 * @brief File output sink, appending to an existing file
 * @brief 文件输出 Sink，追加到已有文件
 *
 * Lines are prefixed with "[LEVEL] " (Short4 names) by default.
 * 默认在每行前加上 "[LEVEL] "（4 字符名称）。
 */
class FileSink : public Sink {
public:
    explicit FileSink(const std::string& filename);
    ~FileSink() override;

    void Write(Level level, std::string_view line) override;
    void Flush() override;
    void Close() override;

    bool HasError() const override { return m_hasError; }
    std::string GetLastError() const override { return m_lastError; }

    size_t GetCurrentSize() const { return m_currentSize; }
    const std::string& GetFilename() const { return m_filename; }

    void SetLevelPrefixEnabled(bool enable) { m_levelPrefixEnabled = enable; }
    bool IsLevelPrefixEnabled() const { return m_levelPrefixEnabled; }
    void SetLevelStyle(LevelNameStyle style) { m_levelStyle = style; }
    LevelNameStyle GetLevelStyle() const { return m_levelStyle; }

private:
    void OpenFile();

    std::string m_filename;
    std::ofstream m_file;
    size_t m_currentSize;
    bool m_levelPrefixEnabled;
    LevelNameStyle m_levelStyle;
    bool m_hasError;
    std::string m_lastError;
};

// ==============================================================================
// MemorySink / 内存输出
// ==============================================================================

/**
 * @brief Keeps every written line; useful for tests and for building messages
 * @brief 保存所有写入的行；用于测试和拼接消息
 */
class MemorySink : public Sink {
public:
    void Write(Level, std::string_view line) override { m_lines.emplace_back(line); }
    void Flush() override {}
    void Close() override {}
    bool HasError() const override { return false; }
    std::string GetLastError() const override { return {}; }

    const std::vector<std::string>& Lines() const { return m_lines; }
    void Clear() { m_lines.clear(); }

    /// All lines joined with '\n' / 用 '\n' 连接所有行
    std::string Joined() const;

private:
    std::vector<std::string> m_lines;
};

// ==============================================================================
// CallbackSink / 回调输出
// ==============================================================================

/**
 * @brief Forwards every line to a user function
 * @brief 将每一行转发给用户函数
 */
class CallbackSink : public Sink {
public:
    using Callback = std::function<void(Level, std::string_view)>;

    explicit CallbackSink(Callback callback) : m_callback(std::move(callback)) {}

    void Write(Level level, std::string_view line) override {
        if (m_callback) {
            m_callback(level, line);
        }
    }
    void Flush() override {}
    void Close() override {}
    bool HasError() const override { return false; }
    std::string GetLastError() const override { return {}; }

private:
    Callback m_callback;
};

}  // namespace propcheck
