/**
 * @file sink.cpp
 * @brief Report output sinks implementation
 * @brief 报告输出目标实现
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#include "propcheck/sink.hpp"

#include <fmt/format.h>

namespace propcheck {

namespace {

/// "[INFO] line" when @p prefixed, otherwise the line itself
std::string FormatLine(Level level, std::string_view line, bool prefixed, LevelNameStyle style) {
    if (!prefixed) {
        return std::string(line);
    }
    return fmt::format("[{}] {}", LevelToString(level, style), line);
}

}  // namespace

// ==============================================================================
// ConsoleSink Implementation / ConsoleSink 实现
// ==============================================================================

void ConsoleSink::Write(Level level, std::string_view text) {
    const std::string line = FormatLine(level, text, m_levelPrefixEnabled, m_levelStyle);
    std::FILE* out = Handle();
    if (m_colorEnabled) {
        std::fputs(GetLevelColor(level), out);
    }
    const size_t written = std::fwrite(line.data(), 1, line.size(), out);
    if (m_colorEnabled) {
        std::fputs(GetResetColor(), out);
    }
    if (written != line.size() || std::fputc('\n', out) == EOF) {
        m_hasError = true;
        m_lastError = fmt::format("{}: console", ErrorCodeToString(ErrorCode::FileWriteFailed));
    }
}

void ConsoleSink::Flush() {
    std::fflush(Handle());
}

const char* ConsoleSink::GetLevelColor(Level level) {
    switch (level) {
        case Level::Trace:    return "\033[37m";
        case Level::Debug:    return "\033[36m";
        case Level::Info:     return "\033[32m";
        case Level::Warn:     return "\033[33m";
        case Level::Error:    return "\033[31m";
        case Level::Critical: return "\033[35m";
        default:              return "\033[0m";
    }
}

// ==============================================================================
// FileSink Implementation / FileSink 实现
// ==============================================================================

FileSink::FileSink(const std::string& filename)
    : m_filename(filename),
      m_currentSize(0),
      m_levelPrefixEnabled(true),
      m_levelStyle(LevelNameStyle::Short4),
      m_hasError(false) {
    OpenFile();
}

FileSink::~FileSink() {
    Close();
}

void FileSink::Write(Level level, std::string_view text) {
    if (!m_file.is_open()) {
        m_hasError = true;
        m_lastError = fmt::format("{}: file not open: {}", ErrorCodeToString(ErrorCode::FileWriteFailed),
                                  m_filename);
        return;
    }
    const std::string line = FormatLine(level, text, m_levelPrefixEnabled, m_levelStyle);
    m_file.write(line.data(), static_cast<std::streamsize>(line.size()));
    m_file.put('\n');
    m_currentSize += line.size() + 1;
    if (m_file.fail()) {
        m_hasError = true;
        m_lastError = fmt::format("{}: {}", ErrorCodeToString(ErrorCode::FileWriteFailed), m_filename);
    }
}

void FileSink::Flush() {
    if (m_file.is_open()) {
        m_file.flush();
    }
}

void FileSink::Close() {
    if (m_file.is_open()) {
        m_file.close();
    }
}

void FileSink::OpenFile() {
    m_file.open(m_filename, std::ios::app);
    if (!m_file.is_open()) {
        m_hasError = true;
        m_lastError = fmt::format("{}: {}", ErrorCodeToString(ErrorCode::FileOpenFailed), m_filename);
        return;
    }
    m_file.seekp(0, std::ios::end);
    m_currentSize = static_cast<size_t>(m_file.tellp());
    m_hasError = false;
}

// ==============================================================================
// MemorySink Implementation / MemorySink 实现
// ==============================================================================

std::string MemorySink::Joined() const {
    std::string result;
    for (size_t i = 0; i < m_lines.size(); ++i) {
        if (i > 0) {
            result += '\n';
        }
        result += m_lines[i];
    }
    return result;
}

}  // namespace propcheck
