#pragma once

#include "types.hpp"
#include <chrono>
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace typecase {

// ============================================================================
// Log levels
// ============================================================================

enum class LogLevel : u8 {
    Debug,
    Info,
    Warn,
    Error,
    Off,
};

[[nodiscard]] constexpr std::string_view log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

// Call site captured through default arguments
struct SourceLocation {
    const char* file;
    int line;

    static SourceLocation current(const char* file = __builtin_FILE(),
                                  int line = __builtin_LINE()) {
        return {file, line};
    }
};

struct LogRecord {
    LogLevel level;
    std::string_view logger_name;
    std::string_view message;
    SourceLocation location;
    std::chrono::system_clock::time_point timestamp;
};

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// stdout below Warn, stderr from Warn up
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true) : m_use_colors(use_colors) {}

    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool m_use_colors;
};

/// Appends to a file; writes are dropped when it could not be opened
class FileSink : public LogSink {
public:
    explicit FileSink(const char* path);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    [[nodiscard]] bool is_open() const { return m_file != nullptr; }

    void write(const LogRecord& record) override;
    void flush() override;

private:
    std::FILE* m_file{nullptr};
};

// ============================================================================
// Logger
// ============================================================================

/// A named channel. Records at or above the global level reach every sink.
class Logger {
public:
    explicit Logger(std::string_view name) : m_name(name) {}

    void debug(std::string_view msg, SourceLocation loc = SourceLocation::current());
    void info(std::string_view msg, SourceLocation loc = SourceLocation::current());
    void warn(std::string_view msg, SourceLocation loc = SourceLocation::current());
    void error(std::string_view msg, SourceLocation loc = SourceLocation::current());

    [[nodiscard]] static bool is_enabled(LogLevel level);

private:
    void log(LogLevel level, std::string_view msg, SourceLocation loc);

    std::string m_name;
};

// ============================================================================
// Global logging configuration
// ============================================================================

namespace logging {

// Install sinks; a no-op when already initialized
void init(std::vector<std::unique_ptr<LogSink>> sinks);

// Flush and drop all sinks and loggers. References from get() dangle afterwards.
void shutdown();

void set_level(LogLevel level);
[[nodiscard]] LogLevel level();

// Named logger, created on first use. Initializes with a ConsoleSink if
// init() was never called.
[[nodiscard]] Logger& get(std::string_view name);

} // namespace logging

} // namespace typecase
