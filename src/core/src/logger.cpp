#include "typecase/core/logger.hpp"
#include <atomic>
#include <ctime>
#include <iostream>
#include <mutex>
#include <unordered_map>

namespace typecase {

namespace {

struct LoggingState {
    std::mutex mutex;
    std::vector<std::unique_ptr<LogSink>> sinks;
    std::unordered_map<std::string, std::unique_ptr<Logger>> loggers;
    std::atomic<LogLevel> level{LogLevel::Info};
    bool initialized{false};
};

LoggingState& state() {
    static LoggingState s;
    return s;
}

// "2024-01-31 12:00:00.123"
std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    char date[24];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local);

    char result[32];
    std::snprintf(result, sizeof(result), "%s.%03d", date, static_cast<int>(millis));
    return result;
}

const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Off:   return "";
    }
    return "";
}

} // anonymous namespace

// ============================================================================
// Sinks
// ============================================================================

void ConsoleSink::write(const LogRecord& record) {
    std::ostream& out = record.level >= LogLevel::Warn ? std::cerr : std::cout;

    out << '[' << format_timestamp(record.timestamp) << "] ";
    if (m_use_colors) {
        out << level_color(record.level) << '[' << log_level_name(record.level) << "]\033[0m ";
    } else {
        out << '[' << log_level_name(record.level) << "] ";
    }
    out << '[' << record.logger_name << "] " << record.message;

    if (record.level == LogLevel::Debug) {
        out << " (" << record.location.file << ':' << record.location.line << ')';
    }
    out << '\n';
}

void ConsoleSink::flush() {
    std::cout.flush();
    std::cerr.flush();
}

FileSink::FileSink(const char* path) : m_file(std::fopen(path, "a")) {}

FileSink::~FileSink() {
    if (m_file) {
        std::fclose(m_file);
    }
}

void FileSink::write(const LogRecord& record) {
    if (!m_file) return;

    const auto level = log_level_name(record.level);
    std::fprintf(m_file, "[%s] [%.*s] [%.*s] %.*s (%s:%d)\n",
                 format_timestamp(record.timestamp).c_str(),
                 static_cast<int>(level.size()), level.data(),
                 static_cast<int>(record.logger_name.size()), record.logger_name.data(),
                 static_cast<int>(record.message.size()), record.message.data(),
                 record.location.file, record.location.line);
}

void FileSink::flush() {
    if (m_file) {
        std::fflush(m_file);
    }
}

// ============================================================================
// Logger
// ============================================================================

bool Logger::is_enabled(LogLevel level) {
    return level != LogLevel::Off && level >= logging::level();
}

void Logger::debug(std::string_view msg, SourceLocation loc) { log(LogLevel::Debug, msg, loc); }
void Logger::info(std::string_view msg, SourceLocation loc) { log(LogLevel::Info, msg, loc); }
void Logger::warn(std::string_view msg, SourceLocation loc) { log(LogLevel::Warn, msg, loc); }
void Logger::error(std::string_view msg, SourceLocation loc) { log(LogLevel::Error, msg, loc); }

void Logger::log(LogLevel level, std::string_view msg, SourceLocation loc) {
    if (!is_enabled(level)) return;

    const LogRecord record{level, m_name, msg, loc, std::chrono::system_clock::now()};

    auto& s = state();
    std::lock_guard lock(s.mutex);
    for (auto& sink : s.sinks) {
        sink->write(record);
    }
}

// ============================================================================
// Global configuration
// ============================================================================

namespace logging {

void init(std::vector<std::unique_ptr<LogSink>> sinks) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (s.initialized) return;

    s.sinks = std::move(sinks);
    s.initialized = true;
}

void shutdown() {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    for (auto& sink : s.sinks) {
        sink->flush();
    }
    s.sinks.clear();
    s.loggers.clear();
    s.initialized = false;
}

void set_level(LogLevel level) {
    state().level.store(level, std::memory_order_relaxed);
}

LogLevel level() {
    return state().level.load(std::memory_order_relaxed);
}

Logger& get(std::string_view name) {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    if (!s.initialized) {
        s.sinks.push_back(std::make_unique<ConsoleSink>());
        s.initialized = true;
    }

    auto it = s.loggers.find(std::string(name));
    if (it == s.loggers.end()) {
        it = s.loggers.emplace(std::string(name), std::make_unique<Logger>(name)).first;
    }
    return *it->second;
}

} // namespace logging

} // namespace typecase
