// sk_wrap/logging.hpp
// Process-wide diagnostic logger
//
// - Level is set programmatically or from SK_WRAP_LOG_LEVEL
//   (none, error, warn, info, debug, trace); default is warn.
// - Lines are timestamped and written to std::clog under a mutex.
// - Filtering happens before formatting, so disabled levels cost one load.

#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include "sk_wrap/format.hpp"

namespace sk_wrap {

enum class LogLevel {
    None,
    Error,
    Warn,
    Info,
    Debug,
    Trace,
};

[[nodiscard]] constexpr const char* log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::None:  return "NONE";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Trace: return "TRACE";
    }
    return "?";
}

/// Parse a level name (case-insensitive). Unknown names yield `fallback`.
[[nodiscard]] inline LogLevel parse_log_level(std::string_view name, LogLevel fallback) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "none" || lower == "off") return LogLevel::None;
    if (lower == "error") return LogLevel::Error;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "info") return LogLevel::Info;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "trace") return LogLevel::Trace;
    return fallback;
}

class Logger {
public:
    static constexpr const char* kEnvVar = "SK_WRAP_LOG_LEVEL";

    [[nodiscard]] static LogLevel level() noexcept {
        return instance().level_.load(std::memory_order_relaxed);
    }

    static void set_level(LogLevel level) noexcept {
        instance().level_.store(level, std::memory_order_relaxed);
    }

    [[nodiscard]] static bool enabled(LogLevel level) noexcept {
        return level != LogLevel::None && level <= Logger::level();
    }

    /// Redirect output (tests capture into a stringstream). nullptr restores std::clog.
    static void set_sink(std::ostream* sink) {
        std::lock_guard<std::mutex> lock(instance().mutex_);
        instance().sink_ = sink ? sink : &std::clog;
    }

    static void write(LogLevel level, std::string_view message) {
        if (!enabled(level)) return;

        const auto now = std::chrono::system_clock::now();
        const auto now_t = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&now_t, &tm_buf);

        std::ostringstream line;
        line << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.'
             << std::setfill('0') << std::setw(3) << ms.count()
             << " [" << log_level_name(level) << "] sk_wrap: " << message << '\n';

        std::lock_guard<std::mutex> lock(instance().mutex_);
        (*instance().sink_) << line.str();
        instance().sink_->flush();
    }

private:
    std::atomic<LogLevel> level_;
    std::mutex mutex_;
    std::ostream* sink_{&std::clog};

    Logger() : level_(initial_level_()) {}

    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    static LogLevel initial_level_() {
        const char* env = std::getenv(kEnvVar);
        return env ? parse_log_level(env, LogLevel::Warn) : LogLevel::Warn;
    }
};

namespace logging {

template<class... Args>
inline void error(detail::format_string<Args...> fmt, Args&&... args) {
    if (Logger::enabled(LogLevel::Error))
        Logger::write(LogLevel::Error, detail::format(fmt, std::forward<Args>(args)...));
}

template<class... Args>
inline void warn(detail::format_string<Args...> fmt, Args&&... args) {
    if (Logger::enabled(LogLevel::Warn))
        Logger::write(LogLevel::Warn, detail::format(fmt, std::forward<Args>(args)...));
}

template<class... Args>
inline void info(detail::format_string<Args...> fmt, Args&&... args) {
    if (Logger::enabled(LogLevel::Info))
        Logger::write(LogLevel::Info, detail::format(fmt, std::forward<Args>(args)...));
}

template<class... Args>
inline void debug(detail::format_string<Args...> fmt, Args&&... args) {
    if (Logger::enabled(LogLevel::Debug))
        Logger::write(LogLevel::Debug, detail::format(fmt, std::forward<Args>(args)...));
}

} // namespace logging

} // namespace sk_wrap
