//! # twbuild Logging
//!
//! Module-tagged logging for the orchestrator:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Per-module filtering (`install=debug,*=warn`)
//! - Console (stderr) and file sinks, text or JSON lines
//! - Compile-time level elision via TWBUILD_MIN_LOG_LEVEL
//!
//! Log output always goes to stderr or a file. stdout is reserved for build
//! directives so a consuming build system can parse it unmodified.
//!
//! ## Usage
//!
//! ```cpp
//! TWBUILD_LOG_INFO("install", "creating package.json (" << path << ")");
//! TWBUILD_LOG_WARN("profile", "PROFILE was not defined, defaulting to debug");
//! ```

#ifndef TWBUILD_LOG_HPP
#define TWBUILD_LOG_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace twbuild::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5, ///< The build cannot continue
    Off = 6
};

inline const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

/// Parses a level name (lower or upper case). Unknown names map to Info.
inline LogLevel parse_level(std::string_view s) {
    if (s == "trace" || s == "TRACE")
        return LogLevel::Trace;
    if (s == "debug" || s == "DEBUG")
        return LogLevel::Debug;
    if (s == "info" || s == "INFO")
        return LogLevel::Info;
    if (s == "warn" || s == "WARN")
        return LogLevel::Warn;
    if (s == "error" || s == "ERROR")
        return LogLevel::Error;
    if (s == "fatal" || s == "FATAL")
        return LogLevel::Fatal;
    if (s == "off" || s == "OFF")
        return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Log Record
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view module; ///< e.g. "install", "jit", "tools"
    std::string message;
    const char* file;
    int line;
    int64_t timestamp_ms; ///< Milliseconds since epoch
};

enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< One object per line
};

/// Renders a record as a single JSON line (no trailing newline).
std::string format_json_line(const LogRecord& record);

// ============================================================================
// Log Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr, with ANSI colors when stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;

    const char* level_color(LogLevel level) const;
};

/// Appends to a file. Flushes after every Error or Fatal record.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

/// Discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

// ============================================================================
// Log Filter
// ============================================================================

/// Per-module level filter parsed from "module=level,*=level" specs.
/// A bare module name enables Trace for that module.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level configured for any module, or the default.
    LogLevel min_level() const {
        LogLevel min = default_level_;
        for (const auto& [_, level] : module_levels_) {
            if (level < min)
                min = level;
        }
        return min;
    }

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Info;
    LogFormat format = LogFormat::Text;
    std::string filter_spec;
    std::string log_file; ///< Empty = no file sink
    bool console = true;
    bool colors = true;
};

/// Global logger. Usable before `init()`; it then has no sinks and drops
/// records.
class Logger {
public:
    /// Replaces all sinks and filters with the given configuration.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before formatting the message.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink. Tests use this to detach capture sinks.
    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Info;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Timestamp Helpers
// ============================================================================

/// Current local time as "HH:MM:SS.mmm".
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &now_c);
#else
    localtime_r(&now_c, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI Parsing
// ============================================================================

/// Builds a LogConfig from argv: --log-level=, --log-filter=, --log-file=,
/// --log-format=, -v/-vv/-vvv, -q. `env_spec` is the value of TWBUILD_LOG,
/// consulted only when argv sets neither a level nor a filter.
LogConfig parse_log_options(int argc, char* argv[], const std::optional<std::string>& env_spec);

/// True for arguments consumed by parse_log_options.
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef TWBUILD_MIN_LOG_LEVEL
#define TWBUILD_MIN_LOG_LEVEL 0
#endif

#define TWBUILD_LOG_IMPL(level, module_str, msg)                                                   \
    do {                                                                                           \
        if (static_cast<int>(level) >= TWBUILD_MIN_LOG_LEVEL) {                                    \
            auto& logger_ = ::twbuild::log::Logger::instance();                                    \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define TWBUILD_LOG_TRACE(module, msg) TWBUILD_LOG_IMPL(::twbuild::log::LogLevel::Trace, module, msg)
#define TWBUILD_LOG_DEBUG(module, msg) TWBUILD_LOG_IMPL(::twbuild::log::LogLevel::Debug, module, msg)
#define TWBUILD_LOG_INFO(module, msg) TWBUILD_LOG_IMPL(::twbuild::log::LogLevel::Info, module, msg)
#define TWBUILD_LOG_WARN(module, msg) TWBUILD_LOG_IMPL(::twbuild::log::LogLevel::Warn, module, msg)
#define TWBUILD_LOG_ERROR(module, msg) TWBUILD_LOG_IMPL(::twbuild::log::LogLevel::Error, module, msg)
#define TWBUILD_LOG_FATAL(module, msg) TWBUILD_LOG_IMPL(::twbuild::log::LogLevel::Fatal, module, msg)

} // namespace twbuild::log

#endif // TWBUILD_LOG_HPP
