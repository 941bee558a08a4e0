//! # bfq Logging
//!
//! Module-tagged log records for the compiler stages. Normal runs print
//! nothing: the default level is `Warn` and the stages only log below it.
//!
//! | Module    | Debug                                 | Trace                  |
//! |-----------|---------------------------------------|------------------------|
//! | `lexer`   | bytes read, tokens produced           | every token            |
//! | `parser`  | statements, loops, depth / stop point | every loop             |
//! | `codegen` | blocks, instructions, temps, labels   | every loop and guard   |
//! | `driver`  | failures                              |                        |
//!
//! ```cpp
//! BFQ_LOG_DEBUG("lexer", "Lexed " << n << " tokens");
//! ```
//!
//! The stream expression is only evaluated when the record passes the
//! logger's level and module filter. Levels below `BFQ_MIN_LOG_LEVEL` are
//! removed at compile time.

#ifndef BFQ_LOG_HPP
#define BFQ_LOG_HPP

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace bfq::log {

enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6, ///< Accepts nothing
};

/// "TRACE", "DEBUG", ... "OFF".
[[nodiscard]] auto level_name(LogLevel level) -> const char*;

/// Case-insensitive inverse of `level_name`. Unknown names give `Info`.
[[nodiscard]] auto parse_level(std::string_view name) -> LogLevel;

// ============================================================================
// Records and Formatting
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view module; ///< "lexer", "parser", "codegen", "driver"
    std::string message;
    const char* file; ///< __FILE__ of the macro call
    int line;         ///< __LINE__ of the macro call
    int64_t timestamp_ms;
};

enum class LogFormat {
    Text, ///< `12:04:31.207 DEBUG [parser] Parsed 6 statements`
    JSON, ///< `{"ts":...,"level":"DEBUG","module":"parser","msg":"..."}`
};

/// One text line, newline included. `colors` wraps the level in ANSI codes.
[[nodiscard]] auto format_text(const LogRecord& record, bool colors) -> std::string;

/// One JSON object on one line, newline included.
[[nodiscard]] auto format_json(const LogRecord& record) -> std::string;

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to a stream, stderr unless told otherwise.
///
/// Colors need both `use_colors` and a stderr that is a color terminal;
/// any other stream gets plain text.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true, std::ostream& out = std::cerr);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_color_enabled(bool enabled) {
        colors_ = enabled;
    }
    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ostream& out_;
    bool colors_;
    LogFormat format_ = LogFormat::Text;
};

/// Writes to a file given with `--log-file=`. Never colored.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    /// False if the file could not be opened; writes are then dropped.
    [[nodiscard]] auto is_open() const -> bool {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

// ============================================================================
// Filter
// ============================================================================

/// Per-module minimum levels plus a default for every other module.
///
/// A filter string is a comma-separated list of `module=level`, `*=level` (the
/// default) or a bare `module` (meaning `module=trace`):
/// `"codegen=trace,parser=debug,*=warn"`.
class LogFilter {
public:
    /// Replaces the module table with the one in `spec`. The default level
    /// only changes if the string has a `*=` entry.
    void parse(std::string_view spec);

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] auto default_level() const -> LogLevel {
        return default_level_;
    }

    /// Lowest level any module (or the default) accepts.
    [[nodiscard]] auto min_level() const -> LogLevel;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> modules_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Info;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< Empty: every module uses `level`
    std::string log_file;    ///< Empty: no file sink
    bool console = true;
    bool colors = true;
};

/// Process-wide logger. Has no sinks until `init()` or `add_sink()`.
class Logger {
public:
    /// Drops all sinks and rebuilds level, filter and sinks from `config`.
    static void init(const LogConfig& config);

    static auto instance() -> Logger&;

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void log(const LogRecord& record);
    void log(LogLevel level, std::string_view module, const std::string& message,
             const char* file, int line);

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();

    /// Sets the global level and the filter's default.
    void set_level(LogLevel level);

    [[nodiscard]] auto level() const -> LogLevel {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger() = default;

    LogLevel level_ = LogLevel::Info;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

/// Local wall-clock time as "HH:MM:SS.mmm".
[[nodiscard]] auto get_timestamp() -> std::string;

[[nodiscard]] inline auto epoch_ms() -> int64_t {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// ============================================================================
// Command Line
// ============================================================================

/// Reads `--log-level=`, `--log-filter=`, `--log-file=`, `--log-format=`,
/// `-v`/`-vv`/`-vvv`/`--verbose` and `-q`/`--quiet` from argv. Without a
/// level or filter flag, `BFQ_LOG` is consulted. The default is `Warn`.
[[nodiscard]] auto parse_log_options(int argc, char* argv[]) -> LogConfig;

/// True for every argument `parse_log_options` consumes.
[[nodiscard]] auto is_log_option(std::string_view arg) -> bool;

// ============================================================================
// Macros
// ============================================================================

// 0=Trace ... 6=Off; set from CMake
#ifndef BFQ_MIN_LOG_LEVEL
#define BFQ_MIN_LOG_LEVEL 0
#endif

#define BFQ_LOG_IMPL(level, module_str, msg)                                                       \
    do {                                                                                           \
        if constexpr (static_cast<int>(level) >= BFQ_MIN_LOG_LEVEL) {                              \
            auto& bfq_logger_ = ::bfq::log::Logger::instance();                                    \
            if (bfq_logger_.should_log(level, module_str)) {                                       \
                std::ostringstream bfq_msg_;                                                       \
                bfq_msg_ << msg;                                                                   \
                bfq_logger_.log(level, module_str, bfq_msg_.str(), __FILE__, __LINE__);            \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define BFQ_LOG_TRACE(module, msg) BFQ_LOG_IMPL(::bfq::log::LogLevel::Trace, module, msg)
#define BFQ_LOG_DEBUG(module, msg) BFQ_LOG_IMPL(::bfq::log::LogLevel::Debug, module, msg)
#define BFQ_LOG_INFO(module, msg) BFQ_LOG_IMPL(::bfq::log::LogLevel::Info, module, msg)
#define BFQ_LOG_WARN(module, msg) BFQ_LOG_IMPL(::bfq::log::LogLevel::Warn, module, msg)
#define BFQ_LOG_ERROR(module, msg) BFQ_LOG_IMPL(::bfq::log::LogLevel::Error, module, msg)
#define BFQ_LOG_FATAL(module, msg) BFQ_LOG_IMPL(::bfq::log::LogLevel::Fatal, module, msg)

} // namespace bfq::log

#endif // BFQ_LOG_HPP
