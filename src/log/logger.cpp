//! # Logger Implementation
//!
//! Level table, record formatting, sinks, `LogFilter` and the `Logger`
//! singleton.

#include "log/log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace bfq::log {

namespace {

struct LevelInfo {
    const char* name;
    const char* color;
};

// Indexed by LogLevel
constexpr std::array<LevelInfo, 7> LEVELS = {{
    {"TRACE", "\033[90m"},
    {"DEBUG", "\033[36m"},
    {"INFO", "\033[32m"},
    {"WARN", "\033[33m"},
    {"ERROR", "\033[31m"},
    {"FATAL", "\033[1;31m"},
    {"OFF", ""},
}};

constexpr const char* COLOR_RESET = "\033[0m";

auto level_info(LogLevel level) -> const LevelInfo& {
    return LEVELS[static_cast<size_t>(level)];
}

auto stderr_is_color_terminal() -> bool {
    if (isatty(fileno(stderr)) == 0) {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
}

void write_json_string(std::ostream& out, std::string_view text) {
    out << '"';
    for (char c : text) {
        switch (c) {
        case '"':
            out << "\\\"";
            break;
        case '\\':
            out << "\\\\";
            break;
        case '\n':
            out << "\\n";
            break;
        case '\r':
            out << "\\r";
            break;
        case '\t':
            out << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                constexpr const char* hex = "0123456789abcdef";
                auto byte = static_cast<unsigned char>(c);
                out << "\\u00" << hex[byte >> 4] << hex[byte & 0xf];
            } else {
                out << c;
            }
        }
    }
    out << '"';
}

} // namespace

auto level_name(LogLevel level) -> const char* {
    return level_info(level).name;
}

auto parse_level(std::string_view name) -> LogLevel {
    std::string upper(name);
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    for (size_t i = 0; i < LEVELS.size(); ++i) {
        if (upper == LEVELS[i].name) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::Info;
}

auto get_timestamp() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = epoch_ms() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis;
    return out.str();
}

// ============================================================================
// Formatting
// ============================================================================

auto format_text(const LogRecord& record, bool colors) -> std::string {
    const auto& info = level_info(record.level);

    std::ostringstream out;
    out << get_timestamp() << ' ';
    if (colors) {
        out << info.color;
    }
    out << std::left << std::setw(5) << info.name;
    if (colors) {
        out << COLOR_RESET;
    }
    out << " [" << record.module << "] " << record.message << '\n';
    return out.str();
}

auto format_json(const LogRecord& record) -> std::string {
    std::ostringstream out;
    out << "{\"ts\":" << record.timestamp_ms << ",\"level\":";
    write_json_string(out, level_name(record.level));
    out << ",\"module\":";
    write_json_string(out, record.module);
    out << ",\"msg\":";
    write_json_string(out, record.message);
    out << "}\n";
    return out.str();
}

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors, std::ostream& out)
    : out_(out), colors_(use_colors && &out == &std::cerr && stderr_is_color_terminal()) {}

void ConsoleSink::write(const LogRecord& record) {
    out_ << (format_ == LogFormat::JSON ? format_json(record) : format_text(record, colors_));
}

void ConsoleSink::flush() {
    out_.flush();
}

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, std::ios::out | (append ? std::ios::app : std::ios::trunc)) {}

FileSink::~FileSink() {
    flush();
}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open()) {
        return;
    }
    file_ << (format_ == LogFormat::JSON ? format_json(record) : format_text(record, false));
    // Errors reach the disk even if the process dies right after
    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    modules_.clear();

    while (!spec.empty()) {
        auto comma = spec.find(',');
        auto entry = spec.substr(0, comma);
        spec = comma == std::string_view::npos ? std::string_view{} : spec.substr(comma + 1);

        if (entry.empty()) {
            continue;
        }

        auto eq = entry.find('=');
        if (eq == std::string_view::npos) {
            modules_[std::string(entry)] = LogLevel::Trace;
        } else if (entry.substr(0, eq) == "*") {
            default_level_ = parse_level(entry.substr(eq + 1));
        } else {
            modules_[std::string(entry.substr(0, eq))] = parse_level(entry.substr(eq + 1));
        }
    }
}

auto LogFilter::should_log(LogLevel level, std::string_view module) const -> bool {
    if (level == LogLevel::Off) {
        return false;
    }
    auto it = modules_.find(std::string(module));
    auto threshold = it == modules_.end() ? default_level_ : it->second;
    return level >= threshold;
}

auto LogFilter::min_level() const -> LogLevel {
    auto lowest = default_level_;
    for (const auto& entry : modules_) {
        lowest = std::min(lowest, entry.second);
    }
    return lowest;
}

// ============================================================================
// Logger
// ============================================================================

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    // Modules absent from the filter stay at the configured level
    logger.filter_ = LogFilter{};
    logger.filter_.set_default_level(config.level);
    logger.filter_.parse(config.filter_spec);
    logger.level_ = logger.filter_.min_level();

    logger.sinks_.clear();
    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        logger.sinks_.push_back(std::move(console));
    }
    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        if (!file->is_open()) {
            std::cerr << "bfq: warning: cannot open log file " << config.log_file << "\n";
            return;
        }
        file->set_format(config.format);
        logger.sinks_.push_back(std::move(file));
    }
}

auto Logger::should_log(LogLevel level, std::string_view module) const -> bool {
    return level >= level_ && filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    log(LogRecord{.level = level,
                  .module = module,
                  .message = message,
                  .file = file,
                  .line = line,
                  .timestamp_ms = epoch_ms()});
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    filter_.set_default_level(level);
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    level_ = filter_.min_level();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace bfq::log
