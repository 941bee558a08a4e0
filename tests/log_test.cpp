//! # Logger Unit Tests
//!
//! LogFilter parsing, text and JSON formatting, the console and file sinks,
//! the Logger singleton and the command-line/environment configuration.

#include "log/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace bfq::log;
namespace fs = std::filesystem;

namespace {

auto make_record(LogLevel level, std::string_view module, std::string message) -> LogRecord {
    return LogRecord{.level = level,
                     .module = module,
                     .message = std::move(message),
                     .file = __FILE__,
                     .line = __LINE__,
                     .timestamp_ms = 1234567890};
}

} // namespace

// ============================================================================
// LogFilter
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("parser=debug,*=warn");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "parser"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "parser"));

    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "lexer"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "lexer"));
}

TEST_F(LogFilterTest, BareModuleName) {
    filter.parse("codegen");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "codegen"));
    // Others keep the default (Info)
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "driver"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "driver"));
}

TEST_F(LogFilterTest, ModuleOff) {
    filter.parse("lexer=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "lexer"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "parser"));
}

TEST_F(LogFilterTest, MinLevel) {
    filter.parse("codegen=trace,*=error");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);

    filter.parse("*=error");
    EXPECT_EQ(filter.min_level(), LogLevel::Error);
}

TEST_F(LogFilterTest, ReparseClearsModules) {
    filter.parse("parser=trace");
    filter.parse("lexer=trace");

    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "parser"));
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "lexer"));
}

TEST(LogLevelTest, ParseAndName) {
    EXPECT_EQ(parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("bogus"), LogLevel::Info);

    EXPECT_STREQ(level_name(LogLevel::Error), "ERROR");
    EXPECT_STREQ(level_name(LogLevel::Info), "INFO");
}

// ============================================================================
// Formatting and sinks
// ============================================================================

TEST(LogFormatTest, TextLine) {
    auto line = format_text(make_record(LogLevel::Info, "parser", "Parsed 3 statements"), false);

    EXPECT_NE(line.find("INFO  [parser] Parsed 3 statements\n"), std::string::npos);
    EXPECT_EQ(line.find("\033["), std::string::npos);
}

TEST(LogFormatTest, TextLineWithColors) {
    auto line = format_text(make_record(LogLevel::Error, "driver", "boom"), true);
    EXPECT_NE(line.find("\033[31m"), std::string::npos);
    EXPECT_NE(line.find("\033[0m"), std::string::npos);
}

TEST(LogFormatTest, JsonLine) {
    auto line = format_json(make_record(LogLevel::Warn, "codegen", "say \"hi\"\n"));
    EXPECT_EQ(line, "{\"ts\":1234567890,\"level\":\"WARN\",\"module\":\"codegen\","
                    "\"msg\":\"say \\\"hi\\\"\\n\"}\n");
}

TEST(LogFormatTest, JsonEscapesControlCharacters) {
    auto line = format_json(make_record(LogLevel::Info, "lexer", std::string("a\x01" "b\x1f\tc")));
    EXPECT_EQ(line, "{\"ts\":1234567890,\"level\":\"INFO\",\"module\":\"lexer\","
                    "\"msg\":\"a\\u0001b\\u001f\\tc\"}\n");
}

TEST(ConsoleSinkTest, WritesToGivenStream) {
    std::ostringstream out;
    ConsoleSink sink(true, out);
    sink.write(make_record(LogLevel::Debug, "lexer", "Lexed 12 bytes"));

    // Colors only apply to a terminal stderr
    EXPECT_EQ(out.str().find("\033["), std::string::npos);
    EXPECT_NE(out.str().find("DEBUG [lexer] Lexed 12 bytes"), std::string::npos);
}

TEST(ConsoleSinkTest, JsonFormat) {
    std::ostringstream out;
    ConsoleSink sink(false, out);
    sink.set_format(LogFormat::JSON);
    sink.write(make_record(LogLevel::Info, "driver", "ok"));

    EXPECT_EQ(out.str(), "{\"ts\":1234567890,\"level\":\"INFO\",\"module\":\"driver\","
                         "\"msg\":\"ok\"}\n");
}

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() / "bfq_log_test.log";
        if (fs::exists(temp_file)) {
            fs::remove(temp_file);
        }
    }

    void TearDown() override {
        if (fs::exists(temp_file)) {
            fs::remove(temp_file);
        }
    }

    std::string read_file(const fs::path& path) {
        std::ifstream f(path);
        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        return content;
    }
};

TEST_F(FileSinkTest, CreatesAndWritesFile) {
    {
        FileSink sink(temp_file.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "driver", "Compiling prog.b"));
        sink.flush();
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[driver]"), std::string::npos);
    EXPECT_NE(content.find("Compiling prog.b"), std::string::npos);
}

TEST_F(FileSinkTest, AppendsToExistingFile) {
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Info, "a", "first"));
    }
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Warn, "b", "second"));
    }

    std::string content = read_file(temp_file);
    auto first = content.find("first");
    auto second = content.find("second");
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(first, second);
}

TEST_F(FileSinkTest, TruncatesWithoutAppend) {
    {
        FileSink sink(temp_file.string(), false);
        sink.write(make_record(LogLevel::Info, "a", "old"));
    }
    {
        FileSink sink(temp_file.string(), false);
        sink.write(make_record(LogLevel::Info, "a", "new"));
    }

    std::string content = read_file(temp_file);
    EXPECT_EQ(content.find("old"), std::string::npos);
    EXPECT_NE(content.find("new"), std::string::npos);
}

TEST(FileSinkOpenTest, MissingDirectory) {
    FileSink sink("/nonexistent-bfq-dir/sub/log.txt", false);
    EXPECT_FALSE(sink.is_open());
    // Writing to a closed sink is a no-op
    sink.write(make_record(LogLevel::Error, "driver", "dropped"));
}

// ============================================================================
// Logger
// ============================================================================

class CaptureSink : public LogSink {
public:
    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    explicit CaptureSink(std::vector<Entry>& records) : records_(records) {}

    void write(const LogRecord& record) override {
        records_.push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {}

private:
    std::vector<Entry>& records_;
};

class LoggerTest : public ::testing::Test {
protected:
    std::vector<CaptureSink::Entry> records;

    void SetUp() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_level(LogLevel::Trace);
        logger.add_sink(std::make_unique<CaptureSink>(records));
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_filter("");
        logger.set_level(LogLevel::Warn);
    }
};

TEST_F(LoggerTest, MacrosReachSinks) {
    BFQ_LOG_DEBUG("parser", "Parsed " << 3 << " statements");
    BFQ_LOG_ERROR("driver", "cannot open file");

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].level, LogLevel::Debug);
    EXPECT_EQ(records[0].module, "parser");
    EXPECT_EQ(records[0].message, "Parsed 3 statements");
    EXPECT_EQ(records[1].level, LogLevel::Error);
}

TEST_F(LoggerTest, LevelHidesLowerRecords) {
    Logger::instance().set_level(LogLevel::Warn);

    BFQ_LOG_TRACE("lexer", "hidden");
    BFQ_LOG_INFO("lexer", "hidden");
    BFQ_LOG_WARN("lexer", "shown");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "shown");
}

TEST_F(LoggerTest, FilterSelectsModules) {
    Logger::instance().set_filter("codegen=trace,*=off");

    BFQ_LOG_TRACE("codegen", "guard");
    BFQ_LOG_ERROR("parser", "hidden");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].module, "codegen");
}

TEST_F(LoggerTest, MessageNotBuiltWhenFiltered) {
    Logger::instance().set_level(LogLevel::Error);

    int evaluated = 0;
    auto expensive = [&]() {
        ++evaluated;
        return "value";
    };
    BFQ_LOG_DEBUG("codegen", "computed " << expensive());

    EXPECT_EQ(evaluated, 0);
    EXPECT_TRUE(records.empty());
}

TEST_F(LoggerTest, ConcurrentLogging) {
    const int num_threads = 8;
    const int messages_per_thread = 100;

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([t]() {
            for (int i = 0; i < messages_per_thread; i++) {
                BFQ_LOG_INFO("test", "thread-" << t << "-msg-" << i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<int>(records.size()), num_threads * messages_per_thread);
}

TEST_F(LoggerTest, InitWithFilterLowersGlobalLevel) {
    LogConfig config;
    config.level = LogLevel::Warn;
    config.filter_spec = "parser=debug";
    config.console = false;
    Logger::init(config);

    // init() replaced the sinks; put the capture sink back
    Logger::instance().add_sink(std::make_unique<CaptureSink>(records));

    EXPECT_EQ(Logger::instance().level(), LogLevel::Debug);
    BFQ_LOG_DEBUG("parser", "shown");
    BFQ_LOG_INFO("lexer", "hidden");
    BFQ_LOG_WARN("lexer", "shown too");

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].message, "shown");
    EXPECT_EQ(records[1].message, "shown too");
}

// ============================================================================
// Command line and environment
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    std::vector<std::string> args_;
    std::vector<char*> argv_;

    void SetUp() override {
        unsetenv("BFQ_LOG");
    }

    void TearDown() override {
        unsetenv("BFQ_LOG");
    }

    auto parse(std::initializer_list<const char*> args) -> LogConfig {
        args_.assign({"bfq"});
        args_.insert(args_.end(), args.begin(), args.end());
        argv_.clear();
        for (auto& arg : args_) {
            argv_.push_back(arg.data());
        }
        return parse_log_options(static_cast<int>(argv_.size()), argv_.data());
    }
};

TEST_F(LogOptionsTest, DefaultsToWarn) {
    auto config = parse({"prog.b"});
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_TRUE(config.filter_spec.empty());
    EXPECT_TRUE(config.log_file.empty());
    EXPECT_EQ(config.format, LogFormat::Text);
}

TEST_F(LogOptionsTest, Verbosity) {
    EXPECT_EQ(parse({"-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse({"--verbose"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, ExplicitLevelWinsOverVerbosity) {
    EXPECT_EQ(parse({"-vvv", "--log-level=error"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, FileFilterAndFormat) {
    auto config = parse({"--log-file=bfq.log", "--log-filter=parser=debug", "--log-format=json"});
    EXPECT_EQ(config.log_file, "bfq.log");
    EXPECT_EQ(config.filter_spec, "parser=debug");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST_F(LogOptionsTest, EnvironmentLevel) {
    setenv("BFQ_LOG", "debug", 1);
    EXPECT_EQ(parse({"prog.b"}).level, LogLevel::Debug);
}

TEST_F(LogOptionsTest, EnvironmentFilter) {
    setenv("BFQ_LOG", "codegen=trace,*=warn", 1);
    auto config = parse({"prog.b"});
    EXPECT_EQ(config.filter_spec, "codegen=trace,*=warn");
    EXPECT_EQ(config.level, LogLevel::Warn);
}

TEST_F(LogOptionsTest, CommandLineBeatsEnvironment) {
    setenv("BFQ_LOG", "trace", 1);
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
}

TEST(LogOptionTest, Recognition) {
    EXPECT_TRUE(is_log_option("-v"));
    EXPECT_TRUE(is_log_option("-vvv"));
    EXPECT_TRUE(is_log_option("-q"));
    EXPECT_TRUE(is_log_option("--log-level=debug"));
    EXPECT_TRUE(is_log_option("--log-file=x"));
    EXPECT_FALSE(is_log_option("-V"));
    EXPECT_FALSE(is_log_option("-o"));
    EXPECT_FALSE(is_log_option("--emit=ast"));
    EXPECT_FALSE(is_log_option("prog.b"));
}
