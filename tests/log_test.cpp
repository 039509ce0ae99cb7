//! # Logger Unit Tests
//!
//! LogFilter parsing, FileSink I/O, JSON output, level and module filtering,
//! thread safety, and command-line option parsing.

#include "log/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace argschema::log;
namespace fs = std::filesystem;

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("schema=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "schema"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "schema"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "schema"));

    // Unmatched modules use the default
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "cli"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "cli"));
}

TEST_F(LogFilterTest, ParseModuleOff) {
    filter.parse("reader=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "reader"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "schema"));
}

TEST_F(LogFilterTest, ParseBareModuleName) {
    // Bare module name enables Trace for it
    filter.parse("analyzer");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "analyzer"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "config"));
}

TEST_F(LogFilterTest, ParseMultipleModules) {
    filter.parse("schema=trace,config=info,cli=warn,*=error");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "schema"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "config"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "config"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "cli"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "cli"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "metadata"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "metadata"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("schema=trace,*=error");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, EmptyFilter) {
    filter.parse("");
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "anything"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "anything"));
}

// ============================================================================
// Helper: Capture sink that stores records in memory
// ============================================================================

class CaptureSink : public LogSink {
public:
    void write(const LogRecord& record) override {
        records.push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {}

    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    std::vector<Entry> records;
};

/// Routes the global logger into a CaptureSink for the duration of a test.
class LoggerCaptureTest : public ::testing::Test {
protected:
    CaptureSink* capture = nullptr;

    void SetUp() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        auto sink = std::make_unique<CaptureSink>();
        capture = sink.get();
        logger.add_sink(std::move(sink));
    }

    void TearDown() override {
        LogConfig defaults;
        defaults.colors = false;
        Logger::init(defaults);
    }
};

// ============================================================================
// Formatting
// ============================================================================

namespace {

auto make_record(LogLevel level, std::string_view module, std::string message) -> LogRecord {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = std::move(message);
    record.file = __FILE__;
    record.line = __LINE__;
    record.timestamp_ms = 1234567890;
    return record;
}

} // namespace

TEST(LogFormatTest, TextContainsLevelModuleAndMessage) {
    auto line = format_text(make_record(LogLevel::Warn, "config", "unknown key 'x'"));
    EXPECT_NE(line.find("WARN "), std::string::npos);
    EXPECT_NE(line.find("[config] unknown key 'x'"), std::string::npos);
}

TEST(LogFormatTest, JsonEscapesMessage) {
    auto line = format_json(make_record(LogLevel::Error, "cli", "bad \"path\"\n"));
    EXPECT_EQ(line, R"({"ts":1234567890,"level":"ERROR","module":"cli","msg":"bad \"path\"\n"})");
}

TEST(ConsoleSinkTest, WritesWithoutColors) {
    // Output goes to stderr; only checks that writing succeeds.
    ConsoleSink sink(false);
    sink.write(make_record(LogLevel::Info, "test", "hello"));
    sink.set_format(LogFormat::JSON);
    sink.write(make_record(LogLevel::Info, "test", "hello"));
    sink.flush();
}

// ============================================================================
// FileSink Creation, Append, and Flush
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() / "argschema_log_test.log";
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
        sink.write(make_record(LogLevel::Info, "test", "file sink test"));
        sink.flush();
    }

    ASSERT_TRUE(fs::exists(temp_file));
    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[test]"), std::string::npos);
    EXPECT_NE(content.find("file sink test"), std::string::npos);
}

TEST_F(FileSinkTest, AppendsToExistingFile) {
    {
        FileSink sink(temp_file.string(), true);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "m1", "first"));
    }
    {
        FileSink sink(temp_file.string(), true);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Warn, "m2", "second"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, TruncatesWithoutAppend) {
    {
        FileSink sink(temp_file.string(), false);
        sink.write(make_record(LogLevel::Info, "m1", "first"));
    }
    {
        FileSink sink(temp_file.string(), false);
        sink.write(make_record(LogLevel::Info, "m1", "second"));
    }

    std::string content = read_file(temp_file);
    EXPECT_EQ(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, JsonFormatCreatesValidLines) {
    {
        FileSink sink(temp_file.string(), false);
        sink.set_format(LogFormat::JSON);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Error, "metadata", "cannot open options.json"));
    }

    std::string content = read_file(temp_file);
    EXPECT_EQ(content.rfind("{\"ts\":", 0), 0u);
    EXPECT_NE(content.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(content.find("\"module\":\"metadata\""), std::string::npos);
    EXPECT_NE(content.find("\"msg\":\"cannot open options.json\"}\n"), std::string::npos);
}

// ============================================================================
// Level and Module Filtering
// ============================================================================

TEST_F(LoggerCaptureTest, DebugHiddenAtInfoLevel) {
    Logger::instance().set_level(LogLevel::Info);

    ARGSCHEMA_LOG_DEBUG("schema", "hidden");
    ARGSCHEMA_LOG_INFO("schema", "shown " << 42);

    ASSERT_EQ(capture->records.size(), 1u);
    EXPECT_EQ(capture->records[0].message, "shown 42");
    EXPECT_EQ(capture->records[0].module, "schema");
}

TEST_F(LoggerCaptureTest, AllHiddenAtOff) {
    Logger::instance().set_level(LogLevel::Off);

    ARGSCHEMA_LOG_ERROR("cli", "hidden");
    ARGSCHEMA_LOG_FATAL("cli", "hidden");

    EXPECT_TRUE(capture->records.empty());
}

TEST_F(LoggerCaptureTest, ModuleFilter) {
    Logger::instance().set_filter("schema=trace,*=error");

    ARGSCHEMA_LOG_TRACE("schema", "schema trace");
    ARGSCHEMA_LOG_WARN("config", "config warn");
    ARGSCHEMA_LOG_ERROR("config", "config error");

    ASSERT_EQ(capture->records.size(), 2u);
    EXPECT_EQ(capture->records[0].message, "schema trace");
    EXPECT_EQ(capture->records[1].message, "config error");
}

// ============================================================================
// Thread Safety
// ============================================================================

TEST_F(LoggerCaptureTest, ConcurrentLogging) {
    auto& logger = Logger::instance();
    logger.set_level(LogLevel::Trace);

    const int num_threads = 8;
    const int messages_per_thread = 100;

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([t]() {
            for (int i = 0; i < messages_per_thread; i++) {
                ARGSCHEMA_LOG_INFO("test", "thread-" << t << "-msg-" << i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<int>(capture->records.size()), num_threads * messages_per_thread);
}

// ============================================================================
// Level Helpers
// ============================================================================

TEST(LogLevelHelpersTest, LevelNameRoundTrip) {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                       LogLevel::Error, LogLevel::Fatal, LogLevel::Off}) {
        EXPECT_EQ(parse_level(level_name(level)), level);
    }
}

TEST(LogLevelHelpersTest, ParseUnknownDefaultsToInfo) {
    EXPECT_EQ(parse_level("loud"), LogLevel::Info);
    EXPECT_EQ(parse_level("warning"), LogLevel::Warn);
}

TEST(TimestampTest, GetTimestampFormat) {
    auto ts = get_timestamp();
    ASSERT_EQ(ts.size(), 12u);
    EXPECT_EQ(ts[2], ':');
    EXPECT_EQ(ts[5], ':');
    EXPECT_EQ(ts[8], '.');
}

// ============================================================================
// Command-line Options
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("ARGSCHEMA_LOG");
    }

    void TearDown() override {
        unsetenv("ARGSCHEMA_LOG");
    }

    auto parse(std::vector<std::string> args) -> LogConfig {
        args.insert(args.begin(), "argschema");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return parse_log_options(static_cast<int>(argv.size()), argv.data());
    }
};

TEST_F(LogOptionsTest, DefaultsToWarn) {
    auto config = parse({"check", "options.json"});
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_TRUE(config.filter_spec.empty());
    EXPECT_TRUE(config.log_file.empty());
}

TEST_F(LogOptionsTest, ExplicitOptions) {
    auto config = parse({"check", "--log-level=debug", "--log-filter=schema=trace",
                         "--log-file=run.log", "--log-format=json", "--no-color"});
    EXPECT_EQ(config.level, LogLevel::Debug);
    EXPECT_EQ(config.filter_spec, "schema=trace");
    EXPECT_EQ(config.log_file, "run.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
    EXPECT_FALSE(config.colors);
}

TEST_F(LogOptionsTest, VerbosityFlags) {
    EXPECT_EQ(parse({"-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
    // An explicit level wins over -v
    EXPECT_EQ(parse({"-vvv", "--log-level=error"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, EnvironmentFallback) {
    setenv("ARGSCHEMA_LOG", "debug", 1);
    EXPECT_EQ(parse({"check"}).level, LogLevel::Debug);

    setenv("ARGSCHEMA_LOG", "schema=trace,*=warn", 1);
    EXPECT_EQ(parse({"check"}).filter_spec, "schema=trace,*=warn");

    // Command-line options take precedence
    EXPECT_EQ(parse({"check", "-q"}).filter_spec, "");
}
