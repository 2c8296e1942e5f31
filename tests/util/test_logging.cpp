// VERISCORE - Logging Tests
// Copyright (c) 2024 VERISCORE Developers
// MIT License

#include <gtest/gtest.h>

#include "veriscore/util/fs.h"
#include "veriscore/util/logging.h"

#include <chrono>
#include <string>
#include <vector>

namespace veriscore {
namespace util {
namespace {

// ============================================================================
// Logging Tests
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetCategoryFilter({});
        Logger::Instance().SetLevel(LogLevel::Info);
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetCategoryFilter({});
        Logger::Instance().SetLevel(LogLevel::Info);
    }

    std::shared_ptr<CallbackSink> Capture(LogLevel level = LogLevel::Trace) {
        auto sink = std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { captured_.push_back(entry); }, level);
        Logger::Instance().AddSink(sink);
        return sink;
    }

    std::vector<LogEntry> captured_;
};

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(LogLevelToString(LogLevel::Info), "INFO");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
}

TEST_F(LoggingTest, LogLevelFromString) {
    EXPECT_EQ(LogLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(LogLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("off"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("None"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("invalid"), LogLevel::Info);
}

TEST_F(LoggingTest, LoggerSingleton) {
    EXPECT_EQ(&Logger::Instance(), &Logger::Instance());
}

TEST_F(LoggingTest, LoggerAddAndClearSinks) {
    auto& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 0u);

    logger.AddSink(std::make_shared<ConsoleSink>());
    logger.AddSink(std::make_shared<ConsoleSink>(LogLevel::Error, false));
    EXPECT_EQ(logger.SinkCount(), 2u);

    logger.ClearSinks();
    EXPECT_EQ(logger.SinkCount(), 0u);
}

TEST_F(LoggingTest, LoggerWillLog) {
    auto& logger = Logger::Instance();
    EXPECT_FALSE(logger.WillLog(LogLevel::Debug, LogCategory::PROVER));
    EXPECT_TRUE(logger.WillLog(LogLevel::Info, LogCategory::PROVER));
    EXPECT_TRUE(logger.WillLog(LogLevel::Error, LogCategory::PROVER));
}

TEST_F(LoggingTest, LoggerCategoryFiltering) {
    auto& logger = Logger::Instance();
    logger.SetCategoryFilter({LogCategory::KEYS, LogCategory::PROVER});
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::KEYS));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::VERIFIER));

    logger.SetCategoryFilter({LogCategory::PROVER});
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::KEYS));
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::PROVER));

    // An empty filter means everything
    logger.SetCategoryFilter({});
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::VERIFIER));

    logger.SetCategoryFilter({LogCategory::CODEC});
    EXPECT_FALSE(logger.WillLog(LogLevel::Error, LogCategory::PROVER));
    logger.SetCategoryFilter({});
    EXPECT_TRUE(logger.WillLog(LogLevel::Error, LogCategory::PROVER));
}

TEST_F(LoggingTest, OffIsNeverLogged) {
    Logger::Instance().SetLevel(LogLevel::Trace);
    EXPECT_FALSE(Logger::Instance().WillLog(LogLevel::Off, LogCategory::PROVER));
}

TEST_F(LoggingTest, StreamMacroReachesSink) {
    Capture();
    LOG_INFO(LogCategory::CIRCUIT) << "constraints: " << 42;
    LOG_DEBUG(LogCategory::CIRCUIT) << "filtered by level";

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "constraints: 42");
    EXPECT_EQ(captured_[0].category, LogCategory::CIRCUIT);
    EXPECT_EQ(captured_[0].level, LogLevel::Info);
    EXPECT_GT(captured_[0].line, 0);
}

TEST_F(LoggingTest, CallbackSinkHonoursItsLevel) {
    Capture(LogLevel::Error);
    Logger::Instance().Log(LogLevel::Warn, LogCategory::DEFAULT, "dropped");
    Logger::Instance().Log(LogLevel::Error, LogCategory::DEFAULT, "kept");

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "kept");
}

TEST_F(LoggingTest, PhaseTimerLogsOneSummary) {
    Logger::Instance().SetLevel(LogLevel::Debug);
    Capture();
    {
        VERISCORE_LOG_TIMER(timer, LogCategory::PROVER, "prove threshold");
        timer.Phase("witness");
        timer.Phase("groth16");
        EXPECT_GE(timer.ElapsedMs(), 0);
        ASSERT_EQ(timer.Phases().size(), 2u);
        EXPECT_EQ(timer.Phases()[0].first, "witness");
        EXPECT_EQ(timer.Phases()[1].first, "groth16");
        EXPECT_TRUE(captured_.empty());
    }

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].level, LogLevel::Debug);
    EXPECT_EQ(captured_[0].message.rfind("prove threshold: witness=", 0), 0u);
    EXPECT_NE(captured_[0].message.find(" groth16="), std::string::npos);
    EXPECT_NE(captured_[0].message.find(" total="), std::string::npos);
}

TEST_F(LoggingTest, PhaseTimerSilentAtInfo) {
    Capture();
    {
        VERISCORE_LOG_TIMER(timer, LogCategory::KEYS, "setup");
        timer.Phase("generator");
    }
    EXPECT_TRUE(captured_.empty());
}

TEST_F(LoggingTest, FormatLogEntry) {
    LogEntry entry;
    entry.level = LogLevel::Warn;
    entry.category = LogCategory::KEYS;
    entry.message = "stale key";
    entry.file = "/src/proof/keystore.cpp";
    entry.line = 42;
    entry.timestamp = std::chrono::system_clock::now();

    const std::string plain = FormatLogEntry(entry, false);
    EXPECT_NE(plain.find("[WARN] [keys] stale key"), std::string::npos);
    EXPECT_EQ(plain.find("keystore.cpp"), std::string::npos);

    const std::string sourced = FormatLogEntry(entry, true);
    EXPECT_NE(sourced.find("[keys] keystore.cpp:42 stale key"), std::string::npos);

    entry.category = LogCategory::DEFAULT;
    EXPECT_EQ(FormatLogEntry(entry, false).find("[default]"), std::string::npos);
}

TEST_F(LoggingTest, ConfigureLoggingWithFileAndCategories) {
    fs::TempDirectory dir;
    ASSERT_TRUE(dir.IsValid());

    LogOptions options;
    options.level = LogLevel::Debug;
    options.printToConsole = false;
    options.file = fs::JoinPath(dir.GetPath(), "veriscore.log");
    options.categories = {LogCategory::KEYS};
    ASSERT_TRUE(ConfigureLogging(options));

    EXPECT_EQ(Logger::Instance().SinkCount(), 1u);
    EXPECT_TRUE(Logger::Instance().WillLog(LogLevel::Debug, LogCategory::KEYS));
    EXPECT_FALSE(Logger::Instance().WillLog(LogLevel::Debug, LogCategory::CODEC));

    LOG_DEBUG(LogCategory::KEYS) << "written to file";
    Logger::Instance().Flush();
    Logger::Instance().ClearSinks();

    std::string content;
    ASSERT_TRUE(fs::ReadFile(options.file, content));
    EXPECT_NE(content.find("written to file"), std::string::npos);
}

TEST_F(LoggingTest, ConfigureLoggingBadFile) {
    LogOptions options;
    options.printToConsole = false;
    options.file = "/nonexistent/dir/veriscore.log";
    EXPECT_FALSE(ConfigureLogging(options));
}

TEST_F(LoggingTest, GetBasename) {
    EXPECT_EQ(GetBasename("/a/b/prover.cpp"), "prover.cpp");
    EXPECT_EQ(GetBasename("prover.cpp"), "prover.cpp");
}

} // namespace
} // namespace util
} // namespace veriscore
