/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 * @brief Logger 单元测试
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#include <gtest/gtest.h>
#ifdef SCRIPTLOG_HAS_RAPIDCHECK
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>
#endif

#include <unistd.h>

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include <scriptlog/macros.hpp>
#include <scriptlog/scriptlog.hpp>

#include "test_helpers.hpp"

namespace scriptlog {
namespace test {

/**
 * @brief Logger with in-memory console and journal sinks
 * @brief 使用内存控制台和系统日志 Sink 的 Logger
 */
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.IsValid());
        logger = std::make_unique<Logger>(capture.Handler());
        logger->GetRouter().SetStdoutSink(out);
        logger->GetRouter().SetStderrSink(err);
        logger->GetRouter().SetJournalSink(journal);
    }

    InitOptions BaseOptions() const {
        InitOptions options;
        options.programName = "nightly.sh";
        options.colorMode = "never";
        return options;
    }

    std::string LogPath() const { return dir.File("logs/nightly.log"); }

    TempDir dir;
    DiagnosticCapture capture;
    std::unique_ptr<Logger> logger;
    std::shared_ptr<MockSink> out = std::make_shared<MockSink>();
    std::shared_ptr<MockSink> err = std::make_shared<MockSink>();
    std::shared_ptr<MockJournalSink> journal = std::make_shared<MockJournalSink>();
};

// ==============================================================================
// Initialization / 初始化
// ==============================================================================

TEST_F(LoggerTest, DefaultsWithoutInit) {
    EXPECT_FALSE(logger->IsInitialized());
    EXPECT_EQ(logger->GetLevel(), Level::Info);
    logger->Info("before init");
    ASSERT_EQ(out->Lines().size(), 1u);
    EXPECT_TRUE(Contains(out->Lines()[0], "[INFO] [unknown] before init"));
}

/**
 * @brief Init with a file writes the INIT line first
 * @brief 带文件初始化时首先写入 INIT 行
 */
TEST_F(LoggerTest, InitWritesInitLine) {
    auto options = BaseOptions();
    options.logFile = LogPath();
    ASSERT_EQ(logger->Init(options), ErrorCode::Success);
    EXPECT_TRUE(logger->IsInitialized());

    logger->Info("started");
    const auto lines = ReadLines(LogPath());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_TRUE(Contains(lines[0], "[INIT] [nightly.sh] Logger initialized by nightly.sh"));
    EXPECT_TRUE(Contains(lines[1], "[INFO] [nightly.sh] started"));
    ASSERT_EQ(out->Lines().size(), 1u);
    EXPECT_TRUE(Contains(out->Lines()[0], "started"));
}

TEST_F(LoggerTest, InitDebugSummary) {
    auto options = BaseOptions();
    options.level = "DEBUG";
    ASSERT_EQ(logger->Init(options), ErrorCode::Success);
    ASSERT_EQ(out->Lines().size(), 1u);
    EXPECT_TRUE(Contains(out->Lines()[0],
                         "Logger initialized by nightly.sh (console=true, file=false, "
                         "journal=false, level=DEBUG)"));
}

/**
 * @brief Explicit options override the config file
 * @brief 显式选项覆盖配置文件
 */
TEST_F(LoggerTest, OptionsOverrideConfig) {
    const std::string config = dir.File("job.conf");
    WriteFile(config, "[logging]\nlevel = ERROR\nformat = %l|%m\nscript_name = fromconfig\n");

    auto options = BaseOptions();
    options.configPath = config;
    options.level = "DEBUG";
    ASSERT_EQ(logger->Init(options), ErrorCode::Success);

    EXPECT_EQ(logger->GetLevel(), Level::Debug);
    EXPECT_EQ(logger->GetState().format, "%l|%m");
    EXPECT_EQ(logger->GetState().scriptName, "fromconfig");
}

TEST_F(LoggerTest, LevelWinsOverVerbose) {
    auto options = BaseOptions();
    options.verbose = true;
    options.level = "WARN";
    ASSERT_EQ(logger->Init(options), ErrorCode::Success);
    EXPECT_EQ(logger->GetLevel(), Level::Warn);
}

TEST_F(LoggerTest, MissingConfigFails) {
    auto options = BaseOptions();
    options.configPath = dir.File("absent.conf");
    EXPECT_EQ(logger->Init(options), ErrorCode::ConfigFileNotFound);
    EXPECT_FALSE(logger->IsInitialized());

    options.configPath = std::string();
    EXPECT_EQ(logger->Init(options), ErrorCode::MissingOptionValue);
    EXPECT_TRUE(capture.Has("--config requires a file path"));
}

TEST_F(LoggerTest, RelativeLogFileFails) {
    auto options = BaseOptions();
    options.logFile = "relative.log";
    EXPECT_EQ(logger->Init(options), ErrorCode::RelativePath);
    EXPECT_TRUE(capture.HasError("must be an absolute path"));
}

/**
 * @brief A failed re-init keeps the previous session intact
 * @brief 重新初始化失败时保持之前的会话不变
 */
TEST_F(LoggerTest, FailedInitKeepsPreviousSession) {
    auto options = BaseOptions();
    options.logFile = LogPath();
    ASSERT_EQ(logger->Init(options), ErrorCode::Success);

    const std::string link = dir.File("link.log");
    ASSERT_EQ(::symlink(dir.File("elsewhere.log").c_str(), link.c_str()), 0);
    auto bad = BaseOptions();
    bad.level = "DEBUG";
    bad.logFile = link;
    EXPECT_EQ(logger->Init(bad), ErrorCode::SymlinkRejected);
    EXPECT_TRUE(capture.HasError("symbolic link"));
    EXPECT_FALSE(Contains(capture.Joined(), "link.log"));

    EXPECT_EQ(logger->GetLevel(), Level::Info);
    logger->Info("still here");
    const auto lines = ReadLines(LogPath());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_TRUE(Contains(lines[1], "still here"));
}

/**
 * @brief Re-initializing on the same path validates it again
 * @brief 对同一路径重新初始化时会再次校验
 */
TEST_F(LoggerTest, ReinitRevalidatesSamePath) {
    auto options = BaseOptions();
    options.logFile = LogPath();
    ASSERT_EQ(logger->Init(options), ErrorCode::Success);
    ASSERT_EQ(logger->Init(options), ErrorCode::Success);
    EXPECT_EQ(ReadLines(LogPath()).size(), 2u);

    const std::string target = dir.File("target.txt");
    WriteFile(target, "target\n");
    ASSERT_EQ(::unlink(LogPath().c_str()), 0);
    ASSERT_EQ(::symlink(target.c_str(), LogPath().c_str()), 0);

    EXPECT_EQ(logger->Init(options), ErrorCode::SymlinkRejected);
    EXPECT_EQ(ReadFile(target), "target\n");
}

/**
 * @brief A regular file renamed over the log path after Init gets no records
 * @brief Init 后被重命名覆盖到日志路径上的普通文件不会收到记录
 */
TEST_F(LoggerTest, ReplacedLogFileIsNotWritten) {
    auto options = BaseOptions();
    options.logFile = LogPath();
    options.quiet = true;
    ASSERT_EQ(logger->Init(options), ErrorCode::Success);

    const std::string victim = dir.File("victim.txt");
    WriteFile(victim, "victim\n");
    ASSERT_EQ(::rename(victim.c_str(), LogPath().c_str()), 0);

    logger->Info("after swap");
    logger->Info("still swapped");
    EXPECT_EQ(ReadFile(LogPath()), "victim\n");
    EXPECT_EQ(capture.CountMatching("replaced by another file"), 1u);
}

TEST_F(LoggerTest, InitFromArguments) {
    const std::string path = LogPath();
    const char* argv[] = {"/usr/local/bin/rotate.sh", "--max-line-length", "100",
                          "-l",                       path.c_str(),        "--no-color"};
    ASSERT_EQ(logger->Init(6, argv), ErrorCode::Success);
    EXPECT_EQ(logger->GetState().scriptName, "rotate.sh");

    logger->Info(std::string(300, 'x'));
    const auto lines = ReadLines(path);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_TRUE(Contains(lines[1], "[rotate.sh] " + std::string(100, 'x')));
    EXPECT_FALSE(Contains(lines[1], std::string(101, 'x')));
}

TEST_F(LoggerTest, BadArgumentsFail) {
    const char* argv[] = {"job.sh", "--config"};
    EXPECT_EQ(logger->Init(2, argv), ErrorCode::MissingOptionValue);
    EXPECT_FALSE(logger->IsInitialized());
}

// ==============================================================================
// Logging / 日志记录
// ==============================================================================

/**
 * @brief Injected newlines and escapes never reach the file
 * @brief 注入的换行和转义序列不会写入文件
 */
TEST_F(LoggerTest, MessagesAreSanitized) {
    auto options = BaseOptions();
    options.logFile = LogPath();
    ASSERT_EQ(logger->Init(options), ErrorCode::Success);

    logger->Warn("user input: ok\n2024-01-01 00:00:00 [ERROR] [root] forged\x1b[2J");
    const auto lines = ReadLines(LogPath());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_TRUE(Contains(lines[1], "user input: ok 2024-01-01 00:00:00 [ERROR] [root] forged"));
    EXPECT_FALSE(Contains(lines[1], "\x1b"));
}

TEST_F(LoggerTest, UnsafeNewlinesKeepsLineBreaks) {
    auto options = BaseOptions();
    options.unsafeAllowNewlines = true;
    ASSERT_EQ(logger->Init(options), ErrorCode::Success);
    logger->Info("a\nb");
    ASSERT_EQ(out->Lines().size(), 1u);
    EXPECT_TRUE(Contains(out->Lines()[0], "a\nb"));
}

TEST_F(LoggerTest, FormatOverloads) {
    ASSERT_EQ(logger->Init(BaseOptions()), ErrorCode::Success);
    logger->Notice("copied {} of {} files", 3, 7);
    logger->Error("exit code {}", 2);
    ASSERT_EQ(out->Lines().size(), 1u);
    EXPECT_TRUE(Contains(out->Lines()[0], "[NOTICE] [nightly.sh] copied 3 of 7 files"));
    ASSERT_EQ(err->Lines().size(), 1u);
    EXPECT_TRUE(Contains(err->Lines()[0], "[ERROR] [nightly.sh] exit code 2"));
}

TEST_F(LoggerTest, FatalIsEmergency) {
    ASSERT_EQ(logger->Init(BaseOptions()), ErrorCode::Success);
    logger->Fatal("giving up");
    ASSERT_EQ(err->Lines().size(), 1u);
    EXPECT_TRUE(Contains(err->Lines()[0], "[EMERGENCY]"));
}

/**
 * @brief Sensitive records reach a terminal console but never the file or journal
 * @brief 敏感记录只输出到终端控制台，不写入文件或系统日志
 */
TEST_F(LoggerTest, SensitiveNeverReachesFile) {
    out->SetTerminal(true);
    auto options = BaseOptions();
    options.logFile = LogPath();
    options.journal = true;
    ASSERT_EQ(logger->Init(options), ErrorCode::Success);

    logger->Sensitive("password={}", "hunter2");
    ASSERT_EQ(out->Lines().size(), 1u);
    EXPECT_TRUE(Contains(out->Lines()[0], "[SENSITIVE] [nightly.sh] password=hunter2"));
    EXPECT_FALSE(Contains(ReadFile(LogPath()), "hunter2"));
    EXPECT_TRUE(journal->Messages().empty());
}

TEST_F(LoggerTest, JournalForwarding) {
    auto options = BaseOptions();
    options.journal = true;
    options.journalTag = "backup";
    ASSERT_EQ(logger->Init(options), ErrorCode::Success);

    logger->Error("disk full");
    ASSERT_EQ(journal->Messages().size(), 1u);
    EXPECT_EQ(journal->Messages()[0].text, "disk full");
    EXPECT_EQ(journal->Messages()[0].facility, "daemon.err");
    EXPECT_EQ(journal->Messages()[0].tag, "backup");
}

TEST_F(LoggerTest, JournalRequestedWithoutUtility) {
    journal->SetAvailable(false);
    auto options = BaseOptions();
    options.journal = true;
    ASSERT_EQ(logger->Init(options), ErrorCode::Success);
    EXPECT_FALSE(logger->GetState().journalEnabled);
    EXPECT_TRUE(capture.Has("logger command not found"));
}

// ==============================================================================
// Runtime Configuration / 运行时配置
// ==============================================================================

/**
 * @brief Setters emit a CONFIG record regardless of the threshold
 * @brief 设置函数输出 CONFIG 记录，不受阈值影响
 */
TEST_F(LoggerTest, SetLevelEmitsAudit) {
    auto options = BaseOptions();
    options.logFile = LogPath();
    ASSERT_EQ(logger->Init(options), ErrorCode::Success);

    EXPECT_EQ(logger->SetLevel("EMERGENCY"), ErrorCode::Success);
    EXPECT_EQ(logger->GetLevel(), Level::Emergency);
    ASSERT_EQ(out->Lines().size(), 1u);
    EXPECT_TRUE(Contains(out->Lines()[0], "[CONFIG] [nightly.sh] Log level changed from INFO "
                                          "to EMERGENCY"));
    const auto lines = ReadLines(LogPath());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_TRUE(Contains(lines[1], "[CONFIG]"));

    logger->Error("filtered");
    EXPECT_TRUE(err->Empty());
}

TEST_F(LoggerTest, InvalidLevelKeepsOld) {
    ASSERT_EQ(logger->Init(BaseOptions()), ErrorCode::Success);
    EXPECT_EQ(logger->SetLevel("LOUD"), ErrorCode::InvalidArgument);
    EXPECT_EQ(logger->SetLevel(static_cast<Level>(12)), ErrorCode::InvalidArgument);
    EXPECT_EQ(logger->GetLevel(), Level::Info);
    EXPECT_TRUE(out->Empty());
}

TEST_F(LoggerTest, SetFormat) {
    ASSERT_EQ(logger->Init(BaseOptions()), ErrorCode::Success);
    EXPECT_EQ(logger->SetFormat("%l: %m"), ErrorCode::Success);
    logger->Info("hi");
    ASSERT_EQ(out->Lines().size(), 2u);
    EXPECT_EQ(out->Lines()[0],
              "CONFIG: Log format changed from \"%d [%l] [%s] %m\" to \"%l: %m\"");
    EXPECT_EQ(out->Lines()[1], "INFO: hi");

    EXPECT_EQ(logger->SetFormat("%m\n%m"), ErrorCode::InvalidArgument);
    EXPECT_EQ(logger->GetState().format, "%l: %m");
}

TEST_F(LoggerTest, SetJournalEnabled) {
    ASSERT_EQ(logger->Init(BaseOptions()), ErrorCode::Success);
    EXPECT_EQ(logger->SetJournalEnabled(true), ErrorCode::Success);
    ASSERT_EQ(journal->Messages().size(), 1u);
    EXPECT_EQ(journal->Messages()[0].text, "CONFIG: Journal logging changed from false to true");
    EXPECT_EQ(journal->Messages()[0].facility, "daemon.notice");

    EXPECT_EQ(logger->SetJournalEnabled(false), ErrorCode::Success);
    EXPECT_EQ(journal->Messages().size(), 2u);

    journal->SetAvailable(false);
    EXPECT_EQ(logger->SetJournalEnabled(true), ErrorCode::JournalUnavailable);
    EXPECT_FALSE(logger->GetState().journalEnabled);
}

TEST_F(LoggerTest, SetJournalTag) {
    ASSERT_EQ(logger->Init(BaseOptions()), ErrorCode::Success);
    EXPECT_EQ(logger->SetJournalTag("tag;rm"), ErrorCode::Success);
    EXPECT_EQ(logger->GetState().journalTag, "tag_rm");
    EXPECT_EQ(logger->SetJournalTag(""), ErrorCode::InvalidArgument);
    EXPECT_EQ(logger->GetState().journalTag, "tag_rm");
}

/**
 * @brief The tag change is announced in the journal under the old tag
 * @brief 标签变更以旧标签发布到系统日志
 */
TEST_F(LoggerTest, JournalTagChangeUsesOldTag) {
    auto options = BaseOptions();
    options.journal = true;
    options.journalTag = "before";
    ASSERT_EQ(logger->Init(options), ErrorCode::Success);

    ASSERT_EQ(logger->SetJournalTag("after"), ErrorCode::Success);
    ASSERT_FALSE(journal->Messages().empty());
    const auto& notice = journal->Messages().back();
    EXPECT_EQ(notice.tag, "before");
    EXPECT_EQ(notice.text, "CONFIG: Journal tag changing from \"before\" to \"after\"");

    logger->Info("tagged");
    EXPECT_EQ(journal->Messages().back().tag, "after");
}

TEST_F(LoggerTest, SetScriptName) {
    ASSERT_EQ(logger->Init(BaseOptions()), ErrorCode::Success);
    EXPECT_EQ(logger->SetScriptName("new name"), ErrorCode::Success);
    EXPECT_EQ(logger->GetState().scriptName, "new_name");
    EXPECT_EQ(logger->SetScriptName(""), ErrorCode::InvalidArgument);
}

TEST_F(LoggerTest, UnsafeSettersWarnInAudit) {
    ASSERT_EQ(logger->Init(BaseOptions()), ErrorCode::Success);
    EXPECT_EQ(logger->SetUnsafeAllowAnsi(true), ErrorCode::Success);
    EXPECT_EQ(logger->SetUnsafeAllowNewlines(true), ErrorCode::Success);
    ASSERT_EQ(out->Lines().size(), 2u);
    EXPECT_TRUE(Contains(out->Lines()[0], "WARNING"));
    EXPECT_TRUE(Contains(out->Lines()[1], "WARNING"));
    EXPECT_TRUE(logger->GetState().unsafeAllowAnsi);

    EXPECT_EQ(logger->SetUnsafeAllowAnsi(false), ErrorCode::Success);
    EXPECT_FALSE(Contains(out->Lines()[2], "WARNING"));
}

TEST_F(LoggerTest, OtherSetters) {
    ASSERT_EQ(logger->Init(BaseOptions()), ErrorCode::Success);
    EXPECT_EQ(logger->SetTimezoneUtc(true), ErrorCode::Success);
    EXPECT_TRUE(logger->GetState().useUtc);
    EXPECT_EQ(logger->SetColorMode("bogus"), ErrorCode::InvalidArgument);
    EXPECT_EQ(logger->SetColorMode("never"), ErrorCode::Success);
    EXPECT_EQ(logger->SetStderrLevel("WARN"), ErrorCode::Success);
    EXPECT_EQ(logger->GetState().stderrLevel, Level::Warn);
    EXPECT_EQ(logger->SetConsoleEnabled(false), ErrorCode::Success);

    out->Clear();
    logger->Warn("silent");
    EXPECT_TRUE(out->Empty());
    EXPECT_TRUE(err->Empty());
}

// ==============================================================================
// Default Logger and Macros / 默认日志器与宏
// ==============================================================================

TEST(DefaultLoggerTest, MacrosUseDefaultLogger) {
    DiagnosticCapture capture;
    auto logger = std::make_shared<Logger>(capture.Handler());
    auto out = std::make_shared<MockSink>();
    auto err = std::make_shared<MockSink>();
    logger->GetRouter().SetStdoutSink(out);
    logger->GetRouter().SetStderrSink(err);
    ASSERT_EQ(logger->SetColorMode(ColorMode::Never), ErrorCode::Success);
    out->Clear();

    SetDefaultLogger(logger);
    EXPECT_EQ(DefaultLogger(), logger);

    SCRIPTLOG_INFO("processed {} rows", 42);
    SCRIPTLOG_DEBUG("hidden");
    SCRIPTLOG_ERROR("failed");
    SCRIPTLOG_FATAL("fatal");

    ASSERT_EQ(out->Lines().size(), 1u);
    EXPECT_TRUE(Contains(out->Lines()[0], "processed 42 rows"));
    ASSERT_EQ(err->Lines().size(), 2u);

    SetDefaultLogger(nullptr);
    EXPECT_NE(DefaultLogger(), nullptr);
    SetDefaultLogger(nullptr);
}

TEST(DefaultLoggerTest, FailedInitKeepsDefault) {
    auto existing = std::make_shared<Logger>([](DiagnosticLevel, std::string_view) {});
    SetDefaultLogger(existing);

    InitOptions options;
    options.logFile = "not/absolute.log";
    EXPECT_EQ(Init(options), ErrorCode::RelativePath);
    EXPECT_EQ(DefaultLogger(), existing);
    SetDefaultLogger(nullptr);
}

// ==============================================================================
// Property-Based Tests / 属性测试
// ==============================================================================

#ifdef SCRIPTLOG_HAS_RAPIDCHECK

/**
 * @brief Property: whatever is logged, each record is exactly one file line
 * @brief 属性：无论记录什么内容，每条记录恰好是文件中的一行
 */
RC_GTEST_PROP(LoggerPropertyTest, OneLinePerRecord, (const std::vector<std::string>& messages)) {
    TempDir dir;
    RC_PRE(dir.IsValid());
    Logger logger([](DiagnosticLevel, std::string_view) {});
    logger.GetRouter().SetStdoutSink(std::make_shared<MockSink>());
    logger.GetRouter().SetStderrSink(std::make_shared<MockSink>());

    InitOptions options;
    options.logFile = dir.File("p.log");
    RC_ASSERT(logger.Init(options) == ErrorCode::Success);
    for (const auto& message : messages) {
        logger.Warn(message);
    }
    RC_ASSERT(ReadLines(dir.File("p.log")).size() == messages.size() + 1);
}

#endif  // SCRIPTLOG_HAS_RAPIDCHECK

}  // namespace test
}  // namespace scriptlog
