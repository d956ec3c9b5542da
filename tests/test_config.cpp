/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading
 * @brief 配置加载单元测试
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#include <gtest/gtest.h>
#ifdef SCRIPTLOG_HAS_RAPIDCHECK
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>
#endif

#include <string>

#include <scriptlog/config.hpp>

#include "test_helpers.hpp"

namespace scriptlog {
namespace test {

/**
 * @brief Loader with captured diagnostics and a controllable journal probe
 * @brief 带诊断捕获和可控系统日志探测的加载器
 */
class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        diagnostics.SetHandler(capture.Handler());
        loader.SetJournalProbe([this] { return journalAvailable; });
    }

    DiagnosticCapture capture;
    Diagnostics diagnostics;
    ConfigLoader loader{diagnostics};
    SessionState state;
    bool journalAvailable{true};
};

// ==============================================================================
// Keys / 键
// ==============================================================================

TEST(SettingKeyTest, CanonicalAndAliases) {
    EXPECT_EQ(LookupSettingKey("level"), SettingKey::Level);
    EXPECT_EQ(LookupSettingKey("LOG_LEVEL"), SettingKey::Level);
    EXPECT_EQ(LookupSettingKey("log-file"), SettingKey::LogFile);
    EXPECT_EQ(LookupSettingKey("logfile"), SettingKey::LogFile);
    EXPECT_EQ(LookupSettingKey("use_journal"), SettingKey::Journal);
    EXPECT_EQ(LookupSettingKey("journal_tag"), SettingKey::Tag);
    EXPECT_EQ(LookupSettingKey("use_colors"), SettingKey::Color);
    EXPECT_EQ(LookupSettingKey("Unsafe-Allow-ANSI-Codes"), SettingKey::UnsafeAllowAnsi);
    EXPECT_EQ(LookupSettingKey("max_line_length"), SettingKey::MaxLineLength);
    EXPECT_EQ(LookupSettingKey("colour"), SettingKey::Unknown);
    EXPECT_EQ(SettingKeyName(SettingKey::LogFile), "log_file");
    EXPECT_EQ(SettingKeyName(SettingKey::Unknown), "unknown");
}

// ==============================================================================
// Parsing / 解析
// ==============================================================================

/**
 * @brief A full [logging] section is applied
 * @brief 完整的 [logging] 节被应用
 */
TEST_F(ConfigTest, FullSection) {
    loader.LoadFromString(
        "# deploy settings\n"
        "[logging]\n"
        "level = DEBUG\n"
        "log_file = \"/var/log/deploy.log\"\n"
        "format = '%l: %m'\n"
        "utc = yes\n"
        "journal = true\n"
        "tag = deployer\n"
        "color = never\n"
        "stderr_level = WARN\n"
        "script_name = deploy.sh\n"
        "max_line_length = 200\n"
        "max_journal_length = 100\n",
        state);

    EXPECT_EQ(state.level, Level::Debug);
    EXPECT_EQ(state.logFile, "/var/log/deploy.log");
    EXPECT_EQ(state.format, "%l: %m");
    EXPECT_TRUE(state.useUtc);
    EXPECT_TRUE(state.journalEnabled);
    EXPECT_EQ(state.journalTag, "deployer");
    EXPECT_EQ(state.colorMode, ColorMode::Never);
    EXPECT_EQ(state.stderrLevel, Level::Warn);
    EXPECT_EQ(state.scriptName, "deploy.sh");
    EXPECT_EQ(state.maxLineLength, 200u);
    EXPECT_EQ(state.maxJournalLength, 100u);
    EXPECT_EQ(capture.Count(), 0u);
}

TEST_F(ConfigTest, CommentsBlankLinesAndWhitespace) {
    loader.LoadFromString("\n; comment\n   # another\n\t level\t=\twarn  \n", state);
    EXPECT_EQ(state.level, Level::Warn);
    EXPECT_EQ(capture.Count(), 0u);
}

TEST_F(ConfigTest, KeysBeforeHeaderCountAsLogging) {
    loader.LoadFromString("level = ERROR\n", state);
    EXPECT_EQ(state.level, Level::Error);
}

/**
 * @brief Other sections are ignored with one warning each
 * @brief 其他节被忽略，每节只警告一次
 */
TEST_F(ConfigTest, OtherSectionsIgnored) {
    loader.LoadFromString(
        "[other]\nlevel = DEBUG\n[other]\nlevel = DEBUG\n[LOGGING]\nutc = true\n", state);
    EXPECT_EQ(state.level, Level::Info);
    EXPECT_TRUE(state.useUtc);
    EXPECT_EQ(capture.CountMatching("Ignoring unknown section [other]"), 1u);
}

TEST_F(ConfigTest, MalformedLinesSkipped) {
    loader.LoadFromString("[logging\nnot a setting\nlevel = NOTICE\n", state);
    EXPECT_EQ(state.level, Level::Notice);
    EXPECT_TRUE(capture.Has("Malformed section header at line 1"));
    EXPECT_TRUE(capture.Has("Malformed configuration line 2"));
}

TEST_F(ConfigTest, UnknownKeyWarns) {
    loader.LoadFromString("colour = always\n", state);
    EXPECT_TRUE(capture.Has("Unknown configuration key 'colour' at line 1"));
}

TEST_F(ConfigTest, NulBytesDropped) {
    loader.LoadFromString(std::string("lev\0el = DEBUG\n", 15), state);
    EXPECT_EQ(state.level, Level::Debug);
}

// ==============================================================================
// Value Validation / 值校验
// ==============================================================================

/**
 * @brief Invalid values warn and keep the previous setting
 * @brief 无效值产生警告并保留原设置
 */
TEST_F(ConfigTest, InvalidValuesKeepDefaults) {
    loader.LoadFromString(
        "level = LOUD\nutc = perhaps\ncolor = rainbow\nmax_line_length = -5\n", state);
    EXPECT_EQ(state.level, Level::Info);
    EXPECT_FALSE(state.useUtc);
    EXPECT_EQ(state.colorMode, ColorMode::Auto);
    EXPECT_EQ(state.maxLineLength, kDefaultMaxLineLength);
    EXPECT_TRUE(capture.Has("Invalid level value. Using default"));
    EXPECT_TRUE(capture.Has("Invalid utc value. Using default"));
    EXPECT_TRUE(capture.Has("Invalid color value. Using default"));
    EXPECT_TRUE(capture.Has("Invalid max_line_length value. Using default"));
}

TEST_F(ConfigTest, LogFileValidation) {
    loader.LoadFromString("log_file = relative/path.log\n", state);
    EXPECT_TRUE(state.logFile.empty());
    EXPECT_TRUE(capture.Has("Invalid log_file value: path must be an absolute path"));

    capture.Clear();
    loader.LoadFromString("log_file = /tmp/$(rm -rf ~).log\n", state);
    EXPECT_TRUE(state.logFile.empty());
    EXPECT_TRUE(capture.Has("command substitution"));

    loader.LoadFromString("log_file = /tmp/ok.log\n", state);
    EXPECT_EQ(state.logFile, "/tmp/ok.log");
    loader.LoadFromString("log_file =\n", state);
    EXPECT_TRUE(state.logFile.empty());
}

TEST_F(ConfigTest, JournalWithoutUtility) {
    journalAvailable = false;
    loader.LoadFromString("journal = true\n", state);
    EXPECT_FALSE(state.journalEnabled);
    EXPECT_TRUE(capture.Has("logger command not found, journal logging disabled"));
}

TEST_F(ConfigTest, QuietAndConsoleLog) {
    loader.LoadFromString("quiet = true\n", state);
    EXPECT_FALSE(state.consoleEnabled);
    loader.LoadFromString("console_log = true\n", state);
    EXPECT_TRUE(state.consoleEnabled);
}

TEST_F(ConfigTest, VerboseRaisesLevel) {
    loader.LoadFromString("verbose = true\n", state);
    EXPECT_TRUE(state.verbose);
    EXPECT_EQ(state.level, Level::Debug);
}

TEST_F(ConfigTest, ScriptNameSanitized) {
    loader.LoadFromString("script_name = evil;name$(x)\n", state);
    EXPECT_EQ(state.scriptName, "evil_name__x_");
}

TEST_F(ConfigTest, FormatWithControlCharactersRejected) {
    EXPECT_FALSE(loader.Apply(SettingKey::Format, "%m\x1b[31m", state));
    EXPECT_EQ(state.format, kDefaultPattern);
}

// ==============================================================================
// Journal Tag / 日志标签
// ==============================================================================

TEST_F(ConfigTest, JournalTagSanitizedAndTruncated) {
    EXPECT_TRUE(loader.Apply(SettingKey::Tag, "app;$(id)", state));
    EXPECT_EQ(state.journalTag, "app___id_");
    EXPECT_TRUE(capture.Has("Sanitized"));

    capture.Clear();
    EXPECT_TRUE(loader.Apply(SettingKey::Tag, std::string(100, 't'), state));
    EXPECT_EQ(state.journalTag.size(), kMaxJournalTagLength);
    EXPECT_TRUE(capture.Has("Truncated"));
}

TEST_F(ConfigTest, JournalTagRejected) {
    state.journalTag = "kept";
    EXPECT_FALSE(loader.Apply(SettingKey::Tag, "", state));
    EXPECT_FALSE(loader.Apply(SettingKey::Tag, "bad\ntag", state));
    EXPECT_EQ(state.journalTag, "kept");
}

// ==============================================================================
// Files / 文件
// ==============================================================================

TEST_F(ConfigTest, LoadFromFile) {
    TempDir dir;
    ASSERT_TRUE(dir.IsValid());
    const std::string path = dir.File("scriptlog.conf");
    WriteFile(path, "[logging]\nlevel = CRITICAL\n");
    EXPECT_EQ(loader.Load(path, state), ErrorCode::Success);
    EXPECT_EQ(state.level, Level::Critical);
}

/**
 * @brief Missing or non-regular config files are errors
 * @brief 缺失或非普通文件的配置是错误
 */
TEST_F(ConfigTest, LoadErrors) {
    TempDir dir;
    ASSERT_TRUE(dir.IsValid());
    EXPECT_EQ(loader.Load(dir.File("missing.conf"), state), ErrorCode::ConfigFileNotFound);
    EXPECT_TRUE(capture.HasError("Configuration file not found"));
    EXPECT_FALSE(Contains(capture.Joined(), dir.Path()));

    EXPECT_EQ(loader.Load(dir.Path(), state), ErrorCode::ConfigFileUnreadable);
}

// ==============================================================================
// Property-Based Tests / 属性测试
// ==============================================================================

#ifdef SCRIPTLOG_HAS_RAPIDCHECK

/**
 * @brief Property: arbitrary config text never crashes and keeps levels valid
 * @brief 属性：任意配置文本不会崩溃且级别始终有效
 */
RC_GTEST_PROP(ConfigPropertyTest, ArbitraryTextKeepsStateValid, (const std::string& text)) {
    Diagnostics diagnostics([](DiagnosticLevel, std::string_view) {});
    ConfigLoader loader(diagnostics);
    loader.SetJournalProbe([] { return false; });
    SessionState state;
    loader.LoadFromString(text, state);
    RC_ASSERT(static_cast<size_t>(state.level) < kLevelCount);
    RC_ASSERT(static_cast<size_t>(state.stderrLevel) < kLevelCount);
    RC_ASSERT(!state.journalEnabled);
}

#endif  // SCRIPTLOG_HAS_RAPIDCHECK

}  // namespace test
}  // namespace scriptlog
