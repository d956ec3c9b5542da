/**
 * @file logger.cpp
 * @brief Logger implementation
 * @brief 日志器实现
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#include "scriptlog/logger.hpp"

#include <chrono>
#include <optional>

#include "scriptlog/sanitizer.hpp"
#include "scriptlog/sink.hpp"
#include "scriptlog/sink_target.hpp"

namespace scriptlog {

namespace {

constexpr std::string_view BoolText(bool value) noexcept {
    return value ? "true" : "false";
}

}  // namespace

Logger::Logger() : Logger(DiagnosticHandler{}) {}

Logger::Logger(DiagnosticHandler handler)
    : m_diagnostics(std::move(handler))
    , m_config(m_diagnostics)
    , m_router(m_diagnostics)
    , m_format(m_state.format) {
    m_config.SetJournalProbe([this] { return IsJournalAvailable(); });
}

// ==============================================================================
// Initialization / 初始化
// ==============================================================================

ErrorCode Logger::Init(const InitOptions& options) {
    SessionState next;
    if (!options.programName.empty()) {
        next.scriptName = SanitizeScriptName(options.programName);
    }
    if (options.sensitiveRequiresTerminal) {
        next.sensitiveRequiresTerminal = *options.sensitiveRequiresTerminal;
    }

    if (options.configPath) {
        if (options.configPath->empty()) {
            m_diagnostics.Error("--config requires a file path");
            return ErrorCode::MissingOptionValue;
        }
        const ErrorCode rc = m_config.Load(*options.configPath, next);
        if (IsError(rc)) {
            return rc;
        }
    }

    // Explicit options win over the config file; --level wins over --verbose
    const auto applyText = [&](SettingKey key, const std::optional<std::string>& value) {
        if (value) {
            m_config.Apply(key, *value, next);
        }
    };
    const auto applyFlag = [&](SettingKey key, const std::optional<bool>& value) {
        if (value) {
            m_config.Apply(key, BoolText(*value), next);
        }
    };

    applyFlag(SettingKey::Verbose, options.verbose);
    applyText(SettingKey::Level, options.level);
    applyText(SettingKey::StderrLevel, options.stderrLevel);
    applyFlag(SettingKey::Quiet, options.quiet);
    applyText(SettingKey::Format, options.format);
    applyFlag(SettingKey::Utc, options.utc);
    applyText(SettingKey::Tag, options.journalTag);
    applyFlag(SettingKey::Journal, options.journal);
    applyText(SettingKey::Color, options.colorMode);
    applyText(SettingKey::ScriptName, options.scriptName);
    applyFlag(SettingKey::UnsafeAllowNewlines, options.unsafeAllowNewlines);
    applyFlag(SettingKey::UnsafeAllowAnsi, options.unsafeAllowAnsi);
    applyText(SettingKey::MaxLineLength, options.maxLineLength);
    applyText(SettingKey::MaxJournalLength, options.maxJournalLength);

    // An explicit log file is not skipped when invalid: PrepareSinkTarget fails Init
    if (options.logFile) {
        next.logFile = *options.logFile;
    }

    std::shared_ptr<FileSink> fileSink;
    if (!next.logFile.empty()) {
        FileIdentity identity;
        const ErrorCode rc = PrepareSinkTarget(next.logFile, identity);
        if (IsError(rc)) {
            m_diagnostics.Error("{}", ErrorCodeToMessage(rc));
            return rc;
        }
        fileSink = std::make_shared<FileSink>(std::move(identity));

        const PatternFormat initFormat(next.format);
        const LogRecord initRecord = MakeRecord(
            Level::Info, kInitRecordName, "Logger initialized by " + next.scriptName, next);
        const ErrorCode writeRc = fileSink->Append(initFormat.FormatRecord(initRecord));
        if (IsError(writeRc)) {
            m_diagnostics.Error("{}", ErrorCodeToMessage(writeRc));
            return writeRc;
        }
    }

    m_state = std::move(next);
    m_format.SetPattern(m_state.format);
    m_router.SetFileSink(fileSink);
    m_initialized = true;

    Log(Level::Debug, fmt::format("Logger initialized by {} (console={}, file={}, journal={}, "
                                  "level={})",
                                  m_state.scriptName, BoolText(m_state.consoleEnabled),
                                  BoolText(fileSink != nullptr),
                                  BoolText(m_state.journalEnabled),
                                  LevelToString(m_state.level)));
    return ErrorCode::Success;
}

ErrorCode Logger::Init(int argc, const char* const* argv) {
    InitOptions options;
    const ErrorCode rc = ParseArguments(argc, argv, options, m_diagnostics);
    if (IsError(rc)) {
        return rc;
    }
    return Init(options);
}

// ==============================================================================
// Logging / 日志记录
// ==============================================================================

LogRecord Logger::MakeRecord(Level level, std::string_view levelName, std::string_view raw,
                             const SessionState& state) const {
    LogRecord record;
    record.level = level;
    record.levelName = levelName;
    record.message =
        Sanitize(raw, state.unsafeAllowNewlines, state.unsafeAllowAnsi, state.maxLineLength);
    record.timestamp = std::chrono::system_clock::now();
    record.useUtc = state.useUtc;
    record.scriptName = state.scriptName;
    return record;
}

void Logger::Emit(Level level, std::string_view levelName, std::string_view raw,
                  bool sensitive) {
    if (!StreamRouter::Accepts(level, m_state)) {
        return;
    }
    const LogRecord record = MakeRecord(level, levelName, raw, m_state);
    m_router.Route(record, m_format.FormatRecord(record), m_state, sensitive);
}

void Logger::Log(Level level, std::string_view message) {
    Emit(level, LevelToString(level), message, false);
}

void Logger::Sensitive(std::string_view message) {
    Emit(Level::Info, kSensitiveRecordName, message, true);
}

void Logger::Audit(std::string_view message, bool toJournal) {
    const LogRecord record = MakeRecord(Level::Notice, kConfigRecordName, message, m_state);
    m_router.RouteAudit(record, m_format.FormatRecord(record), m_state, toJournal);
}

bool Logger::IsJournalAvailable() const {
    const auto& journal = m_router.GetJournalSink();
    return journal && journal->IsAvailable();
}

// ==============================================================================
// Runtime Configuration / 运行时配置
// ==============================================================================

ErrorCode Logger::SetLevel(Level level) {
    if (static_cast<size_t>(level) >= kLevelCount) {
        m_diagnostics.Error("Invalid log level");
        return ErrorCode::InvalidArgument;
    }
    const Level old = m_state.level;
    m_state.level = level;
    Audit(fmt::format("Log level changed from {} to {}", LevelToString(old), LevelToString(level)),
          m_state.journalEnabled);
    return ErrorCode::Success;
}

ErrorCode Logger::SetLevel(std::string_view name) {
    Level level = Level::Info;
    if (!ParseLevel(name, level)) {
        m_diagnostics.Error("Invalid log level: {}", name);
        return ErrorCode::InvalidArgument;
    }
    return SetLevel(level);
}

ErrorCode Logger::SetStderrLevel(Level level) {
    if (static_cast<size_t>(level) >= kLevelCount) {
        m_diagnostics.Error("Invalid stderr level");
        return ErrorCode::InvalidArgument;
    }
    const Level old = m_state.stderrLevel;
    m_state.stderrLevel = level;
    Audit(fmt::format("Stderr level changed from {} to {}", LevelToString(old),
                      LevelToString(level)),
          m_state.journalEnabled);
    return ErrorCode::Success;
}

ErrorCode Logger::SetStderrLevel(std::string_view name) {
    Level level = Level::Error;
    if (!ParseLevel(name, level)) {
        m_diagnostics.Error("Invalid stderr level: {}", name);
        return ErrorCode::InvalidArgument;
    }
    return SetStderrLevel(level);
}

ErrorCode Logger::SetFormat(const std::string& format) {
    if (ContainsControlCharacters(format)) {
        m_diagnostics.Error("Invalid log format: control characters are not allowed");
        return ErrorCode::InvalidArgument;
    }
    const std::string old = m_state.format;
    m_state.format = format;
    m_format.SetPattern(format);
    Audit(fmt::format("Log format changed from \"{}\" to \"{}\"", old, format),
          m_state.journalEnabled);
    return ErrorCode::Success;
}

ErrorCode Logger::SetTimezoneUtc(bool useUtc) {
    const bool old = m_state.useUtc;
    m_state.useUtc = useUtc;
    Audit(fmt::format("Timezone setting changed from {} to {}", BoolText(old), BoolText(useUtc)),
          m_state.journalEnabled);
    return ErrorCode::Success;
}

ErrorCode Logger::SetJournalEnabled(bool enabled) {
    if (enabled && !IsJournalAvailable()) {
        m_diagnostics.Error("logger command not found, cannot enable journal logging");
        return ErrorCode::JournalUnavailable;
    }
    const bool old = m_state.journalEnabled;
    m_state.journalEnabled = enabled;
    // Announce in the journal when it was or now is on
    Audit(fmt::format("Journal logging changed from {} to {}", BoolText(old), BoolText(enabled)),
          old || enabled);
    return ErrorCode::Success;
}

ErrorCode Logger::SetJournalTag(std::string_view tag) {
    std::string accepted;
    if (!ValidateJournalTag(tag, accepted, m_diagnostics)) {
        return ErrorCode::InvalidArgument;
    }
    // Announce under the old tag
    Audit(fmt::format("Journal tag changing from \"{}\" to \"{}\"", m_state.journalTag,
                      accepted),
          m_state.journalEnabled);
    m_state.journalTag = accepted;
    return ErrorCode::Success;
}

ErrorCode Logger::SetColorMode(ColorMode mode) {
    const ColorMode old = m_state.colorMode;
    m_state.colorMode = mode;
    Audit(fmt::format("Color mode changed from {} to {}", ColorModeToString(old),
                      ColorModeToString(mode)),
          m_state.journalEnabled);
    return ErrorCode::Success;
}

ErrorCode Logger::SetColorMode(std::string_view mode) {
    ColorMode parsed = ColorMode::Auto;
    if (!ParseColorMode(mode, parsed)) {
        m_diagnostics.Error("Invalid color mode: {}", mode);
        return ErrorCode::InvalidArgument;
    }
    return SetColorMode(parsed);
}

ErrorCode Logger::SetScriptName(std::string_view name) {
    if (name.empty()) {
        m_diagnostics.Error("Script name must not be empty");
        return ErrorCode::InvalidArgument;
    }
    const std::string old = m_state.scriptName;
    m_state.scriptName = SanitizeScriptName(name);
    Audit(fmt::format("Script name changed from {} to {}", old, m_state.scriptName),
          m_state.journalEnabled);
    return ErrorCode::Success;
}

ErrorCode Logger::SetUnsafeAllowNewlines(bool allow) {
    const bool old = m_state.unsafeAllowNewlines;
    m_state.unsafeAllowNewlines = allow;
    std::string message =
        fmt::format("Unsafe newline mode changed from {} to {}", BoolText(old), BoolText(allow));
    if (allow) {
        message += " (WARNING: newlines in messages are no longer neutralized)";
    }
    Audit(message, m_state.journalEnabled);
    return ErrorCode::Success;
}

ErrorCode Logger::SetUnsafeAllowAnsi(bool allow) {
    const bool old = m_state.unsafeAllowAnsi;
    m_state.unsafeAllowAnsi = allow;
    std::string message =
        fmt::format("Unsafe ANSI mode changed from {} to {}", BoolText(old), BoolText(allow));
    if (allow) {
        message += " (WARNING: terminal escape sequences are no longer stripped)";
    }
    Audit(message, m_state.journalEnabled);
    return ErrorCode::Success;
}

ErrorCode Logger::SetConsoleEnabled(bool enabled) {
    const bool old = m_state.consoleEnabled;
    m_state.consoleEnabled = enabled;
    Audit(fmt::format("Console logging changed from {} to {}", BoolText(old), BoolText(enabled)),
          m_state.journalEnabled);
    return ErrorCode::Success;
}

}  // namespace scriptlog
