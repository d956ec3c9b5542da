/**
 * @file config.cpp
 * @brief Configuration file loading implementation
 * @brief 配置文件加载实现
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#include "scriptlog/config.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <set>
#include <utility>

#include "scriptlog/sanitizer.hpp"
#include "scriptlog/sink.hpp"
#include "scriptlog/sink_target.hpp"

namespace scriptlog {

namespace {

constexpr std::string_view kLoggingSection = "logging";

struct KeyAlias {
    std::string_view name;
    SettingKey key;
};

// Canonical names first, then aliases / 先列规范名，再列别名
constexpr KeyAlias kKeyAliases[] = {
    {"level", SettingKey::Level},
    {"log_file", SettingKey::LogFile},
    {"format", SettingKey::Format},
    {"utc", SettingKey::Utc},
    {"journal", SettingKey::Journal},
    {"tag", SettingKey::Tag},
    {"color", SettingKey::Color},
    {"stderr_level", SettingKey::StderrLevel},
    {"quiet", SettingKey::Quiet},
    {"console_log", SettingKey::ConsoleLog},
    {"verbose", SettingKey::Verbose},
    {"script_name", SettingKey::ScriptName},
    {"unsafe_allow_newlines", SettingKey::UnsafeAllowNewlines},
    {"unsafe_allow_ansi_codes", SettingKey::UnsafeAllowAnsi},
    {"max_line_length", SettingKey::MaxLineLength},
    {"max_journal_length", SettingKey::MaxJournalLength},

    {"log_level", SettingKey::Level},
    {"logfile", SettingKey::LogFile},
    {"file", SettingKey::LogFile},
    {"log_format", SettingKey::Format},
    {"use_utc", SettingKey::Utc},
    {"use_journal", SettingKey::Journal},
    {"journal_tag", SettingKey::Tag},
    {"colors", SettingKey::Color},
    {"use_colors", SettingKey::Color},
    {"console", SettingKey::ConsoleLog},
    {"scriptname", SettingKey::ScriptName},
    {"name", SettingKey::ScriptName},
    {"unsafe_allow_ansi", SettingKey::UnsafeAllowAnsi},
};

std::string_view Trim(std::string_view text) {
    const auto isSpace = [](char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f';
    };
    while (!text.empty() && isSpace(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && isSpace(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

std::string_view Unquote(std::string_view value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string ToLowerAscii(std::string_view text) {
    std::string out(text);
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return out;
}

}  // namespace

// ==============================================================================
// Setting Keys / 设置键
// ==============================================================================

std::string_view SettingKeyName(SettingKey key) noexcept {
    for (const auto& alias : kKeyAliases) {
        if (alias.key == key) {
            return alias.name;
        }
    }
    return "unknown";
}

SettingKey LookupSettingKey(std::string_view rawKey) {
    std::string key = ToLowerAscii(rawKey);
    std::replace(key.begin(), key.end(), '-', '_');
    for (const auto& alias : kKeyAliases) {
        if (alias.name == key) {
            return alias.key;
        }
    }
    return SettingKey::Unknown;
}

bool ValidateJournalTag(std::string_view raw, std::string& out, Diagnostics& diagnostics) {
    if (raw.empty()) {
        diagnostics.Warning("Empty journal tag, using default");
        return false;
    }
    if (ContainsControlCharacters(raw)) {
        diagnostics.Warning("Journal tag contains control characters, using default");
        return false;
    }
    bool changed = false;
    std::string tag = SanitizeJournalTag(raw, &changed);
    if (changed) {
        diagnostics.Warning("Sanitized journal tag: shell metacharacters replaced with '_'");
    }
    if (tag.size() > kMaxJournalTagLength) {
        tag = TruncateUtf8(tag, kMaxJournalTagLength);
        diagnostics.Warning("Truncated journal tag to {} characters", kMaxJournalTagLength);
    }
    out = std::move(tag);
    return true;
}

// ==============================================================================
// ConfigLoader / 配置加载器
// ==============================================================================

ConfigLoader::ConfigLoader(Diagnostics& diagnostics)
    : m_diagnostics(diagnostics)
    , m_journalProbe([] { return JournalSink::FindUtility(SCRIPTLOG_SYSLOG_UTILITY); }) {}

void ConfigLoader::SetJournalProbe(JournalProbe probe) {
    if (probe) {
        m_journalProbe = std::move(probe);
    } else {
        m_journalProbe = [] { return JournalSink::FindUtility(SCRIPTLOG_SYSLOG_UTILITY); };
    }
}

ErrorCode ConfigLoader::Load(const std::string& path, SessionState& state) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        const ErrorCode code =
            errno == ENOENT ? ErrorCode::ConfigFileNotFound : ErrorCode::ConfigFileUnreadable;
        m_diagnostics.Error("{}", ErrorCodeToMessage(code));
        return code;
    }
    if (!S_ISREG(st.st_mode)) {
        m_diagnostics.Error("{}", ErrorCodeToMessage(ErrorCode::ConfigFileUnreadable));
        return ErrorCode::ConfigFileUnreadable;
    }

    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        m_diagnostics.Error("{}", ErrorCodeToMessage(ErrorCode::ConfigFileUnreadable));
        return ErrorCode::ConfigFileUnreadable;
    }
    const std::string content((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());
    if (in.bad()) {
        m_diagnostics.Error("{}", ErrorCodeToMessage(ErrorCode::ConfigFileUnreadable));
        return ErrorCode::ConfigFileUnreadable;
    }

    LoadFromString(content, state);
    return ErrorCode::Success;
}

void ConfigLoader::LoadFromString(std::string_view content, SessionState& state) {
    std::string text(content);
    text.erase(std::remove(text.begin(), text.end(), '\0'), text.end());

    // Keys before the first header belong to [logging]
    bool inLogging = true;
    std::set<std::string> ignoredSections;
    size_t lineNumber = 0;
    size_t start = 0;

    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        const std::string_view line = Trim(std::string_view(text).substr(start, end - start));
        start = end + 1;
        ++lineNumber;

        if (line.empty() || line.front() == '#' || line.front() == ';') {
            continue;
        }

        if (line.front() == '[') {
            if (line.back() != ']') {
                m_diagnostics.Warning("Malformed section header at line {}, ignoring", lineNumber);
                continue;
            }
            const std::string section = ToLowerAscii(Trim(line.substr(1, line.size() - 2)));
            inLogging = section == kLoggingSection;
            if (!inLogging && ignoredSections.insert(section).second) {
                m_diagnostics.Warning("Ignoring unknown section [{}] in configuration", section);
            }
            continue;
        }

        const size_t eq = line.find('=');
        if (eq == std::string_view::npos) {
            m_diagnostics.Warning("Malformed configuration line {}, ignoring", lineNumber);
            continue;
        }
        if (!inLogging) {
            continue;
        }

        const std::string_view rawKey = Trim(line.substr(0, eq));
        const std::string_view value = Unquote(Trim(line.substr(eq + 1)));
        const SettingKey key = LookupSettingKey(rawKey);
        if (key == SettingKey::Unknown) {
            m_diagnostics.Warning("Unknown configuration key '{}' at line {}", rawKey, lineNumber);
            continue;
        }
        Apply(key, value, state);
    }
}

void ConfigLoader::WarnInvalid(SettingKey key) {
    m_diagnostics.Warning("Invalid {} value. Using default", SettingKeyName(key));
}

bool ConfigLoader::ApplyBool(SettingKey key, std::string_view value, bool& target) {
    bool parsed = false;
    if (!ParseBool(value, parsed)) {
        WarnInvalid(key);
        return false;
    }
    target = parsed;
    return true;
}

bool ConfigLoader::ApplyLevel(SettingKey key, std::string_view value, Level& target) {
    Level parsed = Level::Info;
    if (!ParseLevel(value, parsed)) {
        WarnInvalid(key);
        return false;
    }
    target = parsed;
    return true;
}

bool ConfigLoader::ApplySize(SettingKey key, std::string_view value, size_t& target) {
    size_t parsed = 0;
    if (!ParseSize(value, parsed)) {
        WarnInvalid(key);
        return false;
    }
    target = parsed;
    return true;
}

bool ConfigLoader::Apply(SettingKey key, std::string_view value, SessionState& state) {
    switch (key) {
        case SettingKey::Level:
            return ApplyLevel(key, value, state.level);

        case SettingKey::StderrLevel:
            return ApplyLevel(key, value, state.stderrLevel);

        case SettingKey::LogFile: {
            if (value.empty()) {
                state.logFile.clear();
                return true;
            }
            const PathCheck check = CheckLogPath(value);
            if (check != PathCheck::Ok) {
                m_diagnostics.Warning("Invalid log_file value: path {}. Using default",
                                      PathCheckToMessage(check));
                return false;
            }
            state.logFile = std::string(value);
            return true;
        }

        case SettingKey::Format:
            if (ContainsControlCharacters(value)) {
                WarnInvalid(key);
                return false;
            }
            state.format = std::string(value);
            return true;

        case SettingKey::Utc:
            return ApplyBool(key, value, state.useUtc);

        case SettingKey::Journal: {
            bool enabled = false;
            if (!ApplyBool(key, value, enabled)) {
                return false;
            }
            if (enabled && !m_journalProbe()) {
                m_diagnostics.Warning("logger command not found, journal logging disabled");
                state.journalEnabled = false;
                return false;
            }
            state.journalEnabled = enabled;
            return true;
        }

        case SettingKey::Tag: {
            std::string tag;
            if (!ValidateJournalTag(value, tag, m_diagnostics)) {
                return false;
            }
            state.journalTag = std::move(tag);
            return true;
        }

        case SettingKey::Color: {
            ColorMode mode = ColorMode::Auto;
            if (!ParseColorMode(value, mode)) {
                WarnInvalid(key);
                return false;
            }
            state.colorMode = mode;
            return true;
        }

        case SettingKey::Quiet: {
            bool quiet = false;
            if (!ApplyBool(key, value, quiet)) {
                return false;
            }
            state.consoleEnabled = !quiet;
            return true;
        }

        case SettingKey::ConsoleLog:
            return ApplyBool(key, value, state.consoleEnabled);

        case SettingKey::Verbose:
            if (!ApplyBool(key, value, state.verbose)) {
                return false;
            }
            if (state.verbose) {
                state.level = Level::Debug;
            }
            return true;

        case SettingKey::ScriptName:
            if (value.empty()) {
                WarnInvalid(key);
                return false;
            }
            state.scriptName = SanitizeScriptName(value);
            return true;

        case SettingKey::UnsafeAllowNewlines:
            return ApplyBool(key, value, state.unsafeAllowNewlines);

        case SettingKey::UnsafeAllowAnsi:
            return ApplyBool(key, value, state.unsafeAllowAnsi);

        case SettingKey::MaxLineLength:
            return ApplySize(key, value, state.maxLineLength);

        case SettingKey::MaxJournalLength:
            return ApplySize(key, value, state.maxJournalLength);

        case SettingKey::Unknown:
        default:
            m_diagnostics.Warning("Unknown configuration key");
            return false;
    }
}

}  // namespace scriptlog
