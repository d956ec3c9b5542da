/**
 * @file color.cpp
 * @brief Terminal capability detection implementation
 * @brief 终端能力检测实现
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#include "scriptlog/color.hpp"

#include <cstdlib>

#include "scriptlog/log_entry.hpp"

namespace scriptlog {

namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value != nullptr ? std::string(value) : std::string();
}

}  // namespace

std::string_view GetRecordColor(std::string_view recordName) noexcept {
    if (recordName == kInitRecordName || recordName == kConfigRecordName) {
        return color::kPurple;
    }
    if (recordName == kSensitiveRecordName) {
        return color::kCyan;
    }
    Level level = Level::Info;
    if (ParseLevel(recordName, level)) {
        return GetLevelColor(level);
    }
    return "";
}

std::string Colorize(std::string_view line, std::string_view recordName) {
    const std::string_view code = GetRecordColor(recordName);
    if (code.empty()) {
        return std::string(line);
    }
    std::string out;
    out.reserve(code.size() + line.size() + 4);
    out.append(code);
    out.append(line);
    out.append(color::kReset);
    return out;
}

TerminalEnvironment TerminalEnvironment::Capture(bool isTerminal) {
    TerminalEnvironment env;
    env.noColor = GetEnv("NO_COLOR");
    env.cliColor = GetEnv("CLICOLOR");
    env.cliColorForce = GetEnv("CLICOLOR_FORCE");
    env.term = GetEnv("TERM");
    env.isTerminal = isTerminal;
    return env;
}

bool DetectColorSupport(const TerminalEnvironment& env) noexcept {
    if (!env.noColor.empty()) {
        return false;
    }
    if (!env.cliColorForce.empty() && env.cliColorForce != "0") {
        return true;
    }
    if (env.cliColor == "0") {
        return false;
    }
    if (!env.isTerminal) {
        return false;
    }
    if (env.term.empty() || env.term == "dumb") {
        return false;
    }
    return true;
}

bool ShouldColorize(ColorMode mode, const TerminalEnvironment& env) noexcept {
    switch (mode) {
        case ColorMode::Always:
            return true;
        case ColorMode::Never:
            return false;
        case ColorMode::Auto:
        default:
            return DetectColorSupport(env);
    }
}

}  // namespace scriptlog
