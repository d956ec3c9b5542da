/**
 * @file common.cpp
 * @brief Level, color mode and value parsing
 * @brief 级别、颜色模式与值解析实现
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#include "scriptlog/common.hpp"

#include <limits>

namespace scriptlog {

namespace {

constexpr char ToLowerAscii(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

struct LevelAlias {
    std::string_view name;
    Level level;
};

// Every spelling accepted for a level / 每个级别接受的所有写法
constexpr LevelAlias kLevelAliases[] = {
    {"emergency", Level::Emergency}, {"emerg", Level::Emergency}, {"fatal", Level::Emergency},
    {"alert", Level::Alert},         {"critical", Level::Critical}, {"crit", Level::Critical},
    {"error", Level::Error},         {"err", Level::Error},         {"warn", Level::Warn},
    {"warning", Level::Warn},        {"notice", Level::Notice},     {"info", Level::Info},
    {"debug", Level::Debug},
};

struct BoolWord {
    std::string_view word;
    bool value;
};

constexpr BoolWord kBoolWords[] = {
    {"true", true},   {"yes", true}, {"1", true},  {"on", true},
    {"false", false}, {"no", false}, {"0", false}, {"off", false},
};

}  // namespace

bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (ToLowerAscii(a[i]) != ToLowerAscii(b[i])) {
            return false;
        }
    }
    return true;
}

bool ParseLevel(std::string_view name, Level& out) noexcept {
    if (name.size() == 1 && name[0] >= '0' && name[0] <= '7') {
        out = static_cast<Level>(name[0] - '0');
        return true;
    }
    for (const auto& alias : kLevelAliases) {
        if (EqualsIgnoreCase(name, alias.name)) {
            out = alias.level;
            return true;
        }
    }
    return false;
}

bool ParseBool(std::string_view text, bool& out) noexcept {
    for (const auto& entry : kBoolWords) {
        if (EqualsIgnoreCase(text, entry.word)) {
            out = entry.value;
            return true;
        }
    }
    return false;
}

bool ParseColorMode(std::string_view text, ColorMode& out) noexcept {
    if (EqualsIgnoreCase(text, "auto")) {
        out = ColorMode::Auto;
        return true;
    }
    if (EqualsIgnoreCase(text, "always")) {
        out = ColorMode::Always;
        return true;
    }
    if (EqualsIgnoreCase(text, "never")) {
        out = ColorMode::Never;
        return true;
    }
    bool enabled = false;
    if (ParseBool(text, enabled)) {
        out = enabled ? ColorMode::Always : ColorMode::Never;
        return true;
    }
    return false;
}

bool ParseSize(std::string_view text, size_t& out) noexcept {
    if (text.empty()) {
        return false;
    }
    size_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        const auto digit = static_cast<size_t>(c - '0');
        if (value > (std::numeric_limits<size_t>::max() - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

}  // namespace scriptlog
