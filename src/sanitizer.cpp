/**
 * @file sanitizer.cpp
 * @brief Message sanitization implementation
 * @brief 消息净化实现
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#include "scriptlog/sanitizer.hpp"

#include <cstdint>

namespace scriptlog {

namespace {

constexpr char kEsc = '\x1b';
constexpr char kBel = '\x07';

/**
 * @brief Escape-sequence parser states
 * @brief 转义序列解析状态
 */
enum class AnsiState : uint8_t {
    Ground,              ///< Plain text / 普通文本
    Escape,              ///< After ESC / ESC 之后
    EscapeIntermediate,  ///< ESC followed by 0x20-0x2F / ESC 后跟中间字节
    Csi,                 ///< Inside `ESC [` / CSI 序列内
    Osc,                 ///< Inside `ESC ]` / OSC 序列内
    OscEscape,           ///< ESC seen inside OSC / OSC 内遇到 ESC
    String,              ///< Inside DCS/SOS/PM/APC / 字符串序列内
    StringEscape         ///< ESC seen inside a string / 字符串序列内遇到 ESC
};

constexpr bool InRange(unsigned char c, unsigned char lo, unsigned char hi) noexcept {
    return c >= lo && c <= hi;
}

constexpr bool IsC0OrDel(unsigned char c) noexcept {
    return c < 0x20 || c == 0x7f;
}

}  // namespace

std::string StripAnsiCodes(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    AnsiState state = AnsiState::Ground;
    size_t i = 0;
    while (i < text.size()) {
        const auto c = static_cast<unsigned char>(text[i]);
        switch (state) {
            case AnsiState::Ground:
                if (c == kEsc) {
                    state = AnsiState::Escape;
                } else {
                    out.push_back(static_cast<char>(c));
                }
                ++i;
                break;

            case AnsiState::Escape:
                if (c == '[') {
                    state = AnsiState::Csi;
                } else if (c == ']') {
                    state = AnsiState::Osc;
                } else if (c == 'P' || c == 'X' || c == '^' || c == '_') {
                    state = AnsiState::String;
                } else if (c == static_cast<unsigned char>(kEsc)) {
                    // ESC ESC: the first one is a lone ESC
                } else if (InRange(c, 0x20, 0x2f)) {
                    state = AnsiState::EscapeIntermediate;
                } else if (InRange(c, 0x30, 0x7e)) {
                    state = AnsiState::Ground;
                } else {
                    // Lone ESC: drop it and reprocess this byte as text
                    state = AnsiState::Ground;
                    continue;
                }
                ++i;
                break;

            case AnsiState::EscapeIntermediate:
                if (c == static_cast<unsigned char>(kEsc)) {
                    state = AnsiState::Escape;
                } else if (InRange(c, 0x30, 0x7e)) {
                    state = AnsiState::Ground;
                } else if (!InRange(c, 0x20, 0x2f)) {
                    state = AnsiState::Ground;
                    continue;
                }
                ++i;
                break;

            case AnsiState::Csi:
                if (c == static_cast<unsigned char>(kEsc)) {
                    state = AnsiState::Escape;
                } else if (InRange(c, 0x40, 0x7e)) {
                    state = AnsiState::Ground;
                } else if (!InRange(c, 0x20, 0x3f)) {
                    // Malformed sequence: abandon it, keep the byte
                    state = AnsiState::Ground;
                    continue;
                }
                ++i;
                break;

            case AnsiState::Osc:
                if (c == static_cast<unsigned char>(kBel)) {
                    state = AnsiState::Ground;
                } else if (c == static_cast<unsigned char>(kEsc)) {
                    state = AnsiState::OscEscape;
                }
                ++i;
                break;

            case AnsiState::OscEscape:
                if (c == '\\') {
                    state = AnsiState::Ground;
                } else if (c != static_cast<unsigned char>(kEsc)) {
                    state = AnsiState::Osc;
                }
                ++i;
                break;

            case AnsiState::String:
                if (c == static_cast<unsigned char>(kEsc)) {
                    state = AnsiState::StringEscape;
                }
                ++i;
                break;

            case AnsiState::StringEscape:
                if (c == '\\') {
                    state = AnsiState::Ground;
                } else if (c != static_cast<unsigned char>(kEsc)) {
                    state = AnsiState::String;
                }
                ++i;
                break;
        }
    }
    return out;
}

std::string TruncateUtf8(std::string_view text, size_t maxLength) {
    if (text.size() <= maxLength) {
        return std::string(text);
    }
    size_t cut = maxLength;
    // Back off while the first dropped byte is a continuation byte
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xc0) == 0x80) {
        --cut;
    }
    return std::string(text.substr(0, cut));
}

std::string Sanitize(std::string_view raw, bool allowNewlines, bool allowAnsi,
                     size_t maxLength) {
    std::string stripped;
    if (!allowAnsi) {
        stripped = StripAnsiCodes(raw);
        raw = stripped;
    }

    std::string out;
    out.reserve(raw.size());
    for (char ch : raw) {
        const auto c = static_cast<unsigned char>(ch);
        if (c == '\n' || c == '\r' || c == '\t') {
            out.push_back(allowNewlines ? ch : ' ');
        } else if (c == static_cast<unsigned char>(kEsc) ||
                   c == static_cast<unsigned char>(kBel)) {
            // Only reachable as part of a kept escape sequence
            if (allowAnsi) {
                out.push_back(ch);
            }
        } else if (!IsC0OrDel(c)) {
            out.push_back(ch);
        }
    }

    if (maxLength > 0 && out.size() > maxLength) {
        return TruncateUtf8(out, maxLength);
    }
    return out;
}

bool ContainsControlCharacters(std::string_view text) noexcept {
    for (char ch : text) {
        if (IsC0OrDel(static_cast<unsigned char>(ch))) {
            return true;
        }
    }
    return false;
}

bool IsShellMetacharacter(char c) noexcept {
    switch (c) {
        case ';':
        case '$':
        case '(':
        case ')':
        case '`':
        case '|':
        case '&':
        case '<':
        case '>':
        case '\\':
        case '\'':
        case '"':
        case '*':
        case '?':
        case '!':
        case '{':
        case '}':
        case '[':
        case ']':
            return true;
        default:
            return false;
    }
}

std::string SanitizeScriptName(std::string_view name) {
    std::string out;
    out.reserve(name.size() < kMaxScriptNameLength ? name.size() : kMaxScriptNameLength);
    for (char c : name) {
        if (out.size() == kMaxScriptNameLength) {
            break;
        }
        const bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                          (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        out.push_back(keep ? c : '_');
    }
    return out;
}

std::string SanitizeJournalTag(std::string_view tag, bool* changed) {
    std::string out(tag);
    bool replaced = false;
    for (auto& c : out) {
        if (IsShellMetacharacter(c)) {
            c = '_';
            replaced = true;
        }
    }
    if (changed != nullptr) {
        *changed = replaced;
    }
    return out;
}

}  // namespace scriptlog
