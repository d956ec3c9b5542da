/**
 * @file format.cpp
 * @brief Line formatting implementation
 * @brief 行格式化实现
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#include "scriptlog/format.hpp"

#include <ctime>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace scriptlog {

std::string FormatTimestamp(std::chrono::system_clock::time_point tp, bool useUtc) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (useUtc) {
        gmtime_r(&seconds, &tm);
    } else {
        localtime_r(&seconds, &tm);
    }
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", tm);
}

PatternFormat::PatternFormat(const std::string& pattern) : m_pattern(pattern) {
    ParsePattern();
}

void PatternFormat::SetPattern(const std::string& pattern) {
    m_pattern = pattern;
    ParsePattern();
}

void PatternFormat::ParsePattern() {
    m_tokens.clear();
    std::string literal;

    for (size_t i = 0; i < m_pattern.size(); ++i) {
        const char c = m_pattern[i];
        if (c != '%') {
            literal += c;
            continue;
        }
        if (i + 1 == m_pattern.size()) {
            // Trailing lone '%' / 末尾单独的 '%'
            literal += '%';
            break;
        }

        const char spec = m_pattern[++i];
        TokenType type = TokenType::Literal;
        switch (spec) {
            case 'd':
                type = TokenType::Timestamp;
                break;
            case 'z':
                type = TokenType::Timezone;
                break;
            case 'l':
                type = TokenType::Level;
                break;
            case 's':
                type = TokenType::Script;
                break;
            case 'm':
                type = TokenType::Message;
                break;
            case '%':
                literal += '%';
                continue;
            default:
                // Unknown specifier, treat as literal
                // 未知说明符，作为字面文本处理
                literal += '%';
                literal += spec;
                continue;
        }

        if (!literal.empty()) {
            m_tokens.push_back({TokenType::Literal, literal});
            literal.clear();
        }
        m_tokens.push_back({type, ""});
    }

    if (!literal.empty()) {
        m_tokens.push_back({TokenType::Literal, literal});
    }
}

std::string PatternFormat::FormatRecord(const LogRecord& record) const {
    fmt::memory_buffer buffer;

    for (const auto& token : m_tokens) {
        switch (token.type) {
            case TokenType::Literal:
                buffer.append(token.literal);
                break;
            case TokenType::Timestamp:
                buffer.append(FormatTimestamp(record.timestamp, record.useUtc));
                break;
            case TokenType::Timezone:
                buffer.append(TimezoneLabel(record.useUtc));
                break;
            case TokenType::Level:
                buffer.append(record.levelName);
                break;
            case TokenType::Script:
                buffer.append(record.scriptName);
                break;
            case TokenType::Message:
                buffer.append(record.message);
                break;
        }
    }

    return fmt::to_string(buffer);
}

std::string FormatRecord(const std::string& pattern, const LogRecord& record) {
    return PatternFormat(pattern).FormatRecord(record);
}

}  // namespace scriptlog
