/**
 * @file format.hpp
 * @brief Line formatting for scriptLog
 * @brief scriptLog 行格式化
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "scriptlog/log_entry.hpp"

namespace scriptlog {

/// Default line template / 默认行模板
constexpr const char* kDefaultPattern = "%d [%l] [%s] %m";

/**
 * @brief Render `YYYY-MM-DD HH:MM:SS` in UTC or local time
 * @brief 以 UTC 或本地时间渲染 `YYYY-MM-DD HH:MM:SS`
 */
std::string FormatTimestamp(std::chrono::system_clock::time_point tp, bool useUtc);

/**
 * @brief Timezone label for `%z`
 * @brief `%z` 的时区标签
 */
constexpr std::string_view TimezoneLabel(bool useUtc) noexcept {
    return useUtc ? "UTC" : "LOCAL";
}

// ==============================================================================
// PatternFormat / 模式格式化器
// ==============================================================================

/**
 * @brief Template-based line formatter
 * @brief 基于模板的行格式化器
 *
 * Supported specifiers / 支持的说明符:
 *
 * - %d - Timestamp `YYYY-MM-DD HH:MM:SS` / 时间戳
 * - %z - `UTC` or `LOCAL` / 时区
 * - %l - Level (or record) name / 级别名
 * - %s - Script name / 脚本名
 * - %m - Message / 消息
 * - %% - Literal % / 字面量 %
 *
 * Unknown specifiers and a trailing lone `%` are copied literally.
 * 未知说明符以及末尾单独的 `%` 按字面复制。
 *
 * Example / 示例:
 * - "%d [%l] [%s] %m" -> "2024-01-01 12:00:00 [INFO] [deploy.sh] Hello"
 */
class PatternFormat {
public:
    explicit PatternFormat(const std::string& pattern = kDefaultPattern);

    /**
     * @brief Replace the template and re-tokenize it
     * @brief 替换模板并重新分词
     */
    void SetPattern(const std::string& pattern);

    const std::string& GetPattern() const { return m_pattern; }

    /**
     * @brief Render one record
     * @brief 渲染一条记录
     */
    std::string FormatRecord(const LogRecord& record) const;

private:
    enum class TokenType : uint8_t {
        Literal,
        Timestamp,
        Timezone,
        Level,
        Script,
        Message
    };

    struct Token {
        TokenType type;
        std::string literal;
    };

    void ParsePattern();

    std::string m_pattern;
    std::vector<Token> m_tokens;
};

/**
 * @brief One-shot helper: tokenize `pattern` and render `record`
 * @brief 一次性辅助函数：对 `pattern` 分词并渲染 `record`
 */
std::string FormatRecord(const std::string& pattern, const LogRecord& record);

}  // namespace scriptlog
