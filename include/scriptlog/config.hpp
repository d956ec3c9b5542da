/**
 * @file config.hpp
 * @brief Configuration file loading for scriptLog
 * @brief scriptLog 配置文件加载
 *
 * The configuration file is INI-like:
 * 配置文件格式类似 INI：
 *
 * @code
 * [logging]
 * level = DEBUG
 * log_file = /var/log/myscript.log
 * format = "%d %z [%l] [%s] %m"
 * journal = true
 * tag = myscript
 * @endcode
 *
 * Values are treated as opaque strings and mapped to typed settings through a
 * single table; nothing in the file is ever evaluated.
 * 值被视为不透明字符串，并通过单一映射表转换为类型化设置；文件中的任何内容都不会被求值。
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "scriptlog/common.hpp"
#include "scriptlog/diagnostics.hpp"
#include "scriptlog/session_state.hpp"

namespace scriptlog {

// ==============================================================================
// Setting Keys / 设置键
// ==============================================================================

/**
 * @brief Canonical configuration keys
 * @brief 规范化的配置键
 */
enum class SettingKey : uint8_t {
    Level,
    LogFile,
    Format,
    Utc,
    Journal,
    Tag,
    Color,
    StderrLevel,
    Quiet,
    ConsoleLog,
    Verbose,
    ScriptName,
    UnsafeAllowNewlines,
    UnsafeAllowAnsi,
    MaxLineLength,
    MaxJournalLength,
    Unknown
};

/**
 * @brief Canonical spelling of a key, used in messages
 * @brief 键的规范写法，用于消息中
 */
std::string_view SettingKeyName(SettingKey key) noexcept;

/**
 * @brief Resolve a key or alias (case-insensitive, `-` equals `_`)
 * @brief 解析键或别名（不区分大小写，`-` 等同于 `_`）
 */
SettingKey LookupSettingKey(std::string_view rawKey);

/**
 * @brief Validate a journal tag, reporting every adjustment
 * @brief 校验日志标签，并报告每一处调整
 *
 * Empty or control-character tags are rejected. Shell metacharacters are
 * replaced (warning contains "Sanitized"), and tags longer than
 * kMaxJournalTagLength are cut (warning contains "Truncated").
 *
 * @param raw Requested tag / 请求的标签
 * @param out Accepted tag / 接受的标签
 * @return false if rejected / 被拒绝时返回 false
 */
bool ValidateJournalTag(std::string_view raw, std::string& out, Diagnostics& diagnostics);

// ==============================================================================
// ConfigLoader / 配置加载器
// ==============================================================================

/**
 * @brief Reads `[logging]` settings into a SessionState
 * @brief 将 `[logging]` 设置读入 SessionState
 *
 * Invalid values are reported and skipped, leaving the previous value in place.
 * Only a missing or unreadable file is an error.
 * 无效值会被报告并跳过，保留原值。只有文件缺失或不可读才是错误。
 */
class ConfigLoader {
public:
    /// Reports whether the syslog utility is installed / 报告 syslog 工具是否已安装
    using JournalProbe = std::function<bool()>;

    explicit ConfigLoader(Diagnostics& diagnostics);

    /**
     * @brief Override the syslog utility check
     * @brief 覆盖 syslog 工具检查
     */
    void SetJournalProbe(JournalProbe probe);

    /**
     * @brief Load a configuration file
     * @brief 加载配置文件
     *
     * @return Success, ConfigFileNotFound or ConfigFileUnreadable
     */
    ErrorCode Load(const std::string& path, SessionState& state);

    /**
     * @brief Parse configuration text
     * @brief 解析配置文本
     */
    void LoadFromString(std::string_view content, SessionState& state);

    /**
     * @brief Validate and apply one value
     * @brief 校验并应用单个值
     *
     * @return false if the value was rejected / 值被拒绝时返回 false
     */
    bool Apply(SettingKey key, std::string_view value, SessionState& state);

private:
    void WarnInvalid(SettingKey key);
    bool ApplyBool(SettingKey key, std::string_view value, bool& target);
    bool ApplyLevel(SettingKey key, std::string_view value, Level& target);
    bool ApplySize(SettingKey key, std::string_view value, size_t& target);

    Diagnostics& m_diagnostics;
    JournalProbe m_journalProbe;
};

}  // namespace scriptlog
