/**
 * @file session_state.hpp
 * @brief Mutable settings of one logger
 * @brief 单个日志器的可变设置
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "scriptlog/common.hpp"
#include "scriptlog/format.hpp"
#include "scriptlog/sanitizer.hpp"

namespace scriptlog {

constexpr const char* kDefaultScriptName = "unknown";

/**
 * @brief Session state, created with safe defaults
 * @brief 会话状态，以安全默认值创建
 *
 * Populated by the config loader and explicit options, then changed only through
 * the Logger's runtime setters.
 * 由配置加载器和显式选项填充，之后只能通过 Logger 的运行时设置函数修改。
 */
struct SessionState {
    Level level{Level::Info};           ///< Severity threshold / 严重级别阈值
    Level stderrLevel{Level::Error};    ///< At or above goes to stderr / 该级别及以上写入 stderr
    std::string format{kDefaultPattern};
    bool useUtc{false};
    ColorMode colorMode{ColorMode::Auto};
    bool consoleEnabled{true};
    std::string logFile;                ///< Empty = no file sink / 空表示无文件输出
    bool journalEnabled{false};
    std::string journalTag;             ///< Empty = script name / 空表示使用脚本名
    std::string scriptName{kDefaultScriptName};
    bool verbose{false};
    bool unsafeAllowNewlines{false};
    bool unsafeAllowAnsi{false};
    size_t maxLineLength{kDefaultMaxLineLength};        ///< 0 = unlimited / 0 表示不限制
    size_t maxJournalLength{kDefaultMaxJournalLength};  ///< 0 = unlimited / 0 表示不限制
    bool sensitiveRequiresTerminal{true};  ///< Drop SENSITIVE when console is not a tty

    /**
     * @brief Tag used for journal records
     * @brief 日志服务记录使用的标签
     */
    std::string_view EffectiveJournalTag() const {
        return journalTag.empty() ? std::string_view(scriptName) : std::string_view(journalTag);
    }
};

}  // namespace scriptlog
