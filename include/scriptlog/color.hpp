/**
 * @file color.hpp
 * @brief Terminal capability detection and level colors
 * @brief 终端能力检测与级别颜色
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#pragma once

#include <string>
#include <string_view>

#include "scriptlog/common.hpp"

namespace scriptlog {

// ==============================================================================
// ANSI Colors / ANSI 颜色
// ==============================================================================

namespace color {

constexpr const char* kReset = "\033[0m";
constexpr const char* kBlue = "\033[0;34m";
constexpr const char* kGreen = "\033[0;32m";
constexpr const char* kYellow = "\033[0;33m";
constexpr const char* kRed = "\033[0;31m";
constexpr const char* kBoldRed = "\033[1;31m";
constexpr const char* kWhiteOnRed = "\033[37;41m";
constexpr const char* kBoldWhiteOnRed = "\033[1;37;41m";
constexpr const char* kPurple = "\033[0;35m";
constexpr const char* kCyan = "\033[0;36m";

}  // namespace color

/**
 * @brief Color for a level; INFO has none (empty string)
 * @brief 级别对应的颜色；INFO 无颜色（空字符串）
 */
constexpr std::string_view GetLevelColor(Level level) noexcept {
    switch (level) {
        case Level::Emergency:
            return color::kBoldWhiteOnRed;
        case Level::Alert:
            return color::kWhiteOnRed;
        case Level::Critical:
            return color::kBoldRed;
        case Level::Error:
            return color::kRed;
        case Level::Warn:
            return color::kYellow;
        case Level::Notice:
            return color::kGreen;
        case Level::Debug:
            return color::kBlue;
        case Level::Info:
        default:
            return "";
    }
}

/**
 * @brief Color for a record name, covering INIT, CONFIG and SENSITIVE
 * @brief 记录名对应的颜色，包括 INIT、CONFIG 和 SENSITIVE
 */
std::string_view GetRecordColor(std::string_view recordName) noexcept;

/**
 * @brief Wrap `line` in the record color and a reset; unchanged if no color
 * @brief 用记录颜色和重置码包裹 `line`；无颜色时原样返回
 */
std::string Colorize(std::string_view line, std::string_view recordName);

// ==============================================================================
// Terminal Environment / 终端环境
// ==============================================================================

/**
 * @brief Snapshot of the inputs that decide color support
 * @brief 决定颜色支持的输入快照
 *
 * An unset variable and an empty one are treated the same.
 * 未设置的变量与空变量视为相同。
 */
struct TerminalEnvironment {
    std::string noColor;        ///< NO_COLOR
    std::string cliColor;       ///< CLICOLOR
    std::string cliColorForce;  ///< CLICOLOR_FORCE
    std::string term;           ///< TERM
    bool isTerminal{false};     ///< Stream is a tty / 流是否为终端

    /**
     * @brief Read the process environment for a stream
     * @brief 读取某个流对应的进程环境
     */
    static TerminalEnvironment Capture(bool isTerminal);
};

/**
 * @brief Decide color support from the environment alone
 * @brief 仅根据环境判断颜色支持
 *
 * NO_COLOR non-empty -> off; CLICOLOR_FORCE non-empty and not "0" -> on;
 * CLICOLOR == "0" -> off; not a terminal -> off; TERM empty or "dumb" -> off;
 * otherwise on.
 */
bool DetectColorSupport(const TerminalEnvironment& env) noexcept;

/**
 * @brief Combine the configured mode with detection
 * @brief 结合配置模式与检测结果
 */
bool ShouldColorize(ColorMode mode, const TerminalEnvironment& env) noexcept;

}  // namespace scriptlog
