/**
 * @file options.hpp
 * @brief Explicit initialization options and command-line parsing
 * @brief 显式初始化选项与命令行解析
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#pragma once

#include <optional>
#include <string>

#include "scriptlog/common.hpp"
#include "scriptlog/diagnostics.hpp"

namespace scriptlog {

/**
 * @brief Options passed to Logger::Init()
 * @brief 传给 Logger::Init() 的选项
 *
 * Unset fields leave the config file value (or the default) in place. Set fields
 * are applied after the config file and always win. String values go through the
 * same validation as config values.
 *
 * 未设置的字段保留配置文件中的值（或默认值）。已设置的字段在配置文件之后应用，
 * 并且总是优先。字符串值与配置值经过相同的校验。
 *
 * Example / 示例:
 * @code
 * scriptlog::InitOptions options;
 * options.level = "DEBUG";
 * options.logFile = "/var/log/deploy.log";
 * options.journal = true;
 * logger.Init(options);
 * @endcode
 */
struct InitOptions {
    std::optional<std::string> configPath;   ///< -c, --config
    std::optional<std::string> level;        ///< -d, --level
    std::optional<std::string> stderrLevel;  ///< -e, --stderr-level
    std::optional<std::string> logFile;      ///< -l, --log
    std::optional<std::string> format;       ///< -f, --format
    std::optional<std::string> journalTag;   ///< -t, --tag
    std::optional<std::string> colorMode;    ///< --color, --no-color
    std::optional<std::string> scriptName;   ///< -n, --script-name
    std::optional<std::string> maxLineLength;     ///< --max-line-length
    std::optional<std::string> maxJournalLength;  ///< --max-journal-length
    std::optional<bool> quiet;                ///< -q, --quiet
    std::optional<bool> verbose;              ///< -v, --verbose
    std::optional<bool> utc;                  ///< -u, --utc
    std::optional<bool> journal;              ///< -j, --journal
    std::optional<bool> unsafeAllowNewlines;  ///< -U, --unsafe-allow-newlines
    std::optional<bool> unsafeAllowAnsi;      ///< -A, --unsafe-allow-ansi-codes
    std::optional<bool> sensitiveRequiresTerminal;

    /// Script name used when neither the config nor `scriptName` sets one
    /// 当配置和 `scriptName` 都未设置时使用的脚本名
    std::string programName;
};

/**
 * @brief Parse command-line style options
 * @brief 解析命令行风格的选项
 *
 * `argv[0]` supplies InitOptions::programName (its basename). Long options also
 * accept the `--name=value` form. A value that is missing, or that starts with
 * `-`, is reported as missing.
 *
 * `argv[0]` 提供 InitOptions::programName（取其文件名部分）。长选项也接受
 * `--name=value` 形式。缺失的值或以 `-` 开头的值视为缺失。
 *
 * @return Success, MissingOptionValue, or InvalidArgument
 */
ErrorCode ParseArguments(int argc, const char* const* argv, InitOptions& options,
                         Diagnostics& diagnostics);

}  // namespace scriptlog
