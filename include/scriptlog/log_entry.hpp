/**
 * @file log_entry.hpp
 * @brief Log record built for each logging call
 * @brief 每次日志调用构建的日志记录
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <utility>

#include "scriptlog/common.hpp"

namespace scriptlog {

/// Record names that differ from the level name / 与级别名不同的记录名
constexpr std::string_view kInitRecordName = "INIT";
constexpr std::string_view kConfigRecordName = "CONFIG";
constexpr std::string_view kSensitiveRecordName = "SENSITIVE";

/**
 * @brief One log record
 * @brief 一条日志记录
 *
 * `message` is already sanitized. `levelName` normally equals LevelToString(level)
 * but is INIT, CONFIG or SENSITIVE for the special records.
 *
 * `message` 已经过净化。`levelName` 通常等于 LevelToString(level)，
 * 特殊记录则为 INIT、CONFIG 或 SENSITIVE。
 */
struct LogRecord {
    Level level{Level::Info};                               ///< Severity / 严重级别
    std::string_view levelName{LevelToString(Level::Info)}; ///< Display name / 显示名
    std::string message;                                    ///< Sanitized text / 净化后的文本
    std::chrono::system_clock::time_point timestamp{};      ///< Wall clock / 挂钟时间
    bool useUtc{false};                                     ///< Render in UTC / 以 UTC 显示
    std::string_view scriptName;                            ///< Script identity / 脚本名

    LogRecord() = default;

    LogRecord(Level lvl, std::string msg)
        : level(lvl)
        , levelName(LevelToString(lvl))
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now()) {}
};

}  // namespace scriptlog
