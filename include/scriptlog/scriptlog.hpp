/**
 * @file scriptlog.hpp
 * @brief Main header file for scriptLog - secure logging for scripts
 * @brief scriptLog 主头文件 - 面向脚本的安全日志库
 *
 * Include this file to use all scriptLog features.
 * 包含此文件以使用所有 scriptLog 功能。
 *
 * @section features Features / 功能特性
 * - Eight syslog severities with separate stdout/stderr thresholds
 *   八个 syslog 严重级别，stdout/stderr 阈值分离
 * - Console, append-only file and syslog journal outputs
 *   控制台、仅追加文件和 syslog 系统日志输出
 * - Newline and ANSI escape neutralization of every message
 *   对每条消息中和换行与 ANSI 转义
 * - Symlink-safe log file creation
 *   防符号链接攻击的日志文件创建
 *
 * @section usage Basic Usage / 基本用法
 * @code
 * #include <scriptlog/scriptlog.hpp>
 *
 * int main(int argc, char** argv) {
 *     scriptlog::Logger logger;
 *     if (scriptlog::IsError(logger.Init(argc, argv))) {
 *         return 1;
 *     }
 *     logger.Info("Hello, {}!", "world");
 *     return 0;
 * }
 * @endcode
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#pragma once

// Core types / 核心类型
#include "scriptlog/common.hpp"
#include "scriptlog/diagnostics.hpp"
#include "scriptlog/log_entry.hpp"
#include "scriptlog/sanitizer.hpp"

// Formatting and output / 格式化和输出
#include "scriptlog/color.hpp"
#include "scriptlog/format.hpp"
#include "scriptlog/router.hpp"
#include "scriptlog/sink.hpp"
#include "scriptlog/sink_target.hpp"

// Configuration / 配置
#include "scriptlog/config.hpp"
#include "scriptlog/options.hpp"
#include "scriptlog/session_state.hpp"

// Logger / 日志器
#include "scriptlog/logger.hpp"
#include "scriptlog/macros.hpp"
