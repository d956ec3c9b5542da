/**
 * @file common.hpp
 * @brief Common definitions for scriptLog (Level, ColorMode, ErrorCode)
 * @brief scriptLog 通用定义（日志级别、颜色模式、错误码）
 *
 * This file contains fundamental types and constants used throughout the library:
 * - Level: syslog severity levels (Emergency ... Debug)
 * - ColorMode: console color policy (Auto, Always, Never)
 * - ErrorCode: error codes for initialization, configuration and sink failures
 *
 * 此文件包含整个库使用的基本类型和常量：
 * - Level：syslog 严重级别（Emergency ... Debug）
 * - ColorMode：控制台颜色策略（Auto、Always、Never）
 * - ErrorCode：初始化、配置和 Sink 失败的错误码
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#ifndef SCRIPTLOG_COMMON_HPP
#define SCRIPTLOG_COMMON_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace scriptlog {

// ==============================================================================
// Log Level / 日志级别
// ==============================================================================

/**
 * @brief Log level enumeration (syslog severities)
 * @brief 日志级别枚举（syslog 严重级别）
 *
 * Ordinals are fixed: lower value means more severe. A record is emitted when
 * its ordinal is less than or equal to the active threshold.
 *
 * 序号固定：值越小越严重。当记录序号小于或等于当前阈值时输出。
 */
enum class Level : uint8_t {
    Emergency = 0,  ///< System is unusable / 系统不可用
    Alert = 1,      ///< Action must be taken immediately / 必须立即处理
    Critical = 2,   ///< Critical conditions / 严重情况
    Error = 3,      ///< Error conditions / 错误
    Warn = 4,       ///< Warning conditions / 警告
    Notice = 5,     ///< Normal but significant / 正常但重要
    Info = 6,       ///< Informational / 信息
    Debug = 7,      ///< Debug-level messages / 调试信息
    Fatal = Emergency  ///< Alias of Emergency / Emergency 的别名
};

constexpr size_t kLevelCount = 8;  ///< Number of distinct levels / 级别数量

/**
 * @brief Convert log level to its canonical upper-case name
 * @brief 将日志级别转换为规范的大写名称
 */
constexpr std::string_view LevelToString(Level level) noexcept {
    constexpr std::string_view kNames[] = {"EMERGENCY", "ALERT", "CRITICAL", "ERROR",
                                           "WARN",      "NOTICE", "INFO",    "DEBUG"};
    const auto idx = static_cast<size_t>(level);
    if (idx >= kLevelCount) {
        return "UNKNOWN";
    }
    return kNames[idx];
}

/**
 * @brief Map a level to the syslog priority keyword used by the journal utility
 * @brief 将日志级别映射为日志工具使用的 syslog 优先级关键字
 *
 * Out-of-range values map to "notice".
 * 超出范围的值映射为 "notice"。
 */
constexpr std::string_view LevelToSyslogPriority(Level level) noexcept {
    switch (level) {
        case Level::Emergency:
            return "emerg";
        case Level::Alert:
            return "alert";
        case Level::Critical:
            return "crit";
        case Level::Error:
            return "err";
        case Level::Warn:
            return "warning";
        case Level::Notice:
            return "notice";
        case Level::Info:
            return "info";
        case Level::Debug:
            return "debug";
        default:
            return "notice";
    }
}

/**
 * @brief Check if a record at `level` passes `threshold`
 * @brief 检查 `level` 级别的记录是否通过 `threshold`
 */
constexpr bool ShouldLog(Level level, Level threshold) noexcept {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(threshold);
}

/**
 * @brief Parse a level name or numeral (case-insensitive)
 * @brief 解析级别名称或数字（不区分大小写）
 *
 * Accepts EMERGENCY/EMERG/FATAL, ALERT, CRITICAL/CRIT, ERROR/ERR, WARN/WARNING,
 * NOTICE, INFO, DEBUG and the numerals 0-7.
 *
 * @param name Text to parse / 待解析文本
 * @param out Receives the level on success / 成功时接收级别
 * @return true on success, `out` untouched otherwise / 成功返回 true，否则不修改 `out`
 */
bool ParseLevel(std::string_view name, Level& out) noexcept;

// ==============================================================================
// Color Mode / 颜色模式
// ==============================================================================

/**
 * @brief Console color policy
 * @brief 控制台颜色策略
 */
enum class ColorMode : uint8_t {
    Auto = 0,    ///< Detect terminal capability / 检测终端能力
    Always = 1,  ///< Always emit ANSI colors / 总是输出颜色
    Never = 2    ///< Never emit ANSI colors / 从不输出颜色
};

constexpr std::string_view ColorModeToString(ColorMode mode) noexcept {
    switch (mode) {
        case ColorMode::Auto:
            return "auto";
        case ColorMode::Always:
            return "always";
        case ColorMode::Never:
            return "never";
        default:
            return "unknown";
    }
}

/**
 * @brief Parse auto/always/never; booleans map true->always, false->never
 * @brief 解析 auto/always/never；布尔值 true->always，false->never
 */
bool ParseColorMode(std::string_view text, ColorMode& out) noexcept;

/**
 * @brief Parse a boolean word: true/yes/1/on or false/no/0/off (case-insensitive)
 * @brief 解析布尔词：true/yes/1/on 或 false/no/0/off（不区分大小写）
 */
bool ParseBool(std::string_view text, bool& out) noexcept;

/**
 * @brief Parse a non-negative decimal integer
 * @brief 解析非负十进制整数
 */
bool ParseSize(std::string_view text, size_t& out) noexcept;

/**
 * @brief ASCII case-insensitive comparison
 * @brief ASCII 不区分大小写比较
 */
bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept;

// ==============================================================================
// Error Code / 错误码
// ==============================================================================

/**
 * @brief Error code enumeration
 * @brief 错误码枚举
 *
 * Organized by category:
 * - 0: Success
 * - 300-399: Log file sink errors (path, directory, validation, write)
 * - 400-499: Journal errors
 * - 600-699: Configuration and option errors
 * - 900-999: General errors
 *
 * 按类别组织：
 * - 0：成功
 * - 300-399：日志文件 Sink 错误（路径、目录、校验、写入）
 * - 400-499：日志服务错误
 * - 600-699：配置与选项错误
 * - 900-999：通用错误
 */
enum class ErrorCode : int32_t {
    Success = 0,  ///< Operation completed successfully / 操作成功完成

    // Log file errors (300-399) / 日志文件错误
    FileOpenFailed = 300,         ///< Target could not be created or opened / 无法创建或打开
    FileWriteFailed = 301,        ///< Append failed / 追加写入失败
    RelativePath = 310,           ///< Path is not absolute / 路径不是绝对路径
    InvalidPath = 311,            ///< Control characters, markers or too long / 路径非法
    DirectoryCreateFailed = 312,  ///< Parent directory could not be created / 无法创建父目录
    SymlinkRejected = 313,        ///< Target is a symbolic link / 目标是符号链接
    NotRegularFile = 314,         ///< Directory, device, FIFO, ... / 不是普通文件
    NotWritable = 315,            ///< Owner-write permission missing / 缺少写权限
    TargetChanged = 316,          ///< Object replaced after lstat or validation / 对象在 lstat 或校验后被替换

    // Journal errors (400-499) / 日志服务错误
    JournalUnavailable = 400,  ///< Syslog utility not installed / syslog 工具未安装
    JournalSendFailed = 401,   ///< Syslog utility failed / syslog 工具执行失败

    // Configuration errors (600-699) / 配置错误
    ConfigFileNotFound = 600,    ///< Config file does not exist / 配置文件不存在
    ConfigFileUnreadable = 601,  ///< Config file cannot be read / 配置文件不可读
    ConfigInvalidValue = 602,    ///< Invalid configuration value / 配置值无效
    MissingOptionValue = 603,    ///< Option given without a value / 选项缺少值

    // General errors (900-999) / 通用错误
    InvalidArgument = 900,  ///< Invalid argument provided / 提供的参数无效
    NotInitialized = 901,   ///< Logger not initialized / 日志器未初始化
    InternalError = 999     ///< Internal error (unexpected) / 内部错误（意外）
};

/**
 * @brief Convert error code to its identifier
 * @brief 将错误码转换为标识符
 */
constexpr std::string_view ErrorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::FileOpenFailed:
            return "FileOpenFailed";
        case ErrorCode::FileWriteFailed:
            return "FileWriteFailed";
        case ErrorCode::RelativePath:
            return "RelativePath";
        case ErrorCode::InvalidPath:
            return "InvalidPath";
        case ErrorCode::DirectoryCreateFailed:
            return "DirectoryCreateFailed";
        case ErrorCode::SymlinkRejected:
            return "SymlinkRejected";
        case ErrorCode::NotRegularFile:
            return "NotRegularFile";
        case ErrorCode::NotWritable:
            return "NotWritable";
        case ErrorCode::TargetChanged:
            return "TargetChanged";
        case ErrorCode::JournalUnavailable:
            return "JournalUnavailable";
        case ErrorCode::JournalSendFailed:
            return "JournalSendFailed";
        case ErrorCode::ConfigFileNotFound:
            return "ConfigFileNotFound";
        case ErrorCode::ConfigFileUnreadable:
            return "ConfigFileUnreadable";
        case ErrorCode::ConfigInvalidValue:
            return "ConfigInvalidValue";
        case ErrorCode::MissingOptionValue:
            return "MissingOptionValue";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::NotInitialized:
            return "NotInitialized";
        case ErrorCode::InternalError:
            return "InternalError";
        default:
            return "UnknownError";
    }
}

/**
 * @brief Human-readable description of an error code
 * @brief 错误码的可读描述
 *
 * The text never contains a filesystem path so it can be shown to observers of
 * script output without disclosing the filesystem layout.
 *
 * 文本中从不包含文件系统路径，以免向脚本输出的观察者泄露目录结构。
 */
constexpr std::string_view ErrorCodeToMessage(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::FileOpenFailed:
            return "Cannot create or open log file";
        case ErrorCode::FileWriteFailed:
            return "Failed to write to log file";
        case ErrorCode::RelativePath:
            return "Log file path must be an absolute path";
        case ErrorCode::InvalidPath:
            return "Log file path is invalid or exceeds maximum length";
        case ErrorCode::DirectoryCreateFailed:
            return "Cannot create log directory";
        case ErrorCode::SymlinkRejected:
            return "Log file is a symbolic link, refusing to use it";
        case ErrorCode::NotRegularFile:
            return "Log file is not a regular file";
        case ErrorCode::NotWritable:
            return "Log file is not writable";
        case ErrorCode::TargetChanged:
            return "Log file was replaced by another file";
        case ErrorCode::JournalUnavailable:
            return "logger command not found";
        case ErrorCode::JournalSendFailed:
            return "Failed to forward message to journal";
        case ErrorCode::ConfigFileNotFound:
            return "Configuration file not found";
        case ErrorCode::ConfigFileUnreadable:
            return "Configuration file is not readable";
        case ErrorCode::ConfigInvalidValue:
            return "Invalid configuration value";
        case ErrorCode::MissingOptionValue:
            return "Option requires a value";
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::NotInitialized:
            return "Logger is not initialized";
        case ErrorCode::InternalError:
            return "Internal error";
        default:
            return "Unknown error";
    }
}

constexpr bool IsSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::Success;
}

constexpr bool IsError(ErrorCode code) noexcept {
    return code != ErrorCode::Success;
}

}  // namespace scriptlog

#endif  // SCRIPTLOG_COMMON_HPP
