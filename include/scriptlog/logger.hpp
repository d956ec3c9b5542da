/**
 * @file logger.hpp
 * @brief Main Logger class for scriptLog
 * @brief scriptLog 主日志器类
 *
 * A Logger owns one SessionState and the sinks it feeds. Every call is
 * synchronous: sanitize, format, route, return. A Logger is not internally
 * synchronized; use one per thread or guard it externally.
 *
 * Logger 拥有一个 SessionState 及其输出的 Sink。每次调用都是同步的：净化、格式化、
 * 路由、返回。Logger 内部不做同步；每个线程使用一个实例或在外部加锁。
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "scriptlog/common.hpp"
#include "scriptlog/config.hpp"
#include "scriptlog/diagnostics.hpp"
#include "scriptlog/format.hpp"
#include "scriptlog/log_entry.hpp"
#include "scriptlog/options.hpp"
#include "scriptlog/router.hpp"
#include "scriptlog/session_state.hpp"

namespace scriptlog {

// ==============================================================================
// Logger / 日志器
// ==============================================================================

/**
 * @brief Script logger
 * @brief 脚本日志器
 *
 * Usage example / 使用示例:
 * @code
 * scriptlog::Logger logger;
 * scriptlog::InitOptions options;
 * options.logFile = "/var/log/deploy.log";
 * if (scriptlog::IsError(logger.Init(options))) {
 *     return 1;
 * }
 * logger.Info("Deploying {} to {}", version, host);
 * logger.Sensitive("Generated password: " + password);
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Create a logger with default settings writing to stdout/stderr
     * @brief 创建使用默认设置、写入 stdout/stderr 的日志器
     */
    Logger();

    /**
     * @brief Create a logger with a custom diagnostic handler
     * @brief 使用自定义诊断处理器创建日志器
     */
    explicit Logger(DiagnosticHandler handler);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // ==========================================================================
    // Initialization / 初始化
    // ==========================================================================

    /**
     * @brief Build a fresh session from defaults, config file and options
     * @brief 基于默认值、配置文件和选项构建新会话
     *
     * Nothing changes unless every step succeeds: on error the previous
     * session (settings and file sink) stays active.
     * 只有所有步骤都成功才会生效：出错时保留之前的会话（设置和文件 Sink）。
     *
     * @return Success or the failure that made the session unusable
     */
    ErrorCode Init(const InitOptions& options = InitOptions{});

    /**
     * @brief Parse command-line style arguments, then Init()
     * @brief 解析命令行风格参数，然后调用 Init()
     */
    ErrorCode Init(int argc, const char* const* argv);

    bool IsInitialized() const { return m_initialized; }

    // ==========================================================================
    // Logging Methods / 日志方法
    // ==========================================================================

    /**
     * @brief Log a message at `level`
     * @brief 以 `level` 级别记录消息
     */
    void Log(Level level, std::string_view message);

    void Emergency(std::string_view message) { Log(Level::Emergency, message); }
    void Alert(std::string_view message) { Log(Level::Alert, message); }
    void Critical(std::string_view message) { Log(Level::Critical, message); }
    void Error(std::string_view message) { Log(Level::Error, message); }
    void Warn(std::string_view message) { Log(Level::Warn, message); }
    void Notice(std::string_view message) { Log(Level::Notice, message); }
    void Info(std::string_view message) { Log(Level::Info, message); }
    void Debug(std::string_view message) { Log(Level::Debug, message); }
    void Fatal(std::string_view message) { Log(Level::Fatal, message); }

    /**
     * @brief Log to the console only, at INFO severity, never to file or journal
     * @brief 仅输出到控制台（INFO 级别），从不写入文件或系统日志
     */
    void Sensitive(std::string_view message);

    template <typename T, typename... Args>
    void Emergency(fmt::format_string<T, Args...> fmt, T&& arg, Args&&... args) {
        Log(Level::Emergency, fmt::format(fmt, std::forward<T>(arg), std::forward<Args>(args)...));
    }

    template <typename T, typename... Args>
    void Alert(fmt::format_string<T, Args...> fmt, T&& arg, Args&&... args) {
        Log(Level::Alert, fmt::format(fmt, std::forward<T>(arg), std::forward<Args>(args)...));
    }

    template <typename T, typename... Args>
    void Critical(fmt::format_string<T, Args...> fmt, T&& arg, Args&&... args) {
        Log(Level::Critical, fmt::format(fmt, std::forward<T>(arg), std::forward<Args>(args)...));
    }

    template <typename T, typename... Args>
    void Error(fmt::format_string<T, Args...> fmt, T&& arg, Args&&... args) {
        Log(Level::Error, fmt::format(fmt, std::forward<T>(arg), std::forward<Args>(args)...));
    }

    template <typename T, typename... Args>
    void Warn(fmt::format_string<T, Args...> fmt, T&& arg, Args&&... args) {
        Log(Level::Warn, fmt::format(fmt, std::forward<T>(arg), std::forward<Args>(args)...));
    }

    template <typename T, typename... Args>
    void Notice(fmt::format_string<T, Args...> fmt, T&& arg, Args&&... args) {
        Log(Level::Notice, fmt::format(fmt, std::forward<T>(arg), std::forward<Args>(args)...));
    }

    template <typename T, typename... Args>
    void Info(fmt::format_string<T, Args...> fmt, T&& arg, Args&&... args) {
        Log(Level::Info, fmt::format(fmt, std::forward<T>(arg), std::forward<Args>(args)...));
    }

    template <typename T, typename... Args>
    void Debug(fmt::format_string<T, Args...> fmt, T&& arg, Args&&... args) {
        Log(Level::Debug, fmt::format(fmt, std::forward<T>(arg), std::forward<Args>(args)...));
    }

    template <typename T, typename... Args>
    void Fatal(fmt::format_string<T, Args...> fmt, T&& arg, Args&&... args) {
        Log(Level::Fatal, fmt::format(fmt, std::forward<T>(arg), std::forward<Args>(args)...));
    }

    template <typename T, typename... Args>
    void Sensitive(fmt::format_string<T, Args...> fmt, T&& arg, Args&&... args) {
        Sensitive(std::string_view(
            fmt::format(fmt, std::forward<T>(arg), std::forward<Args>(args)...)));
    }

    // ==========================================================================
    // Runtime Configuration / 运行时配置
    // ==========================================================================
    //
    // Each setter validates its input, applies it, and emits a CONFIG record to
    // the console, the file and (when enabled) the journal, regardless of the
    // severity threshold. Invalid input changes nothing.
    // 每个设置函数校验输入、应用更改，并向控制台、文件和（启用时）系统日志输出
    // CONFIG 记录，不受严重级别阈值影响。无效输入不会改变任何状态。

    ErrorCode SetLevel(Level level);
    ErrorCode SetLevel(std::string_view name);
    ErrorCode SetStderrLevel(Level level);
    ErrorCode SetStderrLevel(std::string_view name);
    ErrorCode SetFormat(const std::string& format);
    ErrorCode SetTimezoneUtc(bool useUtc);
    ErrorCode SetJournalEnabled(bool enabled);
    ErrorCode SetJournalTag(std::string_view tag);
    ErrorCode SetColorMode(ColorMode mode);
    ErrorCode SetColorMode(std::string_view mode);
    ErrorCode SetScriptName(std::string_view name);
    ErrorCode SetUnsafeAllowNewlines(bool allow);
    ErrorCode SetUnsafeAllowAnsi(bool allow);
    ErrorCode SetConsoleEnabled(bool enabled);

    // ==========================================================================
    // Accessors / 访问器
    // ==========================================================================

    const SessionState& GetState() const { return m_state; }
    Level GetLevel() const { return m_state.level; }
    StreamRouter& GetRouter() { return m_router; }
    Diagnostics& GetDiagnostics() { return m_diagnostics; }
    ConfigLoader& GetConfigLoader() { return m_config; }

private:
    LogRecord MakeRecord(Level level, std::string_view levelName, std::string_view raw,
                         const SessionState& state) const;
    void Emit(Level level, std::string_view levelName, std::string_view raw, bool sensitive);
    void Audit(std::string_view message, bool toJournal);
    bool IsJournalAvailable() const;

    Diagnostics m_diagnostics;
    ConfigLoader m_config;
    StreamRouter m_router;
    SessionState m_state;
    PatternFormat m_format;
    bool m_initialized{false};
};

// ==============================================================================
// Default Logger / 默认日志器
// ==============================================================================

namespace detail {

inline std::shared_ptr<Logger>& GetDefaultLoggerPtr() {
    static std::shared_ptr<Logger> defaultLogger;
    return defaultLogger;
}

inline std::mutex& GetDefaultLoggerMutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace detail

/**
 * @brief Get the default logger, creating one with default settings if needed
 * @brief 获取默认日志器，必要时以默认设置创建
 */
inline std::shared_ptr<Logger> DefaultLogger() {
    std::lock_guard<std::mutex> lock(detail::GetDefaultLoggerMutex());
    auto& logger = detail::GetDefaultLoggerPtr();
    if (!logger) {
        logger = std::make_shared<Logger>();
    }
    return logger;
}

/**
 * @brief Set the default logger
 * @brief 设置默认日志器
 */
inline void SetDefaultLogger(std::shared_ptr<Logger> logger) {
    std::lock_guard<std::mutex> lock(detail::GetDefaultLoggerMutex());
    detail::GetDefaultLoggerPtr() = std::move(logger);
}

/**
 * @brief Initialize a new default logger
 * @brief 初始化新的默认日志器
 *
 * The default logger is replaced only if initialization succeeds.
 * 仅当初始化成功时才替换默认日志器。
 */
inline ErrorCode Init(const InitOptions& options = InitOptions{}) {
    auto logger = std::make_shared<Logger>();
    const ErrorCode rc = logger->Init(options);
    if (IsSuccess(rc)) {
        SetDefaultLogger(std::move(logger));
    }
    return rc;
}

}  // namespace scriptlog
