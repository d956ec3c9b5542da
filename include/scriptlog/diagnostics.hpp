/**
 * @file diagnostics.hpp
 * @brief Warning and error reporting for the library itself
 * @brief 库自身的警告与错误报告
 *
 * Diagnostics are the library's own messages (invalid config values, unusable log
 * file, journal unavailable). They are written to stderr, never to the log sinks.
 *
 * 诊断信息是库自身的消息（无效配置值、不可用的日志文件、日志服务不可用）。
 * 它们写入 stderr，不会写入日志 Sink。
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace scriptlog {

/**
 * @brief Diagnostic severity
 * @brief 诊断严重程度
 */
enum class DiagnosticLevel : uint8_t {
    Warning = 0,  ///< Degraded but continuing / 降级但继续
    Error = 1     ///< Operation failed / 操作失败
};

constexpr std::string_view DiagnosticLevelToString(DiagnosticLevel level) noexcept {
    return level == DiagnosticLevel::Error ? "Error" : "Warning";
}

/**
 * @brief Receives every diagnostic after control-character filtering
 * @brief 接收经过控制字符过滤后的每条诊断
 */
using DiagnosticHandler = std::function<void(DiagnosticLevel, std::string_view)>;

/**
 * @brief Per-logger diagnostic reporter
 * @brief 每个日志器的诊断报告器
 *
 * The default handler prints `Warning: <text>` or `Error: <text>` to stderr.
 * 默认处理器向 stderr 打印 `Warning: <text>` 或 `Error: <text>`。
 */
class Diagnostics {
public:
    Diagnostics();
    explicit Diagnostics(DiagnosticHandler handler);

    /**
     * @brief Replace the handler; an empty handler restores the stderr default
     * @brief 替换处理器；空处理器恢复默认的 stderr 输出
     */
    void SetHandler(DiagnosticHandler handler);

    /**
     * @brief Report a preformatted message
     * @brief 报告已格式化的消息
     */
    void Report(DiagnosticLevel level, std::string_view message);

    template <typename... Args>
    void Warning(fmt::format_string<Args...> fmt, Args&&... args) {
        Report(DiagnosticLevel::Warning, fmt::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void Error(fmt::format_string<Args...> fmt, Args&&... args) {
        Report(DiagnosticLevel::Error, fmt::format(fmt, std::forward<Args>(args)...));
    }

    size_t GetWarningCount() const { return m_warningCount; }
    size_t GetErrorCount() const { return m_errorCount; }

    /**
     * @brief The stderr handler installed by default
     * @brief 默认安装的 stderr 处理器
     */
    static void PrintToStderr(DiagnosticLevel level, std::string_view message);

private:
    DiagnosticHandler m_handler;
    size_t m_warningCount{0};
    size_t m_errorCount{0};
};

}  // namespace scriptlog
