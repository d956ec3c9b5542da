/**
 * @file router.hpp
 * @brief Severity-based dispatch of formatted lines to sinks
 * @brief 按严重级别将格式化后的行分发到各个 Sink
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#pragma once

#include <memory>
#include <string_view>
#include <utility>

#include "scriptlog/diagnostics.hpp"
#include "scriptlog/log_entry.hpp"
#include "scriptlog/session_state.hpp"
#include "scriptlog/sink.hpp"

namespace scriptlog {

/**
 * @brief Routes records to console, file and journal
 * @brief 将记录路由到控制台、文件和系统日志
 *
 * Rules / 规则:
 * - A record passes only if `level <= state.level`.
 * - Console: stderr when `level <= state.stderrLevel`, otherwise stdout.
 * - File: the plain (uncolored) line; failures are reported once per streak and
 *   the lost line is echoed to stderr.
 * - Journal: the sanitized message with the level's syslog priority.
 * - Sensitive records go to the console only.
 * - One sink failing never stops the others.
 */
class StreamRouter {
public:
    /**
     * @brief Create a router writing to the process stdout/stderr
     * @brief 创建写入进程 stdout/stderr 的路由器
     */
    explicit StreamRouter(Diagnostics& diagnostics);

    void SetStdoutSink(std::shared_ptr<Sink> sink) { m_stdout = std::move(sink); }
    void SetStderrSink(std::shared_ptr<Sink> sink) { m_stderr = std::move(sink); }

    /**
     * @brief Install (or with nullptr, remove) the validated file sink
     * @brief 安装（传 nullptr 时移除）已校验的文件 Sink
     */
    void SetFileSink(std::shared_ptr<Sink> sink);
    void SetJournalSink(std::shared_ptr<JournalSink> sink) { m_journal = std::move(sink); }

    const std::shared_ptr<Sink>& GetStdoutSink() const { return m_stdout; }
    const std::shared_ptr<Sink>& GetStderrSink() const { return m_stderr; }
    const std::shared_ptr<Sink>& GetFileSink() const { return m_file; }
    const std::shared_ptr<JournalSink>& GetJournalSink() const { return m_journal; }

    /**
     * @brief Whether a record at `level` passes the severity filter
     * @brief `level` 级别的记录是否通过严重级别过滤
     */
    static bool Accepts(Level level, const SessionState& state) noexcept {
        return ShouldLog(level, state.level);
    }

    /**
     * @brief Whether a console-bound record goes to stderr
     * @brief 输出到控制台的记录是否写入 stderr
     */
    static bool UsesStderr(Level level, Level stderrLevel) noexcept {
        return ShouldLog(level, stderrLevel);
    }

    /**
     * @brief Dispatch one formatted record
     * @brief 分发一条格式化后的记录
     *
     * @param record Record with sanitized message / 消息已净化的记录
     * @param line Formatted line / 格式化后的行
     * @param state Active settings / 当前设置
     * @param sensitive Console only / 仅控制台
     * @return true if the record passed the severity filter / 通过严重级别过滤时返回 true
     */
    bool Route(const LogRecord& record, std::string_view line, const SessionState& state,
               bool sensitive = false);

    /**
     * @brief Dispatch a CONFIG record, bypassing the severity filter
     * @brief 分发 CONFIG 记录，绕过严重级别过滤
     *
     * Goes to stdout (when the console is enabled), the file, and the journal as
     * `CONFIG: <message>`. `journal` selects whether the journal receives it.
     * 输出到 stdout（控制台启用时）、文件，以及以 `CONFIG: <message>` 形式输出到系统日志。
     */
    void RouteAudit(const LogRecord& record, std::string_view line, const SessionState& state,
                    bool journal);

private:
    void WriteConsole(const LogRecord& record, std::string_view line, const SessionState& state,
                      bool toStderr);
    void WriteFile(const LogRecord& record, std::string_view line);
    void WriteJournal(const LogRecord& record, std::string_view text, const SessionState& state);

    Diagnostics& m_diagnostics;
    std::shared_ptr<Sink> m_stdout;
    std::shared_ptr<Sink> m_stderr;
    std::shared_ptr<Sink> m_file;
    std::shared_ptr<JournalSink> m_journal;
    bool m_fileFailing{false};
    bool m_journalFailing{false};
    bool m_sensitiveWarned{false};
};

}  // namespace scriptlog
