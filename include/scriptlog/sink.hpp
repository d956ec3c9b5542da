/**
 * @file sink.hpp
 * @brief Log output sinks for scriptLog
 * @brief scriptLog 日志输出目标
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#pragma once

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>

#include "scriptlog/common.hpp"
#include "scriptlog/log_entry.hpp"
#include "scriptlog/sanitizer.hpp"
#include "scriptlog/sink_target.hpp"

/// Name of the syslog forwarding utility, resolved through PATH
/// syslog 转发工具的名称，通过 PATH 查找
#ifndef SCRIPTLOG_SYSLOG_UTILITY
#define SCRIPTLOG_SYSLOG_UTILITY "logger"
#endif

namespace scriptlog {

// ==============================================================================
// Sink Base Class / Sink 基类
// ==============================================================================

/**
 * @brief Base class for log output sinks
 * @brief 日志输出目标基类
 *
 * A sink writes already-formatted text for a record. Errors do not throw: the
 * most recent Write() leaves HasError()/GetLastError() describing its outcome.
 *
 * Sink 写入某条记录已格式化的文本。错误不会抛出：最近一次 Write() 的结果
 * 由 HasError()/GetLastError() 描述。
 */
class Sink {
public:
    /**
     * @brief Virtual destructor
     * @brief 虚析构函数
     */
    virtual ~Sink() = default;

    /**
     * @brief Write the text for one record
     * @brief 写入一条记录的文本
     *
     * @param record The record being written / 正在写入的记录
     * @param text Text to emit, without trailing newline / 要输出的文本，不含换行
     */
    virtual void Write(const LogRecord& record, std::string_view text) = 0;

    /**
     * @brief Flush any buffered output
     * @brief 刷新所有缓冲的输出
     */
    virtual void Flush() = 0;

    /**
     * @brief Check if the last write failed
     * @brief 检查最近一次写入是否失败
     */
    virtual bool HasError() const = 0;

    /**
     * @brief Get the last error message (never contains a path)
     * @brief 获取最后的错误消息（不含路径）
     */
    virtual std::string GetLastError() const = 0;

    /**
     * @brief Whether the destination is an interactive terminal
     * @brief 目标是否为交互式终端
     */
    virtual bool IsTerminal() const { return false; }
};

// ==============================================================================
// ConsoleSink / 控制台输出
// ==============================================================================

/**
 * @brief Console output sink
 * @brief 控制台输出 Sink
 *
 * Writes one line per record to stdout or stderr and flushes immediately, so
 * interleaving with the script's own output is preserved.
 * 每条记录向 stdout 或 stderr 写入一行并立即刷新，以保持与脚本自身输出的交错顺序。
 */
class ConsoleSink : public Sink {
public:
    /**
     * @brief Output stream selection
     * @brief 输出流选择
     */
    enum class Stream {
        StdOut,  ///< Standard output / 标准输出
        StdErr   ///< Standard error / 标准错误
    };

    explicit ConsoleSink(Stream stream = Stream::StdOut);

    /**
     * @brief Write to an arbitrary stdio stream (not owned)
     * @brief 写入任意 stdio 流（不持有所有权）
     */
    explicit ConsoleSink(FILE* out);

    void Write(const LogRecord& record, std::string_view text) override;
    void Flush() override;
    bool HasError() const override { return m_hasError; }
    std::string GetLastError() const override { return m_lastError; }
    bool IsTerminal() const override;

private:
    FILE* m_out;
    bool m_hasError{false};
    std::string m_lastError;
};

// ==============================================================================
// FileSink / 文件输出
// ==============================================================================

/**
 * @brief Append-only file sink
 * @brief 仅追加的文件输出 Sink
 *
 * The target must come from PrepareSinkTarget(). Each line is appended with a
 * single write(2) on a descriptor opened O_APPEND|O_NOFOLLOW without O_CREAT and
 * checked against the validated (device, inode). A file removed, swapped for a
 * symlink, or replaced by another file after validation is reported instead of
 * recreated, followed or written.
 *
 * 目标必须来自 PrepareSinkTarget()。每行通过一次 write(2) 追加，描述符以
 * O_APPEND|O_NOFOLLOW 打开且不带 O_CREAT，并与校验时的 (device, inode) 比对。
 * 校验后被删除、替换为符号链接或替换为其他文件的目标会被报告，而不是被重新创建、
 * 跟随或写入。
 */
class FileSink : public Sink {
public:
    explicit FileSink(FileIdentity identity);

    void Write(const LogRecord& record, std::string_view text) override;
    void Flush() override {}
    bool HasError() const override { return m_hasError; }
    std::string GetLastError() const override { return m_lastError; }

    /**
     * @brief Append a line without a record (used for the INIT line)
     * @brief 不带记录地追加一行（用于 INIT 行）
     */
    ErrorCode Append(std::string_view text);

    const FileIdentity& GetIdentity() const { return m_identity; }

private:
    FileIdentity m_identity;
    bool m_hasError{false};
    std::string m_lastError;
};

// ==============================================================================
// JournalSink / 系统日志输出
// ==============================================================================

/**
 * @brief Forwards records to syslog through the `logger` utility
 * @brief 通过 `logger` 工具将记录转发到 syslog
 *
 * Runs `logger -p daemon.<priority> -t <tag> -- <message>` with posix_spawnp and
 * waits for it. No shell is involved; the message is a single argv element.
 *
 * 使用 posix_spawnp 运行 `logger -p daemon.<priority> -t <tag> -- <message>` 并等待
 * 其结束。不经过 shell；消息是单个 argv 元素。
 */
class JournalSink : public Sink {
public:
    explicit JournalSink(std::string utility = SCRIPTLOG_SYSLOG_UTILITY);

    void SetTag(std::string tag) { m_tag = std::move(tag); }
    const std::string& GetTag() const { return m_tag; }

    /// Byte cap for forwarded messages, 0 = unlimited / 转发消息字节上限，0 表示不限制
    void SetMaxLength(size_t maxLength) { m_maxLength = maxLength; }
    size_t GetMaxLength() const { return m_maxLength; }

    void Write(const LogRecord& record, std::string_view text) override;
    void Flush() override {}
    bool HasError() const override { return IsError(m_lastErrorCode); }
    std::string GetLastError() const override {
        return std::string(ErrorCodeToMessage(m_lastErrorCode));
    }
    ErrorCode GetLastErrorCode() const { return m_lastErrorCode; }

    /**
     * @brief Whether the utility can be found
     * @brief 是否能找到该工具
     */
    virtual bool IsAvailable() const;

    /**
     * @brief Search PATH (or check directly when it contains '/') for an executable
     * @brief 在 PATH 中查找可执行文件（包含 '/' 时直接检查）
     */
    static bool FindUtility(const std::string& utility);

protected:
    /**
     * @brief Hand one message to the utility
     * @brief 将一条消息交给工具
     *
     * @param facility `daemon.<priority>` / `daemon.<priority>`
     * @return true if the utility exited with status 0 / 工具以 0 退出时返回 true
     */
    virtual bool Forward(const std::string& facility, const std::string& tag,
                         const std::string& message);

private:
    std::string m_utility;
    std::string m_tag;
    size_t m_maxLength{kDefaultMaxJournalLength};
    ErrorCode m_lastErrorCode{ErrorCode::Success};
};

}  // namespace scriptlog
