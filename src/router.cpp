/**
 * @file router.cpp
 * @brief Stream router implementation
 * @brief 流路由器实现
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#include "scriptlog/router.hpp"

#include <string>

#include "scriptlog/color.hpp"

namespace scriptlog {

StreamRouter::StreamRouter(Diagnostics& diagnostics)
    : m_diagnostics(diagnostics)
    , m_stdout(std::make_shared<ConsoleSink>(ConsoleSink::Stream::StdOut))
    , m_stderr(std::make_shared<ConsoleSink>(ConsoleSink::Stream::StdErr))
    , m_journal(std::make_shared<JournalSink>()) {}

void StreamRouter::SetFileSink(std::shared_ptr<Sink> sink) {
    m_file = std::move(sink);
    m_fileFailing = false;
}

bool StreamRouter::Route(const LogRecord& record, std::string_view line,
                         const SessionState& state, bool sensitive) {
    if (!Accepts(record.level, state)) {
        return false;
    }

    if (sensitive) {
        if (!state.consoleEnabled) {
            return true;
        }
        const bool toStderr = UsesStderr(record.level, state.stderrLevel);
        const auto& sink = toStderr ? m_stderr : m_stdout;
        if (state.sensitiveRequiresTerminal && sink && !sink->IsTerminal()) {
            if (!m_sensitiveWarned) {
                m_diagnostics.Warning(
                    "Sensitive message suppressed because the console is not a terminal");
                m_sensitiveWarned = true;
            }
            return true;
        }
        WriteConsole(record, line, state, toStderr);
        return true;
    }

    if (state.consoleEnabled) {
        WriteConsole(record, line, state, UsesStderr(record.level, state.stderrLevel));
    }
    WriteFile(record, line);
    if (state.journalEnabled) {
        WriteJournal(record, record.message, state);
    }
    return true;
}

void StreamRouter::RouteAudit(const LogRecord& record, std::string_view line,
                              const SessionState& state, bool journal) {
    if (state.consoleEnabled) {
        WriteConsole(record, line, state, false);
    }
    WriteFile(record, line);
    if (journal) {
        std::string text(kConfigRecordName);
        text.append(": ");
        text.append(record.message);
        LogRecord notice = record;
        notice.level = Level::Notice;
        WriteJournal(notice, text, state);
    }
}

void StreamRouter::WriteConsole(const LogRecord& record, std::string_view line,
                                const SessionState& state, bool toStderr) {
    const auto& sink = toStderr ? m_stderr : m_stdout;
    if (!sink) {
        return;
    }
    const TerminalEnvironment env = TerminalEnvironment::Capture(sink->IsTerminal());
    if (ShouldColorize(state.colorMode, env)) {
        sink->Write(record, Colorize(line, record.levelName));
    } else {
        sink->Write(record, line);
    }
}

void StreamRouter::WriteFile(const LogRecord& record, std::string_view line) {
    if (!m_file) {
        return;
    }
    m_file->Write(record, line);
    if (!m_file->HasError()) {
        m_fileFailing = false;
        return;
    }
    if (!m_fileFailing) {
        m_diagnostics.Error("{}", m_file->GetLastError());
        m_fileFailing = true;
    }
    // Keep the line visible somewhere
    if (m_stderr) {
        m_stderr->Write(record, line);
    }
}

void StreamRouter::WriteJournal(const LogRecord& record, std::string_view text,
                                const SessionState& state) {
    if (!m_journal) {
        return;
    }
    m_journal->SetTag(std::string(state.EffectiveJournalTag()));
    m_journal->SetMaxLength(state.maxJournalLength);
    m_journal->Write(record, text);
    if (!m_journal->HasError()) {
        m_journalFailing = false;
        return;
    }
    if (!m_journalFailing) {
        m_diagnostics.Warning("{}", m_journal->GetLastError());
        m_journalFailing = true;
    }
}

}  // namespace scriptlog
