/**
 * @file sink.cpp
 * @brief Log output sinks implementation
 * @brief 日志输出目标实现
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#include "scriptlog/sink.hpp"

#include <fcntl.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <vector>

extern char** environ;

namespace scriptlog {

// ==============================================================================
// ConsoleSink / 控制台输出
// ==============================================================================

ConsoleSink::ConsoleSink(Stream stream)
    : m_out(stream == Stream::StdOut ? stdout : stderr) {}

ConsoleSink::ConsoleSink(FILE* out) : m_out(out) {}

void ConsoleSink::Write(const LogRecord& /*record*/, std::string_view text) {
    m_hasError = false;
    if (std::fwrite(text.data(), 1, text.size(), m_out) != text.size() ||
        std::fputc('\n', m_out) == EOF || std::fflush(m_out) != 0) {
        m_hasError = true;
        m_lastError = "Failed to write to console";
        std::clearerr(m_out);
    }
}

void ConsoleSink::Flush() {
    std::fflush(m_out);
}

bool ConsoleSink::IsTerminal() const {
    const int fd = ::fileno(m_out);
    return fd >= 0 && ::isatty(fd) == 1;
}

// ==============================================================================
// FileSink / 文件输出
// ==============================================================================

FileSink::FileSink(FileIdentity identity) : m_identity(std::move(identity)) {}

void FileSink::Write(const LogRecord& /*record*/, std::string_view text) {
    Append(text);
}

ErrorCode FileSink::Append(std::string_view text) {
    m_hasError = false;
    m_lastError.clear();

    // No O_CREAT: a vanished file is a failure, not something to recreate
    const int fd = ::open(m_identity.path.c_str(),
                          O_WRONLY | O_APPEND | O_NOFOLLOW | O_NONBLOCK | O_CLOEXEC);
    ErrorCode rc = ErrorCode::Success;
    if (fd < 0) {
        rc = ErrorCode::FileWriteFailed;
    } else {
        struct stat st {};
        if (::fstat(fd, &st) != 0 || !S_ISREG(st.st_mode)) {
            rc = ErrorCode::FileWriteFailed;
        } else if (st.st_dev != m_identity.device || st.st_ino != m_identity.inode) {
            // Another regular file renamed over the validated path
            rc = ErrorCode::TargetChanged;
        } else {
            std::string line;
            line.reserve(text.size() + 1);
            line.append(text);
            line.push_back('\n');
            ssize_t written = -1;
            do {
                written = ::write(fd, line.data(), line.size());
            } while (written < 0 && errno == EINTR);
            if (written != static_cast<ssize_t>(line.size())) {
                rc = ErrorCode::FileWriteFailed;
            }
        }
        ::close(fd);
    }

    if (IsError(rc)) {
        m_hasError = true;
        m_lastError = std::string(ErrorCodeToMessage(rc));
    }
    return rc;
}

// ==============================================================================
// JournalSink / 系统日志输出
// ==============================================================================

JournalSink::JournalSink(std::string utility) : m_utility(std::move(utility)) {}

void JournalSink::Write(const LogRecord& record, std::string_view text) {
    if (!IsAvailable()) {
        m_lastErrorCode = ErrorCode::JournalUnavailable;
        return;
    }
    std::string facility = "daemon.";
    facility.append(LevelToSyslogPriority(record.level));

    const std::string message =
        m_maxLength > 0 ? TruncateUtf8(text, m_maxLength) : std::string(text);
    m_lastErrorCode = Forward(facility, m_tag, message) ? ErrorCode::Success
                                                        : ErrorCode::JournalSendFailed;
}

bool JournalSink::IsAvailable() const {
    return FindUtility(m_utility);
}

bool JournalSink::FindUtility(const std::string& utility) {
    if (utility.empty()) {
        return false;
    }
    if (utility.find('/') != std::string::npos) {
        return ::access(utility.c_str(), X_OK) == 0;
    }
    const char* pathEnv = std::getenv("PATH");
    const std::string searchPath = pathEnv != nullptr ? pathEnv : "/usr/bin:/bin";

    size_t start = 0;
    while (start <= searchPath.size()) {
        size_t end = searchPath.find(':', start);
        if (end == std::string::npos) {
            end = searchPath.size();
        }
        std::string dir = searchPath.substr(start, end - start);
        if (dir.empty()) {
            dir = ".";
        }
        const std::string candidate = dir + "/" + utility;
        struct stat st {};
        if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            ::access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
        start = end + 1;
    }
    return false;
}

bool JournalSink::Forward(const std::string& facility, const std::string& tag,
                          const std::string& message) {
    std::vector<char*> argv = {
        const_cast<char*>(m_utility.c_str()),
        const_cast<char*>("-p"),
        const_cast<char*>(facility.c_str()),
        const_cast<char*>("-t"),
        const_cast<char*>(tag.c_str()),
        const_cast<char*>("--"),
        const_cast<char*>(message.c_str()),
        nullptr,
    };

    posix_spawn_file_actions_t actions;
    if (posix_spawn_file_actions_init(&actions) != 0) {
        return false;
    }
    if (posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0) != 0 ||
        posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0) != 0) {
        posix_spawn_file_actions_destroy(&actions);
        return false;
    }

    pid_t pid = 0;
    const int spawnRc = posix_spawnp(&pid, m_utility.c_str(), &actions, nullptr, argv.data(),
                                     environ);
    posix_spawn_file_actions_destroy(&actions);
    if (spawnRc != 0) {
        return false;
    }

    int status = 0;
    pid_t waited = -1;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    return waited == pid && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

}  // namespace scriptlog
