/**
 * @file sink_target.cpp
 * @brief Log file validation and creation implementation
 * @brief 日志文件校验与创建实现
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#include "scriptlog/sink_target.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>

#include "scriptlog/sanitizer.hpp"

namespace scriptlog {

namespace {

constexpr mode_t kDirectoryMode = 0755;
constexpr mode_t kFileMode = 0644;

/// Closes a descriptor on scope exit / 作用域结束时关闭描述符
class ScopedFd {
public:
    explicit ScopedFd(int fd) : m_fd(fd) {}
    ~ScopedFd() {
        if (m_fd >= 0) {
            ::close(m_fd);
        }
    }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int Get() const { return m_fd; }

private:
    int m_fd;
};

ErrorCode OpenErrorToCode(int err) {
    switch (err) {
        case ELOOP:
            return ErrorCode::SymlinkRejected;
        case EISDIR:
        case ENXIO:
        case ENODEV:
            return ErrorCode::NotRegularFile;
        case EACCES:
        case EPERM:
        case EROFS:
        case ETXTBSY:
            return ErrorCode::NotWritable;
        default:
            return ErrorCode::FileOpenFailed;
    }
}

}  // namespace

PathCheck CheckLogPath(std::string_view path) noexcept {
    if (path.empty()) {
        return PathCheck::Empty;
    }
    if (path.front() != '/') {
        return PathCheck::Relative;
    }
    if (path.size() > kMaxPathLength) {
        return PathCheck::TooLong;
    }
    if (ContainsControlCharacters(path)) {
        return PathCheck::ControlCharacters;
    }
    if (path.find('`') != std::string_view::npos || path.find("$(") != std::string_view::npos) {
        return PathCheck::CommandSubstitution;
    }
    return PathCheck::Ok;
}

ErrorCode CreateParentDirectories(const std::string& path) {
    const size_t lastSlash = path.find_last_of('/');
    if (lastSlash == std::string::npos || lastSlash == 0) {
        return ErrorCode::Success;
    }

    // Walk every prefix ending before a '/' / 遍历每个以 '/' 结尾之前的前缀
    size_t pos = 0;
    while (pos < lastSlash) {
        pos = path.find('/', pos + 1);
        if (pos == std::string::npos || pos > lastSlash) {
            pos = lastSlash;
        }
        const std::string prefix = path.substr(0, pos);
        if (prefix.empty() || prefix.back() == '/') {
            continue;
        }
        if (::mkdir(prefix.c_str(), kDirectoryMode) == 0) {
            continue;
        }
        if (errno != EEXIST) {
            return ErrorCode::DirectoryCreateFailed;
        }
        struct stat st {};
        if (::stat(prefix.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
            return ErrorCode::DirectoryCreateFailed;
        }
    }
    return ErrorCode::Success;
}

ErrorCode PrepareSinkTarget(const std::string& path, FileIdentity& identity) {
    switch (CheckLogPath(path)) {
        case PathCheck::Ok:
            break;
        case PathCheck::Relative:
            return ErrorCode::RelativePath;
        default:
            return ErrorCode::InvalidPath;
    }

    ErrorCode rc = CreateParentDirectories(path);
    if (IsError(rc)) {
        return rc;
    }

    // Exclusive create. EEXIST means the file (or something else) is already
    // there; every outcome is validated below.
    // 独占创建。EEXIST 表示文件（或其他对象）已存在；所有结果都在下面校验。
    const int createdFd =
        ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, kFileMode);
    if (createdFd >= 0) {
        ::close(createdFd);
    }

    struct stat linkStat {};
    if (::lstat(path.c_str(), &linkStat) != 0) {
        return ErrorCode::FileOpenFailed;
    }
    if (S_ISLNK(linkStat.st_mode)) {
        return ErrorCode::SymlinkRejected;
    }
    if (!S_ISREG(linkStat.st_mode)) {
        return ErrorCode::NotRegularFile;
    }
    if ((linkStat.st_mode & S_IWUSR) == 0) {
        return ErrorCode::NotWritable;
    }

    ScopedFd fd(::open(path.c_str(), O_WRONLY | O_APPEND | O_NOFOLLOW | O_NONBLOCK | O_CLOEXEC));
    if (fd.Get() < 0) {
        return OpenErrorToCode(errno);
    }

    struct stat fdStat {};
    if (::fstat(fd.Get(), &fdStat) != 0) {
        return ErrorCode::FileOpenFailed;
    }
    if (!S_ISREG(fdStat.st_mode)) {
        return ErrorCode::NotRegularFile;
    }
    if (fdStat.st_dev != linkStat.st_dev || fdStat.st_ino != linkStat.st_ino) {
        return ErrorCode::TargetChanged;
    }

    identity.path = path;
    identity.device = fdStat.st_dev;
    identity.inode = fdStat.st_ino;
    return ErrorCode::Success;
}

}  // namespace scriptlog
