/**
 * @file sink_target.hpp
 * @brief Log file validation and creation
 * @brief 日志文件校验与创建
 *
 * PrepareSinkTarget() turns a configured path into a FileIdentity only after it has
 * proven the path names a regular, non-symlink, owner-writable file. Creation uses
 * O_CREAT|O_EXCL|O_NOFOLLOW, and the object is validated again after any creation
 * attempt, so a symlink planted between the existence check and the open is
 * rejected instead of followed.
 *
 * PrepareSinkTarget() 只有在证明路径指向普通的、非符号链接的、所有者可写的文件后，
 * 才会将其转换为 FileIdentity。创建时使用 O_CREAT|O_EXCL|O_NOFOLLOW，并在任何创建
 * 尝试之后再次校验，因此在存在性检查与打开之间植入的符号链接会被拒绝而不是被跟随。
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#pragma once

#include <sys/types.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "scriptlog/common.hpp"

namespace scriptlog {

constexpr size_t kMaxPathLength = 4096;  ///< Longest accepted path / 最长路径

/**
 * @brief Result of the textual path check
 * @brief 路径文本检查结果
 */
enum class PathCheck : uint8_t {
    Ok = 0,
    Empty,
    Relative,
    ControlCharacters,
    CommandSubstitution,
    TooLong
};

/**
 * @brief Path-free reason text for a PathCheck
 * @brief PathCheck 对应的不含路径的原因文本
 */
constexpr std::string_view PathCheckToMessage(PathCheck check) noexcept {
    switch (check) {
        case PathCheck::Ok:
            return "ok";
        case PathCheck::Empty:
            return "is empty";
        case PathCheck::Relative:
            return "must be an absolute path";
        case PathCheck::ControlCharacters:
            return "contains control characters";
        case PathCheck::CommandSubstitution:
            return "contains command substitution characters";
        case PathCheck::TooLong:
            return "exceeds maximum length";
        default:
            return "is invalid";
    }
}

/**
 * @brief Validate a log path as text, without touching the filesystem
 * @brief 仅按文本校验日志路径，不访问文件系统
 */
PathCheck CheckLogPath(std::string_view path) noexcept;

/**
 * @brief A validated log file
 * @brief 已校验的日志文件
 */
struct FileIdentity {
    std::string path;  ///< Absolute path / 绝对路径
    dev_t device{0};   ///< st_dev at validation / 校验时的 st_dev
    ino_t inode{0};    ///< st_ino at validation / 校验时的 st_ino

    bool IsValid() const { return !path.empty(); }
};

/**
 * @brief Create the missing parent directories of `path` (mode 0755)
 * @brief 创建 `path` 缺失的父目录（权限 0755）
 *
 * @return Success or DirectoryCreateFailed / 成功或 DirectoryCreateFailed
 */
ErrorCode CreateParentDirectories(const std::string& path);

/**
 * @brief Validate, create if needed, and identify a log file
 * @brief 校验、按需创建并识别日志文件
 *
 * @param path Configured path / 配置的路径
 * @param identity Filled on success / 成功时填充
 * @return Success, or the reason the path is unusable / 成功或路径不可用的原因
 */
ErrorCode PrepareSinkTarget(const std::string& path, FileIdentity& identity);

}  // namespace scriptlog
