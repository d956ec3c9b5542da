/**
 * @file sanitizer.hpp
 * @brief Message sanitization for scriptLog
 * @brief scriptLog 消息净化
 *
 * Every message passes through Sanitize() before it is formatted. The sanitizer
 * removes bytes that could forge additional log records (line breaks) or drive the
 * terminal of whoever reads the log (ANSI escape sequences).
 *
 * 每条消息在格式化之前都会经过 Sanitize()。净化器会移除可能伪造额外日志记录的字节
 * （换行）或可能控制日志读者终端的字节（ANSI 转义序列）。
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace scriptlog {

// ==============================================================================
// Limits / 限制
// ==============================================================================

constexpr size_t kDefaultMaxLineLength = 4096;     ///< Default message cap / 默认消息上限
constexpr size_t kDefaultMaxJournalLength = 4096;  ///< Default journal cap / 默认日志服务上限
constexpr size_t kMaxScriptNameLength = 255;       ///< Script name cap / 脚本名上限
constexpr size_t kMaxJournalTagLength = 64;        ///< Journal tag cap / 日志标签上限

// ==============================================================================
// Sanitize / 净化
// ==============================================================================

/**
 * @brief Sanitize a raw message
 * @brief 净化原始消息
 *
 * - NUL, C0 controls other than LF/CR/HT/ESC, and DEL are always removed.
 * - Without `allowNewlines`, LF, CR and HT each become a single space.
 * - Without `allowAnsi`, ANSI escape sequences are removed (see StripAnsiCodes).
 * - The result is truncated to `maxLength` bytes (0 = unlimited) on a UTF-8
 *   character boundary.
 *
 * - 总是移除 NUL、除 LF/CR/HT/ESC 外的 C0 控制字符以及 DEL。
 * - 未设置 `allowNewlines` 时，LF、CR、HT 各替换为一个空格。
 * - 未设置 `allowAnsi` 时，移除 ANSI 转义序列（见 StripAnsiCodes）。
 * - 结果按 UTF-8 字符边界截断到 `maxLength` 字节（0 表示不限制）。
 *
 * @param raw Untrusted input / 不可信输入
 * @param allowNewlines Keep LF/CR/HT / 保留 LF/CR/HT
 * @param allowAnsi Keep escape sequences / 保留转义序列
 * @param maxLength Byte cap, 0 = unlimited / 字节上限，0 表示不限制
 */
std::string Sanitize(std::string_view raw, bool allowNewlines, bool allowAnsi,
                     size_t maxLength = 0);

/**
 * @brief Remove ANSI escape sequences
 * @brief 移除 ANSI 转义序列
 *
 * Recognized forms: CSI (`ESC [` params intermediates final), OSC (`ESC ]` up to
 * BEL or ST, swallowing nested escapes), DCS/SOS/PM/APC strings (`ESC P`, `ESC X`,
 * `ESC ^`, `ESC _` up to ST), two-byte escapes with optional intermediates, and any
 * lone ESC. Unterminated OSC and string sequences consume the rest of the input.
 *
 * 识别的形式：CSI、OSC（以 BEL 或 ST 结束，吞掉内部嵌套转义）、DCS/SOS/PM/APC 字符串、
 * 带可选中间字节的双字节转义，以及单独的 ESC。未结束的 OSC 和字符串序列会吞掉剩余输入。
 */
std::string StripAnsiCodes(std::string_view text);

/**
 * @brief Truncate to at most `maxLength` bytes without splitting a UTF-8 sequence
 * @brief 截断至最多 `maxLength` 字节，且不拆分 UTF-8 序列
 */
std::string TruncateUtf8(std::string_view text, size_t maxLength);

/**
 * @brief Check for C0 control characters or DEL
 * @brief 检查是否包含 C0 控制字符或 DEL
 */
bool ContainsControlCharacters(std::string_view text) noexcept;

/**
 * @brief Check if `c` is a shell metacharacter
 * @brief 检查 `c` 是否为 shell 元字符
 */
bool IsShellMetacharacter(char c) noexcept;

/**
 * @brief Restrict a script name to `[A-Za-z0-9._-]`
 * @brief 将脚本名限制为 `[A-Za-z0-9._-]`
 *
 * Every other byte becomes `_`; the result is capped at kMaxScriptNameLength.
 * Idempotent.
 */
std::string SanitizeScriptName(std::string_view name);

/**
 * @brief Replace shell metacharacters in a journal tag with `_`
 * @brief 将日志标签中的 shell 元字符替换为 `_`
 *
 * Spaces are kept. Length is not changed; callers apply kMaxJournalTagLength.
 *
 * @param tag Tag text / 标签文本
 * @param changed Set to true if any byte was replaced / 有字节被替换时置为 true
 */
std::string SanitizeJournalTag(std::string_view tag, bool* changed = nullptr);

}  // namespace scriptlog
