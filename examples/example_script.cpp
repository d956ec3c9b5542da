/**
 * @file example_script.cpp
 * @brief Example of scriptLog in a maintenance job
 * @brief scriptLog 在维护任务中的使用示例
 *
 * Run with the same options a script would pass, for example:
 * 以脚本会传入的相同选项运行，例如：
 *
 *   example_script -l /tmp/scriptlog-demo/job.log -d DEBUG --color
 *   example_script -c /etc/scriptlog.conf -j -t demo
 *
 * Features demonstrated / 演示的功能:
 * - Initialization from command-line options / 从命令行选项初始化
 * - Level methods and fmt-style formatting / 级别方法与 fmt 风格格式化
 * - Sanitization of untrusted input / 不可信输入的净化
 * - Sensitive console-only output / 仅控制台的敏感输出
 * - Runtime configuration with CONFIG audit records / 带 CONFIG 审计记录的运行时配置
 * - Default logger and macros / 默认日志器与宏
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#include <iostream>
#include <memory>
#include <string>

#include <scriptlog/scriptlog.hpp>

// ==============================================================================
// Example 1: Level Methods
// 示例 1: 级别方法
// ==============================================================================

/**
 * @brief Log a job's progress at several severities
 * @brief 以多个严重级别记录任务进度
 */
void LevelExample(scriptlog::Logger& logger) {
    std::cout << "\n=== Example 1: Level Methods / 级别方法 ===" << std::endl;

    logger.Debug("Resolving backup targets");
    logger.Info("Starting nightly backup");
    logger.Notice("Using {} parallel workers", 4);
    logger.Warn("Disk usage at {}%", 91);
    logger.Error("Failed to copy {} of {} files", 2, 1500);
}

// ==============================================================================
// Example 2: Untrusted Input
// 示例 2: 不可信输入
// ==============================================================================

/**
 * @brief Messages with injected newlines or escapes stay on one clean line
 * @brief 注入了换行或转义序列的消息保持为干净的一行
 */
void SanitizationExample(scriptlog::Logger& logger) {
    std::cout << "\n=== Example 2: Untrusted Input / 不可信输入 ===" << std::endl;

    const std::string hostile =
        "user=alice\n2024-01-01 00:00:00 [INFO] [root] forged entry\x1b]0;owned\x07";
    logger.Info("Login attempt: {}", hostile);
}

// ==============================================================================
// Example 3: Sensitive Output
// 示例 3: 敏感输出
// ==============================================================================

/**
 * @brief Secrets go to the terminal only, never to the file or journal
 * @brief 机密只输出到终端，从不写入文件或系统日志
 */
void SensitiveExample(scriptlog::Logger& logger) {
    std::cout << "\n=== Example 3: Sensitive Output / 敏感输出 ===" << std::endl;

    logger.Sensitive("Generated one-time password: {}", "h7Kq-29xz");
}

// ==============================================================================
// Example 4: Runtime Configuration
// 示例 4: 运行时配置
// ==============================================================================

/**
 * @brief Each change is announced as a CONFIG record
 * @brief 每次更改都会以 CONFIG 记录公布
 */
void RuntimeConfigExample(scriptlog::Logger& logger) {
    std::cout << "\n=== Example 4: Runtime Configuration / 运行时配置 ===" << std::endl;

    logger.SetLevel(scriptlog::Level::Debug);
    logger.Debug("Now visible");

    if (scriptlog::IsError(logger.SetLevel("LOUD"))) {
        std::cout << "Rejected invalid level, still at "
                  << scriptlog::LevelToString(logger.GetLevel()) << std::endl;
    }

    logger.SetTimezoneUtc(true);
    logger.SetFormat("%d %z [%l] %m");
    logger.Info("Formatted with an explicit timezone");
    logger.SetFormat(scriptlog::kDefaultPattern);
}

// ==============================================================================
// Example 5: Default Logger and Macros
// 示例 5: 默认日志器与宏
// ==============================================================================

void MacroExample(std::shared_ptr<scriptlog::Logger> logger) {
    std::cout << "\n=== Example 5: Default Logger / 默认日志器 ===" << std::endl;

    scriptlog::SetDefaultLogger(std::move(logger));
    SCRIPTLOG_INFO("Backup finished in {} seconds", 37);
    SCRIPTLOG_NOTICE("Next run scheduled");
}

int main(int argc, char** argv) {
    std::cout << "========================================" << std::endl;
    std::cout << "scriptLog Examples" << std::endl;
    std::cout << "scriptLog 示例" << std::endl;
    std::cout << "========================================" << std::endl;

    auto logger = std::make_shared<scriptlog::Logger>();
    const scriptlog::ErrorCode rc = logger->Init(argc, argv);
    if (scriptlog::IsError(rc)) {
        std::cerr << "Initialization failed: " << scriptlog::ErrorCodeToString(rc) << std::endl;
        return 1;
    }

    LevelExample(*logger);
    SanitizationExample(*logger);
    SensitiveExample(*logger);
    RuntimeConfigExample(*logger);
    MacroExample(logger);

    std::cout << "\n========================================" << std::endl;
    std::cout << "All examples completed!" << std::endl;
    std::cout << "所有示例完成！" << std::endl;
    std::cout << "========================================" << std::endl;

    return 0;
}
