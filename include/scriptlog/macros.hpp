/**
 * @file macros.hpp
 * @brief Logging macros for scriptLog
 * @brief scriptLog 日志宏定义
 *
 * The macros log through DefaultLogger(). A level can be compiled out by
 * defining SCRIPTLOG_DISABLE_<LEVEL>.
 * 这些宏通过 DefaultLogger() 记录日志。定义 SCRIPTLOG_DISABLE_<LEVEL> 可在编译期移除某个级别。
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#pragma once

#include "scriptlog/logger.hpp"

// ==============================================================================
// Basic Logging Macros / 基本日志宏
// ==============================================================================

/**
 * @brief Log at EMERGENCY level
 * @brief 以 EMERGENCY 级别记录日志
 */
#ifndef SCRIPTLOG_DISABLE_EMERGENCY
#define SCRIPTLOG_EMERGENCY(...) \
    do { \
        auto logger = ::scriptlog::DefaultLogger(); \
        if (logger) { \
            logger->Emergency(__VA_ARGS__); \
        } \
    } while (0)
#else
#define SCRIPTLOG_EMERGENCY(...) ((void)0)
#endif

/**
 * @brief Log at ALERT level
 * @brief 以 ALERT 级别记录日志
 */
#ifndef SCRIPTLOG_DISABLE_ALERT
#define SCRIPTLOG_ALERT(...) \
    do { \
        auto logger = ::scriptlog::DefaultLogger(); \
        if (logger) { \
            logger->Alert(__VA_ARGS__); \
        } \
    } while (0)
#else
#define SCRIPTLOG_ALERT(...) ((void)0)
#endif

/**
 * @brief Log at CRITICAL level
 * @brief 以 CRITICAL 级别记录日志
 */
#ifndef SCRIPTLOG_DISABLE_CRITICAL
#define SCRIPTLOG_CRITICAL(...) \
    do { \
        auto logger = ::scriptlog::DefaultLogger(); \
        if (logger) { \
            logger->Critical(__VA_ARGS__); \
        } \
    } while (0)
#else
#define SCRIPTLOG_CRITICAL(...) ((void)0)
#endif

/**
 * @brief Log at ERROR level
 * @brief 以 ERROR 级别记录日志
 */
#ifndef SCRIPTLOG_DISABLE_ERROR
#define SCRIPTLOG_ERROR(...) \
    do { \
        auto logger = ::scriptlog::DefaultLogger(); \
        if (logger) { \
            logger->Error(__VA_ARGS__); \
        } \
    } while (0)
#else
#define SCRIPTLOG_ERROR(...) ((void)0)
#endif

/**
 * @brief Log at WARN level
 * @brief 以 WARN 级别记录日志
 */
#ifndef SCRIPTLOG_DISABLE_WARN
#define SCRIPTLOG_WARN(...) \
    do { \
        auto logger = ::scriptlog::DefaultLogger(); \
        if (logger) { \
            logger->Warn(__VA_ARGS__); \
        } \
    } while (0)
#else
#define SCRIPTLOG_WARN(...) ((void)0)
#endif

/**
 * @brief Log at NOTICE level
 * @brief 以 NOTICE 级别记录日志
 */
#ifndef SCRIPTLOG_DISABLE_NOTICE
#define SCRIPTLOG_NOTICE(...) \
    do { \
        auto logger = ::scriptlog::DefaultLogger(); \
        if (logger) { \
            logger->Notice(__VA_ARGS__); \
        } \
    } while (0)
#else
#define SCRIPTLOG_NOTICE(...) ((void)0)
#endif

/**
 * @brief Log at INFO level
 * @brief 以 INFO 级别记录日志
 */
#ifndef SCRIPTLOG_DISABLE_INFO
#define SCRIPTLOG_INFO(...) \
    do { \
        auto logger = ::scriptlog::DefaultLogger(); \
        if (logger) { \
            logger->Info(__VA_ARGS__); \
        } \
    } while (0)
#else
#define SCRIPTLOG_INFO(...) ((void)0)
#endif

/**
 * @brief Log at DEBUG level
 * @brief 以 DEBUG 级别记录日志
 */
#ifndef SCRIPTLOG_DISABLE_DEBUG
#define SCRIPTLOG_DEBUG(...) \
    do { \
        auto logger = ::scriptlog::DefaultLogger(); \
        if (logger) { \
            logger->Debug(__VA_ARGS__); \
        } \
    } while (0)
#else
#define SCRIPTLOG_DEBUG(...) ((void)0)
#endif

/// FATAL is EMERGENCY / FATAL 即 EMERGENCY
#define SCRIPTLOG_FATAL(...) SCRIPTLOG_EMERGENCY(__VA_ARGS__)

// ==============================================================================
// Sensitive Logging Macro / 敏感信息日志宏
// ==============================================================================

/**
 * @brief Log to the console only, never to file or journal
 * @brief 仅输出到控制台，从不写入文件或系统日志
 */
#define SCRIPTLOG_SENSITIVE(...) \
    do { \
        auto logger = ::scriptlog::DefaultLogger(); \
        if (logger) { \
            logger->Sensitive(__VA_ARGS__); \
        } \
    } while (0)
