/**
 * @file diagnostics.cpp
 * @brief Diagnostic reporter implementation
 * @brief 诊断报告器实现
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#include "scriptlog/diagnostics.hpp"

#include <cstdio>

#include <fmt/format.h>

#include "scriptlog/sanitizer.hpp"

namespace scriptlog {

Diagnostics::Diagnostics() : m_handler(&Diagnostics::PrintToStderr) {}

Diagnostics::Diagnostics(DiagnosticHandler handler) : m_handler(std::move(handler)) {
    if (!m_handler) {
        m_handler = &Diagnostics::PrintToStderr;
    }
}

void Diagnostics::SetHandler(DiagnosticHandler handler) {
    m_handler = handler ? std::move(handler) : DiagnosticHandler(&Diagnostics::PrintToStderr);
}

void Diagnostics::Report(DiagnosticLevel level, std::string_view message) {
    if (level == DiagnosticLevel::Error) {
        ++m_errorCount;
    } else {
        ++m_warningCount;
    }
    // Messages may quote config keys, so they get the same filtering as log text
    const std::string clean = Sanitize(message, false, false);
    m_handler(level, clean);
}

void Diagnostics::PrintToStderr(DiagnosticLevel level, std::string_view message) {
    fmt::print(stderr, "{}: {}\n", DiagnosticLevelToString(level), message);
    std::fflush(stderr);
}

}  // namespace scriptlog
