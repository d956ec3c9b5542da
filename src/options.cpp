/**
 * @file options.cpp
 * @brief Command-line parsing implementation
 * @brief 命令行解析实现
 *
 * @copyright Copyright (c) 2024 scriptLog
 */

#include "scriptlog/options.hpp"

#include <cstdint>
#include <string_view>

namespace scriptlog {

namespace {

enum class OptionId : uint8_t {
    Log,
    Quiet,
    Verbose,
    Level,
    Format,
    Utc,
    Journal,
    Tag,
    Color,
    NoColor,
    StderrLevel,
    Config,
    UnsafeNewlines,
    UnsafeAnsi,
    MaxLineLength,
    MaxJournalLength,
    ScriptName
};

struct OptionSpec {
    char shortName;  ///< '\0' when there is no short form / 无短选项时为 '\0'
    std::string_view longName;
    OptionId id;
    bool takesValue;
};

constexpr OptionSpec kOptions[] = {
    {'l', "log", OptionId::Log, true},
    {'q', "quiet", OptionId::Quiet, false},
    {'v', "verbose", OptionId::Verbose, false},
    {'d', "level", OptionId::Level, true},
    {'f', "format", OptionId::Format, true},
    {'u', "utc", OptionId::Utc, false},
    {'j', "journal", OptionId::Journal, false},
    {'t', "tag", OptionId::Tag, true},
    {'\0', "color", OptionId::Color, false},
    {'\0', "no-color", OptionId::NoColor, false},
    {'e', "stderr-level", OptionId::StderrLevel, true},
    {'c', "config", OptionId::Config, true},
    {'U', "unsafe-allow-newlines", OptionId::UnsafeNewlines, false},
    {'A', "unsafe-allow-ansi-codes", OptionId::UnsafeAnsi, false},
    {'\0', "max-line-length", OptionId::MaxLineLength, true},
    {'\0', "max-journal-length", OptionId::MaxJournalLength, true},
    {'n', "script-name", OptionId::ScriptName, true},
};

const OptionSpec* FindShort(char name) {
    for (const auto& spec : kOptions) {
        if (spec.shortName != '\0' && spec.shortName == name) {
            return &spec;
        }
    }
    return nullptr;
}

const OptionSpec* FindLong(std::string_view name) {
    for (const auto& spec : kOptions) {
        if (spec.longName == name) {
            return &spec;
        }
    }
    return nullptr;
}

std::string_view Basename(std::string_view path) {
    const size_t slash = path.find_last_of('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

}  // namespace

ErrorCode ParseArguments(int argc, const char* const* argv, InitOptions& options,
                         Diagnostics& diagnostics) {
    if (argc > 0 && argv != nullptr && argv[0] != nullptr) {
        options.programName = std::string(Basename(argv[0]));
    }

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i] != nullptr ? argv[i] : "";

        const OptionSpec* spec = nullptr;
        std::string_view inlineValue;
        bool hasInlineValue = false;

        if (arg.size() > 2 && arg.substr(0, 2) == "--") {
            std::string_view name = arg.substr(2);
            const size_t eq = name.find('=');
            if (eq != std::string_view::npos) {
                inlineValue = name.substr(eq + 1);
                hasInlineValue = true;
                name = name.substr(0, eq);
            }
            spec = FindLong(name);
        } else if (arg.size() == 2 && arg.front() == '-') {
            spec = FindShort(arg[1]);
        }

        if (spec == nullptr) {
            diagnostics.Error("Unknown option: {}", arg);
            return ErrorCode::InvalidArgument;
        }

        std::string value;
        if (spec->takesValue) {
            if (hasInlineValue) {
                value = std::string(inlineValue);
            } else if (i + 1 < argc && argv[i + 1] != nullptr) {
                value = argv[++i];
            } else {
                if (spec->id == OptionId::Config) {
                    diagnostics.Error("--config requires a file path");
                } else {
                    diagnostics.Error("--{} requires a value", spec->longName);
                }
                return ErrorCode::MissingOptionValue;
            }
        } else if (hasInlineValue && spec->id != OptionId::Color) {
            diagnostics.Error("--{} does not take a value", spec->longName);
            return ErrorCode::InvalidArgument;
        }

        switch (spec->id) {
            case OptionId::Log:
                options.logFile = value;
                break;
            case OptionId::Quiet:
                options.quiet = true;
                break;
            case OptionId::Verbose:
                options.verbose = true;
                break;
            case OptionId::Level:
                options.level = value;
                break;
            case OptionId::Format:
                options.format = value;
                break;
            case OptionId::Utc:
                options.utc = true;
                break;
            case OptionId::Journal:
                options.journal = true;
                break;
            case OptionId::Tag:
                options.journalTag = value;
                break;
            case OptionId::Color:
                options.colorMode = hasInlineValue ? std::string(inlineValue) : "always";
                break;
            case OptionId::NoColor:
                options.colorMode = "never";
                break;
            case OptionId::StderrLevel:
                options.stderrLevel = value;
                break;
            case OptionId::Config:
                if (value.empty()) {
                    diagnostics.Error("--config requires a file path");
                    return ErrorCode::MissingOptionValue;
                }
                options.configPath = value;
                break;
            case OptionId::UnsafeNewlines:
                options.unsafeAllowNewlines = true;
                break;
            case OptionId::UnsafeAnsi:
                options.unsafeAllowAnsi = true;
                break;
            case OptionId::MaxLineLength:
            case OptionId::MaxJournalLength: {
                size_t parsed = 0;
                if (!ParseSize(value, parsed)) {
                    diagnostics.Error("Invalid {} value, expected a non-negative integer",
                                      spec->longName);
                    return ErrorCode::InvalidArgument;
                }
                if (spec->id == OptionId::MaxLineLength) {
                    options.maxLineLength = value;
                } else {
                    options.maxJournalLength = value;
                }
                break;
            }
            case OptionId::ScriptName:
                options.scriptName = value;
                break;
        }
    }
    return ErrorCode::Success;
}

}  // namespace scriptlog
