/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include "ConsoleSink.h"
#include <chrono>
#include <format>
#include <string>

namespace Cadence {
namespace Core {
namespace Logging {

    namespace {
        const char* colorFor(LogLevel level) {
            switch (level) {
                case LogLevel::Trace:   return "\033[90m";
                case LogLevel::Debug:   return "\033[36m";
                case LogLevel::Info:    return "\033[0m";
                case LogLevel::Warning: return "\033[33m";
                case LogLevel::Error:   return "\033[31m";
                case LogLevel::Fatal:   return "\033[1;31m";
                default:                return "\033[0m";
            }
        }
    }

    void ConsoleSink::write(const LogEntry& entry) {
        if (!shouldLog(entry.level)) return;

        auto ms = std::chrono::time_point_cast<std::chrono::milliseconds>(entry.timestamp);
        std::string line;
        if (entry.category.empty()) {
            line = std::format("{:%F %T} [{}] {}", ms, logLevelToString(entry.level), entry.message);
        } else {
            line = std::format("{:%F %T} [{}] [{}] {}", ms, logLevelToString(entry.level), entry.category, entry.message);
        }

        FILE* out = entry.level >= LogLevel::Error ? stderr : stdout;
        if (_useColor) {
            std::fprintf(out, "%s%s\033[0m\n", colorFor(entry.level), line.c_str());
        } else {
            std::fprintf(out, "%s\n", line.c_str());
        }
    }

    void ConsoleSink::flush() {
        std::fflush(stdout);
        std::fflush(stderr);
    }

} // namespace Logging
} // namespace Core
} // namespace Cadence
