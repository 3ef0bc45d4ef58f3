/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include "Logger.h"
#include <algorithm>
#include <cctype>
#include <string>
#include <thread>
#include "ConsoleSink.h"

namespace Cadence {
namespace Core {
namespace Logging {

    std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept {
        std::string lowered;
        lowered.reserve(name.size());
        for (char c : name) {
            lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }

        if (lowered == "trace") return LogLevel::Trace;
        if (lowered == "debug") return LogLevel::Debug;
        if (lowered == "info") return LogLevel::Info;
        if (lowered == "warn" || lowered == "warning") return LogLevel::Warning;
        if (lowered == "error") return LogLevel::Error;
        if (lowered == "fatal") return LogLevel::Fatal;
        if (lowered == "off") return LogLevel::Off;
        return std::nullopt;
    }

    Logger::Logger(std::string name)
        : _name(std::move(name)) {
    }

    Logger::~Logger() {
        flush();
    }

    Logger& Logger::global() {
        static Logger* instance = [] {
            auto* logger = new Logger("Cadence");
            logger->addSink(std::make_shared<ConsoleSink>());
            return logger;
        }();
        return *instance;
    }

    void Logger::addSink(std::shared_ptr<ILogSink> sink) {
        if (!sink) return;
        std::lock_guard<std::mutex> lock(_sinksMutex);
        _sinks.push_back(std::move(sink));
    }

    bool Logger::removeSink(const std::shared_ptr<ILogSink>& sink) {
        std::lock_guard<std::mutex> lock(_sinksMutex);
        auto it = std::find(_sinks.begin(), _sinks.end(), sink);
        if (it == _sinks.end()) return false;
        _sinks.erase(it);
        return true;
    }

    void Logger::clearSinks() {
        std::lock_guard<std::mutex> lock(_sinksMutex);
        _sinks.clear();
    }

    size_t Logger::sinkCount() const {
        std::lock_guard<std::mutex> lock(_sinksMutex);
        return _sinks.size();
    }

    void Logger::log(LogLevel level, std::string_view category, std::string_view message) {
        if (!isEnabled(level)) return;

        LogEntry entry;
        entry.timestamp = std::chrono::system_clock::now();
        entry.level = level;
        entry.logger = _name;
        entry.category = std::string(category);
        entry.message = std::string(message);
        entry.threadId = std::this_thread::get_id();

        // Sinks are written under the lock so a single sink never sees interleaved calls
        std::lock_guard<std::mutex> lock(_sinksMutex);
        for (auto& sink : _sinks) {
            if (sink->shouldLog(level)) {
                sink->write(entry);
            }
        }
        if (level >= LogLevel::Error) {
            for (auto& sink : _sinks) {
                sink->flush();
            }
        }
    }

    void Logger::flush() {
        std::lock_guard<std::mutex> lock(_sinksMutex);
        for (auto& sink : _sinks) {
            sink->flush();
        }
    }

} // namespace Logging
} // namespace Core
} // namespace Cadence
