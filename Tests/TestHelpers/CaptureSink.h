/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#pragma once

#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "Logging/ILogSink.h"
#include "Logging/Logger.h"

namespace Cadence::Testing {

// Records every entry so tests can assert on what was logged
class CaptureSink : public Core::Logging::ILogSink {
public:
    void write(const Core::Logging::LogEntry& entry) override {
        std::lock_guard<std::mutex> lock(_mutex);
        _entries.push_back(entry);
    }

    std::vector<Core::Logging::LogEntry> entries() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _entries;
    }

    size_t count(Core::Logging::LogLevel level) const {
        std::lock_guard<std::mutex> lock(_mutex);
        return static_cast<size_t>(std::count_if(_entries.begin(), _entries.end(),
            [level](const auto& e) { return e.level == level; }));
    }

    size_t countContaining(Core::Logging::LogLevel level, const std::string& text) const {
        std::lock_guard<std::mutex> lock(_mutex);
        return static_cast<size_t>(std::count_if(_entries.begin(), _entries.end(),
            [&](const auto& e) { return e.level == level && e.message.find(text) != std::string::npos; }));
    }

    void clear() {
        std::lock_guard<std::mutex> lock(_mutex);
        _entries.clear();
    }

private:
    mutable std::mutex _mutex;
    std::vector<Core::Logging::LogEntry> _entries;
};

// A private logger wired to a CaptureSink, quiet on the console
struct CapturedLogger {
    Core::Logging::Logger logger{"Test"};
    std::shared_ptr<CaptureSink> sink = std::make_shared<CaptureSink>();

    CapturedLogger() {
        logger.setMinLevel(Core::Logging::LogLevel::Trace);
        logger.addSink(sink);
    }
};

} // namespace Cadence::Testing
