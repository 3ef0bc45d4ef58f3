/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#pragma once

#include <atomic>
#include "LogEntry.h"

namespace Cadence {
namespace Core {
namespace Logging {

    /**
     * @brief Destination for log entries
     *
     * Sinks receive entries that passed the owning Logger's level filter and
     * may apply their own, stricter minimum. write() may be called from any
     * thread; the Logger serializes calls into a single sink.
     */
    class ILogSink {
    public:
        virtual ~ILogSink() = default;

        virtual void write(const LogEntry& entry) = 0;
        virtual void flush() {}

        bool shouldLog(LogLevel level) const noexcept {
            return level >= _minLevel.load(std::memory_order_relaxed);
        }

        void setMinLevel(LogLevel level) noexcept { _minLevel.store(level, std::memory_order_relaxed); }
        LogLevel minLevel() const noexcept { return _minLevel.load(std::memory_order_relaxed); }

    private:
        std::atomic<LogLevel> _minLevel{LogLevel::Trace};
    };

} // namespace Logging
} // namespace Core
} // namespace Cadence
