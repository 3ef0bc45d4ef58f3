/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#pragma once

#include <chrono>
#include <string>
#include <thread>
#include "LogLevel.h"

namespace Cadence {
namespace Core {
namespace Logging {

    /**
     * @brief A single log record as delivered to sinks
     */
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level = LogLevel::Info;
        std::string logger;     ///< Name of the Logger that produced the entry
        std::string category;
        std::string message;
        std::thread::id threadId;
    };

} // namespace Logging
} // namespace Core
} // namespace Cadence
