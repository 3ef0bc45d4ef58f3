/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

/**
 * @file Logger.h
 * @brief Named, sink-based logger used throughout Cadence
 *
 * Components that log take a Logger& at construction so tests and hosts can
 * route their output independently. Logger::global() is the default instance
 * used by the CADENCE_LOG_* macros and by components constructed without an
 * explicit logger.
 */

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>
#include "ILogSink.h"
#include "LogEntry.h"
#include "LogLevel.h"

namespace Cadence {
namespace Core {
namespace Logging {

    /**
     * @brief Thread-safe logger that fans entries out to a set of sinks
     *
     * @code
     * Logger logger("Loader");
     * logger.addSink(std::make_shared<ConsoleSink>());
     * logger.setMinLevel(LogLevel::Debug);
     * logger.warning("Retry", "Attempt 1 failed, retrying in 500ms");
     * @endcode
     */
    class Logger {
    public:
        explicit Logger(std::string name = "Cadence");
        ~Logger();

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        /**
         * @brief Process-wide default logger
         *
         * Created on first use with a ConsoleSink and a minimum level of Info.
         */
        static Logger& global();

        void addSink(std::shared_ptr<ILogSink> sink);
        bool removeSink(const std::shared_ptr<ILogSink>& sink);
        void clearSinks();
        size_t sinkCount() const;

        void setMinLevel(LogLevel level) noexcept { _minLevel.store(level, std::memory_order_relaxed); }
        LogLevel minLevel() const noexcept { return _minLevel.load(std::memory_order_relaxed); }
        bool isEnabled(LogLevel level) const noexcept {
            return level != LogLevel::Off && level >= _minLevel.load(std::memory_order_relaxed);
        }

        void log(LogLevel level, std::string_view category, std::string_view message);

        void trace(std::string_view category, std::string_view message) { log(LogLevel::Trace, category, message); }
        void debug(std::string_view category, std::string_view message) { log(LogLevel::Debug, category, message); }
        void info(std::string_view category, std::string_view message) { log(LogLevel::Info, category, message); }
        void warning(std::string_view category, std::string_view message) { log(LogLevel::Warning, category, message); }
        void error(std::string_view category, std::string_view message) { log(LogLevel::Error, category, message); }
        void fatal(std::string_view category, std::string_view message) { log(LogLevel::Fatal, category, message); }

        void flush();

        const std::string& name() const noexcept { return _name; }

    private:
        std::string _name;
        std::atomic<LogLevel> _minLevel{LogLevel::Info};
        mutable std::mutex _sinksMutex;
        std::vector<std::shared_ptr<ILogSink>> _sinks;
    };

} // namespace Logging
} // namespace Core
} // namespace Cadence

#define CADENCE_LOG_TRACE(msg) ::Cadence::Core::Logging::Logger::global().trace("", (msg))
#define CADENCE_LOG_DEBUG(msg) ::Cadence::Core::Logging::Logger::global().debug("", (msg))
#define CADENCE_LOG_INFO(msg) ::Cadence::Core::Logging::Logger::global().info("", (msg))
#define CADENCE_LOG_WARNING(msg) ::Cadence::Core::Logging::Logger::global().warning("", (msg))
#define CADENCE_LOG_ERROR(msg) ::Cadence::Core::Logging::Logger::global().error("", (msg))
#define CADENCE_LOG_FATAL(msg) ::Cadence::Core::Logging::Logger::global().fatal("", (msg))

#define CADENCE_LOG_TRACE_CAT(cat, msg) ::Cadence::Core::Logging::Logger::global().trace((cat), (msg))
#define CADENCE_LOG_DEBUG_CAT(cat, msg) ::Cadence::Core::Logging::Logger::global().debug((cat), (msg))
#define CADENCE_LOG_INFO_CAT(cat, msg) ::Cadence::Core::Logging::Logger::global().info((cat), (msg))
#define CADENCE_LOG_WARNING_CAT(cat, msg) ::Cadence::Core::Logging::Logger::global().warning((cat), (msg))
#define CADENCE_LOG_ERROR_CAT(cat, msg) ::Cadence::Core::Logging::Logger::global().error((cat), (msg))
#define CADENCE_LOG_FATAL_CAT(cat, msg) ::Cadence::Core::Logging::Logger::global().fatal((cat), (msg))
