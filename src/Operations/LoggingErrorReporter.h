/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

/**
 * @file LoggingErrorReporter.h
 * @brief IErrorReporter that writes structured log entries
 *
 * Every report gets a random correlation id that appears in the log line and
 * is handed to the errorReported callback, so a dialog shown by the UI can
 * quote it. Per-context counters make repeated failures visible in tests and
 * diagnostics.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include "IErrorReporter.h"
#include "Logging/Logger.h"

namespace Cadence {
namespace Core {
namespace Operations {

    struct ErrorReport {
        std::string correlationId;
        std::string context;
        std::string message;
        std::exception_ptr error;
        bool showToUser = false;    ///< False when the caller declined or dialogs are suppressed
    };

    class LoggingErrorReporter : public IErrorReporter {
    public:
        using ErrorReportedCallback = std::function<void(const ErrorReport&)>;

        explicit LoggingErrorReporter(Logging::Logger& logger = Logging::Logger::global());

        std::string reportError(std::exception_ptr error, const std::string& context, bool showToUser = true) override;
        std::string reportWarning(const std::string& message, const std::string& context) override;

        /// Headless hosts and tests turn user-facing notifications off
        void setSuppressUserDialogs(bool suppress) noexcept { _suppressUserDialogs.store(suppress); }
        bool suppressUserDialogs() const noexcept { return _suppressUserDialogs.load(); }

        void setErrorReportedCallback(ErrorReportedCallback callback);

        /// Adds value to the named counter and returns the new total
        int64_t incrementCounter(const std::string& name, int64_t value = 1);
        int64_t counter(const std::string& name) const;

        /// Reports made for context (errors and warnings)
        int64_t reportCount(const std::string& context) const { return counter("reports." + context); }

    private:
        static std::string newCorrelationId();

        Logging::Logger& _logger;
        std::atomic<bool> _suppressUserDialogs{false};

        mutable std::mutex _mutex;
        ErrorReportedCallback _callback;
        std::unordered_map<std::string, int64_t> _counters;
    };

} // namespace Operations
} // namespace Core
} // namespace Cadence
