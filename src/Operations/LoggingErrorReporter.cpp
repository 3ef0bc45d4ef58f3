/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include "LoggingErrorReporter.h"
#include <format>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "Concurrency/OperationErrors.h"

namespace Cadence {
namespace Core {
namespace Operations {

    LoggingErrorReporter::LoggingErrorReporter(Logging::Logger& logger)
        : _logger(logger) {
    }

    std::string LoggingErrorReporter::newCorrelationId() {
        static thread_local boost::uuids::random_generator generator;
        return boost::uuids::to_string(generator());
    }

    std::string LoggingErrorReporter::reportError(std::exception_ptr error, const std::string& context, bool showToUser) {
        ErrorReport report;
        report.correlationId = newCorrelationId();
        report.context = context.empty() ? "Unknown" : context;
        report.message = Concurrency::describeException(error);
        report.error = error;
        report.showToUser = showToUser && !suppressUserDialogs();

        _logger.error("ErrorReporting", std::format("Error occurred in {}: {} (CorrelationId: {})",
                                                    report.context, report.message, report.correlationId));
        if (showToUser && !report.showToUser) {
            _logger.info("ErrorReporting", std::format("Suppressed error dialog for context {} (CorrelationId: {})",
                                                       report.context, report.correlationId));
        }

        ErrorReportedCallback callback;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            ++_counters["errors"];
            ++_counters["reports." + report.context];
            callback = _callback;
        }
        if (callback) {
            callback(report);
        }
        return report.correlationId;
    }

    std::string LoggingErrorReporter::reportWarning(const std::string& message, const std::string& context) {
        auto correlationId = newCorrelationId();
        auto where = context.empty() ? std::string("Unknown") : context;
        _logger.warning("ErrorReporting", std::format("Warning in {}: {} (CorrelationId: {})",
                                                      where, message, correlationId));
        std::lock_guard<std::mutex> lock(_mutex);
        ++_counters["warnings"];
        ++_counters["reports." + where];
        return correlationId;
    }

    void LoggingErrorReporter::setErrorReportedCallback(ErrorReportedCallback callback) {
        std::lock_guard<std::mutex> lock(_mutex);
        _callback = std::move(callback);
    }

    int64_t LoggingErrorReporter::incrementCounter(const std::string& name, int64_t value) {
        std::lock_guard<std::mutex> lock(_mutex);
        return _counters[name] += value;
    }

    int64_t LoggingErrorReporter::counter(const std::string& name) const {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _counters.find(name);
        return it != _counters.end() ? it->second : 0;
    }

} // namespace Operations
} // namespace Core
} // namespace Cadence
