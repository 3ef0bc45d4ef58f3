/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include "OperationErrors.h"
#include <format>

namespace Cadence {
namespace Core {
namespace Concurrency {

    namespace {
        std::string exhaustedMessage(int attempts, std::exception_ptr lastError) {
            auto cause = describeException(lastError);
            if (cause.empty()) {
                return std::format("Operation failed after {} attempts", attempts);
            }
            return std::format("Operation failed after {} attempts: {}", attempts, cause);
        }
    }

    RetryExhaustedException::RetryExhaustedException(int attempts, std::exception_ptr lastError)
        : std::runtime_error(exhaustedMessage(attempts, lastError))
        , _attempts(attempts)
        , _lastError(std::move(lastError)) {
    }

    std::string describeException(std::exception_ptr error) {
        if (!error) return {};
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            return e.what();
        } catch (...) {
            return "non-standard exception";
        }
    }

    bool isCancellation(std::exception_ptr error) noexcept {
        if (!error) return false;
        try {
            std::rethrow_exception(error);
        } catch (const OperationCancelledException&) {
            return true;
        } catch (...) {
            return false;
        }
    }

} // namespace Concurrency
} // namespace Core
} // namespace Cadence
