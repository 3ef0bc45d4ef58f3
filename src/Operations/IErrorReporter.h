/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#pragma once

#include <exception>
#include <string>

namespace Cadence {
namespace Core {
namespace Operations {

    /**
     * @brief Sink for terminal failures that may need user attention
     *
     * Injected into the executor. The UI layer decides how (or whether) to show
     * a report; showToUser is a request, not a guarantee.
     */
    class IErrorReporter {
    public:
        virtual ~IErrorReporter() = default;

        /// @return Correlation id assigned to this report
        virtual std::string reportError(std::exception_ptr error, const std::string& context, bool showToUser = true) = 0;

        virtual std::string reportWarning(const std::string& message, const std::string& context) = 0;
    };

} // namespace Operations
} // namespace Core
} // namespace Cadence
