/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#pragma once

#include <cstdio>
#include "ILogSink.h"

namespace Cadence {
namespace Core {
namespace Logging {

    /**
     * @brief Writes formatted entries to stdout (or stderr for Error and above)
     *
     * Format: `2025-01-01 12:00:00.123 [WARN] [Category] message`
     */
    class ConsoleSink : public ILogSink {
    public:
        explicit ConsoleSink(bool useColor = false) : _useColor(useColor) {}

        void write(const LogEntry& entry) override;
        void flush() override;

    private:
        bool _useColor;
    };

} // namespace Logging
} // namespace Core
} // namespace Cadence
