/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#pragma once

#include "IDispatcher.h"

namespace Cadence {
namespace Core {
namespace Concurrency {

    /**
     * @brief Synchronous pass-through dispatcher for headless hosts
     *
     * Every thread counts as the UI context. invokeAsync() runs the action on the
     * calling thread and returns an already-completed handle.
     */
    class InlineDispatcher : public IDispatcher {
    public:
        bool checkAccess() const override { return true; }

        DispatchHandle invokeAsync(std::function<void()> action) override {
            AsyncPromise<void> promise;
            fulfill(promise, action);
            return promise.handle();
        }
    };

} // namespace Concurrency
} // namespace Core
} // namespace Cadence
