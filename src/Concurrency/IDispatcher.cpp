/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include "IDispatcher.h"
#include <stdexcept>

namespace Cadence {
namespace Core {
namespace Concurrency {

    DispatchHandle IDispatcher::invokeAsyncChained(std::function<DispatchHandle()> asyncAction) {
        if (!asyncAction) {
            throw std::invalid_argument("invokeAsyncChained requires a callable");
        }

        auto promise = std::make_shared<AsyncPromise<void>>();
        promise->setProgressHook(progressHook());
        auto result = promise->handle();

        auto outer = invokeAsync([promise, asyncAction = std::move(asyncAction)] {
            promise->markRunning();
            DispatchHandle inner = asyncAction();
            if (!inner.valid()) {
                promise->setValue();
                return;
            }
            inner.onComplete([promise, inner] {
                if (auto error = inner.error()) {
                    promise->setException(error);
                } else {
                    promise->setValue();
                }
            });
        });

        // Covers asyncAction throwing and dispatcher shutdown before it ran
        outer.onComplete([promise, outer] {
            if (auto error = outer.error()) {
                promise->setException(error);
            }
        });

        return result;
    }

} // namespace Concurrency
} // namespace Core
} // namespace Cadence
