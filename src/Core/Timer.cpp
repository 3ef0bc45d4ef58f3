/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include "Timer.h"

namespace Cadence {
namespace Core {

Timer::Timer(std::shared_ptr<detail::TimerData> data)
    : _data(std::move(data)), _valid(true) {}

Timer::Timer(Timer&& other) noexcept
    : _data(std::move(other._data)),
      _valid(other._valid.load(std::memory_order_acquire)) {
    other._valid.store(false, std::memory_order_release);
}

Timer& Timer::operator=(Timer&& other) noexcept {
    if (this != &other) {
        invalidate();

        _data = std::move(other._data);
        _valid.store(other._valid.load(std::memory_order_acquire), std::memory_order_release);
        other._valid.store(false, std::memory_order_release);
    }
    return *this;
}

Timer::~Timer() {
    invalidate();
}

void Timer::invalidate() {
    // CAS to ensure exactly-once invalidation
    bool expected = true;
    if (!_valid.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        return;
    }
    if (!_data) return;

    _data->cancelled.store(true, std::memory_order_release);
    if (_data->runningThread.load(std::memory_order_acquire) != std::this_thread::get_id()) {
        // Wait out an execution in progress elsewhere
        std::lock_guard<std::mutex> lock(_data->runMutex);
    }
}

bool Timer::isValid() const {
    return _valid.load(std::memory_order_acquire) && _data &&
           !_data->cancelled.load(std::memory_order_acquire) &&
           !_data->finished.load(std::memory_order_acquire);
}

} // namespace Core
} // namespace Cadence
