/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include "CancellationToken.h"
#include "OperationErrors.h"
#include <format>
#include <thread>
#include <utility>

namespace Cadence {
namespace Core {
namespace Concurrency {

    namespace {
        std::atomic<uint64_t> g_nextEpoch{1};
    }

    void detail::CancellationState::cancel() {
        std::map<uint64_t, std::function<void()>> pending;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (cancelled.exchange(true, std::memory_order_acq_rel)) return;
            pending.swap(callbacks);
        }
        cv.notify_all();
        for (auto& [id, callback] : pending) {
            callback();
        }
    }

    CancellationRegistration::CancellationRegistration(CancellationRegistration&& other) noexcept
        : _state(std::move(other._state)), _id(other._id) {
        other._id = 0;
    }

    CancellationRegistration& CancellationRegistration::operator=(CancellationRegistration&& other) noexcept {
        if (this != &other) {
            reset();
            _state = std::move(other._state);
            _id = other._id;
            other._id = 0;
        }
        return *this;
    }

    void CancellationRegistration::reset() {
        if (auto state = _state.lock()) {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->callbacks.erase(_id);
        }
        _state.reset();
        _id = 0;
    }

    bool CancellationToken::isCancellationRequested() const noexcept {
        return _state && _state->cancelled.load(std::memory_order_acquire);
    }

    void CancellationToken::throwIfCancellationRequested() const {
        if (isCancellationRequested()) {
            throw OperationCancelledException(
                std::format("Operation was cancelled (epoch {})", _state->epoch), _state->epoch);
        }
    }

    bool CancellationToken::waitFor(std::chrono::steady_clock::duration timeout) const {
        if (!_state) {
            std::this_thread::sleep_for(timeout);
            return false;
        }
        std::unique_lock<std::mutex> lock(_state->mutex);
        return _state->cv.wait_for(lock, timeout, [this] {
            return _state->cancelled.load(std::memory_order_acquire);
        });
    }

    CancellationRegistration CancellationToken::registerCallback(std::function<void()> callback) const {
        if (!_state || !callback) return {};
        {
            std::lock_guard<std::mutex> lock(_state->mutex);
            if (!_state->cancelled.load(std::memory_order_acquire)) {
                auto id = _state->nextCallbackId++;
                _state->callbacks.emplace(id, std::move(callback));
                return CancellationRegistration(_state, id);
            }
        }
        callback();
        return {};
    }

    CancellationSource::CancellationSource()
        : _state(std::make_shared<detail::CancellationState>(g_nextEpoch.fetch_add(1))) {
    }

    CancellationSource::~CancellationSource() = default;

    CancellationToken CancellationSource::token() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return CancellationToken(_state);
    }

    void CancellationSource::cancel() {
        std::shared_ptr<detail::CancellationState> current;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            current = _state;
        }
        current->cancel();
    }

    bool CancellationSource::isCancellationRequested() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _state->cancelled.load(std::memory_order_acquire);
    }

    CancellationToken CancellationSource::reset() {
        std::shared_ptr<detail::CancellationState> previous;
        std::shared_ptr<detail::CancellationState> next =
            std::make_shared<detail::CancellationState>(g_nextEpoch.fetch_add(1));
        {
            std::lock_guard<std::mutex> lock(_mutex);
            previous = std::exchange(_state, next);
        }
        previous->cancel();
        return CancellationToken(next);
    }

    uint64_t CancellationSource::epoch() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _state->epoch;
    }

    std::unique_ptr<CancellationSource> CancellationSource::createLinked(const CancellationToken& first,
                                                                         const CancellationToken& second) {
        auto linked = std::make_unique<CancellationSource>();
        std::weak_ptr<detail::CancellationState> target = linked->_state;
        auto forward = [target] {
            if (auto state = target.lock()) state->cancel();
        };
        linked->_links.push_back(first.registerCallback(forward));
        linked->_links.push_back(second.registerCallback(forward));
        return linked;
    }

} // namespace Concurrency
} // namespace Core
} // namespace Cadence
