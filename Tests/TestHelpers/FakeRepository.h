/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <vector>
#include "Data/Enterprise.h"
#include "Data/IRepository.h"

namespace Cadence::Testing {

/// Thrown by the fake when asked for a failure outside the std::exception hierarchy
struct OpaqueRepositoryFailure {};

/**
 * Scriptable repository: fails the first N calls, can hold callers at a gate
 * until released (or cancelled), and counts every fetch.
 */
class FakeEnterpriseRepository : public Core::Data::IRepository<Core::Data::Enterprise> {
public:
    using Enterprise = Core::Data::Enterprise;

    explicit FakeEnterpriseRepository(std::vector<Enterprise> records = {})
        : _records(std::move(records)) {}

    std::vector<Enterprise> fetchAll(const Core::Concurrency::CancellationToken& token) override {
        int call = ++_fetchCount;
        {
            std::unique_lock<std::mutex> lock(_mutex);
            ++_entered;
            _enteredCV.notify_all();
            while (_gated && !token.isCancellationRequested()) {
                _gateCV.wait_for(lock, std::chrono::milliseconds(5));
            }
        }
        token.throwIfCancellationRequested();

        if (_throwOpaque.load()) {
            throw OpaqueRepositoryFailure{};
        }
        if (_alwaysFail.load() || call <= _failuresRemaining.load()) {
            throw std::runtime_error("transient database error");
        }
        std::lock_guard<std::mutex> lock(_mutex);
        return _records;
    }

    void failFirst(int calls) { _failuresRemaining.store(calls); }
    void setAlwaysFail(bool fail) { _alwaysFail.store(fail); }
    void setThrowOpaque(bool opaque) { _throwOpaque.store(opaque); }

    void setRecords(std::vector<Enterprise> records) {
        std::lock_guard<std::mutex> lock(_mutex);
        _records = std::move(records);
    }

    // Callers block inside fetchAll() until release() or cancellation
    void closeGate() {
        std::lock_guard<std::mutex> lock(_mutex);
        _gated = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _gated = false;
        }
        _gateCV.notify_all();
    }

    // Waits until at least n calls have entered fetchAll()
    bool waitForEntered(int n, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(_mutex);
        return _enteredCV.wait_for(lock, timeout, [&] { return _entered >= n; });
    }

    int fetchCount() const { return _fetchCount.load(); }

private:
    std::atomic<int> _fetchCount{0};
    std::atomic<int> _failuresRemaining{0};
    std::atomic<bool> _alwaysFail{false};
    std::atomic<bool> _throwOpaque{false};

    std::mutex _mutex;
    std::condition_variable _gateCV;
    std::condition_variable _enteredCV;
    std::vector<Enterprise> _records;
    bool _gated = false;
    int _entered = 0;
};

inline std::vector<Core::Data::Enterprise> fourEnterprises() {
    auto all = Core::Data::sampleEnterprises();
    all.resize(4);
    return all;
}

} // namespace Cadence::Testing
