/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

/**
 * @file CadenceApplication.h
 * @brief Process-level run loop that owns services and the UI dispatcher
 *
 * run() binds the MainThreadDispatcher to the calling thread, registers the
 * core services (WorkService, TimerService) when the host has not, drives
 * their lifecycle and pumps dispatched UI work until terminate() is called or
 * a termination signal arrives.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include "Core/CadenceServiceRegistry.h"
#include "Concurrency/MainThreadDispatcher.h"

namespace Cadence { namespace Core {

namespace Concurrency { class WorkService; }
class TimerService;

class CadenceAppDelegate {
public:
    virtual ~CadenceAppDelegate() = default;
    virtual void applicationWillFinishLaunching() {}
    virtual void applicationDidFinishLaunching() {}
    virtual bool applicationShouldTerminate() { return true; }
    virtual void applicationWillTerminate() {}
    virtual void applicationMainLoop() {}
    virtual void applicationDidCatchUnhandledException(std::exception_ptr) {}
};

struct CadenceApplicationConfig {
    size_t workerThreads = 0; // 0 => auto
    bool installSignalHandlers = false;
    std::chrono::milliseconds loopInterval{10};
};

class CadenceApplication {
public:
    static CadenceApplication& shared();

    void configure(const CadenceApplicationConfig& cfg);
    void setDelegate(CadenceAppDelegate* del);

    // Lifecycle
    int run();                 // blocks until termination
    void terminate(int code);  // thread-safe, idempotent

    bool isRunning() const { return _running.load(std::memory_order_acquire); }
    int exitCode() const { return _exitCode.load(); }

    CadenceServiceRegistry& services() { return _services; }

    /// UI-confined context; owned by the thread inside run()
    Concurrency::MainThreadDispatcher& dispatcher() { return _dispatcher; }

    std::shared_ptr<Concurrency::WorkService> workService();
    std::shared_ptr<TimerService> timerService();

    /// Called from the signal path; async-signal-safe
    void notifySignalFromHandler(int signum) noexcept;

private:
    CadenceApplication();
    void ensureCoreServices();
    void handlePosixSignal(int signum);
    void installSignalHandlers();
    void uninstallSignalHandlers();

    CadenceApplicationConfig _cfg{};
    CadenceAppDelegate* _delegate{nullptr};

    CadenceServiceRegistry _services;
    Concurrency::MainThreadDispatcher _dispatcher;

    std::atomic<bool> _running{false};
    std::atomic<bool> _terminateRequested{false};
    std::atomic<int> _exitCode{0};

    std::atomic<bool> _handlersInstalled{false};
    std::atomic<bool> _signalSeen{false};
    std::atomic<int> _lastSignal{0};
    int _signalPipe[2]{-1, -1};
};

}} // namespace Cadence::Core
