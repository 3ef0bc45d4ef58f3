/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include "Core/CadenceApplication.h"
#include "Concurrency/WorkService.h"
#include "Core/TimerService.h"
#include "Logging/Logger.h"
#include <cstdlib>
#include <format>

#if !defined(_WIN32)
#include <signal.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#endif

namespace Cadence { namespace Core {

namespace {
    std::atomic<int> g_signalWriteFd{-1};

#if !defined(_WIN32)
    void CadenceSigHandler(int signum) {
        CadenceApplication::shared().notifySignalFromHandler(signum);
    }
#endif
}

CadenceApplication& CadenceApplication::shared() {
    // Leaked on purpose: signal handlers may fire during static destruction
    static CadenceApplication* inst = new CadenceApplication();
    return *inst;
}

CadenceApplication::CadenceApplication() = default;

void CadenceApplication::configure(const CadenceApplicationConfig& cfg) {
    _cfg = cfg;
}

void CadenceApplication::setDelegate(CadenceAppDelegate* del) {
    _delegate = del;
}

std::shared_ptr<Concurrency::WorkService> CadenceApplication::workService() {
    return _services.get<Concurrency::WorkService>();
}

std::shared_ptr<TimerService> CadenceApplication::timerService() {
    return _services.get<TimerService>();
}

void CadenceApplication::ensureCoreServices() {
    if (!_services.has<Concurrency::WorkService>()) {
        Concurrency::WorkService::Config wcfg{};
        wcfg.threadCount = static_cast<uint32_t>(_cfg.workerThreads);
        _services.registerService<Concurrency::WorkService>(std::make_shared<Concurrency::WorkService>(wcfg));
    }

    if (!_services.has<TimerService>()) {
        _services.registerService<TimerService>(std::make_shared<TimerService>());
    }
}

int CadenceApplication::run() {
    if (_running.exchange(true)) return _exitCode.load();
    _terminateRequested.store(false);
    _signalSeen.store(false);
    _exitCode.store(0);

    _dispatcher.bindToCurrentThread();
    ensureCoreServices();

#if !defined(_WIN32)
    if (_cfg.installSignalHandlers && _signalPipe[0] == -1) {
        if (pipe(_signalPipe) == 0) {
            fcntl(_signalPipe[0], F_SETFL, O_NONBLOCK);
            fcntl(_signalPipe[1], F_SETFL, O_NONBLOCK);
            g_signalWriteFd.store(_signalPipe[1]);
        } else {
            CADENCE_LOG_WARNING_CAT("Application", "Could not create signal pipe; signal handling disabled");
        }
    }
#endif
    if (_cfg.installSignalHandlers) {
        installSignalHandlers();
    }

    _services.loadAll();

    if (auto timers = timerService()) {
        timers->setWorkService(workService().get());
        timers->setDispatcher(&_dispatcher);
    }

    if (_delegate) _delegate->applicationWillFinishLaunching();
    _services.startAll();
    if (_delegate) _delegate->applicationDidFinishLaunching();

    while (!_terminateRequested.load(std::memory_order_acquire)) {
#if !defined(_WIN32)
        if (_signalPipe[0] != -1) {
            struct pollfd pfd;
            pfd.fd = _signalPipe[0];
            pfd.events = POLLIN;
            int ret = poll(&pfd, 1, 0);
            if (ret > 0 && (pfd.revents & POLLIN)) {
                char buf[16];
                while (read(_signalPipe[0], buf, sizeof(buf)) > 0) {}
                handlePosixSignal(_lastSignal.load(std::memory_order_relaxed));
            }
        }
#endif

        _dispatcher.waitForWork(_cfg.loopInterval);
        try {
            _dispatcher.executeMainThreadWork();
            if (_delegate) _delegate->applicationMainLoop();
        } catch (const std::exception& e) {
            CADENCE_LOG_ERROR_CAT("Application", std::format("Unhandled exception in main loop: {}", e.what()));
            if (_delegate) _delegate->applicationDidCatchUnhandledException(std::current_exception());
            terminate(1);
        }
    }

    if (_delegate) _delegate->applicationWillTerminate();
    _services.stopAll();
    _services.unloadAll();

    if (_cfg.installSignalHandlers) {
        uninstallSignalHandlers();
    }
#if !defined(_WIN32)
    g_signalWriteFd.store(-1);
    for (int& fd : _signalPipe) {
        if (fd != -1) {
            close(fd);
            fd = -1;
        }
    }
#endif

    _running.store(false);
    return _exitCode.load();
}

void CadenceApplication::terminate(int code) {
    _exitCode.store(code);
    _terminateRequested.store(true, std::memory_order_release);
    _dispatcher.wake();
}

void CadenceApplication::notifySignalFromHandler(int signum) noexcept {
    _lastSignal.store(signum, std::memory_order_relaxed);
#if !defined(_WIN32)
    int fd = g_signalWriteFd.load();
    if (fd != -1) {
        char byte = 1;
        [[maybe_unused]] auto written = write(fd, &byte, 1);
    }
#endif
}

void CadenceApplication::handlePosixSignal(int signum) {
#if !defined(_WIN32)
    if (signum != SIGINT && signum != SIGTERM) return;
#endif

    bool first = !_signalSeen.exchange(true);
    if (!first) {
        // Second signal: stop waiting on the delegate
        CADENCE_LOG_WARNING_CAT("Application", "Second termination signal, exiting immediately");
        std::quick_exit(1);
    }

    bool allow = true;
    if (_delegate) {
        allow = _delegate->applicationShouldTerminate();
    }
    if (allow) {
        CADENCE_LOG_INFO_CAT("Application", std::format("Termination signal {} received", signum));
        terminate(0);
    } else {
        _signalSeen.store(false);
    }
}

void CadenceApplication::installSignalHandlers() {
    if (_handlersInstalled.exchange(true)) return;
#if !defined(_WIN32)
    struct sigaction sa;
    sa.sa_handler = CadenceSigHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    sigaction(SIGINT, &sa, nullptr);   // Ctrl+C
    sigaction(SIGTERM, &sa, nullptr);  // termination request
#endif
}

void CadenceApplication::uninstallSignalHandlers() {
    if (!_handlersInstalled.exchange(false)) return;
#if !defined(_WIN32)
    struct sigaction sa;
    sa.sa_handler = SIG_DFL;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
#endif
}

}} // namespace Cadence::Core
