/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include <Collections/ThreadSafeCollection.h>
#include <Concurrency/WorkService.h>
#include <Core/CadenceApplication.h>
#include <Core/RuntimeConfig.h>
#include <Core/TimerService.h>
#include <Data/Enterprise.h>
#include <Loaders/CollectionLoader.h>
#include <Logging/Logger.h>
#include <Operations/AsyncOperationExecutor.h>
#include <Operations/LoggingErrorReporter.h>
#include <Progress/StepProgressTracker.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace Cadence::Core;
using namespace Cadence::Core::Concurrency;
using namespace Cadence::Core::Collections;
using namespace Cadence::Core::Data;
using namespace Cadence::Core::Loaders;
using namespace Cadence::Core::Operations;
using namespace Cadence::Core::Progress;

/**
 * Enterprise Loader Example
 *
 * This example demonstrates:
 * 1. A repository that fails transiently and is retried with backoff
 * 2. Loading on a worker while the collection is only touched on the main thread
 * 3. Step progress and mirrored percentage progress
 * 4. Auto-refresh through the TimerService with single-flight de-duplication
 */
class FlakyEnterpriseRepository : public IRepository<Enterprise>
{
    std::atomic<int> calls_{0};

public:
    std::vector<Enterprise> fetchAll(const CancellationToken& token) override {
        int call = ++calls_;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token.throwIfCancellationRequested();

        if (call == 1) {
            throw std::runtime_error("database connection reset");
        }
        return sampleEnterprises();
    }
};

class EnterpriseDelegate : public CadenceAppDelegate
{
    RuntimeConfig config_ = RuntimeConfig::fromEnvironment();

    std::unique_ptr<AsyncOperationExecutor> executor_;
    std::unique_ptr<ThreadSafeCollection<Enterprise>> enterprises_;
    std::unique_ptr<CollectionLoader<Enterprise>> loader_;
    StepProgressTracker tracker_;
    ProgressReporter progress_;

    std::optional<AsyncHandle<LoadOutcome>> pending_;

public:
    void applicationDidFinishLaunching() override {
        auto& app = CadenceApplication::shared();
        auto work = app.workService();
        auto timers = app.timerService();
        if (!work || !timers) {
            CADENCE_LOG_ERROR("[EnterpriseLoaderExample] Core services not available!");
            app.terminate(1);
            return;
        }

        executor_ = std::make_unique<AsyncOperationExecutor>(Logging::Logger::global(),
                                                             std::make_shared<LoggingErrorReporter>());
        enterprises_ = std::make_unique<ThreadSafeCollection<Enterprise>>(app.dispatcher());
        enterprises_->subscribe([](const CollectionChange<Enterprise>& change) {
            CADENCE_LOG_INFO(std::format("[EnterpriseLoaderExample] Collection changed: {} ({} rows)",
                                         collectionChangeActionToString(change.action), change.newItems.size()));
        });

        progress_.subscribe([](const ProgressChangedEvent& e) {
            CADENCE_LOG_DEBUG(std::format("  [Progress] {:.0f}% {}", e.percentage, e.message));
        });
        tracker_.subscribe([](const StepProgressEvent& e) {
            CADENCE_LOG_INFO(std::format("  [Step {}] {}", e.stepIndex, e.statusMessage));
        });

        CollectionLoader<Enterprise>::Config cfg;
        cfg.name = "EnterpriseLoader";
        cfg.operationName = "Loading Enterprises";
        cfg.statusMessage = "Loading enterprises...";
        cfg.retry = config_.retry;
        cfg.timeout = config_.loadTimeout;

        loader_ = std::make_unique<CollectionLoader<Enterprise>>(
            std::make_shared<FlakyEnterpriseRepository>(), *enterprises_, *executor_, cfg, work.get());
        if (config_.autoRefreshInterval.count() > 0) {
            loader_->enableAutoRefresh(*timers, config_.autoRefreshInterval);
        }

        pending_ = work->submitTask([this] { return loader_->loadWithSteps(tracker_, &progress_); });
    }

    void applicationMainLoop() override {
        if (!pending_ || !pending_->isComplete()) return;

        LoadOutcome outcome = pending_->get();
        pending_.reset();

        CADENCE_LOG_INFO(std::format("[EnterpriseLoaderExample] Load finished: {}", loadOutcomeToString(outcome)));
        for (const auto& e : *enterprises_) {
            CADENCE_LOG_INFO(std::format("  {} ({}) rate={:.2f} citizens={}", e.name, e.type, e.currentRate,
                                         e.citizenCount));
        }
        CadenceApplication::shared().terminate(outcome == LoadOutcome::Loaded ? 0 : 1);
    }

    void applicationWillTerminate() override {
        if (loader_) loader_->disableAutoRefresh();
        if (executor_) executor_->dispose();
    }

    void applicationDidCatchUnhandledException(std::exception_ptr) override {
        CADENCE_LOG_ERROR("[EnterpriseLoaderExample] Unhandled exception observed");
    }
};

int main() {
    auto& app = CadenceApplication::shared();

    CadenceApplicationConfig config;
    config.workerThreads = 2;
    config.installSignalHandlers = true;
    app.configure(config);

    EnterpriseDelegate delegate;
    app.setDelegate(&delegate);

    int exitCode = app.run();
    CADENCE_LOG_INFO(std::format("[EnterpriseLoaderExample] Exited with code {}", exitCode));
    return exitCode;
}
