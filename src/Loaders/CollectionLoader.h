/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

/**
 * @file CollectionLoader.h
 * @brief Single-flight, retrying load of a repository into a UI collection
 *
 * One load runs as:
 *
 *   SingleFlightGuard → AsyncOperationExecutor → RetryPolicy(fetchAll)
 *     → optional raceWithTimeout → ThreadSafeCollection::replaceAllAsync
 *
 * A load that finds another one in flight returns SkippedDuplicate without
 * touching any state. Failures never escape load(); they are logged, recorded
 * in lastError() and reported as an outcome.
 */

#pragma once

#include <chrono>
#include <exception>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include "LoadOutcome.h"
#include "Collections/ThreadSafeCollection.h"
#include "Concurrency/CancellationToken.h"
#include "Concurrency/OperationErrors.h"
#include "Concurrency/RetryPolicy.h"
#include "Concurrency/SingleFlightGuard.h"
#include "Concurrency/TimeoutRace.h"
#include "Concurrency/WorkService.h"
#include "Core/TimerService.h"
#include "Data/IRepository.h"
#include "Logging/Logger.h"
#include "Operations/AsyncOperationExecutor.h"
#include "Progress/ProgressReporter.h"
#include "Progress/StepProgressTracker.h"

namespace Cadence {
namespace Core {

namespace Operations {
    /// Only a load that ran to the end counts as complete; a timed-out load does not
    template<>
    struct OperationCompletion<Loaders::LoadOutcome> {
        static bool isComplete(Loaders::LoadOutcome outcome) { return outcome == Loaders::LoadOutcome::Loaded; }
    };
} // namespace Operations

namespace Loaders {

    /**
     * @brief Reusable load command for a record collection
     *
     * @code
     * CollectionLoader<Enterprise>::Config config;
     * config.name = "EnterpriseLoader";
     * config.operationName = "Loading Enterprises";
     * config.retry.maxRetries = 2;
     * config.timeout = std::chrono::seconds(30);
     *
     * CollectionLoader<Enterprise> loader(repository, enterprises, executor, config, &work);
     * loader.enableAutoRefresh(timers, std::chrono::minutes(5));
     * auto outcome = loader.loadWithSteps(tracker);
     * @endcode
     */
    template<typename Record>
    class CollectionLoader {
    public:
        struct Config {
            std::string name = "CollectionLoader";
            std::string operationName = "Loading";
            std::string statusMessage = "Loading data...";
            Concurrency::RetryPolicy::Config retry;

            /// Zero disables the timeout race; non-zero requires a WorkService
            std::chrono::milliseconds timeout{0};

            /// Rows used when the repository returns nothing or the load fails
            std::function<std::vector<Record>()> fallback;
        };

        /**
         * @throws std::invalid_argument for a null repository, or a timeout
         *         without a WorkService to run the fetch on
         */
        CollectionLoader(std::shared_ptr<Data::IRepository<Record>> repository,
                         Collections::ThreadSafeCollection<Record>& target,
                         Operations::AsyncOperationExecutor& executor,
                         Config config = {},
                         Concurrency::WorkService* workService = nullptr,
                         Logging::Logger& logger = Logging::Logger::global())
            : _repository(std::move(repository))
            , _target(target)
            , _executor(executor)
            , _config(std::move(config))
            , _workService(workService)
            , _logger(logger)
            , _retry(_config.retry, logger) {
            if (!_repository) {
                throw std::invalid_argument("CollectionLoader requires a repository");
            }
            if (_config.timeout.count() > 0 && !_workService) {
                throw std::invalid_argument("CollectionLoader timeout requires a WorkService");
            }
        }

        ~CollectionLoader() {
            disableAutoRefresh();
        }

        CollectionLoader(const CollectionLoader&) = delete;
        CollectionLoader& operator=(const CollectionLoader&) = delete;

        /// Load on the calling thread
        LoadOutcome load(Progress::ProgressReporter* progress = nullptr) {
            return run(progress, nullptr);
        }

        /**
         * @brief Load on the calling thread, reporting the named phases
         *
         * Phases: Initializing, Connecting, Querying, Processing, Updating,
         * Finalizing. Cancelling the tracker cancels the load.
         */
        LoadOutcome loadWithSteps(Progress::StepProgressTracker& tracker,
                                  Progress::ProgressReporter* progress = nullptr) {
            return run(progress, &tracker);
        }

        /// Load on a worker; the loader must outlive the handle's completion
        Concurrency::AsyncHandle<LoadOutcome> loadAsync(Concurrency::WorkService& workService,
                                                        Progress::ProgressReporter* progress = nullptr) {
            return workService.submitTask([this, progress] { return load(progress); });
        }

        /**
         * @brief Reload every interval on the worker pool
         *
         * Replaces any previous schedule. Refreshes that overlap a running load
         * are skipped by the single-flight guard.
         */
        void enableAutoRefresh(TimerService& timers, std::chrono::steady_clock::duration interval) {
            auto timer = timers.scheduleTimer(interval, [this] {
                auto outcome = load();
                _logger.debug(_config.name, std::format("Auto refresh finished: {}", loadOutcomeToString(outcome)));
            }, true, Concurrency::ExecutionType::AnyThread);

            std::lock_guard<std::mutex> lock(_refreshMutex);
            _autoRefresh = std::move(timer);
            _logger.info(_config.name, std::format("Auto refresh enabled every {}ms",
                std::chrono::duration_cast<std::chrono::milliseconds>(interval).count()));
        }

        void disableAutoRefresh() {
            Timer previous;
            {
                std::lock_guard<std::mutex> lock(_refreshMutex);
                previous = std::move(_autoRefresh);
            }
            // Invalidated outside the lock so an in-flight refresh can finish
            previous.invalidate();
        }

        bool autoRefreshEnabled() const {
            std::lock_guard<std::mutex> lock(_refreshMutex);
            return _autoRefresh.isValid();
        }

        bool isLoading() const noexcept { return _guard.isHeld(); }

        std::exception_ptr lastError() const {
            std::lock_guard<std::mutex> lock(_resultMutex);
            return _lastError;
        }

        std::optional<LoadOutcome> lastOutcome() const {
            std::lock_guard<std::mutex> lock(_resultMutex);
            return _lastOutcome;
        }

        static std::vector<Progress::ProgressStep> defaultSteps() {
            return {
                {"Initializing", "Preparing to load data"},
                {"Connecting", "Establishing data source connection"},
                {"Querying", "Executing query with retry logic"},
                {"Processing", "Processing retrieved data"},
                {"Updating", "Updating the collection with loaded data"},
                {"Finalizing", "Completing data load"},
            };
        }

    private:
        static void step(Progress::StepProgressTracker* tracker, size_t index, std::string message) {
            if (tracker) tracker->updateProgress(index, std::move(message));
        }

        static void report(Progress::ProgressReporter* progress, std::string_view message, double percentage) {
            if (progress) progress->reportProgress(message, percentage);
        }

        LoadOutcome run(Progress::ProgressReporter* progress, Progress::StepProgressTracker* tracker) {
            auto flight = _guard.tryAcquire();
            if (!flight) {
                _logger.info(_config.name, "Load already in progress, skipping duplicate request");
                return LoadOutcome::SkippedDuplicate;
            }

            if (tracker) {
                tracker->startOperation(_config.operationName, defaultSteps());
            }

            try {
                auto outcome = _executor.execute([&](const Concurrency::CancellationToken& token) {
                    return fetchAndApply(token, progress, tracker);
                }, progress, _config.statusMessage);
                record(outcome, nullptr);
                return outcome;
            } catch (const Concurrency::OperationCancelledException&) {
                _logger.info(_config.name, "Load was cancelled");
                if (tracker && tracker->isOperationInProgress()) {
                    tracker->failOperation("Operation was cancelled");
                }
                record(LoadOutcome::Cancelled, std::current_exception());
                return LoadOutcome::Cancelled;
            } catch (const std::exception& e) {
                if (tracker) {
                    tracker->failOperation(std::format("Load failed: {}", e.what()));
                }
                record(LoadOutcome::Failed, std::current_exception());
                applyFallback();
                return LoadOutcome::Failed;
            } catch (...) {
                _logger.error(_config.name, "Load failed with a non-standard exception");
                if (tracker) {
                    tracker->failOperation("Load failed: unknown error");
                }
                record(LoadOutcome::Failed, std::current_exception());
                applyFallback();
                return LoadOutcome::Failed;
            }
        }

        LoadOutcome fetchAndApply(const Concurrency::CancellationToken& token,
                                  Progress::ProgressReporter* progress,
                                  Progress::StepProgressTracker* tracker) {
            // Either the executor epoch or the tracker can cancel this load
            auto loadCancellation = Concurrency::CancellationSource::createLinked(
                token, tracker ? tracker->token() : Concurrency::CancellationToken::none());
            auto effective = loadCancellation->token();

            step(tracker, 0, "Initializing data load...");
            step(tracker, 1, "Connecting to data source...");
            report(progress, "Connecting to data source...", 10.0);

            auto fetch = [repository = _repository, retry = _retry, effective]() mutable {
                return retry.execute([&](const Concurrency::CancellationToken& t) {
                    return repository->fetchAll(t);
                }, effective);
            };

            std::vector<Record> records;
            if (_config.timeout.count() > 0) {
                auto race = Concurrency::raceWithTimeout(_workService->submitTask(fetch), _config.timeout, effective);
                if (race.outcome == Concurrency::RaceOutcome::TimedOut) {
                    // Stops the abandoned fetch at its next cancellation check
                    loadCancellation->cancel();
                    _logger.warning(_config.name, std::format("Query timed out after {}ms", _config.timeout.count()));
                    if (tracker) {
                        tracker->failOperation(std::format("Operation timed out after {}ms", _config.timeout.count()));
                    }
                    return LoadOutcome::TimedOut;
                }
                effective.throwIfCancellationRequested();
                records = race.get();
            } else {
                records = fetch();
            }
            effective.throwIfCancellationRequested();

            step(tracker, 2, std::format("Query completed - found {} records", records.size()));
            report(progress, "Query completed", 50.0);
            _logger.info(_config.name, std::format("Repository query completed, record count: {}", records.size()));

            step(tracker, 3, "Processing data...");
            if (records.empty() && _config.fallback) {
                _logger.info(_config.name, "No records found, using fallback data");
                records = _config.fallback();
            }
            report(progress, "Processing data", 70.0);

            step(tracker, 4, "Updating collection...");
            _target.replaceAllAsync(std::move(records)).get();
            report(progress, "Collection updated", 90.0);
            effective.throwIfCancellationRequested();

            step(tracker, 5, "Completing data load...");
            if (tracker) tracker->completeOperation();
            _logger.info(_config.name, "Load completed successfully");
            return LoadOutcome::Loaded;
        }

        void applyFallback() {
            if (!_config.fallback) return;
            _logger.info(_config.name, "Load failed, applying fallback data");
            auto handle = _target.replaceAllAsync(_config.fallback());
            handle.wait();
            if (auto error = handle.error()) {
                _logger.error(_config.name, std::format("Applying fallback data failed: {}",
                                                        Concurrency::describeException(error)));
            }
        }

        void record(LoadOutcome outcome, std::exception_ptr error) {
            std::lock_guard<std::mutex> lock(_resultMutex);
            _lastOutcome = outcome;
            _lastError = std::move(error);
        }

        std::shared_ptr<Data::IRepository<Record>> _repository;
        Collections::ThreadSafeCollection<Record>& _target;
        Operations::AsyncOperationExecutor& _executor;
        Config _config;
        Concurrency::WorkService* _workService;
        Logging::Logger& _logger;
        Concurrency::RetryPolicy _retry;
        Concurrency::SingleFlightGuard _guard;

        mutable std::mutex _resultMutex;
        std::optional<LoadOutcome> _lastOutcome;
        std::exception_ptr _lastError;

        mutable std::mutex _refreshMutex;
        Timer _autoRefresh;
    };

} // namespace Loaders
} // namespace Core
} // namespace Cadence
