/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#pragma once

/**
 * @file Cadence.h
 * @brief Single header that includes all Cadence components
 */

// Type System
#include "TypeSystem/TypeID.h"

// Logging
#include "Logging/ConsoleSink.h"
#include "Logging/ILogSink.h"
#include "Logging/LogEntry.h"
#include "Logging/LogLevel.h"
#include "Logging/Logger.h"

// Services and application
#include "Core/CadenceService.h"
#include "Core/CadenceServiceRegistry.h"
#include "Core/CadenceApplication.h"
#include "Core/RuntimeConfig.h"
#include "Core/Timer.h"
#include "Core/TimerService.h"

// Concurrency
#include "Concurrency/AsyncHandle.h"
#include "Concurrency/CancellationToken.h"
#include "Concurrency/DedicatedThreadDispatcher.h"
#include "Concurrency/ExecutionType.h"
#include "Concurrency/IDispatcher.h"
#include "Concurrency/InlineDispatcher.h"
#include "Concurrency/MainThreadDispatcher.h"
#include "Concurrency/OperationErrors.h"
#include "Concurrency/RetryPolicy.h"
#include "Concurrency/SingleFlightGuard.h"
#include "Concurrency/TimeoutRace.h"
#include "Concurrency/WorkService.h"

// Progress
#include "Progress/ProgressReporter.h"
#include "Progress/ProgressStep.h"
#include "Progress/StepProgressTracker.h"

// Collections
#include "Collections/CollectionChange.h"
#include "Collections/ThreadSafeCollection.h"

// Operations
#include "Operations/AsyncOperationExecutor.h"
#include "Operations/IErrorReporter.h"
#include "Operations/LoggingErrorReporter.h"
#include "Operations/OperationState.h"

// Data and loaders
#include "Data/Enterprise.h"
#include "Data/IRepository.h"
#include "Loaders/CollectionLoader.h"
#include "Loaders/LoadOutcome.h"
