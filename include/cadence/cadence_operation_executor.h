/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

/**
 * @file cadence_operation_executor.h
 * @brief C API for the async operation executor
 *
 * Lets a host written in another language run its long operations under the
 * executor's loading/status/progress protocol and share its cancellation
 * epoch. The callback runs synchronously on the calling thread.
 *
 * Thread Safety: All functions in this file are thread-safe unless
 * otherwise documented.
 */

#pragma once

#include "cadence_types.h"

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Opaque Handle Types
// ============================================================================

/**
 * @brief Opaque handle to an operation executor
 *
 * Lifecycle: Created by cadence_operation_executor_create(),
 * destroyed by cadence_operation_executor_destroy().
 */
typedef struct cadence_OperationExecutor_t* cadence_OperationExecutor;

/**
 * @brief Borrowed cancellation token passed to an operation callback
 *
 * Only valid for the duration of the callback.
 */
typedef struct cadence_CancellationToken_t* cadence_CancellationToken;

// ============================================================================
// Callback Types
// ============================================================================

/**
 * @brief Operation body
 *
 * Return CADENCE_OK on success, CADENCE_ERR_CANCELLED when the operation
 * stopped because the token was signalled, or any other code to report a
 * failure. The failure is logged and sent to the error reporter.
 *
 * @param token Cancellation token for this run; poll it with
 *              cadence_cancellation_token_is_cancelled()
 * @param user_data User-provided context pointer (can be NULL)
 */
typedef CadenceStatus (*CadenceOperationCallback)(cadence_CancellationToken token, void* user_data);

// ============================================================================
// Lifecycle
// ============================================================================

/**
 * @brief Creates an executor that logs through the global logger
 *
 * @param name Name used as the log category and error context (NULL for default)
 * @param status Output parameter for error reporting (required)
 * @return Owned pointer (must call cadence_operation_executor_destroy) or NULL on error
 *
 * @code
 * CadenceStatus status = CADENCE_OK;
 * cadence_OperationExecutor exec = cadence_operation_executor_create("Enterprises", &status);
 * @endcode
 */
CADENCE_API cadence_OperationExecutor cadence_operation_executor_create(const char* name,
                                                                        CadenceStatus* status);

/**
 * @brief Disposes and destroys the executor. Safe to call with NULL.
 */
CADENCE_API void cadence_operation_executor_destroy(cadence_OperationExecutor executor);

// ============================================================================
// Execution
// ============================================================================

/**
 * @brief Runs callback under the loading protocol
 *
 * @param executor The executor (required)
 * @param callback Operation body (required)
 * @param user_data Passed through to callback
 * @param status_message Status shown while the operation runs (can be NULL)
 * @param status Output parameter: CADENCE_OK, CADENCE_ERR_CANCELLED,
 *               CADENCE_ERR_DISPOSED or the failure code
 */
CADENCE_API void cadence_operation_executor_execute(cadence_OperationExecutor executor,
                                                    CadenceOperationCallback callback,
                                                    void* user_data,
                                                    const char* status_message,
                                                    CadenceStatus* status);

/**
 * @brief Checks whether the token's epoch has been cancelled
 *
 * @return CADENCE_TRUE if cancellation was requested; CADENCE_FALSE for NULL
 */
CADENCE_API CadenceBool cadence_cancellation_token_is_cancelled(cadence_CancellationToken token);

// ============================================================================
// Control
// ============================================================================

/// Signals the current cancellation epoch
CADENCE_API void cadence_operation_executor_cancel(cadence_OperationExecutor executor, CadenceStatus* status);

/// Cancels the current epoch and starts a fresh one
CADENCE_API void cadence_operation_executor_reset_cancellation(cadence_OperationExecutor executor,
                                                               CadenceStatus* status);

/// Cancels and refuses further work; idempotent
CADENCE_API void cadence_operation_executor_dispose(cadence_OperationExecutor executor, CadenceStatus* status);

// ============================================================================
// Observable State
// ============================================================================

CADENCE_API CadenceBool cadence_operation_executor_is_loading(cadence_OperationExecutor executor);

CADENCE_API CadenceBool cadence_operation_executor_is_disposed(cadence_OperationExecutor executor);

/**
 * @brief Copies the current status message into buffer (NUL-terminated)
 *
 * @param buffer Destination (can be NULL when buffer_size is 0)
 * @param buffer_size Size of buffer in bytes
 * @param out_length Receives the message length without terminator (can be NULL)
 * @param status CADENCE_ERR_BUFFER_TOO_SMALL when the message does not fit;
 *               out_length still receives the required length
 */
CADENCE_API void cadence_operation_executor_status_message(cadence_OperationExecutor executor,
                                                           char* buffer,
                                                           size_t buffer_size,
                                                           size_t* out_length,
                                                           CadenceStatus* status);

/**
 * @brief Reads the mirrored progress percentage
 *
 * @param out_percentage Receives the percentage when one is set (required)
 * @return CADENCE_TRUE when progress is set, CADENCE_FALSE when unset
 */
CADENCE_API CadenceBool cadence_operation_executor_progress(cadence_OperationExecutor executor,
                                                            double* out_percentage);

#ifdef __cplusplus
}
#endif
