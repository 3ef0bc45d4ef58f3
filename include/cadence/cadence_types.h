/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

/**
 * @file cadence_types.h
 * @brief Base C API types shared by every Cadence C header
 *
 * All types are C89-compatible and designed for a stable ABI across
 * language boundaries.
 */

#pragma once

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Export macro (works for both static and shared builds)
#if defined(_WIN32)
  #if defined(CADENCE_SHARED)
    #if defined(CADENCE_BUILDING)
      #define CADENCE_API __declspec(dllexport)
    #else
      #define CADENCE_API __declspec(dllimport)
    #endif
  #else
    #define CADENCE_API
  #endif
#else
  #if defined(CADENCE_SHARED)
    #define CADENCE_API __attribute__((visibility("default")))
  #else
    #define CADENCE_API
  #endif
#endif

// ============================================================================
// Status Codes
// ============================================================================

/**
 * @brief Status codes returned through the status out-parameter
 */
typedef enum CadenceStatus
{
    CADENCE_OK = 0,
    CADENCE_ERR_UNKNOWN = 1,
    CADENCE_ERR_INVALID_ARG = 2,
    CADENCE_ERR_NO_MEMORY = 3,
    CADENCE_ERR_BUFFER_TOO_SMALL = 4,
    CADENCE_ERR_CANCELLED = 5,          ///< Operation observed cancellation
    CADENCE_ERR_DISPOSED = 6,           ///< Executor was disposed
    CADENCE_ERR_OPERATION_FAILED = 7,   ///< Operation callback reported a failure
    CADENCE_ERR_RETRY_EXHAUSTED = 8     ///< All retry attempts failed
} CadenceStatus;

// Booleans (explicit, stable width across languages)
typedef int32_t CadenceBool; // 0 = false, non-zero = true
#define CADENCE_FALSE 0
#define CADENCE_TRUE  1

/**
 * @brief Get a human-readable string for a status code
 *
 * @param status The status code
 * @return Static string (do not free)
 */
CADENCE_API const char* cadence_status_to_string(CadenceStatus status);

#ifdef __cplusplus
}
#endif
