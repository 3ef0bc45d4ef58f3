/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include "../../include/cadence/cadence_operation_executor.h"
#include "../Operations/AsyncOperationExecutor.h"
#include "../Operations/LoggingErrorReporter.h"
#include <cstring>
#include <new>

using namespace Cadence::Core;
using namespace Cadence::Core::Operations;
using Cadence::Core::Concurrency::CancellationToken;

// ============================================================================
// Internal Helpers
// ============================================================================

namespace {

// Failure code carried from a callback back out through execute()
class CallbackFailure : public std::runtime_error {
public:
    explicit CallbackFailure(CadenceStatus code)
        : std::runtime_error(std::string("Operation callback returned ") + cadence_status_to_string(code))
        , _code(code) {}

    CadenceStatus code() const noexcept { return _code; }

private:
    CadenceStatus _code;
};

// Centralized exception translation
void translate_exception(CadenceStatus* status) {
    if (!status) return;

    try {
        throw; // Re-throw current exception
    } catch (const CallbackFailure& e) {
        *status = e.code();
    } catch (const Concurrency::OperationCancelledException&) {
        *status = CADENCE_ERR_CANCELLED;
    } catch (const Concurrency::ExecutorDisposedException&) {
        *status = CADENCE_ERR_DISPOSED;
    } catch (const Concurrency::RetryExhaustedException&) {
        *status = CADENCE_ERR_RETRY_EXHAUSTED;
    } catch (const std::bad_alloc&) {
        *status = CADENCE_ERR_NO_MEMORY;
    } catch (const std::invalid_argument&) {
        *status = CADENCE_ERR_INVALID_ARG;
    } catch (const std::exception&) {
        *status = CADENCE_ERR_UNKNOWN;
    } catch (...) {
        std::terminate(); // Unknown exception = programming bug
    }
}

inline AsyncOperationExecutor* to_cpp(cadence_OperationExecutor executor) {
    return reinterpret_cast<AsyncOperationExecutor*>(executor);
}

inline cadence_OperationExecutor to_c(AsyncOperationExecutor* executor) {
    return reinterpret_cast<cadence_OperationExecutor>(executor);
}

// Tokens are only lent for the duration of a callback
inline const CancellationToken* token_to_cpp(cadence_CancellationToken token) {
    return reinterpret_cast<const CancellationToken*>(token);
}

inline cadence_CancellationToken token_to_c(const CancellationToken* token) {
    return reinterpret_cast<cadence_CancellationToken>(const_cast<CancellationToken*>(token));
}

} // anonymous namespace

// ============================================================================
// Executor C API Implementation
// ============================================================================

extern "C" {

const char* cadence_status_to_string(CadenceStatus status) {
    switch (status) {
        case CADENCE_OK:
            return "CADENCE_OK";
        case CADENCE_ERR_UNKNOWN:
            return "CADENCE_ERR_UNKNOWN";
        case CADENCE_ERR_INVALID_ARG:
            return "CADENCE_ERR_INVALID_ARG";
        case CADENCE_ERR_NO_MEMORY:
            return "CADENCE_ERR_NO_MEMORY";
        case CADENCE_ERR_BUFFER_TOO_SMALL:
            return "CADENCE_ERR_BUFFER_TOO_SMALL";
        case CADENCE_ERR_CANCELLED:
            return "CADENCE_ERR_CANCELLED";
        case CADENCE_ERR_DISPOSED:
            return "CADENCE_ERR_DISPOSED";
        case CADENCE_ERR_OPERATION_FAILED:
            return "CADENCE_ERR_OPERATION_FAILED";
        case CADENCE_ERR_RETRY_EXHAUSTED:
            return "CADENCE_ERR_RETRY_EXHAUSTED";
        default:
            return "CADENCE_STATUS_UNKNOWN";
    }
}

cadence_OperationExecutor cadence_operation_executor_create(const char* name, CadenceStatus* status) {
    if (!status) return nullptr;
    *status = CADENCE_OK;

    try {
        AsyncOperationExecutor::Config config;
        if (name && *name) config.name = name;

        auto& logger = Logging::Logger::global();
        auto* executor = new(std::nothrow) AsyncOperationExecutor(
            logger, std::make_shared<LoggingErrorReporter>(logger), config);
        if (!executor) {
            *status = CADENCE_ERR_NO_MEMORY;
            return nullptr;
        }
        return to_c(executor);
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

void cadence_operation_executor_destroy(cadence_OperationExecutor executor) {
    if (!executor) return;
    delete to_cpp(executor);
}

void cadence_operation_executor_execute(cadence_OperationExecutor executor,
                                        CadenceOperationCallback callback,
                                        void* user_data,
                                        const char* status_message,
                                        CadenceStatus* status) {
    if (!status) return;
    *status = CADENCE_OK;

    if (!executor || !callback) {
        *status = CADENCE_ERR_INVALID_ARG;
        return;
    }

    std::optional<std::string> message;
    if (status_message) message = status_message;

    try {
        to_cpp(executor)->execute([callback, user_data](const CancellationToken& token) {
            CadenceStatus result = callback(token_to_c(&token), user_data);
            if (result == CADENCE_ERR_CANCELLED) {
                throw Concurrency::OperationCancelledException(
                    "Operation callback observed cancellation", token.epoch());
            }
            if (result != CADENCE_OK) {
                throw CallbackFailure(result);
            }
        }, nullptr, std::move(message));
    } catch (...) {
        translate_exception(status);
    }
}

CadenceBool cadence_cancellation_token_is_cancelled(cadence_CancellationToken token) {
    if (!token) return CADENCE_FALSE;
    return token_to_cpp(token)->isCancellationRequested() ? CADENCE_TRUE : CADENCE_FALSE;
}

void cadence_operation_executor_cancel(cadence_OperationExecutor executor, CadenceStatus* status) {
    if (!status) return;
    *status = CADENCE_OK;

    if (!executor) {
        *status = CADENCE_ERR_INVALID_ARG;
        return;
    }

    try {
        to_cpp(executor)->cancelOperations();
    } catch (...) {
        translate_exception(status);
    }
}

void cadence_operation_executor_reset_cancellation(cadence_OperationExecutor executor, CadenceStatus* status) {
    if (!status) return;
    *status = CADENCE_OK;

    if (!executor) {
        *status = CADENCE_ERR_INVALID_ARG;
        return;
    }

    try {
        to_cpp(executor)->resetCancellation();
    } catch (...) {
        translate_exception(status);
    }
}

void cadence_operation_executor_dispose(cadence_OperationExecutor executor, CadenceStatus* status) {
    if (!status) return;
    *status = CADENCE_OK;

    if (!executor) {
        *status = CADENCE_ERR_INVALID_ARG;
        return;
    }

    try {
        to_cpp(executor)->dispose();
    } catch (...) {
        translate_exception(status);
    }
}

CadenceBool cadence_operation_executor_is_loading(cadence_OperationExecutor executor) {
    if (!executor) return CADENCE_FALSE;
    return to_cpp(executor)->state().isLoading() ? CADENCE_TRUE : CADENCE_FALSE;
}

CadenceBool cadence_operation_executor_is_disposed(cadence_OperationExecutor executor) {
    if (!executor) return CADENCE_FALSE;
    return to_cpp(executor)->isDisposed() ? CADENCE_TRUE : CADENCE_FALSE;
}

void cadence_operation_executor_status_message(cadence_OperationExecutor executor,
                                               char* buffer,
                                               size_t buffer_size,
                                               size_t* out_length,
                                               CadenceStatus* status) {
    if (!status) return;
    *status = CADENCE_OK;

    if (!executor || (!buffer && buffer_size > 0)) {
        *status = CADENCE_ERR_INVALID_ARG;
        return;
    }

    try {
        std::string message = to_cpp(executor)->state().statusMessage();
        if (out_length) *out_length = message.size();
        if (message.size() + 1 > buffer_size) {
            *status = CADENCE_ERR_BUFFER_TOO_SMALL;
            return;
        }
        std::memcpy(buffer, message.c_str(), message.size() + 1);
    } catch (...) {
        translate_exception(status);
    }
}

CadenceBool cadence_operation_executor_progress(cadence_OperationExecutor executor, double* out_percentage) {
    if (!executor || !out_percentage) return CADENCE_FALSE;
    auto progress = to_cpp(executor)->state().progressPercentage();
    if (!progress) return CADENCE_FALSE;
    *out_percentage = *progress;
    return CADENCE_TRUE;
}

}  // extern "C"
