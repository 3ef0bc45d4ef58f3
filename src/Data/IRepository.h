/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#pragma once

#include <vector>
#include "Concurrency/CancellationToken.h"

namespace Cadence {
namespace Core {
namespace Data {

    /**
     * @brief Read side of a record store
     *
     * fetchAll() may block and may throw. Loaders treat every exception other
     * than OperationCancelledException as transient and retry it.
     */
    template<typename Record>
    class IRepository {
    public:
        using record_type = Record;

        virtual ~IRepository() = default;

        virtual std::vector<Record> fetchAll(const Concurrency::CancellationToken& token) = 0;
    };

} // namespace Data
} // namespace Core
} // namespace Cadence
