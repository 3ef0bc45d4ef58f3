/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace Cadence {
namespace Core {
namespace Data {

    /// A municipal utility enterprise (water, sewer, trash...)
    struct Enterprise {
        int64_t id = 0;
        std::string name;
        std::string type;
        double currentRate = 0.0;
        double monthlyExpenses = 0.0;
        int32_t citizenCount = 0;

        bool operator==(const Enterprise&) const = default;
    };

    /// Placeholder rows shown when no enterprise data is available
    std::vector<Enterprise> sampleEnterprises();

} // namespace Data
} // namespace Core
} // namespace Cadence
