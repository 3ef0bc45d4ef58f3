/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include "Enterprise.h"

namespace Cadence {
namespace Core {
namespace Data {

    std::vector<Enterprise> sampleEnterprises() {
        return {
            {1, "Water Utility", "Water", 26.50, 52000.0, 2400},
            {2, "Wastewater Treatment", "Sewer", 34.75, 82000.0, 2250},
            {3, "Solid Waste Management", "Waste", 17.25, 35200.0, 2300},
            {4, "Renewable Energy Program", "Electric", 42.50, 88000.0, 1800},
            {5, "Broadband Infrastructure", "Infrastructure", 29.00, 41000.0, 1500},
            {6, "Parks & Recreation", "Parks", 12.75, 28500.0, 1950},
        };
    }

} // namespace Data
} // namespace Core
} // namespace Cadence
