/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#pragma once

#include <cstddef>
#include <vector>

namespace Cadence {
namespace Core {
namespace Collections {

    enum class CollectionChangeAction {
        Add,
        Remove,
        Replace,
        Move,
        Reset
    };

    inline const char* collectionChangeActionToString(CollectionChangeAction action) {
        switch (action) {
            case CollectionChangeAction::Add: return "Add";
            case CollectionChangeAction::Remove: return "Remove";
            case CollectionChangeAction::Replace: return "Replace";
            case CollectionChangeAction::Move: return "Move";
            case CollectionChangeAction::Reset: return "Reset";
        }
        return "Unknown";
    }

    /**
     * @brief One change notification
     *
     * Indices are -1 when not applicable (Reset carries none).
     */
    template<typename T>
    struct CollectionChange {
        CollectionChangeAction action = CollectionChangeAction::Reset;
        std::vector<T> newItems;
        std::vector<T> oldItems;
        std::ptrdiff_t newStartingIndex = -1;
        std::ptrdiff_t oldStartingIndex = -1;
    };

} // namespace Collections
} // namespace Core
} // namespace Cadence
