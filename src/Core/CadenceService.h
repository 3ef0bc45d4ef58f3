/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#pragma once

#include <string>
#include <vector>
#include <atomic>
#include "TypeSystem/TypeID.h"

namespace Cadence {
    namespace Core {

        class CadenceServiceRegistry; // forward declaration

        /**
         * @brief Lifecycle states for a CadenceService instance.
         */
        enum class ServiceState {
            Registered,
            Loaded,
            Started,
            Stopped,
            Unloaded
        };

        /**
         * @brief Base interface for long-lived subsystems (worker pool, timers).
         *
         * Services participate in the application lifecycle via load/start/stop/unload
         * callbacks, driven in dependency order by CadenceServiceRegistry. Construction
         * should be cheap; threads and other resources are acquired in start().
         */
        class CadenceService {
        public:
            virtual ~CadenceService() = default;

            // Identity (metadata only; not used for lookups)
            virtual const char* id() const = 0;    // stable unique id, e.g. "com.cadence.core.work"
            virtual const char* name() const = 0;  // human readable

            // Static type identity for RTTI-less registration and lookup
            virtual TypeSystem::TypeID typeId() const = 0;

            virtual const char* version() const { return "0.1.0"; }

            // Services that must be loaded and started before this one
            virtual std::vector<TypeSystem::TypeID> dependsOnTypes() const { return {}; }

            // Lifecycle hooks (main thread unless documented otherwise)
            virtual void load() {}
            virtual void start() {}
            virtual void stop() {}
            virtual void unload() {}

            ServiceState state() const noexcept { return _state.load(std::memory_order_acquire); }

        protected:
            void setState(ServiceState s) noexcept { _state.store(s, std::memory_order_release); }

        private:
            friend class CadenceServiceRegistry; // allow registry to drive state transitions
            std::atomic<ServiceState> _state{ServiceState::Registered};
        };

    } // namespace Core
} // namespace Cadence
