/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "Core/CadenceService.h"
#include "Logging/Logger.h"
#include "TypeSystem/TypeID.h"

namespace Cadence
{
namespace Core
{

/**
 * @brief Registry and lifecycle orchestrator for CadenceService instances.
 *
 * Services are registered and looked up by static TypeID (RTTI-less). The registry
 * loads and starts services in dependency order and stops and unloads them in
 * reverse order. Every transition is logged under "Services".
 *
 * startAll() is all-or-nothing: if a service's start() throws, the services it
 * already started are stopped again in reverse order and the error propagates.
 */
class CadenceServiceRegistry
{
public:
    explicit CadenceServiceRegistry(Logging::Logger& logger = Logging::Logger::global())
        : _logger(logger) {}
    ~CadenceServiceRegistry() = default;

    CadenceServiceRegistry(const CadenceServiceRegistry&) = delete;
    CadenceServiceRegistry& operator=(const CadenceServiceRegistry&) = delete;

    /**
     * @brief Registers a service under its typeId()
     * @return true if newly inserted, false if it replaced an existing registration
     */
    bool registerService(std::shared_ptr<CadenceService> service);
    template <typename TService>
    bool registerService(std::shared_ptr<TService> service) {
        static_assert(std::is_base_of_v<CadenceService, TService>, "TService must derive from CadenceService");
        return registerService(std::static_pointer_cast<CadenceService>(service));
    }

    bool unregisterService(const TypeSystem::TypeID& tid);
    template <typename T>
    bool unregisterService() {
        return unregisterService(TypeSystem::createTypeId<T>());
    }

    std::shared_ptr<CadenceService> get(const TypeSystem::TypeID& tid) const;
    template <typename T>
    std::shared_ptr<T> get() const {
        return std::static_pointer_cast<T>(get(TypeSystem::createTypeId<T>()));
    }

    bool has(const TypeSystem::TypeID& tid) const noexcept;
    template <typename T>
    bool has() const noexcept {
        return has(TypeSystem::createTypeId<T>());
    }

    size_t serviceCount() const noexcept {
        return _servicesByType.size();
    }

    // Lifecycle control (throws std::runtime_error on dependency errors)
    void loadAll();
    void startAll();
    void stopAll();
    void unloadAll();

private:
    // Returns type ids ordered so that every service follows its dependencies
    std::vector<TypeSystem::TypeID> topoOrder() const;

    // Stops already-started services, newest first, after a failed startAll()
    void rollbackStarted(const std::vector<std::shared_ptr<CadenceService>>& started);

    Logging::Logger& _logger;
    std::unordered_map<TypeSystem::TypeID, std::shared_ptr<CadenceService>> _servicesByType;
};

}  // namespace Core
}  // namespace Cadence
