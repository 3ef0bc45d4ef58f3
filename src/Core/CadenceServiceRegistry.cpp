/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

#include "Core/CadenceServiceRegistry.h"
#include <exception>
#include <format>
#include <queue>
#include <unordered_map>

namespace Cadence {
    namespace Core {

        bool CadenceServiceRegistry::registerService(std::shared_ptr<CadenceService> service) {
            if (!service) return false;
            auto tid = service->typeId();
            bool inserted = (_servicesByType.find(tid) == _servicesByType.end());
            service->setState(ServiceState::Registered);
            _logger.debug("Services", std::format("{} '{}'", inserted ? "Registered" : "Replaced", service->id()));
            _servicesByType[tid] = std::move(service);
            return inserted;
        }

        bool CadenceServiceRegistry::unregisterService(const TypeSystem::TypeID& tid) {
            return _servicesByType.erase(tid) > 0;
        }

        std::shared_ptr<CadenceService> CadenceServiceRegistry::get(const TypeSystem::TypeID& tid) const {
            auto it = _servicesByType.find(tid);
            if (it == _servicesByType.end()) return nullptr;
            return it->second;
        }

        bool CadenceServiceRegistry::has(const TypeSystem::TypeID& tid) const noexcept {
            return _servicesByType.find(tid) != _servicesByType.end();
        }

        void CadenceServiceRegistry::loadAll() {
            for (const auto& tid : topoOrder()) {
                auto& svc = _servicesByType.at(tid);
                if (svc->state() != ServiceState::Registered && svc->state() != ServiceState::Unloaded) continue;
                svc->load();
                svc->setState(ServiceState::Loaded);
                _logger.debug("Services", std::format("Loaded '{}'", svc->id()));
            }
        }

        void CadenceServiceRegistry::startAll() {
            std::vector<std::shared_ptr<CadenceService>> started;
            for (const auto& tid : topoOrder()) {
                auto svc = _servicesByType.at(tid);
                if (svc->state() == ServiceState::Started) continue;
                try {
                    svc->start();
                } catch (const std::exception& e) {
                    _logger.error("Services", std::format("Service '{}' failed to start: {}", svc->id(), e.what()));
                    rollbackStarted(started);
                    throw;
                } catch (...) {
                    _logger.error("Services", std::format("Service '{}' failed to start", svc->id()));
                    rollbackStarted(started);
                    throw;
                }
                svc->setState(ServiceState::Started);
                started.push_back(std::move(svc));
                _logger.info("Services", std::format("Started '{}'", started.back()->id()));
            }
        }

        void CadenceServiceRegistry::rollbackStarted(const std::vector<std::shared_ptr<CadenceService>>& started) {
            for (auto it = started.rbegin(); it != started.rend(); ++it) {
                const auto& svc = *it;
                try {
                    svc->stop();
                } catch (const std::exception& e) {
                    _logger.error("Services", std::format("Service '{}' failed to stop during rollback: {}",
                                                          svc->id(), e.what()));
                }
                svc->setState(ServiceState::Stopped);
                _logger.warning("Services", std::format("Stopped '{}' after a failed start", svc->id()));
            }
        }

        void CadenceServiceRegistry::stopAll() {
            auto order = topoOrder();
            // Dependents stop before the services they rely on
            for (auto it = order.rbegin(); it != order.rend(); ++it) {
                auto& svc = _servicesByType.at(*it);
                if (svc->state() != ServiceState::Started) continue;
                svc->stop();
                svc->setState(ServiceState::Stopped);
                _logger.info("Services", std::format("Stopped '{}'", svc->id()));
            }
        }

        void CadenceServiceRegistry::unloadAll() {
            auto order = topoOrder();
            for (auto it = order.rbegin(); it != order.rend(); ++it) {
                auto& svc = _servicesByType.at(*it);
                if (svc->state() == ServiceState::Unloaded || svc->state() == ServiceState::Registered) continue;
                svc->unload();
                svc->setState(ServiceState::Unloaded);
                _logger.debug("Services", std::format("Unloaded '{}'", svc->id()));
            }
        }

        std::vector<TypeSystem::TypeID> CadenceServiceRegistry::topoOrder() const {
            // Kahn's algorithm; edges run dependency -> dependent
            std::unordered_map<TypeSystem::TypeID, size_t> indegree;
            std::unordered_map<TypeSystem::TypeID, std::vector<TypeSystem::TypeID>> adj;

            for (const auto& [tid, _] : _servicesByType) {
                indegree[tid] = 0;
            }

            for (const auto& [tid, svc] : _servicesByType) {
                for (const auto& depTid : svc->dependsOnTypes()) {
                    if (!has(depTid)) {
                        throw std::runtime_error(std::string("Missing dependency required by service '") + svc->id() + "'");
                    }
                    adj[depTid].push_back(tid);
                    indegree[tid] += 1;
                }
            }

            std::queue<TypeSystem::TypeID> q;
            for (const auto& [tid, deg] : indegree) {
                if (deg == 0) q.push(tid);
            }

            std::vector<TypeSystem::TypeID> order;
            order.reserve(_servicesByType.size());
            while (!q.empty()) {
                auto u = q.front(); q.pop();
                order.push_back(u);
                auto it = adj.find(u);
                if (it == adj.end()) continue;
                for (const auto& v : it->second) {
                    if (--indegree[v] == 0) q.push(v);
                }
            }

            if (order.size() != _servicesByType.size()) {
                throw std::runtime_error("Service dependency cycle detected");
            }

            return order;
        }

    } // namespace Core
} // namespace Cadence
