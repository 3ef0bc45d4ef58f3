/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

/**
 * @file TypeID.h
 * @brief RTTI-less type identity used to register and look up services
 *
 * Services are keyed by TypeID in CadenceServiceRegistry, so lookups work
 * with RTTI disabled and across translation units. Identity comes from
 * boost::type_index.
 */

#pragma once

#include <boost/type_index.hpp>
#include <compare>
#include <cstdint>
#include <functional>
#include <string>

#ifndef CADENCE_TYPEID_INCLUDE_NAME
#define CADENCE_TYPEID_INCLUDE_NAME 1
#endif

namespace Cadence {
namespace Core {
namespace TypeSystem {

    /**
     * @brief Stable, hashable identifier for a C++ type
     *
     * Equality and ordering use only the hash. The name is informational and
     * is empty when CADENCE_TYPEID_INCLUDE_NAME is 0.
     *
     * @code
     * auto a = createTypeId<Concurrency::WorkService>();
     * auto b = createTypeId<TimerService>();
     * assert(a != b);
     * @endcode
     */
    struct TypeID {
        uint64_t id = 0;
        std::string name;

        auto operator<=>(const TypeID& other) const { return id <=> other.id; }
        bool operator==(const TypeID& other) const { return id == other.id; }

        [[nodiscard]] std::string prettyName() const {
            return name;
        }
    };

    // Cached per type; the first call pays for the boost lookup
    template <typename T>
    [[nodiscard]] inline const TypeID& typeIdOf() noexcept {
        static const TypeID k = [] {
            const auto index = boost::typeindex::type_id<T>();
#if CADENCE_TYPEID_INCLUDE_NAME
            return TypeID{static_cast<uint64_t>(index.hash_code()), index.pretty_name()};
#else
            return TypeID{static_cast<uint64_t>(index.hash_code()), std::string()};
#endif
        }();
        return k;
    }

    template <typename T>
    [[nodiscard]] inline TypeID createTypeId() noexcept {
        return typeIdOf<T>();
    }

} // namespace TypeSystem
} // namespace Core
} // namespace Cadence

namespace std {
    template <>
    struct hash<Cadence::Core::TypeSystem::TypeID> {
        size_t operator()(const Cadence::Core::TypeSystem::TypeID& typeId) const noexcept {
            return static_cast<size_t>(typeId.id);
        }
    };
} // namespace std
