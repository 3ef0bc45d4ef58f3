/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Cadence project.
 */

/**
 * @file ThreadSafeCollection.h
 * @brief UI-bound ordered collection writable from any thread
 *
 * The backing vector belongs to the UI-confined context. Writers on that
 * context mutate it directly and get back an already-completed handle; writers
 * anywhere else are marshaled through the IDispatcher and get a handle that
 * completes once the mutation has been applied. Every write call produces at
 * most one change notification, raised on the UI context.
 *
 * Reads are only defined on the UI context and throw std::logic_error
 * elsewhere.
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <vector>
#include "CollectionChange.h"
#include "Concurrency/IDispatcher.h"

namespace Cadence {
namespace Core {
namespace Collections {

    /**
     * @brief Ordered sequence of T; insertion order preserved, duplicates allowed
     *
     * @code
     * ThreadSafeCollection<Enterprise> enterprises(dispatcher);
     * enterprises.subscribe([](const CollectionChange<Enterprise>& change) {
     *     if (change.action == CollectionChangeAction::Reset) view.rebind();
     * });
     *
     * // From a worker thread
     * enterprises.replaceAllAsync(repository.fetchAll(token)).wait();
     * @endcode
     */
    template<typename T>
    class ThreadSafeCollection {
    public:
        using value_type = T;
        using const_iterator = typename std::vector<T>::const_iterator;
        using Handler = std::function<void(const CollectionChange<T>&)>;
        using SubscriptionId = uint64_t;

        explicit ThreadSafeCollection(Concurrency::IDispatcher& dispatcher)
            : _dispatcher(dispatcher) {}

        ThreadSafeCollection(const ThreadSafeCollection&) = delete;
        ThreadSafeCollection& operator=(const ThreadSafeCollection&) = delete;

        /// Swap in the new contents in one step; one Reset notification
        Concurrency::DispatchHandle replaceAllAsync(std::vector<T> items) {
            return dispatch([this, items = std::move(items)]() mutable {
                _items.swap(items);
                raise({CollectionChangeAction::Reset});
            });
        }

        Concurrency::DispatchHandle addAsync(T item) {
            return dispatch([this, item = std::move(item)]() mutable {
                auto index = static_cast<std::ptrdiff_t>(_items.size());
                _items.push_back(item);
                raise({CollectionChangeAction::Add, {std::move(item)}, {}, index, -1});
            });
        }

        /// Appends all items with a single Add notification; empty input raises none
        Concurrency::DispatchHandle addRangeAsync(std::vector<T> items) {
            return dispatch([this, items = std::move(items)]() mutable {
                if (items.empty()) return;
                auto index = static_cast<std::ptrdiff_t>(_items.size());
                _items.insert(_items.end(), items.begin(), items.end());
                raise({CollectionChangeAction::Add, std::move(items), {}, index, -1});
            });
        }

        /// Removes the first element equal to item; no notification if absent
        Concurrency::DispatchHandle removeAsync(T item) {
            return dispatch([this, item = std::move(item)]() mutable {
                auto it = std::find(_items.begin(), _items.end(), item);
                if (it == _items.end()) return;
                auto index = static_cast<std::ptrdiff_t>(it - _items.begin());
                T removed = std::move(*it);
                _items.erase(it);
                raise({CollectionChangeAction::Remove, {}, {std::move(removed)}, -1, index});
            });
        }

        /// @throws std::out_of_range (through the handle) if index > size()
        Concurrency::DispatchHandle insertAsync(size_t index, T item) {
            return dispatch([this, index, item = std::move(item)]() mutable {
                if (index > _items.size()) {
                    throw std::out_of_range("ThreadSafeCollection::insertAsync index out of range");
                }
                _items.insert(_items.begin() + static_cast<std::ptrdiff_t>(index), item);
                raise({CollectionChangeAction::Add, {std::move(item)}, {},
                       static_cast<std::ptrdiff_t>(index), -1});
            });
        }

        /// @throws std::out_of_range (through the handle) if either index is out of range
        Concurrency::DispatchHandle moveAsync(size_t oldIndex, size_t newIndex) {
            return dispatch([this, oldIndex, newIndex] {
                if (oldIndex >= _items.size() || newIndex >= _items.size()) {
                    throw std::out_of_range("ThreadSafeCollection::moveAsync index out of range");
                }
                if (oldIndex == newIndex) return;
                T moved = std::move(_items[oldIndex]);
                _items.erase(_items.begin() + static_cast<std::ptrdiff_t>(oldIndex));
                _items.insert(_items.begin() + static_cast<std::ptrdiff_t>(newIndex), moved);
                raise({CollectionChangeAction::Move, {moved}, {std::move(moved)},
                       static_cast<std::ptrdiff_t>(newIndex), static_cast<std::ptrdiff_t>(oldIndex)});
            });
        }

        Concurrency::DispatchHandle clearAsync() {
            return dispatch([this] {
                _items.clear();
                raise({CollectionChangeAction::Reset});
            });
        }

        // UI-context reads

        size_t size() const {
            requireAccess();
            return _items.size();
        }

        bool empty() const {
            requireAccess();
            return _items.empty();
        }

        const T& operator[](size_t index) const {
            requireAccess();
            return _items[index];
        }

        const T& at(size_t index) const {
            requireAccess();
            return _items.at(index);
        }

        const_iterator begin() const {
            requireAccess();
            return _items.begin();
        }

        const_iterator end() const {
            requireAccess();
            return _items.end();
        }

        std::vector<T> snapshot() const {
            requireAccess();
            return _items;
        }

        /// Handlers run on the UI context, after the mutation is applied
        SubscriptionId subscribe(Handler handler) {
            std::lock_guard<std::mutex> lock(_handlersMutex);
            auto id = _nextId++;
            _handlers.emplace(id, std::move(handler));
            return id;
        }

        bool unsubscribe(SubscriptionId id) {
            std::lock_guard<std::mutex> lock(_handlersMutex);
            return _handlers.erase(id) > 0;
        }

        Concurrency::IDispatcher& dispatcher() const noexcept { return _dispatcher; }

    private:
        template<typename Mutation>
        Concurrency::DispatchHandle dispatch(Mutation&& mutation) {
            if (_dispatcher.checkAccess()) {
                Concurrency::AsyncPromise<void> promise;
                Concurrency::fulfill(promise, mutation);
                return promise.handle();
            }
            return _dispatcher.invokeAsync(std::forward<Mutation>(mutation));
        }

        void requireAccess() const {
            if (!_dispatcher.checkAccess()) {
                throw std::logic_error("ThreadSafeCollection read off the UI context");
            }
        }

        void raise(CollectionChange<T> change) {
            std::vector<Handler> handlers;
            {
                std::lock_guard<std::mutex> lock(_handlersMutex);
                handlers.reserve(_handlers.size());
                for (auto& [id, handler] : _handlers) handlers.push_back(handler);
            }
            for (auto& handler : handlers) handler(change);
        }

        Concurrency::IDispatcher& _dispatcher;
        std::vector<T> _items;

        std::mutex _handlersMutex;
        std::map<SubscriptionId, Handler> _handlers;
        SubscriptionId _nextId = 1;
    };

} // namespace Collections
} // namespace Core
} // namespace Cadence
