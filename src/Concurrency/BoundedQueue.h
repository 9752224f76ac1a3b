/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

/**
 * @file BoundedQueue.h
 * @brief Closable FIFO hand-off queue with blocking push/pop
 *
 * Connects one producer thread to one consumer thread (more are allowed).
 * push() blocks while the queue is full, pop() blocks while it is empty.
 * close() wakes everybody: later pushes fail and hand the item back to the
 * caller untouched, pops keep draining what is left and then return nullopt.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace Stevedore::Core::Concurrency {

template<typename T>
class BoundedQueue {
public:
    /**
     * @param capacity Maximum queued items; 0 means unbounded
     */
    explicit BoundedQueue(size_t capacity = 0) : _capacity(capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * @brief Appends an item, waiting for room if the queue is full
     * @return false if the queue was closed; the item is left with the caller
     */
    [[nodiscard]] bool push(T&& item) {
        {
            std::unique_lock<std::mutex> lock(_mutex);
            _notFull.wait(lock, [this] { return _closed || _capacity == 0 || _items.size() < _capacity; });
            if (_closed) return false;
            _items.push_back(std::move(item));
        }
        _notEmpty.notify_one();
        return true;
    }

    /**
     * @brief Removes the oldest item, waiting while the queue is empty
     * @return The item, or std::nullopt once the queue is closed and empty
     */
    [[nodiscard]] std::optional<T> pop() {
        std::optional<T> out;
        {
            std::unique_lock<std::mutex> lock(_mutex);
            _notEmpty.wait(lock, [this] { return _closed || !_items.empty(); });
            if (_items.empty()) return std::nullopt;
            out.emplace(std::move(_items.front()));
            _items.pop_front();
        }
        _notFull.notify_one();
        return out;
    }

    [[nodiscard]] std::optional<T> tryPop() {
        std::optional<T> out;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_items.empty()) return std::nullopt;
            out.emplace(std::move(_items.front()));
            _items.pop_front();
        }
        _notFull.notify_one();
        return out;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _closed = true;
        }
        _notEmpty.notify_all();
        _notFull.notify_all();
    }

    // Removes and returns everything currently queued
    [[nodiscard]] std::vector<T> drain() {
        std::vector<T> out;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            out.reserve(_items.size());
            for (auto& item : _items) out.push_back(std::move(item));
            _items.clear();
        }
        _notFull.notify_all();
        return out;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _closed;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _items.size();
    }

    size_t capacity() const noexcept { return _capacity; }

private:
    mutable std::mutex _mutex;
    std::condition_variable _notEmpty;
    std::condition_variable _notFull;
    std::deque<T> _items;
    size_t _capacity;
    bool _closed = false;
};

} // namespace Stevedore::Core::Concurrency
