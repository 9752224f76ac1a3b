/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <span>

namespace Stevedore::Core::Memory {

class IBlockPool;

/**
 * @brief Fixed-size byte buffer handed out by an IBlockPool
 *
 * A Block is move-only and carries exclusive ownership of its storage. The
 * holder must either give it back with IBlockPool::returnBlock() or take the
 * storage permanently with IBlockPool::disconnect(). Destroying a live Block
 * frees its memory but leaks a slot of the owning pool's capacity; use
 * BlockLease where an exit path could otherwise skip the return.
 */
class Block {
public:
    Block() = default;
    Block(Block&& other) noexcept
        : _data(std::move(other._data)), _size(other._size), _owner(other._owner) {
        other._size = 0;
        other._owner = nullptr;
    }
    Block& operator=(Block&& other) noexcept {
        if (this != &other) {
            _data = std::move(other._data);
            _size = other._size;
            _owner = other._owner;
            other._size = 0;
            other._owner = nullptr;
        }
        return *this;
    }
    Block(const Block&) = delete;
    Block& operator=(const Block&) = delete;

    std::byte* data() noexcept { return _data.get(); }
    const std::byte* data() const noexcept { return _data.get(); }
    size_t size() const noexcept { return _size; }

    std::span<std::byte> bytes() noexcept { return {_data.get(), _size}; }
    std::span<const std::byte> bytes() const noexcept { return {_data.get(), _size}; }

    bool empty() const noexcept { return !_data; }
    explicit operator bool() const noexcept { return static_cast<bool>(_data); }

    // Pool that issued this block (nullptr once moved-from)
    const IBlockPool* owner() const noexcept { return _owner; }

private:
    friend class IBlockPool;

    Block(std::unique_ptr<std::byte[]> data, size_t size, const IBlockPool* owner) noexcept
        : _data(std::move(data)), _size(size), _owner(owner) {}

    std::unique_ptr<std::byte[]> _data;
    size_t _size = 0;
    const IBlockPool* _owner = nullptr;
};

} // namespace Stevedore::Core::Memory
