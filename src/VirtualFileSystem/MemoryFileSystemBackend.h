/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#pragma once
#include "IFileSystemBackend.h"
#include <cstdint>
#include <functional>
#include <memory>

namespace Stevedore::Core::IO {

class MemoryFileStream;

/**
 * @brief In-memory backend holding a tree of directories and files
 *
 * Paths are '/'-separated and relative to the backend root; "" (or "/") names
 * the root itself. Leading, trailing and repeated separators are ignored, and
 * "." or ".." segments are rejected with InvalidPath.
 *
 * Stored bytes are charged against Config::maxSpace in whole blocks of
 * Config::blockSize. A write that would exceed the quota fails with DiskFull
 * and leaves the file as it was before that write.
 *
 * All members are thread-safe; one mutex guards the tree. Streams opened on
 * a file keep working on that file's node even if it is later moved, and fail
 * with IOError once it has been deleted.
 *
 * @code
 * MemoryFileSystemBackend mem({.blockSize = 512, .maxSpace = 4096});
 * mem.createDirectory("docs").wait();
 * auto w = mem.openStream("docs/a.bin", {StreamOptions::Write, StreamOptions::CreateNew});
 * @endcode
 */
class MemoryFileSystemBackend : public IFileSystemBackend {
public:
    struct Config {
        size_t blockSize = 1024;            ///< Accounting granularity for stored bytes
        uint64_t maxSpace = UINT64_MAX;     ///< Quota over all stored bytes (rounded up per file)
    };

    MemoryFileSystemBackend();
    explicit MemoryFileSystemBackend(Config config);
    ~MemoryFileSystemBackend() override;

    MemoryFileSystemBackend(const MemoryFileSystemBackend&) = delete;
    MemoryFileSystemBackend& operator=(const MemoryFileSystemBackend&) = delete;

    // Core file operations
    FileOperationHandle readFile(const std::string& path, ReadOptions options = {}) override;
    FileOperationHandle writeFile(const std::string& path, std::span<const std::byte> data, WriteOptions options = {}) override;
    FileOperationHandle deleteFile(const std::string& path) override;

    // Metadata operations
    FileOperationHandle getMetadata(const std::string& path) override;
    bool exists(const std::string& path) override;

    // Directory operations
    FileOperationHandle createDirectory(const std::string& path) override;
    FileOperationHandle removeDirectory(const std::string& path, bool recursive = false) override;
    FileOperationHandle listDirectory(const std::string& path, ListDirectoryOptions options = {}) override;

    std::unique_ptr<FileStream> openStream(const std::string& path, StreamOptions options = {}) override;

    FileOperationHandle moveFile(const std::string& src, const std::string& dst, bool overwriteExisting = false) override;

    BackendCapabilities getCapabilities() const override;

    /**
     * @brief Flags a directory as auto-mounted package content
     * @return false if path is not an existing directory
     */
    bool markPackageMount(const std::string& path, bool mounted = true);

    // Bytes currently charged against the quota
    uint64_t usedSpace() const;
    const Config& config() const noexcept { return _config; }

private:
    struct Node;
    struct Storage;

    FileOperationHandle submitWork(const std::string& path,
                                   const std::function<void(FileOperationHandle::Completion&, const std::string&)>& work);

    Config _config;
    std::shared_ptr<Storage> _storage;

    friend class MemoryFileStream;
};

} // namespace Stevedore::Core::IO
