/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace Stevedore::Core::IO {

/// Partial: the call did part of its work (short read, move whose source could not be removed)
enum class FileOpStatus { Pending, Complete, Partial, Failed };

/**
 * Failure reasons reported by backends and streams.
 *
 * DiskFull covers ENOSPC/EDQUOT, a backend quota and a write that could not
 * obtain a buffer. InvalidPath covers malformed names, a missing parent and
 * using a directory where a file is required. A non-empty directory that was
 * not removed recursively is IOError. AlreadyExists is any destination
 * collision.
 */
enum class FileError {
    None = 0,
    FileNotFound,
    AccessDenied,
    DiskFull,
    InvalidPath,
    IOError,
    NetworkError,
    Timeout,
    Conflict,
    AlreadyExists,
    NotSupported,
    Unknown
};

const char* toString(FileError code) noexcept;

struct FileErrorInfo {
    FileError code = FileError::None;
    std::string message;
    std::string path;
    std::optional<std::error_code> systemError;
};

struct FileMetadata {
    std::string path;
    bool exists = false;
    bool isDirectory = false;
    bool isRegularFile = false;
    bool isSymlink = false;
    bool isPackageMount = false;
    uintmax_t size = 0;
    bool readable = false;
    bool writable = false;
    bool executable = false;
    std::optional<std::chrono::system_clock::time_point> lastModified;
};

struct DirectoryEntry {
    std::string name;           ///< Leaf name only
    std::string fullPath;       ///< Path the listing backend accepts back
    FileMetadata metadata;
};

/**
 * @brief Result of one backend call
 *
 * A handle shares a Completion with the backend that produced it. Accessors
 * block in wait() until the backend settles the completion; the shipped
 * backends settle before returning, so waiting never actually parks.
 * A default-constructed handle is Pending and all accessors return empties.
 */
class FileOperationHandle {
public:
    FileOperationHandle() = default;

    void wait() const;
    FileOpStatus status() const noexcept;

    std::span<const std::byte> contentsBytes() const;
    uint64_t bytesWritten() const;
    const std::optional<FileMetadata>& metadata() const;
    const std::vector<DirectoryEntry>& directoryEntries() const;
    const FileErrorInfo& errorInfo() const;

    /// Backend side of a handle
    class Completion {
    public:
        std::vector<std::byte> content;
        uint64_t written = 0;
        std::optional<FileMetadata> meta;
        std::vector<DirectoryEntry> listing;

        bool settled() const noexcept { return _settled.load(std::memory_order_acquire); }

        void settle(FileOpStatus outcome) noexcept;

        // Records an error without settling; used with Partial outcomes
        void note(FileError code, std::string message, std::string path,
                  std::optional<std::error_code> ec = std::nullopt);

        void reject(FileError code, std::string message, std::string path,
                    std::optional<std::error_code> ec = std::nullopt) {
            note(code, std::move(message), std::move(path), ec);
            settle(FileOpStatus::Failed);
        }

    private:
        friend class FileOperationHandle;

        std::atomic<FileOpStatus> _outcome{FileOpStatus::Pending};
        std::atomic<bool> _settled{false};
        FileErrorInfo _error;
        mutable std::mutex _mutex;
        mutable std::condition_variable _cv;
    };

    explicit FileOperationHandle(std::shared_ptr<Completion> completion)
        : _completion(std::move(completion)) {}

private:
    std::shared_ptr<Completion> _completion;
};

} // namespace Stevedore::Core::IO
