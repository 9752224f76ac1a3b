/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

/**
 * @file IFileSystemBackend.h
 * @brief Storage abstraction the operations run against
 *
 * Operations only ever talk to IFileSystemBackend. Before touching a backend
 * they consult getCapabilities(); a missing capability fails the operation
 * with FileError::NotSupported. Paths are opaque strings in the backend's own
 * namespace.
 */
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include "FileOperationHandle.h"

namespace Stevedore::Core::IO {

class FileStream;

struct ReadOptions {
    uint64_t offset = 0;
    std::optional<size_t> length;       ///< Unset reads to end of file
};

struct WriteOptions {
    bool append = false;
    bool createIfMissing = true;
    bool truncate = true;               ///< Ignored when append is set
};

struct StreamOptions {
    enum Mode { Read, Write, ReadWrite };

    /**
     * OpenExisting fails with FileNotFound when nothing is there. Create
     * truncates or creates. CreateNew fails with AlreadyExists on a collision.
     * Read streams always behave as OpenExisting.
     */
    enum Disposition { OpenExisting, Create, CreateNew };

    Mode mode = Read;
    Disposition disposition = OpenExisting;
};

/**
 * What a backend can do. When supportsGetEntry is false the operations skip
 * their existence and collision checks and find out at run time instead.
 */
struct BackendCapabilities {
    bool supportsOpen = true;
    bool supportsBrowse = true;
    bool supportsGetEntry = true;
    bool supportsDelete = true;
    bool supportsMove = true;
    bool supportsCreateDirectory = true;
    bool supportsCreateFile = true;
};

struct ListDirectoryOptions {
    bool includeHidden = true;
    bool sortByName = true;             ///< Keeps tree traversal deterministic
};

class IFileSystemBackend {
public:
    virtual ~IFileSystemBackend() = default;

    virtual FileOperationHandle readFile(const std::string& path, ReadOptions options = {}) = 0;

    /// Fails with DiskFull when the backend runs out of space; the file is left as before
    virtual FileOperationHandle writeFile(const std::string& path, std::span<const std::byte> data, WriteOptions options = {}) = 0;

    /// FileNotFound when nothing is at path
    virtual FileOperationHandle deleteFile(const std::string& path) = 0;

    /// Never fails for a missing path; metadata()->exists is false instead
    virtual FileOperationHandle getMetadata(const std::string& path) = 0;
    virtual bool exists(const std::string& path) = 0;

    /**
     * @brief Creates exactly one directory
     *
     * The parent must exist (InvalidPath otherwise) and nothing may be at
     * path yet (AlreadyExists otherwise).
     */
    virtual FileOperationHandle createDirectory(const std::string& path) = 0;

    /// Non-recursive removal of a non-empty directory fails with IOError
    virtual FileOperationHandle removeDirectory(const std::string& path, bool recursive = false) = 0;

    /**
     * @brief Lists the immediate children of a directory
     *
     * Each DirectoryEntry::fullPath can be handed back to this backend.
     */
    virtual FileOperationHandle listDirectory(const std::string& path, ListDirectoryOptions options = {}) = 0;

    /// Always returns a stream; check fail() and lastError() for open errors
    virtual std::unique_ptr<FileStream> openStream(const std::string& path, StreamOptions options = {}) = 0;

    /// Renames within this backend. An existing dst is AlreadyExists unless overwriteExisting
    virtual FileOperationHandle moveFile(const std::string& src, const std::string& dst, bool overwriteExisting = false) = 0;

    virtual BackendCapabilities getCapabilities() const = 0;
};

} // namespace Stevedore::Core::IO
