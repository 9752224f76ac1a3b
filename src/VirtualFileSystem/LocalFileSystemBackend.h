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
#include <functional>

namespace Stevedore::Core::IO {

/**
 * @brief Host filesystem backend built on std::filesystem and fstream
 *
 * Paths go to the OS untouched, so relative paths resolve against the
 * process working directory. Calls execute on the caller's thread and hand
 * back settled handles. A move falls back to copy and remove when rename
 * cannot cross devices; if the remove then fails the handle is Partial.
 */
class LocalFileSystemBackend : public IFileSystemBackend {
public:
    FileOperationHandle readFile(const std::string& path, ReadOptions options = {}) override;
    FileOperationHandle writeFile(const std::string& path, std::span<const std::byte> data, WriteOptions options = {}) override;
    FileOperationHandle deleteFile(const std::string& path) override;
    FileOperationHandle getMetadata(const std::string& path) override;
    bool exists(const std::string& path) override;

    FileOperationHandle createDirectory(const std::string& path) override;
    FileOperationHandle removeDirectory(const std::string& path, bool recursive = false) override;
    FileOperationHandle listDirectory(const std::string& path, ListDirectoryOptions options = {}) override;

    std::unique_ptr<FileStream> openStream(const std::string& path, StreamOptions options = {}) override;
    FileOperationHandle moveFile(const std::string& src, const std::string& dst, bool overwriteExisting = false) override;

    BackendCapabilities getCapabilities() const override;

private:
    using Work = std::function<void(FileOperationHandle::Completion&, const std::string&)>;

    // Filesystem exceptions escaping work become a rejected completion
    FileOperationHandle submitWork(const std::string& path, const Work& work);
};

} // namespace Stevedore::Core::IO
