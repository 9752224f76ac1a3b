/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

#include "FileOperationHandle.h"

namespace Stevedore::Core::IO {

/**
 * @brief Exception form of FileErrorInfo
 *
 * Thrown by the operation layer when a backend call fails. Callers branch on
 * code() rather than on derived types.
 */
class FileSystemException : public std::runtime_error {
public:
    FileSystemException(FileError code, const std::string& message, std::string path = {},
                        std::optional<std::error_code> systemError = std::nullopt);

    static FileSystemException fromErrorInfo(const FileErrorInfo& info);

    FileError code() const noexcept { return _code; }
    const std::string& path() const noexcept { return _path; }
    const std::optional<std::error_code>& systemError() const noexcept { return _systemError; }

    bool isNotFound() const noexcept { return _code == FileError::FileNotFound; }
    bool isAlreadyExists() const noexcept { return _code == FileError::AlreadyExists; }

private:
    FileError _code;
    std::string _path;
    std::optional<std::error_code> _systemError;
};

/**
 * @brief Waits for a handle and throws FileSystemException unless it completed
 * @param handle Backend result
 * @param what Short description of the call, used when the backend left no message
 * @throws FileSystemException carrying the handle's error info (NotSupported for an unstarted handle)
 */
void throwIfFailed(const FileOperationHandle& handle, const std::string& what);

} // namespace Stevedore::Core::IO
