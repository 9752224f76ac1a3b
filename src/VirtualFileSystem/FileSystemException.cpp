/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#include "FileSystemException.h"

namespace Stevedore::Core::IO {

namespace {
    std::string composeMessage(FileError code, const std::string& message, const std::string& path) {
        std::string out = toString(code);
        if (!message.empty()) out += ": " + message;
        if (!path.empty()) out += " (" + path + ")";
        return out;
    }
}

FileSystemException::FileSystemException(FileError code, const std::string& message, std::string path,
                                         std::optional<std::error_code> systemError)
    : std::runtime_error(composeMessage(code, message, path))
    , _code(code)
    , _path(std::move(path))
    , _systemError(systemError) {}

FileSystemException FileSystemException::fromErrorInfo(const FileErrorInfo& info) {
    return FileSystemException(info.code == FileError::None ? FileError::Unknown : info.code,
                               info.message, info.path, info.systemError);
}

void throwIfFailed(const FileOperationHandle& handle, const std::string& what) {
    handle.wait();
    switch (handle.status()) {
        case FileOpStatus::Complete:
            return;
        case FileOpStatus::Partial:
            // Short reads are Partial without an error; a Partial move or write carries one
            if (handle.errorInfo().code == FileError::None) return;
            break;
        case FileOpStatus::Pending:
            // A default-constructed handle means the backend did not run anything
            throw FileSystemException(FileError::NotSupported, what + " is not supported by this backend");
        default:
            break;
    }
    FileErrorInfo info = handle.errorInfo();
    if (info.message.empty()) info.message = what + " failed";
    throw FileSystemException::fromErrorInfo(info);
}

} // namespace Stevedore::Core::IO
