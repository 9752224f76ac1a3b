/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#include "FileOperationHandle.h"
#include <array>

namespace Stevedore::Core::IO {

namespace {
    constexpr std::array<const char*, 12> kFileErrorNames = {
        "None", "FileNotFound", "AccessDenied", "DiskFull", "InvalidPath", "IOError",
        "NetworkError", "Timeout", "Conflict", "AlreadyExists", "NotSupported", "Unknown"
    };

    const FileErrorInfo kNoError{};
    const std::optional<FileMetadata> kNoMetadata{};
    const std::vector<DirectoryEntry> kNoEntries{};
}

const char* toString(FileError code) noexcept {
    const auto index = static_cast<size_t>(code);
    return index < kFileErrorNames.size() ? kFileErrorNames[index] : "Unknown";
}

void FileOperationHandle::Completion::settle(FileOpStatus outcome) noexcept {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _outcome.store(outcome, std::memory_order_release);
        _settled.store(true, std::memory_order_release);
    }
    _cv.notify_all();
}

void FileOperationHandle::Completion::note(FileError code, std::string message, std::string path,
                                           std::optional<std::error_code> ec) {
    _error.code = code;
    _error.message = std::move(message);
    _error.path = std::move(path);
    _error.systemError = ec;
}

void FileOperationHandle::wait() const {
    if (!_completion || _completion->settled()) return;
    std::unique_lock<std::mutex> lock(_completion->_mutex);
    _completion->_cv.wait(lock, [c = _completion.get()] { return c->settled(); });
}

FileOpStatus FileOperationHandle::status() const noexcept {
    if (!_completion) return FileOpStatus::Pending;
    return _completion->_outcome.load(std::memory_order_acquire);
}

std::span<const std::byte> FileOperationHandle::contentsBytes() const {
    if (!_completion) return {};
    wait();
    return _completion->content;
}

uint64_t FileOperationHandle::bytesWritten() const {
    if (!_completion) return 0;
    wait();
    return _completion->written;
}

const std::optional<FileMetadata>& FileOperationHandle::metadata() const {
    if (!_completion) return kNoMetadata;
    wait();
    return _completion->meta;
}

const std::vector<DirectoryEntry>& FileOperationHandle::directoryEntries() const {
    if (!_completion) return kNoEntries;
    wait();
    return _completion->listing;
}

const FileErrorInfo& FileOperationHandle::errorInfo() const {
    if (!_completion) return kNoError;
    wait();
    return _completion->_error;
}

} // namespace Stevedore::Core::IO
