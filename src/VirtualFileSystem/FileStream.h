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
#include <cstdint>
#include <ios>
#include <optional>
#include <span>
#include <string>
#include "FileOperationHandle.h"

namespace Stevedore::Core::IO {

struct IoResult {
    size_t bytesTransferred = 0;
    bool complete = false;          ///< Request fully served (or end of stream reached)
    std::optional<FileError> error;

    bool success() const { return !error.has_value(); }
};

/**
 * @brief Sequential byte stream opened by a backend
 *
 * A stream that failed to open still exists: fail() is true and lastError()
 * gives the reason. read() returning zero bytes without an error means end of
 * stream. Destroying a stream closes it.
 */
class FileStream {
public:
    virtual ~FileStream() = default;

    virtual IoResult read(std::span<std::byte> buffer) = 0;
    virtual IoResult write(std::span<const std::byte> data) = 0;

    virtual bool seek(int64_t offset, std::ios_base::seekdir dir = std::ios_base::beg) = 0;
    virtual int64_t tell() const = 0;

    virtual bool good() const = 0;
    virtual bool eof() const = 0;
    virtual bool fail() const = 0;
    virtual FileError lastError() const { return fail() ? FileError::IOError : FileError::None; }

    virtual void flush() = 0;
    virtual void close() = 0;

    virtual std::string path() const { return {}; }
};

} // namespace Stevedore::Core::IO
