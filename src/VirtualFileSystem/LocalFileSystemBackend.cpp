/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#include "LocalFileSystemBackend.h"
#include "FileStream.h"
#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <vector>

#if defined(__unix__) || defined(__APPLE__)
#define STEVEDORE_POSIX_FS 1
#include <fcntl.h>
#include <unistd.h>
#endif

namespace Stevedore::Core::IO {

namespace fs = std::filesystem;

namespace {

FileError classifyErrno(int err) {
    switch (err) {
        case 0:             return FileError::IOError;
        case ENOSPC:        return FileError::DiskFull;
        case EACCES:
        case EPERM:         return FileError::AccessDenied;
        case ENOENT:        return FileError::FileNotFound;
        case EEXIST:        return FileError::AlreadyExists;
        case EINVAL:
        case ENAMETOOLONG:
        case EISDIR:
        case ENOTDIR:       return FileError::InvalidPath;
#ifdef STEVEDORE_POSIX_FS
        case EDQUOT:        return FileError::DiskFull;
        case ETIMEDOUT:     return FileError::Timeout;
        case ENETDOWN:
        case ENETUNREACH:   return FileError::NetworkError;
#endif
        default:            return FileError::IOError;
    }
}

FileError classify(const std::error_code& ec) {
    const auto& cat = ec.category();
    if (cat != std::generic_category() && cat != std::system_category()) return FileError::IOError;
    return classifyErrno(ec.value());
}

std::error_code errnoCode(int err) {
    return std::error_code(err, std::generic_category());
}

// FIFOs, sockets and devices never take part in file operations
bool isDeviceLike(const fs::path& p) {
    std::error_code ec;
    const auto st = fs::status(p, ec);
    if (ec) return false;
    switch (st.type()) {
        case fs::file_type::block:
        case fs::file_type::character:
        case fs::file_type::fifo:
        case fs::file_type::socket:
            return true;
        default:
            return false;
    }
}

void fillAccess(const fs::path& p, FileMetadata& meta) {
#ifdef STEVEDORE_POSIX_FS
    meta.readable = ::access(p.c_str(), R_OK) == 0;
    meta.writable = ::access(p.c_str(), W_OK) == 0;
    meta.executable = ::access(p.c_str(), X_OK) == 0;
#else
    std::error_code ec;
    const auto perms = fs::status(p, ec).permissions();
    if (ec) return;
    meta.readable = (perms & fs::perms::owner_read) != fs::perms::none;
    meta.writable = (perms & fs::perms::owner_write) != fs::perms::none;
    meta.executable = (perms & fs::perms::owner_exec) != fs::perms::none;
#endif
}

FileMetadata describe(const fs::path& p) {
    FileMetadata meta;
    meta.path = p.string();

    std::error_code ec;
    const auto st = fs::status(p, ec);
    meta.exists = !ec && fs::exists(st);
    if (!meta.exists) return meta;

    meta.isDirectory = fs::is_directory(st);
    meta.isRegularFile = fs::is_regular_file(st);
    meta.isSymlink = fs::is_symlink(fs::symlink_status(p, ec)) && !ec;
    if (meta.isRegularFile) {
        const auto size = fs::file_size(p, ec);
        meta.size = ec ? 0 : size;
    }
    fillAccess(p, meta);

    const auto written = fs::last_write_time(p, ec);
    if (!ec) {
        const auto offset = written - fs::file_time_type::clock::now();
        meta.lastModified = std::chrono::system_clock::now()
            + std::chrono::duration_cast<std::chrono::system_clock::duration>(offset);
    }
    return meta;
}

std::ios_base::openmode openModeFor(const StreamOptions& options) {
    std::ios_base::openmode mode = std::ios::binary;
    const bool keepContents = options.disposition == StreamOptions::OpenExisting;
    if (options.mode != StreamOptions::Write) mode |= std::ios::in;
    if (options.mode != StreamOptions::Read) {
        mode |= std::ios::out;
        // ios::out without ios::in truncates, so an in-place write also needs ios::in
        mode |= keepContents ? std::ios::in : std::ios::trunc;
    }
    return mode;
}

} // namespace

/**
 * fstream-backed stream. Open failures are latched into _error and make every
 * later read or write fail with the same code.
 */
class LocalFileStream : public FileStream {
public:
    LocalFileStream(std::string path, const StreamOptions& options)
        : _path(std::move(path)), _mode(options.mode) {
        _error = prepare(options);
        if (_error != FileError::None) return;

        errno = 0;
        _file.open(_path, openModeFor(options));
        if (!_file.is_open()) {
            _error = errno == 0 ? FileError::AccessDenied : classifyErrno(errno);
        }
    }

    ~LocalFileStream() override { close(); }

    IoResult read(std::span<std::byte> buffer) override {
        IoResult r;
        if (!usable(r)) return r;
        if (buffer.empty() || _file.eof()) {
            r.complete = true;
            return r;
        }
        _file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        r.bytesTransferred = static_cast<size_t>(_file.gcount());
        r.complete = _file.eof() || r.bytesTransferred == buffer.size();
        if (_file.bad()) {
            _error = FileError::IOError;
            r.error = _error;
        }
        return r;
    }

    IoResult write(std::span<const std::byte> data) override {
        IoResult r;
        if (!usable(r) || !_file.good()) {
            if (!r.error) r.error = FileError::IOError;
            return r;
        }
        errno = 0;
        _file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!_file.good()) {
            _error = classifyErrno(errno);
            r.error = _error;
            return r;
        }
        r.bytesTransferred = data.size();
        r.complete = true;
        return r;
    }

    bool seek(int64_t offset, std::ios_base::seekdir dir) override {
        _file.clear();
        if (_mode != StreamOptions::Write) _file.seekg(offset, dir);
        if (_mode != StreamOptions::Read) _file.seekp(offset, dir);
        return _file.good();
    }

    int64_t tell() const override {
        return static_cast<int64_t>(_mode == StreamOptions::Write ? _file.tellp() : _file.tellg());
    }

    bool good() const override { return _error == FileError::None && _file.good(); }
    bool eof() const override { return _file.eof(); }
    bool fail() const override { return _error != FileError::None || !_file.is_open(); }
    FileError lastError() const override { return _error; }

    void flush() override {
        if (!_file.is_open()) return;
        errno = 0;
        _file.flush();
        if (_file.bad() && _error == FileError::None) _error = classifyErrno(errno);
    }

    void close() override {
        if (_file.is_open()) _file.close();
    }

    std::string path() const override { return _path; }

private:
    FileError prepare(const StreamOptions& options) {
        std::error_code ec;
        const bool present = fs::exists(_path, ec);
        const bool mustExist = options.mode == StreamOptions::Read
            || options.disposition == StreamOptions::OpenExisting;
        if (mustExist && !present) return FileError::FileNotFound;
        if (isDeviceLike(_path)) return FileError::InvalidPath;
        if (present && fs::is_directory(_path, ec)) return FileError::InvalidPath;

        if (options.mode == StreamOptions::Read || options.disposition != StreamOptions::CreateNew) {
            return FileError::None;
        }
#ifdef STEVEDORE_POSIX_FS
        // O_EXCL claims the name; the fstream then reopens the empty file
        const int fd = ::open(_path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
        if (fd < 0) return classifyErrno(errno);
        ::close(fd);
        return FileError::None;
#else
        return present ? FileError::AlreadyExists : FileError::None;
#endif
    }

    bool usable(IoResult& r) const {
        if (_error == FileError::None && _file.is_open()) return true;
        r.error = _error == FileError::None ? FileError::IOError : _error;
        return false;
    }

    mutable std::fstream _file;
    std::string _path;
    StreamOptions::Mode _mode;
    FileError _error = FileError::None;
};

FileOperationHandle LocalFileSystemBackend::submitWork(const std::string& path, const Work& work) {
    auto completion = std::make_shared<FileOperationHandle::Completion>();
    try {
        work(*completion, path);
    } catch (const fs::filesystem_error& e) {
        completion->reject(classify(e.code()), e.what(), path, e.code());
    } catch (const std::bad_alloc&) {
        completion->reject(FileError::Unknown, "Out of memory", path);
    }
    if (!completion->settled()) completion->settle(FileOpStatus::Complete);
    return FileOperationHandle(std::move(completion));
}

FileOperationHandle LocalFileSystemBackend::readFile(const std::string& path, ReadOptions options) {
    return submitWork(path, [options](FileOperationHandle::Completion& c, const std::string& p) {
        std::error_code ec;
        if (!fs::exists(p, ec)) {
            c.reject(FileError::FileNotFound, "File not found", p);
            return;
        }
        if (isDeviceLike(p) || fs::is_directory(p, ec)) {
            c.reject(FileError::InvalidPath, "Not a regular file", p);
            return;
        }

        std::ifstream in(p, std::ios::binary | std::ios::ate);
        if (!in) {
            const int err = errno;
            c.reject(FileError::AccessDenied, "Cannot open file for reading", p, errnoCode(err));
            return;
        }

        const auto total = static_cast<uint64_t>(in.tellg());
        const uint64_t first = std::min(options.offset, total);
        uint64_t want = total - first;
        if (options.length) want = std::min<uint64_t>(want, *options.length);

        c.content.resize(static_cast<size_t>(want));
        in.seekg(static_cast<std::streamoff>(first));
        in.read(reinterpret_cast<char*>(c.content.data()), static_cast<std::streamsize>(want));
        c.content.resize(static_cast<size_t>(in.gcount()));

        const bool shortRead = options.length && c.content.size() < *options.length;
        c.settle(shortRead ? FileOpStatus::Partial : FileOpStatus::Complete);
    });
}

FileOperationHandle LocalFileSystemBackend::writeFile(const std::string& path, std::span<const std::byte> data, WriteOptions options) {
    return submitWork(path, [data, options](FileOperationHandle::Completion& c, const std::string& p) {
        std::error_code ec;
        const bool present = fs::exists(p, ec);
        if (!present && !options.createIfMissing) {
            c.reject(FileError::FileNotFound, "File not found", p);
            return;
        }

        auto mode = std::ios::out | std::ios::binary;
        if (options.append) {
            mode |= std::ios::app;
        } else if (present && !options.truncate) {
            mode |= std::ios::in;
        } else {
            mode |= std::ios::trunc;
        }

        errno = 0;
        std::ofstream out(p, mode);
        if (out) {
            out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
            out.flush();
        }
        if (!out) {
            const int err = errno;
            c.reject(err ? classifyErrno(err) : FileError::AccessDenied, "Write failed", p, errnoCode(err));
            return;
        }
        c.written = data.size();
    });
}

FileOperationHandle LocalFileSystemBackend::deleteFile(const std::string& path) {
    return submitWork(path, [](FileOperationHandle::Completion& c, const std::string& p) {
        std::error_code ec;
        if (!fs::remove(p, ec)) {
            if (ec) c.reject(classify(ec), "Failed to delete file", p, ec);
            else c.reject(FileError::FileNotFound, "File not found", p);
        }
    });
}

FileOperationHandle LocalFileSystemBackend::getMetadata(const std::string& path) {
    return submitWork(path, [](FileOperationHandle::Completion& c, const std::string& p) {
        c.meta = describe(p);
    });
}

bool LocalFileSystemBackend::exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && !ec;
}

FileOperationHandle LocalFileSystemBackend::createDirectory(const std::string& path) {
    return submitWork(path, [](FileOperationHandle::Completion& c, const std::string& p) {
        std::error_code ec;
        if (fs::exists(p, ec)) {
            c.reject(FileError::AlreadyExists, "Entry already exists", p);
            return;
        }
        const fs::path parent = fs::path(p).parent_path();
        if (!parent.empty() && !fs::is_directory(parent, ec)) {
            c.reject(FileError::InvalidPath, "Parent directory does not exist", p);
            return;
        }
        if (!fs::create_directory(p, ec) && ec) {
            c.reject(classify(ec), "Cannot create directory", p, ec);
        }
    });
}

FileOperationHandle LocalFileSystemBackend::removeDirectory(const std::string& path, bool recursive) {
    return submitWork(path, [recursive](FileOperationHandle::Completion& c, const std::string& p) {
        std::error_code ec;
        const auto st = fs::symlink_status(p, ec);
        if (ec || !fs::exists(st)) {
            c.reject(FileError::FileNotFound, "Directory not found", p);
            return;
        }
        if (!fs::is_directory(st)) {
            c.reject(FileError::InvalidPath, "Not a directory", p);
            return;
        }
        if (!recursive && !fs::is_empty(p, ec)) {
            c.reject(FileError::IOError, "Directory not empty", p);
            return;
        }

        if (recursive) fs::remove_all(p, ec);
        else fs::remove(p, ec);
        if (ec) c.reject(classify(ec), "Cannot remove directory", p, ec);
    });
}

FileOperationHandle LocalFileSystemBackend::listDirectory(const std::string& path, ListDirectoryOptions options) {
    return submitWork(path, [options](FileOperationHandle::Completion& c, const std::string& p) {
        std::error_code ec;
        if (!fs::exists(p, ec)) {
            c.reject(FileError::FileNotFound, "Directory not found", p);
            return;
        }
        if (!fs::is_directory(p, ec)) {
            c.reject(FileError::InvalidPath, "Not a directory", p);
            return;
        }

        fs::directory_iterator it(p, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
            const fs::path& child = it->path();
            std::string name = child.filename().string();
            if (!options.includeHidden && name.front() == '.') continue;
            c.listing.push_back(DirectoryEntry{std::move(name), child.string(), describe(child)});
        }
        if (ec) {
            c.listing.clear();
            c.reject(classify(ec), "Cannot iterate directory", p, ec);
            return;
        }

        if (options.sortByName) {
            std::sort(c.listing.begin(), c.listing.end(),
                      [](const DirectoryEntry& a, const DirectoryEntry& b) { return a.name < b.name; });
        }
    });
}

std::unique_ptr<FileStream> LocalFileSystemBackend::openStream(const std::string& path, StreamOptions options) {
    return std::make_unique<LocalFileStream>(path, options);
}

FileOperationHandle LocalFileSystemBackend::moveFile(const std::string& src, const std::string& dst, bool overwriteExisting) {
    return submitWork(src, [dst, overwriteExisting](FileOperationHandle::Completion& c, const std::string& from) {
        std::error_code ec;
        if (!fs::exists(from, ec)) {
            c.reject(FileError::FileNotFound, "Source not found", from);
            return;
        }
        if (fs::exists(dst, ec)) {
            if (!overwriteExisting) {
                c.reject(FileError::AlreadyExists, "Destination already exists", dst);
                return;
            }
            fs::remove_all(dst, ec);
            if (ec) {
                c.reject(classify(ec), "Cannot remove existing destination", dst, ec);
                return;
            }
        }

        const bool directory = fs::is_directory(from, ec);
        const uintmax_t size = directory ? 0 : fs::file_size(from, ec);
        const uint64_t moved = ec ? 0 : size;

        ec.clear();
        fs::rename(from, dst, ec);
        if (!ec) {
            c.written = moved;
            return;
        }

        // EXDEV and friends: fall back to copy then remove
        ec.clear();
        if (directory) fs::copy(from, dst, fs::copy_options::recursive, ec);
        else fs::copy_file(from, dst, ec);
        if (ec) {
            c.reject(classify(ec), "Copy failed during move", from, ec);
            return;
        }

        c.written = moved;
        fs::remove_all(from, ec);
        if (ec) {
            c.note(FileError::IOError, "Source deletion failed after copy", from, ec);
            c.settle(FileOpStatus::Partial);
        }
    });
}

BackendCapabilities LocalFileSystemBackend::getCapabilities() const {
    // Every capability the engine asks for is available on the host filesystem
    return BackendCapabilities{};
}

} // namespace Stevedore::Core::IO
