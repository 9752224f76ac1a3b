/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#include "MemoryFileSystemBackend.h"
#include "FileStream.h"
#include "../Logging/Logger.h"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <map>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace Stevedore::Core::IO {

struct MemoryFileSystemBackend::Node {
    bool isDirectory = false;
    bool isPackageMount = false;
    bool unlinked = false;                  // Removed from the tree; open streams must stop
    std::vector<std::byte> data;
    std::map<std::string, std::shared_ptr<Node>> children;
    std::chrono::system_clock::time_point lastModified = std::chrono::system_clock::now();
};

struct MemoryFileSystemBackend::Storage {
    mutable std::mutex mutex;
    std::shared_ptr<Node> root = std::make_shared<Node>();
    size_t blockSize;
    uint64_t maxSpace;
    uint64_t used = 0;

    Storage(size_t bs, uint64_t max) : blockSize(bs), maxSpace(max) {
        root->isDirectory = true;
    }

    // Splits a backend path into segments; false for "." / ".." segments
    static bool split(const std::string& path, std::vector<std::string>& out) {
        out.clear();
        size_t start = 0;
        while (start <= path.size()) {
            size_t end = path.find('/', start);
            if (end == std::string::npos) end = path.size();
            if (end > start) {
                std::string seg = path.substr(start, end - start);
                if (seg == "." || seg == "..") return false;
                out.push_back(std::move(seg));
            }
            start = end + 1;
        }
        return true;
    }

    static std::string join(const std::vector<std::string>& parts, size_t count) {
        std::string out;
        for (size_t i = 0; i < count; ++i) {
            if (i) out += '/';
            out += parts[i];
        }
        return out;
    }

    std::shared_ptr<Node> find(const std::vector<std::string>& parts, size_t count) const {
        std::shared_ptr<Node> cur = root;
        for (size_t i = 0; i < count; ++i) {
            if (!cur->isDirectory) return nullptr;
            auto it = cur->children.find(parts[i]);
            if (it == cur->children.end()) return nullptr;
            cur = it->second;
        }
        return cur;
    }

    std::shared_ptr<Node> find(const std::vector<std::string>& parts) const {
        return find(parts, parts.size());
    }

    std::shared_ptr<Node> parentOf(const std::vector<std::string>& parts) const {
        if (parts.empty()) return nullptr;
        auto parent = find(parts, parts.size() - 1);
        return (parent && parent->isDirectory) ? parent : nullptr;
    }

    uint64_t charge(uint64_t size) const {
        return ((size + blockSize - 1) / blockSize) * blockSize;
    }

    bool fits(uint64_t oldSize, uint64_t newSize) const {
        const uint64_t oldCharge = charge(oldSize);
        const uint64_t newCharge = charge(newSize);
        return newCharge <= oldCharge || newCharge - oldCharge <= maxSpace - used;
    }

    // Resizes file data, keeping the quota; false leaves the node untouched
    bool resize(Node& node, uint64_t newSize) {
        if (!fits(node.data.size(), newSize)) return false;
        used = used - charge(node.data.size()) + charge(newSize);
        node.data.resize(static_cast<size_t>(newSize));
        node.lastModified = std::chrono::system_clock::now();
        return true;
    }

    void release(Node& node) {
        node.unlinked = true;
        if (node.isDirectory) {
            for (auto& [name, child] : node.children) release(*child);
            node.children.clear();
        } else {
            used -= charge(node.data.size());
            node.data.clear();
            node.data.shrink_to_fit();
        }
    }

    FileMetadata metadataFor(const Node& node, const std::string& path) const {
        FileMetadata meta;
        meta.path = path;
        meta.exists = true;
        meta.isDirectory = node.isDirectory;
        meta.isRegularFile = !node.isDirectory;
        meta.isPackageMount = node.isPackageMount;
        meta.size = node.isDirectory ? 0 : node.data.size();
        meta.readable = true;
        meta.writable = true;
        meta.executable = node.isDirectory;
        meta.lastModified = node.lastModified;
        return meta;
    }
};

// Stream over one file node; position is private to the stream
class MemoryFileStream : public FileStream {
public:
    MemoryFileStream(std::shared_ptr<MemoryFileSystemBackend::Storage> storage,
                     std::shared_ptr<MemoryFileSystemBackend::Node> node,
                     std::string path, StreamOptions::Mode mode, FileError error)
        : _storage(std::move(storage)), _node(std::move(node)), _path(std::move(path))
        , _mode(mode), _error(error) {}

    IoResult read(std::span<std::byte> buffer) override {
        IoResult result;
        if (!checkUsable(result)) return result;
        if (_mode == StreamOptions::Write) {
            result.error = FileError::AccessDenied;
            return result;
        }

        std::lock_guard<std::mutex> lock(_storage->mutex);
        if (_node->unlinked) {
            _error = FileError::IOError;
            result.error = _error;
            return result;
        }
        const uint64_t size = _node->data.size();
        const uint64_t available = _position < size ? size - _position : 0;
        const size_t count = static_cast<size_t>(std::min<uint64_t>(available, buffer.size()));
        if (count > 0) {
            std::memcpy(buffer.data(), _node->data.data() + _position, count);
            _position += count;
        }
        _eof = count < buffer.size();
        result.bytesTransferred = count;
        result.complete = true;
        return result;
    }

    IoResult write(std::span<const std::byte> data) override {
        IoResult result;
        if (!checkUsable(result)) return result;
        if (_mode == StreamOptions::Read) {
            result.error = FileError::AccessDenied;
            return result;
        }
        if (data.empty()) {
            result.complete = true;
            return result;
        }

        std::lock_guard<std::mutex> lock(_storage->mutex);
        if (_node->unlinked) {
            _error = FileError::IOError;
            result.error = _error;
            return result;
        }
        const uint64_t end = _position + data.size();
        if (end > _node->data.size() && !_storage->resize(*_node, end)) {
            _error = FileError::DiskFull;
            result.error = _error;
            return result;
        }
        std::memcpy(_node->data.data() + _position, data.data(), data.size());
        _node->lastModified = std::chrono::system_clock::now();
        _position = end;
        result.bytesTransferred = data.size();
        result.complete = true;
        return result;
    }

    bool seek(int64_t offset, std::ios_base::seekdir dir) override {
        if (fail()) return false;
        int64_t base = 0;
        if (dir == std::ios_base::cur) {
            base = static_cast<int64_t>(_position);
        } else if (dir == std::ios_base::end) {
            std::lock_guard<std::mutex> lock(_storage->mutex);
            base = static_cast<int64_t>(_node->data.size());
        }
        if (base + offset < 0) return false;
        _position = static_cast<uint64_t>(base + offset);
        _eof = false;
        return true;
    }

    int64_t tell() const override { return fail() ? -1 : static_cast<int64_t>(_position); }
    bool good() const override { return !fail() && !_eof; }
    bool eof() const override { return _eof; }
    bool fail() const override { return _error != FileError::None || !_node; }
    FileError lastError() const override { return _error; }
    void flush() override {}
    void close() override { _node.reset(); }
    std::string path() const override { return _path; }

private:
    bool checkUsable(IoResult& result) {
        if (_error != FileError::None) {
            result.error = _error;
            return false;
        }
        if (!_node) {
            result.error = FileError::IOError;
            return false;
        }
        return true;
    }

    std::shared_ptr<MemoryFileSystemBackend::Storage> _storage;
    std::shared_ptr<MemoryFileSystemBackend::Node> _node;
    std::string _path;
    StreamOptions::Mode _mode;
    FileError _error;
    uint64_t _position = 0;
    bool _eof = false;
};

MemoryFileSystemBackend::MemoryFileSystemBackend() : MemoryFileSystemBackend(Config{}) {}

MemoryFileSystemBackend::MemoryFileSystemBackend(Config config)
    : _config(config) {
    if (_config.blockSize == 0) {
        throw std::invalid_argument("MemoryFileSystemBackend blockSize must be non-zero");
    }
    _storage = std::make_shared<Storage>(_config.blockSize, _config.maxSpace);
}

MemoryFileSystemBackend::~MemoryFileSystemBackend() = default;

FileOperationHandle MemoryFileSystemBackend::submitWork(const std::string& path,
    const std::function<void(FileOperationHandle::Completion&, const std::string&)>& work) {

    auto state = std::make_shared<FileOperationHandle::Completion>();
    try {
        work(*state, path);
    } catch (const std::bad_alloc&) {
        state->reject(FileError::DiskFull, "Out of memory", path);
    } catch (const std::length_error& e) {
        state->reject(FileError::DiskFull, e.what(), path);
    }
    if (!state->settled()) {
        state->settle(FileOpStatus::Complete);
    }
    return FileOperationHandle(state);
}

FileOperationHandle MemoryFileSystemBackend::readFile(const std::string& path, ReadOptions options) {
    return submitWork(path, [this, options](FileOperationHandle::Completion& s, const std::string& p) {
        std::vector<std::string> parts;
        if (!Storage::split(p, parts)) {
            s.reject(FileError::InvalidPath, "Invalid path", p);
            return;
        }

        std::lock_guard<std::mutex> lock(_storage->mutex);
        auto node = _storage->find(parts);
        if (!node) {
            s.reject(FileError::FileNotFound, "File not found", p);
            return;
        }
        if (node->isDirectory) {
            s.reject(FileError::InvalidPath, "Path is a directory", p);
            return;
        }

        const uint64_t size = node->data.size();
        const uint64_t start = std::min(options.offset, size);
        size_t count = static_cast<size_t>(size - start);
        if (options.length.has_value()) count = std::min(count, *options.length);

        s.content.assign(node->data.begin() + static_cast<std::ptrdiff_t>(start),
                       node->data.begin() + static_cast<std::ptrdiff_t>(start + count));
        const bool shortRead = options.length.has_value() && count < *options.length;
        s.settle(shortRead ? FileOpStatus::Partial : FileOpStatus::Complete);
    });
}

FileOperationHandle MemoryFileSystemBackend::writeFile(const std::string& path, std::span<const std::byte> data, WriteOptions options) {
    return submitWork(path, [this, data, options](FileOperationHandle::Completion& s, const std::string& p) {
        std::vector<std::string> parts;
        if (!Storage::split(p, parts) || parts.empty()) {
            s.reject(FileError::InvalidPath, "Invalid path", p);
            return;
        }

        std::lock_guard<std::mutex> lock(_storage->mutex);
        auto parent = _storage->parentOf(parts);
        if (!parent) {
            s.reject(FileError::InvalidPath, "Parent directory does not exist", p);
            return;
        }

        auto it = parent->children.find(parts.back());
        std::shared_ptr<Node> node;
        bool created = false;
        if (it == parent->children.end()) {
            if (!options.createIfMissing) {
                s.reject(FileError::FileNotFound, "File not found", p);
                return;
            }
            node = std::make_shared<Node>();
            created = true;
        } else {
            node = it->second;
            if (node->isDirectory) {
                s.reject(FileError::InvalidPath, "Path is a directory", p);
                return;
            }
        }

        const uint64_t offset = options.append ? node->data.size() : 0;
        uint64_t newSize = offset + data.size();
        if (!options.append && !options.truncate) newSize = std::max<uint64_t>(newSize, node->data.size());

        if (!_storage->resize(*node, newSize)) {
            s.reject(FileError::DiskFull, "Not enough space", p);
            return;
        }
        if (!data.empty()) {
            std::memcpy(node->data.data() + offset, data.data(), data.size());
        }
        if (created) parent->children.emplace(parts.back(), node);

        s.written = data.size();
        s.settle(FileOpStatus::Complete);
    });
}

FileOperationHandle MemoryFileSystemBackend::deleteFile(const std::string& path) {
    return submitWork(path, [this](FileOperationHandle::Completion& s, const std::string& p) {
        std::vector<std::string> parts;
        if (!Storage::split(p, parts) || parts.empty()) {
            s.reject(FileError::InvalidPath, "Invalid path", p);
            return;
        }

        std::lock_guard<std::mutex> lock(_storage->mutex);
        auto parent = _storage->parentOf(parts);
        if (!parent || !parent->children.count(parts.back())) {
            s.reject(FileError::FileNotFound, "File not found", p);
            return;
        }
        auto it = parent->children.find(parts.back());
        if (it->second->isDirectory) {
            s.reject(FileError::InvalidPath, "Path is a directory", p);
            return;
        }

        _storage->release(*it->second);
        parent->children.erase(it);
        s.settle(FileOpStatus::Complete);
    });
}

FileOperationHandle MemoryFileSystemBackend::getMetadata(const std::string& path) {
    return submitWork(path, [this](FileOperationHandle::Completion& s, const std::string& p) {
        std::vector<std::string> parts;
        if (!Storage::split(p, parts)) {
            s.reject(FileError::InvalidPath, "Invalid path", p);
            return;
        }

        std::lock_guard<std::mutex> lock(_storage->mutex);
        auto node = _storage->find(parts);
        if (!node) {
            FileMetadata meta;
            meta.path = Storage::join(parts, parts.size());
            s.meta = meta;
        } else {
            s.meta = _storage->metadataFor(*node, Storage::join(parts, parts.size()));
        }
        s.settle(FileOpStatus::Complete);
    });
}

bool MemoryFileSystemBackend::exists(const std::string& path) {
    std::vector<std::string> parts;
    if (!Storage::split(path, parts)) return false;
    std::lock_guard<std::mutex> lock(_storage->mutex);
    return _storage->find(parts) != nullptr;
}

FileOperationHandle MemoryFileSystemBackend::createDirectory(const std::string& path) {
    return submitWork(path, [this](FileOperationHandle::Completion& s, const std::string& p) {
        std::vector<std::string> parts;
        if (!Storage::split(p, parts)) {
            s.reject(FileError::InvalidPath, "Invalid path", p);
            return;
        }
        if (parts.empty()) {
            s.reject(FileError::AlreadyExists, "Root directory always exists", p);
            return;
        }

        std::lock_guard<std::mutex> lock(_storage->mutex);
        auto parent = _storage->parentOf(parts);
        if (!parent) {
            s.reject(FileError::InvalidPath, "Parent directory does not exist", p);
            return;
        }
        if (parent->children.count(parts.back())) {
            s.reject(FileError::AlreadyExists, "Entry already exists", p);
            return;
        }

        auto dir = std::make_shared<Node>();
        dir->isDirectory = true;
        parent->children.emplace(parts.back(), std::move(dir));
        parent->lastModified = std::chrono::system_clock::now();
        s.settle(FileOpStatus::Complete);
    });
}

FileOperationHandle MemoryFileSystemBackend::removeDirectory(const std::string& path, bool recursive) {
    return submitWork(path, [this, recursive](FileOperationHandle::Completion& s, const std::string& p) {
        std::vector<std::string> parts;
        if (!Storage::split(p, parts)) {
            s.reject(FileError::InvalidPath, "Invalid path", p);
            return;
        }
        if (parts.empty()) {
            s.reject(FileError::InvalidPath, "Cannot remove the root directory", p);
            return;
        }

        std::lock_guard<std::mutex> lock(_storage->mutex);
        auto parent = _storage->parentOf(parts);
        if (!parent || !parent->children.count(parts.back())) {
            s.reject(FileError::FileNotFound, "Directory not found", p);
            return;
        }
        auto it = parent->children.find(parts.back());
        if (!it->second->isDirectory) {
            s.reject(FileError::InvalidPath, "Not a directory", p);
            return;
        }
        if (!recursive && !it->second->children.empty()) {
            s.reject(FileError::IOError, "Directory not empty", p);
            return;
        }

        _storage->release(*it->second);
        parent->children.erase(it);
        s.settle(FileOpStatus::Complete);
    });
}

FileOperationHandle MemoryFileSystemBackend::listDirectory(const std::string& path, ListDirectoryOptions options) {
    return submitWork(path, [this, options](FileOperationHandle::Completion& s, const std::string& p) {
        std::vector<std::string> parts;
        if (!Storage::split(p, parts)) {
            s.reject(FileError::InvalidPath, "Invalid path", p);
            return;
        }

        std::lock_guard<std::mutex> lock(_storage->mutex);
        auto node = _storage->find(parts);
        if (!node) {
            s.reject(FileError::FileNotFound, "Directory not found", p);
            return;
        }
        if (!node->isDirectory) {
            s.reject(FileError::InvalidPath, "Not a directory", p);
            return;
        }

        const std::string base = Storage::join(parts, parts.size());
        std::vector<DirectoryEntry> entries;
        entries.reserve(node->children.size());
        // std::map iteration is already name-ordered
        for (const auto& [name, child] : node->children) {
            if (!options.includeHidden && !name.empty() && name[0] == '.') continue;
            DirectoryEntry entry;
            entry.name = name;
            entry.fullPath = base.empty() ? name : base + "/" + name;
            entry.metadata = _storage->metadataFor(*child, entry.fullPath);
            entries.push_back(std::move(entry));
        }

        s.listing = std::move(entries);
        s.settle(FileOpStatus::Complete);
    });
}

std::unique_ptr<FileStream> MemoryFileSystemBackend::openStream(const std::string& path, StreamOptions options) {
    auto failed = [&](FileError code) {
        return std::make_unique<MemoryFileStream>(_storage, nullptr, path, options.mode, code);
    };

    std::vector<std::string> parts;
    if (!Storage::split(path, parts) || parts.empty()) return failed(FileError::InvalidPath);

    std::lock_guard<std::mutex> lock(_storage->mutex);
    auto parent = _storage->parentOf(parts);
    if (!parent) return failed(FileError::InvalidPath);

    auto it = parent->children.find(parts.back());
    const bool present = it != parent->children.end();
    if (present && it->second->isDirectory) return failed(FileError::InvalidPath);

    const bool reading = options.mode == StreamOptions::Read;
    if ((reading || options.disposition == StreamOptions::OpenExisting) && !present) {
        return failed(FileError::FileNotFound);
    }
    if (!reading && options.disposition == StreamOptions::CreateNew && present) {
        return failed(FileError::AlreadyExists);
    }

    std::shared_ptr<Node> node;
    if (present) {
        node = it->second;
        if (!reading && options.disposition == StreamOptions::Create) {
            _storage->resize(*node, 0);
        }
    } else {
        node = std::make_shared<Node>();
        parent->children.emplace(parts.back(), node);
    }

    return std::make_unique<MemoryFileStream>(_storage, std::move(node), path, options.mode, FileError::None);
}

FileOperationHandle MemoryFileSystemBackend::moveFile(const std::string& src, const std::string& dst, bool overwriteExisting) {
    return submitWork(src, [this, src, dst, overwriteExisting](FileOperationHandle::Completion& s, const std::string&) {
        std::vector<std::string> from, to;
        if (!Storage::split(src, from) || from.empty()) {
            s.reject(FileError::InvalidPath, "Invalid source path", src);
            return;
        }
        if (!Storage::split(dst, to) || to.empty()) {
            s.reject(FileError::InvalidPath, "Invalid destination path", dst);
            return;
        }
        if (to.size() >= from.size() && std::equal(from.begin(), from.end(), to.begin())) {
            s.reject(FileError::InvalidPath, "Cannot move an entry into itself", dst);
            return;
        }

        std::lock_guard<std::mutex> lock(_storage->mutex);
        auto srcParent = _storage->parentOf(from);
        if (!srcParent || !srcParent->children.count(from.back())) {
            s.reject(FileError::FileNotFound, "Source not found", src);
            return;
        }
        auto srcIt = srcParent->children.find(from.back());
        auto dstParent = _storage->parentOf(to);
        if (!dstParent) {
            s.reject(FileError::InvalidPath, "Destination parent does not exist", dst);
            return;
        }

        auto dstIt = dstParent->children.find(to.back());
        if (dstIt != dstParent->children.end()) {
            if (!overwriteExisting) {
                s.reject(FileError::AlreadyExists, "Destination already exists", dst);
                return;
            }
            _storage->release(*dstIt->second);
            dstParent->children.erase(dstIt);
        }

        auto node = srcIt->second;
        srcParent->children.erase(srcIt);
        s.written = node->isDirectory ? 0 : node->data.size();
        dstParent->children.emplace(to.back(), std::move(node));
        s.settle(FileOpStatus::Complete);
    });
}

BackendCapabilities MemoryFileSystemBackend::getCapabilities() const {
    return BackendCapabilities{};
}

bool MemoryFileSystemBackend::markPackageMount(const std::string& path, bool mounted) {
    std::vector<std::string> parts;
    if (!Storage::split(path, parts)) return false;

    std::lock_guard<std::mutex> lock(_storage->mutex);
    auto node = _storage->find(parts);
    if (!node || !node->isDirectory) {
        STEVEDORE_LOG_WARNING_CAT("MemoryFileSystem", "markPackageMount: not a directory: " + path);
        return false;
    }
    node->isPackageMount = mounted;
    return true;
}

uint64_t MemoryFileSystemBackend::usedSpace() const {
    std::lock_guard<std::mutex> lock(_storage->mutex);
    return _storage->used;
}

} // namespace Stevedore::Core::IO
