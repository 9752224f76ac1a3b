#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <random>
#include <span>
#include <sstream>
#include <string>
#include <vector>

#include "StevedoreCore.h"

namespace stevedore::test_helpers
{

// RAII temporary directory that gets cleaned up on destruction
class ScopedTempDir
{
public:
    ScopedTempDir() {
        namespace fs = std::filesystem;
        auto base = fs::temp_directory_path();
        auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
        std::random_device rd;
        std::mt19937_64 gen(rd());
        auto rnd = gen();
        std::ostringstream oss;
        oss << "Stevedore_Test_" << std::hex << now << "_" << rnd;
        _path = base / oss.str();
        std::error_code ec;
        fs::create_directories(_path, ec);
    }

    ~ScopedTempDir() {
        namespace fs = std::filesystem;
        std::error_code ec;
        fs::remove_all(_path, ec);  // best-effort cleanup
    }

    const std::filesystem::path& path() const noexcept {
        return _path;
    }
    std::string join(const std::string& name) const {
        return (_path / name).string();
    }

private:
    std::filesystem::path _path;
};

// Deterministic, non-repeating-looking content so misordered blocks show up
inline std::vector<std::byte> patternBytes(size_t size, uint32_t seed = 1) {
    std::vector<std::byte> out(size);
    uint32_t x = seed * 2654435761u + 1;
    for (size_t i = 0; i < size; ++i) {
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        out[i] = static_cast<std::byte>(x & 0xFF);
    }
    return out;
}

inline std::vector<std::byte> toBytes(const std::string& text) {
    std::vector<std::byte> out(text.size());
    for (size_t i = 0; i < text.size(); ++i) out[i] = static_cast<std::byte>(text[i]);
    return out;
}

// Writes a file or fails the calling test
inline void putFile(Stevedore::Core::IO::IFileSystemBackend& backend, const std::string& path,
                    const std::vector<std::byte>& data) {
    Stevedore::Core::IO::throwIfFailed(backend.writeFile(path, std::span<const std::byte>(data)), "writeFile");
}

inline void putFile(Stevedore::Core::IO::IFileSystemBackend& backend, const std::string& path,
                    const std::string& text) {
    putFile(backend, path, toBytes(text));
}

inline std::vector<std::byte> getFile(Stevedore::Core::IO::IFileSystemBackend& backend, const std::string& path) {
    auto handle = backend.readFile(path);
    Stevedore::Core::IO::throwIfFailed(handle, "readFile");
    auto bytes = handle.contentsBytes();
    return {bytes.begin(), bytes.end()};
}

inline void makeDir(Stevedore::Core::IO::IFileSystemBackend& backend, const std::string& path) {
    Stevedore::Core::IO::throwIfFailed(backend.createDirectory(path), "createDirectory");
}

// Observer that records every event and can run a hook on each one
class RecordingObserver : public Stevedore::Core::Operations::IOperationObserver
{
public:
    using Event = Stevedore::Core::Operations::OperationEvent;

    std::function<void(const Event&)> onEvent;

    void onNext(const Event& event) override {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _events.push_back(event);
        }
        if (onEvent) onEvent(event);
    }

    void onCompleted() override {
        std::lock_guard<std::mutex> lock(_mutex);
        ++_completedCount;
    }

    std::vector<Event> events() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _events;
    }

    std::vector<Event> eventsOfType(Event::Type type) const {
        std::vector<Event> out;
        for (auto& e : events()) {
            if (e.type == type) out.push_back(e);
        }
        return out;
    }

    int completedCount() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _completedCount;
    }

private:
    mutable std::mutex _mutex;
    std::vector<Event> _events;
    int _completedCount = 0;
};

// Session with quiet defaults and an optional pool
inline std::shared_ptr<Stevedore::Core::Operations::OperationSession> makeSession(
    std::shared_ptr<Stevedore::Core::Memory::IBlockPool> pool = nullptr,
    int64_t progressInterval = 524288,
    Stevedore::Core::Operations::OperationPolicy policy = Stevedore::Core::Operations::OperationPolicy::defaults()) {
    Stevedore::Core::Operations::OperationSession::Config cfg;
    cfg.defaultPolicy = policy;
    cfg.progressInterval = progressInterval;
    return std::make_shared<Stevedore::Core::Operations::OperationSession>(cfg, std::move(pool));
}

} // namespace stevedore::test_helpers
