#include "StevedoreCore.h"
#include <filesystem>
#include <string>
#include <vector>

using namespace Stevedore::Core;
using namespace Stevedore::Core::Operations;

static std::string tempPath(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

// Prints Progress events as they arrive on the copying thread
class ProgressPrinter : public IOperationObserver {
public:
    void onNext(const OperationEvent& event) override {
        if (event.type != OperationEvent::Type::Progress) return;
        STEVEDORE_LOG_INFO(event.toString());
    }
};

int main() {
    auto pool = std::make_shared<Memory::BlockPool>(Memory::BlockPool::Config::fromEnvironment());

    OperationSession::Config config = OperationSession::Config::fromEnvironment();
    config.progressInterval = 1 << 20;
    auto session = std::make_shared<OperationSession>(config, pool);
    auto subscription = session->subscribe(std::make_shared<ProgressPrinter>());

    // Seed an 8 MiB source in memory
    auto memory = std::make_shared<IO::MemoryFileSystemBackend>();
    std::vector<std::byte> payload(8 << 20);
    for (size_t i = 0; i < payload.size(); ++i) payload[i] = static_cast<std::byte>(i * 31);
    auto seed = memory->writeFile("payload.bin", payload);
    seed.wait();
    if (seed.status() != IO::FileOpStatus::Complete) {
        STEVEDORE_LOG_ERROR(std::string("Seed write failed: ") + seed.errorInfo().message);
        return 1;
    }

    auto local = std::make_shared<IO::LocalFileSystemBackend>();
    const std::string target = tempPath("stevedore_copy_demo.bin");

    auto copy = std::make_shared<CopyFile>(session, memory, "payload.bin", local, target,
                                           OperationPolicy{}.withDestination(DestinationPolicy::Overwrite));
    try {
        copy->estimate();
        STEVEDORE_LOG_INFO("Copying " + std::to_string(copy->totalLength()) + " bytes to " + target);
        copy->run(true);
        copy->assertSuccessful();
    } catch (const std::exception& e) {
        STEVEDORE_LOG_ERROR(std::string("Copy failed: ") + e.what());
        return 1;
    }

    STEVEDORE_LOG_INFO("Copied " + std::to_string(copy->progress()) + " bytes, " +
                       std::to_string(pool->blocksAllocated()) + " blocks still out");

    std::make_shared<Delete>(session, local, target)->run();
    return 0;
}
