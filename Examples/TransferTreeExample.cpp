#include "StevedoreCore.h"
#include <filesystem>
#include <string>

using namespace Stevedore::Core;
using namespace Stevedore::Core::Operations;

static std::string tempPath(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

static bool seed(IO::IFileSystemBackend& backend, const std::string& path, const std::string& text) {
    auto h = backend.writeFile(path, std::span<const std::byte>(reinterpret_cast<const std::byte*>(text.data()), text.size()));
    h.wait();
    if (h.status() != IO::FileOpStatus::Complete) {
        STEVEDORE_LOG_ERROR("Seed write failed for " + path + ": " + h.errorInfo().message);
        return false;
    }
    return true;
}

int main() {
    auto session = std::make_shared<OperationSession>();

    // Build a small tree on disk
    auto local = std::make_shared<IO::LocalFileSystemBackend>();
    const std::string root = tempPath("stevedore_transfer_demo");
    std::make_shared<CreateDirectory>(session, local, root + "/docs/drafts",
                                      OperationPolicy{}.withDestination(DestinationPolicy::Skip))->run();
    if (!seed(*local, root + "/readme.txt", "hello") ||
        !seed(*local, root + "/docs/spec.txt", "the plan") ||
        !seed(*local, root + "/docs/drafts/v1.txt", "first try")) {
        return 1;
    }

    // Move it into memory, then undo the move
    auto memory = std::make_shared<IO::MemoryFileSystemBackend>();
    auto transfer = std::make_shared<TransferTree>(session, local, root, memory, "imported");
    try {
        transfer->estimate();
        STEVEDORE_LOG_INFO(transfer->toString() + " planned " + std::to_string(transfer->size()) +
                           " steps, " + std::to_string(transfer->totalLength()) + " bytes");
        transfer->run(true);
        transfer->assertSuccessful();
        STEVEDORE_LOG_INFO(std::string("Source removed: ") + (local->exists(root) ? "no" : "yes"));

        auto rollback = transfer->createRollback();
        if (rollback) {
            rollback->run();
            rollback->assertSuccessful();
            STEVEDORE_LOG_INFO(std::string("Rolled back, source restored: ") + (local->exists(root) ? "yes" : "no"));
        }
    } catch (const std::exception& e) {
        STEVEDORE_LOG_ERROR(std::string("Transfer failed: ") + e.what());
        return 1;
    }

    std::make_shared<DeleteTree>(session, local, root)->run();
    STEVEDORE_LOG_INFO(std::to_string(session->eventCount()) + " events logged");
    return 0;
}
