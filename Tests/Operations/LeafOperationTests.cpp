#include <gtest/gtest.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "StevedoreTestHelpers.h"

using namespace Stevedore::Core;
using namespace Stevedore::Core::Operations;
using namespace stevedore::test_helpers;

namespace {
IO::FileError codeOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const IO::FileSystemException& e) {
        return e.code();
    }
    return IO::FileError::None;
}
}

// CreateDirectory

TEST(CreateDirectory, CreatesMissingParentsInOrder) {
    auto session = makeSession();
    auto mem = std::make_shared<IO::MemoryFileSystemBackend>();
    makeDir(*mem, "a");

    auto op = std::make_shared<CreateDirectory>(session, mem, "a/b/c");
    op->estimate();
    EXPECT_TRUE(op->canRollback());
    op->run();

    EXPECT_EQ(op->state(), OperationState::Completed);
    EXPECT_TRUE(mem->exists("a/b/c"));
    std::vector<std::string> expected{"a/b", "a/b/c"};
    EXPECT_EQ(op->directoriesCreated(), expected);
}

TEST(CreateDirectory, ExistingDirectory_ThrowSkipOrOverwrite) {
    auto session = makeSession();
    auto mem = std::make_shared<IO::MemoryFileSystemBackend>();
    makeDir(*mem, "d");

    auto strict = std::make_shared<CreateDirectory>(session, mem, "d");
    EXPECT_EQ(codeOf([&] { strict->run(); }), IO::FileError::AlreadyExists);

    auto skip = std::make_shared<CreateDirectory>(session, mem, "d",
                                                  OperationPolicy{}.withDestination(DestinationPolicy::Skip));
    skip->run();
    EXPECT_EQ(skip->state(), OperationState::Skipped);

    // Overwriting a directory with a directory leaves it in place
    auto over = std::make_shared<CreateDirectory>(session, mem, "d",
                                                  OperationPolicy{}.withDestination(DestinationPolicy::Overwrite));
    over->run();
    EXPECT_EQ(over->state(), OperationState::Skipped);
    EXPECT_EQ(over->createRollback(), nullptr);
}

TEST(CreateDirectory, OverwriteReplacesFileAndCannotRollBack) {
    auto session = makeSession();
    auto mem = std::make_shared<IO::MemoryFileSystemBackend>();
    putFile(*mem, "x", std::string("file"));

    auto op = std::make_shared<CreateDirectory>(session, mem, "x",
                                                OperationPolicy{}.withDestination(DestinationPolicy::Overwrite));
    op->estimate();
    EXPECT_FALSE(op->canRollback());
    op->run();

    auto meta = mem->getMetadata("x");
    meta.wait();
    ASSERT_TRUE(meta.metadata().has_value());
    EXPECT_TRUE(meta.metadata()->isDirectory);
}

TEST(CreateDirectory, Rollback_RemovesOnlyWhatWasCreated) {
    auto session = makeSession();
    auto mem = std::make_shared<IO::MemoryFileSystemBackend>();
    makeDir(*mem, "keep");

    auto op = std::make_shared<CreateDirectory>(session, mem, "keep/x/y");
    op->run();

    auto rollback = op->createRollback();
    ASSERT_NE(rollback, nullptr);
    EXPECT_EQ(rollback->children().size(), 2u);
    rollback->run();
    rollback->assertSuccessful();

    EXPECT_FALSE(mem->exists("keep/x"));
    EXPECT_TRUE(mem->exists("keep"));
}

TEST(CreateDirectory, SingleDirectoryRollback_IsPlainDelete) {
    auto session = makeSession();
    auto mem = std::make_shared<IO::MemoryFileSystemBackend>();

    auto op = std::make_shared<CreateDirectory>(session, mem, "solo");
    op->run();
    auto rollback = op->createRollback();
    ASSERT_NE(rollback, nullptr);
    EXPECT_EQ(rollback->name(), "Delete");
    EXPECT_EQ(rollback->path(), "solo");
    rollback->run();
    EXPECT_FALSE(mem->exists("solo"));
}

// Delete

TEST(Delete, RemovesFileAndDirectory) {
    auto session = makeSession();
    auto mem = std::make_shared<IO::MemoryFileSystemBackend>();
    putFile(*mem, "f", std::string("x"));
    makeDir(*mem, "d");

    std::make_shared<Delete>(session, mem, "f")->run();
    std::make_shared<Delete>(session, mem, "d")->run();
    EXPECT_FALSE(mem->exists("f"));
    EXPECT_FALSE(mem->exists("d"));
}

TEST(Delete, NonEmptyDirectory_NeedsRecursive) {
    auto session = makeSession();
    auto mem = std::make_shared<IO::MemoryFileSystemBackend>();
    makeDir(*mem, "d");
    putFile(*mem, "d/f", std::string("x"));

    auto shallow = std::make_shared<Delete>(session, mem, "d");
    EXPECT_NE(codeOf([&] { shallow->run(); }), IO::FileError::None);
    EXPECT_TRUE(mem->exists("d/f"));

    auto deep = std::make_shared<Delete>(session, mem, "d", true);
    EXPECT_TRUE(deep->recursive());
    deep->run();
    EXPECT_FALSE(mem->exists("d"));
}

TEST(Delete, MissingEntry_FollowsDestinationPolicy) {
    auto session = makeSession();
    auto mem = std::make_shared<IO::MemoryFileSystemBackend>();

    auto strict = std::make_shared<Delete>(session, mem, "ghost");
    EXPECT_EQ(codeOf([&] { strict->run(); }), IO::FileError::FileNotFound);

    auto skip = std::make_shared<Delete>(session, mem, "ghost", false,
                                         OperationPolicy{}.withDestination(DestinationPolicy::Skip));
    skip->run();
    EXPECT_EQ(skip->state(), OperationState::Skipped);

    auto over = std::make_shared<Delete>(session, mem, "ghost", false,
                                         OperationPolicy{}.withDestination(DestinationPolicy::Overwrite));
    over->run();
    EXPECT_EQ(over->state(), OperationState::Completed);
}

TEST(Delete, RollbackIsOfferedOnlyWhenSupplied) {
    auto session = makeSession();
    auto mem = std::make_shared<IO::MemoryFileSystemBackend>();
    putFile(*mem, "f", std::string("x"));
    putFile(*mem, "g", std::string("y"));

    auto plain = std::make_shared<Delete>(session, mem, "f");
    EXPECT_FALSE(plain->canRollback());
    plain->run();
    EXPECT_EQ(plain->createRollback(), nullptr);

    auto undo = std::make_shared<CreateDirectory>(session, mem, "restored");
    auto withUndo = std::make_shared<Delete>(session, mem, "g", false, OperationPolicy{}, undo);
    EXPECT_TRUE(withUndo->canRollback());
    EXPECT_EQ(withUndo->createRollback(), nullptr);
    withUndo->run();
    EXPECT_EQ(withUndo->createRollback(), undo);
}

// Move

TEST(Move, RenamesFileAndReportsLength) {
    auto session = makeSession();
    auto mem = std::make_shared<IO::MemoryFileSystemBackend>();
    putFile(*mem, "a", std::string("12345"));

    auto op = std::make_shared<Move>(session, mem, "a", mem, "b");
    op->estimate();
    EXPECT_EQ(op->totalLength(), 5);
    EXPECT_TRUE(op->canRollback());
    op->run();

    EXPECT_TRUE(op->moved());
    EXPECT_EQ(op->progress(), 5);
    EXPECT_FALSE(mem->exists("a"));
    EXPECT_EQ(getFile(*mem, "b"), toBytes("12345"));
}

TEST(Move, Rollback_MovesBack) {
    auto session = makeSession();
    auto mem = std::make_shared<IO::MemoryFileSystemBackend>();
    makeDir(*mem, "src");
    putFile(*mem, "src/f", std::string("x"));

    auto op = std::make_shared<Move>(session, mem, "src", mem, "dst");
    op->run();
    EXPECT_TRUE(mem->exists("dst/f"));

    auto rollback = op->createRollback();
    ASSERT_NE(rollback, nullptr);
    rollback->run();
    rollback->assertSuccessful();
    EXPECT_TRUE(mem->exists("src/f"));
    EXPECT_FALSE(mem->exists("dst"));
}

TEST(Move, ExistingDestination_ThrowSkipOrOverwrite) {
    auto session = makeSession();
    auto mem = std::make_shared<IO::MemoryFileSystemBackend>();
    putFile(*mem, "a", std::string("new"));
    putFile(*mem, "b", std::string("old"));

    auto strict = std::make_shared<Move>(session, mem, "a", mem, "b");
    EXPECT_EQ(codeOf([&] { strict->run(); }), IO::FileError::AlreadyExists);

    auto skip = std::make_shared<Move>(session, mem, "a", mem, "b",
                                       OperationPolicy{}.withDestination(DestinationPolicy::Skip));
    skip->run();
    EXPECT_EQ(skip->state(), OperationState::Skipped);
    EXPECT_TRUE(mem->exists("a"));

    auto over = std::make_shared<Move>(session, mem, "a", mem, "b",
                                       OperationPolicy{}.withDestination(DestinationPolicy::Overwrite));
    over->run();
    EXPECT_TRUE(over->deletedPrevious());
    EXPECT_FALSE(over->canRollback());
    EXPECT_EQ(over->createRollback(), nullptr);
    EXPECT_EQ(getFile(*mem, "b"), toBytes("new"));
}

TEST(Move, MissingSource_SkippedByDefault) {
    auto session = makeSession();
    auto mem = std::make_shared<IO::MemoryFileSystemBackend>();

    auto op = std::make_shared<Move>(session, mem, "ghost", mem, "b");
    op->run();
    EXPECT_EQ(op->state(), OperationState::Skipped);
    EXPECT_FALSE(op->moved());
}

TEST(Move, DifferentBackends_Rejected) {
    auto session = makeSession();
    auto a = std::make_shared<IO::MemoryFileSystemBackend>();
    auto b = std::make_shared<IO::MemoryFileSystemBackend>();
    EXPECT_THROW(Move(session, a, "x", b, "y"), std::invalid_argument);
}
