#include <gtest/gtest.h>

#include <string>

#include "StevedoreTestHelpers.h"
#include "VirtualFileSystem/MemoryFileSystemBackend.h"

using namespace Stevedore::Core::IO;
using namespace stevedore::test_helpers;

TEST(MemoryBackend, WriteReadRoundTrip_AndMetadata) {
    MemoryFileSystemBackend mem;
    makeDir(mem, "docs");
    putFile(mem, "docs/a.txt", std::string("hello"));

    auto bytes = getFile(mem, "docs/a.txt");
    EXPECT_EQ(bytes, toBytes("hello"));

    auto meta = mem.getMetadata("/docs/a.txt");
    meta.wait();
    ASSERT_TRUE(meta.metadata().has_value());
    EXPECT_TRUE(meta.metadata()->exists);
    EXPECT_TRUE(meta.metadata()->isRegularFile);
    EXPECT_EQ(meta.metadata()->size, 5u);
    EXPECT_EQ(meta.metadata()->path, "docs/a.txt");
}

TEST(MemoryBackend, MissingEntries_MapToFileNotFound) {
    MemoryFileSystemBackend mem;

    auto r = mem.readFile("nope.txt");
    r.wait();
    EXPECT_EQ(r.status(), FileOpStatus::Failed);
    EXPECT_EQ(r.errorInfo().code, FileError::FileNotFound);

    auto d = mem.deleteFile("nope.txt");
    d.wait();
    EXPECT_EQ(d.errorInfo().code, FileError::FileNotFound);

    auto meta = mem.getMetadata("nope.txt");
    meta.wait();
    EXPECT_EQ(meta.status(), FileOpStatus::Complete);
    ASSERT_TRUE(meta.metadata().has_value());
    EXPECT_FALSE(meta.metadata()->exists);
}

TEST(MemoryBackend, CreateDirectory_RequiresParentAndRejectsExisting) {
    MemoryFileSystemBackend mem;

    auto orphan = mem.createDirectory("a/b");
    orphan.wait();
    EXPECT_EQ(orphan.errorInfo().code, FileError::InvalidPath);

    makeDir(mem, "a");
    auto again = mem.createDirectory("a");
    again.wait();
    EXPECT_EQ(again.errorInfo().code, FileError::AlreadyExists);

    auto dots = mem.createDirectory("a/../b");
    dots.wait();
    EXPECT_EQ(dots.errorInfo().code, FileError::InvalidPath);
}

TEST(MemoryBackend, RemoveDirectory_NonEmptyNeedsRecursive) {
    MemoryFileSystemBackend mem;
    makeDir(mem, "a");
    putFile(mem, "a/f", std::string("x"));

    auto flat = mem.removeDirectory("a");
    flat.wait();
    EXPECT_EQ(flat.errorInfo().code, FileError::IOError);
    EXPECT_TRUE(mem.exists("a/f"));

    throwIfFailed(mem.removeDirectory("a", true), "removeDirectory");
    EXPECT_FALSE(mem.exists("a"));
    EXPECT_EQ(mem.usedSpace(), 0u);
}

TEST(MemoryBackend, ListDirectory_SortedWithFullPaths) {
    MemoryFileSystemBackend mem;
    makeDir(mem, "d");
    putFile(mem, "d/b", std::string("2"));
    putFile(mem, "d/a", std::string("1"));
    makeDir(mem, "d/c");

    auto list = mem.listDirectory("d");
    throwIfFailed(list, "listDirectory");
    const auto& entries = list.directoryEntries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].fullPath, "d/a");
    EXPECT_EQ(entries[1].fullPath, "d/b");
    EXPECT_EQ(entries[2].fullPath, "d/c");
    EXPECT_TRUE(entries[2].metadata.isDirectory);

    auto root = mem.listDirectory("");
    throwIfFailed(root, "listDirectory");
    ASSERT_EQ(root.directoryEntries().size(), 1u);
    EXPECT_EQ(root.directoryEntries()[0].fullPath, "d");
}

TEST(MemoryBackend, OpenStream_DispositionsAreHonoured) {
    MemoryFileSystemBackend mem;
    putFile(mem, "f", std::string("old"));

    auto createNew = mem.openStream("f", {StreamOptions::Write, StreamOptions::CreateNew});
    EXPECT_TRUE(createNew->fail());
    EXPECT_EQ(createNew->lastError(), FileError::AlreadyExists);

    auto missing = mem.openStream("g", {StreamOptions::Read, StreamOptions::OpenExisting});
    EXPECT_EQ(missing->lastError(), FileError::FileNotFound);

    auto noParent = mem.openStream("x/y", {StreamOptions::Write, StreamOptions::Create});
    EXPECT_EQ(noParent->lastError(), FileError::InvalidPath);

    {
        auto truncating = mem.openStream("f", {StreamOptions::Write, StreamOptions::Create});
        ASSERT_FALSE(truncating->fail());
        auto data = toBytes("new!");
        EXPECT_TRUE(truncating->write(data).success());
    }
    EXPECT_EQ(getFile(mem, "f"), toBytes("new!"));
}

TEST(MemoryBackend, StreamRead_ReturnsZeroAtEnd) {
    MemoryFileSystemBackend mem;
    putFile(mem, "f", std::string("abc"));

    auto in = mem.openStream("f");
    std::vector<std::byte> buf(2);
    EXPECT_EQ(in->read(buf).bytesTransferred, 2u);
    EXPECT_EQ(in->read(buf).bytesTransferred, 1u);
    auto last = in->read(buf);
    EXPECT_TRUE(last.success());
    EXPECT_EQ(last.bytesTransferred, 0u);
}

TEST(MemoryBackend, Quota_WriteBeyondMaxSpaceFailsWithDiskFull) {
    MemoryFileSystemBackend mem({.blockSize = 64, .maxSpace = 128});

    putFile(mem, "a", patternBytes(100));   // charged as 128
    EXPECT_EQ(mem.usedSpace(), 128u);

    auto w = mem.writeFile("b", std::span<const std::byte>(patternBytes(1)));
    w.wait();
    EXPECT_EQ(w.status(), FileOpStatus::Failed);
    EXPECT_EQ(w.errorInfo().code, FileError::DiskFull);
    EXPECT_FALSE(mem.exists("b"));

    auto out = mem.openStream("a", {StreamOptions::Write, StreamOptions::OpenExisting});
    out->seek(0, std::ios_base::end);
    auto more = patternBytes(64);
    auto r = out->write(more);
    EXPECT_FALSE(r.success());
    EXPECT_EQ(*r.error, FileError::DiskFull);
    EXPECT_EQ(getFile(mem, "a").size(), 100u);
}

TEST(MemoryBackend, Move_RenamesAndRejectsCollisionsAndSelfNesting) {
    MemoryFileSystemBackend mem;
    makeDir(mem, "a");
    putFile(mem, "a/f", std::string("x"));
    putFile(mem, "g", std::string("y"));

    auto collide = mem.moveFile("g", "a/f");
    collide.wait();
    EXPECT_EQ(collide.errorInfo().code, FileError::AlreadyExists);

    auto nested = mem.moveFile("a", "a/sub");
    nested.wait();
    EXPECT_EQ(nested.errorInfo().code, FileError::InvalidPath);

    throwIfFailed(mem.moveFile("a", "b"), "moveFile");
    EXPECT_FALSE(mem.exists("a"));
    EXPECT_EQ(getFile(mem, "b/f"), toBytes("x"));

    throwIfFailed(mem.moveFile("g", "b/f", true), "moveFile");
    EXPECT_EQ(getFile(mem, "b/f"), toBytes("y"));
}

TEST(MemoryBackend, DeletedFile_OpenStreamReportsIOError) {
    MemoryFileSystemBackend mem;
    putFile(mem, "f", std::string("abc"));
    auto in = mem.openStream("f");
    throwIfFailed(mem.deleteFile("f"), "deleteFile");

    std::vector<std::byte> buf(4);
    auto r = in->read(buf);
    EXPECT_FALSE(r.success());
    EXPECT_EQ(*r.error, FileError::IOError);
}

TEST(MemoryBackend, MarkPackageMount_FlagsDirectoriesOnly) {
    MemoryFileSystemBackend mem;
    makeDir(mem, "pkg");
    putFile(mem, "file", std::string("x"));

    EXPECT_TRUE(mem.markPackageMount("pkg"));
    EXPECT_FALSE(mem.markPackageMount("file"));
    EXPECT_FALSE(mem.markPackageMount("missing"));

    auto meta = mem.getMetadata("pkg");
    meta.wait();
    EXPECT_TRUE(meta.metadata()->isPackageMount);
}
