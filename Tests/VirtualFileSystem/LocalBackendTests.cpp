#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "StevedoreTestHelpers.h"
#include "VirtualFileSystem/LocalFileSystemBackend.h"

using namespace Stevedore::Core::IO;
using namespace stevedore::test_helpers;

TEST(LocalBackend, MissingFile_MapsToFileNotFound) {
    ScopedTempDir tmp;
    LocalFileSystemBackend local;

    auto r = local.readFile(tmp.join("missing.txt"));
    r.wait();
    ASSERT_EQ(r.status(), FileOpStatus::Failed);
    EXPECT_EQ(r.errorInfo().code, FileError::FileNotFound);

    auto d = local.deleteFile(tmp.join("missing.txt"));
    d.wait();
    EXPECT_EQ(d.errorInfo().code, FileError::FileNotFound);
}

TEST(LocalBackend, CreateDirectory_AlreadyExistsAndMissingParent) {
    ScopedTempDir tmp;
    LocalFileSystemBackend local;

    throwIfFailed(local.createDirectory(tmp.join("a")), "createDirectory");
    auto again = local.createDirectory(tmp.join("a"));
    again.wait();
    EXPECT_EQ(again.errorInfo().code, FileError::AlreadyExists);

    auto orphan = local.createDirectory(tmp.join("x/y"));
    orphan.wait();
    EXPECT_EQ(orphan.errorInfo().code, FileError::InvalidPath);
}

TEST(LocalBackend, RemoveDirectory_NonRecursiveOnNonEmptyFails) {
    ScopedTempDir tmp;
    LocalFileSystemBackend local;
    std::filesystem::create_directories(tmp.path() / "d");
    std::ofstream(tmp.path() / "d" / "f") << "x";

    auto flat = local.removeDirectory(tmp.join("d"));
    flat.wait();
    EXPECT_EQ(flat.status(), FileOpStatus::Failed);
    EXPECT_EQ(flat.errorInfo().code, FileError::IOError);

    throwIfFailed(local.removeDirectory(tmp.join("d"), true), "removeDirectory");
    EXPECT_FALSE(std::filesystem::exists(tmp.path() / "d"));
}

TEST(LocalBackend, OpenStream_CreateNewRejectsExisting) {
    ScopedTempDir tmp;
    LocalFileSystemBackend local;
    putFile(local, tmp.join("f"), std::string("old"));

    auto s = local.openStream(tmp.join("f"), {StreamOptions::Write, StreamOptions::CreateNew});
    EXPECT_TRUE(s->fail());
    EXPECT_EQ(s->lastError(), FileError::AlreadyExists);
    s.reset();
    EXPECT_EQ(getFile(local, tmp.join("f")), toBytes("old"));

    auto fresh = local.openStream(tmp.join("g"), {StreamOptions::Write, StreamOptions::CreateNew});
    ASSERT_FALSE(fresh->fail());
    auto data = toBytes("new");
    EXPECT_TRUE(fresh->write(data).success());
    fresh->close();
    EXPECT_EQ(getFile(local, tmp.join("g")), toBytes("new"));
}

TEST(LocalBackend, ListDirectory_IsSortedByName) {
    ScopedTempDir tmp;
    LocalFileSystemBackend local;
    for (auto name : {"c", "a", "b"}) std::ofstream(tmp.path() / name) << name;

    auto list = local.listDirectory(tmp.path().string());
    throwIfFailed(list, "listDirectory");
    const auto& entries = list.directoryEntries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].name, "a");
    EXPECT_EQ(entries[1].name, "b");
    EXPECT_EQ(entries[2].name, "c");
    EXPECT_EQ(entries[0].fullPath, (tmp.path() / "a").string());
}

TEST(LocalBackend, Move_RefusesToOverwriteUnlessAsked) {
    ScopedTempDir tmp;
    LocalFileSystemBackend local;
    putFile(local, tmp.join("a"), std::string("A"));
    putFile(local, tmp.join("b"), std::string("B"));

    auto collide = local.moveFile(tmp.join("a"), tmp.join("b"));
    collide.wait();
    EXPECT_EQ(collide.errorInfo().code, FileError::AlreadyExists);

    throwIfFailed(local.moveFile(tmp.join("a"), tmp.join("b"), true), "moveFile");
    EXPECT_FALSE(local.exists(tmp.join("a")));
    EXPECT_EQ(getFile(local, tmp.join("b")), toBytes("A"));
}

TEST(LocalBackend, RangedRead_ShortTailIsPartial) {
    ScopedTempDir tmp;
    LocalFileSystemBackend local;
    auto data = toBytes("0123456789");
    auto w = local.writeFile(tmp.join("digits"), data);
    throwIfFailed(w, "writeFile");
    EXPECT_EQ(w.bytesWritten(), 10u);

    auto middle = local.readFile(tmp.join("digits"), ReadOptions{3, 4});
    EXPECT_EQ(middle.status(), FileOpStatus::Complete);
    auto got = middle.contentsBytes();
    EXPECT_EQ(std::vector<std::byte>(got.begin(), got.end()), toBytes("3456"));

    auto tail = local.readFile(tmp.join("digits"), ReadOptions{8, 5});
    EXPECT_EQ(tail.status(), FileOpStatus::Partial);
    EXPECT_EQ(tail.contentsBytes().size(), 2u);
    EXPECT_EQ(tail.errorInfo().code, FileError::None);
}

TEST(LocalBackend, ListDirectory_CanHideDotFiles) {
    ScopedTempDir tmp;
    LocalFileSystemBackend local;
    std::ofstream(tmp.path() / ".hidden") << "h";
    std::ofstream(tmp.path() / "shown") << "s";

    ListDirectoryOptions options;
    options.includeHidden = false;
    auto list = local.listDirectory(tmp.path().string(), options);
    throwIfFailed(list, "listDirectory");
    ASSERT_EQ(list.directoryEntries().size(), 1u);
    EXPECT_EQ(list.directoryEntries()[0].name, "shown");
    EXPECT_TRUE(list.directoryEntries()[0].metadata.isRegularFile);
}
