#include <gtest/gtest.h>
#include "fs/Filesystem.hpp"
#include "perms/CorruptMetadataError.hpp"
#include "perms/Store.hpp"
#include "TempDir.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace stdfs = std::filesystem;
using namespace pfs;
using pfs::test::TempDir;

namespace {

std::vector<std::string> names(const std::vector<fs::DirEntry>& entries) {
    std::vector<std::string> out;
    for (const auto& e : entries) out.push_back(e.name);
    std::sort(out.begin(), out.end());
    return out;
}

int errnoOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const std::system_error& e) {
        return e.code().value();
    }
    return 0;
}

}

class FilesystemTest : public ::testing::Test {
protected:
    TempDir dir;
    std::unique_ptr<fs::Filesystem> filesystem;

    void SetUp() override {
        dir.writeFile("a.txt", "alpha", 0644);
        dir.makeDir("d", 0755);
        mount();
    }

    void mount() {
        filesystem = std::make_unique<fs::Filesystem>(dir.path());
        filesystem->init();
    }

    void remount() {
        filesystem->destroy();
        mount();
    }

    [[nodiscard]] stdfs::path sidecar() const { return dir.path() / perms::SIDECAR_FILENAME; }
};

TEST_F(FilesystemTest, Init_CorruptSidecarRefusesToMount) {
    dir.writeFile(perms::SIDECAR_FILENAME, "not json");
    fs::Filesystem other(dir.path());
    EXPECT_THROW(other.init(), perms::CorruptMetadataError);
    EXPECT_FALSE(other.isInitialized());
}

TEST_F(FilesystemTest, Readdir_RootHidesSidecar) {
    dir.writeFile(perms::SIDECAR_FILENAME, "{}");
    const auto listed = names(filesystem->readdir("/"));
    EXPECT_EQ(listed, (std::vector<std::string>{".", "..", "a.txt", "d"}));
}

TEST_F(FilesystemTest, Readdir_SubdirectoryShowsSidecarName) {
    dir.writeFile(std::string("d/") + perms::SIDECAR_FILENAME, "{}");
    const auto listed = names(filesystem->readdir("/d"));
    EXPECT_NE(std::find(listed.begin(), listed.end(), perms::SIDECAR_FILENAME), listed.end());
}

TEST_F(FilesystemTest, Readdir_ReportsFileTypes) {
    for (const auto& e : filesystem->readdir("/")) {
        if (e.name == "a.txt") EXPECT_EQ(e.type, static_cast<mode_t>(S_IFREG));
        if (e.name == "d") EXPECT_EQ(e.type, static_cast<mode_t>(S_IFDIR));
    }
}

TEST_F(FilesystemTest, Readdir_MissingDirectoryIsEnoent) {
    EXPECT_EQ(errnoOf([&] { (void)filesystem->readdir("/nope"); }), ENOENT);
}

TEST_F(FilesystemTest, Getattr_MissingIsEnoent) {
    EXPECT_EQ(errnoOf([&] { (void)filesystem->getattr("/nope"); }), ENOENT);
}

TEST_F(FilesystemTest, EmptyMountLeavesNoSidecar) {
    (void)filesystem->getattr("/");
    (void)filesystem->readdir("/");
    (void)filesystem->getattr("/a.txt");
    (void)filesystem->getattr("/d");
    filesystem->destroy();

    EXPECT_FALSE(stdfs::exists(sidecar()));
}

TEST_F(FilesystemTest, Chmod_PersistsAcrossRemountWithoutTouchingRealFile) {
    filesystem->chmod("/a.txt", 0600);
    EXPECT_EQ(filesystem->getattr("/a.txt").st_mode, static_cast<mode_t>(S_IFREG | 0600));

    remount();

    EXPECT_EQ(filesystem->getattr("/a.txt").st_mode, static_cast<mode_t>(S_IFREG | 0600));
    EXPECT_EQ(dir.realMode("a.txt"), static_cast<mode_t>(S_IFREG | 0644));
}

TEST_F(FilesystemTest, Chown_PersistsAcrossRemount) {
    filesystem->chown("/d", 1000, 1000);
    remount();

    const auto st = filesystem->getattr("/d");
    EXPECT_EQ(st.st_uid, 1000u);
    EXPECT_EQ(st.st_gid, 1000u);
    EXPECT_EQ(st.st_mode, static_cast<mode_t>(S_IFDIR | 0755));
}

TEST_F(FilesystemTest, Chown_MinusOneKeepsCurrentValue) {
    filesystem->chown("/a.txt", 1000, 2000);
    filesystem->chown("/a.txt", static_cast<uid_t>(-1), 3000);

    const auto st = filesystem->getattr("/a.txt");
    EXPECT_EQ(st.st_uid, 1000u);
    EXPECT_EQ(st.st_gid, 3000u);
}

TEST_F(FilesystemTest, ChownThenChmodEqualsChmodThenChown) {
    dir.writeFile("b.txt", "beta", 0644);

    filesystem->chown("/a.txt", 5, 6);
    filesystem->chmod("/a.txt", 0400);
    filesystem->chmod("/b.txt", 0400);
    filesystem->chown("/b.txt", 5, 6);

    const auto a = filesystem->getattr("/a.txt");
    const auto b = filesystem->getattr("/b.txt");
    EXPECT_EQ(a.st_uid, b.st_uid);
    EXPECT_EQ(a.st_gid, b.st_gid);
    EXPECT_EQ(a.st_mode, b.st_mode);
}

TEST_F(FilesystemTest, Chmod_MissingPathIsEnoent) {
    EXPECT_EQ(errnoOf([&] { filesystem->chmod("/nope", 0600); }), ENOENT);
    EXPECT_FALSE(filesystem->store().find("/nope").has_value());
}

TEST_F(FilesystemTest, Readlink_TargetAtSourceRootIsDot) {
    ASSERT_EQ(::symlink(dir.path().c_str(), (dir.path() / "self").c_str()), 0);
    EXPECT_EQ(filesystem->readlink("/self"), ".");
}

TEST_F(FilesystemTest, Readlink_AbsoluteTargetInsideRoot) {
    ASSERT_EQ(::symlink((dir.path() / "d" / "x").c_str(), (dir.path() / "lnk").c_str()), 0);
    EXPECT_EQ(filesystem->readlink("/lnk"), "d/x");
}

TEST_F(FilesystemTest, Readlink_RelativeTargetUnchanged) {
    ASSERT_EQ(::symlink("../a.txt", (dir.path() / "d" / "up").c_str()), 0);
    EXPECT_EQ(filesystem->readlink("/d/up"), "../a.txt");
}

TEST_F(FilesystemTest, Symlink_AbsoluteBodyIsStoredUnderSourceRoot) {
    filesystem->symlink("/a.txt", "/abs");
    EXPECT_EQ(stdfs::read_symlink(dir.path() / "abs"), dir.path() / "a.txt");
    EXPECT_EQ(filesystem->readlink("/abs"), "a.txt");
}

TEST_F(FilesystemTest, CreateWriteReadPassthrough) {
    const int fd = filesystem->create("/new.txt", O_RDWR, 0640);
    ASSERT_GE(fd, 0);

    const std::string payload = "hello permfs";
    EXPECT_EQ(filesystem->write(fd, payload.data(), payload.size(), 0), payload.size());
    filesystem->flush(fd);
    filesystem->fsync(fd, true);

    std::string back(payload.size(), '\0');
    EXPECT_EQ(filesystem->read(fd, back.data(), back.size(), 0), payload.size());
    EXPECT_EQ(back, payload);

    filesystem->release(fd);
    EXPECT_EQ(dir.readFile("new.txt"), payload);
}

TEST_F(FilesystemTest, Open_ReadsExistingFile) {
    const int fd = filesystem->open("/a.txt", O_RDONLY);
    char buf[16] = {};
    EXPECT_EQ(filesystem->read(fd, buf, sizeof(buf), 0), 5u);
    EXPECT_EQ(std::string(buf, 5), "alpha");
    filesystem->release(fd);
}

TEST_F(FilesystemTest, Truncate_ByPathAndByHandle) {
    filesystem->truncate("/a.txt", 2);
    EXPECT_EQ(dir.readFile("a.txt"), "al");

    const int fd = filesystem->open("/a.txt", O_RDWR);
    filesystem->truncate("/a.txt", 0, fd);
    filesystem->release(fd);
    EXPECT_EQ(dir.readFile("a.txt"), "");
}

TEST_F(FilesystemTest, OpenHandle_AttributesSurviveUnlink) {
    const int fd = filesystem->create("/gone.txt", O_RDWR, 0644);
    const std::string payload = "still here";
    ASSERT_EQ(filesystem->write(fd, payload.data(), payload.size(), 0), payload.size());
    filesystem->unlink("/gone.txt");

    EXPECT_EQ(errnoOf([&] { (void)filesystem->getattr("/gone.txt"); }), ENOENT);

    const auto st = filesystem->getattr("/gone.txt", fd);
    EXPECT_EQ(st.st_size, static_cast<off_t>(payload.size()));
    EXPECT_EQ(st.st_uid, 0u);
    EXPECT_FALSE(filesystem->store().find("/gone.txt").has_value());

    filesystem->truncate("/gone.txt", 5, fd);
    EXPECT_EQ(filesystem->getattr("/gone.txt", fd).st_size, 5);

    filesystem->chmod("/gone.txt", 0600, fd);
    EXPECT_EQ(filesystem->getattr("/gone.txt", fd).st_mode, static_cast<mode_t>(S_IFREG | 0600));

    timespec times[2];
    times[0].tv_sec = 0;
    times[0].tv_nsec = UTIME_OMIT;
    times[1].tv_sec = 1000000000;
    times[1].tv_nsec = 0;
    filesystem->utimens("/gone.txt", times, fd);
    EXPECT_EQ(filesystem->getattr("/gone.txt", fd).st_mtim.tv_sec, 1000000000);

    filesystem->release(fd);
}

TEST_F(FilesystemTest, MkdirRmdirUnlink) {
    filesystem->mkdir("/made", 0700);
    EXPECT_TRUE(stdfs::is_directory(dir.path() / "made"));
    filesystem->rmdir("/made");
    EXPECT_FALSE(stdfs::exists(dir.path() / "made"));

    filesystem->unlink("/a.txt");
    EXPECT_FALSE(stdfs::exists(dir.path() / "a.txt"));
    EXPECT_EQ(errnoOf([&] { filesystem->unlink("/a.txt"); }), ENOENT);
}

TEST_F(FilesystemTest, Rmdir_NonEmptyIsRejected) {
    dir.writeFile("d/child", "x");
    const int err = errnoOf([&] { filesystem->rmdir("/d"); });
    EXPECT_TRUE(err == ENOTEMPTY || err == EEXIST);
}

TEST_F(FilesystemTest, Mknod_Fifo) {
    filesystem->mknod("/pipe", S_IFIFO | 0644, 0);
    EXPECT_TRUE(S_ISFIFO(dir.realMode("pipe")));
}

TEST_F(FilesystemTest, RenameAndLink) {
    filesystem->rename("/a.txt", "/d/moved.txt");
    EXPECT_EQ(dir.readFile("d/moved.txt"), "alpha");

    filesystem->link("/d/moved.txt", "/hard.txt");
    EXPECT_EQ(dir.readFile("hard.txt"), "alpha");

    EXPECT_EQ(errnoOf([&] { filesystem->rename("/a.txt", "/b.txt"); }), ENOENT);
}

TEST_F(FilesystemTest, Rename_NoReplaceRefusesExistingTarget) {
    dir.writeFile("b.txt", "beta");
    EXPECT_EQ(errnoOf([&] { filesystem->rename("/a.txt", "/b.txt", RENAME_NOREPLACE); }), EEXIST);
}

TEST_F(FilesystemTest, Utimens_SetsModificationTime) {
    timespec times[2];
    times[0].tv_sec = 0;
    times[0].tv_nsec = UTIME_OMIT;
    times[1].tv_sec = 1000000000;
    times[1].tv_nsec = 0;
    filesystem->utimens("/a.txt", times);

    EXPECT_EQ(filesystem->getattr("/a.txt").st_mtim.tv_sec, 1000000000);
}

TEST_F(FilesystemTest, Access_ExistingAndMissing) {
    EXPECT_NO_THROW(filesystem->access("/a.txt", F_OK));
    EXPECT_EQ(errnoOf([&] { filesystem->access("/nope", F_OK); }), ENOENT);
}

TEST_F(FilesystemTest, Statfs_ReportsBlocks) {
    EXPECT_GT(filesystem->statfs("/").f_bsize, 0u);
}

TEST_F(FilesystemTest, Destroy_RunsOnce) {
    filesystem->chmod("/a.txt", 0600);
    filesystem->destroy();
    stdfs::remove(sidecar());

    filesystem->destroy();
    EXPECT_FALSE(stdfs::exists(sidecar()));
}
