#include <gtest/gtest.h>
#include "fuse/Decode.hpp"

#include <string>
#include <vector>

using namespace pfs::fuse;

namespace {

struct stat attrWith(const mode_t mode, const uid_t uid, const gid_t gid, const off_t size) {
    struct stat st{};
    st.st_mode = mode;
    st.st_uid = uid;
    st.st_gid = gid;
    st.st_size = size;
    st.st_atim.tv_sec = 111;
    st.st_mtim.tv_sec = 222;
    return st;
}

const std::vector<std::string> LISTING = {".", "..", "alpha", "beta", "gamma"};

std::size_t fixedSize(std::size_t) { return 32; }

}

TEST(DecodeSetattrTest, NoBitsIsEmpty) {
    EXPECT_TRUE(decodeSetattr(attrWith(S_IFREG | 0600, 1, 2, 3), 0).empty());
}

TEST(DecodeSetattrTest, ModeOnly) {
    const auto u = decodeSetattr(attrWith(S_IFREG | 0600, 1, 2, 3), FUSE_SET_ATTR_MODE);
    ASSERT_TRUE(u.mode.has_value());
    EXPECT_EQ(*u.mode, static_cast<mode_t>(S_IFREG | 0600));
    EXPECT_FALSE(u.owner || u.size || u.times);
}

TEST(DecodeSetattrTest, UidOnlyLeavesGroupUnchanged) {
    const auto u = decodeSetattr(attrWith(0, 1000, 55, 0), FUSE_SET_ATTR_UID);
    ASSERT_TRUE(u.owner.has_value());
    EXPECT_EQ(u.owner->first, 1000u);
    EXPECT_EQ(u.owner->second, static_cast<gid_t>(-1));
}

TEST(DecodeSetattrTest, GidOnlyLeavesOwnerUnchanged) {
    const auto u = decodeSetattr(attrWith(0, 1000, 55, 0), FUSE_SET_ATTR_GID);
    ASSERT_TRUE(u.owner.has_value());
    EXPECT_EQ(u.owner->first, static_cast<uid_t>(-1));
    EXPECT_EQ(u.owner->second, 55u);
}

TEST(DecodeSetattrTest, ModeAndOwnerTogether) {
    const auto u = decodeSetattr(attrWith(S_IFDIR | 0700, 5, 6, 0),
                                 FUSE_SET_ATTR_MODE | FUSE_SET_ATTR_UID | FUSE_SET_ATTR_GID);
    EXPECT_EQ(u.mode.value_or(0), static_cast<mode_t>(S_IFDIR | 0700));
    ASSERT_TRUE(u.owner.has_value());
    EXPECT_EQ(u.owner->first, 5u);
    EXPECT_EQ(u.owner->second, 6u);
}

TEST(DecodeSetattrTest, SizeOnly) {
    const auto u = decodeSetattr(attrWith(0, 0, 0, 4096), FUSE_SET_ATTR_SIZE);
    EXPECT_EQ(u.size.value_or(0), static_cast<off_t>(4096));
    EXPECT_FALSE(u.mode || u.owner || u.times);
}

TEST(DecodeSetattrTest, AtimeNowOmitsMtime) {
    const auto u = decodeSetattr(attrWith(0, 0, 0, 0), FUSE_SET_ATTR_ATIME | FUSE_SET_ATTR_ATIME_NOW);
    ASSERT_TRUE(u.times.has_value());
    EXPECT_EQ((*u.times)[0].tv_nsec, UTIME_NOW);
    EXPECT_EQ((*u.times)[1].tv_nsec, UTIME_OMIT);
}

TEST(DecodeSetattrTest, ExplicitMtimeAndNowAtime) {
    const auto u = decodeSetattr(attrWith(0, 0, 0, 0),
                                 FUSE_SET_ATTR_ATIME_NOW | FUSE_SET_ATTR_MTIME);
    ASSERT_TRUE(u.times.has_value());
    EXPECT_EQ((*u.times)[0].tv_nsec, UTIME_NOW);
    EXPECT_EQ((*u.times)[1].tv_sec, 222);
}

TEST(DecodeSetattrTest, MtimeNowAlone) {
    const auto u = decodeSetattr(attrWith(0, 0, 0, 0), FUSE_SET_ATTR_MTIME_NOW);
    ASSERT_TRUE(u.times.has_value());
    EXPECT_EQ((*u.times)[0].tv_nsec, UTIME_OMIT);
    EXPECT_EQ((*u.times)[1].tv_nsec, UTIME_NOW);
}

TEST(DirentWindowTest, FirstPageStopsOnFullBuffer) {
    const auto w = direntWindow(LISTING.size(), 0, 96, fixedSize);
    EXPECT_EQ(w.first, 0u);
    EXPECT_EQ(w.last, 3u);
}

TEST(DirentWindowTest, ResumedPageReachesLastEntry) {
    const auto w = direntWindow(LISTING.size(), 3, 96, fixedSize);
    EXPECT_EQ(w.first, 3u);
    EXPECT_EQ(w.last, LISTING.size());
}

TEST(DirentWindowTest, ResumeAfterDotKeepsDotDot) {
    const auto w = direntWindow(LISTING.size(), 1, 64, fixedSize);
    ASSERT_EQ(w.size(), 2u);
    EXPECT_EQ(LISTING[w.first], "..");
    EXPECT_EQ(LISTING[w.last - 1], "alpha");
}

TEST(DirentWindowTest, EntryLargerThanBufferYieldsNothing) {
    EXPECT_EQ(direntWindow(LISTING.size(), 0, 16, fixedSize).size(), 0u);
}

TEST(DirentWindowTest, OffsetAtOrPastEndIsEmpty) {
    EXPECT_EQ(direntWindow(LISTING.size(), 5, 4096, fixedSize).size(), 0u);
    EXPECT_EQ(direntWindow(LISTING.size(), 42, 4096, fixedSize).size(), 0u);
    EXPECT_EQ(direntWindow(0, 0, 4096, fixedSize).size(), 0u);
}

TEST(DirentWindowTest, VariableEntrySizes) {
    const std::vector<std::size_t> sizes = {24, 24, 40, 40, 40};
    const auto w = direntWindow(sizes.size(), 0, 100, [&](const std::size_t i) { return sizes[i]; });
    EXPECT_EQ(w.last, 3u);
}

TEST(DirentWindowTest, PagingVisitsEveryEntryOnce) {
    std::vector<std::string> seen;
    off_t off = 0;

    for (int pages = 0; pages < 10; ++pages) {
        const auto w = direntWindow(LISTING.size(), off, 64, fixedSize);
        if (w.size() == 0) break;
        for (auto i = w.first; i < w.last; ++i) seen.push_back(LISTING[i]);
        // The kernel resumes from the next-offset of the last entry it received
        off = static_cast<off_t>(w.last);
    }

    EXPECT_EQ(seen, LISTING);
}
