#include <gtest/gtest.h>
#include "fs/PathTranslator.hpp"

#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;
using pfs::fs::PathTranslator;

class PathTranslatorTest : public ::testing::Test {
protected:
    PathTranslator paths{"/srv/data"};
};

TEST_F(PathTranslatorTest, ToReal_Root) {
    EXPECT_EQ(paths.toReal("/"), fs::path("/srv/data"));
}

TEST_F(PathTranslatorTest, ToReal_Nested) {
    EXPECT_EQ(paths.toReal("/docs/report.txt"), fs::path("/srv/data/docs/report.txt"));
}

TEST_F(PathTranslatorTest, ToReal_EmptyThrows) {
    EXPECT_THROW((void)paths.toReal(""), std::invalid_argument);
}

TEST_F(PathTranslatorTest, Root_TrailingSlashNormalized) {
    const PathTranslator slashed("/srv/data/");
    EXPECT_EQ(slashed.root(), fs::path("/srv/data"));
    EXPECT_EQ(slashed.toReal("/a"), fs::path("/srv/data/a"));
}

TEST_F(PathTranslatorTest, ToVirtual_Nested) {
    EXPECT_EQ(paths.toVirtual("/srv/data/docs/report.txt"), "/docs/report.txt");
}

TEST_F(PathTranslatorTest, ToVirtual_RootIsSlash) {
    EXPECT_EQ(paths.toVirtual("/srv/data"), "/");
    EXPECT_EQ(paths.toVirtual("/srv/data/"), "/");
}

TEST_F(PathTranslatorTest, ToVirtual_OutsideThrows) {
    EXPECT_THROW((void)paths.toVirtual("/etc/passwd"), std::invalid_argument);
    EXPECT_THROW((void)paths.toVirtual("/srv/database"), std::invalid_argument);
}

TEST_F(PathTranslatorTest, ToVirtual_InvertsToReal) {
    for (const std::string v : {"/a", "/a/b/c", "/.hidden"})
        EXPECT_EQ(paths.toVirtual(paths.toReal(v)), v);
}

TEST_F(PathTranslatorTest, Rescope_RelativeUnchanged) {
    EXPECT_EQ(paths.rescopeLinkTarget("../sibling"), "../sibling");
    EXPECT_EQ(paths.rescopeLinkTarget("file.txt"), "file.txt");
}

TEST_F(PathTranslatorTest, Rescope_RootIsDot) {
    EXPECT_EQ(paths.rescopeLinkTarget("/srv/data"), ".");
}

TEST_F(PathTranslatorTest, Rescope_InsideRoot) {
    EXPECT_EQ(paths.rescopeLinkTarget("/srv/data/docs/report.txt"), "docs/report.txt");
}

TEST_F(PathTranslatorTest, Rescope_OutsideRootClimbsOut) {
    EXPECT_EQ(paths.rescopeLinkTarget("/etc/passwd"), "../../etc/passwd");
}

TEST_F(PathTranslatorTest, Contains) {
    EXPECT_TRUE(paths.contains("/srv/data"));
    EXPECT_TRUE(paths.contains("/srv/data/x"));
    EXPECT_FALSE(paths.contains("/srv/datax"));
    EXPECT_FALSE(paths.contains("/srv"));
}

TEST_F(PathTranslatorTest, Join) {
    EXPECT_EQ(PathTranslator::join("/", "a"), "/a");
    EXPECT_EQ(PathTranslator::join("/a", "b"), "/a/b");
    EXPECT_EQ(PathTranslator::join("/a/", "b"), "/a/b");
}
