#include "refkit/io/path.hpp"
#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace refkit::io;

TEST(PathNormalizeTest, EmptyIsCurrentDirectory) {
    EXPECT_EQ(normalize(""), ".");
}

TEST(PathNormalizeTest, CollapsesParentSegments) {
    EXPECT_EQ(normalize("/a/b/../c"), "/a/c");
    EXPECT_EQ(normalize("a/b/../../c"), "c");
    EXPECT_EQ(normalize("a/b/c/../../d/./e"), "a/d/e");
}

TEST(PathNormalizeTest, RelativePathKeepsLeadingParents) {
    EXPECT_EQ(normalize("../a"), "../a");
    EXPECT_EQ(normalize("../../a/b"), "../../a/b");
    EXPECT_EQ(normalize("a/../../b"), "../b");
    EXPECT_EQ(normalize("a/.."), ".");
}

TEST(PathNormalizeTest, AbsolutePathNeverClimbsAboveRoot) {
    EXPECT_EQ(normalize("/../a"), "/a");
    EXPECT_EQ(normalize("/a/../../b"), "/b");
    EXPECT_EQ(normalize("/.."), "/");
}

TEST(PathNormalizeTest, DropsEmptyAndCurrentSegments) {
    EXPECT_EQ(normalize("a//b"), "a/b");
    EXPECT_EQ(normalize("./a/./b"), "a/b");
    EXPECT_EQ(normalize("//a///b"), "/a/b");
    EXPECT_EQ(normalize("."), ".");
    EXPECT_EQ(normalize("/"), "/");
}

TEST(PathNormalizeTest, PreservesTrailingSeparator) {
    EXPECT_EQ(normalize("/a/b/"), "/a/b/");
    EXPECT_EQ(normalize("/a/b"), "/a/b");
    EXPECT_EQ(normalize("a/b/../"), "a/");
    EXPECT_EQ(normalize("./"), "./");
}

TEST(PathNormalizeTest, DotsInsideNamesAreOrdinary) {
    EXPECT_EQ(normalize("a/.../b"), "a/.../b");
    EXPECT_EQ(normalize("a/..b/c"), "a/..b/c");
    EXPECT_EQ(normalize("a/b./../c"), "a/c");
}

TEST(PathNormalizeTest, DecodesPercentEscapes) {
    EXPECT_EQ(normalize("a%20b/c"), "a b/c");
    EXPECT_EQ(normalize("a/%2E%2E/b"), "b");
    EXPECT_EQ(normalize("caf%C3%A9.yaml"), "caf\xC3\xA9.yaml");
}

TEST(PathNormalizeTest, MalformedEscapesAreKept) {
    EXPECT_EQ(normalize("a%zz/../b"), "b");
    EXPECT_EQ(normalize("100%/x"), "100%/x");
    EXPECT_EQ(normalize("a%E0/b"), "a%E0/b");
    EXPECT_EQ(normalize("dir/%/../f"), "dir/f");
}

TEST(PathNormalizeTest, DecodingCanBeDisabled) {
    EXPECT_EQ(normalize("a%20b/../c", false), "c");
    EXPECT_EQ(normalize("a%20b", false), "a%20b");
}

TEST(PathNormalizeTest, IsIdempotent) {
    const std::vector<std::string> paths = {
        "",         ".",          "./",      "/",         "//",
        "a",        "a/",         "/a/b/",   "../a",      "../../",
        "/../a",    "a/b/../../c", "a//b/./c", "/a/./b/..", "x/../..",
        "a b/c",    "a%zz/b",     "...",     "a/.../../b"};
    for (const auto& path : paths) {
        const auto once = normalize(path);
        EXPECT_EQ(normalize(once), once) << "path: '" << path << "'";
    }
}

TEST(PosixNormalizeTest, AboveRootDependsOnFlag) {
    EXPECT_EQ(posixNormalize("../a", true), "../a");
    EXPECT_EQ(posixNormalize("../a", false), "a");
    EXPECT_EQ(posixNormalize("", true), "");
    EXPECT_EQ(posixNormalize("/a/b/", false), "a/b");
}

TEST(RelativePathTest, ReplacesFileNameOfBase) {
    EXPECT_EQ(relativePath("foo.yaml", "dir/bar.yaml"), "dir/foo.yaml");
    EXPECT_EQ(relativePath("../foo.yaml", "dir/sub/bar.yaml"),
              "dir/foo.yaml");
    EXPECT_EQ(relativePath("./x/y.json", "/root/a.json"), "/root/x/y.json");
}

TEST(RelativePathTest, BaseWithoutDirectory) {
    EXPECT_EQ(relativePath("foo.yaml", "bar.yaml"), "foo.yaml");
}

TEST(RelativePathTest, MissingPartsFallBack) {
    EXPECT_EQ(relativePath("a/./b.yaml"), "a/b.yaml");
    EXPECT_EQ(relativePath("", "dir/./bar.yaml"), "dir/bar.yaml");
    EXPECT_EQ(relativePath(""), ".");
}

TEST(FilenameTest, ReturnsLastSegment) {
    EXPECT_EQ(filename("dir/sub/file.yaml"), "file.yaml");
    EXPECT_EQ(filename("file.yaml"), "file.yaml");
    EXPECT_EQ(filename("dir/"), "");
    EXPECT_EQ(filename(""), "");
}
