#include "refkit/pointer/pointer.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace refkit::pointer;
using refkit::type::ObjPath;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(ParsePointerTest, SplitsTokens) {
    EXPECT_THAT(parsePointer("/a/b/0"), ElementsAre("a", "b", "0"));
    EXPECT_THAT(parsePointer("/"), ElementsAre(""));
    EXPECT_THAT(parsePointer("/a//b"), ElementsAre("a", "", "b"));
    EXPECT_THAT(parsePointer(""), IsEmpty());
}

TEST(ParsePointerTest, DiscardsTextBeforeFirstSeparator) {
    EXPECT_THAT(parsePointer("#/a"), ElementsAre("a"));
    EXPECT_THAT(parsePointer("abc"), IsEmpty());
}

TEST(ParsePointerTest, UnescapesSlashBeforeTilde) {
    EXPECT_THAT(parsePointer("/a~1b/c~0d"), ElementsAre("a/b", "c~d"));
    EXPECT_THAT(parsePointer("/~01"), ElementsAre("~1"));
    EXPECT_THAT(parsePointer("/~10"), ElementsAre("/0"));
}

TEST(ParsePointerTest, DecodesPercentEscapes) {
    EXPECT_THAT(parsePointer("/a%20b/%7Bid%7D"), ElementsAre("a b", "{id}"));
}

TEST(ParsePointerTest, DecodesBytesThatAreNotUtf8) {
    EXPECT_THAT(parsePointer("/%FF~1~0/a~01b"),
                ElementsAre("\xFF/~", "a~1b"));
}

TEST(ParsePointerTest, KeepsUndecodableTokens) {
    EXPECT_THAT(parsePointer("/50%/a~1b%zz"), ElementsAre("50%", "a/b%zz"));
}

TEST(BuildPointerTest, EmptyTokensGiveEmptyPointer) {
    EXPECT_EQ(buildPointer(std::vector<std::string>{}), "");
    EXPECT_EQ(buildPointer(ObjPath{}), "");
}

TEST(BuildPointerTest, EscapesTildeAndSlash) {
    const std::vector<std::string> tokens = {"a/b", "c~d"};
    EXPECT_EQ(buildPointer(tokens), "/a~1b/c~0d");
}

TEST(BuildPointerTest, PercentEncodesTokens) {
    const std::vector<std::string> tokens = {"paths", "/pets/{id}", "50%"};
    EXPECT_EQ(buildPointer(tokens), "/paths/~1pets~1%7Bid%7D/50%25");
}

TEST(BuildPointerTest, AcceptsObjectPaths) {
    EXPECT_EQ(buildPointer(ObjPath{"items", 2, "a/b"}), "/items/2/a~1b");
}

TEST(BuildPointerTest, RoundTripsThroughParse) {
    const std::vector<std::vector<std::string>> samples = {
        {"a/b", "c~d"},
        {"~1", "~0", "/~", "~/"},
        {"", "", "x"},
        {"%25", "a b", "{\"k\": 1}", "caf\xC3\xA9"},
        {"\xFF", "\xFF/~", "a~1b", "\xC3"},
    };
    for (const auto& tokens : samples) {
        EXPECT_EQ(parsePointer(buildPointer(tokens)), tokens);
    }
}

TEST(BuildRefTest, EmptyPathGivesFileOrHash) {
    EXPECT_EQ(buildRef({}), "#");
    EXPECT_EQ(buildRef({}, "doc.yaml"), "doc.yaml");
}

TEST(BuildRefTest, JoinsFileAndPointer) {
    EXPECT_EQ(buildRef({"components", "schemas", "Pet"}),
              "#/components/schemas/Pet");
    EXPECT_EQ(buildRef({"definitions", "a~b"}, "dir/doc.yaml"),
              "dir/doc.yaml#/definitions/a~0b");
}

TEST(ToObjPathTest, DecodesIntoKeys) {
    const ObjPath expected = {"a/b", "0", "c"};
    EXPECT_EQ(toObjPath("/a~1b/0/c"), expected);
    EXPECT_TRUE(toObjPath("").empty());
}
