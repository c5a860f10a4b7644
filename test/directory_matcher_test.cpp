#include <gtest/gtest.h>

#include "directory_matcher.hpp"
#include "memory_filesystem.hpp"

namespace
{
    std::shared_ptr<MemoryFileSystem> treeWith(std::initializer_list<const char *> dirs)
    {
        auto tree = MemoryFileSystem::create();
        for (const char *dir : dirs)
            tree->addDirectory(dir);
        return tree;
    }
}

TEST(DirectoryMatcherTest, RecognisesPatternNames)
{
    EXPECT_TRUE(DirectoryMatcher::isPatternName("{x}"));
    EXPECT_TRUE(DirectoryMatcher::isPatternName("{[0-9]+}"));
    EXPECT_FALSE(DirectoryMatcher::isPatternName("{}"));
    EXPECT_FALSE(DirectoryMatcher::isPatternName("{abc"));
    EXPECT_FALSE(DirectoryMatcher::isPatternName("abc"));
}

TEST(DirectoryMatcherTest, LiteralBeatsMatchingPattern)
{
    auto tree = treeWith({"abc", "{[a-z]+}"});
    DirEntryWithSubmatches entry = DirectoryMatcher::match(*tree, "abc");
    EXPECT_EQ(entry.file.name, "abc");
    EXPECT_TRUE(entry.submatches.empty());
}

TEST(DirectoryMatcherTest, PatternMatchesWholeSegment)
{
    auto tree = treeWith({"{[0-9]+}"});
    EXPECT_EQ(DirectoryMatcher::match(*tree, "42").file.name, "{[0-9]+}");
    EXPECT_THROW((void)DirectoryMatcher::match(*tree, "42a"), NotFoundError);
    EXPECT_THROW((void)DirectoryMatcher::match(*tree, "a42"), NotFoundError);
}

TEST(DirectoryMatcherTest, MoreCapturesWins)
{
    auto tree = treeWith({"{([0-9])([0-9])}", "{[0-9]+}"});
    DirEntryWithSubmatches entry = DirectoryMatcher::match(*tree, "42");
    EXPECT_EQ(entry.file.name, "{([0-9])([0-9])}");
    ASSERT_EQ(entry.submatches.size(), 2u);
    EXPECT_EQ(entry.submatches[0], (KeyValuePair{"", "4"}));
    EXPECT_EQ(entry.submatches[1], (KeyValuePair{"", "2"}));
}

TEST(DirectoryMatcherTest, EqualCapturesKeepsFirstByName)
{
    auto tree = treeWith({"{(?P<b>[0-9]+)}", "{(?P<a>.+)}"});
    DirEntryWithSubmatches entry = DirectoryMatcher::match(*tree, "7");
    EXPECT_EQ(entry.file.name, "{(?P<a>.+)}");
    ASSERT_EQ(entry.submatches.size(), 1u);
    EXPECT_EQ(entry.submatches[0], (KeyValuePair{"a", "7"}));
}

TEST(DirectoryMatcherTest, NamedGroupsInBothSyntaxes)
{
    auto tree = treeWith({"{(?<year>[0-9]{4})-(?P<month>[0-9]{2})}"});
    DirEntryWithSubmatches entry = DirectoryMatcher::match(*tree, "2024-05");
    ASSERT_EQ(entry.submatches.size(), 2u);
    EXPECT_EQ(entry.submatches[0], (KeyValuePair{"year", "2024"}));
    EXPECT_EQ(entry.submatches[1], (KeyValuePair{"month", "05"}));
}

TEST(DirectoryMatcherTest, CaseInsensitiveFlag)
{
    auto tree = treeWith({"{(?i)abc}"});
    EXPECT_EQ(DirectoryMatcher::match(*tree, "ABC").file.name, "{(?i)abc}");
}

TEST(DirectoryMatcherTest, RawPatternNameIsNeverAddressable)
{
    auto tree = treeWith({"{.*}"});
    EXPECT_THROW((void)DirectoryMatcher::match(*tree, "{.*}"), NotFoundError);
}

TEST(DirectoryMatcherTest, FilesDoNotMatch)
{
    auto tree = MemoryFileSystem::create();
    tree->addFile("abc", "x").addFile("{.*}", "x");
    EXPECT_THROW((void)DirectoryMatcher::match(*tree, "abc"), NotFoundError);
    EXPECT_THROW((void)DirectoryMatcher::match(*tree, "zzz"), NotFoundError);
}

TEST(DirectoryMatcherTest, MalformedPatternIsReported)
{
    auto tree = treeWith({"{[0-9}"});
    EXPECT_THROW((void)DirectoryMatcher::match(*tree, "1"), MalformedError);
}

TEST(DirectoryMatcherTest, LiteralSkipsMalformedPatterns)
{
    auto tree = treeWith({"exact", "{(}"});
    EXPECT_EQ(DirectoryMatcher::match(*tree, "exact").file.name, "exact");
}

TEST(DirectoryMatcherTest, ListingFailurePropagates)
{
    auto tree = treeWith({"{.*}"});
    tree->failPath("");
    EXPECT_THROW((void)DirectoryMatcher::match(*tree, "x"), IoError);
}

TEST(DirectoryMatcherTest, UnmatchedOptionalGroupCapturesEmpty)
{
    auto tree = treeWith({"{(a)?(b)}"});
    DirEntryWithSubmatches entry = DirectoryMatcher::match(*tree, "b");
    ASSERT_EQ(entry.submatches.size(), 2u);
    EXPECT_EQ(entry.submatches[0].value, "");
    EXPECT_EQ(entry.submatches[1].value, "b");
}
