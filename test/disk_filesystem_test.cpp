#include <gtest/gtest.h>

#include "disk_filesystem.hpp"

class DiskFileSystemTest : public ::testing::Test
{
protected:
    fs::path root;

    void SetUp() override
    {
        root = fs::temp_directory_path() /
               ("arbor_disk_fs_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(root / "pages" / "{slug}");
        write(root / "body.html.tmpl", "hello");
        write(root / "pages" / "{slug}" / "body.html.tmpl", "page");
        write(root / "pages" / "b.txt", "bb");
        write(root / "pages" / "a.txt", "a");
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    static void write(const fs::path &path, const std::string &content)
    {
        std::ofstream out(path, std::ios::binary);
        out << content;
    }
};

TEST_F(DiskFileSystemTest, CreateRequiresDirectory)
{
    EXPECT_THROW((void)DiskFileSystem::create(root / "missing"), std::runtime_error);
    EXPECT_THROW((void)DiskFileSystem::create(root / "body.html.tmpl"), std::runtime_error);
}

TEST_F(DiskFileSystemTest, ReadsFilesAndStats)
{
    auto disk = DiskFileSystem::create(root);
    EXPECT_EQ(disk->open("body.html.tmpl")->readAll(), "hello");

    FileInfo info = disk->stat("pages/b.txt");
    EXPECT_EQ(info.name, "b.txt");
    EXPECT_FALSE(info.isDirectory);
    EXPECT_EQ(info.size, 2u);
    EXPECT_TRUE(disk->stat("pages").isDirectory);
}

TEST_F(DiskFileSystemTest, ListIsSortedByName)
{
    auto disk = DiskFileSystem::create(root);
    std::vector<FileInfo> entries = disk->list("pages");
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].name, "a.txt");
    EXPECT_EQ(entries[1].name, "b.txt");
    EXPECT_EQ(entries[2].name, "{slug}");
    EXPECT_TRUE(entries[2].isDirectory);
}

TEST_F(DiskFileSystemTest, MissingAndEscapingPathsAreNotFound)
{
    auto disk = DiskFileSystem::create(root);
    EXPECT_THROW((void)disk->open("nope"), NotFoundError);
    EXPECT_THROW((void)disk->open("body.html.tmpl/x"), NotFoundError);
    EXPECT_THROW((void)disk->open("../etc/passwd"), NotFoundError);
    EXPECT_THROW((void)disk->open("/etc/passwd"), NotFoundError);
    EXPECT_THROW((void)disk->list("nope"), NotFoundError);
    EXPECT_THROW((void)disk->open("pages"), NotFoundError);
}

TEST_F(DiskFileSystemTest, SubScopesToDirectory)
{
    auto disk = DiskFileSystem::create(root);
    auto slug = disk->sub("pages")->sub("{slug}");
    EXPECT_EQ(slug->open("body.html.tmpl")->readAll(), "page");
    EXPECT_FALSE(slug->exists("a.txt"));
}
