#include <gtest/gtest.h>
#include "core/file_utils.hpp"
#include "test_base.hpp"
#include <string>
#include <vector>

class FileUtilsTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        createFile("file1.txt");
        createFile("file2.txt");
        createFile("subdir1/file3.txt");
        createFile("subdir2/nested/file4.txt");
    }

    std::vector<std::string> collect(const std::string &dir, bool recursive, bool &completed, bool &error_occurred)
    {
        std::vector<std::string> files;
        FileUtils::listFilesAsObservable(dir, recursive)
            .subscribe(
                [&files](const std::string &file_path)
                {
                    files.push_back(fs::path(file_path).filename().string());
                },
                [&error_occurred](const std::exception &)
                {
                    error_occurred = true;
                },
                [&completed]()
                {
                    completed = true;
                });
        std::sort(files.begin(), files.end());
        return files;
    }
};

TEST_F(FileUtilsTest, ListFilesNonRecursive)
{
    bool completed = false;
    bool error_occurred = false;
    auto files = collect(input_dir_.string(), false, completed, error_occurred);

    EXPECT_EQ(files, (std::vector<std::string>{"file1.txt", "file2.txt"}));
    EXPECT_TRUE(completed);
    EXPECT_FALSE(error_occurred);
}

TEST_F(FileUtilsTest, ListFilesRecursive)
{
    bool completed = false;
    bool error_occurred = false;
    auto files = collect(input_dir_.string(), true, completed, error_occurred);

    EXPECT_EQ(files, (std::vector<std::string>{"file1.txt", "file2.txt", "file3.txt", "file4.txt"}));
    EXPECT_TRUE(completed);
    EXPECT_FALSE(error_occurred);
}

TEST_F(FileUtilsTest, SymlinksAreNotFollowed)
{
    fs::path outside = root_dir_ / "outside";
    fs::create_directories(outside);
    std::ofstream(outside / "linked.txt") << "x";

    fs::create_directory_symlink(outside, input_dir_ / "dir_link");
    fs::create_symlink(input_dir_ / "file1.txt", input_dir_ / "file_link.txt");

    bool completed = false;
    bool error_occurred = false;
    auto files = collect(input_dir_.string(), true, completed, error_occurred);

    EXPECT_EQ(files, (std::vector<std::string>{"file1.txt", "file2.txt", "file3.txt", "file4.txt"}));
    EXPECT_TRUE(completed);
}

TEST_F(FileUtilsTest, InvalidDirectory)
{
    bool completed = false;
    bool error_occurred = false;
    auto files = collect((root_dir_ / "nonexistent_dir").string(), true, completed, error_occurred);

    EXPECT_TRUE(files.empty());
    EXPECT_TRUE(error_occurred);
    EXPECT_FALSE(completed);
}

TEST_F(FileUtilsTest, FileMetadataReportsSizeAndModificationTime)
{
    auto path = createFile("sized.bin", std::string(1234, 'a'));
    setModificationTime(path, 1600000000);

    auto metadata = FileUtils::getFileMetadata(path.string());
    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->file_size, 1234u);
    EXPECT_EQ(metadata->modification_time, 1600000000);
    EXPECT_FALSE(FileUtils::getFileMetadata((input_dir_ / "missing.bin").string()).has_value());
}

TEST_F(FileUtilsTest, FileExtensionExtraction)
{
    EXPECT_EQ(FileUtils::getFileExtension("test.jpg"), "jpg");
    EXPECT_EQ(FileUtils::getFileExtension("dir/test.PNG"), "png");
    EXPECT_EQ(FileUtils::getFileExtension("archive.tar.GZ"), "gz");
    EXPECT_EQ(FileUtils::getFileExtension("test"), "");
}
