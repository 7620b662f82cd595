#include <gtest/gtest.h>
#include "core/exif_reader.hpp"
#include "core/media_organizer.hpp"
#include "test_base.hpp"
#include <opencv2/imgcodecs.hpp>

class MediaOrganizerTest : public TestBase
{
protected:
    void createBurstTree()
    {
        // Traversal order differs from capture order on purpose
        createFile("b/20240617_143052.jpg", "third");
        createFile("a/20240617_143050.jpg", "first");
        createFile("20240617_143051.png", "second");
        createFile("c/d/20240617_143053.jpg", "fourth");
        createFile("20240101_120000.jpg", "lonely");
        createFile("notes.txt", "not media");
    }

    static std::vector<std::string> newNames(const std::vector<MediaRecord> &records)
    {
        std::vector<std::string> names;
        for (const auto &record : records)
        {
            names.push_back(record.new_name);
        }
        return names;
    }
};

TEST_F(MediaOrganizerTest, ScanOrdersChronologicallyAndNamesBursts)
{
    createBurstTree();

    auto records = MediaOrganizer::scanMedia(input_dir_.string(), ProcessOptions());

    ASSERT_EQ(records.size(), 5u);
    EXPECT_EQ(newNames(records),
              (std::vector<std::string>{"2024-01-01_12-00-00.jpg",
                                        "2024-06-17_14-30-50_01.jpg",
                                        "2024-06-17_14-30-51_02.png",
                                        "2024-06-17_14-30-52_03.jpg",
                                        "2024-06-17_14-30-53_04.jpg"}));

    EXPECT_FALSE(records[0].burst_group_id.has_value());
    for (size_t i = 1; i < records.size(); ++i)
    {
        EXPECT_EQ(records[i].burst_group_id, 0u);
        EXPECT_EQ(records[i].burst_index, i);
        EXPECT_EQ(records[i].date_source, DateSource::FileName);
        EXPECT_TRUE(records[i].new_path.empty());
    }
}

TEST_F(MediaOrganizerTest, ProcessCopiesIntoDateHierarchy)
{
    createBurstTree();

    ProcessResult result = MediaOrganizer::processMedia(input_dir_.string(), output_dir_.string(), ProcessOptions());

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.total_files, 5u);
    EXPECT_EQ(result.processed_files, 5u);
    EXPECT_TRUE(result.errors.empty());

    fs::path june = output_dir_ / "2024" / "2024-06" / "2024-06-17";
    EXPECT_EQ(listFileNames(june),
              (std::vector<std::string>{"2024-06-17_14-30-50_01.jpg",
                                        "2024-06-17_14-30-51_02.png",
                                        "2024-06-17_14-30-52_03.jpg",
                                        "2024-06-17_14-30-53_04.jpg"}));
    EXPECT_EQ(readFile(june / "2024-06-17_14-30-50_01.jpg"), "first");
    EXPECT_EQ(listFileNames(output_dir_ / "2024" / "2024-01" / "2024-01-01"),
              (std::vector<std::string>{"2024-01-01_12-00-00.jpg"}));

    for (const auto &record : result.media)
    {
        EXPECT_TRUE(fs::exists(record.new_path));
        EXPECT_TRUE(fs::exists(record.original_path));
    }
    EXPECT_EQ(readFile(input_dir_ / "b" / "20240617_143052.jpg"), "third");
}

TEST_F(MediaOrganizerTest, SameTimestampInDifferentFoldersGetsCounter)
{
    createFile("one/20240617_143052.jpg", "one");
    createFile("two/20240617_143052.jpg", "two");

    ProcessResult result = MediaOrganizer::processMedia(input_dir_.string(), output_dir_.string(), ProcessOptions());

    EXPECT_EQ(result.processed_files, 2u);
    EXPECT_EQ(listFileNames(output_dir_ / "2024" / "2024-06" / "2024-06-17"),
              (std::vector<std::string>{"2024-06-17_14-30-52.jpg", "2024-06-17_14-30-52_01.jpg"}));
}

TEST_F(MediaOrganizerTest, SequentialAndParallelAgree)
{
    createBurstTree();

    ProcessOptions parallel;
    ProcessOptions sequential;
    sequential.parallel = false;

    auto parallel_records = MediaOrganizer::scanMedia(input_dir_.string(), parallel);
    auto sequential_records = MediaOrganizer::scanMedia(input_dir_.string(), sequential);
    EXPECT_EQ(newNames(parallel_records), newNames(sequential_records));
}

TEST_F(MediaOrganizerTest, VideosFollowTheIncludeFlag)
{
    createFile("clip_20240617_143052.mp4", "not a real container");
    createFile("20240617_150000.jpg", "photo");

    ProcessOptions options;
    auto with_videos = MediaOrganizer::scanMedia(input_dir_.string(), options);
    ASSERT_EQ(with_videos.size(), 2u);
    EXPECT_EQ(with_videos[0].media_type, MediaType::Video);
    EXPECT_EQ(with_videos[0].new_name, "2024-06-17_14-30-52.mp4");

    options.include_videos = false;
    auto photos_only = MediaOrganizer::scanMedia(input_dir_.string(), options);
    ASSERT_EQ(photos_only.size(), 1u);
    EXPECT_EQ(photos_only[0].media_type, MediaType::Photo);
}

TEST_F(MediaOrganizerTest, EmptyTreeIsNotASuccess)
{
    createFile("readme.md", "nothing to organize");

    ProcessResult result = MediaOrganizer::processMedia(input_dir_.string(), output_dir_.string(), ProcessOptions());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.total_files, 0u);
    EXPECT_TRUE(result.media.empty());
}

TEST_F(MediaOrganizerTest, UnusableBackupDirectoryFailsEveryFile)
{
    createFile("20240617_143052.jpg", "one");
    createFile("20240618_143052.jpg", "two");
    fs::path blocker = root_dir_ / "backup_is_a_file";
    std::ofstream(blocker) << "x";

    ProcessOptions options;
    options.backup_dir = blocker.string();
    ProcessResult result = MediaOrganizer::processMedia(input_dir_.string(), output_dir_.string(), options);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.total_files, 2u);
    EXPECT_EQ(result.processed_files, 0u);
    ASSERT_EQ(result.errors.size(), 2u);
    for (const auto &error : result.errors)
    {
        EXPECT_EQ(error.rfind("Failed to backup ", 0), 0u);
    }
}

TEST_F(MediaOrganizerTest, MissingInputRootIsFatal)
{
    std::string missing = (root_dir_ / "does_not_exist").string();
    EXPECT_THROW(MediaOrganizer::scanMedia(missing, ProcessOptions()), std::runtime_error);
    EXPECT_THROW(MediaOrganizer::processMedia(missing, output_dir_.string(), ProcessOptions()), std::runtime_error);
}

TEST_F(MediaOrganizerTest, AutoOrientRotatesOnlyTheCopy)
{
    auto original = createJpegWithExif("IMG_0042.jpg",
                                       {{"Exif.Photo.DateTimeOriginal", "2024:06:17 09:00:00"},
                                        {"Exif.Photo.PixelXDimension", "8"},
                                        {"Exif.Photo.PixelYDimension", "4"}},
                                       6, 8, 4);

    ProcessOptions options;
    options.auto_correct_orientation = true;
    ProcessResult result = MediaOrganizer::processMedia(input_dir_.string(), output_dir_.string(), options);

    ASSERT_EQ(result.media.size(), 1u);
    EXPECT_TRUE(result.errors.empty());
    const MediaRecord &record = result.media[0];
    EXPECT_TRUE(record.rotation_applied);
    EXPECT_EQ(record.width, 4u);
    EXPECT_EQ(record.height, 8u);

    cv::Mat copy = cv::imread(record.new_path, cv::IMREAD_UNCHANGED | cv::IMREAD_IGNORE_ORIENTATION);
    EXPECT_EQ(copy.cols, 4);
    EXPECT_EQ(copy.rows, 8);

    // The copy no longer asks viewers to rotate it again
    auto copy_exif = ExifReader::read(record.new_path);
    if (copy_exif && copy_exif->orientation)
    {
        EXPECT_EQ(*copy_exif->orientation, 1);
    }

    auto original_exif = ExifReader::read(original.string());
    ASSERT_TRUE(original_exif.has_value());
    EXPECT_EQ(original_exif->orientation, 6);
}

TEST_F(MediaOrganizerTest, SortIsStableOnTiesAndUsesPathLast)
{
    Timestamp ts = *DateTimeUtils::fromLocalCivil(CivilDateTime{2024, 6, 17, 14, 30, 52});
    std::vector<MediaRecord> records(3);
    records[0].original_path = "/in/z.jpg";
    records[0].date_taken = ts;
    records[1].original_path = "/in/a.jpg";
    records[1].date_taken = ts;
    records[1].subsecond = 500;
    records[2].original_path = "/in/m.jpg";
    records[2].date_taken = ts;

    MediaOrganizer::sortChronologically(records);
    EXPECT_EQ(records[0].original_path, "/in/m.jpg");
    EXPECT_EQ(records[1].original_path, "/in/z.jpg");
    EXPECT_EQ(records[2].original_path, "/in/a.jpg");
}

TEST_F(MediaOrganizerTest, ParallelScanReadsExifFromJpegsWithXmp)
{
    const int file_count = 12;
    for (int i = 0; i < file_count; ++i)
    {
        std::string minute = (i < 10 ? "0" : "") + std::to_string(i);
        createJpegWithExif("shots/IMG_" + std::to_string(i) + ".jpg",
                           {{"Exif.Photo.DateTimeOriginal", "2024:06:17 10:" + minute + ":00"}},
                           0, 8, 4,
                           {{"Xmp.dc.title", "shot " + std::to_string(i)},
                            {"Xmp.xmp.Rating", "3"}});
    }

    ProcessOptions options;
    options.max_threads = 4;
    auto records = MediaOrganizer::scanMedia(input_dir_.string(), options);

    ASSERT_EQ(records.size(), static_cast<size_t>(file_count));
    for (int i = 0; i < file_count; ++i)
    {
        std::string minute = (i < 10 ? "0" : "") + std::to_string(i);
        EXPECT_EQ(records[i].date_source, DateSource::Exif);
        EXPECT_EQ(records[i].new_name, "2024-06-17_10-" + minute + "-00.jpg");
        EXPECT_FALSE(records[i].burst_group_id.has_value());
    }
}
