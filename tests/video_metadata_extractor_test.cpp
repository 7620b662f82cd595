#include <gtest/gtest.h>
#include "core/video_metadata_extractor.hpp"
#include "test_base.hpp"

TEST(VideoMetadataExtractorTest, ParsesUtcCreationTimeTag)
{
    auto ts = VideoMetadataExtractor::parseCreationTime("2024-06-17T14:30:52.000000Z");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(*ts, std::chrono::system_clock::from_time_t(1718634652));

    auto with_micros = VideoMetadataExtractor::parseCreationTime("2024-06-17T14:30:52.250000Z");
    ASSERT_TRUE(with_micros.has_value());
    EXPECT_EQ(*with_micros - *ts, std::chrono::milliseconds(250));
}

TEST(VideoMetadataExtractorTest, RejectsMalformedCreationTime)
{
    EXPECT_FALSE(VideoMetadataExtractor::parseCreationTime("yesterday").has_value());
}

class VideoMetadataExtractorFileTest : public TestBase
{
};

TEST_F(VideoMetadataExtractorFileTest, NonVideoFileFails)
{
    auto path = createFile("clip.mp4", "definitely not an mp4 container");
    VideoMetadataResult result = VideoMetadataExtractor::extract(path.string());
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error_message.empty());
}

TEST_F(VideoMetadataExtractorFileTest, MissingFileFails)
{
    VideoMetadataResult result = VideoMetadataExtractor::extract((input_dir_ / "missing.mov").string());
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error_message.find("missing.mov"), std::string::npos);
}
