#include <gtest/gtest.h>
#include "core/date_time_utils.hpp"

namespace
{
    Timestamp local(int y, int mo, int d, int h = 0, int mi = 0, int s = 0)
    {
        CivilDateTime civil{y, mo, d, h, mi, s};
        auto ts = DateTimeUtils::fromLocalCivil(civil);
        EXPECT_TRUE(ts.has_value());
        return ts.value_or(Timestamp());
    }
}

TEST(DateTimeUtilsTest, CalendarValidation)
{
    EXPECT_TRUE(DateTimeUtils::isValidCivil({2024, 2, 29, 23, 59, 59}));
    EXPECT_FALSE(DateTimeUtils::isValidCivil({2023, 2, 29, 0, 0, 0}));
    EXPECT_FALSE(DateTimeUtils::isValidCivil({2024, 13, 1, 0, 0, 0}));
    EXPECT_FALSE(DateTimeUtils::isValidCivil({2024, 4, 31, 0, 0, 0}));
    EXPECT_FALSE(DateTimeUtils::isValidCivil({2024, 1, 1, 24, 0, 0}));
    EXPECT_FALSE(DateTimeUtils::isValidCivil({2024, 1, 0, 0, 0, 0}));
}

TEST(DateTimeUtilsTest, ParsesExifDateTime)
{
    auto ts = DateTimeUtils::parseExifDateTime("2024:06:17 14:30:52");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(*ts, local(2024, 6, 17, 14, 30, 52));

    EXPECT_FALSE(DateTimeUtils::parseExifDateTime("0000:00:00 00:00:00").has_value());
    EXPECT_FALSE(DateTimeUtils::parseExifDateTime("2024-06-17 14:30:52").has_value());
    EXPECT_FALSE(DateTimeUtils::parseExifDateTime("").has_value());
}

TEST(DateTimeUtilsTest, FilenameCompactPattern)
{
    auto ts = DateTimeUtils::parseFilenameDate("IMG_20240617_143052.jpg");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(*ts, local(2024, 6, 17, 14, 30, 52));

    auto dashed = DateTimeUtils::parseFilenameDate("PXL_20240617-143052.jpg");
    ASSERT_TRUE(dashed.has_value());
    EXPECT_EQ(*dashed, local(2024, 6, 17, 14, 30, 52));
}

TEST(DateTimeUtilsTest, FilenameIsoLikePattern)
{
    auto underscore = DateTimeUtils::parseFilenameDate("Screenshot 2023-12-01_08-15-00.png");
    ASSERT_TRUE(underscore.has_value());
    EXPECT_EQ(*underscore, local(2023, 12, 1, 8, 15, 0));

    auto t_separator = DateTimeUtils::parseFilenameDate("2023-12-01T08-15-00.heic");
    ASSERT_TRUE(t_separator.has_value());
    EXPECT_EQ(*t_separator, local(2023, 12, 1, 8, 15, 0));
}

TEST(DateTimeUtilsTest, FilenameDateOnlyIsMidnight)
{
    auto ts = DateTimeUtils::parseFilenameDate("scan_20220305.tif");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(*ts, local(2022, 3, 5));
}

TEST(DateTimeUtilsTest, FilenameInvalidCalendarIsRejected)
{
    EXPECT_FALSE(DateTimeUtils::parseFilenameDate("20241317_101010.jpg").has_value());
    EXPECT_FALSE(DateTimeUtils::parseFilenameDate("IMG_0001.jpg").has_value());
    EXPECT_FALSE(DateTimeUtils::parseFilenameDate("holiday.jpg").has_value());
}

TEST(DateTimeUtilsTest, FilenameFallsBackWhenTimeIsInvalid)
{
    // The time part is out of range, the date part alone still parses
    auto ts = DateTimeUtils::parseFilenameDate("20240617_256000.jpg");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(*ts, local(2024, 6, 17));
}

TEST(DateTimeUtilsTest, SubsecondParsing)
{
    EXPECT_EQ(DateTimeUtils::parseSubsecond("123"), 123);
    EXPECT_EQ(DateTimeUtils::parseSubsecond("07"), 7);
    EXPECT_EQ(DateTimeUtils::parseSubsecond(" 5 "), 5);
    EXPECT_FALSE(DateTimeUtils::parseSubsecond("1234").has_value());
    EXPECT_FALSE(DateTimeUtils::parseSubsecond("").has_value());
    EXPECT_FALSE(DateTimeUtils::parseSubsecond("12a").has_value());
}

TEST(DateTimeUtilsTest, Formatting)
{
    Timestamp ts = local(2024, 6, 7, 4, 5, 6);
    EXPECT_EQ(DateTimeUtils::formatForFilename(ts), "2024-06-07_04-05-06");
    EXPECT_EQ(DateTimeUtils::formatIso(ts), "2024-06-07T04:05:06");
    EXPECT_EQ(DateTimeUtils::format(ts, "%Y-%m"), "2024-06");
}
