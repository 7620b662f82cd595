#pragma once

#include <chrono>
#include <ctime>
#include <optional>
#include <string>

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Broken-down wall clock time, interpreted in the local time zone
 */
struct CivilDateTime
{
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
};

/**
 * @brief Date parsing and formatting helpers shared by the resolver and the naming stage
 */
class DateTimeUtils
{
public:
    /**
     * @brief Check calendar ranges (month 1-12, day within month incl. leap years, 24h clock)
     */
    static bool isValidCivil(const CivilDateTime &civil);

    /**
     * @brief Convert a local wall clock time to a timestamp
     * @return std::nullopt if the calendar values are invalid
     */
    static std::optional<Timestamp> fromLocalCivil(const CivilDateTime &civil);

    /**
     * @brief Parse an EXIF date string of the form "YYYY:MM:DD HH:MM:SS"
     */
    static std::optional<Timestamp> parseExifDateTime(const std::string &value);

    /**
     * @brief Extract a date from a file name
     *
     * Patterns are tried in order and the first one yielding a valid date wins:
     * YYYYMMDD[_-]HHMMSS, YYYY-MM-DD[_T]HH-MM-SS, bare YYYYMMDD (midnight).
     */
    static std::optional<Timestamp> parseFilenameDate(const std::string &file_name);

    /**
     * @brief Parse a SubSecTime value as an integer in [0, 999]
     */
    static std::optional<int> parseSubsecond(const std::string &value);

    static Timestamp fromTimeT(std::time_t value);

    // "YYYY-MM-DD_HH-MM-SS"
    static std::string formatForFilename(const Timestamp &ts);

    // "YYYY-MM-DDTHH:MM:SS"
    static std::string formatIso(const Timestamp &ts);

    // strftime with the timestamp in local time
    static std::string format(const Timestamp &ts, const char *pattern);

private:
    static std::tm toLocalTm(const Timestamp &ts);
};
