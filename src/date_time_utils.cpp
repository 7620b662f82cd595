#include "core/date_time_utils.hpp"
#include <cctype>
#include <regex>

namespace
{
    bool isLeapYear(int year)
    {
        return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    }

    int daysInMonth(int year, int month)
    {
        static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (month == 2 && isLeapYear(year))
            return 29;
        return days[month - 1];
    }

    int toInt(const std::ssub_match &match)
    {
        return std::stoi(match.str());
    }
}

bool DateTimeUtils::isValidCivil(const CivilDateTime &civil)
{
    if (civil.year < 1900 || civil.year > 9999)
        return false;
    if (civil.month < 1 || civil.month > 12)
        return false;
    if (civil.day < 1 || civil.day > daysInMonth(civil.year, civil.month))
        return false;
    if (civil.hour < 0 || civil.hour > 23)
        return false;
    if (civil.minute < 0 || civil.minute > 59)
        return false;
    if (civil.second < 0 || civil.second > 59)
        return false;
    return true;
}

std::optional<Timestamp> DateTimeUtils::fromLocalCivil(const CivilDateTime &civil)
{
    if (!isValidCivil(civil))
        return std::nullopt;

    std::tm tm{};
    tm.tm_year = civil.year - 1900;
    tm.tm_mon = civil.month - 1;
    tm.tm_mday = civil.day;
    tm.tm_hour = civil.hour;
    tm.tm_min = civil.minute;
    tm.tm_sec = civil.second;
    tm.tm_isdst = -1;

    std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1))
        return std::nullopt;
    return fromTimeT(t);
}

std::optional<Timestamp> DateTimeUtils::parseExifDateTime(const std::string &value)
{
    static const std::regex exif_re(R"(^\s*(\d{4}):(\d{2}):(\d{2}) (\d{2}):(\d{2}):(\d{2}))");
    std::smatch match;
    if (!std::regex_search(value, match, exif_re))
        return std::nullopt;

    CivilDateTime civil;
    civil.year = toInt(match[1]);
    civil.month = toInt(match[2]);
    civil.day = toInt(match[3]);
    civil.hour = toInt(match[4]);
    civil.minute = toInt(match[5]);
    civil.second = toInt(match[6]);
    return fromLocalCivil(civil);
}

std::optional<Timestamp> DateTimeUtils::parseFilenameDate(const std::string &file_name)
{
    static const std::regex compact_re(R"((\d{4})(\d{2})(\d{2})[_-](\d{2})(\d{2})(\d{2}))");
    static const std::regex dashed_re(R"((\d{4})-(\d{2})-(\d{2})[_T](\d{2})-(\d{2})-(\d{2}))");
    static const std::regex date_only_re(R"((\d{4})(\d{2})(\d{2}))");

    std::smatch match;
    for (const std::regex *re : {&compact_re, &dashed_re})
    {
        if (std::regex_search(file_name, match, *re))
        {
            CivilDateTime civil;
            civil.year = toInt(match[1]);
            civil.month = toInt(match[2]);
            civil.day = toInt(match[3]);
            civil.hour = toInt(match[4]);
            civil.minute = toInt(match[5]);
            civil.second = toInt(match[6]);
            if (auto ts = fromLocalCivil(civil))
                return ts;
        }
    }

    if (std::regex_search(file_name, match, date_only_re))
    {
        CivilDateTime civil;
        civil.year = toInt(match[1]);
        civil.month = toInt(match[2]);
        civil.day = toInt(match[3]);
        return fromLocalCivil(civil);
    }

    return std::nullopt;
}

std::optional<int> DateTimeUtils::parseSubsecond(const std::string &value)
{
    std::string digits;
    for (char c : value)
    {
        if (std::isspace(static_cast<unsigned char>(c)) || c == '\0')
            continue;
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return std::nullopt;
        digits.push_back(c);
    }
    if (digits.empty() || digits.size() > 9)
        return std::nullopt;

    int value_ms = std::stoi(digits);
    if (value_ms > 999)
        return std::nullopt;
    return value_ms;
}

Timestamp DateTimeUtils::fromTimeT(std::time_t value)
{
    return std::chrono::system_clock::from_time_t(value);
}

std::string DateTimeUtils::formatForFilename(const Timestamp &ts)
{
    return format(ts, "%Y-%m-%d_%H-%M-%S");
}

std::string DateTimeUtils::formatIso(const Timestamp &ts)
{
    return format(ts, "%Y-%m-%dT%H:%M:%S");
}

std::string DateTimeUtils::format(const Timestamp &ts, const char *pattern)
{
    std::tm tm = toLocalTm(ts);
    char buffer[64];
    size_t written = std::strftime(buffer, sizeof(buffer), pattern, &tm);
    return std::string(buffer, written);
}

std::tm DateTimeUtils::toLocalTm(const Timestamp &ts)
{
    std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}
