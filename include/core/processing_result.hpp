#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/date_time_utils.hpp"

enum class MediaType
{
    Photo,
    Video
};

/**
 * @brief Tier of the timestamp priority chain that produced date_taken
 */
enum class DateSource
{
    Exif,
    FileName,
    FileCreated,
    FileModified
};

/**
 * @brief Every tier's candidate date, kept for review even when a higher tier won
 */
struct DateCandidates
{
    std::optional<Timestamp> exif_date;
    std::optional<Timestamp> filename_date;
    std::optional<Timestamp> file_created_date;
    std::optional<Timestamp> file_modified_date;
};

/**
 * @brief One discovered media file with a resolved capture timestamp
 */
struct MediaRecord
{
    std::string original_path;
    std::string file_name;
    MediaType media_type = MediaType::Photo;

    Timestamp date_taken;
    std::optional<int> subsecond;        // milliseconds 0-999
    std::optional<std::string> timezone; // e.g. "+09:00"
    DateSource date_source = DateSource::FileModified;
    DateCandidates candidates;

    std::optional<int> exif_orientation; // 1-8
    bool rotation_applied = false;
    std::optional<uint32_t> width;
    std::optional<uint32_t> height;
    std::optional<uint64_t> duration_ms; // videos only
    uint64_t file_size = 0;

    std::optional<size_t> burst_group_id;
    std::optional<size_t> burst_index; // 1-based

    std::string new_name;
    std::string new_path;
};

/**
 * @brief Outcome of a process run
 */
struct ProcessResult
{
    bool success = false; // true iff processed_files > 0
    size_t total_files = 0;
    size_t processed_files = 0;
    std::vector<MediaRecord> media;
    std::vector<std::string> errors;
};

const char *mediaTypeName(MediaType type);
const char *dateSourceName(DateSource source);
