#pragma once

#include <optional>
#include <string>
#include "core/exif_reader.hpp"
#include "core/file_utils.hpp"
#include "core/processing_result.hpp"
#include "core/video_metadata_extractor.hpp"

/**
 * @brief Everything the priority chain can draw a date from, gathered for one file
 */
struct TimestampSources
{
    std::optional<ExifMetadata> exif;   // photos
    std::optional<VideoMetadata> video; // videos
    std::optional<Timestamp> filename_date;
    std::optional<Timestamp> file_created;
    std::optional<Timestamp> file_modified;
};

/**
 * @brief Resolves the capture timestamp of a media file
 *
 * Priority chain, first success wins:
 *  1. embedded metadata (EXIF DateTimeOriginal then DateTime; container creation time for videos)
 *  2. date pattern in the file name
 *  3. filesystem creation time
 *  4. filesystem modification time
 * A file for which no tier succeeds gets no record.
 */
class TimestampResolver
{
public:
    /**
     * @brief Build the record for one file
     * @return std::nullopt if no tier produced a date or the file vanished
     */
    static std::optional<MediaRecord> resolve(const std::string &file_path, MediaType media_type);

    /**
     * @brief Collect the inputs of every tier for a file
     */
    static TimestampSources gatherSources(const std::string &file_path, MediaType media_type,
                                          const std::optional<FileMetadata> &file_metadata);

    /**
     * @brief Apply the priority chain to already gathered sources
     * @param record Record with path, name, type and size filled in
     * @return The completed record, or std::nullopt if every tier failed
     */
    static std::optional<MediaRecord> applyPriorityChain(MediaRecord record, const TimestampSources &sources);

    /**
     * @brief EXIF date with DateTimeOriginal preferred over DateTime
     */
    static std::optional<Timestamp> exifDate(const ExifMetadata &exif);
};
