#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "core/date_time_utils.hpp"

struct VideoMetadata
{
    Timestamp creation_time;
    uint32_t width = 0;
    uint32_t height = 0;
    uint64_t duration_ms = 0;
};

/**
 * @brief Video metadata extraction result
 */
struct VideoMetadataResult
{
    bool success;
    std::string error_message;
    VideoMetadata metadata;

    VideoMetadataResult() : success(false) {}
    VideoMetadataResult(bool s, const std::string &msg = "")
        : success(s), error_message(msg) {}
};

/**
 * @brief Reads container-level metadata of MP4/QuickTime files through libavformat
 *
 * The creation time comes from the movie header box. QuickTime counts seconds
 * from 1904-01-01; the mov demuxer subtracts 2082844800 s before exporting it
 * as the "creation_time" tag, and drops a zero header value.
 */
class VideoMetadataExtractor
{
public:
    /**
     * @brief Extract creation time, track 1 dimensions and duration
     * @param file_path Path to the video file
     * @return Result with success=false if the container cannot be parsed
     *         or carries no valid creation time
     */
    static VideoMetadataResult extract(const std::string &file_path);

    /**
     * @brief Parse an FFmpeg "creation_time" tag (ISO 8601, UTC)
     */
    static std::optional<Timestamp> parseCreationTime(const std::string &value);
};
