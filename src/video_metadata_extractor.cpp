#include "core/video_metadata_extractor.hpp"
#include "core/external_library_wrappers.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <mutex>

extern "C"
{
#include <libavutil/dict.h>
#include <libavutil/log.h>
#include <libavutil/parseutils.h>
}

std::optional<Timestamp> VideoMetadataExtractor::parseCreationTime(const std::string &value)
{
    int64_t micros = 0;
    if (av_parse_time(&micros, value.c_str(), 0) < 0)
    {
        return std::nullopt;
    }
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::microseconds(micros)));
}

VideoMetadataResult VideoMetadataExtractor::extract(const std::string &file_path)
{
    static std::once_flag quiet_flag;
    std::call_once(quiet_flag, []
                   { av_log_set_level(AV_LOG_QUIET); });

    AVFormatInput input;
    if (!input.open(file_path))
    {
        return VideoMetadataResult(false, "Failed to parse video container: " + file_path);
    }

    AVDictionaryEntry *tag = av_dict_get(input->metadata, "creation_time", nullptr, 0);
    if (!tag || !tag->value)
    {
        return VideoMetadataResult(false, "No creation time in video container: " + file_path);
    }

    auto creation_time = parseCreationTime(tag->value);
    if (!creation_time)
    {
        return VideoMetadataResult(false, "Invalid creation time '" + std::string(tag->value) +
                                              "' in video container: " + file_path);
    }

    VideoMetadataResult result(true);
    result.metadata.creation_time = *creation_time;

    // The mov demuxer stores the track id as the stream id
    for (unsigned int i = 0; i < input->nb_streams; ++i)
    {
        const AVStream *stream = input->streams[i];
        if (stream->id == 1 && stream->codecpar)
        {
            result.metadata.width = static_cast<uint32_t>(std::max(stream->codecpar->width, 0));
            result.metadata.height = static_cast<uint32_t>(std::max(stream->codecpar->height, 0));
            break;
        }
    }

    if (input->duration != AV_NOPTS_VALUE && input->duration > 0)
    {
        result.metadata.duration_ms = static_cast<uint64_t>(input->duration / (AV_TIME_BASE / 1000));
    }

    Logger::debug("Video metadata for " + file_path + ": " +
                  std::to_string(result.metadata.width) + "x" + std::to_string(result.metadata.height) +
                  ", " + std::to_string(result.metadata.duration_ms) + " ms");
    return result;
}
