#include "core/timestamp_resolver.hpp"
#include "logging/logger.hpp"

std::optional<Timestamp> TimestampResolver::exifDate(const ExifMetadata &exif)
{
    if (exif.date_time_original)
    {
        if (auto ts = DateTimeUtils::parseExifDateTime(*exif.date_time_original))
            return ts;
    }
    if (exif.date_time)
    {
        return DateTimeUtils::parseExifDateTime(*exif.date_time);
    }
    return std::nullopt;
}

TimestampSources TimestampResolver::gatherSources(const std::string &file_path, MediaType media_type,
                                                  const std::optional<FileMetadata> &file_metadata)
{
    TimestampSources sources;

    if (media_type == MediaType::Photo)
    {
        sources.exif = ExifReader::read(file_path);
    }
    else
    {
        VideoMetadataResult video = VideoMetadataExtractor::extract(file_path);
        if (video.success)
        {
            sources.video = video.metadata;
        }
        else
        {
            Logger::debug(video.error_message);
        }
    }

    sources.filename_date = DateTimeUtils::parseFilenameDate(fs::path(file_path).filename().string());

    if (file_metadata)
    {
        if (file_metadata->creation_time)
        {
            sources.file_created = DateTimeUtils::fromTimeT(*file_metadata->creation_time);
        }
        sources.file_modified = DateTimeUtils::fromTimeT(file_metadata->modification_time);
    }

    return sources;
}

std::optional<MediaRecord> TimestampResolver::applyPriorityChain(MediaRecord record, const TimestampSources &sources)
{
    if (sources.exif)
    {
        const ExifMetadata &exif = *sources.exif;
        record.candidates.exif_date = exifDate(exif);

        if (exif.orientation && *exif.orientation >= 1 && *exif.orientation <= 8)
            record.exif_orientation = exif.orientation;
        if (exif.pixel_x_dimension && *exif.pixel_x_dimension > 0)
            record.width = static_cast<uint32_t>(*exif.pixel_x_dimension);
        if (exif.pixel_y_dimension && *exif.pixel_y_dimension > 0)
            record.height = static_cast<uint32_t>(*exif.pixel_y_dimension);
    }
    else if (sources.video)
    {
        const VideoMetadata &video = *sources.video;
        record.candidates.exif_date = video.creation_time;
        if (video.width > 0)
            record.width = video.width;
        if (video.height > 0)
            record.height = video.height;
        record.duration_ms = video.duration_ms;
    }

    record.candidates.filename_date = sources.filename_date;
    record.candidates.file_created_date = sources.file_created;
    record.candidates.file_modified_date = sources.file_modified;

    if (record.candidates.exif_date)
    {
        record.date_taken = *record.candidates.exif_date;
        record.date_source = DateSource::Exif;

        if (sources.exif)
        {
            const ExifMetadata &exif = *sources.exif;
            const auto &subsec = exif.subsec_time_original ? exif.subsec_time_original : exif.subsec_time;
            if (subsec)
                record.subsecond = DateTimeUtils::parseSubsecond(*subsec);
            record.timezone = exif.offset_time_original ? exif.offset_time_original : exif.offset_time;
        }
        return record;
    }

    if (record.candidates.filename_date)
    {
        record.date_taken = *record.candidates.filename_date;
        record.date_source = DateSource::FileName;
        return record;
    }

    if (record.candidates.file_created_date)
    {
        record.date_taken = *record.candidates.file_created_date;
        record.date_source = DateSource::FileCreated;
        return record;
    }

    if (record.candidates.file_modified_date)
    {
        record.date_taken = *record.candidates.file_modified_date;
        record.date_source = DateSource::FileModified;
        return record;
    }

    return std::nullopt;
}

std::optional<MediaRecord> TimestampResolver::resolve(const std::string &file_path, MediaType media_type)
{
    auto file_metadata = FileUtils::getFileMetadata(file_path);
    if (!file_metadata)
    {
        Logger::debug("Cannot stat " + file_path + ", filesystem tiers unavailable");
    }

    MediaRecord record;
    record.original_path = file_path;
    record.file_name = fs::path(file_path).filename().string();
    record.media_type = media_type;
    record.file_size = file_metadata ? file_metadata->file_size : 0;

    auto resolved = applyPriorityChain(std::move(record), gatherSources(file_path, media_type, file_metadata));
    if (!resolved)
    {
        Logger::debug("No timestamp resolvable for " + file_path + ", dropping");
        return std::nullopt;
    }

    Logger::trace("Resolved " + file_path + " to " + DateTimeUtils::formatIso(resolved->date_taken) +
                  " from " + dateSourceName(resolved->date_source));
    return resolved;
}
