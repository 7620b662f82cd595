#include "core/processing_result.hpp"

const char *mediaTypeName(MediaType type)
{
    switch (type)
    {
    case MediaType::Photo:
        return "Photo";
    case MediaType::Video:
        return "Video";
    }
    return "Photo";
}

const char *dateSourceName(DateSource source)
{
    switch (source)
    {
    case DateSource::Exif:
        return "Exif";
    case DateSource::FileName:
        return "FileName";
    case DateSource::FileCreated:
        return "FileCreated";
    case DateSource::FileModified:
        return "FileModified";
    }
    return "FileModified";
}
