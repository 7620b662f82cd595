#include "core/exif_reader.hpp"
#include "logging/logger.hpp"
#include <exiv2/exiv2.hpp>
#include <exiv2/error.hpp>
#include <mutex>

namespace
{
    std::optional<std::string> findString(const Exiv2::ExifData &exif_data, const char *key)
    {
        auto it = exif_data.findKey(Exiv2::ExifKey(key));
        if (it == exif_data.end() || it->count() == 0)
            return std::nullopt;

        std::string value = it->toString();
        while (!value.empty() && (value.back() == '\0' || value.back() == ' '))
            value.pop_back();
        if (value.empty())
            return std::nullopt;
        return value;
    }

    std::optional<int> findInt(const Exiv2::ExifData &exif_data, const char *key)
    {
        auto value = findString(exif_data, key);
        if (!value)
            return std::nullopt;
        try
        {
            return std::stoi(*value);
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }
    }
}

std::optional<ExifMetadata> ExifReader::read(const std::string &file_path)
{
    // The XMP toolkit must be set up before readers run on several threads
    static std::once_flag init_flag;
    std::call_once(init_flag, []
                   {
                       Exiv2::LogMsg::setLevel(Exiv2::LogMsg::mute);
                       Exiv2::XmpParser::initialize();
                   });

    try
    {
        auto image = Exiv2::ImageFactory::open(file_path);
        if (!image.get())
            return std::nullopt;
        image->readMetadata();

        const Exiv2::ExifData &exif_data = image->exifData();
        if (exif_data.empty())
            return std::nullopt;

        ExifMetadata metadata;
        metadata.date_time_original = findString(exif_data, "Exif.Photo.DateTimeOriginal");
        metadata.date_time = findString(exif_data, "Exif.Image.DateTime");
        metadata.subsec_time_original = findString(exif_data, "Exif.Photo.SubSecTimeOriginal");
        metadata.subsec_time = findString(exif_data, "Exif.Photo.SubSecTime");
        metadata.offset_time_original = findString(exif_data, "Exif.Photo.OffsetTimeOriginal");
        metadata.offset_time = findString(exif_data, "Exif.Photo.OffsetTime");
        metadata.orientation = findInt(exif_data, "Exif.Image.Orientation");
        metadata.pixel_x_dimension = findInt(exif_data, "Exif.Photo.PixelXDimension");
        metadata.pixel_y_dimension = findInt(exif_data, "Exif.Photo.PixelYDimension");
        return metadata;
    }
    catch (const Exiv2::Error &e)
    {
        Logger::debug("No EXIF data in " + file_path + ": " + e.what());
        return std::nullopt;
    }
    catch (const std::exception &e)
    {
        Logger::debug("Unreadable EXIF container in " + file_path + ": " + e.what());
        return std::nullopt;
    }
}
