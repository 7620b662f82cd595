#pragma once

#include <optional>
#include <string>

/**
 * @brief Raw EXIF tag values relevant to timestamp resolution
 */
struct ExifMetadata
{
    std::optional<std::string> date_time_original;
    std::optional<std::string> date_time;
    std::optional<std::string> subsec_time_original;
    std::optional<std::string> subsec_time;
    std::optional<std::string> offset_time_original;
    std::optional<std::string> offset_time;
    std::optional<int> orientation;
    std::optional<int> pixel_x_dimension;
    std::optional<int> pixel_y_dimension;
};

/**
 * @brief Reads EXIF tags through Exiv2
 */
class ExifReader
{
public:
    /**
     * @brief Read the EXIF block of an image file
     * @param file_path Path to the image
     * @return std::nullopt if the file has no readable EXIF container (corrupt data included)
     */
    static std::optional<ExifMetadata> read(const std::string &file_path);
};
