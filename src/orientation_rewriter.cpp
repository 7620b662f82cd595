#include "core/orientation_rewriter.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace
{
    constexpr size_t kExifHeaderSize = 6;
    constexpr uint16_t kOrientationTag = 0x0112;

    struct JpegSegment
    {
        size_t payload_offset = 0;
        size_t payload_size = 0;
    };

    // Locate the first APP1 segment carrying "Exif\0\0"
    std::optional<JpegSegment> findExifSegment(const std::vector<uint8_t> &data)
    {
        if (data.size() < 4 || data[0] != 0xFF || data[1] != 0xD8)
            return std::nullopt;

        size_t pos = 2;
        while (pos + 1 < data.size())
        {
            if (data[pos] != 0xFF)
                return std::nullopt;

            uint8_t marker = data[pos + 1];
            if (marker == 0xFF)
            {
                ++pos; // fill byte
                continue;
            }
            if (marker == 0xD9 || marker == 0xDA)
                return std::nullopt; // EOI or start of scan: no metadata past this point
            if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7))
            {
                pos += 2;
                continue;
            }

            if (pos + 4 > data.size())
                return std::nullopt;
            size_t length = (static_cast<size_t>(data[pos + 2]) << 8) | data[pos + 3];
            if (length < 2 || pos + 2 + length > data.size())
                return std::nullopt;

            JpegSegment segment;
            segment.payload_offset = pos + 4;
            segment.payload_size = length - 2;

            static const uint8_t exif_header[kExifHeaderSize] = {'E', 'x', 'i', 'f', 0, 0};
            if (marker == 0xE1 && segment.payload_size >= kExifHeaderSize &&
                std::equal(exif_header, exif_header + kExifHeaderSize, data.begin() + segment.payload_offset))
            {
                return segment;
            }

            pos += 2 + length;
        }
        return std::nullopt;
    }
}

Orientation OrientationRewriter::orientationFromExif(int value)
{
    switch (value)
    {
    case 1:
        return Orientation::Normal;
    case 3:
        return Orientation::Rotate180;
    case 6:
        return Orientation::Rotate90CW;
    case 8:
        return Orientation::Rotate90CCW;
    default:
        return Orientation::Unknown;
    }
}

bool OrientationRewriter::needsRotation(Orientation orientation)
{
    return orientation == Orientation::Rotate180 ||
           orientation == Orientation::Rotate90CW ||
           orientation == Orientation::Rotate90CCW;
}

cv::Mat OrientationRewriter::applyOrientation(const cv::Mat &image, Orientation orientation)
{
    cv::Mat rotated;
    switch (orientation)
    {
    case Orientation::Rotate180:
        cv::rotate(image, rotated, cv::ROTATE_180);
        return rotated;
    case Orientation::Rotate90CW:
        cv::rotate(image, rotated, cv::ROTATE_90_CLOCKWISE);
        return rotated;
    case Orientation::Rotate90CCW:
        cv::rotate(image, rotated, cv::ROTATE_90_COUNTERCLOCKWISE);
        return rotated;
    case Orientation::Normal:
    case Orientation::Unknown:
        break;
    }
    return image;
}

bool OrientationRewriter::rotateImageFile(const std::string &file_path, int exif_orientation)
{
    Orientation orientation = orientationFromExif(exif_orientation);
    if (!needsRotation(orientation))
        return false;

    // Decode raw pixels; the decoder must not apply the EXIF rotation itself
    cv::Mat image = cv::imread(file_path, cv::IMREAD_UNCHANGED | cv::IMREAD_IGNORE_ORIENTATION);
    if (image.empty())
    {
        throw std::runtime_error("Failed to decode image: " + file_path);
    }

    cv::Mat rotated = applyOrientation(image, orientation);

    // Encode beside the file and swap it in, so a failed write leaves the old bytes
    fs::path target(file_path);
    fs::path staging = target.parent_path() /
                       (target.stem().string() + ".rotating" + target.extension().string());
    bool written = false;
    std::string encode_error;
    try
    {
        written = cv::imwrite(staging.string(), rotated);
    }
    catch (const cv::Exception &e)
    {
        encode_error = e.what();
    }

    std::error_code ec;
    if (!written)
    {
        fs::remove(staging, ec);
        throw std::runtime_error("Failed to encode image: " + file_path +
                                 (encode_error.empty() ? "" : ": " + encode_error));
    }

    fs::rename(staging, target, ec);
    if (ec)
    {
        std::error_code cleanup_ec;
        fs::remove(staging, cleanup_ec);
        throw std::runtime_error("Failed to replace image " + file_path + ": " + ec.message());
    }

    Logger::debug("Rotated pixels of " + file_path + " for orientation " + std::to_string(exif_orientation));
    return true;
}

bool OrientationRewriter::patchOrientationInExif(uint8_t *exif, size_t size)
{
    if (size < kExifHeaderSize + 2)
        return false;

    uint8_t *tiff = exif + kExifHeaderSize;
    size_t tiff_size = size - kExifHeaderSize;

    uint8_t tag[2];
    uint8_t one[2];
    if (tiff[0] == 'I' && tiff[1] == 'I')
    {
        tag[0] = kOrientationTag & 0xFF;
        tag[1] = kOrientationTag >> 8;
        one[0] = 0x01;
        one[1] = 0x00;
    }
    else if (tiff[0] == 'M' && tiff[1] == 'M')
    {
        tag[0] = kOrientationTag >> 8;
        tag[1] = kOrientationTag & 0xFF;
        one[0] = 0x00;
        one[1] = 0x01;
    }
    else
    {
        return false;
    }

    for (size_t i = 0; i + 1 < tiff_size; ++i)
    {
        if (tiff[i] == tag[0] && tiff[i + 1] == tag[1])
        {
            size_t value_pos = i + 8;
            if (value_pos + 2 > tiff_size)
                return false;
            tiff[value_pos] = one[0];
            tiff[value_pos + 1] = one[1];
            return true;
        }
    }
    return false;
}

bool OrientationRewriter::resetOrientationTag(const std::string &file_path)
{
    std::string ext = FileUtils::getFileExtension(file_path);
    if (ext != "jpg" && ext != "jpeg")
        return false;

    std::vector<uint8_t> data;
    {
        std::ifstream in(file_path, std::ios::binary);
        if (!in.is_open())
        {
            throw std::runtime_error("Could not open file: " + file_path);
        }
        data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        if (in.bad())
        {
            throw std::runtime_error("Could not read file: " + file_path);
        }
    }

    auto segment = findExifSegment(data);
    if (!segment)
        return false;

    if (!patchOrientationInExif(data.data() + segment->payload_offset, segment->payload_size))
        return false;

    // The patch keeps every segment length, so the container is rewritten byte for byte
    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
    {
        throw std::runtime_error("Could not open file for writing: " + file_path);
    }
    out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out)
    {
        throw std::runtime_error("Could not write file: " + file_path);
    }

    Logger::debug("Reset EXIF orientation of " + file_path);
    return true;
}
