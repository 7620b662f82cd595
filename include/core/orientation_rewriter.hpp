#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

/**
 * @brief Rotation implied by an EXIF Orientation value
 */
enum class Orientation
{
    Normal,      // 1
    Rotate180,   // 3
    Rotate90CW,  // 6
    Rotate90CCW, // 8
    Unknown      // anything else, no rotation
};

/**
 * @brief Bakes EXIF orientation into pixels and resets the Orientation tag
 */
class OrientationRewriter
{
public:
    static Orientation orientationFromExif(int value);

    static bool needsRotation(Orientation orientation);

    /**
     * @brief Rotate a decoded image; Normal and Unknown return the input unchanged
     */
    static cv::Mat applyOrientation(const cv::Mat &image, Orientation orientation);

    /**
     * @brief Decode, rotate and re-encode an image file
     *
     * The new encoding is written to a sibling file and renamed over the
     * original, which is left as it was on any failure.
     * @return true if the file was rewritten, false if no rotation was needed
     * @throws std::runtime_error on decode, encode or rename failure
     */
    static bool rotateImageFile(const std::string &file_path, int exif_orientation);

    /**
     * @brief Set the EXIF Orientation of a JPEG file to 1
     *
     * Non-JPEG files, files without an EXIF segment and EXIF data without the
     * tag are left untouched.
     * @return true if the file was patched
     * @throws std::runtime_error if the file cannot be read or written
     */
    static bool resetOrientationTag(const std::string &file_path);

    /**
     * @brief Patch the Orientation value inside an APP1 EXIF payload
     *
     * The payload starts with the 6-byte "Exif\0\0" header followed by the TIFF
     * data. The first byte-order-encoded 0x0112 found scanning the TIFF data is
     * taken as the tag, and the 2 bytes 8 bytes after it receive the value 1.
     * @return true if a value was written
     */
    static bool patchOrientationInExif(uint8_t *exif, size_t size);

    static bool patchOrientationInExif(std::vector<uint8_t> &exif)
    {
        return patchOrientationInExif(exif.data(), exif.size());
    }
};
