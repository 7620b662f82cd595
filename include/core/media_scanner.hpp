#pragma once

#include <optional>
#include <string>
#include <vector>
#include "core/processing_result.hpp"

/**
 * @brief A regular file under the input root that classified as media
 */
struct ScannedFile
{
    std::string path;
    MediaType media_type;
};

/**
 * @brief Walks an input tree and classifies files by extension
 */
class MediaScanner
{
public:
    /**
     * @brief Enumerate media files under a root, in traversal order
     * @param input_dir Root directory (symbolic links are not followed)
     * @param include_videos Whether video extensions are classified as media
     * @return Classified files
     * @throws std::runtime_error if the root cannot be enumerated
     */
    static std::vector<ScannedFile> scan(const std::string &input_dir, bool include_videos);

    /**
     * @brief Classify a path by its lower-cased extension
     * @return std::nullopt for ignored files
     */
    static std::optional<MediaType> classify(const std::string &file_path, bool include_videos);

    static bool isPhotoExtension(const std::string &ext);
    static bool isVideoExtension(const std::string &ext);

private:
    static const std::vector<std::string> photo_extensions_;
    static const std::vector<std::string> video_extensions_;
};
