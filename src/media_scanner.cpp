#include "core/media_scanner.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <stdexcept>

const std::vector<std::string> MediaScanner::photo_extensions_ = {
    "jpg", "jpeg", "png", "gif", "bmp", "heic", "heif", "webp", "tiff", "tif"};

const std::vector<std::string> MediaScanner::video_extensions_ = {
    "mp4", "mov", "avi", "mkv", "m4v", "3gp", "wmv", "flv", "webm", "mpeg", "mpg"};

bool MediaScanner::isPhotoExtension(const std::string &ext)
{
    return std::find(photo_extensions_.begin(), photo_extensions_.end(), ext) != photo_extensions_.end();
}

bool MediaScanner::isVideoExtension(const std::string &ext)
{
    return std::find(video_extensions_.begin(), video_extensions_.end(), ext) != video_extensions_.end();
}

std::optional<MediaType> MediaScanner::classify(const std::string &file_path, bool include_videos)
{
    std::string ext = FileUtils::getFileExtension(file_path);
    if (isPhotoExtension(ext))
        return MediaType::Photo;
    if (include_videos && isVideoExtension(ext))
        return MediaType::Video;
    return std::nullopt;
}

std::vector<ScannedFile> MediaScanner::scan(const std::string &input_dir, bool include_videos)
{
    std::vector<ScannedFile> files;
    std::string fatal_error;
    size_t ignored = 0;

    FileUtils::listFilesAsObservable(input_dir, true)
        .subscribe(
            [&](const std::string &file_path)
            {
                if (auto type = classify(file_path, include_videos))
                {
                    files.push_back({file_path, *type});
                }
                else
                {
                    ++ignored;
                }
            },
            [&](const std::exception &e)
            {
                fatal_error = e.what();
            });

    if (!fatal_error.empty())
    {
        throw std::runtime_error(fatal_error);
    }

    Logger::info("Scan of " + input_dir + " found " + std::to_string(files.size()) +
                 " media files (" + std::to_string(ignored) + " ignored)");
    return files;
}
