#pragma once

#include <filesystem>
#include "core/date_time_utils.hpp"

/**
 * @brief Maps a timestamp to output_root/YYYY/YYYY-MM/YYYY-MM-DD
 */
class HierarchyPathBuilder
{
public:
    static std::filesystem::path buildDirectory(const std::filesystem::path &output_root, const Timestamp &ts);

    /**
     * @brief Build the directory and create it with its parents; existing directories are fine
     * @throws std::filesystem::filesystem_error if creation fails
     */
    static std::filesystem::path createDirectory(const std::filesystem::path &output_root, const Timestamp &ts);
};
