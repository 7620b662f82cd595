#pragma once

#include <optional>
#include <string>
#include "core/burst_detector.hpp"

/**
 * @brief Options of one scan or process call
 */
struct ProcessOptions
{
    bool parallel = true;
    bool include_videos = true;
    std::optional<std::string> backup_dir;
    std::optional<int> timezone_offset; // reserved, not applied
    bool cleanup_temp = false;          // reserved, no effect
    bool auto_correct_orientation = false;
    int max_threads = 0; // 0 = TBB default
    BurstDetectorConfig burst;
};
