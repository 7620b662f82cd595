#pragma once

#include <cstdint>
#include <unordered_map>
#include <vector>
#include "core/processing_result.hpp"

struct BurstDetectorConfig
{
    int64_t max_interval_seconds = 3; // largest gap between neighbours in one burst
    size_t min_count = 3;             // smallest run reported as a burst
};

/**
 * @brief A run of shots taken in rapid succession
 */
struct BurstGroup
{
    size_t id = 0;
    std::vector<size_t> indices; // contiguous positions in the input sequence
    Timestamp start_time;
    Timestamp end_time;
    size_t count = 0;
};

/**
 * @brief Segments an ordered timestamp sequence into burst groups
 *
 * Neighbours belong to the same run when 0 <= next - prev <= max_interval_seconds.
 * Runs shorter than min_count are discarded. The input is not sorted here.
 */
class BurstDetector
{
public:
    explicit BurstDetector(BurstDetectorConfig config = BurstDetectorConfig());

    std::vector<BurstGroup> detect(const std::vector<Timestamp> &timestamps) const;

    /**
     * @brief Map every member index to the id of its group
     */
    static std::unordered_map<size_t, size_t> createIndexToGroupMap(const std::vector<BurstGroup> &groups);

    /**
     * @brief Write burst_group_id and 1-based burst_index into the records the groups index
     */
    static void annotate(std::vector<MediaRecord> &records, const std::vector<BurstGroup> &groups);

    const BurstDetectorConfig &config() const { return config_; }

private:
    BurstDetectorConfig config_;

    void closeGroup(std::vector<size_t> &open_group, const std::vector<Timestamp> &timestamps,
                    std::vector<BurstGroup> &groups) const;
};
