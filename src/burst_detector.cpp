#include "core/burst_detector.hpp"
#include "logging/logger.hpp"

BurstDetector::BurstDetector(BurstDetectorConfig config)
    : config_(config)
{
}

std::vector<BurstGroup> BurstDetector::detect(const std::vector<Timestamp> &timestamps) const
{
    std::vector<BurstGroup> groups;
    if (timestamps.empty())
        return groups;

    std::vector<size_t> open_group{0};
    Timestamp last = timestamps[0];

    for (size_t i = 1; i < timestamps.size(); ++i)
    {
        // Full precision, never truncated to whole seconds
        Timestamp::duration delta = timestamps[i] - last;
        if (delta >= Timestamp::duration::zero() && delta <= std::chrono::seconds(config_.max_interval_seconds))
        {
            open_group.push_back(i);
        }
        else
        {
            closeGroup(open_group, timestamps, groups);
            open_group.assign(1, i);
        }
        last = timestamps[i];
    }
    closeGroup(open_group, timestamps, groups);

    Logger::debug("Burst detection over " + std::to_string(timestamps.size()) + " timestamps found " +
                  std::to_string(groups.size()) + " groups");
    return groups;
}

void BurstDetector::closeGroup(std::vector<size_t> &open_group, const std::vector<Timestamp> &timestamps,
                               std::vector<BurstGroup> &groups) const
{
    if (open_group.size() < config_.min_count)
        return;

    BurstGroup group;
    group.id = groups.size();
    group.start_time = timestamps[open_group.front()];
    group.end_time = timestamps[open_group.back()];
    group.count = open_group.size();
    group.indices = std::move(open_group);
    groups.push_back(std::move(group));
}

std::unordered_map<size_t, size_t> BurstDetector::createIndexToGroupMap(const std::vector<BurstGroup> &groups)
{
    std::unordered_map<size_t, size_t> map;
    for (const auto &group : groups)
    {
        for (size_t index : group.indices)
        {
            map[index] = group.id;
        }
    }
    return map;
}

void BurstDetector::annotate(std::vector<MediaRecord> &records, const std::vector<BurstGroup> &groups)
{
    for (const auto &group : groups)
    {
        for (size_t position = 0; position < group.indices.size(); ++position)
        {
            MediaRecord &record = records.at(group.indices[position]);
            record.burst_group_id = group.id;
            record.burst_index = position + 1;
        }
    }
}
