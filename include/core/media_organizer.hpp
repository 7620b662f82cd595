#pragma once

#include <string>
#include <vector>
#include "core/process_options.hpp"
#include "core/processing_result.hpp"

/**
 * @brief Runs the scan and process stages over an input tree.
 *
 * Error Handling Policy:
 * - An input root that cannot be enumerated (or an output root that cannot be
 *   created) throws std::runtime_error and aborts the call.
 * - Per-file failures are logged and collected in ProcessResult::errors; they
 *   never abort the batch.
 * - Files without any resolvable date are dropped without an error.
 */
class MediaOrganizer
{
public:
    /**
     * @brief Resolve, order, burst-group and name every media file under input_dir
     *
     * Records come back sorted by (date_taken, subsecond, original_path); burst
     * detection runs over that order so traversal order does not matter.
     * @throws std::runtime_error if input_dir cannot be enumerated
     */
    static std::vector<MediaRecord> scanMedia(const std::string &input_dir, const ProcessOptions &options);

    /**
     * @brief Scan, then back up and copy every record into output_dir/YYYY/YYYY-MM/YYYY-MM-DD
     * @throws std::runtime_error if input_dir cannot be enumerated or output_dir cannot be created
     */
    static ProcessResult processMedia(const std::string &input_dir, const std::string &output_dir,
                                      const ProcessOptions &options);

    /**
     * @brief Stable chronological order used before burst detection
     */
    static void sortChronologically(std::vector<MediaRecord> &records);

    /**
     * @brief Burst-annotate and name records that are already in chronological order
     */
    static void assignBurstsAndNames(std::vector<MediaRecord> &records, const BurstDetectorConfig &config);

private:
    static std::optional<std::string> correctOrientation(MediaRecord &record);
};
