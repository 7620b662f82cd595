#pragma once

#include <array>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "core/processing_result.hpp"

/**
 * @brief Per-run copy statistics
 */
struct CopyOutcome
{
    size_t processed_files = 0;
    std::vector<std::string> errors;
    std::vector<bool> copied; // per record, aligned with the input
};

/**
 * @brief Backs up and copies named records into the date hierarchy
 *
 * Each record is handled independently: a failure is recorded and the run
 * moves on. Originals are only ever read.
 */
class CopyPipeline
{
public:
    CopyPipeline(std::filesystem::path output_root,
                 std::optional<std::filesystem::path> backup_dir,
                 bool parallel = true,
                 int max_threads = 0);

    /**
     * @brief Copy every record; sets new_path on success
     * @param records Records with new_name assigned
     * @return Success count and error messages in record order
     */
    CopyOutcome run(std::vector<MediaRecord> &records);

    /**
     * @brief Copy a single record
     * @return Error message on failure
     */
    std::optional<std::string> processRecord(MediaRecord &record);

private:
    std::filesystem::path output_root_;
    std::optional<std::filesystem::path> backup_dir_;
    bool parallel_;
    int max_threads_;

    // Target paths claimed in this run but possibly not yet written
    std::mutex reserve_mutex_;
    std::set<std::filesystem::path> reserved_targets_;

    // Serializes backups that share a file name
    std::array<std::mutex, 16> backup_mutexes_;

    std::optional<std::string> backupRecord(const MediaRecord &record);
    std::filesystem::path reserveTarget(const std::filesystem::path &dir, const std::string &file_name);
    void releaseTarget(const std::filesystem::path &target);
};
