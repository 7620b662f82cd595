#include "core/copy_pipeline.hpp"
#include "core/filename_builder.hpp"
#include "core/hierarchy_path_builder.hpp"
#include "core/thread_pool_manager.hpp"
#include "logging/logger.hpp"
#include <atomic>
#include <functional>

namespace fs = std::filesystem;

CopyPipeline::CopyPipeline(fs::path output_root,
                           std::optional<fs::path> backup_dir,
                           bool parallel,
                           int max_threads)
    : output_root_(std::move(output_root)),
      backup_dir_(std::move(backup_dir)),
      parallel_(parallel),
      max_threads_(max_threads)
{
}

CopyOutcome CopyPipeline::run(std::vector<MediaRecord> &records)
{
    if (backup_dir_)
    {
        std::error_code ec;
        fs::create_directories(*backup_dir_, ec);
        if (ec)
        {
            Logger::warn("Cannot create backup directory " + backup_dir_->string() + ": " + ec.message());
        }
    }

    // One slot per record keeps workers on disjoint memory
    std::vector<std::optional<std::string>> record_errors(records.size());
    std::atomic<size_t> processed{0};

    ThreadPoolManager::forEachIndex(records.size(), parallel_, max_threads_,
                                    [&](size_t i)
                                    {
                                        record_errors[i] = processRecord(records[i]);
                                        if (!record_errors[i])
                                        {
                                            processed.fetch_add(1, std::memory_order_relaxed);
                                        }
                                    });

    CopyOutcome outcome;
    outcome.processed_files = processed.load();
    outcome.copied.reserve(records.size());
    for (auto &error : record_errors)
    {
        outcome.copied.push_back(!error.has_value());
        if (error)
        {
            outcome.errors.push_back(std::move(*error));
        }
    }

    Logger::info("Copied " + std::to_string(outcome.processed_files) + " of " +
                 std::to_string(records.size()) + " files to " + output_root_.string() +
                 " (" + std::to_string(outcome.errors.size()) + " errors)");
    return outcome;
}

std::optional<std::string> CopyPipeline::processRecord(MediaRecord &record)
{
    if (backup_dir_)
    {
        if (auto error = backupRecord(record))
        {
            Logger::warn(*error);
            return error;
        }
    }

    fs::path target_dir;
    try
    {
        target_dir = HierarchyPathBuilder::createDirectory(output_root_, record.date_taken);
    }
    catch (const fs::filesystem_error &e)
    {
        std::string error = "Failed to create directory for " + record.original_path + ": " + e.code().message();
        Logger::warn(error);
        return error;
    }

    std::string file_name = record.new_name.empty() ? FilenameBuilder::build(record) : record.new_name;
    fs::path target = reserveTarget(target_dir, file_name);

    std::error_code ec;
    fs::copy_file(record.original_path, target, fs::copy_options::none, ec);
    if (ec)
    {
        releaseTarget(target);
        std::string error = "Failed to copy " + record.original_path + ": " + ec.message();
        Logger::warn(error);
        return error;
    }

    record.new_path = target.string();
    Logger::debug("Copied " + record.original_path + " -> " + record.new_path);
    return std::nullopt;
}

std::optional<std::string> CopyPipeline::backupRecord(const MediaRecord &record)
{
    fs::path backup_path = *backup_dir_ / record.file_name;
    size_t slot = std::hash<std::string>{}(record.file_name) % backup_mutexes_.size();

    std::lock_guard<std::mutex> lock(backup_mutexes_[slot]);
    std::error_code ec;
    fs::copy_file(record.original_path, backup_path, fs::copy_options::overwrite_existing, ec);
    if (ec)
    {
        return "Failed to backup " + record.original_path + ": " + ec.message();
    }
    return std::nullopt;
}

fs::path CopyPipeline::reserveTarget(const fs::path &dir, const std::string &file_name)
{
    std::lock_guard<std::mutex> lock(reserve_mutex_);

    fs::path candidate = dir / file_name;
    unsigned int counter = 1;
    std::error_code ec;
    while (fs::exists(candidate, ec) || reserved_targets_.count(candidate) > 0)
    {
        candidate = dir / FilenameBuilder::withCounter(file_name, counter);
        ++counter;
    }

    reserved_targets_.insert(candidate);
    return candidate;
}

void CopyPipeline::releaseTarget(const fs::path &target)
{
    std::lock_guard<std::mutex> lock(reserve_mutex_);
    reserved_targets_.erase(target);
}
