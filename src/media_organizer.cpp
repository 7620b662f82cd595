#include "core/media_organizer.hpp"
#include "core/copy_pipeline.hpp"
#include "core/filename_builder.hpp"
#include "core/media_scanner.hpp"
#include "core/orientation_rewriter.hpp"
#include "core/thread_pool_manager.hpp"
#include "core/timestamp_resolver.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <tuple>
#include <opencv2/core.hpp>

std::vector<MediaRecord> MediaOrganizer::scanMedia(const std::string &input_dir, const ProcessOptions &options)
{
    auto start = std::chrono::steady_clock::now();
    std::vector<ScannedFile> files = MediaScanner::scan(input_dir, options.include_videos);
    Logger::info("Resolving timestamps of " + std::to_string(files.size()) + " files on " +
                 std::to_string(ThreadPoolManager::effectiveConcurrency(options.parallel, options.max_threads)) +
                 " threads");

    // Pre-sized slots: each task writes only its own index
    std::vector<std::optional<MediaRecord>> slots(files.size());
    ThreadPoolManager::forEachIndex(files.size(), options.parallel, options.max_threads,
                                    [&](size_t i)
                                    {
                                        slots[i] = TimestampResolver::resolve(files[i].path, files[i].media_type);
                                    });

    std::vector<MediaRecord> records;
    records.reserve(slots.size());
    for (auto &slot : slots)
    {
        if (slot)
        {
            records.push_back(std::move(*slot));
        }
    }

    sortChronologically(records);
    assignBurstsAndNames(records, options.burst);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    Logger::info("Resolved " + std::to_string(records.size()) + " of " + std::to_string(files.size()) +
                 " media files in " + std::to_string(elapsed.count()) + " ms");
    return records;
}

void MediaOrganizer::sortChronologically(std::vector<MediaRecord> &records)
{
    std::stable_sort(records.begin(), records.end(),
                     [](const MediaRecord &a, const MediaRecord &b)
                     {
                         return std::make_tuple(a.date_taken, a.subsecond.value_or(0), std::cref(a.original_path)) <
                                std::make_tuple(b.date_taken, b.subsecond.value_or(0), std::cref(b.original_path));
                     });
}

void MediaOrganizer::assignBurstsAndNames(std::vector<MediaRecord> &records, const BurstDetectorConfig &config)
{
    std::vector<Timestamp> timestamps;
    timestamps.reserve(records.size());
    for (const auto &record : records)
    {
        timestamps.push_back(record.date_taken);
    }

    BurstDetector detector(config);
    std::vector<BurstGroup> groups = detector.detect(timestamps);
    BurstDetector::annotate(records, groups);
    if (!groups.empty())
    {
        Logger::info("Detected " + std::to_string(groups.size()) + " burst groups");
    }

    for (auto &record : records)
    {
        record.new_name = FilenameBuilder::build(record);
    }
}

ProcessResult MediaOrganizer::processMedia(const std::string &input_dir, const std::string &output_dir,
                                           const ProcessOptions &options)
{
    ProcessResult result;
    result.media = scanMedia(input_dir, options);
    result.total_files = result.media.size();

    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec)
    {
        throw std::runtime_error("Cannot create output directory " + output_dir + ": " + ec.message());
    }

    std::optional<std::filesystem::path> backup_dir;
    if (options.backup_dir)
    {
        backup_dir = std::filesystem::path(*options.backup_dir);
    }

    CopyPipeline pipeline(output_dir, backup_dir, options.parallel, options.max_threads);
    CopyOutcome outcome = pipeline.run(result.media);
    result.processed_files = outcome.processed_files;
    result.errors = std::move(outcome.errors);

    if (options.auto_correct_orientation)
    {
        std::vector<std::optional<std::string>> orientation_errors(result.media.size());
        ThreadPoolManager::forEachIndex(result.media.size(), options.parallel, options.max_threads,
                                        [&](size_t i)
                                        {
                                            if (outcome.copied[i])
                                            {
                                                orientation_errors[i] = correctOrientation(result.media[i]);
                                            }
                                        });
        for (auto &error : orientation_errors)
        {
            if (error)
            {
                result.errors.push_back(std::move(*error));
            }
        }
    }

    result.success = result.processed_files > 0;
    Logger::info("Processed " + std::to_string(result.processed_files) + "/" + std::to_string(result.total_files) +
                 " files with " + std::to_string(result.errors.size()) + " errors");
    return result;
}

std::optional<std::string> MediaOrganizer::correctOrientation(MediaRecord &record)
{
    if (record.media_type != MediaType::Photo || !record.exif_orientation)
        return std::nullopt;
    if (!OrientationRewriter::needsRotation(OrientationRewriter::orientationFromExif(*record.exif_orientation)))
        return std::nullopt;

    try
    {
        // Only the copy is rewritten; the original stays as it was
        if (OrientationRewriter::rotateImageFile(record.new_path, *record.exif_orientation))
        {
            record.rotation_applied = true;
            if (record.width && record.height && *record.exif_orientation != 3)
            {
                std::swap(record.width, record.height);
            }
            OrientationRewriter::resetOrientationTag(record.new_path);
        }
    }
    catch (const cv::Exception &e)
    {
        std::string error = "Failed to correct orientation of " + record.original_path + ": " + e.what();
        Logger::warn(error);
        return error;
    }
    catch (const std::runtime_error &e)
    {
        std::string error = "Failed to correct orientation of " + record.original_path + ": " + e.what();
        Logger::warn(error);
        return error;
    }
    return std::nullopt;
}
