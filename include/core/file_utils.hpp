#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace fs = std::filesystem;

// Simple custom observable implementation
template <typename T>
class SimpleObservable
{
public:
    using Observer = std::function<void(const T &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;

    SimpleObservable(std::function<void(Observer, ErrorHandler, CompleteHandler)> source)
        : source_(std::move(source)) {}

    void subscribe(Observer onNext, ErrorHandler onError = nullptr, CompleteHandler onComplete = nullptr)
    {
        if (source_)
        {
            source_(onNext, onError, onComplete);
        }
    }

    void subscribe(Observer onNext, CompleteHandler onComplete)
    {
        subscribe(onNext, nullptr, onComplete);
    }

private:
    std::function<void(Observer, ErrorHandler, CompleteHandler)> source_;
};

/**
 * @brief Filesystem facts used by the timestamp fallback tiers
 */
struct FileMetadata
{
    std::string file_path;
    std::time_t modification_time = 0;
    std::optional<std::time_t> creation_time; // not every filesystem records a birth time
    uint64_t file_size = 0;

    std::string toString() const;
};

/**
 * @brief File utilities for enumeration and metadata lookup
 */
class FileUtils
{
public:
    /**
     * @brief Get file metadata without reading file content
     * @param file_path Path to the file
     * @return Optional FileMetadata if file exists and is accessible
     */
    static std::optional<FileMetadata> getFileMetadata(const std::string &file_path);

    /**
     * Lists all regular files under a directory as a simple observable stream.
     * Symbolic links are never followed. An unreadable root is reported through
     * the error handler; unreadable entries below it are skipped.
     * @param dir_path Directory path to scan
     * @param recursive Whether to scan recursively
     * @return SimpleObservable that emits file paths
     */
    static SimpleObservable<std::string> listFilesAsObservable(const std::string &dir_path, bool recursive = false);

    /**
     * Scans a directory recursively and calls the provided function for each regular file
     * @param dir_path Directory path to scan
     * @param onNext Function to call for each file found
     */
    static void scanDirectoryRecursively(const std::string &dir_path, std::function<void(const std::string &)> onNext);

    /**
     * Validates if a path is a valid directory
     * @param path Path to validate
     * @return true if path is a valid directory, false otherwise
     */
    static bool isValidDirectory(const std::string &path);

    /**
     * @brief Lower-cased extension without the leading dot ("" if none)
     */
    static std::string getFileExtension(const std::string &file_path);

private:
    static SimpleObservable<std::string> listFilesInternal(const std::string &dir_path, bool recursive);
};
