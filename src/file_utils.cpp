#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <fcntl.h>

SimpleObservable<std::string> FileUtils::listFilesAsObservable(const std::string &dir_path, bool recursive)
{
    return listFilesInternal(dir_path, recursive);
}

SimpleObservable<std::string> FileUtils::listFilesInternal(const std::string &dir_path, bool recursive)
{
    using Observer = std::function<void(const std::string &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;
    return SimpleObservable<std::string>(
        std::function<void(Observer, ErrorHandler, CompleteHandler)>(
            [dir_path, recursive](Observer onNext, ErrorHandler onError, CompleteHandler onComplete)
            {
                try
                {
                    // Validate directory exists
                    if (!isValidDirectory(dir_path))
                    {
                        std::string msg = "Invalid directory path: " + dir_path;
                        Logger::warn(msg);
                        if (onError)
                        {
                            onError(std::runtime_error(msg));
                        }
                        return;
                    }

                    // The root must be readable; failures below it are skipped
                    fs::directory_iterator root_iterator(dir_path);

                    if (recursive)
                    {
                        scanDirectoryRecursively(dir_path, onNext);
                    }
                    else
                    {
                        for (const auto &entry : root_iterator)
                        {
                            std::error_code ec;
                            if (entry.symlink_status(ec).type() == fs::file_type::regular)
                            {
                                onNext(entry.path().string());
                            }
                        }
                    }
                    if (onComplete)
                    {
                        onComplete();
                    }
                }
                catch (const std::exception &e)
                {
                    std::string msg = "Error listing files in directory: " + dir_path + ": " + e.what();
                    Logger::warn(msg);
                    if (onError)
                    {
                        onError(std::runtime_error(msg));
                    }
                }
            }));
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    std::error_code ec;
    fs::path dir_path(path);
    return fs::exists(dir_path, ec) && fs::is_directory(dir_path, ec);
}

void FileUtils::scanDirectoryRecursively(const std::string &dir_path,
                                         std::function<void(const std::string &)> onNext)
{
    std::function<void(const fs::path &)> scanDirectory = [&](const fs::path &current_path)
    {
        std::error_code ec;
        fs::directory_iterator it(current_path, fs::directory_options::skip_permission_denied, ec);
        if (ec)
        {
            Logger::debug("Skipping unreadable directory " + current_path.string() + ": " + ec.message());
            return;
        }

        for (fs::directory_iterator end; it != end; it.increment(ec))
        {
            if (ec)
            {
                Logger::debug("Stopping iteration of " + current_path.string() + ": " + ec.message());
                return;
            }

            std::error_code status_ec;
            fs::file_status status = it->symlink_status(status_ec);
            if (status_ec)
            {
                Logger::debug("Skipping entry " + it->path().string() + ": " + status_ec.message());
                continue;
            }

            if (status.type() == fs::file_type::regular)
            {
                onNext(it->path().string());
            }
            else if (status.type() == fs::file_type::directory)
            {
                scanDirectory(it->path());
            }
        }
    };
    scanDirectory(fs::path(dir_path));
}

std::string FileUtils::getFileExtension(const std::string &file_path)
{
    std::string ext = fs::path(file_path).extension().string();
    if (!ext.empty() && ext[0] == '.')
        ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string FileMetadata::toString() const
{
    std::stringstream ss;
    ss << "FileMetadata{"
       << "path='" << file_path << "', "
       << "mod_time=" << modification_time << ", "
       << "create_time=";
    if (creation_time)
        ss << *creation_time;
    else
        ss << "none";
    ss << ", size=" << file_size << "}";
    return ss.str();
}

std::optional<FileMetadata> FileUtils::getFileMetadata(const std::string &file_path)
{
    FileMetadata metadata;
    metadata.file_path = file_path;

#if defined(__APPLE__)
    struct stat st;
    if (stat(file_path.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
    {
        return std::nullopt;
    }
    metadata.modification_time = st.st_mtime;
    metadata.creation_time = st.st_birthtime; // macOS specific
    metadata.file_size = static_cast<uint64_t>(st.st_size);
#elif defined(STATX_BTIME)
    struct statx stx;
    if (statx(AT_FDCWD, file_path.c_str(), AT_SYMLINK_NOFOLLOW,
              STATX_BASIC_STATS | STATX_BTIME, &stx) != 0 ||
        !S_ISREG(stx.stx_mode))
    {
        return std::nullopt;
    }
    metadata.modification_time = static_cast<std::time_t>(stx.stx_mtime.tv_sec);
    if (stx.stx_mask & STATX_BTIME)
    {
        metadata.creation_time = static_cast<std::time_t>(stx.stx_btime.tv_sec);
    }
    metadata.file_size = static_cast<uint64_t>(stx.stx_size);
#else
    struct stat st;
    if (lstat(file_path.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
    {
        return std::nullopt;
    }
    metadata.modification_time = st.st_mtime;
    metadata.file_size = static_cast<uint64_t>(st.st_size);
#endif

    return metadata;
}
