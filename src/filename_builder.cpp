#include "core/filename_builder.hpp"
#include "core/file_utils.hpp"
#include <iomanip>
#include <sstream>

std::string FilenameBuilder::outputExtension(const std::string &original_path)
{
    std::string ext = FileUtils::getFileExtension(original_path);
    return ext.empty() ? "jpg" : ext;
}

std::string FilenameBuilder::build(const MediaRecord &record)
{
    std::ostringstream name;
    name << DateTimeUtils::formatForFilename(record.date_taken);

    if (record.subsecond)
    {
        name << '-' << std::setw(3) << std::setfill('0') << *record.subsecond;
    }

    if (record.burst_group_id && record.burst_index)
    {
        name << '_' << std::setw(2) << std::setfill('0') << *record.burst_index;
    }

    name << '.' << outputExtension(record.original_path);
    return name.str();
}

std::string FilenameBuilder::withCounter(const std::string &file_name, unsigned int counter)
{
    std::ostringstream suffix;
    suffix << '_' << std::setw(2) << std::setfill('0') << counter;

    std::string::size_type dot = file_name.rfind('.');
    if (dot == std::string::npos || dot == 0)
        return file_name + suffix.str();
    return file_name.substr(0, dot) + suffix.str() + file_name.substr(dot);
}
