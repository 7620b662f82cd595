#include "core/hierarchy_path_builder.hpp"

std::filesystem::path HierarchyPathBuilder::buildDirectory(const std::filesystem::path &output_root,
                                                           const Timestamp &ts)
{
    return output_root /
           DateTimeUtils::format(ts, "%Y") /
           DateTimeUtils::format(ts, "%Y-%m") /
           DateTimeUtils::format(ts, "%Y-%m-%d");
}

std::filesystem::path HierarchyPathBuilder::createDirectory(const std::filesystem::path &output_root,
                                                            const Timestamp &ts)
{
    std::filesystem::path dir = buildDirectory(output_root, ts);
    std::filesystem::create_directories(dir);
    return dir;
}
