#include "core/result_json.hpp"

namespace
{
    template <typename T>
    nlohmann::json optionalJson(const std::optional<T> &value)
    {
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    }

    nlohmann::json optionalDate(const std::optional<Timestamp> &value)
    {
        return value ? nlohmann::json(DateTimeUtils::formatIso(*value)) : nlohmann::json(nullptr);
    }
}

nlohmann::json ResultJson::toJson(const MediaRecord &record)
{
    nlohmann::json j;
    j["original_path"] = record.original_path;
    j["file_name"] = record.file_name;
    j["media_type"] = mediaTypeName(record.media_type);
    j["date_taken"] = DateTimeUtils::formatIso(record.date_taken);
    j["subsec_time"] = optionalJson(record.subsecond);
    j["timezone"] = optionalJson(record.timezone);
    j["date_source"] = dateSourceName(record.date_source);
    j["exif_date"] = optionalDate(record.candidates.exif_date);
    j["filename_date"] = optionalDate(record.candidates.filename_date);
    j["file_created_date"] = optionalDate(record.candidates.file_created_date);
    j["file_modified_date"] = optionalDate(record.candidates.file_modified_date);
    j["exif_orientation"] = optionalJson(record.exif_orientation);
    j["rotation_applied"] = record.rotation_applied;
    j["width"] = optionalJson(record.width);
    j["height"] = optionalJson(record.height);
    j["duration_ms"] = optionalJson(record.duration_ms);
    j["file_size"] = record.file_size;
    j["burst_group_id"] = optionalJson(record.burst_group_id);
    j["burst_index"] = optionalJson(record.burst_index);
    j["new_name"] = record.new_name;
    j["new_path"] = record.new_path;
    return j;
}

nlohmann::json ResultJson::toJson(const std::vector<MediaRecord> &records)
{
    nlohmann::json array = nlohmann::json::array();
    for (const auto &record : records)
    {
        array.push_back(toJson(record));
    }
    return array;
}

nlohmann::json ResultJson::toJson(const ProcessResult &result)
{
    nlohmann::json j;
    j["success"] = result.success;
    j["total_files"] = result.total_files;
    j["processed_files"] = result.processed_files;
    j["media"] = toJson(result.media);
    j["errors"] = result.errors;
    return j;
}
