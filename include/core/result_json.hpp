#pragma once

#include <nlohmann/json.hpp>
#include "core/processing_result.hpp"

/**
 * @brief JSON views of scan and process results for the command line surface
 */
class ResultJson
{
public:
    static nlohmann::json toJson(const MediaRecord &record);
    static nlohmann::json toJson(const std::vector<MediaRecord> &records);
    static nlohmann::json toJson(const ProcessResult &result);
};
