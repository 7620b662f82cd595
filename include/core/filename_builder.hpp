#pragma once

#include <string>
#include "core/processing_result.hpp"

/**
 * @brief Derives deterministic output file names from resolved timestamps
 *
 * Layout: YYYY-MM-DD_HH-MM-SS[-SSS][_NN].ext where -SSS is the subsecond in
 * milliseconds and _NN the 1-based burst index.
 */
class FilenameBuilder
{
public:
    static std::string build(const MediaRecord &record);

    /**
     * @brief Insert a 2-digit collision counter before the extension ("a.jpg", 1 -> "a_01.jpg")
     */
    static std::string withCounter(const std::string &file_name, unsigned int counter);

    /**
     * @brief Lower-cased extension of the original file, "jpg" if it has none
     */
    static std::string outputExtension(const std::string &original_path);
};
