#include "core/config_manager.hpp"
#include "core/media_organizer.hpp"
#include "core/result_json.hpp"
#include "logging/logger.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
    void printUsage(const char *program)
    {
        std::cout << "Media Organizer - date-based photo and video organizer" << std::endl;
        std::cout << "Usage:" << std::endl;
        std::cout << "  " << program << " scan <input_dir> [options]" << std::endl;
        std::cout << "  " << program << " process <input_dir> <output_dir> [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config <file>       Load YAML configuration" << std::endl;
        std::cout << "  --backup <dir>        Copy originals flat into <dir> before processing" << std::endl;
        std::cout << "  --no-videos           Ignore video files" << std::endl;
        std::cout << "  --sequential          Disable parallel processing" << std::endl;
        std::cout << "  --auto-orient         Rotate copied photos according to EXIF orientation" << std::endl;
        std::cout << "  --log-level <LEVEL>   TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --help, -h            Show this help message" << std::endl;
    }

    nlohmann::json errorJson(const std::string &message)
    {
        nlohmann::json j;
        j["success"] = false;
        j["error"] = message;
        return j;
    }
}

int main(int argc, char *argv[])
{
    std::vector<std::string> positional;
    std::string config_file;
    std::string log_level;
    std::string backup_dir;
    bool no_videos = false;
    bool sequential = false;
    bool auto_orient = false;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if ((arg == "--config" || arg == "--backup" || arg == "--log-level") && i + 1 >= argc)
        {
            std::cerr << "Missing value for " << arg << std::endl;
            return 1;
        }
        else if (arg == "--config")
        {
            config_file = argv[++i];
        }
        else if (arg == "--backup")
        {
            backup_dir = argv[++i];
        }
        else if (arg == "--log-level")
        {
            log_level = argv[++i];
        }
        else if (arg == "--no-videos")
        {
            no_videos = true;
        }
        else if (arg == "--sequential")
        {
            sequential = true;
        }
        else if (arg == "--auto-orient")
        {
            auto_orient = true;
        }
        else if (arg.rfind("--", 0) == 0)
        {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
        else
        {
            positional.push_back(arg);
        }
    }

    if (positional.empty() ||
        (positional[0] == "scan" && positional.size() != 2) ||
        (positional[0] == "process" && positional.size() != 3) ||
        (positional[0] != "scan" && positional[0] != "process"))
    {
        printUsage(argv[0]);
        return 1;
    }

    ConfigManager config_manager;
    Logger::init(config_manager.getLogLevel());
    if (!config_file.empty() && !config_manager.loadConfig(config_file))
    {
        std::cout << errorJson("Cannot load configuration: " + config_file).dump(2) << std::endl;
        return 1;
    }
    if (!log_level.empty())
    {
        config_manager.setLogLevel(log_level);
    }

    ProcessOptions options = config_manager.getProcessOptions();
    if (!backup_dir.empty())
        options.backup_dir = backup_dir;
    if (no_videos)
        options.include_videos = false;
    if (sequential)
        options.parallel = false;
    if (auto_orient)
        options.auto_correct_orientation = true;

    try
    {
        if (positional[0] == "scan")
        {
            auto records = MediaOrganizer::scanMedia(positional[1], options);
            std::cout << ResultJson::toJson(records).dump(2) << std::endl;
        }
        else
        {
            auto result = MediaOrganizer::processMedia(positional[1], positional[2], options);
            std::cout << ResultJson::toJson(result).dump(2) << std::endl;
        }
    }
    catch (const std::exception &e)
    {
        Logger::error(std::string("Fatal error: ") + e.what());
        std::cout << errorJson(e.what()).dump(2) << std::endl;
        return 1;
    }

    return 0;
}
