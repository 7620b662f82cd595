#include "core/config_manager.hpp"
#include "logging/logger.hpp"
#include <fstream>

ConfigManager::ConfigManager()
    : config_(defaultConfig())
{
}

YAML::Node ConfigManager::defaultConfig()
{
    return YAML::Load(R"(
        log_level: "INFO"
        processing:
          parallel: true
          include_videos: true
          auto_correct_orientation: false
          cleanup_temp: false
          max_threads: 0
        backup_dir: ""
        timezone_offset: null
        burst:
          max_interval_seconds: 3
          min_count: 3
    )");
}

template <typename T>
T ConfigManager::getValue(const YAML::Node &section, const char *key, const T &fallback) const
{
    try
    {
        if (section && section.IsMap() && section[key] && !section[key].IsNull())
        {
            return section[key].as<T>();
        }
    }
    catch (const YAML::Exception &e)
    {
        Logger::warn(std::string("Error parsing ") + key + ": " + e.what() + ", using default");
    }
    return fallback;
}

std::string ConfigManager::getLogLevel() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return getValue<std::string>(config_, "log_level", "INFO");
}

bool ConfigManager::getParallel() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    const YAML::Node &cfg = config_;
    return getValue<bool>(cfg["processing"], "parallel", true);
}

bool ConfigManager::getIncludeVideos() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    const YAML::Node &cfg = config_;
    return getValue<bool>(cfg["processing"], "include_videos", true);
}

bool ConfigManager::getAutoCorrectOrientation() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    const YAML::Node &cfg = config_;
    return getValue<bool>(cfg["processing"], "auto_correct_orientation", false);
}

bool ConfigManager::getCleanupTemp() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    const YAML::Node &cfg = config_;
    return getValue<bool>(cfg["processing"], "cleanup_temp", false);
}

int ConfigManager::getMaxThreads() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    const YAML::Node &cfg = config_;
    return getValue<int>(cfg["processing"], "max_threads", 0);
}

std::optional<std::string> ConfigManager::getBackupDir() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    std::string dir = getValue<std::string>(config_, "backup_dir", "");
    if (dir.empty())
        return std::nullopt;
    return dir;
}

std::optional<int> ConfigManager::getTimezoneOffset() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    const YAML::Node &cfg = config_;
    if (!cfg["timezone_offset"] || cfg["timezone_offset"].IsNull())
        return std::nullopt;
    return getValue<int>(config_, "timezone_offset", 0);
}

BurstDetectorConfig ConfigManager::getBurstConfig() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    const YAML::Node &cfg = config_;
    BurstDetectorConfig burst;
    burst.max_interval_seconds = getValue<int64_t>(cfg["burst"], "max_interval_seconds", burst.max_interval_seconds);
    burst.min_count = getValue<size_t>(cfg["burst"], "min_count", burst.min_count);
    return burst;
}

YAML::Node ConfigManager::getConfig() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return YAML::Clone(config_);
}

ProcessOptions ConfigManager::getProcessOptions() const
{
    ProcessOptions options;
    options.parallel = getParallel();
    options.include_videos = getIncludeVideos();
    options.backup_dir = getBackupDir();
    options.timezone_offset = getTimezoneOffset();
    options.cleanup_temp = getCleanupTemp();
    options.auto_correct_orientation = getAutoCorrectOrientation();
    options.max_threads = getMaxThreads();
    options.burst = getBurstConfig();
    return options;
}

void ConfigManager::setLogLevel(const std::string &level)
{
    if (!Logger::isValidLevel(level))
    {
        Logger::warn("Ignoring invalid log level: " + level);
        return;
    }
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_["log_level"] = level;
    }
    Logger::setLevel(level);
}

bool ConfigManager::updateConfig(const YAML::Node &new_config)
{
    if (!validateConfig(new_config))
    {
        Logger::warn("Rejected invalid configuration update");
        return false;
    }
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = new_config.IsNull() ? defaultConfig() : YAML::Clone(new_config);
    return true;
}

bool ConfigManager::validateConfig(const YAML::Node &config) const
{
    if (config.IsNull())
        return true; // empty document, all defaults
    if (!config.IsMap())
    {
        Logger::warn("Configuration root must be a mapping");
        return false;
    }

    try
    {
        if (config["log_level"] && !Logger::isValidLevel(config["log_level"].as<std::string>()))
        {
            Logger::warn("Invalid log_level: " + config["log_level"].as<std::string>());
            return false;
        }

        if (const YAML::Node processing = config["processing"])
        {
            if (!processing.IsMap())
            {
                Logger::warn("processing must be a mapping");
                return false;
            }
            for (const char *key : {"parallel", "include_videos", "auto_correct_orientation", "cleanup_temp"})
            {
                if (processing[key])
                    processing[key].as<bool>();
            }
            if (processing["max_threads"] && processing["max_threads"].as<int>() < 0)
            {
                Logger::warn("processing.max_threads must not be negative");
                return false;
            }
        }

        if (const YAML::Node burst = config["burst"])
        {
            if (!burst.IsMap())
            {
                Logger::warn("burst must be a mapping");
                return false;
            }
            if (burst["max_interval_seconds"] && burst["max_interval_seconds"].as<int64_t>() < 0)
            {
                Logger::warn("burst.max_interval_seconds must not be negative");
                return false;
            }
            if (burst["min_count"] && burst["min_count"].as<int64_t>() < 1)
            {
                Logger::warn("burst.min_count must be at least 1");
                return false;
            }
        }

        if (config["backup_dir"] && !config["backup_dir"].IsNull())
            config["backup_dir"].as<std::string>();
        if (config["timezone_offset"] && !config["timezone_offset"].IsNull())
            config["timezone_offset"].as<int>();
    }
    catch (const YAML::Exception &e)
    {
        Logger::warn(std::string("Invalid configuration value: ") + e.what());
        return false;
    }
    return true;
}

bool ConfigManager::loadConfig(const std::string &file_path)
{
    YAML::Node loaded;
    try
    {
        loaded = YAML::LoadFile(file_path);
    }
    catch (const YAML::Exception &e)
    {
        Logger::error("Failed to load configuration from " + file_path + ": " + e.what());
        return false;
    }

    if (!updateConfig(loaded))
    {
        Logger::error("Configuration in " + file_path + " is invalid, keeping previous values");
        return false;
    }

    Logger::init(getLogLevel());
    Logger::info("Configuration loaded from: " + file_path);
    return true;
}

bool ConfigManager::saveConfig(const std::string &file_path) const
{
    std::ofstream file(file_path);
    if (!file.is_open())
    {
        Logger::error("Failed to open config file for writing: " + file_path);
        return false;
    }

    YAML::Emitter out;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        out << config_;
    }
    file << out.c_str() << std::endl;
    return static_cast<bool>(file);
}
