#pragma once

#include <mutex>
#include <string>
#include <yaml-cpp/yaml.h>
#include "core/process_options.hpp"

/**
 * @brief YAML configuration of the organizer
 *
 * Missing keys fall back to built-in defaults; a document failing validation
 * is rejected as a whole and the previous configuration is kept.
 */
class ConfigManager
{
public:
    ConfigManager();

    // Configuration getters
    std::string getLogLevel() const;
    bool getParallel() const;
    bool getIncludeVideos() const;
    bool getAutoCorrectOrientation() const;
    bool getCleanupTemp() const;
    int getMaxThreads() const;
    std::optional<std::string> getBackupDir() const;
    std::optional<int> getTimezoneOffset() const;
    BurstDetectorConfig getBurstConfig() const;
    YAML::Node getConfig() const;

    /**
     * @brief Materialize the options of a scan/process call
     */
    ProcessOptions getProcessOptions() const;

    void setLogLevel(const std::string &level);
    bool updateConfig(const YAML::Node &new_config);

    // Configuration persistence
    bool loadConfig(const std::string &file_path);
    bool saveConfig(const std::string &file_path) const;

    // Configuration validation
    bool validateConfig(const YAML::Node &config) const;

private:
    mutable std::mutex config_mutex_;
    YAML::Node config_;

    static YAML::Node defaultConfig();

    template <typename T>
    T getValue(const YAML::Node &section, const char *key, const T &fallback) const;
};
