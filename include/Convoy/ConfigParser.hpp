// =================================================================
// include/Convoy/ConfigParser.hpp
// =================================================================
// Loads the .convoy/config.yml file into a typed configuration.

#pragma once

#include "Convoy/Logger.hpp"
#include <map>
#include <mutex>
#include <string>

namespace Convoy {

struct LogConfig {
    std::string dir = ".convoy/logs";
    LogLevel console_level = LogLevel::WARNING;
    LogLevel file_level = LogLevel::DEBUG;
    size_t max_size_mb = 10;
    size_t max_files = 5;
};

struct ConvoyConfig {
    std::string git_binary = "git";
    std::string remote = "origin";
    std::string trunk_ref = "origin/main";
    std::string sync_state_dir = ".syncstate";
    std::string hooks_dir = ".githooks";
    LogConfig log;
};

class ConfigParser {
public:
    /**
     * @brief Reads a configuration file.
     *
     * A missing file, or a missing key, yields the default value. A file
     * that cannot be parsed is reported as a warning and defaults are used.
     *
     * @param config_path The path to the config.yml file.
     */
    static ConvoyConfig load(const std::string& config_path);

    /**
     * @brief Parses configuration from YAML text.
     * @throws YAML::Exception on malformed input or mistyped values.
     */
    static ConvoyConfig parse(const std::string& yaml_text);

    /**
     * @brief The text `convoy init` writes.
     */
    static std::string defaultConfigText();
};

/**
 * @brief Loads each configuration file at most once.
 *
 * Owned by the application root and passed to whoever needs configuration.
 */
class ConfigCache {
public:
    ConvoyConfig get(const std::string& config_path);

    /**
     * @brief Forgets a cached file so the next get() reads it again.
     */
    void invalidate(const std::string& config_path);

private:
    std::mutex m_mutex;
    std::map<std::string, ConvoyConfig> m_configs;
};

} // namespace Convoy
