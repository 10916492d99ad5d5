// =================================================================
// src/Convoy/ConfigParser.cpp
// =================================================================
// Implementation for the YAML configuration loader.

#include "Convoy/ConfigParser.hpp"
#include "Convoy/SysInteraction.hpp"
#include <yaml-cpp/yaml.h>

namespace Convoy {

namespace {

template <typename T>
void readValue(const YAML::Node& node, const char* key, T& target) {
    if (node[key]) {
        target = node[key].as<T>();
    }
}

void readLevel(const YAML::Node& node, const char* key, LogLevel& target) {
    if (node[key]) {
        target = Logger::parseLevel(node[key].as<std::string>(), target);
    }
}

} // namespace

ConvoyConfig ConfigParser::parse(const std::string& yaml_text) {
    ConvoyConfig config;

    YAML::Node root = YAML::Load(yaml_text);
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw YAML::Exception(YAML::Mark::null_mark(), "top level of configuration must be a map");
    }

    readValue(root, "git_binary", config.git_binary);
    readValue(root, "remote", config.remote);
    readValue(root, "trunk_ref", config.trunk_ref);
    readValue(root, "sync_state_dir", config.sync_state_dir);
    readValue(root, "hooks_dir", config.hooks_dir);

    if (root["log"]) {
        YAML::Node log = root["log"];
        readValue(log, "dir", config.log.dir);
        readLevel(log, "console_level", config.log.console_level);
        readLevel(log, "file_level", config.log.file_level);
        readValue(log, "max_size_mb", config.log.max_size_mb);
        readValue(log, "max_files", config.log.max_files);
    }

    return config;
}

ConvoyConfig ConfigParser::load(const std::string& config_path) {
    SysInteraction sys;
    if (!sys.fileExists(config_path)) {
        // It's okay if the file doesn't exist, e.g., before `init` is run.
        return ConvoyConfig();
    }

    try {
        return parse(sys.readFile(config_path));
    } catch (const YAML::Exception& e) {
        Logger::getInstance().warning("ConfigParser", "Ignoring malformed configuration " + config_path, e.what());
    } catch (const std::runtime_error& e) {
        Logger::getInstance().warning("ConfigParser", "Could not read configuration " + config_path, e.what());
    }
    return ConvoyConfig();
}

std::string ConfigParser::defaultConfigText() {
    return R"(# Convoy Configuration v1.0
# Git executable used for every repository operation
git_binary: git

# Remote checked by `convoy pushed`
remote: origin

# Trunk remote-tracking ref, used to count commits of never-pushed branches
trunk_ref: origin/main

# Directory whose changes `convoy audit --relaxed` tolerates
sync_state_dir: .syncstate

# Hooks directory activated after clone when present in the checkout
hooks_dir: .githooks

log:
  dir: .convoy/logs
  console_level: warning   # debug|info|warning|error|critical
  file_level: debug
  max_size_mb: 10
  max_files: 5
)";
}

ConvoyConfig ConfigCache::get(const std::string& config_path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_configs.find(config_path);
    if (it != m_configs.end()) {
        return it->second;
    }
    ConvoyConfig config = ConfigParser::load(config_path);
    m_configs.emplace(config_path, config);
    return config;
}

void ConfigCache::invalidate(const std::string& config_path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_configs.erase(config_path);
}

} // namespace Convoy
