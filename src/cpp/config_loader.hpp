#pragma once

#include <optional>
#include <string>
#include "color_theme.hpp"
#include "frecency.hpp"

// Forward declaration for YAML
namespace YAML {
    class Node;
}

// Security limits for YAML parsing
namespace SecurityLimits {
    constexpr size_t MAX_CONFIG_FILE_SIZE = 64 * 1024;     // 64KB
}

// Path validation utilities
class PathValidator {
public:
    // Check if a config file path is allowed
    // Allowed paths: ~/.config/navigate/ and the data directory
    static bool is_config_path_allowed(const std::string& filepath, const std::string& data_directory);

    // Normalize a path (resolve . and ..)
    static std::string normalize_path(const std::string& path);

    // A bare file name: no separators, not "." or ".."
    static bool is_plain_file_name(const std::string& name);

    // Get home directory
    static std::string get_home_directory();

private:
    // Check if path is within allowed directory
    static bool is_in_directory(const std::string& path, const std::string& directory);
};

class NavigateConfig {
public:
    static constexpr const char* DATA_ENV = "NAVIGATE_DATA";
    static constexpr const char* DEFAULT_DATABASE_FILE = "navigate.yaml";

    // Menu
    int max_choices = 10;

    // Scoring
    FrecencyPolicy frecency;

    // Storage, relative to the data directory
    std::string database_file = DEFAULT_DATABASE_FILE;

    // Diagnostics
    bool debug = false;
    Theme theme;

    // Directory named by NAVIGATE_DATA, if set and non-empty
    static std::optional<std::string> data_directory();

    // ~/.config/navigate/config.yaml
    static std::string default_config_path();

    // Load from YAML file; a missing default file is not an error,
    // anything invalid is reported and the defaults are kept
    static NavigateConfig from_yaml(const std::string& filepath, const std::string& data_directory);

    std::string database_path(const std::string& data_directory) const;

    // Validate configuration
    bool validate() const;

private:
    void apply(const YAML::Node& node);
};
