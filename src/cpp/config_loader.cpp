#include "config_loader.hpp"
#include "debug.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cstdlib>
#include <cstdint>
#include <filesystem>

// PathValidator implementation
std::string PathValidator::get_home_directory() {
    const char* home = std::getenv("HOME");
    return home ? home : "/";
}

std::string PathValidator::normalize_path(const std::string& path) {
    std::error_code ec;
    std::filesystem::path canonical = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        return path;
    }
    return canonical.string();
}

bool PathValidator::is_in_directory(const std::string& path, const std::string& directory) {
    std::string path_str = normalize_path(path);
    std::string dir_str = normalize_path(directory);

    // Ensure directory ends with separator for proper matching
    if (!dir_str.empty() && dir_str.back() != '/') {
        dir_str += '/';
    }

    return path_str.rfind(dir_str, 0) == 0;
}

bool PathValidator::is_config_path_allowed(const std::string& filepath, const std::string& data_directory) {
    std::string config_dir = get_home_directory() + "/.config/navigate";
    if (is_in_directory(filepath, config_dir)) {
        return true;
    }

    if (!data_directory.empty() && is_in_directory(filepath, data_directory)) {
        return true;
    }

    ERROR_LOG("Config file path not allowed: " << filepath);
    INFO_LOG("Config files must be in ~/.config/navigate/ or in $" << NavigateConfig::DATA_ENV << ".");
    return false;
}

bool PathValidator::is_plain_file_name(const std::string& name) {
    return !name.empty() && name != "." && name != ".." &&
           name.find('/') == std::string::npos;
}

// NavigateConfig implementation
std::optional<std::string> NavigateConfig::data_directory() {
    const char* value = std::getenv(DATA_ENV);
    if (!value || value[0] == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::string NavigateConfig::default_config_path() {
    return PathValidator::get_home_directory() + "/.config/navigate/config.yaml";
}

std::string NavigateConfig::database_path(const std::string& data_directory) const {
    return (std::filesystem::path(data_directory) / database_file).string();
}

NavigateConfig NavigateConfig::from_yaml(const std::string& filepath, const std::string& data_directory) {
    NavigateConfig config;

    std::error_code ec;
    if (!std::filesystem::exists(filepath, ec)) {
        DEBUG_LOGLN << "No config file at " << filepath << ", using defaults";
        return config;
    }

    if (!PathValidator::is_config_path_allowed(filepath, data_directory)) {
        ERROR_LOG("Refusing to load config from disallowed path.");
        return config;
    }

    std::uintmax_t file_size = std::filesystem::file_size(filepath, ec);
    if (ec) {
        ERROR_LOG("Error accessing config file: " << ec.message());
        return config;
    }
    if (file_size > SecurityLimits::MAX_CONFIG_FILE_SIZE) {
        ERROR_LOG("Config file too large (" << file_size << " bytes, maximum "
                  << SecurityLimits::MAX_CONFIG_FILE_SIZE << ").");
        return config;
    }

    NavigateConfig loaded;
    try {
        YAML::Node yaml_config = YAML::LoadFile(filepath);
        if (!yaml_config.IsNull()) {
            loaded.apply(yaml_config);
        }
    } catch (const YAML::Exception& e) {
        ERROR_LOG("Error loading YAML from " << filepath << ": " << e.what());
        return config;
    }

    DEBUG_LOGLN << "Using config file: " << filepath;
    return loaded;
}

void NavigateConfig::apply(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw YAML::Exception(node.Mark(), "config root is not a mapping");
    }

    if (node["max-choices"]) {
        max_choices = std::clamp(node["max-choices"].as<int>(), 1, 100);
    }

    if (node["max-age-days"]) {
        double days = std::clamp(node["max-age-days"].as<double>(), 1.0, 3650.0);
        frecency.max_age_seconds = days * 24 * 3600;
    }

    if (node["discount-factor"]) {
        frecency.discount_factor = std::clamp(node["discount-factor"].as<double>(), 0.5, 1.0);
    }

    if (node["database-file"]) {
        std::string name = node["database-file"].as<std::string>();
        if (PathValidator::is_plain_file_name(name)) {
            database_file = name;
        } else {
            ERROR_LOG("Ignoring database-file '" << name << "': must be a plain file name");
        }
    }

    if (node["debug"]) {
        debug = node["debug"].as<bool>();
    }

    if (node["mark-color"] || node["heading-color"] || node["color"]) {
        theme = Theme::from_yaml(node);
    }
}

bool NavigateConfig::validate() const {
    if (max_choices < 1) {
        ERROR_LOG("Invalid max-choices: " << max_choices);
        return false;
    }

    if (frecency.discount_factor <= 0.0 || frecency.discount_factor > 1.0) {
        ERROR_LOG("Invalid discount-factor: " << frecency.discount_factor);
        return false;
    }

    if (frecency.max_age_seconds <= 0.0) {
        ERROR_LOG("Invalid max-age-days");
        return false;
    }

    if (!PathValidator::is_plain_file_name(database_file)) {
        ERROR_LOG("Invalid database-file: " << database_file);
        return false;
    }

    return true;
}
