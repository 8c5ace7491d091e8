// CLI configuration YAML read/write implementation
#include "cli_config.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

bool write_config_to_file(const CliConfig& config, const std::string& path) {
    YAML::Node root;
    root["_comment1"] = "habitrack configuration.";
    root["db_path"] = config.db_path;
    root["page_size"] = config.page_size;
    root["filter_limit"] = config.filter_limit;
    root["screen_width"] = config.screen_width;
    root["default_record_date"] = config.default_record_date;

    std::ofstream fout(path);
    if (!fout) return false;
    fout << root;
    return static_cast<bool>(fout);
}

static void read_positive(const YAML::Node& root, const char* key, int& target) {
    if (!root[key]) return;
    int v = root[key].as<int>();
    if (v <= 0) {
        std::cerr << "Warning: '" << key << "' must be positive, keeping " << target << "." << std::endl;
        return;
    }
    target = v;
}

void load_or_create_config(const std::string& config_path, CliConfig& config) {
    if (fs::exists(config_path)) {
        config.loaded_config_path = fs::absolute(config_path).string();
        try {
            YAML::Node root = YAML::LoadFile(config_path);
            if (root["db_path"]) config.db_path = root["db_path"].as<std::string>();
            read_positive(root, "page_size", config.page_size);
            read_positive(root, "filter_limit", config.filter_limit);
            read_positive(root, "screen_width", config.screen_width);
            if (root["default_record_date"]) {
                std::string mode = root["default_record_date"].as<std::string>();
                if (mode == "today" || mode == "none") {
                    config.default_record_date = mode;
                } else {
                    std::cerr << "Warning: unknown default_record_date '" << mode
                              << "', expected 'today' or 'none'." << std::endl;
                }
            }
            std::cout << "Loaded configuration from '" << config_path << "'." << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "Warning: Could not parse config file '" << config_path
                      << "'. Using default settings. Error: " << e.what() << std::endl;
        }
    } else if (config_path == "config.yaml") {
        std::cout << "Configuration file 'config.yaml' not found. Creating a default one." << std::endl;
        if (write_config_to_file(config, "config.yaml")) {
            config.loaded_config_path = fs::absolute("config.yaml").string();
        } else {
            std::cerr << "Warning: Could not write default 'config.yaml'." << std::endl;
        }
    } else {
        std::cerr << "Warning: Config file '" << config_path << "' not found. Using default settings." << std::endl;
    }
}
