// Lightweight CLI configuration definition and I/O declarations
#pragma once

#include <string>

struct CliConfig {
    std::string loaded_config_path;
    std::string db_path = "habits.db";
    // Rows per page in the habit and record lists.
    int page_size = 5;
    // Matches shown by the live search.
    int filter_limit = 5;
    int screen_width = 50;
    // Pre-filled answer of the "add record" prompt: "today" or "none".
    std::string default_record_date = "today";
};

// Persist the configuration to a YAML file at `path`.
// Returns true on success.
bool write_config_to_file(const CliConfig& config, const std::string& path);

// Load an existing config from `config_path` if it exists.
// If `config_path` is the default "config.yaml" and does not exist, create it with defaults.
void load_or_create_config(const std::string& config_path, CliConfig& config);
