#pragma once

#include <string>
#include <map>
#include <chrono>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Tunables for the session and transfer engine.
struct EngineSettings {
    fs::path staging_dir;                               // <temp>/termbridge_staging
    std::string log_path;                               // <temp>/termbridge_debug.log
    int connect_timeout = 30;                           // seconds
    std::chrono::milliseconds keepalive_interval{60000};
    std::chrono::milliseconds pump_poll{100};
    int pump_read_quantum = 1024;
    std::chrono::milliseconds pump_join_timeout{1000};
    int delete_retries = 3;
    std::chrono::milliseconds delete_backoff{500};
};

class Config {
public:
    // Load ~/.termbridge/config.yaml. A missing file yields defaults.
    static Result<Config> load_global();

    // Load a specific YAML file (must exist).
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text directly.
    static Result<Config> parse(const std::string& yaml_text);

    // Built-in defaults, no file access.
    static Config defaults();

    // Accessors
    const EngineSettings& engine() const { return engine_; }
    EngineSettings& engine() { return engine_; }
    const std::map<std::string, ConnectionParams>& connections() const { return connections_; }

    // Look up a named connection profile.
    Result<ConnectionParams> connection(const std::string& name) const;
    void add_connection(const std::string& name, ConnectionParams params);

public:
    Config();

private:
    EngineSettings engine_;
    std::map<std::string, ConnectionParams> connections_;
};

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
bool global_config_exists();
