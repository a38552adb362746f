#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

Config::Config() {
    engine_.staging_dir = platform::temp_dir() / STAGING_SUBDIR;
    engine_.log_path = (platform::temp_dir() / DEBUG_LOG_NAME).string();
}

Config Config::defaults() {
    return Config();
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".termbridge";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

// Expand a leading "~/" against the home directory.
static std::string expand_home(const std::string& path) {
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}

static std::chrono::milliseconds seconds_node(const YAML::Node& node,
                                              std::chrono::milliseconds fallback) {
    if (!node || !node.IsScalar()) return fallback;
    double secs = node.as<double>();
    if (secs < 0) secs = 0;
    return std::chrono::milliseconds(static_cast<long long>(secs * 1000.0));
}

static std::chrono::milliseconds millis_node(const YAML::Node& node,
                                             std::chrono::milliseconds fallback) {
    if (!node || !node.IsScalar()) return fallback;
    return std::chrono::milliseconds(node.as<long long>());
}

static void parse_engine_settings(const YAML::Node& node, EngineSettings& e) {
    if (node["staging_dir"]) {
        e.staging_dir = expand_home(node["staging_dir"].as<std::string>());
    }
    if (node["log_path"]) {
        e.log_path = expand_home(node["log_path"].as<std::string>());
    }
    e.connect_timeout = node["connect_timeout"].as<int>(e.connect_timeout);
    e.keepalive_interval = seconds_node(node["keepalive_interval"], e.keepalive_interval);
    e.pump_poll = millis_node(node["pump_poll_ms"], e.pump_poll);
    e.pump_read_quantum = node["pump_read_quantum"].as<int>(e.pump_read_quantum);
    e.pump_join_timeout = millis_node(node["pump_join_timeout_ms"], e.pump_join_timeout);
    e.delete_retries = node["delete_retries"].as<int>(e.delete_retries);
    e.delete_backoff = millis_node(node["delete_backoff_ms"], e.delete_backoff);

    if (e.connect_timeout <= 0) e.connect_timeout = CONNECT_TIMEOUT_SECS;
    if (e.pump_read_quantum <= 0) e.pump_read_quantum = PUMP_READ_QUANTUM;
    if (e.delete_retries <= 0) e.delete_retries = 1;
}

static ConnectionParams parse_connection(const YAML::Node& node) {
    ConnectionParams p;
    p.host = node["host"].as<std::string>("");
    p.port = node["port"].as<int>(22);
    p.user = node["user"].as<std::string>("");
    p.auth_type = node["auth"].as<std::string>("password");
    p.password = node["password"].as<std::string>("");
    p.private_key_path = expand_home(node["key"].as<std::string>(""));
    if (node["passphrase"]) {
        p.passphrase = node["passphrase"].as<std::string>();
    }
    return p;
}

static Result<Config> parse_root(const YAML::Node& root) {
    Config config;

    if (root["engine"] && root["engine"].IsMap()) {
        parse_engine_settings(root["engine"], config.engine());
    }

    if (root["connections"] && root["connections"].IsMap()) {
        for (const auto& kv : root["connections"]) {
            config.add_connection(kv.first.as<std::string>(), parse_connection(kv.second));
        }
    }

    return Result<Config>::Ok(config);
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root.IsNull()) return Result<Config>::Ok(Config());
        if (!root.IsMap()) {
            return Result<Config>::Err("Config root must be a mapping", ErrorKind::INVALID_INPUT);
        }
        return parse_root(root);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what(),
                                   ErrorKind::INVALID_INPUT);
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string(), ErrorKind::NOT_FOUND);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (root.IsNull()) return Result<Config>::Ok(Config());
        if (!root.IsMap()) {
            return Result<Config>::Err("Config root must be a mapping", ErrorKind::INVALID_INPUT);
        }
        return parse_root(root);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what(),
                                   ErrorKind::INVALID_INPUT);
    }
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Ok(Config());
    }
    return load_file(get_global_config_path());
}

void Config::add_connection(const std::string& name, ConnectionParams params) {
    connections_[name] = std::move(params);
}

Result<ConnectionParams> Config::connection(const std::string& name) const {
    auto it = connections_.find(name);
    if (it == connections_.end()) {
        return Result<ConnectionParams>::Err("No connection profile named '" + name + "'",
                                             ErrorKind::NOT_FOUND);
    }
    return Result<ConnectionParams>::Ok(it->second);
}
