#include "plugin_config.hpp"
#include <fstream>
#include <spdlog/spdlog.h>

namespace planner_injector {

using json = nlohmann::json;

PluginConfig PluginConfig::from_json(const json& j) {
    PluginConfig cfg;

    if (j.contains("plugin")) {
        const auto& p = j["plugin"];
        cfg.name = p.value("name", cfg.name);
        cfg.config_version = p.value("config_version", cfg.config_version);
        cfg.enabled = p.value("enabled", cfg.enabled);
        cfg.user_debug = p.value("user_debug", cfg.user_debug);
    }

    if (j.contains("api")) {
        const auto& a = j["api"];
        cfg.api_url = a.value("url", cfg.api_url);
        cfg.api_timeout_seconds = a.value("timeout", cfg.api_timeout_seconds);
    }

    if (j.contains("install")) {
        const auto& i = j["install"];
        cfg.install_max_attempts = i.value("max_attempts", cfg.install_max_attempts);
        cfg.install_initial_backoff_ms = i.value("initial_backoff_ms", cfg.install_initial_backoff_ms);
    }

    if (cfg.api_timeout_seconds <= 0) {
        spdlog::warn("⚠️ api.timeout must be positive, using 10s");
        cfg.api_timeout_seconds = 10;
    }
    return cfg;
}

const std::vector<std::string>& ConfigLoader::default_search_paths() {
    static const std::vector<std::string> paths = {
        "config.json",          // 1. Current Working Directory
        "../config.json",       // 2. Parent Directory (build/)
        "config/config.json",   // 3. Config Directory
        "../../config.json"     // 4. Project Root (from build/Release)
    };
    return paths;
}

PluginConfig ConfigLoader::load_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::warn("⚠️ Config file {} not readable, using defaults", path);
        return PluginConfig{};
    }

    try {
        auto cfg = PluginConfig::from_json(json::parse(f));
        spdlog::info("🛰️ Config loaded from {} (enabled: {}, user_debug: {}, api: {})",
                     path, cfg.enabled, cfg.user_debug, cfg.api_url);
        return cfg;
    } catch (const std::exception& e) {
        spdlog::error("💥 Failed to parse config {}: {}", path, e.what());
        return PluginConfig{};
    }
}

PluginConfig ConfigLoader::load(const std::vector<std::string>& search_paths) {
    for (const auto& path : search_paths) {
        std::ifstream file(path);
        if (file.is_open()) {
            return load_file(path);
        }
    }

    spdlog::warn("⚠️ config.json not found in any standard path, using defaults");
    return PluginConfig{};
}

} // namespace planner_injector
