#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <nlohmann/json.hpp>

namespace planner_injector {

struct PluginConfig {
    // [plugin]
    std::string name = "planner_injector";
    std::string config_version = "1.0.2";
    bool enabled = true;
    bool user_debug = false;

    // [api]
    std::string api_url = "http://url.to.your.zhenxun";
    int api_timeout_seconds = 10;

    // [install]
    int install_max_attempts = 5;
    int install_initial_backoff_ms = 3000;

    std::chrono::milliseconds api_timeout() const { return std::chrono::seconds(api_timeout_seconds); }

    // Missing keys keep their defaults; wrong types throw nlohmann::json::type_error.
    static PluginConfig from_json(const nlohmann::json& j);
};

class ConfigLoader {
public:
    static const std::vector<std::string>& default_search_paths();

    // First readable file wins. Never throws: on any problem the defaults
    // are returned and the reason is logged.
    static PluginConfig load(const std::vector<std::string>& search_paths = default_search_paths());
    static PluginConfig load_file(const std::string& path);
};

} // namespace planner_injector
