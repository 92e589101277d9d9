#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include "plugin_config.hpp"
#include "planner_injector_plugin.hpp"

using namespace planner_injector;
namespace fs = std::filesystem;

class NoGroups : public ChatStreamDirectory {
public:
    bool is_group_chat(const std::string&) override { return false; }
};

class NullFetcher : public IAffinityFetcher {
public:
    FetchResult fetch(const std::string&) override { return FetchResult::success(5, "一般"); }
};

static void write_file(const fs::path& p, const std::string& text) {
    std::ofstream f(p);
    f << text;
}

int main() {
    std::cout << "[Test] Starting PluginConfig Test..." << std::endl;

    fs::path testRoot = "test_config_root";
    fs::create_directories(testRoot);

    // Defaults
    PluginConfig defaults;
    assert(defaults.name == "planner_injector");
    assert(defaults.config_version == "1.0.2");
    assert(defaults.enabled && !defaults.user_debug);
    assert(defaults.api_url == "http://url.to.your.zhenxun");
    assert(defaults.api_timeout() == std::chrono::seconds(10));

    // Missing everywhere -> defaults
    auto missing = ConfigLoader::load({(testRoot / "nope.json").string()});
    assert(missing.api_url == defaults.api_url);
    std::cout << "[PASS] Missing config yields defaults." << std::endl;

    // Partial override; search order respected
    write_file(testRoot / "config.json", R"({
        "plugin": {"enabled": false, "user_debug": true},
        "api": {"url": "http://127.0.0.1:8080/", "timeout": 3},
        "install": {"max_attempts": 2}
    })");
    auto cfg = ConfigLoader::load({(testRoot / "nope.json").string(), (testRoot / "config.json").string()});
    assert(!cfg.enabled && cfg.user_debug);
    assert(cfg.api_url == "http://127.0.0.1:8080/");
    assert(cfg.api_timeout() == std::chrono::seconds(3));
    assert(cfg.install_max_attempts == 2);
    assert(cfg.install_initial_backoff_ms == 3000);
    assert(cfg.name == "planner_injector");
    std::cout << "[PASS] File values override defaults." << std::endl;

    // Malformed and mistyped files fall back to defaults
    write_file(testRoot / "broken.json", "{ plugin: ");
    assert(ConfigLoader::load_file((testRoot / "broken.json").string()).enabled);
    write_file(testRoot / "typed.json", R"({"api": {"timeout": "soon"}})");
    assert(ConfigLoader::load_file((testRoot / "typed.json").string()).api_timeout_seconds == 10);
    write_file(testRoot / "negative.json", R"({"api": {"timeout": -1}})");
    assert(ConfigLoader::load_file((testRoot / "negative.json").string()).api_timeout_seconds == 10);
    std::cout << "[PASS] Bad config files fall back to defaults." << std::endl;

    // Config flags reach the plugin components
    PlannerInjectorPlugin plugin(cfg, std::make_shared<NullFetcher>(), std::make_shared<NoGroups>());
    assert(!plugin.enrichment().enabled());
    InboundMessage m;
    m.user_id = "u1";
    assert(plugin.enrichment().execute(m).continue_processing);
    assert(plugin.store().size() == 0);
    auto components = plugin.get_plugin_components();
    assert(components.handlers.size() == 1 && components.commands.size() == 1);
    std::cout << "[PASS] Plugin honours the loaded flags." << std::endl;

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
