#pragma once
#include <string>
#include <vector>
#include <memory>
#include "plugin_config.hpp"
#include "plugin_api.hpp"
#include "cache_manager.hpp"
#include "affinity_fetcher.hpp"
#include "enrichment_step.hpp"
#include "LogManager.hpp"
#include "ReadinessGate.hpp"
#include "commands/DebugCommand.hpp"
#include "planner/PromptHookRegistry.hpp"
#include "planner/PromptInterceptor.hpp"

namespace planner_injector {

struct PluginComponents {
    std::vector<HandlerInfo> handlers;
    std::vector<CommandInfo> commands;
};

// Ties affinity into the reply planner. Built once at startup; every
// consumer gets the same store through this object.
class PlannerInjectorPlugin {
public:
    static constexpr const char* kPluginName = "planner_injector";
    static constexpr const char* kDescription = "把回复概率与好感度挂钩";

    PlannerInjectorPlugin(const PluginConfig& config,
                          std::shared_ptr<IAffinityFetcher> fetcher,
                          std::shared_ptr<ChatStreamDirectory> chat_directory);

    // Uses HttpAffinityFetcher against config.api_url
    PlannerInjectorPlugin(const PluginConfig& config, std::shared_ptr<ChatStreamDirectory> chat_directory);

    PluginComponents get_plugin_components() const;

    // Starts the background planner patch against the host's registry.
    void attach_planner(std::shared_ptr<PromptHookRegistry> registry, std::shared_ptr<ReadinessGate> gate);

    const PluginConfig& config() const { return config_; }
    AffinityStore& store() { return *store_; }
    EnrichmentStep& enrichment() { return *enrichment_; }
    DebugCommand& debug_command() { return *debug_command_; }
    PromptInterceptor& interceptor() { return *interceptor_; }
    LogManager& journal() { return *journal_; }

private:
    PluginConfig config_;
    std::shared_ptr<AffinityStore> store_;
    std::shared_ptr<LogManager> journal_;
    std::shared_ptr<IAffinityFetcher> fetcher_;
    std::unique_ptr<EnrichmentStep> enrichment_;
    std::unique_ptr<DebugCommand> debug_command_;
    std::unique_ptr<PromptInterceptor> interceptor_;
};

} // namespace planner_injector
