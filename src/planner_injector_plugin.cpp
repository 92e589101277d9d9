#include "planner_injector_plugin.hpp"
#include <spdlog/spdlog.h>

namespace planner_injector {

PlannerInjectorPlugin::PlannerInjectorPlugin(const PluginConfig& config,
                                             std::shared_ptr<IAffinityFetcher> fetcher,
                                             std::shared_ptr<ChatStreamDirectory> chat_directory)
    : config_(config),
      store_(std::make_shared<AffinityStore>()),
      journal_(std::make_shared<LogManager>()),
      fetcher_(fetcher) {
    enrichment_ = std::make_unique<EnrichmentStep>(store_, fetcher_, config_.enabled);
    debug_command_ = std::make_unique<DebugCommand>(store_, chat_directory, config_.enabled, config_.user_debug);
    interceptor_ = std::make_unique<PromptInterceptor>(store_, journal_);

    spdlog::info("🧩 插件{}已加载", config_.name);
}

PlannerInjectorPlugin::PlannerInjectorPlugin(const PluginConfig& config, std::shared_ptr<ChatStreamDirectory> chat_directory)
    : PlannerInjectorPlugin(config,
                            std::make_shared<HttpAffinityFetcher>(config.api_url, config.api_timeout()),
                            chat_directory) {}

PluginComponents PlannerInjectorPlugin::get_plugin_components() const {
    return {{EnrichmentStep::get_handler_info()}, {DebugCommand::get_command_info()}};
}

void PlannerInjectorPlugin::attach_planner(std::shared_ptr<PromptHookRegistry> registry, std::shared_ptr<ReadinessGate> gate) {
    InstallPolicy policy;
    policy.max_attempts = config_.install_max_attempts;
    policy.initial_backoff = std::chrono::milliseconds(config_.install_initial_backoff_ms);
    interceptor_->start_background_install(registry, gate, policy);
}

} // namespace planner_injector
