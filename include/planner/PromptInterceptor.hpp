#pragma once
#include <string>
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>
#include <chrono>
#include "cache_manager.hpp"
#include "LogManager.hpp"
#include "ReadinessGate.hpp"
#include "planner/PromptHookRegistry.hpp"

namespace planner_injector {

enum class InstallState {
    Uninstalled,
    Installing,
    Installed,
    Failed
};

const char* to_string(InstallState state);

struct InstallPolicy {
    int max_attempts = 5;
    std::chrono::milliseconds initial_backoff{3000};
};

// Sentence appended to the planner prompt for a cached user.
std::string build_affinity_sentence(const AffinityRecord& record);

// Wraps the host's planner prompt builder so every prompt for a user with
// cached affinity gets the affinity sentence appended.
class PromptInterceptor {
public:
    static constexpr const char* kWrapperTag = "planner_injector.affinity";

    PromptInterceptor(std::shared_ptr<AffinityStore> store, std::shared_ptr<LogManager> journal);
    ~PromptInterceptor();

    PromptInterceptor(const PromptInterceptor&) = delete;
    PromptInterceptor& operator=(const PromptInterceptor&) = delete;

    bool install(PromptHookRegistry& registry, const std::string& hook_name = kPlannerPromptHook);

    // Waits on the gate from a dedicated thread, retrying with doubling
    // backoff. Only the first call starts a thread.
    void start_background_install(std::shared_ptr<PromptHookRegistry> registry,
                                  std::shared_ptr<ReadinessGate> gate,
                                  InstallPolicy policy = {},
                                  const std::string& hook_name = kPlannerPromptHook);

    // Blocks until a background install has finished (or none was started).
    void wait_for_install();

    InstallState state() const { return state_.load(); }

private:
    std::shared_ptr<AffinityStore> store_;
    std::shared_ptr<LogManager> journal_;
    std::atomic<InstallState> state_{InstallState::Uninstalled};

    std::mutex install_mutex_;
    std::mutex installer_mutex_;
    std::thread installer_;
    std::shared_ptr<ReadinessGate> gate_;
    std::atomic<bool> stopping_{false};

    void run_installer(std::shared_ptr<PromptHookRegistry> registry,
                       std::shared_ptr<ReadinessGate> gate,
                       InstallPolicy policy,
                       std::string hook_name);
};

} // namespace planner_injector
