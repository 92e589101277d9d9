#include "planner/PromptInterceptor.hpp"
#include <spdlog/spdlog.h>

namespace planner_injector {

namespace {

long long now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string chat_id_of(const MessageIdList& messages) {
    for (const auto& [id, msg] : messages) {
        if (!msg.chat_id.empty()) return msg.chat_id;
    }
    return "";
}

PlannerPromptResult inject_affinity(const std::shared_ptr<AffinityStore>& store,
                                    const std::shared_ptr<LogManager>& journal,
                                    const PlannerPromptFn& original,
                                    const std::optional<TargetPersonInfo>& chat_target_info,
                                    const ActionMap& current_available_actions,
                                    const MessageIdList& message_id_list,
                                    const std::string& chat_content_block,
                                    const std::string& interest,
                                    const std::string& prompt_key) {
    auto [prompt, message_id_list_result] = original(chat_target_info, current_available_actions, message_id_list,
                                                     chat_content_block, interest, prompt_key);

    // Private chats only carry a target; group planning passes none
    if (!chat_target_info) {
        return {std::move(prompt), std::move(message_id_list_result)};
    }

    auto record = store->get(chat_target_info->user_id);
    if (record) {
        prompt += build_affinity_sentence(*record);

        std::string chat_id = chat_id_of(message_id_list_result);
        if (journal) {
            journal->add_log({now_millis(), chat_id, record->user_id, record->impression,
                              record->attitude, prompt_key, prompt.size()});
        }
        spdlog::info("💉 成功为{}...注入好感度提示", chat_id.substr(0, 5));
    }
    return {std::move(prompt), std::move(message_id_list_result)};
}

} // namespace

const char* to_string(InstallState state) {
    switch (state) {
        case InstallState::Uninstalled: return "uninstalled";
        case InstallState::Installing: return "installing";
        case InstallState::Installed: return "installed";
        case InstallState::Failed: return "failed";
    }
    return "unknown";
}

std::string build_affinity_sentence(const AffinityRecord& record) {
    return "\n你对当前用户的好感度是" + std::to_string(record.impression) +
           "，态度是" + record.attitude +
           "，好感度越高，选择reply的概率越大。好感度>50则有75%的概率reply。";
}

PromptInterceptor::PromptInterceptor(std::shared_ptr<AffinityStore> store, std::shared_ptr<LogManager> journal)
    : store_(store), journal_(journal) {}

PromptInterceptor::~PromptInterceptor() {
    std::lock_guard<std::mutex> lock(installer_mutex_);
    if (installer_.joinable()) {
        stopping_ = true;
        gate_->wake_waiters();
        installer_.join();
    }
}

bool PromptInterceptor::install(PromptHookRegistry& registry, const std::string& hook_name) {
    std::lock_guard<std::mutex> lock(install_mutex_);

    // The wrapper holds its own references so it stays valid in the
    // registry even if this interceptor goes away first.
    auto store = store_;
    auto journal = journal_;
    auto outcome = registry.wrap(hook_name, kWrapperTag, [store, journal](PlannerPromptFn original) {
        return PlannerPromptFn(
            [store, journal, original](const std::optional<TargetPersonInfo>& chat_target_info,
                                       const ActionMap& current_available_actions,
                                       const MessageIdList& message_id_list,
                                       const std::string& chat_content_block,
                                       const std::string& interest,
                                       const std::string& prompt_key) {
                return inject_affinity(store, journal, original, chat_target_info, current_available_actions,
                                       message_id_list, chat_content_block, interest, prompt_key);
            });
    });

    switch (outcome) {
        case WrapOutcome::Wrapped:
            state_ = InstallState::Installed;
            spdlog::info("✅ 成功注入好感度提示 (planner patch): {}", hook_name);
            return true;
        case WrapOutcome::AlreadyWrapped:
            state_ = InstallState::Installed;
            spdlog::debug("Planner patch already present on {}", hook_name);
            return true;
        case WrapOutcome::NotBound:
            break;
    }

    spdlog::error("❌ 注入失败 (planner patch): hook {} is not bound", hook_name);
    if (state_ != InstallState::Installing) state_ = InstallState::Failed;
    return false;
}

void PromptInterceptor::start_background_install(std::shared_ptr<PromptHookRegistry> registry,
                                                 std::shared_ptr<ReadinessGate> gate,
                                                 InstallPolicy policy,
                                                 const std::string& hook_name) {
    std::lock_guard<std::mutex> lock(installer_mutex_);
    if (installer_.joinable() || state_ == InstallState::Installed) return;

    gate_ = gate;
    state_ = InstallState::Installing;
    installer_ = std::thread(&PromptInterceptor::run_installer, this, registry, gate, policy, hook_name);
}

void PromptInterceptor::wait_for_install() {
    std::lock_guard<std::mutex> lock(installer_mutex_);
    if (installer_.joinable()) installer_.join();
}

void PromptInterceptor::run_installer(std::shared_ptr<PromptHookRegistry> registry,
                                      std::shared_ptr<ReadinessGate> gate,
                                      InstallPolicy policy,
                                      std::string hook_name) {
    auto backoff = policy.initial_backoff;

    for (int attempt = 1; attempt <= policy.max_attempts; ++attempt) {
        bool ready = gate->wait_for(backoff, stopping_);
        if (stopping_) {
            spdlog::warn("⚠️ Planner patch stopped before install");
            state_ = InstallState::Failed;
            return;
        }

        if (ready && install(*registry, hook_name)) return;

        spdlog::warn("⚠️ Planner hook {} not ready (attempt {}/{}, gate {})",
                     hook_name, attempt, policy.max_attempts, ready ? "open" : "closed");

        // An open gate returns at once, so back off explicitly
        if (ready && attempt < policy.max_attempts && gate->sleep_for(backoff, stopping_)) {
            state_ = InstallState::Failed;
            return;
        }
        backoff *= 2;
    }

    spdlog::error("❌ 注入失败 (planner patch): gave up on {} after {} attempts", hook_name, policy.max_attempts);
    state_ = InstallState::Failed;
}

} // namespace planner_injector
