#pragma once
#include <string>
#include <map>
#include <set>
#include <mutex>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "planner/PlannerTypes.hpp"

namespace planner_injector {

inline const std::string kPlannerPromptHook = "BrainPlanner.build_planner_prompt";

enum class WrapOutcome {
    NotBound,
    AlreadyWrapped,
    Wrapped
};

// Named registration points for the host's prompt builders. The host binds
// the real routine; plugins layer wrappers on top without touching it.
class PromptHookRegistry {
private:
    struct HookSlot {
        PlannerPromptFn current;
        std::set<std::string> wrapper_tags;
    };

    std::map<std::string, HookSlot> hooks_;
    mutable std::mutex mutex_;

public:
    // Rebinding drops any wrappers layered on the previous routine
    void bind(const std::string& name, PlannerPromptFn fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        hooks_[name] = HookSlot{std::move(fn), {}};
        spdlog::info("🔗 Prompt hook bound: {}", name);
    }

    bool is_bound(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = hooks_.find(name);
        return it != hooks_.end() && static_cast<bool>(it->second.current);
    }

    bool is_wrapped_by(const std::string& name, const std::string& tag) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = hooks_.find(name);
        return it != hooks_.end() && it->second.wrapper_tags.count(tag) > 0;
    }

    template<typename Factory>
    WrapOutcome wrap(const std::string& name, const std::string& tag, Factory&& factory) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = hooks_.find(name);
        if (it == hooks_.end() || !it->second.current) return WrapOutcome::NotBound;
        if (it->second.wrapper_tags.count(tag)) return WrapOutcome::AlreadyWrapped;

        PlannerPromptFn wrapped = factory(it->second.current);
        it->second.current = std::move(wrapped);
        it->second.wrapper_tags.insert(tag);
        return WrapOutcome::Wrapped;
    }

    PlannerPromptResult invoke(const std::string& name,
                               const std::optional<TargetPersonInfo>& chat_target_info,
                               const ActionMap& current_available_actions,
                               const MessageIdList& message_id_list,
                               const std::string& chat_content_block = "",
                               const std::string& interest = "",
                               const std::string& prompt_key = kDefaultPlannerPromptKey) const {
        PlannerPromptFn fn;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = hooks_.find(name);
            if (it == hooks_.end() || !it->second.current) {
                throw std::out_of_range("Prompt hook '" + name + "' is not bound");
            }
            fn = it->second.current;
        }
        // Called outside the lock: a wrapper may be installed concurrently
        return fn(chat_target_info, current_available_actions, message_id_list,
                  chat_content_block, interest, prompt_key);
    }
};

} // namespace planner_injector
