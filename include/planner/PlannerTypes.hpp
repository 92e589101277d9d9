#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <utility>
#include <functional>

namespace planner_injector {

struct TargetPersonInfo {
    std::string platform;
    std::string user_id;
    std::string user_nickname;
    std::string person_id;
    std::string person_name;
};

struct ActionInfo {
    std::string name;
    std::string description;
    std::map<std::string, std::string> parameters;
    std::vector<std::string> requirements;
};

struct DatabaseMessage {
    std::string message_id;
    std::string chat_id;
    std::string user_id;
    std::string user_nickname;
    double time = 0.0;
    std::string processed_plain_text;

    bool operator==(const DatabaseMessage& o) const {
        return message_id == o.message_id && chat_id == o.chat_id && user_id == o.user_id &&
               user_nickname == o.user_nickname && time == o.time &&
               processed_plain_text == o.processed_plain_text;
    }
};

using ActionMap = std::map<std::string, ActionInfo>;
using MessageIdList = std::vector<std::pair<std::string, DatabaseMessage>>;
using PlannerPromptResult = std::pair<std::string, MessageIdList>;

inline const std::string kDefaultPlannerPromptKey = "brain_planner_prompt_react";

// Shape of the host's planner prompt builder. Wrappers must keep it exactly.
using PlannerPromptFn = std::function<PlannerPromptResult(
    const std::optional<TargetPersonInfo>& chat_target_info,
    const ActionMap& current_available_actions,
    const MessageIdList& message_id_list,
    const std::string& chat_content_block,
    const std::string& interest,
    const std::string& prompt_key)>;

} // namespace planner_injector
