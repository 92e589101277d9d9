#include "host/BrainPlanner.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace planner_injector::host {

namespace {

void replace_all(std::string& text, const std::string& token, const std::string& value) {
    size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.length(), value);
        pos += value.length();
    }
}

std::string describe_target(const std::optional<TargetPersonInfo>& target) {
    if (!target) return "你正在群聊中";
    std::string name = target->person_name.empty() ? target->user_nickname : target->person_name;
    return "你正在和" + name + "私聊";
}

std::string describe_actions(const ActionMap& actions) {
    std::string out;
    for (const auto& [name, action] : actions) {
        out += "- " + name + ": " + action.description + "\n";
        for (const auto& req : action.requirements) {
            out += "  要求: " + req + "\n";
        }
    }
    return out;
}

} // namespace

BrainPlanner::BrainPlanner() {
    templates_[kDefaultPlannerPromptKey] =
        "{chat_target}\n"
        "### 聊天记录\n{chat_content_block}\n"
        "### 可用动作\n{actions}"
        "{interest}\n"
        "请从可用动作中选择最合适的一个，并以JSON格式输出。";
}

void BrainPlanner::set_template(const std::string& prompt_key, const std::string& text) {
    std::lock_guard<std::mutex> lock(templates_mutex_);
    templates_[prompt_key] = text;
}

PlannerPromptResult BrainPlanner::build_planner_prompt(const std::optional<TargetPersonInfo>& chat_target_info,
                                                       const ActionMap& current_available_actions,
                                                       const MessageIdList& message_id_list,
                                                       const std::string& chat_content_block,
                                                       const std::string& interest,
                                                       const std::string& prompt_key) const {
    std::string prompt;
    {
        std::lock_guard<std::mutex> lock(templates_mutex_);
        auto it = templates_.find(prompt_key);
        if (it == templates_.end()) {
            throw std::invalid_argument("Unknown planner prompt key: " + prompt_key);
        }
        prompt = it->second;
    }

    replace_all(prompt, "{chat_target}", describe_target(chat_target_info));
    replace_all(prompt, "{chat_content_block}", chat_content_block);
    replace_all(prompt, "{actions}", describe_actions(current_available_actions));
    replace_all(prompt, "{interest}", interest);

    spdlog::debug("Planner prompt built ({} chars, {} messages)", prompt.size(), message_id_list.size());
    return {prompt, message_id_list};
}

InMemoryChatDirectory::InMemoryChatDirectory(size_t max_streams)
    : max_streams_(max_streams > 0 ? max_streams : 1) {}

void InMemoryChatDirectory::remember(const InboundMessage& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = group_streams_.insert_or_assign(message.stream_id, message.group_id.has_value());
    if (!inserted) return;

    order_.push_back(message.stream_id);
    if (order_.size() > max_streams_) {
        spdlog::debug("Chat directory full, forgetting stream {}", order_.front());
        group_streams_.erase(order_.front());
        order_.pop_front();
    }
}

bool InMemoryChatDirectory::is_group_chat(const std::string& stream_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = group_streams_.find(stream_id);
    return it != group_streams_.end() && it->second;
}

size_t InMemoryChatDirectory::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return group_streams_.size();
}

} // namespace planner_injector::host
