#pragma once
#include <string>
#include <map>
#include <mutex>
#include <unordered_map>
#include <deque>
#include "plugin_api.hpp"
#include "planner/PlannerTypes.hpp"

namespace planner_injector::host {

// Demo host's planner. build_planner_prompt is the routine plugins wrap.
class BrainPlanner {
public:
    BrainPlanner();

    PlannerPromptResult build_planner_prompt(const std::optional<TargetPersonInfo>& chat_target_info,
                                             const ActionMap& current_available_actions,
                                             const MessageIdList& message_id_list,
                                             const std::string& chat_content_block = "",
                                             const std::string& interest = "",
                                             const std::string& prompt_key = kDefaultPlannerPromptKey) const;

    void set_template(const std::string& prompt_key, const std::string& text);

private:
    std::map<std::string, std::string> templates_;
    mutable std::mutex templates_mutex_;
};

// Streams are remembered as they are seen on inbound messages. Holds at
// most max_streams entries; the oldest stream is forgotten first and then
// reads as a private chat until it is seen again.
class InMemoryChatDirectory : public ChatStreamDirectory {
public:
    static constexpr size_t kDefaultMaxStreams = 10000;

    explicit InMemoryChatDirectory(size_t max_streams = kDefaultMaxStreams);

    void remember(const InboundMessage& message);
    bool is_group_chat(const std::string& stream_id) override;
    size_t size();

private:
    size_t max_streams_;
    std::unordered_map<std::string, bool> group_streams_;
    std::deque<std::string> order_;
    std::mutex mutex_;
};

} // namespace planner_injector::host
