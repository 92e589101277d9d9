#pragma once
#include <string>
#include <optional>
#include <functional>

namespace planner_injector {

// What the host hands to message handlers and commands.
struct InboundMessage {
    std::string message_id;
    std::string platform;
    std::string user_id;
    std::string user_nickname;
    std::string stream_id;
    std::optional<std::string> group_id;
    std::string plain_text;
};

struct HandlerResult {
    bool success = true;
    bool continue_processing = true; // false would stop the host pipeline
    std::string detail;
};

struct CommandResult {
    bool success = false;
    std::string message;
    int intercept_level = 2;
};

enum class EventType {
    OnStart,
    OnMessage,
    PostLlm
};

struct HandlerInfo {
    std::string name;
    std::string description;
    EventType event_type;
    int weight;
};

struct CommandInfo {
    std::string name;
    std::string description;
    std::string pattern;
};

// Host-side lookup of chat stream metadata
class ChatStreamDirectory {
public:
    virtual ~ChatStreamDirectory() = default;
    virtual bool is_group_chat(const std::string& stream_id) = 0;
};

using MessageSender = std::function<void(const std::string& text)>;

} // namespace planner_injector
