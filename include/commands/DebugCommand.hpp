#pragma once
#include <string>
#include <memory>
#include <optional>
#include "cache_manager.hpp"
#include "plugin_api.hpp"

namespace planner_injector {

struct DebugCommandArgs {
    std::optional<std::string> chat_id;
};

// /debug [chatid]: shows the caller's cached affinity and the chat type.
class DebugCommand {
public:
    DebugCommand(std::shared_ptr<AffinityStore> store,
                 std::shared_ptr<ChatStreamDirectory> chat_directory,
                 bool enabled,
                 bool allow_user_debug);

    static CommandInfo get_command_info();

    // nullopt when text is not a /debug invocation
    static std::optional<DebugCommandArgs> parse(const std::string& text);

    CommandResult execute(const InboundMessage& message, const DebugCommandArgs& args, const MessageSender& send_text);

private:
    std::shared_ptr<AffinityStore> store_;
    std::shared_ptr<ChatStreamDirectory> chat_directory_;
    const bool enabled_;
    const bool allow_user_debug_;
};

} // namespace planner_injector
