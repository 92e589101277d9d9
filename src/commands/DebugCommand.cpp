#include "commands/DebugCommand.hpp"
#include <regex>
#include <spdlog/spdlog.h>

namespace planner_injector {

DebugCommand::DebugCommand(std::shared_ptr<AffinityStore> store,
                           std::shared_ptr<ChatStreamDirectory> chat_directory,
                           bool enabled,
                           bool allow_user_debug)
    : store_(store), chat_directory_(chat_directory), enabled_(enabled), allow_user_debug_(allow_user_debug) {}

CommandInfo DebugCommand::get_command_info() {
    return {"debug", "测试命令，用于调试", R"(^/debug(?: (\w+))?$)"};
}

std::optional<DebugCommandArgs> DebugCommand::parse(const std::string& text) {
    static const std::regex pattern(get_command_info().pattern);
    std::smatch match;
    if (!std::regex_match(text, match, pattern)) return std::nullopt;

    DebugCommandArgs args;
    if (match[1].matched) args.chat_id = match.str(1);
    return args;
}

CommandResult DebugCommand::execute(const InboundMessage& message, const DebugCommandArgs& args, const MessageSender& send_text) {
    if (!allow_user_debug_ || !enabled_) {
        return {false, "该功能已关闭", 2};
    }

    std::string stream_id = args.chat_id.value_or(message.stream_id);
    bool is_group_chat = chat_directory_->is_group_chat(stream_id);

    if (!is_group_chat) {
        send_text("impression:" + to_string(store_->get(message.user_id)));
    }
    send_text(std::string("is_group_chat:") + (is_group_chat ? "true" : "false"));

    spdlog::debug("/debug from {} on stream {}", message.user_id, stream_id);
    return {true, "你输入的ID是：" + stream_id, 2};
}

} // namespace planner_injector
