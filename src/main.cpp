#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <cstdlib>

#include "plugin_config.hpp"
#include "planner_injector_plugin.hpp"
#include "planner/PromptHookRegistry.hpp"
#include "host/BrainPlanner.hpp"
#include "ReadinessGate.hpp"

using json = nlohmann::json;
using namespace planner_injector;

namespace {

InboundMessage parse_message(const json& j) {
    InboundMessage m;
    m.message_id = j.value("message_id", "");
    m.platform = j.value("platform", "qq");
    m.user_id = j.at("user_id").get<std::string>();
    m.user_nickname = j.value("user_nickname", "");
    if (j.contains("group_id") && !j["group_id"].is_null()) {
        m.group_id = j["group_id"].get<std::string>();
    }
    m.stream_id = j.value("stream_id", m.group_id ? "group:" + *m.group_id : "private:" + m.user_id);
    m.plain_text = j.value("plain_text", "");
    return m;
}

std::optional<TargetPersonInfo> parse_target(const json& body) {
    if (!body.contains("chat_target_info") || body["chat_target_info"].is_null()) return std::nullopt;
    const auto& t = body["chat_target_info"];
    return TargetPersonInfo{
        t.value("platform", "qq"),
        t.at("user_id").get<std::string>(),
        t.value("user_nickname", ""),
        t.value("person_id", ""),
        t.value("person_name", "")
    };
}

ActionMap parse_actions(const json& body) {
    ActionMap actions;
    if (!body.contains("actions")) return actions;
    for (const auto& a : body["actions"]) {
        ActionInfo info;
        info.name = a.at("name").get<std::string>();
        info.description = a.value("description", "");
        info.requirements = a.value("requirements", std::vector<std::string>{});
        actions[info.name] = info;
    }
    return actions;
}

MessageIdList parse_messages(const json& body) {
    MessageIdList list;
    if (!body.contains("messages")) return list;
    for (const auto& m : body["messages"]) {
        DatabaseMessage msg;
        msg.message_id = m.value("message_id", "");
        msg.chat_id = m.value("chat_id", "");
        msg.user_id = m.value("user_id", "");
        msg.user_nickname = m.value("user_nickname", "");
        msg.time = m.value("time", 0.0);
        msg.processed_plain_text = m.value("processed_plain_text", "");
        list.emplace_back(msg.message_id, msg);
    }
    return list;
}

json messages_to_json(const MessageIdList& list) {
    json out = json::array();
    for (const auto& [id, msg] : list) {
        out.push_back({{"message_id", id}, {"chat_id", msg.chat_id}, {"user_id", msg.user_id},
                       {"processed_plain_text", msg.processed_plain_text}});
    }
    return out;
}

} // namespace

class PlannerHostServer {
public:
    PlannerHostServer(const PluginConfig& config, int port = 5003)
        : port_(port),
          server_(),
          chat_directory_(std::make_shared<host::InMemoryChatDirectory>()),
          registry_(std::make_shared<PromptHookRegistry>()),
          planner_ready_(std::make_shared<ReadinessGate>()),
          plugin_(config, chat_directory_)
    {
        auto components = plugin_.get_plugin_components();
        for (const auto& h : components.handlers) spdlog::info("🛰️ Handler Integrated: {} (weight {})", h.name, h.weight);
        for (const auto& c : components.commands) spdlog::info("🛰️ Command Integrated: /{}", c.name);

        plugin_.attach_planner(registry_, planner_ready_);
        setup_routes();
    }

    void run() {
        // The planner comes up after plugins are loaded, as in the real host
        registry_->bind(kPlannerPromptHook, [this](const std::optional<TargetPersonInfo>& target,
                                                   const ActionMap& actions,
                                                   const MessageIdList& messages,
                                                   const std::string& chat_content_block,
                                                   const std::string& interest,
                                                   const std::string& prompt_key) {
            return planner_.build_planner_prompt(target, actions, messages, chat_content_block, interest, prompt_key);
        });
        planner_ready_->open();

        spdlog::info("🚀 Starting planner host on port {}", port_);
        server_.listen("127.0.0.1", port_);
    }

private:
    int port_;
    httplib::Server server_;
    host::BrainPlanner planner_;
    std::shared_ptr<host::InMemoryChatDirectory> chat_directory_;
    std::shared_ptr<PromptHookRegistry> registry_;
    std::shared_ptr<ReadinessGate> planner_ready_;
    PlannerInjectorPlugin plugin_;

    void setup_routes() {
        server_.Post("/message", [this](const httplib::Request& req, httplib::Response& res) {
            try {
                auto message = parse_message(json::parse(req.body));
                chat_directory_->remember(message);
                auto result = plugin_.enrichment().execute(message);
                res.set_content(json{{"success", result.success},
                                     {"continue", result.continue_processing}}.dump(), "application/json");
            } catch (const std::exception& e) {
                spdlog::error("❌ Message handling error: {}", e.what());
                res.status = 500;
                res.set_content(json{{"error", e.what()}}.dump(), "application/json");
            }
        });

        server_.Post("/command", [this](const httplib::Request& req, httplib::Response& res) {
            try {
                auto body = json::parse(req.body);
                auto message = parse_message(body.at("message"));
                auto args = DebugCommand::parse(body.value("text", message.plain_text));
                if (!args) {
                    res.status = 404;
                    res.set_content(json{{"error", "Unknown command"}}.dump(), "application/json");
                    return;
                }

                json sent = json::array();
                auto result = plugin_.debug_command().execute(message, *args,
                    [&sent](const std::string& text) { sent.push_back(text); });

                res.set_content(json{{"success", result.success},
                                     {"message", result.message},
                                     {"intercept_level", result.intercept_level},
                                     {"sent", sent}}.dump(), "application/json");
            } catch (const std::exception& e) {
                res.status = 500;
                res.set_content(json{{"error", e.what()}}.dump(), "application/json");
            }
        });

        server_.Post("/plan", [this](const httplib::Request& req, httplib::Response& res) {
            try {
                auto body = json::parse(req.body);
                auto [prompt, messages] = registry_->invoke(
                    kPlannerPromptHook,
                    parse_target(body),
                    parse_actions(body),
                    parse_messages(body),
                    body.value("chat_content_block", ""),
                    body.value("interest", ""),
                    body.value("prompt_key", kDefaultPlannerPromptKey));

                res.set_content(json{{"prompt", prompt},
                                     {"messages", messages_to_json(messages)},
                                     {"patch_state", to_string(plugin_.interceptor().state())}}.dump(),
                                "application/json");
            } catch (const std::exception& e) {
                spdlog::error("❌ Planner error: {}", e.what());
                res.status = 500;
                res.set_content(json{{"error", e.what()}}.dump(), "application/json");
            }
        });

        server_.Get("/api/admin/injections", [this](const httplib::Request&, httplib::Response& res) {
            json response = {
                {"patch_state", to_string(plugin_.interceptor().state())},
                {"cached_users", plugin_.store().size()},
                {"logs", plugin_.journal().get_logs_json()}
            };
            res.set_content(response.dump(), "application/json");
        });
    }
};

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(std::getenv("PLANNER_INJECTOR_DEBUG") ? spdlog::level::debug : spdlog::level::info);

    PluginConfig config = argc > 1 ? ConfigLoader::load_file(argv[1]) : ConfigLoader::load();

    PlannerHostServer server(config, 5003);
    server.run();
    return 0;
}
