#include "enrichment_step.hpp"
#include <spdlog/spdlog.h>

namespace planner_injector {

EnrichmentStep::EnrichmentStep(std::shared_ptr<AffinityStore> store,
                               std::shared_ptr<IAffinityFetcher> fetcher,
                               bool enabled)
    : store_(store), fetcher_(fetcher), enabled_(enabled) {}

HandlerInfo EnrichmentStep::get_handler_info() {
    return {"user_info_get", "获取用户好感度", EventType::OnMessage, 900};
}

HandlerResult EnrichmentStep::execute(const InboundMessage& message) {
    if (!enabled_) {
        return {true, true, "disabled"};
    }

    ensure_cached(message.user_id);
    return {true, true, ""};
}

std::future<HandlerResult> EnrichmentStep::execute_async(InboundMessage message) {
    return std::async(std::launch::async, [this, message = std::move(message)]() {
        return execute(message);
    });
}

void EnrichmentStep::ensure_cached(const std::string& user_id) {
    if (store_->get(user_id)) return;

    std::promise<void> done;
    std::shared_future<void> pending;
    bool leader = false;
    {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        auto it = in_flight_.find(user_id);
        if (it != in_flight_.end()) {
            pending = it->second;
        } else {
            // Another leader may have finished between our miss and the lock
            if (store_->get(user_id)) return;
            pending = done.get_future().share();
            in_flight_.emplace(user_id, pending);
            leader = true;
        }
    }

    if (!leader) {
        pending.wait();
        return;
    }

    FetchResult result;
    try {
        result = fetcher_->fetch(user_id);
    } catch (const std::exception& e) {
        spdlog::error("💥 Affinity lookup for {} threw: {}", user_id, e.what());
        result = FetchResult::failure(FetchStatus::TransportError, e.what());
    } catch (...) {
        // Followers are waiting on this lookup; it must always settle
        spdlog::error("💥 Affinity lookup for {} threw a non-standard exception", user_id);
        result = FetchResult::failure(FetchStatus::TransportError, "unknown exception");
    }

    store_->set(user_id, result.impression, result.attitude);

    {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        in_flight_.erase(user_id);
    }
    done.set_value();
}

} // namespace planner_injector
