#pragma once
#include <string>
#include <memory>
#include <mutex>
#include <future>
#include <unordered_map>
#include "cache_manager.hpp"
#include "affinity_fetcher.hpp"
#include "plugin_api.hpp"

namespace planner_injector {

// ON_MESSAGE handler: make sure the sender's affinity is cached before
// the planner runs. A cache hit never touches the network.
class EnrichmentStep {
public:
    EnrichmentStep(std::shared_ptr<AffinityStore> store,
                   std::shared_ptr<IAffinityFetcher> fetcher,
                   bool enabled);

    static HandlerInfo get_handler_info();

    HandlerResult execute(const InboundMessage& message);
    std::future<HandlerResult> execute_async(InboundMessage message);

    bool enabled() const { return enabled_; }

private:
    std::shared_ptr<AffinityStore> store_;
    std::shared_ptr<IAffinityFetcher> fetcher_;
    const bool enabled_;

    // user_id -> lookup already on the wire for that user
    std::unordered_map<std::string, std::shared_future<void>> in_flight_;
    std::mutex in_flight_mutex_;

    void ensure_cached(const std::string& user_id);
};

} // namespace planner_injector
