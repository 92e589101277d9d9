#pragma once
#include <string>
#include <chrono>
#include "affinity_types.hpp"

namespace planner_injector {

class IAffinityFetcher {
public:
    virtual ~IAffinityFetcher() = default;
    // Never throws. On failure the result carries the default pair.
    virtual FetchResult fetch(const std::string& user_id) = 0;
};

// Queries POST {base_url}/get_info/{user_id} on the affinity service.
class HttpAffinityFetcher : public IAffinityFetcher {
public:
    HttpAffinityFetcher(const std::string& base_url, std::chrono::milliseconds timeout);

    FetchResult fetch(const std::string& user_id) override;

    std::string get_endpoint_url(const std::string& user_id) const;

private:
    std::string base_url_;
    std::chrono::milliseconds timeout_;
};

// Parses the service response body. Exposed for the fetcher tests.
FetchResult decode_affinity_body(const std::string& body, long http_status);

} // namespace planner_injector
