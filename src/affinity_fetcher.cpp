#include "affinity_fetcher.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdint>
#include <limits>

namespace planner_injector {

using json = nlohmann::json;

namespace {

std::string strip_trailing_slashes(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

} // namespace

HttpAffinityFetcher::HttpAffinityFetcher(const std::string& base_url, std::chrono::milliseconds timeout)
    : base_url_(strip_trailing_slashes(base_url)), timeout_(timeout) {}

std::string HttpAffinityFetcher::get_endpoint_url(const std::string& user_id) const {
    return base_url_ + "/get_info/" + user_id;
}

FetchResult decode_affinity_body(const std::string& body, long http_status) {
    try {
        auto data = json::parse(body);
        if (!data.is_object()) {
            return FetchResult::failure(FetchStatus::DecodeError, "response body is not a JSON object", http_status);
        }
        int impression = kDefaultImpression;
        auto it = data.find("impression");
        if (it != data.end()) {
            // Only integers that fit an int; floats and huge values would be narrowed
            if (!it->is_number_integer()) {
                return FetchResult::failure(FetchStatus::DecodeError, "impression is not an integer", http_status);
            }
            bool in_range = it->is_number_unsigned()
                ? it->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                : it->get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                  it->get<std::int64_t>() <= std::numeric_limits<int>::max();
            if (!in_range) {
                return FetchResult::failure(FetchStatus::DecodeError, "impression out of range: " + it->dump(), http_status);
            }
            impression = static_cast<int>(it->get<std::int64_t>());
        }
        std::string attitude = data.value("attitude", kDefaultAttitude);
        return FetchResult::success(impression, std::move(attitude), http_status);
    } catch (const json::exception& e) {
        return FetchResult::failure(FetchStatus::DecodeError, e.what(), http_status);
    }
}

FetchResult HttpAffinityFetcher::fetch(const std::string& user_id) {
    const std::string url = get_endpoint_url(user_id);

    // 3xx counts as failure, never followed
    auto r = cpr::Post(cpr::Url{url}, cpr::Timeout{timeout_}, cpr::Redirect{false});

    if (r.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
        spdlog::error("⏱️ API 请求超时: {}", url);
        return FetchResult::failure(FetchStatus::Timeout, r.error.message);
    }

    if (r.error) {
        spdlog::error("❌ API 请求失败: {} ({})", url, r.error.message);
        return FetchResult::failure(FetchStatus::TransportError, r.error.message);
    }

    if (r.status_code < 200 || r.status_code >= 300) {
        spdlog::error("❌ API 请求失败: {} returned HTTP {}", url, r.status_code);
        return FetchResult::failure(FetchStatus::HttpStatusError,
                                    "HTTP " + std::to_string(r.status_code), r.status_code);
    }

    auto result = decode_affinity_body(r.text, r.status_code);
    if (!result.ok()) {
        spdlog::error("💥 处理 API 响应时发生错误: {} ({})", url, result.detail);
        return result;
    }

    spdlog::debug("API 请求成功，用户 {} 的好感度为 {}", user_id, result.impression);
    return result;
}

} // namespace planner_injector
