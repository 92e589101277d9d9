#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace planner_injector {

inline const std::string kDefaultAttitude = "一般";
constexpr int kDefaultImpression = 0;
constexpr std::chrono::seconds kDefaultCacheTtl{3600};

struct AffinityRecord {
    std::string user_id;
    int impression = kDefaultImpression;
    std::string attitude = kDefaultAttitude;

    bool operator==(const AffinityRecord& other) const {
        return user_id == other.user_id && impression == other.impression && attitude == other.attitude;
    }
};

// Human-readable form used by the debug command
inline std::string to_string(const AffinityRecord& r) {
    return "AffinityRecord(user_id=" + r.user_id +
           ", impression=" + std::to_string(r.impression) +
           ", attitude=" + r.attitude + ")";
}

inline std::string to_string(const std::optional<AffinityRecord>& r) {
    return r ? to_string(*r) : std::string("None");
}

enum class FetchStatus {
    Ok,
    Timeout,
    TransportError,
    HttpStatusError,
    DecodeError
};

inline const char* to_string(FetchStatus s) {
    switch (s) {
        case FetchStatus::Ok: return "ok";
        case FetchStatus::Timeout: return "timeout";
        case FetchStatus::TransportError: return "transport_error";
        case FetchStatus::HttpStatusError: return "http_status_error";
        case FetchStatus::DecodeError: return "decode_error";
    }
    return "unknown";
}

// Outcome of one remote lookup. impression/attitude are always usable:
// any failure leaves them at the neutral defaults.
struct FetchResult {
    FetchStatus status = FetchStatus::Ok;
    int impression = kDefaultImpression;
    std::string attitude = kDefaultAttitude;
    long http_status = 0;
    std::string detail;

    bool ok() const { return status == FetchStatus::Ok; }

    static FetchResult success(int impression, std::string attitude, long http_status = 200) {
        FetchResult r;
        r.impression = impression;
        r.attitude = std::move(attitude);
        r.http_status = http_status;
        return r;
    }

    static FetchResult failure(FetchStatus status, std::string detail, long http_status = 0) {
        FetchResult r;
        r.status = status;
        r.detail = std::move(detail);
        r.http_status = http_status;
        return r;
    }
};

} // namespace planner_injector
