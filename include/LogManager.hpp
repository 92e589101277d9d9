#pragma once
#include <deque>
#include <mutex>
#include <vector>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace planner_injector {

struct InjectionLog {
    long long timestamp;
    std::string chat_id;
    std::string user_id;
    int impression;
    std::string attitude;
    std::string prompt_key;
    size_t prompt_length; // length after injection
};

// Keeps the most recent prompt injections for the admin endpoint.
class LogManager {
public:
    explicit LogManager(size_t capacity = 50) : capacity_(capacity) {}

    void add_log(const InjectionLog& log) {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.push_back(log);
        if (logs_.size() > capacity_) {
            logs_.pop_front();
        }
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return logs_.size();
    }

    std::vector<InjectionLog> snapshot() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return {logs_.begin(), logs_.end()};
    }

    json get_logs_json() const {
        std::lock_guard<std::mutex> lock(mtx_);
        json j_list = json::array();
        // Newest first
        for (auto it = logs_.rbegin(); it != logs_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"chat_id", it->chat_id},
                {"user_id", it->user_id},
                {"impression", it->impression},
                {"attitude", it->attitude},
                {"prompt_key", it->prompt_key},
                {"prompt_length", it->prompt_length}
            });
        }
        return j_list;
    }

private:
    const size_t capacity_;
    std::deque<InjectionLog> logs_;
    mutable std::mutex mtx_;
};

}
