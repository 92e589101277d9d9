#include <cassert>
#include <iostream>
#include <thread>
#include <chrono>
#include <httplib.h>
#include "affinity_fetcher.hpp"

using namespace planner_injector;

// Stand-in for the affinity service, one route per failure mode.
class FakeAffinityService {
public:
    FakeAffinityService() {
        server_.Post(R"(/get_info/([\w-]+))", [](const httplib::Request& req, httplib::Response& res) {
            const std::string user = req.matches[1];
            if (user == "u1") {
                res.set_content(R"({"impression": 80, "attitude": "friendly"})", "application/json");
            } else if (user == "partial") {
                res.set_content(R"({"impression": 33})", "application/json");
            } else if (user == "empty") {
                res.set_content("{}", "application/json");
            } else if (user == "boom") {
                res.status = 503;
                res.set_content(R"({"error": "overloaded"})", "application/json");
            } else if (user == "garbled") {
                res.set_content("<html>not json{", "text/html");
            } else if (user == "array") {
                res.set_content("[1, 2, 3]", "application/json");
            } else if (user == "wrongtype") {
                res.set_content(R"({"impression": "very high"})", "application/json");
            } else if (user == "huge") {
                res.set_content(R"({"impression": 4294967376})", "application/json");
            } else if (user == "exp") {
                res.set_content(R"({"impression": 1e20})", "application/json");
            } else if (user == "fractional") {
                res.set_content(R"({"impression": 80.9})", "application/json");
            } else if (user == "moved") {
                res.set_redirect("/get_info/u1", 302);
            } else if (user == "slow") {
                std::this_thread::sleep_for(std::chrono::seconds(3));
                res.set_content(R"({"impression": 99})", "application/json");
            } else {
                res.status = 404;
            }
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    ~FakeAffinityService() {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    std::string base_url() const { return "http://127.0.0.1:" + std::to_string(port_); }

private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
};

static void assert_default(const FetchResult& r, FetchStatus expected) {
    assert(r.status == expected);
    assert(!r.ok());
    assert(r.impression == 0);
    assert(r.attitude == kDefaultAttitude);
}

int main() {
    std::cout << "[Test] Starting AffinityFetcher Test..." << std::endl;

    FakeAffinityService service;
    // Trailing slash must be tolerated
    HttpAffinityFetcher fetcher(service.base_url() + "/", std::chrono::seconds(1));
    assert(fetcher.get_endpoint_url("u1") == service.base_url() + "/get_info/u1");

    auto ok = fetcher.fetch("u1");
    assert(ok.ok());
    assert(ok.impression == 80);
    assert(ok.attitude == "friendly");
    std::cout << "[PASS] Successful lookup decoded." << std::endl;

    auto partial = fetcher.fetch("partial");
    assert(partial.ok() && partial.impression == 33 && partial.attitude == kDefaultAttitude);
    auto empty = fetcher.fetch("empty");
    assert(empty.ok() && empty.impression == 0 && empty.attitude == kDefaultAttitude);
    std::cout << "[PASS] Missing fields fall back to defaults." << std::endl;

    auto server_error = fetcher.fetch("boom");
    assert_default(server_error, FetchStatus::HttpStatusError);
    assert(server_error.http_status == 503);
    assert_default(fetcher.fetch("nobody"), FetchStatus::HttpStatusError);
    std::cout << "[PASS] Non-2xx statuses yield the default pair." << std::endl;

    assert_default(fetcher.fetch("garbled"), FetchStatus::DecodeError);
    assert_default(fetcher.fetch("array"), FetchStatus::DecodeError);
    assert_default(fetcher.fetch("wrongtype"), FetchStatus::DecodeError);
    std::cout << "[PASS] Undecodable bodies yield the default pair." << std::endl;

    // Out-of-range or non-integer impressions are rejected, never narrowed
    assert_default(fetcher.fetch("huge"), FetchStatus::DecodeError);
    assert_default(fetcher.fetch("exp"), FetchStatus::DecodeError);
    assert_default(fetcher.fetch("fractional"), FetchStatus::DecodeError);
    std::cout << "[PASS] Impressions outside int range or not integral are decode errors." << std::endl;

    auto moved = fetcher.fetch("moved");
    assert_default(moved, FetchStatus::HttpStatusError);
    assert(moved.http_status == 302);
    std::cout << "[PASS] Redirects are not followed." << std::endl;

    HttpAffinityFetcher unreachable("http://127.0.0.1:1", std::chrono::seconds(1));
    assert_default(unreachable.fetch("u1"), FetchStatus::TransportError);
    std::cout << "[PASS] Connection failure yields the default pair." << std::endl;

    auto start = std::chrono::steady_clock::now();
    auto timed_out = fetcher.fetch("slow");
    auto elapsed = std::chrono::steady_clock::now() - start;
    assert_default(timed_out, FetchStatus::Timeout);
    assert(elapsed < std::chrono::milliseconds(2500) && "Timeout must bound the call.");
    std::cout << "[PASS] Hanging endpoint times out in "
              << std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() << " ms." << std::endl;

    // Decoder in isolation
    assert(decode_affinity_body(R"({"impression": -5, "attitude": "冷淡"})", 200).impression == -5);
    assert(decode_affinity_body("", 200).status == FetchStatus::DecodeError);
    assert(decode_affinity_body(R"({"impression": 2147483647})", 200).impression == 2147483647);
    assert(decode_affinity_body(R"({"impression": -2147483648})", 200).impression == -2147483648);
    assert(decode_affinity_body(R"({"impression": 2147483648})", 200).status == FetchStatus::DecodeError);
    assert(decode_affinity_body(R"({"impression": -2147483649})", 200).status == FetchStatus::DecodeError);
    std::cout << "[PASS] Decoder accepts exactly the int range." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
