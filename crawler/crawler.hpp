#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "charset.hpp"
#include "checkpoint.hpp"
#include "config.hpp"
#include "crawl_state.hpp"
#include "fetcher.hpp"
#include "frontier.hpp"
#include "http_transport.hpp"
#include "log.hpp"
#include "rate_controller.hpp"
#include "worker_pool.hpp"

namespace prefixcrawl {

// Final output document: {"total_requests", "total_names", "names" (sorted)}.
std::string encode_results(uint64_t total_requests, const std::vector<std::string>& names);

// Writes encode_results() atomically to `path`. Returns empty string on success.
std::string save_results(const std::string& path, uint64_t total_requests, const std::vector<std::string>& names);

// One crawl run: resume or seed, drain the frontier with a worker pool,
// report progress, then checkpoint and write the results.
class Crawler {
public:
    struct Summary {
        uint64_t requests = 0;
        size_t names = 0;
        size_t explored = 0;
        double seconds = 0.0;
        bool interrupted = false;
        bool resumed = false;
    };

    Crawler(const Config& cfg, HttpTransport& transport, Log& log, Sleeper sleeper = sleep_seconds,
            std::chrono::milliseconds poll_interval = std::chrono::milliseconds(5000));

    // Runs until the crawl completes or `stop` becomes true. Returns empty
    // string on success; otherwise the error that ended the run early (the
    // results gathered so far are still written).
    std::string run(const std::atomic<bool>& stop, Summary& summary);

    const CrawlState& state() const { return state_; }
    const Charset& charset() const { return charset_; }
    const RateController& rate() const { return rate_; }

private:
    Config cfg_;
    Log& log_;
    Sleeper sleep_;
    const std::chrono::milliseconds poll_interval_;

    Charset charset_;
    CrawlState state_;
    Frontier frontier_;
    RateController rate_;
    Fetcher fetcher_;
    CheckpointManager checkpoints_;

    std::chrono::steady_clock::time_point started_;

    bool resume();
    void seed();
    void log_status() const;
    void log_final(double seconds) const;
};

}  // namespace prefixcrawl
