#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "charset.hpp"
#include "checkpoint.hpp"
#include "crawl_state.hpp"
#include "fetcher.hpp"
#include "frontier.hpp"
#include "log.hpp"
#include "rate_controller.hpp"

namespace prefixcrawl {

// Fixed set of threads draining the frontier. Each worker pops a prefix,
// fetches it, expands the page into child prefixes, marks the prefix
// explored, then waits out the shared adaptive delay. The pool finishes once
// the frontier is empty and no prefix is in flight on two consecutive polls,
// or when a stop is requested.
class WorkerPool {
public:
    WorkerPool(Frontier& frontier, CrawlState& state, Fetcher& fetcher, RateController& rate, const Charset& charset,
               size_t max_results, Log& log, Sleeper sleeper = sleep_seconds,
               std::chrono::milliseconds poll_interval = std::chrono::milliseconds(5000));
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Optional; periodic saves are skipped when unset.
    void set_checkpoints(CheckpointManager* checkpoints) { checkpoints_ = checkpoints; }

    void start(size_t workers);

    // Workers finish the prefix in hand and exit; queued prefixes stay queued.
    void request_stop();

    void join();

    bool finished() const { return running_.load() == 0; }
    size_t running() const { return running_.load(); }
    uint64_t prefixes_processed() const { return processed_.load(); }
    uint64_t duplicates_skipped() const { return skipped_.load(); }

    // Processes one prefix synchronously: fetch, expand, record, enqueue children.
    void process(const std::string& prefix);

private:
    Frontier& frontier_;
    CrawlState& state_;
    Fetcher& fetcher_;
    RateController& rate_;
    const Charset& charset_;
    const size_t max_results_;
    Log& log_;
    Sleeper sleep_;
    const std::chrono::milliseconds poll_interval_;
    CheckpointManager* checkpoints_ = nullptr;

    std::vector<std::thread> threads_;
    std::atomic<bool> stop_{false};
    std::atomic<size_t> running_{0};
    std::atomic<uint64_t> processed_{0};
    std::atomic<uint64_t> skipped_{0};

    void worker_loop(size_t id);
};

}  // namespace prefixcrawl
