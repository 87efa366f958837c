#include "worker_pool.hpp"

#include <utility>

#include "expansion.hpp"

namespace prefixcrawl {

WorkerPool::WorkerPool(Frontier& frontier, CrawlState& state, Fetcher& fetcher, RateController& rate,
                       const Charset& charset, size_t max_results, Log& log, Sleeper sleeper,
                       std::chrono::milliseconds poll_interval)
    : frontier_(frontier),
      state_(state),
      fetcher_(fetcher),
      rate_(rate),
      charset_(charset),
      max_results_(max_results),
      log_(log),
      sleep_(std::move(sleeper)),
      poll_interval_(poll_interval) {}

WorkerPool::~WorkerPool() {
    request_stop();
    join();
}

void WorkerPool::start(size_t workers) {
    stop_.store(false);
    running_.fetch_add(workers);
    threads_.reserve(threads_.size() + workers);
    for (size_t i = 0; i < workers; i++) {
        threads_.emplace_back([this, i] { worker_loop(i); });
    }
}

void WorkerPool::request_stop() {
    stop_.store(true);
}

void WorkerPool::join() {
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

void WorkerPool::process(const std::string& prefix) {
    log_.info("Processing prefix: '" + prefix + "'");

    FetchResult page = fetcher_.fetch(prefix);
    if (page.ok()) state_.stats.record(prefix.size(), !page.names.empty());

    // Any failure leaves an empty page: nothing recorded, nothing queued.
    Expansion e = expand_prefix(prefix, page.names, max_results_, charset_);
    state_.names.insert_all(e.names);

    for (const auto& child : e.children) {
        if (state_.explored.contains(child.prefix)) continue;
        frontier_.push(child.priority, child.prefix);
    }
    if (e.kind == Expansion::Kind::Fallback) {
        log_.debug("No pivot for '" + prefix + "', queued every extension");
    }

    state_.explored.insert(prefix);
    processed_.fetch_add(1);
}

void WorkerPool::worker_loop(size_t id) {
    int idle_polls = 0;
    while (!stop_.load()) {
        QueueItem item;
        if (!frontier_.pop(item, poll_interval_)) {
            if (frontier_.closed()) break;
            // Two empty polls in a row with nothing in flight anywhere means no
            // worker can still be about to push more work.
            if (frontier_.quiescent()) {
                if (++idle_polls >= 2) break;
            } else {
                idle_polls = 0;
            }
            continue;
        }
        idle_polls = 0;

        if (state_.explored.contains(item.prefix)) {
            skipped_.fetch_add(1);
            frontier_.done(item.prefix);
            continue;
        }

        process(item.prefix);
        frontier_.done(item.prefix);

        if (checkpoints_) checkpoints_->maybe_save();
        sleep_(rate_.delay_for(item.prefix.size()));
    }

    log_.debug(msg() << "Worker " << id << " exiting");
    running_.fetch_sub(1);
}

}  // namespace prefixcrawl
