#include "crawler.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <thread>
#include <utility>

#include "expansion.hpp"
#include "file_util.hpp"
#include "json_util.hpp"

namespace prefixcrawl {

std::string encode_results(uint64_t total_requests, const std::vector<std::string>& names) {
    std::ostringstream head;
    head << "{\n  \"total_requests\": " << total_requests << ",\n  \"total_names\": " << names.size()
         << ",\n  \"names\": ";
    std::string out = head.str();
    json_append_string_array(out, names, 2, 1);
    out += "\n}\n";
    return out;
}

std::string save_results(const std::string& path, uint64_t total_requests, const std::vector<std::string>& names) {
    return write_text_file_atomic(path, encode_results(total_requests, names));
}

static FetchPolicy policy_from(const Config& cfg) {
    FetchPolicy p;
    p.api_version = cfg.api_version;
    p.max_results = cfg.max_results;
    p.max_retries = cfg.max_retries;
    return p;
}

Crawler::Crawler(const Config& cfg, HttpTransport& transport, Log& log, Sleeper sleeper,
                 std::chrono::milliseconds poll_interval)
    : cfg_(cfg),
      log_(log),
      sleep_(std::move(sleeper)),
      poll_interval_(poll_interval),
      charset_(cfg.charset, cfg.special_chars ? Charset::default_special() : std::string()),
      rate_(cfg.initial_delay, cfg.min_delay, cfg.max_delay, log),
      fetcher_(transport, rate_, state_.requests, cfg.base_url, policy_from(cfg), log, sleep_),
      checkpoints_(cfg.checkpoint_file, cfg.checkpoint_every, cfg.checkpoint_seconds, state_, log) {}

bool Crawler::resume() {
    CheckpointRecord record;
    bool found = false;
    auto err = checkpoints_.load(record, found);
    if (!err.empty()) {
        log_.error("Error loading checkpoint " + checkpoints_.path() + ": " + err + "; starting fresh");
        return false;
    }
    if (!found) return false;

    apply_checkpoint(record, state_);
    for (const auto& child : reconstruct_frontier(record.explored_prefixes, charset_)) {
        frontier_.push(child.priority, child.prefix);
    }
    // Seeds are extensions of the empty prefix, which is never explored itself.
    for (char c : charset_.all()) {
        const std::string seed(1, c);
        if (!state_.explored.contains(seed)) frontier_.push(seed_priority(charset_, c), seed);
    }

    log_.info(msg() << "Checkpoint loaded with " << state_.names.size() << " names");
    log_.info(msg() << "Queued " << frontier_.size() << " prefixes for exploration");
    return true;
}

void Crawler::seed() {
    for (char c : charset_.all()) {
        frontier_.push(seed_priority(charset_, c), std::string(1, c));
    }
    log_.info(msg() << "Starting fresh with " << frontier_.size() << " initial prefixes");
}

void Crawler::log_status() const {
    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
    const double minutes = std::max(elapsed / 60.0, 0.01);
    const size_t names = state_.names.size();
    const uint64_t requests = state_.requests.value();
    const auto rs = rate_.snapshot();

    log_.info(msg() << "Status: " << names << " names found, " << requests << " requests made, "
                    << frontier_.size() << " prefixes queued");
    log_.info(msg() << std::fixed << std::setprecision(1) << "Rate: " << names / minutes << " names/min, "
                    << requests / minutes << " requests/min");
    log_.info(msg() << std::fixed << std::setprecision(2) << "Current delay: " << rs.delay
                    << "s, Success/Failure: " << rs.rolling_success << "/" << rs.rolling_failure);

    const auto stats = state_.stats.snapshot();
    if (stats.empty()) return;
    log_.info("Prefix length statistics:");
    for (const auto& [len, st] : stats) {
        if (st.queries == 0) continue;
        const double pct = 100.0 * static_cast<double>(st.success) / static_cast<double>(st.queries);
        log_.info(msg() << "  Length " << len << ": " << st.success << "/" << st.queries << " (" << std::fixed
                        << std::setprecision(1) << pct << "% success)");
    }
}

void Crawler::log_final(double seconds) const {
    const double minutes = std::max(seconds / 60.0, 0.01);
    const size_t names = state_.names.size();
    const uint64_t requests = state_.requests.value();
    log_.info(msg() << std::fixed << std::setprecision(2) << "Extraction completed in " << seconds << " seconds ("
                    << std::setprecision(1) << seconds / 60.0 << " minutes)");
    log_.info(msg() << "Total API requests: " << requests);
    log_.info(msg() << "Total names discovered: " << names);
    log_.info(msg() << std::fixed << std::setprecision(1) << "Final rate: " << names / minutes << " names/min, "
                    << requests / minutes << " requests/min");
}

std::string Crawler::run(const std::atomic<bool>& stop, Summary& summary) {
    summary = Summary{};
    started_ = std::chrono::steady_clock::now();

    log_.info(msg() << "Starting extraction with max_results=" << cfg_.max_results << " and " << cfg_.workers
                    << " workers against " << cfg_.base_url << "/v" << cfg_.api_version);
    log_.info(msg() << std::fixed << std::setprecision(2) << "Initial delay: " << rate_.delay()
                    << "s, Min: " << rate_.min_delay() << "s, Max: " << rate_.max_delay() << "s");
    log_.info("Primary character set: " + charset_.primary());
    if (!charset_.special().empty()) log_.info("Special characters: " + charset_.special());

    summary.resumed = resume();
    if (summary.resumed) {
        log_.info(msg() << "Resumed from checkpoint with " << state_.names.size() << " names and "
                        << state_.explored.size() << " explored prefixes");
    }
    if (frontier_.size() == 0) seed();

    WorkerPool pool(frontier_, state_, fetcher_, rate_, charset_, cfg_.max_results, log_, sleep_, poll_interval_);
    pool.set_checkpoints(&checkpoints_);
    checkpoints_.reset_schedule();
    pool.start(cfg_.workers);

    std::string error;
    const auto status_every = std::chrono::duration<double>(cfg_.status_seconds);
    const auto tick = std::min(poll_interval_, std::chrono::milliseconds(1000));
    auto last_status = std::chrono::steady_clock::now();

    while (!pool.finished()) {
        if (stop.load()) {
            summary.interrupted = true;
            log_.info("Received interrupt, saving checkpoint before exit");
            break;
        }
        if (checkpoints_.storage_failed()) {
            error = "checkpoint storage failed; stopping crawl";
            log_.error(error);
            break;
        }
        if (std::chrono::steady_clock::now() - last_status >= status_every) {
            last_status = std::chrono::steady_clock::now();
            log_status();
        }
        std::this_thread::sleep_for(tick);
    }

    pool.request_stop();
    frontier_.close();
    pool.join();

    auto err = checkpoints_.save_or_retry();
    if (!err.empty() && error.empty()) error = "final checkpoint failed: " + err;

    const auto names = state_.names.sorted();
    err = save_results(cfg_.output_file, state_.requests.value(), names);
    if (!err.empty()) {
        log_.error("Error saving results: " + err);
        if (error.empty()) error = "could not write results: " + err;
    } else {
        log_.info("Results saved to " + cfg_.output_file);
    }

    summary.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
    summary.requests = state_.requests.value();
    summary.names = names.size();
    summary.explored = state_.explored.size();
    log_final(summary.seconds);
    return error;
}

}  // namespace prefixcrawl
