#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "charset.hpp"
#include "crawl_state.hpp"
#include "expansion.hpp"
#include "log.hpp"

namespace prefixcrawl {

// Durable crawl state. The frontier is never stored; it is rebuilt from the
// explored prefixes on load.
struct CheckpointRecord {
    std::vector<std::string> discovered_names;
    std::vector<std::string> explored_prefixes;
    uint64_t request_count = 0;
    double timestamp = 0.0;  // seconds since the epoch
    std::map<size_t, LengthStats> prefix_length_stats;
};

std::string encode_checkpoint(const CheckpointRecord& record);

// Returns empty string on success; otherwise why the document is not a checkpoint.
std::string decode_checkpoint(const std::string& text, CheckpointRecord& out);

// Every single-character extension of an explored prefix that is not itself
// explored, prioritised by the length of the prefix it extends.
std::vector<ChildPrefix> reconstruct_frontier(const std::vector<std::string>& explored, const Charset& charset);

CheckpointRecord snapshot_state(const CrawlState& state);

// Loads `record` into `state` (sets are unioned, counters and stats replaced).
void apply_checkpoint(const CheckpointRecord& record, CrawlState& state);

// Owns the checkpoint file of one crawl: periodic saves from the workers, the
// final save at shutdown, and loading at startup.
class CheckpointManager {
public:
    CheckpointManager(std::string path, uint64_t every_requests, double every_seconds, CrawlState& state,
                      Log& log);

    const std::string& path() const { return path_; }

    // `found` is false (and the result empty) when no checkpoint exists yet.
    std::string load(CheckpointRecord& out, bool& found) const;

    // Writes a snapshot now. Returns empty string on success.
    std::string save();

    // save(), retried once on failure. Two failures in a row mark the storage
    // as failed; the error of the second attempt is returned.
    std::string save_or_retry();

    // Saves when `every_requests` requests or `every_seconds` have passed since
    // the last save. Skips silently while another thread is saving.
    void maybe_save();

    // Restarts the save schedule from the current request count and time.
    void reset_schedule();

    bool storage_failed() const;
    uint64_t saves() const;

private:
    const std::string path_;
    const uint64_t every_requests_;
    const std::chrono::duration<double> every_seconds_;
    CrawlState& state_;
    Log& log_;

    mutable std::mutex mu_;  // serializes saves and guards the fields below
    uint64_t last_saved_requests_ = 0;
    std::chrono::steady_clock::time_point last_saved_at_;
    uint64_t saves_ = 0;
    bool storage_failed_ = false;

    std::string save_locked();
    std::string save_or_retry_locked();
};

}  // namespace prefixcrawl
