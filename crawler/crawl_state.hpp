#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace prefixcrawl {

// Thread-safe grow-only set of strings. Used for both the discovered names
// and the explored prefixes; nothing is ever removed during a run.
class StringSet {
public:
    // Returns true if `s` was not present before.
    bool insert(const std::string& s);

    // Returns how many of `items` were new.
    size_t insert_all(const std::vector<std::string>& items);

    bool contains(const std::string& s) const;
    size_t size() const;

    // Sorted copy of the contents.
    std::vector<std::string> sorted() const;

private:
    mutable std::mutex mu_;
    std::unordered_set<std::string> items_;
};

using NameSet = StringSet;
using ExploredSet = StringSet;

struct LengthStats {
    uint64_t success = 0;  // pages with at least one result
    uint64_t queries = 0;
};

// Per prefix length query statistics. Diagnostic only.
class LengthStatsTable {
public:
    void record(size_t prefix_length, bool had_results);
    void restore(const std::map<size_t, LengthStats>& stats);
    std::map<size_t, LengthStats> snapshot() const;

private:
    mutable std::mutex mu_;
    std::map<size_t, LengthStats> stats_;
};

class RequestCounter {
public:
    uint64_t increment() { return count_.fetch_add(1) + 1; }
    uint64_t value() const { return count_.load(); }
    void reset(uint64_t v) { count_.store(v); }

private:
    std::atomic<uint64_t> count_{0};
};

// Everything the workers share for the duration of one crawl run.
struct CrawlState {
    NameSet names;
    ExploredSet explored;
    LengthStatsTable stats;
    RequestCounter requests;
};

}  // namespace prefixcrawl
