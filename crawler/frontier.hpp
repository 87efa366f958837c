#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <queue>
#include <string>
#include <unordered_set>
#include <vector>

namespace prefixcrawl {

struct QueueItem {
    int priority = 0;
    uint64_t sequence = 0;
    std::string prefix;
};

// Pending prefixes ordered by (priority, insertion sequence). A prefix stays
// "pending" from push() until the worker that popped it calls done(), so the
// same prefix cannot be queued twice while it waits or while it is in flight.
class Frontier {
public:
    // Returns false if the prefix is already queued or in flight, or the frontier is closed.
    bool push(int priority, const std::string& prefix);

    // Waits up to `timeout` for an item. Returns false on timeout or when closed.
    // A popped item counts as in flight until done() is called for it.
    bool pop(QueueItem& out, std::chrono::milliseconds timeout);

    void done(const std::string& prefix);

    // Wakes all waiters; later pushes are ignored and pops return false.
    void close();
    bool closed() const;

    size_t size() const;
    size_t in_flight() const;

    // True when nothing is queued and nothing is in flight.
    bool quiescent() const;

private:
    struct Later {
        bool operator()(const QueueItem& a, const QueueItem& b) const {
            if (a.priority != b.priority) return a.priority > b.priority;
            return a.sequence > b.sequence;
        }
    };

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::priority_queue<QueueItem, std::vector<QueueItem>, Later> queue_;
    std::unordered_set<std::string> pending_;
    uint64_t next_sequence_ = 0;
    size_t in_flight_ = 0;
    bool closed_ = false;
};

}  // namespace prefixcrawl
