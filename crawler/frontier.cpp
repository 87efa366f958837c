#include "frontier.hpp"

namespace prefixcrawl {

bool Frontier::push(int priority, const std::string& prefix) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (closed_) return false;
        if (!pending_.insert(prefix).second) return false;
        queue_.push(QueueItem{priority, next_sequence_++, prefix});
    }
    cv_.notify_one();
    return true;
}

bool Frontier::pop(QueueItem& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    if (!cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); })) return false;
    if (closed_) return false;

    out = queue_.top();
    queue_.pop();
    in_flight_++;
    return true;
}

void Frontier::done(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mu_);
    pending_.erase(prefix);
    if (in_flight_ > 0) in_flight_--;
}

void Frontier::close() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool Frontier::closed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
}

size_t Frontier::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
}

size_t Frontier::in_flight() const {
    std::lock_guard<std::mutex> lock(mu_);
    return in_flight_;
}

bool Frontier::quiescent() const {
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.empty() && in_flight_ == 0;
}

}  // namespace prefixcrawl
