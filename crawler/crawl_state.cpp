#include "crawl_state.hpp"

#include <algorithm>

namespace prefixcrawl {

bool StringSet::insert(const std::string& s) {
    std::lock_guard<std::mutex> lock(mu_);
    return items_.insert(s).second;
}

size_t StringSet::insert_all(const std::vector<std::string>& items) {
    std::lock_guard<std::mutex> lock(mu_);
    size_t added = 0;
    for (const auto& s : items) {
        if (items_.insert(s).second) added++;
    }
    return added;
}

bool StringSet::contains(const std::string& s) const {
    std::lock_guard<std::mutex> lock(mu_);
    return items_.count(s) > 0;
}

size_t StringSet::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return items_.size();
}

std::vector<std::string> StringSet::sorted() const {
    std::vector<std::string> out;
    {
        std::lock_guard<std::mutex> lock(mu_);
        out.assign(items_.begin(), items_.end());
    }
    std::sort(out.begin(), out.end());
    return out;
}

void LengthStatsTable::record(size_t prefix_length, bool had_results) {
    std::lock_guard<std::mutex> lock(mu_);
    auto& s = stats_[prefix_length];
    s.queries++;
    if (had_results) s.success++;
}

void LengthStatsTable::restore(const std::map<size_t, LengthStats>& stats) {
    std::lock_guard<std::mutex> lock(mu_);
    stats_ = stats;
}

std::map<size_t, LengthStats> LengthStatsTable::snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    return stats_;
}

}  // namespace prefixcrawl
