#include "expansion.hpp"

namespace prefixcrawl {

int seed_priority(const Charset& charset, char c) {
    return charset.is_special(c) ? kSeedSpecialPriority : kSeedPriority;
}

int sibling_priority(const Charset& charset, const std::string& prefix, char c) {
    const int len = static_cast<int>(prefix.size());
    return len + (charset.is_special(c) ? kSpecialSiblingBoost : kSiblingBoost);
}

static void enqueue_all(Expansion& out, const std::string& prefix, const Charset& charset) {
    out.kind = Expansion::Kind::Fallback;
    out.children.reserve(charset.size());
    for (char c : charset.all()) {
        out.children.push_back({sibling_priority(charset, prefix, c), prefix + c});
    }
}

Expansion expand_prefix(const std::string& prefix, const std::vector<std::string>& suggestions,
                        size_t max_results, const Charset& charset) {
    Expansion out;
    out.names = suggestions;

    if (suggestions.empty() || suggestions.size() < max_results) return out;

    const std::string& last = suggestions.back();

    // The pivot is only meaningful when the last suggestion extends the prefix itself.
    if (last.size() <= prefix.size() || last.compare(0, prefix.size(), prefix) != 0) {
        enqueue_all(out, prefix, charset);
        return out;
    }

    const char pivot = last[prefix.size()];
    if (!charset.contains(pivot)) {
        enqueue_all(out, prefix, charset);
        return out;
    }

    out.kind = Expansion::Kind::Pivot;
    out.pivot = pivot;
    out.children.push_back({static_cast<int>(prefix.size()), prefix + pivot});

    // The service pages in byte order, so only branches whose character value
    // is above the pivot can hold names the page did not reach.
    const auto pivot_value = static_cast<unsigned char>(pivot);
    for (char c : charset.all()) {
        if (static_cast<unsigned char>(c) <= pivot_value) continue;
        out.children.push_back({sibling_priority(charset, prefix, c), prefix + c});
    }
    return out;
}

}  // namespace prefixcrawl
