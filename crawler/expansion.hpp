#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "charset.hpp"

namespace prefixcrawl {

// Queue priorities. Lower values dequeue first.
constexpr int kSeedPriority = 1;
constexpr int kSeedSpecialPriority = 2;
constexpr int kSiblingBoost = 5;
constexpr int kSpecialSiblingBoost = 10;
constexpr int kResumeBoost = 1;

struct ChildPrefix {
    int priority = 0;
    std::string prefix;
};

struct Expansion {
    enum class Kind {
        Complete,   // page shorter than the cap: nothing left under the prefix
        Pivot,      // truncated page, branches after the pivot character queued
        Fallback,   // truncated page with no usable pivot, every branch queued
    };

    Kind kind = Kind::Complete;
    char pivot = '\0';
    std::vector<std::string> names;
    std::vector<ChildPrefix> children;
};

// Decides what one autocomplete page implies. `suggestions` is the page as
// returned by the service (ascending); every suggestion is recorded. When the
// page is full, the character that follows `prefix` in the last suggestion
// is queued first and only characters with a greater byte value are queued
// as siblings.
Expansion expand_prefix(const std::string& prefix, const std::vector<std::string>& suggestions,
                        size_t max_results, const Charset& charset);

// Priority of the single-character seed `c`.
int seed_priority(const Charset& charset, char c);

// Priority of a sibling or fallback child `prefix + c`.
int sibling_priority(const Charset& charset, const std::string& prefix, char c);

}  // namespace prefixcrawl
