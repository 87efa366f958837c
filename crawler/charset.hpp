#pragma once

#include <cstddef>
#include <string>

namespace prefixcrawl {

// Ordered alphabet used to extend prefixes. The primary tier (digits and
// lowercase letters by default) always precedes the special tier
// (punctuation), and "greater than" means "later in this order".
class Charset {
public:
    Charset();
    Charset(std::string primary, std::string special);

    // Digits + lowercase letters, optionally followed by ASCII punctuation
    // without backslash and quotes.
    static Charset standard(bool with_special);
    static std::string default_primary();
    static std::string default_special();

    const std::string& primary() const { return primary_; }
    const std::string& special() const { return special_; }
    const std::string& all() const { return all_; }
    size_t size() const { return all_.size(); }
    bool empty() const { return all_.empty(); }

    bool contains(char c) const { return rank(c) >= 0; }
    bool is_special(char c) const;

    // Position of `c` in the order, or -1 if absent.
    int rank(char c) const;

private:
    std::string primary_;
    std::string special_;
    std::string all_;
    int rank_[256];

    void build_ranks();
};

}  // namespace prefixcrawl
