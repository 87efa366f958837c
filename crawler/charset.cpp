#include "charset.hpp"

#include <cctype>

namespace prefixcrawl {

Charset::Charset() {
    build_ranks();
}

Charset::Charset(std::string primary, std::string special) {
    // Later duplicates of a character are dropped; the first occurrence fixes its rank.
    for (char c : primary) {
        if (all_.find(c) == std::string::npos) {
            primary_.push_back(c);
            all_.push_back(c);
        }
    }
    for (char c : special) {
        if (all_.find(c) == std::string::npos) {
            special_.push_back(c);
            all_.push_back(c);
        }
    }
    build_ranks();
}

std::string Charset::default_primary() {
    return "0123456789abcdefghijklmnopqrstuvwxyz";
}

std::string Charset::default_special() {
    std::string out;
    for (int c = 0x21; c < 0x7F; c++) {
        if (!std::ispunct(c)) continue;
        if (c == '\\' || c == '"' || c == '\'') continue;
        out.push_back(static_cast<char>(c));
    }
    return out;
}

Charset Charset::standard(bool with_special) {
    return Charset(default_primary(), with_special ? default_special() : std::string());
}

bool Charset::is_special(char c) const {
    int r = rank(c);
    return r >= static_cast<int>(primary_.size());
}

int Charset::rank(char c) const {
    return rank_[static_cast<unsigned char>(c)];
}

void Charset::build_ranks() {
    for (int& r : rank_) r = -1;
    for (size_t i = 0; i < all_.size(); i++) {
        rank_[static_cast<unsigned char>(all_[i])] = static_cast<int>(i);
    }
}

}  // namespace prefixcrawl
