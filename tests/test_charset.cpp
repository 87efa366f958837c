#include <gtest/gtest.h>

#include "charset.hpp"

using prefixcrawl::Charset;

TEST(CharsetTest, StandardOrderIsDigitsLettersThenPunctuation) {
    Charset cs = Charset::standard(true);

    EXPECT_EQ(cs.primary(), "0123456789abcdefghijklmnopqrstuvwxyz");
    EXPECT_LT(cs.rank('9'), cs.rank('a'));
    EXPECT_LT(cs.rank('z'), cs.rank('!'));
    EXPECT_LT(cs.rank('z'), cs.rank('-'));
    EXPECT_EQ(cs.size(), cs.primary().size() + cs.special().size());
}

TEST(CharsetTest, SpecialTierExcludesBackslashAndQuotes) {
    Charset cs = Charset::standard(true);

    EXPECT_FALSE(cs.contains('\\'));
    EXPECT_FALSE(cs.contains('"'));
    EXPECT_FALSE(cs.contains('\''));
    EXPECT_TRUE(cs.contains('.'));
    EXPECT_TRUE(cs.is_special('.'));
    EXPECT_FALSE(cs.is_special('q'));
}

TEST(CharsetTest, WithoutSpecialTier) {
    Charset cs = Charset::standard(false);

    EXPECT_TRUE(cs.special().empty());
    EXPECT_FALSE(cs.contains('-'));
    EXPECT_EQ(cs.size(), 36u);
}

TEST(CharsetTest, DuplicatesKeepFirstPosition) {
    Charset cs("abca", "-a.");

    EXPECT_EQ(cs.all(), "abc-.");
    EXPECT_EQ(cs.rank('a'), 0);
    EXPECT_EQ(cs.rank('-'), 3);
    EXPECT_FALSE(cs.is_special('a'));
}

TEST(CharsetTest, AbsentCharactersHaveNoRank) {
    Charset cs("ab", "");

    EXPECT_EQ(cs.rank('z'), -1);
    EXPECT_FALSE(cs.contains('z'));
    EXPECT_FALSE(cs.is_special('z'));
    EXPECT_TRUE(Charset().empty());
}
