#include <gtest/gtest.h>

#include "domain/DomainMatcher.hpp"

using lease::domain::DomainMatcher;

// ============================================
// EMPTY ALLOW-LIST
// ============================================

TEST(DomainMatcherTest, EmptyListAllowsAnything) {
    std::vector<std::string> none;
    EXPECT_TRUE(DomainMatcher::isAllowed("example.com", none));
    EXPECT_TRUE(DomainMatcher::isAllowed("", none));
    EXPECT_TRUE(DomainMatcher::isAllowed("https://evil.org/path", none));
}

// ============================================
// PLAIN ENTRY
// ============================================

TEST(DomainMatcherTest, PlainEntryMatchesDomainAndSubdomains) {
    std::vector<std::string> list{"example.com"};

    EXPECT_TRUE(DomainMatcher::isAllowed("example.com", list));
    EXPECT_TRUE(DomainMatcher::isAllowed("www.example.com", list));
    EXPECT_TRUE(DomainMatcher::isAllowed("sub.example.com", list));
    EXPECT_TRUE(DomainMatcher::isAllowed("https://example.com", list));
    EXPECT_TRUE(DomainMatcher::isAllowed("http://www.example.com", list));
    EXPECT_TRUE(DomainMatcher::isAllowed("deep.sub.example.com", list));
}

TEST(DomainMatcherTest, PlainEntryRejectsLookalikes) {
    std::vector<std::string> list{"example.com"};

    EXPECT_FALSE(DomainMatcher::isAllowed("notexample.com", list));
    EXPECT_FALSE(DomainMatcher::isAllowed("example.com.evil.com", list));
    EXPECT_FALSE(DomainMatcher::isAllowed("example.org", list));
    EXPECT_FALSE(DomainMatcher::isAllowed("", list));
}

TEST(DomainMatcherTest, MatchingIsCaseInsensitive) {
    std::vector<std::string> list{"Example.COM"};

    EXPECT_TRUE(DomainMatcher::isAllowed("EXAMPLE.com", list));
    EXPECT_TRUE(DomainMatcher::isAllowed("HTTPS://WWW.Example.Com", list));
    EXPECT_TRUE(DomainMatcher::isAllowed("Shop.example.com", list));
}

TEST(DomainMatcherTest, EntryWithSchemeAndWww) {
    std::vector<std::string> list{"https://www.acme.com"};

    EXPECT_TRUE(DomainMatcher::isAllowed("acme.com", list));
    EXPECT_TRUE(DomainMatcher::isAllowed("shop.acme.com", list));
    EXPECT_FALSE(DomainMatcher::isAllowed("acme.org", list));
}

TEST(DomainMatcherTest, VerbatimEqualityAlwaysMatches) {
    std::vector<std::string> list{"localhost:3000"};
    EXPECT_TRUE(DomainMatcher::isAllowed("localhost:3000", list));
    EXPECT_FALSE(DomainMatcher::isAllowed("localhost:4000", list));
}

TEST(DomainMatcherTest, AnyEntryInListIsEnough) {
    std::vector<std::string> list{"alpha.io", "beta.io", "*.gamma.io"};

    EXPECT_TRUE(DomainMatcher::isAllowed("beta.io", list));
    EXPECT_TRUE(DomainMatcher::isAllowed("x.gamma.io", list));
    EXPECT_FALSE(DomainMatcher::isAllowed("delta.io", list));
}

// ============================================
// WILDCARD ENTRY
// ============================================

TEST(DomainMatcherTest, WildcardMatchesBaseAndSubdomains) {
    std::vector<std::string> list{"*.example.com"};

    EXPECT_TRUE(DomainMatcher::isAllowed("a.example.com", list));
    EXPECT_TRUE(DomainMatcher::isAllowed("example.com", list));
    EXPECT_TRUE(DomainMatcher::isAllowed("www.example.com", list));
    EXPECT_TRUE(DomainMatcher::isAllowed("https://a.b.example.com", list));
}

TEST(DomainMatcherTest, WildcardRejectsOtherDomains) {
    std::vector<std::string> list{"*.example.com"};

    EXPECT_FALSE(DomainMatcher::isAllowed("example.org", list));
    EXPECT_FALSE(DomainMatcher::isAllowed("badexample.com", list));
    EXPECT_FALSE(DomainMatcher::isAllowed("example.com.evil.com", list));
}

// ============================================
// DEGENERATE ENTRIES
// ============================================

TEST(DomainMatcherTest, EmptyOrBareWildcardEntriesDoNotOpenEverything) {
    std::vector<std::string> list{"", "*.", "https://", "www."};

    EXPECT_FALSE(DomainMatcher::isAllowed("example.com", list));
    EXPECT_FALSE(DomainMatcher::isAllowed("a.b", list));
    // Точное совпадение строк всё же срабатывает
    EXPECT_TRUE(DomainMatcher::isAllowed("", list));
}

TEST(DomainMatcherTest, NeverThrowsOnOddInput) {
    std::vector<std::string> list{"*.", ".", "..", "*.*.", std::string(1, '\0')};

    EXPECT_NO_THROW(DomainMatcher::isAllowed("", list));
    EXPECT_NO_THROW(DomainMatcher::isAllowed(".", list));
    EXPECT_NO_THROW(DomainMatcher::isAllowed("*", list));
    EXPECT_NO_THROW(DomainMatcher::isAllowed(std::string(1000, '.'), list));
    EXPECT_NO_THROW(DomainMatcher::isAllowed("\xff\xfe", list));
}

// ============================================
// NORMALIZE
// ============================================

TEST(DomainMatcherTest, NormalizeStripsSchemeThenWww) {
    EXPECT_EQ(DomainMatcher::normalize("https://www.Acme.com"), "acme.com");
    EXPECT_EQ(DomainMatcher::normalize("HTTP://acme.com"), "acme.com");
    EXPECT_EQ(DomainMatcher::normalize("www.acme.com"), "acme.com");
    EXPECT_EQ(DomainMatcher::normalize("acme.com"), "acme.com");
    EXPECT_EQ(DomainMatcher::normalize(""), "");
    // Только ведущий префикс
    EXPECT_EQ(DomainMatcher::normalize("shop.www.acme.com"), "shop.www.acme.com");
}
