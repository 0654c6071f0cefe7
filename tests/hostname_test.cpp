#include <gtest/gtest.h>
#include "subscout/common/hostname.hpp"

using namespace subscout::common;

TEST(HostnameTest, NormalizesCaseWildcardAndDots) {
    EXPECT_EQ(normalizeHostname("  WWW.Example.COM. "), "www.example.com");
    EXPECT_EQ(normalizeHostname("*.api.example.com"), "api.example.com");
    EXPECT_EQ(normalizeHostname("..mail.example.com.."), "mail.example.com");
}

TEST(HostnameTest, RejectsInvalidNames) {
    EXPECT_FALSE(normalizeHostname(""));
    EXPECT_FALSE(normalizeHostname("   "));
    EXPECT_FALSE(normalizeHostname("..."));
    EXPECT_FALSE(normalizeHostname("bad host.example.com"));
    EXPECT_FALSE(normalizeHostname("-lead.example.com"));
    EXPECT_FALSE(normalizeHostname("trail-.example.com"));
    EXPECT_FALSE(normalizeHostname("under_score.example.com"));
    EXPECT_FALSE(normalizeHostname("a..b.example.com"));
    EXPECT_FALSE(normalizeHostname(std::string(64, 'a') + ".example.com"));
}

TEST(HostnameTest, EncodesInternationalNames) {
    EXPECT_EQ(normalizeHostname("b\xc3\xbc" "cher.example"), "xn--bcher-kva.example");
}

TEST(HostnameTest, SanitizeDomainRequiresDot) {
    EXPECT_EQ(sanitizeDomain("Example.com"), "example.com");
    EXPECT_FALSE(sanitizeDomain("localhost"));
    EXPECT_FALSE(sanitizeDomain("not a domain"));
}

TEST(HostnameTest, SubdomainMembership) {
    EXPECT_TRUE(isSubdomain("example.com", "example.com"));
    EXPECT_TRUE(isSubdomain("a.b.example.com", "example.com"));
    EXPECT_TRUE(isSubdomain("WWW.example.com.", "example.com"));
    EXPECT_FALSE(isSubdomain("badexample.com", "example.com"));
    EXPECT_FALSE(isSubdomain("example.org", "example.com"));
}

TEST(HostnameTest, SplitsCertificateNames) {
    auto names = splitCertificateNames("*.example.com\nwww.example.com\r\n\n  api.example.com  ");
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "example.com");
    EXPECT_EQ(names[1], "www.example.com");
    EXPECT_EQ(names[2], "api.example.com");
}

TEST(HostnameTest, UniqueKeepsFirstSeenOrder) {
    auto unique = uniqueEverseen({"b", "a", "b", "c", "a"});
    EXPECT_EQ(unique, (std::vector<std::string>{"b", "a", "c"}));
}

TEST(HostnameTest, ChunksIntoFixedSizes) {
    auto chunks = chunked({"a", "b", "c", "d", "e"}, 2);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].size(), 2u);
    EXPECT_EQ(chunks[2], std::vector<std::string>{"e"});

    EXPECT_TRUE(chunked({}, 3).empty());
    EXPECT_EQ(chunked({"a", "b"}, 0).size(), 2u);
}
