#include <gtest/gtest.h>
#include "subscout/discovery/collector.hpp"
#include "test_support.hpp"

using namespace subscout;
using namespace subscout::discovery;
using subscout::test::TempDir;

namespace {

class FakeCertificateSource : public CertificateSource {
public:
    explicit FakeCertificateSource(CertificateFetchResult result) : result_(std::move(result)) {}

    std::string name() const override { return "fake"; }

    CertificateFetchResult fetch(const std::string& domain) override {
        requested = domain;
        return result_;
    }

    std::string requested;

private:
    CertificateFetchResult result_;
};

}

TEST(CollectorTest, MergesCertificateDomainAndBruteforce) {
    CertificateFetchResult fetched;
    fetched.names = {"www.example.com", "shop.example.com"};
    auto source = std::make_shared<FakeCertificateSource>(fetched);

    CollectorOptions options;
    options.bruteforce_words = {"www", "API", " dev "};

    CandidateCollector collector(source, options);
    auto candidates = collector.collect("example.com");

    EXPECT_EQ(source->requested, "example.com");
    EXPECT_EQ(candidates, (std::vector<std::string>{
        "www.example.com", "shop.example.com", "example.com", "api.example.com", "dev.example.com"
    }));
}

TEST(CollectorTest, CertificateFailureFallsBackToBruteforce) {
    CertificateFetchResult failed;
    failed.error = core::CoreErrorCode::CT_BAD_STATUS;
    failed.detail = "status=503";

    CollectorOptions options;
    options.bruteforce_words = {"mail"};

    CandidateCollector collector(std::make_shared<FakeCertificateSource>(failed), options);
    EXPECT_EQ(collector.collect("example.com"),
              (std::vector<std::string>{"example.com", "mail.example.com"}));
}

TEST(CollectorTest, DropsNamesOutsideDomain) {
    CertificateFetchResult fetched;
    fetched.names = {"other.org", "a.example.com"};

    CandidateCollector collector(std::make_shared<FakeCertificateSource>(fetched), CollectorOptions{});
    EXPECT_EQ(collector.collect("example.com"),
              (std::vector<std::string>{"a.example.com", "example.com"}));
}

TEST(CollectorTest, LoadsWordlistsWithSeclistsCap) {
    TempDir dir;
    auto extra = dir.write("extra.txt", "VPN\n\n  portal \nvpn\n");
    auto seclists = dir.write("seclists.txt", "one\ntwo\nthree\nfour\n");

    CollectorOptions options;
    options.bruteforce_words = {"www"};
    options.extra_wordlist = extra;
    options.seclists_wordlist = seclists;
    options.seclists_min_words = 2;

    CandidateCollector collector(nullptr, options);
    EXPECT_EQ(collector.bruteforceWords(),
              (std::vector<std::string>{"www", "vpn", "portal", "one", "two"}));
}

TEST(CollectorTest, MissingWordlistIsEmpty) {
    EXPECT_TRUE(loadWordlist("/nonexistent/subscout/words.txt").empty());
}

TEST(CollectorTest, SkipsInvalidBruteforceWords) {
    CollectorOptions options;
    options.bruteforce_words = {"ok", "bad word", "-dash"};

    CandidateCollector collector(nullptr, options);
    EXPECT_EQ(collector.bruteforceCandidates("example.com"),
              std::vector<std::string>{"ok.example.com"});
}
