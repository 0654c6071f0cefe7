#pragma once

#include "certificate_source.hpp"
#include <memory>
#include <string>
#include <vector>

namespace subscout {
namespace discovery {

struct CollectorOptions {
    std::vector<std::string> bruteforce_words;
    std::string extra_wordlist;
    std::string seclists_wordlist;
    int seclists_min_words = 0;
};

class CandidateCollector {
public:
    CandidateCollector(std::shared_ptr<CertificateSource> source, CollectorOptions options);

    // Certificate names, the domain itself, then brute-force names;
    // deduplicated in first-seen order and limited to the domain's subtree.
    std::vector<std::string> collect(const std::string& domain) const;

    std::vector<std::string> bruteforceWords() const;
    std::vector<std::string> bruteforceCandidates(const std::string& domain) const;

private:
    std::shared_ptr<CertificateSource> source_;
    CollectorOptions options_;

    std::vector<std::string> fetchCertificateNames(const std::string& domain) const;
};

// Trimmed, lowercased, non-empty lines of a wordlist file. Reads at most
// `limit` words when limit > 0. An unreadable file yields an empty list.
std::vector<std::string> loadWordlist(const std::string& path, size_t limit = 0);

}}
