#include "subscout/discovery/collector.hpp"
#include "subscout/common/hostname.hpp"
#include "subscout/common/logger.hpp"
#include <filesystem>
#include <fstream>

namespace subscout {
namespace discovery {

CandidateCollector::CandidateCollector(std::shared_ptr<CertificateSource> source, CollectorOptions options)
    : source_(std::move(source)), options_(std::move(options)) {}

std::vector<std::string> CandidateCollector::collect(const std::string& domain) const {
    std::vector<std::string> candidates = fetchCertificateNames(domain);
    size_t certificate_count = candidates.size();

    candidates.push_back(domain);

    auto brute = bruteforceCandidates(domain);
    candidates.insert(candidates.end(), brute.begin(), brute.end());

    std::vector<std::string> filtered;
    filtered.reserve(candidates.size());
    for (auto& name : candidates) {
        if (common::isSubdomain(name, domain)) {
            filtered.push_back(std::move(name));
        }
    }

    auto result = common::uniqueEverseen(filtered);

    common::Logger::instance().info("[Collector] Candidates collected | domain={} | certificate={} | bruteforce={} | total={}",
                                    domain, certificate_count, brute.size(), result.size());
    return result;
}

std::vector<std::string> CandidateCollector::fetchCertificateNames(const std::string& domain) const {
    if (!source_) {
        return {};
    }

    auto result = source_->fetch(domain);
    if (!result.ok()) {
        common::ErrorContext ctx;
        ctx.component = source_->name();
        ctx.details["domain"] = domain;
        ctx.details["error"] = core::CoreErrorCodeHelper::toString(*result.error);
        if (!result.detail.empty()) {
            ctx.details["detail"] = result.detail;
        }
        common::Logger::instance().warn("[Collector] Certificate source failed | {}",
                                        common::formatContext(ctx));
        return {};
    }

    return result.names;
}

std::vector<std::string> CandidateCollector::bruteforceWords() const {
    std::vector<std::string> words;

    for (const auto& word : options_.bruteforce_words) {
        auto cleaned = common::toLower(common::trim(word));
        if (!cleaned.empty()) {
            words.push_back(cleaned);
        }
    }

    if (!options_.extra_wordlist.empty()) {
        auto extra = loadWordlist(options_.extra_wordlist);
        words.insert(words.end(), extra.begin(), extra.end());
    }

    if (!options_.seclists_wordlist.empty()) {
        size_t limit = options_.seclists_min_words > 0 ? static_cast<size_t>(options_.seclists_min_words) : 0;
        auto seclists = loadWordlist(options_.seclists_wordlist, limit);
        words.insert(words.end(), seclists.begin(), seclists.end());
    }

    return common::uniqueEverseen(words);
}

std::vector<std::string> CandidateCollector::bruteforceCandidates(const std::string& domain) const {
    std::vector<std::string> candidates;

    for (const auto& word : bruteforceWords()) {
        auto normalized = common::normalizeHostname(word + "." + domain);
        if (normalized) {
            candidates.push_back(*normalized);
        }
    }

    return candidates;
}

std::vector<std::string> loadWordlist(const std::string& path, size_t limit) {
    std::vector<std::string> words;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        common::Logger::instance().debug("[Collector] Wordlist not found | path={}", path);
        return words;
    }

    std::ifstream file(path);
    if (!file) {
        common::Logger::instance().debug("[Collector] Wordlist not readable | path={}", path);
        return words;
    }

    std::string line;
    while (std::getline(file, line)) {
        auto word = common::toLower(common::trim(line));
        if (word.empty()) {
            continue;
        }
        words.push_back(std::move(word));
        if (limit > 0 && words.size() >= limit) {
            break;
        }
    }

    return words;
}

}}
