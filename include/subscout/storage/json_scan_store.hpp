#pragma once

#include "scan_store.hpp"
#include "../common/config.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <mutex>

namespace subscout {
namespace storage {

// File-backed store: runs.json holds the run index, domains/<domain>.json
// holds one domain's entries and run membership. Once the index grows past
// max_runs the oldest runs are dropped, except each domain's latest
// completed run.
class JsonScanStore : public ScanStore {
public:
    explicit JsonScanStore(const std::string& directory, size_t max_runs = 1000);

    int64_t startRun(const std::string& domain) override;
    void completeRun(int64_t run_id, size_t total, int64_t duration_ms) override;
    common::Snapshot loadSnapshot(const std::string& domain) override;
    void upsertEntries(const std::string& domain,
                       const std::vector<common::SubdomainEntry>& entries,
                       std::optional<int64_t> run_id) override;
    std::vector<common::ScanRun> recentRuns(size_t limit) override;
    std::vector<common::ScanRun> runsForDomain(const std::string& domain, size_t limit) override;

private:
    std::filesystem::path directory_;
    size_t max_runs_;
    std::mutex mutex_;

    std::filesystem::path runsPath() const;
    std::filesystem::path domainPath(const std::string& domain) const;

    nlohmann::json readJson(const std::filesystem::path& path, nlohmann::json fallback) const;
    void writeJson(const std::filesystem::path& path, const nlohmann::json& document) const;

    std::vector<common::ScanRun> loadRuns() const;
};

// Run index capacity derived from the storage settings.
size_t runIndexCapacity(const common::StorageConfig& config);

}}
