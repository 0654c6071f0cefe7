#include "subscout/storage/json_scan_store.hpp"
#include "subscout/common/constants.hpp"
#include "subscout/common/logger.hpp"
#include "subscout/common/paths.hpp"
#include <sys/stat.h>
#include <algorithm>
#include <fstream>
#include <map>
#include <set>

namespace subscout {
namespace storage {

namespace {

std::string safeGetString(const nlohmann::json& json, const std::string& key, const std::string& default_value = "") {
    if (json.contains(key) && !json[key].is_null() && json[key].is_string()) {
        return json[key].get<std::string>();
    }
    return default_value;
}

std::optional<int64_t> safeGetInt(const nlohmann::json& json, const std::string& key) {
    if (json.contains(key) && !json[key].is_null() && json[key].is_number_integer()) {
        return json[key].get<int64_t>();
    }
    return std::nullopt;
}

std::optional<common::TimePoint> safeGetTime(const nlohmann::json& json, const std::string& key) {
    return common::parseIsoTime(safeGetString(json, key));
}

nlohmann::json runToDocument(const common::ScanRun& run) {
    nlohmann::json doc;
    doc["id"] = run.id;
    doc["domain"] = run.domain;
    doc["started_at"] = common::formatIsoTime(run.started_at);
    doc["completed_at"] = run.completed_at ? nlohmann::json(common::formatIsoTime(*run.completed_at)) : nlohmann::json(nullptr);
    doc["total"] = run.total;
    doc["duration_ms"] = run.duration_ms ? nlohmann::json(*run.duration_ms) : nlohmann::json(nullptr);
    return doc;
}

common::ScanRun runFromDocument(const nlohmann::json& doc) {
    common::ScanRun run;
    run.id = safeGetInt(doc, "id").value_or(0);
    run.domain = safeGetString(doc, "domain");
    run.started_at = safeGetTime(doc, "started_at").value_or(common::TimePoint{});
    run.completed_at = safeGetTime(doc, "completed_at");
    run.total = static_cast<size_t>(safeGetInt(doc, "total").value_or(0));
    run.duration_ms = safeGetInt(doc, "duration_ms");
    return run;
}

// Completed runs first, newest completion first, then newest start.
bool newerRunFirst(const common::ScanRun& a, const common::ScanRun& b) {
    if (a.completed_at.has_value() != b.completed_at.has_value()) {
        return a.completed_at.has_value();
    }
    if (a.completed_at && *a.completed_at != *b.completed_at) {
        return *a.completed_at > *b.completed_at;
    }
    if (a.started_at != b.started_at) {
        return a.started_at > b.started_at;
    }
    return a.id > b.id;
}

// Drops the oldest runs until at most max_runs remain. The latest completed
// run of every domain is kept because snapshot metadata is read from it, and
// so is the run being started.
size_t pruneRuns(nlohmann::json& runs_document, size_t max_runs, int64_t current_id) {
    if (runs_document.size() <= max_runs) {
        return 0;
    }

    std::vector<common::ScanRun> runs;
    runs.reserve(runs_document.size());
    for (const auto& item : runs_document) {
        runs.push_back(runFromDocument(item));
    }

    std::map<std::string, common::ScanRun> latest;
    for (const auto& run : runs) {
        if (!run.completed_at) {
            continue;
        }
        auto it = latest.find(run.domain);
        if (it == latest.end() || newerRunFirst(run, it->second)) {
            latest[run.domain] = run;
        }
    }

    std::set<int64_t> kept_ids{current_id};
    for (const auto& [domain, run] : latest) {
        kept_ids.insert(run.id);
    }

    std::vector<int64_t> prunable;
    for (const auto& run : runs) {
        if (kept_ids.count(run.id) == 0) {
            prunable.push_back(run.id);
        }
    }
    std::sort(prunable.begin(), prunable.end());

    size_t excess = runs_document.size() - max_runs;
    std::set<int64_t> dropped(prunable.begin(),
                              prunable.begin() + static_cast<std::ptrdiff_t>(std::min(excess, prunable.size())));

    nlohmann::json remaining = nlohmann::json::array();
    for (auto& item : runs_document) {
        if (dropped.count(safeGetInt(item, "id").value_or(0)) == 0) {
            remaining.push_back(std::move(item));
        }
    }
    runs_document = std::move(remaining);
    return dropped.size();
}

}

size_t runIndexCapacity(const common::StorageConfig& config) {
    auto slots = static_cast<size_t>(std::max(1, config.recent_scans_limit));
    return std::max(slots * constants::limits::STORED_RUNS_PER_RECENT_SCAN,
                    static_cast<size_t>(std::max(1, config.per_domain_history_limit)));
}

JsonScanStore::JsonScanStore(const std::string& directory, size_t max_runs)
    : directory_(directory),
      max_runs_(std::max<size_t>(1, max_runs)) {
    std::error_code ec;
    std::filesystem::create_directories(directory_ / "domains", ec);
    if (ec) {
        throw StorageError(core::CoreErrorCode::STORAGE_WRITE_FAILED,
                           "cannot create history directory " + directory_.string() + ": " + ec.message());
    }
    common::Logger::instance().debug("[ScanStore] Initialized | dir={}", directory_.string());
}

std::filesystem::path JsonScanStore::runsPath() const {
    return directory_ / "runs.json";
}

std::filesystem::path JsonScanStore::domainPath(const std::string& domain) const {
    return directory_ / "domains" / (domain + ".json");
}

nlohmann::json JsonScanStore::readJson(const std::filesystem::path& path, nlohmann::json fallback) const {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return fallback;
    }

    std::ifstream file(path);
    if (!file) {
        throw StorageError(core::CoreErrorCode::STORAGE_READ_FAILED, "cannot open " + path.string());
    }

    auto document = nlohmann::json::parse(file, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        throw StorageError(core::CoreErrorCode::STORAGE_READ_FAILED, "corrupt document " + path.string());
    }
    return document;
}

void JsonScanStore::writeJson(const std::filesystem::path& path, const nlohmann::json& document) const {
    auto temp_path = path;
    temp_path += ".tmp";

    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file) {
            throw StorageError(core::CoreErrorCode::STORAGE_WRITE_FAILED, "cannot create " + temp_path.string());
        }
        file << document.dump(2);
        file.close();
        if (!file) {
            throw StorageError(core::CoreErrorCode::STORAGE_WRITE_FAILED, "cannot write " + temp_path.string());
        }
    }

    mode_t mode = common::PathManager::instance().isSystemMode() ? 0644 : 0600;
    if (chmod(temp_path.c_str(), mode) != 0) {
        common::Logger::instance().warn("[ScanStore] Failed to set permissions | path={}", temp_path.string());
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        throw StorageError(core::CoreErrorCode::STORAGE_WRITE_FAILED, "cannot replace " + path.string());
    }
}

std::vector<common::ScanRun> JsonScanStore::loadRuns() const {
    auto document = readJson(runsPath(), nlohmann::json::object());

    std::vector<common::ScanRun> runs;
    if (document.contains("runs") && document["runs"].is_array()) {
        for (const auto& item : document["runs"]) {
            if (item.is_object()) {
                runs.push_back(runFromDocument(item));
            }
        }
    }
    return runs;
}

int64_t JsonScanStore::startRun(const std::string& domain) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto document = readJson(runsPath(), nlohmann::json::object());
    if (!document.contains("runs") || !document["runs"].is_array()) {
        document["runs"] = nlohmann::json::array();
    }

    int64_t run_id = safeGetInt(document, "next_id").value_or(1);

    common::ScanRun run;
    run.id = run_id;
    run.domain = domain;
    run.started_at = std::chrono::system_clock::now();

    document["runs"].push_back(runToDocument(run));
    document["next_id"] = run_id + 1;

    auto pruned = pruneRuns(document["runs"], max_runs_, run_id);
    if (pruned > 0) {
        common::Logger::instance().debug("[ScanStore] Pruned run index | removed={} | kept={}",
                                        pruned, document["runs"].size());
    }

    writeJson(runsPath(), document);

    common::Logger::instance().debug("[ScanStore] Run started | id={} | domain={}", run_id, domain);
    return run_id;
}

void JsonScanStore::completeRun(int64_t run_id, size_t total, int64_t duration_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto document = readJson(runsPath(), nlohmann::json::object());
    if (!document.contains("runs") || !document["runs"].is_array()) {
        common::Logger::instance().warn("[ScanStore] Run index missing | id={}", run_id);
        return;
    }

    for (auto& item : document["runs"]) {
        if (safeGetInt(item, "id") == run_id) {
            item["completed_at"] = common::formatIsoTime(std::chrono::system_clock::now());
            item["total"] = total;
            item["duration_ms"] = duration_ms;
            writeJson(runsPath(), document);
            common::Logger::instance().debug("[ScanStore] Run completed | id={} | total={} | duration_ms={}",
                                            run_id, total, duration_ms);
            return;
        }
    }

    common::Logger::instance().warn("[ScanStore] Unknown run | id={}", run_id);
}

common::Snapshot JsonScanStore::loadSnapshot(const std::string& domain) {
    std::lock_guard<std::mutex> lock(mutex_);

    common::Snapshot snapshot;
    auto document = readJson(domainPath(domain), nlohmann::json::object());

    if (document.contains("entries") && document["entries"].is_object()) {
        for (const auto& [name, item] : document["entries"].items()) {
            common::SubdomainEntry entry;
            entry.name = name;
            if (item.contains("ips") && item["ips"].is_array()) {
                for (const auto& ip : item["ips"]) {
                    if (ip.is_string()) {
                        entry.ips.push_back(ip.get<std::string>());
                    }
                }
            }
            auto cname = safeGetString(item, "cname");
            if (!cname.empty()) {
                entry.cname = cname;
            }
            if (auto status = safeGetInt(item, "http_status")) {
                entry.http_status = static_cast<int>(*status);
            }
            entry.tls = item.contains("tls") && item["tls"].is_boolean() && item["tls"].get<bool>();
            entry.server = safeGetString(item, "server");
            entry.last_probe = safeGetTime(item, "last_probe").value_or(common::TimePoint{});
            snapshot.entries.push_back(std::move(entry));
        }
    }

    std::sort(snapshot.entries.begin(), snapshot.entries.end(),
              [](const common::SubdomainEntry& a, const common::SubdomainEntry& b) { return a.name < b.name; });

    auto runs = loadRuns();
    runs.erase(std::remove_if(runs.begin(), runs.end(), [&domain](const common::ScanRun& run) {
        return run.domain != domain || !run.completed_at;
    }), runs.end());

    if (!runs.empty()) {
        auto latest = *std::min_element(runs.begin(), runs.end(), newerRunFirst);
        common::SnapshotMeta meta;
        meta.cached_at = *latest.completed_at;
        meta.total_unique = latest.total;
        meta.duration_ms = latest.duration_ms;
        snapshot.meta = meta;
    }

    return snapshot;
}

void JsonScanStore::upsertEntries(const std::string& domain,
                                  const std::vector<common::SubdomainEntry>& entries,
                                  std::optional<int64_t> run_id) {
    if (entries.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto path = domainPath(domain);
    auto document = readJson(path, nlohmann::json::object());
    document["domain"] = domain;
    if (!document.contains("entries") || !document["entries"].is_object()) {
        document["entries"] = nlohmann::json::object();
    }
    if (!document.contains("runs") || !document["runs"].is_object()) {
        document["runs"] = nlohmann::json::object();
    }

    auto now = common::formatIsoTime(std::chrono::system_clock::now());
    auto& stored = document["entries"];

    for (const auto& entry : entries) {
        auto& item = stored[entry.name];
        std::string first_seen = safeGetString(item, "first_seen", now);

        item = nlohmann::json::object();
        item["ips"] = entry.ips;
        item["cname"] = entry.cname && !entry.cname->empty() ? nlohmann::json(*entry.cname) : nlohmann::json(nullptr);
        item["http_status"] = entry.http_status ? nlohmann::json(*entry.http_status) : nlohmann::json(nullptr);
        item["tls"] = entry.tls;
        item["server"] = entry.server.empty() ? nlohmann::json(nullptr) : nlohmann::json(entry.server);
        item["first_seen"] = first_seen;
        item["last_seen"] = now;
        item["last_probe"] = common::formatIsoTime(entry.last_probe);
    }

    if (run_id) {
        auto& members = document["runs"][std::to_string(*run_id)];
        std::set<std::string> names;
        if (members.is_array()) {
            for (const auto& name : members) {
                if (name.is_string()) {
                    names.insert(name.get<std::string>());
                }
            }
        }
        for (const auto& entry : entries) {
            names.insert(entry.name);
        }
        members = names;
    }

    writeJson(path, document);
    common::Logger::instance().debug("[ScanStore] Entries saved | domain={} | count={}", domain, entries.size());
}

std::vector<common::ScanRun> JsonScanStore::recentRuns(size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto runs = loadRuns();
    runs.erase(std::remove_if(runs.begin(), runs.end(),
                              [](const common::ScanRun& run) { return !run.completed_at; }),
               runs.end());
    std::sort(runs.begin(), runs.end(), newerRunFirst);

    if (runs.size() > limit) {
        runs.resize(limit);
    }
    return runs;
}

std::vector<common::ScanRun> JsonScanStore::runsForDomain(const std::string& domain, size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto runs = loadRuns();
    runs.erase(std::remove_if(runs.begin(), runs.end(),
                              [&domain](const common::ScanRun& run) { return run.domain != domain; }),
               runs.end());
    std::sort(runs.begin(), runs.end(), newerRunFirst);

    if (runs.size() > limit) {
        runs.resize(limit);
    }
    return runs;
}

}}
