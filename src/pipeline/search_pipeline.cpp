#include "subscout/pipeline/search_pipeline.hpp"
#include "subscout/common/hostname.hpp"
#include "subscout/common/logger.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace subscout {
namespace pipeline {

namespace {

common::SearchEvent makeEvent(common::EventStage stage, const std::string& domain) {
    common::SearchEvent event;
    event.stage = stage;
    event.domain = domain;
    return event;
}

common::SearchEvent entryEvent(const std::string& domain, const common::SubdomainEntry& entry) {
    auto event = makeEvent(common::EventStage::ENTRY, domain);
    event.entry = entry;
    return event;
}

}

SearchPipeline::SearchPipeline(std::shared_ptr<storage::ScanStore> store,
                               std::shared_ptr<discovery::CandidateCollector> collector,
                               BackendSelector select_backend,
                               std::shared_ptr<probe::HostProber> prober,
                               int probe_concurrency)
    : store_(std::move(store)),
      collector_(std::move(collector)),
      select_backend_(std::move(select_backend)),
      prober_(std::move(prober)),
      probe_concurrency_(std::max(1, probe_concurrency)) {}

common::Snapshot SearchPipeline::loadSnapshot(const std::string& domain) {
    if (!store_) {
        return {};
    }

    try {
        return store_->loadSnapshot(domain);
    } catch (const storage::StorageError& e) {
        common::ErrorContext ctx{"SearchPipeline", {
            {"domain", domain},
            {"code", core::CoreErrorCodeHelper::toString(e.code())},
            {"error", e.what()}
        }};
        common::Logger::instance().warn("[SearchPipeline] Snapshot unavailable | {}", common::formatContext(ctx));
        return {};
    }
}

std::optional<int64_t> SearchPipeline::startRun(const std::string& domain) {
    if (!store_) {
        return std::nullopt;
    }

    try {
        return store_->startRun(domain);
    } catch (const storage::StorageError& e) {
        common::Logger::instance().warn("[SearchPipeline] Failed to record run start | domain={} | error={}",
                                       domain, e.what());
        return std::nullopt;
    }
}

int64_t SearchPipeline::persistResults(const std::string& domain,
                                       std::optional<int64_t> run_id,
                                       const std::map<std::string, common::SubdomainEntry>& entries,
                                       std::chrono::steady_clock::time_point started_at) {
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at).count();

    if (!store_ || !run_id) {
        return duration_ms;
    }

    std::vector<common::SubdomainEntry> sorted;
    sorted.reserve(entries.size());
    for (const auto& [name, entry] : entries) {
        sorted.push_back(entry);
    }

    store_->upsertEntries(domain, sorted, run_id);
    store_->completeRun(*run_id, sorted.size(), duration_ms);

    common::Logger::instance().debug("[SearchPipeline] Results persisted | domain={} | run_id={} | total={}",
                                    domain, *run_id, sorted.size());
    return duration_ms;
}

void SearchPipeline::search(const std::string& domain, bool refresh, const EventSink& emit) {
    auto normalized = common::sanitizeDomain(domain);
    if (!normalized) {
        throw std::invalid_argument("invalid domain");
    }
    const std::string& root = *normalized;
    auto& logger = common::Logger::instance();

    std::map<std::string, common::SubdomainEntry> cached;
    auto snapshot = loadSnapshot(root);

    if (!snapshot.entries.empty()) {
        for (const auto& entry : snapshot.entries) {
            cached[entry.name] = entry;
        }

        auto hit = makeEvent(common::EventStage::CACHE_HIT, root);
        hit.count = cached.size();
        emit(hit);

        for (const auto& [name, entry] : cached) {
            emit(entryEvent(root, entry));
        }

        if (!refresh) {
            auto done = makeEvent(common::EventStage::DONE, root);
            done.count = cached.size();
            if (snapshot.meta) {
                done.count = snapshot.meta->total_unique;
                done.cached_at = snapshot.meta->cached_at;
                done.duration_ms = snapshot.meta->duration_ms;
            }
            emit(done);
            logger.info("[SearchPipeline] Served from cache | domain={} | count={}", root, cached.size());
            return;
        }
    }

    emit(makeEvent(common::EventStage::STARTED, root));
    logger.info("[SearchPipeline] Pass started | domain={} | refresh={}", root, refresh);

    auto run_id = startRun(root);
    auto started_at = std::chrono::steady_clock::now();

    auto candidates = collector_->collect(root);

    auto found = makeEvent(common::EventStage::CRT_SH_FOUND, root);
    found.count = candidates.size();
    emit(found);

    auto backend = select_backend_();

    auto resolving = makeEvent(common::EventStage::RESOLVING, root);
    resolving.resolver = backend->name();
    resolving.count = candidates.size();
    emit(resolving);

    std::unordered_set<std::string> known(candidates.begin(), candidates.end());
    for (const auto& [name, entry] : cached) {
        if (known.insert(name).second) {
            candidates.push_back(name);
        }
    }

    std::map<std::string, common::SubdomainEntry> entries = cached;
    bool persisted = false;

    try {
        std::vector<common::ResolvedRecord> records;
        size_t outside = 0;
        backend->resolve(candidates, [&](common::ResolvedRecord&& record) {
            if (!common::isSubdomain(record.name, root)) {
                ++outside;
                return;
            }
            records.push_back(std::move(record));
        });
        logger.debug("[SearchPipeline] Resolution finished | domain={} | resolver={} | resolved={} | outside_root={}",
                    root, backend->name(), records.size(), outside);

        probe::probeAll(*prober_, records, probe_concurrency_, [&](common::SubdomainEntry&& entry) {
            if (!common::isSubdomain(entry.name, root)) {
                logger.debug("[SearchPipeline] Dropped entry outside root | domain={} | name={}", root, entry.name);
                return;
            }
            entries[entry.name] = entry;
            emit(entryEvent(root, entry));
        });

        int64_t duration_ms = 0;
        try {
            duration_ms = persistResults(root, run_id, entries, started_at);
        } catch (const std::exception& e) {
            duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started_at).count();
            logger.warn("[SearchPipeline] Failed to persist results | domain={} | error={}", root, e.what());
        }
        persisted = true;

        auto done = makeEvent(common::EventStage::DONE, root);
        done.count = entries.size();
        done.cached_at = std::chrono::system_clock::now();
        done.duration_ms = duration_ms;
        emit(done);

        logger.info("[SearchPipeline] Pass finished | domain={} | total={} | duration_ms={}",
                   root, entries.size(), duration_ms);
    } catch (const std::exception& e) {
        if (!persisted) {
            logger.warn("[SearchPipeline] Pass interrupted, saving partial results | domain={} | error={} | entries={}",
                       root, e.what(), entries.size());
            try {
                persistResults(root, run_id, entries, started_at);
            } catch (const std::exception& persist_error) {
                logger.warn("[SearchPipeline] Failed to persist incomplete scan | domain={} | error={}",
                           root, persist_error.what());
            }
        }
        throw;
    }
}

void SearchPipeline::run(const std::string& domain, bool refresh, EventChannel& channel) {
    try {
        search(domain, refresh, [&channel](const common::SearchEvent& event) {
            channel.push(event);
        });
    } catch (const std::exception& e) {
        common::Logger::instance().error("[SearchPipeline] Pass failed | domain={} | error={}", domain, e.what());

        auto normalized = common::sanitizeDomain(domain);
        auto event = makeEvent(common::EventStage::ERROR, normalized.value_or(domain));
        event.error = e.what();
        channel.push(std::move(event));
    }
    channel.close();
}

}}
