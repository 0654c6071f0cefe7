#pragma once

#include "event_channel.hpp"
#include "../common/config.hpp"
#include "../common/types.hpp"
#include "../discovery/collector.hpp"
#include "../dns/dns_client.hpp"
#include "../probe/prober.hpp"
#include "../resolve/resolver.hpp"
#include "../storage/scan_store.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace subscout {
namespace pipeline {

using EventSink = std::function<void(const common::SearchEvent&)>;
using BackendSelector = std::function<std::unique_ptr<resolve::ResolverBackend>()>;

class SearchPipeline {
public:
    // store may be null; history is then neither read nor written.
    SearchPipeline(std::shared_ptr<storage::ScanStore> store,
                   std::shared_ptr<discovery::CandidateCollector> collector,
                   BackendSelector select_backend,
                   std::shared_ptr<probe::HostProber> prober,
                   int probe_concurrency);

    // Runs one discovery pass and reports progress through emit. Throws
    // std::invalid_argument before any work when domain is not valid.
    void search(const std::string& domain, bool refresh, const EventSink& emit);

    // Same pass feeding a channel. Any failure becomes a terminal error
    // event; the channel is closed on return.
    void run(const std::string& domain, bool refresh, EventChannel& channel);

private:
    std::shared_ptr<storage::ScanStore> store_;
    std::shared_ptr<discovery::CandidateCollector> collector_;
    BackendSelector select_backend_;
    std::shared_ptr<probe::HostProber> prober_;
    int probe_concurrency_;

    common::Snapshot loadSnapshot(const std::string& domain);
    std::optional<int64_t> startRun(const std::string& domain);

    int64_t persistResults(const std::string& domain,
                           std::optional<int64_t> run_id,
                           const std::map<std::string, common::SubdomainEntry>& entries,
                           std::chrono::steady_clock::time_point started_at);
};

struct PipelineServices {
    std::shared_ptr<storage::ScanStore> store;
    std::shared_ptr<dns::DnsClient> dns;
    std::shared_ptr<probe::HostProber> prober;
    std::shared_ptr<SearchPipeline> pipeline;
    resolve::ResolverOptions resolver_options;
};

// Wires the production collaborators from configuration. A history store
// that cannot be opened is logged and left null.
PipelineServices buildPipelineServices(const common::GlobalConfig& config);

}}
