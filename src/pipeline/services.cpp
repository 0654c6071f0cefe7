#include "subscout/pipeline/search_pipeline.hpp"
#include "subscout/discovery/certificate_source.hpp"
#include "subscout/storage/json_scan_store.hpp"
#include "subscout/common/logger.hpp"

namespace subscout {
namespace pipeline {

PipelineServices buildPipelineServices(const common::GlobalConfig& config) {
    PipelineServices services;

    services.dns = std::make_shared<dns::SystemDnsClient>(config.resolver.timeout);

    if (config.storage.enable_history) {
        try {
            services.store = std::make_shared<storage::JsonScanStore>(
                config.storage.store_dir, storage::runIndexCapacity(config.storage));
        } catch (const storage::StorageError& e) {
            common::Logger::instance().warn("[Services] History disabled | dir={} | error={}",
                                           config.storage.store_dir, e.what());
        }
    }

    discovery::CrtShOptions crtsh;
    crtsh.base_url = config.discovery.crtsh_url;
    crtsh.timeout_seconds = config.discovery.crtsh_timeout;
    crtsh.user_agent = config.discovery.crtsh_user_agent;

    discovery::CollectorOptions collector_options;
    collector_options.bruteforce_words = config.discovery.bruteforce_words;
    collector_options.extra_wordlist = config.discovery.extra_wordlist;
    collector_options.seclists_wordlist = config.discovery.seclists_wordlist;
    collector_options.seclists_min_words = config.discovery.seclists_min_words;

    auto collector = std::make_shared<discovery::CandidateCollector>(
        std::make_shared<discovery::CrtShClient>(crtsh), collector_options);

    probe::ProbeOptions probe_options;
    probe_options.timeout_seconds = config.probe.http_timeout;
    probe_options.https_port = config.probe.https_port;
    probe_options.http_port = config.probe.http_port;
    probe_options.concurrency = config.probe.concurrency;
    services.prober = std::make_shared<probe::LivenessProber>(probe_options, services.dns);

    services.resolver_options.massdns_bin = config.resolver.massdns_bin;
    services.resolver_options.resolvers_file = config.resolver.resolvers_file;
    services.resolver_options.batch_size = config.resolver.batch_size;
    services.resolver_options.concurrency = config.resolver.concurrency;
    services.resolver_options.dns_timeout = config.resolver.timeout;

    auto resolver_options = services.resolver_options;
    auto dns = services.dns;
    BackendSelector selector = [resolver_options, dns]() {
        return resolve::selectResolverBackend(resolver_options, dns);
    };

    services.pipeline = std::make_shared<SearchPipeline>(
        services.store, collector, selector, services.prober, config.probe.concurrency);

    return services;
}

}}
