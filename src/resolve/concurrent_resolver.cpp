#include "subscout/resolve/concurrent_resolver.hpp"
#include "subscout/common/constants.hpp"
#include "subscout/common/hostname.hpp"
#include "subscout/common/logger.hpp"
#include "subscout/common/worker_pool.hpp"

namespace subscout {
namespace resolve {

ConcurrentResolver::ConcurrentResolver(std::shared_ptr<dns::DnsClient> dns, int concurrency)
    : dns_(std::move(dns)), concurrency_(concurrency) {}

std::string ConcurrentResolver::name() const {
    return constants::resolver::SYSTEM_BACKEND_NAME;
}

void ConcurrentResolver::resolve(const std::vector<std::string>& candidates, const RecordCallback& on_record) {
    common::Logger::instance().debug("[Resolver] Resolving via system DNS | count={} | concurrency={}",
                                    candidates.size(), concurrency_);

    std::function<std::optional<common::ResolvedRecord>(const std::string&)> work =
        [this](const std::string& candidate) -> std::optional<common::ResolvedRecord> {
            auto host = common::normalizeHostname(candidate);
            if (!host) {
                return std::nullopt;
            }
            auto record = dns::lookupHost(*dns_, *host);
            if (!record.hasAnswer()) {
                return std::nullopt;
            }
            return record;
        };

    std::function<void(common::ResolvedRecord&&)> deliver = [&on_record](common::ResolvedRecord&& record) {
        on_record(std::move(record));
    };

    common::runBounded<std::string, common::ResolvedRecord>(candidates, concurrency_, work, deliver, "Resolver");
}

}}
