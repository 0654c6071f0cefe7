#pragma once

#include "../common/types.hpp"
#include "../dns/dns_client.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace subscout {
namespace resolve {

using RecordCallback = std::function<void(common::ResolvedRecord&&)>;

// Turns candidate names into resolved records. Records are handed to the
// callback as soon as they are known; names without any answer are dropped.
class ResolverBackend {
public:
    virtual ~ResolverBackend() = default;

    virtual std::string name() const = 0;
    virtual void resolve(const std::vector<std::string>& candidates, const RecordCallback& on_record) = 0;
};

struct ResolverOptions {
    std::string massdns_bin;
    std::string resolvers_file;
    int batch_size = 0;
    int concurrency = 0;
    int dns_timeout = 0;
};

// Parses the simple text output of the batch resolver ("name. TYPE value").
// Addresses are kept sorted and distinct; the last CNAME seen wins.
std::map<std::string, common::ResolvedRecord> parseBatchOutput(const std::string& output);

std::optional<std::string> findBatchResolverBinary(const std::string& configured);

// Batch backend when its binary and resolver list are usable, otherwise the
// per-host backend.
std::unique_ptr<ResolverBackend> selectResolverBackend(const ResolverOptions& options,
                                                       std::shared_ptr<dns::DnsClient> dns);

}}
