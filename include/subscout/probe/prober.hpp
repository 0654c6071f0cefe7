#pragma once

#include "../common/types.hpp"
#include "../core/error_codes.hpp"
#include "../dns/dns_client.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace subscout {
namespace probe {

struct ProbeOptions {
    double timeout_seconds = 8.0;
    uint16_t https_port = 443;
    uint16_t http_port = 80;
    int concurrency = 20;
};

struct HttpAttempt {
    std::optional<int> status;
    std::string server;
    std::optional<core::CoreErrorCode> error;

    bool responded() const { return status.has_value(); }
};

class HostProber {
public:
    virtual ~HostProber() = default;

    // Probes one host. When `known` is absent the host is resolved first.
    // Throws std::invalid_argument when host is not a valid domain name.
    virtual common::SubdomainEntry probe(const std::string& host,
                                         const std::optional<common::ResolvedRecord>& known = std::nullopt) = 0;
};

class LivenessProber : public HostProber {
public:
    LivenessProber(ProbeOptions options, std::shared_ptr<dns::DnsClient> dns);

    common::SubdomainEntry probe(const std::string& host,
                                 const std::optional<common::ResolvedRecord>& known = std::nullopt) override;

    HttpAttempt attempt(const std::string& scheme, const std::string& host, uint16_t port) const;

private:
    ProbeOptions options_;
    std::shared_ptr<dns::DnsClient> dns_;
};

using EntryCallback = std::function<void(common::SubdomainEntry&&)>;

// Probes every answered record on at most `concurrency` threads and hands
// each entry to on_result on the calling thread as soon as it is ready.
// A host whose probe fails outright still yields its addresses and CNAME.
void probeAll(HostProber& prober,
              const std::vector<common::ResolvedRecord>& records,
              int concurrency,
              const EntryCallback& on_result);

}}
