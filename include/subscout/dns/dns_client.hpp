#pragma once

#include "../common/types.hpp"
#include "../core/error_codes.hpp"
#include <string>
#include <vector>
#include <optional>

namespace subscout {
namespace dns {

enum class RecordType {
    A,
    AAAA,
    CNAME
};

std::string to_string(RecordType type);

struct DnsAnswer {
    std::vector<std::string> values;
    std::optional<core::CoreErrorCode> error;

    bool ok() const { return !error.has_value(); }
};

class DnsClient {
public:
    virtual ~DnsClient() = default;

    virtual DnsAnswer query(const std::string& name, RecordType type) = 0;
};

// Queries the resolvers from /etc/resolv.conf. Each call owns its own
// resolver state, so one instance can be shared across threads.
class SystemDnsClient : public DnsClient {
public:
    explicit SystemDnsClient(int timeout_seconds);

    DnsAnswer query(const std::string& name, RecordType type) override;

private:
    int timeout_seconds_;
};

// A, AAAA, then CNAME. A failed record type contributes nothing; the other
// types are still queried. Addresses come back sorted and distinct.
common::ResolvedRecord lookupHost(DnsClient& client, const std::string& name);

}}
