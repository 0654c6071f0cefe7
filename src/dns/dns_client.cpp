#include "subscout/dns/dns_client.hpp"
#include "subscout/common/hostname.hpp"
#include "subscout/common/logger.hpp"
#include <netinet/in.h>
#include <arpa/inet.h>
#include <arpa/nameser.h>
#include <resolv.h>
#include <netdb.h>
#include <algorithm>
#include <cstring>
#include <set>
#include <vector>

namespace subscout {
namespace dns {

namespace {

constexpr int ANSWER_BUFFER_SIZE = 65536;

int toNsType(RecordType type) {
    switch (type) {
        case RecordType::A: return ns_t_a;
        case RecordType::AAAA: return ns_t_aaaa;
        case RecordType::CNAME: return ns_t_cname;
    }
    return ns_t_a;
}

core::CoreErrorCode mapResolverError(int herr) {
    switch (herr) {
        case HOST_NOT_FOUND:
        case NO_DATA:
            return core::CoreErrorCode::DNS_NO_ANSWER;
        case TRY_AGAIN:
            return core::CoreErrorCode::DNS_TIMEOUT;
        default:
            return core::CoreErrorCode::DNS_QUERY_FAILED;
    }
}

std::optional<std::string> readRecord(const ns_msg& handle, const ns_rr& rr, RecordType type) {
    switch (type) {
        case RecordType::A: {
            if (ns_rr_rdlen(rr) != 4) return std::nullopt;
            char ip[INET_ADDRSTRLEN];
            if (!inet_ntop(AF_INET, ns_rr_rdata(rr), ip, sizeof(ip))) return std::nullopt;
            return std::string(ip);
        }
        case RecordType::AAAA: {
            if (ns_rr_rdlen(rr) != 16) return std::nullopt;
            char ip[INET6_ADDRSTRLEN];
            if (!inet_ntop(AF_INET6, ns_rr_rdata(rr), ip, sizeof(ip))) return std::nullopt;
            return std::string(ip);
        }
        case RecordType::CNAME: {
            char target[NS_MAXDNAME];
            int res = ns_name_uncompress(ns_msg_base(handle), ns_msg_end(handle),
                                         ns_rr_rdata(rr), target, sizeof(target));
            if (res < 0) return std::nullopt;
            std::string value = common::toLower(target);
            while (!value.empty() && value.back() == '.') value.pop_back();
            if (value.empty()) return std::nullopt;
            return value;
        }
    }
    return std::nullopt;
}

}

std::string to_string(RecordType type) {
    switch (type) {
        case RecordType::A: return "A";
        case RecordType::AAAA: return "AAAA";
        case RecordType::CNAME: return "CNAME";
    }
    return "UNKNOWN";
}

SystemDnsClient::SystemDnsClient(int timeout_seconds)
    : timeout_seconds_(std::max(1, timeout_seconds)) {}

DnsAnswer SystemDnsClient::query(const std::string& name, RecordType type) {
    DnsAnswer answer;

    struct __res_state state;
    std::memset(&state, 0, sizeof(state));

    if (res_ninit(&state) != 0) {
        answer.error = core::CoreErrorCode::DNS_QUERY_FAILED;
        return answer;
    }

    state.retrans = timeout_seconds_;
    state.retry = 1;

    std::vector<unsigned char> buffer(ANSWER_BUFFER_SIZE);
    int wanted = toNsType(type);
    int len = res_nquery(&state, name.c_str(), ns_c_in, wanted, buffer.data(), static_cast<int>(buffer.size()));

    if (len < 0) {
        answer.error = mapResolverError(state.res_h_errno);
        res_nclose(&state);
        return answer;
    }

    res_nclose(&state);

    ns_msg handle;
    if (ns_initparse(buffer.data(), len, &handle) < 0) {
        answer.error = core::CoreErrorCode::DNS_QUERY_FAILED;
        return answer;
    }

    int count = ns_msg_count(handle, ns_s_an);
    for (int i = 0; i < count; ++i) {
        ns_rr rr;
        if (ns_parserr(&handle, ns_s_an, i, &rr) < 0) {
            continue;
        }
        if (static_cast<int>(ns_rr_type(rr)) != wanted) {
            continue;
        }
        auto value = readRecord(handle, rr, type);
        if (value) {
            answer.values.push_back(*value);
        }
    }

    if (answer.values.empty()) {
        answer.error = core::CoreErrorCode::DNS_NO_ANSWER;
    }

    return answer;
}

common::ResolvedRecord lookupHost(DnsClient& client, const std::string& name) {
    common::ResolvedRecord record;
    record.name = name;

    std::set<std::string> addresses;
    for (auto type : {RecordType::A, RecordType::AAAA}) {
        auto answer = client.query(name, type);
        if (!answer.ok()) {
            if (*answer.error != core::CoreErrorCode::DNS_NO_ANSWER) {
                common::Logger::instance().debug("[DNS] Query failed | name={} | type={} | error={}",
                                                 name, to_string(type),
                                                 core::CoreErrorCodeHelper::toString(*answer.error));
            }
            continue;
        }
        addresses.insert(answer.values.begin(), answer.values.end());
    }

    record.ips.assign(addresses.begin(), addresses.end());

    auto cname_answer = client.query(name, RecordType::CNAME);
    if (cname_answer.ok() && !cname_answer.values.empty()) {
        record.cname = cname_answer.values.front();
    } else if (cname_answer.error && *cname_answer.error != core::CoreErrorCode::DNS_NO_ANSWER) {
        common::Logger::instance().debug("[DNS] Query failed | name={} | type=CNAME | error={}",
                                         name, core::CoreErrorCodeHelper::toString(*cname_answer.error));
    }

    return record;
}

}}
