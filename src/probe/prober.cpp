#include "subscout/probe/prober.hpp"
#include "subscout/probe/tls_check.hpp"
#include "subscout/common/hostname.hpp"
#include "subscout/common/logger.hpp"
#include "subscout/common/worker_pool.hpp"
#include <httplib.h>
#include <cmath>
#include <stdexcept>

namespace subscout {
namespace probe {

namespace {

constexpr int RETRY_WITH_GET[] = {403, 405};

bool shouldRetryWithGet(int status) {
    for (int code : RETRY_WITH_GET) {
        if (status == code) {
            return true;
        }
    }
    return false;
}

core::CoreErrorCode classifyError(httplib::Error error) {
    switch (error) {
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return core::CoreErrorCode::HTTP_TIMEOUT;
        case httplib::Error::SSLConnection:
        case httplib::Error::SSLServerVerification:
            return core::CoreErrorCode::TLS_HANDSHAKE_FAILED;
        default:
            return core::CoreErrorCode::HTTP_CONNECTION_FAILED;
    }
}

common::SubdomainEntry partialEntry(const common::ResolvedRecord& record) {
    common::SubdomainEntry entry;
    entry.name = record.name;
    entry.ips = record.ips;
    entry.cname = record.cname;
    entry.last_probe = std::chrono::system_clock::now();
    return entry;
}

}

LivenessProber::LivenessProber(ProbeOptions options, std::shared_ptr<dns::DnsClient> dns)
    : options_(options), dns_(std::move(dns)) {}

HttpAttempt LivenessProber::attempt(const std::string& scheme, const std::string& host, uint16_t port) const {
    HttpAttempt result;

    std::string base_url = scheme + "://" + host + ":" + std::to_string(port);
    httplib::Client client(base_url);

    double whole = 0.0;
    double fraction = std::modf(options_.timeout_seconds, &whole);
    time_t sec = static_cast<time_t>(whole);
    time_t usec = static_cast<time_t>(fraction * 1000000.0);

    client.set_connection_timeout(sec, usec);
    client.set_read_timeout(sec, usec);
    client.set_write_timeout(sec, usec);
    client.set_follow_location(true);
    if (scheme == "https") {
        client.enable_server_certificate_verification(true);
    }

    for (const char* method : {"HEAD", "GET"}) {
        auto res = std::string(method) == "HEAD" ? client.Head("/") : client.Get("/");

        if (!res) {
            result.error = classifyError(res.error());
            common::Logger::instance().debug("[Prober] Request failed | url={} | method={} | error={}",
                                            base_url, method, httplib::to_string(res.error()));
            break;
        }

        result.status = res->status;
        result.server = res->get_header_value("Server");
        result.error.reset();

        if (std::string(method) == "HEAD" && shouldRetryWithGet(res->status)) {
            continue;
        }
        break;
    }

    return result;
}

common::SubdomainEntry LivenessProber::probe(const std::string& host,
                                             const std::optional<common::ResolvedRecord>& known) {
    auto normalized = common::sanitizeDomain(host);
    if (!normalized) {
        throw std::invalid_argument("invalid domain for status probe");
    }

    common::ResolvedRecord record;
    if (known) {
        record = *known;
    } else if (dns_) {
        record = dns::lookupHost(*dns_, *normalized);
    }
    record.name = *normalized;

    auto entry = partialEntry(record);

    try {
        auto https = attempt("https", *normalized, options_.https_port);
        if (https.responded()) {
            entry.http_status = https.status;
            entry.server = https.server;
            entry.tls = true;
        } else {
            auto http = attempt("http", *normalized, options_.http_port);
            if (http.responded()) {
                entry.http_status = http.status;
                entry.server = http.server;
            }
        }

        if (!entry.tls) {
            auto tls = checkTls(*normalized, options_.https_port, options_.timeout_seconds);
            entry.tls = tls.ok;
            if (!tls.ok && tls.error) {
                common::Logger::instance().debug("[Prober] TLS check failed | host={} | code={} | detail={}",
                                                *normalized, core::CoreErrorCodeHelper::toString(*tls.error),
                                                tls.detail);
            }
        }
    } catch (const std::exception& e) {
        common::Logger::instance().debug("[Prober] Probe aborted | host={} | error={}", *normalized, e.what());
        entry = partialEntry(record);
    }

    entry.last_probe = std::chrono::system_clock::now();
    return entry;
}

void probeAll(HostProber& prober,
              const std::vector<common::ResolvedRecord>& records,
              int concurrency,
              const EntryCallback& on_result) {
    std::vector<common::ResolvedRecord> answered;
    answered.reserve(records.size());
    for (const auto& record : records) {
        if (record.hasAnswer()) {
            answered.push_back(record);
        }
    }

    if (answered.size() != records.size()) {
        common::Logger::instance().debug("[Prober] Skipping unanswered records | count={}",
                                        records.size() - answered.size());
    }

    std::function<std::optional<common::SubdomainEntry>(const common::ResolvedRecord&)> work =
        [&prober](const common::ResolvedRecord& record) -> std::optional<common::SubdomainEntry> {
            try {
                return prober.probe(record.name, record);
            } catch (const std::exception& e) {
                common::Logger::instance().debug("[Prober] Using partial result | host={} | error={}",
                                                record.name, e.what());
                return partialEntry(record);
            }
        };

    std::function<void(common::SubdomainEntry&&)> deliver = [&on_result](common::SubdomainEntry&& entry) {
        on_result(std::move(entry));
    };

    common::runBounded<common::ResolvedRecord, common::SubdomainEntry>(answered, concurrency, work, deliver, "Prober");
}

}}
