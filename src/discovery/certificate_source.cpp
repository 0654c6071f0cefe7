#include "subscout/discovery/certificate_source.hpp"
#include "subscout/common/hostname.hpp"
#include "subscout/common/logger.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>

namespace subscout {
namespace discovery {

CrtShClient::CrtShClient(CrtShOptions options) : options_(std::move(options)) {}

CrtShClient::~CrtShClient() = default;

CertificateFetchResult CrtShClient::fetch(const std::string& domain) {
    CertificateFetchResult result;

    httplib::Client client(options_.base_url);
    client.set_connection_timeout(options_.timeout_seconds, 0);
    client.set_read_timeout(options_.timeout_seconds, 0);
    client.set_write_timeout(options_.timeout_seconds, 0);
    client.set_follow_location(true);
    client.enable_server_certificate_verification(true);

    httplib::Headers headers = {
        {"User-Agent", options_.user_agent},
        {"Accept", "application/json"}
    };

    std::string path = "/?q=%25." + domain + "&output=json";

    common::Logger::instance().debug("[CrtSh] Request | domain={} | url={}{}",
                                     domain, options_.base_url, path);

    auto res = client.Get(path, headers);

    if (!res) {
        auto err = res.error();
        result.error = (err == httplib::Error::ConnectionTimeout || err == httplib::Error::Read)
            ? core::CoreErrorCode::HTTP_TIMEOUT
            : core::CoreErrorCode::CT_FETCH_FAILED;
        result.detail = httplib::to_string(err);
        return result;
    }

    if (res->status != 200) {
        result.error = core::CoreErrorCode::CT_BAD_STATUS;
        result.detail = "status=" + std::to_string(res->status);
        return result;
    }

    return parseCrtShPayload(res->body, domain);
}

CertificateFetchResult parseCrtShPayload(const std::string& body, const std::string& domain) {
    CertificateFetchResult result;

    auto payload = nlohmann::json::parse(body, nullptr, false);
    if (payload.is_discarded() || !payload.is_array()) {
        result.error = core::CoreErrorCode::CT_MALFORMED_PAYLOAD;
        result.detail = payload.is_discarded() ? "invalid json" : "expected array";
        return result;
    }

    std::vector<std::string> names;

    for (const auto& row : payload) {
        if (!row.is_object() || !row.contains("name_value") || !row["name_value"].is_string()) {
            continue;
        }

        for (const auto& raw : common::splitCertificateNames(row["name_value"].get<std::string>())) {
            auto normalized = common::normalizeHostname(raw);
            if (!normalized) {
                continue;
            }
            if (common::isSubdomain(*normalized, domain)) {
                names.push_back(*normalized);
            }
        }
    }

    result.names = common::uniqueEverseen(names);
    return result;
}

}}
