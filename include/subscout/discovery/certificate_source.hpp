#pragma once

#include "../core/error_codes.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace subscout {
namespace discovery {

struct CertificateFetchResult {
    std::vector<std::string> names;
    std::optional<core::CoreErrorCode> error;
    std::string detail;

    bool ok() const { return !error.has_value(); }
};

class CertificateSource {
public:
    virtual ~CertificateSource() = default;

    virtual std::string name() const = 0;

    // Normalized names under the domain, first-seen order. Failures are
    // reported in the result and never thrown.
    virtual CertificateFetchResult fetch(const std::string& domain) = 0;
};

struct CrtShOptions {
    std::string base_url;
    int timeout_seconds = 20;
    std::string user_agent;
};

class CrtShClient : public CertificateSource {
public:
    explicit CrtShClient(CrtShOptions options);
    ~CrtShClient() override;

    std::string name() const override { return "crt.sh"; }
    CertificateFetchResult fetch(const std::string& domain) override;

private:
    CrtShOptions options_;
};

// Parses a crt.sh JSON response body. Rows without a string name_value are
// skipped; a body that is not a JSON array is reported as malformed.
CertificateFetchResult parseCrtShPayload(const std::string& body, const std::string& domain);

}}
