#pragma once

#include "../core/error_codes.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace subscout {
namespace probe {

struct TlsCheckResult {
    bool ok = false;
    std::optional<core::CoreErrorCode> error;
    std::string detail;
};

// Full TLS handshake with SNI and certificate plus host name verification
// against the default trust store. The whole check is bounded by
// timeout_seconds per connection attempt.
TlsCheckResult checkTls(const std::string& host, uint16_t port, double timeout_seconds);

}}
