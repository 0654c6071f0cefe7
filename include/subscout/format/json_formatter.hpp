#pragma once

#include "../common/types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace subscout {
namespace format {

class JsonFormatter {
public:
    // {name, ips, cname, http_status, tls, server}; a missing CNAME is "".
    static nlohmann::json formatEntry(const common::SubdomainEntry& entry);

    static nlohmann::json formatEvent(const common::SearchEvent& event);

    // {id, domain, timestamp, total, duration_ms}; timestamp is the
    // completion time, or the start time for an unfinished run.
    static nlohmann::json formatRun(const common::ScanRun& run);

    static nlohmann::json formatProbeResult(const common::SubdomainEntry& entry);

    // One Server-Sent Events frame. The event line is omitted when
    // event_name is empty.
    static std::string formatSse(const nlohmann::json& payload, const std::string& event_name = "");

private:
    static nlohmann::json optionalTime(const std::optional<common::TimePoint>& tp);
};

}}
