#include "subscout/format/json_formatter.hpp"

namespace subscout {
namespace format {

nlohmann::json JsonFormatter::optionalTime(const std::optional<common::TimePoint>& tp) {
    if (tp) {
        return common::formatIsoTime(*tp);
    }
    return nullptr;
}

nlohmann::json JsonFormatter::formatEntry(const common::SubdomainEntry& entry) {
    nlohmann::json json;
    json["name"] = entry.name;
    json["ips"] = entry.ips;
    json["cname"] = entry.cname.value_or("");

    if (entry.http_status) {
        json["http_status"] = *entry.http_status;
    } else {
        json["http_status"] = nullptr;
    }

    json["tls"] = entry.tls;
    json["server"] = entry.server;
    return json;
}

nlohmann::json JsonFormatter::formatEvent(const common::SearchEvent& event) {
    nlohmann::json json;

    switch (event.stage) {
        case common::EventStage::ENTRY:
            json["type"] = "entry";
            if (event.entry) {
                json.update(formatEntry(*event.entry));
            }
            return json;

        case common::EventStage::CACHE_HIT:
        case common::EventStage::CRT_SH_FOUND:
            json["stage"] = common::to_string(event.stage);
            json["domain"] = event.domain;
            json["count"] = event.count;
            return json;

        case common::EventStage::RESOLVING:
            json["stage"] = "resolving";
            json["domain"] = event.domain;
            json["resolver"] = event.resolver;
            json["count"] = event.count;
            return json;

        case common::EventStage::DONE:
            json["stage"] = "done";
            json["domain"] = event.domain;
            json["total_unique"] = event.count;
            json["cached_at"] = optionalTime(event.cached_at);
            if (event.duration_ms) {
                json["duration_ms"] = *event.duration_ms;
            } else {
                json["duration_ms"] = nullptr;
            }
            return json;

        case common::EventStage::ERROR:
            json["stage"] = "error";
            json["domain"] = event.domain;
            json["error"] = event.error;
            return json;

        case common::EventStage::STARTED:
        default:
            json["stage"] = common::to_string(event.stage);
            json["domain"] = event.domain;
            return json;
    }
}

nlohmann::json JsonFormatter::formatRun(const common::ScanRun& run) {
    nlohmann::json json;
    json["id"] = run.id;
    json["domain"] = run.domain;
    json["timestamp"] = common::formatIsoTime(run.completed_at.value_or(run.started_at));
    json["total"] = run.total;

    if (run.duration_ms) {
        json["duration_ms"] = *run.duration_ms;
    } else {
        json["duration_ms"] = nullptr;
    }
    return json;
}

nlohmann::json JsonFormatter::formatProbeResult(const common::SubdomainEntry& entry) {
    nlohmann::json json;
    json["domain"] = entry.name;
    json["ips"] = entry.ips;

    if (entry.http_status) {
        json["http_status"] = *entry.http_status;
    } else {
        json["http_status"] = nullptr;
    }

    json["tls"] = entry.tls;
    json["server"] = entry.server;
    json["cname"] = entry.cname.value_or("");
    json["last_probe"] = common::formatIsoTime(entry.last_probe);
    return json;
}

std::string JsonFormatter::formatSse(const nlohmann::json& payload, const std::string& event_name) {
    std::string frame;
    if (!event_name.empty()) {
        frame += "event: " + event_name + "\n";
    }
    frame += "data: " + payload.dump() + "\n\n";
    return frame;
}

}}
