#pragma once

#include "error_framework.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>

namespace subscout {
namespace common {

using TimePoint = std::chrono::system_clock::time_point;

struct ResolvedRecord {
    std::string name;
    std::vector<std::string> ips;
    std::optional<std::string> cname;

    bool hasAnswer() const { return !ips.empty() || (cname && !cname->empty()); }
};

struct SubdomainEntry {
    std::string name;
    std::vector<std::string> ips;
    std::optional<std::string> cname;
    std::optional<int> http_status;
    bool tls = false;
    std::string server;
    TimePoint last_probe{};
};

struct ScanRun {
    int64_t id = 0;
    std::string domain;
    TimePoint started_at{};
    std::optional<TimePoint> completed_at;
    size_t total = 0;
    std::optional<int64_t> duration_ms;
};

struct SnapshotMeta {
    TimePoint cached_at{};
    size_t total_unique = 0;
    std::optional<int64_t> duration_ms;
};

struct Snapshot {
    std::vector<SubdomainEntry> entries;
    std::optional<SnapshotMeta> meta;
};

enum class EventStage {
    CACHE_HIT,
    STARTED,
    CRT_SH_FOUND,
    RESOLVING,
    ENTRY,
    DONE,
    ERROR
};

struct SearchEvent {
    EventStage stage = EventStage::STARTED;
    std::string domain;
    size_t count = 0;
    std::string resolver;
    std::optional<SubdomainEntry> entry;
    std::optional<TimePoint> cached_at;
    std::optional<int64_t> duration_ms;
    std::string error;
};

std::string to_string(EventStage stage);

std::string formatIsoTime(TimePoint tp);
std::optional<TimePoint> parseIsoTime(const std::string& text);

}}
