#include "subscout/common/types.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>

namespace subscout {
namespace common {

std::string to_string(EventStage stage) {
    switch (stage) {
        case EventStage::CACHE_HIT: return "cache_hit";
        case EventStage::STARTED: return "started";
        case EventStage::CRT_SH_FOUND: return "crt_sh_found";
        case EventStage::RESOLVING: return "resolving";
        case EventStage::ENTRY: return "entry";
        case EventStage::DONE: return "done";
        case EventStage::ERROR: return "error";
        default: return "unknown";
    }
}

std::string formatIsoTime(TimePoint tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::optional<TimePoint> parseIsoTime(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }

    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }

    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

}}
