#pragma once

#include <string>
#include <array>
#include <cstdint>

namespace subscout {
namespace constants {

namespace version {
#ifdef SUBSCOUT_VERSION
    constexpr const char* CLI_VERSION = SUBSCOUT_VERSION;
#else
    constexpr const char* CLI_VERSION = "1.0.0";
#endif

    inline std::string getFullVersion() {
        return std::string("subscout v") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "subscout";
    constexpr const char* LOGGER_NAME = "subscout";
    constexpr const char* CONFIG_ENV = "SUBSCOUT_CONFIG";
    constexpr const char* CONTAINER_ENV = "SUBSCOUT_CONTAINER";
}

namespace discovery {
    constexpr const char* DEFAULT_CRTSH_URL = "https://crt.sh";
    constexpr const char* DEFAULT_USER_AGENT = "subscout/1.0";
    constexpr std::array<const char*, 6> DEFAULT_BRUTEFORCE_WORDS = {
        "www", "api", "dev", "mail", "staging", "test"
    };
}

namespace resolver {
    constexpr const char* BATCH_BACKEND_NAME = "massdns";
    constexpr const char* SYSTEM_BACKEND_NAME = "system";
    constexpr const char* FALLBACK_BINARY_PATH = "/opt/massdns/massdns";
    constexpr const char* BINARY_NAME = "massdns";
}

namespace limits {
    constexpr int DEFAULT_CRTSH_TIMEOUT_SECONDS = 20;
    constexpr int DEFAULT_SECLISTS_MIN_WORDS = 500;

    constexpr int DEFAULT_RESOLVER_BATCH_SIZE = 400;
    constexpr int DEFAULT_RESOLVER_CONCURRENCY = 100;
    constexpr int DEFAULT_DNS_TIMEOUT_SECONDS = 5;

    constexpr double DEFAULT_HTTP_TIMEOUT_SECONDS = 8.0;
    constexpr int DEFAULT_PROBE_CONCURRENCY = 20;
    constexpr uint16_t DEFAULT_HTTPS_PORT = 443;
    constexpr uint16_t DEFAULT_HTTP_PORT = 80;

    constexpr int DEFAULT_RECENT_SCANS_LIMIT = 50;
    constexpr int DEFAULT_PER_DOMAIN_HISTORY_LIMIT = 10;
    constexpr int MAX_RECENT_QUERY_LIMIT = 100;

    // runs.json keeps this many runs per recent_scans_limit slot.
    constexpr size_t STORED_RUNS_PER_RECENT_SCAN = 20;

    constexpr const char* DEFAULT_SERVER_HOST = "127.0.0.1";
    constexpr uint16_t DEFAULT_SERVER_PORT = 8000;
    constexpr int DEFAULT_RATE_LIMIT_REQUESTS = 60;
    constexpr double DEFAULT_RATE_LIMIT_WINDOW_SECONDS = 60.0;
    constexpr size_t DEFAULT_RATE_LIMIT_MAX_KEYS = 10000;
    constexpr size_t DEFAULT_EVENT_QUEUE_CAPACITY = 256;

    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 100;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 5;
}

namespace config_defaults {
    constexpr const char* CRTSH_URL = discovery::DEFAULT_CRTSH_URL;
    constexpr int CRTSH_TIMEOUT = limits::DEFAULT_CRTSH_TIMEOUT_SECONDS;
    constexpr const char* CRTSH_USER_AGENT = discovery::DEFAULT_USER_AGENT;
    constexpr int SECLISTS_MIN_WORDS = limits::DEFAULT_SECLISTS_MIN_WORDS;

    constexpr int RESOLVER_BATCH_SIZE = limits::DEFAULT_RESOLVER_BATCH_SIZE;
    constexpr int RESOLVER_CONCURRENCY = limits::DEFAULT_RESOLVER_CONCURRENCY;
    constexpr int RESOLVER_TIMEOUT = limits::DEFAULT_DNS_TIMEOUT_SECONDS;

    constexpr double PROBE_HTTP_TIMEOUT = limits::DEFAULT_HTTP_TIMEOUT_SECONDS;
    constexpr int PROBE_CONCURRENCY = limits::DEFAULT_PROBE_CONCURRENCY;
    constexpr uint16_t PROBE_HTTPS_PORT = limits::DEFAULT_HTTPS_PORT;
    constexpr uint16_t PROBE_HTTP_PORT = limits::DEFAULT_HTTP_PORT;

    constexpr bool STORAGE_ENABLE_HISTORY = true;
    constexpr int STORAGE_RECENT_SCANS_LIMIT = limits::DEFAULT_RECENT_SCANS_LIMIT;
    constexpr int STORAGE_PER_DOMAIN_HISTORY_LIMIT = limits::DEFAULT_PER_DOMAIN_HISTORY_LIMIT;

    constexpr const char* SERVER_HTTP_HOST = limits::DEFAULT_SERVER_HOST;
    constexpr uint16_t SERVER_HTTP_PORT = limits::DEFAULT_SERVER_PORT;
    constexpr int SERVER_RATE_LIMIT_REQUESTS = limits::DEFAULT_RATE_LIMIT_REQUESTS;
    constexpr double SERVER_RATE_LIMIT_WINDOW = limits::DEFAULT_RATE_LIMIT_WINDOW_SECONDS;
    constexpr bool SERVER_TRUST_X_FORWARDED_FOR = false;
    constexpr size_t SERVER_RATE_LIMIT_MAX_KEYS = limits::DEFAULT_RATE_LIMIT_MAX_KEYS;
    constexpr size_t SERVER_EVENT_QUEUE_CAPACITY = limits::DEFAULT_EVENT_QUEUE_CAPACITY;

    constexpr size_t LOG_ROTATION_SIZE_MB = limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    constexpr size_t LOG_MAX_FILES = limits::DEFAULT_LOG_MAX_FILES;
}

}
}
