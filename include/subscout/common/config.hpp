#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>

namespace subscout {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct DiscoveryConfig {
    std::string crtsh_url;
    int crtsh_timeout;
    std::string crtsh_user_agent;
    std::vector<std::string> bruteforce_words;
    std::string extra_wordlist;
    std::string seclists_wordlist;
    int seclists_min_words;
};

struct ResolverConfig {
    std::string massdns_bin;
    std::string resolvers_file;
    int batch_size;
    int concurrency;
    int timeout;
};

struct ProbeConfig {
    double http_timeout;
    int concurrency;
    uint16_t https_port;
    uint16_t http_port;
};

struct StorageConfig {
    bool enable_history;
    std::string store_dir;
    int recent_scans_limit;
    int per_domain_history_limit;
};

struct ServerConfig {
    std::string http_host;
    uint16_t http_port;
    int rate_limit_requests;
    double rate_limit_window;
    bool trust_x_forwarded_for;
    size_t rate_limit_max_keys;
    size_t event_queue_capacity;
};

struct LoggingConfig {
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

struct GlobalConfig {
    std::string data_dir;
    std::string log_file;
    LogLevel log_level;
    DiscoveryConfig discovery;
    ResolverConfig resolver;
    ProbeConfig probe;
    StorageConfig storage;
    ServerConfig server;
    LoggingConfig logging;
};

std::string logLevelToString(LogLevel level);
std::optional<LogLevel> parseLogLevel(const std::string& value);

class Config {
public:
    static Config& instance();

    bool load(const std::string& config_file = "");
    bool save(const std::string& config_file = "");
    bool exists() const;

    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }

    void setValue(const std::string& key, const std::string& value);
    std::optional<std::string> getValue(const std::string& key) const;
    static std::vector<std::string> knownKeys();

    std::string getConfigPath() const;
    std::optional<std::string> findBestConfig() const;

    static GlobalConfig createDefaultConfig();

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;

    void applyPathDefaults();
    bool tryLoadTomlFile(const std::string& path);
};

}}
