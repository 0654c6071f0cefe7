#include "subscout/common/config.hpp"
#include "subscout/common/constants.hpp"
#include "subscout/common/paths.hpp"
#include "subscout/common/logger.hpp"
#include <toml.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <filesystem>
#include <unistd.h>
#include <sys/stat.h>

namespace subscout {
namespace common {

namespace {

double findNumber(const toml::value& section, const std::string& key) {
    const auto& value = toml::find(section, key);
    if (value.is_integer()) {
        return static_cast<double>(value.as_integer());
    }
    return value.as_floating();
}

bool parseBool(const std::string& value) {
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    throw std::invalid_argument("Expected boolean value: " + value);
}

uint16_t parsePort(const std::string& value) {
    int port = std::stoi(value);
    if (port < 0 || port > 65535) {
        throw std::out_of_range("Port out of range: " + value);
    }
    return static_cast<uint16_t>(port);
}

std::vector<std::string> splitWords(const std::string& value) {
    std::vector<std::string> words;
    std::stringstream ss(value);
    std::string word;
    while (std::getline(ss, word, ',')) {
        auto begin = word.find_first_not_of(" \t");
        auto end = word.find_last_not_of(" \t");
        if (begin != std::string::npos) {
            words.push_back(word.substr(begin, end - begin + 1));
        }
    }
    return words;
}

std::string joinWords(const std::vector<std::string>& words) {
    std::string result;
    for (const auto& word : words) {
        if (!result.empty()) result += ",";
        result += word;
    }
    return result;
}

std::string formatNumber(double value) {
    return fmt::format("{}", value);
}

}

std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "INFO";
}

std::optional<LogLevel> parseLogLevel(const std::string& raw) {
    std::string value = raw;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (value == "DEBUG") return LogLevel::DEBUG;
    if (value == "INFO") return LogLevel::INFO;
    if (value == "WARN") return LogLevel::WARN;
    if (value == "ERROR") return LogLevel::ERROR;
    return std::nullopt;
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;

    GlobalConfig config;

    config.data_dir = "";
    config.log_file = "";
    config.log_level = LogLevel::INFO;

    config.discovery.crtsh_url = CRTSH_URL;
    config.discovery.crtsh_timeout = CRTSH_TIMEOUT;
    config.discovery.crtsh_user_agent = CRTSH_USER_AGENT;
    config.discovery.bruteforce_words.assign(
        constants::discovery::DEFAULT_BRUTEFORCE_WORDS.begin(),
        constants::discovery::DEFAULT_BRUTEFORCE_WORDS.end());
    config.discovery.extra_wordlist = "";
    config.discovery.seclists_wordlist = "";
    config.discovery.seclists_min_words = SECLISTS_MIN_WORDS;

    config.resolver.massdns_bin = "";
    config.resolver.resolvers_file = "";
    config.resolver.batch_size = RESOLVER_BATCH_SIZE;
    config.resolver.concurrency = RESOLVER_CONCURRENCY;
    config.resolver.timeout = RESOLVER_TIMEOUT;

    config.probe.http_timeout = PROBE_HTTP_TIMEOUT;
    config.probe.concurrency = PROBE_CONCURRENCY;
    config.probe.https_port = PROBE_HTTPS_PORT;
    config.probe.http_port = PROBE_HTTP_PORT;

    config.storage.enable_history = STORAGE_ENABLE_HISTORY;
    config.storage.store_dir = "";
    config.storage.recent_scans_limit = STORAGE_RECENT_SCANS_LIMIT;
    config.storage.per_domain_history_limit = STORAGE_PER_DOMAIN_HISTORY_LIMIT;

    config.server.http_host = SERVER_HTTP_HOST;
    config.server.http_port = SERVER_HTTP_PORT;
    config.server.rate_limit_requests = SERVER_RATE_LIMIT_REQUESTS;
    config.server.rate_limit_window = SERVER_RATE_LIMIT_WINDOW;
    config.server.trust_x_forwarded_for = SERVER_TRUST_X_FORWARDED_FOR;
    config.server.rate_limit_max_keys = SERVER_RATE_LIMIT_MAX_KEYS;
    config.server.event_queue_capacity = SERVER_EVENT_QUEUE_CAPACITY;

    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;

    return config;
}

std::optional<std::string> Config::findBestConfig() const {
    auto paths = PathManager::instance().getConfigSearchPaths();

    for (const auto& path : paths) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }

    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    try {
        global_ = createDefaultConfig();

        std::string effective_config_file = config_file;
        if (effective_config_file.empty()) {
            auto best = findBestConfig();
            effective_config_file = best ? *best : PathManager::instance().getConfigFile();
        }

        current_config_path_ = effective_config_file;

        bool loaded = tryLoadTomlFile(effective_config_file);
        applyPathDefaults();

        Logger::instance().debug("[Config] Loaded | path={} | from_file={}",
                                 effective_config_file, loaded);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | error={}", e.what());
        applyPathDefaults();
        return false;
    }
}

void Config::applyPathDefaults() {
    auto& path_manager = PathManager::instance();

    if (global_.data_dir.empty()) {
        global_.data_dir = path_manager.getDataDir();
    }
    if (global_.log_file.empty()) {
        global_.log_file = path_manager.getLogDir() + "/subscout.log";
    }
    if (global_.resolver.resolvers_file.empty()) {
        global_.resolver.resolvers_file = global_.data_dir + "/resolvers.txt";
    }
    if (global_.storage.store_dir.empty()) {
        global_.storage.store_dir = global_.data_dir + "/history";
    }
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().debug("[Config] File not found, using defaults | path={}", path);
        return false;
    }

    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().warn("[Config] File not readable, using defaults | path={}", path);
        return false;
    }

    auto data = toml::parse(path);

    if (data.contains("global")) {
        auto section = data.at("global");

        if (section.contains("data_dir")) {
            global_.data_dir = toml::find<std::string>(section, "data_dir");
        }
        if (section.contains("log_file")) {
            global_.log_file = toml::find<std::string>(section, "log_file");
        }
        if (section.contains("log_level")) {
            auto level = parseLogLevel(toml::find<std::string>(section, "log_level"));
            if (level) global_.log_level = *level;
        }
    }

    if (data.contains("discovery")) {
        auto section = data.at("discovery");

        if (section.contains("crtsh_url")) {
            global_.discovery.crtsh_url = toml::find<std::string>(section, "crtsh_url");
        }
        if (section.contains("crtsh_timeout")) {
            global_.discovery.crtsh_timeout = toml::find<int>(section, "crtsh_timeout");
        }
        if (section.contains("crtsh_user_agent")) {
            global_.discovery.crtsh_user_agent = toml::find<std::string>(section, "crtsh_user_agent");
        }
        if (section.contains("bruteforce_words")) {
            global_.discovery.bruteforce_words =
                toml::find<std::vector<std::string>>(section, "bruteforce_words");
        }
        if (section.contains("extra_wordlist")) {
            global_.discovery.extra_wordlist = toml::find<std::string>(section, "extra_wordlist");
        }
        if (section.contains("seclists_wordlist")) {
            global_.discovery.seclists_wordlist = toml::find<std::string>(section, "seclists_wordlist");
        }
        if (section.contains("seclists_min_words")) {
            global_.discovery.seclists_min_words = toml::find<int>(section, "seclists_min_words");
        }
    }

    if (data.contains("resolver")) {
        auto section = data.at("resolver");

        if (section.contains("massdns_bin")) {
            global_.resolver.massdns_bin = toml::find<std::string>(section, "massdns_bin");
        }
        if (section.contains("resolvers_file")) {
            global_.resolver.resolvers_file = toml::find<std::string>(section, "resolvers_file");
        }
        if (section.contains("batch_size")) {
            global_.resolver.batch_size = toml::find<int>(section, "batch_size");
        }
        if (section.contains("concurrency")) {
            global_.resolver.concurrency = toml::find<int>(section, "concurrency");
        }
        if (section.contains("timeout")) {
            global_.resolver.timeout = toml::find<int>(section, "timeout");
        }
    }

    if (data.contains("probe")) {
        auto section = data.at("probe");

        if (section.contains("http_timeout")) {
            global_.probe.http_timeout = findNumber(section, "http_timeout");
        }
        if (section.contains("concurrency")) {
            global_.probe.concurrency = toml::find<int>(section, "concurrency");
        }
        if (section.contains("https_port")) {
            global_.probe.https_port = static_cast<uint16_t>(toml::find<int>(section, "https_port"));
        }
        if (section.contains("http_port")) {
            global_.probe.http_port = static_cast<uint16_t>(toml::find<int>(section, "http_port"));
        }
    }

    if (data.contains("storage")) {
        auto section = data.at("storage");

        if (section.contains("enable_history")) {
            global_.storage.enable_history = toml::find<bool>(section, "enable_history");
        }
        if (section.contains("store_dir")) {
            global_.storage.store_dir = toml::find<std::string>(section, "store_dir");
        }
        if (section.contains("recent_scans_limit")) {
            global_.storage.recent_scans_limit = toml::find<int>(section, "recent_scans_limit");
        }
        if (section.contains("per_domain_history_limit")) {
            global_.storage.per_domain_history_limit = toml::find<int>(section, "per_domain_history_limit");
        }
    }

    if (data.contains("server")) {
        auto section = data.at("server");

        if (section.contains("http_host")) {
            global_.server.http_host = toml::find<std::string>(section, "http_host");
        }
        if (section.contains("http_port")) {
            global_.server.http_port = static_cast<uint16_t>(toml::find<int>(section, "http_port"));
        }
        if (section.contains("rate_limit_requests")) {
            global_.server.rate_limit_requests = toml::find<int>(section, "rate_limit_requests");
        }
        if (section.contains("rate_limit_window")) {
            global_.server.rate_limit_window = findNumber(section, "rate_limit_window");
        }
        if (section.contains("trust_x_forwarded_for")) {
            global_.server.trust_x_forwarded_for = toml::find<bool>(section, "trust_x_forwarded_for");
        }
        if (section.contains("rate_limit_max_keys")) {
            global_.server.rate_limit_max_keys = toml::find<size_t>(section, "rate_limit_max_keys");
        }
        if (section.contains("event_queue_capacity")) {
            global_.server.event_queue_capacity = toml::find<size_t>(section, "event_queue_capacity");
        }
    }

    if (data.contains("logging")) {
        auto section = data.at("logging");

        if (section.contains("rotation_size_mb")) {
            global_.logging.rotation_size_mb = toml::find<size_t>(section, "rotation_size_mb");
        }
        if (section.contains("max_files")) {
            global_.logging.max_files = toml::find<size_t>(section, "max_files");
        }
        if (section.contains("format")) {
            std::string format_str = toml::find<std::string>(section, "format");
            global_.logging.format = format_str == "json" ? LogFormat::JSON : LogFormat::TEXT;
        }
    }

    return true;
}

bool Config::save(const std::string& config_file) {
    try {
        auto& path_manager = PathManager::instance();

        std::string effective_config_file = config_file;
        if (effective_config_file.empty()) {
            effective_config_file = current_config_path_.empty()
                ? path_manager.getConfigFile()
                : current_config_path_;
        }

        toml::array words;
        for (const auto& word : global_.discovery.bruteforce_words) {
            words.push_back(word);
        }

        toml::value data = toml::table{
            {"global", toml::table{
                {"data_dir", global_.data_dir},
                {"log_file", global_.log_file},
                {"log_level", logLevelToString(global_.log_level)}
            }},
            {"discovery", toml::table{
                {"crtsh_url", global_.discovery.crtsh_url},
                {"crtsh_timeout", global_.discovery.crtsh_timeout},
                {"crtsh_user_agent", global_.discovery.crtsh_user_agent},
                {"bruteforce_words", words},
                {"extra_wordlist", global_.discovery.extra_wordlist},
                {"seclists_wordlist", global_.discovery.seclists_wordlist},
                {"seclists_min_words", global_.discovery.seclists_min_words}
            }},
            {"resolver", toml::table{
                {"massdns_bin", global_.resolver.massdns_bin},
                {"resolvers_file", global_.resolver.resolvers_file},
                {"batch_size", global_.resolver.batch_size},
                {"concurrency", global_.resolver.concurrency},
                {"timeout", global_.resolver.timeout}
            }},
            {"probe", toml::table{
                {"http_timeout", global_.probe.http_timeout},
                {"concurrency", global_.probe.concurrency},
                {"https_port", global_.probe.https_port},
                {"http_port", global_.probe.http_port}
            }},
            {"storage", toml::table{
                {"enable_history", global_.storage.enable_history},
                {"store_dir", global_.storage.store_dir},
                {"recent_scans_limit", global_.storage.recent_scans_limit},
                {"per_domain_history_limit", global_.storage.per_domain_history_limit}
            }},
            {"server", toml::table{
                {"http_host", global_.server.http_host},
                {"http_port", global_.server.http_port},
                {"rate_limit_requests", global_.server.rate_limit_requests},
                {"rate_limit_window", global_.server.rate_limit_window},
                {"trust_x_forwarded_for", global_.server.trust_x_forwarded_for},
                {"rate_limit_max_keys", global_.server.rate_limit_max_keys},
                {"event_queue_capacity", global_.server.event_queue_capacity}
            }},
            {"logging", toml::table{
                {"rotation_size_mb", global_.logging.rotation_size_mb},
                {"max_files", global_.logging.max_files},
                {"format", global_.logging.format == LogFormat::JSON ? "json" : "text"}
            }}
        };

        std::filesystem::path config_dir = std::filesystem::path(effective_config_file).parent_path();
        std::error_code ec;
        if (!config_dir.empty() && !std::filesystem::exists(config_dir, ec)) {
            std::filesystem::create_directories(config_dir, ec);
        }

        std::ofstream file(effective_config_file);
        if (!file) {
            Logger::instance().error("[Config] File open failed | path={}", effective_config_file);
            return false;
        }

        file << toml::format(data);
        file.close();

        if (chmod(effective_config_file.c_str(), path_manager.isSystemMode() ? 0644 : 0600) != 0) {
            Logger::instance().warn("[Config] Failed to set permissions | path={}", effective_config_file);
        }

        current_config_path_ = effective_config_file;

        Logger::instance().info("[Config] Saved | path={}", effective_config_file);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Save failed | error={}", e.what());
        return false;
    }
}

bool Config::exists() const {
    return std::filesystem::exists(getConfigPath());
}

void Config::setValue(const std::string& key, const std::string& value) {
    if (key == "data_dir") global_.data_dir = value;
    else if (key == "log_file") global_.log_file = value;
    else if (key == "log_level") {
        auto level = parseLogLevel(value);
        if (!level) {
            throw std::invalid_argument("Expected DEBUG, INFO, WARN or ERROR: " + value);
        }
        global_.log_level = *level;
    }
    else if (key == "discovery.crtsh_url") global_.discovery.crtsh_url = value;
    else if (key == "discovery.crtsh_timeout") global_.discovery.crtsh_timeout = std::stoi(value);
    else if (key == "discovery.crtsh_user_agent") global_.discovery.crtsh_user_agent = value;
    else if (key == "discovery.bruteforce_words") global_.discovery.bruteforce_words = splitWords(value);
    else if (key == "discovery.extra_wordlist") global_.discovery.extra_wordlist = value;
    else if (key == "discovery.seclists_wordlist") global_.discovery.seclists_wordlist = value;
    else if (key == "discovery.seclists_min_words") global_.discovery.seclists_min_words = std::stoi(value);
    else if (key == "resolver.massdns_bin") global_.resolver.massdns_bin = value;
    else if (key == "resolver.resolvers_file") global_.resolver.resolvers_file = value;
    else if (key == "resolver.batch_size") global_.resolver.batch_size = std::stoi(value);
    else if (key == "resolver.concurrency") global_.resolver.concurrency = std::stoi(value);
    else if (key == "resolver.timeout") global_.resolver.timeout = std::stoi(value);
    else if (key == "probe.http_timeout") global_.probe.http_timeout = std::stod(value);
    else if (key == "probe.concurrency") global_.probe.concurrency = std::stoi(value);
    else if (key == "probe.https_port") global_.probe.https_port = parsePort(value);
    else if (key == "probe.http_port") global_.probe.http_port = parsePort(value);
    else if (key == "storage.enable_history") global_.storage.enable_history = parseBool(value);
    else if (key == "storage.store_dir") global_.storage.store_dir = value;
    else if (key == "storage.recent_scans_limit") global_.storage.recent_scans_limit = std::stoi(value);
    else if (key == "storage.per_domain_history_limit") global_.storage.per_domain_history_limit = std::stoi(value);
    else if (key == "server.http_host") global_.server.http_host = value;
    else if (key == "server.http_port") global_.server.http_port = parsePort(value);
    else if (key == "server.rate_limit_requests") global_.server.rate_limit_requests = std::stoi(value);
    else if (key == "server.rate_limit_window") global_.server.rate_limit_window = std::stod(value);
    else if (key == "server.trust_x_forwarded_for") global_.server.trust_x_forwarded_for = parseBool(value);
    else if (key == "server.rate_limit_max_keys") global_.server.rate_limit_max_keys = std::stoull(value);
    else if (key == "server.event_queue_capacity") global_.server.event_queue_capacity = std::stoull(value);
    else if (key == "logging.rotation_size_mb") global_.logging.rotation_size_mb = std::stoull(value);
    else if (key == "logging.max_files") global_.logging.max_files = std::stoull(value);
    else if (key == "logging.format") {
        if (value != "json" && value != "text") {
            throw std::invalid_argument("Expected json or text: " + value);
        }
        global_.logging.format = (value == "json") ? LogFormat::JSON : LogFormat::TEXT;
    }
    else {
        throw std::invalid_argument("Unknown configuration key: " + key);
    }
}

std::optional<std::string> Config::getValue(const std::string& key) const {
    if (key == "data_dir") return global_.data_dir;
    else if (key == "log_file") return global_.log_file;
    else if (key == "log_level") return logLevelToString(global_.log_level);
    else if (key == "discovery.crtsh_url") return global_.discovery.crtsh_url;
    else if (key == "discovery.crtsh_timeout") return std::to_string(global_.discovery.crtsh_timeout);
    else if (key == "discovery.crtsh_user_agent") return global_.discovery.crtsh_user_agent;
    else if (key == "discovery.bruteforce_words") return joinWords(global_.discovery.bruteforce_words);
    else if (key == "discovery.extra_wordlist") return global_.discovery.extra_wordlist;
    else if (key == "discovery.seclists_wordlist") return global_.discovery.seclists_wordlist;
    else if (key == "discovery.seclists_min_words") return std::to_string(global_.discovery.seclists_min_words);
    else if (key == "resolver.massdns_bin") return global_.resolver.massdns_bin;
    else if (key == "resolver.resolvers_file") return global_.resolver.resolvers_file;
    else if (key == "resolver.batch_size") return std::to_string(global_.resolver.batch_size);
    else if (key == "resolver.concurrency") return std::to_string(global_.resolver.concurrency);
    else if (key == "resolver.timeout") return std::to_string(global_.resolver.timeout);
    else if (key == "probe.http_timeout") return formatNumber(global_.probe.http_timeout);
    else if (key == "probe.concurrency") return std::to_string(global_.probe.concurrency);
    else if (key == "probe.https_port") return std::to_string(global_.probe.https_port);
    else if (key == "probe.http_port") return std::to_string(global_.probe.http_port);
    else if (key == "storage.enable_history") return global_.storage.enable_history ? "true" : "false";
    else if (key == "storage.store_dir") return global_.storage.store_dir;
    else if (key == "storage.recent_scans_limit") return std::to_string(global_.storage.recent_scans_limit);
    else if (key == "storage.per_domain_history_limit") return std::to_string(global_.storage.per_domain_history_limit);
    else if (key == "server.http_host") return global_.server.http_host;
    else if (key == "server.http_port") return std::to_string(global_.server.http_port);
    else if (key == "server.rate_limit_requests") return std::to_string(global_.server.rate_limit_requests);
    else if (key == "server.rate_limit_window") return formatNumber(global_.server.rate_limit_window);
    else if (key == "server.trust_x_forwarded_for") return global_.server.trust_x_forwarded_for ? "true" : "false";
    else if (key == "server.rate_limit_max_keys") return std::to_string(global_.server.rate_limit_max_keys);
    else if (key == "server.event_queue_capacity") return std::to_string(global_.server.event_queue_capacity);
    else if (key == "logging.rotation_size_mb") return std::to_string(global_.logging.rotation_size_mb);
    else if (key == "logging.max_files") return std::to_string(global_.logging.max_files);
    else if (key == "logging.format") return global_.logging.format == LogFormat::JSON ? "json" : "text";

    return std::nullopt;
}

std::vector<std::string> Config::knownKeys() {
    return {
        "data_dir", "log_file", "log_level",
        "discovery.crtsh_url", "discovery.crtsh_timeout", "discovery.crtsh_user_agent",
        "discovery.bruteforce_words", "discovery.extra_wordlist", "discovery.seclists_wordlist",
        "discovery.seclists_min_words",
        "resolver.massdns_bin", "resolver.resolvers_file", "resolver.batch_size",
        "resolver.concurrency", "resolver.timeout",
        "probe.http_timeout", "probe.concurrency", "probe.https_port", "probe.http_port",
        "storage.enable_history", "storage.store_dir", "storage.recent_scans_limit",
        "storage.per_domain_history_limit",
        "server.http_host", "server.http_port", "server.rate_limit_requests",
        "server.rate_limit_window", "server.trust_x_forwarded_for", "server.rate_limit_max_keys",
        "server.event_queue_capacity",
        "logging.rotation_size_mb", "logging.max_files", "logging.format"
    };
}

std::string Config::getConfigPath() const {
    if (!current_config_path_.empty()) {
        return current_config_path_;
    }
    return PathManager::instance().getConfigFile();
}

}}
