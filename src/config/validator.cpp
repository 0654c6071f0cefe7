#include "subscout/config/validator.hpp"
#include "subscout/common/logger.hpp"
#include "subscout/resolve/resolver.hpp"
#include <filesystem>
#include <regex>

namespace subscout {
namespace config {

ValidationResult ConfigValidator::validate(const common::GlobalConfig& config) {
    ValidationResult result;

    auto fail = [&result](const std::string& message) {
        result.errors.push_back(message);
        result.is_valid = false;
    };

    common::Logger::instance().debug("[Validator] Starting validation");

    if (!validatePath(config.data_dir)) {
        fail("data_dir: Invalid or inaccessible path");
    }

    if (!config.log_file.empty() &&
        !canCreateDirectory(std::filesystem::path(config.log_file).parent_path().string())) {
        fail("log_file: Cannot create parent directory");
    }

    if (!validateUrl(config.discovery.crtsh_url)) {
        fail("discovery.crtsh_url: Must be an http(s) URL");
    }

    if (config.discovery.crtsh_timeout <= 0 || config.discovery.crtsh_timeout > 600) {
        fail("discovery.crtsh_timeout: Must be between 1-600 seconds");
    }

    if (config.discovery.seclists_min_words < 0) {
        fail("discovery.seclists_min_words: Must be >= 0");
    }

    for (const auto& path : {config.discovery.extra_wordlist, config.discovery.seclists_wordlist}) {
        if (!path.empty() && !std::filesystem::is_regular_file(path)) {
            result.warnings.push_back("Wordlist not found, it will be skipped: " + path);
        }
    }

    if (config.resolver.batch_size < 1) {
        fail("resolver.batch_size: Must be >= 1");
    }

    if (config.resolver.concurrency < 1) {
        fail("resolver.concurrency: Must be >= 1");
    }

    if (config.resolver.timeout <= 0 || config.resolver.timeout > 120) {
        fail("resolver.timeout: Must be between 1-120 seconds");
    }

    if (!config.resolver.massdns_bin.empty() &&
        resolve::findBatchResolverBinary(config.resolver.massdns_bin) != config.resolver.massdns_bin) {
        result.warnings.push_back(
            "resolver.massdns_bin: Not an executable file: " + config.resolver.massdns_bin + "\n"
            "  The default locations and PATH will be searched instead."
        );
    }

    if (!std::filesystem::is_regular_file(config.resolver.resolvers_file) &&
        resolve::findBatchResolverBinary(config.resolver.massdns_bin)) {
        result.warnings.push_back(
            "resolver.resolvers_file: Not found: " + config.resolver.resolvers_file + "\n"
            "  Batch resolution is disabled until a resolver list is provided."
        );
    }

    if (config.probe.http_timeout <= 0.0) {
        fail("probe.http_timeout: Must be > 0");
    }

    if (config.probe.concurrency < 1) {
        fail("probe.concurrency: Must be >= 1");
    }

    if (!validatePort(config.probe.https_port)) {
        fail("probe.https_port: Invalid port number");
    }

    if (!validatePort(config.probe.http_port)) {
        fail("probe.http_port: Invalid port number");
    }

    if (config.storage.enable_history && !validatePath(config.storage.store_dir)) {
        fail("storage.store_dir: Invalid or inaccessible path");
    }

    if (config.storage.recent_scans_limit < 1) {
        fail("storage.recent_scans_limit: Must be >= 1");
    }

    if (config.storage.per_domain_history_limit < 1) {
        fail("storage.per_domain_history_limit: Must be >= 1");
    }

    if (!validatePort(config.server.http_port)) {
        fail("server.http_port: Invalid port number");
    } else if (config.server.http_port < 1024) {
        result.warnings.push_back("server.http_port: Privileged port, binding may require root");
    }

    if (config.server.rate_limit_requests < 0) {
        fail("server.rate_limit_requests: Must be >= 0 (0=disabled)");
    }

    if (config.server.rate_limit_window < 1.0) {
        fail("server.rate_limit_window: Must be >= 1 second");
    }

    if (config.server.rate_limit_max_keys < 1) {
        fail("server.rate_limit_max_keys: Must be >= 1");
    }

    if (config.server.event_queue_capacity < 1) {
        fail("server.event_queue_capacity: Must be >= 1");
    }

    if (config.logging.rotation_size_mb < 1) {
        fail("logging.rotation_size_mb: Must be >= 1");
    }

    if (config.logging.max_files < 1) {
        fail("logging.max_files: Must be >= 1");
    }

    if (result.is_valid) {
        common::Logger::instance().info("[Validator] Passed | warnings={}", result.warnings.size());
    } else {
        common::Logger::instance().error("[Validator] Failed | errors={}", result.errors.size());
    }

    return result;
}

ValidationResult ConfigValidator::validateFile(const std::string& path) {
    ValidationResult result;

    if (!std::filesystem::exists(path)) {
        result.errors.push_back("Configuration file does not exist");
        result.is_valid = false;
        common::Logger::instance().error("[Validator] File not found | path={}", path);
        return result;
    }

    try {
        auto& config = common::Config::instance();
        if (!config.load(path)) {
            result.errors.push_back("Failed to parse configuration file");
            result.is_valid = false;
            common::Logger::instance().error("[Validator] Parse failed | path={}", path);
            return result;
        }

        return validate(config.global());
    } catch (const std::exception& e) {
        result.errors.push_back(std::string("Exception: ") + e.what());
        result.is_valid = false;
        common::Logger::instance().error("[Validator] Exception | path={} | error={}", path, e.what());
        return result;
    }
}

bool ConfigValidator::validatePath(const std::string& path) {
    if (path.empty()) return false;

    std::filesystem::path p(path);

    if (std::filesystem::exists(p)) {
        return std::filesystem::is_directory(p);
    }

    return canCreateDirectory(path);
}

bool ConfigValidator::validatePort(uint16_t port) {
    return port >= 1;
}

bool ConfigValidator::validateUrl(const std::string& url) {
    std::regex url_pattern(R"(^https?://[a-zA-Z0-9\-\.]+(\:[0-9]+)?(/.*)?$)");
    return std::regex_match(url, url_pattern);
}

bool ConfigValidator::canCreateDirectory(const std::string& path) {
    try {
        std::filesystem::path p(path);

        if (std::filesystem::exists(p)) {
            return std::filesystem::is_directory(p);
        }

        auto parent = p.parent_path();
        if (parent.empty() || parent == p) return true;

        if (std::filesystem::exists(parent)) {
            auto perms = std::filesystem::status(parent).permissions();
            return (perms & std::filesystem::perms::owner_write) != std::filesystem::perms::none;
        }

        return canCreateDirectory(parent.string());
    } catch (const std::filesystem::filesystem_error& e) {
        common::Logger::instance().debug("[Validator] Directory check failed | path={} | error={}", path, e.what());
        return false;
    }
}

}}
