#include "subscout/resolve/resolver.hpp"
#include "subscout/resolve/batch_resolver.hpp"
#include "subscout/resolve/concurrent_resolver.hpp"
#include "subscout/common/constants.hpp"
#include "subscout/common/hostname.hpp"
#include "subscout/common/logger.hpp"
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <set>
#include <sstream>

namespace subscout {
namespace resolve {

namespace {

std::string stripTrailingDot(std::string value) {
    while (!value.empty() && value.back() == '.') {
        value.pop_back();
    }
    return value;
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

bool isExecutableFile(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

}

std::map<std::string, common::ResolvedRecord> parseBatchOutput(const std::string& output) {
    std::map<std::string, std::set<std::string>> addresses;
    std::map<std::string, common::ResolvedRecord> records;

    std::istringstream stream(output);
    std::string line;

    while (std::getline(stream, line)) {
        std::istringstream fields(line);
        std::string name, type, value;
        if (!(fields >> name >> type >> value)) {
            continue;
        }

        name = common::toLower(stripTrailingDot(name));
        if (name.empty()) {
            continue;
        }
        type = toUpper(type);
        value = stripTrailingDot(value);

        auto& record = records[name];
        record.name = name;

        if (type == "A" || type == "AAAA") {
            addresses[name].insert(value);
        } else if (type == "CNAME") {
            record.cname = common::toLower(value);
        }
    }

    for (auto& [name, record] : records) {
        auto it = addresses.find(name);
        if (it != addresses.end()) {
            record.ips.assign(it->second.begin(), it->second.end());
        }
    }

    return records;
}

std::optional<std::string> findBatchResolverBinary(const std::string& configured) {
    if (!configured.empty() && isExecutableFile(configured)) {
        return configured;
    }

    if (isExecutableFile(constants::resolver::FALLBACK_BINARY_PATH)) {
        return std::string(constants::resolver::FALLBACK_BINARY_PATH);
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) {
        return std::nullopt;
    }

    std::istringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        auto candidate = (std::filesystem::path(dir) / constants::resolver::BINARY_NAME).string();
        if (isExecutableFile(candidate)) {
            return candidate;
        }
    }

    return std::nullopt;
}

std::unique_ptr<ResolverBackend> selectResolverBackend(const ResolverOptions& options,
                                                       std::shared_ptr<dns::DnsClient> dns) {
    auto binary = findBatchResolverBinary(options.massdns_bin);

    if (binary) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(options.resolvers_file, ec)) {
            common::Logger::instance().debug("[Resolver] Using batch backend | binary={} | resolvers={}",
                                            *binary, options.resolvers_file);
            auto fallback = std::make_shared<ConcurrentResolver>(dns, options.concurrency);
            return std::make_unique<BatchResolver>(*binary, options.resolvers_file,
                                                   options.batch_size, fallback);
        }
        common::Logger::instance().warn("[Resolver] Resolver list missing, using system DNS | path={}",
                                       options.resolvers_file);
    } else {
        common::Logger::instance().debug("[Resolver] Batch resolver binary not found, using system DNS");
    }

    return std::make_unique<ConcurrentResolver>(dns, options.concurrency);
}

}}
