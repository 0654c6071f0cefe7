#include "subscout/resolve/batch_resolver.hpp"
#include "subscout/common/constants.hpp"
#include "subscout/common/hostname.hpp"
#include "subscout/common/logger.hpp"
#include "subscout/common/subprocess.hpp"
#include "subscout/core/error_codes.hpp"
#include <cerrno>
#include <cstring>
#include <unordered_set>

namespace subscout {
namespace resolve {

BatchResolver::BatchResolver(std::string binary,
                             std::string resolvers_file,
                             int batch_size,
                             std::shared_ptr<ResolverBackend> fallback)
    : binary_(std::move(binary)),
      resolvers_file_(std::move(resolvers_file)),
      batch_size_(batch_size),
      fallback_(std::move(fallback)) {}

std::string BatchResolver::name() const {
    return constants::resolver::BATCH_BACKEND_NAME;
}

void BatchResolver::resolve(const std::vector<std::string>& candidates, const RecordCallback& on_record) {
    auto batches = common::chunked(candidates, batch_size_);
    auto& logger = common::Logger::instance();

    for (size_t index = 0; index < batches.size(); ++index) {
        const auto& batch = batches[index];

        std::string input;
        std::unordered_set<std::string> submitted;
        for (const auto& name : batch) {
            input += name;
            input += ".\n";
            submitted.insert(common::toLower(name));
        }

        auto result = common::runProcess(
            {binary_, "-r", resolvers_file_, "-o", "S", "-w", "-"}, input);

        if (!result.spawned) {
            common::ErrorContext ctx{"BatchResolver", {
                {"binary", binary_},
                {"errno", std::strerror(result.spawn_errno)}
            }};
            logger.warn("[BatchResolver] {} | {}",
                       core::CoreErrorCodeHelper::getMessage(
                           result.spawn_errno == ENOENT ? core::CoreErrorCode::RESOLVER_BINARY_MISSING
                                                        : core::CoreErrorCode::RESOLVER_SPAWN_FAILED),
                       common::formatContext(ctx));

            if (!fallback_) {
                return;
            }

            std::vector<std::string> remaining;
            for (size_t rest = index; rest < batches.size(); ++rest) {
                remaining.insert(remaining.end(), batches[rest].begin(), batches[rest].end());
            }
            logger.info("[BatchResolver] Falling back | backend={} | remaining={}",
                       fallback_->name(), remaining.size());
            fallback_->resolve(remaining, on_record);
            return;
        }

        if (result.exit_code != 0) {
            logger.warn("[BatchResolver] {} | batch={} | exit_code={} | stderr={}",
                       core::CoreErrorCodeHelper::getMessage(core::CoreErrorCode::RESOLVER_BATCH_FAILED),
                       index, result.exit_code, common::trim(result.stderr_data));
            continue;
        }

        auto records = parseBatchOutput(result.stdout_data);
        logger.debug("[BatchResolver] Batch done | batch={} | size={} | answered={}",
                    index, batch.size(), records.size());

        // The answer section also lists CNAME targets as records of their own.
        size_t skipped = 0;
        for (auto& [name, record] : records) {
            if (submitted.count(name) == 0) {
                ++skipped;
                continue;
            }
            if (record.hasAnswer()) {
                on_record(std::move(record));
            }
        }
        if (skipped > 0) {
            logger.debug("[BatchResolver] Ignored records outside batch | batch={} | count={}", index, skipped);
        }
    }
}

}}
