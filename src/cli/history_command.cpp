#include "history_command.hpp"
#include "subscout/common/config.hpp"
#include "subscout/common/constants.hpp"
#include "subscout/common/hostname.hpp"
#include "subscout/common/logger.hpp"
#include "subscout/format/json_formatter.hpp"
#include "subscout/storage/json_scan_store.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>

namespace subscout {
namespace cli {

namespace {

std::unique_ptr<storage::ScanStore> openStore() {
    auto& config = common::Config::instance().global();

    if (!config.storage.enable_history) {
        std::cerr << "Scan history is disabled (storage.enable_history = false)\n";
        return nullptr;
    }

    return std::make_unique<storage::JsonScanStore>(config.storage.store_dir,
                                                    storage::runIndexCapacity(config.storage));
}

void printRuns(const std::vector<common::ScanRun>& runs) {
    std::cout << std::left
              << std::setw(8) << "ID" << " "
              << std::setw(32) << "DOMAIN" << " "
              << std::setw(22) << "TIMESTAMP" << " "
              << std::setw(8) << "TOTAL" << " "
              << "DURATION\n";

    for (const auto& run : runs) {
        std::cout << std::setw(8) << run.id << " "
                  << std::setw(32) << run.domain << " "
                  << std::setw(22) << common::formatIsoTime(run.completed_at.value_or(run.started_at)) << " "
                  << std::setw(8) << run.total << " "
                  << (run.duration_ms ? std::to_string(*run.duration_ms) + " ms" : "-") << "\n";
    }
}

}

HistoryCommand::HistoryCommand() = default;

void HistoryCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    subcommand->add_option("domain", domain_, "Domain to inspect")->required();
    subcommand->add_option("-n,--limit", limit_, "Number of runs to list (default: storage.per_domain_history_limit)")
        ->check(CLI::NonNegativeNumber);
    subcommand->add_flag("--json", json_output_, "Print as JSON");
}

bool HistoryCommand::wasCalled() const {
    return subcommand_ && subcommand_->parsed();
}

int HistoryCommand::execute() {
    auto normalized = common::sanitizeDomain(domain_);
    if (!normalized) {
        std::cerr << "Invalid domain: " << domain_ << "\n";
        return 1;
    }

    try {
        auto store = openStore();
        if (!store) {
            return 1;
        }

        auto& config = common::Config::instance().global();
        int limit = limit_ > 0 ? limit_ : config.storage.per_domain_history_limit;

        auto snapshot = store->loadSnapshot(*normalized);
        auto runs = store->runsForDomain(*normalized, static_cast<size_t>(std::max(0, limit)));

        if (json_output_) {
            nlohmann::json output;
            output["domain"] = *normalized;
            output["cached"] = snapshot.meta ? nlohmann::json(common::formatIsoTime(snapshot.meta->cached_at))
                                             : nlohmann::json(nullptr);
            output["total"] = snapshot.meta ? snapshot.meta->total_unique : snapshot.entries.size();
            output["results"] = nlohmann::json::array();
            for (const auto& entry : snapshot.entries) {
                output["results"].push_back(format::JsonFormatter::formatEntry(entry));
            }
            output["runs"] = nlohmann::json::array();
            for (const auto& run : runs) {
                output["runs"].push_back(format::JsonFormatter::formatRun(run));
            }
            std::cout << output.dump(2) << std::endl;
            return 0;
        }

        if (snapshot.entries.empty()) {
            std::cout << "No stored results for " << *normalized << "\n";
            return 0;
        }

        std::cout << "Domain:  " << *normalized << "\n";
        if (snapshot.meta) {
            std::cout << "Cached:  " << common::formatIsoTime(snapshot.meta->cached_at) << "\n";
        }
        std::cout << "Entries: " << snapshot.entries.size() << "\n\n";

        for (const auto& entry : snapshot.entries) {
            std::cout << std::left << std::setw(40) << entry.name << " "
                      << std::setw(4) << (entry.http_status ? std::to_string(*entry.http_status) : "-") << " "
                      << (entry.tls ? "tls" : "-") << "\n";
        }

        if (!runs.empty()) {
            std::cout << "\nRuns:\n";
            printRuns(runs);
        }
        return 0;

    } catch (const storage::StorageError& e) {
        common::Logger::instance().error("[History] Store error | code={} | error={}",
                                        core::CoreErrorCodeHelper::toString(e.code()), e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

RecentCommand::RecentCommand() = default;

void RecentCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    subcommand->add_option("-n,--limit", limit_, "Number of scans to list (1-100)")
        ->check(CLI::Range(1, constants::limits::MAX_RECENT_QUERY_LIMIT));
    subcommand->add_flag("--json", json_output_, "Print as JSON");
}

bool RecentCommand::wasCalled() const {
    return subcommand_ && subcommand_->parsed();
}

int RecentCommand::execute() {
    try {
        auto store = openStore();
        if (!store) {
            return 1;
        }

        auto& config = common::Config::instance().global();
        int limit = std::min(limit_, std::max(0, config.storage.recent_scans_limit));
        auto runs = store->recentRuns(static_cast<size_t>(limit));

        if (json_output_) {
            nlohmann::json output;
            output["recent"] = nlohmann::json::array();
            for (const auto& run : runs) {
                output["recent"].push_back(format::JsonFormatter::formatRun(run));
            }
            std::cout << output.dump(2) << std::endl;
            return 0;
        }

        if (runs.empty()) {
            std::cout << "No completed scans\n";
            return 0;
        }

        printRuns(runs);
        return 0;

    } catch (const storage::StorageError& e) {
        common::Logger::instance().error("[Recent] Store error | code={} | error={}",
                                        core::CoreErrorCodeHelper::toString(e.code()), e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}}
