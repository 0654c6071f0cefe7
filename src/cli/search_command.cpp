#include "search_command.hpp"
#include "subscout/common/config.hpp"
#include "subscout/common/logger.hpp"
#include "subscout/format/json_formatter.hpp"
#include "subscout/pipeline/search_pipeline.hpp"
#include <iostream>
#include <iomanip>
#include <stdexcept>

namespace subscout {
namespace cli {

SearchCommand::SearchCommand() = default;

void SearchCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    subcommand->add_option("domain", domain_, "Domain to enumerate")->required();
    subcommand->add_flag("-r,--refresh", refresh_, "Run a fresh pass even if cached results exist");
    subcommand->add_flag("--json", json_output_, "Print one JSON event per line");
}

bool SearchCommand::wasCalled() const {
    return subcommand_ && subcommand_->parsed();
}

void SearchCommand::printEvent(const common::SearchEvent& event) const {
    if (json_output_) {
        std::cout << format::JsonFormatter::formatEvent(event).dump() << std::endl;
        return;
    }

    switch (event.stage) {
        case common::EventStage::CACHE_HIT:
            std::cout << "Cached results: " << event.count << "\n";
            break;

        case common::EventStage::STARTED:
            std::cout << "Scanning " << event.domain << "...\n";
            break;

        case common::EventStage::CRT_SH_FOUND:
            std::cout << "Candidates: " << event.count << "\n";
            break;

        case common::EventStage::RESOLVING:
            std::cout << "Resolving " << event.count << " candidates via " << event.resolver << "\n\n";
            break;

        case common::EventStage::ENTRY:
            if (event.entry) {
                const auto& entry = *event.entry;
                std::string ips;
                for (const auto& ip : entry.ips) {
                    if (!ips.empty()) ips += ",";
                    ips += ip;
                }
                std::cout << std::left << std::setw(40) << entry.name << " "
                          << std::setw(4) << (entry.http_status ? std::to_string(*entry.http_status) : "-") << " "
                          << std::setw(4) << (entry.tls ? "tls" : "-") << " "
                          << ips;
                if (entry.cname && !entry.cname->empty()) {
                    std::cout << " -> " << *entry.cname;
                }
                if (!entry.server.empty()) {
                    std::cout << " [" << entry.server << "]";
                }
                std::cout << std::endl;
            }
            break;

        case common::EventStage::DONE:
            std::cout << "\nDone: " << event.count << " unique subdomains";
            if (event.duration_ms) {
                std::cout << " in " << *event.duration_ms << " ms";
            }
            if (event.cached_at) {
                std::cout << " (cached at " << common::formatIsoTime(*event.cached_at) << ")";
            }
            std::cout << "\n";
            break;

        case common::EventStage::ERROR:
            std::cerr << "\033[31mError:\033[0m " << event.error << "\n";
            break;
    }
}

int SearchCommand::execute() {
    auto& config = common::Config::instance().global();
    auto services = pipeline::buildPipelineServices(config);

    try {
        services.pipeline->search(domain_, refresh_, [this](const common::SearchEvent& event) {
            printEvent(event);
        });
        return 0;

    } catch (const std::invalid_argument&) {
        std::cerr << "Invalid domain: " << domain_ << "\n";
        return 1;
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Search] Pass failed | domain={} | error={}", domain_, e.what());

        common::SearchEvent event;
        event.stage = common::EventStage::ERROR;
        event.domain = domain_;
        event.error = e.what();
        printEvent(event);
        return 1;
    }
}

}}
