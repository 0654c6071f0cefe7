#include "probe_command.hpp"
#include "subscout/common/config.hpp"
#include "subscout/common/logger.hpp"
#include "subscout/format/json_formatter.hpp"
#include "subscout/pipeline/search_pipeline.hpp"
#include <iostream>
#include <stdexcept>

namespace subscout {
namespace cli {

ProbeCommand::ProbeCommand() = default;

void ProbeCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    subcommand->add_option("host", host_, "Hostname to probe")->required();
    subcommand->add_flag("--json", json_output_, "Print the result as JSON");
}

bool ProbeCommand::wasCalled() const {
    return subcommand_ && subcommand_->parsed();
}

int ProbeCommand::execute() {
    auto& config = common::Config::instance().global();
    auto services = pipeline::buildPipelineServices(config);

    try {
        auto entry = services.prober->probe(host_);

        if (json_output_) {
            std::cout << format::JsonFormatter::formatProbeResult(entry).dump(2) << std::endl;
            return 0;
        }

        std::cout << "Host:        " << entry.name << "\n";
        std::cout << "Addresses:   ";
        if (entry.ips.empty()) {
            std::cout << "(none)";
        }
        for (size_t i = 0; i < entry.ips.size(); ++i) {
            std::cout << (i ? ", " : "") << entry.ips[i];
        }
        std::cout << "\n";
        std::cout << "CNAME:       " << entry.cname.value_or("(none)") << "\n";
        std::cout << "HTTP status: " << (entry.http_status ? std::to_string(*entry.http_status) : "(no response)") << "\n";
        std::cout << "TLS:         " << (entry.tls ? "yes" : "no") << "\n";
        std::cout << "Server:      " << (entry.server.empty() ? "(unknown)" : entry.server) << "\n";
        return 0;

    } catch (const std::invalid_argument&) {
        std::cerr << "Invalid host: " << host_ << "\n";
        return 1;
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Probe] Failed | host={} | error={}", host_, e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}}
