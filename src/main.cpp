#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

#include "subscout/common/config.hpp"
#include "subscout/common/constants.hpp"
#include "subscout/common/logger.hpp"
#include "cli/main_command.hpp"
#include "cli/search_command.hpp"
#include "cli/probe_command.hpp"
#include "cli/history_command.hpp"
#include "cli/serve_command.hpp"
#include "cli/config_command.hpp"

std::string find_config_argument(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind("--config=", 0) == 0) {
            return arg.substr(9);
        }
    }
    return "";
}

bool is_serve_command(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "serve") {
            return true;
        }
    }
    return false;
}

int main(int argc, char** argv) {
    try {
        CLI::App app{subscout::constants::system::APPLICATION_NAME, "subscout"};
        app.set_version_flag("--version,-v", subscout::constants::version::getFullVersion());
        app.require_subcommand(0, 1);

        std::string config_file;
        app.add_option("-c,--config", config_file, "Configuration file path");

        auto& config = subscout::common::Config::instance();
        if (!config.load(find_config_argument(argc, argv))) {
            std::cerr << "Warning: configuration could not be parsed, using defaults ("
                      << config.getConfigPath() << ")\n";
        }

        if (is_serve_command(argc, argv)) {
            subscout::common::Logger::instance().initialize(
                subscout::common::LogMode::FILE_ONLY,
                config.global().log_file,
                config.global().log_level,
                config.global().logging
            );
        } else {
            subscout::common::Logger::instance().initialize(
                subscout::common::LogMode::CONSOLE_ONLY,
                "",
                config.global().log_level,
                config.global().logging
            );
        }

        auto search_cmd = std::make_unique<subscout::cli::SearchCommand>();
        auto probe_cmd = std::make_unique<subscout::cli::ProbeCommand>();
        auto history_cmd = std::make_unique<subscout::cli::HistoryCommand>();
        auto recent_cmd = std::make_unique<subscout::cli::RecentCommand>();
        auto serve_cmd = std::make_unique<subscout::cli::ServeCommand>();
        auto config_cmd = std::make_unique<subscout::cli::ConfigCommand>();

        search_cmd->setup(app.add_subcommand("search", "Discover and probe subdomains of a domain"));
        probe_cmd->setup(app.add_subcommand("probe", "Probe a single host"));
        history_cmd->setup(app.add_subcommand("history", "Show stored results for a domain"));
        recent_cmd->setup(app.add_subcommand("recent", "List recently completed scans"));
        serve_cmd->setup(app.add_subcommand("serve", "Run the HTTP API"));
        config_cmd->setup(app.add_subcommand("config", "Manage configuration"));

        CLI11_PARSE(app, argc, argv);

        if (search_cmd->wasCalled()) {
            return search_cmd->execute();
        } else if (probe_cmd->wasCalled()) {
            return probe_cmd->execute();
        } else if (history_cmd->wasCalled()) {
            return history_cmd->execute();
        } else if (recent_cmd->wasCalled()) {
            return recent_cmd->execute();
        } else if (serve_cmd->wasCalled()) {
            return serve_cmd->execute();
        } else if (config_cmd->wasCalled()) {
            return config_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
            return 0;
        }

    } catch (const CLI::ParseError& e) {
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
