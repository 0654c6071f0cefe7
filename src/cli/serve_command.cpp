#include "serve_command.hpp"
#include "subscout/common/config.hpp"
#include "subscout/common/logger.hpp"
#include "subscout/config/validator.hpp"
#include "subscout/daemon/http_server.hpp"
#include "subscout/pipeline/search_pipeline.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace subscout {
namespace cli {

std::atomic<bool> ServeCommand::stop_requested_{false};

ServeCommand::ServeCommand() = default;

void ServeCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    subcommand->add_option("--host", host_, "Listen address (default: server.http_host)");
    subcommand->add_option("-p,--port", port_, "Listen port (default: server.http_port)")
        ->check(CLI::Range(0, 65535));
    subcommand->add_flag("--check-config", check_config_, "Validate configuration and exit");
}

bool ServeCommand::wasCalled() const {
    return subcommand_ && subcommand_->parsed();
}

void ServeCommand::signalHandlerStatic(int) {
    stop_requested_ = true;
}

int ServeCommand::execute() {
    auto& config = common::Config::instance().global();

    config::ConfigValidator validator;
    auto validation = validator.validate(config);

    for (const auto& warning : validation.warnings) {
        common::Logger::instance().warn("[Serve] Config warning | {}", warning);
    }

    if (check_config_) {
        for (const auto& error : validation.errors) {
            std::cerr << "  ERROR: " << error << "\n";
        }
        std::cout << (validation.is_valid ? "Configuration is valid.\n" : "Configuration has errors.\n");
        return validation.is_valid ? 0 : 1;
    }

    if (!validation.is_valid) {
        for (const auto& error : validation.errors) {
            common::Logger::instance().error("[Serve] Config error | {}", error);
            std::cerr << "Configuration error: " << error << "\n";
        }
        return 1;
    }

    std::string host = host_.empty() ? config.server.http_host : host_;
    uint16_t port = port_ >= 0 ? static_cast<uint16_t>(port_) : config.server.http_port;

    try {
        auto services = pipeline::buildPipelineServices(config);
        daemon::HttpApiServer server(host, port, std::move(services), config);

        signal(SIGINT, &ServeCommand::signalHandlerStatic);
        signal(SIGTERM, &ServeCommand::signalHandlerStatic);
        signal(SIGPIPE, SIG_IGN);

        if (!server.start()) {
            common::Logger::instance().error("[Serve] Failed to start | host={} | port={}", host, port);
            std::cerr << "Failed to start HTTP server on " << host << ":" << port << "\n";
            return 1;
        }

        std::cout << "Listening on http://" << host << ":" << server.boundPort() << std::endl;
        common::Logger::instance().info("[Serve] Started | host={} | port={}", host, server.boundPort());

        while (!stop_requested_ && server.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        common::Logger::instance().info("[Serve] Shutting down");
        server.stop();
        common::Logger::instance().info("[Serve] Shutdown complete");
        common::Logger::instance().shutdown();
        return 0;

    } catch (const std::exception& e) {
        common::Logger::instance().error("[Serve] Error | error={}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}}
