#include "config_command.hpp"
#include "subscout/common/config.hpp"
#include "subscout/common/logger.hpp"
#include "subscout/common/paths.hpp"
#include "subscout/config/validator.hpp"
#include <iostream>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <unistd.h>

namespace subscout {
namespace cli {

ConfigCommand::ConfigCommand() : was_called_(false) {}

void ConfigCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    set_cmd_ = subcommand->add_subcommand("set", "Set configuration value");
    set_cmd_->add_option("key", set_key_, "Configuration key")->required();
    set_cmd_->add_option("value", set_value_, "Configuration value")->required();
    set_cmd_->callback([this]() { was_called_ = true; });

    get_cmd_ = subcommand->add_subcommand("get", "Get configuration value");
    get_cmd_->add_option("key", get_key_, "Configuration key (optional)");
    get_cmd_->callback([this]() { was_called_ = true; });

    show_cmd_ = subcommand->add_subcommand("show", "Show configuration file");
    show_cmd_->callback([this]() { was_called_ = true; });

    validate_cmd_ = subcommand->add_subcommand("validate", "Validate configuration");
    validate_cmd_->callback([this]() { was_called_ = true; });
}

bool ConfigCommand::wasCalled() const {
    return was_called_ || (subcommand_ && subcommand_->parsed());
}

int ConfigCommand::execute() {
    if (set_cmd_->parsed()) {
        return executeSet();
    } else if (get_cmd_->parsed()) {
        return executeGet();
    } else if (show_cmd_->parsed()) {
        return executeShow();
    } else if (validate_cmd_->parsed()) {
        return executeValidate();
    }

    std::cout << subcommand_->help() << std::endl;
    return 0;
}

int ConfigCommand::executeSet() {
    auto& config = common::Config::instance();
    std::string config_path = config.getConfigPath();

    if (!canWriteConfig(config_path)) {
        std::cerr << "\033[31mError: Permission denied\033[0m\n\n";
        std::cerr << "Resource: " << config_path << "\n\n";

        auto& path_manager = common::PathManager::instance();
        if (path_manager.isSystemMode()) {
            std::cerr << "\033[1mSystem-wide configuration requires root privileges.\033[0m\n";
            std::cerr << "Run with sudo:\n";
            std::cerr << "  \033[32msudo subscout config set " << set_key_
                      << " \"" << set_value_ << "\"\033[0m\n";
        } else {
            std::cerr << "Cannot write to configuration file.\n";
            std::cerr << "Check file permissions: ls -l " << config_path << "\n";
        }
        return 1;
    }

    try {
        config.setValue(set_key_, set_value_);
    } catch (const std::exception& e) {
        std::cerr << "\033[31mError:\033[0m " << e.what() << "\n";
        return 1;
    }

    config::ConfigValidator validator;
    auto result = validator.validate(config.global());
    if (!result.is_valid) {
        for (const auto& error : result.errors) {
            std::cerr << "  ERROR: " << error << "\n";
        }
        std::cerr << "Configuration not saved.\n";
        return 1;
    }

    if (config.save()) {
        std::cout << "✓ Configuration updated: " << set_key_ << " = " << set_value_ << "\n";
        common::Logger::instance().info("[Config] Value updated | key={} | path={}", set_key_, config_path);
        return 0;
    }

    std::cerr << "Failed to save configuration.\n";
    return 1;
}

int ConfigCommand::executeGet() {
    auto& config = common::Config::instance();

    if (get_key_.empty()) {
        std::cout << "Configuration:\n";
        for (const auto& key : common::Config::knownKeys()) {
            auto value = config.getValue(key);
            std::cout << "  " << key << " = " << value.value_or("") << "\n";
        }
        return 0;
    }

    auto value = config.getValue(get_key_);
    if (!value) {
        std::cerr << "Unknown configuration key: " << get_key_ << "\n";
        return 1;
    }

    std::cout << *value << "\n";
    return 0;
}

int ConfigCommand::executeShow() {
    auto& config = common::Config::instance();
    std::string config_path = config.getConfigPath();

    if (!config.exists()) {
        std::cerr << "Configuration file does not exist.\n";
        std::cerr << "Expected: " << config_path << "\n";
        std::cerr << "Built-in defaults are in effect. Create it with: subscout config set <key> <value>\n";
        return 1;
    }

    std::cout << "Configuration file: " << config_path << "\n\n";

    std::ifstream file(config_path);
    if (!file) {
        std::cerr << "Failed to read configuration file.\n";
        return 1;
    }

    std::string line;
    while (std::getline(file, line)) {
        std::cout << line << "\n";
    }

    return 0;
}

int ConfigCommand::executeValidate() {
    auto& config = common::Config::instance();
    std::string config_path = config.getConfigPath();

    config::ConfigValidator validator;
    config::ValidationResult result;

    if (config.exists()) {
        std::cout << "Validating: " << config_path << "\n\n";
        result = validator.validateFile(config_path);
    } else {
        std::cout << "Validating built-in defaults (no file at " << config_path << ")\n\n";
        result = validator.validate(config.global());
    }

    for (const auto& error : result.errors) {
        std::cout << "  ERROR: " << error << "\n";
    }

    for (const auto& warning : result.warnings) {
        std::cout << "  WARNING: " << warning << "\n";
    }

    std::cout << "\nErrors: " << result.errors.size()
              << "  Warnings: " << result.warnings.size() << "\n";

    if (result.is_valid) {
        std::cout << "\nConfiguration is valid.\n";
        return 0;
    }

    std::cout << "\nConfiguration has errors.\n";
    return 1;
}

bool ConfigCommand::canWriteConfig(const std::string& config_path) {
    if (std::filesystem::exists(config_path)) {
        return access(config_path.c_str(), W_OK) == 0;
    }

    std::filesystem::path parent = std::filesystem::path(config_path).parent_path();
    if (!std::filesystem::exists(parent)) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return false;
        }
    }
    return access(parent.c_str(), W_OK) == 0;
}

}}
