#pragma once

#include "config.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <memory>
#include <string>
#include <vector>

namespace subscout {
namespace common {

enum class LogMode {
    CONSOLE_ONLY,
    FILE_ONLY
};

class Logger {
public:
    static Logger& instance();

    void initialize(LogMode mode, const std::string& log_file, LogLevel level, const LoggingConfig& logging_config);
    void shutdown();

    template<typename... Args>
    void error(const std::string& format, Args&&... args) {
        if (logger_) logger_->error(fmt::runtime(format), std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(const std::string& format, Args&&... args) {
        if (logger_) logger_->warn(fmt::runtime(format), std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const std::string& format, Args&&... args) {
        if (logger_) logger_->info(fmt::runtime(format), std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(const std::string& format, Args&&... args) {
        if (logger_) logger_->debug(fmt::runtime(format), std::forward<Args>(args)...);
    }

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> logger_;
    bool initialized_ = false;

    void install(std::vector<spdlog::sink_ptr> sinks, spdlog::level::level_enum level, LogFormat format);
};

}}
