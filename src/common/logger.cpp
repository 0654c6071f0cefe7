#include "subscout/common/logger.hpp"
#include "subscout/common/constants.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace subscout {
namespace common {

namespace {

constexpr const char* TEXT_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";
constexpr const char* JSON_PATTERN = R"({"timestamp":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","message":"%v"})";

// Containers collect stderr, so file logging is skipped there.
bool runningInContainer() {
    return std::getenv(constants::system::CONTAINER_ENV) != nullptr ||
           std::getenv("KUBERNETES_SERVICE_HOST") != nullptr ||
           std::filesystem::exists("/.dockerenv");
}

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::DEBUG: return spdlog::level::debug;
    }
    return spdlog::level::info;
}

spdlog::sink_ptr consoleSink(spdlog::level::level_enum level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_level(level);
    return sink;
}

// subscout.log becomes subscout.json.log for JSON output.
std::string logFilePath(const std::string& base_path, LogFormat format) {
    if (format != LogFormat::JSON) {
        return base_path;
    }
    std::filesystem::path path(base_path);
    auto extension = path.extension().string();
    path.replace_extension(".json" + extension);
    return path.string();
}

// Returns nullptr when the file cannot be opened; the caller falls back to stderr.
spdlog::sink_ptr rotatingFileSink(const std::string& log_file,
                                  spdlog::level::level_enum level,
                                  const LoggingConfig& logging_config) {
    auto log_dir = std::filesystem::path(log_file).parent_path();
    std::error_code ec;
    if (!log_dir.empty() && !std::filesystem::exists(log_dir, ec) &&
        !std::filesystem::create_directories(log_dir, ec)) {
        std::cerr << "[Logger] Cannot create log directory " << log_dir << ": " << ec.message()
                  << ", logging to stderr" << std::endl;
        return nullptr;
    }

    try {
        auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFilePath(log_file, logging_config.format),
            logging_config.rotation_size_mb * 1024 * 1024,
            logging_config.max_files);
        sink->set_level(level);
        return sink;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "[Logger] Cannot open log file " << log_file << ": " << ex.what()
                  << ", logging to stderr" << std::endl;
        return nullptr;
    }
}

}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(LogMode mode, const std::string& log_file, LogLevel level, const LoggingConfig& logging_config) {
    if (initialized_) {
        if (logger_) {
            logger_->warn("[Logger] Already initialized, ignoring duplicate initialization");
        }
        return;
    }

    auto spdlog_level = toSpdlogLevel(level);
    bool to_file = mode == LogMode::FILE_ONLY && !log_file.empty() && !runningInContainer();

    spdlog::sink_ptr sink;
    if (to_file) {
        sink = rotatingFileSink(log_file, spdlog_level, logging_config);
        to_file = sink != nullptr;
    }
    if (!sink) {
        sink = consoleSink(spdlog_level);
    }

    try {
        install({sink}, spdlog_level, logging_config.format);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "[Logger] Initialization failed: " << ex.what() << std::endl;
        install({consoleSink(spdlog_level)}, spdlog_level, LogFormat::TEXT);
        to_file = false;
    }

    if (to_file) {
        logger_->flush_on(spdlog::level::info);
        spdlog::flush_every(std::chrono::seconds(3));
    }
}

void Logger::install(std::vector<spdlog::sink_ptr> sinks, spdlog::level::level_enum level, LogFormat format) {
    spdlog::drop(constants::system::LOGGER_NAME);

    logger_ = std::make_shared<spdlog::logger>(constants::system::LOGGER_NAME, sinks.begin(), sinks.end());
    logger_->set_pattern(format == LogFormat::JSON ? JSON_PATTERN : TEXT_PATTERN);
    logger_->set_level(level);
    spdlog::register_logger(logger_);
    initialized_ = true;
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(constants::system::LOGGER_NAME);
        logger_.reset();
    }
    spdlog::shutdown();
    initialized_ = false;
}

}}
