#include <gtest/gtest.h>
#include "subscout/common/logger.hpp"
#include "test_support.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace subscout;
using subscout::test::TempDir;

namespace {

bool insideContainer() {
    return std::getenv("SUBSCOUT_CONTAINER") || std::getenv("KUBERNETES_SERVICE_HOST") ||
           std::filesystem::exists("/.dockerenv");
}

std::string readFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}

TEST(LoggerTest, JsonFileLogGetsJsonSuffix) {
    if (insideContainer()) {
        GTEST_SKIP() << "file logging is replaced by stderr inside containers";
    }

    TempDir dir("subscout_logger");
    auto log_file = (dir.path() / "logs" / "subscout.log").string();

    common::LoggingConfig logging;
    logging.rotation_size_mb = 1;
    logging.max_files = 1;
    logging.format = common::LogFormat::JSON;

    auto& logger = common::Logger::instance();
    logger.initialize(common::LogMode::FILE_ONLY, log_file, common::LogLevel::INFO, logging);
    logger.info("[Test] Written | key={}", "value");
    logger.debug("[Test] Hidden");
    logger.shutdown();

    auto json_log = dir.path() / "logs" / "subscout.json.log";
    ASSERT_TRUE(std::filesystem::exists(json_log));
    EXPECT_FALSE(std::filesystem::exists(log_file));

    auto content = readFile(json_log);
    EXPECT_NE(content.find("\"level\":\"info\""), std::string::npos);
    EXPECT_NE(content.find("[Test] Written | key=value"), std::string::npos);
    EXPECT_EQ(content.find("[Test] Hidden"), std::string::npos);
}

TEST(LoggerTest, ConsoleModeWritesNoFile) {
    TempDir dir("subscout_logger");
    auto log_file = (dir.path() / "subscout.log").string();

    common::LoggingConfig logging;
    logging.rotation_size_mb = 1;
    logging.max_files = 1;
    logging.format = common::LogFormat::TEXT;

    auto& logger = common::Logger::instance();
    logger.initialize(common::LogMode::CONSOLE_ONLY, log_file, common::LogLevel::WARN, logging);
    logger.warn("[Test] To stderr");
    logger.shutdown();

    EXPECT_FALSE(std::filesystem::exists(log_file));
}
