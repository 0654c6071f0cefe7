#include <gtest/gtest.h>
#include "subscout/common/config.hpp"
#include "subscout/common/paths.hpp"
#include "subscout/config/validator.hpp"
#include "test_support.hpp"
#include <stdexcept>
#include <cstdlib>

using namespace subscout;
using subscout::test::TempDir;

TEST(ConfigTest, DefaultsMatchDocumentedValues) {
    auto config = common::Config::createDefaultConfig();

    EXPECT_EQ(config.discovery.crtsh_url, "https://crt.sh");
    EXPECT_EQ(config.discovery.crtsh_timeout, 20);
    EXPECT_EQ(config.discovery.bruteforce_words.size(), 6u);
    EXPECT_EQ(config.resolver.batch_size, 400);
    EXPECT_EQ(config.probe.https_port, 443);
    EXPECT_EQ(config.probe.http_port, 80);
    EXPECT_EQ(config.server.http_port, 8000);
    EXPECT_EQ(config.server.rate_limit_requests, 60);
    EXPECT_FALSE(config.server.trust_x_forwarded_for);
    EXPECT_TRUE(config.storage.enable_history);
}

TEST(ConfigTest, LoadsTomlOverrides) {
    TempDir dir("subscout_config");
    auto path = dir.write("subscout.toml",
        "[global]\n"
        "data_dir = \"" + dir.path().string() + "/data\"\n"
        "log_level = \"debug\"\n"
        "\n"
        "[discovery]\n"
        "bruteforce_words = [\"www\", \"vpn\"]\n"
        "\n"
        "[probe]\n"
        "http_timeout = 3\n"
        "concurrency = 5\n"
        "\n"
        "[server]\n"
        "http_port = 9090\n"
        "rate_limit_window = 30.5\n");

    auto& config = common::Config::instance();
    ASSERT_TRUE(config.load(path));

    const auto& global = config.global();
    EXPECT_EQ(global.log_level, common::LogLevel::DEBUG);
    EXPECT_EQ(global.discovery.bruteforce_words, (std::vector<std::string>{"www", "vpn"}));
    EXPECT_DOUBLE_EQ(global.probe.http_timeout, 3.0);
    EXPECT_EQ(global.probe.concurrency, 5);
    EXPECT_EQ(global.server.http_port, 9090);
    EXPECT_DOUBLE_EQ(global.server.rate_limit_window, 30.5);
    EXPECT_EQ(global.storage.store_dir, dir.path().string() + "/data/history");
    EXPECT_EQ(config.getConfigPath(), path);
}

TEST(ConfigTest, MalformedFileFallsBackToDefaults) {
    TempDir dir("subscout_config");
    auto path = dir.write("broken.toml", "[server\nhttp_port = ");

    auto& config = common::Config::instance();
    EXPECT_FALSE(config.load(path));
    EXPECT_EQ(config.global().server.http_port, 8000);
    EXPECT_FALSE(config.global().data_dir.empty());
}

TEST(ConfigTest, SetAndGetValues) {
    auto& config = common::Config::instance();
    TempDir dir("subscout_config");
    config.load((dir.path() / "absent.toml").string());

    config.setValue("server.http_port", "8123");
    EXPECT_EQ(config.getValue("server.http_port"), "8123");

    config.setValue("discovery.bruteforce_words", "www, api ,mail");
    EXPECT_EQ(config.global().discovery.bruteforce_words, (std::vector<std::string>{"www", "api", "mail"}));

    config.setValue("storage.enable_history", "no");
    EXPECT_EQ(config.getValue("storage.enable_history"), "false");

    EXPECT_THROW(config.setValue("log_level", "loud"), std::invalid_argument);
    EXPECT_THROW(config.setValue("no.such.key", "1"), std::invalid_argument);
    EXPECT_THROW(config.setValue("probe.http_port", "70000"), std::out_of_range);
    EXPECT_FALSE(config.getValue("no.such.key"));

    for (const auto& key : common::Config::knownKeys()) {
        EXPECT_TRUE(config.getValue(key)) << key;
    }
}

TEST(ConfigTest, SaveRoundTripsThroughFile) {
    TempDir dir("subscout_config");
    auto path = (dir.path() / "saved.toml").string();

    auto& config = common::Config::instance();
    config.load(path);
    config.setValue("probe.concurrency", "7");
    config.setValue("server.trust_x_forwarded_for", "true");
    ASSERT_TRUE(config.save(path));

    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.global().probe.concurrency, 7);
    EXPECT_TRUE(config.global().server.trust_x_forwarded_for);
}

TEST(ConfigValidatorTest, AcceptsDefaultsInWritableLocation) {
    TempDir dir("subscout_config");
    auto config = common::Config::createDefaultConfig();
    config.data_dir = (dir.path() / "data").string();
    config.log_file = (dir.path() / "logs" / "subscout.log").string();
    config.storage.store_dir = (dir.path() / "data" / "history").string();
    config.resolver.resolvers_file = (dir.path() / "resolvers.txt").string();

    config::ConfigValidator validator;
    auto result = validator.validate(config);
    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.errors.empty());
}

TEST(ConfigValidatorTest, ReportsOutOfRangeValues) {
    TempDir dir("subscout_config");
    auto config = common::Config::createDefaultConfig();
    config.data_dir = dir.path().string();
    config.storage.store_dir = dir.path().string();
    config.discovery.crtsh_url = "ftp://crt.sh";
    config.resolver.batch_size = 0;
    config.probe.http_timeout = 0.0;
    config.server.rate_limit_window = 0.5;

    config::ConfigValidator validator;
    auto result = validator.validate(config);
    EXPECT_FALSE(result.is_valid);
    EXPECT_EQ(result.errors.size(), 4u);
}

TEST(ConfigValidatorTest, ChecksUrlsAndPorts) {
    EXPECT_TRUE(config::ConfigValidator::validateUrl("https://crt.sh"));
    EXPECT_TRUE(config::ConfigValidator::validateUrl("http://127.0.0.1:8080/api"));
    EXPECT_FALSE(config::ConfigValidator::validateUrl("crt.sh"));
    EXPECT_FALSE(config::ConfigValidator::validatePort(0));
    EXPECT_TRUE(config::ConfigValidator::validatePort(443));
}

TEST(PathManagerTest, EnvironmentConfigComesFirst) {
    auto& paths = common::PathManager::instance();

    ::setenv("SUBSCOUT_CONFIG", "/tmp/subscout-env.toml", 1);
    auto with_env = paths.getConfigSearchPaths();
    ::unsetenv("SUBSCOUT_CONFIG");

    ASSERT_EQ(with_env.size(), 2u);
    EXPECT_EQ(with_env[0], "/tmp/subscout-env.toml");
    EXPECT_EQ(with_env[1], paths.getConfigFile());

    auto without_env = paths.getConfigSearchPaths();
    ASSERT_EQ(without_env.size(), 1u);
    EXPECT_EQ(without_env[0], paths.getConfigFile());
}

TEST(PathManagerTest, DirectoriesAreNamedAfterApplication) {
    auto& paths = common::PathManager::instance();

    EXPECT_NE(paths.getConfigFile().find("/subscout.toml"), std::string::npos);
    for (const auto& dir : {paths.getConfigDir(), paths.getDataDir(), paths.getLogDir()}) {
        EXPECT_FALSE(dir.empty());
        EXPECT_TRUE(dir.find("subscout") != std::string::npos || dir.rfind("./", 0) == 0) << dir;
    }
}
