#include <gtest/gtest.h>
#include "subscout/discovery/certificate_source.hpp"
#include <httplib.h>
#include <chrono>
#include <thread>

using namespace subscout;
using namespace subscout::discovery;

TEST(CrtShPayloadTest, ExtractsNamesUnderDomain) {
    std::string body = R"([
        {"name_value": "*.example.com\nwww.example.com"},
        {"name_value": "API.example.com"},
        {"name_value": "www.example.com"},
        {"name_value": "example.org"},
        {"name_value": 42},
        {"issuer": "no name"}
    ])";

    auto result = parseCrtShPayload(body, "example.com");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.names, (std::vector<std::string>{"example.com", "www.example.com", "api.example.com"}));
}

TEST(CrtShPayloadTest, RejectsMalformedBodies) {
    auto invalid = parseCrtShPayload("<html>", "example.com");
    ASSERT_FALSE(invalid.ok());
    EXPECT_EQ(*invalid.error, core::CoreErrorCode::CT_MALFORMED_PAYLOAD);

    auto object = parseCrtShPayload(R"({"name_value": "a.example.com"})", "example.com");
    ASSERT_FALSE(object.ok());
    EXPECT_EQ(*object.error, core::CoreErrorCode::CT_MALFORMED_PAYLOAD);
}

class CrtShClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_.Get("/", [this](const httplib::Request& req, httplib::Response& res) {
            query_ = req.get_param_value("q");
            res.status = status_;
            res.set_content(body_, "application/json");
        });
        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        while (!server_.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    void TearDown() override {
        server_.stop();
        thread_.join();
    }

    CrtShClient client() {
        CrtShOptions options;
        options.base_url = "http://127.0.0.1:" + std::to_string(port_);
        options.timeout_seconds = 5;
        options.user_agent = "subscout-test";
        return CrtShClient(options);
    }

    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
    int status_ = 200;
    std::string body_ = "[]";
    std::string query_;
};

TEST_F(CrtShClientTest, FetchesAndParses) {
    body_ = R"([{"name_value": "dev.example.com\nmail.example.com"}])";

    auto result = client().fetch("example.com");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(query_, "%.example.com");
    EXPECT_EQ(result.names, (std::vector<std::string>{"dev.example.com", "mail.example.com"}));
}

TEST_F(CrtShClientTest, ReportsBadStatus) {
    status_ = 502;

    auto result = client().fetch("example.com");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(*result.error, core::CoreErrorCode::CT_BAD_STATUS);
}

TEST(CrtShClientUnreachableTest, ReportsFetchFailure) {
    httplib::Server probe;
    int port = probe.bind_to_any_port("127.0.0.1");
    probe.stop();

    CrtShOptions options;
    options.base_url = "http://127.0.0.1:" + std::to_string(port);
    options.timeout_seconds = 2;
    options.user_agent = "subscout-test";

    CrtShClient client(options);
    auto result = client.fetch("example.com");
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(result.names.empty());
}
