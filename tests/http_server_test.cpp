#include <gtest/gtest.h>
#include "subscout/common/hostname.hpp"
#include "subscout/daemon/http_server.hpp"
#include "subscout/storage/json_scan_store.hpp"
#include "test_support.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

using namespace subscout;
using subscout::test::TempDir;

namespace {

class NoCertificates : public discovery::CertificateSource {
public:
    std::string name() const override { return "none"; }
    discovery::CertificateFetchResult fetch(const std::string&) override { return {}; }
};

class EchoBackend : public resolve::ResolverBackend {
public:
    std::string name() const override { return "echo"; }

    void resolve(const std::vector<std::string>& candidates, const resolve::RecordCallback& on_record) override {
        for (const auto& name : candidates) {
            common::ResolvedRecord record;
            record.name = name;
            record.ips = {"198.51.100.1"};
            on_record(std::move(record));
        }
    }
};

// Holds the pass inside resolution for a short while.
class SlowBackend : public EchoBackend {
public:
    explicit SlowBackend(std::shared_ptr<std::atomic<bool>> entered) : entered_(std::move(entered)) {}

    void resolve(const std::vector<std::string>& candidates, const resolve::RecordCallback& on_record) override {
        *entered_ = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        EchoBackend::resolve(candidates, on_record);
    }

private:
    std::shared_ptr<std::atomic<bool>> entered_;
};

class StubProber : public probe::HostProber {
public:
    common::SubdomainEntry probe(const std::string& host,
                                 const std::optional<common::ResolvedRecord>& known) override {
        if (!common::sanitizeDomain(host)) {
            throw std::invalid_argument("invalid domain for status probe");
        }
        common::SubdomainEntry entry;
        entry.name = host;
        entry.ips = known ? known->ips : std::vector<std::string>{"198.51.100.1"};
        entry.http_status = 200;
        entry.server = "stub";
        entry.last_probe = std::chrono::system_clock::now();
        return entry;
    }
};

}

class HttpApiServerTest : public ::testing::Test {
protected:
    using BackendFactory = std::function<std::unique_ptr<resolve::ResolverBackend>()>;

    void startServer(int rate_limit_requests, BackendFactory backend_factory = nullptr) {
        config_ = common::Config::createDefaultConfig();
        config_.server.rate_limit_requests = rate_limit_requests;
        config_.server.rate_limit_window = 60.0;
        config_.resolver.massdns_bin = "";

        pipeline::PipelineServices services;
        store_ = std::make_shared<storage::JsonScanStore>(dir_.path().string());
        services.store = store_;
        services.prober = std::make_shared<StubProber>();

        discovery::CollectorOptions options;
        options.bruteforce_words = {"www"};
        auto collector = std::make_shared<discovery::CandidateCollector>(std::make_shared<NoCertificates>(), options);

        if (!backend_factory) {
            backend_factory = []() -> std::unique_ptr<resolve::ResolverBackend> {
                return std::make_unique<EchoBackend>();
            };
        }

        services.pipeline = std::make_shared<pipeline::SearchPipeline>(
            services.store, collector, backend_factory, services.prober, 2);

        server_ = std::make_unique<daemon::HttpApiServer>("127.0.0.1", 0, services, config_);
        ASSERT_TRUE(server_->start());
        client_ = std::make_unique<httplib::Client>("127.0.0.1", server_->boundPort());
        client_->set_read_timeout(10, 0);
    }

    void TearDown() override {
        if (server_) {
            server_->stop();
        }
    }

    static nlohmann::json body(const httplib::Result& res) {
        return nlohmann::json::parse(res->body);
    }

    TempDir dir_{"subscout_http"};
    common::GlobalConfig config_;
    std::shared_ptr<storage::JsonScanStore> store_;
    std::unique_ptr<daemon::HttpApiServer> server_;
    std::unique_ptr<httplib::Client> client_;
};

TEST_F(HttpApiServerTest, HealthAndRoot) {
    startServer(0);

    auto health = client_->Get("/healthz");
    ASSERT_TRUE(health);
    EXPECT_EQ(health->status, 200);
    EXPECT_EQ(body(health)["success"], true);
    EXPECT_EQ(body(health)["data"]["status"], "ok");

    auto root = client_->Get("/");
    ASSERT_TRUE(root);
    EXPECT_EQ(body(root)["data"]["name"], "subscout");
    EXPECT_EQ(body(root)["data"]["features"]["history_enabled"], true);
}

TEST_F(HttpApiServerTest, RejectsMissingAndInvalidDomain) {
    startServer(0);

    auto missing = client_->Get("/api/history");
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 400);
    EXPECT_EQ(body(missing)["error"]["code"], "REQUEST_MISSING_PARAMETER");

    auto invalid = client_->Get("/api/status?domain=not%20valid");
    ASSERT_TRUE(invalid);
    EXPECT_EQ(invalid->status, 400);
    EXPECT_EQ(body(invalid)["error"]["code"], "REQUEST_INVALID_DOMAIN");

    auto unknown = client_->Get("/api/nothing");
    ASSERT_TRUE(unknown);
    EXPECT_EQ(unknown->status, 404);
    EXPECT_EQ(body(unknown)["success"], false);
}

TEST_F(HttpApiServerTest, SearchStreamsEventsThenHistoryHasThem) {
    startServer(0);

    auto stream = client_->Get("/api/search?domain=example.com");
    ASSERT_TRUE(stream);
    EXPECT_EQ(stream->status, 200);
    EXPECT_NE(stream->get_header_value("Content-Type").find("text/event-stream"), std::string::npos);
    EXPECT_EQ(stream->get_header_value("Cache-Control"), "no-cache");
    EXPECT_EQ(stream->get_header_value("X-Accel-Buffering"), "no");
    EXPECT_NE(stream->body.find("data: {\"domain\":\"example.com\",\"stage\":\"started\"}"), std::string::npos);
    EXPECT_NE(stream->body.find("\"type\":\"entry\""), std::string::npos);
    EXPECT_NE(stream->body.find("\"stage\":\"done\""), std::string::npos);

    auto history = client_->Get("/api/history?domain=example.com");
    ASSERT_TRUE(history);
    auto data = body(history)["data"];
    EXPECT_EQ(data["domain"], "example.com");
    EXPECT_EQ(data["total"], 2);
    EXPECT_EQ(data["results"].size(), 2u);
    EXPECT_EQ(data["runs"].size(), 1u);

    auto recent = client_->Get("/api/recent?limit=5");
    ASSERT_TRUE(recent);
    EXPECT_EQ(body(recent)["data"]["recent"].size(), 1u);
}

TEST_F(HttpApiServerTest, StatusProbesSingleHost) {
    startServer(0);

    auto status = client_->Get("/api/status?domain=WWW.Example.com");
    ASSERT_TRUE(status);
    EXPECT_EQ(status->status, 200);
    auto data = body(status)["data"];
    EXPECT_EQ(data["domain"], "www.example.com");
    EXPECT_EQ(data["http_status"], 200);
    EXPECT_EQ(data["server"], "stub");
}

TEST_F(HttpApiServerTest, RecentRejectsNonNumericLimit) {
    startServer(0);

    auto recent = client_->Get("/api/recent?limit=lots");
    ASSERT_TRUE(recent);
    EXPECT_EQ(recent->status, 400);
    EXPECT_EQ(body(recent)["error"]["code"], "REQUEST_INVALID_PARAMETER");
}

TEST_F(HttpApiServerTest, RateLimitAppliesToApiOnly) {
    startServer(2);

    auto first = client_->Get("/api/recent");
    ASSERT_TRUE(first);
    EXPECT_EQ(first->get_header_value("X-RateLimit-Remaining"), "1");

    ASSERT_TRUE(client_->Get("/api/recent"));

    auto limited = client_->Get("/api/recent");
    ASSERT_TRUE(limited);
    EXPECT_EQ(limited->status, 429);
    EXPECT_FALSE(limited->get_header_value("Retry-After").empty());
    EXPECT_EQ(body(limited)["error"]["code"], "RATE_LIMIT_EXCEEDED");

    auto health = client_->Get("/healthz");
    ASSERT_TRUE(health);
    EXPECT_EQ(health->status, 200);
}

TEST_F(HttpApiServerTest, StopWaitsForRunningSearch) {
    auto entered = std::make_shared<std::atomic<bool>>(false);
    startServer(0, [entered]() -> std::unique_ptr<resolve::ResolverBackend> {
        return std::make_unique<SlowBackend>(entered);
    });

    int port = server_->boundPort();
    std::thread consumer([port]() {
        httplib::Client client("127.0.0.1", port);
        client.set_read_timeout(5, 0);
        client.Get("/api/search?domain=example.com",
                   [](const char*, size_t) { return false; });
    });

    for (int i = 0; i < 100 && !*entered; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    ASSERT_TRUE(*entered);

    server_->stop();
    consumer.join();

    auto runs = store_->runsForDomain("example.com", 10);
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_TRUE(runs[0].completed_at);
    EXPECT_EQ(store_->loadSnapshot("example.com").entries.size(), 2u);
}
