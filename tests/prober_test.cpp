#include <gtest/gtest.h>
#include "subscout/probe/prober.hpp"
#include <httplib.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

using namespace subscout;
using namespace subscout::probe;

namespace {

class LocalServer {
public:
    LocalServer() {
        port_ = server_.bind_to_any_port("127.0.0.1");
    }

    ~LocalServer() {
        stop();
    }

    void start() {
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        while (!server_.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    void stop() {
        if (thread_.joinable()) {
            server_.stop();
            thread_.join();
        }
    }

    httplib::Server& server() { return server_; }
    uint16_t port() const { return static_cast<uint16_t>(port_); }

private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
};

common::ResolvedRecord loopbackRecord() {
    common::ResolvedRecord record;
    record.name = "127.0.0.1";
    record.ips = {"127.0.0.1"};
    return record;
}

class ScriptedProber : public HostProber {
public:
    common::SubdomainEntry probe(const std::string& host,
                                 const std::optional<common::ResolvedRecord>& known) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            probed.insert(host);
        }
        if (host == "broken.example.com") {
            throw std::runtime_error("socket exploded");
        }

        common::SubdomainEntry entry;
        entry.name = host;
        entry.ips = known ? known->ips : std::vector<std::string>{};
        entry.http_status = 200;
        return entry;
    }

    std::set<std::string> probed;

private:
    std::mutex mutex_;
};

}

class LivenessProberTest : public ::testing::Test {
protected:
    void SetUp() override {
        http_.server().Get("/", [](const httplib::Request& req, httplib::Response& res) {
            res.set_header("Server", "unit-httpd");
            if (req.method == "HEAD") {
                res.status = 405;
                return;
            }
            res.status = 200;
            res.set_content("ok", "text/plain");
        });
        http_.start();
    }

    ProbeOptions options() const {
        ProbeOptions opts;
        opts.timeout_seconds = 2.0;
        opts.http_port = http_.port();
        opts.https_port = closed_.port();
        opts.concurrency = 2;
        return opts;
    }

    LocalServer http_;
    LocalServer closed_;
};

TEST_F(LivenessProberTest, HeadNotAllowedFallsBackToGet) {
    LivenessProber prober(options(), nullptr);

    auto attempt = prober.attempt("http", "127.0.0.1", http_.port());
    ASSERT_TRUE(attempt.responded());
    EXPECT_EQ(*attempt.status, 200);
    EXPECT_EQ(attempt.server, "unit-httpd");
    EXPECT_FALSE(attempt.error);
}

TEST_F(LivenessProberTest, ClosedPortReportsConnectionFailure) {
    LivenessProber prober(options(), nullptr);

    auto attempt = prober.attempt("https", "127.0.0.1", closed_.port());
    EXPECT_FALSE(attempt.responded());
    ASSERT_TRUE(attempt.error);
}

TEST_F(LivenessProberTest, ProbeUsesPlainHttpWhenHttpsIsDown) {
    LivenessProber prober(options(), nullptr);

    auto entry = prober.probe("127.0.0.1", loopbackRecord());
    EXPECT_EQ(entry.name, "127.0.0.1");
    EXPECT_EQ(entry.ips, std::vector<std::string>{"127.0.0.1"});
    ASSERT_TRUE(entry.http_status);
    EXPECT_EQ(*entry.http_status, 200);
    EXPECT_EQ(entry.server, "unit-httpd");
    EXPECT_FALSE(entry.tls);
    EXPECT_NE(entry.last_probe, common::TimePoint{});
}

TEST_F(LivenessProberTest, RejectsInvalidHost) {
    LivenessProber prober(options(), nullptr);
    EXPECT_THROW(prober.probe("not a host"), std::invalid_argument);
    EXPECT_THROW(prober.probe("localhost"), std::invalid_argument);
}

TEST(ProbeAllTest, SkipsUnansweredAndKeepsPartialResults) {
    ScriptedProber prober;

    common::ResolvedRecord ok;
    ok.name = "www.example.com";
    ok.ips = {"192.0.2.1"};

    common::ResolvedRecord broken;
    broken.name = "broken.example.com";
    broken.cname = "gone.example.net";

    common::ResolvedRecord empty;
    empty.name = "nothing.example.com";

    std::vector<common::SubdomainEntry> entries;
    probeAll(prober, {ok, broken, empty}, 4, [&entries](common::SubdomainEntry&& entry) {
        entries.push_back(std::move(entry));
    });

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(prober.probed.count("nothing.example.com"), 0u);

    for (const auto& entry : entries) {
        if (entry.name == "broken.example.com") {
            EXPECT_FALSE(entry.http_status);
            EXPECT_EQ(entry.cname, "gone.example.net");
        } else {
            EXPECT_EQ(entry.name, "www.example.com");
            EXPECT_EQ(entry.http_status, 200);
        }
    }
}
