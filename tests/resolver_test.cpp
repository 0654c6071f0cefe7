#include <gtest/gtest.h>
#include "subscout/resolve/resolver.hpp"
#include "subscout/resolve/batch_resolver.hpp"
#include "subscout/resolve/concurrent_resolver.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <map>
#include <mutex>

using namespace subscout;
using namespace subscout::resolve;
using subscout::test::TempDir;

namespace {

class FakeDnsClient : public dns::DnsClient {
public:
    dns::DnsAnswer query(const std::string& name, dns::RecordType type) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++queries;

        auto it = answers_.find({name, type});
        if (it == answers_.end()) {
            return {{}, core::CoreErrorCode::DNS_NO_ANSWER};
        }
        return {it->second, std::nullopt};
    }

    void add(const std::string& name, dns::RecordType type, std::vector<std::string> values) {
        answers_[{name, type}] = std::move(values);
    }

    int queries = 0;

private:
    std::mutex mutex_;
    std::map<std::pair<std::string, dns::RecordType>, std::vector<std::string>> answers_;
};

class RecordingBackend : public ResolverBackend {
public:
    std::string name() const override { return "recording"; }

    void resolve(const std::vector<std::string>& candidates, const RecordCallback& on_record) override {
        received = candidates;
        for (const auto& candidate : candidates) {
            common::ResolvedRecord record;
            record.name = candidate;
            record.ips = {"192.0.2.1"};
            on_record(std::move(record));
        }
    }

    std::vector<std::string> received;
};

std::vector<common::ResolvedRecord> collect(ResolverBackend& backend, const std::vector<std::string>& names) {
    std::vector<common::ResolvedRecord> records;
    backend.resolve(names, [&records](common::ResolvedRecord&& record) {
        records.push_back(std::move(record));
    });
    std::sort(records.begin(), records.end(),
              [](const common::ResolvedRecord& a, const common::ResolvedRecord& b) { return a.name < b.name; });
    return records;
}

}

TEST(BatchOutputTest, ParsesAddressesAndCname) {
    std::string output =
        "www.example.com. CNAME edge.CDN.net.\n"
        "www.example.com. A 203.0.113.9\n"
        "www.example.com. A 203.0.113.2\n"
        "www.example.com. A 203.0.113.9\n"
        "API.example.com. AAAA 2001:db8::1\n"
        "garbage\n"
        "\n";

    auto records = parseBatchOutput(output);
    ASSERT_EQ(records.size(), 2u);

    const auto& www = records.at("www.example.com");
    EXPECT_EQ(www.ips, (std::vector<std::string>{"203.0.113.2", "203.0.113.9"}));
    EXPECT_EQ(www.cname, "edge.cdn.net");

    const auto& api = records.at("api.example.com");
    EXPECT_EQ(api.ips, std::vector<std::string>{"2001:db8::1"});
    EXPECT_FALSE(api.cname);
}

TEST(LookupHostTest, CombinesRecordTypes) {
    FakeDnsClient dns;
    dns.add("www.example.com", dns::RecordType::A, {"10.0.0.9", "10.0.0.1", "10.0.0.9"});
    dns.add("www.example.com", dns::RecordType::AAAA, {"2001:db8::10"});
    dns.add("www.example.com", dns::RecordType::CNAME, {"edge.example.net"});

    auto record = dns::lookupHost(dns, "www.example.com");
    EXPECT_EQ(record.ips, (std::vector<std::string>{"10.0.0.1", "10.0.0.9", "2001:db8::10"}));
    EXPECT_EQ(record.cname, "edge.example.net");
    EXPECT_TRUE(record.hasAnswer());
}

TEST(ConcurrentResolverTest, DropsUnansweredAndInvalidNames) {
    auto dns = std::make_shared<FakeDnsClient>();
    dns->add("a.example.com", dns::RecordType::A, {"192.0.2.1"});
    dns->add("b.example.com", dns::RecordType::CNAME, {"target.example.net"});

    ConcurrentResolver resolver(dns, 4);
    EXPECT_EQ(resolver.name(), "system");

    auto records = collect(resolver, {"a.example.com", "b.example.com", "c.example.com", "bad name"});
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].name, "a.example.com");
    EXPECT_EQ(records[1].name, "b.example.com");
    EXPECT_EQ(records[1].cname, "target.example.net");
}

TEST(ConcurrentResolverTest, SortsAddresses) {
    auto dns = std::make_shared<FakeDnsClient>();
    dns->add("www.example.com", dns::RecordType::A, {"10.0.0.9", "10.0.0.1"});

    ConcurrentResolver resolver(dns, 2);
    auto records = collect(resolver, {"www.example.com"});
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].ips, (std::vector<std::string>{"10.0.0.1", "10.0.0.9"}));
}

TEST(BatchResolverTest, RunsBinaryPerBatch) {
    TempDir dir("subscout_resolver");
    auto resolvers = dir.write("resolvers.txt", "1.1.1.1\n");
    auto calls = (dir.path() / "calls").string();
    auto binary = dir.write("fake-massdns",
        "#!/bin/sh\n"
        "echo call >> '" + calls + "'\n"
        "while read name; do\n"
        "  echo \"$name A 198.51.100.7\"\n"
        "done\n",
        true);

    BatchResolver resolver(binary, resolvers, 2, nullptr);
    EXPECT_EQ(resolver.name(), "massdns");

    auto records = collect(resolver, {"a.example.com", "b.example.com", "c.example.com"});
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[2].name, "c.example.com");
    EXPECT_EQ(records[2].ips, std::vector<std::string>{"198.51.100.7"});

    std::ifstream log(calls);
    int invocations = 0;
    std::string line;
    while (std::getline(log, line)) {
        ++invocations;
    }
    EXPECT_EQ(invocations, 2);
}

TEST(BatchResolverTest, SkipsFailedBatch) {
    TempDir dir("subscout_resolver");
    auto resolvers = dir.write("resolvers.txt", "1.1.1.1\n");
    auto binary = dir.write("failing-massdns",
        "#!/bin/sh\n"
        "cat > /dev/null\n"
        "echo 'resolver list unusable' >&2\n"
        "exit 3\n",
        true);

    auto fallback = std::make_shared<RecordingBackend>();
    BatchResolver resolver(binary, resolvers, 10, fallback);

    EXPECT_TRUE(collect(resolver, {"a.example.com"}).empty());
    EXPECT_TRUE(fallback->received.empty());
}

TEST(BatchResolverTest, KeepsOnlySubmittedNames) {
    TempDir dir("subscout_resolver");
    auto resolvers = dir.write("resolvers.txt", "1.1.1.1\n");
    auto binary = dir.write("chain-massdns",
        "#!/bin/sh\n"
        "cat > /dev/null\n"
        "echo 'www.example.com. CNAME edge.cdn.net.'\n"
        "echo 'edge.cdn.net. A 198.51.100.7'\n",
        true);

    BatchResolver resolver(binary, resolvers, 10, nullptr);

    auto records = collect(resolver, {"www.example.com"});
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].name, "www.example.com");
    EXPECT_EQ(records[0].cname, "edge.cdn.net");
    EXPECT_TRUE(records[0].ips.empty());
}

TEST(BatchResolverTest, FallsBackWhenBinaryCannotStart) {
    TempDir dir("subscout_resolver");
    auto resolvers = dir.write("resolvers.txt", "1.1.1.1\n");

    auto fallback = std::make_shared<RecordingBackend>();
    BatchResolver resolver((dir.path() / "missing-massdns").string(), resolvers, 1, fallback);

    auto records = collect(resolver, {"a.example.com", "b.example.com"});
    EXPECT_EQ(fallback->received, (std::vector<std::string>{"a.example.com", "b.example.com"}));
    EXPECT_EQ(records.size(), 2u);
}

TEST(ResolverSelectionTest, UsesSystemBackendWithoutResolverList) {
    TempDir dir("subscout_resolver");
    auto binary = dir.write("massdns", "#!/bin/sh\nexit 0\n", true);

    ResolverOptions options;
    options.massdns_bin = binary;
    options.resolvers_file = (dir.path() / "absent.txt").string();
    options.batch_size = 10;
    options.concurrency = 2;

    auto backend = selectResolverBackend(options, std::make_shared<FakeDnsClient>());
    EXPECT_EQ(backend->name(), "system");

    options.resolvers_file = dir.write("resolvers.txt", "9.9.9.9\n");
    backend = selectResolverBackend(options, std::make_shared<FakeDnsClient>());
    EXPECT_EQ(backend->name(), "massdns");
}

TEST(ResolverSelectionTest, FindsConfiguredBinaryOnlyWhenExecutable) {
    TempDir dir("subscout_resolver");
    auto executable = dir.write("massdns", "#!/bin/sh\n", true);
    auto plain = dir.write("not-executable", "data");

    EXPECT_EQ(findBatchResolverBinary(executable), executable);
    EXPECT_NE(findBatchResolverBinary(plain), plain);
}
