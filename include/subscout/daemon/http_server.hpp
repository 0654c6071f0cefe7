#pragma once

#include "rate_limiter.hpp"
#include "../common/config.hpp"
#include "../pipeline/search_pipeline.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace subscout {
namespace daemon {

class HttpApiServer {
public:
    HttpApiServer(const std::string& host, uint16_t port,
                  pipeline::PipelineServices services,
                  const common::GlobalConfig& config);
    ~HttpApiServer();

    bool start();
    void stop();
    bool isRunning() const { return running_; }

    // Port actually bound; differs from the configured one when it was 0.
    int boundPort() const { return bound_port_; }

private:
    struct SearchTask {
        std::thread worker;
        std::shared_ptr<pipeline::EventChannel> channel;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    std::string host_;
    uint16_t port_;
    pipeline::PipelineServices services_;
    common::StorageConfig storage_config_;
    common::ServerConfig server_config_;
    std::string massdns_bin_;
    std::unique_ptr<RateLimiter> limiter_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};
    std::atomic<int> bound_port_{0};

    // Passes started by /api/search. stop() abandons their streams and joins
    // them so each pass still persists before the server goes away.
    std::mutex searches_mutex_;
    std::list<SearchTask> searches_;
    bool accepting_searches_ = true;

    void reapFinishedSearches();

    void setupRoutes();
    httplib::Server::HandlerResponse admitRequest(const httplib::Request& req, httplib::Response& res);

    void handleRoot(const httplib::Request& req, httplib::Response& res);
    void handleHealth(const httplib::Request& req, httplib::Response& res);
    void handleSearch(const httplib::Request& req, httplib::Response& res);
    void handleStatus(const httplib::Request& req, httplib::Response& res);
    void handleHistory(const httplib::Request& req, httplib::Response& res);
    void handleRecent(const httplib::Request& req, httplib::Response& res);

    std::optional<std::string> requireDomain(const httplib::Request& req, httplib::Response& res);
};

}}
