#include "subscout/daemon/http_server.hpp"
#include "subscout/http/response.hpp"
#include "subscout/format/json_formatter.hpp"
#include "subscout/resolve/resolver.hpp"
#include "subscout/common/constants.hpp"
#include "subscout/common/error_framework.hpp"
#include "subscout/common/hostname.hpp"
#include "subscout/common/logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace subscout {
namespace daemon {

namespace {

bool parseFlag(const std::string& value) {
    auto lowered = common::toLower(common::trim(value));
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

void sendInternalError(httplib::Response& res, const std::string& endpoint, const std::exception& e) {
    common::ErrorContext ctx;
    ctx.component = "HTTP";
    ctx.details["exception"] = e.what();
    ctx.details["endpoint"] = endpoint;

    nlohmann::json details;
    details["exception"] = e.what();
    http::HttpResponse::sendError(res, http::ErrorCode::SYSTEM_INTERNAL_ERROR, details);
    common::Logger::instance().error("[HTTP] Request exception | {}", common::formatContext(ctx));
}

}

HttpApiServer::HttpApiServer(const std::string& host, uint16_t port,
                             pipeline::PipelineServices services,
                             const common::GlobalConfig& config)
    : host_(host),
      port_(port),
      services_(std::move(services)),
      storage_config_(config.storage),
      server_config_(config.server),
      massdns_bin_(config.resolver.massdns_bin) {
    server_ = std::make_unique<httplib::Server>();

    if (server_config_.rate_limit_requests > 0) {
        limiter_ = std::make_unique<RateLimiter>(server_config_.rate_limit_requests,
                                                 server_config_.rate_limit_window,
                                                 server_config_.trust_x_forwarded_for,
                                                 server_config_.rate_limit_max_keys);
    }
}

HttpApiServer::~HttpApiServer() {
    stop();
}

bool HttpApiServer::start() {
    if (running_) {
        return true;
    }

    setupRoutes();

    {
        std::lock_guard<std::mutex> lock(searches_mutex_);
        accepting_searches_ = true;
    }

    server_->set_read_timeout(10, 0);
    server_->set_write_timeout(10, 0);
    server_->set_idle_interval(1, 0);
    server_->set_keep_alive_max_count(100);

    int bound = port_ == 0 ? server_->bind_to_any_port(host_) : (server_->bind_to_port(host_, port_) ? port_ : -1);
    if (bound < 0) {
        common::Logger::instance().error("[HTTP] Failed to bind | host={} | port={}", host_, port_);
        return false;
    }
    bound_port_ = bound;

    running_ = true;

    server_thread_ = std::thread([this]() {
        common::Logger::instance().info("[HTTP] Server starting | host={} | port={}",
                                       host_, bound_port_.load());

        if (!server_->listen_after_bind()) {
            common::Logger::instance().error("[HTTP] Listen failed | host={} | port={}",
                                            host_, bound_port_.load());
            running_ = false;
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    if (running_) {
        common::Logger::instance().info("[HTTP] Server started | host={} | port={} | rate_limit={}",
                                       host_, bound_port_.load(), limiter_ ? limiter_->requests() : 0);
    }

    return running_;
}

void HttpApiServer::stop() {
    std::list<SearchTask> pending;
    {
        std::lock_guard<std::mutex> lock(searches_mutex_);
        accepting_searches_ = false;
        pending.swap(searches_);
    }

    for (auto& task : pending) {
        task.channel->abandon();
    }

    if (server_) {
        server_->stop();
    }

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    if (!pending.empty()) {
        common::Logger::instance().info("[HTTP] Waiting for searches | count={}", pending.size());
    }
    for (auto& task : pending) {
        if (task.worker.joinable()) {
            task.worker.join();
        }
    }

    if (running_.exchange(false)) {
        common::Logger::instance().info("[HTTP] Server stopped");
    }
}

void HttpApiServer::reapFinishedSearches() {
    for (auto it = searches_.begin(); it != searches_.end();) {
        if (*it->finished) {
            if (it->worker.joinable()) {
                it->worker.join();
            }
            it = searches_.erase(it);
        } else {
            ++it;
        }
    }
}

void HttpApiServer::setupRoutes() {
    server_->set_pre_routing_handler([this](const auto& req, auto& res) {
        return admitRequest(req, res);
    });

    server_->Get("/", [this](const auto& req, auto& res) {
        handleRoot(req, res);
    });

    server_->Get("/healthz", [this](const auto& req, auto& res) {
        handleHealth(req, res);
    });

    server_->Get("/api/search", [this](const auto& req, auto& res) {
        handleSearch(req, res);
    });

    server_->Get("/api/status", [this](const auto& req, auto& res) {
        handleStatus(req, res);
    });

    server_->Get("/api/history", [this](const auto& req, auto& res) {
        handleHistory(req, res);
    });

    server_->Get("/api/recent", [this](const auto& req, auto& res) {
        handleRecent(req, res);
    });

    server_->set_error_handler([](const auto& req, auto& res) {
        if (!res.body.empty()) {
            return;
        }

        if (res.status == 404) {
            http::HttpResponse::sendError(res, http::ErrorCode::REQUEST_INVALID_ENDPOINT);
        } else if (res.status == 405) {
            http::HttpResponse::sendError(res, http::ErrorCode::REQUEST_METHOD_NOT_ALLOWED);
        }
    });
}

httplib::Server::HandlerResponse HttpApiServer::admitRequest(const httplib::Request& req, httplib::Response& res) {
    if (!limiter_ || req.path.rfind("/api/", 0) != 0) {
        return httplib::Server::HandlerResponse::Unhandled;
    }

    auto key = limiter_->identify(req.remote_addr, req.get_header_value("X-Forwarded-For"));
    auto decision = limiter_->hit(key);

    if (!decision.allowed) {
        http::HttpResponse::applyHeaders(res, RateLimiter::retryHeaders(decision));

        nlohmann::json details;
        details["retry_after"] = decision.retry_after;
        http::HttpResponse::sendError(res, http::ErrorCode::RATE_LIMIT_EXCEEDED,
                                     std::string("Rate limit exceeded"), details);

        common::Logger::instance().warn("[HTTP] Rate limited | client={} | path={} | retry_after={:.1f}",
                                       key, req.path, decision.retry_after);
        return httplib::Server::HandlerResponse::Handled;
    }

    http::HttpResponse::applyHeaders(res, RateLimiter::quotaHeaders(decision));
    return httplib::Server::HandlerResponse::Unhandled;
}

std::optional<std::string> HttpApiServer::requireDomain(const httplib::Request& req, httplib::Response& res) {
    if (!req.has_param("domain") || req.get_param_value("domain").empty()) {
        nlohmann::json details;
        details["parameter"] = "domain";
        http::HttpResponse::sendError(res, http::ErrorCode::REQUEST_MISSING_PARAMETER, details);
        return std::nullopt;
    }

    auto raw = req.get_param_value("domain");
    auto normalized = common::sanitizeDomain(raw);
    if (!normalized) {
        nlohmann::json details;
        details["domain"] = raw;
        http::HttpResponse::sendError(res, http::ErrorCode::REQUEST_INVALID_DOMAIN, details);
        common::Logger::instance().debug("[HTTP] Invalid domain | path={} | domain={}", req.path, raw);
        return std::nullopt;
    }

    return normalized;
}

void HttpApiServer::handleRoot(const httplib::Request& req, httplib::Response& res) {
    nlohmann::json response;
    response["name"] = constants::system::APPLICATION_NAME;
    response["version"] = constants::version::CLI_VERSION;
    response["status"] = "ok";
    response["features"]["history_enabled"] = services_.store != nullptr;
    response["features"]["massdns_available"] = resolve::findBatchResolverBinary(massdns_bin_).has_value();
    response["rate_limit"]["requests"] = server_config_.rate_limit_requests;
    response["rate_limit"]["window_seconds"] = server_config_.rate_limit_window;
    http::HttpResponse::sendSuccess(res, response);
}

void HttpApiServer::handleHealth(const httplib::Request& req, httplib::Response& res) {
    nlohmann::json response;
    response["status"] = "ok";
    response["timestamp"] = common::formatIsoTime(std::chrono::system_clock::now());
    http::HttpResponse::sendSuccess(res, response);
}

void HttpApiServer::handleSearch(const httplib::Request& req, httplib::Response& res) {
    try {
        auto domain = requireDomain(req, res);
        if (!domain) {
            return;
        }

        bool refresh = req.has_param("refresh") && parseFlag(req.get_param_value("refresh"));

        common::Logger::instance().info("[HTTP] Search request | domain={} | refresh={} | client={}",
                                       *domain, refresh, req.remote_addr);

        auto channel = std::make_shared<pipeline::EventChannel>(server_config_.event_queue_capacity);
        auto search_pipeline = services_.pipeline;
        std::string target = *domain;

        {
            std::lock_guard<std::mutex> lock(searches_mutex_);
            if (!accepting_searches_) {
                http::HttpResponse::sendError(res, http::ErrorCode::SYSTEM_SERVICE_UNAVAILABLE);
                return;
            }
            reapFinishedSearches();

            SearchTask task;
            task.channel = channel;
            task.finished = std::make_shared<std::atomic<bool>>(false);
            auto finished = task.finished;
            task.worker = std::thread([search_pipeline, channel, target, refresh, finished]() {
                search_pipeline->run(target, refresh, *channel);
                *finished = true;
            });
            searches_.push_back(std::move(task));
        }

        http::HttpResponse::prepareEventStream(res);

        res.set_chunked_content_provider(
            "text/event-stream",
            [channel](size_t, httplib::DataSink& sink) {
                common::SearchEvent event;
                if (!channel->pop(event)) {
                    sink.done();
                    return true;
                }

                auto frame = format::JsonFormatter::formatSse(
                    format::JsonFormatter::formatEvent(event),
                    event.stage == common::EventStage::ERROR ? "error" : "");

                if (!sink.write(frame.data(), frame.size())) {
                    channel->abandon();
                    return false;
                }
                return true;
            },
            [channel, target](bool success) {
                if (!success) {
                    common::Logger::instance().info("[HTTP] Search stream closed early | domain={}", target);
                    channel->abandon();
                }
            });

    } catch (const std::exception& e) {
        sendInternalError(res, "/api/search", e);
    }
}

void HttpApiServer::handleStatus(const httplib::Request& req, httplib::Response& res) {
    try {
        auto domain = requireDomain(req, res);
        if (!domain) {
            return;
        }

        common::Logger::instance().debug("[HTTP] Status request | domain={}", *domain);

        auto entry = services_.prober->probe(*domain);
        http::HttpResponse::sendSuccess(res, format::JsonFormatter::formatProbeResult(entry));

    } catch (const std::invalid_argument& e) {
        nlohmann::json details;
        details["error"] = e.what();
        http::HttpResponse::sendError(res, http::ErrorCode::REQUEST_INVALID_DOMAIN, details);
    } catch (const std::exception& e) {
        sendInternalError(res, "/api/status", e);
    }
}

void HttpApiServer::handleHistory(const httplib::Request& req, httplib::Response& res) {
    try {
        auto domain = requireDomain(req, res);
        if (!domain) {
            return;
        }

        common::Snapshot snapshot;
        std::vector<common::ScanRun> runs;

        if (services_.store) {
            snapshot = services_.store->loadSnapshot(*domain);
            runs = services_.store->runsForDomain(
                *domain, static_cast<size_t>(std::max(0, storage_config_.per_domain_history_limit)));
        }

        nlohmann::json response;
        response["domain"] = *domain;

        if (snapshot.meta) {
            response["cached"] = common::formatIsoTime(snapshot.meta->cached_at);
            response["total"] = snapshot.meta->total_unique;
        } else {
            response["cached"] = nullptr;
            response["total"] = snapshot.entries.size();
        }

        response["results"] = nlohmann::json::array();
        for (const auto& entry : snapshot.entries) {
            response["results"].push_back(format::JsonFormatter::formatEntry(entry));
        }

        response["runs"] = nlohmann::json::array();
        for (const auto& run : runs) {
            response["runs"].push_back(format::JsonFormatter::formatRun(run));
        }

        http::HttpResponse::sendSuccess(res, response);

    } catch (const storage::StorageError& e) {
        nlohmann::json details;
        details["code"] = core::CoreErrorCodeHelper::toString(e.code());
        http::HttpResponse::sendError(res, http::ErrorCodeHelper::mapCoreErrorCode(e.code()), details);
        common::Logger::instance().warn("[HTTP] History unavailable | error={}", e.what());
    } catch (const std::exception& e) {
        sendInternalError(res, "/api/history", e);
    }
}

void HttpApiServer::handleRecent(const httplib::Request& req, httplib::Response& res) {
    try {
        int limit = 10;

        if (req.has_param("limit")) {
            try {
                limit = std::stoi(req.get_param_value("limit"));
            } catch (const std::exception&) {
                nlohmann::json details;
                details["parameter"] = "limit";
                http::HttpResponse::sendError(res, http::ErrorCode::REQUEST_INVALID_PARAMETER, details);
                return;
            }
        }

        limit = std::clamp(limit, 1, constants::limits::MAX_RECENT_QUERY_LIMIT);
        limit = std::min(limit, std::max(0, storage_config_.recent_scans_limit));

        nlohmann::json response;
        response["recent"] = nlohmann::json::array();

        if (services_.store) {
            for (const auto& run : services_.store->recentRuns(static_cast<size_t>(limit))) {
                response["recent"].push_back(format::JsonFormatter::formatRun(run));
            }
        }

        http::HttpResponse::sendSuccess(res, response);

    } catch (const storage::StorageError& e) {
        nlohmann::json details;
        details["code"] = core::CoreErrorCodeHelper::toString(e.code());
        http::HttpResponse::sendError(res, http::ErrorCodeHelper::mapCoreErrorCode(e.code()), details);
        common::Logger::instance().warn("[HTTP] Recent scans unavailable | error={}", e.what());
    } catch (const std::exception& e) {
        sendInternalError(res, "/api/recent", e);
    }
}

}}
