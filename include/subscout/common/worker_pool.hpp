#pragma once

#include "logger.hpp"
#include <tbb/concurrent_queue.h>
#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace subscout {
namespace common {

// Runs work() over items on at most `concurrency` threads. Each produced value
// is handed to on_result on the calling thread in completion order. A worker
// that throws loses only its current item. An exception from on_result stops
// the remaining work and is rethrown once all workers have joined.
template<typename In, typename Out>
void runBounded(const std::vector<In>& items,
                int concurrency,
                const std::function<std::optional<Out>(const In&)>& work,
                const std::function<void(Out&&)>& on_result,
                const std::string& component) {
    if (items.empty()) {
        return;
    }

    size_t worker_count = std::min(items.size(), static_cast<size_t>(std::max(1, concurrency)));

    tbb::concurrent_bounded_queue<std::optional<Out>> results;
    std::atomic<size_t> next{0};
    std::atomic<bool> stop{false};

    std::vector<std::thread> workers;
    workers.reserve(worker_count);

    for (size_t w = 0; w < worker_count; ++w) {
        workers.emplace_back([&]() {
            while (!stop.load()) {
                size_t index = next.fetch_add(1);
                if (index >= items.size()) {
                    break;
                }

                try {
                    auto value = work(items[index]);
                    if (value) {
                        results.push(std::move(value));
                    }
                } catch (const std::exception& e) {
                    Logger::instance().debug("[{}] Worker item failed | error={}", component, e.what());
                }
            }
            results.push(std::nullopt);
        });
    }

    size_t finished = 0;
    std::exception_ptr consumer_error;

    while (finished < worker_count) {
        std::optional<Out> item;
        results.pop(item);

        if (!item) {
            ++finished;
            continue;
        }

        if (consumer_error) {
            continue;
        }

        try {
            on_result(std::move(*item));
        } catch (...) {
            consumer_error = std::current_exception();
            stop.store(true);
        }
    }

    for (auto& worker : workers) {
        worker.join();
    }

    if (consumer_error) {
        std::rethrow_exception(consumer_error);
    }
}

}}
