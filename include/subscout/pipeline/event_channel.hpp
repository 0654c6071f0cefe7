#pragma once

#include "../common/types.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>

namespace subscout {
namespace pipeline {

// Bounded single-pass event queue between a pipeline run and its consumer.
// push() blocks while the queue is full. Once the consumer abandons the
// stream, pushed events are discarded so the producer can run to completion.
class EventChannel {
public:
    explicit EventChannel(size_t capacity);

    void push(common::SearchEvent event);

    // Blocks until an event is available. Returns false once the channel is
    // closed and drained, or abandoned.
    bool pop(common::SearchEvent& event);

    void close();
    void abandon();

    bool isClosed() const;
    bool isAbandoned() const;
    size_t size() const;

private:
    size_t capacity_;
    std::deque<common::SearchEvent> queue_;
    bool closed_ = false;
    bool abandoned_ = false;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
};

}}
