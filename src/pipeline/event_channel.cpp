#include "subscout/pipeline/event_channel.hpp"
#include <algorithm>

namespace subscout {
namespace pipeline {

EventChannel::EventChannel(size_t capacity) : capacity_(std::max<size_t>(1, capacity)) {}

void EventChannel::push(common::SearchEvent event) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this]() { return abandoned_ || closed_ || queue_.size() < capacity_; });

    if (abandoned_ || closed_) {
        return;
    }

    queue_.push_back(std::move(event));
    lock.unlock();
    not_empty_.notify_one();
}

bool EventChannel::pop(common::SearchEvent& event) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this]() { return abandoned_ || closed_ || !queue_.empty(); });

    if (abandoned_ || queue_.empty()) {
        return false;
    }

    event = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return true;
}

void EventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

void EventChannel::abandon() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        abandoned_ = true;
        queue_.clear();
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

bool EventChannel::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool EventChannel::isAbandoned() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return abandoned_;
}

size_t EventChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

}}
