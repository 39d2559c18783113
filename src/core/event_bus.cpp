#include "event_bus.hpp"
#include "../utils/logger.hpp"

#include <chrono>

namespace arbx {

EventBus::EventBus() : running_(false) {}

EventBus::~EventBus() {
    stop();
}

void EventBus::subscribe(Handler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handlers_.push_back(std::move(handler));
}

void EventBus::start() {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread([this] { run(); });
}

void EventBus::run() {
    while (running_) {
        Event event;
        if (event_queue_.wait_and_pop_for(event, std::chrono::milliseconds(100))) {
            process_event(event);
        }
    }
    drain();
}

void EventBus::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
}

void EventBus::push_event(Event event) {
    event_queue_.push(std::move(event));
}

size_t EventBus::drain() {
    size_t count = 0;
    Event event;
    while (event_queue_.try_pop(event)) {
        process_event(event);
        ++count;
    }
    return count;
}

void EventBus::process_event(const Event& event) {
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handlers = handlers_;
    }

    for (const auto& handler : handlers) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            ARBX_LOG_ERROR("Event handler failed: {}", e.what());
        }
    }
    ++dispatched_;
}

} // namespace arbx
