#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>
#include "../utils/thread_safe_queue.hpp"
#include "event.hpp"
#include "event_pusher.hpp"

namespace arbx {

// Queues outbound events and hands them to subscribers on the bus thread.
class EventBus : public EventPusher {
public:
    using Handler = std::function<void(const Event&)>;

    EventBus();
    ~EventBus() override;

    void subscribe(Handler handler);

    void start();
    void stop();

    void push_event(Event event) override;

    // Dispatches everything queued so far on the calling thread.
    size_t drain();

    size_t pending() const { return event_queue_.size(); }
    uint64_t dispatched() const { return dispatched_; }

private:
    void run();
    void process_event(const Event& event);

    ThreadSafeQueue<Event> event_queue_;
    std::mutex handler_mutex_;
    std::vector<Handler> handlers_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> dispatched_{0};
    std::thread thread_;
};

} // namespace arbx
