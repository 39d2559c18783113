#include "fill_channel.hpp"

namespace arbx {

void FillChannel::publish(const FillReport& report) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (last_ && last_->is_final) {
            return;
        }
        last_ = report;
    }
    condition_.notify_all();
}

FillWait FillChannel::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool final = condition_.wait_for(lock, timeout, [this] { return last_ && last_->is_final; });
    return FillWait{final, last_};
}

std::shared_ptr<FillChannel> FillRouter::open(const std::string& client_order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& channel = channels_[client_order_id];
    if (!channel) {
        channel = std::make_shared<FillChannel>();
    }
    return channel;
}

void FillRouter::close(const std::string& client_order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    channels_.erase(client_order_id);
}

bool FillRouter::route(const FillReport& report) {
    std::shared_ptr<FillChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channels_.find(report.client_order_id);
        if (it == channels_.end()) {
            return false;
        }
        channel = it->second;
    }
    channel->publish(report);
    return true;
}

size_t FillRouter::open_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_.size();
}

} // namespace arbx
