#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "types.hpp"

namespace arbx {

struct FillWait {
    bool final = false;                 // a final report arrived in time
    std::optional<FillReport> report;   // the last report seen, if any
};

// One order's fill reports. Reports are cumulative; the latest one wins.
class FillChannel {
public:
    void publish(const FillReport& report);
    FillWait wait_for(std::chrono::milliseconds timeout);

private:
    std::mutex mutex_;
    std::condition_variable condition_;
    std::optional<FillReport> last_;
};

// Routes pushed fill reports to the channel opened for their client order id.
class FillRouter {
public:
    std::shared_ptr<FillChannel> open(const std::string& client_order_id);
    void close(const std::string& client_order_id);

    // False when no channel is open for the report.
    bool route(const FillReport& report);

    size_t open_count() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<FillChannel>> channels_;
};

} // namespace arbx
