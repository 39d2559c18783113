#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <vector>
#include "types.hpp"
#include "../utils/config_types.hpp"

namespace arbx {

class EventPusher;

enum class VenueStatus {
    HEALTHY,
    DEGRADED,   // scanned less often
    UNHEALTHY   // paths through the venue are paused
};

const char* to_string(VenueStatus status);

struct VenueHealth {
    Venue venue;
    size_t samples = 0;
    size_t errors = 0;
    Decimal error_rate_pct;
    std::chrono::milliseconds average_fill_latency{0};
    VenueStatus status = VenueStatus::HEALTHY;
};

// Rolling order-outcome statistics per venue, fed by the execution
// coordinator. A venue with fewer than `min_samples` recent outcomes counts
// as healthy, so a paused venue recovers once its failures age out of the
// window.
class VenueHealthTracker {
public:
    using ClockFn = std::function<TimePoint()>;

    explicit VenueHealthTracker(HealthConfig config, EventPusher* events = nullptr, ClockFn clock = nullptr);

    void configure(HealthConfig config);

    // An order that reached a final fill report, with the time from placement.
    void record_fill(const Venue& venue, std::chrono::milliseconds latency);
    // An order the venue rejected, failed on, or never finished.
    void record_failure(const Venue& venue, ErrorKind kind);

    VenueHealth health(const Venue& venue) const;
    std::vector<VenueHealth> all() const;

    int slowdown_factor(const Venue& venue) const;
    int slowdown_factor(const Path& path) const;

    bool is_paused(const Venue& venue) const;
    bool is_paused(const Path& path) const;

private:
    struct Sample {
        TimePoint at;
        bool failed;
        std::chrono::milliseconds latency;
    };

    void record(const Venue& venue, Sample sample, ErrorKind kind);
    VenueHealth evaluate_locked(const Venue& venue, TimePoint now) const;

    mutable std::mutex mutex_;
    HealthConfig config_;
    EventPusher* events_;
    ClockFn clock_;
    std::map<Venue, std::deque<Sample>> samples_;
    std::map<Venue, VenueStatus> reported_;
};

} // namespace arbx
