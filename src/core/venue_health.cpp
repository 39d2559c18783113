#include "venue_health.hpp"
#include "event_pusher.hpp"
#include "../utils/logger.hpp"

#include <algorithm>

namespace arbx {

const char* to_string(VenueStatus status) {
    switch (status) {
        case VenueStatus::HEALTHY: return "healthy";
        case VenueStatus::DEGRADED: return "degraded";
        case VenueStatus::UNHEALTHY: return "unhealthy";
    }
    return "unknown";
}

VenueHealthTracker::VenueHealthTracker(HealthConfig config, EventPusher* events, ClockFn clock)
    : config_(std::move(config)),
      events_(events),
      clock_(clock ? std::move(clock) : ClockFn([] { return Clock::now(); })) {}

void VenueHealthTracker::configure(HealthConfig config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = std::move(config);
    const size_t window = static_cast<size_t>(std::max(config_.window, 1));
    for (auto& [venue, samples] : samples_) {
        while (samples.size() > window) {
            samples.pop_front();
        }
    }
}

void VenueHealthTracker::record_fill(const Venue& venue, std::chrono::milliseconds latency) {
    record(venue, Sample{clock_(), false, latency}, ErrorKind::NONE);
}

void VenueHealthTracker::record_failure(const Venue& venue, ErrorKind kind) {
    ARBX_LOG_DEBUG("Venue {} order failure: {}", venue, to_string(kind));
    record(venue, Sample{clock_(), true, std::chrono::milliseconds(0)}, kind);
}

void VenueHealthTracker::record(const Venue& venue, Sample sample, ErrorKind kind) {
    VenueHealth current;
    VenueStatus previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& samples = samples_[venue];
        samples.push_back(sample);
        while (samples.size() > static_cast<size_t>(std::max(config_.window, 1))) {
            samples.pop_front();
        }

        current = evaluate_locked(venue, sample.at);
        auto it = reported_.find(venue);
        previous = it == reported_.end() ? VenueStatus::HEALTHY : it->second;
        reported_[venue] = current.status;
    }

    if (current.status == previous) {
        return;
    }
    if (current.status == VenueStatus::HEALTHY) {
        ARBX_LOG_INFO("Venue {} is healthy again", venue);
        return;
    }

    const std::string summary = current.error_rate_pct.to_string() + "% of " + std::to_string(current.samples) +
                                " orders failed, average fill " +
                                std::to_string(current.average_fill_latency.count()) + "ms";
    ARBX_LOG_WARN("Venue {} is {}: {}", venue, to_string(current.status), summary);

    if (current.status == VenueStatus::UNHEALTHY && events_ != nullptr) {
        Alert alert;
        alert.level = Alert::Level::WARNING;
        alert.kind = ErrorKind::VENUE_UNHEALTHY;
        alert.title = "Venue " + venue + " paused";
        alert.message = summary + (kind == ErrorKind::NONE ? "" : std::string("; last failure ") + to_string(kind));
        alert.timestamp = sample.at;
        events_->push_event(AlertEvent{alert});
    }
}

VenueHealth VenueHealthTracker::evaluate_locked(const Venue& venue, TimePoint now) const {
    VenueHealth health;
    health.venue = venue;

    auto it = samples_.find(venue);
    if (it == samples_.end()) {
        return health;
    }

    const TimePoint cutoff = now - std::chrono::milliseconds(config_.window_ms);
    size_t fills = 0;
    int64_t latency_total = 0;
    for (const auto& sample : it->second) {
        if (sample.at < cutoff) {
            continue;
        }
        ++health.samples;
        if (sample.failed) {
            ++health.errors;
        } else {
            ++fills;
            latency_total += sample.latency.count();
        }
    }

    if (fills > 0) {
        health.average_fill_latency = std::chrono::milliseconds(latency_total / static_cast<int64_t>(fills));
    }
    if (health.samples == 0) {
        return health;
    }
    health.error_rate_pct = Decimal::from_int(static_cast<int64_t>(health.errors)) * Decimal::hundred() /
                            Decimal::from_int(static_cast<int64_t>(health.samples));

    if (health.samples < static_cast<size_t>(config_.min_samples)) {
        return health;
    }
    if (health.error_rate_pct > config_.unhealthy_error_rate_pct) {
        health.status = VenueStatus::UNHEALTHY;
    } else if (health.error_rate_pct > config_.degraded_error_rate_pct ||
               health.average_fill_latency > std::chrono::milliseconds(config_.slow_fill_ms)) {
        health.status = VenueStatus::DEGRADED;
    }
    return health;
}

VenueHealth VenueHealthTracker::health(const Venue& venue) const {
    const TimePoint now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    return evaluate_locked(venue, now);
}

std::vector<VenueHealth> VenueHealthTracker::all() const {
    const TimePoint now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<VenueHealth> result;
    result.reserve(samples_.size());
    for (const auto& [venue, samples] : samples_) {
        result.push_back(evaluate_locked(venue, now));
    }
    return result;
}

int VenueHealthTracker::slowdown_factor(const Venue& venue) const {
    const TimePoint now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    return evaluate_locked(venue, now).status == VenueStatus::HEALTHY ? 1 : std::max(config_.degraded_slowdown, 1);
}

int VenueHealthTracker::slowdown_factor(const Path& path) const {
    int factor = 1;
    for (const auto& leg : path.legs) {
        factor = std::max(factor, slowdown_factor(leg.venue));
    }
    return factor;
}

bool VenueHealthTracker::is_paused(const Venue& venue) const {
    return health(venue).status == VenueStatus::UNHEALTHY;
}

bool VenueHealthTracker::is_paused(const Path& path) const {
    return std::any_of(path.legs.begin(), path.legs.end(), [this](const Leg& leg) { return is_paused(leg.venue); });
}

} // namespace arbx
