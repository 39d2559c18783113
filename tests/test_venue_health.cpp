#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "core/venue_health.hpp"
#include "mocks/mock_event_pusher.hpp"
#include "test_support.hpp"

using namespace arbx;
using namespace arbx::testing;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;

class VenueHealthTest : public ::testing::Test {
protected:
    void SetUp() override {
        ON_CALL(events, push_event(_)).WillByDefault(Invoke([this](Event event) { pushed.push_back(event); }));
        tracker = std::make_unique<VenueHealthTracker>(HealthConfig{}, &events, clock.fn());
    }

    void fills(const Venue& venue, int count, int latency_ms = 100) {
        for (int i = 0; i < count; ++i) {
            tracker->record_fill(venue, std::chrono::milliseconds(latency_ms));
            clock.advance(std::chrono::milliseconds(10));
        }
    }

    void failures(const Venue& venue, int count, ErrorKind kind = ErrorKind::LEG_REJECTED) {
        for (int i = 0; i < count; ++i) {
            tracker->record_failure(venue, kind);
            clock.advance(std::chrono::milliseconds(10));
        }
    }

    size_t alerts() const {
        size_t count = 0;
        for (const auto& event : pushed) {
            count += std::holds_alternative<AlertEvent>(event) ? 1 : 0;
        }
        return count;
    }

    static Path path_through(const Venue& first, const Venue& second) {
        Path path;
        path.start_asset = "USDT";
        path.legs = {Leg{first, Pair::parse("SOL/USDT"), OrderSide::BUY},
                     Leg{second, Pair::parse("SOL/USDT"), OrderSide::SELL}};
        return path;
    }

    ManualClock clock;
    NiceMock<mocks::MockEventPusher> events;
    std::vector<Event> pushed;
    std::unique_ptr<VenueHealthTracker> tracker;
};

TEST_F(VenueHealthTest, UnknownVenueIsHealthy) {
    VenueHealth health = tracker->health("kraken");
    EXPECT_EQ(health.venue, "kraken");
    EXPECT_EQ(health.samples, 0u);
    EXPECT_EQ(health.status, VenueStatus::HEALTHY);
    EXPECT_EQ(tracker->slowdown_factor("kraken"), 1);
    EXPECT_FALSE(tracker->is_paused("kraken"));
}

TEST_F(VenueHealthTest, ErrorRateAboveDegradedBandSlowsVenue) {
    fills("kraken", 8, 120);
    failures("kraken", 2, ErrorKind::LEG_TIMEOUT);

    VenueHealth health = tracker->health("kraken");
    EXPECT_EQ(health.samples, 10u);
    EXPECT_EQ(health.errors, 2u);
    EXPECT_EQ(health.error_rate_pct, dec("20"));
    EXPECT_EQ(health.average_fill_latency, std::chrono::milliseconds(120));
    EXPECT_EQ(health.status, VenueStatus::DEGRADED);
    EXPECT_EQ(tracker->slowdown_factor("kraken"), 4);
    EXPECT_FALSE(tracker->is_paused("kraken"));
    EXPECT_EQ(alerts(), 0u);
}

TEST_F(VenueHealthTest, HighErrorRatePausesVenueAndAlertsOnce) {
    fills("binanceus", 3);
    failures("binanceus", 2);

    EXPECT_EQ(tracker->health("binanceus").error_rate_pct, dec("40"));
    EXPECT_EQ(tracker->health("binanceus").status, VenueStatus::UNHEALTHY);
    EXPECT_TRUE(tracker->is_paused("binanceus"));
    ASSERT_EQ(alerts(), 1u);

    const auto& alert = std::get<AlertEvent>(pushed.front()).alert;
    EXPECT_EQ(alert.level, Alert::Level::WARNING);
    EXPECT_EQ(alert.kind, ErrorKind::VENUE_UNHEALTHY);
    EXPECT_NE(alert.title.find("binanceus"), std::string::npos);
    EXPECT_NE(alert.message.find("LegRejected"), std::string::npos);

    // Still unhealthy: no second alert.
    failures("binanceus", 1);
    EXPECT_EQ(alerts(), 1u);
}

TEST_F(VenueHealthTest, FewSamplesAreNotJudged) {
    failures("kraken", 4);

    VenueHealth health = tracker->health("kraken");
    EXPECT_EQ(health.error_rate_pct, dec("100"));
    EXPECT_EQ(health.status, VenueStatus::HEALTHY);
    EXPECT_FALSE(tracker->is_paused("kraken"));
}

TEST_F(VenueHealthTest, SlowFillsDegradeVenue) {
    fills("kraken", 5, 6000);

    VenueHealth health = tracker->health("kraken");
    EXPECT_EQ(health.errors, 0u);
    EXPECT_EQ(health.average_fill_latency, std::chrono::milliseconds(6000));
    EXPECT_EQ(health.status, VenueStatus::DEGRADED);
}

TEST_F(VenueHealthTest, FailuresAgeOutOfWindow) {
    failures("kraken", 5);
    ASSERT_TRUE(tracker->is_paused("kraken"));

    clock.advance(std::chrono::milliseconds(600001));

    EXPECT_EQ(tracker->health("kraken").samples, 0u);
    EXPECT_FALSE(tracker->is_paused("kraken"));
    EXPECT_EQ(tracker->slowdown_factor("kraken"), 1);
}

TEST_F(VenueHealthTest, WindowKeepsMostRecentOutcomes) {
    HealthConfig config;
    config.window = 5;
    tracker->configure(config);

    failures("kraken", 5);
    ASSERT_TRUE(tracker->is_paused("kraken"));
    fills("kraken", 5);

    VenueHealth health = tracker->health("kraken");
    EXPECT_EQ(health.samples, 5u);
    EXPECT_EQ(health.errors, 0u);
    EXPECT_EQ(health.status, VenueStatus::HEALTHY);
}

TEST_F(VenueHealthTest, PathTakesWorstVenue) {
    fills("kraken", 5, 6000);
    Path path = path_through("kraken", "binanceus");

    EXPECT_EQ(tracker->slowdown_factor(path), 4);
    EXPECT_FALSE(tracker->is_paused(path));

    failures("binanceus", 5);
    EXPECT_TRUE(tracker->is_paused(path));
    EXPECT_FALSE(tracker->is_paused(path_through("kraken", "kraken")));
}

TEST_F(VenueHealthTest, AllListsEveryRecordedVenue) {
    fills("kraken", 1);
    failures("binanceus", 1);

    auto all = tracker->all();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].venue, "binanceus");
    EXPECT_EQ(all[1].venue, "kraken");
}

TEST(VenueStatusTest, Names) {
    EXPECT_STREQ(to_string(VenueStatus::HEALTHY), "healthy");
    EXPECT_STREQ(to_string(VenueStatus::UNHEALTHY), "unhealthy");
}
