#include <gtest/gtest.h>
#include <vector>
#include "event_detector.h"
#include "track_fixtures.h"

using namespace fixtures;
using regatta::DetectorConfig;
using regatta::Event;
using regatta::EventDetector;
using regatta::EventType;
using regatta::WindReference;

static WindReference wind_from(double twd) {
    WindReference w;
    w.twd_deg = twd;
    return w;
}

static DetectorConfig no_cooldown() {
    DetectorConfig cfg;
    cfg.cooldown_s = 0.0;
    return cfg;
}

// ============================================================================
// Test Suite: WindRelative
// ============================================================================

TEST(WindRelative, TackThroughTheBow) {
    auto samples = samples_from_headings(concat(repeat(45.0, 10), repeat(315.0, 10)));
    auto events = EventDetector().detect(7, samples, wind_from(0.0));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, EventType::TACK);
    EXPECT_EQ(events[0].boat_id, 7);
    // First sample on the new side
    EXPECT_EQ(events[0].t, samples[10].t);
    EXPECT_NEAR(events[0].heading_change_deg, -90.0, 1e-9);
}

TEST(WindRelative, GybeThroughTheStern) {
    auto samples = samples_from_headings(concat(repeat(135.0, 10), repeat(225.0, 10)));
    auto events = EventDetector().detect(1, samples, wind_from(0.0));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, EventType::GYBE);
}

TEST(WindRelative, WindAcrossNorth) {
    auto samples = samples_from_headings(concat(repeat(35.0, 10), repeat(305.0, 10)));
    auto events = EventDetector().detect(1, samples, wind_from(350.0));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, EventType::TACK);
}

TEST(WindRelative, SideHeldForDwellCounts) {
    auto h = concat(concat(repeat(45.0, 10), repeat(315.0, 3)), repeat(45.0, 10));
    auto events = EventDetector(no_cooldown()).detect(1, samples_from_headings(h), wind_from(0.0));
    EXPECT_EQ(events.size(), 2u);
}

TEST(WindRelative, SideShorterThanDwellIgnored) {
    auto h = concat(concat(repeat(45.0, 10), repeat(315.0, 2)), repeat(45.0, 10));
    auto events = EventDetector(no_cooldown()).detect(1, samples_from_headings(h), wind_from(0.0));
    EXPECT_TRUE(events.empty());
}

TEST(WindRelative, SingleSampleBlipIgnored) {
    auto h = concat(concat(repeat(45.0, 10), repeat(315.0, 1)), repeat(45.0, 10));
    auto events = EventDetector().detect(1, samples_from_headings(h), wind_from(0.0));
    EXPECT_TRUE(events.empty());
}

TEST(WindRelative, InitialSideIsNotAnEvent) {
    auto events = EventDetector().detect(1, samples_from_headings(repeat(315.0, 30)), wind_from(0.0));
    EXPECT_TRUE(events.empty());
}

TEST(WindRelative, CooldownKeepsFirstOfBurst) {
    auto h = concat(concat(repeat(45.0, 10), repeat(315.0, 4)), repeat(45.0, 10));
    auto samples = samples_from_headings(h);
    auto events = EventDetector().detect(1, samples, wind_from(0.0));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].t, samples[10].t);
}

TEST(WindRelative, EventsSpacedBeyondCooldownAllKept) {
    std::vector<double> h;
    for (int i = 0; i < 6; ++i) h = concat(h, repeat(i % 2 == 0 ? 45.0 : 315.0, 10));
    auto events = EventDetector().detect(1, samples_from_headings(h), wind_from(0.0));
    ASSERT_EQ(events.size(), 5u);
    for (size_t i = 1; i < events.size(); ++i) {
        EXPECT_GT(events[i].t, events[i - 1].t);
    }
}

TEST(WindRelative, NoSamplesNoEvents) {
    EXPECT_TRUE(EventDetector().detect(1, {}, wind_from(0.0)).empty());
}

// ============================================================================
// Test Suite: HeadingSwingFallback
// ============================================================================

TEST(HeadingSwingFallback, LargeTurnIsManeuver) {
    auto samples = samples_from_headings(concat(repeat(45.0, 20), repeat(315.0, 20)));
    auto events = EventDetector().detect(3, samples, WindReference());
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, EventType::MANEUVER);
    EXPECT_NEAR(events[0].heading_change_deg, -90.0, 1e-9);
    EXPECT_EQ(events[0].t, samples[15].t);
}

TEST(HeadingSwingFallback, SmallTurnIgnored) {
    auto samples = samples_from_headings(concat(repeat(45.0, 20), repeat(80.0, 20)));
    EXPECT_TRUE(EventDetector().detect(3, samples, WindReference()).empty());
}

TEST(HeadingSwingFallback, RearmsBetweenTurns) {
    auto h = concat(concat(repeat(45.0, 20), repeat(315.0, 20)), repeat(45.0, 20));
    auto events = EventDetector().detect(3, samples_from_headings(h), WindReference());
    EXPECT_EQ(events.size(), 2u);
}

TEST(HeadingSwingFallback, TwsAloneStillFallsBack) {
    WindReference wind;
    wind.tws_kt = 12.0;
    auto samples = samples_from_headings(concat(repeat(45.0, 20), repeat(315.0, 20)));
    auto events = EventDetector().detect(3, samples, wind);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, EventType::MANEUVER);
}
