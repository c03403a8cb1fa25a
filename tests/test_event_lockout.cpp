#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "risk/event_lockout.hpp"
#include "test_helpers.hpp"

using namespace lumen;
using namespace lumen::testing_helpers;

namespace {

ScheduledEvent event_at(const std::string& name, int64_t time, EventImpact impact = EventImpact::HIGH) {
    ScheduledEvent e;
    e.name = name;
    e.time = time;
    e.category = "macro";
    e.impact = impact;
    return e;
}

} // namespace

TEST(EventLockoutTest, NoEventsNoLockout) {
    EventLockout lockout;
    EXPECT_FALSE(lockout.check(T0).blocked);
}

TEST(EventLockoutTest, DefaultWindowBeforeAndAfter) {
    EventLockout lockout;
    lockout.add_event(event_at("CPI", T0));

    EXPECT_FALSE(lockout.check(T0 - 31 * MINUTE).blocked);
    EXPECT_TRUE(lockout.check(T0 - 30 * MINUTE).blocked);
    EXPECT_TRUE(lockout.check(T0 + 60 * MINUTE).blocked);
    EXPECT_FALSE(lockout.check(T0 + 61 * MINUTE).blocked);
}

TEST(EventLockoutTest, ReasonNamesEvent) {
    EventLockout lockout;
    lockout.add_event(event_at("FOMC", T0));
    auto r = lockout.check(T0 - 10 * MINUTE);
    ASSERT_TRUE(r.blocked);
    EXPECT_NE(r.reason.find("FOMC"), std::string::npos);
    EXPECT_NE(r.reason.find("before"), std::string::npos);
    ASSERT_TRUE(r.event.has_value());
    EXPECT_EQ(r.event->name, "FOMC");
}

TEST(EventLockoutTest, LowImpactIgnoredByDefault) {
    EventLockout lockout;
    lockout.add_event(event_at("Minor", T0, EventImpact::LOW));
    EXPECT_FALSE(lockout.check(T0).blocked);
}

TEST(EventLockoutTest, DisabledNeverBlocks) {
    EventLockout lockout;
    lockout.add_event(event_at("CPI", T0));
    lockout.set_enabled(false);
    EXPECT_FALSE(lockout.check(T0).blocked);
}

TEST(EventLockoutTest, EventsKeptSorted) {
    EventLockout lockout;
    lockout.add_event(event_at("B", T0 + 2 * MINUTE));
    lockout.add_event(event_at("A", T0 + 1 * MINUTE));
    lockout.add_event(event_at("C", T0 + 3 * MINUTE));
    ASSERT_EQ(lockout.events().size(), 3u);
    EXPECT_EQ(lockout.events()[0].name, "A");
    EXPECT_EQ(lockout.events()[2].name, "C");
}

TEST(EventLockoutTest, PruneAndUpcoming) {
    EventLockout lockout;
    lockout.add_event(event_at("Old", T0 - 5 * 60 * MINUTE));
    lockout.add_event(event_at("Soon", T0 + 2 * 60 * MINUTE));
    lockout.add_event(event_at("Later", T0 + 48 * 60 * MINUTE));

    lockout.prune_old_events(T0);
    EXPECT_EQ(lockout.events().size(), 2u);

    auto next = lockout.upcoming(T0, 24);
    ASSERT_EQ(next.size(), 1u);
    EXPECT_EQ(next[0].name, "Soon");
}

TEST(EventLockoutTest, LoadCalendarAcceptsIsoAndEpoch) {
    EventLockout lockout;
    auto calendar = nlohmann::json::parse(R"([
        {"name": "CPI", "time": "2023-11-14T22:13:20Z", "impact": "high", "lockout_before_min": 5},
        {"name": "Unlock", "time": 1700003600000, "category": "crypto", "impact": "medium"}
    ])");
    lockout.load_calendar(calendar);

    ASSERT_EQ(lockout.events().size(), 2u);
    EXPECT_EQ(lockout.events()[0].time, T0);
    EXPECT_EQ(lockout.events()[0].lockout_before_ms, 5 * MINUTE);
    EXPECT_FALSE(lockout.check(T0 - 6 * MINUTE).blocked);
    EXPECT_TRUE(lockout.check(T0 - 5 * MINUTE).blocked);
}

TEST(EventLockoutTest, LoadCalendarRejectsMalformedInput) {
    EventLockout lockout;
    EXPECT_THROW(lockout.load_calendar(nlohmann::json::object()), ValidationError);
    EXPECT_THROW(lockout.load_calendar(nlohmann::json::parse(R"([{"name": "x"}])")), ValidationError);
    EXPECT_THROW(lockout.load_calendar(nlohmann::json::parse(R"([{"name": "x", "time": "soon"}])")),
                 ValidationError);
}
