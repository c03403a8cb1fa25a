#include "risk/event_lockout.hpp"
#include "common/errors.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace lumen {

std::string impact_to_string(EventImpact impact) {
    switch (impact) {
        case EventImpact::LOW: return "low";
        case EventImpact::MEDIUM: return "medium";
        case EventImpact::HIGH: return "high";
    }
    return "high";
}

EventImpact impact_from_string(const std::string& s) {
    if (s == "low") return EventImpact::LOW;
    if (s == "medium") return EventImpact::MEDIUM;
    return EventImpact::HIGH;
}

EventLockout::EventLockout()
    : EventLockout(Config{})
{
}

EventLockout::EventLockout(const Config& config)
    : config_(config)
{
}

void EventLockout::add_event(ScheduledEvent event) {
    if (event.lockout_before_ms <= 0) event.lockout_before_ms = config_.default_lockout_before_ms;
    if (event.lockout_after_ms <= 0) event.lockout_after_ms = config_.default_lockout_after_ms;

    auto pos = std::upper_bound(events_.begin(), events_.end(), event.time,
                                [](int64_t t, const ScheduledEvent& e) { return t < e.time; });
    events_.insert(pos, std::move(event));
}

void EventLockout::add_events(const std::vector<ScheduledEvent>& events) {
    for (const auto& e : events) {
        add_event(e);
    }
}

void EventLockout::load_calendar(const nlohmann::json& calendar) {
    if (!calendar.is_array()) {
        throw ValidationError("Event calendar must be a JSON array");
    }

    for (const auto& item : calendar) {
        if (!item.contains("name") || !item.contains("time")) {
            throw ValidationError("Calendar event requires name and time");
        }

        ScheduledEvent e;
        e.name = item.at("name").get<std::string>();
        const auto& t = item.at("time");
        e.time = t.is_string() ? time_utils::parse_iso8601_ms(t.get<std::string>())
                               : t.get<int64_t>();
        e.category = item.value("category", std::string("macro"));
        e.impact = impact_from_string(item.value("impact", std::string("high")));
        e.lockout_before_ms = item.value("lockout_before_min", int64_t{0}) * 60 * 1000;
        e.lockout_after_ms = item.value("lockout_after_min", int64_t{0}) * 60 * 1000;
        add_event(std::move(e));
    }

    spdlog::info("Event calendar loaded: {} events", events_.size());
}

EventLockout::Result EventLockout::check(int64_t now) const {
    Result result;

    if (!config_.enabled) {
        result.reason = "Event lockout disabled";
        return result;
    }

    for (const auto& event : events_) {
        if (config_.lockout_impacts.count(event.impact) == 0) continue;

        int64_t start = event.time - event.lockout_before_ms;
        int64_t end = event.time + event.lockout_after_ms;

        if (now >= start && now <= end) {
            long minutes = std::lround(std::abs(static_cast<double>(event.time - now)) / 60000.0);
            result.blocked = true;
            result.reason = fmt::format("Event lockout: {} ({} min {}) [{} impact]",
                                        event.name, minutes,
                                        now < event.time ? "before" : "after",
                                        impact_to_string(event.impact));
            result.event = event;
            return result;
        }
    }

    result.reason = "No active event lockout";
    return result;
}

void EventLockout::prune_old_events(int64_t now) {
    events_.erase(std::remove_if(events_.begin(), events_.end(),
                                 [now](const ScheduledEvent& e) {
                                     return e.time + e.lockout_after_ms <= now;
                                 }),
                  events_.end());
}

std::vector<ScheduledEvent> EventLockout::upcoming(int64_t now, int hours_ahead) const {
    int64_t cutoff = now + static_cast<int64_t>(hours_ahead) * 3600 * 1000;
    std::vector<ScheduledEvent> out;
    for (const auto& e : events_) {
        if (e.time >= now && e.time <= cutoff) out.push_back(e);
    }
    return out;
}

} // namespace lumen
