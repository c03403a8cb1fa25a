#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace lumen {

enum class EventImpact {
    LOW,
    MEDIUM,
    HIGH
};

std::string impact_to_string(EventImpact impact);
EventImpact impact_from_string(const std::string& s);

/**
 * Scheduled macro or crypto event (FOMC, CPI, token unlock, ...).
 */
struct ScheduledEvent {
    std::string name;
    int64_t time{0};            // epoch ms
    std::string category;       // macro, crypto, earnings
    EventImpact impact{EventImpact::HIGH};
    int64_t lockout_before_ms{0};
    int64_t lockout_after_ms{0};
};

/**
 * Blocks trading inside [time - before, time + after] of scheduled events
 * whose impact is in the configured set.
 */
class EventLockout {
public:
    struct Config {
        int64_t default_lockout_before_ms{30 * 60 * 1000};
        int64_t default_lockout_after_ms{60 * 60 * 1000};
        std::set<EventImpact> lockout_impacts{EventImpact::HIGH};
        bool enabled{true};
    };

    struct Result {
        bool blocked{false};
        std::string reason;
        std::optional<ScheduledEvent> event;
    };

    EventLockout();
    explicit EventLockout(const Config& config);

    // Zero lockout windows are replaced by the configured defaults
    void add_event(ScheduledEvent event);
    void add_events(const std::vector<ScheduledEvent>& events);

    // Load a JSON array of {name, time (ISO 8601 or epoch ms), category, impact,
    // lockout_before_min?, lockout_after_min?}
    void load_calendar(const nlohmann::json& calendar);

    Result check(int64_t now) const;

    void prune_old_events(int64_t now);

    std::vector<ScheduledEvent> upcoming(int64_t now, int hours_ahead = 24) const;
    const std::vector<ScheduledEvent>& events() const { return events_; }

    void set_enabled(bool enabled) { config_.enabled = enabled; }

private:
    Config config_;
    std::vector<ScheduledEvent> events_;  // Sorted by time ascending
};

} // namespace lumen
