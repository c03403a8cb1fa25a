#pragma once

#include <string>
#include <vector>
#include <functional>
#include <optional>
#include "common/types.hpp"
#include "config/config.hpp"
#include "utils/metrics.hpp"

namespace lumen {

class KillSwitchRepository;

/**
 * Durable kill switch row.
 */
struct KillSwitchState {
    bool triggered{false};
    std::string reason;                       // Empty while armed
    std::optional<int64_t> triggered_at;      // epoch ms
    int consecutive_losses{0};
    std::vector<int64_t> spread_violations;   // epoch ms, ascending
    int api_error_count{0};
};

/**
 * Kill switch event for audit trail.
 */
struct KillEvent {
    int64_t timestamp{0};
    std::string details;
    bool is_activation{false};  // true = triggered, false = reset
};

/**
 * Two-state machine (armed / triggered) that halts new submissions.
 *
 * DESIGN PRINCIPLES:
 * - Triggering is sticky: the first reason and time win, later triggers are no-ops
 * - Only an explicit reset() re-arms
 * - Every state-changing call invokes the persist hook before returning
 * - Single writer (the trading loop), no internal locking
 */
class KillSwitch {
public:
    using Callback = std::function<void(const std::string& reason)>;
    using PersistFn = std::function<void(const KillSwitchState&)>;

    KillSwitch(const KillSwitchLimits& limits, Metrics& metrics);

    // Hydrate from the repository, or create the default armed row
    void init(KillSwitchRepository& repo, const std::string& id = "default");

    // Write the current state to the repository
    void persist(KillSwitchRepository& repo, const std::string& id = "default") const;

    void set_persist_fn(PersistFn fn) { persist_fn_ = std::move(fn); }
    void set_callback(Callback cb) { callback_ = std::move(cb); }

    // Core state queries
    bool is_triggered() const { return state_.triggered; }
    const KillSwitchState& state() const { return state_; }

    // Returns true if this call moved armed -> triggered
    bool trigger(const std::string& reason, int64_t now = now_ms());

    // Explicit operator reset; clears every field
    void reset(const std::string& operator_note = "");

    // Condition feeds. Each returns true if the kill switch was just triggered.
    bool record_trade_result(bool won);
    bool check_drawdown(double current_equity, double peak_equity);
    bool record_spread_violation(int64_t now = now_ms());
    bool check_api_errors(int error_count);

    // Spread violations still inside the trailing window at `now`
    int active_spread_violations(int64_t now = now_ms()) const;

    // Audit trail (in-memory, bounded)
    const std::vector<KillEvent>& event_history() const { return event_history_; }

    const KillSwitchLimits& limits() const { return limits_; }

private:
    KillSwitchLimits limits_;
    Metrics& metrics_;
    KillSwitchState state_;

    Callback callback_;
    PersistFn persist_fn_;

    std::vector<KillEvent> event_history_;

    int64_t window_ms() const;
    void prune_spread_violations(int64_t now);
    void emit_persist();
    void record_event(int64_t timestamp, const std::string& details, bool is_activation);
    void invoke_callback(const std::string& reason);
};

} // namespace lumen
