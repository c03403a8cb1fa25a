#include "core/kill_switch.hpp"
#include "persistence/kill_switch_repository.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace lumen {

KillSwitch::KillSwitch(const KillSwitchLimits& limits, Metrics& metrics)
    : limits_(limits)
    , metrics_(metrics)
{
    spdlog::debug("KillSwitch initialized: max_drawdown={:.2f}%, max_losses={}, api_errors={}, "
                  "spread_violations={} per {}min",
                  limits.max_drawdown_pct, limits.max_consecutive_losses,
                  limits.api_error_threshold, limits.spread_violations_limit,
                  limits.spread_violations_window_min);
}

void KillSwitch::init(KillSwitchRepository& repo, const std::string& id) {
    auto loaded = repo.load(id);
    if (loaded) {
        state_ = *loaded;
    } else {
        state_ = KillSwitchState{};
        repo.save(id, state_);
    }

    if (state_.triggered) {
        spdlog::warn("Kill switch is active from previous session: reason={}", state_.reason);
    }
}

void KillSwitch::persist(KillSwitchRepository& repo, const std::string& id) const {
    repo.save(id, state_);
}

bool KillSwitch::trigger(const std::string& reason, int64_t now) {
    if (state_.triggered) {
        spdlog::debug("KillSwitch already triggered, ignoring: {}", reason);
        return false;
    }

    state_.triggered = true;
    state_.reason = reason;
    state_.triggered_at = now;

    spdlog::critical("KILL SWITCH TRIGGERED: {}", reason);
    metrics_.increment("kill_switch.triggered");
    record_event(now, reason, true);

    emit_persist();
    invoke_callback(reason);
    return true;
}

void KillSwitch::reset(const std::string& operator_note) {
    std::string prev_reason = state_.reason;
    state_ = KillSwitchState{};

    spdlog::warn("Kill switch reset by operator: {} (previous reason: {})",
                 operator_note.empty() ? "-" : operator_note,
                 prev_reason.empty() ? "-" : prev_reason);
    metrics_.increment("kill_switch.reset");
    record_event(now_ms(), operator_note, false);

    emit_persist();
}

bool KillSwitch::record_trade_result(bool won) {
    if (won) {
        state_.consecutive_losses = 0;
    } else {
        state_.consecutive_losses++;
    }
    emit_persist();

    if (state_.consecutive_losses >= limits_.max_consecutive_losses) {
        return trigger(fmt::format("{} consecutive losses", state_.consecutive_losses));
    }
    return false;
}

bool KillSwitch::check_drawdown(double current_equity, double peak_equity) {
    if (peak_equity <= 0) return false;

    double drawdown_pct = (peak_equity - current_equity) / peak_equity * 100.0;
    if (drawdown_pct >= limits_.max_drawdown_pct) {
        return trigger(fmt::format("Drawdown {:.2f}% exceeds {:.2f}% threshold",
                                   drawdown_pct, limits_.max_drawdown_pct));
    }
    return false;
}

bool KillSwitch::record_spread_violation(int64_t now) {
    state_.spread_violations.push_back(now);
    std::sort(state_.spread_violations.begin(), state_.spread_violations.end());
    prune_spread_violations(now);
    emit_persist();

    int count = static_cast<int>(state_.spread_violations.size());
    spdlog::warn("Spread/slippage violation {}/{} in {}min window",
                 count, limits_.spread_violations_limit, limits_.spread_violations_window_min);

    if (count >= limits_.spread_violations_limit) {
        return trigger(fmt::format("{} spread/slippage violations in {} minutes",
                                   count, limits_.spread_violations_window_min), now);
    }
    return false;
}

bool KillSwitch::check_api_errors(int error_count) {
    if (state_.api_error_count != error_count) {
        state_.api_error_count = error_count;
        emit_persist();
    }

    if (error_count >= limits_.api_error_threshold) {
        return trigger(fmt::format("API error count {} exceeds threshold {}",
                                   error_count, limits_.api_error_threshold));
    }
    return false;
}

int KillSwitch::active_spread_violations(int64_t now) const {
    int64_t window = window_ms();
    return static_cast<int>(std::count_if(
        state_.spread_violations.begin(), state_.spread_violations.end(),
        [&](int64_t t) { return now - t < window; }));
}

int64_t KillSwitch::window_ms() const {
    return static_cast<int64_t>(limits_.spread_violations_window_min) * 60 * 1000;
}

void KillSwitch::prune_spread_violations(int64_t now) {
    int64_t window = window_ms();
    auto& v = state_.spread_violations;
    v.erase(std::remove_if(v.begin(), v.end(),
                           [&](int64_t t) { return now - t >= window; }),
            v.end());
}

void KillSwitch::emit_persist() {
    if (persist_fn_) {
        persist_fn_(state_);
    }
}

void KillSwitch::record_event(int64_t timestamp, const std::string& details, bool is_activation) {
    event_history_.push_back(KillEvent{timestamp, details, is_activation});

    // Keep history bounded
    if (event_history_.size() > 1000) {
        event_history_.erase(event_history_.begin(), event_history_.begin() + 500);
    }
}

void KillSwitch::invoke_callback(const std::string& reason) {
    if (callback_) {
        try {
            callback_(reason);
        } catch (const std::exception& e) {
            spdlog::error("KillSwitch callback error: {}", e.what());
        }
    }
}

} // namespace lumen
