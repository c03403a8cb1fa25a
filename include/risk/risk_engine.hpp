#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "risk/event_lockout.hpp"
#include "risk/volatility_guard.hpp"

namespace lumen {

struct RiskInput {
    Signal signal;
    std::string symbol;
    const AccountSnapshot* snapshot{nullptr};
    Ticker ticker;
    int64_t now{0};                            // epoch ms
    const std::vector<Candle>* candles{nullptr};
    std::optional<double> leverage;
};

/**
 * Composes the pure guards into one pre-trade decision.
 *
 * Checks run in a fixed order and stop at the first failure, which tags
 * the decision with its BlockedBy code. Never throws for a blocked trade.
 */
class RiskEngine {
public:
    explicit RiskEngine(const Config& config);

    RiskDecision evaluate(const RiskInput& input) const;

    // Sized BUY notional the position check compares against the cap
    double incoming_order_usd(const Signal& signal) const;

    EventLockout& event_lockout() { return event_lockout_; }
    const VolatilityGuard& volatility_guard() const { return volatility_guard_; }

private:
    const Config& config_;
    VolatilityGuard volatility_guard_;
    EventLockout event_lockout_;
};

} // namespace lumen
