#include "risk/risk_engine.hpp"
#include "common/errors.hpp"
#include "risk/guards.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace lumen {

namespace {

VolatilityGuard::Config volatility_config(const GuardConfig& guards) {
    VolatilityGuard::Config c;
    c.atr_multiplier_threshold = guards.volatility_atr_threshold;
    return c;
}

EventLockout::Config lockout_config(const GuardConfig& guards) {
    EventLockout::Config c;
    c.enabled = guards.event_lockout_enabled;
    return c;
}

} // namespace

RiskEngine::RiskEngine(const Config& config)
    : config_(config)
    , volatility_guard_(volatility_config(config.guards))
    , event_lockout_(lockout_config(config.guards))
{
}

double RiskEngine::incoming_order_usd(const Signal& signal) const {
    if (signal.action != SignalAction::BUY) return 0.0;
    return compute_position_usd(signal.confidence, config_.risk.max_position_usd,
                                config_.risk.min_order_usd);
}

RiskDecision RiskEngine::evaluate(const RiskInput& input) const {
    if (!input.snapshot) {
        throw ValidationError("RiskEngine::evaluate requires an account snapshot");
    }

    const Signal& signal = input.signal;
    const AccountSnapshot& snapshot = *input.snapshot;
    const Ticker& ticker = input.ticker;
    const bool live = config_.mode == TradingMode::LIVE;

    // 1. Static operator kill flag
    if (live && config_.kill_switch) {
        return RiskDecision::block("Kill switch enabled", BlockedBy::KILL_SWITCH);
    }

    // 2. Live trading gate
    if (live && !config_.allow_live_trading) {
        return RiskDecision::block("Live trading disabled by config", BlockedBy::LIVE_DISABLED);
    }

    // 3. HOLD = no action
    if (signal.action == SignalAction::HOLD) {
        return RiskDecision::block("No action signal");
    }

    // 4. Pair whitelist
    const auto& allowed = config_.risk.allowed_pairs;
    if (!allowed.empty() && std::find(allowed.begin(), allowed.end(), input.symbol) == allowed.end()) {
        return RiskDecision::block(fmt::format("Pair {} not in whitelist", input.symbol),
                                   BlockedBy::PAIR_NOT_WHITELISTED);
    }

    // 5. No selling what we do not hold
    if (signal.action == SignalAction::SELL) {
        const Position* pos = snapshot.find_position(input.symbol);
        if (!pos || pos->quantity <= 0) {
            return RiskDecision::block("No position to sell");
        }
    }

    // 6. Max daily loss
    if (exceeds_max_daily_loss(snapshot, config_.risk.max_daily_loss_usd)) {
        return RiskDecision::block("Max daily loss reached", BlockedBy::MAX_DAILY_LOSS);
    }

    // 7. Max open positions
    if (exceeds_max_open_positions(snapshot, config_.risk.max_open_positions, input.symbol)) {
        return RiskDecision::block("Max open positions reached", BlockedBy::MAX_OPEN_POSITIONS);
    }

    // 8. Max position size
    if (exceeds_max_position_usd(snapshot, input.symbol, config_.risk.max_position_usd,
                                 ticker.last, incoming_order_usd(signal))) {
        return RiskDecision::block("Max position exceeded", BlockedBy::MAX_POSITION_USD);
    }

    // 9. Cooldown after stop-out
    auto stop_it = snapshot.last_stop_out_at.find(input.symbol);
    if (stop_it != snapshot.last_stop_out_at.end() && stop_it->second > 0) {
        int64_t cooldown_ms = static_cast<int64_t>(config_.risk.cooldown_minutes) * 60 * 1000;
        if (input.now - stop_it->second < cooldown_ms) {
            return RiskDecision::block("Cooldown active after stop-out", BlockedBy::COOLDOWN);
        }
    }

    // 10. Volume guard (unknown volume passes)
    if (ticker.volume_24h && *ticker.volume_24h < config_.guards.min_volume) {
        return RiskDecision::block("Volume below minimum guard", BlockedBy::MIN_VOLUME);
    }

    // 11. Spread guard (infinity and NaN block)
    double spread_bps = compute_spread_bps(ticker);
    if (!(spread_bps <= config_.guards.max_spread_bps)) {
        return RiskDecision::block(fmt::format("Spread guard blocked: {:.1f}bps > {:.1f}bps",
                                               spread_bps, config_.guards.max_spread_bps),
                                   BlockedBy::SPREAD_GUARD);
    }

    // 12. Slippage guard
    double slippage_bps = estimate_slippage_bps(ticker);
    if (!(slippage_bps <= config_.guards.max_slippage_bps)) {
        return RiskDecision::block(fmt::format("Slippage guard blocked: {:.1f}bps > {:.1f}bps",
                                               slippage_bps, config_.guards.max_slippage_bps),
                                   BlockedBy::SLIPPAGE_GUARD);
    }

    // 13. Max leverage
    if (input.leverage && *input.leverage > config_.risk.max_leverage) {
        return RiskDecision::block(fmt::format("Leverage {}x exceeds max {}x",
                                               *input.leverage, config_.risk.max_leverage),
                                   BlockedBy::MAX_LEVERAGE);
    }

    // 14. Volatility circuit breaker
    if (input.candles && !input.candles->empty()) {
        auto vol = volatility_guard_.check(*input.candles);
        if (vol.blocked) {
            return RiskDecision::block(vol.reason, BlockedBy::VOLATILITY_CIRCUIT_BREAKER);
        }
    }

    // 15. Event lockout
    auto lockout = event_lockout_.check(input.now);
    if (lockout.blocked) {
        return RiskDecision::block(lockout.reason, BlockedBy::EVENT_LOCKOUT);
    }

    return RiskDecision::allow("All 15 risk checks passed");
}

} // namespace lumen
