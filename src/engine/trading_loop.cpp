#include "engine/trading_loop.hpp"
#include "common/errors.hpp"
#include <spdlog/spdlog.h>

namespace lumen {

TradingLoop::TradingLoop(const Config& config,
                         RiskEngine& risk,
                         KillSwitch& kill_switch,
                         OrderManager& orders,
                         RetryExecutor& retry,
                         AnomalyDetector& anomalies,
                         AccountBook& book,
                         Metrics& metrics,
                         AlertService* alerts)
    : config_(config)
    , risk_(risk)
    , kill_switch_(kill_switch)
    , orders_(orders)
    , retry_(retry)
    , anomalies_(anomalies)
    , book_(book)
    , metrics_(metrics)
    , alerts_(alerts)
{
    if (alerts_) {
        kill_switch_.set_callback([this](const std::string& reason) {
            alert(AlertSeverity::CRITICAL, "Kill switch triggered", reason);
        });
    }

    // A halt restored from storage never passes through trigger()
    if (kill_switch_.is_triggered()) {
        const auto& st = kill_switch_.state();
        std::map<std::string, std::string> meta;
        if (st.triggered_at) meta["triggered_at"] = std::to_string(*st.triggered_at);
        alert(AlertSeverity::CRITICAL, "Kill switch active from previous session", st.reason, meta);
    }
}

void TradingLoop::alert(AlertSeverity severity, const std::string& title, const std::string& message,
                        const std::map<std::string, std::string>& metadata) {
    if (!alerts_) return;
    try {
        alerts_->notify(severity, title, message, metadata);
    } catch (const std::exception& e) {
        spdlog::error("Alert delivery failed for '{}': {}", title, e.what());
    }
}

CycleResult TradingLoop::run_cycle(const std::string& symbol,
                                   const Ticker& ticker,
                                   const std::vector<Candle>& candles,
                                   const Signal& signal,
                                   int64_t now) {
    CycleResult result;
    cycles_++;

    // 1. Mark to market
    if (ticker.last > 0) {
        book_.mark_to_market(symbol, ticker.last);
    }

    // 2. Anomalies (observe only)
    run_anomaly_checks(symbol, ticker, candles, now, result);

    // 3. Risk evaluation on a fresh snapshot
    AccountSnapshot snapshot = book_.snapshot();
    RiskInput input;
    input.signal = signal;
    input.symbol = symbol;
    input.snapshot = &snapshot;
    input.ticker = ticker;
    input.now = now;
    input.candles = &candles;
    result.decision = risk_.evaluate(input);

    if (!result.decision.allowed) {
        if (result.decision.blocked_by) {
            BlockedBy code = *result.decision.blocked_by;
            metrics_.increment("risk.blocked");
            spdlog::info("{} {} blocked by {}: {}", symbol, action_to_string(signal.action),
                         blocked_by_to_string(code), result.decision.reason);

            if (code == BlockedBy::SPREAD_GUARD || code == BlockedBy::SLIPPAGE_GUARD) {
                kill_switch_.record_spread_violation(now);
            }
        } else if (signal.action != SignalAction::HOLD) {
            spdlog::info("{} {} skipped: {}", symbol, action_to_string(signal.action),
                         result.decision.reason);
        }
    } else if (kill_switch_.is_triggered()) {
        // 4. Kill switch gate
        result.halted_by_kill_switch = true;
        spdlog::warn("{} {} not submitted, kill switch active: {}", symbol,
                     action_to_string(signal.action), kill_switch_.state().reason);
    } else {
        // 5-6. Submit and book the fill
        submit(symbol, ticker, signal, now, result);
    }

    // 7. Drawdown feed
    kill_switch_.check_drawdown(book_.equity(), book_.peak_equity());

    // 8. Gauges
    export_gauges();

    return result;
}

void TradingLoop::run_anomaly_checks(const std::string& symbol, const Ticker& ticker,
                                     const std::vector<Candle>& candles, int64_t now,
                                     CycleResult& result) {
    result.anomalies = anomalies_.check_ticker(ticker);
    if (!candles.empty()) {
        auto from_candles = anomalies_.check_candles(candles, now);
        result.anomalies.insert(result.anomalies.end(), from_candles.begin(), from_candles.end());
    }

    for (const auto& a : result.anomalies) {
        metrics_.increment("anomaly.detected");
        spdlog::warn("Anomaly {} [{}] on {}: {}", anomaly_type_to_string(a.type),
                     anomaly_severity_to_string(a.severity), symbol, a.message);

        if (a.severity == AnomalySeverity::HIGH) {
            alert(AlertSeverity::WARNING, "Market anomaly: " + anomaly_type_to_string(a.type), a.message,
                  {{"symbol", symbol}, {"value", fmt::format("{:.4f}", a.value)},
                   {"threshold", fmt::format("{:.4f}", a.threshold)}});
        }
    }
}

void TradingLoop::submit(const std::string& symbol, const Ticker& ticker, const Signal& signal,
                         int64_t now, CycleResult& result) {
    Side side = signal.action == SignalAction::BUY ? Side::BUY : Side::SELL;

    // Fixed before the first attempt so every retry reuses the same key
    SubmitRequest req{symbol, signal, ticker, generate_client_order_id(symbol, side, now)};

    try {
        result.order = retry_.execute([&] { return orders_.submit_signal(req); },
                                      "submit_order " + symbol);
    } catch (const PersistenceError& e) {
        kill_switch_.check_api_errors(retry_.api_error_count());
        alert(AlertSeverity::CRITICAL, "Order persistence failed", e.what(), {{"symbol", symbol}});
        throw;
    } catch (const LumenError& e) {
        result.error = fmt::format("{}: {}", e.code(), e.what());
        spdlog::error("Order submission for {} failed: {}", symbol, result.error);
        alert(AlertSeverity::ERROR, "Order submission failed", result.error, {{"symbol", symbol}});
    }

    kill_switch_.check_api_errors(retry_.api_error_count());

    if (!result.order) return;

    result.closed_trade = book_.apply_fill(*result.order, now);
    if (result.closed_trade) {
        kill_switch_.record_trade_result(result.closed_trade->won());
    }
}

void TradingLoop::export_gauges() {
    metrics_.gauge("equity.current", book_.equity());
    metrics_.gauge("equity.peak", book_.peak_equity());
    metrics_.gauge("kill_switch.active", kill_switch_.is_triggered() ? 1.0 : 0.0);
    metrics_.gauge("positions.open", static_cast<double>(book_.open_positions().size()));
}

} // namespace lumen
