#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "core/kill_switch.hpp"
#include "execution/order_manager.hpp"
#include "execution/retry_executor.hpp"
#include "market_data/anomaly_detector.hpp"
#include "position/account_book.hpp"
#include "risk/risk_engine.hpp"
#include "utils/alerter.hpp"
#include "utils/metrics.hpp"

namespace lumen {

/**
 * Outcome of one evaluation cycle for one symbol.
 */
struct CycleResult {
    RiskDecision decision;
    std::vector<Anomaly> anomalies;
    std::optional<Order> order;
    std::optional<ClosedTrade> closed_trade;
    bool halted_by_kill_switch{false};
    std::string error;                 // Submission failure, empty on success
};

/**
 * Per-tick service loop: guards and anomaly checks, kill switch gate,
 * idempotent submission, and the feedback of outcomes into the kill switch.
 *
 * One cycle per symbol must finish before the next one for that symbol
 * starts. All collaborators are owned by the caller.
 */
class TradingLoop {
public:
    TradingLoop(const Config& config,
                RiskEngine& risk,
                KillSwitch& kill_switch,
                OrderManager& orders,
                RetryExecutor& retry,
                AnomalyDetector& anomalies,
                AccountBook& book,
                Metrics& metrics,
                AlertService* alerts = nullptr);

    // PersistenceError propagates; other submission failures land in CycleResult::error
    CycleResult run_cycle(const std::string& symbol,
                          const Ticker& ticker,
                          const std::vector<Candle>& candles,
                          const Signal& signal,
                          int64_t now = now_ms());

    int64_t cycles() const { return cycles_; }

private:
    const Config& config_;
    RiskEngine& risk_;
    KillSwitch& kill_switch_;
    OrderManager& orders_;
    RetryExecutor& retry_;
    AnomalyDetector& anomalies_;
    AccountBook& book_;
    Metrics& metrics_;
    AlertService* alerts_;

    int64_t cycles_{0};

    void alert(AlertSeverity severity, const std::string& title, const std::string& message,
               const std::map<std::string, std::string>& metadata = {});
    void run_anomaly_checks(const std::string& symbol, const Ticker& ticker,
                            const std::vector<Candle>& candles, int64_t now, CycleResult& result);
    void submit(const std::string& symbol, const Ticker& ticker, const Signal& signal,
                int64_t now, CycleResult& result);
    void export_gauges();
};

} // namespace lumen
