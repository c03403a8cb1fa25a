#pragma once

#include <iosfwd>
#include <map>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "engine/trading_loop.hpp"

namespace lumen {

/**
 * One recorded tick: the ticker, the strategy's signal and optionally the
 * candles closed since the previous tick.
 *
 * Line format (JSON):
 *   {"symbol":"BTC-USD",
 *    "ticker":{"bid":..,"ask":..,"last":..,"volume_24h":..,"time":<ms or ISO>},
 *    "signal":{"action":"BUY","confidence":0.7,"reason":"..."},
 *    "candles":[{"time":..,"open":..,"high":..,"low":..,"close":..,"volume":..,"interval":"1m"}]}
 */
struct ReplayEvent {
    std::string symbol;
    Ticker ticker;
    Signal signal;
    std::vector<Candle> candles;
};

// Throws ValidationError on a malformed line
ReplayEvent parse_replay_event(const std::string& line);

struct ReplayStats {
    int lines_processed{0};
    int lines_rejected{0};
    int signals{0};
    int orders_filled{0};
    int orders_pending{0};
    int blocked{0};
    int halted{0};
    int submit_errors{0};
    int anomalies{0};
    int trades_closed{0};
    int wins{0};
    double realized_pnl{0.0};
    double final_equity{0.0};
    double peak_equity{0.0};
    double max_drawdown_pct{0.0};
    std::map<std::string, int> blocks_by_code;
};

/**
 * Feeds recorded ticks through a TradingLoop in file order.
 *
 * Candle history is kept per symbol and capped at MAX_CANDLES.
 */
class Replayer {
public:
    static constexpr size_t MAX_CANDLES = 500;

    Replayer(TradingLoop& loop, AccountBook& book, bool verbose = false);

    void process(const ReplayEvent& event);
    ReplayStats run(std::istream& input);

    const ReplayStats& stats() const { return stats_; }

private:
    TradingLoop& loop_;
    AccountBook& book_;
    bool verbose_;
    ReplayStats stats_;
    std::map<std::string, std::vector<Candle>> history_;

    void append_candles(const std::string& symbol, const std::vector<Candle>& candles);
};

void print_replay_results(const ReplayStats& stats, std::ostream& out);

} // namespace lumen
