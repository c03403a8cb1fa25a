#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "execution/order.hpp"

namespace lumen {

/**
 * Result of a SELL fill that reduced or closed a long position.
 */
struct ClosedTrade {
    std::string symbol;
    Size quantity{0.0};
    Price entry_price{0.0};
    Price exit_price{0.0};
    Notional realized_pnl{0.0};

    bool won() const { return realized_pnl > 0.0; }
};

/**
 * Spot account between evaluation cycles: cash, long positions, daily
 * realized PnL, stop-out times and peak equity.
 *
 * Owned by the trading loop (single writer); guards only see the
 * AccountSnapshot copies it hands out.
 */
class AccountBook {
public:
    static constexpr double QTY_EPSILON = 1e-9;

    explicit AccountBook(double starting_cash);

    // Apply a filled order. Pending/rejected orders are ignored.
    std::optional<ClosedTrade> apply_fill(const Order& order, int64_t now = now_ms());

    // Mark positions to market; also refreshes peak equity
    void mark_to_market(const std::string& symbol, Price price);

    AccountSnapshot snapshot() const;

    double cash() const { return cash_; }
    Notional realized_pnl() const { return total_realized_pnl_; }
    Notional daily_realized_pnl() const { return daily_realized_pnl_; }
    Notional unrealized_pnl() const;
    Notional equity() const;
    Notional peak_equity() const { return peak_equity_; }

    std::optional<Position> get_position(const std::string& symbol) const;
    std::vector<Position> open_positions() const;

    int wins() const { return wins_; }
    int losses() const { return losses_; }

    // Start of trading day
    void reset_daily_pnl();

private:
    double cash_;
    std::map<std::string, Position> positions_;
    std::map<std::string, int64_t> last_stop_out_at_;

    Notional total_realized_pnl_{0.0};
    Notional daily_realized_pnl_{0.0};
    Notional peak_equity_{0.0};

    int wins_{0};
    int losses_{0};

    void update_peak();
};

} // namespace lumen
