#include "risk/guards.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace lumen {

bool exceeds_max_daily_loss(const AccountSnapshot& snapshot, double max_loss_usd) {
    double pnl = snapshot.realized_pnl_usd + snapshot.unrealized_pnl_usd;
    return pnl <= -std::abs(max_loss_usd);
}

bool exceeds_max_open_positions(const AccountSnapshot& snapshot, int max_open_positions,
                                const std::string& symbol) {
    if (snapshot.find_position(symbol)) return false;
    return static_cast<int>(snapshot.open_positions.size()) >= max_open_positions;
}

bool exceeds_max_position_usd(const AccountSnapshot& snapshot,
                              const std::string& symbol,
                              double max_position_usd,
                              std::optional<Price> current_price,
                              double incoming_order_usd) {
    const Position* position = snapshot.find_position(symbol);
    if (!position) {
        return incoming_order_usd >= max_position_usd;
    }

    double price = current_price.value_or(position->market_price);
    double existing = std::abs(position->quantity * price);
    return existing + incoming_order_usd >= max_position_usd;
}

double compute_spread_bps(const Ticker& ticker) {
    double mid = (ticker.ask + ticker.bid) / 2.0;
    if (!std::isfinite(mid) || mid <= 0) return std::numeric_limits<double>::infinity();
    return (ticker.ask - ticker.bid) / mid * 10000.0;
}

double estimate_slippage_bps(const Ticker& ticker) {
    double mid = (ticker.ask + ticker.bid) / 2.0;
    if (!std::isfinite(mid) || mid <= 0 || !std::isfinite(ticker.last)) {
        return std::numeric_limits<double>::infinity();
    }
    return std::abs(ticker.last - mid) / mid * 10000.0;
}

double compute_position_usd(double confidence, double max_position_usd, double floor_usd) {
    double scaled = max_position_usd * std::clamp(confidence, 0.0, 1.0);
    return std::max(floor_usd, scaled);
}

} // namespace lumen
