#include "position/account_book.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace lumen {

AccountBook::AccountBook(double starting_cash)
    : cash_(starting_cash)
    , peak_equity_(starting_cash)
{
}

std::optional<ClosedTrade> AccountBook::apply_fill(const Order& order, int64_t now) {
    if (order.status != OrderStatus::FILLED || order.filled_quantity <= 0 || !order.avg_fill_price) {
        return std::nullopt;
    }

    const Price fill = *order.avg_fill_price;
    const Size qty = order.filled_quantity;

    if (order.side == Side::BUY) {
        auto& pos = positions_[order.symbol];
        double new_qty = pos.quantity + qty;
        pos.avg_entry_price = (pos.quantity * pos.avg_entry_price + qty * fill) / new_qty;
        pos.symbol = order.symbol;
        pos.quantity = new_qty;
        pos.market_price = fill;
        cash_ -= qty * fill;

        spdlog::debug("Position {}: qty={:.8f} avg={:.2f}", order.symbol, pos.quantity, pos.avg_entry_price);
        update_peak();
        return std::nullopt;
    }

    auto it = positions_.find(order.symbol);
    if (it == positions_.end()) {
        spdlog::warn("SELL fill for {} with no open position ignored", order.symbol);
        return std::nullopt;
    }

    Position& pos = it->second;
    Size closed = std::min(qty, pos.quantity);

    ClosedTrade trade;
    trade.symbol = order.symbol;
    trade.quantity = closed;
    trade.entry_price = pos.avg_entry_price;
    trade.exit_price = fill;
    trade.realized_pnl = (fill - pos.avg_entry_price) * closed;

    cash_ += closed * fill;
    total_realized_pnl_ += trade.realized_pnl;
    daily_realized_pnl_ += trade.realized_pnl;
    pos.quantity -= closed;
    pos.market_price = fill;

    if (trade.won()) {
        wins_++;
    } else {
        losses_++;
        last_stop_out_at_[order.symbol] = now;
    }

    if (pos.quantity <= QTY_EPSILON) {
        positions_.erase(it);
    }

    spdlog::info("Closed {:.8f} {} @ {:.2f} (entry {:.2f}) pnl=${:.2f}",
                 closed, trade.symbol, trade.exit_price, trade.entry_price, trade.realized_pnl);

    update_peak();
    return trade;
}

void AccountBook::mark_to_market(const std::string& symbol, Price price) {
    auto it = positions_.find(symbol);
    if (it != positions_.end() && price > 0) {
        it->second.market_price = price;
    }
    update_peak();
}

Notional AccountBook::unrealized_pnl() const {
    Notional total = 0.0;
    for (const auto& [symbol, pos] : positions_) {
        total += (pos.market_price - pos.avg_entry_price) * pos.quantity;
    }
    return total;
}

Notional AccountBook::equity() const {
    Notional value = cash_;
    for (const auto& [symbol, pos] : positions_) {
        value += pos.quantity * pos.market_price;
    }
    return value;
}

AccountSnapshot AccountBook::snapshot() const {
    AccountSnapshot s;
    s.cash_usd = cash_;
    s.realized_pnl_usd = daily_realized_pnl_;
    s.unrealized_pnl_usd = unrealized_pnl();
    s.open_positions = open_positions();
    s.last_stop_out_at = last_stop_out_at_;
    return s;
}

std::optional<Position> AccountBook::get_position(const std::string& symbol) const {
    auto it = positions_.find(symbol);
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

std::vector<Position> AccountBook::open_positions() const {
    std::vector<Position> out;
    out.reserve(positions_.size());
    for (const auto& [symbol, pos] : positions_) {
        out.push_back(pos);
    }
    return out;
}

void AccountBook::reset_daily_pnl() {
    spdlog::info("Daily PnL reset (was ${:.2f})", daily_realized_pnl_);
    daily_realized_pnl_ = 0.0;
}

void AccountBook::update_peak() {
    peak_equity_ = std::max(peak_equity_, equity());
}

} // namespace lumen
