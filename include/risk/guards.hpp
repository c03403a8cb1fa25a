#pragma once

#include <optional>
#include <string>
#include "common/types.hpp"

namespace lumen {

// Pure risk predicates. No I/O, no state; safe to call from any thread.

// realized + unrealized <= -|max_loss_usd|
bool exceeds_max_daily_loss(const AccountSnapshot& snapshot, double max_loss_usd);

// True only when a brand-new symbol would push the count to or past max.
// Adding to a held symbol is never blocked here; per-symbol size is
// capped by exceeds_max_position_usd.
bool exceeds_max_open_positions(const AccountSnapshot& snapshot, int max_open_positions,
                                const std::string& symbol);

// |qty * (current_price or stored market price)| + incoming >= max_usd.
// With no existing position only incoming_order_usd is compared.
bool exceeds_max_position_usd(const AccountSnapshot& snapshot,
                              const std::string& symbol,
                              double max_position_usd,
                              std::optional<Price> current_price = std::nullopt,
                              double incoming_order_usd = 0.0);

// (ask - bid) / mid * 10000; +inf when mid <= 0
double compute_spread_bps(const Ticker& ticker);

// |last - mid| / mid * 10000; +inf when mid <= 0
double estimate_slippage_bps(const Ticker& ticker);

// max(floor_usd, max_position_usd * clamp(confidence, 0, 1))
double compute_position_usd(double confidence, double max_position_usd, double floor_usd = 25.0);

} // namespace lumen
