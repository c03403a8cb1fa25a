#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "execution/order.hpp"

namespace lumen {

/**
 * Generic exchange capability.
 *
 * Calls block the calling thread until the venue answers. Implementations
 * throw TransientError for timeouts, connection resets, 5xx and rate-limit
 * responses, and LumenError (or ValidationError) for anything else.
 */
class ExchangeAdapter {
public:
    virtual ~ExchangeAdapter() = default;

    virtual std::string name() const = 0;

    virtual Ticker get_ticker(const std::string& symbol) = 0;
    virtual std::vector<Candle> get_candles(const std::string& symbol,
                                            const std::string& interval,
                                            int limit) = 0;

    virtual Order place_order(const OrderRequest& request) = 0;
    virtual void cancel_order(const std::string& order_id) = 0;
    virtual Order get_order(const std::string& order_id) = 0;
    virtual std::vector<Order> list_open_orders(const std::optional<std::string>& symbol = std::nullopt) = 0;
    virtual std::vector<Balance> get_balances() = 0;
};

} // namespace lumen
