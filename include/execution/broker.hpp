#pragma once

#include <memory>
#include <string>
#include "common/types.hpp"
#include "execution/order.hpp"
#include "market_data/exchange_adapter.hpp"

namespace lumen {

/**
 * Execution venue for sized order requests. Exactly two variants exist
 * (paper and live); the active one is chosen once at startup.
 */
class Broker {
public:
    virtual ~Broker() = default;

    virtual Order place(const OrderRequest& request, const Ticker& ticker) = 0;
    virtual TradingMode mode() const = 0;
};

/**
 * Simulated fills against the current ticker.
 *
 * Market orders fill at mid +/- mid * min(max_slippage_bps / 10000, 2%),
 * buys paying up and sells receiving less. Limit orders fill at the limit
 * price when the book already crosses it, otherwise stay pending.
 */
class PaperBroker : public Broker {
public:
    static constexpr double MAX_SLIPPAGE_FRACTION = 0.02;

    explicit PaperBroker(double max_slippage_bps);

    Order place(const OrderRequest& request, const Ticker& ticker) override;
    TradingMode mode() const override { return TradingMode::PAPER; }

private:
    double max_slippage_bps_;

    Order make_order(const OrderRequest& request, OrderStatus status,
                     std::optional<Price> fill_price) const;
};

/**
 * Forwards requests to the exchange adapter.
 */
class LiveBroker : public Broker {
public:
    explicit LiveBroker(ExchangeAdapter& exchange);

    Order place(const OrderRequest& request, const Ticker& ticker) override;
    TradingMode mode() const override { return TradingMode::LIVE; }

private:
    ExchangeAdapter& exchange_;
};

// Throws ValidationError for live mode without an adapter
std::unique_ptr<Broker> make_broker(TradingMode mode,
                                    double max_slippage_bps,
                                    ExchangeAdapter* exchange);

} // namespace lumen
