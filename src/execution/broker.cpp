#include "execution/broker.hpp"
#include "common/errors.hpp"
#include "utils/crypto.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace lumen {

// PaperBroker implementation

PaperBroker::PaperBroker(double max_slippage_bps)
    : max_slippage_bps_(max_slippage_bps)
{
}

Order PaperBroker::place(const OrderRequest& request, const Ticker& ticker) {
    if (request.quantity <= 0) {
        throw ValidationError("Order quantity must be positive: " + request.client_order_id);
    }

    double mid = (ticker.bid + ticker.ask) / 2.0;
    if (!std::isfinite(mid) || mid <= 0) {
        throw ValidationError("No usable quote for paper fill: " + request.symbol);
    }
    double slip = mid * std::min(max_slippage_bps_ / 10000.0, MAX_SLIPPAGE_FRACTION);

    if (request.type == OrderType::LIMIT && request.price) {
        double limit = *request.price;
        bool crosses = request.side == Side::BUY ? ticker.ask <= limit : ticker.bid >= limit;
        if (!crosses) {
            return make_order(request, OrderStatus::PENDING, std::nullopt);
        }
        return make_order(request, OrderStatus::FILLED, limit);
    }

    double fill_price = request.side == Side::BUY ? mid + slip : mid - slip;
    return make_order(request, OrderStatus::FILLED, fill_price);
}

Order PaperBroker::make_order(const OrderRequest& request, OrderStatus status,
                              std::optional<Price> fill_price) const {
    int64_t ts = now_ms();

    Order order;
    order.order_id = "paper-" + crypto::uuid_v4();
    order.client_order_id = request.client_order_id;
    order.symbol = request.symbol;
    order.side = request.side;
    order.type = request.type;
    order.quantity = request.quantity;
    order.price = request.price;
    order.status = status;
    order.filled_quantity = status == OrderStatus::FILLED ? request.quantity : 0.0;
    order.avg_fill_price = fill_price;
    order.created_at = ts;
    order.updated_at = ts;
    return order;
}

// LiveBroker implementation

LiveBroker::LiveBroker(ExchangeAdapter& exchange)
    : exchange_(exchange)
{
}

Order LiveBroker::place(const OrderRequest& request, const Ticker& /*ticker*/) {
    spdlog::info("LIVE order -> {}: {} {} {:.8f} ({})", exchange_.name(),
                 side_to_string(request.side), request.symbol, request.quantity,
                 request.client_order_id);

    Order order = exchange_.place_order(request);
    if (!order.client_order_id.empty() && order.client_order_id != request.client_order_id) {
        spdlog::warn("{} returned client id {} for {}", exchange_.name(),
                     order.client_order_id, request.client_order_id);
    }
    // Stored under the caller's key so retries of the same intent find it
    order.client_order_id = request.client_order_id;
    return order;
}

std::unique_ptr<Broker> make_broker(TradingMode mode,
                                    double max_slippage_bps,
                                    ExchangeAdapter* exchange) {
    if (mode == TradingMode::LIVE) {
        if (!exchange) {
            throw ValidationError("Live mode requires an exchange adapter");
        }
        return std::make_unique<LiveBroker>(*exchange);
    }
    return std::make_unique<PaperBroker>(max_slippage_bps);
}

} // namespace lumen
