#include "execution/order_manager.hpp"
#include "risk/guards.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace lumen {

OrderManager::OrderManager(const Config& config, OrderStore& store, Broker& broker, Metrics& metrics)
    : config_(config)
    , store_(store)
    , broker_(broker)
    , metrics_(metrics)
{
}

Size OrderManager::compute_quantity(double confidence, const Ticker& ticker) const {
    double target_usd = compute_position_usd(confidence, config_.risk.max_position_usd,
                                             config_.risk.min_order_usd);
    return std::max(MIN_QUANTITY, target_usd / std::max(ticker.last, 1.0));
}

std::optional<Order> OrderManager::submit_signal(const SubmitRequest& request) {
    const Signal& signal = request.signal;
    if (signal.action == SignalAction::HOLD) {
        return std::nullopt;
    }

    Side side = signal.action == SignalAction::BUY ? Side::BUY : Side::SELL;
    std::string client_order_id = request.idempotency_key
        ? *request.idempotency_key
        : generate_client_order_id(request.symbol, side);

    auto existing = store_.get_by_client_order_id(client_order_id);
    if (existing) {
        spdlog::info("Idempotent order request matched existing order: client_order_id={}, order_id={}",
                     client_order_id, existing->order_id);
        metrics_.increment("orders.idempotent_hit");
        return existing;
    }

    OrderRequest order_req;
    order_req.symbol = request.symbol;
    order_req.side = side;
    order_req.type = OrderType::MARKET;
    order_req.quantity = compute_quantity(signal.confidence, request.ticker);
    order_req.client_order_id = client_order_id;

    Order order;
    {
        ScopedLatency latency(metrics_, "order.submit_latency_ms");
        order = broker_.place(order_req, request.ticker);
    }
    if (order.reason.empty()) {
        order.reason = signal.reason;
    }

    store_.upsert(order);
    metrics_.increment("orders.submitted");

    spdlog::info("Order {} {} {} qty={:.8f} status={} fill={} ({})",
                 order.client_order_id, side_to_string(order.side), order.symbol,
                 order.quantity, order_status_to_string(order.status),
                 order.avg_fill_price ? fmt::format("{:.2f}", *order.avg_fill_price) : "-",
                 mode_to_string(broker_.mode()));
    return order;
}

std::optional<Order> OrderManager::cancel(const std::string& client_order_id) {
    auto order = store_.get_by_client_order_id(client_order_id);
    if (!order) return std::nullopt;
    if (order->is_terminal()) return order;

    order->mark_canceled();
    store_.upsert(*order);
    spdlog::info("Order {} canceled", client_order_id);
    return order;
}

} // namespace lumen
