#pragma once

#include <optional>
#include <string>
#include "common/types.hpp"
#include "config/config.hpp"
#include "execution/broker.hpp"
#include "execution/order.hpp"
#include "persistence/order_store.hpp"
#include "utils/metrics.hpp"

namespace lumen {

struct SubmitRequest {
    std::string symbol;
    Signal signal;
    Ticker ticker;
    std::optional<std::string> idempotency_key;
};

/**
 * Turns a cleared signal into at most one persisted order per
 * client_order_id.
 *
 * Broker and store failures propagate to the caller. The order is
 * persisted before submit_signal returns.
 */
class OrderManager {
public:
    static constexpr double MIN_QUANTITY = 0.000001;

    OrderManager(const Config& config, OrderStore& store, Broker& broker, Metrics& metrics);

    // HOLD -> nullopt with no side effects
    std::optional<Order> submit_signal(const SubmitRequest& request);

    // Sized quantity for a confidence at the given ticker
    Size compute_quantity(double confidence, const Ticker& ticker) const;

    // Mark a stored order canceled (status change only, no venue call)
    std::optional<Order> cancel(const std::string& client_order_id);

    TradingMode mode() const { return broker_.mode(); }

private:
    const Config& config_;
    OrderStore& store_;
    Broker& broker_;
    Metrics& metrics_;
};

} // namespace lumen
