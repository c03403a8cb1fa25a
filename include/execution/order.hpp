#pragma once

#include <string>
#include <optional>
#include "common/types.hpp"

namespace lumen {

/**
 * Order representation with lifecycle tracking.
 *
 * Keyed by client_order_id (the idempotency key). Orders are never deleted;
 * status changes are written back through OrderStore::upsert.
 */
struct Order {
    // Identifiers
    std::string order_id;          // Broker-assigned ID
    std::string client_order_id;   // Idempotency key

    // Order details
    std::string symbol;
    Side side{Side::BUY};
    OrderType type{OrderType::MARKET};
    Size quantity{0.0};
    std::optional<Price> price;

    // State
    OrderStatus status{OrderStatus::PENDING};
    Size filled_quantity{0.0};
    std::optional<Price> avg_fill_price;
    std::string reason;            // Signal reason or reject reason

    // Timing (epoch ms)
    int64_t created_at{0};
    int64_t updated_at{0};

    bool is_terminal() const;
    bool is_open() const;
    Notional filled_notional() const;

    // State transitions
    void mark_filled(Price fill_price, int64_t at = now_ms());
    void mark_canceled(int64_t at = now_ms());
    void mark_rejected(const std::string& why, int64_t at = now_ms());
};

/**
 * Generate client order ID: {symbol}-{side}-{epochMillis}-{8 hex chars}.
 */
std::string generate_client_order_id(const std::string& symbol, Side side, int64_t at = now_ms());

} // namespace lumen
