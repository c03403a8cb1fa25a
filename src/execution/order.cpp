#include "execution/order.hpp"
#include "utils/crypto.hpp"

namespace lumen {

bool Order::is_terminal() const {
    return status == OrderStatus::FILLED ||
           status == OrderStatus::CANCELED ||
           status == OrderStatus::REJECTED;
}

bool Order::is_open() const {
    return status == OrderStatus::PENDING || status == OrderStatus::OPEN;
}

Notional Order::filled_notional() const {
    return filled_quantity * avg_fill_price.value_or(0.0);
}

void Order::mark_filled(Price fill_price, int64_t at) {
    status = OrderStatus::FILLED;
    filled_quantity = quantity;
    avg_fill_price = fill_price;
    updated_at = at;
}

void Order::mark_canceled(int64_t at) {
    status = OrderStatus::CANCELED;
    updated_at = at;
}

void Order::mark_rejected(const std::string& why, int64_t at) {
    status = OrderStatus::REJECTED;
    reason = why;
    updated_at = at;
}

std::string generate_client_order_id(const std::string& symbol, Side side, int64_t at) {
    return symbol + "-" + side_to_string(side) + "-" + std::to_string(at) + "-" +
           crypto::random_hex(4);
}

} // namespace lumen
