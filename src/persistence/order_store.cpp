#include "persistence/order_store.hpp"
#include <algorithm>

namespace lumen {

void InMemoryOrderStore::upsert(const Order& order) {
    orders_[order.client_order_id] = order;
    upserts_++;
}

std::optional<Order> InMemoryOrderStore::get_by_client_order_id(const std::string& client_order_id) {
    auto it = orders_.find(client_order_id);
    if (it == orders_.end()) return std::nullopt;
    return it->second;
}

std::optional<Order> InMemoryOrderStore::get_by_order_id(const std::string& order_id) {
    for (const auto& [key, order] : orders_) {
        if (order.order_id == order_id) return order;
    }
    return std::nullopt;
}

std::vector<Order> InMemoryOrderStore::open_orders(const std::optional<std::string>& symbol) {
    std::vector<Order> result;
    for (const auto& [key, order] : orders_) {
        if (!order.is_open()) continue;
        if (symbol && order.symbol != *symbol) continue;
        result.push_back(order);
    }
    return result;
}

std::vector<Order> InMemoryOrderStore::all_orders() {
    std::vector<Order> result;
    result.reserve(orders_.size());
    for (const auto& [key, order] : orders_) {
        result.push_back(order);
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const Order& a, const Order& b) { return a.created_at > b.created_at; });
    return result;
}

} // namespace lumen
