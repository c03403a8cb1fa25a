#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "execution/order.hpp"

namespace lumen {

/**
 * Durable order storage keyed by client_order_id.
 */
class OrderStore {
public:
    virtual ~OrderStore() = default;

    // Insert or replace the row with the same client_order_id
    virtual void upsert(const Order& order) = 0;

    virtual std::optional<Order> get_by_client_order_id(const std::string& client_order_id) = 0;
    virtual std::optional<Order> get_by_order_id(const std::string& order_id) = 0;

    // Pending or open orders, optionally for one symbol
    virtual std::vector<Order> open_orders(const std::optional<std::string>& symbol = std::nullopt) = 0;

    // Newest first
    virtual std::vector<Order> all_orders() = 0;
};

class InMemoryOrderStore : public OrderStore {
public:
    void upsert(const Order& order) override;
    std::optional<Order> get_by_client_order_id(const std::string& client_order_id) override;
    std::optional<Order> get_by_order_id(const std::string& order_id) override;
    std::vector<Order> open_orders(const std::optional<std::string>& symbol = std::nullopt) override;
    std::vector<Order> all_orders() override;

    size_t size() const { return orders_.size(); }
    int upsert_count() const { return upserts_; }

private:
    std::map<std::string, Order> orders_;
    int upserts_{0};
};

} // namespace lumen
