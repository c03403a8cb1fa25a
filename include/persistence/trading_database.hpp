#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include "persistence/order_store.hpp"
#include "persistence/kill_switch_repository.hpp"

// Forward declare sqlite3
struct sqlite3;
struct sqlite3_stmt;

namespace lumen {

// ============================================================================
// TRADING DATABASE
//
// Durable store for orders (keyed by client_order_id) and the kill switch
// row. Writes are synchronous; every SQLite failure surfaces as a
// PersistenceError so the caller never proceeds on an unwritten state.
// All timestamps are UTC epoch milliseconds.
// ============================================================================

class TradingDatabase : public OrderStore, public KillSwitchRepository {
public:
    explicit TradingDatabase(const std::string& db_path);
    ~TradingDatabase() override;

    // Non-copyable
    TradingDatabase(const TradingDatabase&) = delete;
    TradingDatabase& operator=(const TradingDatabase&) = delete;

    // Connection management
    bool is_open() const;
    void close();

    // Schema management
    void initialize_schema();
    int get_schema_version();

    // OrderStore
    void upsert(const Order& order) override;
    std::optional<Order> get_by_client_order_id(const std::string& client_order_id) override;
    std::optional<Order> get_by_order_id(const std::string& order_id) override;
    std::vector<Order> open_orders(const std::optional<std::string>& symbol = std::nullopt) override;
    std::vector<Order> all_orders() override;
    int64_t count_orders();

    // KillSwitchRepository
    std::optional<KillSwitchState> load(const std::string& id) override;
    void save(const std::string& id, const KillSwitchState& state) override;

    // Utility
    void execute(const std::string& sql);

    static std::string encode_violations(const std::vector<int64_t>& timestamps);
    static std::vector<int64_t> decode_violations(const std::string& json);

private:
    sqlite3* db_{nullptr};
    std::string db_path_;

    // Statement preparation helpers
    sqlite3_stmt* prepare(const std::string& sql);
    void bind_text(sqlite3_stmt* stmt, int index, const std::string& value);
    void bind_int64(sqlite3_stmt* stmt, int index, int64_t value);
    void bind_double(sqlite3_stmt* stmt, int index, double value);
    void bind_null(sqlite3_stmt* stmt, int index);
    void step_done(sqlite3_stmt* stmt, const std::string& what);
    void finalize(sqlite3_stmt* stmt);

    // Result extraction helpers
    std::string get_text(sqlite3_stmt* stmt, int col);
    int64_t get_int64(sqlite3_stmt* stmt, int col);
    double get_double(sqlite3_stmt* stmt, int col);
    bool is_null(sqlite3_stmt* stmt, int col);

    Order read_order(sqlite3_stmt* stmt);
    std::vector<Order> query_orders(sqlite3_stmt* stmt);

    void create_tables();
    void create_indexes();
};

}  // namespace lumen
