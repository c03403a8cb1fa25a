#include "persistence/trading_database.hpp"
#include "common/errors.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <initializer_list>

namespace lumen {

namespace {

constexpr const char* ORDER_COLUMNS =
    "client_order_id, order_id, symbol, side, type, quantity, price, status, "
    "filled_quantity, avg_fill_price, reason, created_at, updated_at";

// Stored enum columns must hold exactly what upsert() wrote
template <typename E>
E column_enum(const std::string& text, const char* column, std::string (*to_string)(E),
              std::initializer_list<E> values) {
    for (E v : values) {
        if (to_string(v) == text) return v;
    }
    throw PersistenceError(std::string("Corrupt ") + column + " column: '" + text + "'");
}

} // namespace

// ============================================================================
// DATABASE IMPLEMENTATION
// ============================================================================

TradingDatabase::TradingDatabase(const std::string& db_path)
    : db_path_(db_path)
{
    std::filesystem::path parent = std::filesystem::path(db_path).parent_path();
    if (!parent.empty() && db_path != ":memory:") {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw PersistenceError("Failed to create database directory " + parent.string() +
                                   ": " + ec.message());
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw PersistenceError("Failed to open database: " + error);
    }

    // WAL mode for crash-safe appends
    execute("PRAGMA journal_mode = WAL;");
    execute("PRAGMA synchronous = FULL;");

    initialize_schema();

    spdlog::info("TradingDatabase opened: {}", db_path);
}

TradingDatabase::~TradingDatabase() {
    close();
}

bool TradingDatabase::is_open() const {
    return db_ != nullptr;
}

void TradingDatabase::close() {
    if (db_) {
        if (sqlite3_close(db_) != SQLITE_OK) {
            spdlog::warn("TradingDatabase close with unfinalized statements: {}", sqlite3_errmsg(db_));
            sqlite3_close_v2(db_);
        }
        db_ = nullptr;
        spdlog::debug("TradingDatabase closed");
    }
}

void TradingDatabase::execute(const std::string& sql) {
    if (!db_) {
        throw PersistenceError("Database is closed: " + db_path_);
    }

    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string error = errmsg ? errmsg : "Unknown error";
        sqlite3_free(errmsg);
        throw PersistenceError("SQL error: " + error + " in: " + sql);
    }
}

sqlite3_stmt* TradingDatabase::prepare(const std::string& sql) {
    if (!db_) {
        throw PersistenceError("Database is closed: " + db_path_);
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw PersistenceError("Failed to prepare statement: " +
                               std::string(sqlite3_errmsg(db_)));
    }
    return stmt;
}

void TradingDatabase::bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void TradingDatabase::bind_int64(sqlite3_stmt* stmt, int index, int64_t value) {
    sqlite3_bind_int64(stmt, index, value);
}

void TradingDatabase::bind_double(sqlite3_stmt* stmt, int index, double value) {
    sqlite3_bind_double(stmt, index, value);
}

void TradingDatabase::bind_null(sqlite3_stmt* stmt, int index) {
    sqlite3_bind_null(stmt, index);
}

void TradingDatabase::step_done(sqlite3_stmt* stmt, const std::string& what) {
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        finalize(stmt);
        throw PersistenceError(what + " failed: " + error);
    }
}

void TradingDatabase::finalize(sqlite3_stmt* stmt) {
    sqlite3_finalize(stmt);
}

std::string TradingDatabase::get_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

int64_t TradingDatabase::get_int64(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_int64(stmt, col);
}

double TradingDatabase::get_double(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_double(stmt, col);
}

bool TradingDatabase::is_null(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_type(stmt, col) == SQLITE_NULL;
}

// ============================================================================
// SCHEMA
// ============================================================================

void TradingDatabase::initialize_schema() {
    create_tables();
    create_indexes();
    spdlog::debug("Database schema initialized (version {})", get_schema_version());
}

void TradingDatabase::create_tables() {
    // Orders table
    execute(R"(
        CREATE TABLE IF NOT EXISTS orders (
            client_order_id TEXT PRIMARY KEY,
            order_id TEXT UNIQUE,
            symbol TEXT NOT NULL,
            side TEXT NOT NULL,
            type TEXT NOT NULL,
            quantity REAL NOT NULL,
            price REAL,
            status TEXT NOT NULL,
            filled_quantity REAL NOT NULL DEFAULT 0,
            avg_fill_price REAL,
            reason TEXT,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );
    )");

    // Kill switch row (one per id, normally "default")
    execute(R"(
        CREATE TABLE IF NOT EXISTS kill_switch (
            id TEXT PRIMARY KEY,
            triggered INTEGER NOT NULL DEFAULT 0,
            reason TEXT,
            triggered_at INTEGER,
            consecutive_losses INTEGER NOT NULL DEFAULT 0,
            spread_violations TEXT NOT NULL DEFAULT '[]',
            api_error_count INTEGER NOT NULL DEFAULT 0,
            updated_at INTEGER NOT NULL
        );
    )");

    // Schema version table
    execute(R"(
        CREATE TABLE IF NOT EXISTS schema_version (
            version INTEGER PRIMARY KEY
        );
    )");

    execute("INSERT OR IGNORE INTO schema_version (version) VALUES (1);");
}

void TradingDatabase::create_indexes() {
    execute("CREATE INDEX IF NOT EXISTS idx_orders_symbol_status ON orders(symbol, status);");
    execute("CREATE INDEX IF NOT EXISTS idx_orders_created ON orders(created_at DESC);");
}

int TradingDatabase::get_schema_version() {
    auto stmt = prepare("SELECT MAX(version) FROM schema_version;");
    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        version = static_cast<int>(get_int64(stmt, 0));
    }
    finalize(stmt);
    return version;
}

// ============================================================================
// ORDER OPERATIONS
// ============================================================================

void TradingDatabase::upsert(const Order& order) {
    if (order.client_order_id.empty()) {
        throw ValidationError("Cannot persist order without client_order_id");
    }

    auto stmt = prepare(R"(
        INSERT INTO orders (
            client_order_id, order_id, symbol, side, type, quantity, price, status,
            filled_quantity, avg_fill_price, reason, created_at, updated_at
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(client_order_id) DO UPDATE SET
            order_id = excluded.order_id,
            status = excluded.status,
            price = excluded.price,
            filled_quantity = excluded.filled_quantity,
            avg_fill_price = excluded.avg_fill_price,
            reason = excluded.reason,
            updated_at = excluded.updated_at;
    )");

    int64_t ts = now_ms();

    bind_text(stmt, 1, order.client_order_id);
    if (order.order_id.empty()) {
        bind_null(stmt, 2);
    } else {
        bind_text(stmt, 2, order.order_id);
    }
    bind_text(stmt, 3, order.symbol);
    bind_text(stmt, 4, side_to_string(order.side));
    bind_text(stmt, 5, order_type_to_string(order.type));
    bind_double(stmt, 6, order.quantity);
    if (order.price) {
        bind_double(stmt, 7, *order.price);
    } else {
        bind_null(stmt, 7);
    }
    bind_text(stmt, 8, order_status_to_string(order.status));
    bind_double(stmt, 9, order.filled_quantity);
    if (order.avg_fill_price) {
        bind_double(stmt, 10, *order.avg_fill_price);
    } else {
        bind_null(stmt, 10);
    }
    bind_text(stmt, 11, order.reason);
    bind_int64(stmt, 12, order.created_at ? order.created_at : ts);
    bind_int64(stmt, 13, order.updated_at ? order.updated_at : ts);

    step_done(stmt, "Upsert order " + order.client_order_id);
    finalize(stmt);
}

Order TradingDatabase::read_order(sqlite3_stmt* stmt) {
    Order o;
    o.client_order_id = get_text(stmt, 0);
    o.order_id = get_text(stmt, 1);
    o.symbol = get_text(stmt, 2);
    o.side = column_enum(get_text(stmt, 3), "side", &side_to_string, {Side::BUY, Side::SELL});
    o.type = column_enum(get_text(stmt, 4), "type", &order_type_to_string,
                         {OrderType::MARKET, OrderType::LIMIT});
    o.quantity = get_double(stmt, 5);
    if (!is_null(stmt, 6)) o.price = get_double(stmt, 6);
    o.status = column_enum(get_text(stmt, 7), "status", &order_status_to_string,
                           {OrderStatus::PENDING, OrderStatus::OPEN, OrderStatus::FILLED,
                            OrderStatus::CANCELED, OrderStatus::REJECTED});
    o.filled_quantity = get_double(stmt, 8);
    if (!is_null(stmt, 9)) o.avg_fill_price = get_double(stmt, 9);
    o.reason = get_text(stmt, 10);
    o.created_at = get_int64(stmt, 11);
    o.updated_at = get_int64(stmt, 12);
    return o;
}

std::vector<Order> TradingDatabase::query_orders(sqlite3_stmt* stmt) {
    std::vector<Order> orders;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        try {
            orders.push_back(read_order(stmt));
        } catch (const PersistenceError&) {
            finalize(stmt);
            throw;
        } catch (const std::exception& e) {
            finalize(stmt);
            throw PersistenceError(std::string("Failed to read order row: ") + e.what());
        }
    }
    if (rc != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        finalize(stmt);
        throw PersistenceError("Order query failed: " + error);
    }
    finalize(stmt);
    return orders;
}

std::optional<Order> TradingDatabase::get_by_client_order_id(const std::string& client_order_id) {
    auto stmt = prepare(std::string("SELECT ") + ORDER_COLUMNS +
                        " FROM orders WHERE client_order_id = ?;");
    bind_text(stmt, 1, client_order_id);

    auto rows = query_orders(stmt);
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

std::optional<Order> TradingDatabase::get_by_order_id(const std::string& order_id) {
    auto stmt = prepare(std::string("SELECT ") + ORDER_COLUMNS +
                        " FROM orders WHERE order_id = ?;");
    bind_text(stmt, 1, order_id);

    auto rows = query_orders(stmt);
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

std::vector<Order> TradingDatabase::open_orders(const std::optional<std::string>& symbol) {
    std::string sql = std::string("SELECT ") + ORDER_COLUMNS +
                      " FROM orders WHERE status IN ('pending', 'open')";
    if (symbol) sql += " AND symbol = ?";
    sql += " ORDER BY created_at ASC;";

    auto stmt = prepare(sql);
    if (symbol) bind_text(stmt, 1, *symbol);
    return query_orders(stmt);
}

std::vector<Order> TradingDatabase::all_orders() {
    auto stmt = prepare(std::string("SELECT ") + ORDER_COLUMNS +
                        " FROM orders ORDER BY created_at DESC;");
    return query_orders(stmt);
}

int64_t TradingDatabase::count_orders() {
    auto stmt = prepare("SELECT COUNT(*) FROM orders;");
    int64_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = get_int64(stmt, 0);
    }
    finalize(stmt);
    return count;
}

// ============================================================================
// KILL SWITCH OPERATIONS
// ============================================================================

std::string TradingDatabase::encode_violations(const std::vector<int64_t>& timestamps) {
    nlohmann::json j = nlohmann::json::array();
    for (int64_t ts : timestamps) {
        j.push_back({{"timestamp", ts}});
    }
    return j.dump();
}

std::vector<int64_t> TradingDatabase::decode_violations(const std::string& json) {
    std::vector<int64_t> out;
    try {
        auto j = nlohmann::json::parse(json.empty() ? "[]" : json);
        if (!j.is_array()) {
            throw PersistenceError("Corrupt spread_violations column: not an array");
        }
        for (const auto& item : j) {
            if (item.is_number_integer()) {
                out.push_back(item.get<int64_t>());
            } else if (item.is_object() && item.contains("timestamp")) {
                out.push_back(item.at("timestamp").get<int64_t>());
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError(std::string("Corrupt spread_violations column: ") + e.what());
    }
    return out;
}

std::optional<KillSwitchState> TradingDatabase::load(const std::string& id) {
    auto stmt = prepare(R"(
        SELECT triggered, reason, triggered_at, consecutive_losses,
               spread_violations, api_error_count
        FROM kill_switch WHERE id = ?;
    )");
    bind_text(stmt, 1, id);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        finalize(stmt);
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        std::string error = sqlite3_errmsg(db_);
        finalize(stmt);
        throw PersistenceError("Load kill switch failed: " + error);
    }

    KillSwitchState s;
    s.triggered = get_int64(stmt, 0) != 0;
    s.reason = get_text(stmt, 1);
    if (!is_null(stmt, 2)) s.triggered_at = get_int64(stmt, 2);
    s.consecutive_losses = static_cast<int>(get_int64(stmt, 3));
    std::string violations = get_text(stmt, 4);
    s.api_error_count = static_cast<int>(get_int64(stmt, 5));
    finalize(stmt);

    s.spread_violations = decode_violations(violations);
    return s;
}

void TradingDatabase::save(const std::string& id, const KillSwitchState& state) {
    auto stmt = prepare(R"(
        INSERT INTO kill_switch (
            id, triggered, reason, triggered_at, consecutive_losses,
            spread_violations, api_error_count, updated_at
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            triggered = excluded.triggered,
            reason = excluded.reason,
            triggered_at = excluded.triggered_at,
            consecutive_losses = excluded.consecutive_losses,
            spread_violations = excluded.spread_violations,
            api_error_count = excluded.api_error_count,
            updated_at = excluded.updated_at;
    )");

    bind_text(stmt, 1, id);
    bind_int64(stmt, 2, state.triggered ? 1 : 0);
    if (state.reason.empty()) {
        bind_null(stmt, 3);
    } else {
        bind_text(stmt, 3, state.reason);
    }
    if (state.triggered_at) {
        bind_int64(stmt, 4, *state.triggered_at);
    } else {
        bind_null(stmt, 4);
    }
    bind_int64(stmt, 5, state.consecutive_losses);
    bind_text(stmt, 6, encode_violations(state.spread_violations));
    bind_int64(stmt, 7, state.api_error_count);
    bind_int64(stmt, 8, now_ms());

    step_done(stmt, "Save kill switch " + id);
    finalize(stmt);
}

}  // namespace lumen
