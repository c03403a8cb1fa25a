#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "core/kill_switch.hpp"
#include "execution/order_manager.hpp"
#include "persistence/trading_database.hpp"
#include "utils/crypto.hpp"
#include "test_helpers.hpp"
#include <filesystem>

using namespace lumen;
using namespace lumen::testing_helpers;

class TradingDatabaseTest : public ::testing::Test {
protected:
    std::string test_db_path_;

    void SetUp() override {
        test_db_path_ = "/tmp/test_lumen_db_" + crypto::uuid_v4() + ".sqlite";
    }

    void TearDown() override {
        if (std::filesystem::exists(test_db_path_)) {
            std::filesystem::remove(test_db_path_);
        }
        std::filesystem::remove(test_db_path_ + "-wal");
        std::filesystem::remove(test_db_path_ + "-shm");
    }

    static Order make_order(const std::string& cid, const std::string& oid,
                            OrderStatus status = OrderStatus::FILLED,
                            const std::string& symbol = "BTC-USD", int64_t at = T0) {
        Order o;
        o.client_order_id = cid;
        o.order_id = oid;
        o.symbol = symbol;
        o.side = Side::BUY;
        o.type = OrderType::MARKET;
        o.quantity = 0.0025;
        o.status = status;
        if (status == OrderStatus::FILLED) {
            o.filled_quantity = o.quantity;
            o.avg_fill_price = 50100.0;
        }
        o.reason = "momentum";
        o.created_at = at;
        o.updated_at = at;
        return o;
    }
};

// ============================================================================
// Schema
// ============================================================================

TEST_F(TradingDatabaseTest, OpensAndInitializesSchema) {
    TradingDatabase db(test_db_path_);
    EXPECT_TRUE(db.is_open());
    EXPECT_EQ(db.get_schema_version(), 1);

    db.initialize_schema();   // Idempotent
    EXPECT_EQ(db.get_schema_version(), 1);
}

TEST_F(TradingDatabaseTest, CreatesParentDirectory) {
    std::string dir = "/tmp/test_lumen_dir_" + crypto::uuid_v4();
    {
        TradingDatabase db(dir + "/nested/lumen.sqlite");
        EXPECT_TRUE(db.is_open());
    }
    EXPECT_TRUE(std::filesystem::exists(dir + "/nested/lumen.sqlite"));
    std::filesystem::remove_all(dir);
}

TEST_F(TradingDatabaseTest, ClosedDatabaseThrows) {
    TradingDatabase db(test_db_path_);
    db.close();
    EXPECT_THROW(db.count_orders(), PersistenceError);
}

// ============================================================================
// Orders
// ============================================================================

TEST_F(TradingDatabaseTest, UpsertAndReadBack) {
    TradingDatabase db(test_db_path_);
    db.upsert(make_order("cid-1", "ex-1"));

    auto o = db.get_by_client_order_id("cid-1");
    ASSERT_TRUE(o.has_value());
    EXPECT_EQ(o->order_id, "ex-1");
    EXPECT_EQ(o->symbol, "BTC-USD");
    EXPECT_EQ(o->side, Side::BUY);
    EXPECT_EQ(o->status, OrderStatus::FILLED);
    EXPECT_DOUBLE_EQ(o->quantity, 0.0025);
    EXPECT_FALSE(o->price.has_value());
    ASSERT_TRUE(o->avg_fill_price.has_value());
    EXPECT_DOUBLE_EQ(*o->avg_fill_price, 50100.0);
    EXPECT_EQ(o->reason, "momentum");
    EXPECT_EQ(o->created_at, T0);

    auto by_oid = db.get_by_order_id("ex-1");
    ASSERT_TRUE(by_oid.has_value());
    EXPECT_EQ(by_oid->client_order_id, "cid-1");
}

TEST_F(TradingDatabaseTest, UpsertSameKeyUpdatesSingleRow) {
    TradingDatabase db(test_db_path_);
    db.upsert(make_order("cid-1", "ex-1", OrderStatus::OPEN));

    Order updated = make_order("cid-1", "ex-1", OrderStatus::FILLED, "BTC-USD", T0 + 1000);
    db.upsert(updated);

    EXPECT_EQ(db.count_orders(), 1);
    EXPECT_EQ(db.get_by_client_order_id("cid-1")->status, OrderStatus::FILLED);
    EXPECT_EQ(db.get_by_client_order_id("cid-1")->updated_at, T0 + 1000);
}

TEST_F(TradingDatabaseTest, OrdersWithoutExchangeIdCoexist) {
    TradingDatabase db(test_db_path_);
    db.upsert(make_order("cid-1", "", OrderStatus::PENDING));
    db.upsert(make_order("cid-2", "", OrderStatus::PENDING));
    EXPECT_EQ(db.count_orders(), 2);
    EXPECT_FALSE(db.get_by_order_id("").has_value());
}

TEST_F(TradingDatabaseTest, OpenOrdersFilter) {
    TradingDatabase db(test_db_path_);
    db.upsert(make_order("a", "1", OrderStatus::OPEN, "BTC-USD"));
    db.upsert(make_order("b", "2", OrderStatus::PENDING, "ETH-USD"));
    db.upsert(make_order("c", "3", OrderStatus::FILLED, "BTC-USD"));

    EXPECT_EQ(db.open_orders().size(), 2u);
    auto btc = db.open_orders(std::string("BTC-USD"));
    ASSERT_EQ(btc.size(), 1u);
    EXPECT_EQ(btc[0].client_order_id, "a");
}

TEST_F(TradingDatabaseTest, AllOrdersNewestFirst) {
    TradingDatabase db(test_db_path_);
    db.upsert(make_order("old", "1", OrderStatus::FILLED, "BTC-USD", T0));
    db.upsert(make_order("new", "2", OrderStatus::FILLED, "BTC-USD", T0 + 5000));

    auto all = db.all_orders();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].client_order_id, "new");
}

TEST_F(TradingDatabaseTest, OrdersSurviveReopen) {
    {
        TradingDatabase db(test_db_path_);
        db.upsert(make_order("cid-1", "ex-1"));
    }
    TradingDatabase db(test_db_path_);
    EXPECT_TRUE(db.get_by_client_order_id("cid-1").has_value());
}

TEST_F(TradingDatabaseTest, DuplicateSubmitYieldsOneRow) {
    TradingDatabase db(test_db_path_);
    Config config;
    PaperBroker broker(20.0);
    MetricsRegistry metrics;
    OrderManager manager(config, db, broker, metrics);

    SubmitRequest req{"BTC-USD", make_signal(SignalAction::BUY), tight_ticker(), std::string("dup-key")};
    manager.submit_signal(req);
    manager.submit_signal(req);

    EXPECT_EQ(db.count_orders(), 1);
}

// ============================================================================
// Kill switch row
// ============================================================================

TEST_F(TradingDatabaseTest, MissingKillSwitchRow) {
    TradingDatabase db(test_db_path_);
    EXPECT_FALSE(db.load("default").has_value());
}

TEST_F(TradingDatabaseTest, KillSwitchRoundTrip) {
    KillSwitchState state;
    state.triggered = true;
    state.reason = "3 consecutive losses";
    state.triggered_at = T0;
    state.consecutive_losses = 3;
    state.spread_violations = {T0 - 2000, T0 - 1000};
    state.api_error_count = 2;

    {
        TradingDatabase db(test_db_path_);
        db.save("default", state);
    }

    TradingDatabase db(test_db_path_);
    auto loaded = db.load("default");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded->triggered);
    EXPECT_EQ(loaded->reason, "3 consecutive losses");
    EXPECT_EQ(loaded->triggered_at, T0);
    EXPECT_EQ(loaded->consecutive_losses, 3);
    EXPECT_EQ(loaded->spread_violations, state.spread_violations);
    EXPECT_EQ(loaded->api_error_count, 2);
}

TEST_F(TradingDatabaseTest, ArmedRowHasNoTriggerTime) {
    TradingDatabase db(test_db_path_);
    db.save("default", KillSwitchState{});
    auto loaded = db.load("default");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_FALSE(loaded->triggered);
    EXPECT_FALSE(loaded->triggered_at.has_value());
    EXPECT_TRUE(loaded->spread_violations.empty());
}

TEST_F(TradingDatabaseTest, KillSwitchHydratesFromDatabase) {
    MetricsRegistry metrics;
    KillSwitchLimits limits;
    {
        TradingDatabase db(test_db_path_);
        KillSwitch ks(limits, metrics);
        ks.init(db);
        ks.set_persist_fn([&db](const KillSwitchState& s) { db.save("default", s); });
        ks.trigger("Drawdown 6.00% exceeds 5.00% threshold", T0);
    }

    TradingDatabase db(test_db_path_);
    KillSwitch ks(limits, metrics);
    ks.init(db);
    EXPECT_TRUE(ks.is_triggered());
    EXPECT_EQ(ks.state().reason, "Drawdown 6.00% exceeds 5.00% threshold");
}

TEST_F(TradingDatabaseTest, ViolationCodecAcceptsBothShapes) {
    auto encoded = TradingDatabase::encode_violations({T0, T0 + 1});
    EXPECT_EQ(TradingDatabase::decode_violations(encoded), (std::vector<int64_t>{T0, T0 + 1}));
    EXPECT_EQ(TradingDatabase::decode_violations("[5, 6]"), (std::vector<int64_t>{5, 6}));
}

// ============================================================================
// Corrupt rows
// ============================================================================

TEST_F(TradingDatabaseTest, UnknownSideInRowThrowsPersistenceError) {
    TradingDatabase db(test_db_path_);
    db.upsert(make_order("cid-1", "ex-1"));
    db.execute("UPDATE orders SET side = 'short' WHERE client_order_id = 'cid-1';");

    EXPECT_THROW(db.get_by_client_order_id("cid-1"), PersistenceError);
    EXPECT_THROW(db.all_orders(), PersistenceError);
}

TEST_F(TradingDatabaseTest, UnknownStatusInRowThrowsPersistenceError) {
    TradingDatabase db(test_db_path_);
    db.upsert(make_order("cid-1", "ex-1", OrderStatus::OPEN));
    db.execute("UPDATE orders SET status = 'halfway' WHERE client_order_id = 'cid-1';");

    EXPECT_THROW(db.open_orders(), PersistenceError);
}

TEST_F(TradingDatabaseTest, DatabaseStaysUsableAfterCorruptRead) {
    TradingDatabase db(test_db_path_);
    db.upsert(make_order("cid-1", "ex-1"));
    db.execute("UPDATE orders SET type = '???' WHERE client_order_id = 'cid-1';");
    EXPECT_THROW(db.get_by_client_order_id("cid-1"), PersistenceError);

    // The failed statement was finalized, so writes and the close still work
    db.upsert(make_order("cid-2", "ex-2"));
    EXPECT_EQ(db.count_orders(), 2);
    db.close();
    EXPECT_FALSE(db.is_open());
}

TEST_F(TradingDatabaseTest, CorruptViolationWindowThrowsPersistenceError) {
    EXPECT_THROW(TradingDatabase::decode_violations("[{\"timestamp\": \"soon\"}]"), PersistenceError);
    EXPECT_THROW(TradingDatabase::decode_violations("{\"timestamp\": 5}"), PersistenceError);
    EXPECT_THROW(TradingDatabase::decode_violations("not json"), PersistenceError);

    TradingDatabase db(test_db_path_);
    KillSwitchState s;
    s.spread_violations = {T0};
    db.save("default", s);
    db.execute("UPDATE kill_switch SET spread_violations = '[{\"timestamp\": \"later\"}]';");
    EXPECT_THROW(db.load("default"), PersistenceError);
}
